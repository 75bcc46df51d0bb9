/// @file error_test.cpp
/// @brief Tests for rcache error helpers

#include <gtest/gtest.h>

#include "common/error.h"

namespace rcache {
namespace {

absl::StatusOr<int> ParsePositive(int value) {
    if (value <= 0) {
        return absl::InvalidArgumentError("not positive");
    }
    return value;
}

absl::StatusOr<int> Doubled(int value) {
    RCACHE_ASSIGN_OR_RETURN(int parsed, ParsePositive(value));
    return parsed * 2;
}

absl::Status CheckBoth(int a, int b) {
    RCACHE_RETURN_IF_ERROR(ParsePositive(a).status());
    RCACHE_RETURN_IF_ERROR(ParsePositive(b).status());
    return absl::OkStatus();
}

TEST(ErrorTest, CodesMapToAbslCodes) {
    EXPECT_EQ(ToAbslCode(ErrorCode::kConnectionFailed), absl::StatusCode::kUnavailable);
    EXPECT_EQ(ToAbslCode(ErrorCode::kStoreError), absl::StatusCode::kInternal);
    EXPECT_EQ(ToAbslCode(ErrorCode::kDeserializationError), absl::StatusCode::kDataLoss);
    EXPECT_EQ(ToAbslCode(ErrorCode::kConfigurationError), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(ToAbslCode(ErrorCode::kSerializationError), absl::StatusCode::kInternal);
}

TEST(ErrorTest, MakeErrorKeepsMessage) {
    auto status = MakeError(ErrorCode::kStoreError, "GET failed: WRONGTYPE");
    EXPECT_TRUE(absl::IsInternal(status));
    EXPECT_EQ(status.message(), "GET failed: WRONGTYPE");
}

TEST(ErrorTest, ConnectionFailuresAreRecognizable) {
    EXPECT_TRUE(IsConnectionFailure(MakeError(ErrorCode::kConnectionFailed, "refused")));
    EXPECT_FALSE(IsConnectionFailure(absl::UnavailableError("refused")));
    EXPECT_FALSE(IsConnectionFailure(absl::OkStatus()));
}

TEST(ErrorTest, AssignOrReturn) {
    auto ok = Doubled(4);
    ASSERT_TRUE(ok.ok());
    EXPECT_EQ(*ok, 8);

    EXPECT_TRUE(absl::IsInvalidArgument(Doubled(-1).status()));
}

TEST(ErrorTest, ReturnIfError) {
    EXPECT_TRUE(CheckBoth(1, 2).ok());
    EXPECT_FALSE(CheckBoth(1, 0).ok());
}

}  // namespace
}  // namespace rcache
