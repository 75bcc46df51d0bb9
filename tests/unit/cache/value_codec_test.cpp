/// @file value_codec_test.cpp
/// @brief Tests for the stored value envelope

#include <gtest/gtest.h>

#include <string>

#include "cache/value_codec.h"

namespace rcache::cache {
namespace {

using namespace std::string_literals;

TEST(ValueCodecTest, AsciiStringsAreStoredRaw) {
    auto blob = EncodeValue("hello world");
    ASSERT_TRUE(blob.ok());
    EXPECT_EQ(*blob, "rhello world");
}

TEST(ValueCodecTest, EmptyStringIsJustTheTag) {
    auto blob = EncodeValue("");
    ASSERT_TRUE(blob.ok());
    EXPECT_EQ(*blob, "r");

    auto value = DecodeValue(*blob);
    ASSERT_TRUE(value.ok());
    EXPECT_EQ(*value, Value(""));
}

TEST(ValueCodecTest, WhatNeedsEncoding) {
    EXPECT_FALSE(NeedsEncoding("plain ascii"));
    EXPECT_FALSE(NeedsEncoding("\x01\x7f"));
    EXPECT_TRUE(NeedsEncoding("caf\xc3\xa9"));
    EXPECT_TRUE(NeedsEncoding(Value()));
    EXPECT_TRUE(NeedsEncoding(12));
    EXPECT_TRUE(NeedsEncoding(true));
    EXPECT_TRUE(NeedsEncoding(Value::array({1, 2})));
    EXPECT_TRUE(NeedsEncoding(Value::object()));
    EXPECT_TRUE(NeedsEncoding(Value::binary({0xde, 0xad})));
}

TEST(ValueCodecTest, EncodedValuesCarryTagAndVersion) {
    auto blob = EncodeValue(Value::array({1, "two", nullptr}));
    ASSERT_TRUE(blob.ok());
    ASSERT_GE(blob->size(), 2u);
    EXPECT_EQ((*blob)[0], 's');
    EXPECT_EQ(static_cast<uint8_t>((*blob)[1]), kEncodingVersion);
}

TEST(ValueCodecTest, StructuredValuesRoundTrip) {
    const Value value = {
        {"id", 7},
        {"price", 101.25},
        {"tags", {"fx", "spot"}},
        {"meta", {{"active", false}, {"note", nullptr}}},
        {"label", "Gr\xc3\xbc\xc3\x9f" "e"},
        {"raw", Value::binary({0x00, 0xff, 0x10})},
    };

    auto blob = EncodeValue(value);
    ASSERT_TRUE(blob.ok());

    auto decoded = DecodeValue(*blob);
    ASSERT_TRUE(decoded.ok()) << decoded.status();
    EXPECT_EQ(*decoded, value);
}

TEST(ValueCodecTest, BinarySubtypeSurvivesAsCborTag) {
    const Value tagged = Value::binary({0xca, 0xfe}, 42);

    auto blob = EncodeValue(tagged);
    ASSERT_TRUE(blob.ok());
    // Tag 42 precedes the byte string
    EXPECT_EQ(blob->substr(2, 2), "\xd8\x2a"s);

    auto decoded = DecodeValue(*blob);
    ASSERT_TRUE(decoded.ok()) << decoded.status();
    ASSERT_TRUE(decoded->is_binary());
    ASSERT_TRUE(decoded->get_binary().has_subtype());
    EXPECT_EQ(decoded->get_binary().subtype(), 42u);
    EXPECT_EQ(*decoded, tagged);
}

TEST(ValueCodecTest, RawTextThatLooksSerializedStaysText) {
    // Only the leading tag decides the format
    const std::string text = "s\x02 not really cbor";
    auto blob = EncodeValue(text);
    ASSERT_TRUE(blob.ok());

    auto decoded = DecodeValue(*blob);
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(*decoded, Value(text));
}

TEST(ValueCodecTest, EmptyBlobIsDataLoss) {
    EXPECT_TRUE(absl::IsDataLoss(DecodeValue("").status()));
}

TEST(ValueCodecTest, UnknownTagIsDataLoss) {
    EXPECT_TRUE(absl::IsDataLoss(DecodeValue("hello").status()));
}

TEST(ValueCodecTest, UnsupportedVersionIsDataLoss) {
    EXPECT_TRUE(absl::IsDataLoss(DecodeValue("s\x09\xf6"s).status()));
    EXPECT_TRUE(absl::IsDataLoss(DecodeValue("s").status()));
}

TEST(ValueCodecTest, TruncatedPayloadIsDataLoss) {
    auto blob = EncodeValue(Value{{"key", "a fairly long string value"}});
    ASSERT_TRUE(blob.ok());

    const std::string truncated = blob->substr(0, blob->size() - 5);
    EXPECT_TRUE(absl::IsDataLoss(DecodeValue(truncated).status()));
}

}  // namespace
}  // namespace rcache::cache
