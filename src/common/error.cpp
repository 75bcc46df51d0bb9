#include "error.h"

#include <absl/strings/cord.h>

namespace rcache {

namespace {

// Attached to connection failures so callers can tell them apart from other
// kUnavailable statuses.
constexpr absl::string_view kErrorCodePayload = "rcache.error_code";

}  // namespace

absl::StatusCode ToAbslCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return absl::StatusCode::kOk;
        case ErrorCode::kInvalidArgument:
        case ErrorCode::kConfigurationError:
            return absl::StatusCode::kInvalidArgument;
        case ErrorCode::kStoreError:
        case ErrorCode::kSerializationError:
            return absl::StatusCode::kInternal;
        case ErrorCode::kConnectionFailed:
            return absl::StatusCode::kUnavailable;
        case ErrorCode::kDeserializationError:
            return absl::StatusCode::kDataLoss;
        case ErrorCode::kUnknown:
        default:
            return absl::StatusCode::kUnknown;
    }
}

absl::Status MakeError(ErrorCode code, std::string_view message) {
    absl::Status status(ToAbslCode(code),
                        absl::string_view(message.data(), message.size()));
    if (code == ErrorCode::kConnectionFailed) {
        status.SetPayload(kErrorCodePayload, absl::Cord("connection_failed"));
    }
    return status;
}

bool IsConnectionFailure(const absl::Status& status) {
    auto payload = status.GetPayload(kErrorCodePayload);
    return payload.has_value() && *payload == "connection_failed";
}

}  // namespace rcache
