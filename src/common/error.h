#pragma once

/// @file error.h
/// @brief rcache error handling utilities using absl::Status

#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

namespace rcache {

/// @brief Error codes used across rcache
enum class ErrorCode {
    kOk = 0,
    kUnknown,
    kInvalidArgument,

    // rcache-specific error codes
    kConnectionFailed,
    kStoreError,
    kSerializationError,
    kDeserializationError,
    kConfigurationError,
};

/// @brief Convert rcache error code to absl::StatusCode
absl::StatusCode ToAbslCode(ErrorCode code);

/// @brief Create an error status with the given code and message
absl::Status MakeError(ErrorCode code, std::string_view message);

/// @brief True if the status was produced by a failed connection attempt
bool IsConnectionFailure(const absl::Status& status);

// Macros for status checking and propagation

/// @brief Return if status is not OK
#define RCACHE_RETURN_IF_ERROR(expr)                                           \
    do {                                                                        \
        auto _status = (expr);                                                  \
        if (!_status.ok()) {                                                    \
            return _status;                                                     \
        }                                                                       \
    } while (0)

/// @brief Assign or return if status is not OK
#define RCACHE_ASSIGN_OR_RETURN(lhs, rhs)                                      \
    RCACHE_ASSIGN_OR_RETURN_IMPL(                                              \
        RCACHE_CONCAT(_status_or_, __LINE__), lhs, rhs)

#define RCACHE_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rhs)                       \
    auto statusor = (rhs);                                                      \
    if (!statusor.ok()) {                                                       \
        return statusor.status();                                               \
    }                                                                           \
    lhs = std::move(statusor).value()

#define RCACHE_CONCAT(a, b) RCACHE_CONCAT_IMPL(a, b)
#define RCACHE_CONCAT_IMPL(a, b) a##b

}  // namespace rcache
