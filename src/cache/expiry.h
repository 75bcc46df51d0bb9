#pragma once

/// @file expiry.h
/// @brief Conversions between caller expiry times and store TTLs

#include <chrono>
#include <cstdint>

#include <absl/status/statusor.h>

namespace rcache::cache {

/// @brief Convert an expiry in (fractional) seconds to whole milliseconds
///
/// The value is truncated, so 1.9999 s becomes 1999 ms. Non-finite values and
/// expiries that truncate to zero or below are rejected with InvalidArgument.
absl::StatusOr<std::chrono::milliseconds> ExpiryToMillis(double seconds);

/// @brief Convert a PTTL reply to whole seconds, rounding down
///
/// Missing keys (-2), keys without expiry (-1) and expired keys all map to 0.
/// Rounding down means a reported TTL never overstates the remaining life.
int64_t RemainingSeconds(int64_t pttl_millis);

}  // namespace rcache::cache
