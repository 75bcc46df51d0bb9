#pragma once

/// @file server_address.h
/// @brief Resolution of the cache server's host and port

#include <cstdint>
#include <string>
#include <string_view>

#include <absl/status/statusor.h>

namespace rcache::storage {

inline constexpr const char* kDefaultHost = "127.0.0.1";
inline constexpr uint16_t kDefaultPort = 6379;

/// @brief Host and port of a Redis server
struct ServerAddress {
    std::string host = kDefaultHost;
    uint16_t port = kDefaultPort;

    /// @brief "host:port"
    std::string ToString() const;
};

/// @brief Parse "host:port"
///
/// The split happens at the last colon. Empty text yields the default
/// address, an empty host the default host and a missing port 6379. A port
/// that is not a number in [1, 65535] is a configuration error.
absl::StatusOr<ServerAddress> ParseServerAddress(std::string_view text);

/// @brief Read the server address from REDIS_CACHE_SERVER
absl::StatusOr<ServerAddress> ResolveServerAddress();

}  // namespace rcache::storage
