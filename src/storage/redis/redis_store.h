#pragma once

/// @file redis_store.h
/// @brief hiredis-backed KeyValueStore

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "common/config.h"
#include "storage/kv_store.h"
#include "storage/redis/server_address.h"

namespace rcache::storage {

/// @brief Redis connection configuration
struct RedisConfig {
    ServerAddress address;
    std::string password;
    int database = 0;

    /// Connect attempts made after the first one fails
    int reconnect_attempts = 3;
    /// Delay before the first reconnect; grows linearly per attempt
    std::chrono::milliseconds reconnect_delay{100};

    std::chrono::milliseconds connection_timeout{5000};
    std::chrono::milliseconds socket_timeout{5000};
};

/// @brief Build a RedisConfig from the "redis.*" configuration keys
absl::StatusOr<RedisConfig> RedisConfigFromConfig(const Config& config);

/// @brief Single synchronous connection to a Redis server
///
/// Not thread-safe. A lost connection is re-established transparently and
/// the interrupted command is sent again, within the reconnect budget.
class RedisStore : public KeyValueStore {
public:
    explicit RedisStore(RedisConfig config);
    ~RedisStore() override;

    RedisStore(const RedisStore&) = delete;
    RedisStore& operator=(const RedisStore&) = delete;

    /// @brief Connect, retrying up to reconnect_attempts times
    ///
    /// Failure is returned as a kConnectionFailed status and logged as
    /// critical; callers are not expected to recover from it.
    absl::Status Connect();

    absl::Status Disconnect();

    bool IsConnected() const;

    /// @brief Replies to unacknowledged writes not yet read off the socket
    ///
    /// Replies that have already arrived are discarded before every send, so
    /// this stays bounded by what is in flight.
    size_t PendingReplies() const;

    absl::Status Ping() override;
    absl::StatusOr<std::optional<std::string>> Get(const std::string& key) override;
    absl::Status Set(const std::string& key, const std::string& value,
                     std::optional<std::chrono::milliseconds> ttl) override;
    absl::Status SetNoReply(const std::string& key, const std::string& value,
                            std::optional<std::chrono::milliseconds> ttl) override;
    absl::StatusOr<int64_t> Delete(const std::vector<std::string>& keys) override;
    absl::StatusOr<std::vector<std::string>> Keys(const std::string& pattern) override;
    absl::StatusOr<int64_t> PTTL(const std::string& key) override;
    absl::Status FlushAll() override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/// @brief Store factory target: create a RedisStore and connect it
absl::StatusOr<std::unique_ptr<KeyValueStore>> ConnectRedisStore(const RedisConfig& config);

}  // namespace rcache::storage
