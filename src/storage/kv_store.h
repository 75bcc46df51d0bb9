#pragma once

/// @file kv_store.h
/// @brief Abstract key-value store used by the cache facade

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

namespace rcache::storage {

/// @brief Minimal command set the cache needs from its backing store
///
/// Implementations are not required to be thread-safe; callers serialize
/// access to a single instance.
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    /// @brief Round-trip a no-op command
    virtual absl::Status Ping() = 0;

    /// @brief GET
    /// @return Stored bytes, or nullopt if the key does not exist
    virtual absl::StatusOr<std::optional<std::string>> Get(const std::string& key) = 0;

    /// @brief SET, with PX expiry when ttl is given
    virtual absl::Status Set(const std::string& key, const std::string& value,
                             std::optional<std::chrono::milliseconds> ttl) = 0;

    /// @brief SET without waiting for the reply
    ///
    /// Errors reported by the store for this command are discarded. Only a
    /// failure to obtain a connection at all is returned.
    virtual absl::Status SetNoReply(const std::string& key, const std::string& value,
                                    std::optional<std::chrono::milliseconds> ttl) = 0;

    /// @brief DEL
    /// @return Number of keys that existed and were removed
    virtual absl::StatusOr<int64_t> Delete(const std::vector<std::string>& keys) = 0;

    /// @brief KEYS with a glob pattern
    virtual absl::StatusOr<std::vector<std::string>> Keys(const std::string& pattern) = 0;

    /// @brief PTTL
    /// @return Remaining milliseconds, -1 for no expiry, -2 for a missing key
    virtual absl::StatusOr<int64_t> PTTL(const std::string& key) = 0;

    /// @brief FLUSHALL
    virtual absl::Status FlushAll() = 0;
};

/// @brief Opens a new connected store
using StoreFactory =
    std::function<absl::StatusOr<std::unique_ptr<KeyValueStore>>()>;

}  // namespace rcache::storage
