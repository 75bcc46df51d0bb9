#pragma once

/// @file cache_facade.h
/// @brief Namespaced cache over one shared store connection

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

#include "cache/value_codec.h"
#include "storage/kv_store.h"
#include "storage/redis/redis_store.h"

namespace rcache {

/// @brief Whether a write waits for the store's acknowledgement
enum class WriteMode {
    kAcknowledged,
    /// Send and return; store errors for the write are never observed
    kFireAndForget,
};

/// @brief Namespaced get/set/delete/enumerate/ttl over a shared store
///
/// The facade owns at most one store connection, created on first use by
/// the store factory. The connection belongs to the process that created
/// it: after fork() the child discards the inherited handle and opens its
/// own on the next call. All operations are serialized on an internal
/// mutex, so one facade may be shared between threads.
///
/// Values go through EncodeValue/DecodeValue, so any Value (including null
/// and nested structures) round-trips. Plain ASCII strings are stored
/// readable; see value_codec.h for the envelope.
///
/// If the connection cannot be established, every operation returns the
/// kConnectionFailed status from the store factory. That failure is not
/// retried at this layer.
class CacheFacade {
public:
    /// @brief Facade backed by Redis
    explicit CacheFacade(storage::RedisConfig config);

    /// @brief Facade backed by an arbitrary store factory
    explicit CacheFacade(storage::StoreFactory factory);

    ~CacheFacade();

    CacheFacade(const CacheFacade&) = delete;
    CacheFacade& operator=(const CacheFacade&) = delete;

    /// @brief Fetch a value
    /// @return nullopt if the key does not exist
    absl::StatusOr<std::optional<Value>> Get(std::string_view ns, std::string_view key);

    /// @brief Store a value
    /// @param exptime Expiry in seconds; fractions are truncated to whole ms
    /// @param mode kFireAndForget returns as soon as the write is sent
    absl::Status Set(std::string_view ns, std::string_view key, const Value& value,
                     std::optional<double> exptime = std::nullopt,
                     WriteMode mode = WriteMode::kAcknowledged);

    /// @brief Set() in kFireAndForget mode
    absl::Status SetNoWait(std::string_view ns, std::string_view key, const Value& value,
                           std::optional<double> exptime = std::nullopt);

    /// @brief Delete keys of one namespace
    /// @return Number of keys that existed
    absl::StatusOr<int64_t> Del(std::string_view ns, const std::vector<std::string>& keys);

    /// @brief All keys of a namespace, without the namespace prefix, unordered
    absl::StatusOr<std::vector<std::string>> Keys(std::string_view ns);

    /// @brief Remaining life of a key in whole seconds, rounded down
    /// @return 0 for missing, expired and non-expiring keys
    absl::StatusOr<int64_t> Ttl(std::string_view ns, std::string_view key);

    /// @brief Remove every key in the store, across all namespaces
    absl::Status FlushAll();

    /// @brief Check that the store answers
    absl::Status Ping();

    /// @brief Drop the shared connection; the next call reconnects
    void ResetConnection();

    /// @brief Store any type with a nlohmann to_json() overload
    template <typename T>
    absl::Status SetObject(std::string_view ns, std::string_view key, const T& object,
                           std::optional<double> exptime = std::nullopt,
                           WriteMode mode = WriteMode::kAcknowledged);

    /// @brief Fetch a value and convert it with its nlohmann from_json() overload
    template <typename T>
    absl::StatusOr<std::optional<T>> GetAs(std::string_view ns, std::string_view key);

private:
    /// Returns the store for the calling process, creating it if needed.
    /// Must be called with mutex_ held.
    absl::StatusOr<storage::KeyValueStore*> SharedConnection();

    /// Counts the failure in metrics and hands it back
    absl::Status Record(absl::Status status);

    storage::StoreFactory factory_;

    std::mutex mutex_;
    std::unique_ptr<storage::KeyValueStore> store_;
    pid_t owner_pid_ = 0;
};

// Template implementations

template <typename T>
absl::Status CacheFacade::SetObject(std::string_view ns, std::string_view key, const T& object,
                                    std::optional<double> exptime, WriteMode mode) {
    Value value;
    try {
        value = object;
    } catch (const Value::exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Cannot convert object to a cache value: ", e.what()));
    }
    return Set(ns, key, value, exptime, mode);
}

template <typename T>
absl::StatusOr<std::optional<T>> CacheFacade::GetAs(std::string_view ns, std::string_view key) {
    auto value = Get(ns, key);
    if (!value.ok()) {
        return value.status();
    }
    if (!value->has_value()) {
        return std::optional<T>();
    }
    try {
        return std::optional<T>((*value)->template get<T>());
    } catch (const Value::exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Cached value for ", absl::string_view(ns.data(), ns.size()), "::",
                         absl::string_view(key.data(), key.size()),
                         " does not convert to the requested type: ", e.what()));
    }
}

}  // namespace rcache
