/// @file cache_facade.cpp
/// @brief CacheFacade implementation

#include "cache/cache_facade.h"

#include <unistd.h>

#include <absl/strings/match.h>

#include "cache/cache_key.h"
#include "cache/expiry.h"
#include "common/error.h"
#include "common/logging.h"
#include "common/metrics.h"

namespace rcache {

namespace {

constexpr const char* kCommandLatency = "rcache_command_seconds";

}  // namespace

CacheFacade::CacheFacade(storage::RedisConfig config)
    : CacheFacade(storage::StoreFactory(
          [config = std::move(config)]() { return storage::ConnectRedisStore(config); })) {}

CacheFacade::CacheFacade(storage::StoreFactory factory)
    : factory_(std::move(factory)) {}

CacheFacade::~CacheFacade() = default;

absl::StatusOr<storage::KeyValueStore*> CacheFacade::SharedConnection() {
    const pid_t pid = getpid();
    if (store_ && owner_pid_ != pid) {
        RCACHE_LOG_INFO("Process {} inherited the cache connection of process {}, reconnecting",
                        pid, owner_pid_);
        store_.reset();
    }

    if (!store_) {
        auto store = factory_();
        if (!store.ok()) {
            return store.status();
        }
        if (*store == nullptr) {
            return absl::InternalError("Store factory returned no store");
        }
        store_ = *std::move(store);
        owner_pid_ = pid;
    }
    return store_.get();
}

absl::Status CacheFacade::Record(absl::Status status) {
    if (!status.ok()) {
        RCACHE_COUNTER("rcache_errors_total").Increment();
    }
    return status;
}

absl::StatusOr<std::optional<Value>> CacheFacade::Get(std::string_view ns, std::string_view key) {
    const std::string cache_key = cache::CacheKey(ns, key);

    absl::StatusOr<std::optional<std::string>> raw;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto store = SharedConnection();
        if (!store.ok()) {
            return Record(store.status());
        }
        ScopedTimer timer(RCACHE_HISTOGRAM(kCommandLatency));
        raw = (*store)->Get(cache_key);
    }

    if (!raw.ok()) {
        return Record(raw.status());
    }
    if (!raw->has_value()) {
        RCACHE_COUNTER("rcache_get_misses_total").Increment();
        return std::optional<Value>();
    }
    RCACHE_COUNTER("rcache_get_hits_total").Increment();

    auto decoded = cache::DecodeValue(**raw);
    if (!decoded.ok()) {
        RCACHE_LOG_ERROR("Cannot decode value stored at {}: {}", cache_key,
                         std::string_view(decoded.status().message().data(),
                                          decoded.status().message().size()));
        return Record(decoded.status());
    }
    return std::optional<Value>(*std::move(decoded));
}

absl::Status CacheFacade::Set(std::string_view ns, std::string_view key, const Value& value,
                              std::optional<double> exptime, WriteMode mode) {
    std::optional<std::chrono::milliseconds> ttl;
    if (exptime.has_value()) {
        auto millis = cache::ExpiryToMillis(*exptime);
        if (!millis.ok()) {
            return Record(millis.status());
        }
        ttl = *millis;
    }

    auto blob = cache::EncodeValue(value);
    if (!blob.ok()) {
        return Record(blob.status());
    }

    const std::string cache_key = cache::CacheKey(ns, key);
    absl::Status status;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto store = SharedConnection();
        if (!store.ok()) {
            return Record(store.status());
        }
        ScopedTimer timer(RCACHE_HISTOGRAM(kCommandLatency));
        if (mode == WriteMode::kFireAndForget) {
            status = (*store)->SetNoReply(cache_key, *blob, ttl);
        } else {
            status = (*store)->Set(cache_key, *blob, ttl);
        }
    }

    if (status.ok()) {
        RCACHE_COUNTER("rcache_sets_total").Increment();
    }
    return Record(status);
}

absl::Status CacheFacade::SetNoWait(std::string_view ns, std::string_view key,
                                    const Value& value, std::optional<double> exptime) {
    return Set(ns, key, value, exptime, WriteMode::kFireAndForget);
}

absl::StatusOr<int64_t> CacheFacade::Del(std::string_view ns,
                                         const std::vector<std::string>& keys) {
    if (keys.empty()) {
        return 0;
    }

    std::vector<std::string> cache_keys;
    cache_keys.reserve(keys.size());
    for (const auto& key : keys) {
        cache_keys.push_back(cache::CacheKey(ns, key));
    }

    absl::StatusOr<int64_t> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto store = SharedConnection();
        if (!store.ok()) {
            return Record(store.status());
        }
        ScopedTimer timer(RCACHE_HISTOGRAM(kCommandLatency));
        removed = (*store)->Delete(cache_keys);
    }

    if (!removed.ok()) {
        return Record(removed.status());
    }
    RCACHE_COUNTER("rcache_deletes_total").Add(*removed);
    return removed;
}

absl::StatusOr<std::vector<std::string>> CacheFacade::Keys(std::string_view ns) {
    const std::string prefix = cache::NamespacePrefix(ns);
    const std::string pattern = cache::EscapeGlob(prefix) + "*";

    absl::StatusOr<std::vector<std::string>> matched;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto store = SharedConnection();
        if (!store.ok()) {
            return Record(store.status());
        }
        ScopedTimer timer(RCACHE_HISTOGRAM(kCommandLatency));
        matched = (*store)->Keys(pattern);
    }

    if (!matched.ok()) {
        return Record(matched.status());
    }

    std::vector<std::string> keys;
    keys.reserve(matched->size());
    for (const auto& cache_key : *matched) {
        if (absl::StartsWith(cache_key, prefix)) {
            keys.push_back(cache_key.substr(prefix.size()));
        }
    }
    return keys;
}

absl::StatusOr<int64_t> CacheFacade::Ttl(std::string_view ns, std::string_view key) {
    const std::string cache_key = cache::CacheKey(ns, key);

    absl::StatusOr<int64_t> pttl;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto store = SharedConnection();
        if (!store.ok()) {
            return Record(store.status());
        }
        ScopedTimer timer(RCACHE_HISTOGRAM(kCommandLatency));
        pttl = (*store)->PTTL(cache_key);
    }

    if (!pttl.ok()) {
        return Record(pttl.status());
    }
    return cache::RemainingSeconds(*pttl);
}

absl::Status CacheFacade::FlushAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto store = SharedConnection();
    if (!store.ok()) {
        return Record(store.status());
    }
    ScopedTimer timer(RCACHE_HISTOGRAM(kCommandLatency));
    return Record((*store)->FlushAll());
}

absl::Status CacheFacade::Ping() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto store = SharedConnection();
    if (!store.ok()) {
        return Record(store.status());
    }
    return Record((*store)->Ping());
}

void CacheFacade::ResetConnection() {
    std::lock_guard<std::mutex> lock(mutex_);
    store_.reset();
    owner_pid_ = 0;
}

}  // namespace rcache
