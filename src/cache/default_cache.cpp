#include "cache/default_cache.h"

#include <mutex>

#include "common/config.h"
#include "common/error.h"

namespace rcache {

namespace {

std::mutex g_default_cache_mutex;
std::shared_ptr<CacheFacade> g_default_cache;

absl::StatusOr<std::unique_ptr<storage::KeyValueStore>> ConnectFromConfig() {
    // Merging into a fresh Config deep-copies; GlobalConfig() stays untouched
    Config config;
    config.Merge(GlobalConfig());
    config.Merge(Config::LoadFromEnvironment());

    RCACHE_ASSIGN_OR_RETURN(storage::RedisConfig redis_config,
                            storage::RedisConfigFromConfig(config));
    return storage::ConnectRedisStore(redis_config);
}

}  // namespace

std::shared_ptr<CacheFacade> DefaultCache() {
    std::lock_guard<std::mutex> lock(g_default_cache_mutex);
    if (!g_default_cache) {
        g_default_cache = std::make_shared<CacheFacade>(storage::StoreFactory(ConnectFromConfig));
    }
    return g_default_cache;
}

void ResetDefaultCache() {
    std::lock_guard<std::mutex> lock(g_default_cache_mutex);
    g_default_cache.reset();
}

}  // namespace rcache
