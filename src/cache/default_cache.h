#pragma once

/// @file default_cache.h
/// @brief Optional process-wide CacheFacade

#include <memory>

#include "cache/cache_facade.h"

namespace rcache {

/// @brief Process-wide facade, created on first call
///
/// The Redis settings are read from GlobalConfig() overlaid with the
/// environment (REDIS_CACHE_SERVER, RCACHE_*) when the connection is opened,
/// which also happens again in a forked child.
std::shared_ptr<CacheFacade> DefaultCache();

/// @brief Drop the process-wide facade; the next DefaultCache() builds a new one
///
/// Holders of the previous instance keep it alive until they release it.
void ResetDefaultCache();

}  // namespace rcache
