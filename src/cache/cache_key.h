#pragma once

/// @file cache_key.h
/// @brief Physical key derivation for namespaced cache entries

#include <string>
#include <string_view>

namespace rcache::cache {

/// @brief Separator between namespace and key in the physical key
inline constexpr std::string_view kKeySeparator = "::";

/// @brief Build the physical key "<ns>::<key>"
///
/// An empty (or default-constructed) view stands for an absent value. Keys
/// that themselves contain "::" can collide across the boundary.
std::string CacheKey(std::string_view ns, std::string_view key);

/// @brief Prefix shared by every key of a namespace, i.e. CacheKey(ns, "")
std::string NamespacePrefix(std::string_view ns);

/// @brief Backslash-escape glob metacharacters (* ? [ ] \) for KEYS patterns
std::string EscapeGlob(std::string_view literal);

}  // namespace rcache::cache
