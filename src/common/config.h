#pragma once

/// @file config.h
/// @brief rcache configuration management

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <yaml-cpp/yaml.h>

namespace rcache {

/// @brief Configuration value that can hold different types
using ConfigValue = std::variant<int64_t, std::string>;

/// @brief Name of the variable selecting the cache server as "host:port"
inline constexpr const char* kServerEnvVar = "REDIS_CACHE_SERVER";

/// @brief Configuration manager for loading and accessing configuration
///
/// Keys use dot notation ("redis.server"). Recognized keys:
///   redis.server               host:port of the cache server
///   redis.password             AUTH password, empty for none
///   redis.database             logical database index
///   redis.reconnect_attempts   extra connect attempts after the first
///   redis.connect_timeout_ms   connect timeout
///   redis.socket_timeout_ms    per-command socket timeout
///   logging.level              trace|debug|info|warn|error|critical|off
class Config {
public:
    /// @brief Default constructor creates empty configuration
    Config() = default;

    /// @brief Load configuration from a YAML file
    /// @param path Path to the YAML configuration file
    static absl::StatusOr<Config> LoadFromFile(const std::filesystem::path& path);

    /// @brief Load configuration from a YAML string
    /// @param yaml_content YAML content as a string
    static absl::StatusOr<Config> LoadFromString(std::string_view yaml_content);

    /// @brief Load configuration from environment variables
    ///
    /// REDIS_CACHE_SERVER maps to redis.server; everything else is read from
    /// variables carrying the given prefix.
    /// @param prefix Environment variable prefix (e.g., "RCACHE_")
    static Config LoadFromEnvironment(std::string_view prefix = "RCACHE_");

    /// @brief Merge another configuration into this one (other takes precedence)
    void Merge(const Config& other);

    std::string GetString(std::string_view key, std::string_view default_value = "") const;
    int64_t GetInt(std::string_view key, int64_t default_value = 0) const;

    /// @brief Check if a key exists
    bool HasKey(std::string_view key) const;

    /// @brief Set a configuration value, creating intermediate maps
    void Set(std::string_view key, ConfigValue value);

private:
    YAML::Node root_;

    /// @brief Navigate to a nested node using dot notation
    std::optional<YAML::Node> GetNestedNode(std::string_view key) const;
};

/// @brief Global configuration instance
Config& GlobalConfig();

/// @brief Initialize global configuration from file and environment
///
/// Environment values override the file. The logging level, if present, is
/// applied to the library logger.
/// @param config_path Path to configuration file (optional)
/// @param env_prefix Environment variable prefix
absl::Status InitGlobalConfig(
    const std::optional<std::filesystem::path>& config_path = std::nullopt,
    std::string_view env_prefix = "RCACHE_"
);

}  // namespace rcache
