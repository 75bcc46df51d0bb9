#include "config.h"

#include <cstdlib>
#include <functional>
#include <mutex>
#include <vector>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>

#include "logging.h"

namespace rcache {

namespace {

std::mutex g_global_config_mutex;
Config g_global_config;

std::optional<std::string> GetEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value != nullptr && *value != '\0') {
        return std::string(value);
    }
    return std::nullopt;
}

}  // namespace

absl::StatusOr<Config> Config::LoadFromFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return absl::NotFoundError(
            absl::StrCat("Configuration file not found: ", path.string()));
    }

    try {
        Config config;
        config.root_ = YAML::LoadFile(path.string());
        return config;
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Failed to parse YAML configuration: ", e.what()));
    }
}

absl::StatusOr<Config> Config::LoadFromString(std::string_view yaml_content) {
    try {
        Config config;
        config.root_ = YAML::Load(std::string(yaml_content));
        return config;
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Failed to parse YAML content: ", e.what()));
    }
}

Config Config::LoadFromEnvironment(std::string_view prefix) {
    Config config;

    auto get_prefixed = [&prefix](const char* suffix) {
        return GetEnv(absl::StrCat(absl::string_view(prefix.data(), prefix.size()), suffix));
    };
    auto set_int = [&config](const char* key, const std::string& raw) {
        int64_t parsed = 0;
        if (absl::SimpleAtoi(raw, &parsed)) {
            config.Set(key, parsed);
        } else {
            RCACHE_LOG_WARN("Ignoring non-numeric value '{}' for {}", raw, key);
        }
    };

    if (auto val = GetEnv(kServerEnvVar)) {
        config.Set("redis.server", *val);
    }
    if (auto val = get_prefixed("REDIS_PASSWORD")) {
        config.Set("redis.password", *val);
    }
    if (auto val = get_prefixed("REDIS_DATABASE")) {
        set_int("redis.database", *val);
    }
    if (auto val = get_prefixed("RECONNECT_ATTEMPTS")) {
        set_int("redis.reconnect_attempts", *val);
    }
    if (auto val = get_prefixed("CONNECT_TIMEOUT_MS")) {
        set_int("redis.connect_timeout_ms", *val);
    }
    if (auto val = get_prefixed("SOCKET_TIMEOUT_MS")) {
        set_int("redis.socket_timeout_ms", *val);
    }
    if (auto val = get_prefixed("LOG_LEVEL")) {
        config.Set("logging.level", *val);
    }

    return config;
}

void Config::Merge(const Config& other) {
    std::function<void(YAML::Node&, const YAML::Node&)> merge_nodes;
    merge_nodes = [&merge_nodes](YAML::Node& base, const YAML::Node& overlay) {
        if (!overlay.IsMap()) {
            return;
        }
        for (const auto& kv : overlay) {
            const std::string key = kv.first.as<std::string>();
            if (base[key] && base[key].IsMap() && kv.second.IsMap()) {
                YAML::Node base_child = base[key];
                merge_nodes(base_child, kv.second);
            } else {
                base[key] = YAML::Clone(kv.second);
            }
        }
    };

    merge_nodes(root_, other.root_);
}

std::optional<YAML::Node> Config::GetNestedNode(std::string_view key) const {
    std::vector<std::string> parts = absl::StrSplit(absl::string_view(key.data(), key.size()), '.');
    // Node assignment copies content into the target, so walk with reset()
    YAML::Node current;
    current.reset(root_);

    for (const auto& part : parts) {
        if (!current || !current.IsMap()) {
            return std::nullopt;
        }
        const YAML::Node& parent = current;
        current.reset(parent[part]);
    }

    if (!current || current.IsNull()) {
        return std::nullopt;
    }

    return current;
}

std::string Config::GetString(std::string_view key, std::string_view default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        return node->as<std::string>();
    }
    return std::string(default_value);
}

int64_t Config::GetInt(std::string_view key, int64_t default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        try {
            return node->as<int64_t>();
        } catch (const YAML::Exception&) {
            return default_value;
        }
    }
    return default_value;
}

bool Config::HasKey(std::string_view key) const {
    return GetNestedNode(key).has_value();
}

void Config::Set(std::string_view key, ConfigValue value) {
    std::vector<std::string> parts = absl::StrSplit(absl::string_view(key.data(), key.size()), '.');

    YAML::Node current;
    current.reset(root_);
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        YAML::Node child = current[parts[i]];
        if (!child.IsMap()) {
            child = YAML::Node(YAML::NodeType::Map);
        }
        current.reset(child);
    }

    std::visit([&](auto&& val) { current[parts.back()] = val; }, value);
}

Config& GlobalConfig() {
    return g_global_config;
}

absl::Status InitGlobalConfig(
    const std::optional<std::filesystem::path>& config_path,
    std::string_view env_prefix
) {
    Config merged;

    if (config_path.has_value()) {
        auto file_config = Config::LoadFromFile(*config_path);
        if (!file_config.ok()) {
            return file_config.status();
        }
        merged.Merge(*file_config);
    }

    // Environment has the highest priority
    merged.Merge(Config::LoadFromEnvironment(env_prefix));

    if (merged.HasKey("logging.level")) {
        const std::string level_name = merged.GetString("logging.level");
        if (auto level = ParseLogLevel(level_name)) {
            SetLogLevel(*level);
        } else {
            RCACHE_LOG_WARN("Unknown log level '{}' in configuration", level_name);
        }
    }

    std::lock_guard<std::mutex> lock(g_global_config_mutex);
    g_global_config = std::move(merged);
    return absl::OkStatus();
}

}  // namespace rcache
