/// @file config_test.cpp
/// @brief Tests for rcache configuration management

#include <gtest/gtest.h>

#include <cstdlib>
#include <optional>
#include <string>

#include "common/config.h"

namespace rcache {
namespace {

class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        if (const char* old = std::getenv(name)) {
            previous_ = old;
        }
        setenv(name, value, 1);
    }

    ~ScopedEnv() {
        if (previous_.has_value()) {
            setenv(name_, previous_->c_str(), 1);
        } else {
            unsetenv(name_);
        }
    }

private:
    const char* name_;
    std::optional<std::string> previous_;
};

TEST(ConfigTest, LoadFromString) {
    const std::string yaml_content = R"(
redis:
  server: cache.internal:6380
  database: 2
  reconnect_attempts: 5
logging:
  level: debug
)";

    auto result = Config::LoadFromString(yaml_content);
    ASSERT_TRUE(result.ok()) << result.status().message();

    Config config = std::move(*result);

    EXPECT_EQ(config.GetString("redis.server"), "cache.internal:6380");
    EXPECT_EQ(config.GetInt("redis.database"), 2);
    EXPECT_EQ(config.GetInt("redis.reconnect_attempts"), 5);
    EXPECT_EQ(config.GetString("logging.level"), "debug");
}

TEST(ConfigTest, DefaultValues) {
    Config config;

    EXPECT_EQ(config.GetString("nonexistent.key", "default"), "default");
    EXPECT_EQ(config.GetInt("nonexistent.key", 42), 42);
    EXPECT_FALSE(config.HasKey("nonexistent.key"));
}

TEST(ConfigTest, SetValues) {
    Config config;

    config.Set("redis.server", std::string("10.0.0.5:6379"));
    config.Set("redis.database", static_cast<int64_t>(3));
    config.Set("logging.level", std::string("info"));

    EXPECT_EQ(config.GetString("redis.server"), "10.0.0.5:6379");
    EXPECT_EQ(config.GetInt("redis.database"), 3);
    EXPECT_EQ(config.GetString("logging.level"), "info");

    config.Set("redis.database", static_cast<int64_t>(5));  // Overwrite
    EXPECT_EQ(config.GetInt("redis.database"), 5);
}

TEST(ConfigTest, LookupsDoNotCreateKeys) {
    Config config;
    config.Set("redis.server", std::string("host:1"));

    EXPECT_FALSE(config.HasKey("redis.password"));
    EXPECT_FALSE(config.HasKey("redis.password"));
    EXPECT_EQ(config.GetString("redis.server"), "host:1");
}

TEST(ConfigTest, WrongTypeFallsBackToDefault) {
    auto result = Config::LoadFromString("redis:\n  database: two\n");
    ASSERT_TRUE(result.ok());

    EXPECT_EQ(result->GetInt("redis.database", 7), 7);
}

TEST(ConfigTest, MergeConfigs) {
    const std::string base_yaml = R"(
redis:
  server: base:6379
  database: 1
logging:
  level: info
)";

    const std::string overlay_yaml = R"(
redis:
  database: 4
  password: secret
)";

    auto base_result = Config::LoadFromString(base_yaml);
    auto overlay_result = Config::LoadFromString(overlay_yaml);
    ASSERT_TRUE(base_result.ok());
    ASSERT_TRUE(overlay_result.ok());

    Config base = std::move(*base_result);
    Config overlay = std::move(*overlay_result);

    base.Merge(overlay);

    EXPECT_EQ(base.GetString("redis.server"), "base:6379");
    EXPECT_EQ(base.GetInt("redis.database"), 4);       // Overwritten
    EXPECT_EQ(base.GetString("redis.password"), "secret");  // Added
    EXPECT_EQ(base.GetString("logging.level"), "info");
}

TEST(ConfigTest, InvalidYaml) {
    auto result = Config::LoadFromString("{ invalid yaml [");
    EXPECT_FALSE(result.ok());
}

TEST(ConfigTest, MissingFile) {
    auto result = Config::LoadFromFile("/nonexistent/rcache.yaml");
    EXPECT_TRUE(absl::IsNotFound(result.status()));
}

TEST(ConfigTest, LoadFromEnvironment) {
    ScopedEnv server(kServerEnvVar, "redis.example:7000");
    ScopedEnv attempts("RCACHETEST_RECONNECT_ATTEMPTS", "1");
    ScopedEnv level("RCACHETEST_LOG_LEVEL", "error");
    ScopedEnv database("RCACHETEST_REDIS_DATABASE", "not-a-number");

    Config config = Config::LoadFromEnvironment("RCACHETEST_");

    EXPECT_EQ(config.GetString("redis.server"), "redis.example:7000");
    EXPECT_EQ(config.GetInt("redis.reconnect_attempts"), 1);
    EXPECT_EQ(config.GetString("logging.level"), "error");
    EXPECT_FALSE(config.HasKey("redis.database"));
}

}  // namespace
}  // namespace rcache
