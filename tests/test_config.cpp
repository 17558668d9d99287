#include "taskrelay/core/config_manager.hpp"
#include "taskrelay/utils/config_validator.hpp"
#include "taskrelay/utils/yaml_config.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <cstdlib>
#include <fstream>

using namespace taskrelay;
using namespace std::chrono_literals;

namespace {

void write_file(const std::filesystem::path& path, const std::string& contents) {
    std::ofstream out(path);
    out << contents;
}

} // anonymous namespace

TEST(YamlConfigTest, NestedSectionsAreParsed) {
    auto node = YAML::Load(R"(
log_level: debug
token: explicit-token
http:
  base_url: https://api.example.com/open/v1
  timeout_ms: 5000
  retries: 2
cache:
  dir: /var/cache/taskrelay
  ttl_seconds: 120
  stale_if_error_seconds: 600
  tasks_ttl_seconds: 30
oauth:
  client_id: my-client
  client_secret: shh
  token_url: https://auth.example.com/oauth/token
)");

    auto config = utils::YamlConfigHelper::from_yaml(node);
    EXPECT_EQ(config.log_level, utils::LogLevel::Debug);
    EXPECT_EQ(config.token, "explicit-token");
    EXPECT_EQ(config.http.base_url, "https://api.example.com/open/v1");
    EXPECT_EQ(config.http.timeout, 5000ms);
    EXPECT_EQ(config.http.retries, 2);
    EXPECT_EQ(config.cache.dir, "/var/cache/taskrelay");
    EXPECT_EQ(config.cache.ttl, 120s);
    EXPECT_EQ(config.cache.stale_if_error, 600s);
    EXPECT_EQ(config.cache.tasks_ttl, 30s);
    EXPECT_EQ(config.cache.projects_ttl, 604800s);
    EXPECT_EQ(config.oauth.client_id, "my-client");
    EXPECT_EQ(config.oauth.client_secret, "shh");
    EXPECT_EQ(config.oauth.token_url, "https://auth.example.com/oauth/token");
}

TEST(YamlConfigTest, FlatKeysAreAccepted) {
    auto node = YAML::Load(R"(
base_url: https://flat.example.com
timeout_ms: 8000
cache_ttl_seconds: 90
client_id: flat-client
)");

    auto config = utils::YamlConfigHelper::from_yaml(node);
    EXPECT_EQ(config.http.base_url, "https://flat.example.com");
    EXPECT_EQ(config.http.timeout, 8000ms);
    EXPECT_EQ(config.cache.ttl, 90s);
    EXPECT_EQ(config.oauth.client_id, "flat-client");
}

TEST(YamlConfigTest, NestedKeyWinsOverFlatKey) {
    auto node = YAML::Load(R"(
timeout_ms: 8000
http:
  timeout_ms: 3000
)");

    auto config = utils::YamlConfigHelper::from_yaml(node);
    EXPECT_EQ(config.http.timeout, 3000ms);
}

TEST(YamlConfigTest, SerializedConfigOmitsSecrets) {
    core::ApplicationConfig config;
    config.token = "explicit-token";
    config.oauth.client_secret = "shh";

    auto node = utils::YamlConfigHelper::to_yaml(config);
    EXPECT_FALSE(node["token"]);
    EXPECT_FALSE(node["oauth"]["client_secret"]);
    EXPECT_EQ(node["http"]["retries"].as<int>(), 3);
}

TEST(YamlConfigTest, LoadFromFileReportsProblems) {
    test::TempDir dir;

    auto missing = utils::YamlConfigHelper::load_from_file(dir / "absent.yaml");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error(), core::ConfigError::FileNotFound);

    write_file(dir / "list.yaml", "- a\n- b\n");
    auto list = utils::YamlConfigHelper::load_from_file(dir / "list.yaml");
    ASSERT_FALSE(list);
    EXPECT_EQ(list.error(), core::ConfigError::InvalidFormat);

    write_file(dir / "broken.yaml", "http: [unclosed\n");
    auto broken = utils::YamlConfigHelper::load_from_file(dir / "broken.yaml");
    ASSERT_FALSE(broken);
    EXPECT_EQ(broken.error(), core::ConfigError::InvalidFormat);

    write_file(dir / "empty.yaml", "");
    auto empty = utils::YamlConfigHelper::load_from_file(dir / "empty.yaml");
    ASSERT_TRUE(empty);
    EXPECT_EQ(empty->http.retries, 3);
}

TEST(ConfigValidatorTest, DefaultsAreValid) {
    core::ApplicationConfig config;
    auto result = utils::ConfigValidator::validate_application_config(config);
    EXPECT_TRUE(result.is_valid);
    EXPECT_TRUE(result.errors.empty());
}

TEST(ConfigValidatorTest, EveryViolationIsReported) {
    core::ApplicationConfig config;
    config.http.timeout = 10ms;
    config.http.retries = 11;
    config.cache.ttl = 0s;
    config.cache.stale_if_error = 700000s;

    auto result = utils::ConfigValidator::validate_application_config(config);
    EXPECT_FALSE(result.is_valid);
    ASSERT_EQ(result.errors.size(), 4u);
    EXPECT_EQ(result.errors[0].first, utils::ValidationError::InvalidTimeout);
    EXPECT_EQ(result.errors[0].second,
              "Invalid http.timeout_ms: must be a number between 1000 and 300000, got 10");
    EXPECT_EQ(result.errors[1].first, utils::ValidationError::InvalidRetries);
    EXPECT_EQ(result.errors[2].first, utils::ValidationError::InvalidCacheTtl);
    EXPECT_EQ(result.errors[3].first, utils::ValidationError::InvalidStaleWindow);

    auto summary = result.get_error_summary();
    EXPECT_NE(summary.find("http.retries"), std::string::npos);
    EXPECT_NE(summary.find("cache.ttl_seconds"), std::string::npos);
}

TEST(ConfigValidatorTest, BoundsAreInclusive) {
    core::HttpConfig http;
    http.timeout = 1000ms;
    http.retries = 0;
    EXPECT_TRUE(utils::ConfigValidator::validate_http_config(http).is_valid);

    http.timeout = 300000ms;
    http.retries = 10;
    EXPECT_TRUE(utils::ConfigValidator::validate_http_config(http).is_valid);

    core::CacheConfig cache;
    cache.ttl = 1s;
    cache.stale_if_error = 604800s;
    EXPECT_TRUE(utils::ConfigValidator::validate_cache_config(cache).is_valid);
}

TEST(ConfigValidatorTest, RetriesAboveCapWarn) {
    core::HttpConfig http;
    http.retries = 8;

    auto result = utils::ConfigValidator::validate_http_config(http);
    EXPECT_TRUE(result.is_valid);
    EXPECT_EQ(result.warnings.size(), 1u);
}

TEST(ConfigValidatorTest, UrlsAreChecked) {
    core::HttpConfig http;
    http.base_url = "ftp://example.com";
    auto http_result = utils::ConfigValidator::validate_http_config(http);
    ASSERT_FALSE(http_result.is_valid);
    EXPECT_EQ(http_result.errors[0].first, utils::ValidationError::InvalidServerUrl);

    core::OAuthConfig oauth;
    oauth.token_url = "http://auth.example.com/token";
    auto oauth_result = utils::ConfigValidator::validate_oauth_config(oauth);
    ASSERT_FALSE(oauth_result.is_valid);
    EXPECT_EQ(oauth_result.errors[0].first, utils::ValidationError::InvalidTokenUrl);
}

TEST(ConfigManagerTest, MissingExplicitPathIsError) {
    test::TempDir dir;
    core::ConfigManager manager(dir / "nope.yaml");

    auto result = manager.load();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind, core::ErrorKind::Config);
    EXPECT_NE(result.error().message.find("file not found"), std::string::npos);
}

TEST(ConfigManagerTest, LoadsExplicitFile) {
    test::TempDir dir;
    write_file(dir / "config.yaml", "http:\n  retries: 1\ncache:\n  dir: " + (dir / "cache").string() + "\n");

    core::ConfigManager manager(dir / "config.yaml");
    ASSERT_TRUE(manager.load());

    EXPECT_EQ(manager.get().http.retries, 1);
    EXPECT_EQ(manager.get().cache.dir, (dir / "cache").string());
    ASSERT_TRUE(manager.source_path().has_value());
    EXPECT_EQ(*manager.source_path(), dir / "config.yaml");
}

TEST(ConfigManagerTest, InvalidValuesAreRejected) {
    test::TempDir dir;
    write_file(dir / "config.yaml", "http:\n  timeout_ms: 5\n  retries: 99\n");

    core::ConfigManager manager(dir / "config.yaml");
    auto result = manager.load();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind, core::ErrorKind::Config);
    EXPECT_NE(result.error().message.find("http.timeout_ms"), std::string::npos);
    EXPECT_NE(result.error().message.find("http.retries"), std::string::npos);
}

TEST(ConfigManagerTest, EnvironmentPathIsUsed) {
    test::TempDir dir;
    write_file(dir / "env.yaml", "http:\n  retries: 4\n");

    ::setenv("TASKRELAY_CONFIG", (dir / "env.yaml").c_str(), 1);
    core::ConfigManager manager;
    auto result = manager.load();
    ::unsetenv("TASKRELAY_CONFIG");

    ASSERT_TRUE(result);
    EXPECT_EQ(manager.get().http.retries, 4);
    EXPECT_FALSE(manager.get().cache.dir.empty());
}

TEST(ConfigManagerTest, MissingEnvironmentPathIsError) {
    test::TempDir dir;

    ::setenv("TASKRELAY_CONFIG", (dir / "missing.yaml").c_str(), 1);
    core::ConfigManager manager;
    auto result = manager.load();
    ::unsetenv("TASKRELAY_CONFIG");

    EXPECT_FALSE(result);
}
