#include "taskrelay/utils/yaml_config.hpp"
#include "taskrelay/utils/logger.hpp"
#include <cstdint>

namespace taskrelay {
namespace utils {

namespace {
    // Nested value first, then the flat legacy key
    YAML::Node pick(const YAML::Node& root, const char* section, const char* nested, const char* flat) {
        if (root[section] && root[section].IsMap() && root[section][nested]) {
            return root[section][nested];
        }
        return root[flat];
    }
}

std::expected<core::ApplicationConfig, core::ConfigError>
YamlConfigHelper::load_from_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        LOG_DEBUG("YamlConfig", "File not found: " + path.string());
        return std::unexpected(core::ConfigError::FileNotFound);
    }

    try {
        YAML::Node node = YAML::LoadFile(path.string());
        if (node.IsNull()) {
            return core::ApplicationConfig{};
        }
        if (!node.IsMap()) {
            LOG_ERROR("YamlConfig", "Top level of " + path.string() + " is not a mapping");
            return std::unexpected(core::ConfigError::InvalidFormat);
        }
        return from_yaml(node);
    } catch (const YAML::BadFile& e) {
        LOG_ERROR("YamlConfig", "Cannot read " + path.string() + ": " + std::string(e.what()));
        return std::unexpected(core::ConfigError::PermissionDenied);
    } catch (const YAML::Exception& e) {
        LOG_ERROR("YamlConfig", "Parse error: " + std::string(e.what()));
        return std::unexpected(core::ConfigError::InvalidFormat);
    }
}

core::ApplicationConfig YamlConfigHelper::from_yaml(const YAML::Node& node) {
    core::ApplicationConfig config;

    if (node["log_level"]) {
        config.log_level = log_level_from_string(node["log_level"].as<std::string>());
    }
    if (node["token"]) {
        config.token = node["token"].as<std::string>();
    }

    parse_http_config(node, config.http);
    parse_cache_config(node, config.cache);
    parse_oauth_config(node, config.oauth);

    return config;
}

void YamlConfigHelper::parse_http_config(const YAML::Node& node, core::HttpConfig& config) {
    if (auto value = pick(node, "http", "base_url", "base_url")) {
        config.base_url = value.as<std::string>();
    }
    if (auto value = pick(node, "http", "timeout_ms", "timeout_ms")) {
        config.timeout = std::chrono::milliseconds(value.as<std::int64_t>());
    }
    if (auto value = pick(node, "http", "retries", "retries")) {
        config.retries = value.as<int>();
    }
}

void YamlConfigHelper::parse_cache_config(const YAML::Node& node, core::CacheConfig& config) {
    if (auto value = pick(node, "cache", "dir", "cache_dir")) {
        config.dir = value.as<std::string>();
    }
    if (auto value = pick(node, "cache", "ttl_seconds", "cache_ttl_seconds")) {
        config.ttl = std::chrono::seconds(value.as<std::int64_t>());
    }
    if (auto value = pick(node, "cache", "stale_if_error_seconds", "cache_stale_if_error_seconds")) {
        config.stale_if_error = std::chrono::seconds(value.as<std::int64_t>());
    }
    if (auto value = pick(node, "cache", "projects_ttl_seconds", "projects_cache_ttl_seconds")) {
        config.projects_ttl = std::chrono::seconds(value.as<std::int64_t>());
    }
    if (auto value = pick(node, "cache", "tasks_ttl_seconds", "tasks_cache_ttl_seconds")) {
        config.tasks_ttl = std::chrono::seconds(value.as<std::int64_t>());
    }
}

void YamlConfigHelper::parse_oauth_config(const YAML::Node& node, core::OAuthConfig& config) {
    if (auto value = pick(node, "oauth", "client_id", "client_id")) {
        config.client_id = value.as<std::string>();
    }
    if (auto value = pick(node, "oauth", "client_secret", "client_secret")) {
        config.client_secret = value.as<std::string>();
    }
    if (auto value = pick(node, "oauth", "token_url", "token_url")) {
        config.token_url = value.as<std::string>();
    }
    if (auto value = pick(node, "oauth", "token_path", "token_path")) {
        config.token_path = value.as<std::string>();
    }
}

YAML::Node YamlConfigHelper::to_yaml(const core::ApplicationConfig& config) {
    YAML::Node node;

    node["log_level"] = to_string(config.log_level);

    node["http"]["base_url"] = config.http.base_url;
    node["http"]["timeout_ms"] = static_cast<std::int64_t>(config.http.timeout.count());
    node["http"]["retries"] = config.http.retries;

    node["cache"]["dir"] = config.cache.dir;
    node["cache"]["ttl_seconds"] = static_cast<std::int64_t>(config.cache.ttl.count());
    node["cache"]["stale_if_error_seconds"] = static_cast<std::int64_t>(config.cache.stale_if_error.count());
    node["cache"]["projects_ttl_seconds"] = static_cast<std::int64_t>(config.cache.projects_ttl.count());
    node["cache"]["tasks_ttl_seconds"] = static_cast<std::int64_t>(config.cache.tasks_ttl.count());

    // Secrets are left out
    node["oauth"]["client_id"] = config.oauth.client_id;
    node["oauth"]["token_url"] = config.oauth.token_url;
    node["oauth"]["token_path"] = config.oauth.token_path;

    return node;
}

} // namespace utils
} // namespace taskrelay
