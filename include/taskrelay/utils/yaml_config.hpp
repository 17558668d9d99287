#pragma once

#include "taskrelay/core/models.hpp"
#include <yaml-cpp/yaml.h>
#include <expected>
#include <filesystem>

namespace taskrelay {
namespace utils {

class YamlConfigHelper {
public:
    // Load configuration from YAML file
    static std::expected<core::ApplicationConfig, core::ConfigError>
    load_from_file(const std::filesystem::path& path);

    // Nested sections win over the flat legacy keys
    static core::ApplicationConfig from_yaml(const YAML::Node& node);
    static YAML::Node to_yaml(const core::ApplicationConfig& config);

private:
    static void parse_http_config(const YAML::Node& node, core::HttpConfig& config);
    static void parse_cache_config(const YAML::Node& node, core::CacheConfig& config);
    static void parse_oauth_config(const YAML::Node& node, core::OAuthConfig& config);
};

} // namespace utils
} // namespace taskrelay
