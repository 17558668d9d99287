#include "taskrelay/core/config_manager.hpp"
#include "taskrelay/utils/config_validator.hpp"
#include "taskrelay/utils/logger.hpp"
#include "taskrelay/utils/paths.hpp"
#include "taskrelay/utils/yaml_config.hpp"
#include <cstdlib>
#include <shared_mutex>

namespace taskrelay {
namespace core {

namespace {

struct Candidate {
    std::filesystem::path path;
    bool required = false;
};

std::string describe(ConfigError error) {
    switch (error) {
        case ConfigError::FileNotFound: return "file not found";
        case ConfigError::InvalidFormat: return "invalid YAML";
        case ConfigError::ValidationError: return "validation failed";
        case ConfigError::PermissionDenied: return "permission denied";
        default: return "unknown error";
    }
}

} // anonymous namespace

// Configuration manager implementation

class ConfigManager::Impl {
public:
    explicit Impl(const std::filesystem::path& config_path)
        : m_explicit_path(config_path) {
        LOG_DEBUG("ConfigService", "Initializing" +
                  (config_path.empty() ? std::string() : " with path: " + config_path.string()));
    }

    std::expected<void, Error> load() {
        LOG_DEBUG("ConfigService", "Loading configuration");

        ApplicationConfig config;
        std::optional<std::filesystem::path> source;

        for (const auto& candidate : candidates()) {
            auto result = utils::YamlConfigHelper::load_from_file(candidate.path);
            if (result) {
                config = *result;
                source = candidate.path;
                break;
            }
            if (result.error() == ConfigError::FileNotFound && !candidate.required) {
                continue;
            }
            return std::unexpected(config_error("Failed to load configuration from " +
                                                candidate.path.string() + ": " +
                                                describe(result.error())));
        }

        resolve_paths(config);

        auto validation = utils::ConfigValidator::validate_application_config(config);
        if (!validation.is_valid) {
            return std::unexpected(config_error("Invalid configuration: " +
                                                validation.get_error_summary()));
        }

        for (const auto& warning : validation.warnings) {
            LOG_WARNING("ConfigService", warning);
        }

        std::unique_lock lock(m_mutex);
        m_config = std::move(config);
        m_source = std::move(source);
        m_warnings = validation.warnings;

        if (m_source) {
            LOG_DEBUG("ConfigService", "Configuration loaded from " + m_source->string());
        } else {
            LOG_INFO("ConfigService", "Using default configuration");
        }
        return {};
    }

    const ApplicationConfig& get() const {
        std::shared_lock lock(m_mutex);
        return m_config;
    }

    std::optional<std::filesystem::path> source_path() const {
        std::shared_lock lock(m_mutex);
        return m_source;
    }

    std::vector<std::string> warnings() const {
        std::shared_lock lock(m_mutex);
        return m_warnings;
    }

private:
    std::vector<Candidate> candidates() const {
        if (!m_explicit_path.empty()) {
            return {{m_explicit_path, true}};
        }

        std::vector<Candidate> result;
        if (const char* env_path = std::getenv("TASKRELAY_CONFIG"); env_path && *env_path) {
            result.push_back({utils::expand_home(env_path), true});
        }
        result.push_back({std::filesystem::current_path() / "taskrelay.yaml", false});
        result.push_back({default_config_path(), false});
        return result;
    }

    static void resolve_paths(ApplicationConfig& config) {
        if (config.cache.dir.empty()) {
            config.cache.dir = utils::cache_directory().string();
        } else {
            config.cache.dir = utils::expand_home(config.cache.dir).string();
        }
    }

    mutable std::shared_mutex m_mutex;
    std::filesystem::path m_explicit_path;
    ApplicationConfig m_config;
    std::optional<std::filesystem::path> m_source;
    std::vector<std::string> m_warnings;
};

// ConfigManager implementation

ConfigManager::ConfigManager(const std::filesystem::path& config_path)
    : m_impl(std::make_unique<Impl>(config_path)) {}

ConfigManager::~ConfigManager() = default;

std::expected<void, Error> ConfigManager::load() {
    return m_impl->load();
}

const ApplicationConfig& ConfigManager::get() const {
    return m_impl->get();
}

std::optional<std::filesystem::path> ConfigManager::source_path() const {
    return m_impl->source_path();
}

std::vector<std::string> ConfigManager::warnings() const {
    return m_impl->warnings();
}

std::filesystem::path ConfigManager::default_config_path() {
    return utils::config_directory() / "config.yaml";
}

} // namespace core
} // namespace taskrelay
