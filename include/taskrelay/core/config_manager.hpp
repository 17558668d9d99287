#pragma once

#include "taskrelay/core/errors.hpp"
#include "taskrelay/core/models.hpp"
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace taskrelay {
namespace core {

/**
 * @brief Locates, loads and validates the YAML configuration
 *
 * Candidates are tried in order: the explicit path, $TASKRELAY_CONFIG,
 * ./taskrelay.yaml, then the user config directory. The first existing
 * file is used; with none, defaults apply. An explicit path or
 * $TASKRELAY_CONFIG that does not exist is an error.
 */
class ConfigManager {
public:
    explicit ConfigManager(const std::filesystem::path& config_path = {});
    ~ConfigManager();

    std::expected<void, Error> load();

    const ApplicationConfig& get() const;

    // File the configuration came from, empty when defaults are in use
    std::optional<std::filesystem::path> source_path() const;
    std::vector<std::string> warnings() const;

    static std::filesystem::path default_config_path();

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace core
} // namespace taskrelay
