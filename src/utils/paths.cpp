#include "taskrelay/utils/paths.hpp"
#include <cstdlib>

namespace taskrelay {
namespace utils {

namespace {

constexpr const char* APP_DIRECTORY = "taskrelay";

std::filesystem::path home_directory() {
    if (const char* home = std::getenv("HOME")) {
        return home;
    }
    return std::filesystem::current_path();
}

std::filesystem::path xdg_directory(const char* variable, const std::filesystem::path& fallback) {
    if (const char* value = std::getenv(variable); value && *value) {
        return std::filesystem::path(value) / APP_DIRECTORY;
    }
    return home_directory() / fallback / APP_DIRECTORY;
}

} // anonymous namespace

std::filesystem::path expand_home(const std::string& path) {
    if (path == "~") {
        return home_directory();
    }
    if (path.starts_with("~/")) {
        return home_directory() / path.substr(2);
    }
    return path;
}

std::filesystem::path config_directory() {
    return xdg_directory("XDG_CONFIG_HOME", ".config");
}

std::filesystem::path cache_directory() {
    return xdg_directory("XDG_CACHE_HOME", ".cache");
}

std::filesystem::path state_directory() {
    return xdg_directory("XDG_STATE_HOME", std::filesystem::path(".local") / "state");
}

} // namespace utils
} // namespace taskrelay
