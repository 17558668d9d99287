#pragma once

#include <filesystem>
#include <string>

namespace taskrelay {
namespace utils {

// Replaces a leading "~" with $HOME
std::filesystem::path expand_home(const std::string& path);

// XDG base directories with their ~/.config, ~/.cache, ~/.local/state fallbacks,
// each suffixed with the application directory
std::filesystem::path config_directory();
std::filesystem::path cache_directory();
std::filesystem::path state_directory();

} // namespace utils
} // namespace taskrelay
