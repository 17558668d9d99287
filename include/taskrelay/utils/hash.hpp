#pragma once

#include <string>

namespace taskrelay {
namespace utils {

// Lowercase hex SHA-1 digest, used to derive cache file names from keys
std::string sha1_hex(const std::string& data);

} // namespace utils
} // namespace taskrelay
