#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace taskrelay {
namespace core {

// Error taxonomy shared by every layer
enum class ErrorKind {
    Validation,
    NotFound,
    Network,
    Api,
    Auth,
    NotImplemented,
    Config,
    Io,
    Unknown
};

// Process exit codes, stable for scripting
enum class ExitCode : std::uint8_t {
    Ok = 0,
    Unknown = 1,
    Validation = 2,
    Auth = 3,
    NotFound = 4,
    Network = 5,
    NotImplemented = 6
};

struct Error {
    ErrorKind kind = ErrorKind::Unknown;
    std::string message;
    std::optional<int> status_code;
    std::optional<std::string> path;
    std::string detail;  // Truncated response body or underlying cause

    std::string to_string() const;
};

// Response bodies attached to errors are cut to this many characters
inline constexpr std::size_t MAX_ERROR_BODY_LENGTH = 500;

Error validation_error(const std::string& message, const std::string& field = {});
Error not_found_error(const std::string& resource, const std::string& id);
Error network_error(const std::string& message, const std::string& cause = {});
Error api_error(const std::string& message, int status_code,
                const std::string& path = {}, const std::string& body = {});
Error auth_error(const std::string& message);
Error not_implemented_error(const std::string& message = "Not implemented");
Error config_error(const std::string& message);
Error io_error(const std::string& message);

std::string to_string(ErrorKind kind);
ExitCode exit_code_for(const Error& error);

} // namespace core
} // namespace taskrelay
