#include "taskrelay/core/errors.hpp"

namespace taskrelay {
namespace core {

std::string Error::to_string() const {
    std::string result = message;
    if (!detail.empty()) {
        result += " (" + detail + ")";
    }
    return result;
}

Error validation_error(const std::string& message, const std::string& field) {
    Error error;
    error.kind = ErrorKind::Validation;
    error.message = message;
    error.status_code = 400;
    if (!field.empty()) {
        error.path = field;
    }
    return error;
}

Error not_found_error(const std::string& resource, const std::string& id) {
    Error error;
    error.kind = ErrorKind::NotFound;
    error.message = resource + " not found: " + id;
    error.status_code = 404;
    error.path = resource + "/" + id;
    return error;
}

Error network_error(const std::string& message, const std::string& cause) {
    Error error;
    error.kind = ErrorKind::Network;
    error.message = message;
    error.detail = cause;
    return error;
}

Error api_error(const std::string& message, int status_code,
                const std::string& path, const std::string& body) {
    Error error;
    error.kind = ErrorKind::Api;
    error.message = "API returned HTTP " + std::to_string(status_code) + ": " + message;
    error.status_code = status_code;
    if (!path.empty()) {
        error.path = path;
    }
    error.detail = body.substr(0, MAX_ERROR_BODY_LENGTH);
    return error;
}

Error auth_error(const std::string& message) {
    Error error;
    error.kind = ErrorKind::Auth;
    error.message = message;
    return error;
}

Error not_implemented_error(const std::string& message) {
    Error error;
    error.kind = ErrorKind::NotImplemented;
    error.message = message;
    error.status_code = 501;
    return error;
}

Error config_error(const std::string& message) {
    Error error;
    error.kind = ErrorKind::Config;
    error.message = message;
    return error;
}

Error io_error(const std::string& message) {
    Error error;
    error.kind = ErrorKind::Io;
    error.message = message;
    return error;
}

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return "ValidationError";
        case ErrorKind::NotFound: return "NotFoundError";
        case ErrorKind::Network: return "NetworkError";
        case ErrorKind::Api: return "ApiError";
        case ErrorKind::Auth: return "AuthError";
        case ErrorKind::NotImplemented: return "NotImplementedError";
        case ErrorKind::Config: return "ConfigError";
        case ErrorKind::Io: return "IoError";
        case ErrorKind::Unknown: return "UnknownError";
        default: return "UnknownError";
    }
}

ExitCode exit_code_for(const Error& error) {
    switch (error.kind) {
        case ErrorKind::Validation:
        case ErrorKind::Config:
            return ExitCode::Validation;
        case ErrorKind::Auth:
            return ExitCode::Auth;
        case ErrorKind::NotFound:
            return ExitCode::NotFound;
        case ErrorKind::Network:
            return ExitCode::Network;
        case ErrorKind::NotImplemented:
            return ExitCode::NotImplemented;
        case ErrorKind::Api:
            if (error.status_code && (*error.status_code == 401 || *error.status_code == 403)) {
                return ExitCode::Auth;
            }
            return ExitCode::Unknown;
        default:
            return ExitCode::Unknown;
    }
}

} // namespace core
} // namespace taskrelay
