#pragma once

#include "taskrelay/utils/logger.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace taskrelay {
namespace core {

// ============================================================================
// Credential
// ============================================================================

// OAuth credential as persisted in the token file
struct Credential {
    std::string access_token;
    std::optional<std::string> refresh_token;
    std::optional<std::string> token_type;
    std::optional<std::string> scope;
    std::optional<std::int64_t> expires_in;   // seconds
    std::optional<std::int64_t> expires_at;   // epoch milliseconds

    // Unknown fields from the token endpoint, written back untouched
    nlohmann::json extra = nlohmann::json::object();
};

// ============================================================================
// Configuration
// ============================================================================

enum class ConfigError {
    FileNotFound,
    InvalidFormat,
    ValidationError,
    PermissionDenied
};

struct ConfigLimits {
    static constexpr std::chrono::milliseconds MIN_TIMEOUT{1000};
    static constexpr std::chrono::milliseconds MAX_TIMEOUT{300000};
    static constexpr int MIN_RETRIES = 0;
    static constexpr int MAX_RETRIES = 10;
    static constexpr std::chrono::seconds MIN_CACHE_TTL{1};
    static constexpr std::chrono::seconds MAX_CACHE_TTL{604800};
};

struct HttpConfig {
    std::string base_url = "https://api.dida365.com/open/v1";
    std::chrono::milliseconds timeout{15000};
    int retries = 3;
};

struct CacheConfig {
    std::string dir;  // Empty means the platform default
    std::chrono::seconds ttl{3600};
    std::chrono::seconds stale_if_error{86400};

    // Per-namespace TTLs handed to the cache by callers
    std::chrono::seconds projects_ttl{604800};
    std::chrono::seconds tasks_ttl{600};
};

struct OAuthConfig {
    std::string client_id;
    std::string client_secret;
    std::string token_url = "https://dida365.com/oauth/token";
    std::string token_path;  // Empty means the platform default
};

struct ApplicationConfig {
    HttpConfig http;
    CacheConfig cache;
    OAuthConfig oauth;

    std::string token;  // Explicit access token, wins over the token file
    taskrelay::utils::LogLevel log_level = taskrelay::utils::LogLevel::Warning;
};

} // namespace core
} // namespace taskrelay
