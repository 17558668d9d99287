#include "taskrelay/utils/config_validator.hpp"
#include "taskrelay/utils/url_utils.hpp"

namespace taskrelay::utils {

void ConfigValidator::check_range(ValidationResult& result,
                                  ValidationError error,
                                  const std::string& name,
                                  long long value,
                                  long long min,
                                  long long max) {
    if (value < min || value > max) {
        result.add_error(error, "Invalid " + name + ": must be a number between " +
                                std::to_string(min) + " and " + std::to_string(max) +
                                ", got " + std::to_string(value));
    }
}

ValidationResult ConfigValidator::validate_http_config(const core::HttpConfig& config) {
    ValidationResult result;

    if (!UrlUtils::is_valid_url(config.base_url)) {
        result.add_error(ValidationError::InvalidServerUrl,
            "Invalid http.base_url: \"" + config.base_url + "\". Must be a valid HTTP/HTTPS URL.");
    }

    check_range(result, ValidationError::InvalidTimeout, "http.timeout_ms",
                config.timeout.count(),
                core::ConfigLimits::MIN_TIMEOUT.count(),
                core::ConfigLimits::MAX_TIMEOUT.count());

    check_range(result, ValidationError::InvalidRetries, "http.retries",
                config.retries,
                core::ConfigLimits::MIN_RETRIES,
                core::ConfigLimits::MAX_RETRIES);

    if (config.retries > 5 && config.retries <= core::ConfigLimits::MAX_RETRIES) {
        result.add_warning("http.retries above 5 is capped at 5 per request");
    }

    return result;
}

ValidationResult ConfigValidator::validate_cache_config(const core::CacheConfig& config) {
    ValidationResult result;

    const auto min_ttl = core::ConfigLimits::MIN_CACHE_TTL.count();
    const auto max_ttl = core::ConfigLimits::MAX_CACHE_TTL.count();

    check_range(result, ValidationError::InvalidCacheTtl, "cache.ttl_seconds",
                config.ttl.count(), min_ttl, max_ttl);
    check_range(result, ValidationError::InvalidStaleWindow, "cache.stale_if_error_seconds",
                config.stale_if_error.count(), min_ttl, max_ttl);
    check_range(result, ValidationError::InvalidCacheTtl, "cache.projects_ttl_seconds",
                config.projects_ttl.count(), min_ttl, max_ttl);
    check_range(result, ValidationError::InvalidCacheTtl, "cache.tasks_ttl_seconds",
                config.tasks_ttl.count(), min_ttl, max_ttl);

    return result;
}

ValidationResult ConfigValidator::validate_oauth_config(const core::OAuthConfig& config) {
    ValidationResult result;

    if (!config.token_url.empty() && !UrlUtils::is_https_url(config.token_url)) {
        result.add_error(ValidationError::InvalidTokenUrl,
            "oauth.token_url must use HTTPS: " + config.token_url);
    }

    if (!config.client_secret.empty() && config.client_id.empty()) {
        result.add_warning("oauth.client_secret is set but oauth.client_id is empty");
    }

    return result;
}

ValidationResult ConfigValidator::validate_application_config(const core::ApplicationConfig& config) {
    ValidationResult result;

    result.merge(validate_http_config(config.http));
    result.merge(validate_cache_config(config.cache));
    result.merge(validate_oauth_config(config.oauth));

    return result;
}

} // namespace taskrelay::utils
