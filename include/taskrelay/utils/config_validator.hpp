#pragma once

#include "taskrelay/core/models.hpp"
#include <string>
#include <utility>
#include <vector>

namespace taskrelay::utils {

/**
 * @brief Configuration validation errors
 */
enum class ValidationError {
    InvalidTimeout,
    InvalidRetries,
    InvalidCacheTtl,
    InvalidStaleWindow,
    InvalidServerUrl,
    InvalidTokenUrl
};

/**
 * @brief Detailed validation result
 */
struct ValidationResult {
    bool is_valid = true;
    std::vector<std::pair<ValidationError, std::string>> errors;
    std::vector<std::string> warnings;

    void add_error(ValidationError error, const std::string& message) {
        is_valid = false;
        errors.emplace_back(error, message);
    }

    void add_warning(const std::string& message) {
        warnings.emplace_back(message);
    }

    void merge(const ValidationResult& other) {
        errors.insert(errors.end(), other.errors.begin(), other.errors.end());
        warnings.insert(warnings.end(), other.warnings.begin(), other.warnings.end());
        is_valid = is_valid && other.is_valid;
    }

    std::string get_error_summary() const {
        std::string summary;
        for (const auto& [error, message] : errors) {
            if (!summary.empty()) summary += "; ";
            summary += message;
        }
        return summary;
    }

    std::string get_warning_summary() const {
        std::string summary;
        for (const auto& warning : warnings) {
            if (!summary.empty()) summary += "; ";
            summary += warning;
        }
        return summary;
    }
};

/**
 * @brief Bounds and format checks for the loaded configuration
 *
 * Every violation is collected so a single run reports all of them.
 */
class ConfigValidator {
public:
    static ValidationResult validate_http_config(const core::HttpConfig& config);
    static ValidationResult validate_cache_config(const core::CacheConfig& config);
    static ValidationResult validate_oauth_config(const core::OAuthConfig& config);
    static ValidationResult validate_application_config(const core::ApplicationConfig& config);

private:
    static void check_range(ValidationResult& result,
                            ValidationError error,
                            const std::string& name,
                            long long value,
                            long long min,
                            long long max);
};

} // namespace taskrelay::utils
