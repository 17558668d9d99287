#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace taskrelay {
namespace utils {

using FormFields = std::vector<std::pair<std::string, std::string>>;

class UrlUtils {
public:
    static std::string encode(const std::string& str);

    // Resolves a relative API path against a base URL, one slash between them
    static std::string join_path(const std::string& base, const std::string& path);

    // application/x-www-form-urlencoded body, fields kept in order
    static std::string build_form_body(const FormFields& fields);

    static bool is_valid_url(const std::string& url);
    static bool is_https_url(const std::string& url);
    static std::optional<std::string> get_scheme(const std::string& url);
};

} // namespace utils
} // namespace taskrelay
