#include "taskrelay/utils/url_utils.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace taskrelay {
namespace utils {

std::string UrlUtils::encode(const std::string& str) {
    std::ostringstream encoded;
    encoded.fill('0');
    encoded << std::hex;

    for (char c : str) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << std::uppercase;
            encoded << '%' << std::setw(2) << static_cast<int>(uc);
            encoded << std::nouppercase;
        }
    }

    return encoded.str();
}

std::string UrlUtils::join_path(const std::string& base, const std::string& path) {
    if (base.empty()) return path;
    if (path.empty()) return base;

    bool base_ends_with_slash = base.back() == '/';
    bool path_starts_with_slash = path.front() == '/';

    if (base_ends_with_slash && path_starts_with_slash) {
        return base + path.substr(1);
    } else if (!base_ends_with_slash && !path_starts_with_slash) {
        return base + "/" + path;
    } else {
        return base + path;
    }
}

std::string UrlUtils::build_form_body(const FormFields& fields) {
    std::ostringstream oss;
    bool first = true;

    for (const auto& [key, value] : fields) {
        if (!first) oss << "&";
        oss << encode(key) << "=" << encode(value);
        first = false;
    }

    return oss.str();
}

bool UrlUtils::is_valid_url(const std::string& url) {
    auto scheme = get_scheme(url);
    if (!scheme) {
        return false;
    }
    // Require something after "://"
    if (url.size() <= scheme->size() + 3) {
        return false;
    }
    return *scheme == "http" || *scheme == "https";
}

bool UrlUtils::is_https_url(const std::string& url) {
    return is_valid_url(url) && get_scheme(url) == "https";
}

std::optional<std::string> UrlUtils::get_scheme(const std::string& url) {
    size_t scheme_pos = url.find("://");
    if (scheme_pos == std::string::npos || scheme_pos == 0) {
        return std::nullopt;
    }
    return url.substr(0, scheme_pos);
}

} // namespace utils
} // namespace taskrelay
