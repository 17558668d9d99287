#include "taskrelay/services/network/http_types.hpp"
#include "taskrelay/services/network/http_client.hpp"
#include "taskrelay/utils/url_utils.hpp"

#include <algorithm>
#include <cctype>

namespace taskrelay {
namespace services {

bool HttpRequest::is_valid() const {
    return !url.empty() && utils::UrlUtils::is_valid_url(url) && timeout.count() > 0;
}

bool HttpResponse::is_success() const {
    return status_code >= 200 && status_code < 300;
}

bool HttpResponse::is_client_error() const {
    return status_code >= 400 && status_code < 500;
}

bool HttpResponse::is_server_error() const {
    return status_code >= 500 && status_code < 600;
}

std::optional<std::string> HttpResponse::get_header(const std::string& name) const {
    auto it = std::find_if(headers.begin(), headers.end(),
        [&name](const auto& pair) {
            return std::equal(pair.first.begin(), pair.first.end(),
                            name.begin(), name.end(),
                            [](char a, char b) {
                                return std::tolower(static_cast<unsigned char>(a)) ==
                                       std::tolower(static_cast<unsigned char>(b));
                            });
        });
    return it != headers.end() ? std::make_optional(it->second) : std::nullopt;
}

bool HttpClientConfig::is_valid() const {
    return connect_timeout.count() > 0;
}

std::string to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::DELETE_: return "DELETE";
        case HttpMethod::PATCH: return "PATCH";
        default: return "GET";
    }
}

std::string to_string(NetworkError error) {
    switch (error) {
        case NetworkError::ConnectionFailed: return "connection failed";
        case NetworkError::Timeout: return "request timed out";
        case NetworkError::DNSResolutionFailed: return "DNS resolution failed";
        case NetworkError::SSLError: return "SSL error";
        case NetworkError::InvalidUrl: return "invalid URL";
        case NetworkError::TooManyRedirects: return "too many redirects";
        case NetworkError::BadResponse: return "bad response";
        case NetworkError::Cancelled: return "request cancelled";
        default: return "unknown network error";
    }
}

} // namespace services
} // namespace taskrelay
