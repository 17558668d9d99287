#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>

namespace taskrelay {
namespace services {

enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE_,
    PATCH
};

// Transport-level failures, before any HTTP status is available
enum class NetworkError {
    ConnectionFailed,
    Timeout,
    DNSResolutionFailed,
    SSLError,
    InvalidUrl,
    TooManyRedirects,
    BadResponse,
    Cancelled
};

using HttpHeaders = std::unordered_map<std::string, std::string>;

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::string body;
    std::chrono::milliseconds timeout{15000};
    bool follow_redirects = true;
    int max_redirects = 5;

    std::optional<std::string> bearer_token;
    bool verify_ssl = true;

    bool is_valid() const;
};

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::string body;
    std::chrono::milliseconds response_time{0};

    bool is_success() const;
    bool is_client_error() const;
    bool is_server_error() const;
    std::optional<std::string> get_header(const std::string& name) const;
};

std::string to_string(HttpMethod method);
std::string to_string(NetworkError error);

} // namespace services
} // namespace taskrelay
