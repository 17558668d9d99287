#pragma once

#include "taskrelay/services/network/http_types.hpp"
#include "taskrelay/version.hpp"
#include <expected>
#include <memory>
#include <string>

namespace taskrelay {
namespace services {

// HTTP client interface
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Performs a single attempt; no retries at this level
    virtual std::expected<HttpResponse, NetworkError> execute(const HttpRequest& request) = 0;

    virtual void set_default_headers(const HttpHeaders& headers) = 0;
    virtual void set_user_agent(const std::string& user_agent) = 0;
};

struct HttpClientConfig {
    HttpHeaders default_headers;
    std::string user_agent = "taskrelay/" TASKRELAY_VERSION_STRING;
    std::chrono::milliseconds connect_timeout{10000};
    bool verify_ssl = true;
    std::optional<std::string> ca_cert_path;

    bool is_valid() const;
};

// libcurl-backed client
std::unique_ptr<HttpClient> create_http_client(const HttpClientConfig& config = {});

} // namespace services
} // namespace taskrelay
