#include "taskrelay/services/network/http_client.hpp"
#include "taskrelay/utils/logger.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <chrono>

namespace taskrelay {
namespace services {

// Callback for writing HTTP response data
static size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(const HttpClientConfig& config = {}) : m_config(config) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }

    ~CurlHttpClient() override {
        curl_global_cleanup();
    }

    std::expected<HttpResponse, NetworkError> execute(const HttpRequest& request) override {
        LOG_DEBUG("CurlHttpClient", to_string(request.method) + " " + request.url);

        if (!request.is_valid()) {
            LOG_ERROR("CurlHttpClient", "Invalid URL provided: " + request.url);
            return std::unexpected<NetworkError>(NetworkError::InvalidUrl);
        }

        CURL* curl = curl_easy_init();
        if (!curl) {
            LOG_ERROR("CurlHttpClient", "Failed to initialize curl handle");
            return std::unexpected<NetworkError>(NetworkError::ConnectionFailed);
        }

        std::string response_body;
        auto start_time = std::chrono::steady_clock::now();

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        setup_method_and_body(curl, request);

        struct curl_slist* header_list = setup_headers(request);
        if (header_list) {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
        }

        // The whole attempt is bounded; curl aborts the transfer when it elapses
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(std::min(m_config.connect_timeout, request.timeout).count()));

        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, request.follow_redirects ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(request.max_redirects));

        const bool verify = request.verify_ssl && m_config.verify_ssl;
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, verify ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, verify ? 2L : 0L);
        if (m_config.ca_cert_path) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, m_config.ca_cert_path->c_str());
        }

        CURLcode res = curl_easy_perform(curl);

        long response_code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response_code);

        char* content_type = nullptr;
        curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &content_type);

        HttpResponse response;
        if (content_type) {
            response.headers["Content-Type"] = content_type;
        }

        if (header_list) {
            curl_slist_free_all(header_list);
        }
        curl_easy_cleanup(curl);

        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        if (res != CURLE_OK) {
            LOG_WARNING("CurlHttpClient", "HTTP request failed: " + std::string(curl_easy_strerror(res)));
            return std::unexpected<NetworkError>(curl_error_to_network_error(res));
        }

        LOG_DEBUG("CurlHttpClient", "HTTP request completed in " + std::to_string(duration.count()) +
                  "ms with status " + std::to_string(response_code));

        response.status_code = static_cast<int>(response_code);
        response.body = std::move(response_body);
        response.response_time = duration;
        return response;
    }

    void set_default_headers(const HttpHeaders& headers) override {
        m_config.default_headers = headers;
    }

    void set_user_agent(const std::string& user_agent) override {
        m_config.user_agent = user_agent;
    }

private:
    HttpClientConfig m_config;

    void setup_method_and_body(CURL* curl, const HttpRequest& request) {
        switch (request.method) {
            case HttpMethod::GET:
                break;
            case HttpMethod::POST:
                curl_easy_setopt(curl, CURLOPT_POST, 1L);
                curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
                curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.length()));
                break;
            case HttpMethod::PUT:
            case HttpMethod::PATCH:
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, to_string(request.method).c_str());
                if (!request.body.empty()) {
                    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
                    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.length()));
                }
                break;
            case HttpMethod::DELETE_:
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
                break;
        }
    }

    struct curl_slist* setup_headers(const HttpRequest& request) {
        struct curl_slist* header_list = nullptr;

        for (const auto& [key, value] : m_config.default_headers) {
            if (request.headers.contains(key)) {
                continue;
            }
            std::string header = key + ": " + value;
            header_list = curl_slist_append(header_list, header.c_str());
        }

        for (const auto& [key, value] : request.headers) {
            std::string header = key + ": " + value;
            header_list = curl_slist_append(header_list, header.c_str());
        }

        // Token value is never logged
        if (request.bearer_token) {
            std::string auth_header = "Authorization: Bearer " + *request.bearer_token;
            header_list = curl_slist_append(header_list, auth_header.c_str());
        }

        if (!m_config.user_agent.empty()) {
            std::string ua_header = "User-Agent: " + m_config.user_agent;
            header_list = curl_slist_append(header_list, ua_header.c_str());
        }

        return header_list;
    }

    NetworkError curl_error_to_network_error(CURLcode code) {
        switch (code) {
            case CURLE_COULDNT_RESOLVE_HOST:
            case CURLE_COULDNT_RESOLVE_PROXY:
                return NetworkError::DNSResolutionFailed;
            case CURLE_COULDNT_CONNECT:
                return NetworkError::ConnectionFailed;
            case CURLE_OPERATION_TIMEDOUT:
                return NetworkError::Timeout;
            case CURLE_SSL_CONNECT_ERROR:
            case CURLE_SSL_CERTPROBLEM:
            case CURLE_SSL_CIPHER:
            case CURLE_PEER_FAILED_VERIFICATION:
                return NetworkError::SSLError;
            case CURLE_TOO_MANY_REDIRECTS:
                return NetworkError::TooManyRedirects;
            case CURLE_URL_MALFORMAT:
                return NetworkError::InvalidUrl;
            case CURLE_ABORTED_BY_CALLBACK:
                return NetworkError::Cancelled;
            default:
                return NetworkError::BadResponse;
        }
    }
};

std::unique_ptr<HttpClient> create_http_client(const HttpClientConfig& config) {
    return std::make_unique<CurlHttpClient>(config);
}

} // namespace services
} // namespace taskrelay
