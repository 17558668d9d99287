#pragma once

#include "taskrelay/core/errors.hpp"
#include "taskrelay/services/network/http_client.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <expected>
#include <memory>
#include <optional>
#include <string>

namespace taskrelay {
namespace services {

struct TransportOptions {
    std::string base_url;
    std::optional<std::string> token;
    std::chrono::milliseconds timeout{15000};
    int retries = 3;

    // Delay before retry n is min(backoff_base * 2^n, backoff_cap)
    std::chrono::milliseconds backoff_base{200};
    std::chrono::milliseconds backoff_cap{5000};
};

// Bookkeeping for one logical request across its attempts
struct RetryState {
    int attempt = 0;
    std::chrono::steady_clock::time_point started = std::chrono::steady_clock::now();

    std::chrono::milliseconds elapsed() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
    }
};

/**
 * @brief JSON API client with per-attempt timeout and retry with backoff
 *
 * 4xx responses are terminal. 5xx responses and transport failures are
 * retried up to min(retries, MAX_RETRIES) extra times. Exhausted 5xx
 * retries surface the last Api error; exhausted transport retries surface
 * a Network error carrying the underlying cause.
 */
class TransportClient {
public:
    static constexpr int MAX_RETRIES = 5;

    TransportClient(std::shared_ptr<HttpClient> http_client, TransportOptions options);

    std::expected<nlohmann::json, core::Error> request(
        HttpMethod method,
        const std::string& path,
        const std::optional<nlohmann::json>& body = std::nullopt);

    std::expected<nlohmann::json, core::Error> get(const std::string& path);
    std::expected<nlohmann::json, core::Error> post(
        const std::string& path,
        const std::optional<nlohmann::json>& body = std::nullopt);
    std::expected<nlohmann::json, core::Error> del(const std::string& path);

    // Attempts made by the most recent request
    int attempt_count() const { return m_attempt_count.load(); }

    const TransportOptions& options() const { return m_options; }

    static std::chrono::milliseconds backoff_delay(int attempt,
                                                   std::chrono::milliseconds base,
                                                   std::chrono::milliseconds cap);

private:
    std::expected<HttpResponse, core::Error> execute_with_retry(const HttpRequest& request,
                                                                const std::string& path);
    std::expected<nlohmann::json, core::Error> parse_response(const HttpResponse& response,
                                                              const std::string& path) const;
    bool endpoint_configured() const;

    std::shared_ptr<HttpClient> m_http_client;
    TransportOptions m_options;
    std::atomic<int> m_attempt_count{0};
};

} // namespace services
} // namespace taskrelay
