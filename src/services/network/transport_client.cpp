#include "taskrelay/services/network/transport_client.hpp"
#include "taskrelay/utils/json_helper.hpp"
#include "taskrelay/utils/logger.hpp"
#include "taskrelay/utils/url_utils.hpp"
#include <algorithm>
#include <thread>

namespace taskrelay {
namespace services {

TransportClient::TransportClient(std::shared_ptr<HttpClient> http_client, TransportOptions options)
    : m_http_client(std::move(http_client))
    , m_options(std::move(options)) {
}

std::chrono::milliseconds TransportClient::backoff_delay(int attempt,
                                                         std::chrono::milliseconds base,
                                                         std::chrono::milliseconds cap) {
    // Shift is bounded so the multiplication cannot overflow
    const int exponent = std::clamp(attempt, 0, 20);
    const auto delay = base * (std::int64_t{1} << exponent);
    return std::min(delay, cap);
}

bool TransportClient::endpoint_configured() const {
    return !m_options.base_url.empty() && !m_options.base_url.starts_with("TODO");
}

std::expected<nlohmann::json, core::Error> TransportClient::request(
    HttpMethod method,
    const std::string& path,
    const std::optional<nlohmann::json>& body) {

    if (!endpoint_configured()) {
        return std::unexpected(core::network_error(
            "HTTP endpoint not configured. Set http.base_url in config."));
    }

    HttpRequest request;
    request.method = method;
    request.url = utils::UrlUtils::join_path(m_options.base_url, path);
    request.timeout = m_options.timeout;
    request.headers["Accept"] = "application/json";

    if (m_options.token && !m_options.token->empty()) {
        request.bearer_token = m_options.token;
    }
    if (body) {
        request.headers["Content-Type"] = "application/json";
        request.body = body->dump();
    }

    auto response = execute_with_retry(request, path);
    if (!response) {
        return std::unexpected(response.error());
    }

    return parse_response(*response, path);
}

std::expected<nlohmann::json, core::Error> TransportClient::get(const std::string& path) {
    return request(HttpMethod::GET, path);
}

std::expected<nlohmann::json, core::Error> TransportClient::post(
    const std::string& path,
    const std::optional<nlohmann::json>& body) {
    return request(HttpMethod::POST, path, body);
}

std::expected<nlohmann::json, core::Error> TransportClient::del(const std::string& path) {
    return request(HttpMethod::DELETE_, path);
}

std::expected<HttpResponse, core::Error> TransportClient::execute_with_retry(
    const HttpRequest& request,
    const std::string& path) {

    const int max_retries = std::clamp(m_options.retries, 0, MAX_RETRIES);
    RetryState state;
    core::Error last_error = core::network_error("Network request failed");

    for (state.attempt = 0; state.attempt <= max_retries; ++state.attempt) {
        m_attempt_count = state.attempt + 1;

        auto result = m_http_client->execute(request);

        if (!result) {
            if (result.error() == NetworkError::Timeout) {
                last_error = core::network_error(
                    "Request timed out after " + std::to_string(m_options.timeout.count()) + "ms",
                    to_string(result.error()));
            } else {
                last_error = core::network_error("Network request failed", to_string(result.error()));
            }
            LOG_DEBUG("TransportClient", to_string(request.method) + " " + path + " attempt " +
                      std::to_string(state.attempt + 1) + " failed: " + to_string(result.error()));
        } else if (result->is_success()) {
            return std::move(*result);
        } else if (result->is_server_error()) {
            last_error = core::api_error("Server error", result->status_code, path, result->body);
            LOG_DEBUG("TransportClient", to_string(request.method) + " " + path + " attempt " +
                      std::to_string(state.attempt + 1) + " returned " +
                      std::to_string(result->status_code));
        } else {
            // 4xx and anything else outside 2xx/5xx is never retried
            LOG_DEBUG("TransportClient", to_string(request.method) + " " + path + " returned " +
                      std::to_string(result->status_code) + ", not retrying");
            return std::unexpected(core::api_error("Request rejected", result->status_code,
                                                   path, result->body));
        }

        if (state.attempt < max_retries) {
            const auto delay = backoff_delay(state.attempt, m_options.backoff_base, m_options.backoff_cap);
            LOG_INFO("TransportClient", "Retrying " + path + " in " + std::to_string(delay.count()) + "ms");
            std::this_thread::sleep_for(delay);
        }
    }

    LOG_WARNING("TransportClient", to_string(request.method) + " " + path + " failed after " +
                std::to_string(m_attempt_count.load()) + " attempts (" +
                std::to_string(state.elapsed().count()) + "ms)");
    return std::unexpected(last_error);
}

std::expected<nlohmann::json, core::Error> TransportClient::parse_response(
    const HttpResponse& response,
    const std::string& path) const {

    if (response.body.empty()) {
        return nlohmann::json::object();
    }

    const auto content_type = response.get_header("Content-Type").value_or("");

    if (content_type.find("application/json") != std::string::npos) {
        auto parsed = utils::JsonHelper::safe_parse(response.body);
        if (!parsed) {
            LOG_WARNING("TransportClient", "Malformed JSON from " + path + ": " + parsed.error());
            return std::unexpected(core::api_error("Invalid JSON response from API",
                                                   response.status_code, path, response.body));
        }
        return std::move(*parsed);
    }

    if (response.is_success()) {
        return nlohmann::json(response.body);
    }

    return std::unexpected(core::api_error("Unexpected response", response.status_code,
                                           path, response.body));
}

} // namespace services
} // namespace taskrelay
