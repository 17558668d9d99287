#include "taskrelay/services/auth/oauth_refresher.hpp"
#include "taskrelay/services/auth/token_store.hpp"
#include "taskrelay/utils/json_helper.hpp"
#include "taskrelay/utils/logger.hpp"
#include "taskrelay/utils/url_utils.hpp"
#include <regex>

namespace taskrelay {
namespace services {

OAuthRefresher::OAuthRefresher(std::shared_ptr<HttpClient> http_client, core::OAuthConfig config)
    : m_http_client(std::move(http_client))
    , m_config(std::move(config)) {
}

bool OAuthRefresher::is_configured() const {
    return !m_config.client_id.empty() && !m_config.token_url.empty();
}

std::string OAuthRefresher::sanitize(const std::string& message) {
    static const std::regex secrets(
        R"((client_secret|access_token|refresh_token|code)([=:])\s*[^\s&,"]+)",
        std::regex::icase);
    return std::regex_replace(message, secrets, "$1$2[REDACTED]");
}

std::expected<core::Credential, core::Error> OAuthRefresher::refresh(const std::string& refresh_token) const {
    if (!is_configured()) {
        return std::unexpected(core::auth_error("OAuth is not configured. Set oauth.client_id in config."));
    }
    if (!utils::UrlUtils::is_https_url(m_config.token_url)) {
        return std::unexpected(core::auth_error("tokenUrl must use HTTPS: " + m_config.token_url));
    }
    if (refresh_token.empty()) {
        return std::unexpected(core::auth_error("No refresh token available"));
    }

    utils::FormFields fields = {
        {"grant_type", "refresh_token"},
        {"refresh_token", refresh_token},
        {"client_id", m_config.client_id}
    };
    if (!m_config.client_secret.empty()) {
        fields.emplace_back("client_secret", m_config.client_secret);
    }

    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = m_config.token_url;
    request.timeout = TOKEN_TIMEOUT;
    request.headers["Content-Type"] = "application/x-www-form-urlencoded";
    request.headers["Accept"] = "application/json";
    request.body = utils::UrlUtils::build_form_body(fields);

    LOG_DEBUG("OAuthRefresher", "Requesting new access token from " + m_config.token_url);

    auto response = m_http_client->execute(request);
    if (!response) {
        if (response.error() == NetworkError::Timeout) {
            return std::unexpected(core::network_error(
                "Request timeout after " + std::to_string(TOKEN_TIMEOUT.count()) + "ms",
                to_string(response.error())));
        }
        return std::unexpected(core::network_error("Network error during token refresh",
                                                   to_string(response.error())));
    }

    if (!response->is_success()) {
        auto error = core::auth_error(sanitize("Token refresh failed: " +
                                               std::to_string(response->status_code) + " " +
                                               response->body.substr(0, core::MAX_ERROR_BODY_LENGTH)));
        error.status_code = response->status_code;
        return std::unexpected(error);
    }

    auto parsed = utils::JsonHelper::safe_parse(response->body);
    if (!parsed || !parsed->is_object()) {
        return std::unexpected(core::auth_error("Invalid token response: expected object"));
    }

    auto credential = TokenStore::from_json(*parsed);
    if (!credential) {
        return std::unexpected(core::auth_error("Invalid token response: missing or invalid access_token"));
    }

    LOG_INFO("OAuthRefresher", "Access token refreshed");
    return TokenStore::normalize(*credential);
}

} // namespace services
} // namespace taskrelay
