#include "taskrelay/services/auth/credential_provider.hpp"
#include "taskrelay/utils/logger.hpp"

namespace taskrelay {
namespace services {

CredentialProvider::CredentialProvider(const core::ApplicationConfig& config,
                                       std::shared_ptr<HttpClient> http_client,
                                       RefreshCoordinator& coordinator)
    : m_explicit_token(config.token)
    , m_store(TokenStore::resolve_token_path(config.oauth))
    , m_refresher(std::move(http_client), config.oauth)
    , m_coordinator(coordinator) {
}

std::expected<core::Credential, core::Error> CredentialProvider::load_required() const {
    auto loaded = m_store.load();
    if (!loaded) {
        auto error = loaded.error();
        error.message = "Failed to load token from " + m_store.path().string() + ": " + error.message;
        return std::unexpected(error);
    }
    if (!*loaded) {
        return std::unexpected(core::auth_error(
            "No valid access token found. Provide a token or configure OAuth authentication."));
    }
    return std::move(**loaded);
}

std::expected<std::string, core::Error> CredentialProvider::access_token() {
    if (!m_explicit_token.empty()) {
        LOG_DEBUG("CredentialProvider", "Using explicitly configured token");
        return m_explicit_token;
    }

    auto credential = load_required();
    if (!credential) {
        return std::unexpected(credential.error());
    }

    if (!TokenStore::is_expired(*credential)) {
        return credential->access_token;
    }

    if (!credential->refresh_token || !m_refresher.is_configured()) {
        LOG_WARNING("CredentialProvider", "Access token is expired and cannot be refreshed");
        return credential->access_token;
    }

    LOG_INFO("CredentialProvider", "Access token expired, refreshing");
    auto refreshed = refresh(*credential);
    if (!refreshed) {
        return std::unexpected(refreshed.error());
    }
    return refreshed->access_token;
}

std::expected<core::Credential, core::Error> CredentialProvider::force_refresh() {
    auto credential = load_required();
    if (!credential) {
        return std::unexpected(credential.error());
    }
    if (!credential->refresh_token) {
        return std::unexpected(core::auth_error("Stored credential has no refresh_token"));
    }
    return refresh(*credential);
}

std::expected<core::Credential, core::Error> CredentialProvider::refresh(const core::Credential& current) {
    return m_coordinator.with_mutex([this, current]() -> RefreshCoordinator::RefreshOutcome {
        auto refreshed = m_refresher.refresh(current.refresh_token.value_or(""));
        if (!refreshed) {
            return std::unexpected(refreshed.error());
        }

        // Endpoints may omit the refresh token when it is not rotated
        if (!refreshed->refresh_token) {
            refreshed->refresh_token = current.refresh_token;
        }

        return m_store.save(*refreshed);
    });
}

} // namespace services
} // namespace taskrelay
