#pragma once

#include "taskrelay/core/errors.hpp"
#include "taskrelay/core/models.hpp"
#include "taskrelay/services/auth/oauth_refresher.hpp"
#include "taskrelay/services/auth/refresh_coordinator.hpp"
#include "taskrelay/services/auth/token_store.hpp"
#include <expected>
#include <memory>
#include <string>

namespace taskrelay {
namespace services {

/**
 * @brief Resolves the bearer token used for API calls
 *
 * An explicitly configured token wins. Otherwise the token file is loaded,
 * and an expired credential with a refresh token is refreshed through the
 * RefreshCoordinator and written back.
 */
class CredentialProvider {
public:
    CredentialProvider(const core::ApplicationConfig& config,
                       std::shared_ptr<HttpClient> http_client,
                       RefreshCoordinator& coordinator = RefreshCoordinator::instance());

    std::expected<std::string, core::Error> access_token();

    // Refreshes regardless of expiry
    std::expected<core::Credential, core::Error> force_refresh();

    const TokenStore& store() const { return m_store; }
    bool has_explicit_token() const { return !m_explicit_token.empty(); }

private:
    std::expected<core::Credential, core::Error> load_required() const;
    std::expected<core::Credential, core::Error> refresh(const core::Credential& current);

    std::string m_explicit_token;
    TokenStore m_store;
    OAuthRefresher m_refresher;
    RefreshCoordinator& m_coordinator;
};

} // namespace services
} // namespace taskrelay
