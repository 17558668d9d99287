#pragma once

#include "taskrelay/core/errors.hpp"
#include "taskrelay/core/models.hpp"
#include "taskrelay/services/network/http_client.hpp"
#include <chrono>
#include <expected>
#include <memory>
#include <string>

namespace taskrelay {
namespace services {

// Exchanges a refresh token for a new credential at the OAuth token endpoint
class OAuthRefresher {
public:
    static constexpr std::chrono::milliseconds TOKEN_TIMEOUT{30000};

    OAuthRefresher(std::shared_ptr<HttpClient> http_client, core::OAuthConfig config);

    std::expected<core::Credential, core::Error> refresh(const std::string& refresh_token) const;

    bool is_configured() const;

    // Redacts token and secret values that endpoints like to echo back
    static std::string sanitize(const std::string& message);

private:
    std::shared_ptr<HttpClient> m_http_client;
    core::OAuthConfig m_config;
};

} // namespace services
} // namespace taskrelay
