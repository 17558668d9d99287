#include "taskrelay/services/auth/credential_provider.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <fstream>

using namespace taskrelay;

class CredentialProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_config.oauth.client_id = "client";
        m_config.oauth.client_secret = "secret";
        m_config.oauth.token_url = "https://auth.example.com/oauth/token";
        m_config.oauth.token_path = (m_dir / "token.json").string();
    }

    services::CredentialProvider make_provider() {
        return services::CredentialProvider(m_config, m_http, m_coordinator);
    }

    void store_credential(std::int64_t expires_at, std::optional<std::string> refresh_token = "r1") {
        core::Credential credential;
        credential.access_token = "stored";
        credential.refresh_token = std::move(refresh_token);
        credential.expires_at = expires_at;
        ASSERT_TRUE(services::TokenStore(m_dir / "token.json").save(credential));
    }

    test::TempDir m_dir;
    core::ApplicationConfig m_config;
    std::shared_ptr<test::FakeHttpClient> m_http = std::make_shared<test::FakeHttpClient>();
    services::RefreshCoordinator m_coordinator;
};

TEST_F(CredentialProviderTest, ExplicitTokenWins) {
    m_config.token = "explicit";
    store_credential(utils::epoch_millis() + 3'600'000);

    auto provider = make_provider();
    auto token = provider.access_token();
    ASSERT_TRUE(token);
    EXPECT_EQ(*token, "explicit");
    EXPECT_TRUE(provider.has_explicit_token());
}

TEST_F(CredentialProviderTest, NoCredentialIsAuthError) {
    auto provider = make_provider();
    auto token = provider.access_token();
    ASSERT_FALSE(token);
    EXPECT_EQ(token.error().kind, core::ErrorKind::Auth);
    EXPECT_EQ(core::exit_code_for(token.error()), core::ExitCode::Auth);
}

TEST_F(CredentialProviderTest, ValidStoredTokenIsReturned) {
    store_credential(utils::epoch_millis() + 3'600'000);

    auto provider = make_provider();
    auto token = provider.access_token();
    ASSERT_TRUE(token);
    EXPECT_EQ(*token, "stored");
    EXPECT_EQ(m_http->call_count(), 0u);
}

TEST_F(CredentialProviderTest, ExpiredTokenIsRefreshedAndSaved) {
    store_credential(utils::epoch_millis() - 1000);
    m_http->enqueue_response(200, R"({"access_token":"fresh","expires_in":3600,"token_type":"bearer"})");

    auto provider = make_provider();
    auto token = provider.access_token();
    ASSERT_TRUE(token);
    EXPECT_EQ(*token, "fresh");
    EXPECT_EQ(m_http->call_count(), 1u);

    auto stored = provider.store().load();
    ASSERT_TRUE(stored);
    ASSERT_TRUE(stored->has_value());
    EXPECT_EQ((*stored)->access_token, "fresh");
    EXPECT_EQ((*stored)->refresh_token, "r1");
    EXPECT_TRUE((*stored)->expires_at.has_value());
}

TEST_F(CredentialProviderTest, ExpiredWithoutRefreshTokenIsReturnedAsIs) {
    store_credential(utils::epoch_millis() - 1000, std::nullopt);

    auto provider = make_provider();
    auto token = provider.access_token();
    ASSERT_TRUE(token);
    EXPECT_EQ(*token, "stored");
    EXPECT_EQ(m_http->call_count(), 0u);
}

TEST_F(CredentialProviderTest, RefreshFailureIsPropagated) {
    store_credential(utils::epoch_millis() - 1000);
    m_http->enqueue_response(400, "error=invalid_grant&refresh_token=r1", "text/plain");

    auto provider = make_provider();
    auto token = provider.access_token();
    ASSERT_FALSE(token);
    EXPECT_EQ(token.error().kind, core::ErrorKind::Auth);
    EXPECT_EQ(token.error().message.find("r1"), std::string::npos);

    auto stored = provider.store().load();
    ASSERT_TRUE(stored);
    EXPECT_EQ((*stored)->access_token, "stored");
}

TEST_F(CredentialProviderTest, ForceRefreshNeedsRefreshToken) {
    store_credential(utils::epoch_millis() + 3'600'000, std::nullopt);

    auto provider = make_provider();
    auto refreshed = provider.force_refresh();
    ASSERT_FALSE(refreshed);
    EXPECT_EQ(refreshed.error().message, "Stored credential has no refresh_token");
}

TEST_F(CredentialProviderTest, ForceRefreshIgnoresExpiry) {
    store_credential(utils::epoch_millis() + 3'600'000);
    m_http->enqueue_response(200, R"({"access_token":"rotated","refresh_token":"r2"})");

    auto provider = make_provider();
    auto refreshed = provider.force_refresh();
    ASSERT_TRUE(refreshed);
    EXPECT_EQ(refreshed->access_token, "rotated");
    EXPECT_EQ(refreshed->refresh_token, "r2");
}

TEST_F(CredentialProviderTest, CorruptTokenFileNamesPath) {
    {
        std::ofstream out(m_dir / "token.json");
        out << "not json";
    }

    auto provider = make_provider();
    auto token = provider.access_token();
    ASSERT_FALSE(token);
    EXPECT_EQ(token.error().kind, core::ErrorKind::Auth);
    EXPECT_NE(token.error().message.find((m_dir / "token.json").string()), std::string::npos);
}
