#include "taskrelay/services/auth/oauth_refresher.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace taskrelay;

namespace {

core::OAuthConfig make_config() {
    core::OAuthConfig config;
    config.client_id = "client";
    config.client_secret = "s3cret";
    config.token_url = "https://auth.example.com/oauth/token";
    return config;
}

} // anonymous namespace

TEST(OAuthRefresherTest, SanitizeRedactsSecrets) {
    EXPECT_EQ(services::OAuthRefresher::sanitize("refresh_token=abc&client_id=x"),
              "refresh_token=[REDACTED]&client_id=x");
    EXPECT_EQ(services::OAuthRefresher::sanitize("Client_Secret: hunter2"),
              "Client_Secret:[REDACTED]");
    EXPECT_EQ(services::OAuthRefresher::sanitize("nothing to hide"), "nothing to hide");
}

TEST(OAuthRefresherTest, PostsFormEncodedGrant) {
    auto http = std::make_shared<test::FakeHttpClient>();
    http->enqueue_response(200, R"({"access_token":"new","expires_in":60})");

    services::OAuthRefresher refresher(http, make_config());
    auto credential = refresher.refresh("r 1");
    ASSERT_TRUE(credential);
    EXPECT_EQ(credential->access_token, "new");
    EXPECT_TRUE(credential->expires_at.has_value());

    auto requests = http->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].method, services::HttpMethod::POST);
    EXPECT_EQ(requests[0].url, "https://auth.example.com/oauth/token");
    EXPECT_EQ(requests[0].headers.at("Content-Type"), "application/x-www-form-urlencoded");
    EXPECT_EQ(requests[0].body,
              "grant_type=refresh_token&refresh_token=r%201&client_id=client&client_secret=s3cret");
    EXPECT_EQ(requests[0].timeout, services::OAuthRefresher::TOKEN_TIMEOUT);
}

TEST(OAuthRefresherTest, RejectsPlainHttpEndpoint) {
    auto http = std::make_shared<test::FakeHttpClient>();
    auto config = make_config();
    config.token_url = "http://auth.example.com/oauth/token";

    services::OAuthRefresher refresher(http, config);
    auto credential = refresher.refresh("r1");
    ASSERT_FALSE(credential);
    EXPECT_EQ(credential.error().kind, core::ErrorKind::Auth);
    EXPECT_EQ(http->call_count(), 0u);
}

TEST(OAuthRefresherTest, ErrorResponseIsSanitized) {
    auto http = std::make_shared<test::FakeHttpClient>();
    http->enqueue_response(401, "invalid client_secret=s3cret", "text/plain");

    services::OAuthRefresher refresher(http, make_config());
    auto credential = refresher.refresh("r1");
    ASSERT_FALSE(credential);
    EXPECT_EQ(credential.error().status_code, 401);
    EXPECT_EQ(credential.error().message, "Token refresh failed: 401 invalid client_secret=[REDACTED]");
}

TEST(OAuthRefresherTest, TimeoutIsNetworkError) {
    auto http = std::make_shared<test::FakeHttpClient>();
    http->enqueue_error(services::NetworkError::Timeout);

    services::OAuthRefresher refresher(http, make_config());
    auto credential = refresher.refresh("r1");
    ASSERT_FALSE(credential);
    EXPECT_EQ(credential.error().kind, core::ErrorKind::Network);
    EXPECT_EQ(credential.error().message, "Request timeout after 30000ms");
}

TEST(OAuthRefresherTest, ResponseWithoutAccessTokenIsRejected) {
    auto http = std::make_shared<test::FakeHttpClient>();
    http->enqueue_response(200, R"({"token_type":"bearer"})");

    services::OAuthRefresher refresher(http, make_config());
    EXPECT_FALSE(refresher.refresh("r1"));
}

TEST(OAuthRefresherTest, UnconfiguredClientIsReported) {
    auto config = make_config();
    config.client_id.clear();

    services::OAuthRefresher refresher(std::make_shared<test::FakeHttpClient>(), config);
    EXPECT_FALSE(refresher.is_configured());
    EXPECT_FALSE(refresher.refresh("r1"));
}
