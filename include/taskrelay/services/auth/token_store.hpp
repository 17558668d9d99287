#pragma once

#include "taskrelay/core/errors.hpp"
#include "taskrelay/core/models.hpp"
#include "taskrelay/utils/clock.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>

namespace taskrelay {
namespace services {

/**
 * @brief Persists one OAuth credential as a snake_case JSON file
 *
 * Writes are atomic: a uniquely named temp file in the target directory is
 * written, synced and renamed over the destination. The directory is
 * created 0700 and the file ends up 0600.
 */
class TokenStore {
public:
    static constexpr int DEFAULT_EXPIRY_SKEW_SECONDS = 60;

    explicit TokenStore(const std::filesystem::path& token_path = {});
    ~TokenStore() = default;

    // Absent file is not an error
    std::expected<std::optional<core::Credential>, core::Error> load() const;

    // Normalizes before writing and returns what was written
    std::expected<core::Credential, core::Error> save(const core::Credential& credential) const;

    std::expected<void, core::Error> clear() const;

    const std::filesystem::path& path() const { return m_token_path; }

    static core::Credential normalize(const core::Credential& credential,
                                      std::int64_t now = utils::epoch_millis());

    // A credential without expires_at never expires
    static bool is_expired(const core::Credential& credential,
                           int skew_seconds = DEFAULT_EXPIRY_SKEW_SECONDS,
                           std::int64_t now = utils::epoch_millis());

    static std::expected<core::Credential, core::Error> from_json(const nlohmann::json& json);
    static nlohmann::json to_json(const core::Credential& credential);

    static std::filesystem::path default_token_path();
    static std::filesystem::path resolve_token_path(const core::OAuthConfig& config);

private:
    std::expected<void, core::Error> write_atomic(const std::string& contents) const;

    std::filesystem::path m_token_path;
};

} // namespace services
} // namespace taskrelay
