#include "taskrelay/services/auth/token_store.hpp"
#include "taskrelay/utils/json_helper.hpp"
#include "taskrelay/utils/logger.hpp"
#include "taskrelay/utils/paths.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <limits>
#include <random>
#include <sstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace taskrelay {
namespace services {

namespace {

std::string random_suffix() {
    static constexpr char alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<std::size_t> dist(0, sizeof(alphabet) - 2);

    std::string suffix(10, '0');
    for (auto& c : suffix) {
        c = alphabet[dist(gen)];
    }
    return suffix;
}

std::string errno_message() {
    return std::strerror(errno);
}

constexpr std::int64_t INT64_MAX_VALUE = std::numeric_limits<std::int64_t>::max();
constexpr std::int64_t INT64_MIN_VALUE = std::numeric_limits<std::int64_t>::min();

// Saturating, values in token files are unchecked
std::int64_t seconds_to_millis(std::int64_t seconds) {
    constexpr std::int64_t limit = INT64_MAX_VALUE / 1000;
    return std::clamp(seconds, -limit, limit) * 1000;
}

std::int64_t saturating_add(std::int64_t a, std::int64_t b) {
    if (b > 0 && a > INT64_MAX_VALUE - b) {
        return INT64_MAX_VALUE;
    }
    if (b < 0 && a < INT64_MIN_VALUE - b) {
        return INT64_MIN_VALUE;
    }
    return a + b;
}

} // anonymous namespace

TokenStore::TokenStore(const std::filesystem::path& token_path)
    : m_token_path(token_path.empty() ? default_token_path() : token_path) {
}

std::filesystem::path TokenStore::default_token_path() {
    return utils::config_directory() / "token.json";
}

std::filesystem::path TokenStore::resolve_token_path(const core::OAuthConfig& config) {
    if (!config.token_path.empty()) {
        return utils::expand_home(config.token_path);
    }
    return default_token_path();
}

core::Credential TokenStore::normalize(const core::Credential& credential, std::int64_t now) {
    core::Credential normalized = credential;
    if (!normalized.expires_at && normalized.expires_in && *normalized.expires_in != 0) {
        normalized.expires_at = saturating_add(now, seconds_to_millis(*normalized.expires_in));
    }
    return normalized;
}

bool TokenStore::is_expired(const core::Credential& credential, int skew_seconds, std::int64_t now) {
    if (!credential.expires_at) {
        return false;
    }
    return now >= saturating_add(*credential.expires_at, -seconds_to_millis(skew_seconds));
}

std::expected<core::Credential, core::Error> TokenStore::from_json(const nlohmann::json& json) {
    if (!json.is_object()) {
        return std::unexpected(core::auth_error("Invalid token: not an object"));
    }

    auto access_token = utils::JsonHelper::get_optional<std::string>(json, "access_token");
    if (!access_token || access_token->empty()) {
        return std::unexpected(core::auth_error("Invalid token: missing or invalid access_token"));
    }

    core::Credential credential;
    credential.access_token = *access_token;
    credential.refresh_token = utils::JsonHelper::get_optional<std::string>(json, "refresh_token");
    credential.token_type = utils::JsonHelper::get_optional<std::string>(json, "token_type");
    credential.scope = utils::JsonHelper::get_optional<std::string>(json, "scope");
    credential.expires_in = utils::JsonHelper::get_optional<std::int64_t>(json, "expires_in");
    credential.expires_at = utils::JsonHelper::get_optional<std::int64_t>(json, "expires_at");

    // Anything not captured above round-trips through extra
    credential.extra = nlohmann::json::object();
    for (const auto& [field, value] : json.items()) {
        const bool captured =
            field == "access_token" ||
            (field == "refresh_token" && credential.refresh_token) ||
            (field == "token_type" && credential.token_type) ||
            (field == "scope" && credential.scope) ||
            (field == "expires_in" && credential.expires_in) ||
            (field == "expires_at" && credential.expires_at);
        if (!captured) {
            credential.extra[field] = value;
        }
    }

    return credential;
}

nlohmann::json TokenStore::to_json(const core::Credential& credential) {
    nlohmann::json json = credential.extra.is_object() ? credential.extra : nlohmann::json::object();

    json["access_token"] = credential.access_token;
    if (credential.refresh_token) json["refresh_token"] = *credential.refresh_token;
    if (credential.token_type) json["token_type"] = *credential.token_type;
    if (credential.scope) json["scope"] = *credential.scope;
    if (credential.expires_in) json["expires_in"] = *credential.expires_in;
    if (credential.expires_at) json["expires_at"] = *credential.expires_at;

    return json;
}

std::expected<std::optional<core::Credential>, core::Error> TokenStore::load() const {
    std::error_code ec;
    if (!std::filesystem::exists(m_token_path, ec)) {
        if (ec && ec != std::errc::no_such_file_or_directory) {
            return std::unexpected(core::io_error("Cannot access token file " +
                                                  m_token_path.string() + ": " + ec.message()));
        }
        LOG_DEBUG("TokenStore", "No token file at " + m_token_path.string());
        return std::optional<core::Credential>{};
    }

    std::ifstream in(m_token_path);
    if (!in) {
        return std::unexpected(core::io_error("Cannot read token file " + m_token_path.string() +
                                              ": " + errno_message()));
    }

    std::stringstream buffer;
    buffer << in.rdbuf();

    auto parsed = utils::JsonHelper::safe_parse(buffer.str());
    if (!parsed) {
        return std::unexpected(core::auth_error("Token file " + m_token_path.string() +
                                                " is not valid JSON: " + parsed.error()));
    }

    auto credential = from_json(*parsed);
    if (!credential) {
        return std::unexpected(credential.error());
    }

    LOG_DEBUG("TokenStore", "Loaded credential from " + m_token_path.string());
    return std::optional<core::Credential>{std::move(*credential)};
}

std::expected<core::Credential, core::Error> TokenStore::save(const core::Credential& credential) const {
    if (credential.access_token.empty()) {
        return std::unexpected(core::validation_error("Cannot save a credential without access_token",
                                                      "access_token"));
    }

    auto normalized = normalize(credential);
    if (auto written = write_atomic(to_json(normalized).dump(2)); !written) {
        return std::unexpected(written.error());
    }

    LOG_INFO("TokenStore", "Credential saved to " + m_token_path.string());
    return normalized;
}

std::expected<void, core::Error> TokenStore::clear() const {
    std::error_code ec;
    std::filesystem::remove(m_token_path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return std::unexpected(core::io_error("Failed to remove token file " +
                                              m_token_path.string() + ": " + ec.message()));
    }

    LOG_INFO("TokenStore", "Credential cleared");
    return {};
}

std::expected<void, core::Error> TokenStore::write_atomic(const std::string& contents) const {
    auto dir = m_token_path.parent_path();
    if (dir.empty()) {
        dir = ".";
    }

    std::error_code ec;
    if (!std::filesystem::exists(dir, ec)) {
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            return std::unexpected(core::io_error("Failed to create token directory " +
                                                  dir.string() + ": " + ec.message()));
        }
        std::filesystem::permissions(dir, std::filesystem::perms::owner_all,
                                     std::filesystem::perm_options::replace, ec);
        if (ec) {
            LOG_WARNING("TokenStore", "Could not restrict token directory permissions: " + ec.message());
        }
    }

    const auto tmp = dir / (".tmp-" + std::to_string(::getpid()) + "-" +
                            std::to_string(utils::epoch_millis()) + "-" + random_suffix() + ".json");

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (fd < 0) {
        return std::unexpected(core::io_error("Failed to create temp file in " + dir.string() +
                                              ": " + errno_message()));
    }

    auto fail = [&](const std::string& what) -> std::expected<void, core::Error> {
        auto error = core::io_error(what + ": " + errno_message());
        if (fd >= 0) {
            ::close(fd);
        }
        ::unlink(tmp.c_str());
        return std::unexpected(error);
    };

    const char* data = contents.data();
    std::size_t remaining = contents.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return fail("Failed to write token file");
        }
        data += written;
        remaining -= static_cast<std::size_t>(written);
    }

    if (::fsync(fd) != 0) {
        return fail("Failed to sync token file");
    }
    if (::close(fd) != 0) {
        fd = -1;
        return fail("Failed to close token file");
    }
    fd = -1;

    if (::rename(tmp.c_str(), m_token_path.c_str()) != 0) {
        return fail("Failed to replace token file");
    }

    if (::chmod(m_token_path.c_str(), 0600) != 0) {
        LOG_WARNING("TokenStore", "Could not set token file permissions: " + errno_message());
    }

    return {};
}

} // namespace services
} // namespace taskrelay
