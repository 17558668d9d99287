#pragma once

#include "taskrelay/core/errors.hpp"
#include "taskrelay/utils/clock.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace taskrelay {
namespace services {

struct CacheEntry {
    std::string key;
    nlohmann::json value;
    std::int64_t cached_at = 0;   // epoch ms
    std::int64_t expires_at = 0;  // epoch ms

    // Strict: an entry expiring exactly now is still fresh
    bool is_stale(std::int64_t now) const { return now > expires_at; }
};

enum class CacheSource {
    Memory,
    Disk,
    None
};

struct LookupResult {
    std::optional<CacheEntry> entry;
    bool stale = false;
    CacheSource source = CacheSource::None;
};

enum class FetchSource {
    Cache,
    Origin
};

struct FetchResult {
    nlohmann::json value;
    FetchSource source = FetchSource::Origin;
    bool stale = false;
    std::optional<std::int64_t> cached_at;

    // Origin failure absorbed by a stale entry
    std::optional<core::Error> error;
};

struct FetchOptions {
    std::optional<std::chrono::milliseconds> ttl;
    std::optional<std::chrono::milliseconds> stale_if_error;
};

struct CacheOptions {
    std::filesystem::path dir;
    std::chrono::milliseconds ttl{std::chrono::hours(1)};
    std::chrono::milliseconds stale_if_error{std::chrono::hours(24)};
    utils::EpochClock clock = utils::epoch_millis;
};

struct CacheStats {
    std::filesystem::path dir;
    std::size_t files = 0;
    std::size_t memory_entries = 0;
    std::chrono::milliseconds ttl{0};
    std::chrono::milliseconds stale_if_error{0};
};

std::string to_string(CacheSource source);
std::string to_string(FetchSource source);

/**
 * @brief Two-tier JSON cache with TTL, single-flight fetch and stale-if-error
 *
 * Entries live in memory and as one JSON file per key, named by the SHA-1
 * of the key. Concurrent fetches of the same key share one origin call and
 * observe the same outcome. Safe to use from any thread.
 */
class ResultCache {
public:
    using FetchFn = std::function<std::expected<nlohmann::json, core::Error>()>;
    using FetchOutcome = std::expected<FetchResult, core::Error>;

    explicit ResultCache(CacheOptions options);
    ~ResultCache() = default;

    ResultCache(const ResultCache&) = delete;
    ResultCache& operator=(const ResultCache&) = delete;

    // Disk failures here are treated as misses
    LookupResult get(const std::string& key);

    std::expected<void, core::Error> set(const std::string& key,
                                         const nlohmann::json& value,
                                         std::optional<std::chrono::milliseconds> ttl = std::nullopt);

    FetchOutcome fetch(const std::string& key, const FetchFn& fetch_fn, const FetchOptions& options = {});

    std::expected<void, core::Error> invalidate(const std::string& key);
    std::expected<void, core::Error> purge();
    std::expected<CacheStats, core::Error> stats() const;

    std::filesystem::path file_for_key(const std::string& key) const;
    const CacheOptions& options() const { return m_options; }

private:
    std::optional<CacheEntry> read_disk(const std::string& key) const;
    FetchOutcome run_fetch(const std::string& key,
                           const FetchFn& fetch_fn,
                           const FetchOptions& options,
                           const std::optional<CacheEntry>& previous);

    CacheOptions m_options;

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, CacheEntry> m_memory;

    std::mutex m_in_flight_mutex;
    std::unordered_map<std::string, std::shared_future<FetchOutcome>> m_in_flight;
};

} // namespace services
} // namespace taskrelay
