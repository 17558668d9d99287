#include "taskrelay/services/cache/result_cache.hpp"
#include "taskrelay/utils/hash.hpp"
#include "taskrelay/utils/json_helper.hpp"
#include "taskrelay/utils/logger.hpp"
#include <exception>
#include <fstream>
#include <iterator>
#include <sstream>

namespace taskrelay {
namespace services {

namespace {

bool is_cache_entry(const nlohmann::json& json) {
    return json.is_object() &&
           json.contains("key") && json["key"].is_string() &&
           json.contains("value") &&
           json.contains("cachedAt") && json["cachedAt"].is_number() &&
           json.contains("expiresAt") && json["expiresAt"].is_number();
}

nlohmann::json entry_to_json(const CacheEntry& entry) {
    return {
        {"key", entry.key},
        {"value", entry.value},
        {"cachedAt", entry.cached_at},
        {"expiresAt", entry.expires_at}
    };
}

} // anonymous namespace

std::string to_string(CacheSource source) {
    switch (source) {
        case CacheSource::Memory: return "memory";
        case CacheSource::Disk: return "disk";
        case CacheSource::None: return "none";
        default: return "none";
    }
}

std::string to_string(FetchSource source) {
    switch (source) {
        case FetchSource::Cache: return "cache";
        case FetchSource::Origin: return "origin";
        default: return "origin";
    }
}

ResultCache::ResultCache(CacheOptions options)
    : m_options(std::move(options)) {
    if (!m_options.clock) {
        m_options.clock = utils::epoch_millis;
    }
    LOG_DEBUG("ResultCache", "Cache directory: " + m_options.dir.string());
}

std::filesystem::path ResultCache::file_for_key(const std::string& key) const {
    return m_options.dir / (utils::sha1_hex(key) + ".json");
}

std::optional<CacheEntry> ResultCache::read_disk(const std::string& key) const {
    const auto file = file_for_key(key);

    std::ifstream in(file);
    if (!in) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();

    auto parsed = utils::JsonHelper::safe_parse(buffer.str());
    if (!parsed) {
        LOG_DEBUG("ResultCache", "Ignoring unparseable cache file " + file.filename().string());
        return std::nullopt;
    }
    if (!is_cache_entry(*parsed)) {
        LOG_DEBUG("ResultCache", "Ignoring malformed cache file " + file.filename().string());
        return std::nullopt;
    }
    if ((*parsed)["key"].get<std::string>() != key) {
        LOG_DEBUG("ResultCache", "Key mismatch in cache file " + file.filename().string());
        return std::nullopt;
    }

    CacheEntry entry;
    entry.key = key;
    entry.value = (*parsed)["value"];
    entry.cached_at = (*parsed)["cachedAt"].get<std::int64_t>();
    entry.expires_at = (*parsed)["expiresAt"].get<std::int64_t>();
    return entry;
}

LookupResult ResultCache::get(const std::string& key) {
    const auto now = m_options.clock();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_memory.find(key);
        if (it != m_memory.end()) {
            const bool stale = it->second.is_stale(now);
            LOG_DEBUG("ResultCache", "Memory hit for " + key + (stale ? " (stale)" : ""));
            return {it->second, stale, CacheSource::Memory};
        }
    }

    auto disk_entry = read_disk(key);
    if (!disk_entry) {
        LOG_DEBUG("ResultCache", "Cache miss for " + key);
        return {};
    }

    const bool stale = disk_entry->is_stale(now);
    {
        // A concurrent set() may have stored a newer entry since the memory miss
        std::lock_guard<std::mutex> lock(m_mutex);
        m_memory.try_emplace(key, *disk_entry);
    }

    LOG_DEBUG("ResultCache", "Disk hit for " + key + (stale ? " (stale)" : ""));
    return {std::move(disk_entry), stale, CacheSource::Disk};
}

std::expected<void, core::Error> ResultCache::set(const std::string& key,
                                                  const nlohmann::json& value,
                                                  std::optional<std::chrono::milliseconds> ttl) {
    const auto now = m_options.clock();

    CacheEntry entry;
    entry.key = key;
    entry.value = value;
    entry.cached_at = now;
    entry.expires_at = now + ttl.value_or(m_options.ttl).count();

    std::error_code ec;
    std::filesystem::create_directories(m_options.dir, ec);
    if (ec) {
        return std::unexpected(core::io_error("Failed to create cache directory " +
                                              m_options.dir.string() + ": " + ec.message()));
    }

    std::string serialized;
    try {
        serialized = entry_to_json(entry).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(core::io_error("Failed to serialize cache entry for " + key + ": " + e.what()));
    }

    const auto file = file_for_key(key);
    {
        std::ofstream out(file, std::ios::trunc);
        if (!out) {
            return std::unexpected(core::io_error("Failed to open cache file " + file.string()));
        }
        out << serialized;
        out.flush();
        if (!out) {
            return std::unexpected(core::io_error("Failed to write cache file " + file.string()));
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_memory[key] = std::move(entry);
    }

    LOG_DEBUG("ResultCache", "Stored " + key);
    return {};
}

ResultCache::FetchOutcome ResultCache::fetch(const std::string& key,
                                             const FetchFn& fetch_fn,
                                             const FetchOptions& options) {
    auto lookup = get(key);
    if (lookup.entry && !lookup.stale) {
        FetchResult result;
        result.value = lookup.entry->value;
        result.source = FetchSource::Cache;
        result.stale = false;
        result.cached_at = lookup.entry->cached_at;
        return result;
    }

    std::promise<FetchOutcome> promise;
    std::shared_future<FetchOutcome> pending;
    bool leader = false;

    {
        std::lock_guard<std::mutex> lock(m_in_flight_mutex);
        auto it = m_in_flight.find(key);
        if (it != m_in_flight.end()) {
            pending = it->second;
        } else {
            pending = promise.get_future().share();
            m_in_flight.emplace(key, pending);
            leader = true;
        }
    }

    if (!leader) {
        LOG_DEBUG("ResultCache", "Joining in-flight fetch for " + key);
        return pending.get();
    }

    auto settle = [this, &key]() {
        std::lock_guard<std::mutex> lock(m_in_flight_mutex);
        m_in_flight.erase(key);
    };

    FetchOutcome outcome;
    try {
        outcome = run_fetch(key, fetch_fn, options, lookup.entry);
    } catch (...) {
        settle();
        promise.set_exception(std::current_exception());
        throw;
    }

    settle();
    promise.set_value(outcome);

    return outcome;
}

ResultCache::FetchOutcome ResultCache::run_fetch(const std::string& key,
                                                 const FetchFn& fetch_fn,
                                                 const FetchOptions& options,
                                                 const std::optional<CacheEntry>& previous) {
    const auto ttl = options.ttl.value_or(m_options.ttl);
    const auto stale_window = options.stale_if_error.value_or(m_options.stale_if_error);
    const auto now = m_options.clock();

    std::expected<nlohmann::json, core::Error> fetched;
    try {
        fetched = fetch_fn();
    } catch (const std::exception& e) {
        fetched = std::unexpected(core::Error{core::ErrorKind::Unknown, e.what(), {}, {}, {}});
    } catch (...) {
        fetched = std::unexpected(core::Error{core::ErrorKind::Unknown,
                                              "Fetch for " + key + " threw a non-standard exception",
                                              {}, {}, {}});
    }

    if (fetched) {
        if (auto stored = set(key, *fetched, ttl); !stored) {
            LOG_WARNING("ResultCache", "Failed to persist " + key + ": " + stored.error().message);
        }
        FetchResult result;
        result.value = std::move(*fetched);
        result.source = FetchSource::Origin;
        result.stale = false;
        return result;
    }

    if (previous) {
        const auto stale_age = now - previous->expires_at;
        if (stale_age <= stale_window.count()) {
            LOG_INFO("ResultCache", "Serving stale " + key + " after origin failure: " +
                     fetched.error().message);
            FetchResult result;
            result.value = previous->value;
            result.source = FetchSource::Cache;
            result.stale = true;
            result.cached_at = previous->cached_at;
            result.error = fetched.error();
            return result;
        }
        LOG_DEBUG("ResultCache", "Stale entry for " + key + " is outside the stale window");
    }

    return std::unexpected(fetched.error());
}

std::expected<void, core::Error> ResultCache::invalidate(const std::string& key) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_memory.erase(key);
    }

    std::error_code ec;
    std::filesystem::remove(file_for_key(key), ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return std::unexpected(core::io_error("Failed to remove cache entry for " + key + ": " + ec.message()));
    }

    LOG_DEBUG("ResultCache", "Invalidated " + key);
    return {};
}

std::expected<void, core::Error> ResultCache::purge() {
    std::size_t cleared = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        cleared = m_memory.size();
        m_memory.clear();
    }

    std::error_code ec;
    std::filesystem::remove_all(m_options.dir, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return std::unexpected(core::io_error("Failed to remove cache directory " +
                                              m_options.dir.string() + ": " + ec.message()));
    }

    LOG_INFO("ResultCache", "Cache purged - Memory entries: " + std::to_string(cleared));
    return {};
}

std::expected<CacheStats, core::Error> ResultCache::stats() const {
    CacheStats stats;
    stats.dir = m_options.dir;
    stats.ttl = m_options.ttl;
    stats.stale_if_error = m_options.stale_if_error;

    std::error_code ec;
    std::filesystem::directory_iterator it(m_options.dir, ec);
    if (ec) {
        if (ec != std::errc::no_such_file_or_directory) {
            return std::unexpected(core::io_error("Failed to read cache directory " +
                                                  m_options.dir.string() + ": " + ec.message()));
        }
    } else {
        stats.files = static_cast<std::size_t>(
            std::distance(std::filesystem::begin(it), std::filesystem::end(it)));
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        stats.memory_entries = m_memory.size();
    }
    return stats;
}

} // namespace services
} // namespace taskrelay
