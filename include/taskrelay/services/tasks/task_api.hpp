#pragma once

#include "taskrelay/core/errors.hpp"
#include "taskrelay/services/cache/result_cache.hpp"
#include "taskrelay/services/network/transport_client.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace taskrelay {
namespace services {

struct TaskApiOptions {
    std::chrono::milliseconds projects_ttl{std::chrono::hours(24 * 7)};
    std::chrono::milliseconds tasks_ttl{std::chrono::minutes(10)};
};

// Task status values used by the search filter
inline constexpr int TASK_STATUS_ACTIVE = 0;
inline constexpr int TASK_STATUS_COMPLETED = 2;

struct SearchParams {
    std::string query;                     // Case-insensitive, matched against title, content and desc
    std::vector<std::string> project_ids;  // At least one, at most MAX_SEARCH_PROJECTS
    std::optional<int> status;
};

struct SearchFailure {
    std::string project_id;
    core::Error error;
};

struct SearchResult {
    nlohmann::json results = nlohmann::json::array();
    std::size_t projects_searched = 0;
    std::vector<SearchFailure> failures;
};

/**
 * @brief Typed access to the project and task endpoints
 *
 * Identifiers are validated before any request is made. List reads can go
 * through the ResultCache; mutations invalidate the keys they affect.
 */
class TaskApi {
public:
    static constexpr const char* PROJECTS_LIST_KEY = "projects:list";
    static constexpr const char* ALL_TASKS_KEY = "tasks:get-all:*";
    static constexpr std::size_t MAX_SEARCH_QUERY_LENGTH = 1000;
    static constexpr std::size_t MAX_SEARCH_PROJECTS = 100;

    TaskApi(std::shared_ptr<TransportClient> transport,
            std::shared_ptr<ResultCache> cache,
            TaskApiOptions options = {});

    // Projects
    std::expected<nlohmann::json, core::Error> projects_list();
    std::expected<nlohmann::json, core::Error> projects_create(const nlohmann::json& body);
    std::expected<nlohmann::json, core::Error> projects_update(const std::string& project_id,
                                                               const nlohmann::json& body);
    std::expected<nlohmann::json, core::Error> projects_delete(const std::string& project_id);

    // Tasks
    std::expected<nlohmann::json, core::Error> tasks_get_all(const std::string& project_id);
    std::expected<nlohmann::json, core::Error> tasks_get(const std::string& project_id,
                                                         const std::string& task_id);
    std::expected<nlohmann::json, core::Error> tasks_create(const std::string& project_id,
                                                            const nlohmann::json& draft);
    std::expected<nlohmann::json, core::Error> tasks_update(const std::string& project_id,
                                                            const std::string& task_id,
                                                            const nlohmann::json& draft);
    std::expected<nlohmann::json, core::Error> tasks_complete(const std::string& project_id,
                                                              const std::string& task_id);
    std::expected<nlohmann::json, core::Error> tasks_delete(const std::string& project_id,
                                                            const std::string& task_id);

    // Cache-first reads; force_refresh bypasses the lookup but still stores
    std::expected<FetchResult, core::Error> cached_projects_list(bool force_refresh = false);
    std::expected<FetchResult, core::Error> cached_tasks_get_all(const std::string& project_id,
                                                                 bool force_refresh = false);
    // Tasks of every project, aggregated into one array under ALL_TASKS_KEY
    std::expected<FetchResult, core::Error> cached_tasks_get_all_projects(bool force_refresh = false);

    /**
     * @brief Searches tasks of the given projects without a server-side query
     *
     * Each project's task list is read cache-first under its tasks key, so a
     * search reuses what `tasks list` stored and vice versa. A project whose
     * read fails is reported in `failures` and does not fail the search.
     */
    std::expected<SearchResult, core::Error> tasks_search_local(const SearchParams& params,
                                                                bool force_refresh = false);

    static std::string tasks_cache_key(const std::string& project_id);
    static std::expected<void, core::Error> validate_id(const std::string& id, const std::string& name);
    static std::expected<void, core::Error> validate_search(const SearchParams& params);
    static bool task_matches(const nlohmann::json& task, const std::string& query, std::optional<int> status);

private:
    std::expected<FetchResult, core::Error> cached_read(const std::string& key,
                                                        std::chrono::milliseconds ttl,
                                                        bool force_refresh,
                                                        const ResultCache::FetchFn& fetch_fn);
    void invalidate_quietly(const std::string& key);
    void invalidate_tasks(const std::string& project_id);
    std::expected<nlohmann::json, core::Error> fetch_all_project_tasks();

    std::shared_ptr<TransportClient> m_transport;
    std::shared_ptr<ResultCache> m_cache;
    TaskApiOptions m_options;
};

} // namespace services
} // namespace taskrelay
