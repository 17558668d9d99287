#include "taskrelay/services/tasks/task_api.hpp"
#include "taskrelay/utils/logger.hpp"
#include <algorithm>
#include <cctype>
#include <regex>

namespace taskrelay {
namespace services {

namespace {

bool is_blank(const std::string& value) {
    return std::all_of(value.begin(), value.end(),
                       [](unsigned char c) { return std::isspace(c); });
}

std::string trim(const std::string& value) {
    auto first = std::find_if_not(value.begin(), value.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(value.rbegin(), value.rend(),
                                 [](unsigned char c) { return std::isspace(c); }).base();
    return first < last ? std::string(first, last) : std::string();
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::expected<void, core::Error> validate_project_body(const nlohmann::json& body, bool is_create) {
    if (!body.is_object()) {
        return std::unexpected(core::validation_error("Project body must be a JSON object", "body"));
    }
    if (is_create || body.contains("name")) {
        if (!body.contains("name") || !body["name"].is_string() || is_blank(body["name"].get<std::string>())) {
            return std::unexpected(core::validation_error("Project name must be a non-empty string", "name"));
        }
    }
    if (body.contains("sortOrder") && (!body["sortOrder"].is_number() || body["sortOrder"].get<double>() < 0)) {
        return std::unexpected(core::validation_error("sortOrder must be a non-negative number", "sortOrder"));
    }
    if (body.contains("viewMode") && !body["viewMode"].is_string()) {
        return std::unexpected(core::validation_error("viewMode must be a string", "viewMode"));
    }
    if (body.contains("kind") && !body["kind"].is_string()) {
        return std::unexpected(core::validation_error("kind must be a string", "kind"));
    }
    return {};
}

// An API 404 on a read names the missing resource
std::expected<nlohmann::json, core::Error> map_not_found(std::expected<nlohmann::json, core::Error> result,
                                                         const std::string& resource,
                                                         const std::string& id) {
    if (!result && result.error().kind == core::ErrorKind::Api && result.error().status_code == 404) {
        return std::unexpected(core::not_found_error(resource, id));
    }
    return result;
}

} // anonymous namespace

TaskApi::TaskApi(std::shared_ptr<TransportClient> transport,
                 std::shared_ptr<ResultCache> cache,
                 TaskApiOptions options)
    : m_transport(std::move(transport))
    , m_cache(std::move(cache))
    , m_options(options) {
}

std::string TaskApi::tasks_cache_key(const std::string& project_id) {
    return "tasks:get-all:" + project_id;
}

std::expected<void, core::Error> TaskApi::validate_id(const std::string& id, const std::string& name) {
    static const std::regex safe_id("^[A-Za-z0-9_-]+$");

    if (id.empty()) {
        return std::unexpected(core::validation_error(name + " must be a non-empty string", name));
    }
    if (!std::regex_match(id, safe_id)) {
        return std::unexpected(core::validation_error(
            name + " contains invalid characters (only alphanumeric, dash, underscore allowed)", name));
    }
    return {};
}

std::expected<void, core::Error> TaskApi::validate_search(const SearchParams& params) {
    if (params.query.size() > MAX_SEARCH_QUERY_LENGTH) {
        return std::unexpected(core::validation_error(
            "query must be " + std::to_string(MAX_SEARCH_QUERY_LENGTH) + " characters or less", "query"));
    }
    if (params.project_ids.empty()) {
        return std::unexpected(core::validation_error("At least one projectId is required for search", "projectIds"));
    }
    if (params.project_ids.size() > MAX_SEARCH_PROJECTS) {
        return std::unexpected(core::validation_error(
            "projectIds must be " + std::to_string(MAX_SEARCH_PROJECTS) + " or fewer", "projectIds"));
    }
    for (const auto& project_id : params.project_ids) {
        if (auto valid = validate_id(project_id, "projectId"); !valid) {
            return valid;
        }
    }
    if (params.status && *params.status != TASK_STATUS_ACTIVE && *params.status != TASK_STATUS_COMPLETED) {
        return std::unexpected(core::validation_error("status must be 0 (active) or 2 (completed)", "status"));
    }
    return {};
}

bool TaskApi::task_matches(const nlohmann::json& task, const std::string& query, std::optional<int> status) {
    if (!task.is_object()) {
        return false;
    }

    if (status) {
        auto it = task.find("status");
        if (it == task.end() || !it->is_number_integer() || it->get<int>() != *status) {
            return false;
        }
    }

    const auto needle = to_lower(trim(query));
    if (needle.empty()) {
        return true;
    }

    std::string haystack;
    for (const char* field : {"title", "content", "desc"}) {
        auto it = task.find(field);
        if (it == task.end() || !it->is_string()) {
            continue;
        }
        auto text = trim(it->get<std::string>());
        if (text.empty()) {
            continue;
        }
        if (!haystack.empty()) {
            haystack += ' ';
        }
        haystack += text;
    }
    return to_lower(haystack).find(needle) != std::string::npos;
}

void TaskApi::invalidate_quietly(const std::string& key) {
    if (!m_cache) {
        return;
    }
    if (auto result = m_cache->invalidate(key); !result) {
        LOG_WARNING("TaskApi", "Failed to invalidate " + key + ": " + result.error().message);
    }
}

void TaskApi::invalidate_tasks(const std::string& project_id) {
    invalidate_quietly(tasks_cache_key(project_id));
    invalidate_quietly(ALL_TASKS_KEY);
}

// ============================================================================
// Projects
// ============================================================================

std::expected<nlohmann::json, core::Error> TaskApi::projects_list() {
    return m_transport->get("project");
}

std::expected<nlohmann::json, core::Error> TaskApi::projects_create(const nlohmann::json& body) {
    if (auto valid = validate_project_body(body, true); !valid) {
        return std::unexpected(valid.error());
    }

    auto result = m_transport->post("project", body);
    if (result) {
        invalidate_quietly(PROJECTS_LIST_KEY);
    }
    return result;
}

std::expected<nlohmann::json, core::Error> TaskApi::projects_update(const std::string& project_id,
                                                                    const nlohmann::json& body) {
    if (auto valid = validate_id(project_id, "projectId"); !valid) {
        return std::unexpected(valid.error());
    }
    if (auto valid = validate_project_body(body, false); !valid) {
        return std::unexpected(valid.error());
    }

    auto result = m_transport->post("project/" + project_id, body);
    if (result) {
        invalidate_quietly(PROJECTS_LIST_KEY);
    }
    return result;
}

std::expected<nlohmann::json, core::Error> TaskApi::projects_delete(const std::string& project_id) {
    if (auto valid = validate_id(project_id, "projectId"); !valid) {
        return std::unexpected(valid.error());
    }

    auto result = m_transport->del("project/" + project_id);
    if (result) {
        invalidate_quietly(PROJECTS_LIST_KEY);
        invalidate_tasks(project_id);
    }
    return result;
}

// ============================================================================
// Tasks
// ============================================================================

std::expected<nlohmann::json, core::Error> TaskApi::tasks_get_all(const std::string& project_id) {
    if (auto valid = validate_id(project_id, "projectId"); !valid) {
        return std::unexpected(valid.error());
    }
    return map_not_found(m_transport->get("project/" + project_id + "/data"), "project", project_id);
}

std::expected<nlohmann::json, core::Error> TaskApi::tasks_get(const std::string& project_id,
                                                              const std::string& task_id) {
    if (auto valid = validate_id(project_id, "projectId"); !valid) {
        return std::unexpected(valid.error());
    }
    if (auto valid = validate_id(task_id, "taskId"); !valid) {
        return std::unexpected(valid.error());
    }
    return map_not_found(m_transport->get("project/" + project_id + "/task/" + task_id), "task", task_id);
}

std::expected<nlohmann::json, core::Error> TaskApi::tasks_create(const std::string& project_id,
                                                                 const nlohmann::json& draft) {
    if (auto valid = validate_id(project_id, "projectId"); !valid) {
        return std::unexpected(valid.error());
    }
    if (!draft.is_object() || !draft.contains("title") || !draft["title"].is_string() ||
        is_blank(draft["title"].get<std::string>())) {
        return std::unexpected(core::validation_error("Task title is required", "title"));
    }

    nlohmann::json body = draft;
    body["projectId"] = project_id;

    auto result = m_transport->post("task", body);
    if (result) {
        invalidate_tasks(project_id);
    }
    return result;
}

std::expected<nlohmann::json, core::Error> TaskApi::tasks_update(const std::string& project_id,
                                                                 const std::string& task_id,
                                                                 const nlohmann::json& draft) {
    if (auto valid = validate_id(project_id, "projectId"); !valid) {
        return std::unexpected(valid.error());
    }
    if (auto valid = validate_id(task_id, "taskId"); !valid) {
        return std::unexpected(valid.error());
    }
    if (!draft.is_object()) {
        return std::unexpected(core::validation_error("Task update must be a JSON object", "draft"));
    }
    if (draft.contains("title") && (!draft["title"].is_string() || is_blank(draft["title"].get<std::string>()))) {
        return std::unexpected(core::validation_error("Task title must be a non-empty string", "title"));
    }

    // The path id is authoritative; null fields are left untouched on the server
    nlohmann::json body = nlohmann::json::object();
    for (auto it = draft.begin(); it != draft.end(); ++it) {
        if (it.key() == "id" || it.value().is_null()) {
            continue;
        }
        body[it.key()] = it.value();
    }
    body["projectId"] = project_id;
    body["id"] = task_id;

    auto result = m_transport->post("task/" + task_id, body);
    if (result) {
        invalidate_tasks(project_id);
    }
    return result;
}

std::expected<nlohmann::json, core::Error> TaskApi::tasks_complete(const std::string& project_id,
                                                                   const std::string& task_id) {
    if (auto valid = validate_id(project_id, "projectId"); !valid) {
        return std::unexpected(valid.error());
    }
    if (auto valid = validate_id(task_id, "taskId"); !valid) {
        return std::unexpected(valid.error());
    }

    auto result = m_transport->post("project/" + project_id + "/task/" + task_id + "/complete");
    if (result) {
        invalidate_tasks(project_id);
    }
    return result;
}

std::expected<nlohmann::json, core::Error> TaskApi::tasks_delete(const std::string& project_id,
                                                                 const std::string& task_id) {
    if (auto valid = validate_id(project_id, "projectId"); !valid) {
        return std::unexpected(valid.error());
    }
    if (auto valid = validate_id(task_id, "taskId"); !valid) {
        return std::unexpected(valid.error());
    }

    auto result = m_transport->del("project/" + project_id + "/task/" + task_id);
    if (result) {
        invalidate_tasks(project_id);
    }
    return result;
}

// ============================================================================
// Cached reads
// ============================================================================

std::expected<FetchResult, core::Error> TaskApi::cached_read(const std::string& key,
                                                             std::chrono::milliseconds ttl,
                                                             bool force_refresh,
                                                             const ResultCache::FetchFn& fetch_fn) {
    if (!force_refresh) {
        FetchOptions options;
        options.ttl = ttl;
        return m_cache->fetch(key, fetch_fn, options);
    }

    LOG_DEBUG("TaskApi", "Bypassing cache for " + key);
    auto fetched = fetch_fn();
    if (!fetched) {
        return std::unexpected(fetched.error());
    }
    if (auto stored = m_cache->set(key, *fetched, ttl); !stored) {
        LOG_WARNING("TaskApi", "Failed to store " + key + ": " + stored.error().message);
    }

    FetchResult result;
    result.value = std::move(*fetched);
    result.source = FetchSource::Origin;
    result.stale = false;
    return result;
}

std::expected<FetchResult, core::Error> TaskApi::cached_projects_list(bool force_refresh) {
    return cached_read(PROJECTS_LIST_KEY, m_options.projects_ttl, force_refresh,
                       [this]() { return projects_list(); });
}

std::expected<FetchResult, core::Error> TaskApi::cached_tasks_get_all(const std::string& project_id,
                                                                      bool force_refresh) {
    if (auto valid = validate_id(project_id, "projectId"); !valid) {
        return std::unexpected(valid.error());
    }
    return cached_read(tasks_cache_key(project_id), m_options.tasks_ttl, force_refresh,
                       [this, project_id]() { return tasks_get_all(project_id); });
}

std::expected<nlohmann::json, core::Error> TaskApi::fetch_all_project_tasks() {
    auto projects = projects_list();
    if (!projects) {
        return std::unexpected(projects.error());
    }
    if (!projects->is_array()) {
        return std::unexpected(core::api_error("Project list is not an array", 200, "project"));
    }

    nlohmann::json all = nlohmann::json::array();
    for (const auto& project : *projects) {
        if (!project.is_object() || !project.contains("id") || !project["id"].is_string()) {
            continue;
        }
        auto data = tasks_get_all(project["id"].get<std::string>());
        if (!data) {
            return std::unexpected(data.error());
        }
        if (data->is_object() && data->contains("tasks") && (*data)["tasks"].is_array()) {
            for (const auto& task : (*data)["tasks"]) {
                all.push_back(task);
            }
        }
    }

    LOG_DEBUG("TaskApi", "Aggregated " + std::to_string(all.size()) + " tasks from " +
              std::to_string(projects->size()) + " projects");
    return all;
}

std::expected<FetchResult, core::Error> TaskApi::cached_tasks_get_all_projects(bool force_refresh) {
    return cached_read(ALL_TASKS_KEY, m_options.tasks_ttl, force_refresh,
                       [this]() { return fetch_all_project_tasks(); });
}

// ============================================================================
// Local search
// ============================================================================

std::expected<SearchResult, core::Error> TaskApi::tasks_search_local(const SearchParams& params,
                                                                     bool force_refresh) {
    if (auto valid = validate_search(params); !valid) {
        return std::unexpected(valid.error());
    }

    SearchResult result;
    result.projects_searched = params.project_ids.size();

    for (const auto& project_id : params.project_ids) {
        auto fetched = cached_tasks_get_all(project_id, force_refresh);
        if (!fetched) {
            LOG_WARNING("TaskApi", "Search skipped project " + project_id + ": " + fetched.error().message);
            result.failures.push_back({project_id, fetched.error()});
            continue;
        }

        const auto& data = fetched->value;
        if (!data.is_object() || !data.contains("tasks") || !data["tasks"].is_array()) {
            continue;
        }
        for (const auto& task : data["tasks"]) {
            if (task_matches(task, params.query, params.status)) {
                result.results.push_back(task);
            }
        }
    }

    LOG_DEBUG("TaskApi", "Search matched " + std::to_string(result.results.size()) + " tasks in " +
              std::to_string(result.projects_searched) + " projects");
    return result;
}

} // namespace services
} // namespace taskrelay
