#include "taskrelay/core/config_manager.hpp"
#include "taskrelay/core/errors.hpp"
#include "taskrelay/services/auth/credential_provider.hpp"
#include "taskrelay/services/cache/result_cache.hpp"
#include "taskrelay/services/network/transport_client.hpp"
#include "taskrelay/services/tasks/task_api.hpp"
#include "taskrelay/utils/logger.hpp"
#include "taskrelay/utils/paths.hpp"
#include "taskrelay/version.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <charconv>
#include <expected>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {
    using taskrelay::core::Error;

    constexpr const char* USAGE =
        "Usage: taskrelay [--config PATH] [--json] [--version] <command>\n"
        "\n"
        "Commands:\n"
        "  status                              Show authentication and configuration status\n"
        "  auth refresh                        Refresh the stored access token\n"
        "  auth logout [--force]               Remove the stored token\n"
        "  auth login                          Not supported, store a token file instead\n"
        "  cache status                        Show cache statistics\n"
        "  cache purge [--force]               Remove every cached entry\n"
        "  projects list [--force-refresh]     List projects (cache-first)\n"
        "  projects create --name NAME [PROJECT OPTIONS]\n"
        "  projects update <projectId> [PROJECT OPTIONS]\n"
        "  projects delete <projectId> [--force]\n"
        "  tasks list <projectId> [--force-refresh]\n"
        "                                      List tasks of a project (cache-first)\n"
        "  tasks get-all [<projectId>] [--force-refresh]\n"
        "                                      List tasks of one or every project (cache-first)\n"
        "  tasks get <projectId> <taskId>\n"
        "  tasks create <projectId> --title TITLE [TASK OPTIONS]\n"
        "  tasks update <projectId> <taskId> [TASK OPTIONS]\n"
        "  tasks complete <projectId> <taskId>\n"
        "  tasks delete <projectId> <taskId> [--force]\n"
        "  tasks search <query> [--project-ids ID,ID] [--status 0|2] [--force-refresh]\n"
        "                                      Search cached task lists by title, content and desc\n"
        "\n"
        "Project options: --name, --color, --view-mode, --kind, --sort-order\n"
        "Task options:    --title, --content, --desc, --start, --due, --all-day,\n"
        "                 --priority, --sort-order\n";

    // Options that take a value
    const std::vector<std::string> VALUE_OPTIONS = {
        "name", "color", "view-mode", "kind", "sort-order",
        "title", "content", "desc", "start", "due", "priority",
        "project-ids", "status"
    };

    struct CliOptions {
        std::filesystem::path config_path;
        bool json = false;
        bool force = false;
        bool force_refresh = false;
        bool help = false;
        bool version = false;
        bool all_day = false;
        std::map<std::string, std::string> values;
        std::vector<std::string> positional;

        std::optional<std::string> value(const std::string& name) const {
            auto it = values.find(name);
            if (it == values.end()) {
                return std::nullopt;
            }
            return it->second;
        }
    };

    struct Response {
        nlohmann::json data;
        std::vector<std::string> warnings;
        nlohmann::json meta;
    };

    std::expected<CliOptions, Error> parse_arguments(int argc, char* argv[]) {
        CliOptions options;
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--config") {
                if (i + 1 >= argc) {
                    return std::unexpected(taskrelay::core::validation_error("--config requires a path", "config"));
                }
                options.config_path = argv[++i];
            } else if (arg == "--json") {
                options.json = true;
            } else if (arg == "--force") {
                options.force = true;
            } else if (arg == "--force-refresh") {
                options.force_refresh = true;
            } else if (arg == "--help" || arg == "-h") {
                options.help = true;
            } else if (arg == "--version") {
                options.version = true;
            } else if (arg == "--all-day") {
                options.all_day = true;
            } else if (arg.starts_with("--") &&
                       std::find(VALUE_OPTIONS.begin(), VALUE_OPTIONS.end(), arg.substr(2)) != VALUE_OPTIONS.end()) {
                if (i + 1 >= argc) {
                    return std::unexpected(taskrelay::core::validation_error(arg + " requires a value", arg.substr(2)));
                }
                options.values[arg.substr(2)] = argv[++i];
            } else if (arg.starts_with("--")) {
                return std::unexpected(taskrelay::core::validation_error("Unknown option: " + arg));
            } else {
                options.positional.push_back(arg);
            }
        }
        return options;
    }

    std::unique_ptr<taskrelay::utils::Logger> setup_logging(taskrelay::utils::LogLevel level) {
        using namespace taskrelay::utils;

        auto logger = std::make_unique<Logger>(level);
        logger->add_sink(std::make_unique<ConsoleSink>(true));

        const auto log_path = state_directory() / "taskrelay.log";
        auto file_sink = std::make_unique<FileSink>(log_path, false);
        if (file_sink->is_open()) {
            logger->add_sink(std::move(file_sink));
        }

        return logger;
    }

    void print_json(const nlohmann::json& payload, bool compact, std::ostream& out) {
        // API text is not guaranteed to be UTF-8
        out << payload.dump(compact ? -1 : 2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    }

    std::expected<long long, Error> parse_number(const std::string& name, const std::string& text) {
        long long value = 0;
        const auto* end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(text.data(), end, value);
        if (ec != std::errc() || ptr != end) {
            return std::unexpected(taskrelay::core::validation_error("--" + name + " must be an integer", name));
        }
        return value;
    }

    std::vector<std::string> split_ids(const std::string& text) {
        std::vector<std::string> ids;
        std::size_t start = 0;
        while (start <= text.size()) {
            auto comma = text.find(',', start);
            if (comma == std::string::npos) {
                comma = text.size();
            }
            auto id = text.substr(start, comma - start);
            id.erase(0, id.find_first_not_of(" \t"));
            id.erase(id.find_last_not_of(" \t") + 1);
            if (!id.empty()) {
                ids.push_back(id);
            }
            start = comma + 1;
        }
        return ids;
    }

    // Copies string options into the body under their API field names
    std::expected<nlohmann::json, Error> build_body(const CliOptions& options,
                                                    const std::vector<std::pair<std::string, std::string>>& strings,
                                                    const std::vector<std::pair<std::string, std::string>>& numbers) {
        nlohmann::json body = nlohmann::json::object();
        for (const auto& [option, field] : strings) {
            if (auto value = options.value(option)) {
                body[field] = *value;
            }
        }
        for (const auto& [option, field] : numbers) {
            if (auto value = options.value(option)) {
                auto number = parse_number(option, *value);
                if (!number) {
                    return std::unexpected(number.error());
                }
                body[field] = *number;
            }
        }
        return body;
    }

    std::expected<nlohmann::json, Error> build_project_body(const CliOptions& options) {
        return build_body(options,
                          {{"name", "name"}, {"color", "color"}, {"view-mode", "viewMode"}, {"kind", "kind"}},
                          {{"sort-order", "sortOrder"}});
    }

    std::expected<nlohmann::json, Error> build_task_draft(const CliOptions& options) {
        auto draft = build_body(options,
                                {{"title", "title"}, {"content", "content"}, {"desc", "desc"},
                                 {"start", "startDate"}, {"due", "dueDate"}},
                                {{"priority", "priority"}, {"sort-order", "sortOrder"}});
        if (draft && options.all_day) {
            (*draft)["isAllDay"] = true;
        }
        return draft;
    }

    // Positional ids are checked before credentials are resolved
    std::expected<void, Error> require_ids(const CliOptions& options,
                                           const std::vector<std::string>& names,
                                           const std::string& usage) {
        const auto& args = options.positional;
        if (args.size() < 2 + names.size()) {
            return std::unexpected(taskrelay::core::validation_error("Usage: " + usage, names.back()));
        }
        for (std::size_t i = 0; i < names.size(); ++i) {
            if (auto valid = taskrelay::services::TaskApi::validate_id(args[2 + i], names[i]); !valid) {
                return valid;
            }
        }
        return {};
    }

    std::expected<Response, Error> to_response(const std::expected<nlohmann::json, Error>& result) {
        if (!result) {
            return std::unexpected(result.error());
        }
        return Response{*result, {}, nullptr};
    }

    int output_success(const CliOptions& options, const Response& response) {
        nlohmann::json payload = {{"ok", true}, {"data", response.data}};
        if (!response.warnings.empty()) {
            payload["warnings"] = response.warnings;
        }
        if (!response.meta.is_null()) {
            payload["meta"] = response.meta;
        }
        print_json(payload, options.json, std::cout);
        return static_cast<int>(taskrelay::core::ExitCode::Ok);
    }

    int output_error(bool compact, const Error& error) {
        nlohmann::json details = nlohmann::json::object();
        if (error.path) details["path"] = *error.path;
        if (!error.detail.empty()) details["detail"] = error.detail;

        nlohmann::json payload = {
            {"ok", false},
            {"error", {
                {"type", taskrelay::core::to_string(error.kind)},
                {"code", error.status_code ? nlohmann::json(*error.status_code) : nlohmann::json(nullptr)},
                {"message", error.message},
                {"details", details}
            }}
        };
        print_json(payload, compact, std::cerr);
        return static_cast<int>(taskrelay::core::exit_code_for(error));
    }

    bool confirm(const std::string& question) {
        std::cerr << question << " [y/N]: " << std::flush;
        std::string answer;
        if (!std::getline(std::cin, answer)) {
            return false;
        }
        return answer == "y" || answer == "Y";
    }

    nlohmann::json cache_meta(const taskrelay::services::FetchResult& result, bool forced) {
        nlohmann::json meta = {
            {"source", taskrelay::services::to_string(result.source)},
            {"stale", result.stale}
        };
        if (forced) meta["forced"] = true;
        if (result.cached_at) meta["cachedAt"] = *result.cached_at;
        return {{"cache", meta}};
    }

    // Services built on demand so commands that need no token never ask for one
    class CommandContext {
    public:
        explicit CommandContext(const taskrelay::core::ApplicationConfig& config)
            : m_config(config)
            , m_http_client(taskrelay::services::create_http_client()) {
        }

        std::shared_ptr<taskrelay::services::ResultCache> cache() {
            if (!m_cache) {
                taskrelay::services::CacheOptions options;
                options.dir = m_config.cache.dir;
                options.ttl = m_config.cache.ttl;
                options.stale_if_error = m_config.cache.stale_if_error;
                m_cache = std::make_shared<taskrelay::services::ResultCache>(std::move(options));
            }
            return m_cache;
        }

        taskrelay::services::CredentialProvider& credentials() {
            if (!m_credentials) {
                m_credentials = std::make_unique<taskrelay::services::CredentialProvider>(m_config, m_http_client);
            }
            return *m_credentials;
        }

        std::expected<std::shared_ptr<taskrelay::services::TaskApi>, Error> task_api() {
            if (m_task_api) {
                return m_task_api;
            }

            auto token = credentials().access_token();
            if (!token) {
                return std::unexpected(token.error());
            }

            taskrelay::services::TransportOptions transport_options;
            transport_options.base_url = m_config.http.base_url;
            transport_options.token = *token;
            transport_options.timeout = m_config.http.timeout;
            transport_options.retries = m_config.http.retries;

            auto transport = std::make_shared<taskrelay::services::TransportClient>(m_http_client, transport_options);

            taskrelay::services::TaskApiOptions api_options;
            api_options.projects_ttl = m_config.cache.projects_ttl;
            api_options.tasks_ttl = m_config.cache.tasks_ttl;

            m_task_api = std::make_shared<taskrelay::services::TaskApi>(transport, cache(), api_options);
            return m_task_api;
        }

        const taskrelay::core::ApplicationConfig& config() const { return m_config; }

    private:
        const taskrelay::core::ApplicationConfig& m_config;
        std::shared_ptr<taskrelay::services::HttpClient> m_http_client;
        std::shared_ptr<taskrelay::services::ResultCache> m_cache;
        std::unique_ptr<taskrelay::services::CredentialProvider> m_credentials;
        std::shared_ptr<taskrelay::services::TaskApi> m_task_api;
    };

    std::expected<Response, Error> run_status(CommandContext& context,
                                              const taskrelay::core::ConfigManager& config_manager) {
        const auto& store = context.credentials().store();

        nlohmann::json data = {
            {"api", context.config().http.base_url},
            {"tokenPath", store.path().string()},
            {"configPath", config_manager.source_path() ? nlohmann::json(config_manager.source_path()->string())
                                                        : nlohmann::json(nullptr)},
            {"cacheDir", context.config().cache.dir}
        };

        if (context.credentials().has_explicit_token()) {
            data["authenticated"] = true;
            data["tokenSource"] = "config";
            return Response{data, {}, nullptr};
        }

        auto loaded = store.load();
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        if (!*loaded) {
            data["authenticated"] = false;
            return Response{data, {"Not logged in. Store a token at " + store.path().string() + "."}, nullptr};
        }

        const auto& credential = **loaded;
        data["authenticated"] = true;
        data["tokenSource"] = "file";
        data["expiresAt"] = credential.expires_at ? nlohmann::json(*credential.expires_at) : nlohmann::json(nullptr);
        data["expired"] = taskrelay::services::TokenStore::is_expired(credential);
        data["refreshable"] = credential.refresh_token.has_value();
        return Response{data, {}, nullptr};
    }

    std::expected<Response, Error> run_auth(CommandContext& context, const CliOptions& options) {
        const auto& args = options.positional;
        if (args.size() < 2) {
            return std::unexpected(taskrelay::core::validation_error("auth requires a subcommand: refresh | logout | login"));
        }

        if (args[1] == "refresh") {
            auto refreshed = context.credentials().force_refresh();
            if (!refreshed) {
                return std::unexpected(refreshed.error());
            }
            nlohmann::json data = {
                {"refreshed", true},
                {"expiresAt", refreshed->expires_at ? nlohmann::json(*refreshed->expires_at) : nlohmann::json(nullptr)}
            };
            return Response{data, {}, nullptr};
        }

        if (args[1] == "logout") {
            if (!options.force && !confirm("Remove the stored token?")) {
                return Response{{{"cancelled", true}}, {}, nullptr};
            }
            auto cleared = context.credentials().store().clear();
            if (!cleared) {
                return std::unexpected(cleared.error());
            }
            return Response{{{"loggedOut", true}}, {}, nullptr};
        }

        if (args[1] == "login") {
            return std::unexpected(taskrelay::core::not_implemented_error(
                "Interactive login is not supported. Store a token at " +
                context.credentials().store().path().string() + " or set token in the configuration."));
        }

        return std::unexpected(taskrelay::core::validation_error("Unknown auth subcommand: " + args[1]));
    }

    std::expected<Response, Error> run_cache(CommandContext& context, const CliOptions& options) {
        const auto& args = options.positional;
        if (args.size() < 2) {
            return std::unexpected(taskrelay::core::validation_error("cache requires a subcommand: status | purge"));
        }

        if (args[1] == "status") {
            auto stats = context.cache()->stats();
            if (!stats) {
                return std::unexpected(stats.error());
            }
            nlohmann::json data = {
                {"dir", stats->dir.string()},
                {"files", stats->files},
                {"memoryEntries", stats->memory_entries},
                {"ttlMs", stats->ttl.count()},
                {"staleIfErrorMs", stats->stale_if_error.count()}
            };
            return Response{data, {}, nullptr};
        }

        if (args[1] == "purge") {
            if (!options.force &&
                !confirm("Are you sure you want to purge all cache? This cannot be undone.")) {
                return Response{{{"cancelled", true}}, {}, nullptr};
            }
            auto purged = context.cache()->purge();
            if (!purged) {
                return std::unexpected(purged.error());
            }
            return Response{{{"purged", true}}, {}, nullptr};
        }

        return std::unexpected(taskrelay::core::validation_error("Unknown cache subcommand: " + args[1]));
    }

    std::expected<Response, Error> to_response(const std::expected<taskrelay::services::FetchResult, Error>& result,
                                               bool forced) {
        if (!result) {
            return std::unexpected(result.error());
        }
        std::vector<std::string> warnings;
        if (result->stale) {
            warnings.push_back("Returned stale cache due to fetch error.");
        }
        return Response{result->value, warnings, cache_meta(*result, forced)};
    }

    bool confirm_delete(const CliOptions& options, const std::string& what) {
        return options.force || confirm("Delete " + what + "? This cannot be undone.");
    }

    std::expected<Response, Error> run_projects(CommandContext& context, const CliOptions& options) {
        const auto& args = options.positional;
        const std::string subcommand = args.size() > 1 ? args[1] : "";

        if (subcommand == "update") {
            if (auto valid = require_ids(options, {"projectId"}, "projects update <projectId> [options]"); !valid) {
                return std::unexpected(valid.error());
            }
        } else if (subcommand == "delete") {
            if (auto valid = require_ids(options, {"projectId"}, "projects delete <projectId> [--force]"); !valid) {
                return std::unexpected(valid.error());
            }
        } else if (subcommand != "list" && subcommand != "create") {
            return std::unexpected(taskrelay::core::validation_error(
                "projects requires a subcommand: list | create | update | delete"));
        }

        auto api = context.task_api();
        if (!api) {
            return std::unexpected(api.error());
        }

        if (subcommand == "list") {
            return to_response((*api)->cached_projects_list(options.force_refresh), options.force_refresh);
        }

        if (subcommand == "delete") {
            if (!confirm_delete(options, "project " + args[2])) {
                return Response{{{"cancelled", true}}, {}, nullptr};
            }
            return to_response((*api)->projects_delete(args[2]));
        }

        auto body = build_project_body(options);
        if (!body) {
            return std::unexpected(body.error());
        }
        if (subcommand == "create") {
            return to_response((*api)->projects_create(*body));
        }
        return to_response((*api)->projects_update(args[2], *body));
    }

    std::expected<Response, Error> run_tasks_search(taskrelay::services::TaskApi& api, const CliOptions& options) {
        const auto& args = options.positional;
        if (args.size() < 3) {
            return std::unexpected(taskrelay::core::validation_error(
                "Search query is required. Use: taskrelay tasks search <query>", "query"));
        }

        taskrelay::services::SearchParams params;
        params.query = args[2];

        if (auto status = options.value("status")) {
            auto number = parse_number("status", *status);
            if (!number) {
                return std::unexpected(number.error());
            }
            params.status = static_cast<int>(*number);
        }

        if (auto ids = options.value("project-ids")) {
            params.project_ids = split_ids(*ids);
        } else {
            auto projects = api.cached_projects_list(options.force_refresh);
            if (!projects) {
                return std::unexpected(projects.error());
            }
            if (projects->value.is_array()) {
                for (const auto& project : projects->value) {
                    if (project.is_object() && project.contains("id") && project["id"].is_string()) {
                        params.project_ids.push_back(project["id"].get<std::string>());
                    }
                }
            }
        }

        if (params.project_ids.empty()) {
            return std::unexpected(taskrelay::core::validation_error("No projects to search", "projectIds"));
        }

        auto result = api.tasks_search_local(params, options.force_refresh);
        if (!result) {
            return std::unexpected(result.error());
        }

        nlohmann::json data = {
            {"results", result->results},
            {"total", result->results.size()},
            {"projectsSearched", result->projects_searched}
        };
        std::vector<std::string> warnings;
        if (!result->failures.empty()) {
            nlohmann::json errors = nlohmann::json::array();
            for (const auto& failure : result->failures) {
                errors.push_back(nlohmann::json{{"projectId", failure.project_id}, {"error", failure.error.message}});
            }
            data["errors"] = errors;
            warnings.push_back(std::to_string(result->failures.size()) + " project(s) could not be searched.");
        }
        return Response{data, warnings, nullptr};
    }

    std::expected<Response, Error> run_tasks(CommandContext& context, const CliOptions& options) {
        const auto& args = options.positional;
        const std::string subcommand = args.size() > 1 ? args[1] : "";

        std::expected<void, Error> valid;
        if (subcommand == "list") {
            valid = require_ids(options, {"projectId"}, "tasks list <projectId> [--force-refresh]");
        } else if (subcommand == "get-all") {
            if (args.size() > 2) {
                valid = require_ids(options, {"projectId"}, "tasks get-all [<projectId>] [--force-refresh]");
            }
        } else if (subcommand == "create") {
            valid = require_ids(options, {"projectId"}, "tasks create <projectId> --title TITLE [options]");
        } else if (subcommand == "get" || subcommand == "update" ||
                   subcommand == "complete" || subcommand == "delete") {
            valid = require_ids(options, {"projectId", "taskId"},
                                "tasks " + subcommand + " <projectId> <taskId>");
        } else if (subcommand != "search") {
            valid = std::unexpected(taskrelay::core::validation_error(
                "tasks requires a subcommand: list | get-all | get | create | update | complete | delete | search"));
        }
        if (!valid) {
            return std::unexpected(valid.error());
        }

        auto api = context.task_api();
        if (!api) {
            return std::unexpected(api.error());
        }

        if (subcommand == "list" || (subcommand == "get-all" && args.size() > 2)) {
            return to_response((*api)->cached_tasks_get_all(args[2], options.force_refresh), options.force_refresh);
        }
        if (subcommand == "get-all") {
            return to_response((*api)->cached_tasks_get_all_projects(options.force_refresh), options.force_refresh);
        }
        if (subcommand == "search") {
            return run_tasks_search(**api, options);
        }
        if (subcommand == "get") {
            return to_response((*api)->tasks_get(args[2], args[3]));
        }
        if (subcommand == "complete") {
            return to_response((*api)->tasks_complete(args[2], args[3]));
        }
        if (subcommand == "delete") {
            if (!confirm_delete(options, "task " + args[3])) {
                return Response{{{"cancelled", true}}, {}, nullptr};
            }
            return to_response((*api)->tasks_delete(args[2], args[3]));
        }

        auto draft = build_task_draft(options);
        if (!draft) {
            return std::unexpected(draft.error());
        }
        if (subcommand == "create") {
            return to_response((*api)->tasks_create(args[2], *draft));
        }
        return to_response((*api)->tasks_update(args[2], args[3], *draft));
    }
} // anonymous namespace

int main(int argc, char* argv[]) {
    auto parsed = parse_arguments(argc, argv);
    if (!parsed) {
        std::cerr << USAGE;
        return output_error(false, parsed.error());
    }
    const auto& options = *parsed;

    if (options.version) {
        std::cout << "taskrelay " << TASKRELAY_VERSION_STRING << std::endl;
        return 0;
    }

    if (options.help || options.positional.empty()) {
        std::cout << USAGE;
        return options.help ? 0 : static_cast<int>(taskrelay::core::ExitCode::Validation);
    }

    taskrelay::core::ConfigManager config_manager(options.config_path);
    if (auto loaded = config_manager.load(); !loaded) {
        return output_error(options.json, loaded.error());
    }

    const auto& config = config_manager.get();
    taskrelay::utils::LoggerManager::set_instance(setup_logging(config.log_level));

    LOG_DEBUG("Main", "Log level: " + taskrelay::utils::to_string(config.log_level));

    CommandContext context(config);
    const auto& command = options.positional.front();

    std::expected<Response, Error> result;
    if (command == "status") {
        result = run_status(context, config_manager);
    } else if (command == "auth") {
        result = run_auth(context, options);
    } else if (command == "cache") {
        result = run_cache(context, options);
    } else if (command == "projects") {
        result = run_projects(context, options);
    } else if (command == "tasks") {
        result = run_tasks(context, options);
    } else {
        result = std::unexpected(taskrelay::core::validation_error("Unknown command: " + command));
    }

    int exit_code = result ? output_success(options, *result) : output_error(options.json, result.error());

    taskrelay::utils::LoggerManager::get_instance().flush();
    return exit_code;
}
