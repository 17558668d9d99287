#pragma once

#include "taskrelay/services/network/http_client.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

namespace taskrelay::test {

// Unique directory under the system temp dir, removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "taskrelay-test") {
        std::random_device rd;
        m_path = std::filesystem::temp_directory_path() /
                 (prefix + "-" + std::to_string(::getpid()) + "-" + std::to_string(rd()));
        std::filesystem::create_directories(m_path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return m_path; }
    std::filesystem::path operator/(const std::string& name) const { return m_path / name; }

private:
    std::filesystem::path m_path;
};

// Manually advanced epoch-ms clock
class ManualClock {
public:
    explicit ManualClock(std::int64_t start = 1'700'000'000'000) : m_now(start) {}

    std::int64_t now() const { return m_now.load(); }
    void advance(std::chrono::milliseconds delta) { m_now += delta.count(); }

    std::function<std::int64_t()> as_function() {
        return [this]() { return now(); };
    }

private:
    std::atomic<std::int64_t> m_now;
};

/**
 * @brief Scripted HttpClient
 *
 * Queued results are returned in order; once the queue is empty the last
 * result repeats. A handler, when set, takes precedence over the queue.
 */
class FakeHttpClient : public services::HttpClient {
public:
    using Result = std::expected<services::HttpResponse, services::NetworkError>;
    using Handler = std::function<Result(const services::HttpRequest&)>;

    static services::HttpResponse make_response(int status,
                                                std::string body,
                                                const std::string& content_type = "application/json") {
        services::HttpResponse response;
        response.status_code = status;
        response.body = std::move(body);
        if (!content_type.empty()) {
            response.headers["Content-Type"] = content_type;
        }
        return response;
    }

    void enqueue_response(int status, std::string body, const std::string& content_type = "application/json") {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_results.push_back(make_response(status, std::move(body), content_type));
    }

    void enqueue_error(services::NetworkError error) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_results.push_back(std::unexpected(error));
    }

    void set_handler(Handler handler) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_handler = std::move(handler);
    }

    void set_delay(std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_delay = delay;
    }

    Result execute(const services::HttpRequest& request) override {
        Handler handler;
        Result result = std::unexpected(services::NetworkError::ConnectionFailed);
        std::chrono::milliseconds delay{0};
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_requests.push_back(request);
            delay = m_delay;
            handler = m_handler;
            if (!handler && !m_results.empty()) {
                result = m_results.front();
                if (m_results.size() > 1) {
                    m_results.pop_front();
                }
            }
        }

        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        return handler ? handler(request) : result;
    }

    void set_default_headers(const services::HttpHeaders& headers) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_default_headers = headers;
    }

    void set_user_agent(const std::string& user_agent) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_user_agent = user_agent;
    }

    std::vector<services::HttpRequest> requests() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_requests;
    }

    std::size_t call_count() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_requests.size();
    }

private:
    mutable std::mutex m_mutex;
    std::deque<Result> m_results;
    std::vector<services::HttpRequest> m_requests;
    Handler m_handler;
    std::chrono::milliseconds m_delay{0};
    services::HttpHeaders m_default_headers;
    std::string m_user_agent;
};

} // namespace taskrelay::test
