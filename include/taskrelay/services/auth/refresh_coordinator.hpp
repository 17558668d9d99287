#pragma once

#include "taskrelay/core/errors.hpp"
#include "taskrelay/core/models.hpp"
#include <expected>
#include <functional>
#include <future>
#include <mutex>
#include <optional>

namespace taskrelay {
namespace services {

/**
 * @brief Single-flight slot for credential refresh
 *
 * While a refresh runs, every other caller of with_mutex() waits on it and
 * receives the same credential or the same error instead of starting its
 * own. The slot clears once the refresh settles.
 */
class RefreshCoordinator {
public:
    using RefreshOutcome = std::expected<core::Credential, core::Error>;
    using RefreshFn = std::function<RefreshOutcome()>;

    RefreshCoordinator() = default;
    ~RefreshCoordinator() = default;

    RefreshCoordinator(const RefreshCoordinator&) = delete;
    RefreshCoordinator& operator=(const RefreshCoordinator&) = delete;

    // Process-wide slot
    static RefreshCoordinator& instance();

    RefreshOutcome with_mutex(const RefreshFn& refresh_fn);

    bool in_progress() const;

private:
    mutable std::mutex m_mutex;
    std::optional<std::shared_future<RefreshOutcome>> m_pending;
};

} // namespace services
} // namespace taskrelay
