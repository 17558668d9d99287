#include "taskrelay/services/auth/refresh_coordinator.hpp"
#include "taskrelay/utils/logger.hpp"

namespace taskrelay {
namespace services {

RefreshCoordinator& RefreshCoordinator::instance() {
    static RefreshCoordinator coordinator;
    return coordinator;
}

bool RefreshCoordinator::in_progress() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending.has_value();
}

RefreshCoordinator::RefreshOutcome RefreshCoordinator::with_mutex(const RefreshFn& refresh_fn) {
    std::promise<RefreshOutcome> promise;
    std::optional<std::shared_future<RefreshOutcome>> existing;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_pending) {
            existing = m_pending;
        } else {
            m_pending = promise.get_future().share();
        }
    }

    if (existing) {
        LOG_DEBUG("RefreshCoordinator", "Refresh already in progress, waiting for it");
        return existing->get();
    }

    LOG_DEBUG("RefreshCoordinator", "Starting credential refresh");

    auto settle = [this]() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_pending.reset();
    };

    RefreshOutcome outcome;
    try {
        outcome = refresh_fn();
    } catch (const std::exception& e) {
        outcome = std::unexpected(core::auth_error(std::string("Credential refresh failed: ") + e.what()));
    } catch (...) {
        outcome = std::unexpected(core::auth_error("Credential refresh failed: unknown exception"));
    }

    settle();
    promise.set_value(outcome);

    if (!outcome) {
        LOG_WARNING("RefreshCoordinator", "Credential refresh failed: " + outcome.error().message);
    }
    return outcome;
}

} // namespace services
} // namespace taskrelay
