#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace sqlmcp {

/**
 * @brief Tracks in-flight requests so shutdown can drain them
 *
 * A request counts as in flight from acceptance (before it is queued) until
 * its response has been written.
 */
class ShutdownCoordinator {
public:
    struct Config {
        std::chrono::milliseconds shutdown_timeout{30000};
    };

    ShutdownCoordinator();
    explicit ShutdownCoordinator(const Config& config);

    /// Stop admitting requests. Safe to call more than once.
    void initiate_shutdown();

    /// Called when a request is accepted. Returns false if shutting down.
    [[nodiscard]] bool try_enter_request();

    /// Called when a request completes.
    void leave_request();

    /// Blocks until all in-flight requests complete or timeout.
    /// Returns true if drained cleanly, false if timed out.
    [[nodiscard]] bool wait_for_drain();

    [[nodiscard]] bool is_shutting_down() const {
        return shutting_down_.load(std::memory_order_acquire);
    }

    [[nodiscard]] uint32_t in_flight_count() const {
        return in_flight_.load(std::memory_order_relaxed);
    }

private:
    void notify_drain();

    Config config_;
    std::atomic<bool> shutting_down_{false};
    std::atomic<uint32_t> in_flight_{0};
    std::mutex drain_mutex_;
    std::condition_variable drain_cv_;
};

/**
 * @brief RAII admission ticket: enters on construction, leaves on destruction
 */
class RequestGuard {
public:
    explicit RequestGuard(ShutdownCoordinator& coordinator)
        : coordinator_(coordinator), entered_(coordinator.try_enter_request()) {}

    ~RequestGuard() {
        if (entered_) coordinator_.leave_request();
    }

    RequestGuard(const RequestGuard&) = delete;
    RequestGuard& operator=(const RequestGuard&) = delete;

    [[nodiscard]] bool entered() const { return entered_; }

private:
    ShutdownCoordinator& coordinator_;
    bool entered_;
};

} // namespace sqlmcp
