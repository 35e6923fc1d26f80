#pragma once

// ==============================================================================
// TickScheduler - Fixed-Interval Callback Driver
// ==============================================================================
// Drives Orchestrator::tick() while the pipeline is Running.
//
// ThreadTickScheduler runs the callback on a dedicated thread against fixed
// deadlines (start + k * interval). A callback that overruns one or more
// deadlines does not cause a burst of catch-up calls: the missed deadlines
// are skipped and counted. An exception escaping the callback is logged and
// counted; it does not end the timer thread.
// ==============================================================================

#include "pipeline/error.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace Notescope {

class TickScheduler {
public:
    using Callback = std::function<void()>;

    virtual ~TickScheduler() = default;

    /// @brief Begin invoking callback every interval
    /// @return SchedulerError when the timer cannot be started
    [[nodiscard]] virtual Status start(std::chrono::milliseconds interval, Callback callback) = 0;

    /// @brief Cancel the timer and wait for an in-flight callback to return.
    /// Idempotent. Must not be called from inside the callback.
    virtual void stop() = 0;

    [[nodiscard]] virtual bool isRunning() const noexcept = 0;

    /// @brief Deadlines skipped because a callback overran
    [[nodiscard]] virtual uint64_t missedDeadlines() const noexcept = 0;
};

class ThreadTickScheduler final : public TickScheduler {
public:
    ThreadTickScheduler() = default;
    ~ThreadTickScheduler() override;

    ThreadTickScheduler(const ThreadTickScheduler&) = delete;
    ThreadTickScheduler& operator=(const ThreadTickScheduler&) = delete;

    [[nodiscard]] Status start(std::chrono::milliseconds interval, Callback callback) override;
    void stop() override;
    [[nodiscard]] bool isRunning() const noexcept override;
    [[nodiscard]] uint64_t missedDeadlines() const noexcept override;

    /// @brief Callbacks that ended in an exception; the timer keeps running
    [[nodiscard]] uint64_t callbackFailures() const noexcept;

private:
    void run(std::chrono::milliseconds interval);

    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable wake_;
    bool stopRequested_ = false;
    Callback callback_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> missed_{0};
    std::atomic<uint64_t> failures_{0};
};

} // namespace Notescope
