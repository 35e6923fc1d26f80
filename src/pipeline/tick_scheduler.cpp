// ==============================================================================
// ThreadTickScheduler Implementation
// ==============================================================================

#include "pipeline/tick_scheduler.h"

#include "logging/log.h"

#include <exception>
#include <string>
#include <system_error>
#include <utility>

namespace Notescope {

ThreadTickScheduler::~ThreadTickScheduler() {
    stop();
}

// ==============================================================================
// Lifecycle
// ==============================================================================

Status ThreadTickScheduler::start(std::chrono::milliseconds interval, Callback callback) {
    if (interval.count() <= 0) {
        return Status::failure(ErrorCode::Scheduler, "tick interval must be positive");
    }
    if (!callback) {
        return Status::failure(ErrorCode::Scheduler, "no tick callback");
    }
    if (thread_.joinable()) {
        return Status::failure(ErrorCode::Scheduler, "scheduler already running");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopRequested_ = false;
    }
    callback_ = std::move(callback);
    missed_.store(0, std::memory_order_relaxed);
    failures_.store(0, std::memory_order_relaxed);

    try {
        thread_ = std::thread([this, interval] { run(interval); });
    } catch (const std::system_error& e) {
        callback_ = nullptr;
        return Status::failure(ErrorCode::Scheduler,
                               std::string("could not create tick thread: ") + e.what());
    }

    running_.store(true, std::memory_order_release);
    return Status::success();
}

void ThreadTickScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopRequested_ = true;
    }
    wake_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
    callback_ = nullptr;
    running_.store(false, std::memory_order_release);
}

bool ThreadTickScheduler::isRunning() const noexcept {
    return running_.load(std::memory_order_acquire);
}

uint64_t ThreadTickScheduler::missedDeadlines() const noexcept {
    return missed_.load(std::memory_order_relaxed);
}

uint64_t ThreadTickScheduler::callbackFailures() const noexcept {
    return failures_.load(std::memory_order_relaxed);
}

// ==============================================================================
// Timer Thread
// ==============================================================================

void ThreadTickScheduler::run(std::chrono::milliseconds interval) {
    using Clock = std::chrono::steady_clock;

    auto deadline = Clock::now() + interval;

    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopRequested_) {
        if (wake_.wait_until(lock, deadline, [this] { return stopRequested_; })) {
            break;
        }

        lock.unlock();
        try {
            callback_();
        } catch (const std::exception& e) {
            failures_.fetch_add(1, std::memory_order_relaxed);
            Log::get()->error("Tick callback threw: {}", e.what());
        }
        lock.lock();

        deadline += interval;
        const auto now = Clock::now();
        while (deadline <= now) {
            deadline += interval;
            missed_.fetch_add(1, std::memory_order_relaxed);
        }
    }
}

} // namespace Notescope
