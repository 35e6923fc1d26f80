#pragma once

// =============================================================================
// Blocking Log Sink
// =============================================================================
// spdlog sink that parks the logging thread on the first message containing
// a trigger string until the test releases it. Lets a test hold a worker at a
// known log statement while it acts from another thread.
// =============================================================================

#include <spdlog/sinks/base_sink.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace TestHelpers {

class BlockingLogSink final : public spdlog::sinks::base_sink<std::mutex> {
public:
    explicit BlockingLogSink(std::string trigger)
        : trigger_(std::move(trigger))
        , blockedFuture_(blocked_.get_future())
        , releaseFuture_(release_.get_future()) {}

    /// True once a logging thread is parked inside the sink
    bool waitUntilBlocked(std::chrono::milliseconds timeout) {
        return blockedFuture_.wait_for(timeout) == std::future_status::ready;
    }

    /// Let the parked thread continue. Safe to call more than once.
    void release() {
        if (!released_.exchange(true)) release_.set_value();
    }

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        if (fired_) return;
        const std::string_view text(msg.payload.data(), msg.payload.size());
        if (text.find(trigger_) == std::string_view::npos) return;
        fired_ = true;
        blocked_.set_value();
        releaseFuture_.wait();
    }

    void flush_() override {}

private:
    std::string trigger_;
    std::promise<void> blocked_;
    std::promise<void> release_;
    std::future<void> blockedFuture_;
    std::future<void> releaseFuture_;
    std::atomic<bool> released_{false};
    bool fired_ = false;
};

/// Attaches a sink to a logger for the lifetime of the scope
class ScopedSink {
public:
    ScopedSink(std::shared_ptr<spdlog::logger> logger, spdlog::sink_ptr sink)
        : logger_(std::move(logger)), sink_(std::move(sink)) {
        logger_->sinks().push_back(sink_);
    }

    ~ScopedSink() {
        auto& sinks = logger_->sinks();
        for (auto it = sinks.begin(); it != sinks.end(); ++it) {
            if (*it == sink_) {
                sinks.erase(it);
                break;
            }
        }
    }

    ScopedSink(const ScopedSink&) = delete;
    ScopedSink& operator=(const ScopedSink&) = delete;

private:
    std::shared_ptr<spdlog::logger> logger_;
    spdlog::sink_ptr sink_;
};

} // namespace TestHelpers
