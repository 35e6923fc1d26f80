#pragma once

// =============================================================================
// Manual Tick Scheduler
// =============================================================================
// TickScheduler whose ticks are fired explicitly by the test.
// =============================================================================

#include "pipeline/tick_scheduler.h"

#include <chrono>
#include <cstdint>
#include <utility>

namespace TestHelpers {

class ManualTickScheduler final : public Notescope::TickScheduler {
public:
    bool failStart = false;
    int startCount = 0;
    int stopCount = 0;
    std::chrono::milliseconds lastInterval{0};

    Notescope::Status start(std::chrono::milliseconds interval, Callback callback) override {
        ++startCount;
        if (failStart) {
            return Notescope::Status::failure(Notescope::ErrorCode::Scheduler,
                                              "could not create tick thread");
        }
        lastInterval = interval;
        callback_ = std::move(callback);
        return Notescope::Status::success();
    }

    void stop() override {
        ++stopCount;
        callback_ = nullptr;
    }

    bool isRunning() const noexcept override { return static_cast<bool>(callback_); }
    uint64_t missedDeadlines() const noexcept override { return 0; }

    /// Invoke the scheduled callback once; false when not running
    bool fire() {
        if (!callback_) return false;
        callback_();
        return true;
    }

private:
    Callback callback_;
};

} // namespace TestHelpers
