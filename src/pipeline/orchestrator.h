#pragma once

// ==============================================================================
// Orchestrator - Capture/Analysis State Machine
// ==============================================================================
// Owns the sample buffer, the capture source, the analyzer and the detector,
// and drives them from a TickScheduler:
//
//   Idle --start()--> Running --stop()--> Idle
//
// Each tick snapshots the buffer, analyzes and detects peaks, and publishes
// one PipelineResult to the renderer. At most one tick executes at a time;
// a tick requested while another is in progress is dropped, never queued.
//
// start(), stop(), clear() and prepare() are serialized with each other.
// None of them may be called from inside a Renderer callback.
// ==============================================================================

#include "capture/audio_device.h"
#include "capture/capture_source.h"
#include "pipeline/error.h"
#include "pipeline/pipeline_config.h"
#include "pipeline/pipeline_types.h"
#include "pipeline/renderer.h"
#include "pipeline/tick_scheduler.h"

#include <notescope/dsp/primitives/sample_ring_buffer.h>
#include <notescope/dsp/processors/peak_detector.h>
#include <notescope/dsp/processors/spectral_analyzer.h>

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace Notescope {

enum class PipelineState : uint8_t {
    Idle,
    Running
};

[[nodiscard]] constexpr const char* pipelineStateName(PipelineState state) noexcept {
    return state == PipelineState::Running ? "Running" : "Idle";
}

/// What a single tick() did
enum class TickOutcome : uint8_t {
    Published,      ///< Result delivered to the renderer
    SkippedEmpty,   ///< Buffer empty; nothing published
    DroppedBusy,       ///< Another tick was executing
    DiscardedCleared,  ///< clear() ran during analysis; the stale result was dropped
    Failed,            ///< Analysis or rendering threw; nothing further published
    NotPrepared        ///< prepare() has not succeeded
};

struct PipelineStats {
    uint64_t ticksPublished = 0;
    uint64_t ticksSkipped = 0;      ///< Empty, discarded after clear, or failed
    uint64_t ticksDropped = 0;
    uint64_t missedDeadlines = 0;
    uint64_t blocksCaptured = 0;
    uint64_t inputOverflows = 0;
    uint64_t inputUnderflows = 0;
    size_t bufferedSamples = 0;
};

class Orchestrator {
public:
    /// Number of peaks listed in the per-tick status line
    static constexpr size_t kStatusPeakCount = 5;

    Orchestrator(AudioInputDevice& device, TickScheduler& scheduler, Renderer& renderer);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /// @brief Validate config and allocate the buffer, analyzer and detector
    /// @return ConfigurationError on invalid config or while Running
    [[nodiscard]] Status prepare(const PipelineConfig& config);

    [[nodiscard]] bool isPrepared() const noexcept {
        return prepared_.load(std::memory_order_acquire);
    }

    /// @brief Idle -> Running. A no-op returning success when already Running.
    /// @return ConfigurationError when unprepared, DeviceError or SchedulerError
    ///         (the pipeline stays Idle with the device released)
    Status start();

    /// @brief Running -> Idle. A no-op when Idle.
    Status stop();

    /// @brief Empty the buffer and notify the renderer; valid in either state
    Status clear();

    /// @brief Run one analysis pass (timer driven, or manual)
    ///
    /// Never throws: a failure inside analysis or a renderer callback is
    /// logged and counted as a skipped tick.
    TickOutcome tick();

    [[nodiscard]] PipelineState state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    [[nodiscard]] PipelineStats stats() const;

    [[nodiscard]] DSP::SampleRingBuffer& buffer() noexcept { return buffer_; }
    [[nodiscard]] CaptureSource& capture() noexcept { return capture_; }
    [[nodiscard]] const PipelineConfig& config() const noexcept { return config_; }

    /// @brief "Top Peaks: 440.0Hz, 880.0Hz" for the first maxCount peaks
    [[nodiscard]] static std::string formatTopPeaks(const std::vector<DSP::Peak>& peaks,
                                                    size_t maxCount = kStatusPeakCount);

private:
    TickOutcome analyzeAndPublish();
    void publishStatus(const std::string& text);
    void logStreamWarnings();

    TickScheduler& scheduler_;
    Renderer& renderer_;

    PipelineConfig config_;
    DSP::SampleRingBuffer buffer_;
    CaptureSource capture_;
    DSP::SpectralAnalyzer analyzer_;
    DSP::PeakDetector detector_;
    PipelineResult result_;   ///< Reused across ticks

    std::atomic<PipelineState> state_{PipelineState::Idle};
    std::atomic<bool> prepared_{false};
    std::atomic<bool> busy_{false};
    std::atomic<uint64_t> clearGeneration_{0};

    std::atomic<uint64_t> published_{0};
    std::atomic<uint64_t> skipped_{0};
    std::atomic<uint64_t> dropped_{0};

    std::mutex controlMutex_;
    std::mutex rendererMutex_;
};

} // namespace Notescope
