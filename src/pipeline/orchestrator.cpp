// ==============================================================================
// Orchestrator Implementation
// ==============================================================================

#include "pipeline/orchestrator.h"

#include "logging/log.h"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <exception>

namespace Notescope {

namespace {

/// Holds the busy flag for the duration of a tick or a prepare
class BusyGuard {
public:
    explicit BusyGuard(std::atomic<bool>& flag) noexcept : flag_(flag) {
        bool expected = false;
        acquired_ = flag_.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
    }
    ~BusyGuard() {
        if (acquired_) flag_.store(false, std::memory_order_release);
    }

    BusyGuard(const BusyGuard&) = delete;
    BusyGuard& operator=(const BusyGuard&) = delete;

    [[nodiscard]] bool acquired() const noexcept { return acquired_; }

private:
    std::atomic<bool>& flag_;
    bool acquired_ = false;
};

} // namespace

// ==============================================================================
// Construction
// ==============================================================================

Orchestrator::Orchestrator(AudioInputDevice& device, TickScheduler& scheduler, Renderer& renderer)
    : scheduler_(scheduler)
    , renderer_(renderer)
    , capture_(device, buffer_) {}

Orchestrator::~Orchestrator() {
    scheduler_.stop();
    capture_.stop();
}

// ==============================================================================
// Control Surface
// ==============================================================================

Status Orchestrator::prepare(const PipelineConfig& config) {
    std::lock_guard<std::mutex> control(controlMutex_);

    if (state() == PipelineState::Running) {
        return Status::failure(ErrorCode::Configuration, "cannot prepare while running");
    }

    Status status = config.validate();
    if (!status.ok()) {
        Log::get()->error("Invalid configuration: {}", status.message());
        return status;
    }

    BusyGuard busy(busy_);
    if (!busy.acquired()) {
        return Status::failure(ErrorCode::Configuration, "cannot prepare during a tick");
    }

    prepared_.store(false, std::memory_order_release);

    const size_t capacity = config.bufferCapacity();
    if (!buffer_.prepare(capacity)) {
        return Status::failure(ErrorCode::Configuration, "sample buffer capacity must be positive");
    }
    if (!analyzer_.prepare(config.sampleRate, config.minFrequencyHz, config.window)) {
        return Status::failure(ErrorCode::Configuration, "spectral analyzer rejected configuration");
    }
    if (!detector_.configure(config.peakDetectorConfig())) {
        return Status::failure(ErrorCode::Configuration, "peak detector rejected configuration");
    }

    config_ = config;
    result_ = PipelineResult{};
    result_.waveform.reserve(capacity);
    result_.sampleRate = config.sampleRate;
    published_.store(0, std::memory_order_relaxed);
    skipped_.store(0, std::memory_order_relaxed);
    dropped_.store(0, std::memory_order_relaxed);

    prepared_.store(true, std::memory_order_release);
    Log::get()->info("Pipeline prepared: {} Hz, {} sample buffer, {} ms tick, {} window",
                     config.sampleRate, capacity, config.tickInterval.count(),
                     DSP::Window::name(config.window));
    return Status::success();
}

Status Orchestrator::start() {
    std::lock_guard<std::mutex> control(controlMutex_);

    if (!isPrepared()) {
        return Status::failure(ErrorCode::Configuration, "pipeline not prepared");
    }
    if (state() == PipelineState::Running) {
        return Status::success();
    }

    CaptureSettings settings;
    settings.deviceName = config_.deviceName;
    settings.sampleRate = config_.sampleRate;
    settings.blockSize = config_.blockSize;
    settings.channelCount = config_.channelCount;
    settings.inputChannel = config_.inputChannel;
    settings.downmix = config_.downmix;

    Status status = capture_.start(settings);
    if (!status.ok()) {
        Log::get()->error("Capture failed to start: {}", status.toString());
        publishStatus("Failed to start: " + status.message());
        return status;
    }

    status = scheduler_.start(config_.tickInterval, [this] { tick(); });
    if (!status.ok()) {
        capture_.stop();
        Log::get()->error("Tick scheduler failed to start: {}", status.toString());
        publishStatus("Failed to start: " + status.message());
        return status;
    }

    state_.store(PipelineState::Running, std::memory_order_release);
    Log::get()->info("Pipeline Idle -> Running");
    publishStatus("Recording...");
    return Status::success();
}

Status Orchestrator::stop() {
    std::lock_guard<std::mutex> control(controlMutex_);

    if (state() == PipelineState::Idle) {
        return Status::success();
    }

    scheduler_.stop();
    capture_.stop();

    state_.store(PipelineState::Idle, std::memory_order_release);
    Log::get()->info("Pipeline Running -> Idle");
    publishStatus("Stopped");
    return Status::success();
}

Status Orchestrator::clear() {
    std::lock_guard<std::mutex> control(controlMutex_);

    // A tick holding a pre-clear snapshot sees the new generation when it
    // reaches the renderer and discards its result
    std::lock_guard<std::mutex> render(rendererMutex_);
    buffer_.clear();
    clearGeneration_.fetch_add(1, std::memory_order_acq_rel);
    Log::get()->debug("Sample buffer cleared");

    renderer_.onCleared();
    renderer_.onStatus("Buffer cleared");
    return Status::success();
}

// ==============================================================================
// Tick
// ==============================================================================

TickOutcome Orchestrator::tick() {
    BusyGuard busy(busy_);
    if (!busy.acquired()) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        Log::get()->debug("Tick dropped: previous analysis still running");
        return TickOutcome::DroppedBusy;
    }

    if (!isPrepared()) {
        return TickOutcome::NotPrepared;
    }

    try {
        return analyzeAndPublish();
    } catch (const std::exception& e) {
        skipped_.fetch_add(1, std::memory_order_relaxed);
        Log::get()->error("Tick failed: {}", e.what());
        return TickOutcome::Failed;
    }
}

TickOutcome Orchestrator::analyzeAndPublish() {
    const uint64_t generation = clearGeneration_.load(std::memory_order_acquire);
    buffer_.snapshot(result_.waveform);

    logStreamWarnings();

    if (!analyzer_.analyze(result_.waveform, result_.spectrum)) {
        skipped_.fetch_add(1, std::memory_order_relaxed);
        Log::get()->debug("Tick skipped: {}", errorCodeName(ErrorCode::InsufficientData));
        return TickOutcome::SkippedEmpty;
    }

    detector_.detect(result_.spectrum, result_.peaks);
    result_.sampleRate = config_.sampleRate;
    result_.sequence = published_.load(std::memory_order_relaxed) + 1;

    {
        std::lock_guard<std::mutex> render(rendererMutex_);
        if (clearGeneration_.load(std::memory_order_acquire) != generation) {
            skipped_.fetch_add(1, std::memory_order_relaxed);
            Log::get()->debug("Tick discarded: buffer cleared during analysis");
            return TickOutcome::DiscardedCleared;
        }
        renderer_.onResult(result_);
        if (!result_.peaks.empty()) {
            renderer_.onStatus(formatTopPeaks(result_.peaks));
        }
    }
    published_.fetch_add(1, std::memory_order_relaxed);

    Log::get()->trace("Tick {}: {} samples, {} bins, {} peaks", result_.sequence,
                      result_.waveform.size(), result_.spectrum.size(), result_.peaks.size());
    return TickOutcome::Published;
}

// ==============================================================================
// Queries
// ==============================================================================

PipelineStats Orchestrator::stats() const {
    PipelineStats stats;
    stats.ticksPublished = published_.load(std::memory_order_relaxed);
    stats.ticksSkipped = skipped_.load(std::memory_order_relaxed);
    stats.ticksDropped = dropped_.load(std::memory_order_relaxed);
    stats.missedDeadlines = scheduler_.missedDeadlines();
    stats.blocksCaptured = capture_.blocksDelivered();
    const StreamStatusCounts status = capture_.totalStatus();
    stats.inputOverflows = status.overflows;
    stats.inputUnderflows = status.underflows;
    stats.bufferedSamples = buffer_.size();
    return stats;
}

std::string Orchestrator::formatTopPeaks(const std::vector<DSP::Peak>& peaks, size_t maxCount) {
    std::string text = "Top Peaks: ";
    const size_t count = std::min(maxCount, peaks.size());
    for (size_t i = 0; i < count; ++i) {
        if (i > 0) text += ", ";
        text += fmt::format("{:.1f}Hz", peaks[i].frequencyHz);
    }
    return text;
}

// ==============================================================================
// Internal
// ==============================================================================

void Orchestrator::publishStatus(const std::string& text) {
    std::lock_guard<std::mutex> render(rendererMutex_);
    renderer_.onStatus(text);
}

void Orchestrator::logStreamWarnings() {
    const StreamStatusCounts counts = capture_.drainStatus();
    if (counts.overflows > 0) {
        Log::get()->warn("Input overflow in {} block(s) since last tick", counts.overflows);
    }
    if (counts.underflows > 0) {
        Log::get()->warn("Input underflow in {} block(s) since last tick", counts.underflows);
    }
}

} // namespace Notescope
