// ==============================================================================
// CaptureSource Implementation
// ==============================================================================

#include "capture/capture_source.h"

#include "logging/log.h"

#include <algorithm>
#include <array>
#include <string>

namespace Notescope {

namespace {

/// Closes an opened device unless ownership is released on success
class StreamGuard {
public:
    explicit StreamGuard(AudioInputDevice& device) noexcept : device_(device) {}
    ~StreamGuard() {
        if (armed_) {
            device_.stop();
            device_.close();
        }
    }

    StreamGuard(const StreamGuard&) = delete;
    StreamGuard& operator=(const StreamGuard&) = delete;

    void release() noexcept { armed_ = false; }

private:
    AudioInputDevice& device_;
    bool armed_ = true;
};

} // namespace

CaptureSource::~CaptureSource() {
    stop();
}

// ==============================================================================
// Lifecycle
// ==============================================================================

Status CaptureSource::start(const CaptureSettings& settings) {
    if (isRunning()) return Status::success();

    if (settings.channelCount < 1) {
        return Status::failure(ErrorCode::Device, "channel count must be at least 1");
    }

    StreamParameters params;
    params.deviceName = settings.deviceName;
    params.sampleRate = settings.sampleRate;
    params.framesPerBlock = settings.blockSize;
    params.channelCount = settings.channelCount;

    Status status = device_.open(params);
    if (!status.ok()) {
        device_.close();
        return status;
    }
    StreamGuard guard(device_);

    const int opened = device_.channelCount();
    if (!settings.downmix && (settings.inputChannel < 0 || settings.inputChannel >= opened)) {
        return Status::failure(ErrorCode::Device,
                               "input channel " + std::to_string(settings.inputChannel) +
                                   " does not exist on a " + std::to_string(opened) +
                                   "-channel stream");
    }

    inputChannel_ = settings.inputChannel;
    downmix_ = settings.downmix;
    blocks_.store(0, std::memory_order_relaxed);
    overflows_.store(0, std::memory_order_relaxed);
    underflows_.store(0, std::memory_order_relaxed);
    pendingOverflows_.store(0, std::memory_order_relaxed);
    pendingUnderflows_.store(0, std::memory_order_relaxed);

    status = device_.start(&CaptureSource::onInput, this);
    if (!status.ok()) return status;

    guard.release();
    running_.store(true, std::memory_order_release);
    if (downmix_) {
        Log::get()->debug("Capture started, downmixing {} channel(s)", opened);
    } else {
        Log::get()->debug("Capture started on channel {} of {}", inputChannel_, opened);
    }
    return Status::success();
}

void CaptureSource::stop() {
    device_.stop();
    device_.close();
    running_.store(false, std::memory_order_release);
}

// ==============================================================================
// Status Counters
// ==============================================================================

StreamStatusCounts CaptureSource::totalStatus() const noexcept {
    StreamStatusCounts counts;
    counts.overflows = overflows_.load(std::memory_order_relaxed);
    counts.underflows = underflows_.load(std::memory_order_relaxed);
    return counts;
}

StreamStatusCounts CaptureSource::drainStatus() noexcept {
    StreamStatusCounts counts;
    counts.overflows = pendingOverflows_.exchange(0, std::memory_order_relaxed);
    counts.underflows = pendingUnderflows_.exchange(0, std::memory_order_relaxed);
    return counts;
}

// ==============================================================================
// Audio Thread
// ==============================================================================

void CaptureSource::onInput(const float* interleaved, size_t frameCount, int channelCount,
                            StreamStatusFlags status, void* userData) noexcept {
    static_cast<CaptureSource*>(userData)->deliver(interleaved, frameCount, channelCount, status);
}

void CaptureSource::deliver(const float* interleaved, size_t frameCount, int channelCount,
                            StreamStatusFlags status) noexcept {
    if (status & kStreamInputOverflow) {
        overflows_.fetch_add(1, std::memory_order_relaxed);
        pendingOverflows_.fetch_add(1, std::memory_order_relaxed);
    }
    if (status & kStreamInputUnderflow) {
        underflows_.fetch_add(1, std::memory_order_relaxed);
        pendingUnderflows_.fetch_add(1, std::memory_order_relaxed);
    }
    blocks_.fetch_add(1, std::memory_order_relaxed);

    if (interleaved == nullptr || frameCount == 0 || channelCount < 1) return;

    const auto channels = static_cast<size_t>(channelCount);
    if (channels == 1) {
        buffer_.pushBlock(interleaved, frameCount);
        return;
    }

    if (!downmix_) {
        if (inputChannel_ >= channelCount) return;
        buffer_.pushStrided(interleaved + inputChannel_, frameCount, channels);
        return;
    }

    std::array<float, kDownmixChunk> scratch;
    const float scale = 1.0f / static_cast<float>(channelCount);
    for (size_t offset = 0; offset < frameCount; offset += kDownmixChunk) {
        const size_t frames = std::min(kDownmixChunk, frameCount - offset);
        const float* frame = interleaved + offset * channels;
        for (size_t i = 0; i < frames; ++i, frame += channels) {
            float sum = 0.0f;
            for (size_t c = 0; c < channels; ++c) sum += frame[c];
            scratch[i] = sum * scale;
        }
        buffer_.pushBlock(scratch.data(), frames);
    }
}

} // namespace Notescope
