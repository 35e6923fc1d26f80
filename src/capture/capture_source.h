#pragma once

// ==============================================================================
// CaptureSource - Audio Input Producer
// ==============================================================================
// Opens an input stream on an AudioInputDevice and pushes every delivered
// block, reduced to mono, into a SampleRingBuffer.
//
// Real-time contract of the delivery path (onInput/deliver):
// - no allocation, no locks other than the ring buffer's spin lock
// - no logging; stream status flags are only counted
// ==============================================================================

#include "capture/audio_device.h"
#include "pipeline/error.h"

#include <notescope/dsp/primitives/sample_ring_buffer.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

namespace Notescope {

struct CaptureSettings {
    std::string deviceName;
    double sampleRate = 44100.0;
    size_t blockSize = 2048;
    int channelCount = 1;
    int inputChannel = 0;   ///< Channel pushed when downmix is off
    bool downmix = false;   ///< Average all channels
};

/// Counters drained by the orchestrator each tick
struct StreamStatusCounts {
    uint64_t overflows = 0;
    uint64_t underflows = 0;
};

class CaptureSource {
public:
    /// Frames averaged per downmix chunk (stack scratch size)
    static constexpr size_t kDownmixChunk = 512;

    CaptureSource(AudioInputDevice& device, DSP::SampleRingBuffer& buffer) noexcept
        : device_(device), buffer_(buffer) {}

    ~CaptureSource();

    CaptureSource(const CaptureSource&) = delete;
    CaptureSource& operator=(const CaptureSource&) = delete;

    /// @brief Open and start the input stream
    /// @return success (also when already running) or DeviceError; on failure
    ///         the device is closed again
    [[nodiscard]] Status start(const CaptureSettings& settings);

    /// @brief Stop delivery and release the device. Idempotent.
    void stop();

    [[nodiscard]] bool isRunning() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    [[nodiscard]] uint64_t blocksDelivered() const noexcept {
        return blocks_.load(std::memory_order_relaxed);
    }

    /// @brief Overflow/underflow totals since start
    [[nodiscard]] StreamStatusCounts totalStatus() const noexcept;

    /// @brief Counts accumulated since the previous drain, reset to zero
    [[nodiscard]] StreamStatusCounts drainStatus() noexcept;

    /// @brief Driver entry point (InputCallback signature)
    static void onInput(const float* interleaved, size_t frameCount, int channelCount,
                        StreamStatusFlags status, void* userData) noexcept;

private:
    void deliver(const float* interleaved, size_t frameCount, int channelCount,
                 StreamStatusFlags status) noexcept;

    AudioInputDevice& device_;
    DSP::SampleRingBuffer& buffer_;

    // Written in start() before the stream runs; read on the audio thread
    int inputChannel_ = 0;
    bool downmix_ = false;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> blocks_{0};
    std::atomic<uint64_t> overflows_{0};
    std::atomic<uint64_t> underflows_{0};
    std::atomic<uint64_t> pendingOverflows_{0};
    std::atomic<uint64_t> pendingUnderflows_{0};
};

} // namespace Notescope
