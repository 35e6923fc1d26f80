#pragma once

// ==============================================================================
// AudioInputDevice - Capture Backend Interface
// ==============================================================================
// Minimal surface the capture source needs from an audio driver. The
// production backend is PortAudioDevice; tests substitute a fake that
// delivers blocks synchronously.
// ==============================================================================

#include "pipeline/error.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace Notescope {

/// Bit set of driver-reported stream conditions
using StreamStatusFlags = uint32_t;

inline constexpr StreamStatusFlags kStreamInputUnderflow = 0x1;
inline constexpr StreamStatusFlags kStreamInputOverflow = 0x2;

/// @brief Driver delivery callback
///
/// Invoked on the driver's real-time thread with one interleaved float32
/// block of frameCount * channelCount samples. Implementations must not
/// block, lock a kernel mutex, allocate, or log.
using InputCallback = void (*)(const float* interleaved, size_t frameCount, int channelCount,
                               StreamStatusFlags status, void* userData) noexcept;

struct StreamParameters {
    std::string deviceName;        ///< Empty selects the system default input
    double sampleRate = 44100.0;
    size_t framesPerBlock = 2048;
    int channelCount = 1;
};

struct DeviceInfo {
    int index = -1;
    std::string name;
    int maxInputChannels = 0;
    double defaultSampleRate = 0.0;
    bool isDefault = false;
};

class AudioInputDevice {
public:
    virtual ~AudioInputDevice() = default;

    /// @brief Acquire the device and create (but do not start) a stream
    /// @return DeviceError when missing, busy or the format is unsupported
    [[nodiscard]] virtual Status open(const StreamParameters& params) = 0;

    /// @brief Start delivering blocks to callback
    [[nodiscard]] virtual Status start(InputCallback callback, void* userData) = 0;

    /// @brief Halt delivery; no callback runs after this returns
    virtual void stop() = 0;

    /// @brief Release the stream. Safe to call when not open.
    virtual void close() = 0;

    [[nodiscard]] virtual bool isOpen() const noexcept = 0;

    /// @brief Channels of the open stream (0 when closed)
    [[nodiscard]] virtual int channelCount() const noexcept = 0;

    [[nodiscard]] virtual std::vector<DeviceInfo> listInputDevices() const = 0;
};

} // namespace Notescope
