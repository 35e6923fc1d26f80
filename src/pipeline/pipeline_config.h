#pragma once

// ==============================================================================
// PipelineConfig - Analysis Pipeline Configuration
// ==============================================================================
// Recognized options with their defaults. validate() reports the first invalid
// field as a ConfigurationError.
// ==============================================================================

#include "pipeline/error.h"

#include <notescope/dsp/core/window_functions.h>
#include <notescope/dsp/processors/peak_detector.h>

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

namespace Notescope {

struct PipelineConfig {
    double sampleRate = 44100.0;                     ///< Hz
    size_t blockSize = 2048;                         ///< Frames per capture callback
    double bufferDurationSeconds = 5.0;              ///< Ring buffer length
    std::chrono::milliseconds tickInterval{100};     ///< Analysis cadence
    float minFrequencyHz = 20.0f;                    ///< Spectrum low cut
    size_t topK = 10;                                ///< Peaks per result
    size_t peakMinSeparationBins = 10;               ///< Bin-index separation
    float peakHeightFraction = 0.2f;                 ///< Threshold position [0, 1]

    int channelCount = 1;                            ///< Channels opened on the device
    int inputChannel = 0;                            ///< Channel kept when not downmixing
    bool downmix = false;                            ///< Average all channels instead
    std::string deviceName;                          ///< Empty = system default input
    DSP::WindowType window = DSP::WindowType::Hann;

    /// @brief Check every field
    /// @return success, or ConfigurationError naming the offending option
    [[nodiscard]] Status validate() const;

    /// @brief Ring buffer capacity in samples: round(sampleRate * duration)
    [[nodiscard]] size_t bufferCapacity() const noexcept;

    /// @brief Peak detector settings derived from this configuration
    [[nodiscard]] DSP::PeakDetectorConfig peakDetectorConfig() const noexcept;
};

/// @brief Parse "hann", "hamming" or "blackman" (case-sensitive)
[[nodiscard]] bool parseWindowType(std::string_view text, DSP::WindowType& out) noexcept;

} // namespace Notescope
