// ==============================================================================
// PipelineConfig Implementation
// ==============================================================================

#include "pipeline/pipeline_config.h"

#include <cmath>
#include <string>

namespace Notescope {

namespace {

Status invalid(const char* option, const std::string& reason) {
    return Status::failure(ErrorCode::Configuration, std::string(option) + " " + reason);
}

} // namespace

Status PipelineConfig::validate() const {
    if (!(sampleRate > 0.0) || !std::isfinite(sampleRate)) {
        return invalid("sample_rate", "must be positive");
    }
    if (blockSize == 0) {
        return invalid("block_size", "must be positive");
    }
    if (!(bufferDurationSeconds > 0.0) || !std::isfinite(bufferDurationSeconds)) {
        return invalid("buffer_duration", "must be positive");
    }
    if (bufferCapacity() == 0) {
        return invalid("buffer_duration", "holds less than one sample");
    }
    if (tickInterval.count() <= 0) {
        return invalid("tick_interval", "must be positive");
    }
    if (!(minFrequencyHz >= 0.0f) || static_cast<double>(minFrequencyHz) >= sampleRate / 2.0) {
        return invalid("min_freq", "must lie in [0, sample_rate / 2)");
    }
    if (!(peakHeightFraction >= 0.0f && peakHeightFraction <= 1.0f)) {
        return invalid("peak_height_fraction", "must lie in [0, 1]");
    }
    if (channelCount < 1) {
        return invalid("channels", "must be at least 1");
    }
    if (!downmix && (inputChannel < 0 || inputChannel >= channelCount)) {
        return invalid("input_channel", "must be below the channel count");
    }
    return Status::success();
}

size_t PipelineConfig::bufferCapacity() const noexcept {
    const double samples = std::round(sampleRate * bufferDurationSeconds);
    if (!(samples >= 1.0) || !std::isfinite(samples)) return 0;
    return static_cast<size_t>(samples);
}

DSP::PeakDetectorConfig PipelineConfig::peakDetectorConfig() const noexcept {
    DSP::PeakDetectorConfig config;
    config.topK = topK;
    config.minSeparationBins = peakMinSeparationBins;
    config.heightFraction = peakHeightFraction;
    return config;
}

bool parseWindowType(std::string_view text, DSP::WindowType& out) noexcept {
    if (text == "hann") {
        out = DSP::WindowType::Hann;
    } else if (text == "hamming") {
        out = DSP::WindowType::Hamming;
    } else if (text == "blackman") {
        out = DSP::WindowType::Blackman;
    } else {
        return false;
    }
    return true;
}

} // namespace Notescope
