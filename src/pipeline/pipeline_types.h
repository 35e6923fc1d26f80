#pragma once

// ==============================================================================
// Pipeline Result
// ==============================================================================

#include <notescope/dsp/processors/peak_detector.h>
#include <notescope/dsp/processors/spectral_analyzer.h>

#include <cstdint>
#include <vector>

namespace Notescope {

/// @brief Everything published to the renderer for one tick
///
/// Storage is owned and reused by the orchestrator; renderers must copy
/// whatever they want to keep past onResult().
struct PipelineResult {
    std::vector<float> waveform;       ///< Buffer snapshot, oldest first
    DSP::SpectrumFrame spectrum;       ///< Masked dB spectrum of the snapshot
    std::vector<DSP::Peak> peaks;      ///< Sorted by magnitude, descending
    double sampleRate = 0.0;
    uint64_t sequence = 0;             ///< 1 for the first published tick
};

} // namespace Notescope
