// ==============================================================================
// Layer 0: Core Utilities
// db_utils.h - Magnitude/Decibel Conversion
// ==============================================================================
// Real-Time Audio Thread Safety
// - No allocation, no locks, no exceptions, no I/O
//
// Layered DSP Architecture
// - Layer 0: NO dependencies on higher layers
// ==============================================================================

#pragma once

#include <cmath>
#include <cstddef>

namespace Notescope {
namespace DSP {

// ==============================================================================
// Constants
// ==============================================================================

/// Offset added to spectral magnitudes before taking the logarithm.
/// Keeps log10 finite for bins of exactly zero magnitude.
inline constexpr double kMagnitudeEpsilon = 1e-10;

/// Level reported for a bin of exactly zero magnitude: 20 * log10(1e-10).
inline constexpr float kMagnitudeFloorDb = -200.0f;

// ==============================================================================
// Functions
// ==============================================================================

/// Convert a linear spectral magnitude to decibels.
///
/// @param magnitude  |X[k]| of a DFT bin (>= 0)
/// @return           20 * log10(magnitude + kMagnitudeEpsilon)
///
/// @note  Evaluated in double so the epsilon survives for small magnitudes.
/// @note  Zero magnitude maps to kMagnitudeFloorDb (-200 dB).
///
/// @example  magnitudeToDb(0.0f)   -> -200.0f
/// @example  magnitudeToDb(1.0f)   ->    0.0f
/// @example  magnitudeToDb(10.0f)  ->   20.0f
///
[[nodiscard]] inline float magnitudeToDb(float magnitude) noexcept {
    const double m = static_cast<double>(magnitude) + kMagnitudeEpsilon;
    return static_cast<float>(20.0 * std::log10(m));
}

/// Convert a block of linear magnitudes to decibels.
/// @param magnitudes Input magnitudes
/// @param outDb Destination (may alias magnitudes)
/// @param count Number of values
inline void magnitudesToDb(const float* magnitudes, float* outDb, size_t count) noexcept {
    if (magnitudes == nullptr || outDb == nullptr) return;
    for (size_t i = 0; i < count; ++i) {
        outDb[i] = magnitudeToDb(magnitudes[i]);
    }
}

} // namespace DSP
} // namespace Notescope
