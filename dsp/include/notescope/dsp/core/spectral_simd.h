// ==============================================================================
// Layer 0: Core Utility - SIMD-Accelerated Spectral Math
// ==============================================================================
// Bulk magnitude and decibel conversion for analysis spectra, using Google
// Highway for runtime SIMD dispatch (SSE2/AVX2/AVX-512/NEON).
//
// These functions are the vectorized equivalents of the per-bin sqrt and
// magnitudeToDb() in db_utils.h. SpectralAnalyzer calls them once per frame.
//
// Real-Time Safety: noexcept, no allocations
// ==============================================================================

#pragma once

#include <cstddef>

namespace Notescope {
namespace DSP {

/// @brief Bulk compute |z| from interleaved Complex data
/// @param complexData Pointer to interleaved {real, imag} float pairs
/// @param numBins Number of complex bins (NOT number of floats)
/// @param mags Output magnitude array (must hold numBins floats)
/// @note SIMD-accelerated with runtime ISA dispatch
void computeMagnitudeBulk(const float* complexData, std::size_t numBins,
                          float* mags) noexcept;

/// @brief Bulk convert linear magnitudes to decibels
///
/// output[i] = 20 * log10(input[i] + kMagnitudeEpsilon)
///
/// @param input Linear magnitudes (>= 0)
/// @param output Decibel values (must hold count floats, may alias input)
/// @param count Number of elements
/// @note A zero magnitude maps to -200 dB
/// @note SIMD-accelerated with runtime ISA dispatch
void magnitudeToDbBulk(const float* input, float* output, std::size_t count) noexcept;

} // namespace DSP
} // namespace Notescope
