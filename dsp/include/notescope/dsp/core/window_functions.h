// ==============================================================================
// Layer 0: Core Utility - Window Functions
// ==============================================================================
// Window function generators for single-shot spectral analysis.
// Includes Hann, Hamming and Blackman windows in their symmetric form.
//
// Real-Time Safety: noexcept, allocation in generate() only when the caller
// passes a std::vector that has to grow.
// ==============================================================================

#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

#include <notescope/dsp/core/math_constants.h>

namespace Notescope {
namespace DSP {

// =============================================================================
// Window Type Enumeration
// =============================================================================

/// @brief Supported window function types for snapshot analysis
enum class WindowType : uint8_t {
    Hann,       ///< Hann (Hanning) window - default, -31 dB first sidelobe
    Hamming,    ///< Hamming window - -43 dB first sidelobe, no zero endpoints
    Blackman    ///< Blackman window - -58 dB first sidelobe, wider main lobe
};

// =============================================================================
// Window Namespace - Free Functions
// =============================================================================

namespace Window {

// -----------------------------------------------------------------------------
// Window Generators (In-Place)
// -----------------------------------------------------------------------------
// All generators produce the symmetric variant, which divides the phase by
// (N - 1) so both endpoints carry the same weight. A window of length 1 is
// the single value 1.0.

namespace detail {

/// Phase step for the symmetric form, or 0 when size < 2
[[nodiscard]] inline double symmetricStep(size_t size) noexcept {
    return size > 1 ? kTwoPiD / static_cast<double>(size - 1) : 0.0;
}

} // namespace detail

/// @brief Fill buffer with Hann window (symmetric)
/// @param output Destination buffer
/// @param size Window size
/// @note Formula: 0.5 - 0.5*cos(2*pi*n/(N-1))
inline void generateHann(float* output, size_t size) noexcept {
    if (output == nullptr || size == 0) return;
    if (size == 1) {
        output[0] = 1.0f;
        return;
    }

    const double step = detail::symmetricStep(size);
    for (size_t n = 0; n < size; ++n) {
        const double phase = step * static_cast<double>(n);
        output[n] = static_cast<float>(0.5 - 0.5 * std::cos(phase));
    }
}

/// @brief Fill buffer with Hamming window (symmetric)
/// @param output Destination buffer
/// @param size Window size
/// @note Formula: 0.54 - 0.46*cos(2*pi*n/(N-1))
inline void generateHamming(float* output, size_t size) noexcept {
    if (output == nullptr || size == 0) return;
    if (size == 1) {
        output[0] = 1.0f;
        return;
    }

    const double step = detail::symmetricStep(size);
    for (size_t n = 0; n < size; ++n) {
        const double phase = step * static_cast<double>(n);
        output[n] = static_cast<float>(0.54 - 0.46 * std::cos(phase));
    }
}

/// @brief Fill buffer with Blackman window (symmetric)
/// @param output Destination buffer
/// @param size Window size
/// @note Formula: 0.42 - 0.5*cos(2*pi*n/(N-1)) + 0.08*cos(4*pi*n/(N-1))
inline void generateBlackman(float* output, size_t size) noexcept {
    if (output == nullptr || size == 0) return;
    if (size == 1) {
        output[0] = 1.0f;
        return;
    }

    const double step = detail::symmetricStep(size);
    for (size_t n = 0; n < size; ++n) {
        const double phase = step * static_cast<double>(n);
        // The formula leaves tiny negative values at the endpoints
        const double w = 0.42 - 0.5 * std::cos(phase) + 0.08 * std::cos(2.0 * phase);
        output[n] = static_cast<float>(w < 0.0 ? 0.0 : w);
    }
}

// -----------------------------------------------------------------------------
// Dispatch
// -----------------------------------------------------------------------------

/// @brief Fill buffer with the window of the given type
inline void generate(WindowType type, float* output, size_t size) noexcept {
    switch (type) {
        case WindowType::Hann:
            generateHann(output, size);
            break;
        case WindowType::Hamming:
            generateHamming(output, size);
            break;
        case WindowType::Blackman:
            generateBlackman(output, size);
            break;
    }
}

/// @brief Create a window as a vector
/// @note Allocates; call outside the audio callback
[[nodiscard]] inline std::vector<float> create(WindowType type, size_t size) {
    std::vector<float> window(size);
    generate(type, window.data(), size);
    return window;
}

/// @brief Human-readable window name ("hann", "hamming", "blackman")
[[nodiscard]] inline const char* name(WindowType type) noexcept {
    switch (type) {
        case WindowType::Hann: return "hann";
        case WindowType::Hamming: return "hamming";
        case WindowType::Blackman: return "blackman";
    }
    return "unknown";
}

} // namespace Window

} // namespace DSP
} // namespace Notescope
