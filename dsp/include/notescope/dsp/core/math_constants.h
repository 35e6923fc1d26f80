// ==============================================================================
// Layer 0: Core Utility - Math Constants
// ==============================================================================
// Centralized mathematical constants for DSP calculations.
// All DSP components should import these constants instead of defining locally.
//
// Note: Constants are inline constexpr to ensure a single definition across
// all translation units (avoids ODR violations from multiple definitions).
// ==============================================================================

#pragma once

namespace Notescope {
namespace DSP {

// =============================================================================
// Mathematical Constants
// =============================================================================

/// Pi constant for DSP calculations
inline constexpr float kPi = 3.14159265358979323846f;

/// Two times Pi (full circle in radians)
/// Used for angular frequency calculations: omega = kTwoPi * f / fs
inline constexpr float kTwoPi = 2.0f * kPi;

/// Double-precision Pi, for phase terms that must stay exact over long
/// transforms (chirp sequences, window tables of several seconds)
inline constexpr double kPiD = 3.14159265358979323846;

/// Double-precision two Pi
inline constexpr double kTwoPiD = 2.0 * kPiD;

} // namespace DSP
} // namespace Notescope
