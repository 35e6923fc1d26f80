// ==============================================================================
// Layer 0: Core Utility - Order Statistics
// ==============================================================================
// Percentile and extremum helpers for spectrum thresholding.
// ==============================================================================

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace Notescope {
namespace DSP {

/// @brief Compute the p-th percentile with linear interpolation between
///        closest ranks
///
/// The rank is (n - 1) * p / 100 on the ascending order; fractional ranks
/// interpolate between the two neighbouring order statistics. p = 0 is the
/// minimum and p = 100 the maximum.
///
/// @param data Input values (not modified)
/// @param n Number of values
/// @param percent Percentile in [0, 100] (clamped)
/// @param scratch Work buffer, resized to n (reuse it across calls)
/// @return Percentile value, or 0 if n == 0
[[nodiscard]] inline float computePercentile(const float* data, size_t n, float percent,
                                             std::vector<float>& scratch) {
    if (data == nullptr || n == 0) {
        return 0.0f;
    }

    const double p = std::clamp(static_cast<double>(percent), 0.0, 100.0);
    const double rank = static_cast<double>(n - 1) * p / 100.0;
    const auto lo = static_cast<size_t>(std::floor(rank));
    const size_t hi = std::min(lo + 1, n - 1);
    const double frac = rank - static_cast<double>(lo);

    scratch.assign(data, data + n);

    std::nth_element(scratch.begin(), scratch.begin() + static_cast<std::ptrdiff_t>(lo),
                     scratch.end());
    const double lower = scratch[lo];
    if (hi == lo || frac == 0.0) {
        return static_cast<float>(lower);
    }

    // Everything right of lo is >= lower; the next order statistic is their min
    const double upper = *std::min_element(
        scratch.begin() + static_cast<std::ptrdiff_t>(lo + 1), scratch.end());
    return static_cast<float>(lower + (upper - lower) * frac);
}

/// @brief Maximum value, or 0 if n == 0
[[nodiscard]] inline float computeMax(const float* data, size_t n) noexcept {
    if (data == nullptr || n == 0) {
        return 0.0f;
    }
    return *std::max_element(data, data + n);
}

} // namespace DSP
} // namespace Notescope
