// ==============================================================================
// Layer 0: Core Utility - SIMD-Accelerated Spectral Math
// ==============================================================================
// Bulk magnitude and decibel conversion using Google Highway for runtime SIMD
// dispatch (SSE2/AVX2/AVX-512/NEON).
//
// This file uses Highway's self-inclusion pattern: foreach_target.h re-includes
// this file once per ISA target. The SIMD kernels compile for each target;
// HWY_EXPORT/HWY_DYNAMIC_DISPATCH (inside #if HWY_ONCE) select the best at
// runtime.
// ==============================================================================

#undef HWY_TARGET_INCLUDE
#define HWY_TARGET_INCLUDE "notescope/dsp/core/spectral_simd.cpp"
#include "hwy/foreach_target.h"  // NOLINT(misc-header-include-cycle) Highway self-inclusion
#include "hwy/highway.h"
#include "hwy/contrib/math/math-inl.h"

#include <cmath>
#include <cstddef>

// =============================================================================
// Per-Target SIMD Kernels (compiled once per ISA target)
// =============================================================================

HWY_BEFORE_NAMESPACE();

// NOLINTNEXTLINE(modernize-concat-nested-namespaces) HWY_NAMESPACE is a macro
namespace Notescope {
namespace DSP {
namespace HWY_NAMESPACE {

namespace hn = hwy::HWY_NAMESPACE;

// -----------------------------------------------------------------------------
// ComputeMagnitudeImpl: Complex[] -> mags[]
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
void ComputeMagnitudeImpl(const float* HWY_RESTRICT complexData, size_t numBins,
                          float* HWY_RESTRICT mags) {
    const hn::ScalableTag<float> d;
    const size_t N = hn::Lanes(d);

    size_t k = 0;

    for (; k + N <= numBins; k += N) {
        hn::Vec<decltype(d)> re;
        hn::Vec<decltype(d)> im;
        hn::LoadInterleaved2(d, complexData + k * 2, re, im);

        const auto reSq = hn::Mul(re, re);
        hn::StoreU(hn::Sqrt(hn::MulAdd(im, im, reSq)), d, mags + k);
    }

    // Scalar tail
    for (; k < numBins; ++k) {
        const float re = complexData[k * 2];
        const float im = complexData[k * 2 + 1];
        mags[k] = std::sqrt(re * re + im * im);
    }
}

// -----------------------------------------------------------------------------
// MagnitudeToDbImpl: 20 * log10(x + 1e-10)
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
void MagnitudeToDbImpl(const float* input, float* output, size_t count) {
    const hn::ScalableTag<float> d;
    const size_t N = hn::Lanes(d);
    const auto epsilon = hn::Set(d, 1e-10f);  // kMagnitudeEpsilon
    const auto twenty = hn::Set(d, 20.0f);

    size_t k = 0;
    for (; k + N <= count; k += N) {
        const auto v = hn::Add(hn::LoadU(d, input + k), epsilon);
        hn::StoreU(hn::Mul(twenty, hn::Log10(d, v)), d, output + k);
    }
    // Scalar tail
    for (; k < count; ++k) {
        const double m = static_cast<double>(input[k]) + 1e-10;
        output[k] = static_cast<float>(20.0 * std::log10(m));
    }
}

}  // namespace HWY_NAMESPACE
}  // namespace DSP
}  // namespace Notescope

HWY_AFTER_NAMESPACE();

// =============================================================================
// Dispatch Table + Wrapper Functions (compiled once)
// =============================================================================

#if HWY_ONCE

#include "notescope/dsp/core/spectral_simd.h"

// NOLINTNEXTLINE(modernize-concat-nested-namespaces) HWY_NAMESPACE dispatch section
namespace Notescope {
namespace DSP {

HWY_EXPORT(ComputeMagnitudeImpl);
HWY_EXPORT(MagnitudeToDbImpl);

void computeMagnitudeBulk(const float* complexData, std::size_t numBins,
                          float* mags) noexcept {
    HWY_DYNAMIC_DISPATCH(ComputeMagnitudeImpl)(complexData, numBins, mags);
}

void magnitudeToDbBulk(const float* input, float* output, std::size_t count) noexcept {
    HWY_DYNAMIC_DISPATCH(MagnitudeToDbImpl)(input, output, count);
}

}  // namespace DSP
}  // namespace Notescope

#endif  // HWY_ONCE
