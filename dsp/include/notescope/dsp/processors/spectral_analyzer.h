// ==============================================================================
// Layer 2: DSP Processor - SpectralAnalyzer
// ==============================================================================
// Snapshot spectrum analysis: window -> real DFT -> dB magnitudes, with the
// bins below a minimum frequency discarded.
//
// The transform length is the snapshot length N (any N >= 1). Window table and
// FFT plan are cached and rebuilt only when N changes, so a steady stream of
// equal-length snapshots allocates nothing after the first frame.
//
// Dependencies:
// - Layer 0: window_functions.h, spectral_simd.h
// - Layer 1: fft.h
// ==============================================================================

#pragma once

#include <notescope/dsp/core/spectral_simd.h>
#include <notescope/dsp/core/window_functions.h>
#include <notescope/dsp/primitives/fft.h>

#include <cmath>
#include <cstddef>
#include <vector>

namespace Notescope {
namespace DSP {

// =============================================================================
// SpectrumFrame
// =============================================================================

/// @brief Masked magnitude spectrum of one snapshot
///
/// frequenciesHz is strictly increasing and runs from the first bin at or above
/// the minimum frequency up to Nyquist (bin N/2).
struct SpectrumFrame {
    std::vector<float> frequenciesHz;
    std::vector<float> magnitudesDb;
    size_t fftSize = 0;        ///< DFT length N (snapshot length)
    size_t firstBin = 0;       ///< Full-spectrum index of frequenciesHz[0]
    double binWidthHz = 0.0;   ///< sampleRate / N

    [[nodiscard]] size_t size() const noexcept { return magnitudesDb.size(); }
    [[nodiscard]] bool empty() const noexcept { return magnitudesDb.empty(); }

    void clear() noexcept {
        frequenciesHz.clear();
        magnitudesDb.clear();
        fftSize = 0;
        firstBin = 0;
        binWidthHz = 0.0;
    }
};

// =============================================================================
// SpectralAnalyzer
// =============================================================================

/// @brief Windowed real-DFT magnitude analyzer
///
/// Not thread-safe; the orchestrator runs at most one analysis at a time.
class SpectralAnalyzer {
public:
    static constexpr float kDefaultMinFrequencyHz = 20.0f;

    SpectralAnalyzer() = default;

    SpectralAnalyzer(const SpectralAnalyzer&) = delete;
    SpectralAnalyzer& operator=(const SpectralAnalyzer&) = delete;
    SpectralAnalyzer(SpectralAnalyzer&&) noexcept = default;
    SpectralAnalyzer& operator=(SpectralAnalyzer&&) noexcept = default;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// @brief Configure the analyzer
    /// @param sampleRate Sample rate in Hz (> 0)
    /// @param minFrequencyHz Bins below this frequency are discarded (>= 0)
    /// @param window Analysis window
    /// @return false for a non-positive sample rate or negative minimum frequency
    [[nodiscard]] bool prepare(double sampleRate,
                               float minFrequencyHz = kDefaultMinFrequencyHz,
                               WindowType window = WindowType::Hann) {
        prepared_ = false;
        if (!(sampleRate > 0.0) || !std::isfinite(sampleRate)) return false;
        if (!(minFrequencyHz >= 0.0f) || !std::isfinite(minFrequencyHz)) return false;

        sampleRate_ = sampleRate;
        minFrequencyHz_ = minFrequencyHz;
        if (window != windowType_) {
            windowType_ = window;
            cachedSize_ = 0;  // Force window regeneration
        }
        prepared_ = true;
        return true;
    }

    [[nodiscard]] bool isPrepared() const noexcept { return prepared_; }

    // =========================================================================
    // Processing
    // =========================================================================

    /// @brief Analyze one snapshot
    /// @param samples Snapshot samples, oldest first
    /// @param count Snapshot length N
    /// @param frame Output frame (storage reused across calls)
    /// @return false if not prepared or the snapshot is empty; frame is cleared
    /// @note Allocates only when N differs from the previous call
    bool analyze(const float* samples, size_t count, SpectrumFrame& frame) {
        if (!prepared_ || samples == nullptr || count == 0) {
            frame.clear();
            return false;
        }
        if (!ensureSize(count)) {
            frame.clear();
            return false;
        }

        // 1. Window
        for (size_t n = 0; n < count; ++n) {
            windowed_[n] = samples[n] * window_[n];
        }

        // 2. Real DFT (N/2+1 bins)
        fft_.forward(windowed_.data(), bins_.data());

        // 3-5. Mask, frequencies, dB
        const size_t numBins = fft_.numBins();
        const size_t first = firstRetainedBin(count, numBins);
        const size_t retained = numBins - first;
        const double binWidth = sampleRate_ / static_cast<double>(count);

        frame.fftSize = count;
        frame.firstBin = first;
        frame.binWidthHz = binWidth;
        frame.frequenciesHz.resize(retained);
        frame.magnitudesDb.resize(retained);
        if (retained == 0) return true;

        computeMagnitudeBulk(reinterpret_cast<const float*>(bins_.data() + first),
                             retained, frame.magnitudesDb.data());
        magnitudeToDbBulk(frame.magnitudesDb.data(), frame.magnitudesDb.data(), retained);

        for (size_t i = 0; i < retained; ++i) {
            frame.frequenciesHz[i] = static_cast<float>(
                static_cast<double>(first + i) * sampleRate_ / static_cast<double>(count));
        }
        return true;
    }

    /// @brief Analyze a snapshot held in a vector
    bool analyze(const std::vector<float>& snapshot, SpectrumFrame& frame) {
        return analyze(snapshot.data(), snapshot.size(), frame);
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] double sampleRate() const noexcept { return sampleRate_; }
    [[nodiscard]] float minFrequencyHz() const noexcept { return minFrequencyHz_; }
    [[nodiscard]] WindowType windowType() const noexcept { return windowType_; }

    /// @brief Snapshot length the window and FFT are currently built for
    [[nodiscard]] size_t cachedSize() const noexcept { return cachedSize_; }

    /// @brief Whether the current FFT plan is a direct pffft transform
    [[nodiscard]] bool usesDirectTransform() const noexcept {
        return fft_.usesDirectTransform();
    }

private:
    bool ensureSize(size_t count) {
        if (count == cachedSize_ && fft_.isPrepared()) return true;

        fft_.prepare(count);
        if (!fft_.isPrepared()) {
            cachedSize_ = 0;
            return false;
        }
        window_.resize(count);
        Window::generate(windowType_, window_.data(), count);
        windowed_.resize(count);
        bins_.resize(fft_.numBins());
        cachedSize_ = count;
        return true;
    }

    /// First bin whose centre frequency k * sampleRate / N is >= minFrequency
    [[nodiscard]] size_t firstRetainedBin(size_t count, size_t numBins) const noexcept {
        const double n = static_cast<double>(count);
        const double minFreq = static_cast<double>(minFrequencyHz_);

        auto k = static_cast<size_t>(std::floor(minFreq * n / sampleRate_));
        if (k > numBins) k = numBins;
        while (k > 0 && static_cast<double>(k - 1) * sampleRate_ / n >= minFreq) --k;
        while (k < numBins && static_cast<double>(k) * sampleRate_ / n < minFreq) ++k;
        return k;
    }

    double sampleRate_ = 44100.0;
    float minFrequencyHz_ = kDefaultMinFrequencyHz;
    WindowType windowType_ = WindowType::Hann;
    bool prepared_ = false;

    size_t cachedSize_ = 0;
    FFT fft_;
    std::vector<float> window_;
    std::vector<float> windowed_;
    std::vector<Complex> bins_;
};

} // namespace DSP
} // namespace Notescope
