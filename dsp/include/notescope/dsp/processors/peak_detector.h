// ==============================================================================
// Layer 2: DSP Processor - PeakDetector
// ==============================================================================
// Extracts ranked dominant-frequency peaks from a SpectrumFrame.
//
// Algorithm:
// 1. threshold = p + heightFraction * (max - p), p = low percentile (5th)
// 2. local maxima above both neighbours; a flat top counts once at its middle
// 3. keep maxima with magnitude >= threshold
// 4. minimum separation: strongest first, each kept peak removes every other
//    candidate closer than minSeparationBins
// 5. sort by magnitude descending, truncate to topK, rank = position
//
// Ties in magnitude are resolved towards the higher bin index, both in the
// separation pass and in the final ordering.
//
// Dependencies:
// - Layer 0: statistics.h
// - Layer 2: spectral_analyzer.h (SpectrumFrame)
// ==============================================================================

#pragma once

#include <notescope/dsp/core/statistics.h>
#include <notescope/dsp/processors/spectral_analyzer.h>

#include <algorithm>
#include <cstddef>
#include <vector>

namespace Notescope {
namespace DSP {

/// @brief One detected spectral peak
struct Peak {
    float frequencyHz = 0.0f;
    float magnitudeDb = 0.0f;
    size_t binIndex = 0;  ///< Index inside the SpectrumFrame
    size_t rank = 0;      ///< 0 = strongest
};

/// @brief Peak detection parameters
struct PeakDetectorConfig {
    size_t topK = 10;               ///< Maximum number of peaks returned
    size_t minSeparationBins = 10;  ///< Minimum index distance between peaks
    float heightFraction = 0.2f;    ///< Threshold position between percentile and max
    float lowPercentile = 5.0f;     ///< Noise-floor percentile [0, 100]
};

/// @brief Ranked peak picker for magnitude spectra
///
/// Not thread-safe. Scratch storage is reused between calls.
class PeakDetector {
public:
    PeakDetector() = default;

    /// @brief Apply a configuration
    /// @return false if heightFraction is outside [0, 1] or lowPercentile
    ///         outside [0, 100]; the previous configuration is kept
    [[nodiscard]] bool configure(const PeakDetectorConfig& config) noexcept {
        if (!(config.heightFraction >= 0.0f && config.heightFraction <= 1.0f)) return false;
        if (!(config.lowPercentile >= 0.0f && config.lowPercentile <= 100.0f)) return false;
        config_ = config;
        return true;
    }

    [[nodiscard]] const PeakDetectorConfig& config() const noexcept { return config_; }

    /// @brief Detect up to config().topK peaks
    void detect(const SpectrumFrame& frame, std::vector<Peak>& peaks) {
        detect(frame, config_.topK, peaks);
    }

    /// @brief Detect up to topK peaks
    /// @param frame Input spectrum
    /// @param topK Maximum number of peaks
    /// @param peaks Output, sorted by magnitude descending; empty when nothing
    ///        qualifies (not an error)
    void detect(const SpectrumFrame& frame, size_t topK, std::vector<Peak>& peaks) {
        peaks.clear();
        lastThresholdDb_ = 0.0f;

        const size_t n = frame.magnitudesDb.size();
        if (n == 0) return;

        const float* x = frame.magnitudesDb.data();

        const float floorDb = computePercentile(x, n, config_.lowPercentile, scratch_);
        const float maxDb = computeMax(x, n);
        lastThresholdDb_ = floorDb + config_.heightFraction * (maxDb - floorDb);

        if (topK == 0) return;

        findLocalMaxima(x, n);
        applyHeight(x, lastThresholdDb_);
        applySeparation(x);

        // Final ordering
        std::sort(candidates_.begin(), candidates_.end(), [x](size_t a, size_t b) {
            return x[a] != x[b] ? x[a] > x[b] : a > b;
        });

        const size_t count = std::min(topK, candidates_.size());
        peaks.reserve(count);
        for (size_t r = 0; r < count; ++r) {
            const size_t i = candidates_[r];
            Peak peak;
            peak.frequencyHz = i < frame.frequenciesHz.size() ? frame.frequenciesHz[i] : 0.0f;
            peak.magnitudeDb = x[i];
            peak.binIndex = i;
            peak.rank = r;
            peaks.push_back(peak);
        }
    }

    /// @brief Convenience overload returning a new vector
    [[nodiscard]] std::vector<Peak> detect(const SpectrumFrame& frame, size_t topK) {
        std::vector<Peak> peaks;
        detect(frame, topK, peaks);
        return peaks;
    }

    /// @brief Height threshold used by the last detect() call (dB)
    [[nodiscard]] float lastThresholdDb() const noexcept { return lastThresholdDb_; }

private:
    // Strict local maxima; plateaus report their middle (lower middle for
    // even widths). The first and last bins never qualify.
    void findLocalMaxima(const float* x, size_t n) {
        candidates_.clear();
        if (n < 3) return;

        const size_t iMax = n - 1;
        size_t i = 1;
        while (i < iMax) {
            if (x[i - 1] < x[i]) {
                size_t ahead = i + 1;
                while (ahead < iMax && x[ahead] == x[i]) ++ahead;
                if (x[ahead] < x[i]) {
                    candidates_.push_back((i + ahead - 1) / 2);
                    i = ahead;
                }
            }
            ++i;
        }
    }

    void applyHeight(const float* x, float threshold) {
        candidates_.erase(std::remove_if(candidates_.begin(), candidates_.end(),
                                         [x, threshold](size_t i) { return x[i] < threshold; }),
                          candidates_.end());
    }

    // candidates_ must be in ascending index order
    void applySeparation(const float* x) {
        const size_t sep = config_.minSeparationBins;
        const size_t m = candidates_.size();
        if (sep <= 1 || m < 2) return;

        order_.resize(m);
        for (size_t j = 0; j < m; ++j) order_[j] = j;
        std::sort(order_.begin(), order_.end(), [this, x](size_t a, size_t b) {
            const size_t ia = candidates_[a];
            const size_t ib = candidates_[b];
            return x[ia] != x[ib] ? x[ia] > x[ib] : ia > ib;
        });

        keep_.assign(m, 1);
        for (const size_t j : order_) {
            if (!keep_[j]) continue;
            const size_t centre = candidates_[j];

            for (size_t k = j; k-- > 0 && centre - candidates_[k] < sep;) {
                keep_[k] = 0;
            }
            for (size_t k = j + 1; k < m && candidates_[k] - centre < sep; ++k) {
                keep_[k] = 0;
            }
        }

        size_t w = 0;
        for (size_t j = 0; j < m; ++j) {
            if (keep_[j]) candidates_[w++] = candidates_[j];
        }
        candidates_.resize(w);
    }

    PeakDetectorConfig config_;
    float lastThresholdDb_ = 0.0f;

    std::vector<float> scratch_;
    std::vector<size_t> candidates_;
    std::vector<size_t> order_;
    std::vector<unsigned char> keep_;
};

} // namespace DSP
} // namespace Notescope
