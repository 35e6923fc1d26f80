// ==============================================================================
// Layer 1: DSP Primitive - Real-Input Fourier Transform
// ==============================================================================
// SIMD-accelerated FFT via pffft (Pretty Fast FFT).
// Provides the forward real-to-complex transform for ANY length N >= 1.
//
// - Lengths pffft supports natively (multiples of 2*S*S, where S is the SIMD
//   width, with only 2/3/5 prime factors) run a direct real transform.
// - All other lengths (e.g. 44100 = 2^2 * 3^2 * 5^2 * 7^2) use Bluestein's
//   chirp-z algorithm: the DFT becomes a circular convolution of length
//   M = 2^k >= 2N-1, evaluated with pffft complex transforms.
//
// Real-Time Safety: noexcept, allocations only in prepare()
// Complexity: O(N log N) for both paths
//
// Backend: pffft (marton78 fork, BSD license)
// ==============================================================================

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <memory>

#include <pffft.h>

#include <notescope/dsp/core/math_constants.h>

namespace Notescope {
namespace DSP {

// =============================================================================
// Complex Number (POD)
// =============================================================================

/// @brief Simple complex number for FFT operations
/// @note POD type for performance - no virtual functions
struct Complex {
    float real = 0.0f;  ///< Real component
    float imag = 0.0f;  ///< Imaginary component

    [[nodiscard]] constexpr Complex operator+(const Complex& other) const noexcept {
        return {real + other.real, imag + other.imag};
    }

    [[nodiscard]] constexpr Complex operator-(const Complex& other) const noexcept {
        return {real - other.real, imag - other.imag};
    }

    [[nodiscard]] constexpr Complex operator*(const Complex& other) const noexcept {
        return {
            real * other.real - imag * other.imag,
            real * other.imag + imag * other.real
        };
    }

    [[nodiscard]] constexpr Complex conjugate() const noexcept {
        return {real, -imag};
    }

    /// @brief Get magnitude |z| = sqrt(real^2 + imag^2)
    [[nodiscard]] float magnitude() const noexcept {
        return std::sqrt(real * real + imag * imag);
    }
};

// =============================================================================
// RAII Helpers for pffft Resources
// =============================================================================

namespace detail {

struct PffftSetupDeleter {
    void operator()(PFFFT_Setup* s) const noexcept {
        if (s) pffft_destroy_setup(s);
    }
};

struct PffftAlignedDeleter {
    void operator()(void* p) const noexcept {
        if (p) pffft_aligned_free(p);
    }
};

using AlignedBuffer = std::unique_ptr<float, PffftAlignedDeleter>;

/// Allocate a zeroed SIMD-aligned float buffer via pffft
inline AlignedBuffer makeAlignedBuffer(size_t numFloats) noexcept {
    AlignedBuffer buffer{static_cast<float*>(pffft_aligned_malloc(numFloats * sizeof(float))),
                         PffftAlignedDeleter{}};
    if (buffer) std::fill_n(buffer.get(), numFloats, 0.0f);
    return buffer;
}

/// Remove all factors of f from n
constexpr size_t stripFactor(size_t n, size_t f) noexcept {
    while (n > 0 && n % f == 0) n /= f;
    return n;
}

} // namespace detail

// =============================================================================
// Size Helpers
// =============================================================================

/// @brief Whether pffft can run a real transform of this length directly
/// @note pffft requires N to be a multiple of 2*S*S (S = SIMD width) and
///       N/S to factor into 2, 3 and 5 only
[[nodiscard]] inline bool isDirectRealSize(size_t n) noexcept {
    const auto simd = static_cast<size_t>(pffft_simd_size());
    const size_t granule = 2 * simd * simd;
    if (n == 0 || n % granule != 0) return false;
    return detail::stripFactor(detail::stripFactor(detail::stripFactor(n / simd, 2), 3), 5) == 1;
}

/// @brief Smallest power of two >= value (and >= minimum)
[[nodiscard]] constexpr size_t nextPowerOfTwo(size_t value, size_t minimum = 1) noexcept {
    size_t p = minimum;
    while (p < value) p <<= 1;
    return p;
}

// =============================================================================
// FFT Class
// =============================================================================

/// @brief Forward real-input Fourier transform of arbitrary length
///
/// @par Usage
/// @code
/// FFT fft;
/// fft.prepare(44100);                    // not real-time safe
/// std::vector<Complex> bins(fft.numBins());
/// fft.forward(samples, bins.data());     // real-time safe
/// @endcode
class FFT {
public:
    /// Minimum complex convolution length for the Bluestein path
    static constexpr size_t kMinConvolutionSize = 64;

    FFT() noexcept = default;
    ~FFT() noexcept = default;

    // Non-copyable, movable (unique_ptr members enable default move)
    FFT(const FFT&) = delete;
    FFT& operator=(const FFT&) = delete;
    FFT(FFT&&) noexcept = default;
    FFT& operator=(FFT&&) noexcept = default;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    /// @brief Prepare the transform for a given length
    /// @param fftSize Number of real input samples (any value >= 1)
    /// @note NOT real-time safe (allocates pffft setup and aligned buffers)
    /// @note On failure (size 0 or allocation failure) isPrepared() is false
    void prepare(size_t fftSize) noexcept {
        release();
        if (fftSize == 0) return;

        size_ = fftSize;
        direct_ = isDirectRealSize(fftSize);

        const bool ok = direct_ ? prepareDirect() : prepareBluestein();
        if (!ok) release();
    }

    // -------------------------------------------------------------------------
    // Processing (Real-Time Safe)
    // -------------------------------------------------------------------------

    /// @brief Forward FFT: real time-domain -> complex frequency-domain
    /// @param input N real samples
    /// @param output N/2+1 complex bins (DC to Nyquist), unnormalized
    /// @pre prepare() has been called
    void forward(const float* input, Complex* output) noexcept {
        if (!isPrepared() || input == nullptr || output == nullptr) return;

        if (direct_) {
            forwardDirect(input, output);
        } else {
            forwardBluestein(input, output);
        }
    }

    // -------------------------------------------------------------------------
    // Query
    // -------------------------------------------------------------------------

    /// @brief Get configured transform length N
    [[nodiscard]] size_t size() const noexcept { return size_; }

    /// @brief Get number of output bins (N/2+1)
    [[nodiscard]] size_t numBins() const noexcept { return size_ / 2 + 1; }

    /// @brief Check if prepare() has succeeded
    [[nodiscard]] bool isPrepared() const noexcept { return size_ > 0 && setup_ != nullptr; }

    /// @brief True when the length runs as a direct pffft real transform
    [[nodiscard]] bool usesDirectTransform() const noexcept { return isPrepared() && direct_; }

    /// @brief Length of the underlying pffft transform (N, or M for Bluestein)
    [[nodiscard]] size_t transformSize() const noexcept {
        return direct_ ? size_ : convSize_;
    }

private:
    // -------------------------------------------------------------------------
    // Direct real transform
    // -------------------------------------------------------------------------

    bool prepareDirect() noexcept {
        setup_.reset(pffft_new_setup(static_cast<int>(size_), PFFFT_REAL));
        if (!setup_) return false;

        buf1_ = detail::makeAlignedBuffer(size_);
        buf2_ = detail::makeAlignedBuffer(size_);
        work_ = detail::makeAlignedBuffer(size_);
        return buf1_ && buf2_ && work_;
    }

    void forwardDirect(const float* input, Complex* output) noexcept {
        const size_t N = size_;

        std::copy_n(input, N, buf1_.get());

        pffft_transform_ordered(setup_.get(), buf1_.get(), buf2_.get(),
                                work_.get(), PFFFT_FORWARD);

        // pffft ordered real output:
        //   [DC_real, Nyquist_real, Re(1), Im(1), Re(2), Im(2), ...]
        const float* fftOut = buf2_.get();

        output[0] = {fftOut[0], 0.0f};
        output[N / 2] = {fftOut[1], 0.0f};

        for (size_t k = 1; k < N / 2; ++k) {
            output[k] = {fftOut[2 * k], fftOut[2 * k + 1]};
        }
    }

    // -------------------------------------------------------------------------
    // Bluestein (chirp-z) transform
    // -------------------------------------------------------------------------
    // X[k] = w[k] * sum_n (x[n] w[n]) conj(w[k-n]),  w[m] = exp(-i pi m^2 / N)

    bool prepareBluestein() noexcept {
        const size_t N = size_;
        convSize_ = nextPowerOfTwo(2 * N - 1, kMinConvolutionSize);
        const size_t M = convSize_;

        setup_.reset(pffft_new_setup(static_cast<int>(M), PFFFT_COMPLEX));
        if (!setup_) return false;

        chirp_ = detail::makeAlignedBuffer(2 * N);
        chirpSpectrum_ = detail::makeAlignedBuffer(2 * M);
        buf1_ = detail::makeAlignedBuffer(2 * M);
        buf2_ = detail::makeAlignedBuffer(2 * M);
        buf3_ = detail::makeAlignedBuffer(2 * M);
        work_ = detail::makeAlignedBuffer(2 * M);
        if (!chirp_ || !chirpSpectrum_ || !buf1_ || !buf2_ || !buf3_ || !work_) {
            return false;
        }

        // n^2 mod 2N keeps the phase argument small and exact for long inputs
        float* w = chirp_.get();
        const auto twoN = static_cast<uint64_t>(2 * N);
        for (size_t n = 0; n < N; ++n) {
            const uint64_t q = (static_cast<uint64_t>(n) * static_cast<uint64_t>(n)) % twoN;
            const double angle = kPiD * static_cast<double>(q) / static_cast<double>(N);
            w[2 * n] = static_cast<float>(std::cos(angle));
            w[2 * n + 1] = static_cast<float>(-std::sin(angle));
        }

        // Convolution kernel conj(w[m]) for m in (-N, N), wrapped into length M
        float* b = buf1_.get();
        std::fill_n(b, 2 * M, 0.0f);
        b[0] = w[0];
        b[1] = -w[1];
        for (size_t n = 1; n < N; ++n) {
            b[2 * n] = w[2 * n];
            b[2 * n + 1] = -w[2 * n + 1];
            b[2 * (M - n)] = w[2 * n];
            b[2 * (M - n) + 1] = -w[2 * n + 1];
        }

        // Kept in pffft's internal (unordered) layout for zconvolve
        pffft_transform(setup_.get(), b, chirpSpectrum_.get(), work_.get(), PFFFT_FORWARD);
        std::fill_n(b, 2 * M, 0.0f);
        return true;
    }

    void forwardBluestein(const float* input, Complex* output) noexcept {
        const size_t N = size_;
        const size_t M = convSize_;
        const float* w = chirp_.get();

        float* a = buf1_.get();
        for (size_t n = 0; n < N; ++n) {
            a[2 * n] = input[n] * w[2 * n];
            a[2 * n + 1] = input[n] * w[2 * n + 1];
        }
        std::fill(a + 2 * N, a + 2 * M, 0.0f);

        pffft_transform(setup_.get(), a, buf2_.get(), work_.get(), PFFFT_FORWARD);

        std::fill_n(buf3_.get(), 2 * M, 0.0f);
        pffft_zconvolve_accumulate(setup_.get(), buf2_.get(), chirpSpectrum_.get(),
                                   buf3_.get(), 1.0f / static_cast<float>(M));

        pffft_transform(setup_.get(), buf3_.get(), a, work_.get(), PFFFT_BACKWARD);

        for (size_t k = 0; k <= N / 2; ++k) {
            const Complex c{a[2 * k], a[2 * k + 1]};
            const Complex wk{w[2 * k], w[2 * k + 1]};
            output[k] = c * wk;
        }
    }

    // -------------------------------------------------------------------------
    // Helpers
    // -------------------------------------------------------------------------

    void release() noexcept {
        setup_.reset();
        buf1_.reset();
        buf2_.reset();
        buf3_.reset();
        work_.reset();
        chirp_.reset();
        chirpSpectrum_.reset();
        size_ = 0;
        convSize_ = 0;
        direct_ = false;
    }

    size_t size_ = 0;
    size_t convSize_ = 0;  // Bluestein convolution length M
    bool direct_ = false;
    std::unique_ptr<PFFFT_Setup, detail::PffftSetupDeleter> setup_;
    detail::AlignedBuffer buf1_;           // Input staging / time-domain result
    detail::AlignedBuffer buf2_;           // Forward spectrum
    detail::AlignedBuffer buf3_;           // Convolution accumulator (Bluestein)
    detail::AlignedBuffer work_;           // pffft work buffer
    detail::AlignedBuffer chirp_;          // w[n], interleaved (Bluestein)
    detail::AlignedBuffer chirpSpectrum_;  // FFT of conj(w) kernel (Bluestein)
};

} // namespace DSP
} // namespace Notescope
