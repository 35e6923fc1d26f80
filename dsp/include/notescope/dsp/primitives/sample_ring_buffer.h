// ==============================================================================
// Layer 1: DSP Primitive - SampleRingBuffer
// ==============================================================================
// Fixed-capacity FIFO of mono samples shared between the audio capture
// callback (producer) and the analysis tick (consumer).
//
// Once full, every push evicts exactly the oldest sample. Snapshots return the
// contents oldest-first. A short spin lock guards storage and indices; the
// longest critical section is one snapshot copy of at most capacity floats.
//
// Real-Time Safety:
// - prepare(): allocates, NOT real-time safe
// - push*/clear(): noexcept, no allocation, no kernel waits
// - snapshot(): allocates only if the destination has to grow
// ==============================================================================

#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Notescope {
namespace DSP {

namespace detail {

/// @brief Minimal test-and-set spin lock for very short critical sections
class SpinLock {
public:
    void lock() noexcept {
        while (flag_.test_and_set(std::memory_order_acquire)) {
            // spin
        }
    }

    void unlock() noexcept { flag_.clear(std::memory_order_release); }

private:
    std::atomic_flag flag_ = ATOMIC_FLAG_INIT;
};

/// @brief Scoped holder for SpinLock
class SpinLockGuard {
public:
    explicit SpinLockGuard(SpinLock& lock) noexcept : lock_(lock) { lock_.lock(); }
    ~SpinLockGuard() { lock_.unlock(); }

    SpinLockGuard(const SpinLockGuard&) = delete;
    SpinLockGuard& operator=(const SpinLockGuard&) = delete;

private:
    SpinLock& lock_;
};

} // namespace detail

/// @brief Bounded sample FIFO with oldest-first eviction
///
/// @par Usage
/// @code
/// SampleRingBuffer buffer;
/// if (!buffer.prepare(44100 * 5)) { /* capacity 0 */ }
/// buffer.pushBlock(block, 2048);        // audio thread
/// std::vector<float> snap;
/// buffer.snapshot(snap);                // analysis thread
/// @endcode
class SampleRingBuffer {
public:
    SampleRingBuffer() noexcept = default;

    SampleRingBuffer(const SampleRingBuffer&) = delete;
    SampleRingBuffer& operator=(const SampleRingBuffer&) = delete;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// @brief Allocate storage for capacity samples and empty the buffer
    /// @param capacity Maximum number of retained samples
    /// @return false if capacity is 0 (buffer left unprepared)
    /// @note NOT real-time safe. Do not call while a producer is running.
    [[nodiscard]] bool prepare(size_t capacity) {
        if (capacity == 0) {
            storage_.clear();
            storage_.shrink_to_fit();
            resetIndices();
            return false;
        }
        storage_.assign(capacity, 0.0f);
        resetIndices();
        return true;
    }

    /// @brief True once prepare() succeeded
    [[nodiscard]] bool isPrepared() const noexcept { return !storage_.empty(); }

    // =========================================================================
    // Producer (Real-Time Safe)
    // =========================================================================

    /// @brief Append one sample, evicting the oldest when full
    void push(float sample) noexcept {
        if (storage_.empty()) return;
        detail::SpinLockGuard guard(lock_);
        pushUnlocked(sample);
    }

    /// @brief Append count contiguous samples
    void pushBlock(const float* samples, size_t count) noexcept {
        pushStrided(samples, count, 1);
    }

    /// @brief Append every stride-th sample of an interleaved block
    /// @param interleaved First sample of the selected channel
    /// @param frames Number of frames
    /// @param stride Distance between consecutive frames (channel count)
    void pushStrided(const float* interleaved, size_t frames, size_t stride) noexcept {
        if (storage_.empty() || interleaved == nullptr || frames == 0 || stride == 0) return;

        detail::SpinLockGuard guard(lock_);
        const size_t cap = storage_.size();

        // Only the newest capacity frames can survive
        size_t first = 0;
        if (frames > cap) {
            first = frames - cap;
            totalWritten_ += first;
        }
        for (size_t i = first; i < frames; ++i) {
            pushUnlocked(interleaved[i * stride]);
        }
    }

    // =========================================================================
    // Consumer
    // =========================================================================

    /// @brief Copy the current contents, oldest first
    /// @param out Destination, resized to size()
    void snapshot(std::vector<float>& out) const {
        // Reserve outside the lock so the critical section never allocates
        const size_t cap = storage_.size();
        if (out.capacity() < cap) out.reserve(cap);

        detail::SpinLockGuard guard(lock_);
        out.resize(count_);
        if (count_ == 0) return;

        const size_t start = (writeIndex_ + cap - count_) % cap;
        const size_t firstPart = std::min(count_, cap - start);
        std::copy_n(storage_.data() + start, firstPart, out.data());
        std::copy_n(storage_.data(), count_ - firstPart, out.data() + firstPart);
    }

    /// @brief Copy the current contents into a new vector
    [[nodiscard]] std::vector<float> snapshot() const {
        std::vector<float> out;
        snapshot(out);
        return out;
    }

    /// @brief Empty the buffer (capacity unchanged)
    void clear() noexcept {
        detail::SpinLockGuard guard(lock_);
        resetIndices();
    }

    // =========================================================================
    // Queries
    // =========================================================================

    /// @brief Number of retained samples
    [[nodiscard]] size_t size() const noexcept {
        detail::SpinLockGuard guard(lock_);
        return count_;
    }

    [[nodiscard]] size_t capacity() const noexcept { return storage_.size(); }

    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

    /// @brief Samples pushed since prepare() or the last clear()
    [[nodiscard]] uint64_t totalWritten() const noexcept {
        detail::SpinLockGuard guard(lock_);
        return totalWritten_;
    }

private:
    void pushUnlocked(float sample) noexcept {
        const size_t cap = storage_.size();
        storage_[writeIndex_] = sample;
        writeIndex_ = (writeIndex_ + 1 == cap) ? 0 : writeIndex_ + 1;
        if (count_ < cap) ++count_;
        ++totalWritten_;
    }

    void resetIndices() noexcept {
        writeIndex_ = 0;
        count_ = 0;
        totalWritten_ = 0;
    }

    std::vector<float> storage_;
    size_t writeIndex_ = 0;    // Next slot to write
    size_t count_ = 0;         // Retained samples (<= capacity)
    uint64_t totalWritten_ = 0;
    mutable detail::SpinLock lock_;
};

} // namespace DSP
} // namespace Notescope
