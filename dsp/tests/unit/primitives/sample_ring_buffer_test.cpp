// ==============================================================================
// Tests: SampleRingBuffer
// ==============================================================================
// Bounded FIFO shared by the capture callback and the analysis tick.
// ==============================================================================

// This translation unit owns the global operator new overrides for dsp_tests
#define NOTESCOPE_ENABLE_ALLOCATION_TRACKING
#include "test_helpers/allocation_detector.h"

#include <notescope/dsp/primitives/sample_ring_buffer.h>

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <numeric>
#include <random>
#include <thread>
#include <vector>

using Catch::Approx;
using namespace Notescope::DSP;

TEST_CASE("SampleRingBuffer: prepare", "[ringbuffer][primitives]") {
    SampleRingBuffer buffer;

    SECTION("starts unprepared and empty") {
        REQUIRE_FALSE(buffer.isPrepared());
        REQUIRE(buffer.capacity() == 0);
        REQUIRE(buffer.size() == 0);
        REQUIRE(buffer.snapshot().empty());
    }

    SECTION("capacity 0 is rejected") {
        REQUIRE_FALSE(buffer.prepare(0));
        REQUIRE_FALSE(buffer.isPrepared());
    }

    SECTION("positive capacity succeeds") {
        REQUIRE(buffer.prepare(220500));
        REQUIRE(buffer.isPrepared());
        REQUIRE(buffer.capacity() == 220500);
        REQUIRE(buffer.size() == 0);
        REQUIRE(buffer.totalWritten() == 0);
    }

    SECTION("push on an unprepared buffer is ignored") {
        buffer.push(1.0f);
        REQUIRE(buffer.size() == 0);
    }
}

TEST_CASE("SampleRingBuffer: push and snapshot preserve order", "[ringbuffer][primitives]") {
    SampleRingBuffer buffer;
    REQUIRE(buffer.prepare(8));

    buffer.push(1.0f);
    buffer.push(2.0f);
    buffer.push(3.0f);

    const auto snap = buffer.snapshot();
    REQUIRE(snap == std::vector<float>{1.0f, 2.0f, 3.0f});
    REQUIRE(buffer.size() == 3);
    REQUIRE(buffer.totalWritten() == 3);
}

TEST_CASE("SampleRingBuffer: full buffer evicts oldest first", "[ringbuffer][primitives]") {
    SampleRingBuffer buffer;
    REQUIRE(buffer.prepare(4));

    SECTION("single pushes") {
        for (int i = 1; i <= 6; ++i) {
            buffer.push(static_cast<float>(i));
        }
        REQUIRE(buffer.size() == 4);
        REQUIRE(buffer.snapshot() == std::vector<float>{3.0f, 4.0f, 5.0f, 6.0f});
        REQUIRE(buffer.totalWritten() == 6);
    }

    SECTION("block larger than capacity keeps the newest samples") {
        std::array<float, 10> block;
        std::iota(block.begin(), block.end(), 0.0f);
        buffer.pushBlock(block.data(), block.size());

        REQUIRE(buffer.snapshot() == std::vector<float>{6.0f, 7.0f, 8.0f, 9.0f});
        REQUIRE(buffer.totalWritten() == 10);
    }

    SECTION("blocks that wrap around") {
        const std::array<float, 3> a{1.0f, 2.0f, 3.0f};
        const std::array<float, 3> b{4.0f, 5.0f, 6.0f};
        buffer.pushBlock(a.data(), a.size());
        buffer.pushBlock(b.data(), b.size());

        REQUIRE(buffer.snapshot() == std::vector<float>{3.0f, 4.0f, 5.0f, 6.0f});
    }
}

TEST_CASE("SampleRingBuffer: snapshot equals the most recent capacity pushes",
          "[ringbuffer][primitives]") {
    std::mt19937 gen(7);
    std::uniform_int_distribution<size_t> capacityDist(1, 64);
    std::uniform_int_distribution<size_t> blockDist(0, 40);

    for (int trial = 0; trial < 50; ++trial) {
        const size_t capacity = capacityDist(gen);
        SampleRingBuffer buffer;
        REQUIRE(buffer.prepare(capacity));

        std::vector<float> history;
        float next = 0.0f;
        for (int step = 0; step < 20; ++step) {
            std::vector<float> block(blockDist(gen));
            for (auto& s : block) s = next++;
            buffer.pushBlock(block.data(), block.size());
            history.insert(history.end(), block.begin(), block.end());

            const auto snap = buffer.snapshot();
            REQUIRE(snap.size() <= capacity);

            const size_t expected = std::min(capacity, history.size());
            REQUIRE(snap.size() == expected);
            REQUIRE(std::equal(snap.begin(), snap.end(), history.end() - static_cast<std::ptrdiff_t>(expected)));
        }
    }
}

TEST_CASE("SampleRingBuffer: pushStrided extracts one channel", "[ringbuffer][primitives]") {
    SampleRingBuffer buffer;
    REQUIRE(buffer.prepare(16));

    // Stereo frames: left = i, right = 100 + i
    const std::array<float, 8> interleaved{0.0f, 100.0f, 1.0f, 101.0f, 2.0f, 102.0f, 3.0f, 103.0f};

    SECTION("left channel") {
        buffer.pushStrided(interleaved.data(), 4, 2);
        REQUIRE(buffer.snapshot() == std::vector<float>{0.0f, 1.0f, 2.0f, 3.0f});
    }

    SECTION("right channel") {
        buffer.pushStrided(interleaved.data() + 1, 4, 2);
        REQUIRE(buffer.snapshot() == std::vector<float>{100.0f, 101.0f, 102.0f, 103.0f});
    }

    SECTION("zero stride and null input are ignored") {
        buffer.pushStrided(interleaved.data(), 4, 0);
        buffer.pushStrided(nullptr, 4, 2);
        REQUIRE(buffer.size() == 0);
    }
}

TEST_CASE("SampleRingBuffer: clear empties the buffer", "[ringbuffer][primitives]") {
    SampleRingBuffer buffer;
    REQUIRE(buffer.prepare(32));

    std::vector<float> block(50, 0.5f);
    buffer.pushBlock(block.data(), block.size());
    REQUIRE(buffer.size() == 32);

    buffer.clear();

    REQUIRE(buffer.snapshot().empty());
    REQUIRE(buffer.size() == 0);
    REQUIRE(buffer.totalWritten() == 0);
    REQUIRE(buffer.capacity() == 32);

    SECTION("buffer is usable after clear") {
        buffer.push(9.0f);
        REQUIRE(buffer.snapshot() == std::vector<float>{9.0f});
    }
}

TEST_CASE("SampleRingBuffer: snapshot into reused vector", "[ringbuffer][primitives]") {
    SampleRingBuffer buffer;
    REQUIRE(buffer.prepare(8));

    std::vector<float> dest(100, -1.0f);
    buffer.push(0.25f);
    buffer.snapshot(dest);

    REQUIRE(dest.size() == 1);
    REQUIRE(dest[0] == Approx(0.25f));
}

TEST_CASE("SampleRingBuffer: push path does not allocate", "[ringbuffer][primitives][realtime]") {
    SampleRingBuffer buffer;
    REQUIRE(buffer.prepare(4096));

    std::array<float, 2048> block{};
    std::array<float, 4096> stereo{};
    std::vector<float> dest;
    dest.reserve(4096);

    TestHelpers::AllocationScope scope;
    buffer.push(0.1f);
    buffer.pushBlock(block.data(), block.size());
    buffer.pushStrided(stereo.data(), 2048, 2);
    buffer.clear();
    buffer.pushBlock(block.data(), block.size());
    buffer.snapshot(dest);
    const size_t allocations = scope.stop();

    REQUIRE(allocations == 0);
    REQUIRE(dest.size() == 2048);
}

TEST_CASE("SampleRingBuffer: concurrent push and snapshot", "[ringbuffer][primitives]") {
    SampleRingBuffer buffer;
    REQUIRE(buffer.prepare(8192));

    constexpr size_t kBlockSize = 512;
    constexpr size_t kNumBlocks = 100;

    std::atomic<bool> producerDone{false};

    // Producer thread: push sequential blocks
    std::thread producer([&]() {
        std::array<float, kBlockSize> block;
        for (size_t b = 0; b < kNumBlocks; ++b) {
            for (size_t i = 0; i < kBlockSize; ++i) {
                block[i] = static_cast<float>(b * kBlockSize + i);
            }
            buffer.pushBlock(block.data(), kBlockSize);
        }
        producerDone.store(true);
    });

    // Consumer thread: every snapshot must be a contiguous run of the sequence
    std::atomic<bool> consumerOk{true};
    std::thread consumer([&]() {
        std::vector<float> snap;
        do {
            buffer.snapshot(snap);
            if (snap.size() > buffer.capacity()) {
                consumerOk.store(false);
                return;
            }
            for (size_t i = 1; i < snap.size(); ++i) {
                if (snap[i] != snap[i - 1] + 1.0f) {
                    consumerOk.store(false);
                    return;
                }
            }
            std::this_thread::sleep_for(std::chrono::microseconds(100));
        } while (!producerDone.load());
    });

    producer.join();
    consumer.join();

    REQUIRE(consumerOk.load());
    REQUIRE(buffer.totalWritten() == kBlockSize * kNumBlocks);

    const auto finalSnap = buffer.snapshot();
    REQUIRE(finalSnap.size() == 8192);
    REQUIRE(finalSnap.back() == Approx(static_cast<float>(kBlockSize * kNumBlocks - 1)));
}
