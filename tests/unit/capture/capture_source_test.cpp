// ==============================================================================
// Tests: CaptureSource
// ==============================================================================
// Capture against FakeAudioDevice: mono reduction, device release on failed
// starts, status flag counting and the allocation-free delivery path.
// ==============================================================================

// This translation unit owns the global operator new overrides for notescope_tests
#define NOTESCOPE_ENABLE_ALLOCATION_TRACKING
#include "test_helpers/allocation_detector.h"

#include "capture/capture_source.h"

#include "test_helpers/fake_audio_device.h"
#include "test_helpers/test_signals.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <numeric>
#include <string>
#include <vector>

using Catch::Approx;
using namespace Notescope;
using TestHelpers::FakeAudioDevice;

namespace {

CaptureSettings monoSettings() {
    CaptureSettings settings;
    settings.sampleRate = 44100.0;
    settings.blockSize = 256;
    settings.channelCount = 1;
    return settings;
}

} // namespace

TEST_CASE("CaptureSource: start opens and starts the device", "[capture]") {
    FakeAudioDevice device;
    DSP::SampleRingBuffer buffer;
    REQUIRE(buffer.prepare(1024));
    CaptureSource capture(device, buffer);

    CaptureSettings settings = monoSettings();
    settings.deviceName = "USB Mic";

    REQUIRE(capture.start(settings).ok());
    REQUIRE(capture.isRunning());
    REQUIRE(device.isOpen());
    REQUIRE(device.isStreaming());
    REQUIRE(device.lastParams.deviceName == "USB Mic");
    REQUIRE(device.lastParams.sampleRate == Approx(44100.0));
    REQUIRE(device.lastParams.framesPerBlock == 256);
    REQUIRE(device.lastParams.channelCount == 1);

    SECTION("start while running is a no-op") {
        REQUIRE(capture.start(settings).ok());
        REQUIRE(device.openCount == 1);
    }

    SECTION("stop releases the device and is idempotent") {
        capture.stop();
        REQUIRE_FALSE(capture.isRunning());
        REQUIRE_FALSE(device.isOpen());
        REQUIRE_FALSE(device.isStreaming());
        capture.stop();
        REQUIRE_FALSE(device.isOpen());
    }
}

TEST_CASE("CaptureSource: mono blocks go straight into the buffer", "[capture]") {
    FakeAudioDevice device;
    DSP::SampleRingBuffer buffer;
    REQUIRE(buffer.prepare(1024));
    CaptureSource capture(device, buffer);
    REQUIRE(capture.start(monoSettings()).ok());

    std::vector<float> block(256);
    std::iota(block.begin(), block.end(), 0.0f);
    REQUIRE(device.deliver(block));
    REQUIRE(device.deliver(block));

    REQUIRE(buffer.size() == 512);
    REQUIRE(capture.blocksDelivered() == 2);
    const auto snap = buffer.snapshot();
    REQUIRE(snap[0] == 0.0f);
    REQUIRE(snap[256] == 0.0f);
    REQUIRE(snap[511] == 255.0f);
}

TEST_CASE("CaptureSource: multi-channel reduction", "[capture]") {
    FakeAudioDevice device;
    DSP::SampleRingBuffer buffer;
    REQUIRE(buffer.prepare(4096));
    CaptureSource capture(device, buffer);

    constexpr size_t kFrames = 1000;   // spans more than one downmix chunk
    std::vector<float> left(kFrames);
    std::vector<float> right(kFrames);
    for (size_t i = 0; i < kFrames; ++i) {
        left[i] = 0.25f;
        right[i] = static_cast<float>(i);
    }
    const auto stereo = TestHelpers::interleave({left, right});

    CaptureSettings settings = monoSettings();
    settings.channelCount = 2;

    SECTION("selected channel") {
        settings.inputChannel = 1;
        REQUIRE(capture.start(settings).ok());
        REQUIRE(device.deliver(stereo));

        const auto snap = buffer.snapshot();
        REQUIRE(snap.size() == kFrames);
        REQUIRE(snap == right);
    }

    SECTION("downmix averages channels") {
        settings.downmix = true;
        REQUIRE(capture.start(settings).ok());
        REQUIRE(device.deliver(stereo));

        const auto snap = buffer.snapshot();
        REQUIRE(snap.size() == kFrames);
        for (size_t i = 0; i < kFrames; ++i) {
            REQUIRE(snap[i] == Approx((0.25f + static_cast<float>(i)) * 0.5f));
        }
    }
}

TEST_CASE("CaptureSource: failures leave the device released", "[capture]") {
    FakeAudioDevice device;
    DSP::SampleRingBuffer buffer;
    REQUIRE(buffer.prepare(1024));
    CaptureSource capture(device, buffer);

    SECTION("open failure") {
        device.failOpen = true;
        const Status status = capture.start(monoSettings());
        REQUIRE(status.code() == ErrorCode::Device);
        REQUIRE_FALSE(capture.isRunning());
        REQUIRE_FALSE(device.isOpen());
    }

    SECTION("start failure closes the opened stream") {
        device.failStart = true;
        const Status status = capture.start(monoSettings());
        REQUIRE(status.code() == ErrorCode::Device);
        REQUIRE(device.openCount == 1);
        REQUIRE(device.closeCount >= 1);
        REQUIRE_FALSE(device.isOpen());
        REQUIRE_FALSE(capture.isRunning());
    }

    SECTION("selected channel missing on the opened stream") {
        device.channelsOverride = 1;
        CaptureSettings settings = monoSettings();
        settings.channelCount = 2;
        settings.inputChannel = 1;

        const Status status = capture.start(settings);
        REQUIRE(status.code() == ErrorCode::Device);
        REQUIRE(status.message().find("input channel 1") != std::string::npos);
        REQUIRE(device.startCount == 0);
        REQUIRE_FALSE(device.isOpen());
    }

    SECTION("a later start succeeds") {
        device.failOpen = true;
        REQUIRE_FALSE(capture.start(monoSettings()).ok());
        device.failOpen = false;
        REQUIRE(capture.start(monoSettings()).ok());
        REQUIRE(capture.isRunning());
    }
}

TEST_CASE("CaptureSource: stream status flags are counted and drained", "[capture]") {
    FakeAudioDevice device;
    DSP::SampleRingBuffer buffer;
    REQUIRE(buffer.prepare(1024));
    CaptureSource capture(device, buffer);
    REQUIRE(capture.start(monoSettings()).ok());

    std::vector<float> block(64, 0.1f);
    REQUIRE(device.deliver(block, kStreamInputOverflow));
    REQUIRE(device.deliver(block, kStreamInputOverflow | kStreamInputUnderflow));
    REQUIRE(device.deliver(block));

    // Samples still arrive while warnings are raised
    REQUIRE(buffer.size() == 192);

    const StreamStatusCounts drained = capture.drainStatus();
    REQUIRE(drained.overflows == 2);
    REQUIRE(drained.underflows == 1);

    const StreamStatusCounts again = capture.drainStatus();
    REQUIRE(again.overflows == 0);
    REQUIRE(again.underflows == 0);

    const StreamStatusCounts totals = capture.totalStatus();
    REQUIRE(totals.overflows == 2);
    REQUIRE(totals.underflows == 1);
}

TEST_CASE("CaptureSource: delivery path does not allocate", "[capture][realtime]") {
    FakeAudioDevice device;
    DSP::SampleRingBuffer buffer;
    REQUIRE(buffer.prepare(8192));
    CaptureSource capture(device, buffer);

    CaptureSettings settings = monoSettings();
    settings.channelCount = 4;
    settings.downmix = true;
    REQUIRE(capture.start(settings).ok());

    const std::vector<float> block(2048 * 4, 0.5f);

    TestHelpers::AllocationScope scope;
    for (int i = 0; i < 8; ++i) {
        device.deliver(block.data(), 2048, kStreamInputOverflow);
    }
    const size_t allocations = scope.stop();

    REQUIRE(allocations == 0);
    REQUIRE(buffer.size() == 8192);
}
