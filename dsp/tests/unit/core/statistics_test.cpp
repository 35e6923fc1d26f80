// ==============================================================================
// Layer 0: Core Utility Tests - Order Statistics
// ==============================================================================
// Tests for: dsp/include/notescope/dsp/core/statistics.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <notescope/dsp/core/statistics.h>

#include <vector>

using namespace Notescope::DSP;
using Catch::Approx;

TEST_CASE("computePercentile interpolates between closest ranks", "[statistics][percentile]") {
    std::vector<float> scratch;
    const std::vector<float> data{5.0f, 1.0f, 4.0f, 2.0f, 3.0f};

    SECTION("endpoints are min and max") {
        REQUIRE(computePercentile(data.data(), data.size(), 0.0f, scratch) == Approx(1.0f));
        REQUIRE(computePercentile(data.data(), data.size(), 100.0f, scratch) == Approx(5.0f));
    }

    SECTION("median of odd count") {
        REQUIRE(computePercentile(data.data(), data.size(), 50.0f, scratch) == Approx(3.0f));
    }

    SECTION("5th percentile of five values") {
        // rank = 4 * 0.05 = 0.2 -> 1 + 0.2 * (2 - 1)
        REQUIRE(computePercentile(data.data(), data.size(), 5.0f, scratch) == Approx(1.2f));
    }

    SECTION("fractional rank on even count") {
        const std::vector<float> even{40.0f, 10.0f, 30.0f, 20.0f};
        // rank = 3 * 0.25 = 0.75 -> 10 + 0.75 * 10
        REQUIRE(computePercentile(even.data(), even.size(), 25.0f, scratch) == Approx(17.5f));
    }

    SECTION("out-of-range percent is clamped") {
        REQUIRE(computePercentile(data.data(), data.size(), -10.0f, scratch) == Approx(1.0f));
        REQUIRE(computePercentile(data.data(), data.size(), 250.0f, scratch) == Approx(5.0f));
    }

    SECTION("input is not modified") {
        computePercentile(data.data(), data.size(), 50.0f, scratch);
        REQUIRE(data == std::vector<float>{5.0f, 1.0f, 4.0f, 2.0f, 3.0f});
    }
}

TEST_CASE("computePercentile edge cases", "[statistics][percentile][edge]") {
    std::vector<float> scratch;

    SECTION("empty input returns 0") {
        REQUIRE(computePercentile(nullptr, 0, 5.0f, scratch) == 0.0f);
    }

    SECTION("single value") {
        const float one = -42.0f;
        REQUIRE(computePercentile(&one, 1, 5.0f, scratch) == Approx(-42.0f));
    }

    SECTION("duplicates") {
        const std::vector<float> flat(10, -200.0f);
        REQUIRE(computePercentile(flat.data(), flat.size(), 5.0f, scratch) == Approx(-200.0f));
    }
}

TEST_CASE("computeMax", "[statistics]") {
    const std::vector<float> data{-3.0f, 7.5f, 2.0f};
    REQUIRE(computeMax(data.data(), data.size()) == Approx(7.5f));
    REQUIRE(computeMax(nullptr, 0) == 0.0f);
}
