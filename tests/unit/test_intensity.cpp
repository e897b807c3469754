/**
 * @file test_intensity.cpp
 * @brief Unit tests for volume providers and the intensity auto-gain
 *
 * The capture provider needs a sound device; its peak meter and the
 * constant provider are exercised directly.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <dotscape/volume_provider.h>

#include <atomic>
#include <thread>
#include <vector>

using namespace dotscape;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

TEST_CASE("Constant volume provider", "[audio]") {
    ConstantVolumeProvider provider(0.3f);
    REQUIRE(provider.name() == "constant");

    for (int i = 0; i < 3; ++i) {
        auto v = provider.pollVolume();
        REQUIRE(v.has_value());
        REQUIRE(*v == 0.3f);
    }
}

TEST_CASE("Peak meter", "[audio]") {
    PeakMeter meter;

    SECTION("nothing recorded gives no sample") {
        REQUIRE_FALSE(meter.take().has_value());
    }

    SECTION("loudest block since the last take wins") {
        std::vector<float> quiet = {0.1f, -0.2f, 0.05f};
        std::vector<float> loud = {0.3f, -0.7f, 0.2f};
        meter.record(quiet.data(), quiet.size());
        meter.record(loud.data(), loud.size());
        meter.record(quiet.data(), quiet.size());

        auto v = meter.take();
        REQUIRE(v.has_value());
        REQUIRE(*v == 0.7f);
    }

    SECTION("take resets the meter") {
        std::vector<float> block = {0.5f};
        meter.record(block.data(), block.size());
        REQUIRE(meter.take().has_value());
        REQUIRE_FALSE(meter.take().has_value());
    }

    SECTION("silent block is a zero sample, not a missing one") {
        std::vector<float> silence(64, 0.0f);
        meter.record(silence.data(), silence.size());
        auto v = meter.take();
        REQUIRE(v.has_value());
        REQUIRE(*v == 0.0f);
    }

    SECTION("blocks recorded during takes are never lost") {
        std::vector<float> block = {1.0f};
        std::atomic<bool> done{false};
        std::thread writer([&] {
            for (int i = 0; i < 20000; ++i) {
                meter.record(block.data(), block.size());
            }
            done = true;
        });

        int samples = 0;
        while (!done) {
            if (auto v = meter.take()) {
                REQUIRE(*v == 1.0f);
                ++samples;
            }
        }
        writer.join();

        // The final block is either already taken or still held
        if (auto v = meter.take()) {
            REQUIRE(*v == 1.0f);
            ++samples;
        }
        REQUIRE(samples > 0);
        REQUIRE_FALSE(meter.take().has_value());
    }
}

TEST_CASE("Capture provider before start", "[audio]") {
    AudioPeakProvider provider;
    REQUIRE_FALSE(provider.isCapturing());
    REQUIRE_FALSE(provider.pollVolume().has_value());
    REQUIRE(provider.name() == "audio");
}

TEST_CASE("Intensity controller", "[audio]") {
    SECTION("starts at unit gain") {
        IntensityController gain(0.8f);
        REQUIRE(gain.intensity() == 0.8f);
        REQUIRE(gain.multiplier() == 1.0f);
        REQUIRE_FALSE(gain.clamped());
    }

    SECTION("sample is scaled by the multiplier") {
        IntensityController gain;
        float out = gain.update(0.5f, 0.0f);
        REQUIRE(out == 0.5f);
        REQUIRE(gain.intensity() == 0.5f);
    }

    SECTION("multiplier creeps up while below the ceiling") {
        IntensityController gain;
        gain.update(0.5f, 2.0f);
        REQUIRE_THAT(gain.multiplier(), WithinRel(1.1f, 1e-6f));
    }

    SECTION("overshoot is clamped and the multiplier scaled down") {
        IntensityController gain;
        float out = gain.update(4.0f, 0.016f);
        REQUIRE(out == 1.0f);
        REQUIRE(gain.clamped());
        REQUIRE_THAT(gain.multiplier(), WithinRel(0.25f, 1e-6f));

        // Same level again now maps to exactly full intensity
        out = gain.update(4.0f, 0.016f);
        REQUIRE_THAT(out, WithinRel(1.0f, 1e-6f));
    }

    SECTION("no sample decays linearly over twenty seconds") {
        IntensityController gain(1.0f);
        gain.update(std::nullopt, 10.0f);
        REQUIRE_THAT(gain.intensity(), WithinAbs(0.5f, 1e-6f));
        gain.update(std::nullopt, 10.0f);
        REQUIRE(gain.intensity() == 0.0f);
        gain.update(std::nullopt, 10.0f);
        REQUIRE(gain.intensity() == 0.0f);
    }

    SECTION("silence does not grow the multiplier") {
        IntensityController gain;
        gain.update(0.0f, 5.0f);
        REQUIRE(gain.intensity() == 0.0f);
        REQUIRE(gain.multiplier() == 1.0f);
    }

    SECTION("multiplier is capped") {
        IntensityController gain;
        for (int i = 0; i < 1000; ++i) {
            gain.update(0.001f, 10.0f);
        }
        REQUIRE(gain.multiplier() == IntensityController::MAX_MULTIPLIER);
        REQUIRE(gain.intensity() <= 1.0f);
    }

    SECTION("output never exceeds one") {
        IntensityController gain;
        for (float v : {0.2f, 3.0f, 0.9f, 50.0f, 0.0f, 1.0f}) {
            REQUIRE(gain.update(v, 0.5f) <= 1.0f);
        }
    }
}
