/**
 * @file test_config.cpp
 * @brief Unit tests for command-line and JSON settings parsing
 */

#include <catch2/catch_test_macros.hpp>

#include <dotscape/config.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace dotscape;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

// Owns argv storage for parseArgs
struct Args {
    std::vector<std::string> storage;
    std::vector<char*> argv;

    Args(std::initializer_list<std::string> args = {}) : storage(args) {
        storage.insert(storage.begin(), "dotscape");
        for (auto& s : storage) {
            argv.push_back(s.data());
        }
    }

    int parse(Config& config) {
        return parseArgs(static_cast<int>(argv.size()), argv.data(), config);
    }
};

fs::path writeSettings(const std::string& name, const std::string& text) {
    fs::path path = fs::temp_directory_path() / name;
    std::ofstream out(path);
    out << text;
    return path;
}

} // namespace

// =============================================================================
// Defaults
// =============================================================================

TEST_CASE("Config defaults", "[config]") {
    Config config;
    REQUIRE(config.backgroundImage.empty());
    REQUIRE(config.pointCount == 1000);
    REQUIRE(config.pointSize == 5.0f);
    REQUIRE(config.intensity == 0.8f);
    REQUIRE(config.renderMode == RenderMode::Billboards);
    REQUIRE(config.msaa);
    REQUIRE(config.sampleCount() == 4);
    REQUIRE(config.windowClass == "dotscape");
    REQUIRE(config.windowWidth == 1280);
    REQUIRE(config.windowHeight == 720);
    REQUIRE_FALSE(config.audio);
    REQUIRE_FALSE(config.headless);
    REQUIRE(config.frames == 0);
    REQUIRE(validate(config).empty());
}

// =============================================================================
// Helpers
// =============================================================================

TEST_CASE("Size parsing", "[config]") {
    int w = 7, h = 9;

    SECTION("valid") {
        REQUIRE(parseSize("1920x1080", w, h));
        REQUIRE(w == 1920);
        REQUIRE(h == 1080);
    }

    SECTION("malformed input leaves values untouched") {
        REQUIRE_FALSE(parseSize("1920", w, h));
        REQUIRE_FALSE(parseSize("x1080", w, h));
        REQUIRE_FALSE(parseSize("1920x", w, h));
        REQUIRE_FALSE(parseSize("19a0x1080", w, h));
        REQUIRE_FALSE(parseSize("1920x1080px", w, h));
        REQUIRE(w == 7);
        REQUIRE(h == 9);
    }
}

TEST_CASE("Render mode names", "[config]") {
    RenderMode mode = RenderMode::Billboards;
    REQUIRE(parseRenderMode("points", mode));
    REQUIRE(mode == RenderMode::Points);
    REQUIRE(std::string(renderModeName(mode)) == "points");
    REQUIRE_FALSE(parseRenderMode("sprites", mode));
    REQUIRE(mode == RenderMode::Points);
}

TEST_CASE("Validation", "[config]") {
    Config config;

    SECTION("zero points") {
        config.pointCount = 0;
        REQUIRE_FALSE(validate(config).empty());
    }

    SECTION("non-positive point size") {
        config.pointSize = 0.0f;
        REQUIRE_FALSE(validate(config).empty());
    }

    SECTION("intensity out of range") {
        config.intensity = 1.5f;
        REQUIRE_FALSE(validate(config).empty());
        config.intensity = -0.1f;
        REQUIRE_FALSE(validate(config).empty());
    }

    SECTION("point store larger than one storage binding") {
        config.pointCount = MAX_POINT_COUNT;
        REQUIRE(validate(config).empty());
        config.pointCount = MAX_POINT_COUNT + 1;
        REQUIRE_FALSE(validate(config).empty());
    }

    SECTION("half-specified image size") {
        config.expectedImageSize.width = 1920;
        REQUIRE_FALSE(validate(config).empty());
        config.expectedImageSize.height = 1080;
        REQUIRE(validate(config).empty());
    }
}

// =============================================================================
// JSON
// =============================================================================

TEST_CASE("JSON settings", "[config]") {
    Config config;
    std::string error;

    SECTION("recognised keys are applied") {
        json j = {
            {"backgroundImage", "wall.png"},
            {"windowClass", "desk"},
            {"pointCount", 2000},
            {"pointSize", 3.5},
            {"intensity", 0.5},
            {"windowWidth", 800},
            {"windowHeight", 600},
            {"msaa", false},
            {"audio", true},
            {"audioDevice", "Monitor"},
            {"decorated", true},
            {"verbose", true},
            {"imageWidth", 1920},
            {"imageHeight", 1080},
            {"renderMode", "points"}
        };
        REQUIRE(applyJson(j, config, error));
        REQUIRE(config.backgroundImage == "wall.png");
        REQUIRE(config.windowClass == "desk");
        REQUIRE(config.pointCount == 2000);
        REQUIRE(config.pointSize == 3.5f);
        REQUIRE(config.intensity == 0.5f);
        REQUIRE(config.windowWidth == 800);
        REQUIRE(config.windowHeight == 600);
        REQUIRE_FALSE(config.msaa);
        REQUIRE(config.sampleCount() == 1);
        REQUIRE(config.audio);
        REQUIRE(config.audioDevice == "Monitor");
        REQUIRE(config.decorated);
        REQUIRE(config.verbose);
        REQUIRE(config.expectedImageSize.width == 1920);
        REQUIRE(config.expectedImageSize.height == 1080);
        REQUIRE(config.renderMode == RenderMode::Points);
    }

    SECTION("unknown keys are ignored") {
        REQUIRE(applyJson(json::object({{"colour", "red"}}), config, error));
        REQUIRE(config.pointCount == 1000);
    }

    SECTION("wrong value type is rejected") {
        REQUIRE_FALSE(applyJson(json::object({{"pointCount", "many"}}), config, error));
        REQUIRE_FALSE(error.empty());
    }

    SECTION("negative integers are rejected, not wrapped") {
        REQUIRE_FALSE(applyJson(json::object({{"pointCount", -1}}), config, error));
        REQUIRE(error.find("pointCount") != std::string::npos);
        REQUIRE(config.pointCount == 1000);

        REQUIRE_FALSE(applyJson(json::object({{"imageWidth", -5}}), config, error));
        REQUIRE(config.expectedImageSize.width == 0);

        REQUIRE_FALSE(applyJson(json::object({{"windowHeight", -720}}), config, error));
        REQUIRE(config.windowHeight == 720);
    }

    SECTION("point count above the storage limit is rejected") {
        REQUIRE_FALSE(applyJson(json::object({{"pointCount", uint64_t{MAX_POINT_COUNT} + 1}}), config, error));
        REQUIRE_FALSE(applyJson(json::object({{"pointCount", uint64_t{1} << 63}}), config, error));
        REQUIRE(config.pointCount == 1000);
        REQUIRE(applyJson(json::object({{"pointCount", MAX_POINT_COUNT}}), config, error));
        REQUIRE(config.pointCount == MAX_POINT_COUNT);
    }

    SECTION("fractional count is rejected") {
        REQUIRE_FALSE(applyJson(json::object({{"pointCount", 10.5}}), config, error));
    }

    SECTION("unknown render mode is rejected") {
        REQUIRE_FALSE(applyJson(json::object({{"renderMode", "sprites"}}), config, error));
        REQUIRE(error.find("sprites") != std::string::npos);
    }

    SECTION("non-object is rejected") {
        REQUIRE_FALSE(applyJson(json::array({1, 2}), config, error));
    }

    SECTION("missing file") {
        REQUIRE_FALSE(loadConfigFile("/nonexistent/dotscape.json", config, error));
        REQUIRE(error.find("/nonexistent/dotscape.json") != std::string::npos);
    }

    SECTION("malformed file") {
        fs::path path = writeSettings("dotscape_test_bad.json", "{ \"pointCount\": ");
        REQUIRE_FALSE(loadConfigFile(path.string(), config, error));
        fs::remove(path);
    }
}

// =============================================================================
// Command Line
// =============================================================================

TEST_CASE("Command-line parsing", "[config]") {
    Config config;

    SECTION("no arguments keeps defaults") {
        Args args{};
        REQUIRE(args.parse(config) == -1);
        REQUIRE(config.pointCount == 1000);
    }

    SECTION("every option") {
        Args args{"-b", "bg.png", "-c", "wallpaper", "--count", "250",
                  "--point-size", "8", "--intensity", "0.25", "--window", "640x480",
                  "--image-size", "1920x1080", "--render-mode", "points",
                  "--audio-device", "Monitor of Speakers", "--frames", "30",
                  "--no-msaa", "--audio", "--decorated", "--headless", "--verbose"};
        REQUIRE(args.parse(config) == -1);
        REQUIRE(config.backgroundImage == "bg.png");
        REQUIRE(config.windowClass == "wallpaper");
        REQUIRE(config.pointCount == 250);
        REQUIRE(config.pointSize == 8.0f);
        REQUIRE(config.intensity == 0.25f);
        REQUIRE(config.windowWidth == 640);
        REQUIRE(config.windowHeight == 480);
        REQUIRE(config.expectedImageSize.width == 1920);
        REQUIRE(config.expectedImageSize.height == 1080);
        REQUIRE(config.renderMode == RenderMode::Points);
        REQUIRE(config.audioDevice == "Monitor of Speakers");
        REQUIRE(config.frames == 30);
        REQUIRE_FALSE(config.msaa);
        REQUIRE(config.audio);
        REQUIRE(config.decorated);
        REQUIRE(config.headless);
        REQUIRE(config.verbose);
    }

    SECTION("equals form") {
        Args args{"--count=42", "--background-image=wall.jpg"};
        REQUIRE(args.parse(config) == -1);
        REQUIRE(config.pointCount == 42);
        REQUIRE(config.backgroundImage == "wall.jpg");
    }

    SECTION("help exits with success") {
        Args args{"--help"};
        REQUIRE(args.parse(config) == 0);
    }

    SECTION("version exits with success") {
        Args args{"--version"};
        REQUIRE(args.parse(config) == 0);
    }

    SECTION("unknown flag fails") {
        Args args{"--sparkle"};
        REQUIRE(args.parse(config) > 0);
    }

    SECTION("bad render mode fails") {
        Args args{"--render-mode", "sprites"};
        REQUIRE(args.parse(config) > 0);
    }

    SECTION("bad window size fails") {
        Args args{"--window", "wide"};
        REQUIRE(args.parse(config) > 0);
    }

    SECTION("out-of-range intensity fails") {
        Args args{"--intensity", "2"};
        REQUIRE(args.parse(config) > 0);
    }

    SECTION("negative count fails") {
        Args args{"--count", "-1"};
        REQUIRE(args.parse(config) > 0);
    }

    SECTION("count above the storage limit fails") {
        Args args{"--count", std::to_string(MAX_POINT_COUNT + 1)};
        REQUIRE(args.parse(config) > 0);
    }

    SECTION("zero points fails") {
        Args args{"--count", "0"};
        REQUIRE(args.parse(config) > 0);
    }
}

TEST_CASE("Settings file with a negative count", "[config]") {
    fs::path path = writeSettings("dotscape_test_negative.json", R"({"pointCount": -1})");

    Config config;
    Args args{"--config", path.string()};
    REQUIRE(args.parse(config) > 0);
    REQUIRE(config.pointCount == 1000);

    fs::remove(path);
}

TEST_CASE("Settings file then flags", "[config]") {
    fs::path path = writeSettings("dotscape_test_settings.json",
        R"({"pointCount": 300, "pointSize": 2.0, "renderMode": "points"})");

    Config config;
    Args args{"--config", path.string(), "--point-size", "6"};
    REQUIRE(args.parse(config) == -1);

    // From the file
    REQUIRE(config.pointCount == 300);
    REQUIRE(config.renderMode == RenderMode::Points);
    // Flag overrides the file
    REQUIRE(config.pointSize == 6.0f);

    fs::remove(path);
}
