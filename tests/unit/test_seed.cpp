/**
 * @file test_seed.cpp
 * @brief Unit tests for initial point placement and asset path lookup
 */

#include <catch2/catch_test_macros.hpp>

#include <dotscape/io/image_loader.h>
#include <dotscape/point_seeder.h>

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace dotscape;
namespace fs = std::filesystem;

// =============================================================================
// Point Seeder
// =============================================================================

TEST_CASE("Seeded points lie inside the extent", "[seed]") {
    PointSeeder seeder(42);
    WindowExtent extent{800.0f, 600.0f};
    std::vector<Point> points = seeder.generate(1000, extent);

    REQUIRE(points.size() == 1000);
    for (const auto& p : points) {
        REQUIRE(p.position.x >= 0.0f);
        REQUIRE(p.position.x < 800.0f);
        REQUIRE(p.position.y >= 0.0f);
        REQUIRE(p.position.y < 600.0f);
        REQUIRE(p.position.x == std::floor(p.position.x));
        REQUIRE(p.position.y == std::floor(p.position.y));
    }
}

TEST_CASE("Seeded speeds stay in range with both signs", "[seed]") {
    PointSeeder seeder(42);
    std::vector<Point> points = seeder.generate(1000, WindowExtent{800.0f, 600.0f});

    bool sawNegative = false;
    bool sawPositive = false;
    for (const auto& p : points) {
        for (float v : {p.velocity.x, p.velocity.y}) {
            REQUIRE(std::fabs(v) >= PointSeeder::MIN_SPEED);
            REQUIRE(std::fabs(v) < PointSeeder::MAX_SPEED);
            sawNegative = sawNegative || v < 0.0f;
            sawPositive = sawPositive || v > 0.0f;
        }
    }
    REQUIRE(sawNegative);
    REQUIRE(sawPositive);
}

TEST_CASE("Same seed gives the same points", "[seed]") {
    WindowExtent extent{320.0f, 240.0f};
    std::vector<Point> a = PointSeeder(7).generate(64, extent);
    std::vector<Point> b = PointSeeder(7).generate(64, extent);

    for (size_t i = 0; i < a.size(); ++i) {
        REQUIRE(a[i].position == b[i].position);
        REQUIRE(a[i].velocity == b[i].velocity);
    }
}

TEST_CASE("Tiny extent collapses positions to the origin", "[seed]") {
    PointSeeder seeder(3);
    std::vector<Point> points = seeder.generate(10, WindowExtent{1.0f, 1.0f});
    for (const auto& p : points) {
        REQUIRE(p.position == glm::vec2(0.0f, 0.0f));
    }
}

TEST_CASE("Zero count gives no points", "[seed]") {
    PointSeeder seeder(3);
    REQUIRE(seeder.generate(0, WindowExtent{100.0f, 100.0f}).empty());
}

// =============================================================================
// Background Asset Lookup
// =============================================================================

TEST_CASE("Background image lookup", "[background]") {
    SECTION("missing file gives invalid image") {
        io::ImageData image = io::loadImage("/nonexistent/wallpaper.png");
        REQUIRE_FALSE(image.valid());
    }

    SECTION("empty path resolves to nothing") {
        REQUIRE(io::resolvePath("").empty());
    }

    SECTION("undecodable file gives invalid image") {
        fs::path path = fs::temp_directory_path() / "dotscape_test_not_an_image.png";
        {
            std::ofstream out(path);
            out << "definitely not a png";
        }
        REQUIRE(io::resolvePath(path.string()) == path.string());
        REQUIRE_FALSE(io::loadImage(path.string()).valid());
        fs::remove(path);
    }

    SECTION("relative paths are found in search directories") {
        fs::path dir = fs::temp_directory_path() / "dotscape_test_assets";
        fs::create_directories(dir);
        fs::path file = dir / "bg.png";
        {
            std::ofstream out(file);
            out << "x";
        }
        std::string resolved = io::resolvePath("bg.png", {dir.string()});
        REQUIRE(fs::equivalent(resolved, file));
        fs::remove_all(dir);
    }
}

// =============================================================================
// Fill To Monitor
// =============================================================================

namespace {

io::ImageData solidImage(int width, int height, uint8_t r, uint8_t g, uint8_t b) {
    io::ImageData image;
    image.width = width;
    image.height = height;
    image.channels = 4;
    for (int i = 0; i < width * height; ++i) {
        image.pixels.insert(image.pixels.end(), {r, g, b, 255});
    }
    return image;
}

} // namespace

TEST_CASE("Fill dimensions cover the target", "[background]") {
    SECTION("same aspect scales exactly") {
        ImageSize size = io::fillDimensions(3840, 2160, ImageSize{1920, 1080});
        REQUIRE(size.width == 1920);
        REQUIRE(size.height == 1080);
    }

    SECTION("square image is scaled by the wider ratio") {
        ImageSize size = io::fillDimensions(1000, 1000, ImageSize{1920, 1080});
        REQUIRE(size.width == 1920);
        REQUIRE(size.height == 1920);
    }

    SECTION("tall target scales by the height ratio") {
        ImageSize size = io::fillDimensions(1920, 1080, ImageSize{1080, 1920});
        REQUIRE(size.width == 3413);
        REQUIRE(size.height == 1920);
    }

    SECTION("sides never collapse to zero") {
        ImageSize size = io::fillDimensions(10000, 1, ImageSize{1, 1});
        REQUIRE(size.width == 10000);
        REQUIRE(size.height == 1);
    }

    SECTION("empty target or image gives an empty size") {
        REQUIRE(io::fillDimensions(100, 100, ImageSize{}).empty());
        REQUIRE(io::fillDimensions(0, 100, ImageSize{10, 10}).empty());
    }
}

TEST_CASE("Resize to fill the monitor", "[background]") {
    SECTION("output is exactly the target size") {
        io::ImageData image = solidImage(4, 2, 200, 100, 50);
        io::ImageData filled = io::resizeToFill(image, ImageSize{6, 6});
        REQUIRE(filled.valid());
        REQUIRE(filled.width == 6);
        REQUIRE(filled.height == 6);
        REQUIRE(filled.pixels.size() == 6u * 6u * 4u);

        // Solid colour survives the filter
        for (size_t i = 0; i < filled.pixels.size(); i += 4) {
            REQUIRE(std::abs(filled.pixels[i] - 200) <= 1);
            REQUIRE(std::abs(filled.pixels[i + 1] - 100) <= 1);
            REQUIRE(std::abs(filled.pixels[i + 2] - 50) <= 1);
            REQUIRE(filled.pixels[i + 3] == 255);
        }
    }

    SECTION("wide image is cropped around its centre") {
        // Left half black, right half white
        io::ImageData image = solidImage(8, 2, 0, 0, 0);
        for (int y = 0; y < 2; ++y) {
            for (int x = 4; x < 8; ++x) {
                size_t i = (static_cast<size_t>(y) * 8 + x) * 4;
                image.pixels[i] = image.pixels[i + 1] = image.pixels[i + 2] = 255;
            }
        }

        io::ImageData filled = io::resizeToFill(image, ImageSize{4, 2});
        REQUIRE(filled.width == 4);
        REQUIRE(filled.height == 2);
        REQUIRE(filled.pixels[0] < 128);
        REQUIRE(filled.pixels[3 * 4] > 128);
    }

    SECTION("image already at the target size is unchanged") {
        io::ImageData image = solidImage(3, 3, 1, 2, 3);
        io::ImageData filled = io::resizeToFill(image, ImageSize{3, 3});
        REQUIRE(filled.pixels == image.pixels);
    }

    SECTION("invalid input gives an invalid image") {
        REQUIRE_FALSE(io::resizeToFill(io::ImageData{}, ImageSize{4, 4}).valid());
        REQUIRE_FALSE(io::resizeToFill(solidImage(2, 2, 0, 0, 0), ImageSize{}).valid());
    }
}
