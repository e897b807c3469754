/**
 * @file test_surface.cpp
 * @brief Unit tests for surface format selection
 *
 * Uses only the WebGPU enums; no adapter or device is created.
 */

#include <catch2/catch_test_macros.hpp>

#include <dotscape/gpu_common.h>

#include <vector>

using namespace dotscape;

TEST_CASE("Surface format prefers sRGB", "[gpu]") {
    SECTION("sRGB listed after a linear format is chosen") {
        std::vector<WGPUTextureFormat> formats = {
            WGPUTextureFormat_BGRA8Unorm,
            WGPUTextureFormat_RGBA8Unorm,
            WGPUTextureFormat_BGRA8UnormSrgb
        };
        REQUIRE(gpu::chooseSurfaceFormat(formats.data(), formats.size()) ==
                WGPUTextureFormat_BGRA8UnormSrgb);
    }

    SECTION("first sRGB format wins") {
        std::vector<WGPUTextureFormat> formats = {
            WGPUTextureFormat_RGBA8UnormSrgb,
            WGPUTextureFormat_BGRA8UnormSrgb
        };
        REQUIRE(gpu::chooseSurfaceFormat(formats.data(), formats.size()) ==
                WGPUTextureFormat_RGBA8UnormSrgb);
    }

    SECTION("no sRGB format falls back to the first offered") {
        std::vector<WGPUTextureFormat> formats = {
            WGPUTextureFormat_RGBA8Unorm,
            WGPUTextureFormat_BGRA8Unorm
        };
        REQUIRE(gpu::chooseSurfaceFormat(formats.data(), formats.size()) ==
                WGPUTextureFormat_RGBA8Unorm);
    }

    SECTION("nothing offered") {
        REQUIRE(gpu::chooseSurfaceFormat(nullptr, 0) == WGPUTextureFormat_BGRA8Unorm);
    }
}

TEST_CASE("sRGB format classification", "[gpu]") {
    REQUIRE(gpu::isSrgbFormat(WGPUTextureFormat_BGRA8UnormSrgb));
    REQUIRE(gpu::isSrgbFormat(WGPUTextureFormat_RGBA8UnormSrgb));
    REQUIRE_FALSE(gpu::isSrgbFormat(WGPUTextureFormat_BGRA8Unorm));
    REQUIRE_FALSE(gpu::isSrgbFormat(WGPUTextureFormat_RGBA16Float));
}
