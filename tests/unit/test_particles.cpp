/**
 * @file test_particles.cpp
 * @brief Unit tests for billboard geometry, draw parameters and edge falloff
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <dotscape/point_math.h>

using namespace dotscape;
using namespace dotscape::host;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

// =============================================================================
// Device Coordinates
// =============================================================================

TEST_CASE("Pixel to NDC mapping flips y", "[render]") {
    WindowExtent extent{800.0f, 600.0f};

    SECTION("top-left corner") {
        glm::vec2 ndc = toNdc(glm::vec2(0.0f, 0.0f), extent);
        REQUIRE(ndc.x == -1.0f);
        REQUIRE(ndc.y == 1.0f);
    }

    SECTION("bottom-right corner") {
        glm::vec2 ndc = toNdc(glm::vec2(800.0f, 600.0f), extent);
        REQUIRE(ndc.x == 1.0f);
        REQUIRE(ndc.y == -1.0f);
    }

    SECTION("center") {
        glm::vec2 ndc = toNdc(glm::vec2(400.0f, 300.0f), extent);
        REQUIRE_THAT(ndc.x, WithinAbs(0.0f, 1e-6f));
        REQUIRE_THAT(ndc.y, WithinAbs(0.0f, 1e-6f));
    }

    SECTION("moving down in pixels moves down in NDC") {
        glm::vec2 upper = toNdc(glm::vec2(100.0f, 100.0f), extent);
        glm::vec2 lower = toNdc(glm::vec2(100.0f, 200.0f), extent);
        REQUIRE(lower.y < upper.y);
    }
}

// =============================================================================
// Billboard Quad
// =============================================================================

TEST_CASE("Billboard corners form a triangle strip", "[render]") {
    REQUIRE(billboardCorner(0) == glm::vec2(-1.0f, -1.0f));
    REQUIRE(billboardCorner(1) == glm::vec2(1.0f, -1.0f));
    REQUIRE(billboardCorner(2) == glm::vec2(-1.0f, 1.0f));
    REQUIRE(billboardCorner(3) == glm::vec2(1.0f, 1.0f));
}

TEST_CASE("Billboard spans pointSize pixels", "[render]") {
    WindowExtent extent{100.0f, 100.0f};
    Point p;
    p.position = glm::vec2(50.0f, 50.0f);
    p.velocity = glm::vec2(0.0f);

    glm::vec2 v0 = billboardVertex(p, 0, 10.0f, extent);
    glm::vec2 v3 = billboardVertex(p, 3, 10.0f, extent);

    // 10 px on a 100 px window is 0.2 in NDC
    REQUIRE_THAT(v3.x - v0.x, WithinRel(0.2f, 1e-5f));
    REQUIRE_THAT(v0.y - v3.y, WithinRel(0.2f, 1e-5f));
    REQUIRE_THAT((v0.x + v3.x) * 0.5f, WithinAbs(0.0f, 1e-6f));
}

// =============================================================================
// Draw Parameters
// =============================================================================

TEST_CASE("One billboard instance per point", "[render]") {
    for (uint32_t count : {1u, 64u, 65u, 1000u}) {
        DrawCall draw = particleDraw(RenderMode::Billboards, count);
        REQUIRE(draw.vertexCount == 4);
        REQUIRE(draw.instanceCount == count);
        // Not the rounded-up dispatch size
        if (count % WORKGROUP_SIZE != 0) {
            REQUIRE(draw.instanceCount < workgroupCount(count) * WORKGROUP_SIZE);
        }
    }
}

TEST_CASE("Point list draws one vertex per point", "[render]") {
    for (uint32_t count : {1u, 64u, 65u, 1000u}) {
        DrawCall draw = particleDraw(RenderMode::Points, count);
        REQUIRE(draw.vertexCount == count);
        REQUIRE(draw.instanceCount == 1);
    }
}

// =============================================================================
// Falloff
// =============================================================================

TEST_CASE("Billboard opacity falloff", "[render]") {
    const float intensity = 0.8f;

    SECTION("center is full intensity") {
        REQUIRE(billboardAlpha(0.0f, intensity) == intensity);
    }

    SECTION("inside the falloff radius is full intensity") {
        REQUIRE(billboardAlpha(0.5f, intensity) == intensity);
        REQUIRE(billboardAlpha(FALLOFF_START, intensity) == intensity);
    }

    SECTION("boundary and beyond are transparent") {
        REQUIRE(billboardAlpha(1.0f, intensity) == 0.0f);
        REQUIRE(billboardAlpha(1.5f, intensity) == 0.0f);
    }

    SECTION("decays inside the falloff band") {
        REQUIRE_THAT(billboardAlpha(0.875f, intensity), WithinRel(0.875f * intensity, 1e-5f));
    }

    SECTION("non-increasing from 0.75 to 1") {
        float previous = billboardAlpha(FALLOFF_START, intensity);
        for (int i = 1; i <= 100; ++i) {
            float len = FALLOFF_START + 0.25f * static_cast<float>(i) / 100.0f;
            float alpha = billboardAlpha(len, intensity);
            REQUIRE(alpha <= previous);
            previous = alpha;
        }
    }

    SECTION("zero intensity is invisible everywhere") {
        REQUIRE(billboardAlpha(0.0f, 0.0f) == 0.0f);
        REQUIRE(billboardAlpha(0.9f, 0.0f) == 0.0f);
    }
}
