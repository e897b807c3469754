#pragma once

// Dotscape - Core Types
// Data layouts shared between the host and the WGSL programs

#include <glm/glm.hpp>
#include <cstdint>

namespace dotscape {

/// One simulated particle. Layout matches `struct Point` in the WGSL programs
/// (two vec2f, 16-byte array stride).
struct Point {
    glm::vec2 position;  ///< Pixels, origin top-left
    glm::vec2 velocity;  ///< Pixels per second
};

static_assert(sizeof(Point) == 16, "Point must match the WGSL array<Point> stride");

/// Drawable size in pixels. Both components are kept > 0 (see host::clampExtent).
struct WindowExtent {
    float width = 1.0f;
    float height = 1.0f;

    bool operator==(const WindowExtent& o) const { return width == o.width && height == o.height; }
    bool operator!=(const WindowExtent& o) const { return !(*this == o); }
};

static_assert(sizeof(WindowExtent) == 8, "WindowExtent is bound as a vec2f uniform");

/// Seconds since the previous frame
struct FrameTiming {
    float deltaTime = 0.0f;
};

/// Billboard diameter (pixels) and peak opacity
struct PointStyle {
    float pointSize = 5.0f;
    float intensity = 0.8f;
};

/// Pan offset into the background image, in image pixels
struct BackgroundView {
    glm::vec2 windowPos{0.0f, 0.0f};
};

static_assert(sizeof(BackgroundView) == 8, "windowPos is bound as a vec2f uniform");

enum class RenderMode {
    Billboards,  ///< Instanced soft circles
    Points       ///< Legacy single-pixel point list
};

/// Pixel dimensions of the background asset
struct ImageSize {
    uint32_t width = 0;
    uint32_t height = 0;

    bool empty() const { return width == 0 || height == 0; }
};

} // namespace dotscape
