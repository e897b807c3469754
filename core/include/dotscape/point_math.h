#pragma once

/**
 * @file point_math.h
 * @brief Host implementations of the per-point GPU math
 *
 * Every formula the WGSL programs evaluate has a CPU counterpart here. The
 * compute shader and these functions must agree bit-for-bit on the
 * integration and reflection policy; tests and the headless mode run on
 * these.
 */

#include <dotscape/types.h>
#include <cstdint>
#include <vector>

namespace dotscape::host {

/// Invocations per compute workgroup (`@workgroup_size(64)`)
constexpr uint32_t WORKGROUP_SIZE = 64;

/// Local radius where the billboard edge starts to fade
constexpr float FALLOFF_START = 0.75f;

/// Number of workgroups needed to cover `count` points, rounded up
uint32_t workgroupCount(uint32_t count);

/// Clamp a window size to at least 1x1 so NDC mapping never divides by zero
WindowExtent clampExtent(float width, float height);

// -----------------------------------------------------------------------------
// Physics
// -----------------------------------------------------------------------------

/**
 * @brief Advance one point by dt
 *
 * Integrates position, flips each velocity component independently when the
 * new position is outside that axis' bounds, then clamps the position into
 * [0, width] x [0, height].
 */
void stepPoint(Point& point, const WindowExtent& extent, float dt);

struct DispatchStats {
    uint32_t workgroups = 0;
    uint32_t invocations = 0;  ///< workgroups * WORKGROUP_SIZE
    uint32_t updated = 0;      ///< invocations that passed the index guard
    uint64_t reflections = 0;  ///< Velocity component sign flips
};

/**
 * @brief Run the compute dispatch on the CPU
 *
 * Walks every (workgroup, local index) pair the GPU would launch for `count`
 * points. Invocations at or past `count` return without touching `points`,
 * so entries beyond `count` in a larger buffer are left untouched.
 */
DispatchStats dispatchPhysics(std::vector<Point>& points, uint32_t count,
                              const WindowExtent& extent, float dt);

// -----------------------------------------------------------------------------
// Particle billboards
// -----------------------------------------------------------------------------

/// Position in pixels to normalized device coordinates (+y up)
glm::vec2 toNdc(const glm::vec2& world, const WindowExtent& extent);

/// Unit quad corner for triangle-strip vertex 0..3: (-1,-1) (1,-1) (-1,1) (1,1)
glm::vec2 billboardCorner(uint32_t vertexIndex);

/// NDC position of one billboard vertex
glm::vec2 billboardVertex(const Point& point, uint32_t vertexIndex,
                          float pointSize, const WindowExtent& extent);

/// Fragment opacity at local radius `len`. Zero at len >= 1.
float billboardAlpha(float len, float intensity);

struct DrawCall {
    uint32_t vertexCount = 0;
    uint32_t instanceCount = 0;
};

/**
 * @brief Draw parameters for `count` points
 *
 * Billboards draw a 4-vertex strip once per point, so the instance count is
 * exactly `count` (never the rounded-up dispatch size). The point list draws
 * one vertex per point in a single instance.
 */
DrawCall particleDraw(RenderMode mode, uint32_t count);

/// Full-window background quad: 4-vertex strip, one instance
DrawCall backgroundDraw();

// -----------------------------------------------------------------------------
// Background
// -----------------------------------------------------------------------------

/// Unit corner for background vertex 0..3: (0,0) (1,0) (0,1) (1,1)
glm::vec2 backgroundCorner(uint32_t vertexIndex);

/// Texture coordinate sampled at background vertex `vertexIndex`
glm::vec2 backgroundUv(uint32_t vertexIndex, const WindowExtent& extent,
                       const glm::vec2& windowPos, const ImageSize& image);

/// Monitor rectangle in virtual screen coordinates (top-left origin)
struct MonitorRect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    bool contains(int px, int py) const {
        return px >= x && px < x + width && py >= y && py < y + height;
    }
};

/// Index of the first work area containing (px, py), or -1
int findMonitor(const std::vector<MonitorRect>& workAreas, int px, int py);

/**
 * @brief Pan offset of a window on its monitor
 *
 * `monitor` is the monitor position with its video mode size. The result is
 * the window's bottom-left corner measured from the monitor's bottom-left,
 * which is the crop origin of the monitor-sized background.
 */
glm::vec2 backgroundPan(const MonitorRect& monitor, int windowX, int windowY,
                        int windowHeight);

// -----------------------------------------------------------------------------
// Headless simulation
// -----------------------------------------------------------------------------

struct SimulationStats {
    uint32_t frames = 0;
    uint64_t reflections = 0;  ///< Velocity component sign flips over all frames
    DispatchStats dispatch;    ///< Shape of one frame's dispatch
    glm::vec2 minPosition{0.0f};
    glm::vec2 maxPosition{0.0f};
};

/// Dispatch all points `frames` times at fixed `dt` and collect bounds statistics
SimulationStats simulate(std::vector<Point>& points, const WindowExtent& extent,
                         float dt, uint32_t frames);

} // namespace dotscape::host
