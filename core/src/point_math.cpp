// Dotscape - Host Point Math Implementation

#include <dotscape/point_math.h>
#include <algorithm>
#include <limits>

namespace dotscape::host {

uint32_t workgroupCount(uint32_t count) {
    return (count + WORKGROUP_SIZE - 1) / WORKGROUP_SIZE;
}

WindowExtent clampExtent(float width, float height) {
    WindowExtent extent;
    extent.width = std::max(width, 1.0f);
    extent.height = std::max(height, 1.0f);
    return extent;
}

void stepPoint(Point& point, const WindowExtent& extent, float dt) {
    point.position += point.velocity * dt;

    if (point.position.x < 0.0f || point.position.x > extent.width) {
        point.velocity.x = -point.velocity.x;
    }
    if (point.position.y < 0.0f || point.position.y > extent.height) {
        point.velocity.y = -point.velocity.y;
    }

    // Clamp after the flip so large steps cannot tunnel out of the window
    point.position.x = std::clamp(point.position.x, 0.0f, extent.width);
    point.position.y = std::clamp(point.position.y, 0.0f, extent.height);
}

DispatchStats dispatchPhysics(std::vector<Point>& points, uint32_t count,
                              const WindowExtent& extent, float dt) {
    DispatchStats stats;
    stats.workgroups = workgroupCount(count);

    for (uint32_t group = 0; group < stats.workgroups; ++group) {
        for (uint32_t local = 0; local < WORKGROUP_SIZE; ++local) {
            ++stats.invocations;
            uint32_t idx = group * WORKGROUP_SIZE + local;
            if (idx >= count || idx >= points.size()) {
                continue;
            }
            glm::vec2 before = points[idx].velocity;
            stepPoint(points[idx], extent, dt);
            if (points[idx].velocity.x != before.x) ++stats.reflections;
            if (points[idx].velocity.y != before.y) ++stats.reflections;
            ++stats.updated;
        }
    }
    return stats;
}

glm::vec2 toNdc(const glm::vec2& world, const WindowExtent& extent) {
    return glm::vec2(world.x / extent.width * 2.0f - 1.0f,
                     1.0f - world.y / extent.height * 2.0f);
}

glm::vec2 billboardCorner(uint32_t vertexIndex) {
    return glm::vec2((vertexIndex & 1u) ? 1.0f : -1.0f,
                     (vertexIndex & 2u) ? 1.0f : -1.0f);
}

glm::vec2 billboardVertex(const Point& point, uint32_t vertexIndex,
                          float pointSize, const WindowExtent& extent) {
    glm::vec2 world = point.position + billboardCorner(vertexIndex) * (pointSize * 0.5f);
    return toNdc(world, extent);
}

float billboardAlpha(float len, float intensity) {
    if (len >= 1.0f) {
        return 0.0f;
    }
    return std::min(intensity, (1.0f - (len - FALLOFF_START)) * intensity);
}

DrawCall particleDraw(RenderMode mode, uint32_t count) {
    DrawCall draw;
    if (mode == RenderMode::Points) {
        draw.vertexCount = count;
        draw.instanceCount = 1;
    } else {
        draw.vertexCount = 4;
        draw.instanceCount = count;
    }
    return draw;
}

DrawCall backgroundDraw() {
    DrawCall draw;
    draw.vertexCount = 4;
    draw.instanceCount = 1;
    return draw;
}

glm::vec2 backgroundCorner(uint32_t vertexIndex) {
    return glm::vec2(static_cast<float>(vertexIndex & 1u),
                     static_cast<float>(vertexIndex >> 1u));
}

glm::vec2 backgroundUv(uint32_t vertexIndex, const WindowExtent& extent,
                       const glm::vec2& windowPos, const ImageSize& image) {
    glm::vec2 corner = backgroundCorner(vertexIndex);
    glm::vec2 size(static_cast<float>(image.width), static_cast<float>(image.height));
    glm::vec2 uv = (corner * glm::vec2(extent.width, extent.height) + windowPos) / size;
    uv.y = 1.0f - uv.y;
    return uv;
}

int findMonitor(const std::vector<MonitorRect>& workAreas, int px, int py) {
    for (size_t i = 0; i < workAreas.size(); ++i) {
        if (workAreas[i].contains(px, py)) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

glm::vec2 backgroundPan(const MonitorRect& monitor, int windowX, int windowY,
                        int windowHeight) {
    float x = static_cast<float>(windowX - monitor.x);
    float y = static_cast<float>(monitor.height - (windowHeight + (windowY - monitor.y)));
    return glm::vec2(x, y);
}

SimulationStats simulate(std::vector<Point>& points, const WindowExtent& extent,
                         float dt, uint32_t frames) {
    SimulationStats stats;
    uint32_t count = static_cast<uint32_t>(points.size());

    for (uint32_t frame = 0; frame < frames; ++frame) {
        stats.dispatch = dispatchPhysics(points, count, extent, dt);
        stats.reflections += stats.dispatch.reflections;
        ++stats.frames;
    }

    if (points.empty()) {
        return stats;
    }

    stats.minPosition = glm::vec2(std::numeric_limits<float>::max());
    stats.maxPosition = glm::vec2(std::numeric_limits<float>::lowest());
    for (const auto& p : points) {
        stats.minPosition = glm::min(stats.minPosition, p.position);
        stats.maxPosition = glm::max(stats.maxPosition, p.position);
    }
    return stats;
}

} // namespace dotscape::host
