#pragma once

// Dotscape - Resource Bindings
// The concrete GPU resources bound to each program's group 0.
// Slot order follows the tables in binding_layout.h.

#include <webgpu/webgpu.h>
#include <vector>

namespace dotscape {

struct PhysicsBindings {
    WGPUBuffer points = nullptr;   ///< read_write storage
    uint64_t pointsSize = 0;       ///< N * sizeof(Point)
    WGPUBuffer windowSize = nullptr;
    WGPUBuffer deltaTime = nullptr;

    bool complete() const { return points && pointsSize && windowSize && deltaTime; }
    std::vector<WGPUBindGroupEntry> entries() const;
};

struct ParticleBindings {
    WGPUBuffer points = nullptr;   ///< read-only storage, same buffer as PhysicsBindings
    uint64_t pointsSize = 0;
    WGPUBuffer windowSize = nullptr;
    WGPUBuffer pointSize = nullptr;
    WGPUBuffer intensity = nullptr;

    bool complete() const { return points && pointsSize && windowSize && pointSize && intensity; }
    std::vector<WGPUBindGroupEntry> entries() const;
};

struct BackgroundBindings {
    WGPUTextureView texture = nullptr;
    WGPUSampler sampler = nullptr;
    WGPUBuffer windowSize = nullptr;
    WGPUBuffer windowPos = nullptr;

    bool complete() const { return texture && sampler && windowSize && windowPos; }
    std::vector<WGPUBindGroupEntry> entries() const;
};

/// Create a bind group for `layout` from descriptor entries
WGPUBindGroup createBindGroup(WGPUDevice device, WGPUBindGroupLayout layout,
                              const std::vector<WGPUBindGroupEntry>& entries,
                              const char* label);

} // namespace dotscape
