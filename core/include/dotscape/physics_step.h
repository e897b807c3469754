#pragma once

// Dotscape - Physics Step
// Compute pass that integrates every point and reflects it off the window edges

#include <dotscape/resource_bindings.h>
#include <webgpu/webgpu.h>
#include <cstdint>

namespace dotscape {

class PhysicsStep {
public:
    PhysicsStep() = default;
    ~PhysicsStep();

    PhysicsStep(const PhysicsStep&) = delete;
    PhysicsStep& operator=(const PhysicsStep&) = delete;

    bool init(WGPUDevice device, const PhysicsBindings& resources, uint32_t pointCount);
    void cleanup();

    /// Record one compute pass covering all points into `encoder`
    void encode(WGPUCommandEncoder encoder) const;

    /// ceil(pointCount / 64)
    uint32_t workgroupCount() const { return m_workgroups; }

    bool isInitialized() const { return m_pipeline != nullptr; }

private:
    WGPUComputePipeline m_pipeline = nullptr;
    WGPUBindGroupLayout m_bindGroupLayout = nullptr;
    WGPUBindGroup m_bindGroup = nullptr;
    uint32_t m_workgroups = 0;
};

} // namespace dotscape
