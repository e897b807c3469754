// Dotscape - Physics Step

#include <dotscape/physics_step.h>
#include <dotscape/binding_layout.h>
#include <dotscape/gpu_common.h>
#include <dotscape/pipeline_builder.h>
#include <dotscape/point_math.h>
#include <dotscape/shaders.h>
#include <iostream>

namespace dotscape {

PhysicsStep::~PhysicsStep() {
    cleanup();
}

bool PhysicsStep::init(WGPUDevice device, const PhysicsBindings& resources, uint32_t pointCount) {
    if (!resources.complete()) {
        std::cerr << "[Physics] Incomplete bindings" << std::endl;
        return false;
    }

    gpu::PipelineBuilder builder(device);
    builder.label("Physics Step")
           .shader(shaders::physics())
           .computeEntry("main")
           .bindings(bindings::PHYSICS);

    m_pipeline = builder.buildCompute();
    m_bindGroupLayout = builder.bindGroupLayout();
    if (!m_pipeline) {
        std::cerr << "[Physics] Failed to create compute pipeline" << std::endl;
        cleanup();
        return false;
    }

    m_bindGroup = createBindGroup(device, m_bindGroupLayout, resources.entries(), "Physics Bindings");
    if (!m_bindGroup) {
        std::cerr << "[Physics] Failed to create bind group" << std::endl;
        cleanup();
        return false;
    }

    m_workgroups = host::workgroupCount(pointCount);
    return true;
}

void PhysicsStep::cleanup() {
    gpu::release(m_bindGroup);
    gpu::release(m_bindGroupLayout);
    gpu::release(m_pipeline);
    m_workgroups = 0;
}

void PhysicsStep::encode(WGPUCommandEncoder encoder) const {
    if (!m_pipeline) return;

    WGPUComputePassDescriptor passDesc = {};
    passDesc.label = gpu::toStringView("Physics Pass");
    WGPUComputePassEncoder pass = wgpuCommandEncoderBeginComputePass(encoder, &passDesc);

    wgpuComputePassEncoderSetPipeline(pass, m_pipeline);
    wgpuComputePassEncoderSetBindGroup(pass, bindings::GROUP, m_bindGroup, 0, nullptr);
    wgpuComputePassEncoderDispatchWorkgroups(pass, m_workgroups, 1, 1);

    wgpuComputePassEncoderEnd(pass);
    wgpuComputePassEncoderRelease(pass);
}

} // namespace dotscape
