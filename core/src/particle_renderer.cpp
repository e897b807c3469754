// Dotscape - Particle Renderer Implementation
// Billboards are generated in the vertex shader from vertex_index, so no
// vertex or instance buffers are bound.

#include <dotscape/particle_renderer.h>
#include <dotscape/binding_layout.h>
#include <dotscape/gpu_common.h>
#include <dotscape/pipeline_builder.h>
#include <dotscape/point_math.h>
#include <dotscape/shaders.h>
#include <iostream>

namespace dotscape {

ParticleRenderer::~ParticleRenderer() {
    cleanup();
}

bool ParticleRenderer::init(WGPUDevice device, WGPUTextureFormat format, uint32_t sampleCount,
                            const ParticleBindings& resources, uint32_t pointCount,
                            RenderMode mode) {
    if (!resources.complete()) {
        std::cerr << "[Particles] Incomplete bindings" << std::endl;
        return false;
    }

    m_mode = mode;
    m_pointCount = pointCount;

    gpu::PipelineBuilder builder(device);
    builder.bindings(bindings::PARTICLES)
           .colorTargetWithBlend(format)
           .sampleCount(sampleCount);

    if (m_mode == RenderMode::Points) {
        builder.label("Point List")
               .shader(shaders::pointList())
               .topology(WGPUPrimitiveTopology_PointList);
    } else {
        builder.label("Particle Billboards")
               .shader(shaders::particles())
               .topology(WGPUPrimitiveTopology_TriangleStrip);
    }

    m_pipeline = builder.build();
    m_bindGroupLayout = builder.bindGroupLayout();
    if (!m_pipeline) {
        std::cerr << "[Particles] Failed to create render pipeline" << std::endl;
        cleanup();
        return false;
    }

    m_bindGroup = createBindGroup(device, m_bindGroupLayout, resources.entries(), "Particle Bindings");
    if (!m_bindGroup) {
        std::cerr << "[Particles] Failed to create bind group" << std::endl;
        cleanup();
        return false;
    }

    std::cout << "[Particles] Mode: " << renderModeName(m_mode)
              << ", " << sampleCount << "x MSAA" << std::endl;
    return true;
}

void ParticleRenderer::cleanup() {
    gpu::release(m_bindGroup);
    gpu::release(m_bindGroupLayout);
    gpu::release(m_pipeline);
}

void ParticleRenderer::encode(WGPURenderPassEncoder pass) const {
    if (!m_pipeline) return;

    wgpuRenderPassEncoderSetPipeline(pass, m_pipeline);
    wgpuRenderPassEncoderSetBindGroup(pass, bindings::GROUP, m_bindGroup, 0, nullptr);
    host::DrawCall draw = host::particleDraw(m_mode, m_pointCount);
    wgpuRenderPassEncoderDraw(pass, draw.vertexCount, draw.instanceCount, 0, 0);
}

} // namespace dotscape
