#pragma once

// Dotscape - Particle Renderer
// GPU-instanced soft circles read straight from the point store

#include <dotscape/config.h>
#include <dotscape/resource_bindings.h>
#include <webgpu/webgpu.h>
#include <cstdint>

namespace dotscape {

class ParticleRenderer {
public:
    ParticleRenderer() = default;
    ~ParticleRenderer();

    ParticleRenderer(const ParticleRenderer&) = delete;
    ParticleRenderer& operator=(const ParticleRenderer&) = delete;

    bool init(WGPUDevice device, WGPUTextureFormat format, uint32_t sampleCount,
              const ParticleBindings& resources, uint32_t pointCount,
              RenderMode mode = RenderMode::Billboards);
    void cleanup();

    /// Draw into an open render pass, alpha-blended over what is there
    void encode(WGPURenderPassEncoder pass) const;

    RenderMode mode() const { return m_mode; }
    bool isInitialized() const { return m_pipeline != nullptr; }

private:
    RenderMode m_mode = RenderMode::Billboards;
    uint32_t m_pointCount = 0;

    WGPURenderPipeline m_pipeline = nullptr;
    WGPUBindGroupLayout m_bindGroupLayout = nullptr;
    WGPUBindGroup m_bindGroup = nullptr;
};

} // namespace dotscape
