#pragma once

// Dotscape - Frame Uniforms
// Small uniform buffers shared by the compute and render programs

#include <dotscape/types.h>
#include <webgpu/webgpu.h>

namespace dotscape {

class FrameUniforms {
public:
    FrameUniforms() = default;
    ~FrameUniforms();

    FrameUniforms(const FrameUniforms&) = delete;
    FrameUniforms& operator=(const FrameUniforms&) = delete;

    bool init(WGPUDevice device, WGPUQueue queue, const WindowExtent& extent,
              const PointStyle& style);
    void cleanup();

    // Writes are queued and land before the next submitted pass
    void setExtent(const WindowExtent& extent);
    void setDeltaTime(float dt);
    void setPointSize(float size);
    void setIntensity(float intensity);
    void setWindowPos(const glm::vec2& pos);

    const WindowExtent& extent() const { return m_extent; }
    const FrameTiming& timing() const { return m_timing; }
    const PointStyle& style() const { return m_style; }
    const BackgroundView& view() const { return m_view; }

    WGPUBuffer windowSizeBuffer() const { return m_windowSize; }
    WGPUBuffer deltaTimeBuffer() const { return m_deltaTime; }
    WGPUBuffer pointSizeBuffer() const { return m_pointSize; }
    WGPUBuffer intensityBuffer() const { return m_intensity; }
    WGPUBuffer windowPosBuffer() const { return m_windowPos; }

private:
    WGPUQueue m_queue = nullptr;

    WindowExtent m_extent;
    FrameTiming m_timing;
    PointStyle m_style;
    BackgroundView m_view;

    WGPUBuffer m_windowSize = nullptr;
    WGPUBuffer m_deltaTime = nullptr;
    WGPUBuffer m_pointSize = nullptr;
    WGPUBuffer m_intensity = nullptr;
    WGPUBuffer m_windowPos = nullptr;
};

} // namespace dotscape
