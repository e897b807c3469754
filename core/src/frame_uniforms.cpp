// Dotscape - Frame Uniforms

#include <dotscape/frame_uniforms.h>
#include <dotscape/binding_layout.h>
#include <dotscape/gpu_common.h>
#include <iostream>

namespace dotscape {

FrameUniforms::~FrameUniforms() {
    cleanup();
}

bool FrameUniforms::init(WGPUDevice device, WGPUQueue queue, const WindowExtent& extent,
                         const PointStyle& style) {
    m_queue = queue;
    m_extent = extent;
    m_style = style;
    m_timing.deltaTime = 0.016f;

    auto usage = WGPUBufferUsage_Uniform;
    m_windowSize = gpu::createBuffer(device, queue, "Window Size", usage,
                                     bindings::VEC2_SIZE, &m_extent);
    m_deltaTime = gpu::createBuffer(device, queue, "Delta Time", usage,
                                    bindings::SCALAR_SIZE, &m_timing.deltaTime);
    m_pointSize = gpu::createBuffer(device, queue, "Point Size", usage,
                                    bindings::SCALAR_SIZE, &m_style.pointSize);
    m_intensity = gpu::createBuffer(device, queue, "Intensity", usage,
                                    bindings::SCALAR_SIZE, &m_style.intensity);
    m_windowPos = gpu::createBuffer(device, queue, "Window Position", usage,
                                    bindings::VEC2_SIZE, &m_view.windowPos);

    if (!m_windowSize || !m_deltaTime || !m_pointSize || !m_intensity || !m_windowPos) {
        std::cerr << "[FrameUniforms] Failed to create uniform buffers" << std::endl;
        cleanup();
        return false;
    }
    return true;
}

void FrameUniforms::cleanup() {
    gpu::release(m_windowSize);
    gpu::release(m_deltaTime);
    gpu::release(m_pointSize);
    gpu::release(m_intensity);
    gpu::release(m_windowPos);
    m_queue = nullptr;
}

void FrameUniforms::setExtent(const WindowExtent& extent) {
    m_extent = extent;
    wgpuQueueWriteBuffer(m_queue, m_windowSize, 0, &m_extent, sizeof(WindowExtent));
}

void FrameUniforms::setDeltaTime(float dt) {
    m_timing.deltaTime = dt;
    wgpuQueueWriteBuffer(m_queue, m_deltaTime, 0, &m_timing.deltaTime, sizeof(float));
}

void FrameUniforms::setPointSize(float size) {
    if (size == m_style.pointSize) return;
    m_style.pointSize = size;
    wgpuQueueWriteBuffer(m_queue, m_pointSize, 0, &m_style.pointSize, sizeof(float));
}

void FrameUniforms::setIntensity(float intensity) {
    if (intensity == m_style.intensity) return;
    m_style.intensity = intensity;
    wgpuQueueWriteBuffer(m_queue, m_intensity, 0, &m_style.intensity, sizeof(float));
}

void FrameUniforms::setWindowPos(const glm::vec2& pos) {
    if (pos == m_view.windowPos) return;
    m_view.windowPos = pos;
    wgpuQueueWriteBuffer(m_queue, m_windowPos, 0, &m_view.windowPos, sizeof(glm::vec2));
}

} // namespace dotscape
