#pragma once

// Dotscape - GPU Context
// WebGPU instance, adapter, device, queue and window surface

#include <webgpu/webgpu.h>
#include <cstdint>
#include <string>

struct GLFWwindow;

namespace dotscape {

class GpuContext {
public:
    GpuContext() = default;
    ~GpuContext();

    GpuContext(const GpuContext&) = delete;
    GpuContext& operator=(const GpuContext&) = delete;

    /// Create everything up to a configured surface for `window`
    bool init(GLFWwindow* window, uint32_t width, uint32_t height);
    void cleanup();

    /// (Re)configure the surface swap chain for a new size
    void configureSurface(uint32_t width, uint32_t height);

    /// Process pending GPU work and callbacks without blocking
    void poll();

    WGPUInstance instance() const { return m_instance; }
    WGPUAdapter adapter() const { return m_adapter; }
    WGPUDevice device() const { return m_device; }
    WGPUQueue queue() const { return m_queue; }
    WGPUSurface surface() const { return m_surface; }
    WGPUTextureFormat surfaceFormat() const { return m_config.format; }

    const std::string& adapterName() const { return m_adapterName; }
    const std::string& lastError() const { return m_lastError; }

private:
    bool requestAdapter();
    bool requestDevice();
    void chooseSurfaceFormat();

    WGPUInstance m_instance = nullptr;
    WGPUAdapter m_adapter = nullptr;
    WGPUSurface m_surface = nullptr;
    WGPUDevice m_device = nullptr;
    WGPUQueue m_queue = nullptr;
    WGPUSurfaceConfiguration m_config = {};
    bool m_configured = false;

    std::string m_adapterName;
    std::string m_lastError;
};

} // namespace dotscape
