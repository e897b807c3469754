// Dotscape - GPU Context

#include <dotscape/gpu_context.h>
#include <dotscape/gpu_common.h>
#include <webgpu/wgpu.h>  // wgpu-native extensions (wgpuDevicePoll)
#include <glfw3webgpu.h>
#include <GLFW/glfw3.h>
#include <iostream>

namespace dotscape {

// -----------------------------------------------------------------------------
// WebGPU Callbacks
// -----------------------------------------------------------------------------

namespace {

struct AdapterUserData {
    WGPUAdapter adapter = nullptr;
    std::string message;
    bool done = false;
};

void onAdapterRequestEnded(WGPURequestAdapterStatus status, WGPUAdapter adapter,
                           WGPUStringView message, void* userdata1, void* userdata2) {
    (void)userdata2;
    auto* data = static_cast<AdapterUserData*>(userdata1);
    if (status == WGPURequestAdapterStatus_Success) {
        data->adapter = adapter;
    } else {
        data->message = message.data ? gpu::toString(message) : "unknown error";
    }
    data->done = true;
}

struct DeviceUserData {
    WGPUDevice device = nullptr;
    std::string message;
    bool done = false;
};

void onDeviceRequestEnded(WGPURequestDeviceStatus status, WGPUDevice device,
                          WGPUStringView message, void* userdata1, void* userdata2) {
    (void)userdata2;
    auto* data = static_cast<DeviceUserData*>(userdata1);
    if (status == WGPURequestDeviceStatus_Success) {
        data->device = device;
    } else {
        data->message = message.data ? gpu::toString(message) : "unknown error";
    }
    data->done = true;
}

void onDeviceLost(WGPUDevice const* device, WGPUDeviceLostReason reason,
                  WGPUStringView message, void* userdata1, void* userdata2) {
    (void)device; (void)userdata1; (void)userdata2;
    if (reason == WGPUDeviceLostReason_Destroyed) return;
    std::cerr << "[GpuContext] Device lost: "
              << (message.data ? gpu::toString(message) : "unknown") << std::endl;
}

void onDeviceError(WGPUDevice const* device, WGPUErrorType type,
                   WGPUStringView message, void* userdata1, void* userdata2) {
    (void)device; (void)type; (void)userdata1; (void)userdata2;
    std::cerr << "[GpuContext] WebGPU error: "
              << (message.data ? gpu::toString(message) : "unknown") << std::endl;
}

const char* backendName(WGPUBackendType type) {
    switch (type) {
        case WGPUBackendType_Metal: return "Metal";
        case WGPUBackendType_Vulkan: return "Vulkan";
        case WGPUBackendType_D3D12: return "D3D12";
        case WGPUBackendType_D3D11: return "D3D11";
        case WGPUBackendType_OpenGL: return "OpenGL";
        default: return "Other";
    }
}

} // namespace

// -----------------------------------------------------------------------------
// GpuContext
// -----------------------------------------------------------------------------

GpuContext::~GpuContext() {
    cleanup();
}

bool GpuContext::init(GLFWwindow* window, uint32_t width, uint32_t height) {
    WGPUInstanceDescriptor instanceDesc = {};
    m_instance = wgpuCreateInstance(&instanceDesc);
    if (!m_instance) {
        m_lastError = "Failed to create WebGPU instance";
        return false;
    }

    m_surface = glfwCreateWindowWGPUSurface(m_instance, window);
    if (!m_surface) {
        m_lastError = "Failed to create surface";
        cleanup();
        return false;
    }

    if (!requestAdapter() || !requestDevice()) {
        cleanup();
        return false;
    }

    m_queue = wgpuDeviceGetQueue(m_device);

    chooseSurfaceFormat();
    configureSurface(width, height);

    std::cout << "[GpuContext] WebGPU initialized (surface format " << m_config.format
              << ", " << width << "x" << height << ")" << std::endl;
    return true;
}

bool GpuContext::requestAdapter() {
    WGPURequestAdapterOptions adapterOpts = {};
    adapterOpts.compatibleSurface = m_surface;
    adapterOpts.powerPreference = WGPUPowerPreference_HighPerformance;

    AdapterUserData adapterData;
    WGPURequestAdapterCallbackInfo adapterCallback = {};
    adapterCallback.mode = WGPUCallbackMode_AllowSpontaneous;
    adapterCallback.callback = onAdapterRequestEnded;
    adapterCallback.userdata1 = &adapterData;

    wgpuInstanceRequestAdapter(m_instance, &adapterOpts, adapterCallback);

    // wgpu-native answers synchronously with AllowSpontaneous
    while (!adapterData.done) {
        wgpuInstanceProcessEvents(m_instance);
    }

    if (!adapterData.adapter) {
        m_lastError = "Failed to get adapter: " + adapterData.message;
        return false;
    }
    m_adapter = adapterData.adapter;

    WGPUAdapterInfo info = {};
    wgpuAdapterGetInfo(m_adapter, &info);
    m_adapterName = (info.device.data && info.device.length > 0) ? gpu::toString(info.device) : "unknown";
    std::cout << "[GpuContext] Adapter: " << m_adapterName
              << " (" << backendName(info.backendType) << ")" << std::endl;
    wgpuAdapterInfoFreeMembers(info);
    return true;
}

bool GpuContext::requestDevice() {
    WGPUDeviceDescriptor deviceDesc = {};
    deviceDesc.label = gpu::toStringView("Dotscape Device");
    deviceDesc.deviceLostCallbackInfo.mode = WGPUCallbackMode_AllowSpontaneous;
    deviceDesc.deviceLostCallbackInfo.callback = onDeviceLost;
    deviceDesc.uncapturedErrorCallbackInfo.callback = onDeviceError;

    DeviceUserData deviceData;
    WGPURequestDeviceCallbackInfo deviceCallback = {};
    deviceCallback.mode = WGPUCallbackMode_AllowSpontaneous;
    deviceCallback.callback = onDeviceRequestEnded;
    deviceCallback.userdata1 = &deviceData;

    wgpuAdapterRequestDevice(m_adapter, &deviceDesc, deviceCallback);

    while (!deviceData.done) {
        wgpuInstanceProcessEvents(m_instance);
    }

    if (!deviceData.device) {
        m_lastError = "Failed to get device: " + deviceData.message;
        return false;
    }
    m_device = deviceData.device;
    return true;
}

void GpuContext::chooseSurfaceFormat() {
    WGPUSurfaceCapabilities capabilities = {};
    wgpuSurfaceGetCapabilities(m_surface, m_adapter, &capabilities);

    m_config = {};
    m_config.device = m_device;
    m_config.format = gpu::chooseSurfaceFormat(capabilities.formats, capabilities.formatCount);
    m_config.presentMode = WGPUPresentMode_Fifo;
    m_config.alphaMode = WGPUCompositeAlphaMode_Auto;
    m_config.usage = WGPUTextureUsage_RenderAttachment;

    wgpuSurfaceCapabilitiesFreeMembers(capabilities);
}

void GpuContext::configureSurface(uint32_t width, uint32_t height) {
    m_config.width = width;
    m_config.height = height;
    wgpuSurfaceConfigure(m_surface, &m_config);
    m_configured = true;
}

void GpuContext::poll() {
    wgpuDevicePoll(m_device, false, nullptr);
}

void GpuContext::cleanup() {
    if (m_configured && m_surface) {
        wgpuSurfaceUnconfigure(m_surface);
        m_configured = false;
    }
    if (m_device) {
        gpu::releaseSamplers(m_device);
    }
    if (m_queue) { wgpuQueueRelease(m_queue); m_queue = nullptr; }
    if (m_device) { wgpuDeviceRelease(m_device); m_device = nullptr; }
    if (m_adapter) { wgpuAdapterRelease(m_adapter); m_adapter = nullptr; }
    if (m_surface) { wgpuSurfaceRelease(m_surface); m_surface = nullptr; }
    if (m_instance) { wgpuInstanceRelease(m_instance); m_instance = nullptr; }
}

} // namespace dotscape
