// Dotscape - GPU Common Utilities Implementation

#include <dotscape/gpu_common.h>
#include <unordered_map>

namespace dotscape::gpu {

WGPUBuffer createBuffer(WGPUDevice device, WGPUQueue queue, const char* label,
                        WGPUBufferUsage usage, uint64_t size, const void* data) {
    WGPUBufferDescriptor desc = {};
    desc.label = toStringView(label);
    desc.size = (size + 3) & ~uint64_t(3);
    desc.usage = usage | WGPUBufferUsage_CopyDst;
    WGPUBuffer buffer = wgpuDeviceCreateBuffer(device, &desc);

    if (buffer && data && size > 0) {
        wgpuQueueWriteBuffer(queue, buffer, 0, data, static_cast<size_t>(size));
    }
    return buffer;
}

// =============================================================================
// Sampler Cache
// =============================================================================

static std::unordered_map<WGPUDevice, WGPUSampler> s_repeatSamplers;

WGPUSampler getRepeatSampler(WGPUDevice device) {
    auto it = s_repeatSamplers.find(device);
    if (it != s_repeatSamplers.end()) {
        return it->second;
    }

    WGPUSamplerDescriptor desc = {};
    desc.label = toStringView("Background Sampler");
    desc.addressModeU = WGPUAddressMode_Repeat;
    desc.addressModeV = WGPUAddressMode_Repeat;
    desc.addressModeW = WGPUAddressMode_Repeat;
    desc.magFilter = WGPUFilterMode_Linear;
    desc.minFilter = WGPUFilterMode_Nearest;
    desc.mipmapFilter = WGPUMipmapFilterMode_Nearest;
    desc.lodMinClamp = 0.0f;
    desc.lodMaxClamp = 32.0f;
    desc.maxAnisotropy = 1;

    WGPUSampler sampler = wgpuDeviceCreateSampler(device, &desc);
    s_repeatSamplers[device] = sampler;
    return sampler;
}

void releaseSamplers(WGPUDevice device) {
    auto it = s_repeatSamplers.find(device);
    if (it != s_repeatSamplers.end()) {
        release(it->second);
        s_repeatSamplers.erase(it);
    }
}

} // namespace dotscape::gpu
