#pragma once

/**
 * @file gpu_common.h
 * @brief Common WebGPU helpers
 *
 * - String view conversion in both directions
 * - Buffer creation shorthand
 * - Cached samplers
 * - Safe release helpers for GPU resources
 */

#include <webgpu/webgpu.h>
#include <cstring>
#include <string>

namespace dotscape::gpu {

// =============================================================================
// String Helpers
// =============================================================================

/**
 * @brief Convert C string to WebGPU string view
 */
inline WGPUStringView toStringView(const char* str) {
    WGPUStringView view;
    view.data = str;
    view.length = std::strlen(str);
    return view;
}

/**
 * @brief Copy a WebGPU string view (possibly null-terminated) into a std::string
 */
inline std::string toString(WGPUStringView view) {
    if (!view.data) {
        return "";
    }
    size_t len = view.length == WGPU_STRLEN ? std::strlen(view.data) : view.length;
    return std::string(view.data, len);
}

// =============================================================================
// Surface Format
// =============================================================================

inline bool isSrgbFormat(WGPUTextureFormat format) {
    switch (format) {
        case WGPUTextureFormat_BGRA8UnormSrgb:
        case WGPUTextureFormat_RGBA8UnormSrgb:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Pick the surface format: first sRGB format offered, else the first
 * offered, else BGRA8Unorm
 */
inline WGPUTextureFormat chooseSurfaceFormat(const WGPUTextureFormat* formats, size_t count) {
    for (size_t i = 0; i < count; ++i) {
        if (isSrgbFormat(formats[i])) return formats[i];
    }
    return count > 0 ? formats[0] : WGPUTextureFormat_BGRA8Unorm;
}

// =============================================================================
// Buffers
// =============================================================================

/**
 * @brief Create a buffer, optionally filled from host memory
 *
 * `size` is rounded up to a multiple of 4 as WebGPU requires.
 */
WGPUBuffer createBuffer(WGPUDevice device, WGPUQueue queue, const char* label,
                        WGPUBufferUsage usage, uint64_t size, const void* data = nullptr);

// =============================================================================
// Sampler Factory
// =============================================================================

/**
 * @brief Get a cached repeat-addressing sampler for the background
 *
 * Linear magnification, nearest minification. Panning past the image edge
 * wraps around. Samplers are cached per device.
 *
 * @param device The WebGPU device
 * @return Cached sampler (do NOT release - see releaseSamplers)
 */
WGPUSampler getRepeatSampler(WGPUDevice device);

/// Release every sampler cached for `device`
void releaseSamplers(WGPUDevice device);

// =============================================================================
// Resource Cleanup Helpers
// =============================================================================

/**
 * @brief Safe release helpers that check for null, release, and set to nullptr
 *
 * Usage:
 * @code
 * void cleanup() {
 *     gpu::release(m_pipeline);
 *     gpu::release(m_bindGroupLayout);
 *     gpu::release(m_buffer);
 * }
 * @endcode
 */

inline void release(WGPURenderPipeline& p) {
    if (p) { wgpuRenderPipelineRelease(p); p = nullptr; }
}

inline void release(WGPUComputePipeline& p) {
    if (p) { wgpuComputePipelineRelease(p); p = nullptr; }
}

inline void release(WGPUBindGroupLayout& l) {
    if (l) { wgpuBindGroupLayoutRelease(l); l = nullptr; }
}

inline void release(WGPUBindGroup& g) {
    if (g) { wgpuBindGroupRelease(g); g = nullptr; }
}

inline void release(WGPUBuffer& b) {
    if (b) { wgpuBufferRelease(b); b = nullptr; }
}

inline void release(WGPUSampler& s) {
    if (s) { wgpuSamplerRelease(s); s = nullptr; }
}

inline void release(WGPUTexture& t) {
    if (t) { wgpuTextureRelease(t); t = nullptr; }
}

inline void release(WGPUTextureView& v) {
    if (v) { wgpuTextureViewRelease(v); v = nullptr; }
}

inline void release(WGPUShaderModule& m) {
    if (m) { wgpuShaderModuleRelease(m); m = nullptr; }
}

inline void release(WGPUPipelineLayout& l) {
    if (l) { wgpuPipelineLayoutRelease(l); l = nullptr; }
}

} // namespace dotscape::gpu
