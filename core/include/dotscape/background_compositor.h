#pragma once

// Dotscape - Background Compositor
// Full-screen quad showing the part of a static image under the window

#include <dotscape/io/image_loader.h>
#include <dotscape/resource_bindings.h>
#include <dotscape/types.h>
#include <webgpu/webgpu.h>
#include <string>

namespace dotscape {

class BackgroundCompositor {
public:
    BackgroundCompositor() = default;
    ~BackgroundCompositor();

    BackgroundCompositor(const BackgroundCompositor&) = delete;
    BackgroundCompositor& operator=(const BackgroundCompositor&) = delete;

    /**
     * @brief Load the image and build the pipeline
     *
     * `resources` supplies the windowSize and windowPos uniforms; the texture
     * and sampler slots are filled here. A missing or undecodable image, or
     * one whose decoded size differs from a non-empty `expectedSize`, fails
     * init. A non-empty `fillSize` (the monitor resolution) resizes the image
     * to fill it before upload; the uploaded size is compiled into the shader.
     */
    bool init(WGPUDevice device, WGPUQueue queue, WGPUTextureFormat format, uint32_t sampleCount,
              const std::string& imagePath, const ImageSize& expectedSize,
              const ImageSize& fillSize, const BackgroundBindings& resources);
    void cleanup();

    /// Draw the quad (4 vertices, 1 instance) into an open render pass
    void encode(WGPURenderPassEncoder pass) const;

    const ImageSize& imageSize() const { return m_imageSize; }
    const std::string& lastError() const { return m_lastError; }
    bool isInitialized() const { return m_pipeline != nullptr; }

private:
    bool uploadImage(WGPUDevice device, WGPUQueue queue, const io::ImageData& image);

    ImageSize m_imageSize;
    std::string m_lastError;

    WGPUTexture m_texture = nullptr;
    WGPUTextureView m_textureView = nullptr;
    WGPURenderPipeline m_pipeline = nullptr;
    WGPUBindGroupLayout m_bindGroupLayout = nullptr;
    WGPUBindGroup m_bindGroup = nullptr;
};

} // namespace dotscape
