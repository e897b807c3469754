// Dotscape - Background Compositor Implementation

#include <dotscape/background_compositor.h>
#include <dotscape/binding_layout.h>
#include <dotscape/gpu_common.h>
#include <dotscape/io/image_loader.h>
#include <dotscape/pipeline_builder.h>
#include <dotscape/point_math.h>
#include <dotscape/shaders.h>
#include <iostream>

namespace dotscape {

BackgroundCompositor::~BackgroundCompositor() {
    cleanup();
}

bool BackgroundCompositor::init(WGPUDevice device, WGPUQueue queue, WGPUTextureFormat format,
                                uint32_t sampleCount, const std::string& imagePath,
                                const ImageSize& expectedSize, const ImageSize& fillSize,
                                const BackgroundBindings& resources) {
    m_lastError.clear();

    io::ImageData image = io::loadImage(imagePath);
    if (!image.valid()) {
        m_lastError = "Background image missing or unreadable: " + imagePath;
        return false;
    }

    if (!expectedSize.empty() &&
        (expectedSize.width != static_cast<uint32_t>(image.width) ||
         expectedSize.height != static_cast<uint32_t>(image.height))) {
        m_lastError = "Background image is " + std::to_string(image.width) + "x" +
                      std::to_string(image.height) + ", expected " +
                      std::to_string(expectedSize.width) + "x" + std::to_string(expectedSize.height);
        return false;
    }

    if (!fillSize.empty()) {
        image = io::resizeToFill(image, fillSize);
        if (!image.valid()) {
            m_lastError = "Failed to resize background to " + std::to_string(fillSize.width) +
                          "x" + std::to_string(fillSize.height);
            return false;
        }
    }

    if (!uploadImage(device, queue, image)) {
        cleanup();
        return false;
    }

    gpu::PipelineBuilder builder(device);
    builder.label("Background")
           .shader(shaders::background(m_imageSize))
           .bindings(bindings::BACKGROUND)
           .colorTarget(format)
           .topology(WGPUPrimitiveTopology_TriangleStrip)
           .sampleCount(sampleCount);

    m_pipeline = builder.build();
    m_bindGroupLayout = builder.bindGroupLayout();
    if (!m_pipeline) {
        m_lastError = "Failed to create background pipeline";
        cleanup();
        return false;
    }

    BackgroundBindings bound = resources;
    bound.texture = m_textureView;
    bound.sampler = gpu::getRepeatSampler(device);
    if (!bound.complete()) {
        m_lastError = "Incomplete background bindings";
        cleanup();
        return false;
    }

    m_bindGroup = createBindGroup(device, m_bindGroupLayout, bound.entries(), "Background Bindings");
    if (!m_bindGroup) {
        m_lastError = "Failed to create background bind group";
        cleanup();
        return false;
    }

    std::cout << "[Background] " << imagePath << " (" << m_imageSize.width << "x"
              << m_imageSize.height << ")" << std::endl;
    return true;
}

bool BackgroundCompositor::uploadImage(WGPUDevice device, WGPUQueue queue, const io::ImageData& image) {
    m_imageSize.width = static_cast<uint32_t>(image.width);
    m_imageSize.height = static_cast<uint32_t>(image.height);

    WGPUTextureDescriptor texDesc = {};
    texDesc.label = gpu::toStringView("Background Texture");
    texDesc.size.width = m_imageSize.width;
    texDesc.size.height = m_imageSize.height;
    texDesc.size.depthOrArrayLayers = 1;
    texDesc.mipLevelCount = 1;
    texDesc.sampleCount = 1;
    texDesc.dimension = WGPUTextureDimension_2D;
    texDesc.format = WGPUTextureFormat_RGBA8UnormSrgb;
    texDesc.usage = WGPUTextureUsage_TextureBinding | WGPUTextureUsage_CopyDst;

    m_texture = wgpuDeviceCreateTexture(device, &texDesc);
    if (!m_texture) {
        m_lastError = "Failed to create background texture";
        return false;
    }

    WGPUTextureViewDescriptor viewDesc = {};
    viewDesc.format = texDesc.format;
    viewDesc.dimension = WGPUTextureViewDimension_2D;
    viewDesc.baseMipLevel = 0;
    viewDesc.mipLevelCount = 1;
    viewDesc.baseArrayLayer = 0;
    viewDesc.arrayLayerCount = 1;
    viewDesc.aspect = WGPUTextureAspect_All;
    m_textureView = wgpuTextureCreateView(m_texture, &viewDesc);

    WGPUTexelCopyTextureInfo destination = {};
    destination.texture = m_texture;
    destination.mipLevel = 0;
    destination.origin = {0, 0, 0};
    destination.aspect = WGPUTextureAspect_All;

    WGPUTexelCopyBufferLayout dataLayout = {};
    dataLayout.offset = 0;
    dataLayout.bytesPerRow = m_imageSize.width * 4;
    dataLayout.rowsPerImage = m_imageSize.height;

    WGPUExtent3D writeSize = {m_imageSize.width, m_imageSize.height, 1};
    wgpuQueueWriteTexture(queue, &destination, image.pixels.data(), image.pixels.size(),
                          &dataLayout, &writeSize);
    return true;
}

void BackgroundCompositor::cleanup() {
    gpu::release(m_bindGroup);
    gpu::release(m_bindGroupLayout);
    gpu::release(m_pipeline);
    gpu::release(m_textureView);
    gpu::release(m_texture);
}

void BackgroundCompositor::encode(WGPURenderPassEncoder pass) const {
    if (!m_pipeline) return;

    wgpuRenderPassEncoderSetPipeline(pass, m_pipeline);
    wgpuRenderPassEncoderSetBindGroup(pass, bindings::GROUP, m_bindGroup, 0, nullptr);
    host::DrawCall draw = host::backgroundDraw();
    wgpuRenderPassEncoderDraw(pass, draw.vertexCount, draw.instanceCount, 0, 0);
}

} // namespace dotscape
