// Dotscape - Frame Orchestrator

#include <dotscape/frame_orchestrator.h>
#include <dotscape/gpu_common.h>
#include <dotscape/gpu_context.h>
#include <dotscape/point_math.h>
#include <iostream>

namespace dotscape {

const char* frameStageName(FrameStage stage) {
    switch (stage) {
        case FrameStage::Idle: return "idle";
        case FrameStage::ApplyResize: return "apply-resize";
        case FrameStage::AcquireSurface: return "acquire-surface";
        case FrameStage::Physics: return "physics";
        case FrameStage::Render: return "render";
        case FrameStage::Submit: return "submit";
        case FrameStage::Present: return "present";
    }
    return "unknown";
}

FrameOrchestrator::~FrameOrchestrator() {
    cleanup();
}

bool FrameOrchestrator::init(GpuContext& gpu, const Config& config, int width, int height,
                             const ImageSize& monitorSize) {
    m_gpu = &gpu;
    m_sampleCount = config.sampleCount();

    WGPUDevice device = gpu.device();
    WGPUQueue queue = gpu.queue();
    WindowExtent extent = host::clampExtent(static_cast<float>(width), static_cast<float>(height));

    PointStyle style;
    style.pointSize = config.pointSize;
    style.intensity = config.intensity;

    if (!m_uniforms.init(device, queue, extent, style)) {
        m_lastError = "Failed to create uniform buffers";
        return false;
    }

    if (!m_points.init(device, queue, config.pointCount, extent)) {
        m_lastError = "Failed to create point store";
        return false;
    }

    PhysicsBindings physics;
    physics.points = m_points.buffer();
    physics.pointsSize = m_points.byteSize();
    physics.windowSize = m_uniforms.windowSizeBuffer();
    physics.deltaTime = m_uniforms.deltaTimeBuffer();
    if (!m_physics.init(device, physics, m_points.count())) {
        m_lastError = "Failed to create physics pipeline";
        return false;
    }

    if (!config.backgroundImage.empty()) {
        BackgroundBindings background;
        background.windowSize = m_uniforms.windowSizeBuffer();
        background.windowPos = m_uniforms.windowPosBuffer();
        if (!m_background.init(device, queue, gpu.surfaceFormat(), m_sampleCount,
                               config.backgroundImage, config.expectedImageSize, monitorSize,
                               background)) {
            m_lastError = m_background.lastError();
            return false;
        }
    }

    ParticleBindings particles;
    particles.points = m_points.buffer();
    particles.pointsSize = m_points.byteSize();
    particles.windowSize = m_uniforms.windowSizeBuffer();
    particles.pointSize = m_uniforms.pointSizeBuffer();
    particles.intensity = m_uniforms.intensityBuffer();
    if (!m_particles.init(device, gpu.surfaceFormat(), m_sampleCount, particles,
                          m_points.count(), config.renderMode)) {
        m_lastError = "Failed to create particle pipeline";
        return false;
    }

    if (!createMsaaTarget()) {
        m_lastError = "Failed to create multisample target";
        return false;
    }

    m_stage = FrameStage::Idle;
    return true;
}

void FrameOrchestrator::cleanup() {
    gpu::release(m_msaaView);
    gpu::release(m_msaaTexture);
    m_particles.cleanup();
    m_background.cleanup();
    m_physics.cleanup();
    m_points.cleanup();
    m_uniforms.cleanup();
    m_gpu = nullptr;
}

void FrameOrchestrator::requestResize(int width, int height) {
    m_pendingWidth = width;
    m_pendingHeight = height;
    m_resizePending = true;
}

bool FrameOrchestrator::applyPendingResize() {
    if (!m_resizePending) return true;
    m_resizePending = false;

    WindowExtent extent = host::clampExtent(static_cast<float>(m_pendingWidth),
                                            static_cast<float>(m_pendingHeight));
    if (extent == m_uniforms.extent()) return true;

    m_gpu->configureSurface(static_cast<uint32_t>(extent.width), static_cast<uint32_t>(extent.height));
    m_uniforms.setExtent(extent);
    m_points.reseed(extent);
    return createMsaaTarget();
}

bool FrameOrchestrator::createMsaaTarget() {
    gpu::release(m_msaaView);
    gpu::release(m_msaaTexture);
    if (m_sampleCount <= 1) return true;

    const WindowExtent& extent = m_uniforms.extent();

    WGPUTextureDescriptor texDesc = {};
    texDesc.label = gpu::toStringView("MSAA Target");
    texDesc.size.width = static_cast<uint32_t>(extent.width);
    texDesc.size.height = static_cast<uint32_t>(extent.height);
    texDesc.size.depthOrArrayLayers = 1;
    texDesc.mipLevelCount = 1;
    texDesc.sampleCount = m_sampleCount;
    texDesc.dimension = WGPUTextureDimension_2D;
    texDesc.format = m_gpu->surfaceFormat();
    texDesc.usage = WGPUTextureUsage_RenderAttachment;

    m_msaaTexture = wgpuDeviceCreateTexture(m_gpu->device(), &texDesc);
    if (!m_msaaTexture) return false;

    m_msaaView = wgpuTextureCreateView(m_msaaTexture, nullptr);
    return m_msaaView != nullptr;
}

FrameStatus FrameOrchestrator::fail(const std::string& message) {
    m_lastError = std::string(frameStageName(m_stage)) + ": " + message;
    std::cerr << "[Frame] " << m_lastError << std::endl;
    return FrameStatus::Fatal;
}

FrameStatus FrameOrchestrator::renderFrame() {
    if (!m_gpu) {
        return fail("not initialized");
    }

    m_stage = FrameStage::ApplyResize;
    if (!applyPendingResize()) {
        return fail("failed to recreate multisample target");
    }

    m_stage = FrameStage::AcquireSurface;
    WGPUSurfaceTexture surfaceTexture = {};
    wgpuSurfaceGetCurrentTexture(m_gpu->surface(), &surfaceTexture);
    switch (surfaceTexture.status) {
        case WGPUSurfaceGetCurrentTextureStatus_SuccessOptimal:
        case WGPUSurfaceGetCurrentTextureStatus_SuccessSuboptimal:
            break;
        case WGPUSurfaceGetCurrentTextureStatus_Timeout:
            gpu::release(surfaceTexture.texture);
            return FrameStatus::Skipped;
        case WGPUSurfaceGetCurrentTextureStatus_Outdated:
        case WGPUSurfaceGetCurrentTextureStatus_Lost: {
            gpu::release(surfaceTexture.texture);
            const WindowExtent& extent = m_uniforms.extent();
            m_gpu->configureSurface(static_cast<uint32_t>(extent.width), static_cast<uint32_t>(extent.height));
            return FrameStatus::Skipped;
        }
        default:
            gpu::release(surfaceTexture.texture);
            return fail("surface texture unavailable (status " +
                        std::to_string(static_cast<int>(surfaceTexture.status)) + ")");
    }

    WGPUTextureViewDescriptor viewDesc = {};
    viewDesc.format = m_gpu->surfaceFormat();
    viewDesc.dimension = WGPUTextureViewDimension_2D;
    viewDesc.baseMipLevel = 0;
    viewDesc.mipLevelCount = 1;
    viewDesc.baseArrayLayer = 0;
    viewDesc.arrayLayerCount = 1;
    viewDesc.aspect = WGPUTextureAspect_All;
    WGPUTextureView view = wgpuTextureCreateView(surfaceTexture.texture, &viewDesc);

    WGPUCommandEncoderDescriptor encoderDesc = {};
    encoderDesc.label = gpu::toStringView("Frame Encoder");
    WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(m_gpu->device(), &encoderDesc);

    m_stage = FrameStage::Physics;
    m_physics.encode(encoder);

    m_stage = FrameStage::Render;
    WGPURenderPassColorAttachment colorAttachment = {};
    colorAttachment.view = m_msaaView ? m_msaaView : view;
    colorAttachment.resolveTarget = m_msaaView ? view : nullptr;
    colorAttachment.depthSlice = WGPU_DEPTH_SLICE_UNDEFINED;
    colorAttachment.loadOp = WGPULoadOp_Clear;
    colorAttachment.storeOp = WGPUStoreOp_Store;
    colorAttachment.clearValue = {0.0, 0.0, 0.0, 1.0};

    WGPURenderPassDescriptor renderPassDesc = {};
    renderPassDesc.label = gpu::toStringView("Scene Pass");
    renderPassDesc.colorAttachmentCount = 1;
    renderPassDesc.colorAttachments = &colorAttachment;

    WGPURenderPassEncoder pass = wgpuCommandEncoderBeginRenderPass(encoder, &renderPassDesc);
    m_background.encode(pass);
    m_particles.encode(pass);
    wgpuRenderPassEncoderEnd(pass);
    wgpuRenderPassEncoderRelease(pass);

    m_stage = FrameStage::Submit;
    WGPUCommandBufferDescriptor cmdBufferDesc = {};
    WGPUCommandBuffer cmdBuffer = wgpuCommandEncoderFinish(encoder, &cmdBufferDesc);
    wgpuCommandEncoderRelease(encoder);
    if (!cmdBuffer) {
        wgpuTextureViewRelease(view);
        gpu::release(surfaceTexture.texture);
        return fail("command encoding failed");
    }
    wgpuQueueSubmit(m_gpu->queue(), 1, &cmdBuffer);
    wgpuCommandBufferRelease(cmdBuffer);

    m_stage = FrameStage::Present;
    wgpuSurfacePresent(m_gpu->surface());
    m_gpu->poll();

    // wgpu-native: release the surface texture after presenting
    wgpuTextureViewRelease(view);
    gpu::release(surfaceTexture.texture);

    m_stage = FrameStage::Idle;
    return FrameStatus::Presented;
}

} // namespace dotscape
