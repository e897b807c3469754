#pragma once

/**
 * @file frame_orchestrator.h
 * @brief Per-frame sequencing of physics, background and particles
 *
 * Every frame runs the same fixed sequence (see FrameStage). The physics
 * compute pass and the render pass are recorded into one command encoder and
 * submitted once on the device's single queue; WebGPU orders passes within a
 * submission, so the render pass always sees this frame's physics writes,
 * and the next frame's physics cannot start before this frame's draw has
 * consumed the buffer.
 *
 * Resizes are latched by requestResize() and only applied at the start of
 * the next renderFrame(), so both stages of a frame agree on the bounds.
 */

#include <dotscape/background_compositor.h>
#include <dotscape/config.h>
#include <dotscape/frame_uniforms.h>
#include <dotscape/particle_renderer.h>
#include <dotscape/physics_step.h>
#include <dotscape/point_store.h>
#include <webgpu/webgpu.h>
#include <string>

namespace dotscape {

class GpuContext;

enum class FrameStage {
    Idle,
    ApplyResize,
    AcquireSurface,
    Physics,
    Render,
    Submit,
    Present
};

const char* frameStageName(FrameStage stage);

enum class FrameStatus {
    Presented,  ///< Frame submitted and presented
    Skipped,    ///< Surface was outdated or lost and has been reconfigured
    Fatal       ///< Unrecoverable; see lastError()
};

class FrameOrchestrator {
public:
    FrameOrchestrator() = default;
    ~FrameOrchestrator();

    FrameOrchestrator(const FrameOrchestrator&) = delete;
    FrameOrchestrator& operator=(const FrameOrchestrator&) = delete;

    /// Build the point store, uniforms, pipelines and MSAA target.
    /// A non-empty `monitorSize` is the size the background is resized to fill.
    bool init(GpuContext& gpu, const Config& config, int width, int height,
              const ImageSize& monitorSize = {});
    void cleanup();

    /// Latch a new framebuffer size; applied at the start of the next frame
    void requestResize(int width, int height);
    bool resizePending() const { return m_resizePending; }

    void setDeltaTime(float dt) { m_uniforms.setDeltaTime(dt); }
    void setPointSize(float size) { m_uniforms.setPointSize(size); }
    void setIntensity(float intensity) { m_uniforms.setIntensity(intensity); }
    void setWindowPos(const glm::vec2& pos) { m_uniforms.setWindowPos(pos); }

    /// Run one frame through every FrameStage
    FrameStatus renderFrame();

    const WindowExtent& extent() const { return m_uniforms.extent(); }
    const PointStyle& style() const { return m_uniforms.style(); }
    const BackgroundView& view() const { return m_uniforms.view(); }
    uint32_t pointCount() const { return m_points.count(); }
    uint32_t sampleCount() const { return m_sampleCount; }
    bool hasBackground() const { return m_background.isInitialized(); }
    FrameStage stage() const { return m_stage; }
    const std::string& lastError() const { return m_lastError; }

private:
    /// Returns false if the multisample target could not be recreated
    bool applyPendingResize();
    bool createMsaaTarget();
    FrameStatus fail(const std::string& message);

    GpuContext* m_gpu = nullptr;

    FrameUniforms m_uniforms;
    PointStore m_points;
    PhysicsStep m_physics;
    BackgroundCompositor m_background;
    ParticleRenderer m_particles;

    uint32_t m_sampleCount = 1;
    WGPUTexture m_msaaTexture = nullptr;
    WGPUTextureView m_msaaView = nullptr;

    bool m_resizePending = false;
    int m_pendingWidth = 0;
    int m_pendingHeight = 0;

    FrameStage m_stage = FrameStage::Idle;
    std::string m_lastError;
};

} // namespace dotscape
