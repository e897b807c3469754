// Dotscape - Desktop Particle Visualizer
// Window, timing, audio gain and the frame loop

#include <dotscape/config.h>
#include <dotscape/frame_orchestrator.h>
#include <dotscape/gpu_context.h>
#include <dotscape/point_math.h>
#include <dotscape/point_seeder.h>
#include <dotscape/volume_provider.h>
#include <GLFW/glfw3.h>
#include <glm/glm.hpp>

#include <iostream>
#include <iomanip>
#include <memory>
#include <string>
#include <vector>

using namespace dotscape;

namespace {

constexpr float INITIAL_DELTA_TIME = 0.016f;
constexpr float HEADLESS_DELTA_TIME = 1.0f / 60.0f;
constexpr uint32_t HEADLESS_DEFAULT_FRAMES = 600;

// -----------------------------------------------------------------------------
// Headless Simulation
// -----------------------------------------------------------------------------

int runHeadless(const Config& config) {
    WindowExtent extent = host::clampExtent(static_cast<float>(config.windowWidth),
                                            static_cast<float>(config.windowHeight));
    uint32_t frames = config.frames > 0 ? config.frames : HEADLESS_DEFAULT_FRAMES;

    PointSeeder seeder;
    std::vector<Point> points = seeder.generate(config.pointCount, extent);

    std::cout << "Running headless: " << config.pointCount << " points, "
              << extent.width << "x" << extent.height << ", "
              << frames << " frames at 1/60 s" << std::endl;

    host::SimulationStats stats = host::simulate(points, extent, HEADLESS_DELTA_TIME, frames);
    const host::DispatchStats& dispatch = stats.dispatch;

    std::cout << "[Physics] " << dispatch.workgroups << " workgroups, "
              << dispatch.invocations << " invocations, "
              << dispatch.updated << " points per dispatch" << std::endl;
    std::cout << std::fixed << std::setprecision(2)
              << "[Physics] x: " << stats.minPosition.x << " .. " << stats.maxPosition.x
              << ", y: " << stats.minPosition.y << " .. " << stats.maxPosition.y
              << ", reflections: " << stats.reflections << std::endl;

    bool inBounds = stats.minPosition.x >= 0.0f && stats.minPosition.y >= 0.0f &&
                    stats.maxPosition.x <= extent.width && stats.maxPosition.y <= extent.height;
    if (!inBounds) {
        std::cerr << "[Physics] Points escaped the window bounds" << std::endl;
        return 1;
    }
    return 0;
}

// -----------------------------------------------------------------------------
// Window Position
// -----------------------------------------------------------------------------

// Monitor whose work area holds the window centre, or null
GLFWmonitor* monitorForWindow(GLFWwindow* window) {
    int count = 0;
    GLFWmonitor** monitors = glfwGetMonitors(&count);
    if (!monitors || count == 0) return nullptr;

    std::vector<host::MonitorRect> workAreas(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        host::MonitorRect& area = workAreas[static_cast<size_t>(i)];
        glfwGetMonitorWorkarea(monitors[i], &area.x, &area.y, &area.width, &area.height);
    }

    int windowX = 0, windowY = 0, windowW = 0, windowH = 0;
    glfwGetWindowPos(window, &windowX, &windowY);
    glfwGetWindowSize(window, &windowW, &windowH);

    int index = host::findMonitor(workAreas, windowX + windowW / 2, windowY + windowH / 2);
    return index >= 0 ? monitors[index] : nullptr;
}

// Monitor position and video mode size; zero size when unknown
host::MonitorRect monitorRect(GLFWmonitor* monitor) {
    host::MonitorRect rect;
    if (!monitor) return rect;

    const GLFWvidmode* mode = glfwGetVideoMode(monitor);
    if (!mode) return rect;

    glfwGetMonitorPos(monitor, &rect.x, &rect.y);
    rect.width = mode->width;
    rect.height = mode->height;
    return rect;
}

// Bottom-left origin offset of the window on its monitor
glm::vec2 windowPosOnMonitor(GLFWwindow* window) {
    host::MonitorRect monitor = monitorRect(monitorForWindow(window));
    if (monitor.width == 0 || monitor.height == 0) return glm::vec2(0.0f);

    int windowX = 0, windowY = 0, windowW = 0, windowH = 0;
    glfwGetWindowPos(window, &windowX, &windowY);
    glfwGetWindowSize(window, &windowW, &windowH);
    return host::backgroundPan(monitor, windowX, windowY, windowH);
}

} // namespace

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------

int main(int argc, char** argv) {
    Config config;
    int exitCode = parseArgs(argc, argv, config);
    if (exitCode >= 0) {
        return exitCode;
    }

    if (config.headless) {
        return runHeadless(config);
    }

    if (!glfwInit()) {
        std::cerr << "Failed to initialize GLFW" << std::endl;
        return 1;
    }

    // No OpenGL context - we're using WebGPU
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_DECORATED, config.decorated ? GLFW_TRUE : GLFW_FALSE);
    glfwWindowHintString(GLFW_X11_CLASS_NAME, config.windowClass.c_str());
    glfwWindowHintString(GLFW_X11_INSTANCE_NAME, config.windowClass.c_str());

    GLFWwindow* window = glfwCreateWindow(config.windowWidth, config.windowHeight,
                                          "Dotscape", nullptr, nullptr);
    if (!window) {
        std::cerr << "Failed to create window" << std::endl;
        glfwTerminate();
        return 1;
    }

    int width = 0, height = 0;
    glfwGetFramebufferSize(window, &width, &height);

    GpuContext gpu;
    if (!gpu.init(window, static_cast<uint32_t>(width), static_cast<uint32_t>(height))) {
        std::cerr << "[GpuContext] " << gpu.lastError() << std::endl;
        glfwDestroyWindow(window);
        glfwTerminate();
        return 1;
    }

    // Background is resized to fill the monitor the window opened on
    host::MonitorRect monitor = monitorRect(monitorForWindow(window));
    ImageSize monitorSize;
    monitorSize.width = static_cast<uint32_t>(monitor.width);
    monitorSize.height = static_cast<uint32_t>(monitor.height);

    FrameOrchestrator frames;
    if (!frames.init(gpu, config, width, height, monitorSize)) {
        std::cerr << "[Frame] " << frames.lastError() << std::endl;
        frames.cleanup();
        gpu.cleanup();
        glfwDestroyWindow(window);
        glfwTerminate();
        return 1;
    }
    frames.setWindowPos(windowPosOnMonitor(window));

    // Audio-reactive intensity
    std::unique_ptr<VolumeProvider> volume;
    IntensityController gain(config.intensity);
    if (config.audio) {
        auto capture = std::make_unique<AudioPeakProvider>();
        if (capture->start(config.audioDevice)) {
            volume = std::move(capture);
        } else {
            std::cerr << "[Audio] " << capture->lastError()
                      << "; using constant intensity " << config.intensity << std::endl;
            volume = std::make_unique<ConstantVolumeProvider>(config.intensity);
        }
    }

    // Timing
    double lastFrameTime = glfwGetTime();
    double lastFpsTime = lastFrameTime;
    uint32_t frameCount = 0;
    uint32_t totalFrames = 0;
    float deltaTime = INITIAL_DELTA_TIME;

    exitCode = 0;
    while (!glfwWindowShouldClose(window)) {
        glfwPollEvents();

        int fbWidth = 0, fbHeight = 0;
        glfwGetFramebufferSize(window, &fbWidth, &fbHeight);

        // Minimized: nothing to draw into
        if (fbWidth == 0 || fbHeight == 0) {
            glfwWaitEvents();
            lastFrameTime = glfwGetTime();
            continue;
        }

        if (static_cast<float>(fbWidth) != frames.extent().width ||
            static_cast<float>(fbHeight) != frames.extent().height) {
            frames.requestResize(fbWidth, fbHeight);
        }

        frames.setDeltaTime(deltaTime);
        frames.setWindowPos(windowPosOnMonitor(window));

        if (volume && volume->name() != "constant") {
            float intensity = gain.update(volume->pollVolume(), deltaTime);
            if (config.verbose && gain.clamped()) {
                std::cout << "[Audio] Gain clamped: multiplier " << gain.multiplier() << std::endl;
            }
            frames.setIntensity(intensity);
        }

        FrameStatus status = frames.renderFrame();
        if (status == FrameStatus::Fatal) {
            std::cerr << "[Frame] " << frames.lastError() << std::endl;
            exitCode = 1;
            break;
        }

        // FPS counter and title update
        double currentTime = glfwGetTime();
        deltaTime = static_cast<float>(currentTime - lastFrameTime);
        lastFrameTime = currentTime;

        if (status == FrameStatus::Presented) {
            frameCount++;
            totalFrames++;
        }

        if (currentTime - lastFpsTime >= 1.0) {
            std::string title = "Dotscape - " + std::to_string(frameCount) + " fps";
            glfwSetWindowTitle(window, title.c_str());
            frameCount = 0;
            lastFpsTime = currentTime;
        }

        if (config.frames > 0 && totalFrames >= config.frames) {
            break;
        }
    }

    // Cleanup
    std::cout << "Shutting down..." << std::endl;

    volume.reset();
    frames.cleanup();
    gpu.cleanup();
    glfwDestroyWindow(window);
    glfwTerminate();

    return exitCode;
}
