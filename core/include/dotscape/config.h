#pragma once

/**
 * @file config.h
 * @brief Runtime configuration from the command line and JSON settings files
 *
 * A settings file given with `--config` is applied first; any command-line
 * flag then overrides the value it set.
 *
 * @par Example settings file
 * @code
 * {
 *     "backgroundImage": "assets/images/wallpaper.png",
 *     "pointCount": 2000,
 *     "pointSize": 4.0,
 *     "renderMode": "billboards",
 *     "audio": true
 * }
 * @endcode
 */

#include <dotscape/types.h>
#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <string>

#ifndef DOTSCAPE_VERSION
#define DOTSCAPE_VERSION "0.1.0"
#endif

namespace dotscape {

/// WebGPU default limit for one storage buffer binding (128 MiB)
constexpr uint64_t MAX_STORAGE_BINDING_SIZE = 134217728;

/// Largest point store that fits one storage binding
constexpr uint32_t MAX_POINT_COUNT = static_cast<uint32_t>(MAX_STORAGE_BINDING_SIZE / sizeof(Point));

const char* renderModeName(RenderMode mode);
bool parseRenderMode(const std::string& name, RenderMode& out);

struct Config {
    // Scene
    std::string backgroundImage;            ///< Empty = clear to black
    ImageSize expectedImageSize;            ///< 0x0 = accept any asset size
    uint32_t pointCount = 1000;
    float pointSize = 5.0f;                 ///< Billboard diameter in pixels
    float intensity = 0.8f;                 ///< Peak opacity, 0..1
    RenderMode renderMode = RenderMode::Billboards;
    bool msaa = true;

    // Window
    std::string windowClass = "dotscape";
    int windowWidth = 1280;
    int windowHeight = 720;
    bool decorated = false;

    // Audio-reactive intensity
    bool audio = false;
    std::string audioDevice;                ///< Substring of a capture device name

    // Run control
    bool headless = false;
    uint32_t frames = 0;                    ///< 0 = unlimited
    bool verbose = false;

    uint32_t sampleCount() const { return msaa ? 4u : 1u; }
};

/// Parse "WxH". Returns false and leaves w/h untouched on malformed input.
bool parseSize(const std::string& s, int& w, int& h);

/**
 * @brief Check value ranges
 * @return Empty string if valid, otherwise a description of the first problem
 */
std::string validate(const Config& config);

/// Apply recognised keys from a JSON object. Unknown keys are ignored.
bool applyJson(const nlohmann::json& j, Config& config, std::string& error);

/// Read a JSON settings file into config
bool loadConfigFile(const std::string& path, Config& config, std::string& error);

/**
 * @brief Parse command-line arguments into config
 * @return -1 to continue running, otherwise the process exit code
 *         (0 after --help / --version, non-zero on errors)
 */
int parseArgs(int argc, char** argv, Config& config);

} // namespace dotscape
