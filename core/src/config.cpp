// Dotscape - Configuration

#include <dotscape/config.h>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace dotscape {

const char* renderModeName(RenderMode mode) {
    switch (mode) {
        case RenderMode::Billboards: return "billboards";
        case RenderMode::Points: return "points";
    }
    return "billboards";
}

bool parseRenderMode(const std::string& name, RenderMode& out) {
    if (name == "billboards") {
        out = RenderMode::Billboards;
        return true;
    }
    if (name == "points") {
        out = RenderMode::Points;
        return true;
    }
    return false;
}

bool parseSize(const std::string& s, int& w, int& h) {
    size_t x = s.find('x');
    if (x == std::string::npos || x == 0 || x + 1 >= s.size()) {
        return false;
    }
    try {
        size_t usedW = 0;
        size_t usedH = 0;
        int pw = std::stoi(s.substr(0, x), &usedW);
        int ph = std::stoi(s.substr(x + 1), &usedH);
        if (usedW != x || usedH != s.size() - x - 1) {
            return false;
        }
        w = pw;
        h = ph;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

std::string validate(const Config& config) {
    if (config.pointCount == 0) {
        return "pointCount must be at least 1";
    }
    if (config.pointCount > MAX_POINT_COUNT) {
        return "pointCount must be at most " + std::to_string(MAX_POINT_COUNT);
    }
    if (!(config.pointSize > 0.0f)) {
        return "pointSize must be greater than 0";
    }
    if (config.intensity < 0.0f || config.intensity > 1.0f) {
        return "intensity must be within [0, 1]";
    }
    if (config.windowWidth <= 0 || config.windowHeight <= 0) {
        return "window size must be positive";
    }
    if ((config.expectedImageSize.width == 0) != (config.expectedImageSize.height == 0)) {
        return "image size needs both width and height";
    }
    return "";
}

namespace {

// Integers are read signed so negative values are caught instead of wrapping
template <typename T>
bool readInteger(const json& j, const char* key, int64_t minValue, int64_t maxValue,
                 T& out, std::string& error) {
    if (!j.contains(key)) {
        return true;
    }
    const json& value = j[key];
    if (!value.is_number_integer()) {
        error = std::string(key) + " must be an integer";
        return false;
    }
    int64_t v = value.get<int64_t>();
    if (value.is_number_unsigned() && value.get<uint64_t>() > static_cast<uint64_t>(maxValue)) {
        v = maxValue + 1;
    }
    if (v < minValue || v > maxValue) {
        error = std::string(key) + " must be within [" + std::to_string(minValue) + ", " +
                std::to_string(maxValue) + "]";
        return false;
    }
    out = static_cast<T>(v);
    return true;
}

} // namespace

bool applyJson(const json& j, Config& config, std::string& error) {
    if (!j.is_object()) {
        error = "settings must be a JSON object";
        return false;
    }

    try {
        config.backgroundImage = j.value("backgroundImage", config.backgroundImage);
        config.windowClass = j.value("windowClass", config.windowClass);
        config.pointSize = j.value("pointSize", config.pointSize);
        config.intensity = j.value("intensity", config.intensity);
        config.msaa = j.value("msaa", config.msaa);
        config.audio = j.value("audio", config.audio);
        config.audioDevice = j.value("audioDevice", config.audioDevice);
        config.decorated = j.value("decorated", config.decorated);
        config.verbose = j.value("verbose", config.verbose);

        constexpr int64_t maxDimension = 65536;
        if (!readInteger(j, "pointCount", 1, MAX_POINT_COUNT, config.pointCount, error) ||
            !readInteger(j, "windowWidth", 1, maxDimension, config.windowWidth, error) ||
            !readInteger(j, "windowHeight", 1, maxDimension, config.windowHeight, error) ||
            !readInteger(j, "imageWidth", 0, maxDimension, config.expectedImageSize.width, error) ||
            !readInteger(j, "imageHeight", 0, maxDimension, config.expectedImageSize.height, error)) {
            return false;
        }

        if (j.contains("renderMode")) {
            std::string mode = j["renderMode"].get<std::string>();
            if (!parseRenderMode(mode, config.renderMode)) {
                error = "unknown renderMode '" + mode + "'";
                return false;
            }
        }
    } catch (const json::exception& e) {
        error = e.what();
        return false;
    }
    return true;
}

bool loadConfigFile(const std::string& path, Config& config, std::string& error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "cannot open settings file: " + path;
        return false;
    }

    json j;
    try {
        j = json::parse(file);
    } catch (const json::exception& e) {
        error = path + ": " + e.what();
        return false;
    }

    if (!applyJson(j, config, error)) {
        error = path + ": " + error;
        return false;
    }
    return true;
}

int parseArgs(int argc, char** argv, Config& config) {
    // Settings file is applied before the flags so the flags win
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string path;
        if (arg == "--config" && i + 1 < argc) {
            path = argv[i + 1];
        } else if (arg.rfind("--config=", 0) == 0) {
            path = arg.substr(9);
        }
        if (!path.empty()) {
            std::string error;
            if (!loadConfigFile(path, config, error)) {
                std::cerr << "[Config] " << error << std::endl;
                return 1;
            }
        }
    }

    CLI::App app{"Dotscape - GPU particle visualizer"};
    app.set_version_flag("-v,--version", std::string(DOTSCAPE_VERSION));
    app.set_help_flag("-h,--help", "Show this help");

    std::string configPath;
    std::string windowSize;
    std::string imageSize;
    std::string renderMode = renderModeName(config.renderMode);
    bool noMsaa = false;

    app.add_option("--config", configPath, "JSON settings file");
    app.add_option("-b,--background-image", config.backgroundImage, "Background image (PNG, JPG, ...)");
    app.add_option("-c,--class", config.windowClass, "Window class / title");
    app.add_option("--count", config.pointCount, "Number of points");
    app.add_option("--point-size", config.pointSize, "Point diameter in pixels");
    app.add_option("--intensity", config.intensity, "Peak point opacity (0-1)");
    app.add_option("--window", windowSize, "Window size WxH");
    app.add_option("--image-size", imageSize, "Expected background size WxH");
    app.add_option("--render-mode", renderMode, "billboards or points")
       ->check(CLI::IsMember({"billboards", "points"}));
    app.add_option("--audio-device", config.audioDevice, "Capture device name (substring)");
    app.add_option("--frames", config.frames, "Exit after N frames (0 = run forever)");
    app.add_flag("--no-msaa", noMsaa, "Disable 4x multisampling");
    app.add_flag("--audio", config.audio, "Drive intensity from audio peaks");
    app.add_flag("--decorated", config.decorated, "Show window decorations");
    app.add_flag("--headless", config.headless, "Run the simulation on the CPU without a window");
    app.add_flag("--verbose", config.verbose, "Extra logging");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    if (noMsaa) {
        config.msaa = false;
    }

    if (!parseRenderMode(renderMode, config.renderMode)) {
        std::cerr << "[Config] Unknown render mode: " << renderMode << std::endl;
        return 1;
    }

    if (!windowSize.empty() &&
        !parseSize(windowSize, config.windowWidth, config.windowHeight)) {
        std::cerr << "[Config] Invalid --window value (expected WxH): " << windowSize << std::endl;
        return 1;
    }

    if (!imageSize.empty()) {
        int w = 0;
        int h = 0;
        if (!parseSize(imageSize, w, h) || w <= 0 || h <= 0) {
            std::cerr << "[Config] Invalid --image-size value (expected WxH): " << imageSize << std::endl;
            return 1;
        }
        config.expectedImageSize.width = static_cast<uint32_t>(w);
        config.expectedImageSize.height = static_cast<uint32_t>(h);
    }

    std::string problem = validate(config);
    if (!problem.empty()) {
        std::cerr << "[Config] " << problem << std::endl;
        return 1;
    }

    return -1;
}

} // namespace dotscape
