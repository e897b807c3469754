// Dotscape I/O - Image Loader Implementation

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#define STB_IMAGE_RESIZE_IMPLEMENTATION
#include <stb_image_resize2.h>

#include <dotscape/io/image_loader.h>
#include <algorithm>
#include <cmath>
#include <cstring>
#include <iostream>
#include <filesystem>

namespace fs = std::filesystem;

namespace dotscape::io {

const std::vector<std::string> IMAGE_SEARCH_PATHS = {"assets/images", "assets"};

ImageData loadImage(const std::string& path) {
    ImageData result;

    std::string resolvedPath = resolvePath(path, IMAGE_SEARCH_PATHS);
    if (resolvedPath.empty()) {
        std::cerr << "[Image] Not found: " << path << std::endl;
        return result;
    }

    // Force RGBA so the upload layout is fixed at 4 bytes per pixel
    int width, height, channels;
    unsigned char* data = stbi_load(resolvedPath.c_str(), &width, &height, &channels, 4);

    if (!data) {
        std::cerr << "[Image] Failed to decode " << resolvedPath
                  << " - " << stbi_failure_reason() << std::endl;
        return result;
    }

    result.width = width;
    result.height = height;
    result.channels = channels;
    result.pixels.assign(data, data + (static_cast<size_t>(width) * height * 4));

    stbi_image_free(data);
    return result;
}

ImageSize fillDimensions(int width, int height, const ImageSize& target) {
    ImageSize size;
    if (width <= 0 || height <= 0 || target.empty()) {
        return size;
    }

    double ratio = std::max(static_cast<double>(target.width) / width,
                            static_cast<double>(target.height) / height);
    size.width = static_cast<uint32_t>(std::max(std::lround(width * ratio), 1L));
    size.height = static_cast<uint32_t>(std::max(std::lround(height * ratio), 1L));
    return size;
}

ImageData resizeToFill(const ImageData& image, const ImageSize& target) {
    if (!image.valid() || target.empty()) {
        return ImageData{};
    }
    if (static_cast<uint32_t>(image.width) == target.width &&
        static_cast<uint32_t>(image.height) == target.height) {
        return image;
    }

    ImageSize scaled = fillDimensions(image.width, image.height, target);
    std::vector<uint8_t> resized(static_cast<size_t>(scaled.width) * scaled.height * 4);
    if (!stbir_resize_uint8_srgb(image.pixels.data(), image.width, image.height, 0,
                                 resized.data(), static_cast<int>(scaled.width),
                                 static_cast<int>(scaled.height), 0, STBIR_RGBA)) {
        std::cerr << "[Image] Failed to resize " << image.width << "x" << image.height
                  << " to " << scaled.width << "x" << scaled.height << std::endl;
        return ImageData{};
    }

    // Centre crop; scaled covers target on both axes
    uint32_t offsetX = (scaled.width - target.width) / 2;
    uint32_t offsetY = (scaled.height - target.height) / 2;
    size_t rowBytes = static_cast<size_t>(target.width) * 4;

    ImageData result;
    result.width = static_cast<int>(target.width);
    result.height = static_cast<int>(target.height);
    result.channels = image.channels;
    result.pixels.resize(rowBytes * target.height);
    for (uint32_t row = 0; row < target.height; ++row) {
        const uint8_t* src = resized.data() +
            ((static_cast<size_t>(row + offsetY) * scaled.width + offsetX) * 4);
        std::memcpy(result.pixels.data() + row * rowBytes, src, rowBytes);
    }
    return result;
}

std::string resolvePath(const std::string& path, const std::vector<std::string>& searchPaths) {
    if (path.empty()) {
        return "";
    }

    fs::path p = path;
    if (p.is_absolute()) {
        return fs::is_regular_file(p) ? path : "";
    }

    if (fs::is_regular_file(p)) {
        return fs::absolute(p).string();
    }

    for (const auto& searchDir : searchPaths) {
        fs::path candidate = fs::path(searchDir) / path;
        if (fs::is_regular_file(candidate)) {
            return fs::absolute(candidate).string();
        }
    }

    return "";
}

} // namespace dotscape::io
