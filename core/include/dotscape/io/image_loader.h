#pragma once

#include <dotscape/types.h>
#include <string>
#include <vector>
#include <cstdint>

namespace dotscape::io {

/// Decoded 8-bit image, always RGBA
struct ImageData {
    std::vector<uint8_t> pixels;  ///< RGBA pixel data, rows top to bottom
    int width = 0;
    int height = 0;
    int channels = 0;             ///< Original channels before forced RGBA

    bool valid() const { return !pixels.empty() && width > 0 && height > 0; }
};

/// Directories searched for relative image paths, after the working directory
extern const std::vector<std::string> IMAGE_SEARCH_PATHS;

/// Load an image (PNG, JPG, BMP, TGA, etc.)
/// @param path Path to the image file
/// @return ImageData with RGBA pixels, or empty ImageData on failure
ImageData loadImage(const std::string& path);

/**
 * @brief Size an image is scaled to before cropping to fill a target
 *
 * Scales by the larger of the two axis ratios so the result covers
 * `target` on both axes, rounding each side and keeping it at least 1.
 */
ImageSize fillDimensions(int width, int height, const ImageSize& target);

/**
 * @brief Scale an image to cover `target`, then centre-crop to exactly `target`
 *
 * Filtering is done in sRGB space. Returns a copy when the image already has
 * the target size, and an invalid image on failure.
 */
ImageData resizeToFill(const ImageData& image, const ImageSize& target);

/// Resolve a path by checking multiple search locations
/// @param path The path to resolve (can be relative or absolute)
/// @param searchPaths Additional directories to search (after current directory)
/// @return The resolved path if found, or empty string if not found
std::string resolvePath(const std::string& path, const std::vector<std::string>& searchPaths = {});

} // namespace dotscape::io
