#pragma once

// Dotscape - WGSL Sources
// Compute, billboard, point-list and background programs

#include <dotscape/types.h>
#include <string>

namespace dotscape::shaders {

/// Physics step, entry point `main`, @workgroup_size(64)
const char* physics();

/// Instanced soft-circle billboards, entry points `vs_main` / `fs_main`
const char* particles();

/// Legacy one-vertex-per-point renderer (PointList topology)
const char* pointList();

/// Panned background quad with IMAGE_SIZE baked in from the asset
std::string background(const ImageSize& imageSize);

} // namespace dotscape::shaders
