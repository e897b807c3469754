#pragma once

/**
 * @file binding_layout.h
 * @brief Bind group tables for the three GPU programs
 *
 * These tables are the host side of the `@group(0) @binding(n)` declarations
 * in shaders.cpp. Bind group layouts are built from them (see
 * PipelineBuilder::bindings) so host and WGSL cannot drift apart.
 */

#include <dotscape/types.h>
#include <cstddef>
#include <cstdint>

namespace dotscape::bindings {

enum class ResourceKind {
    StorageReadWrite,
    StorageReadOnly,
    Uniform,
    Texture2D,
    Sampler
};

// Shader stage bits (same values as WGPUShaderStage)
enum Stage : uint32_t {
    STAGE_VERTEX = 0x1,
    STAGE_FRAGMENT = 0x2,
    STAGE_COMPUTE = 0x4
};

struct BindingSlot {
    uint32_t binding;
    ResourceKind kind;
    uint64_t minSize;  ///< Buffers only; for storage this is one element
    uint32_t stages;
    const char* name;  ///< Variable name in WGSL
};

struct BindingTable {
    const BindingSlot* slots;
    size_t count;

    const BindingSlot* begin() const { return slots; }
    const BindingSlot* end() const { return slots + count; }
    const BindingSlot& operator[](size_t i) const { return slots[i]; }
};

/// Every program binds a single group
constexpr uint32_t GROUP = 0;

constexpr uint64_t VEC2_SIZE = 8;
constexpr uint64_t SCALAR_SIZE = 4;

constexpr BindingSlot PHYSICS_SLOTS[] = {
    {0, ResourceKind::StorageReadWrite, sizeof(Point), STAGE_COMPUTE, "points"},
    {1, ResourceKind::Uniform, VEC2_SIZE, STAGE_COMPUTE, "windowSize"},
    {2, ResourceKind::Uniform, SCALAR_SIZE, STAGE_COMPUTE, "deltaTime"},
};

constexpr BindingSlot PARTICLE_SLOTS[] = {
    {0, ResourceKind::StorageReadOnly, sizeof(Point), STAGE_VERTEX, "points"},
    {1, ResourceKind::Uniform, VEC2_SIZE, STAGE_VERTEX, "windowSize"},
    {2, ResourceKind::Uniform, SCALAR_SIZE, STAGE_VERTEX, "pointSize"},
    {3, ResourceKind::Uniform, SCALAR_SIZE, STAGE_FRAGMENT, "intensity"},
};

constexpr BindingSlot BACKGROUND_SLOTS[] = {
    {0, ResourceKind::Texture2D, 0, STAGE_FRAGMENT, "backgroundTexture"},
    {1, ResourceKind::Sampler, 0, STAGE_FRAGMENT, "backgroundSampler"},
    {2, ResourceKind::Uniform, VEC2_SIZE, STAGE_VERTEX, "windowSize"},
    {3, ResourceKind::Uniform, VEC2_SIZE, STAGE_VERTEX, "windowPos"},
};

constexpr BindingTable PHYSICS{PHYSICS_SLOTS, sizeof(PHYSICS_SLOTS) / sizeof(BindingSlot)};
constexpr BindingTable PARTICLES{PARTICLE_SLOTS, sizeof(PARTICLE_SLOTS) / sizeof(BindingSlot)};
constexpr BindingTable BACKGROUND{BACKGROUND_SLOTS, sizeof(BACKGROUND_SLOTS) / sizeof(BindingSlot)};

} // namespace dotscape::bindings
