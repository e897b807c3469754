// Dotscape - Resource Bindings

#include <dotscape/resource_bindings.h>
#include <dotscape/binding_layout.h>
#include <dotscape/gpu_common.h>

namespace dotscape {

namespace {

WGPUBindGroupEntry bufferEntry(uint32_t binding, WGPUBuffer buffer, uint64_t size) {
    WGPUBindGroupEntry entry = {};
    entry.binding = binding;
    entry.buffer = buffer;
    entry.offset = 0;
    entry.size = size;
    return entry;
}

// Uniform slots bind exactly the size the table declares
WGPUBindGroupEntry uniformEntry(const bindings::BindingSlot& slot, WGPUBuffer buffer) {
    return bufferEntry(slot.binding, buffer, slot.minSize);
}

} // namespace

std::vector<WGPUBindGroupEntry> PhysicsBindings::entries() const {
    const auto& t = bindings::PHYSICS;
    return {
        bufferEntry(t[0].binding, points, pointsSize),
        uniformEntry(t[1], windowSize),
        uniformEntry(t[2], deltaTime),
    };
}

std::vector<WGPUBindGroupEntry> ParticleBindings::entries() const {
    const auto& t = bindings::PARTICLES;
    return {
        bufferEntry(t[0].binding, points, pointsSize),
        uniformEntry(t[1], windowSize),
        uniformEntry(t[2], pointSize),
        uniformEntry(t[3], intensity),
    };
}

std::vector<WGPUBindGroupEntry> BackgroundBindings::entries() const {
    const auto& t = bindings::BACKGROUND;

    WGPUBindGroupEntry textureEntry = {};
    textureEntry.binding = t[0].binding;
    textureEntry.textureView = texture;

    WGPUBindGroupEntry samplerEntry = {};
    samplerEntry.binding = t[1].binding;
    samplerEntry.sampler = sampler;

    return {
        textureEntry,
        samplerEntry,
        uniformEntry(t[2], windowSize),
        uniformEntry(t[3], windowPos),
    };
}

WGPUBindGroup createBindGroup(WGPUDevice device, WGPUBindGroupLayout layout,
                              const std::vector<WGPUBindGroupEntry>& entries,
                              const char* label) {
    WGPUBindGroupDescriptor desc = {};
    desc.label = gpu::toStringView(label);
    desc.layout = layout;
    desc.entryCount = entries.size();
    desc.entries = entries.data();
    return wgpuDeviceCreateBindGroup(device, &desc);
}

} // namespace dotscape
