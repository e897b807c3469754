// Dotscape - Pipeline Builder Implementation

#include <dotscape/pipeline_builder.h>
#include <dotscape/gpu_common.h>
#include <iostream>

namespace dotscape::gpu {

PipelineBuilder::PipelineBuilder(WGPUDevice device)
    : m_device(device) {}

PipelineBuilder::~PipelineBuilder() {
    // m_bindGroupLayout and the pipeline are handed to the caller
    release(m_shaderModule);
    release(m_pipelineLayout);
}

PipelineBuilder& PipelineBuilder::label(const char* name) {
    m_label = name;
    return *this;
}

PipelineBuilder& PipelineBuilder::shader(const char* wgslSource) {
    m_shaderSource = wgslSource;
    return *this;
}

PipelineBuilder& PipelineBuilder::shader(const std::string& wgslSource) {
    m_shaderSource = wgslSource;
    return *this;
}

PipelineBuilder& PipelineBuilder::vertexEntry(const char* entryPoint) {
    m_vertexEntry = entryPoint;
    return *this;
}

PipelineBuilder& PipelineBuilder::fragmentEntry(const char* entryPoint) {
    m_fragmentEntry = entryPoint;
    return *this;
}

PipelineBuilder& PipelineBuilder::computeEntry(const char* entryPoint) {
    m_computeEntry = entryPoint;
    return *this;
}

PipelineBuilder& PipelineBuilder::colorTarget(WGPUTextureFormat format) {
    m_colorFormat = format;
    m_useBlend = false;
    return *this;
}

PipelineBuilder& PipelineBuilder::colorTargetWithBlend(WGPUTextureFormat format) {
    m_colorFormat = format;
    m_useBlend = true;
    return *this;
}

PipelineBuilder& PipelineBuilder::topology(WGPUPrimitiveTopology topology) {
    m_topology = topology;
    return *this;
}

PipelineBuilder& PipelineBuilder::sampleCount(uint32_t count) {
    m_sampleCount = count;
    return *this;
}

PipelineBuilder& PipelineBuilder::bindings(const bindings::BindingTable& table) {
    for (const auto& slot : table) {
        WGPUShaderStage visibility = static_cast<WGPUShaderStage>(slot.stages);
        switch (slot.kind) {
            case bindings::ResourceKind::StorageReadWrite:
                storageBuffer(slot.binding, slot.minSize, visibility, false);
                break;
            case bindings::ResourceKind::StorageReadOnly:
                storageBuffer(slot.binding, slot.minSize, visibility, true);
                break;
            case bindings::ResourceKind::Uniform:
                uniform(slot.binding, slot.minSize, visibility);
                break;
            case bindings::ResourceKind::Texture2D:
                texture(slot.binding, visibility);
                break;
            case bindings::ResourceKind::Sampler:
                sampler(slot.binding, visibility);
                break;
        }
    }
    return *this;
}

PipelineBuilder& PipelineBuilder::uniform(uint32_t binding, uint64_t size, WGPUShaderStage visibility) {
    m_bindings.push_back({binding, BindingType::Uniform, size, visibility});
    return *this;
}

PipelineBuilder& PipelineBuilder::texture(uint32_t binding, WGPUShaderStage visibility) {
    m_bindings.push_back({binding, BindingType::Texture, 0, visibility});
    return *this;
}

PipelineBuilder& PipelineBuilder::sampler(uint32_t binding, WGPUShaderStage visibility) {
    m_bindings.push_back({binding, BindingType::Sampler, 0, visibility});
    return *this;
}

PipelineBuilder& PipelineBuilder::storageBuffer(uint32_t binding, uint64_t size,
                                                WGPUShaderStage visibility, bool readOnly) {
    auto type = readOnly ? BindingType::ReadOnlyStorageBuffer : BindingType::StorageBuffer;
    m_bindings.push_back({binding, type, size, visibility});
    return *this;
}

bool PipelineBuilder::createShaderModule() {
    WGPUShaderSourceWGSL wgslDesc = {};
    wgslDesc.chain.sType = WGPUSType_ShaderSourceWGSL;
    wgslDesc.code = toStringView(m_shaderSource.c_str());

    WGPUShaderModuleDescriptor shaderDesc = {};
    shaderDesc.nextInChain = &wgslDesc.chain;
    shaderDesc.label = toStringView(m_label.c_str());
    m_shaderModule = wgpuDeviceCreateShaderModule(m_device, &shaderDesc);
    if (!m_shaderModule) {
        std::cerr << "[PipelineBuilder] " << m_label << ": shader module creation failed" << std::endl;
        return false;
    }
    return true;
}

bool PipelineBuilder::createBindGroupLayout() {
    std::vector<WGPUBindGroupLayoutEntry> entries(m_bindings.size());

    for (size_t i = 0; i < m_bindings.size(); ++i) {
        auto& entry = entries[i];
        auto& binding = m_bindings[i];

        entry = {};
        entry.binding = binding.binding;
        entry.visibility = binding.visibility;

        switch (binding.type) {
            case BindingType::Uniform:
                entry.buffer.type = WGPUBufferBindingType_Uniform;
                entry.buffer.minBindingSize = binding.size;
                break;
            case BindingType::Texture:
                entry.texture.sampleType = WGPUTextureSampleType_Float;
                entry.texture.viewDimension = WGPUTextureViewDimension_2D;
                break;
            case BindingType::Sampler:
                entry.sampler.type = WGPUSamplerBindingType_Filtering;
                break;
            case BindingType::StorageBuffer:
                entry.buffer.type = WGPUBufferBindingType_Storage;
                entry.buffer.minBindingSize = binding.size;
                break;
            case BindingType::ReadOnlyStorageBuffer:
                entry.buffer.type = WGPUBufferBindingType_ReadOnlyStorage;
                entry.buffer.minBindingSize = binding.size;
                break;
        }
    }

    WGPUBindGroupLayoutDescriptor layoutDesc = {};
    layoutDesc.label = toStringView(m_label.c_str());
    layoutDesc.entryCount = entries.size();
    layoutDesc.entries = entries.data();
    m_bindGroupLayout = wgpuDeviceCreateBindGroupLayout(m_device, &layoutDesc);
    if (!m_bindGroupLayout) {
        std::cerr << "[PipelineBuilder] " << m_label << ": bind group layout creation failed" << std::endl;
        return false;
    }
    return true;
}

bool PipelineBuilder::createPipelineLayout() {
    WGPUPipelineLayoutDescriptor pipelineLayoutDesc = {};
    pipelineLayoutDesc.bindGroupLayoutCount = 1;
    pipelineLayoutDesc.bindGroupLayouts = &m_bindGroupLayout;
    m_pipelineLayout = wgpuDeviceCreatePipelineLayout(m_device, &pipelineLayoutDesc);
    return m_pipelineLayout != nullptr;
}

WGPURenderPipeline PipelineBuilder::build() {
    if (!createShaderModule() || !createBindGroupLayout() || !createPipelineLayout()) {
        return nullptr;
    }

    WGPUBlendState blendState = {};
    blendState.color.srcFactor = WGPUBlendFactor_SrcAlpha;
    blendState.color.dstFactor = WGPUBlendFactor_OneMinusSrcAlpha;
    blendState.color.operation = WGPUBlendOperation_Add;
    blendState.alpha.srcFactor = WGPUBlendFactor_One;
    blendState.alpha.dstFactor = WGPUBlendFactor_OneMinusSrcAlpha;
    blendState.alpha.operation = WGPUBlendOperation_Add;

    WGPUColorTargetState colorTarget = {};
    colorTarget.format = m_colorFormat;
    colorTarget.writeMask = WGPUColorWriteMask_All;
    if (m_useBlend) {
        colorTarget.blend = &blendState;
    }

    WGPUFragmentState fragmentState = {};
    fragmentState.module = m_shaderModule;
    fragmentState.entryPoint = toStringView(m_fragmentEntry.c_str());
    fragmentState.targetCount = 1;
    fragmentState.targets = &colorTarget;

    WGPURenderPipelineDescriptor pipelineDesc = {};
    pipelineDesc.label = toStringView(m_label.c_str());
    pipelineDesc.layout = m_pipelineLayout;
    pipelineDesc.vertex.module = m_shaderModule;
    pipelineDesc.vertex.entryPoint = toStringView(m_vertexEntry.c_str());
    pipelineDesc.primitive.topology = m_topology;
    pipelineDesc.primitive.cullMode = WGPUCullMode_None;
    pipelineDesc.multisample.count = m_sampleCount;
    pipelineDesc.multisample.mask = ~0u;
    pipelineDesc.fragment = &fragmentState;

    m_pipeline = wgpuDeviceCreateRenderPipeline(m_device, &pipelineDesc);
    if (!m_pipeline) {
        std::cerr << "[PipelineBuilder] " << m_label << ": render pipeline creation failed" << std::endl;
    }
    return m_pipeline;
}

WGPUComputePipeline PipelineBuilder::buildCompute() {
    if (!createShaderModule() || !createBindGroupLayout() || !createPipelineLayout()) {
        return nullptr;
    }

    WGPUComputePipelineDescriptor pipelineDesc = {};
    pipelineDesc.label = toStringView(m_label.c_str());
    pipelineDesc.layout = m_pipelineLayout;
    pipelineDesc.compute.module = m_shaderModule;
    pipelineDesc.compute.entryPoint = toStringView(m_computeEntry.c_str());

    m_computePipeline = wgpuDeviceCreateComputePipeline(m_device, &pipelineDesc);
    if (!m_computePipeline) {
        std::cerr << "[PipelineBuilder] " << m_label << ": compute pipeline creation failed" << std::endl;
    }
    return m_computePipeline;
}

} // namespace dotscape::gpu
