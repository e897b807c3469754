// Dotscape - Pipeline Builder Utility
// Fluent API for creating render and compute pipelines with less boilerplate

#pragma once

#include <dotscape/binding_layout.h>
#include <webgpu/webgpu.h>
#include <vector>
#include <string>

namespace dotscape::gpu {

// Binding types for the builder
enum class BindingType {
    Uniform,
    Texture,
    Sampler,
    StorageBuffer,
    ReadOnlyStorageBuffer
};

struct BindingEntry {
    uint32_t binding;
    BindingType type;
    uint64_t size;  // For uniform/storage buffers
    WGPUShaderStage visibility;
};

// Pipeline builder with fluent interface
class PipelineBuilder {
public:
    explicit PipelineBuilder(WGPUDevice device);
    ~PipelineBuilder();

    PipelineBuilder& label(const char* name);

    // Shader configuration
    PipelineBuilder& shader(const char* wgslSource);
    PipelineBuilder& shader(const std::string& wgslSource);
    PipelineBuilder& vertexEntry(const char* entryPoint);
    PipelineBuilder& fragmentEntry(const char* entryPoint);
    PipelineBuilder& computeEntry(const char* entryPoint);

    // Output configuration (render pipelines)
    PipelineBuilder& colorTarget(WGPUTextureFormat format);
    PipelineBuilder& colorTargetWithBlend(WGPUTextureFormat format);
    PipelineBuilder& topology(WGPUPrimitiveTopology topology);
    PipelineBuilder& sampleCount(uint32_t count);

    // Whole group from a binding table
    PipelineBuilder& bindings(const bindings::BindingTable& table);

    // Individual bindings
    PipelineBuilder& uniform(uint32_t binding, uint64_t size, WGPUShaderStage visibility);
    PipelineBuilder& texture(uint32_t binding, WGPUShaderStage visibility);
    PipelineBuilder& sampler(uint32_t binding, WGPUShaderStage visibility);
    PipelineBuilder& storageBuffer(uint32_t binding, uint64_t size, WGPUShaderStage visibility,
                                   bool readOnly = false);

    // Build the pipeline
    WGPURenderPipeline build();
    WGPUComputePipeline buildCompute();

    // Access the bind group layout after build(); the caller owns it
    WGPUBindGroupLayout bindGroupLayout() const { return m_bindGroupLayout; }

    // Check if build succeeded
    bool valid() const { return m_pipeline != nullptr || m_computePipeline != nullptr; }

private:
    bool createBindGroupLayout();
    bool createPipelineLayout();
    bool createShaderModule();

    WGPUDevice m_device;
    std::string m_label = "Dotscape Pipeline";
    std::string m_shaderSource;
    std::string m_vertexEntry = "vs_main";
    std::string m_fragmentEntry = "fs_main";
    std::string m_computeEntry = "main";
    WGPUTextureFormat m_colorFormat = WGPUTextureFormat_BGRA8Unorm;
    WGPUPrimitiveTopology m_topology = WGPUPrimitiveTopology_TriangleStrip;
    uint32_t m_sampleCount = 1;
    bool m_useBlend = false;

    std::vector<BindingEntry> m_bindings;

    // Created resources
    WGPUShaderModule m_shaderModule = nullptr;
    WGPUBindGroupLayout m_bindGroupLayout = nullptr;
    WGPUPipelineLayout m_pipelineLayout = nullptr;
    WGPURenderPipeline m_pipeline = nullptr;
    WGPUComputePipeline m_computePipeline = nullptr;
};

} // namespace dotscape::gpu
