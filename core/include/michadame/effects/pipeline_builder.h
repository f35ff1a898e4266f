// Michadame - Pipeline Builder Utility
// Fluent API for creating full-screen render pipelines

#pragma once

#include <webgpu/webgpu.h>
#include <cstdint>
#include <vector>
#include <string>

namespace michadame::effects::gpu {

// Binding types for the builder
enum class BindingType {
    Uniform,
    Texture,
    Sampler
};

struct BindingEntry {
    uint32_t binding;
    BindingType type;
    uint64_t size;  // For uniform buffers
};

// Pipeline builder with fluent interface. All bindings are fragment-stage.
class PipelineBuilder {
public:
    explicit PipelineBuilder(WGPUDevice device);
    ~PipelineBuilder();

    PipelineBuilder(const PipelineBuilder&) = delete;
    PipelineBuilder& operator=(const PipelineBuilder&) = delete;

    PipelineBuilder& label(const std::string& name);

    // Shader configuration
    PipelineBuilder& shader(const std::string& wgslSource);

    // Output configuration
    PipelineBuilder& colorTarget(WGPUTextureFormat format);

    // Binding configuration
    PipelineBuilder& uniform(uint32_t binding, uint64_t size);
    PipelineBuilder& texture(uint32_t binding);
    PipelineBuilder& sampler(uint32_t binding);

    // Build the pipeline. The shader must define vs_main (see FULLSCREEN_VERTEX_SHADER)
    // and fs_main. Validation errors raised by wgpu are reported through error scopes.
    // Returns nullptr on failure, including duplicate binding slots.
    WGPURenderPipeline build();

    // Access the bind group layout after build(). Ownership passes to the caller.
    WGPUBindGroupLayout bindGroupLayout() const { return m_bindGroupLayout; }

private:
    // Bind group layout, then pipeline layout
    bool createLayouts();
    bool fail(const char* stage) const;

    WGPUDevice m_device;
    std::string m_label = "pass";
    std::string m_shaderSource;
    WGPUTextureFormat m_colorFormat = WGPUTextureFormat_RGBA16Float;

    std::vector<BindingEntry> m_bindings;

    // Created resources
    WGPUShaderModule m_shaderModule = nullptr;
    WGPUBindGroupLayout m_bindGroupLayout = nullptr;
    WGPUPipelineLayout m_pipelineLayout = nullptr;
    WGPURenderPipeline m_pipeline = nullptr;
};

} // namespace michadame::effects::gpu
