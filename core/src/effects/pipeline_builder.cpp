// Michadame - Pipeline Builder Implementation

#include <michadame/effects/pipeline_builder.h>
#include <michadame/effects/gpu_common.h>
#include <algorithm>
#include <iostream>

namespace michadame::effects::gpu {

namespace {

WGPUBindGroupLayoutEntry layoutEntry(const BindingEntry& binding) {
    WGPUBindGroupLayoutEntry entry = {};
    entry.binding = binding.binding;
    entry.visibility = WGPUShaderStage_Fragment;

    if (binding.type == BindingType::Uniform) {
        entry.buffer.type = WGPUBufferBindingType_Uniform;
        entry.buffer.minBindingSize = binding.size;
    } else if (binding.type == BindingType::Texture) {
        entry.texture.sampleType = WGPUTextureSampleType_Float;
        entry.texture.viewDimension = WGPUTextureViewDimension_2D;
    } else {
        entry.sampler.type = WGPUSamplerBindingType_Filtering;
    }
    return entry;
}

bool hasDuplicateSlots(std::vector<BindingEntry> bindings) {
    std::sort(bindings.begin(), bindings.end(),
              [](const BindingEntry& a, const BindingEntry& b) { return a.binding < b.binding; });
    auto dup = std::adjacent_find(bindings.begin(), bindings.end(),
        [](const BindingEntry& a, const BindingEntry& b) { return a.binding == b.binding; });
    return dup != bindings.end();
}

} // namespace

PipelineBuilder::PipelineBuilder(WGPUDevice device)
    : m_device(device) {}

PipelineBuilder::~PipelineBuilder() {
    // The bind group layout and pipeline belong to the caller after build()
    release(m_shaderModule);
    release(m_pipelineLayout);
}

PipelineBuilder& PipelineBuilder::label(const std::string& name) {
    m_label = name;
    return *this;
}

PipelineBuilder& PipelineBuilder::shader(const std::string& wgslSource) {
    m_shaderSource = wgslSource;
    return *this;
}

PipelineBuilder& PipelineBuilder::colorTarget(WGPUTextureFormat format) {
    m_colorFormat = format;
    return *this;
}

PipelineBuilder& PipelineBuilder::uniform(uint32_t binding, uint64_t size) {
    m_bindings.push_back({binding, BindingType::Uniform, size});
    return *this;
}

PipelineBuilder& PipelineBuilder::texture(uint32_t binding) {
    m_bindings.push_back({binding, BindingType::Texture, 0});
    return *this;
}

PipelineBuilder& PipelineBuilder::sampler(uint32_t binding) {
    m_bindings.push_back({binding, BindingType::Sampler, 0});
    return *this;
}

bool PipelineBuilder::fail(const char* stage) const {
    std::cerr << "[PipelineBuilder] " << m_label << ": " << stage << " failed" << std::endl;
    return false;
}

bool PipelineBuilder::createLayouts() {
    if (hasDuplicateSlots(m_bindings)) {
        return fail("binding validation (duplicate slot)");
    }

    std::vector<WGPUBindGroupLayoutEntry> entries;
    entries.reserve(m_bindings.size());
    for (const BindingEntry& binding : m_bindings) {
        entries.push_back(layoutEntry(binding));
    }

    WGPUBindGroupLayoutDescriptor groupDesc = {};
    groupDesc.label = toStringView(m_label.c_str());
    groupDesc.entryCount = entries.size();
    groupDesc.entries = entries.data();
    m_bindGroupLayout = wgpuDeviceCreateBindGroupLayout(m_device, &groupDesc);
    if (!m_bindGroupLayout) {
        return fail("bind group layout");
    }

    WGPUPipelineLayoutDescriptor layoutDesc = {};
    layoutDesc.bindGroupLayoutCount = 1;
    layoutDesc.bindGroupLayouts = &m_bindGroupLayout;
    m_pipelineLayout = wgpuDeviceCreatePipelineLayout(m_device, &layoutDesc);
    return m_pipelineLayout ? true : fail("pipeline layout");
}

WGPURenderPipeline PipelineBuilder::build() {
    if (m_shaderSource.empty()) {
        fail("shader (no source)");
        return nullptr;
    }

    WGPUShaderSourceWGSL wgsl = {};
    wgsl.chain.sType = WGPUSType_ShaderSourceWGSL;
    wgsl.code = toStringView(m_shaderSource.c_str());

    WGPUShaderModuleDescriptor moduleDesc = {};
    moduleDesc.nextInChain = &wgsl.chain;
    moduleDesc.label = toStringView(m_label.c_str());
    m_shaderModule = wgpuDeviceCreateShaderModule(m_device, &moduleDesc);
    if (!m_shaderModule) {
        fail("shader module");
        return nullptr;
    }

    if (!createLayouts()) {
        return nullptr;
    }

    WGPUColorTargetState target = {};
    target.format = m_colorFormat;
    target.writeMask = WGPUColorWriteMask_All;

    WGPUFragmentState fragment = {};
    fragment.module = m_shaderModule;
    fragment.entryPoint = toStringView("fs_main");
    fragment.targetCount = 1;
    fragment.targets = &target;

    WGPURenderPipelineDescriptor desc = {};
    desc.label = toStringView(m_label.c_str());
    desc.layout = m_pipelineLayout;
    desc.vertex.module = m_shaderModule;
    desc.vertex.entryPoint = toStringView("vs_main");
    desc.primitive.topology = WGPUPrimitiveTopology_TriangleList;
    desc.multisample.count = 1;
    desc.multisample.mask = ~0u;
    desc.fragment = &fragment;

    m_pipeline = wgpuDeviceCreateRenderPipeline(m_device, &desc);
    if (!m_pipeline) {
        fail("render pipeline");
    }
    return m_pipeline;
}

} // namespace michadame::effects::gpu
