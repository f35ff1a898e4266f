// Michadame CRT - Render Graph Implementation

#include <michadame/crt/render_graph.h>
#include <michadame/crt/crt_shaders.h>
#include <michadame/effects/gpu_common.h>
#include <michadame/effects/pipeline_builder.h>
#include <iostream>
#include <stdexcept>

namespace michadame::crt {

namespace gpu = michadame::effects::gpu;
using gpu::toStringView;

namespace {

size_t passIndex(PassKind kind) {
    return static_cast<size_t>(kind);
}

bool isOffscreen(PassKind kind) {
    return kind != PassKind::Composite && kind != PassKind::Passthrough;
}

} // namespace

RenderGraph::RenderGraph(WGPUDevice device, WGPUQueue queue, WGPUTextureFormat targetFormat)
    : m_device(device), m_queue(queue), m_targetFormat(targetFormat) {
    // Invalid WGSL still yields non-null handles; the scope catches it
    wgpuDevicePushErrorScope(m_device, WGPUErrorFilter_Validation);
    try {
        buildPipelines();
    } catch (const std::exception&) {
        std::string scopeError = gpu::popErrorScope(m_device);
        if (!scopeError.empty()) {
            std::cerr << "[RenderGraph] " << scopeError << std::endl;
        }
        destroy();
        throw;
    }

    std::string scopeError = gpu::popErrorScope(m_device);
    if (!scopeError.empty()) {
        destroy();
        throw std::runtime_error("Pass pipelines failed to build: " + scopeError);
    }
    std::cout << "[RenderGraph] Built " << kPassCount << " pass pipelines" << std::endl;
}

RenderGraph::~RenderGraph() {
    destroy();
}

void RenderGraph::buildPass(PassKind kind, const std::string& source, WGPUTextureFormat format,
                            uint64_t uniformSize, bool twoInputs, WGPUSampler sampler) {
    gpu::PipelineBuilder builder(m_device);
    builder.label(passKindName(kind))
           .shader(source)
           .colorTarget(format)
           .uniform(0, uniformSize)
           .texture(1);
    if (twoInputs) {
        builder.texture(2).sampler(3);
    } else {
        builder.sampler(2);
    }

    PassPipeline& pass = m_passes[passIndex(kind)];
    pass.pipeline = builder.build();
    pass.layout = builder.bindGroupLayout();
    if (!pass.pipeline) {
        throw std::runtime_error(std::string("Failed to build ") + passKindName(kind) + " pipeline");
    }

    WGPUBufferDescriptor bufferDesc = {};
    bufferDesc.label = toStringView(passKindName(kind));
    bufferDesc.size = uniformSize;
    bufferDesc.usage = WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst;
    pass.uniforms = wgpuDeviceCreateBuffer(m_device, &bufferDesc);
    if (!pass.uniforms) {
        throw std::runtime_error(std::string("Failed to create ") + passKindName(kind) + " uniform buffer");
    }

    pass.sampler = sampler;
}

void RenderGraph::buildPipelines() {
    // Use shared cached samplers (do NOT release - managed by gpu_common)
    WGPUSampler nearest = gpu::getNearestClampSampler(m_device);
    WGPUSampler linear = gpu::getLinearClampSampler(m_device);

    buildPass(PassKind::Pixelate, shaders::pixelate(), gpu::PASS_FORMAT,
              sizeof(PassUniforms), false, nearest);

    for (PassKind kind : {PassKind::BloomH, PassKind::BloomV, PassKind::ScanH, PassKind::ScanV}) {
        buildPass(kind, shaders::separableBlur(kind), gpu::PASS_FORMAT,
                  sizeof(PassUniforms), false, nearest);
    }

    buildPass(PassKind::Composite, shaders::composite(), m_targetFormat,
              sizeof(CompositeUniforms), true, linear);
    buildPass(PassKind::Passthrough, shaders::passthrough(), m_targetFormat,
              sizeof(PassUniforms), false, linear);
}

bool RenderGraph::allocateTargets(Extent size) {
    releaseTargets();

    WGPUTextureDescriptor texDesc = {};
    texDesc.size.width = size.width;
    texDesc.size.height = size.height;
    texDesc.size.depthOrArrayLayers = 1;
    texDesc.mipLevelCount = 1;
    texDesc.sampleCount = 1;
    texDesc.dimension = WGPUTextureDimension_2D;
    texDesc.format = gpu::PASS_FORMAT;
    texDesc.usage = WGPUTextureUsage_TextureBinding | WGPUTextureUsage_RenderAttachment;

    WGPUTextureViewDescriptor viewDesc = {};
    viewDesc.format = gpu::PASS_FORMAT;
    viewDesc.dimension = WGPUTextureViewDimension_2D;
    viewDesc.mipLevelCount = 1;
    viewDesc.arrayLayerCount = 1;

    for (size_t i = 0; i < kTargetCount; i++) {
        texDesc.label = toStringView(passKindName(static_cast<PassKind>(i)));
        m_targets[i].texture = wgpuDeviceCreateTexture(m_device, &texDesc);
        if (m_targets[i].texture) {
            m_targets[i].view = wgpuTextureCreateView(m_targets[i].texture, &viewDesc);
        }
        if (!m_targets[i].view) {
            std::cerr << "[RenderGraph] Failed to allocate pass target "
                      << passKindName(static_cast<PassKind>(i)) << std::endl;
            releaseTargets();
            return false;
        }
    }

    std::cout << "[RenderGraph] Pass targets sized to " << size.width << "x" << size.height << std::endl;
    return true;
}

void RenderGraph::releaseTargets() {
    for (auto& target : m_targets) {
        gpu::release(target.view);
        if (target.texture) {
            wgpuTextureDestroy(target.texture);
            gpu::release(target.texture);
        }
    }
}

WGPUTextureView RenderGraph::passView(PassKind kind) const {
    return m_targets[passIndex(kind)].view;
}

void RenderGraph::drawPass(WGPUCommandEncoder encoder, PassKind kind, WGPUTextureView output,
                           WGPUTextureView input0, WGPUTextureView input1,
                           const Viewport* viewport, Extent outputSize) {
    PassPipeline& pass = m_passes[passIndex(kind)];
    bool twoInputs = input1 != nullptr;

    WGPUBindGroupEntry bindEntries[4] = {};
    bindEntries[0].binding = 0;
    bindEntries[0].buffer = pass.uniforms;
    bindEntries[0].size = kind == PassKind::Composite ? sizeof(CompositeUniforms) : sizeof(PassUniforms);
    bindEntries[1].binding = 1;
    bindEntries[1].textureView = input0;
    if (twoInputs) {
        bindEntries[2].binding = 2;
        bindEntries[2].textureView = input1;
        bindEntries[3].binding = 3;
        bindEntries[3].sampler = pass.sampler;
    } else {
        bindEntries[2].binding = 2;
        bindEntries[2].sampler = pass.sampler;
    }

    WGPUBindGroupDescriptor bindDesc = {};
    bindDesc.layout = pass.layout;
    bindDesc.entryCount = twoInputs ? 4 : 3;
    bindDesc.entries = bindEntries;
    WGPUBindGroup bindGroup = wgpuDeviceCreateBindGroup(m_device, &bindDesc);

    WGPURenderPassColorAttachment colorAttachment = {};
    colorAttachment.view = output;
    colorAttachment.depthSlice = WGPU_DEPTH_SLICE_UNDEFINED;
    colorAttachment.loadOp = WGPULoadOp_Clear;
    colorAttachment.storeOp = WGPUStoreOp_Store;
    colorAttachment.clearValue = {0.0, 0.0, 0.0, 1.0};

    WGPURenderPassDescriptor passDesc = {};
    passDesc.label = toStringView(passKindName(kind));
    passDesc.colorAttachmentCount = 1;
    passDesc.colorAttachments = &colorAttachment;

    WGPURenderPassEncoder renderPass = wgpuCommandEncoderBeginRenderPass(encoder, &passDesc);
    if (viewport) {
        wgpuRenderPassEncoderSetViewport(renderPass, viewport->x, viewport->y,
                                         viewport->width, viewport->height, 0.0f, 1.0f);
    }
    wgpuRenderPassEncoderSetPipeline(renderPass, pass.pipeline);
    wgpuRenderPassEncoderSetBindGroup(renderPass, 0, bindGroup, 0, nullptr);
    wgpuRenderPassEncoderDraw(renderPass, 3, 1, 0, 0);
    if (viewport) {
        // Leave the full target as the viewport
        wgpuRenderPassEncoderSetViewport(renderPass, 0.0f, 0.0f,
                                         static_cast<float>(outputSize.width),
                                         static_cast<float>(outputSize.height), 0.0f, 1.0f);
    }
    wgpuRenderPassEncoderEnd(renderPass);
    wgpuRenderPassEncoderRelease(renderPass);

    gpu::release(bindGroup);
}

void RenderGraph::render(WGPUCommandEncoder encoder, WGPUTextureView targetView,
                         WGPUTextureView sourceView, Extent captureSize, Extent targetSize,
                         const ShaderParams& params, bool pixelate, bool crt) {
    if (!sourceView) {
        if (!m_warnedNullSource) {
            std::cerr << "[RenderGraph] render() called without a source texture" << std::endl;
            m_warnedNullSource = true;
        }
        return;
    }
    if (!m_passes[0].pipeline) {
        std::cerr << "[RenderGraph] render() called after destroy()" << std::endl;
        return;
    }
    if (!encoder || !targetView || captureSize.empty() || targetSize.empty()) {
        return;
    }

    if (m_sizeTracker.needsAllocation(captureSize)) {
        if (!allocateTargets(captureSize)) {
            return;
        }
        m_sizeTracker.commit(captureSize);
    }

    ShaderParams values = params.clamped();
    std::vector<PassKind> plan = planPasses(pixelate, crt);
    Viewport viewport = computeViewport(captureSize, targetSize);

    // Upload every uniform block first; each pass owns its buffer
    for (PassKind kind : plan) {
        PassPipeline& pass = m_passes[passIndex(kind)];
        if (kind == PassKind::Composite) {
            CompositeUniforms u = makeCompositeUniforms(captureSize, values);
            wgpuQueueWriteBuffer(m_queue, pass.uniforms, 0, &u, sizeof(u));
        } else {
            PassUniforms u = makePassUniforms(kind, captureSize, values);
            wgpuQueueWriteBuffer(m_queue, pass.uniforms, 0, &u, sizeof(u));
        }
    }

    WGPUTextureView stageInput = sourceView;
    for (PassKind kind : plan) {
        if (isOffscreen(kind) && !passView(kind)) {
            std::cerr << "[RenderGraph] Missing target for " << passKindName(kind) << std::endl;
            return;
        }

        switch (kind) {
            case PassKind::Pixelate:
                drawPass(encoder, kind, passView(kind), sourceView, nullptr, nullptr, captureSize);
                stageInput = passView(kind);
                break;
            case PassKind::BloomH:
            case PassKind::ScanH:
                drawPass(encoder, kind, passView(kind), stageInput, nullptr, nullptr, captureSize);
                break;
            case PassKind::BloomV:
                drawPass(encoder, kind, passView(kind), passView(PassKind::BloomH), nullptr, nullptr, captureSize);
                break;
            case PassKind::ScanV:
                drawPass(encoder, kind, passView(kind), passView(PassKind::ScanH), nullptr, nullptr, captureSize);
                break;
            case PassKind::Composite:
                drawPass(encoder, kind, targetView, passView(PassKind::ScanV),
                         passView(PassKind::BloomV), &viewport, targetSize);
                break;
            case PassKind::Passthrough:
                drawPass(encoder, kind, targetView, stageInput, nullptr, &viewport, targetSize);
                break;
        }
    }
}

void RenderGraph::destroy() {
    releaseTargets();
    for (auto& pass : m_passes) {
        gpu::release(pass.pipeline);
        gpu::release(pass.layout);
        gpu::release(pass.uniforms);
        pass.sampler = nullptr;
    }
    m_sizeTracker = SizeTracker();
}

} // namespace michadame::crt
