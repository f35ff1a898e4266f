#pragma once

/**
 * @file render_graph.h
 * @brief Multi-pass CRT post-processing on WebGPU
 *
 * Pass chain with CRT enabled:
 *
 *   source -> [pixelate] -> bloomH -> bloomV --------\
 *                      \--> scanH  -> scanV  -> composite -> target
 *
 * Offscreen passes run at capture resolution into RGBA16Float targets; the
 * composite (or passthrough) pass draws into the caller's target view inside
 * an aspect-preserving viewport.
 */

#include <michadame/crt/render_layout.h>
#include <michadame/crt/shader_params.h>
#include <webgpu/webgpu.h>
#include <array>
#include <string>
#include <vector>

namespace michadame::crt {

class RenderGraph {
public:
    /**
     * @brief Build every pass pipeline.
     * @param targetFormat Format of the views passed to render()
     * @throws std::runtime_error if any pipeline fails to build or the device
     *         reports a validation error while building them
     */
    RenderGraph(WGPUDevice device, WGPUQueue queue, WGPUTextureFormat targetFormat);
    ~RenderGraph();

    RenderGraph(const RenderGraph&) = delete;
    RenderGraph& operator=(const RenderGraph&) = delete;

    /**
     * @brief Record all passes for one frame into `encoder`.
     *
     * Every pass the graph begins is ended before returning, so the caller
     * can keep recording its own passes on the same encoder. Pass targets
     * are reallocated first if `captureSize` changed since the last call;
     * if that fails nothing is drawn and the next call tries again.
     *
     * @param sourceView Current capture frame; must not be null
     * @param captureSize Size of the capture frame
     * @param targetSize Size of `targetView`
     */
    void render(WGPUCommandEncoder encoder, WGPUTextureView targetView,
                WGPUTextureView sourceView, Extent captureSize, Extent targetSize,
                const ShaderParams& params, bool pixelate, bool crt);

    /**
     * @brief Release every pipeline, layout, buffer and pass target.
     *
     * Idempotent. Must run before the device is released.
     */
    void destroy();

private:
    static constexpr size_t kPassCount = 7;
    static constexpr size_t kTargetCount = 5;   // Pixelate..ScanV

    struct PassPipeline {
        WGPURenderPipeline pipeline = nullptr;
        WGPUBindGroupLayout layout = nullptr;
        WGPUBuffer uniforms = nullptr;
        WGPUSampler sampler = nullptr;      // cached, not owned
    };

    struct PassTarget {
        WGPUTexture texture = nullptr;
        WGPUTextureView view = nullptr;
    };

    void buildPipelines();
    void buildPass(PassKind kind, const std::string& source, WGPUTextureFormat format,
                   uint64_t uniformSize, bool twoInputs, WGPUSampler sampler);
    bool allocateTargets(Extent size);
    void releaseTargets();

    WGPUTextureView passView(PassKind kind) const;

    void drawPass(WGPUCommandEncoder encoder, PassKind kind, WGPUTextureView output,
                  WGPUTextureView input0, WGPUTextureView input1,
                  const Viewport* viewport, Extent outputSize);

    WGPUDevice m_device = nullptr;
    WGPUQueue m_queue = nullptr;
    WGPUTextureFormat m_targetFormat;

    std::array<PassPipeline, kPassCount> m_passes{};
    std::array<PassTarget, kTargetCount> m_targets{};
    SizeTracker m_sizeTracker;
    bool m_warnedNullSource = false;
};

} // namespace michadame::crt
