#pragma once

/**
 * @file gpu_common.h
 * @brief WebGPU pieces shared by the CRT passes and the viewer
 *
 * Pass target format, the fullscreen-triangle vertex stage, per-device
 * sampler cache, null-safe release helpers and WGSL gamma snippets.
 */

#include <webgpu/webgpu.h>
#include <cstring>
#include <string>

namespace michadame::effects::gpu {

/// Format of every offscreen pass target
inline constexpr WGPUTextureFormat PASS_FORMAT = WGPUTextureFormat_RGBA16Float;

/// Null-terminated C string as a WebGPU string view
inline WGPUStringView toStringView(const char* str) {
    return WGPUStringView{str, std::strlen(str)};
}

// =============================================================================
// Fullscreen Triangle
// =============================================================================

/**
 * @brief Vertex stage shared by every pass
 *
 * Three vertices derived from the vertex index cover the viewport, so passes
 * bind no vertex buffer. UV (0,0) is the top-left texel, matching the row
 * order of uploaded frames.
 */
inline constexpr const char* FULLSCREEN_VERTEX_SHADER = R"(
struct VertexOutput {
    @builtin(position) position: vec4f,
    @location(0) uv: vec2f,
};

@vertex
fn vs_main(@builtin(vertex_index) index: u32) -> VertexOutput {
    // uv = (0,0), (2,0), (0,2)
    let uv = vec2f(f32((index << 1u) & 2u), f32(index & 2u));
    var out: VertexOutput;
    out.position = vec4f(uv.x * 2.0 - 1.0, 1.0 - uv.y * 2.0, 0.0, 1.0);
    out.uv = uv;
    return out;
}
)";

// =============================================================================
// Sampler Factory
// =============================================================================

/**
 * @brief Bilinear, clamp-to-edge sampler owned by the cache
 *
 * Do not release the returned handle; call releaseSamplers() at shutdown.
 */
WGPUSampler getLinearClampSampler(WGPUDevice device);

/**
 * @brief Point-sampled, clamp-to-edge sampler owned by the cache
 *
 * Used where exact texel values are needed (pixel grid snapping, blur taps
 * fetched at texel centers).
 */
WGPUSampler getNearestClampSampler(WGPUDevice device);

/**
 * @brief Release every cached sampler created for a device
 *
 * Must run before the device itself is released.
 */
void releaseSamplers(WGPUDevice device);

// =============================================================================
// Error Scopes
// =============================================================================

/**
 * @brief Text for the outcome of a popped error scope
 *
 * Empty when the scope completed and caught nothing. A scope that could not
 * be popped is reported as an error.
 */
std::string describeErrorScope(WGPUPopErrorScopeStatus status, WGPUErrorType type,
                               WGPUStringView message);

/**
 * @brief Pop the innermost error scope and wait for its result
 * @return describeErrorScope() of the result
 */
std::string popErrorScope(WGPUDevice device);

// =============================================================================
// Release Helpers
// =============================================================================

/// Release `handle` if set and reset it to null
template<typename Handle>
inline void releaseWith(Handle& handle, void (*releaseFn)(Handle)) {
    if (handle) {
        releaseFn(handle);
        handle = nullptr;
    }
}

inline void release(WGPURenderPipeline& h) { releaseWith(h, wgpuRenderPipelineRelease); }
inline void release(WGPUPipelineLayout& h) { releaseWith(h, wgpuPipelineLayoutRelease); }
inline void release(WGPUBindGroupLayout& h) { releaseWith(h, wgpuBindGroupLayoutRelease); }
inline void release(WGPUBindGroup& h) { releaseWith(h, wgpuBindGroupRelease); }
inline void release(WGPUShaderModule& h) { releaseWith(h, wgpuShaderModuleRelease); }
inline void release(WGPUBuffer& h) { releaseWith(h, wgpuBufferRelease); }
inline void release(WGPUSampler& h) { releaseWith(h, wgpuSamplerRelease); }
inline void release(WGPUTexture& h) { releaseWith(h, wgpuTextureRelease); }
inline void release(WGPUTextureView& h) { releaseWith(h, wgpuTextureViewRelease); }

// =============================================================================
// WGSL Snippets
// =============================================================================

namespace wgsl {

/**
 * @brief Gamma transfer functions
 *
 * Blur passes accumulate in linear light (decoded at 2.2); the final
 * composite encodes with a caller-supplied exponent.
 */
inline constexpr const char* GAMMA = R"(
fn toLinear(c: vec3f) -> vec3f {
    return pow(max(c, vec3f(0.0)), vec3f(2.2));
}

fn toGamma(c: vec3f, gamma: f32) -> vec3f {
    return pow(max(c, vec3f(0.0)), vec3f(1.0 / gamma));
}
)";

} // namespace wgsl

} // namespace michadame::effects::gpu
