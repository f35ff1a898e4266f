#pragma once

/**
 * @file render_layout.h
 * @brief CPU-side planning for the CRT render graph
 *
 * Pass ordering, viewport fitting, target size tracking and uniform
 * marshaling. Everything here is independent of the GPU device.
 */

#include <michadame/crt/shader_params.h>
#include <cstdint>
#include <vector>

namespace michadame::crt {

struct Extent {
    uint32_t width = 0;
    uint32_t height = 0;

    bool empty() const { return width == 0 || height == 0; }
    bool operator==(const Extent& o) const { return width == o.width && height == o.height; }
    bool operator!=(const Extent& o) const { return !(*this == o); }
};

/// Virtual grid the pixelate pass snaps to
inline constexpr Extent PIXELATE_GRID{854, 480};

struct Viewport {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;
};

/**
 * @brief Largest rectangle with the content's aspect ratio, centered in the target.
 *
 * Produces letterbox bars for wider targets and pillarbox bars for taller ones.
 * Returns an empty viewport if either extent is empty.
 */
Viewport computeViewport(Extent content, Extent target);

enum class PassKind {
    Pixelate,
    BloomH,
    BloomV,
    ScanH,
    ScanV,
    Composite,      ///< Final CRT pass into the caller's target
    Passthrough     ///< Plain copy into the caller's target
};

const char* passKindName(PassKind kind);

/**
 * @brief Ordered pass list for the current toggles.
 *
 * - crt: [Pixelate] BloomH BloomV ScanH ScanV Composite
 * - pixelate only: Pixelate Passthrough
 * - neither: Passthrough
 */
std::vector<PassKind> planPasses(bool pixelate, bool crt);

/**
 * @brief Detects capture size changes that require reallocating pass targets.
 *
 * The size is committed separately, after allocation succeeded.
 */
class SizeTracker {
public:
    /// True if `size` differs from the last committed size
    bool needsAllocation(Extent size) const { return size != m_current; }

    /// Record `size` as allocated
    void commit(Extent size) { m_current = size; }

    Extent current() const { return m_current; }

private:
    Extent m_current;
};

// =============================================================================
// Uniform layouts (must match the WGSL structs in crt_shaders.cpp)
// =============================================================================

/// @brief Uniforms for pixelate and the four separable blur passes
struct PassUniforms {
    float sourceSize[2];
    float hardness;     ///< Gaussian scale, exp2(hardness * |x|^shape)
    float shape;        ///< Falloff exponent
};
static_assert(sizeof(PassUniforms) == 16, "PassUniforms layout");

/// @brief Uniforms for the final composite pass
struct CompositeUniforms {
    float sourceSize[2];
    float warp[2];
    float bloomAmount;
    float hardScan;
    float shape;
    float brightBoost;
    float maskDark;
    float maskLight;
    float shadowMask;
    float gamma;        ///< Output encoding exponent
};
static_assert(sizeof(CompositeUniforms) == 48, "CompositeUniforms layout");

PassUniforms makePassUniforms(PassKind kind, Extent captureSize, const ShaderParams& params);

/**
 * @brief Marshal the composite uniforms.
 *
 * With shadow mask 0 the mask intensities are written as 1.0 so the result
 * does not depend on mask_dark or mask_light.
 */
CompositeUniforms makeCompositeUniforms(Extent captureSize, const ShaderParams& params);

} // namespace michadame::crt
