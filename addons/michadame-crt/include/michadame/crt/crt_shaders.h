#pragma once

/**
 * @file crt_shaders.h
 * @brief WGSL sources for the CRT render graph passes
 *
 * Each function returns a complete module (shared vertex stage included).
 */

#include <michadame/crt/render_layout.h>
#include <string>

namespace michadame::crt::shaders {

/// Snap source UVs to the PIXELATE_GRID cell centers
std::string pixelate();

/**
 * @brief One-dimensional Gaussian pass with taps at texel centers.
 *
 * Weights are exp2(hardness * |d|^shape) normalized over 2 * radius + 1
 * taps. Passes that read gamma-encoded input linearize it first.
 */
std::string separableBlur(PassKind kind);

/// Number of taps on each side of the center for a blur pass
int blurRadius(PassKind kind);

/// Warp, scanline beam, bloom mix, shadow mask, brightboost, gamma encode
std::string composite();

/// Linear copy of the input into the viewport
std::string passthrough();

} // namespace michadame::crt::shaders
