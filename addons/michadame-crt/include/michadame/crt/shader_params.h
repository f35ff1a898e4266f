#pragma once

/**
 * @file shader_params.h
 * @brief Tunable parameters of the CRT render graph
 */

#include <michadame/param.h>
#include <string>
#include <vector>

namespace michadame::crt {

/**
 * @brief CRT shader parameter set
 *
 * A plain value type; the render graph reads a copy every frame.
 *
 * @par Parameters
 * | Name | Type | Range | Default | Description |
 * |------|------|-------|---------|-------------|
 * | warp_x | float | 0-0.125 | 0.031 | Horizontal barrel curvature |
 * | warp_y | float | 0-0.125 | 0.041 | Vertical barrel curvature |
 * | hard_scan | float | -20 to -1 | -8.0 | Scanline beam hardness |
 * | hard_pix | float | -20 to 0 | -3.0 | Horizontal pixel hardness |
 * | hard_bloom_pix | float | -4 to -0.5 | -1.5 | Bloom horizontal hardness |
 * | hard_bloom_scan | float | -4 to -1 | -2.0 | Bloom vertical hardness |
 * | bloom_amount | float | 0-1 | 0.15 | Bloom contribution |
 * | shape | float | 0-10 | 2.0 | Scanline falloff exponent |
 * | shadow_mask | int | 0-4 | 3 | Mask pattern, 0 disables |
 * | brightboost | float | 0-2 | 1.0 | Output gain |
 * | mask_dark | float | 0-2 | 0.5 | Mask attenuation of unlit phosphors |
 * | mask_light | float | 0-2 | 1.5 | Mask gain of lit phosphors |
 * | gamma | float | 1-3 | 2.2 | Output encoding exponent |
 */
struct ShaderParams {
    float warpX = 0.031f;
    float warpY = 0.041f;
    float hardScan = -8.0f;
    float hardPix = -3.0f;
    float hardBloomPix = -1.5f;
    float hardBloomScan = -2.0f;
    float bloomAmount = 0.15f;
    float shape = 2.0f;
    float shadowMask = 3.0f;
    float brightBoost = 1.0f;
    float maskDark = 0.5f;
    float maskLight = 1.5f;
    float gamma = 2.2f;

    /// Declarations of every parameter, in display order
    static const std::vector<ParamDecl>& decls();

    /**
     * @brief Set a parameter by name, clamped to its declared range
     * @return false if the name is unknown or the value is not finite;
     *         the stored value is then left unchanged
     */
    bool setParam(const std::string& name, float value);

    /**
     * @brief Read a parameter by name
     * @return false if the name is unknown
     */
    bool getParam(const std::string& name, float& out) const;

    /// Copy with every value clamped into range
    ShaderParams clamped() const;

    /// Shadow mask pattern as an integer in [0, 4]
    int shadowMaskType() const;

    bool operator==(const ShaderParams& other) const;
    bool operator!=(const ShaderParams& other) const { return !(*this == other); }

private:
    float* field(const std::string& name);
    const float* field(const std::string& name) const;
};

} // namespace michadame::crt
