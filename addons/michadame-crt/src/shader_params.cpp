// Michadame CRT - Shader Parameter Set

#include <michadame/crt/shader_params.h>
#include <algorithm>
#include <cmath>

namespace michadame::crt {

const std::vector<ParamDecl>& ShaderParams::decls() {
    static const std::vector<ParamDecl> s_decls = {
        {"warp_x",          ParamType::Float,   0.0f,   0.125f, 0.031f},
        {"warp_y",          ParamType::Float,   0.0f,   0.125f, 0.041f},
        {"hard_scan",       ParamType::Float, -20.0f,  -1.0f,  -8.0f},
        {"hard_pix",        ParamType::Float, -20.0f,   0.0f,  -3.0f},
        {"hard_bloom_pix",  ParamType::Float,  -4.0f,  -0.5f,  -1.5f},
        {"hard_bloom_scan", ParamType::Float,  -4.0f,  -1.0f,  -2.0f},
        {"bloom_amount",    ParamType::Float,   0.0f,   1.0f,   0.15f},
        {"shape",           ParamType::Float,   0.0f,  10.0f,   2.0f},
        {"shadow_mask",     ParamType::Int,     0.0f,   4.0f,   3.0f},
        {"brightboost",     ParamType::Float,   0.0f,   2.0f,   1.0f},
        {"mask_dark",       ParamType::Float,   0.0f,   2.0f,   0.5f},
        {"mask_light",      ParamType::Float,   0.0f,   2.0f,   1.5f},
        {"gamma",           ParamType::Float,   1.0f,   3.0f,   2.2f},
    };
    return s_decls;
}

const float* ShaderParams::field(const std::string& name) const {
    if (name == "warp_x") return &warpX;
    if (name == "warp_y") return &warpY;
    if (name == "hard_scan") return &hardScan;
    if (name == "hard_pix") return &hardPix;
    if (name == "hard_bloom_pix") return &hardBloomPix;
    if (name == "hard_bloom_scan") return &hardBloomScan;
    if (name == "bloom_amount") return &bloomAmount;
    if (name == "shape") return &shape;
    if (name == "shadow_mask") return &shadowMask;
    if (name == "brightboost") return &brightBoost;
    if (name == "mask_dark") return &maskDark;
    if (name == "mask_light") return &maskLight;
    if (name == "gamma") return &gamma;
    return nullptr;
}

float* ShaderParams::field(const std::string& name) {
    return const_cast<float*>(static_cast<const ShaderParams*>(this)->field(name));
}

bool ShaderParams::setParam(const std::string& name, float value) {
    const ParamDecl* decl = findParam(decls(), name);
    float* target = field(name);
    if (!decl || !target || !std::isfinite(value)) return false;
    *target = decl->clamp(value);
    return true;
}

bool ShaderParams::getParam(const std::string& name, float& out) const {
    const float* source = field(name);
    if (!source) return false;
    out = *source;
    return true;
}

ShaderParams ShaderParams::clamped() const {
    ShaderParams out = *this;
    for (const auto& decl : decls()) {
        float* value = out.field(decl.name);
        *value = decl.clamp(*value);
    }
    return out;
}

int ShaderParams::shadowMaskType() const {
    if (!std::isfinite(shadowMask)) return 0;
    int type = static_cast<int>(std::lround(std::clamp(shadowMask, 0.0f, 4.0f)));
    return type < 0 ? 0 : (type > 4 ? 4 : type);
}

bool ShaderParams::operator==(const ShaderParams& other) const {
    for (const auto& decl : decls()) {
        float a = 0.0f;
        float b = 0.0f;
        getParam(decl.name, a);
        other.getParam(decl.name, b);
        if (a != b) return false;
    }
    return true;
}

} // namespace michadame::crt
