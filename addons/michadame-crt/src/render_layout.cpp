// Michadame CRT - Render Graph Planning

#include <michadame/crt/render_layout.h>
#include <algorithm>

namespace michadame::crt {

Viewport computeViewport(Extent content, Extent target) {
    Viewport vp;
    if (content.empty() || target.empty()) {
        return vp;
    }

    float contentAspect = static_cast<float>(content.width) / content.height;
    float targetAspect = static_cast<float>(target.width) / target.height;

    if (targetAspect > contentAspect) {
        // Target is wider: pillarbox
        vp.height = static_cast<float>(target.height);
        vp.width = vp.height * contentAspect;
    } else {
        // Target is taller: letterbox
        vp.width = static_cast<float>(target.width);
        vp.height = vp.width / contentAspect;
    }
    vp.width = std::min(vp.width, static_cast<float>(target.width));
    vp.height = std::min(vp.height, static_cast<float>(target.height));
    vp.x = (target.width - vp.width) * 0.5f;
    vp.y = (target.height - vp.height) * 0.5f;
    return vp;
}

const char* passKindName(PassKind kind) {
    switch (kind) {
        case PassKind::Pixelate:    return "Pixelate";
        case PassKind::BloomH:      return "BloomH";
        case PassKind::BloomV:      return "BloomV";
        case PassKind::ScanH:       return "ScanH";
        case PassKind::ScanV:       return "ScanV";
        case PassKind::Composite:   return "Composite";
        case PassKind::Passthrough: return "Passthrough";
        default:                    return "Unknown";
    }
}

std::vector<PassKind> planPasses(bool pixelate, bool crt) {
    std::vector<PassKind> passes;
    if (pixelate) {
        passes.push_back(PassKind::Pixelate);
    }
    if (crt) {
        passes.insert(passes.end(), {PassKind::BloomH, PassKind::BloomV,
                                     PassKind::ScanH, PassKind::ScanV,
                                     PassKind::Composite});
    } else {
        passes.push_back(PassKind::Passthrough);
    }
    return passes;
}

PassUniforms makePassUniforms(PassKind kind, Extent captureSize, const ShaderParams& params) {
    PassUniforms u = {};
    u.sourceSize[0] = static_cast<float>(captureSize.width);
    u.sourceSize[1] = static_cast<float>(captureSize.height);
    u.shape = 2.0f;

    switch (kind) {
        case PassKind::Pixelate:
            u.sourceSize[0] = static_cast<float>(PIXELATE_GRID.width);
            u.sourceSize[1] = static_cast<float>(PIXELATE_GRID.height);
            break;
        case PassKind::BloomH:
            u.hardness = params.hardBloomPix;
            break;
        case PassKind::BloomV:
            u.hardness = params.hardBloomScan;
            break;
        case PassKind::ScanH:
            u.hardness = params.hardPix;
            break;
        case PassKind::ScanV:
            u.hardness = params.hardScan;
            u.shape = params.shape;
            break;
        case PassKind::Composite:
        case PassKind::Passthrough:
            break;
    }
    return u;
}

CompositeUniforms makeCompositeUniforms(Extent captureSize, const ShaderParams& params) {
    CompositeUniforms u = {};
    u.sourceSize[0] = static_cast<float>(captureSize.width);
    u.sourceSize[1] = static_cast<float>(captureSize.height);
    u.warp[0] = params.warpX;
    u.warp[1] = params.warpY;
    u.bloomAmount = params.bloomAmount;
    u.hardScan = params.hardScan;
    u.shape = params.shape;
    u.brightBoost = params.brightBoost;
    u.gamma = std::clamp(params.gamma, 1.0f, 3.0f);

    int mask = params.shadowMaskType();
    u.shadowMask = static_cast<float>(mask);
    u.maskDark = mask == 0 ? 1.0f : params.maskDark;
    u.maskLight = mask == 0 ? 1.0f : params.maskLight;
    return u;
}

} // namespace michadame::crt
