// Michadame - GPU Common Utilities Implementation

#include <michadame/effects/gpu_common.h>
#include <webgpu/wgpu.h>
#include <unordered_map>

namespace michadame::effects::gpu {

// =============================================================================
// Sampler Cache
// =============================================================================

enum class SamplerKind { LinearClamp, NearestClamp };

struct SamplerKey {
    WGPUDevice device;
    SamplerKind kind;

    bool operator==(const SamplerKey& other) const {
        return device == other.device && kind == other.kind;
    }
};

struct SamplerKeyHash {
    size_t operator()(const SamplerKey& k) const {
        return std::hash<void*>()(k.device) ^ (std::hash<int>()(static_cast<int>(k.kind)) << 1);
    }
};

static std::unordered_map<SamplerKey, WGPUSampler, SamplerKeyHash> s_samplerCache;

static WGPUSampler createSampler(WGPUDevice device, WGPUFilterMode filter) {
    WGPUSamplerDescriptor desc = {};
    desc.addressModeU = WGPUAddressMode_ClampToEdge;
    desc.addressModeV = WGPUAddressMode_ClampToEdge;
    desc.addressModeW = WGPUAddressMode_ClampToEdge;
    desc.magFilter = filter;
    desc.minFilter = filter;
    desc.mipmapFilter = WGPUMipmapFilterMode_Nearest;
    desc.maxAnisotropy = 1;
    return wgpuDeviceCreateSampler(device, &desc);
}

static WGPUSampler cachedSampler(WGPUDevice device, SamplerKind kind) {
    SamplerKey key{device, kind};
    auto it = s_samplerCache.find(key);
    if (it != s_samplerCache.end()) {
        return it->second;
    }
    WGPUFilterMode filter = kind == SamplerKind::LinearClamp
        ? WGPUFilterMode_Linear
        : WGPUFilterMode_Nearest;
    WGPUSampler sampler = createSampler(device, filter);
    s_samplerCache[key] = sampler;
    return sampler;
}

WGPUSampler getLinearClampSampler(WGPUDevice device) {
    return cachedSampler(device, SamplerKind::LinearClamp);
}

WGPUSampler getNearestClampSampler(WGPUDevice device) {
    return cachedSampler(device, SamplerKind::NearestClamp);
}

void releaseSamplers(WGPUDevice device) {
    for (auto it = s_samplerCache.begin(); it != s_samplerCache.end();) {
        if (it->first.device == device) {
            release(it->second);
            it = s_samplerCache.erase(it);
        } else {
            ++it;
        }
    }
}

// =============================================================================
// Error Scopes
// =============================================================================

namespace {

const char* errorTypeName(WGPUErrorType type) {
    switch (type) {
        case WGPUErrorType_Validation: return "validation error";
        case WGPUErrorType_OutOfMemory: return "out of memory";
        case WGPUErrorType_Internal: return "internal error";
        default: return "unknown error";
    }
}

struct ErrorScopeResult {
    bool done = false;
    std::string message;
};

void onErrorScopePopped(WGPUPopErrorScopeStatus status, WGPUErrorType type,
                        WGPUStringView message, void* userdata1, void* userdata2) {
    (void)userdata2;
    auto* result = static_cast<ErrorScopeResult*>(userdata1);
    result->message = describeErrorScope(status, type, message);
    result->done = true;
}

} // namespace

std::string describeErrorScope(WGPUPopErrorScopeStatus status, WGPUErrorType type,
                               WGPUStringView message) {
    if (status != WGPUPopErrorScopeStatus_Success) {
        return "error scope could not be popped";
    }
    if (type == WGPUErrorType_NoError) {
        return std::string();
    }

    std::string text = errorTypeName(type);
    if (message.data) {
        text += ": ";
        if (message.length == WGPU_STRLEN) {
            text += message.data;
        } else {
            text.append(message.data, message.length);
        }
    }
    return text;
}

std::string popErrorScope(WGPUDevice device) {
    ErrorScopeResult result;
    WGPUPopErrorScopeCallbackInfo callbackInfo = {};
    callbackInfo.mode = WGPUCallbackMode_AllowSpontaneous;
    callbackInfo.callback = onErrorScopePopped;
    callbackInfo.userdata1 = &result;

    wgpuDevicePopErrorScope(device, callbackInfo);
    while (!result.done) {
        wgpuDevicePoll(device, true, nullptr);
    }
    return result.message;
}

} // namespace michadame::effects::gpu
