// Michadame CRT - WGSL Shader Sources

#include <michadame/crt/crt_shaders.h>
#include <michadame/effects/gpu_common.h>

namespace michadame::crt::shaders {

namespace gpu = michadame::effects::gpu;

namespace {

const char* PASS_BINDINGS = R"(
struct Uniforms {
    sourceSize: vec2f,
    hardness: f32,
    shape: f32,
};

@group(0) @binding(0) var<uniform> uniforms: Uniforms;
@group(0) @binding(1) var inputTex: texture_2d<f32>;
@group(0) @binding(2) var texSampler: sampler;
)";

} // namespace

std::string pixelate() {
    const char* fragment = R"(
@fragment
fn fs_main(input: VertexOutput) -> @location(0) vec4f {
    let grid = uniforms.sourceSize;
    let cell = (floor(input.uv * grid) + vec2f(0.5)) / grid;
    return vec4f(textureSample(inputTex, texSampler, cell).rgb, 1.0);
}
)";
    return std::string(gpu::FULLSCREEN_VERTEX_SHADER) + PASS_BINDINGS + fragment;
}

int blurRadius(PassKind kind) {
    switch (kind) {
        case PassKind::BloomH: return 3;   // 7 taps
        case PassKind::BloomV: return 2;
        case PassKind::ScanH:  return 2;
        case PassKind::ScanV:  return 2;
        default:               return 0;
    }
}

std::string separableBlur(PassKind kind) {
    bool horizontal = kind == PassKind::BloomH || kind == PassKind::ScanH;
    // Horizontal passes read the gamma-encoded source; vertical ones read our linear output
    bool linearize = horizontal;
    std::string radius = std::to_string(blurRadius(kind));

    std::string fragment = R"(
const RADIUS: i32 = )" + radius + R"(;
const AXIS: vec2f = )" + (horizontal ? "vec2f(1.0, 0.0)" : "vec2f(0.0, 1.0)") + R"(;
const LINEARIZE: bool = )" + (linearize ? "true" : "false") + R"(;

fn fetch(texel: vec2f) -> vec3f {
    let uv = texel / uniforms.sourceSize;
    if (max(abs(uv.x - 0.5), abs(uv.y - 0.5)) > 0.5) {
        return vec3f(0.0);
    }
    let c = textureSampleLevel(inputTex, texSampler, uv, 0.0).rgb;
    if (LINEARIZE) {
        return toLinear(c);
    }
    return c;
}

fn weight(d: f32) -> f32 {
    return exp2(uniforms.hardness * pow(max(abs(d), 1.0e-4), uniforms.shape));
}

@fragment
fn fs_main(input: VertexOutput) -> @location(0) vec4f {
    let pos = input.uv * uniforms.sourceSize;
    let base = floor(pos);
    let dist = dot(-((pos - base) - vec2f(0.5)), AXIS);

    var sum = vec3f(0.0);
    var total = 0.0;
    for (var i = -RADIUS; i <= RADIUS; i++) {
        let off = f32(i);
        let w = weight(dist + off);
        sum += fetch(base + vec2f(0.5) + AXIS * off) * w;
        total += w;
    }
    return vec4f(sum / max(total, 1.0e-6), 1.0);
}
)";
    return std::string(gpu::FULLSCREEN_VERTEX_SHADER) + gpu::wgsl::GAMMA + PASS_BINDINGS + fragment;
}

std::string composite() {
    const char* fragment = R"(
struct Uniforms {
    sourceSize: vec2f,
    warp: vec2f,
    bloomAmount: f32,
    hardScan: f32,
    shape: f32,
    brightBoost: f32,
    maskDark: f32,
    maskLight: f32,
    shadowMask: f32,
    gamma: f32,
};

@group(0) @binding(0) var<uniform> uniforms: Uniforms;
@group(0) @binding(1) var scanTex: texture_2d<f32>;
@group(0) @binding(2) var bloomTex: texture_2d<f32>;
@group(0) @binding(3) var texSampler: sampler;

fn warp(uv: vec2f) -> vec2f {
    var pos = uv * 2.0 - 1.0;
    pos *= vec2f(1.0 + (pos.y * pos.y) * uniforms.warp.x,
                 1.0 + (pos.x * pos.x) * uniforms.warp.y);
    return pos * 0.5 + 0.5;
}

fn beam(d: f32) -> f32 {
    return exp2(uniforms.hardScan * pow(max(abs(d), 1.0e-4), uniforms.shape));
}

fn mask(fragPos: vec2f) -> vec3f {
    let maskType = i32(uniforms.shadowMask + 0.5);
    var m = vec3f(uniforms.maskDark);
    var pos = fragPos;

    if (maskType == 1) {
        // Compressed TV style shadow mask
        var line = uniforms.maskLight;
        var odd = 0.0;
        if (fract(pos.x / 6.0) < 0.5) {
            odd = 1.0;
        }
        if (fract((pos.y + odd) / 2.0) < 0.5) {
            line = uniforms.maskDark;
        }
        let x = fract(pos.x / 3.0);
        if (x < 0.333) { m.r = uniforms.maskLight; }
        else if (x < 0.666) { m.g = uniforms.maskLight; }
        else { m.b = uniforms.maskLight; }
        return m * line;
    } else if (maskType == 2) {
        // Aperture grille
        let x = fract(pos.x / 3.0);
        if (x < 0.333) { m.r = uniforms.maskLight; }
        else if (x < 0.666) { m.g = uniforms.maskLight; }
        else { m.b = uniforms.maskLight; }
        return m;
    } else if (maskType == 3) {
        // Stretched VGA style shadow mask
        pos.x += pos.y * 3.0;
        let x = fract(pos.x / 6.0);
        if (x < 0.333) { m.r = uniforms.maskLight; }
        else if (x < 0.666) { m.g = uniforms.maskLight; }
        else { m.b = uniforms.maskLight; }
        return m;
    } else if (maskType == 4) {
        // VGA style shadow mask
        pos = floor(pos * vec2f(1.0, 0.5));
        pos.x += pos.y * 3.0;
        let x = fract(pos.x / 6.0);
        if (x < 0.333) { m.r = uniforms.maskLight; }
        else if (x < 0.666) { m.g = uniforms.maskLight; }
        else { m.b = uniforms.maskLight; }
        return m;
    }
    return vec3f(1.0);
}

@fragment
fn fs_main(input: VertexOutput) -> @location(0) vec4f {
    let uv = warp(input.uv);
    if (max(abs(uv.x - 0.5), abs(uv.y - 0.5)) > 0.5) {
        return vec4f(0.0, 0.0, 0.0, 1.0);
    }

    // Beam profile over the nearest three source rows at output resolution
    let pos = uv * uniforms.sourceSize;
    let dist = -((pos.y - floor(pos.y)) - 0.5);
    let profile = beam(dist - 1.0) + beam(dist) + beam(dist + 1.0);

    let scan = textureSampleLevel(scanTex, texSampler, uv, 0.0).rgb;
    let bloom = textureSampleLevel(bloomTex, texSampler, uv, 0.0).rgb;
    var color = scan * profile + bloom * uniforms.bloomAmount;
    color *= mask(input.position.xy);
    color *= uniforms.brightBoost;
    return vec4f(toGamma(color, uniforms.gamma), 1.0);
}
)";
    return std::string(gpu::FULLSCREEN_VERTEX_SHADER) + gpu::wgsl::GAMMA + fragment;
}

std::string passthrough() {
    const char* fragment = R"(
@fragment
fn fs_main(input: VertexOutput) -> @location(0) vec4f {
    return vec4f(textureSample(inputTex, texSampler, input.uv).rgb, 1.0);
}
)";
    return std::string(gpu::FULLSCREEN_VERTEX_SHADER) + PASS_BINDINGS + fragment;
}

} // namespace michadame::crt::shaders
