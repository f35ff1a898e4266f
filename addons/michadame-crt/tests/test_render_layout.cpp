/**
 * @file test_render_layout.cpp
 * @brief Unit tests for render graph planning and uniform marshaling
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <michadame/crt/crt_shaders.h>
#include <michadame/crt/frame_texture.h>
#include <michadame/crt/render_layout.h>
#include <cstddef>
#include <cstring>

using namespace michadame::crt;
using Catch::Matchers::WithinAbs;

TEST_CASE("Pass plan follows the toggles", "[crt][graph]") {
    SECTION("passthrough only") {
        auto plan = planPasses(false, false);
        REQUIRE(plan == std::vector<PassKind>{PassKind::Passthrough});
    }

    SECTION("pixelate without crt") {
        auto plan = planPasses(true, false);
        REQUIRE(plan == std::vector<PassKind>{PassKind::Pixelate, PassKind::Passthrough});
    }

    SECTION("full crt chain") {
        auto plan = planPasses(false, true);
        REQUIRE(plan == std::vector<PassKind>{PassKind::BloomH, PassKind::BloomV,
                                              PassKind::ScanH, PassKind::ScanV,
                                              PassKind::Composite});
    }

    SECTION("pixelate feeds the crt chain") {
        auto plan = planPasses(true, true);
        REQUIRE(plan.size() == 6);
        REQUIRE(plan.front() == PassKind::Pixelate);
        REQUIRE(plan.back() == PassKind::Composite);
    }
}

TEST_CASE("Viewport preserves the capture aspect ratio", "[crt][graph]") {
    SECTION("same aspect fills the target") {
        Viewport vp = computeViewport({1920, 1080}, {1280, 720});
        REQUIRE_THAT(vp.x, WithinAbs(0.0f, 0.001f));
        REQUIRE_THAT(vp.y, WithinAbs(0.0f, 0.001f));
        REQUIRE_THAT(vp.width, WithinAbs(1280.0f, 0.001f));
        REQUIRE_THAT(vp.height, WithinAbs(720.0f, 0.001f));
    }

    SECTION("4:3 content in a 16:9 target is pillarboxed") {
        Viewport vp = computeViewport({640, 480}, {1920, 1080});
        REQUIRE_THAT(vp.height, WithinAbs(1080.0f, 0.001f));
        REQUIRE_THAT(vp.width, WithinAbs(1440.0f, 0.001f));
        REQUIRE_THAT(vp.x, WithinAbs(240.0f, 0.001f));
        REQUIRE_THAT(vp.y, WithinAbs(0.0f, 0.001f));
    }

    SECTION("16:9 content in a 4:3 target is letterboxed") {
        Viewport vp = computeViewport({1920, 1080}, {1024, 768});
        REQUIRE_THAT(vp.width, WithinAbs(1024.0f, 0.001f));
        REQUIRE_THAT(vp.height, WithinAbs(576.0f, 0.001f));
        REQUIRE_THAT(vp.y, WithinAbs(96.0f, 0.001f));
    }

    SECTION("empty extents give an empty viewport") {
        Viewport vp = computeViewport({0, 0}, {800, 600});
        REQUIRE(vp.width == 0.0f);
        REQUIRE(vp.height == 0.0f);
    }
}

TEST_CASE("Size tracker reports capture size changes", "[crt][graph]") {
    SizeTracker tracker;

    REQUIRE(tracker.needsAllocation({1280, 720}));
    tracker.commit({1280, 720});
    REQUIRE_FALSE(tracker.needsAllocation({1280, 720}));

    SECTION("a new capture size is detected before the next draw") {
        REQUIRE(tracker.needsAllocation({1920, 1080}));
        tracker.commit({1920, 1080});
        REQUIRE(tracker.current() == Extent{1920, 1080});
    }

    SECTION("an uncommitted size is reported again") {
        REQUIRE(tracker.needsAllocation({640, 480}));
        REQUIRE(tracker.needsAllocation({640, 480}));
        REQUIRE(tracker.current() == Extent{1280, 720});
    }
}

TEST_CASE("Pass uniforms pick the right hardness", "[crt][uniforms]") {
    ShaderParams params;
    Extent capture{1280, 720};

    SECTION("blur passes run at capture size") {
        PassUniforms u = makePassUniforms(PassKind::BloomH, capture, params);
        REQUIRE(u.sourceSize[0] == 1280.0f);
        REQUIRE(u.sourceSize[1] == 720.0f);
        REQUIRE_THAT(u.hardness, WithinAbs(params.hardBloomPix, 0.0001f));
        REQUIRE_THAT(u.shape, WithinAbs(2.0f, 0.0001f));
    }

    SECTION("vertical scan pass uses the shape exponent") {
        params.shape = 3.5f;
        PassUniforms u = makePassUniforms(PassKind::ScanV, capture, params);
        REQUIRE_THAT(u.hardness, WithinAbs(params.hardScan, 0.0001f));
        REQUIRE_THAT(u.shape, WithinAbs(3.5f, 0.0001f));
    }

    SECTION("pixelate snaps to the fixed grid") {
        PassUniforms u = makePassUniforms(PassKind::Pixelate, capture, params);
        REQUIRE(u.sourceSize[0] == 854.0f);
        REQUIRE(u.sourceSize[1] == 480.0f);
    }
}

TEST_CASE("Composite uniforms", "[crt][uniforms]") {
    ShaderParams params;
    Extent capture{1920, 1080};

    SECTION("values are marshaled") {
        CompositeUniforms u = makeCompositeUniforms(capture, params);
        REQUIRE_THAT(u.warp[0], WithinAbs(params.warpX, 0.0001f));
        REQUIRE_THAT(u.warp[1], WithinAbs(params.warpY, 0.0001f));
        REQUIRE_THAT(u.bloomAmount, WithinAbs(params.bloomAmount, 0.0001f));
        REQUIRE_THAT(u.brightBoost, WithinAbs(params.brightBoost, 0.0001f));
        REQUIRE_THAT(u.maskDark, WithinAbs(0.5f, 0.0001f));
        REQUIRE_THAT(u.maskLight, WithinAbs(1.5f, 0.0001f));
        REQUIRE(u.shadowMask == 3.0f);
        REQUIRE_THAT(u.gamma, WithinAbs(2.2f, 0.0001f));
    }

    SECTION("output gamma follows the parameter") {
        params.gamma = 1.8f;
        CompositeUniforms u = makeCompositeUniforms(capture, params);
        REQUIRE_THAT(u.gamma, WithinAbs(1.8f, 0.0001f));
        REQUIRE(offsetof(CompositeUniforms, gamma) == 44);
    }

    SECTION("shadow mask 0 ignores mask intensities") {
        ShaderParams a;
        a.shadowMask = 0.0f;
        ShaderParams b = a;
        b.maskDark = 0.1f;
        b.maskLight = 1.9f;

        CompositeUniforms ua = makeCompositeUniforms(capture, a);
        CompositeUniforms ub = makeCompositeUniforms(capture, b);
        REQUIRE(std::memcmp(&ua, &ub, sizeof(CompositeUniforms)) == 0);
        REQUIRE(ua.maskDark == 1.0f);
        REQUIRE(ua.maskLight == 1.0f);
    }
}

TEST_CASE("Pass shaders", "[crt][shaders]") {
    SECTION("tap counts") {
        REQUIRE(shaders::blurRadius(PassKind::BloomH) == 3);
        REQUIRE(shaders::blurRadius(PassKind::BloomV) == 2);
        REQUIRE(shaders::blurRadius(PassKind::ScanH) == 2);
        REQUIRE(shaders::blurRadius(PassKind::ScanV) == 2);
    }

    SECTION("horizontal passes linearize their input") {
        std::string h = shaders::separableBlur(PassKind::ScanH);
        std::string v = shaders::separableBlur(PassKind::ScanV);
        REQUIRE(h.find("const LINEARIZE: bool = true;") != std::string::npos);
        REQUIRE(v.find("const LINEARIZE: bool = false;") != std::string::npos);
        REQUIRE(h.find("vec2f(1.0, 0.0)") != std::string::npos);
    }

    SECTION("every module carries the shared vertex stage") {
        for (const std::string& src : {shaders::pixelate(), shaders::composite(), shaders::passthrough()}) {
            REQUIRE(src.find("fn vs_main") != std::string::npos);
            REQUIRE(src.find("fn fs_main") != std::string::npos);
        }
    }

    SECTION("composite encodes with the uniform gamma") {
        std::string src = shaders::composite();
        REQUIRE(src.find("gamma: f32,") != std::string::npos);
        REQUIRE(src.find("toGamma(color, uniforms.gamma)") != std::string::npos);
    }
}

TEST_CASE("RGB24 frames expand to opaque RGBA", "[crt][upload]") {
    const uint8_t rgb[6] = {10, 20, 30, 40, 50, 60};
    uint8_t rgba[8] = {};
    expandRGB24toRGBA(rgb, rgba, 2);

    const uint8_t expected[8] = {10, 20, 30, 255, 40, 50, 60, 255};
    REQUIRE(std::memcmp(rgba, expected, sizeof(expected)) == 0);
}
