/**
 * @file test_shader_params.cpp
 * @brief Unit tests for the CRT shader parameter set
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <michadame/crt/shader_params.h>
#include <limits>

using namespace michadame;
using namespace michadame::crt;
using Catch::Matchers::WithinAbs;

TEST_CASE("ShaderParams defaults", "[crt][params]") {
    ShaderParams params;
    float out = 0.0f;

    SECTION("declared defaults match field defaults") {
        for (const auto& decl : ShaderParams::decls()) {
            REQUIRE(params.getParam(decl.name, out));
            REQUIRE_THAT(out, WithinAbs(decl.defaultVal, 0.0001f));
        }
    }

    SECTION("Lottes defaults") {
        REQUIRE_THAT(params.hardScan, WithinAbs(-8.0f, 0.0001f));
        REQUIRE_THAT(params.hardPix, WithinAbs(-3.0f, 0.0001f));
        REQUIRE_THAT(params.warpX, WithinAbs(0.031f, 0.0001f));
        REQUIRE_THAT(params.warpY, WithinAbs(0.041f, 0.0001f));
        REQUIRE(params.shadowMaskType() == 3);
        REQUIRE_THAT(params.gamma, WithinAbs(2.2f, 0.0001f));
    }

    SECTION("every declared name is addressable") {
        REQUIRE(ShaderParams::decls().size() == 13);
        for (const auto& decl : ShaderParams::decls()) {
            REQUIRE(params.setParam(decl.name, decl.defaultVal));
        }
    }
}

TEST_CASE("ShaderParams setParam/getParam", "[crt][params]") {
    ShaderParams params;
    float out = 0.0f;

    SECTION("values inside the range are stored") {
        REQUIRE(params.setParam("bloom_amount", 0.4f));
        REQUIRE(params.getParam("bloom_amount", out));
        REQUIRE_THAT(out, WithinAbs(0.4f, 0.0001f));
    }

    SECTION("values are clamped to the declared range") {
        params.setParam("hard_scan", 5.0f);
        REQUIRE_THAT(params.hardScan, WithinAbs(-1.0f, 0.0001f));
        params.setParam("warp_x", 1.0f);
        REQUIRE_THAT(params.warpX, WithinAbs(0.125f, 0.0001f));
    }

    SECTION("shadow mask is discrete") {
        params.setParam("shadow_mask", 1.6f);
        REQUIRE_THAT(params.shadowMask, WithinAbs(2.0f, 0.0001f));
        REQUIRE(params.shadowMaskType() == 2);
    }

    SECTION("gamma is clamped to 1-3") {
        REQUIRE(params.setParam("gamma", 2.5f));
        REQUIRE_THAT(params.gamma, WithinAbs(2.5f, 0.0001f));
        params.setParam("gamma", 0.2f);
        REQUIRE_THAT(params.gamma, WithinAbs(1.0f, 0.0001f));
        params.setParam("gamma", 8.0f);
        REQUIRE_THAT(params.gamma, WithinAbs(3.0f, 0.0001f));
    }

    SECTION("non-finite values are rejected and the value is kept") {
        const float inf = std::numeric_limits<float>::infinity();
        const float nan = std::numeric_limits<float>::quiet_NaN();
        REQUIRE(params.setParam("shadow_mask", 1.0f));

        REQUIRE_FALSE(params.setParam("shadow_mask", nan));
        REQUIRE_FALSE(params.setParam("shadow_mask", inf));
        REQUIRE_FALSE(params.setParam("shadow_mask", -inf));
        REQUIRE_FALSE(params.setParam("warp_x", nan));
        REQUIRE(params.shadowMaskType() == 1);
        REQUIRE_THAT(params.warpX, WithinAbs(0.031f, 0.0001f));
    }

    SECTION("unknown names are rejected") {
        REQUIRE_FALSE(params.setParam("curvature", 0.5f));
        REQUIRE_FALSE(params.getParam("curvature", out));
    }
}

TEST_CASE("ShaderParams clamped copy", "[crt][params]") {
    ShaderParams params;
    params.brightBoost = 9.0f;
    params.shape = -1.0f;

    ShaderParams safe = params.clamped();
    REQUIRE_THAT(safe.brightBoost, WithinAbs(2.0f, 0.0001f));
    REQUIRE_THAT(safe.shape, WithinAbs(0.0f, 0.0001f));
    REQUIRE(safe != params);
    REQUIRE(safe.clamped() == safe);

    SECTION("NaN fields fall back to their defaults") {
        ShaderParams broken;
        broken.shadowMask = std::numeric_limits<float>::quiet_NaN();
        broken.gamma = std::numeric_limits<float>::quiet_NaN();
        REQUIRE(broken.shadowMaskType() == 0);

        ShaderParams fixed = broken.clamped();
        REQUIRE(fixed.shadowMaskType() == 3);
        REQUIRE_THAT(fixed.gamma, WithinAbs(2.2f, 0.0001f));
    }
}
