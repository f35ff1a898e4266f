/**
 * @file test_viewer_controls.cpp
 * @brief Unit tests for viewer keyboard handling and command-line overrides
 */

#include <catch2/catch_test_macros.hpp>
#include "viewer_controls.h"

using namespace michadame;

TEST_CASE("Fullscreen key handling", "[cli][fullscreen]") {
    ViewerState state;
    storage::ViewerConfig config;

    SECTION("F toggles between windowed and fullscreen") {
        REQUIRE_FALSE(handleViewerKey(ViewerKey::ToggleFullscreen, state, config));
        REQUIRE(state.fullscreen == FullscreenState::Fullscreen);
        handleViewerKey(ViewerKey::ToggleFullscreen, state, config);
        REQUIRE(state.fullscreen == FullscreenState::Windowed);
    }

    SECTION("Esc only leaves fullscreen") {
        handleViewerKey(ViewerKey::LeaveFullscreen, state, config);
        REQUIRE(state.fullscreen == FullscreenState::Windowed);

        state.fullscreen = FullscreenState::Fullscreen;
        handleViewerKey(ViewerKey::LeaveFullscreen, state, config);
        REQUIRE(state.fullscreen == FullscreenState::Windowed);
    }
}

TEST_CASE("Effect toggles mark the config as changed", "[cli][keys]") {
    ViewerState state;
    storage::ViewerConfig config;

    REQUIRE(handleViewerKey(ViewerKey::ToggleCrt, state, config));
    REQUIRE_FALSE(config.crtEnabled);

    REQUIRE(handleViewerKey(ViewerKey::TogglePixelate, state, config));
    REQUIRE(config.pixelateEnabled);

    SECTION("reset restores shader defaults") {
        REQUIRE_FALSE(handleViewerKey(ViewerKey::ResetShader, state, config));

        config.shader.warpX = 0.2f;
        config.shader.shadowMask = 1.0f;
        REQUIRE(handleViewerKey(ViewerKey::ResetShader, state, config));
        REQUIRE(config.shader == crt::ShaderParams{});
        REQUIRE_FALSE(config.crtEnabled);
    }

    SECTION("quit does not touch the config") {
        storage::ViewerConfig before = config;
        REQUIRE_FALSE(handleViewerKey(ViewerKey::Quit, state, config));
        REQUIRE(state.quitRequested);
        REQUIRE(config.crtEnabled == before.crtEnabled);
        REQUIRE(config.pixelateEnabled == before.pixelateEnabled);
    }
}

TEST_CASE("Command-line overrides", "[cli][config]") {
    storage::ViewerConfig config;

    SECTION("absent overrides leave the config alone") {
        REQUIRE_FALSE(applyOverrides(config, ViewerOverrides{}));
        REQUIRE(config.videoDevice == "/dev/video0");
    }

    SECTION("present overrides replace stored values") {
        ViewerOverrides overrides;
        overrides.device = "/dev/video2";
        overrides.format = "YUYV";
        overrides.width = 1280;
        overrides.height = 720;
        overrides.crtEnabled = false;

        REQUIRE(applyOverrides(config, overrides));
        REQUIRE(config.videoDevice == "/dev/video2");
        REQUIRE(config.formatFourcc == "YUYV");
        REQUIRE(config.width == 1280);
        REQUIRE(config.height == 720);
        REQUIRE(config.framerate == 30);
        REQUIRE_FALSE(config.crtEnabled);
    }

    SECTION("overrides equal to the stored values are not a change") {
        ViewerOverrides overrides;
        overrides.framerate = 30;
        overrides.crtEnabled = true;
        REQUIRE_FALSE(applyOverrides(config, overrides));
    }
}

TEST_CASE("Size parsing", "[cli]") {
    uint32_t w = 0, h = 0;

    REQUIRE(parseSize("1920x1080", w, h));
    REQUIRE(w == 1920);
    REQUIRE(h == 1080);

    REQUIRE_FALSE(parseSize("1920", w, h));
    REQUIRE_FALSE(parseSize("x1080", w, h));
    REQUIRE_FALSE(parseSize("1920x", w, h));
    REQUIRE_FALSE(parseSize("0x1080", w, h));
    REQUIRE_FALSE(parseSize("19a0x1080", w, h));
    REQUIRE_FALSE(parseSize("1920x1080p", w, h));
}
