/**
 * @file test_viewer_config.cpp
 * @brief Unit tests for viewer config persistence
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <michadame/storage/viewer_config.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

using namespace michadame;
using namespace michadame::storage;
using Catch::Matchers::WithinAbs;
using json = nlohmann::json;

namespace {

std::filesystem::path tempConfigPath(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / "michadame-tests";
    std::filesystem::create_directories(dir);
    auto path = dir / name;
    std::filesystem::remove(path);
    return path;
}

} // namespace

TEST_CASE("ViewerConfig JSON mapping", "[storage][config]") {
    SECTION("keys written to disk") {
        ViewerConfig config;
        config.videoDevice = "/dev/video2";
        config.formatFourcc = "YUYV";
        config.width = 1280;
        config.height = 720;
        config.framerate = 60;
        config.pixelateEnabled = true;
        config.shader.bloomAmount = 0.5f;

        json j = toJson(config);
        REQUIRE(j["video_device"] == "/dev/video2");
        REQUIRE(j["video_format_fourcc"] == "YUYV");
        REQUIRE(j["video_resolution"][0] == 1280);
        REQUIRE(j["video_resolution"][1] == 720);
        REQUIRE(j["video_framerate"] == 60);
        REQUIRE(j["pixelate_enabled"] == true);
        REQUIRE(j["shader"].size() == crt::ShaderParams::decls().size());
        REQUIRE_THAT(j["shader"]["bloom_amount"].get<float>(), WithinAbs(0.5f, 0.0001f));
    }

    SECTION("missing keys keep defaults") {
        ViewerConfig config = fromJson(json{{"crt_enabled", false}});
        REQUIRE_FALSE(config.crtEnabled);
        REQUIRE(config.videoDevice == ViewerConfig().videoDevice);
        REQUIRE(config.shader == crt::ShaderParams());
    }

    SECTION("mistyped keys are ignored") {
        ViewerConfig config = fromJson(json{{"video_framerate", "thirty"},
                                            {"video_resolution", {1, 2, 3}}});
        REQUIRE(config.framerate == ViewerConfig().framerate);
        REQUIRE(config.width == ViewerConfig().width);
    }

    SECTION("shader values are clamped and unknown keys ignored") {
        json j = {{"shader", {{"hard_scan", 10.0}, {"curvature", 0.3}, {"shadow_mask", 0}}}};
        ViewerConfig config = fromJson(j);
        REQUIRE_THAT(config.shader.hardScan, WithinAbs(-1.0f, 0.0001f));
        REQUIRE(config.shader.shadowMaskType() == 0);
    }

    SECTION("out-of-float-range shader values clamp to the bounds") {
        json j = {{"shader", {{"bloom_amount", 1e300}, {"shape", -1e300},
                              {"shadow_mask", 1e300}, {"gamma", -1e300}}}};
        ViewerConfig config = fromJson(j);
        REQUIRE_THAT(config.shader.bloomAmount, WithinAbs(1.0f, 0.0001f));
        REQUIRE_THAT(config.shader.shape, WithinAbs(0.0f, 0.0001f));
        REQUIRE(config.shader.shadowMaskType() == 4);
        REQUIRE_THAT(config.shader.gamma, WithinAbs(1.0f, 0.0001f));
    }

    SECTION("gamma is persisted") {
        ViewerConfig config;
        config.shader.gamma = 2.6f;
        json j = toJson(config);
        REQUIRE_THAT(j["shader"]["gamma"].get<float>(), WithinAbs(2.6f, 0.0001f));
        REQUIRE_THAT(fromJson(j).shader.gamma, WithinAbs(2.6f, 0.0001f));
    }
}

TEST_CASE("ViewerConfig capture request", "[storage][config]") {
    ViewerConfig config;
    config.formatFourcc = "YUYV";
    config.width = 640;
    config.height = 480;
    config.framerate = 30;

    video::CaptureConfig capture = config.captureConfig();
    REQUIRE(capture.device == config.videoDevice);
    REQUIRE(capture.format.fourcc == "YUYV");
    REQUIRE_NOTHROW(capture.validate());
}

TEST_CASE("ConfigStore load and save", "[storage][config]") {
    SECTION("missing file yields defaults") {
        auto path = tempConfigPath("missing.json");
        ConfigStore store(path.string());
        REQUIRE(store.load());
        REQUIRE(store.config().crtEnabled);
        REQUIRE_FALSE(store.isDirty());
    }

    SECTION("dirty store saves on destruction") {
        auto path = tempConfigPath("roundtrip.json");
        {
            ConfigStore store(path.string());
            store.config().crtEnabled = false;
            store.config().shader.brightBoost = 1.4f;
            store.markDirty();
        }
        REQUIRE(std::filesystem::exists(path));

        ConfigStore reloaded(path.string());
        REQUIRE_FALSE(reloaded.config().crtEnabled);
        REQUIRE_THAT(reloaded.config().shader.brightBoost, WithinAbs(1.4f, 0.0001f));
    }

    SECTION("parse errors reset to defaults") {
        auto path = tempConfigPath("broken.json");
        {
            std::ofstream out(path);
            out << "{ not json";
        }
        ConfigStore store(path.string());
        REQUIRE_FALSE(store.load());
        REQUIRE(store.config().crtEnabled);
    }
}
