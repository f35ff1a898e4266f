// Michadame Storage - Viewer Config

#include <michadame/storage/viewer_config.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>

namespace michadame::storage {

using json = nlohmann::json;

video::CaptureConfig ViewerConfig::captureConfig() const {
    video::CaptureConfig capture;
    capture.device = videoDevice;
    capture.format.fourcc = formatFourcc;
    capture.format.description = formatFourcc;
    capture.format.resolutions = {{width, height, {framerate}}};
    capture.width = width;
    capture.height = height;
    capture.framerate = framerate;
    return capture;
}

json toJson(const ViewerConfig& config) {
    json shader = json::object();
    for (const auto& decl : crt::ShaderParams::decls()) {
        float value = 0.0f;
        config.shader.getParam(decl.name, value);
        shader[decl.name] = value;
    }

    return json{
        {"video_device", config.videoDevice},
        {"video_format_fourcc", config.formatFourcc},
        {"video_resolution", {config.width, config.height}},
        {"video_framerate", config.framerate},
        {"pixelate_enabled", config.pixelateEnabled},
        {"crt_enabled", config.crtEnabled},
        {"shader", shader},
    };
}

ViewerConfig fromJson(const json& j) {
    ViewerConfig config;
    if (!j.is_object()) {
        return config;
    }

    if (j.contains("video_device") && j["video_device"].is_string()) {
        config.videoDevice = j["video_device"].get<std::string>();
    }
    if (j.contains("video_format_fourcc") && j["video_format_fourcc"].is_string()) {
        config.formatFourcc = j["video_format_fourcc"].get<std::string>();
    }
    if (j.contains("video_resolution")) {
        const json& res = j["video_resolution"];
        if (res.is_array() && res.size() == 2 &&
            res[0].is_number_unsigned() && res[1].is_number_unsigned()) {
            config.width = res[0].get<uint32_t>();
            config.height = res[1].get<uint32_t>();
        }
    }
    if (j.contains("video_framerate") && j["video_framerate"].is_number_unsigned()) {
        config.framerate = j["video_framerate"].get<uint32_t>();
    }
    if (j.contains("pixelate_enabled") && j["pixelate_enabled"].is_boolean()) {
        config.pixelateEnabled = j["pixelate_enabled"].get<bool>();
    }
    if (j.contains("crt_enabled") && j["crt_enabled"].is_boolean()) {
        config.crtEnabled = j["crt_enabled"].get<bool>();
    }
    if (j.contains("shader") && j["shader"].is_object()) {
        for (const auto& [key, value] : j["shader"].items()) {
            if (value.is_number()) {
                // Narrowing an out-of-range double to float is undefined
                const ParamDecl* decl = findParam(crt::ShaderParams::decls(), key);
                double raw = value.get<double>();
                if (decl && std::isfinite(raw)) {
                    raw = std::clamp(raw, static_cast<double>(decl->minVal), static_cast<double>(decl->maxVal));
                    config.shader.setParam(key, static_cast<float>(raw));
                }
            }
        }
    }
    return config;
}

std::string defaultConfigPath() {
    std::filesystem::path base;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        base = xdg;
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        base = std::filesystem::path(home) / ".config";
    } else {
        base = std::filesystem::current_path();
    }
    return (base / "michadame" / "config.json").string();
}

ConfigStore::ConfigStore(const std::string& path)
    : path_(path) {
    load();
}

ConfigStore::~ConfigStore() {
    if (dirty_) {
        save();
    }
}

bool ConfigStore::load() {
    config_ = ViewerConfig();
    dirty_ = false;

    if (!std::filesystem::exists(path_)) {
        return true;  // First run, defaults are valid
    }

    std::ifstream file(path_);
    if (!file.is_open()) {
        std::cerr << "[ConfigStore] Failed to open: " << path_ << "\n";
        return false;
    }

    try {
        json data;
        file >> data;
        config_ = fromJson(data);
        std::cout << "[ConfigStore] Loaded: " << path_ << "\n";
        return true;
    } catch (const json::exception& e) {
        std::cerr << "[ConfigStore] Parse error in " << path_ << ": " << e.what() << "\n";
        config_ = ViewerConfig();
        return false;
    }
}

bool ConfigStore::save() {
    std::error_code ec;
    std::filesystem::path parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            std::cerr << "[ConfigStore] Failed to create " << parent.string() << ": " << ec.message() << "\n";
            return false;
        }
    }

    std::ofstream file(path_);
    if (!file.is_open()) {
        std::cerr << "[ConfigStore] Failed to write: " << path_ << "\n";
        return false;
    }

    try {
        file << std::setw(2) << toJson(config_) << std::endl;
        dirty_ = false;
        std::cout << "[ConfigStore] Saved: " << path_ << "\n";
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigStore] Write error: " << e.what() << "\n";
        return false;
    }
}

} // namespace michadame::storage
