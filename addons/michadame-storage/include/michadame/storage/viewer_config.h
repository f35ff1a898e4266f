#pragma once

/**
 * @file viewer_config.h
 * @brief Persistent viewer settings (JSON)
 *
 * Example:
 * @code
 * ConfigStore store(defaultConfigPath());
 * store.config().crtEnabled = false;
 * store.markDirty();   // written back on destruction
 * @endcode
 */

#include <michadame/crt/shader_params.h>
#include <michadame/video/video_format.h>
#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <memory>
#include <string>

namespace michadame::storage {

struct ViewerConfig {
    std::string videoDevice = "/dev/video0";
    std::string formatFourcc = "MJPG";
    uint32_t width = 1920;
    uint32_t height = 1080;
    uint32_t framerate = 30;
    bool pixelateEnabled = false;
    bool crtEnabled = true;
    crt::ShaderParams shader;

    /**
     * @brief Capture request for the stored mode.
     *
     * The stored mode is advertised as the only supported one; the device
     * rejects it at open time if it cannot deliver it.
     */
    video::CaptureConfig captureConfig() const;
};

nlohmann::json toJson(const ViewerConfig& config);

/**
 * @brief Read a config from JSON.
 *
 * Missing or mistyped keys keep their defaults, unknown shader keys are
 * ignored, and shader values are clamped to their declared ranges.
 */
ViewerConfig fromJson(const nlohmann::json& j);

/// $XDG_CONFIG_HOME/michadame/config.json, falling back to ~/.config
std::string defaultConfigPath();

/**
 * @brief File-backed ViewerConfig that saves itself when dirty.
 */
class ConfigStore {
public:
    explicit ConfigStore(const std::string& path);
    ~ConfigStore();

    ConfigStore(const ConfigStore&) = delete;
    ConfigStore& operator=(const ConfigStore&) = delete;

    /**
     * @brief Reload from disk.
     * @return true if the file was read or does not exist yet; false on a
     *         read or parse error (config is reset to defaults)
     */
    bool load();

    /// Write to disk, creating the parent directory if needed
    bool save();

    ViewerConfig& config() { return config_; }
    const ViewerConfig& config() const { return config_; }

    void markDirty() { dirty_ = true; }
    bool isDirty() const { return dirty_; }
    const std::string& path() const { return path_; }

private:
    std::string path_;
    ViewerConfig config_;
    bool dirty_ = false;
};

} // namespace michadame::storage
