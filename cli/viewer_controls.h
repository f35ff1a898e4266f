// Michadame Viewer Controls
// Keyboard handling and command-line overrides for the viewer, kept free of
// windowing code so they can be tested directly

#pragma once

#include <michadame/storage/viewer_config.h>
#include <cstdint>
#include <optional>
#include <string>

namespace michadame {

enum class FullscreenState {
    Windowed,
    Fullscreen
};

enum class ViewerKey {
    ToggleFullscreen,   // F
    LeaveFullscreen,    // Esc
    ToggleCrt,          // C
    TogglePixelate,     // G
    ResetShader,        // R
    Quit                // Q
};

struct ViewerState {
    FullscreenState fullscreen = FullscreenState::Windowed;
    bool quitRequested = false;
};

/**
 * @brief Apply one key press.
 * @return true if a persisted setting in `config` changed
 */
bool handleViewerKey(ViewerKey key, ViewerState& state, storage::ViewerConfig& config);

// Command-line values that override the stored config when present
struct ViewerOverrides {
    std::optional<std::string> device;
    std::optional<std::string> format;
    std::optional<uint32_t> width;
    std::optional<uint32_t> height;
    std::optional<uint32_t> framerate;
    std::optional<bool> crtEnabled;
    std::optional<bool> pixelateEnabled;
};

/**
 * @brief Copy every present override into `config`.
 * @return true if any stored value changed
 */
bool applyOverrides(storage::ViewerConfig& config, const ViewerOverrides& overrides);

/**
 * @brief Parse "WxH" (e.g. "1280x720").
 * @return false if the string is malformed or either side is zero
 */
bool parseSize(const std::string& s, uint32_t& width, uint32_t& height);

} // namespace michadame
