// Michadame Viewer Controls - Implementation

#include "viewer_controls.h"
#include <cstdlib>

namespace michadame {

bool handleViewerKey(ViewerKey key, ViewerState& state, storage::ViewerConfig& config) {
    switch (key) {
        case ViewerKey::ToggleFullscreen:
            state.fullscreen = state.fullscreen == FullscreenState::Windowed
                ? FullscreenState::Fullscreen
                : FullscreenState::Windowed;
            return false;

        case ViewerKey::LeaveFullscreen:
            state.fullscreen = FullscreenState::Windowed;
            return false;

        case ViewerKey::ToggleCrt:
            config.crtEnabled = !config.crtEnabled;
            return true;

        case ViewerKey::TogglePixelate:
            config.pixelateEnabled = !config.pixelateEnabled;
            return true;

        case ViewerKey::ResetShader:
            if (config.shader == crt::ShaderParams{}) {
                return false;
            }
            config.shader = crt::ShaderParams{};
            return true;

        case ViewerKey::Quit:
            state.quitRequested = true;
            return false;
    }
    return false;
}

template<typename T>
static bool assign(T& field, const std::optional<T>& value) {
    if (!value || field == *value) {
        return false;
    }
    field = *value;
    return true;
}

bool applyOverrides(storage::ViewerConfig& config, const ViewerOverrides& overrides) {
    bool changed = false;
    changed |= assign(config.videoDevice, overrides.device);
    changed |= assign(config.formatFourcc, overrides.format);
    changed |= assign(config.width, overrides.width);
    changed |= assign(config.height, overrides.height);
    changed |= assign(config.framerate, overrides.framerate);
    changed |= assign(config.crtEnabled, overrides.crtEnabled);
    changed |= assign(config.pixelateEnabled, overrides.pixelateEnabled);
    return changed;
}

bool parseSize(const std::string& s, uint32_t& width, uint32_t& height) {
    size_t x = s.find('x');
    if (x == std::string::npos || x == 0 || x + 1 >= s.size()) {
        return false;
    }

    char* end = nullptr;
    unsigned long w = std::strtoul(s.c_str(), &end, 10);
    if (end != s.c_str() + x) {
        return false;
    }
    const char* hs = s.c_str() + x + 1;
    unsigned long h = std::strtoul(hs, &end, 10);
    if (*end != '\0' || w == 0 || h == 0) {
        return false;
    }

    width = static_cast<uint32_t>(w);
    height = static_cast<uint32_t>(h);
    return true;
}

} // namespace michadame
