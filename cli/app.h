// Michadame Application
// Viewer window: owns the WebGPU surface, capture session and render graph

#pragma once

#include "viewer_controls.h"
#include <string>

namespace michadame {

// Configuration passed from command-line arguments
struct AppConfig {
    std::string configPath;     // empty = defaultConfigPath()
    ViewerOverrides overrides;
    int windowWidth = 1280;
    int windowHeight = 720;
    bool startFullscreen = false;
};

// Main application class
// Owns window, WebGPU context, capture session and runs the main loop
class Application {
public:
    Application() = default;
    ~Application();

    // Returns 0 on success, non-zero on error
    int init(const AppConfig& config);

    // Returns exit code (0 = success)
    int run();

    // Cleanup (called by destructor, can be called explicitly)
    void shutdown();

    struct Impl;

private:
    Impl* m_impl = nullptr;
    bool m_initialized = false;
};

} // namespace michadame
