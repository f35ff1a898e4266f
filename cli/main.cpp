// Michadame - Entry Point
// Parses command-line arguments and runs the viewer

#include "app.h"
#include <CLI/CLI.hpp>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
    CLI::App cli{"Michadame - low-latency capture viewer with a CRT shader"};
    cli.set_help_flag("-h,--help", "Show this help");

    michadame::AppConfig config;
    michadame::ViewerOverrides& overrides = config.overrides;

    std::string device;
    std::string format;
    std::string size;
    std::string window;
    uint32_t fps = 0;
    bool crt = true;
    bool pixelate = false;

    cli.add_option("-d,--device", device, "Capture device path (e.g. /dev/video0)");
    cli.add_option("-f,--format", format, "Pixel format FourCC: MJPG, YUYV, ...");
    cli.add_option("-s,--size", size, "Capture size WxH (e.g. 1920x1080)");
    cli.add_option("--fps", fps, "Capture framerate")->check(CLI::PositiveNumber);
    cli.add_option("-c,--config", config.configPath, "Config file (default: ~/.config/michadame/config.json)");
    cli.add_option("--window", window, "Initial window size WxH");
    auto* crtFlag = cli.add_flag("--crt,!--no-crt", crt, "Enable or disable the CRT effect");
    auto* pixelateFlag = cli.add_flag("--pixelate,!--no-pixelate", pixelate, "Enable or disable pixelation");
    cli.add_flag("--fullscreen", config.startFullscreen, "Start in fullscreen");

    try {
        cli.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli.exit(e);
    }

    if (!device.empty()) overrides.device = device;
    if (!format.empty()) overrides.format = format;
    if (fps > 0) overrides.framerate = fps;
    if (crtFlag->count() > 0) overrides.crtEnabled = crt;
    if (pixelateFlag->count() > 0) overrides.pixelateEnabled = pixelate;

    if (!size.empty()) {
        uint32_t w = 0, h = 0;
        if (!michadame::parseSize(size, w, h)) {
            std::cerr << "Invalid --size '" << size << "', expected WxH" << std::endl;
            return 2;
        }
        overrides.width = w;
        overrides.height = h;
    }
    if (!window.empty()) {
        uint32_t w = 0, h = 0;
        if (!michadame::parseSize(window, w, h)) {
            std::cerr << "Invalid --window '" << window << "', expected WxH" << std::endl;
            return 2;
        }
        config.windowWidth = static_cast<int>(w);
        config.windowHeight = static_cast<int>(h);
    }

    std::cout << "Michadame - Starting..." << std::endl;

    michadame::Application app;

    int initResult = app.init(config);
    if (initResult != 0) {
        return initResult;
    }

    return app.run();
}
