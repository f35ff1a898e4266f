// Michadame Video - Format Descriptions

#include <michadame/video/video_format.h>
#include <michadame/video/capture_error.h>
#include <algorithm>
#include <sstream>

namespace michadame::video {

bool Resolution::supportsFramerate(uint32_t fps) const {
    return std::find(framerates.begin(), framerates.end(), fps) != framerates.end();
}

const Resolution* VideoFormat::findResolution(uint32_t width, uint32_t height) const {
    for (const auto& res : resolutions) {
        if (res.width == width && res.height == height) {
            return &res;
        }
    }
    return nullptr;
}

void CaptureConfig::validate() const {
    if (device.empty()) {
        throw CaptureError(CaptureError::Kind::Configuration, "No capture device specified");
    }

    const Resolution* res = format.findResolution(width, height);
    if (!res) {
        std::ostringstream msg;
        msg << "Resolution " << width << "x" << height
            << " is not advertised for format " << format.fourcc;
        throw CaptureError(CaptureError::Kind::Configuration, msg.str());
    }

    if (!res->supportsFramerate(framerate)) {
        std::ostringstream msg;
        msg << "Frame rate " << framerate << " is not advertised for "
            << width << "x" << height << " " << format.fourcc;
        throw CaptureError(CaptureError::Kind::Configuration, msg.str());
    }
}

} // namespace michadame::video
