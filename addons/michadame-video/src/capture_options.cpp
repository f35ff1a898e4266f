// Michadame Video - Capture Option Mapping

#include <michadame/video/capture_options.h>
#include <cctype>

namespace michadame::video {

std::string canonicalFormatTag(const std::string& fourcc) {
    std::string tag = fourcc;
    while (!tag.empty() && (tag.back() == '\0' || std::isspace(static_cast<unsigned char>(tag.back())))) {
        tag.pop_back();
    }
    for (char& c : tag) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return tag;
}

CaptureInputHints normalizeFormatTag(const std::string& fourcc) {
    std::string tag = canonicalFormatTag(fourcc);

    CaptureInputHints hints;
    if (tag == "mjpg" || tag == "mjpeg") {
        hints.kind = StreamKind::Compressed;
        hints.inputFormat = "mjpeg";
        return hints;
    }

    hints.kind = StreamKind::Raw;
    hints.inputFormat = "rawvideo";
    hints.pixelFormat = (tag == "yuyv") ? std::string("yuyv422") : tag;
    return hints;
}

CaptureOptions buildCaptureOptions(const CaptureConfig& config) {
    CaptureOptions options;
    options.emplace_back("video_size", std::to_string(config.width) + "x" + std::to_string(config.height));
    options.emplace_back("framerate", std::to_string(config.framerate));
    options.emplace_back("fflags", "nobuffer+discardcorrupt");
    options.emplace_back("probesize", "32");
    options.emplace_back("analyzeduration", "100000");

    CaptureInputHints hints = normalizeFormatTag(config.format.fourcc);
    options.emplace_back("input_format", hints.inputFormat);
    if (hints.pixelFormat) {
        options.emplace_back("pixel_format", *hints.pixelFormat);
    }
    return options;
}

} // namespace michadame::video
