#pragma once

/**
 * @file video_format.h
 * @brief Capture format descriptions and capture configuration
 *
 * Formats are produced by device enumeration (outside this library) and are
 * treated as immutable once queried.
 */

#include <cstdint>
#include <string>
#include <vector>

namespace michadame::video {

/**
 * @brief A frame size with the frame rates advertised for it.
 */
struct Resolution {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint32_t> framerates;

    bool supportsFramerate(uint32_t fps) const;
};

/**
 * @brief One pixel format advertised by a capture device.
 *
 * The default value ("0000", "None", no resolutions) stands for
 * "no format selected".
 */
struct VideoFormat {
    std::string fourcc = "0000";
    std::string description = "None";
    std::vector<Resolution> resolutions;

    bool isNone() const { return resolutions.empty() && fourcc == "0000"; }

    /// Resolution entry for an exact size, nullptr if not advertised
    const Resolution* findResolution(uint32_t width, uint32_t height) const;
};

/**
 * @brief Everything needed to open a capture stream.
 */
struct CaptureConfig {
    std::string device;         ///< Device path, e.g. /dev/video0
    VideoFormat format;
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t framerate = 0;

    /**
     * @brief Check the request against the advertised format.
     * @throws CaptureError (Configuration) if the device path is empty, the
     *         size is not advertised, or the frame rate is not advertised for
     *         that size.
     */
    void validate() const;
};

} // namespace michadame::video
