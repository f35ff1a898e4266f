#pragma once

/**
 * @file capture_options.h
 * @brief Mapping from capture configuration to FFmpeg input options
 */

#include <michadame/video/video_format.h>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace michadame::video {

enum class StreamKind {
    Raw,        ///< Uncompressed frames, pixel format must be forced
    Compressed  ///< Encoded stream (MJPEG), decoder picks the pixel format
};

/**
 * @brief How to ask the v4l2 input for a given format tag.
 */
struct CaptureInputHints {
    StreamKind kind = StreamKind::Raw;
    std::string inputFormat;                ///< "rawvideo" or "mjpeg"
    std::optional<std::string> pixelFormat; ///< Forced pixel format for raw streams
};

/// Ordered key/value list handed to avformat_open_input
using CaptureOptions = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Trim trailing NULs and whitespace, then lower-case.
 */
std::string canonicalFormatTag(const std::string& fourcc);

/**
 * @brief Translate a four-character format tag into input hints.
 *
 * - "yuyv" -> raw, pixel format "yuyv422"
 * - "mjpg"/"mjpeg" -> compressed, input format "mjpeg"
 * - anything else -> raw, tag used as the pixel format
 */
CaptureInputHints normalizeFormatTag(const std::string& fourcc);

/**
 * @brief Build the low-latency option set for a capture request.
 */
CaptureOptions buildCaptureOptions(const CaptureConfig& config);

} // namespace michadame::video
