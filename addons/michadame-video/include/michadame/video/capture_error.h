#pragma once

#include <stdexcept>
#include <string>

namespace michadame::video {

/**
 * @brief Fatal error raised by the capture pipeline.
 *
 * The pipeline never retries; the owner decides whether to restart it.
 * Dropped packets and frames are not errors and never raise this.
 */
class CaptureError : public std::runtime_error {
public:
    enum class Kind {
        Configuration,  ///< Requested resolution/framerate not advertised
        DeviceOpen,     ///< Capture input could not be opened
        DecoderInit,    ///< No decoder for the stream, or it failed to open
        Decode,         ///< Decoder rejected a packet or failed to produce a frame
        Convert         ///< Color conversion to RGB24 failed
    };

    CaptureError(Kind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    Kind kind() const { return m_kind; }

private:
    Kind m_kind;
};

inline const char* captureErrorKindName(CaptureError::Kind kind) {
    switch (kind) {
        case CaptureError::Kind::Configuration: return "Configuration";
        case CaptureError::Kind::DeviceOpen:    return "DeviceOpen";
        case CaptureError::Kind::DecoderInit:   return "DecoderInit";
        case CaptureError::Kind::Decode:        return "Decode";
        case CaptureError::Kind::Convert:       return "Convert";
        default:                                return "Unknown";
    }
}

} // namespace michadame::video
