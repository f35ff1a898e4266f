#pragma once

#include <michadame/latest_slot.h>
#include <cstdint>
#include <memory>
#include <vector>

namespace michadame::video {

/**
 * @brief One decoded frame as tightly packed RGB24 (width * height * 3 bytes).
 *
 * Shared read-only between the decode thread and the render thread.
 */
struct DecodedFrame {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint8_t> rgb;

    size_t expectedSize() const { return static_cast<size_t>(width) * height * 3; }
};

using FramePtr = std::shared_ptr<const DecodedFrame>;

/// Single-slot channel from the decoder to the consumer
using FrameSink = LatestSlot<FramePtr>;

} // namespace michadame::video
