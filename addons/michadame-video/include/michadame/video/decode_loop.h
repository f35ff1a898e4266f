#pragma once

/**
 * @file decode_loop.h
 * @brief Decode loop between the packet slot and the frame sink
 */

#include <michadame/latest_slot.h>
#include <michadame/stop_signal.h>
#include <michadame/video/decoded_frame.h>
#include <atomic>
#include <cstdint>
#include <thread>

namespace michadame::video {

/**
 * @brief Packet-in, frame-out decoder.
 *
 * Implementations throw CaptureError (Decode or Convert) on failure.
 */
template <typename Packet>
class DecodeBackend {
public:
    virtual ~DecodeBackend() = default;

    virtual void sendPacket(const Packet& packet) = 0;

    /// Signal end of input so buffered frames can be drained
    virtual void sendEndOfStream() = 0;

    /// Next converted frame, nullptr when more input is needed
    virtual FramePtr receiveFrame() = 0;
};

struct DecodeStats {
    uint64_t packetsDecoded = 0;
    uint64_t framesDelivered = 0;
    uint64_t framesDropped = 0;     ///< Sink still held an unconsumed frame
};

namespace detail {

template <typename Packet>
void drainFrames(DecodeBackend<Packet>& backend, FrameSink& sink, DecodeStats& stats) {
    while (FramePtr frame = backend.receiveFrame()) {
        if (sink.tryPublish(std::move(frame))) {
            stats.framesDelivered++;
        } else {
            stats.framesDropped++;
        }
    }
}

} // namespace detail

/**
 * @brief Decode packets from the slot until stop or until input is closed.
 *
 * Never blocks on either side: an empty packet slot yields the thread, and a
 * frame that finds the sink occupied is dropped while the decoder keeps being
 * drained. Once `inputClosed` is set and the slot is empty, the decoder is
 * flushed and the loop returns. No packet is sent after stop is observed.
 */
template <typename Packet>
DecodeStats runDecodeLoop(LatestSlot<Packet>& packets, DecodeBackend<Packet>& backend,
                          FrameSink& sink, const StopSignal& stop,
                          const std::atomic<bool>& inputClosed) {
    DecodeStats stats;

    while (!stop.stopRequested()) {
        // Read the flag before polling so a final packet is never missed
        bool closed = inputClosed.load(std::memory_order_acquire);
        auto packet = packets.tryTake();
        if (!packet) {
            if (closed) {
                backend.sendEndOfStream();
                detail::drainFrames(backend, sink, stats);
                break;
            }
            std::this_thread::yield();
            continue;
        }

        backend.sendPacket(*packet);
        stats.packetsDecoded++;
        detail::drainFrames(backend, sink, stats);
    }

    return stats;
}

} // namespace michadame::video
