#pragma once

/**
 * @file packet_reader.h
 * @brief Reader loop that forwards only the newest video packet
 */

#include <michadame/latest_slot.h>
#include <michadame/stop_signal.h>
#include <cstdint>

namespace michadame::video {

/**
 * @brief Blocking source of demuxed packets.
 *
 * Packet must expose `int streamIndex() const`.
 */
template <typename Packet>
class PacketSource {
public:
    virtual ~PacketSource() = default;

    /**
     * @brief Block until the next packet is available.
     * @return false at end of stream or when the read was interrupted
     */
    virtual bool readPacket(Packet& out) = 0;

    /// Index of the stream whose packets are forwarded
    virtual int videoStreamIndex() const = 0;
};

struct ReaderStats {
    uint64_t packetsRead = 0;
    uint64_t packetsSkipped = 0;    ///< Not from the video stream
    uint64_t packetsForwarded = 0;
    uint64_t packetsReplaced = 0;   ///< Forwarded over an unconsumed packet
};

/**
 * @brief Pump packets from the source into the slot until stop or end of stream.
 *
 * The slot only ever holds the newest video packet; an unconsumed packet is
 * overwritten. The stop signal is checked after every blocking read so a
 * packet read after stop was requested is dropped rather than forwarded.
 */
template <typename Packet>
ReaderStats readPackets(PacketSource<Packet>& source, LatestSlot<Packet>& slot,
                        const StopSignal& stop) {
    ReaderStats stats;
    const int videoIndex = source.videoStreamIndex();

    while (!stop.stopRequested()) {
        Packet packet;
        if (!source.readPacket(packet)) {
            break;
        }
        if (stop.stopRequested()) {
            break;
        }
        stats.packetsRead++;

        if (packet.streamIndex() != videoIndex) {
            stats.packetsSkipped++;
            continue;
        }

        if (slot.publish(std::move(packet))) {
            stats.packetsReplaced++;
        }
        stats.packetsForwarded++;
    }

    return stats;
}

} // namespace michadame::video
