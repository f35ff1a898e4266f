#pragma once

/**
 * @file pipeline_runner.h
 * @brief Reader thread + decode loop wiring shared by all capture backends
 */

#include <michadame/video/decode_loop.h>
#include <michadame/video/packet_reader.h>
#include <atomic>
#include <exception>
#include <iostream>
#include <thread>

namespace michadame::video {

struct PipelineStats {
    ReaderStats reader;
    DecodeStats decode;
};

/**
 * @brief Run the reader on its own thread and the decode loop on this one.
 *
 * `readerStop` must be linked to `stop` (or be `stop`) and must be the
 * signal the source's blocking read observes. It is raised on every exit
 * path, and the reader thread is joined before this returns or rethrows.
 * An exception escaping the reader is rethrown here after the join.
 */
template <typename Packet>
PipelineStats runPipeline(PacketSource<Packet>& source, DecodeBackend<Packet>& backend,
                          FrameSink& sink, const StopSignal& stop, StopSignal& readerStop) {
    PipelineStats stats;
    LatestSlot<Packet> packets;
    std::atomic<bool> readerDone{false};
    std::exception_ptr readerError;

    std::thread reader([&] {
        try {
            stats.reader = readPackets(source, packets, readerStop);
        } catch (const std::exception& e) {
            std::cerr << "[PacketReader] " << e.what() << std::endl;
            readerError = std::current_exception();
        }
        readerDone.store(true, std::memory_order_release);
    });

    // Stops and joins the reader however the decode loop exits
    struct ReaderGuard {
        StopSignal& signal;
        std::thread& thread;
        ~ReaderGuard() {
            signal.requestStop();
            if (thread.joinable()) thread.join();
        }
    } guard{readerStop, reader};

    stats.decode = runDecodeLoop(packets, backend, sink, stop, readerDone);

    readerStop.requestStop();
    if (reader.joinable()) reader.join();
    if (readerError) {
        std::rethrow_exception(readerError);
    }
    return stats;
}

} // namespace michadame::video
