/**
 * @file test_capture_pipeline.cpp
 * @brief Reader, decode loop and pipeline threading tests with fake backends
 */

#include <catch2/catch_test_macros.hpp>
#include <michadame/video/capture_error.h>
#include <michadame/video/pipeline_runner.h>
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <thread>

using namespace michadame;
using namespace michadame::video;

namespace {

constexpr int kVideo = 0;
constexpr int kAudio = 1;

struct FakePacket {
    int stream = kVideo;
    int id = 0;
    int streamIndex() const { return stream; }
};

// Yields a scripted list of packets, then end of stream
class ScriptedSource : public PacketSource<FakePacket> {
public:
    explicit ScriptedSource(std::deque<FakePacket> packets) : m_packets(std::move(packets)) {}

    bool readPacket(FakePacket& out) override {
        if (m_packets.empty()) return false;
        out = m_packets.front();
        m_packets.pop_front();
        if (onRead) onRead(out);
        return true;
    }

    int videoStreamIndex() const override { return kVideo; }

    std::function<void(const FakePacket&)> onRead;

private:
    std::deque<FakePacket> m_packets;
};

// Blocks in readPacket until the given signal is raised, like a live device
class BlockingSource : public PacketSource<FakePacket> {
public:
    explicit BlockingSource(const StopSignal& stop) : m_stop(stop) {}

    bool readPacket(FakePacket& out) override {
        while (!m_stop.stopRequested()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            if (m_emitted < 3) {
                out = FakePacket{kVideo, ++m_emitted};
                return true;
            }
        }
        return false;
    }

    int videoStreamIndex() const override { return kVideo; }

private:
    const StopSignal& m_stop;
    int m_emitted = 0;
};

// Produces `framesPerPacket` frames for every packet it is sent
class FakeBackend : public DecodeBackend<FakePacket> {
public:
    explicit FakeBackend(int framesPerPacket = 1) : m_framesPerPacket(framesPerPacket) {}

    void sendPacket(const FakePacket& packet) override {
        if (throwOnPacket) {
            throw CaptureError(CaptureError::Kind::Decode, "corrupt packet");
        }
        sentIds.push_back(packet.id);
        m_pending += m_framesPerPacket;
    }

    void sendEndOfStream() override { endOfStream = true; }

    FramePtr receiveFrame() override {
        receiveCalls++;
        if (m_pending == 0) return nullptr;
        m_pending--;
        auto frame = std::make_shared<DecodedFrame>();
        frame->width = 2;
        frame->height = 1;
        frame->rgb.assign(frame->expectedSize(), static_cast<uint8_t>(sentIds.back()));
        return frame;
    }

    std::vector<int> sentIds;
    int receiveCalls = 0;
    bool endOfStream = false;
    bool throwOnPacket = false;

private:
    int m_framesPerPacket;
    int m_pending = 0;
};

} // namespace

TEST_CASE("Packet reader forwards only the newest video packet", "[video][reader]") {
    LatestSlot<FakePacket> slot;
    StopSignal stop;

    SECTION("unconsumed packets are replaced") {
        ScriptedSource source({{kVideo, 1}, {kVideo, 2}, {kVideo, 3}, {kVideo, 4}, {kVideo, 5}});
        auto stats = readPackets(source, slot, stop);

        REQUIRE(stats.packetsForwarded == 5);
        REQUIRE(stats.packetsReplaced == 4);
        auto packet = slot.tryTake();
        REQUIRE(packet.has_value());
        REQUIRE(packet->id == 5);
    }

    SECTION("packets from other streams are discarded") {
        ScriptedSource source({{kVideo, 1}, {kAudio, 2}, {kAudio, 3}});
        auto stats = readPackets(source, slot, stop);

        REQUIRE(stats.packetsRead == 3);
        REQUIRE(stats.packetsSkipped == 2);
        REQUIRE(slot.tryTake()->id == 1);
    }

    SECTION("a packet read after stop is not forwarded") {
        ScriptedSource source({{kVideo, 1}, {kVideo, 2}});
        source.onRead = [&](const FakePacket& p) {
            if (p.id == 2) stop.requestStop();
        };
        auto stats = readPackets(source, slot, stop);

        REQUIRE(stats.packetsForwarded == 1);
        REQUIRE(slot.tryTake()->id == 1);
    }

    SECTION("already stopped reader reads nothing") {
        ScriptedSource source({{kVideo, 1}});
        stop.requestStop();
        auto stats = readPackets(source, slot, stop);

        REQUIRE(stats.packetsRead == 0);
        REQUIRE(slot.empty());
    }
}

TEST_CASE("Decode loop delivers with drop-new semantics", "[video][decode]") {
    LatestSlot<FakePacket> packets;
    FrameSink sink;
    StopSignal stop;
    std::atomic<bool> inputClosed{true};

    SECTION("occupied sink drops new frames but keeps draining") {
        FakeBackend backend(3);
        packets.publish(FakePacket{kVideo, 7});
        auto stats = runDecodeLoop(packets, backend, sink, stop, inputClosed);

        REQUIRE(stats.packetsDecoded == 1);
        REQUIRE(stats.framesDelivered == 1);
        REQUIRE(stats.framesDropped == 2);
        // Drained until the decoder asked for more input
        REQUIRE(backend.receiveCalls >= 4);
        REQUIRE(backend.endOfStream);

        auto frame = sink.tryTake();
        REQUIRE(frame.has_value());
        REQUIRE((*frame)->rgb[0] == 7);
    }

    SECTION("stop before the loop sends no packet") {
        FakeBackend backend;
        packets.publish(FakePacket{kVideo, 1});
        stop.requestStop();
        auto stats = runDecodeLoop(packets, backend, sink, stop, inputClosed);

        REQUIRE(stats.packetsDecoded == 0);
        REQUIRE(backend.sentIds.empty());
        REQUIRE(sink.empty());
    }

    SECTION("decode errors propagate") {
        FakeBackend backend;
        backend.throwOnPacket = true;
        packets.publish(FakePacket{kVideo, 1});
        REQUIRE_THROWS_AS(runDecodeLoop(packets, backend, sink, stop, inputClosed), CaptureError);
    }
}

TEST_CASE("Pipeline runs reader and decoder to completion", "[video][pipeline]") {
    FrameSink sink;
    StopSignal stop;
    StopSignal readerStop(&stop);

    SECTION("end of stream finishes both loops") {
        ScriptedSource source({{kVideo, 1}, {kAudio, 2}, {kVideo, 3}});
        FakeBackend backend;
        auto stats = runPipeline(source, backend, sink, stop, readerStop);

        REQUIRE(stats.reader.packetsForwarded == 2);
        REQUIRE(stats.decode.packetsDecoded >= 1);
        // The last forwarded packet is always decoded
        REQUIRE(backend.sentIds.back() == 3);
        REQUIRE(backend.endOfStream);
        REQUIRE(readerStop.stopRequested());
        REQUIRE_FALSE(stop.stopRequested());
    }

    SECTION("caller stop terminates a blocking reader") {
        BlockingSource source(readerStop);
        FakeBackend backend;

        std::thread stopper([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(30));
            stop.requestStop();
        });
        auto stats = runPipeline(source, backend, sink, stop, readerStop);
        stopper.join();

        REQUIRE(stop.stopRequested());
        REQUIRE(stats.reader.packetsForwarded <= 3);
    }

    SECTION("decode failure stops and joins the reader before rethrowing") {
        BlockingSource source(readerStop);
        FakeBackend backend;
        backend.throwOnPacket = true;

        REQUIRE_THROWS_AS(runPipeline(source, backend, sink, stop, readerStop), CaptureError);
        REQUIRE(readerStop.stopRequested());
        REQUIRE_FALSE(stop.stopRequested());
    }
}
