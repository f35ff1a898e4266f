#pragma once

/**
 * @file ffmpeg_capture.h
 * @brief FFmpeg (libavdevice v4l2) packet source and decoder backend
 */

#include <michadame/stop_signal.h>
#include <michadame/video/decode_loop.h>
#include <michadame/video/packet_reader.h>
#include <michadame/video/video_format.h>
#include <memory>

struct AVPacket;
struct AVCodecParameters;
struct AVCodecContext;

namespace michadame::video {

/**
 * @brief Owning, move-only wrapper around an AVPacket.
 */
class AvPacket {
public:
    AvPacket();
    ~AvPacket();

    AvPacket(AvPacket&& other) noexcept;
    AvPacket& operator=(AvPacket&& other) noexcept;
    AvPacket(const AvPacket&) = delete;
    AvPacket& operator=(const AvPacket&) = delete;

    int streamIndex() const;

    AVPacket* get() const { return m_packet; }

private:
    AVPacket* m_packet = nullptr;
};

/**
 * @brief Opens a v4l2 capture device and reads packets from it.
 *
 * Blocking reads are interrupted as soon as `stop` is raised.
 */
class FFmpegCaptureSource : public PacketSource<AvPacket> {
public:
    /**
     * @throws CaptureError (DeviceOpen) if the input cannot be opened or has
     *         no video stream
     */
    FFmpegCaptureSource(const CaptureConfig& config, const StopSignal& stop);
    ~FFmpegCaptureSource() override;

    FFmpegCaptureSource(const FFmpegCaptureSource&) = delete;
    FFmpegCaptureSource& operator=(const FFmpegCaptureSource&) = delete;

    bool readPacket(AvPacket& out) override;
    int videoStreamIndex() const override;

    /// Codec parameters of the selected video stream
    const AVCodecParameters* codecParameters() const;

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};

/**
 * @brief Restrict a codec context to slice threading with low-delay output.
 *
 * Frame threading would hold back one frame per worker.
 */
void configureLowLatencyDecoder(AVCodecContext* ctx);

/**
 * @brief Decodes packets and converts every frame to RGB24.
 *
 * The swscale converter is built lazily from the first frame and rebuilt if
 * the frame size or pixel format changes mid-stream.
 */
class FFmpegFrameDecoder : public DecodeBackend<AvPacket> {
public:
    /**
     * @throws CaptureError (DecoderInit) if no decoder exists for the stream
     *         or it fails to open
     */
    explicit FFmpegFrameDecoder(const AVCodecParameters* params);
    ~FFmpegFrameDecoder() override;

    FFmpegFrameDecoder(const FFmpegFrameDecoder&) = delete;
    FFmpegFrameDecoder& operator=(const FFmpegFrameDecoder&) = delete;

    void sendPacket(const AvPacket& packet) override;
    void sendEndOfStream() override;
    FramePtr receiveFrame() override;

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace michadame::video
