// Michadame Video - FFmpeg Capture Backend

#include <michadame/video/ffmpeg_capture.h>
#include <michadame/video/capture_error.h>
#include <michadame/video/capture_options.h>
#include <chrono>
#include <iostream>
#include <thread>

extern "C" {
#include <libavdevice/avdevice.h>
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/error.h>
#include <libavutil/pixdesc.h>
#include <libswscale/swscale.h>
}

namespace michadame::video {

namespace {

std::string avErrorString(int err) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(err, buf, sizeof(buf));
    return buf;
}

// Called by libavformat during blocking I/O; non-zero aborts the call
int interruptCallback(void* opaque) {
    const auto* stop = static_cast<const StopSignal*>(opaque);
    return stop->stopRequested() ? 1 : 0;
}

} // namespace

// =============================================================================
// AvPacket
// =============================================================================

AvPacket::AvPacket() : m_packet(av_packet_alloc()) {}

AvPacket::~AvPacket() {
    if (m_packet) {
        av_packet_free(&m_packet);
    }
}

AvPacket::AvPacket(AvPacket&& other) noexcept : m_packet(other.m_packet) {
    other.m_packet = nullptr;
}

AvPacket& AvPacket::operator=(AvPacket&& other) noexcept {
    if (this != &other) {
        if (m_packet) av_packet_free(&m_packet);
        m_packet = other.m_packet;
        other.m_packet = nullptr;
    }
    return *this;
}

int AvPacket::streamIndex() const {
    return m_packet ? m_packet->stream_index : -1;
}

// =============================================================================
// FFmpegCaptureSource
// =============================================================================

struct FFmpegCaptureSource::Impl {
    AVFormatContext* formatCtx = nullptr;
    int videoStreamIndex = -1;
    const StopSignal* stop = nullptr;

    ~Impl() {
        if (formatCtx) {
            avformat_close_input(&formatCtx);
        }
    }
};

FFmpegCaptureSource::FFmpegCaptureSource(const CaptureConfig& config, const StopSignal& stop)
    : m_impl(std::make_unique<Impl>()) {
    m_impl->stop = &stop;

    avdevice_register_all();

    const AVInputFormat* inputFormat = av_find_input_format("v4l2");
    if (!inputFormat) {
        throw CaptureError(CaptureError::Kind::DeviceOpen, "FFmpeg was built without v4l2 input support");
    }

    AVDictionary* options = nullptr;
    std::cout << "[FFmpegCapture] Opening " << config.device << " with";
    for (const auto& [key, value] : buildCaptureOptions(config)) {
        av_dict_set(&options, key.c_str(), value.c_str(), 0);
        std::cout << " " << key << "=" << value;
    }
    std::cout << std::endl;

    m_impl->formatCtx = avformat_alloc_context();
    if (!m_impl->formatCtx) {
        av_dict_free(&options);
        throw CaptureError(CaptureError::Kind::DeviceOpen, "Failed to allocate format context");
    }
    m_impl->formatCtx->interrupt_callback.callback = interruptCallback;
    m_impl->formatCtx->interrupt_callback.opaque = const_cast<StopSignal*>(&stop);

    // On failure avformat_open_input frees the context and nulls the pointer
    int ret = avformat_open_input(&m_impl->formatCtx, config.device.c_str(), inputFormat, &options);
    av_dict_free(&options);
    if (ret < 0) {
        throw CaptureError(CaptureError::Kind::DeviceOpen,
                           "Failed to open " + config.device + ": " + avErrorString(ret));
    }

    ret = avformat_find_stream_info(m_impl->formatCtx, nullptr);
    if (ret < 0) {
        throw CaptureError(CaptureError::Kind::DeviceOpen,
                           "Failed to read stream info: " + avErrorString(ret));
    }

    ret = av_find_best_stream(m_impl->formatCtx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (ret < 0) {
        throw CaptureError(CaptureError::Kind::DeviceOpen,
                           "No video stream on " + config.device);
    }
    m_impl->videoStreamIndex = ret;

    const AVCodecParameters* par = m_impl->formatCtx->streams[ret]->codecpar;
    std::cout << "[FFmpegCapture] Opened " << config.device
              << " (" << par->width << "x" << par->height
              << ", " << avcodec_get_name(par->codec_id) << ")" << std::endl;
}

FFmpegCaptureSource::~FFmpegCaptureSource() = default;

bool FFmpegCaptureSource::readPacket(AvPacket& out) {
    while (true) {
        int ret = av_read_frame(m_impl->formatCtx, out.get());
        if (ret >= 0) {
            return true;
        }
        if (ret == AVERROR(EAGAIN)) {
            if (m_impl->stop->stopRequested()) return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            continue;
        }
        if (ret == AVERROR_EOF) {
            std::cout << "[FFmpegCapture] End of stream" << std::endl;
        } else if (ret != AVERROR_EXIT) {
            std::cerr << "[FFmpegCapture] Read failed: " << avErrorString(ret) << std::endl;
        }
        return false;
    }
}

int FFmpegCaptureSource::videoStreamIndex() const {
    return m_impl->videoStreamIndex;
}

const AVCodecParameters* FFmpegCaptureSource::codecParameters() const {
    return m_impl->formatCtx->streams[m_impl->videoStreamIndex]->codecpar;
}

// =============================================================================
// FrameConverter
// =============================================================================

namespace {

/**
 * Converts decoded frames to packed RGB24 with a cached swscale context.
 */
class FrameConverter {
public:
    FrameConverter(int width, int height, AVPixelFormat format)
        : m_width(width), m_height(height), m_format(format) {
        m_sws = sws_getContext(width, height, format,
                               width, height, AV_PIX_FMT_RGB24,
                               SWS_FAST_BILINEAR, nullptr, nullptr, nullptr);
        if (!m_sws) {
            const char* name = av_get_pix_fmt_name(format);
            throw CaptureError(CaptureError::Kind::Convert,
                               std::string("No conversion from ") + (name ? name : "unknown") + " to rgb24");
        }
    }

    ~FrameConverter() {
        sws_freeContext(m_sws);
    }

    FrameConverter(const FrameConverter&) = delete;
    FrameConverter& operator=(const FrameConverter&) = delete;

    bool matches(const AVFrame* frame) const {
        return frame->width == m_width && frame->height == m_height &&
               frame->format == m_format;
    }

    FramePtr convert(const AVFrame* frame) const {
        auto out = std::make_shared<DecodedFrame>();
        out->width = static_cast<uint32_t>(m_width);
        out->height = static_cast<uint32_t>(m_height);
        out->rgb.resize(out->expectedSize());

        uint8_t* dst[4] = {out->rgb.data(), nullptr, nullptr, nullptr};
        int dstStride[4] = {m_width * 3, 0, 0, 0};
        int rows = sws_scale(m_sws, frame->data, frame->linesize, 0, m_height, dst, dstStride);
        if (rows != m_height) {
            throw CaptureError(CaptureError::Kind::Convert,
                               "Scaler produced " + std::to_string(rows) + " of " +
                               std::to_string(m_height) + " rows");
        }
        return out;
    }

    int width() const { return m_width; }
    int height() const { return m_height; }

private:
    SwsContext* m_sws = nullptr;
    int m_width;
    int m_height;
    AVPixelFormat m_format;
};

} // namespace

// =============================================================================
// FFmpegFrameDecoder
// =============================================================================

void configureLowLatencyDecoder(AVCodecContext* ctx) {
    // Automatic worker count, slices only
    ctx->thread_count = 0;
    ctx->thread_type = FF_THREAD_SLICE;
    ctx->flags |= AV_CODEC_FLAG_LOW_DELAY;
}

struct FFmpegFrameDecoder::Impl {
    AVCodecContext* codecCtx = nullptr;
    AVFrame* frame = nullptr;
    std::unique_ptr<FrameConverter> converter;

    ~Impl() {
        converter.reset();
        if (frame) av_frame_free(&frame);
        if (codecCtx) avcodec_free_context(&codecCtx);
    }
};

FFmpegFrameDecoder::FFmpegFrameDecoder(const AVCodecParameters* params)
    : m_impl(std::make_unique<Impl>()) {
    const AVCodec* codec = avcodec_find_decoder(params->codec_id);
    if (!codec) {
        throw CaptureError(CaptureError::Kind::DecoderInit,
                           std::string("No decoder for ") + avcodec_get_name(params->codec_id));
    }

    m_impl->codecCtx = avcodec_alloc_context3(codec);
    if (!m_impl->codecCtx) {
        throw CaptureError(CaptureError::Kind::DecoderInit, "Failed to allocate codec context");
    }

    int ret = avcodec_parameters_to_context(m_impl->codecCtx, params);
    if (ret < 0) {
        throw CaptureError(CaptureError::Kind::DecoderInit,
                           "Failed to copy codec parameters: " + avErrorString(ret));
    }

    configureLowLatencyDecoder(m_impl->codecCtx);

    ret = avcodec_open2(m_impl->codecCtx, codec, nullptr);
    if (ret < 0) {
        throw CaptureError(CaptureError::Kind::DecoderInit,
                           "Failed to open decoder: " + avErrorString(ret));
    }

    m_impl->frame = av_frame_alloc();
    if (!m_impl->frame) {
        throw CaptureError(CaptureError::Kind::DecoderInit, "Failed to allocate frame");
    }

    std::cout << "[FrameDecoder] Using " << codec->name << " decoder" << std::endl;
}

FFmpegFrameDecoder::~FFmpegFrameDecoder() = default;

void FFmpegFrameDecoder::sendPacket(const AvPacket& packet) {
    int ret = avcodec_send_packet(m_impl->codecCtx, packet.get());
    if (ret < 0 && ret != AVERROR(EAGAIN)) {
        throw CaptureError(CaptureError::Kind::Decode,
                           "Decoder rejected packet: " + avErrorString(ret));
    }
}

void FFmpegFrameDecoder::sendEndOfStream() {
    int ret = avcodec_send_packet(m_impl->codecCtx, nullptr);
    if (ret < 0 && ret != AVERROR_EOF) {
        throw CaptureError(CaptureError::Kind::Decode,
                           "Decoder flush failed: " + avErrorString(ret));
    }
}

FramePtr FFmpegFrameDecoder::receiveFrame() {
    AVFrame* frame = m_impl->frame;
    int ret = avcodec_receive_frame(m_impl->codecCtx, frame);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
        return nullptr;
    }
    if (ret < 0) {
        throw CaptureError(CaptureError::Kind::Decode,
                           "Failed to receive frame: " + avErrorString(ret));
    }

    auto& converter = m_impl->converter;
    if (!converter || !converter->matches(frame)) {
        if (converter) {
            std::cout << "[FrameDecoder] Frame geometry changed from "
                      << converter->width() << "x" << converter->height()
                      << " to " << frame->width << "x" << frame->height
                      << ", rebuilding converter" << std::endl;
        }
        converter.reset();
        converter = std::make_unique<FrameConverter>(
            frame->width, frame->height, static_cast<AVPixelFormat>(frame->format));
    }

    FramePtr out = converter->convert(frame);
    av_frame_unref(frame);
    return out;
}

} // namespace michadame::video
