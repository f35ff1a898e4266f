// Michadame Video - Capture Pipeline

#include <michadame/video/capture_pipeline.h>
#include <michadame/video/ffmpeg_capture.h>
#include <iostream>

extern "C" {
#include <libavutil/log.h>
}

namespace michadame::video {

PipelineStats runCapturePipeline(FrameSink& sink, const StopSignal& stop,
                                 const CaptureConfig& config) {
    config.validate();

    av_log_set_level(AV_LOG_WARNING);

    // Linked to the caller's signal; raised on our own exit to stop the reader
    StopSignal readerStop(&stop);

    FFmpegCaptureSource source(config, readerStop);
    FFmpegFrameDecoder decoder(source.codecParameters());

    PipelineStats stats = runPipeline(source, decoder, sink, stop, readerStop);

    std::cout << "[CapturePipeline] Finished: "
              << stats.reader.packetsRead << " packets read, "
              << stats.reader.packetsReplaced << " replaced, "
              << stats.decode.framesDelivered << " frames delivered, "
              << stats.decode.framesDropped << " dropped" << std::endl;
    return stats;
}

// =============================================================================
// CaptureSession
// =============================================================================

CaptureSession::~CaptureSession() {
    stop();
}

void CaptureSession::start(const CaptureConfig& config) {
    stop();

    {
        std::lock_guard<std::mutex> lock(m_errorMutex);
        m_lastError.reset();
    }
    m_frames.clear();
    m_stop = std::make_unique<StopSignal>();
    m_state = State::Running;

    const StopSignal* stopSignal = m_stop.get();
    m_thread = std::thread([this, config, stopSignal] {
        try {
            runCapturePipeline(m_frames, *stopSignal, config);
            m_state = State::Stopped;
        } catch (const CaptureError& e) {
            std::cerr << "[CaptureSession] " << captureErrorKindName(e.kind())
                      << " error: " << e.what() << std::endl;
            {
                std::lock_guard<std::mutex> lock(m_errorMutex);
                m_lastError = e.what();
            }
            m_state = State::Failed;
        } catch (const std::exception& e) {
            std::cerr << "[CaptureSession] " << e.what() << std::endl;
            {
                std::lock_guard<std::mutex> lock(m_errorMutex);
                m_lastError = e.what();
            }
            m_state = State::Failed;
        }
    });

    std::cout << "[CaptureSession] Started " << config.device << " "
              << config.width << "x" << config.height << "@" << config.framerate
              << " " << config.format.fourcc << std::endl;
}

void CaptureSession::stop() {
    if (m_stop) {
        m_stop->requestStop();
    }
    if (m_thread.joinable()) {
        m_thread.join();
        std::cout << "[CaptureSession] Stopped (" << captureStateName(state()) << ")" << std::endl;
    }
    m_stop.reset();
}

std::optional<std::string> CaptureSession::lastError() const {
    std::lock_guard<std::mutex> lock(m_errorMutex);
    return m_lastError;
}

const char* captureStateName(CaptureSession::State state) {
    switch (state) {
        case CaptureSession::State::Idle:    return "Idle";
        case CaptureSession::State::Running: return "Running";
        case CaptureSession::State::Stopped: return "Stopped";
        case CaptureSession::State::Failed:  return "Failed";
        default:                             return "Unknown";
    }
}

} // namespace michadame::video
