#pragma once

/**
 * @file capture_pipeline.h
 * @brief Capture -> decode -> single-slot frame delivery
 */

#include <michadame/stop_signal.h>
#include <michadame/video/capture_error.h>
#include <michadame/video/decoded_frame.h>
#include <michadame/video/pipeline_runner.h>
#include <michadame/video/video_format.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace michadame::video {

/**
 * @brief Open the device and deliver RGB24 frames until stop or end of stream.
 *
 * Blocks the calling thread, which becomes the decode thread; a reader
 * thread is spawned and joined internally. Frames are offered to `sink`
 * with drop-new semantics.
 *
 * @throws CaptureError on configuration, open, decoder or conversion failure
 */
PipelineStats runCapturePipeline(FrameSink& sink, const StopSignal& stop,
                                 const CaptureConfig& config);

/**
 * @brief Owns a capture pipeline running on a background thread.
 *
 * Example:
 * @code
 * CaptureSession session;
 * session.start(config);
 * if (auto frame = session.frames().tryTake()) upload(**frame);
 * session.stop();
 * @endcode
 */
class CaptureSession {
public:
    enum class State { Idle, Running, Stopped, Failed };

    CaptureSession() = default;
    ~CaptureSession();

    CaptureSession(const CaptureSession&) = delete;
    CaptureSession& operator=(const CaptureSession&) = delete;

    /**
     * @brief Stop any running pipeline and start a new one.
     */
    void start(const CaptureConfig& config);

    /**
     * @brief Request stop and join the decode thread. Idempotent.
     */
    void stop();

    State state() const { return m_state.load(); }
    bool isRunning() const { return state() == State::Running; }

    /// Message of the error that ended the last run, if any
    std::optional<std::string> lastError() const;

    FrameSink& frames() { return m_frames; }

private:
    FrameSink m_frames;
    std::unique_ptr<StopSignal> m_stop;
    std::thread m_thread;
    std::atomic<State> m_state{State::Idle};

    mutable std::mutex m_errorMutex;
    std::optional<std::string> m_lastError;
};

const char* captureStateName(CaptureSession::State state);

} // namespace michadame::video
