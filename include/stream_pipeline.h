#pragma once

/**
 * @file stream_pipeline.h
 * @brief Orchestrates one realtime session and its concurrent tasks
 */

#include "ai_session.h"
#include "audio_io.h"
#include "capture/capture_source.h"
#include "config.h"
#include "core/task_group.h"
#include "errors.h"
#include "media_types.h"
#include "response_sink.h"
#include "text_intake.h"
#include <functional>
#include <memory>
#include <vector>

namespace live_relay {

enum class PipelineState {
    Idle,
    Starting,
    Running,
    Stopping
};

const char* pipeline_state_name(PipelineState state);

/**
 * @brief Device factories, called once per session on the task that owns the device
 *
 * make_speaker may be empty: session audio then only reaches the sink.
 */
struct PipelineDevices {
    std::function<std::unique_ptr<capture::MediaCaptureSource>(VideoMode)> make_video_source;
    std::function<std::unique_ptr<capture::MediaCaptureSource>()> make_microphone;
    std::function<std::unique_ptr<audio::AudioOutput>()> make_speaker;

    /// Camera/screen/microphone/speaker backed by OpenCV, X11 and PortAudio.
    static PipelineDevices from_config(const Config& config);
};

/**
 * @brief Streaming pipeline: capture -> bounded queue -> session -> playback
 *
 * Tasks per session:
 * - intake: operator turns (primary; its completion stops the pipeline)
 * - send_realtime: bounded queue -> SessionTranscoder -> session
 * - listen_audio: microphone -> bounded queue
 * - capture_video: camera or screen -> bounded queue (camera/screen modes only)
 * - receive: session -> playback queue + sink
 * - play_audio: playback queue -> speaker (when a speaker is configured)
 *
 * Any task failure stops every task. State: Idle -> Starting -> Running ->
 * Stopping -> Idle.
 */
class StreamPipeline {
public:
    StreamPipeline(const Config& config,
                   SessionFactory& session_factory,
                   PipelineDevices devices,
                   std::shared_ptr<ResponseSink> sink,
                   std::shared_ptr<TextIntake> intake);
    ~StreamPipeline();

    StreamPipeline(const StreamPipeline&) = delete;
    StreamPipeline& operator=(const StreamPipeline&) = delete;

    /**
     * @brief Open a session and launch the tasks
     * @return error if already running or the session could not be opened;
     *         the pipeline is then back in Idle
     */
    Result<void> start(VideoMode mode);

    /**
     * @brief Discard all audio waiting for playback; the session keeps running
     * @return number of buffers discarded
     */
    size_t interrupt();

    /**
     * @brief Cancel every task, wait for them, release devices and close the session
     *
     * Idempotent. Must not be called from a pipeline task or sink callback.
     */
    void stop();

    /// Only flags the stop; the supervisor performs it. Async-signal-safe.
    void request_stop();

    /// Block until the pipeline is back in Idle.
    void wait();

    PipelineState state() const;
    bool is_running() const;
    VideoMode video_mode() const;

    size_t pending_playback() const;
    size_t pending_outbound() const;

    /// Task outcomes of the most recent session.
    std::vector<TaskReport> last_reports() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace live_relay
