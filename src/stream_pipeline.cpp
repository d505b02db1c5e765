#include "stream_pipeline.h"
#include "capture/camera_capture.h"
#include "capture/microphone_capture.h"
#include "capture/screen_capture.h"
#include "core/bounded_channel.h"
#include "core/constants.h"
#include "logger.h"
#include "session_transcoder.h"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace live_relay {

const char* pipeline_state_name(PipelineState state) {
    switch (state) {
        case PipelineState::Idle:     return "idle";
        case PipelineState::Starting: return "starting";
        case PipelineState::Running:  return "running";
        case PipelineState::Stopping: return "stopping";
        default: return "unknown";
    }
}

PipelineDevices PipelineDevices::from_config(const Config& config) {
    PipelineDevices devices;
    CaptureConfig capture_cfg = config.capture;
    AudioConfig audio_cfg = config.audio;

    devices.make_video_source = [capture_cfg](VideoMode mode) -> std::unique_ptr<capture::MediaCaptureSource> {
        auto interval = std::chrono::milliseconds(capture_cfg.frame_interval_ms);
        switch (mode) {
            case VideoMode::Camera:
                return std::make_unique<capture::CameraCapture>(
                    capture_cfg.camera_index, capture_cfg.camera_max_dimension, capture_cfg.jpeg_quality, interval);
            case VideoMode::Screen:
                return std::make_unique<capture::ScreenCapture>(
                    capture_cfg.display, capture_cfg.screen_max_width, capture_cfg.jpeg_quality, interval);
            default:
                return nullptr;
        }
    };

    devices.make_microphone = [audio_cfg]() -> std::unique_ptr<capture::MediaCaptureSource> {
        return std::make_unique<capture::MicrophoneCapture>(
            audio_cfg.input_device, audio_cfg.send_sample_rate, audio_cfg.chunk_size);
    };

    if (audio_cfg.local_playback) {
        devices.make_speaker = [audio_cfg]() -> std::unique_ptr<audio::AudioOutput> {
            return std::make_unique<audio::PortAudioOutput>(
                audio_cfg.output_device, audio_cfg.receive_sample_rate, audio_cfg.chunk_size);
        };
    }
    return devices;
}

namespace {

constexpr const char* PRIMARY_TASK = "intake";

} // namespace

class StreamPipeline::Impl {
public:
    Impl(const Config& config, SessionFactory& session_factory, PipelineDevices devices,
         std::shared_ptr<ResponseSink> sink, std::shared_ptr<TextIntake> intake)
        : config_(config),
          session_factory_(session_factory),
          devices_(std::move(devices)),
          sink_(std::move(sink)),
          intake_(std::move(intake)) {}

    ~Impl() {
        stop();
    }

    Result<void> start(VideoMode mode) {
        std::lock_guard<std::mutex> control(control_mutex_);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != PipelineState::Idle) {
                return make_state_error("Pipeline already running");
            }
            state_ = PipelineState::Starting;
        }
        // Previous supervisor may have finished on its own
        if (supervisor_.joinable()) {
            supervisor_.join();
        }
        stop_requested_.store(false);

        LOG_PIPELINE(std::string("Starting (video: ") + video_mode_name(mode) + ")");

        auto connected = session_factory_.connect(config_.session);
        if (!connected) {
            Logger::error("[Pipeline] Session connect failed (" + connected.error().describe() + ")");
            set_state(PipelineState::Idle);
            return connected.error();
        }

        auto run = std::make_shared<Run>();
        run->ai = std::move(connected.value());
        run->out_queue = std::make_shared<BoundedChannel<OutboundItem>>(config_.pipeline.out_queue_capacity);
        run->playback = std::make_shared<BoundedChannel<Bytes>>(BoundedChannel<Bytes>::UNBOUNDED);
        run->playback_active.store(static_cast<bool>(devices_.make_speaker));
        run->tasks = std::make_unique<TaskGroup>(run->token);

        Run* r = run.get();
        run->tasks->set_on_finished([this, r](const TaskReport& report) { on_task_finished(*r, report); });

        intake_->begin();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            current_ = run;
            video_mode_ = mode;
        }

        run->tasks->spawn(PRIMARY_TASK, [this, r](const StopToken& token) { run_intake(*r, token); });
        run->tasks->spawn("send_realtime", [this, r](const StopToken& token) { run_sender(*r, token); });
        run->tasks->spawn("listen_audio", [this, r](const StopToken& token) { run_microphone(*r, token); });
        if (mode != VideoMode::None) {
            run->tasks->spawn("capture_video", [this, r, mode](const StopToken& token) {
                run_video(*r, token, mode);
            });
        }
        run->tasks->spawn("receive", [this, r](const StopToken& token) { run_receiver(*r, token); });
        if (devices_.make_speaker) {
            run->tasks->spawn("play_audio", [this, r](const StopToken& token) { run_player(*r, token); });
        }

        set_state(PipelineState::Running);
        supervisor_ = std::thread(&Impl::supervise, this);
        LOG_PIPELINE("Running");
        return Result<void>();
    }

    size_t interrupt() {
        std::shared_ptr<Run> run = current();
        if (!run) {
            return 0;
        }
        size_t discarded = run->playback->drain();
        if (discarded > 0) {
            LOG_AUDIO("Playback flushed: " + std::to_string(discarded) + " buffers discarded");
        }
        return discarded;
    }

    void stop() {
        std::lock_guard<std::mutex> control(control_mutex_);
        if (!supervisor_.joinable()) {
            return;
        }
        if (supervisor_.get_id() == std::this_thread::get_id()) {
            Logger::error("[Pipeline] stop() called from the supervisor thread; ignored");
            return;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_requested_.store(true);
        }
        state_cv_.notify_all();
        supervisor_.join();
    }

    void request_stop() {
        stop_requested_.store(true);
    }

    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        state_cv_.wait(lock, [this] { return state_ == PipelineState::Idle; });
    }

    PipelineState state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    VideoMode video_mode() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return video_mode_;
    }

    size_t pending_playback() const {
        std::shared_ptr<Run> run = current();
        return run ? run->playback->size() : 0;
    }

    size_t pending_outbound() const {
        std::shared_ptr<Run> run = current();
        return run ? run->out_queue->size() : 0;
    }

    std::vector<TaskReport> last_reports() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_reports_;
    }

private:
    // Everything owned by one started session
    struct Run {
        StopToken token;
        std::unique_ptr<AISession> ai;
        std::shared_ptr<BoundedChannel<OutboundItem>> out_queue;
        std::shared_ptr<BoundedChannel<Bytes>> playback;
        std::atomic<bool> playback_active{false};
        std::unique_ptr<TaskGroup> tasks;
        bool teardown_requested = false;  // guarded by mutex_
        std::string stop_reason;          // guarded by mutex_
    };

    std::shared_ptr<Run> current() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_;
    }

    void set_state(PipelineState state) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            state_ = state;
        }
        state_cv_.notify_all();
    }

    void on_task_finished(Run& run, const TaskReport& report) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!run.teardown_requested) {
                if (report.name == PRIMARY_TASK) {
                    run.teardown_requested = true;
                    run.stop_reason = "intake finished";
                } else if (report.outcome == TaskOutcome::Failed) {
                    run.teardown_requested = true;
                    run.stop_reason = "task '" + report.name + "' failed: " + report.error;
                }
            }
        }
        state_cv_.notify_all();
    }

    void supervise() {
        Logger::set_thread_tag("supervisor");
        std::shared_ptr<Run> run;
        std::string reason;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            run = current_;
            // Polled so request_stop() from a signal handler is observed
            while (!run->teardown_requested && !stop_requested_.load()) {
                state_cv_.wait_for(lock, std::chrono::milliseconds(constants::pipeline::POLL_SLICE_MS));
            }
            reason = run->teardown_requested ? run->stop_reason : "stop requested";
            state_ = PipelineState::Stopping;
        }
        state_cv_.notify_all();

        LOG_PIPELINE("Stopping: " + reason);
        teardown(*run);
        sink_->on_pipeline_stopped(reason);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_reports_ = run->tasks->reports();
            current_.reset();
            state_ = PipelineState::Idle;
        }
        state_cv_.notify_all();
        LOG_PIPELINE("Stopped");
    }

    void teardown(Run& run) {
        run.tasks->cancel();
        run.out_queue->drain();
        run.out_queue->close();
        run.playback->drain();
        run.playback->close();
        intake_->cancel();
        if (run.ai) {
            run.ai->close();
        }
        run.tasks->join_all();

        for (const auto& report : run.tasks->reports()) {
            Logger::debug("[Pipeline] task " + report.name + ": " + task_outcome_name(report.outcome));
        }
        run.ai.reset();
    }

    // --- tasks ---

    void run_intake(Run& run, const StopToken& token) {
        while (!token.stop_requested()) {
            auto turn = intake_->next(token);
            if (!turn) {
                break;
            }
            if (turn->image) {
                if (!run.out_queue->put(std::move(*turn->image))) {
                    break;
                }
            }
            if (turn->text) {
                std::string text = turn->text->empty() ? constants::pipeline::EMPTY_TURN_TEXT : *turn->text;
                auto sent = run.ai->send_client_content(text, true);
                if (!sent) {
                    if (token.stop_requested()) break;
                    throw std::runtime_error("send_client_content failed: " + sent.error().message);
                }
            }
        }
    }

    void run_sender(Run& run, const StopToken& token) {
        while (auto item = run.out_queue->get()) {
            if (token.stop_requested()) {
                break;
            }
            auto sent = SessionTranscoder::forward(*item, *run.ai);
            if (!sent) {
                if (token.stop_requested()) break;
                throw std::runtime_error(std::string("send ") + SessionTranscoder::kind(*item) +
                                         " failed: " + sent.error().message);
            }
        }
    }

    void run_microphone(Run& run, const StopToken& token) {
        if (!devices_.make_microphone) {
            return;
        }
        auto mic = devices_.make_microphone();
        if (!mic) {
            return;
        }
        run_capture(run, token, *mic, false);
    }

    void run_video(Run& run, const StopToken& token, VideoMode mode) {
        if (!devices_.make_video_source) {
            return;
        }
        auto source = devices_.make_video_source(mode);
        if (!source) {
            Logger::warn(std::string("[Pipeline] No capture source for mode ") + video_mode_name(mode));
            return;
        }
        run_capture(run, token, *source, true);
    }

    // Capture, wait the source interval, then queue. A device failure ends only this task.
    void run_capture(Run& run, const StopToken& token, capture::MediaCaptureSource& source, bool report_frames) {
        const std::string name = source.name();
        auto opened = source.open();
        if (!opened) {
            Logger::error("[Capture] " + name + " unavailable (" + opened.error().describe() + ")");
            sink_->on_device_stopped(name, opened.error().message);
            return;
        }

        const auto interval = source.interval();
        while (!token.stop_requested()) {
            auto item = source.capture();
            if (!item) {
                if (token.stop_requested()) break;
                Logger::error("[Capture] " + name + " stopped: " + item.error().message);
                sink_->on_device_stopped(name, item.error().message);
                break;
            }
            if (interval.count() > 0 && !token.wait_for(interval)) {
                break;
            }
            if (!run.out_queue->put(std::move(item.value()))) {
                break;
            }
            if (report_frames) {
                sink_->on_frame_captured(name);
            }
        }
        source.close();
    }

    void run_receiver(Run& run, const StopToken& token) {
        while (true) {
            auto event = run.ai->receive(token);
            if (!event) {
                break;
            }

            if (auto* audio = std::get_if<AudioData>(&*event)) {
                if (run.playback_active.load()) {
                    run.playback->put(audio->pcm);
                }
                sink_->on_audio(audio->pcm);
            } else if (auto* text = std::get_if<TextDelta>(&*event)) {
                sink_->on_text(text->text);
            } else if (std::holds_alternative<TurnComplete>(*event)) {
                if (config_.pipeline.flush_playback_on_turn_complete) {
                    interrupt();
                }
                sink_->on_turn_complete();
            } else if (std::holds_alternative<Interrupted>(*event)) {
                interrupt();
            }
        }
    }

    void run_player(Run& run, const StopToken& token) {
        auto speaker = devices_.make_speaker();
        if (!speaker) {
            run.playback_active.store(false);
            return;
        }
        auto opened = speaker->open();
        if (!opened) {
            run.playback_active.store(false);
            run.playback->drain();
            Logger::error("[Audio] Speaker unavailable (" + opened.error().describe() + ")");
            sink_->on_device_stopped("speaker", opened.error().message);
            return;
        }

        while (auto buffer = run.playback->get()) {
            if (token.stop_requested()) {
                break;
            }
            auto written = speaker->write(*buffer);
            if (!written) {
                run.playback_active.store(false);
                run.playback->drain();
                Logger::error("[Audio] Playback stopped: " + written.error().message);
                sink_->on_device_stopped("speaker", written.error().message);
                break;
            }
        }
        speaker->close();
    }

    const Config config_;
    SessionFactory& session_factory_;
    PipelineDevices devices_;
    std::shared_ptr<ResponseSink> sink_;
    std::shared_ptr<TextIntake> intake_;

    std::mutex control_mutex_;          // serializes start()/stop()
    mutable std::mutex mutex_;
    std::condition_variable state_cv_;
    PipelineState state_ = PipelineState::Idle;
    VideoMode video_mode_ = VideoMode::None;
    std::atomic<bool> stop_requested_{false};
    std::shared_ptr<Run> current_;
    std::vector<TaskReport> last_reports_;
    std::thread supervisor_;
};

StreamPipeline::StreamPipeline(const Config& config, SessionFactory& session_factory, PipelineDevices devices,
                               std::shared_ptr<ResponseSink> sink, std::shared_ptr<TextIntake> intake)
    : pimpl_(std::make_unique<Impl>(config, session_factory, std::move(devices), std::move(sink), std::move(intake))) {}

StreamPipeline::~StreamPipeline() = default;

Result<void> StreamPipeline::start(VideoMode mode) {
    return pimpl_->start(mode);
}

size_t StreamPipeline::interrupt() {
    return pimpl_->interrupt();
}

void StreamPipeline::stop() {
    pimpl_->stop();
}

void StreamPipeline::request_stop() {
    pimpl_->request_stop();
}

void StreamPipeline::wait() {
    pimpl_->wait();
}

PipelineState StreamPipeline::state() const {
    return pimpl_->state();
}

bool StreamPipeline::is_running() const {
    return pimpl_->state() == PipelineState::Running;
}

VideoMode StreamPipeline::video_mode() const {
    return pimpl_->video_mode();
}

size_t StreamPipeline::pending_playback() const {
    return pimpl_->pending_playback();
}

size_t StreamPipeline::pending_outbound() const {
    return pimpl_->pending_outbound();
}

std::vector<TaskReport> StreamPipeline::last_reports() const {
    return pimpl_->last_reports();
}

} // namespace live_relay
