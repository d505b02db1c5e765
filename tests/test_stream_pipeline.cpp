/**
 * StreamPipeline against an in-memory session and fake devices.
 * Covers start/stop, task failure propagation, primary-task termination,
 * playback flushing and device failure isolation.
 */

#include "stream_pipeline.h"
#include "test_fakes.h"
#include "test_support.h"
#include "text_intake.h"
#include <algorithm>
#include <memory>
#include <string>
#include <thread>

using namespace live_relay;
using namespace live_relay::testing;

namespace {

/// Hands out a fixed list of turns, then reports the operator quit.
class ScriptedIntake : public TextIntake {
public:
    explicit ScriptedIntake(std::vector<ClientTurn> turns) : turns_(std::move(turns)) {}

    std::optional<ClientTurn> next(const StopToken&) override {
        if (index_ >= turns_.size()) return std::nullopt;
        return turns_[index_++];
    }

private:
    std::vector<ClientTurn> turns_;
    size_t index_ = 0;
};

const TaskReport* find_report(const std::vector<TaskReport>& reports, const std::string& name) {
    for (const auto& r : reports) {
        if (r.name == name) return &r;
    }
    return nullptr;
}

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

} // namespace

int main() {
    Config config;

    // --- start(camera) then immediate stop: every task ends, devices released ---
    {
        FakeSessionFactory factory;
        FakeDevices devices;
        auto sink = std::make_shared<RecordingSink>();
        auto intake = std::make_shared<ChannelTextIntake>();
        StreamPipeline pipeline(config, factory, devices.make(), sink, intake);

        ASSERT(pipeline.state() == PipelineState::Idle);
        auto started = pipeline.start(VideoMode::Camera);
        ASSERT(started.is_ok());
        ASSERT(pipeline.is_running());
        ASSERT(pipeline.video_mode() == VideoMode::Camera);

        pipeline.stop();
        ASSERT(pipeline.state() == PipelineState::Idle);
        ASSERT(factory.log->closed);

        auto reports = pipeline.last_reports();
        ASSERT(reports.size() == 6);
        for (const auto& r : reports) {
            ASSERT(r.outcome == TaskOutcome::Cancelled || r.outcome == TaskOutcome::Completed);
        }
        ASSERT(find_report(reports, "capture_video") != nullptr);
        ASSERT(devices.video->opens == devices.video->closes);
        ASSERT(devices.mic->opens == devices.mic->closes);
        ASSERT(sink->stop_count() == 1);

        // Stop is idempotent
        pipeline.stop();
        ASSERT(sink->stop_count() == 1);
    }

    // --- mode none launches no capture task; no speaker means no play task ---
    {
        FakeSessionFactory factory;
        FakeDevices devices;
        devices.with_speaker = false;
        auto sink = std::make_shared<RecordingSink>();
        auto intake = std::make_shared<ChannelTextIntake>();
        StreamPipeline pipeline(config, factory, devices.make(), sink, intake);

        ASSERT(pipeline.start(VideoMode::None).is_ok());
        pipeline.stop();
        auto reports = pipeline.last_reports();
        ASSERT(find_report(reports, "capture_video") == nullptr);
        ASSERT(find_report(reports, "play_audio") == nullptr);
        ASSERT(reports.size() == 4);
        ASSERT(devices.video->opens == 0);
    }

    // --- connect failure returns to Idle with nothing running ---
    {
        FakeSessionFactory factory;
        factory.fail_connect = true;
        FakeDevices devices;
        auto sink = std::make_shared<RecordingSink>();
        auto intake = std::make_shared<ChannelTextIntake>();
        StreamPipeline pipeline(config, factory, devices.make(), sink, intake);

        auto started = pipeline.start(VideoMode::Screen);
        ASSERT(started.is_error());
        ASSERT(started.error().type == ErrorType::NetworkError);
        ASSERT(pipeline.state() == PipelineState::Idle);
        ASSERT(pipeline.last_reports().empty());
        ASSERT(devices.mic->opens == 0);
    }

    // --- second start while running is rejected ---
    {
        FakeSessionFactory factory;
        FakeDevices devices;
        auto sink = std::make_shared<RecordingSink>();
        auto intake = std::make_shared<ChannelTextIntake>();
        StreamPipeline pipeline(config, factory, devices.make(), sink, intake);

        ASSERT(pipeline.start(VideoMode::None).is_ok());
        auto again = pipeline.start(VideoMode::Camera);
        ASSERT(again.is_error());
        ASSERT(again.error().type == ErrorType::InvalidState);
        pipeline.stop();

        // Restart after stop works with a fresh session
        ASSERT(pipeline.start(VideoMode::None).is_ok());
        ASSERT(factory.log->sessions_opened == 1);
        pipeline.stop();
    }

    // --- camera frames and mic audio reach the session ---
    {
        FakeSessionFactory factory;
        FakeDevices devices;
        auto sink = std::make_shared<RecordingSink>();
        auto intake = std::make_shared<ChannelTextIntake>();
        StreamPipeline pipeline(config, factory, devices.make(), sink, intake);

        ASSERT(pipeline.start(VideoMode::Camera).is_ok());
        auto log = factory.log;
        ASSERT(wait_until([&] { return log->media_count() >= 2; }));
        ASSERT(wait_until([&] { return log->audio_count() >= 2; }));
        ASSERT(sink->frame_count() >= 2);
        {
            std::lock_guard<std::mutex> l(sink->mutex);
            ASSERT(sink->frames.front() == "camera");
        }
        pipeline.stop();
    }

    // --- controller turns: text, empty text and image ---
    {
        FakeSessionFactory factory;
        FakeDevices devices;
        auto sink = std::make_shared<RecordingSink>();
        auto intake = std::make_shared<ChannelTextIntake>();
        StreamPipeline pipeline(config, factory, devices.make(), sink, intake);

        ClientTurn early;
        early.text = "too early";
        ASSERT(!intake->submit(early));

        ASSERT(pipeline.start(VideoMode::None).is_ok());
        auto log = factory.log;

        ClientTurn hello;
        hello.text = "hello";
        ASSERT(intake->submit(hello));
        ClientTurn empty;
        empty.text = "";
        ASSERT(intake->submit(empty));
        ClientTurn picture;
        MediaFrame frame;
        frame.mime_type = "image/png";
        frame.payload = Bytes{1, 2, 3};
        picture.image = frame;
        ASSERT(intake->submit(picture));

        ASSERT(wait_until([&] { return log->texts().size() == 2; }));
        auto texts = log->texts();
        ASSERT(texts.size() == 2 && texts[0] == "hello" && texts[1] == ".");
        ASSERT(wait_until([&] { return log->media_count() == 1; }));
        {
            std::lock_guard<std::mutex> l(log->mutex);
            ASSERT(!log->media.empty() && log->media[0].mime_type == "image/png");
        }
        pipeline.stop();
        ASSERT(!intake->submit(hello));
    }

    // --- inbound events reach the sink and the speaker ---
    {
        FakeSessionFactory factory;
        FakeDevices devices;
        auto sink = std::make_shared<RecordingSink>();
        auto intake = std::make_shared<ChannelTextIntake>();
        StreamPipeline pipeline(config, factory, devices.make(), sink, intake);

        ASSERT(pipeline.start(VideoMode::None).is_ok());
        auto log = factory.log;
        log->inbound.put(AudioData{Bytes(8, 1)});
        log->inbound.put(TextDelta{"Hi"});
        log->inbound.put(TextDelta{" there"});
        log->inbound.put(TurnComplete{});

        ASSERT(wait_until([&] { return sink->turns == 1; }));
        ASSERT(sink->audio_count == 1);
        {
            std::lock_guard<std::mutex> l(sink->mutex);
            ASSERT(sink->texts.size() == 2 && sink->texts[0] == "Hi" && sink->texts[1] == " there");
        }
        pipeline.stop();
        ASSERT(devices.speaker->opened);
        ASSERT(devices.speaker->closed);
    }

    // --- interrupt drops pending playback; later audio still plays ---
    {
        FakeSessionFactory factory;
        FakeDevices devices;
        devices.speaker->write_delay_ms = 150;
        auto sink = std::make_shared<RecordingSink>();
        auto intake = std::make_shared<ChannelTextIntake>();
        StreamPipeline pipeline(config, factory, devices.make(), sink, intake);

        ASSERT(pipeline.interrupt() == 0);
        ASSERT(pipeline.start(VideoMode::None).is_ok());
        auto log = factory.log;
        for (int i = 0; i < 6; ++i) {
            log->inbound.put(AudioData{Bytes(8, static_cast<uint8_t>(i))});
        }
        ASSERT(wait_until([&] { return pipeline.pending_playback() >= 4; }));
        size_t discarded = pipeline.interrupt();
        ASSERT(discarded >= 4);
        ASSERT(pipeline.pending_playback() == 0);
        ASSERT(pipeline.is_running());

        log->inbound.put(AudioData{Bytes(8, 42)});
        ASSERT(wait_until([&] {
            std::lock_guard<std::mutex> l(devices.speaker->mutex);
            return !devices.speaker->played.empty() && devices.speaker->played.back()[0] == 42;
        }));
        // Only the buffer already being written before the interrupt, plus the new one
        ASSERT(devices.speaker->played_count() <= 3);
        pipeline.stop();
    }

    // --- turn complete and server interruption flush playback too ---
    {
        FakeSessionFactory factory;
        FakeDevices devices;
        devices.speaker->write_delay_ms = 600;
        auto sink = std::make_shared<RecordingSink>();
        auto intake = std::make_shared<ChannelTextIntake>();
        StreamPipeline pipeline(config, factory, devices.make(), sink, intake);

        ASSERT(pipeline.start(VideoMode::None).is_ok());
        auto log = factory.log;
        for (int i = 0; i < 5; ++i) log->inbound.put(AudioData{Bytes(8, 1)});
        log->inbound.put(TurnComplete{});
        ASSERT(wait_until([&] { return sink->turns == 1; }));
        ASSERT(pipeline.pending_playback() == 0);

        for (int i = 0; i < 5; ++i) log->inbound.put(AudioData{Bytes(8, 2)});
        log->inbound.put(Interrupted{});
        ASSERT(wait_until([&] { return sink->audio_count == 10; }));
        // Without the flush the queue would take seconds to play out
        ASSERT(wait_until([&] { return pipeline.pending_playback() == 0; }, 500));
        ASSERT(sink->turns == 1);
        pipeline.stop();
    }

    // --- a failing task stops every sibling and the pipeline returns to Idle ---
    {
        FakeSessionFactory factory;
        FakeDevices devices;
        auto sink = std::make_shared<RecordingSink>();
        auto intake = std::make_shared<ChannelTextIntake>();
        StreamPipeline pipeline(config, factory, devices.make(), sink, intake);

        ASSERT(pipeline.start(VideoMode::Screen).is_ok());
        factory.log->break_transport();

        ASSERT(wait_until([&] { return pipeline.state() == PipelineState::Idle; }, 3000));
        auto reports = pipeline.last_reports();
        const TaskReport* receive = find_report(reports, "receive");
        ASSERT(receive != nullptr && receive->outcome == TaskOutcome::Failed);
        ASSERT(receive != nullptr && receive->error == "connection reset");
        for (const auto& r : reports) {
            if (r.name != "receive") ASSERT(r.outcome != TaskOutcome::Running);
        }
        ASSERT(devices.video->opens == devices.video->closes);
        {
            std::lock_guard<std::mutex> l(sink->mutex);
            ASSERT(sink->pipeline_stops.size() == 1);
            ASSERT(sink->pipeline_stops[0].find("receive") != std::string::npos);
        }
        pipeline.stop();
    }

    // --- a send failure is fatal as well ---
    {
        FakeSessionFactory factory;
        FakeDevices devices;
        auto sink = std::make_shared<RecordingSink>();
        auto intake = std::make_shared<ChannelTextIntake>();
        StreamPipeline pipeline(config, factory, devices.make(), sink, intake);

        ASSERT(pipeline.start(VideoMode::None).is_ok());
        factory.log->fail_sends = true;
        ASSERT(wait_until([&] { return pipeline.state() == PipelineState::Idle; }, 3000));
        auto reports = pipeline.last_reports();
        const TaskReport* sender = find_report(reports, "send_realtime");
        ASSERT(sender != nullptr && sender->outcome == TaskOutcome::Failed);
    }

    // --- the primary task finishing tears the pipeline down ---
    {
        FakeSessionFactory factory;
        FakeDevices devices;
        auto sink = std::make_shared<RecordingSink>();
        ClientTurn turn;
        turn.text = "bye";
        auto intake = std::make_shared<ScriptedIntake>(std::vector<ClientTurn>{turn});
        StreamPipeline pipeline(config, factory, devices.make(), sink, intake);

        ASSERT(pipeline.start(VideoMode::Camera).is_ok());
        pipeline.wait();
        ASSERT(pipeline.state() == PipelineState::Idle);
        auto texts = factory.log->texts();
        ASSERT(texts.size() == 1 && texts[0] == "bye");
        auto reports = pipeline.last_reports();
        const TaskReport* primary = find_report(reports, "intake");
        ASSERT(primary != nullptr && primary->outcome == TaskOutcome::Completed);
        {
            std::lock_guard<std::mutex> l(sink->mutex);
            ASSERT(!sink->pipeline_stops.empty() && sink->pipeline_stops[0] == "intake finished");
        }
        pipeline.stop();
    }

    // --- request_stop (signal path) ends wait() ---
    {
        FakeSessionFactory factory;
        FakeDevices devices;
        auto sink = std::make_shared<RecordingSink>();
        auto intake = std::make_shared<ChannelTextIntake>();
        StreamPipeline pipeline(config, factory, devices.make(), sink, intake);

        ASSERT(pipeline.start(VideoMode::None).is_ok());
        std::thread signaller([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            pipeline.request_stop();
        });
        pipeline.wait();
        signaller.join();
        ASSERT(pipeline.state() == PipelineState::Idle);
        pipeline.stop();
    }

    // --- a device that fails to open stops only its own task ---
    {
        FakeSessionFactory factory;
        FakeDevices devices;
        devices.video_fails_open = true;
        auto sink = std::make_shared<RecordingSink>();
        auto intake = std::make_shared<ChannelTextIntake>();
        StreamPipeline pipeline(config, factory, devices.make(), sink, intake);

        ASSERT(pipeline.start(VideoMode::Camera).is_ok());
        ASSERT(wait_until([&] {
            std::lock_guard<std::mutex> l(sink->mutex);
            return contains(sink->stopped_devices, "camera");
        }));
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        ASSERT(pipeline.is_running());
        ASSERT(wait_until([&] { return factory.log->audio_count() >= 1; }));
        pipeline.stop();
        auto reports = pipeline.last_reports();
        const TaskReport* video = find_report(reports, "capture_video");
        ASSERT(video != nullptr && video->outcome == TaskOutcome::Completed);
    }

    // --- a device read failure after some frames ---
    {
        FakeSessionFactory factory;
        FakeDevices devices;
        devices.video_fail_after = 3;
        auto sink = std::make_shared<RecordingSink>();
        auto intake = std::make_shared<ChannelTextIntake>();
        StreamPipeline pipeline(config, factory, devices.make(), sink, intake);

        ASSERT(pipeline.start(VideoMode::Screen).is_ok());
        ASSERT(wait_until([&] {
            std::lock_guard<std::mutex> l(sink->mutex);
            return contains(sink->stopped_devices, "screen");
        }));
        ASSERT(sink->frame_count() == 3);
        ASSERT(wait_until([&] { return factory.log->media_count() == 3; }));
        ASSERT(devices.video->closes == 1);
        ASSERT(pipeline.is_running());
        pipeline.stop();
    }

    return finish("test_stream_pipeline");
}
