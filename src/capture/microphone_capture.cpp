#include "capture/microphone_capture.h"
#include "audio_io.h"
#include "logger.h"
#include <portaudio.h>
#include <sstream>

namespace live_relay {
namespace capture {

class MicrophoneCapture::Impl {
public:
    Impl(const std::string& device, int sample_rate, int chunk_frames)
        : device_(device), sample_rate_(sample_rate), chunk_frames_(chunk_frames) {}

    ~Impl() {
        close();
    }

    Result<void> open() {
        if (stream_) return Result<void>();

        library_ = std::make_unique<audio::PortAudioLibrary>();
        if (!library_->ok()) {
            std::string reason = library_->error();
            library_.reset();
            return make_resource_error("PortAudio init error: " + reason);
        }

        int input_idx = audio::find_device(device_, true);
        if (input_idx < 0) {
            library_.reset();
            return make_resource_error("Input device not found: " + (device_.empty() ? std::string("default") : device_));
        }
        const PaDeviceInfo* info = Pa_GetDeviceInfo(input_idx);

        PaStreamParameters input_params;
        input_params.device = input_idx;
        input_params.channelCount = CHANNELS;
        input_params.sampleFormat = paInt16;
        input_params.suggestedLatency = info->defaultLowInputLatency;
        input_params.hostApiSpecificStreamInfo = nullptr;

        PaError err = Pa_OpenStream(&stream_, &input_params, nullptr, sample_rate_,
                                    chunk_frames_, paClipOff, nullptr, nullptr);
        if (err != paNoError) {
            stream_ = nullptr;
            library_.reset();
            return make_resource_error("Failed to open input stream: " + std::string(Pa_GetErrorText(err)));
        }
        err = Pa_StartStream(stream_);
        if (err != paNoError) {
            Pa_CloseStream(stream_);
            stream_ = nullptr;
            library_.reset();
            return make_io_error("Failed to start input stream: " + std::string(Pa_GetErrorText(err)));
        }

        std::ostringstream oss;
        oss << "Using input device: [" << input_idx << "] " << info->name << " @ " << sample_rate_ << " Hz";
        LOG_CAPTURE(oss.str());
        return Result<void>();
    }

    Result<OutboundItem> capture() {
        if (!stream_) {
            return make_state_error("Input stream not open");
        }

        AudioChunk chunk;
        chunk.sample_rate = sample_rate_;
        chunk.pcm.resize(static_cast<size_t>(chunk_frames_) * sizeof(Sample) * CHANNELS);

        PaError err = Pa_ReadStream(stream_, chunk.pcm.data(), static_cast<unsigned long>(chunk_frames_));
        if (err == paInputOverflowed) {
            // Data is still valid; an overflow only means samples were lost before this read
            LOG_AUDIO("Input overflow");
        } else if (err != paNoError) {
            return make_io_error("Microphone read failed: " + std::string(Pa_GetErrorText(err)));
        }
        return OutboundItem(std::move(chunk));
    }

    void close() {
        if (stream_) {
            Pa_StopStream(stream_);
            Pa_CloseStream(stream_);
            stream_ = nullptr;
            LOG_CAPTURE("Microphone closed");
        }
        library_.reset();
    }

private:
    std::string device_;
    int sample_rate_;
    int chunk_frames_;
    std::unique_ptr<audio::PortAudioLibrary> library_;
    PaStream* stream_ = nullptr;
};

MicrophoneCapture::MicrophoneCapture(const std::string& device, int sample_rate, int chunk_frames)
    : pimpl_(std::make_unique<Impl>(device, sample_rate, chunk_frames)) {}

MicrophoneCapture::~MicrophoneCapture() = default;

Result<void> MicrophoneCapture::open() {
    return pimpl_->open();
}

Result<OutboundItem> MicrophoneCapture::capture() {
    return pimpl_->capture();
}

void MicrophoneCapture::close() {
    pimpl_->close();
}

} // namespace capture
} // namespace live_relay
