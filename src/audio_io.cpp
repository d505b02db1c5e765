#include "audio_io.h"
#include "logger.h"
#include <portaudio.h>
#include <sstream>

namespace live_relay {
namespace audio {

PortAudioLibrary::PortAudioLibrary() {
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        error_ = Pa_GetErrorText(err);
        Logger::error("PortAudio init error: " + error_);
        return;
    }
    ok_ = true;
}

PortAudioLibrary::~PortAudioLibrary() {
    if (ok_) {
        Pa_Terminate();
    }
}

int find_device(const std::string& name, bool is_input) {
    int num_devices = Pa_GetDeviceCount();

    if (name == "default" || name.empty()) {
        int default_idx = is_input ? Pa_GetDefaultInputDevice() : Pa_GetDefaultOutputDevice();
        if (default_idx != paNoDevice) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(default_idx);
            std::ostringstream oss;
            oss << "Using default " << (is_input ? "input" : "output")
                << " device: [" << default_idx << "] " << (info ? info->name : "?");
            Logger::debug(oss.str());
        }
        return default_idx == paNoDevice ? -1 : default_idx;
    }

    // Numeric device index
    try {
        size_t consumed = 0;
        int device_idx = std::stoi(name, &consumed);
        if (consumed == name.size() && device_idx >= 0 && device_idx < num_devices) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(device_idx);
            int channels = info ? (is_input ? info->maxInputChannels : info->maxOutputChannels) : 0;
            if (channels > 0) {
                return device_idx;
            }
            Logger::warn("Device [" + std::to_string(device_idx) + "] has no " +
                         (is_input ? "input" : "output") + " channels");
            return -1;
        }
    } catch (const std::exception&) {
        // Not a number, continue to name matching
    }

    for (int i = 0; i < num_devices; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (info && info->name == name) {
            int channels = is_input ? info->maxInputChannels : info->maxOutputChannels;
            if (channels > 0) {
                return i;
            }
        }
    }

    return -1;
}

void list_devices() {
    PortAudioLibrary library;
    if (!library.ok()) {
        return;
    }

    int num_devices = Pa_GetDeviceCount();
    Logger::info("Available audio devices:");

    for (int i = 0; i < num_devices; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info) continue;
        std::ostringstream oss;
        oss << "  [" << i << "] " << info->name;
        if (info->maxInputChannels > 0) oss << " (IN:" << info->maxInputChannels << ")";
        if (info->maxOutputChannels > 0) oss << " (OUT:" << info->maxOutputChannels << ")";
        if (info->maxInputChannels == 0 && info->maxOutputChannels == 0) oss << " (no I/O)";
        Logger::info(oss.str());
    }
}

class PortAudioOutput::Impl {
public:
    Impl(const std::string& device, int sample_rate, int frames_per_buffer)
        : device_(device), sample_rate_(sample_rate), frames_per_buffer_(frames_per_buffer) {}

    ~Impl() {
        close();
    }

    Result<void> open() {
        if (stream_) return Result<void>();

        library_ = std::make_unique<PortAudioLibrary>();
        if (!library_->ok()) {
            std::string reason = library_->error();
            library_.reset();
            return make_resource_error("PortAudio init error: " + reason);
        }

        int output_idx = find_device(device_, false);
        if (output_idx < 0) {
            library_.reset();
            return make_resource_error("Output device not found: " + (device_.empty() ? std::string("default") : device_));
        }
        const PaDeviceInfo* info = Pa_GetDeviceInfo(output_idx);

        PaStreamParameters output_params;
        output_params.device = output_idx;
        output_params.channelCount = CHANNELS;
        output_params.sampleFormat = paInt16;
        output_params.suggestedLatency = info->defaultLowOutputLatency;
        output_params.hostApiSpecificStreamInfo = nullptr;

        PaError err = Pa_OpenStream(&stream_, nullptr, &output_params, sample_rate_,
                                    frames_per_buffer_, paClipOff, nullptr, nullptr);
        if (err != paNoError) {
            stream_ = nullptr;
            library_.reset();
            return make_resource_error("Failed to open output stream: " + std::string(Pa_GetErrorText(err)));
        }
        err = Pa_StartStream(stream_);
        if (err != paNoError) {
            Pa_CloseStream(stream_);
            stream_ = nullptr;
            library_.reset();
            return make_io_error("Failed to start output stream: " + std::string(Pa_GetErrorText(err)));
        }

        std::ostringstream oss;
        oss << "Using output device: [" << output_idx << "] " << info->name << " @ " << sample_rate_ << " Hz";
        Logger::info(oss.str());
        return Result<void>();
    }

    Result<void> write(const Bytes& pcm) {
        if (!stream_) {
            return make_state_error("Output stream not open");
        }
        unsigned long frames = static_cast<unsigned long>(pcm.size() / (sizeof(Sample) * CHANNELS));
        if (frames == 0) return Result<void>();

        PaError err = Pa_WriteStream(stream_, pcm.data(), frames);
        if (err == paOutputUnderflowed) {
            LOG_AUDIO("Output underflow");
        } else if (err != paNoError) {
            return make_io_error("Audio write failed: " + std::string(Pa_GetErrorText(err)));
        }
        return Result<void>();
    }

    void close() {
        if (stream_) {
            Pa_StopStream(stream_);
            Pa_CloseStream(stream_);
            stream_ = nullptr;
            LOG_AUDIO("Output stream closed");
        }
        library_.reset();
    }

private:
    std::string device_;
    int sample_rate_;
    int frames_per_buffer_;
    std::unique_ptr<PortAudioLibrary> library_;
    PaStream* stream_ = nullptr;
};

PortAudioOutput::PortAudioOutput(const std::string& device, int sample_rate, int frames_per_buffer)
    : pimpl_(std::make_unique<Impl>(device, sample_rate, frames_per_buffer)) {}

PortAudioOutput::~PortAudioOutput() = default;

Result<void> PortAudioOutput::open() {
    return pimpl_->open();
}

Result<void> PortAudioOutput::write(const Bytes& pcm) {
    return pimpl_->write(pcm);
}

void PortAudioOutput::close() {
    pimpl_->close();
}

} // namespace audio
} // namespace live_relay
