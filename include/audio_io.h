#pragma once

/**
 * @file audio_io.h
 * @brief PortAudio device lookup and the playback device interface
 */

#include "common.h"
#include "errors.h"
#include <memory>
#include <string>

namespace live_relay {
namespace audio {

/**
 * @brief RAII guard for Pa_Initialize / Pa_Terminate (reference counted by PortAudio)
 */
class PortAudioLibrary {
public:
    PortAudioLibrary();
    ~PortAudioLibrary();

    PortAudioLibrary(const PortAudioLibrary&) = delete;
    PortAudioLibrary& operator=(const PortAudioLibrary&) = delete;

    bool ok() const { return ok_; }
    const std::string& error() const { return error_; }

private:
    bool ok_ = false;
    std::string error_;
};

/**
 * @brief Resolve a device by "default"/empty, numeric index or exact name
 * @return PortAudio device index, or -1 when not found. PortAudio must be initialized.
 */
int find_device(const std::string& name, bool is_input);

/**
 * @brief Log all available audio devices
 */
void list_devices();

/**
 * @brief Sink for 16-bit mono PCM
 *
 * write() blocks until the device accepted the buffer.
 */
class AudioOutput {
public:
    virtual ~AudioOutput() = default;

    virtual Result<void> open() = 0;
    virtual Result<void> write(const Bytes& pcm) = 0;
    virtual void close() = 0;
};

/**
 * @brief Blocking PortAudio output stream
 */
class PortAudioOutput : public AudioOutput {
public:
    PortAudioOutput(const std::string& device, int sample_rate, int frames_per_buffer);
    ~PortAudioOutput() override;

    PortAudioOutput(const PortAudioOutput&) = delete;
    PortAudioOutput& operator=(const PortAudioOutput&) = delete;

    Result<void> open() override;
    Result<void> write(const Bytes& pcm) override;
    void close() override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace audio
} // namespace live_relay
