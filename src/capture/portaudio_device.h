#pragma once

// ==============================================================================
// PortAudioDevice - PortAudio Capture Backend
// ==============================================================================
// One instance owns one PortAudio initialization (Pa_Initialize in the
// constructor, Pa_Terminate in the destructor) and at most one input stream.
// ==============================================================================

#include "capture/audio_device.h"

#include <portaudio.h>

namespace Notescope {

class PortAudioDevice final : public AudioInputDevice {
public:
    PortAudioDevice();
    ~PortAudioDevice() override;

    PortAudioDevice(const PortAudioDevice&) = delete;
    PortAudioDevice& operator=(const PortAudioDevice&) = delete;

    /// @brief Whether Pa_Initialize succeeded
    [[nodiscard]] bool isInitialized() const noexcept { return initError_ == paNoError; }

    [[nodiscard]] Status open(const StreamParameters& params) override;
    [[nodiscard]] Status start(InputCallback callback, void* userData) override;
    void stop() override;
    void close() override;
    [[nodiscard]] bool isOpen() const noexcept override { return stream_ != nullptr; }
    [[nodiscard]] int channelCount() const noexcept override { return channels_; }
    [[nodiscard]] std::vector<DeviceInfo> listInputDevices() const override;

private:
    static int streamCallback(const void* input, void* output, unsigned long frameCount,
                              const PaStreamCallbackTimeInfo* timeInfo,
                              PaStreamCallbackFlags statusFlags, void* userData);

    [[nodiscard]] Status findDevice(const std::string& name, PaDeviceIndex& index) const;

    PaError initError_ = paNotInitialized;
    PaStream* stream_ = nullptr;
    int channels_ = 0;

    // Read by the PortAudio thread; cleared only once the stream is inactive
    // or closed
    InputCallback callback_ = nullptr;
    void* userData_ = nullptr;
};

} // namespace Notescope
