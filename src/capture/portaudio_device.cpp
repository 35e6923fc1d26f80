// ==============================================================================
// PortAudioDevice Implementation
// ==============================================================================

#include "capture/portaudio_device.h"

#include "logging/log.h"

#include <string>
#include <utility>

namespace Notescope {

namespace {

Status paFailure(const char* what, PaError err) {
    return Status::failure(ErrorCode::Device, std::string(what) + ": " + Pa_GetErrorText(err));
}

} // namespace

// ==============================================================================
// Lifecycle
// ==============================================================================

PortAudioDevice::PortAudioDevice() {
    initError_ = Pa_Initialize();
    if (initError_ != paNoError) {
        Log::get()->error("PortAudio initialization failed: {}", Pa_GetErrorText(initError_));
    }
}

PortAudioDevice::~PortAudioDevice() {
    stop();
    close();
    if (initError_ == paNoError) {
        Pa_Terminate();
    }
}

Status PortAudioDevice::open(const StreamParameters& params) {
    if (!isInitialized()) {
        return paFailure("PortAudio unavailable", initError_);
    }
    if (stream_ != nullptr) {
        return Status::failure(ErrorCode::Device, "stream already open");
    }

    PaDeviceIndex index = paNoDevice;
    Status found = findDevice(params.deviceName, index);
    if (!found.ok()) return found;

    const PaDeviceInfo* info = Pa_GetDeviceInfo(index);
    if (info == nullptr) {
        return Status::failure(ErrorCode::Device, "no device info for index " + std::to_string(index));
    }
    if (info->maxInputChannels < params.channelCount) {
        return Status::failure(ErrorCode::Device,
                               std::string(info->name) + " has " +
                                   std::to_string(info->maxInputChannels) + " input channel(s), " +
                                   std::to_string(params.channelCount) + " requested");
    }

    PaStreamParameters input{};
    input.device = index;
    input.channelCount = params.channelCount;
    input.sampleFormat = paFloat32;
    input.suggestedLatency = info->defaultLowInputLatency;
    input.hostApiSpecificStreamInfo = nullptr;

    PaError err = Pa_IsFormatSupported(&input, nullptr, params.sampleRate);
    if (err != paFormatIsSupported) {
        return paFailure("unsupported input format", err);
    }

    err = Pa_OpenStream(&stream_, &input, nullptr, params.sampleRate,
                        static_cast<unsigned long>(params.framesPerBlock), paClipOff,
                        &PortAudioDevice::streamCallback, this);
    if (err != paNoError) {
        stream_ = nullptr;
        return paFailure("Pa_OpenStream failed", err);
    }

    channels_ = params.channelCount;
    Log::get()->info("Opened input '{}' at {} Hz, {} channel(s), {} frames per block",
                     info->name, params.sampleRate, params.channelCount, params.framesPerBlock);
    return Status::success();
}

Status PortAudioDevice::start(InputCallback callback, void* userData) {
    if (stream_ == nullptr) {
        return Status::failure(ErrorCode::Device, "stream not open");
    }
    if (callback == nullptr) {
        return Status::failure(ErrorCode::Device, "no input callback");
    }

    callback_ = callback;
    userData_ = userData;

    const PaError err = Pa_StartStream(stream_);
    if (err != paNoError) {
        callback_ = nullptr;
        userData_ = nullptr;
        return paFailure("Pa_StartStream failed", err);
    }
    return Status::success();
}

void PortAudioDevice::stop() {
    if (stream_ == nullptr) return;
    if (Pa_IsStreamActive(stream_) == 1) {
        PaError err = Pa_StopStream(stream_);
        if (err != paNoError) {
            Log::get()->warn("Pa_StopStream failed: {}", Pa_GetErrorText(err));
            err = Pa_AbortStream(stream_);
            if (err != paNoError) {
                Log::get()->warn("Pa_AbortStream failed: {}", Pa_GetErrorText(err));
            }
        }
    }

    // The audio thread reads the binding; it is only cleared once delivery
    // has ended. close() clears it otherwise.
    if (Pa_IsStreamActive(stream_) != 0) {
        Log::get()->error("Input stream still active after stop");
        return;
    }
    callback_ = nullptr;
    userData_ = nullptr;
}

void PortAudioDevice::close() {
    if (stream_ == nullptr) return;
    const PaError err = Pa_CloseStream(stream_);
    if (err != paNoError) {
        Log::get()->warn("Pa_CloseStream failed: {}", Pa_GetErrorText(err));
    } else {
        callback_ = nullptr;
        userData_ = nullptr;
    }
    stream_ = nullptr;
    channels_ = 0;
}

// ==============================================================================
// Device Enumeration
// ==============================================================================

std::vector<DeviceInfo> PortAudioDevice::listInputDevices() const {
    std::vector<DeviceInfo> devices;
    if (!isInitialized()) return devices;

    const PaDeviceIndex count = Pa_GetDeviceCount();
    if (count < 0) {
        Log::get()->error("Pa_GetDeviceCount failed: {}", Pa_GetErrorText(count));
        return devices;
    }

    const PaDeviceIndex defaultInput = Pa_GetDefaultInputDevice();
    for (PaDeviceIndex i = 0; i < count; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (info == nullptr || info->maxInputChannels <= 0) continue;

        DeviceInfo device;
        device.index = i;
        device.name = info->name;
        device.maxInputChannels = info->maxInputChannels;
        device.defaultSampleRate = info->defaultSampleRate;
        device.isDefault = (i == defaultInput);
        devices.push_back(std::move(device));
    }
    return devices;
}

Status PortAudioDevice::findDevice(const std::string& name, PaDeviceIndex& index) const {
    if (name.empty()) {
        index = Pa_GetDefaultInputDevice();
        if (index == paNoDevice) {
            return Status::failure(ErrorCode::Device, "no default input device");
        }
        return Status::success();
    }

    const PaDeviceIndex count = Pa_GetDeviceCount();
    for (PaDeviceIndex i = 0; i < count; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (info != nullptr && info->maxInputChannels > 0 && name == info->name) {
            index = i;
            return Status::success();
        }
    }
    return Status::failure(ErrorCode::Device, "input device not found: " + name);
}

// ==============================================================================
// Audio Thread
// ==============================================================================

int PortAudioDevice::streamCallback(const void* input, void* /*output*/, unsigned long frameCount,
                                    const PaStreamCallbackTimeInfo* /*timeInfo*/,
                                    PaStreamCallbackFlags statusFlags, void* userData) {
    auto* self = static_cast<PortAudioDevice*>(userData);
    if (self->callback_ == nullptr || input == nullptr) return paContinue;

    StreamStatusFlags flags = 0;
    if (statusFlags & paInputUnderflow) flags |= kStreamInputUnderflow;
    if (statusFlags & paInputOverflow) flags |= kStreamInputOverflow;

    self->callback_(static_cast<const float*>(input), static_cast<size_t>(frameCount),
                    self->channels_, flags, self->userData_);
    return paContinue;
}

} // namespace Notescope
