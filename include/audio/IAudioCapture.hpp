#pragma once
#include "AudioCaptureError.hpp"
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

struct AudioConfig {
    int targetSampleRate = 16000;   // STT engines expect 16kHz mono
};

// Abstract microphone capture interface.
// Implementations: PortAudioCapture (default input device). Tests provide
// their own scripted implementation.
class IAudioCapture {
public:
    virtual ~IAudioCapture() = default;

    // Receives one mono frame at AudioConfig::targetSampleRate.
    // Called from the host audio thread: must not block.
    using SampleCallback = std::function<void(const float* samples,
                                              size_t count)>;

    // Called at most once if the stream dies after start() succeeded.
    // Invoked from the capture control thread.
    using ErrorCallback = std::function<void(const std::string& message)>;

    // Throws AudioCaptureError. The config is fixed until stop().
    virtual void start(const AudioConfig& config, SampleCallback onSamples) = 0;

    // Idempotent. Never throws.
    virtual void stop() = 0;

    virtual bool isRunning() const = 0;

    virtual void setErrorCallback(ErrorCallback cb) = 0;

    // Names of input-capable devices; empty when enumeration fails
    virtual std::vector<std::string> listDevices() const = 0;

    // Name for logging
    virtual std::string backendName() const = 0;
};
