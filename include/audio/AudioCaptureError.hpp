#pragma once
#include <stdexcept>
#include <string>

// Raised synchronously by IAudioCapture::start(). Terminal for that
// capture session; callers decide whether to try again.
class AudioCaptureError : public std::runtime_error {
public:
    enum class Kind {
        NoDevice,        // no default input device
        ConfigError,     // device cannot report a usable configuration
        StreamError,     // stream refused to open/start/stop
        NotInitialized   // host audio library failed to initialise
    };

    AudioCaptureError(Kind kind, const std::string& message)
        : std::runtime_error(describe(kind, message)), kind_(kind) {}

    Kind kind() const { return kind_; }

    static const char* kindName(Kind k) {
        switch (k) {
            case Kind::NoDevice:       return "No audio device found";
            case Kind::ConfigError:    return "Configuration error";
            case Kind::StreamError:    return "Stream error";
            case Kind::NotInitialized: return "Audio system not initialized";
        }
        return "Audio error";
    }

private:
    static std::string describe(Kind k, const std::string& message) {
        if (message.empty()) return kindName(k);
        return std::string(kindName(k)) + ": " + message;
    }

    Kind kind_;
};
