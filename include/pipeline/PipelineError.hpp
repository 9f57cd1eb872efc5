#pragma once
#include <stdexcept>
#include <string>

class PipelineError : public std::runtime_error {
public:
    enum class Kind {
        AlreadyRunning,
        NotRunning,
        Audio,     // capture failed to start
        Stt        // engine failed to load
    };

    PipelineError(Kind kind, const std::string& message = "")
        : std::runtime_error(describe(kind, message)), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    static std::string describe(Kind k, const std::string& message) {
        switch (k) {
            case Kind::AlreadyRunning: return "Pipeline already running";
            case Kind::NotRunning:     return "Pipeline not started";
            case Kind::Audio:          return "Audio error: " + message;
            case Kind::Stt:            return "STT error: " + message;
        }
        return message;
    }

    Kind kind_;
};
