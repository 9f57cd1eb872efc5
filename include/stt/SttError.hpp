#pragma once
#include <stdexcept>
#include <string>

// Engine errors. Load errors are thrown to the caller of load()/createEngine.
// Inference errors only ever live inside the inference worker, where they
// are logged and dropped.
class SttError : public std::runtime_error {
public:
    enum class Kind {
        ModelLoadError,
        ModelNotFound,
        InferenceError,
        InvalidAudioFormat,
        NotInitialized
    };

    SttError(Kind kind, const std::string& message)
        : std::runtime_error(describe(kind, message)), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    static std::string describe(Kind k, const std::string& message) {
        switch (k) {
            case Kind::ModelLoadError:     return "Model load error: " + message;
            case Kind::ModelNotFound:      return "Model not found: " + message;
            case Kind::InferenceError:     return "Inference error: " + message;
            case Kind::InvalidAudioFormat: return "Invalid audio format: " + message;
            case Kind::NotInitialized:     return "Engine not initialized";
        }
        return message;
    }

    Kind kind_;
};
