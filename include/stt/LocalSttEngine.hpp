#pragma once
#include "BufferedSttEngine.hpp"
#include <memory>
#include <string>

// Local-model transcription. Dispatches a Partial request every time the
// buffer reaches the auto-dispatch threshold, and a Final one on flush().
//
// Inference goes through a whisper.cpp server running the model on this
// machine; the engine itself only validates the model reference.
class LocalSttEngine : public BufferedSttEngine {
public:
    struct Options {
        std::string displayName = "Whisper";
        int         autoDispatchMs = 1000;   // Whisper does better on longer segments
        std::string serverUrl   = "http://127.0.0.1:8080";
        int         httpTimeoutMs = 30000;
    };

    // Throws SttError(ModelNotFound) if modelPath does not exist,
    // SttError(ModelLoadError) if it cannot be read.
    static std::unique_ptr<LocalSttEngine> load(const std::string& modelPath,
                                                const Options& options,
                                                DispatchPolicy policy = localPolicy());

    LocalSttEngine(const std::string& modelPath,
                   const std::string& displayName,
                   std::shared_ptr<ITranscriptionBackend> backend,
                   const DispatchPolicy& policy);

    const std::string& modelPath() const { return modelPath_; }

    // Any non-empty remainder is worth a final pass
    static DispatchPolicy localPolicy() {
        DispatchPolicy p;
        p.minDispatchSamples = 1;
        return p;
    }

private:
    std::string modelPath_;
};
