#pragma once
#include "Language.hpp"
#include <string>

// The opaque inference step: WAV bytes in, text out.
// Implementations: HttpTranscriptionBackend (cloud providers and a local
// whisper.cpp server). Tests substitute scripted backends.
class ITranscriptionBackend {
public:
    virtual ~ITranscriptionBackend() = default;

    // Returns the trimmed transcription, possibly empty.
    // Throws SttError (InferenceError) on network, provider or parse
    // failure. Called from the engine's inference thread.
    virtual std::string transcribe(const std::string& wav,
                                   const Language& language) = 0;
};
