#pragma once
#include "Language.hpp"
#include "SttEvent.hpp"
#include "SttError.hpp"
#include <optional>
#include <string>
#include <vector>

// Abstract speech-to-text engine.
// Implementations: CloudSttEngine (OpenAI / Voxtral / Gemini over HTTP),
// LocalSttEngine (local model served by whisper.cpp).
//
// Engines are constructed through their static load() (or createEngine()
// from EngineFactory.hpp). Callers serialize pushAudio/flush/reset; only
// the result queue is shared with the engine's own inference thread.
class ISttEngine {
public:
    virtual ~ISttEngine() = default;

    // Applies to the next dispatched request, not to in-flight ones
    virtual void setLanguage(const Language& language) = 0;
    virtual Language language() const = 0;

    // PCM float32, mono, at the engine's sample rate
    virtual void pushAudio(const std::vector<float>& pcm) = 0;

    // Non-blocking FIFO pop; std::nullopt when nothing is ready
    virtual std::optional<SttEvent> poll() = 0;

    // Dispatch buffered audio for a final result and wait (bounded) for
    // every in-flight request to settle
    virtual void flush() = 0;

    // Drop buffered audio and ready events. Language is kept.
    virtual void reset() = 0;

    virtual std::string name() const = 0;
    virtual bool isReady() const = 0;
};
