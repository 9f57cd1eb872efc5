#include "stt/BufferedSttEngine.hpp"
#include "audio/WavEncoder.hpp"
#include <spdlog/spdlog.h>
#include <exception>

namespace {

// Settles the request however the job exits
class RequestGuard {
public:
    explicit RequestGuard(ResultQueue& results) : results_(results) {}
    ~RequestGuard() { results_.finishRequest(); }

    RequestGuard(const RequestGuard&) = delete;
    RequestGuard& operator=(const RequestGuard&) = delete;

private:
    ResultQueue& results_;
};

} // namespace

BufferedSttEngine::BufferedSttEngine(
    std::string name,
    std::shared_ptr<ITranscriptionBackend> backend,
    const DispatchPolicy& policy)
    : name_(std::move(name))
    , backend_(std::move(backend))
    , policy_(policy)
    , results_(std::make_shared<ResultQueue>())
{
    buffer_.reserve(static_cast<size_t>(policy_.sampleRate) * 2);
}

BufferedSttEngine::~BufferedSttEngine() = default;

void BufferedSttEngine::setLanguage(const Language& language) {
    language_ = language;
    spdlog::debug("{} language set: {}", name_, language_.code());
}

void BufferedSttEngine::pushAudio(const std::vector<float>& pcm) {
    buffer_.insert(buffer_.end(), pcm.begin(), pcm.end());

    if (policy_.autoDispatchSamples > 0 &&
        buffer_.size() >= policy_.autoDispatchSamples) {
        dispatch(SttEvent::Kind::Partial);
    }
}

std::optional<SttEvent> BufferedSttEngine::poll() {
    return results_->pop();
}

void BufferedSttEngine::flush() {
    spdlog::info("Flush {}: {} samples ({:.1f}s)", name_, buffer_.size(),
                 static_cast<float>(buffer_.size()) / policy_.sampleRate);

    // Nothing sent: still close the segment so earlier Partials become final
    if (!dispatch(SttEvent::Kind::Final))
        submit(SttEvent::Kind::Final, {});

    if (!results_->waitIdle(policy_.flushTimeout)) {
        spdlog::warn("Timeout waiting for {} response after {}ms",
                     name_, policy_.flushTimeout.count());
    }
}

void BufferedSttEngine::reset() {
    buffer_.clear();
    results_->reset();
    spdlog::debug("{} engine reset", name_);
}

bool BufferedSttEngine::dispatch(SttEvent::Kind kind) {
    if (buffer_.empty()) return false;

    // Move out so later pushes can never touch the in-flight payload
    std::vector<float> audio = std::move(buffer_);
    buffer_.clear();

    if (audio.size() < policy_.minDispatchSamples) {
        spdlog::debug("Audio too short ({} samples), skipped", audio.size());
        return false;
    }

    submit(kind, std::move(audio));
    return true;
}

// An empty payload makes no backend call and only settles the segment
void BufferedSttEngine::submit(SttEvent::Kind kind, std::vector<float> audio) {
    const uint64_t generation = results_->beginRequest();
    const float seconds = static_cast<float>(audio.size()) / policy_.sampleRate;
    if (!audio.empty())
        spdlog::info("{} transcription of {:.1f}s audio...", name_, seconds);

    auto backend    = backend_;
    auto results    = results_;
    auto language   = language_;
    auto name       = name_;
    int  sampleRate = policy_.sampleRate;

    worker_.submit([=, audio = std::move(audio)]() {
        RequestGuard guard(*results);

        std::string text;
        if (!audio.empty()) {
            try {
                std::string wav = WavEncoder::encodeMono16(audio, sampleRate);
                spdlog::info("Sending to {}: {:.1f}s audio, {} bytes WAV",
                             name, seconds, wav.size());
                text = backend->transcribe(wav, language);
            } catch (const std::exception& e) {
                spdlog::error("{} error: {}", name, e.what());
            } catch (...) {
                spdlog::error("{} error: unknown exception from backend", name);
            }
        }

        if (!text.empty()) spdlog::info("{} result: {}", name, text);
        if (!results->pushSegment(kind, text, generation) && !text.empty())
            spdlog::debug("{} result discarded after reset", name);
    });
}
