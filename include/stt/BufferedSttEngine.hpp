#pragma once
#include "ISttEngine.hpp"
#include "ITranscriptionBackend.hpp"
#include "InferenceWorker.hpp"
#include "ResultQueue.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

// When buffered audio gets sent for inference.
struct DispatchPolicy {
    int    sampleRate          = 16000;
    size_t minDispatchSamples  = 16000;   // shorter buffers are discarded
    size_t autoDispatchSamples = 0;       // 0 = only flush() dispatches
    std::chrono::milliseconds flushTimeout{30000};

    static size_t samplesFor(int ms, int sampleRate) {
        return static_cast<size_t>(ms) * static_cast<size_t>(sampleRate) / 1000;
    }
};

// Accumulate → dispatch → collect, shared by every engine variant.
//
// pushAudio() appends to the accumulation buffer and, when the policy sets
// an auto-dispatch threshold, hands full buffers off as Partial requests.
// flush() hands the remainder off as a Final request and waits for all
// in-flight requests to settle, bounded by policy.flushTimeout. A request
// that outlives the timeout is abandoned: its result still lands in the
// queue for a later poll().
//
// Requests run on the engine's InferenceWorker; failures are logged and
// produce no event. Partials are cumulative over the current segment, so a
// consumer replacing the pending Partial never loses an earlier chunk; the
// Final carries the whole segment.
class BufferedSttEngine : public ISttEngine {
public:
    BufferedSttEngine(std::string name,
                      std::shared_ptr<ITranscriptionBackend> backend,
                      const DispatchPolicy& policy);
    ~BufferedSttEngine() override;

    void setLanguage(const Language& language) override;
    Language language() const override { return language_; }

    void pushAudio(const std::vector<float>& pcm) override;
    std::optional<SttEvent> poll() override;
    void flush() override;
    void reset() override;

    std::string name() const override { return name_; }
    bool isReady() const override { return backend_ != nullptr; }

    const DispatchPolicy& policy() const { return policy_; }
    size_t bufferedSamples() const { return buffer_.size(); }
    size_t inFlight() const { return results_->inFlight(); }

protected:
    // Take the whole buffer and submit it. Returns false when nothing was
    // sent (empty or below the minimum duration).
    bool dispatch(SttEvent::Kind kind);

private:
    void submit(SttEvent::Kind kind, std::vector<float> audio);

    std::string                            name_;
    std::shared_ptr<ITranscriptionBackend> backend_;
    DispatchPolicy                         policy_;
    Language                               language_;
    std::vector<float>                     buffer_;
    std::shared_ptr<ResultQueue>           results_;

    // Declared last: joins before the members its jobs reference go away
    InferenceWorker                        worker_;
};
