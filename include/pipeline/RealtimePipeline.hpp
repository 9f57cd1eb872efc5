#pragma once
#include "EventBroadcaster.hpp"
#include "PipelineError.hpp"
#include "PipelineStatus.hpp"
#include "audio/IAudioCapture.hpp"
#include "audio/SampleRingBuffer.hpp"
#include "stt/ISttEngine.hpp"
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <thread>

struct PipelineConfig {
    Language    language;                   // Auto
    AudioConfig audio;
    size_t      ringCapacity = 16000 * 4;   // ~4s at 16kHz
};

// Realtime transcription: microphone -> engine -> subscribers.
//
// Threads:
//   Audio callback:  mix/resample, write into the SampleRingBuffer
//   Processing loop: drain the ring, push to the engine, publish events
//   Caller:          start()/stop()/setLanguage()
//
// The engine is only touched under engineMtx_. Status is written under an
// exclusive lock and read under a shared one.
class RealtimePipeline {
public:
    using CaptureFactory = std::function<std::unique_ptr<IAudioCapture>()>;

    // PortAudio on the default input device
    static CaptureFactory defaultCaptureFactory();

    RealtimePipeline(std::unique_ptr<ISttEngine> engine,
                     PipelineConfig config = {},
                     CaptureFactory captureFactory = defaultCaptureFactory());
    ~RealtimePipeline();

    RealtimePipeline(const RealtimePipeline&) = delete;
    RealtimePipeline& operator=(const RealtimePipeline&) = delete;

    // Throws PipelineError(AlreadyRunning) when Running, and
    // PipelineError(Audio) when the capture cannot start (status -> Error)
    void start();

    // Stops capture, flushes the engine and publishes the last events.
    // No-op when Stopped. Blocks for at most the engine's flush timeout.
    void stop();

    void setLanguage(const Language& language);

    PipelineStatus status() const;
    bool isRunning() const { return status().is(PipelineStatus::State::Running); }

    // Receives only events published after this call
    EventReceiver subscribe() { return events_.subscribe(); }

    PipelineConfig config() const;
    std::string engineName() const;

private:
    void processLoop();
    void drainAndPush(std::vector<float>& frame);
    void publishReady();
    void setStatus(PipelineStatus s);
    void signalLoop();
    void teardown();
    void onCaptureError(const std::string& message);

    std::unique_ptr<ISttEngine> engine_;
    mutable std::mutex          engineMtx_;

    PipelineConfig              config_;
    mutable std::mutex          configMtx_;

    CaptureFactory                    captureFactory_;
    std::unique_ptr<IAudioCapture>    capture_;
    std::unique_ptr<SampleRingBuffer> ring_;
    EventBroadcaster                  events_;

    PipelineStatus              status_;
    mutable std::shared_mutex   statusMtx_;

    // Serializes start()/stop()
    std::mutex                  lifecycleMtx_;

    std::mutex                  wakeMtx_;
    std::condition_variable     wakeCv_;
    bool                        stopLoop_ = false;
    std::thread                 loopThread_;
};
