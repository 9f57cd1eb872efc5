#pragma once
#include "Transcript.hpp"
#include "config/AppConfig.hpp"
#include "pipeline/RealtimePipeline.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

// One user's dictation: owns the pipeline and the running transcript.
//
// The pipeline is built lazily on the first recording and thrown away
// whenever a config change affects the engine; the next startRecording()
// builds a fresh one.
class DictationSession {
public:
    using EngineFactory = std::function<std::unique_ptr<ISttEngine>(const AppConfig&)>;
    using EventCallback = std::function<void(const SttEvent&)>;

    explicit DictationSession(AppConfig config,
                              EngineFactory engineFactory = nullptr,
                              RealtimePipeline::CaptureFactory captureFactory =
                                  RealtimePipeline::defaultCaptureFactory());
    ~DictationSession();

    DictationSession(const DictationSession&) = delete;
    DictationSession& operator=(const DictationSession&) = delete;

    // Called from the listener thread for every event, after the
    // transcript has been updated
    void setEventCallback(EventCallback cb);

    // Language defaults to config().language.
    // Throws PipelineError (Stt when the engine cannot be built).
    void startRecording(std::optional<Language> language = std::nullopt);

    // Returns the trimmed transcript. A second concurrent call returns ""
    // without touching the pipeline.
    std::string stopRecording();

    // Stop without producing text
    void cancelRecording();

    void applyConfig(const AppConfig& config);

    bool isRecording() const { return recording_; }
    bool hasPipeline() const;
    PipelineStatus pipelineStatus() const;
    Transcript transcript() const;
    AppConfig config() const;

private:
    void listen(EventReceiver rx);
    void stopListener();
    void shutdownLocked();

    AppConfig                         config_;
    EngineFactory                     engineFactory_;
    RealtimePipeline::CaptureFactory  captureFactory_;
    std::unique_ptr<RealtimePipeline> pipeline_;
    mutable std::mutex                mtx_;   // config_, pipeline_

    Transcript                        transcript_;
    mutable std::mutex                transcriptMtx_;

    EventCallback                     onEvent_;
    std::mutex                        callbackMtx_;

    std::atomic<bool>                 recording_{false};
    std::atomic<bool>                 stopping_{false};

    std::thread                       listener_;
    std::atomic<bool>                 listenerStop_{false};
};
