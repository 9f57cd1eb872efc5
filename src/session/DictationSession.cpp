#include "session/DictationSession.hpp"
#include "stt/EngineFactory.hpp"
#include <spdlog/spdlog.h>

DictationSession::DictationSession(AppConfig config,
                                   EngineFactory engineFactory,
                                   RealtimePipeline::CaptureFactory captureFactory)
    : config_(std::move(config))
    , engineFactory_(engineFactory ? std::move(engineFactory)
                                   : EngineFactory(&createEngine))
    , captureFactory_(std::move(captureFactory)) {}

DictationSession::~DictationSession() {
    std::lock_guard lock(mtx_);
    shutdownLocked();
}

void DictationSession::setEventCallback(EventCallback cb) {
    std::lock_guard lock(callbackMtx_);
    onEvent_ = std::move(cb);
}

void DictationSession::startRecording(std::optional<Language> language) {
    std::lock_guard lock(mtx_);

    // Leave the running recording untouched; a capture that died may be
    // restarted
    if (pipeline_ && pipeline_->isRunning())
        throw PipelineError(PipelineError::Kind::AlreadyRunning);
    if (recording_ && !pipeline_->status().is(PipelineStatus::State::Error))
        throw PipelineError(PipelineError::Kind::AlreadyRunning);

    Language lang = language ? *language : Language::fromCode(config_.language);

    if (!pipeline_) {
        std::unique_ptr<ISttEngine> engine;
        try {
            engine = engineFactory_(config_);
        } catch (const SttError& e) {
            spdlog::error("Cannot create STT engine: {}", e.what());
            throw PipelineError(PipelineError::Kind::Stt, e.what());
        }

        PipelineConfig pc;
        pc.audio.targetSampleRate = config_.targetSampleRate;
        pipeline_ = std::make_unique<RealtimePipeline>(
            std::move(engine), pc, captureFactory_);
    }

    pipeline_->setLanguage(lang);

    stopListener();
    {
        std::lock_guard tlock(transcriptMtx_);
        transcript_.clear();
    }

    listenerStop_ = false;
    listener_ = std::thread(&DictationSession::listen, this,
                            pipeline_->subscribe());

    try {
        pipeline_->start();
    } catch (const PipelineError&) {
        stopListener();
        throw;
    }

    recording_ = true;
    spdlog::info("Recording started ({}, language {})",
                 pipeline_->engineName(), lang.code());
}

std::string DictationSession::stopRecording() {
    if (stopping_.exchange(true)) {
        spdlog::warn("stopRecording already in progress, skipped");
        return "";
    }

    std::string text;
    {
        std::lock_guard lock(mtx_);
        if (pipeline_) pipeline_->stop();
        stopListener();
        recording_ = false;

        std::lock_guard tlock(transcriptMtx_);
        text = transcript_.text();
    }

    stopping_ = false;
    spdlog::info("Recording stopped, text: {}", text);
    return text;
}

void DictationSession::cancelRecording() {
    std::lock_guard lock(mtx_);
    if (pipeline_) pipeline_->stop();
    stopListener();
    recording_ = false;

    std::lock_guard tlock(transcriptMtx_);
    transcript_.clear();
    spdlog::info("Recording cancelled");
}

void DictationSession::applyConfig(const AppConfig& config) {
    std::lock_guard lock(mtx_);
    bool rebuild = AppConfig::engineSettingsChanged(config_, config);
    config_ = config;

    if (rebuild && pipeline_) {
        spdlog::info("Engine settings changed, pipeline will be recreated");
        shutdownLocked();
    }
}

bool DictationSession::hasPipeline() const {
    std::lock_guard lock(mtx_);
    return pipeline_ != nullptr;
}

PipelineStatus DictationSession::pipelineStatus() const {
    std::lock_guard lock(mtx_);
    return pipeline_ ? pipeline_->status() : PipelineStatus{};
}

Transcript DictationSession::transcript() const {
    std::lock_guard lock(transcriptMtx_);
    return transcript_;
}

AppConfig DictationSession::config() const {
    std::lock_guard lock(mtx_);
    return config_;
}

void DictationSession::shutdownLocked() {
    if (pipeline_) pipeline_->stop();
    stopListener();
    pipeline_.reset();
    recording_ = false;
}

// Drains what the pipeline already published, then exits
void DictationSession::stopListener() {
    listenerStop_ = true;
    if (listener_.joinable()) listener_.join();
}

void DictationSession::listen(EventReceiver rx) {
    while (true) {
        auto event = rx.recv(std::chrono::milliseconds(50));
        if (!event) {
            if (listenerStop_ || rx.closed()) break;
            continue;
        }

        {
            std::lock_guard lock(transcriptMtx_);
            transcript_.apply(*event);
        }

        std::lock_guard lock(callbackMtx_);
        if (onEvent_) onEvent_(*event);
    }

    if (size_t lagged = rx.takeLagged())
        spdlog::warn("Transcript listener lagged, {} events dropped", lagged);
}
