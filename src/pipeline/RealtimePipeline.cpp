#include "pipeline/RealtimePipeline.hpp"
#include "audio/PortAudioCapture.hpp"
#include <spdlog/spdlog.h>

RealtimePipeline::CaptureFactory RealtimePipeline::defaultCaptureFactory() {
    return [] { return std::make_unique<PortAudioCapture>(); };
}

RealtimePipeline::RealtimePipeline(std::unique_ptr<ISttEngine> engine,
                                   PipelineConfig config,
                                   CaptureFactory captureFactory)
    : engine_(std::move(engine))
    , config_(std::move(config))
    , captureFactory_(std::move(captureFactory)) {}

RealtimePipeline::~RealtimePipeline() {
    stop();
}

void RealtimePipeline::start() {
    std::lock_guard lifecycle(lifecycleMtx_);

    if (status().is(PipelineStatus::State::Running))
        throw PipelineError(PipelineError::Kind::AlreadyRunning);

    // Leftovers from a capture that died while running
    const bool recovering = status().is(PipelineStatus::State::Error);
    teardown();

    setStatus({PipelineStatus::State::Starting, ""});

    PipelineConfig cfg = config();
    {
        std::lock_guard lock(engineMtx_);
        // Audio from the dead session was never flushed. Results still in
        // flight after a timed-out flush are kept for the next poll.
        if (recovering) engine_->reset();
        engine_->setLanguage(cfg.language);
    }

    ring_ = std::make_unique<SampleRingBuffer>(cfg.ringCapacity);
    {
        std::lock_guard lock(wakeMtx_);
        stopLoop_ = false;
    }

    try {
        capture_ = captureFactory_();
        capture_->setErrorCallback([this](const std::string& msg) {
            onCaptureError(msg);
        });

        SampleRingBuffer* ring = ring_.get();
        capture_->start(cfg.audio, [ring](const float* samples, size_t count) {
            ring->write(samples, count);
        });
    } catch (const std::exception& e) {
        spdlog::error("Pipeline start failed: {}", e.what());
        setStatus(PipelineStatus::error(e.what()));
        capture_.reset();
        ring_.reset();
        throw PipelineError(PipelineError::Kind::Audio, e.what());
    }

    loopThread_ = std::thread(&RealtimePipeline::processLoop, this);

    {
        // The capture may already have reported an error
        std::unique_lock lock(statusMtx_);
        if (status_.is(PipelineStatus::State::Starting))
            status_ = {PipelineStatus::State::Running, ""};
    }
    spdlog::info("Pipeline started ({}, language {}, {} Hz via {})",
                 engineName(), cfg.language.code(),
                 cfg.audio.targetSampleRate, capture_->backendName());
}

void RealtimePipeline::stop() {
    std::lock_guard lifecycle(lifecycleMtx_);

    if (status().is(PipelineStatus::State::Stopped)) return;

    setStatus({PipelineStatus::State::Stopping, ""});

    teardown();

    {
        std::lock_guard lock(engineMtx_);
        engine_->flush();
        publishReady();
    }

    setStatus({PipelineStatus::State::Stopped, ""});
    spdlog::info("Pipeline stopped");
}

void RealtimePipeline::setLanguage(const Language& language) {
    {
        std::lock_guard lock(configMtx_);
        config_.language = language;
    }
    std::lock_guard lock(engineMtx_);
    engine_->setLanguage(language);
}

PipelineStatus RealtimePipeline::status() const {
    std::shared_lock lock(statusMtx_);
    return status_;
}

PipelineConfig RealtimePipeline::config() const {
    std::lock_guard lock(configMtx_);
    return config_;
}

std::string RealtimePipeline::engineName() const {
    std::lock_guard lock(engineMtx_);
    return engine_->name();
}

void RealtimePipeline::setStatus(PipelineStatus s) {
    std::unique_lock lock(statusMtx_);
    status_ = std::move(s);
}

void RealtimePipeline::signalLoop() {
    {
        std::lock_guard lock(wakeMtx_);
        stopLoop_ = true;
    }
    wakeCv_.notify_all();
}

// Capture first so nothing more lands in the ring, then the loop, which
// pushes whatever is left before exiting.
void RealtimePipeline::teardown() {
    if (capture_) {
        capture_->stop();
        capture_.reset();
    }
    signalLoop();
    if (loopThread_.joinable()) loopThread_.join();
    ring_.reset();
}

// Control thread of the capture: must not stop or join the capture here
void RealtimePipeline::onCaptureError(const std::string& message) {
    spdlog::error("Audio capture failed while running: {}", message);
    setStatus(PipelineStatus::error(message));
    signalLoop();
}

void RealtimePipeline::processLoop() {
    spdlog::debug("Processing loop started");

    std::vector<float> frame;
    frame.reserve(ring_->capacity());

    while (true) {
        bool stopping;
        {
            std::unique_lock lock(wakeMtx_);
            wakeCv_.wait_for(lock, std::chrono::milliseconds(10), [this] {
                return stopLoop_ || ring_->available() > 0;
            });
            stopping = stopLoop_;
        }

        drainAndPush(frame);

        if (size_t dropped = ring_->takeDropped())
            spdlog::warn("Audio handoff full, dropped {} samples", dropped);

        if (stopping) break;
    }

    spdlog::debug("Processing loop stopped");
}

void RealtimePipeline::drainAndPush(std::vector<float>& frame) {
    frame.clear();
    if (ring_->drainInto(frame) == 0) return;

    std::lock_guard lock(engineMtx_);
    engine_->pushAudio(frame);
    publishReady();
}

// engineMtx_ must be held
void RealtimePipeline::publishReady() {
    while (auto event = engine_->poll()) {
        spdlog::debug("Publishing {} event: {}",
                      event->isFinal() ? "final" : "partial", event->text);
        events_.publish(*event);
    }
}
