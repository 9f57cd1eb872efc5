#include "audio/PortAudioCapture.hpp"
#include "audio/AudioConvert.hpp"
#include <portaudio.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>

PortAudioCapture::PortAudioCapture(unsigned long framesPerBuffer)
    : framesPerBuffer_(framesPerBuffer) {
    PaError err = Pa_Initialize();
    if (err == paNoError) {
        paInitialized_ = true;
    } else {
        spdlog::error("PortAudio init failed: {}", Pa_GetErrorText(err));
    }
}

PortAudioCapture::~PortAudioCapture() {
    stop();
    if (paInitialized_)
        Pa_Terminate();
}

void PortAudioCapture::start(const AudioConfig& config,
                             SampleCallback onSamples) {
    if (!paInitialized_)
        throw AudioCaptureError(AudioCaptureError::Kind::NotInitialized,
                                "PortAudio failed to initialize");

    // One stream per instance
    stop();

    config_    = config;
    onSamples_ = std::move(onSamples);
    {
        std::lock_guard lock(controlMtx_);
        stopRequested_ = false;
    }

    std::promise<void> ready;
    auto started = ready.get_future();
    controlThread_ = std::thread(&PortAudioCapture::controlLoop, this,
                                 std::move(ready));

    try {
        started.get();
    } catch (const AudioCaptureError&) {
        if (controlThread_.joinable()) controlThread_.join();
        throw;
    }

    running_ = true;
}

void PortAudioCapture::stop() {
    {
        std::lock_guard lock(controlMtx_);
        stopRequested_ = true;
    }
    controlCv_.notify_all();

    if (controlThread_.joinable())
        controlThread_.join();

    running_ = false;
}

std::vector<std::string> PortAudioCapture::listDevices() const {
    std::vector<std::string> result;
    if (!paInitialized_) return result;

    int count = Pa_GetDeviceCount();
    if (count < 0) {
        spdlog::warn("Device enumeration failed: {}", Pa_GetErrorText(count));
        return result;
    }

    for (int i = 0; i < count; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (info && info->maxInputChannels > 0 && info->name)
            result.emplace_back(info->name);
    }
    return result;
}

// ── Control thread ───────────────────────────────────────────────────────

void PortAudioCapture::controlLoop(std::promise<void> ready) {
    try {
        openStream();
    } catch (const AudioCaptureError&) {
        ready.set_exception(std::current_exception());
        return;
    }
    ready.set_value();

    std::string failure;
    {
        std::unique_lock lock(controlMtx_);
        while (!stopRequested_) {
            controlCv_.wait_for(lock, std::chrono::milliseconds(100));
            if (stopRequested_) break;

            // Device unplugged or host API gave up on us
            PaError active = Pa_IsStreamActive(stream_);
            if (active != 1) {
                failure = active < 0 ? Pa_GetErrorText(active)
                                     : "stream stopped unexpectedly";
                break;
            }
        }
    }

    closeStream();

    if (!failure.empty()) {
        spdlog::error("Audio stream error: {}", failure);
        running_ = false;
        if (onError_) onError_(failure);
    } else {
        spdlog::info("Audio capture stopped");
    }
}

void PortAudioCapture::openStream() {
    PaDeviceIndex device = Pa_GetDefaultInputDevice();
    if (device == paNoDevice)
        throw AudioCaptureError(AudioCaptureError::Kind::NoDevice, "");

    const PaDeviceInfo* info = Pa_GetDeviceInfo(device);
    if (!info)
        throw AudioCaptureError(AudioCaptureError::Kind::ConfigError,
                                "cannot query default input device");
    if (info->maxInputChannels < 1 || info->defaultSampleRate <= 0)
        throw AudioCaptureError(AudioCaptureError::Kind::ConfigError,
            fmt::format("device '{}' reports {} inputs at {}Hz",
                        info->name, info->maxInputChannels,
                        info->defaultSampleRate));

    // Never assume 16kHz mono: take whatever the device runs at natively
    sourceRate_     = static_cast<int>(info->defaultSampleRate);
    sourceChannels_ = std::min(info->maxInputChannels, 2);

    spdlog::info("Audio device: '{}'", info->name);
    spdlog::info("Audio config: {}Hz {}ch -> {}Hz mono",
                 sourceRate_, sourceChannels_, config_.targetSampleRate);

    size_t monoFrames = framesPerBuffer_;
    monoScratch_.assign(monoFrames, 0.0f);
    resampledScratch_.assign(
        resampledLength(monoFrames, sourceRate_, config_.targetSampleRate) + 1,
        0.0f);

    PaStreamParameters inputParams;
    inputParams.device       = device;
    inputParams.channelCount = sourceChannels_;
    inputParams.sampleFormat = paFloat32;   // interleaved
    inputParams.suggestedLatency = info->defaultLowInputLatency;
    inputParams.hostApiSpecificStreamInfo = nullptr;

    PaError err = Pa_OpenStream(
        &stream_,
        &inputParams,
        nullptr,  // no output
        info->defaultSampleRate,
        framesPerBuffer_,
        paClipOff,
        &PortAudioCapture::paCallback,
        this
    );
    if (err != paNoError) {
        stream_ = nullptr;
        throw AudioCaptureError(AudioCaptureError::Kind::StreamError,
                                std::string("Pa_OpenStream: ") +
                                Pa_GetErrorText(err));
    }

    err = Pa_StartStream(stream_);
    if (err != paNoError) {
        Pa_CloseStream(stream_);
        stream_ = nullptr;
        throw AudioCaptureError(AudioCaptureError::Kind::StreamError,
                                std::string("Pa_StartStream: ") +
                                Pa_GetErrorText(err));
    }

    spdlog::info("Audio capture started");
}

void PortAudioCapture::closeStream() {
    if (!stream_) return;

    PaError err = Pa_StopStream(stream_);
    if (err != paNoError && err != paStreamIsStopped)
        spdlog::error("Pa_StopStream failed: {}", Pa_GetErrorText(err));

    err = Pa_CloseStream(stream_);
    if (err != paNoError)
        spdlog::error("Pa_CloseStream failed: {}", Pa_GetErrorText(err));

    stream_ = nullptr;
}

// ── Real-time callback ───────────────────────────────────────────────────

int PortAudioCapture::paCallback(
    const void* input, void* /*output*/,
    unsigned long frameCount,
    const void* /*timeInfo*/,
    unsigned long /*statusFlags*/,
    void* userData)
{
    auto* self = static_cast<PortAudioCapture*>(userData);
    return self->handleAudio(static_cast<const float*>(input), frameCount);
}

int PortAudioCapture::handleAudio(const float* input,
                                  unsigned long frameCount) {
    if (!input || !onSamples_) return paContinue;

    size_t count = static_cast<size_t>(frameCount) * sourceChannels_;
    size_t mono  = stereoToMonoInto(input, count, sourceChannels_,
                                    monoScratch_);
    size_t n = resampleInto(monoScratch_.data(), mono, sourceRate_,
                            config_.targetSampleRate, resampledScratch_);

    if (n > 0)
        onSamples_(resampledScratch_.data(), n);

    return paContinue;
}
