#pragma once
#include "IAudioCapture.hpp"
#include <atomic>
#include <condition_variable>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// PortAudio-based microphone capture from the default input device.
// Link with -lportaudio.
//
// Audio data flows:
//   PortAudio callback (real-time thread)
//       → downmix + resample into preallocated scratch
//           → SampleCallback (non-blocking handoff owned by the caller)
//
// The stream itself is opened, started, stopped and closed on a dedicated
// control thread that polls for a stop request every 100ms, so callers
// never wait on the host audio thread directly.

// Forward declare PortAudio types to avoid including portaudio.h in header
typedef void PaStream;

class PortAudioCapture : public IAudioCapture {
public:
    explicit PortAudioCapture(unsigned long framesPerBuffer = 1024);
    ~PortAudioCapture() override;

    PortAudioCapture(const PortAudioCapture&) = delete;
    PortAudioCapture& operator=(const PortAudioCapture&) = delete;

    void start(const AudioConfig& config, SampleCallback onSamples) override;
    void stop() override;
    bool isRunning() const override { return running_; }

    void setErrorCallback(ErrorCallback cb) override { onError_ = std::move(cb); }

    std::vector<std::string> listDevices() const override;
    std::string backendName() const override { return "PortAudio"; }

    // Native format negotiated with the device (valid while running)
    int sourceSampleRate() const { return sourceRate_; }
    int sourceChannels() const   { return sourceChannels_; }

private:
    // PortAudio stream callback (static → forwards to instance)
    static int paCallback(const void* input, void* output,
                          unsigned long frameCount,
                          const void* timeInfo,
                          unsigned long statusFlags,
                          void* userData);

    int handleAudio(const float* input, unsigned long frameCount);

    // Control thread body. Reports open/start success through `ready`.
    void controlLoop(std::promise<void> ready);
    void openStream();
    void closeStream();

    AudioConfig     config_;
    SampleCallback  onSamples_;
    ErrorCallback   onError_;

    PaStream*       stream_ = nullptr;
    int             sourceRate_     = 0;
    int             sourceChannels_ = 0;
    unsigned long   framesPerBuffer_;

    // Scratch for the callback, sized before the stream starts
    std::vector<float> monoScratch_;
    std::vector<float> resampledScratch_;

    std::thread             controlThread_;
    std::mutex              controlMtx_;
    std::condition_variable controlCv_;
    bool                    stopRequested_ = false;
    std::atomic<bool>       running_{false};

    bool paInitialized_ = false;
};
