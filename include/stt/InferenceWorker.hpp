#pragma once
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

// Single background thread that runs an engine's inference requests one at
// a time, in submission order. Keeps the network call off the pipeline
// thread while guaranteeing results land in the same order as the audio.
//
// Destruction finishes the request currently running and discards any that
// have not started.
class InferenceWorker {
public:
    InferenceWorker();
    ~InferenceWorker();

    InferenceWorker(const InferenceWorker&) = delete;
    InferenceWorker& operator=(const InferenceWorker&) = delete;

    void submit(std::function<void()> job);

    // Jobs waiting to start (excludes the one running)
    size_t queued() const;

private:
    void run();

    std::deque<std::function<void()>> jobs_;
    mutable std::mutex                mtx_;
    std::condition_variable           cv_;
    bool                              stopping_ = false;
    std::thread                       thread_;
};
