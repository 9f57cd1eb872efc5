#include "stt/InferenceWorker.hpp"
#include <spdlog/spdlog.h>

InferenceWorker::InferenceWorker()
    : thread_(&InferenceWorker::run, this) {}

InferenceWorker::~InferenceWorker() {
    size_t dropped = 0;
    {
        std::lock_guard lock(mtx_);
        stopping_ = true;
        dropped = jobs_.size();
        jobs_.clear();
    }
    cv_.notify_all();

    if (dropped > 0)
        spdlog::warn("Inference worker shutting down, {} queued request(s) dropped",
                     dropped);

    if (thread_.joinable())
        thread_.join();
}

void InferenceWorker::submit(std::function<void()> job) {
    {
        std::lock_guard lock(mtx_);
        jobs_.push_back(std::move(job));
    }
    cv_.notify_one();
}

size_t InferenceWorker::queued() const {
    std::lock_guard lock(mtx_);
    return jobs_.size();
}

void InferenceWorker::run() {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock lock(mtx_);
            cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
            if (stopping_) return;
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }
        job();
    }
}
