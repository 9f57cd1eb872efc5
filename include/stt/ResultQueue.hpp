#pragma once
#include "SttEvent.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

// Results handed from an engine's inference thread to whoever polls it.
// Also tracks in-flight requests so flush() can wait for them without
// busy polling.
//
// Every request is stamped with the generation current at dispatch time.
// reset() bumps the generation so results from earlier requests are
// discarded when they land.
class ResultQueue {
public:
    // Caller thread: a request is about to be handed to the worker
    uint64_t beginRequest() {
        std::lock_guard lock(mtx_);
        inFlight_++;
        return generation_;
    }

    // Worker thread: the request settled (success or failure)
    void finishRequest() {
        std::lock_guard lock(mtx_);
        if (inFlight_ > 0) inFlight_--;
        cv_.notify_all();
    }

    // Worker thread: local engines transcribe one segment of speech in
    // several chunks. A Partial carries every chunk since the last Final so
    // the next one can replace it; a Final closes the segment, chunks
    // already reported as Partials included. Results stamped before the
    // last reset() are dropped. Returns true if an event was enqueued.
    bool pushSegment(SttEvent::Kind kind, const std::string& text,
                     uint64_t generation) {
        std::lock_guard lock(mtx_);
        if (generation != generation_) return false;

        if (!text.empty()) {
            if (!segment_.empty()) segment_ += ' ';
            segment_ += text;
        }

        if (kind == SttEvent::Kind::Partial) {
            if (text.empty()) return false;
            events_.push_back(SttEvent::makePartial(segment_));
            return true;
        }

        if (segment_.empty()) return false;
        events_.push_back(SttEvent::makeFinal(std::move(segment_)));
        segment_.clear();
        return true;
    }

    void push(SttEvent event) {
        std::lock_guard lock(mtx_);
        events_.push_back(std::move(event));
    }

    std::optional<SttEvent> pop() {
        std::lock_guard lock(mtx_);
        if (events_.empty()) return std::nullopt;
        SttEvent e = std::move(events_.front());
        events_.pop_front();
        return e;
    }

    // Drop ready events and orphan in-flight results
    void reset() {
        std::lock_guard lock(mtx_);
        events_.clear();
        segment_.clear();
        generation_++;
    }

    // Blocks until no request is in flight. Returns false on timeout.
    bool waitIdle(std::chrono::milliseconds timeout) {
        std::unique_lock lock(mtx_);
        return cv_.wait_for(lock, timeout, [this] { return inFlight_ == 0; });
    }

    size_t inFlight() const {
        std::lock_guard lock(mtx_);
        return inFlight_;
    }

    size_t size() const {
        std::lock_guard lock(mtx_);
        return events_.size();
    }

private:
    std::deque<SttEvent>    events_;
    std::string             segment_;
    size_t                  inFlight_   = 0;
    uint64_t                generation_ = 0;
    mutable std::mutex      mtx_;
    std::condition_variable cv_;
};
