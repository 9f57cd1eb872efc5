#pragma once
#include "stt/SttEvent.hpp"
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

// One-to-many delivery of SttEvents.
//
// Every receiver owns a bounded queue. A receiver only sees events
// published after it subscribed. When a queue is full the oldest event is
// dropped and counted as lag; the publisher never blocks.
class EventBroadcaster {
    struct Channel {
        std::deque<SttEvent>    events;
        size_t                  lagged = 0;
        bool                    closed = false;
        std::mutex              mtx;
        std::condition_variable cv;
    };

public:
    static constexpr size_t kDefaultCapacity = 100;

    class Receiver {
    public:
        Receiver() = default;

        // Non-blocking
        std::optional<SttEvent> tryRecv() {
            if (!ch_) return std::nullopt;
            std::lock_guard lock(ch_->mtx);
            return popLocked();
        }

        // Waits up to `timeout` for an event. std::nullopt on timeout or
        // when the broadcaster closed and nothing is left.
        std::optional<SttEvent> recv(std::chrono::milliseconds timeout) {
            if (!ch_) return std::nullopt;
            std::unique_lock lock(ch_->mtx);
            ch_->cv.wait_for(lock, timeout, [this] {
                return !ch_->events.empty() || ch_->closed;
            });
            return popLocked();
        }

        // Events dropped since the last call
        size_t takeLagged() {
            if (!ch_) return 0;
            std::lock_guard lock(ch_->mtx);
            size_t n = ch_->lagged;
            ch_->lagged = 0;
            return n;
        }

        bool closed() const {
            if (!ch_) return true;
            std::lock_guard lock(ch_->mtx);
            return ch_->closed && ch_->events.empty();
        }

        bool valid() const { return ch_ != nullptr; }

    private:
        friend class EventBroadcaster;
        explicit Receiver(std::shared_ptr<Channel> ch) : ch_(std::move(ch)) {}

        std::optional<SttEvent> popLocked() {
            if (ch_->events.empty()) return std::nullopt;
            SttEvent e = std::move(ch_->events.front());
            ch_->events.pop_front();
            return e;
        }

        std::shared_ptr<Channel> ch_;
    };

    explicit EventBroadcaster(size_t capacity = kDefaultCapacity)
        : capacity_(std::max<size_t>(capacity, 1)) {}

    ~EventBroadcaster() { close(); }

    EventBroadcaster(const EventBroadcaster&) = delete;
    EventBroadcaster& operator=(const EventBroadcaster&) = delete;

    Receiver subscribe() {
        auto ch = std::make_shared<Channel>();
        std::lock_guard lock(mtx_);
        channels_.push_back(ch);
        return Receiver(std::move(ch));
    }

    // Returns the number of live receivers the event was delivered to
    size_t publish(const SttEvent& event) {
        std::lock_guard lock(mtx_);
        size_t delivered = 0;
        auto it = channels_.begin();
        while (it != channels_.end()) {
            auto ch = it->lock();
            if (!ch) {
                it = channels_.erase(it);
                continue;
            }
            {
                std::lock_guard chLock(ch->mtx);
                if (ch->events.size() >= capacity_) {
                    ch->events.pop_front();
                    ch->lagged++;
                }
                ch->events.push_back(event);
            }
            ch->cv.notify_all();
            delivered++;
            ++it;
        }
        return delivered;
    }

    // Wake every receiver; they drain what is queued, then report closed
    void close() {
        std::lock_guard lock(mtx_);
        for (auto& w : channels_) {
            if (auto ch = w.lock()) {
                {
                    std::lock_guard chLock(ch->mtx);
                    ch->closed = true;
                }
                ch->cv.notify_all();
            }
        }
        channels_.clear();
    }

    size_t receiverCount() const {
        std::lock_guard lock(mtx_);
        size_t n = 0;
        for (auto& w : channels_)
            if (!w.expired()) n++;
        return n;
    }

    size_t capacity() const { return capacity_; }

private:
    size_t                              capacity_;
    std::vector<std::weak_ptr<Channel>> channels_;
    mutable std::mutex                  mtx_;
};

using EventReceiver = EventBroadcaster::Receiver;
