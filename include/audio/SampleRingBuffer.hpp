#pragma once
#include <vector>
#include <atomic>
#include <cstring>
#include <algorithm>

// Bounded lock-free single-producer single-consumer sample ring.
// Producer: audio callback thread (real-time safe: no allocs, no locks).
// Consumer: pipeline processing thread.
//
// Samples that do not fit are dropped and counted instead of blocking the
// producer; the consumer reports the count via takeDropped().
class SampleRingBuffer {
public:
    explicit SampleRingBuffer(size_t capacity = 16000 * 4)
        : buf_(capacity), capacity_(capacity) {}

    SampleRingBuffer(const SampleRingBuffer&) = delete;
    SampleRingBuffer& operator=(const SampleRingBuffer&) = delete;

    // Producer: returns the number of samples actually stored
    size_t write(const float* data, size_t count) {
        size_t wr = writePos_.load(std::memory_order_relaxed);
        size_t rd = readPos_.load(std::memory_order_acquire);

        size_t space   = capacity_ - (wr - rd);
        size_t toWrite = std::min(count, space);
        if (toWrite < count)
            dropped_.fetch_add(count - toWrite, std::memory_order_relaxed);
        if (toWrite == 0) return 0;

        size_t wrIdx = wr % capacity_;
        size_t firstChunk = std::min(toWrite, capacity_ - wrIdx);
        std::memcpy(&buf_[wrIdx], data, firstChunk * sizeof(float));
        if (toWrite > firstChunk) {
            std::memcpy(&buf_[0], data + firstChunk,
                        (toWrite - firstChunk) * sizeof(float));
        }

        writePos_.store(wr + toWrite, std::memory_order_release);
        return toWrite;
    }

    // Consumer: move everything currently readable to the end of `out`
    size_t drainInto(std::vector<float>& out) {
        size_t rd = readPos_.load(std::memory_order_relaxed);
        size_t wr = writePos_.load(std::memory_order_acquire);

        size_t toRead = wr - rd;
        if (toRead == 0) return 0;

        size_t base = out.size();
        out.resize(base + toRead);

        size_t rdIdx = rd % capacity_;
        size_t firstChunk = std::min(toRead, capacity_ - rdIdx);
        std::memcpy(&out[base], &buf_[rdIdx], firstChunk * sizeof(float));
        if (toRead > firstChunk) {
            std::memcpy(&out[base + firstChunk], &buf_[0],
                        (toRead - firstChunk) * sizeof(float));
        }

        readPos_.store(rd + toRead, std::memory_order_release);
        return toRead;
    }

    size_t available() const {
        return writePos_.load(std::memory_order_acquire)
             - readPos_.load(std::memory_order_relaxed);
    }

    size_t capacity() const { return capacity_; }

    // Consumer: dropped sample count since the last call
    size_t takeDropped() {
        return dropped_.exchange(0, std::memory_order_relaxed);
    }

private:
    std::vector<float> buf_;
    size_t capacity_;
    std::atomic<size_t> writePos_{0};
    std::atomic<size_t> readPos_{0};
    std::atomic<size_t> dropped_{0};
};
