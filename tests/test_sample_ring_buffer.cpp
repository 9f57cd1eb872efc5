#include <gtest/gtest.h>
#include "audio/SampleRingBuffer.hpp"
#include <thread>
#include <vector>

TEST(SampleRingBufferTest, WriteAndDrain) {
    SampleRingBuffer buf(1024);
    float data[] = {1.0f, 2.0f, 3.0f};
    EXPECT_EQ(buf.write(data, 3), 3u);
    EXPECT_EQ(buf.available(), 3u);

    std::vector<float> out;
    EXPECT_EQ(buf.drainInto(out), 3u);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_FLOAT_EQ(out[0], 1.0f);
    EXPECT_FLOAT_EQ(out[2], 3.0f);
    EXPECT_EQ(buf.available(), 0u);
}

TEST(SampleRingBufferTest, DrainAppends) {
    SampleRingBuffer buf(16);
    float data[] = {4.0f};
    buf.write(data, 1);

    std::vector<float> out = {9.0f};
    buf.drainInto(out);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_FLOAT_EQ(out[0], 9.0f);
    EXPECT_FLOAT_EQ(out[1], 4.0f);
}

TEST(SampleRingBufferTest, WrapAround) {
    SampleRingBuffer buf(4);

    float data1[] = {1.0f, 2.0f, 3.0f};
    buf.write(data1, 3);
    std::vector<float> out;
    buf.drainInto(out);

    // Wraps past the end of the storage
    float data2[] = {4.0f, 5.0f, 6.0f};
    EXPECT_EQ(buf.write(data2, 3), 3u);

    out.clear();
    EXPECT_EQ(buf.drainInto(out), 3u);
    EXPECT_FLOAT_EQ(out[0], 4.0f);
    EXPECT_FLOAT_EQ(out[1], 5.0f);
    EXPECT_FLOAT_EQ(out[2], 6.0f);
}

TEST(SampleRingBufferTest, OverflowIsDroppedAndCounted) {
    SampleRingBuffer buf(4);

    float data[8] = {1, 2, 3, 4, 5, 6, 7, 8};
    EXPECT_EQ(buf.write(data, 8), 4u);
    EXPECT_EQ(buf.available(), 4u);
    EXPECT_EQ(buf.takeDropped(), 4u);
    EXPECT_EQ(buf.takeDropped(), 0u);   // reset by take

    // Oldest samples are kept
    std::vector<float> out;
    buf.drainInto(out);
    EXPECT_FLOAT_EQ(out[0], 1.0f);
    EXPECT_FLOAT_EQ(out[3], 4.0f);
}

TEST(SampleRingBufferTest, EmptyDrainReturnsZero) {
    SampleRingBuffer buf(1024);
    std::vector<float> out;
    EXPECT_EQ(buf.drainInto(out), 0u);
    EXPECT_TRUE(out.empty());
}

TEST(SampleRingBufferTest, ConcurrentProducerConsumerKeepsOrder) {
    SampleRingBuffer buf(256);
    const int total = 20000;

    std::thread producer([&] {
        int next = 0;
        while (next < total) {
            float chunk[16];
            int n = std::min(16, total - next);
            for (int i = 0; i < n; i++) chunk[i] = static_cast<float>(next + i);
            size_t written = buf.write(chunk, n);
            next += static_cast<int>(written);
            if (written == 0) std::this_thread::yield();
        }
    });

    std::vector<float> out;
    while (out.size() < static_cast<size_t>(total)) {
        if (buf.drainInto(out) == 0) std::this_thread::yield();
    }
    producer.join();

    for (int i = 0; i < total; i++)
        ASSERT_FLOAT_EQ(out[i], static_cast<float>(i));
}
