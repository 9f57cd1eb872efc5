#include <gtest/gtest.h>
#include "audio/WavEncoder.hpp"
#include <cmath>
#include <cstring>
#include <limits>

static uint32_t readU32(const std::string& s, size_t off) {
    return  static_cast<uint32_t>(static_cast<unsigned char>(s[off]))
         | (static_cast<uint32_t>(static_cast<unsigned char>(s[off + 1])) << 8)
         | (static_cast<uint32_t>(static_cast<unsigned char>(s[off + 2])) << 16)
         | (static_cast<uint32_t>(static_cast<unsigned char>(s[off + 3])) << 24);
}

static int16_t readI16(const std::string& s, size_t off) {
    uint16_t v = static_cast<uint16_t>(static_cast<unsigned char>(s[off]))
               | static_cast<uint16_t>(static_cast<unsigned char>(s[off + 1]) << 8);
    return static_cast<int16_t>(v);
}

TEST(WavEncoderTest, HeaderLayout) {
    std::vector<float> samples(100, 0.0f);
    auto wav = WavEncoder::encodeMono16(samples, 16000);

    ASSERT_EQ(wav.size(), 44u + 200u);
    EXPECT_EQ(wav.compare(0, 4, "RIFF"), 0);
    EXPECT_EQ(readU32(wav, 4), 36u + 200u);
    EXPECT_EQ(wav.compare(8, 4, "WAVE"), 0);
    EXPECT_EQ(wav.compare(12, 4, "fmt "), 0);
    EXPECT_EQ(readU32(wav, 16), 16u);
    EXPECT_EQ(readI16(wav, 20), 1);        // PCM
    EXPECT_EQ(readI16(wav, 22), 1);        // mono
    EXPECT_EQ(readU32(wav, 24), 16000u);
    EXPECT_EQ(readU32(wav, 28), 32000u);   // byte rate
    EXPECT_EQ(readI16(wav, 32), 2);        // block align
    EXPECT_EQ(readI16(wav, 34), 16);
    EXPECT_EQ(wav.compare(36, 4, "data"), 0);
    EXPECT_EQ(readU32(wav, 40), 200u);
}

TEST(WavEncoderTest, SamplesAreScaledAndClamped) {
    std::vector<float> samples = {0.0f, 1.0f, -1.0f, 2.0f, -2.0f, 0.5f};
    auto wav = WavEncoder::encodeMono16(samples, 16000);

    EXPECT_EQ(readI16(wav, 44), 0);
    EXPECT_EQ(readI16(wav, 46), 32767);
    EXPECT_EQ(readI16(wav, 48), -32767);
    EXPECT_EQ(readI16(wav, 50), 32767);
    EXPECT_EQ(readI16(wav, 52), -32768);
    EXPECT_EQ(readI16(wav, 54), 16383);
}

TEST(WavEncoderTest, NanAndInfinitySamples) {
    EXPECT_EQ(WavEncoder::toPcm16(std::numeric_limits<float>::quiet_NaN()), 0);
    EXPECT_EQ(WavEncoder::toPcm16(std::numeric_limits<float>::infinity()), 32767);
    EXPECT_EQ(WavEncoder::toPcm16(-std::numeric_limits<float>::infinity()), -32768);

    std::vector<float> samples = {std::nanf(""), 0.5f};
    auto wav = WavEncoder::encodeMono16(samples, 16000);
    EXPECT_EQ(readI16(wav, 44), 0);
    EXPECT_EQ(readI16(wav, 46), 16383);
}

TEST(WavEncoderTest, EmptyInputIsHeaderOnly) {
    auto wav = WavEncoder::encodeMono16({}, 16000);
    EXPECT_EQ(wav.size(), 44u);
    EXPECT_EQ(readU32(wav, 40), 0u);
}
