#pragma once
#include <cstdint>
#include <string>
#include <vector>

// In-memory PCM WAV encoding for upload to transcription services.
// Output is a canonical 44-byte RIFF header followed by 16-bit
// little-endian mono samples.
class WavEncoder {
public:
    static constexpr int kBitsPerSample = 16;
    static constexpr int kHeaderSize    = 44;

    // Float samples in [-1, 1] are scaled by 32767 and clamped to the
    // int16 range.
    static std::string encodeMono16(const std::vector<float>& samples,
                                    int sampleRate);

    static int16_t toPcm16(float sample);
};
