#include "audio/WavEncoder.hpp"
#include <algorithm>
#include <cmath>

namespace {

void putU32(std::string& out, uint32_t v) {
    out.push_back(static_cast<char>(v & 0xff));
    out.push_back(static_cast<char>((v >> 8) & 0xff));
    out.push_back(static_cast<char>((v >> 16) & 0xff));
    out.push_back(static_cast<char>((v >> 24) & 0xff));
}

void putU16(std::string& out, uint16_t v) {
    out.push_back(static_cast<char>(v & 0xff));
    out.push_back(static_cast<char>((v >> 8) & 0xff));
}

} // namespace

int16_t WavEncoder::toPcm16(float sample) {
    if (std::isnan(sample)) return 0;
    float scaled = std::clamp(sample * 32767.0f, -32768.0f, 32767.0f);
    return static_cast<int16_t>(scaled);
}

std::string WavEncoder::encodeMono16(const std::vector<float>& samples,
                                     int sampleRate) {
    const uint16_t channels   = 1;
    const uint16_t blockAlign = channels * kBitsPerSample / 8;
    const uint32_t byteRate   = static_cast<uint32_t>(sampleRate) * blockAlign;
    const uint32_t dataSize   = static_cast<uint32_t>(samples.size()) * blockAlign;

    std::string out;
    out.reserve(kHeaderSize + dataSize);

    out.append("RIFF", 4);
    putU32(out, 36 + dataSize);
    out.append("WAVE", 4);

    out.append("fmt ", 4);
    putU32(out, 16);                  // fmt chunk size
    putU16(out, 1);                   // PCM
    putU16(out, channels);
    putU32(out, static_cast<uint32_t>(sampleRate));
    putU32(out, byteRate);
    putU16(out, blockAlign);
    putU16(out, kBitsPerSample);

    out.append("data", 4);
    putU32(out, dataSize);

    for (float s : samples)
        putU16(out, static_cast<uint16_t>(toPcm16(s)));

    return out;
}
