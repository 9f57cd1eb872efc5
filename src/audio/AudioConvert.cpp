#include "audio/AudioConvert.hpp"
#include <algorithm>
#include <cmath>

std::vector<float> stereoToMono(const std::vector<float>& samples,
                                int channelCount) {
    if (channelCount <= 1)
        return samples;

    std::vector<float> out;
    size_t n = stereoToMonoInto(samples.data(), samples.size(),
                                channelCount, out);
    out.resize(n);
    return out;
}

std::vector<float> resample(const std::vector<float>& samples,
                            int sourceRate, int targetRate) {
    if (sourceRate == targetRate)
        return samples;

    std::vector<float> out;
    size_t n = resampleInto(samples.data(), samples.size(),
                            sourceRate, targetRate, out);
    out.resize(n);
    return out;
}

size_t stereoToMonoInto(const float* samples, size_t count,
                        int channelCount, std::vector<float>& out) {
    if (channelCount <= 1) {
        if (out.size() < count) out.resize(count);
        std::copy(samples, samples + count, out.begin());
        return count;
    }

    size_t frames = count / static_cast<size_t>(channelCount);
    if (out.size() < frames) out.resize(frames);

    const float scale = 1.0f / static_cast<float>(channelCount);
    for (size_t f = 0; f < frames; f++) {
        const float* group = samples + f * channelCount;
        float sum = 0.0f;
        for (int ch = 0; ch < channelCount; ch++)
            sum += group[ch];
        out[f] = sum * scale;
    }
    return frames;
}

size_t resampledLength(size_t count, int sourceRate, int targetRate) {
    if (sourceRate == targetRate) return count;
    if (sourceRate <= 0 || targetRate <= 0) return 0;
    double ratio = static_cast<double>(sourceRate) / targetRate;
    return static_cast<size_t>(std::floor(count / ratio));
}

size_t resampleInto(const float* samples, size_t count,
                    int sourceRate, int targetRate,
                    std::vector<float>& out) {
    size_t outLen = resampledLength(count, sourceRate, targetRate);
    if (out.size() < outLen) out.resize(outLen);

    if (sourceRate == targetRate) {
        std::copy(samples, samples + count, out.begin());
        return count;
    }
    if (outLen == 0) return 0;

    const double ratio = static_cast<double>(sourceRate) / targetRate;
    const size_t last  = count - 1;

    for (size_t i = 0; i < outLen; i++) {
        double srcPos = i * ratio;
        size_t lo = static_cast<size_t>(srcPos);
        size_t hi = std::min(lo + 1, last);
        lo = std::min(lo, last);
        float frac = static_cast<float>(srcPos - std::floor(srcPos));
        out[i] = samples[lo] * (1.0f - frac) + samples[hi] * frac;
    }
    return outLen;
}
