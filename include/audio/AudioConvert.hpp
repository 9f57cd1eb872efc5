#pragma once
#include <cstddef>
#include <vector>

// Channel mixdown and sample-rate conversion for the capture path.
//
// The vector-returning versions are the reference behaviour. The *Into
// versions write into a caller-owned vector and only grow it, so the audio
// callback can reuse preallocated scratch space.

// Average each group of `channelCount` interleaved samples into one mono
// sample. channelCount == 1 returns the input unchanged. A trailing partial
// group is dropped.
std::vector<float> stereoToMono(const std::vector<float>& samples,
                                int channelCount);

// Linear-interpolation resample. Equal rates return the input unchanged.
// Output length is floor(len * targetRate / sourceRate). No anti-alias
// filtering.
std::vector<float> resample(const std::vector<float>& samples,
                            int sourceRate, int targetRate);

// Returns the number of samples written to `out`.
size_t stereoToMonoInto(const float* samples, size_t count,
                        int channelCount, std::vector<float>& out);

size_t resampleInto(const float* samples, size_t count,
                    int sourceRate, int targetRate,
                    std::vector<float>& out);

// Output length resample() produces for `count` input samples.
size_t resampledLength(size_t count, int sourceRate, int targetRate);
