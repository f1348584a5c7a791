#ifndef VOXD_AUDIO_LEVEL_H
#define VOXD_AUDIO_LEVEL_H

#include <cmath>
#include <cstddef>
#include <vector>

namespace AudioUtils {

// Root mean square of a mono float block in [-1, 1]. Used as the loudness
// signal for voice activity detection.
inline float computeRms(const float* samples, size_t count) {
    if (!samples || count == 0) {
        return 0.0f;
    }
    double sum = 0.0;
    for (size_t i = 0; i < count; ++i) {
        sum += static_cast<double>(samples[i]) * samples[i];
    }
    return static_cast<float>(std::sqrt(sum / static_cast<double>(count)));
}

inline float computeRms(const std::vector<float>& samples) {
    return computeRms(samples.data(), samples.size());
}

// Threshold used to trim leading/trailing silence before a batch call:
// half the VAD threshold, lowered for quiet recordings so soft trailing
// phonemes survive.
float trimThreshold(float vadThreshold, float maxLevel);

// Drops leading and trailing audio whose windowed RMS stays below threshold,
// keeping padMs of context on each side. Returns the input unchanged when no
// window reaches the threshold or the input is shorter than one window.
std::vector<float> trimSilence(const std::vector<float>& samples, int sampleRate,
                               float threshold, int windowMs, int hopMs, int padMs);

}  // namespace AudioUtils

#endif  // VOXD_AUDIO_LEVEL_H
