#include "audio/audio_level.h"

#include "core/daemon_constants.h"

#include <algorithm>

namespace AudioUtils {

float trimThreshold(float vadThreshold, float maxLevel) {
    float threshold = vadThreshold * DaemonConstants::TRIM_THRESHOLD_RATIO;
    if (maxLevel > 0.0f) {
        threshold = std::min(threshold, maxLevel * DaemonConstants::TRIM_MAX_RMS_RATIO);
    }
    return threshold;
}

std::vector<float> trimSilence(const std::vector<float>& samples, int sampleRate,
                               float threshold, int windowMs, int hopMs, int padMs) {
    const size_t window = static_cast<size_t>(sampleRate) * windowMs / 1000;
    const size_t hop = static_cast<size_t>(sampleRate) * hopMs / 1000;
    const size_t pad = static_cast<size_t>(sampleRate) * padMs / 1000;
    if (window == 0 || hop == 0 || samples.size() <= window) {
        return samples;
    }

    const size_t frameCount = (samples.size() - window) / hop + 1;
    size_t first = frameCount;
    size_t last = 0;
    for (size_t f = 0; f < frameCount; ++f) {
        // Inclusive comparison keeps quiet word endings
        if (computeRms(samples.data() + f * hop, window) >= threshold) {
            if (first == frameCount) {
                first = f;
            }
            last = f;
        }
    }
    if (first == frameCount) {
        return samples;
    }

    size_t start = first * hop > pad ? first * hop - pad : 0;
    size_t end = std::min(samples.size(), last * hop + window + pad);
    return std::vector<float>(samples.begin() + static_cast<std::ptrdiff_t>(start),
                              samples.begin() + static_cast<std::ptrdiff_t>(end));
}

}  // namespace AudioUtils
