#pragma once

#include <vector>

namespace woodshed {

/**
 * @brief Downsampled min/max envelope of a track for waveform drawing
 *
 * min[i] and max[i] describe bucket i of a mono mixdown. An empty value means
 * no waveform is available, which is a valid degraded state.
 */
struct WaveformPeaks {
    std::vector<float> min;
    std::vector<float> max;
    int buckets = 0;
    double durationSec = 0.0;

    static WaveformPeaks empty() {
        return {};
    }

    bool isEmpty() const {
        return buckets == 0;
    }
};

}  // namespace woodshed
