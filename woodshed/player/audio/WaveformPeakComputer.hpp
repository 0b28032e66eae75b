#pragma once

#include <juce_audio_formats/juce_audio_formats.h>

#include "WaveformPeaks.hpp"

namespace woodshed {

/**
 * @brief Computes min/max waveform buckets for an audio file
 *
 * All channels are mixed down to mono by averaging. The file is split into
 * min(targetBuckets, sampleCount) buckets of equal length; the last bucket also
 * takes the remainder.
 *
 * Safe to call from a background thread: each call uses its own reader.
 */
class WaveformPeakComputer {
  public:
    WaveformPeakComputer();
    virtual ~WaveformPeakComputer() = default;

    /**
     * @brief Compute peaks for a file
     * @param file Audio file to read
     * @param targetBucketCount Desired number of buckets
     * @return Peaks, or empty peaks for a file without frames
     * @throws AudioEngineError if the file is missing or cannot be decoded
     */
    virtual WaveformPeaks computePeaks(const juce::File& file, int targetBucketCount);

  private:
    static constexpr int READ_BLOCK_SIZE = 65536;

    juce::AudioFormatManager formatManager_;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(WaveformPeakComputer)
};

}  // namespace woodshed
