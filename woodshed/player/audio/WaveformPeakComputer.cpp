#include "WaveformPeakComputer.hpp"

#include <algorithm>
#include <limits>
#include <memory>

#include "../engine/AudioEngineError.hpp"

namespace woodshed {

WaveformPeakComputer::WaveformPeakComputer() {
    formatManager_.registerBasicFormats();
}

WaveformPeaks WaveformPeakComputer::computePeaks(const juce::File& file, int targetBucketCount) {
    if (!file.existsAsFile())
        throw AudioEngineError::fileNotFound();

    std::unique_ptr<juce::AudioFormatReader> reader(formatManager_.createReaderFor(file));
    if (!reader)
        throw AudioEngineError::invalidFormat();

    const juce::int64 totalSamples = reader->lengthInSamples;
    const int numChannels = static_cast<int>(reader->numChannels);
    if (totalSamples <= 0 || numChannels <= 0 || targetBucketCount <= 0)
        return WaveformPeaks::empty();

    const int buckets =
        static_cast<int>(std::min<juce::int64>(targetBucketCount, totalSamples));
    const juce::int64 samplesPerBucket = totalSamples / buckets;

    WaveformPeaks peaks;
    peaks.buckets = buckets;
    peaks.min.assign(static_cast<size_t>(buckets), 0.0f);
    peaks.max.assign(static_cast<size_t>(buckets), 0.0f);
    peaks.durationSec =
        reader->sampleRate > 0.0 ? static_cast<double>(totalSamples) / reader->sampleRate : 0.0;

    juce::AudioBuffer<float> block(numChannels, READ_BLOCK_SIZE);
    const float channelScale = 1.0f / static_cast<float>(numChannels);

    for (int b = 0; b < buckets; ++b) {
        const juce::int64 start = b * samplesPerBucket;
        const juce::int64 end = (b == buckets - 1) ? totalSamples : start + samplesPerBucket;

        float lowest = std::numeric_limits<float>::max();
        float highest = std::numeric_limits<float>::lowest();

        for (juce::int64 position = start; position < end;) {
            const int count =
                static_cast<int>(std::min<juce::int64>(READ_BLOCK_SIZE, end - position));
            if (!reader->read(block.getArrayOfWritePointers(), numChannels, position, count))
                throw AudioEngineError::loadFailed("read error in " +
                                                   file.getFileName().toStdString());

            for (int i = 0; i < count; ++i) {
                float sum = 0.0f;
                for (int ch = 0; ch < numChannels; ++ch)
                    sum += block.getSample(ch, i);

                const float mono = sum * channelScale;
                lowest = std::min(lowest, mono);
                highest = std::max(highest, mono);
            }
            position += count;
        }

        peaks.min[static_cast<size_t>(b)] = lowest;
        peaks.max[static_cast<size_t>(b)] = highest;
    }

    DBG("WaveformPeakComputer: " << buckets << " buckets for " << file.getFileName());
    return peaks;
}

}  // namespace woodshed
