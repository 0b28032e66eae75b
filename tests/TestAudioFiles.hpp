#pragma once

#include <juce_audio_formats/juce_audio_formats.h>

#include <cmath>
#include <memory>

namespace woodshed::test {

/**
 * Generate a sine WAV file and return it as a TemporaryFile.
 * Channel c carries amplitude / (c + 1), so a mono mixdown differs from every
 * single channel.
 */
inline std::unique_ptr<juce::TemporaryFile> createSineWavFile(double sampleRate,
                                                              double durationSeconds,
                                                              int numChannels = 2,
                                                              float amplitude = 0.8f,
                                                              float frequency = 220.0f) {
    const int numSamples = static_cast<int>(sampleRate * durationSeconds);
    juce::AudioBuffer<float> buffer(numChannels, juce::jmax(1, numSamples));
    buffer.clear();

    const float phaseInc =
        static_cast<float>(frequency * juce::MathConstants<double>::twoPi / sampleRate);
    for (int ch = 0; ch < numChannels; ++ch) {
        const float channelAmplitude = amplitude / static_cast<float>(ch + 1);
        float phase = 0.0f;
        for (int i = 0; i < numSamples; ++i) {
            buffer.setSample(ch, i, channelAmplitude * std::sin(phase));
            phase += phaseInc;
        }
    }

    auto f = std::make_unique<juce::TemporaryFile>(".wav");
    juce::WavAudioFormat wavFormat;
    JUCE_BEGIN_IGNORE_WARNINGS_MSVC(4996)
    JUCE_BEGIN_IGNORE_WARNINGS_GCC_LIKE("-Wdeprecated-declarations")
    std::unique_ptr<juce::AudioFormatWriter> writer(
        wavFormat.createWriterFor(new juce::FileOutputStream(f->getFile()), sampleRate,
                                  static_cast<unsigned int>(numChannels), 16, {}, 0));
    JUCE_END_IGNORE_WARNINGS_GCC_LIKE
    JUCE_END_IGNORE_WARNINGS_MSVC
    if (writer && numSamples > 0)
        writer->writeFromAudioSampleBuffer(buffer, 0, numSamples);
    return f;
}

}  // namespace woodshed::test
