#pragma once

#include <juce_core/juce_core.h>

#include <atomic>
#include <functional>
#include <optional>
#include <vector>

#include "woodshed/player/engine/AudioEngine.hpp"

namespace woodshed::test {

/**
 * Records every engine call as text ("play:12.50", "pause", ...) so tests can
 * assert on the exact command sequence a reducer run produced.
 */
class FakeAudioEngine : public AudioEngine {
  public:
    bool initialize() override {
        initialized = true;
        return true;
    }
    void shutdown() override {
        initialized = false;
    }

    TrackMeta load(const juce::File& file) override {
        const int active = ++activeLoads;
        maxActiveLoads = juce::jmax(maxActiveLoads.load(), active);

        calls.push_back("load:" + file.getFileName());
        if (onLoadCalled)
            onLoadCalled(file);

        --activeLoads;
        if (loadError)
            throw *loadError;
        return TrackMeta{file.getFileNameWithoutExtension(), loadDuration};
    }

    void play(double fromSeconds) override {
        calls.push_back("play:" + juce::String(fromSeconds, 2));
        if (onPlayCalled)
            onPlayCalled(fromSeconds);
    }
    void pause() override {
        calls.push_back("pause");
    }
    void seek(double seconds) override {
        calls.push_back("seek:" + juce::String(seconds, 2));
    }
    void setRate(double rate) override {
        calls.push_back("rate:" + juce::String(rate, 2));
    }
    void setPitchSemitones(double semitones) override {
        calls.push_back("pitch:" + juce::String(semitones, 2));
    }
    void setLoop(std::optional<double> aSec, std::optional<double> bSec, bool enabled) override {
        calls.push_back("loop:" + (aSec ? juce::String(*aSec, 2) : juce::String("-")) + ":" +
                        (bSec ? juce::String(*bSec, 2) : juce::String("-")) + ":" +
                        (enabled ? "on" : "off"));
    }

    // Simulate the engine's own notifications
    void emitPosition(double seconds) {
        if (onPositionChanged)
            onPositionChanged(seconds);
    }
    void emitPlaybackFinished() {
        if (onPlaybackFinished)
            onPlaybackFinished();
    }

    std::vector<juce::String> calls;
    std::optional<AudioEngineError> loadError;
    double loadDuration = 120.0;
    bool initialized = false;

    // Called from inside play(), for re-entrancy tests
    std::function<void(double)> onPlayCalled;

    // Called from inside load(), before it returns
    std::function<void(const juce::File&)> onLoadCalled;

    // Number of load() calls in progress, and the most ever seen at once
    std::atomic<int> activeLoads{0};
    std::atomic<int> maxActiveLoads{0};
};

}  // namespace woodshed::test
