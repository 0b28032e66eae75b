#pragma once

#include <juce_core/juce_core.h>

#include <functional>
#include <optional>

#include "../state/PlayerState.hpp"
#include "AudioEngineError.hpp"

namespace woodshed {

/**
 * @brief Abstract audio engine interface
 *
 * The engine keeps no notion of a resume position: every play() carries its
 * start time and the player core remembers where playback should continue.
 * Concrete implementations (e.g., TracktionAudioEngine) inherit from this.
 */
class AudioEngine {
  public:
    virtual ~AudioEngine() = default;

    // ===== Lifecycle =====
    virtual bool initialize() = 0;
    virtual void shutdown() = 0;

    // ===== Media =====

    /**
     * @brief Load a file, replacing whatever was loaded before
     * @throws AudioEngineError if the file is missing or cannot be decoded
     */
    virtual TrackMeta load(const juce::File& file) = 0;

    // ===== Transport =====
    virtual void play(double fromSeconds) = 0;
    virtual void pause() = 0;
    virtual void seek(double seconds) = 0;

    // ===== Rate / Pitch =====
    virtual void setRate(double rate) = 0;
    virtual void setPitchSemitones(double semitones) = 0;

    // ===== Loop =====

    /** Best-effort loop hint; loop wrapping does not depend on it. */
    virtual void setLoop(std::optional<double> aSec, std::optional<double> bSec,
                         bool enabled) = 0;

    // ===== Notifications =====
    // May fire on any thread; receivers must hand off to their own context.

    /** Current position in source seconds while playing. */
    std::function<void(double)> onPositionChanged;

    /** The end of the media was reached. */
    std::function<void()> onPlaybackFinished;
};

}  // namespace woodshed
