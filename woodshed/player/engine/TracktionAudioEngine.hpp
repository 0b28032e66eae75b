#pragma once

#include <juce_events/juce_events.h>
#include <tracktion_engine/tracktion_engine.h>

#include <atomic>
#include <memory>
#include <optional>

#include "AudioEngine.hpp"
#include "PlaybackPositionTimer.hpp"

namespace woodshed {

namespace te = tracktion;

/**
 * @brief AudioEngine backed by Tracktion Engine
 *
 * Holds one Edit with a single audio track. The loaded file becomes one wave
 * clip starting at zero. Rate and pitch are applied to that clip with the
 * engine's default time-stretch mode, so edit time runs at source / rate:
 *
 *   editSeconds = sourceSeconds / rate
 *
 * All positions crossing the AudioEngine interface are source seconds.
 * Edit mutations happen on the message thread; load() may be called from any
 * thread and hands the clip swap over to the message thread.
 */
class TracktionAudioEngine : public AudioEngine {
  public:
    TracktionAudioEngine();
    ~TracktionAudioEngine() override;

    // ===== Lifecycle =====
    bool initialize() override;
    void shutdown() override;

    // ===== AudioEngine =====
    TrackMeta load(const juce::File& file) override;

    void play(double fromSeconds) override;
    void pause() override;
    void seek(double seconds) override;

    void setRate(double rate) override;
    void setPitchSemitones(double semitones) override;

    void setLoop(std::optional<double> aSec, std::optional<double> bSec, bool enabled) override;

    // ===== Queries =====
    bool isPlaying() const;
    bool hasClip() const;
    double getSourcePosition() const;
    double getSourceLength() const {
        return sourceLength_;
    }
    double getRate() const {
        return rate_;
    }
    double getPitchSemitones() const {
        return pitch_;
    }
    bool isNativeLoopActive() const;

    te::Engine* getEngine() {
        return engine_.get();
    }
    te::Edit* getEdit() {
        return edit_.get();
    }

  private:
    // Message thread only
    bool replaceClip(const juce::File& file, double sourceLength);
    bool replaceClipOnMessageThread(const juce::File& file, double sourceLength);
    void applyClipTiming();
    void applyLoopHint();
    void handleEndOfMedia();

    double toEditTime(double sourceSeconds) const;
    double clampToSource(double sourceSeconds) const;

    std::unique_ptr<te::Engine> engine_;
    std::unique_ptr<te::Edit> edit_;
    te::WaveAudioClip::Ptr clip_;

    std::atomic<double> sourceLength_{0.0};
    std::atomic<double> rate_{1.0};
    double pitch_ = 0.0;

    std::optional<double> loopStart_;
    std::optional<double> loopEnd_;
    bool loopEnabled_ = false;

    // Cleared on shutdown so pending message-thread clip swaps become no-ops
    std::shared_ptr<std::atomic<bool>> alive_ = std::make_shared<std::atomic<bool>>(false);

    std::unique_ptr<PlaybackPositionTimer> positionTimer_;

    static constexpr int LOAD_HANDOFF_POLL_MS = 50;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(TracktionAudioEngine)
};

}  // namespace woodshed
