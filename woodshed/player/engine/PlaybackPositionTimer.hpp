#pragma once

#include <juce_events/juce_events.h>

#include <functional>

namespace woodshed {

class TracktionAudioEngine;

/**
 * @brief Timer that polls the audio engine for the playback position
 *
 * While the transport runs it reports the source-time position every interval
 * and detects the end of the loaded media, which Tracktion's transport does
 * not stop at on its own.
 */
class PlaybackPositionTimer : private juce::Timer {
  public:
    explicit PlaybackPositionTimer(TracktionAudioEngine& engine);
    ~PlaybackPositionTimer() override;

    void start();
    void stop();
    bool isRunning() const;

    /** Fired on the message thread with the position in source seconds. */
    std::function<void(double)> onPosition;

    /** Fired once on the message thread when the end of the media is reached. */
    std::function<void()> onEndReached;

  private:
    void timerCallback() override;

    TracktionAudioEngine& engine_;
};

}  // namespace woodshed
