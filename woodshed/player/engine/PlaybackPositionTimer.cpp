#include "PlaybackPositionTimer.hpp"

#include "../core/Config.hpp"
#include "TracktionAudioEngine.hpp"

namespace woodshed {

PlaybackPositionTimer::PlaybackPositionTimer(TracktionAudioEngine& engine) : engine_(engine) {}

PlaybackPositionTimer::~PlaybackPositionTimer() {
    stopTimer();
}

void PlaybackPositionTimer::start() {
    startTimer(Config::getInstance().getPositionPollIntervalMs());
}

void PlaybackPositionTimer::stop() {
    stopTimer();
}

bool PlaybackPositionTimer::isRunning() const {
    return isTimerRunning();
}

void PlaybackPositionTimer::timerCallback() {
    if (!engine_.isPlaying())
        return;

    const double position = engine_.getSourcePosition();
    const double length = engine_.getSourceLength();

    if (length > 0.0 && position >= length) {
        stopTimer();
        if (onEndReached)
            onEndReached();
        return;
    }

    if (onPosition)
        onPosition(position);
}

}  // namespace woodshed
