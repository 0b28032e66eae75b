#include "PlayerSelectors.hpp"

#include <algorithm>

namespace woodshed {
namespace PlayerSelectors {

std::optional<LoopRange> loopRange(const AppState& state) {
    if (!state.loop.hasBothBounds())
        return std::nullopt;

    const double a = *state.loop.aSec;
    const double b = *state.loop.bSec;
    return LoopRange{std::min(a, b), std::max(a, b)};
}

bool canEnableLoop(const AppState& state) {
    return state.loop.hasBothBounds();
}

bool shouldShowLoopOverlay(const AppState& state) {
    return state.loop.enabled && state.loop.hasBothBounds();
}

bool hasTrack(const AppState& state) {
    return state.track.has_value();
}

double playbackProgress(const AppState& state) {
    if (!state.track || state.track->durationSec <= 0.0)
        return 0.0;
    return state.transport.currentTimeSec / state.track->durationSec;
}

double positionToTime(const AppState& state, double normalizedPosition) {
    if (!state.track)
        return 0.0;
    return normalizedPosition * state.track->durationSec;
}

double viewportPositionToTime(const AppState& state, double viewportPosition) {
    return state.viewport.startSec + viewportPosition * state.viewport.getSpan();
}

double timeToViewportPosition(const AppState& state, double timeSec) {
    const double span = state.viewport.getSpan();
    if (span <= 0.0)
        return 0.0;
    return (timeSec - state.viewport.startSec) / span;
}

}  // namespace PlayerSelectors
}  // namespace woodshed
