#pragma once

#include <optional>

#include "PlayerState.hpp"

namespace woodshed {

/**
 * @brief Read-only derived queries over AppState
 */
namespace PlayerSelectors {

struct LoopRange {
    double startSec;
    double endSec;
};

// Ordered loop range, or nothing while a bound is missing
std::optional<LoopRange> loopRange(const AppState& state);

bool canEnableLoop(const AppState& state);
bool shouldShowLoopOverlay(const AppState& state);
bool hasTrack(const AppState& state);

// Fraction of the track already played; 0 without a playable track
double playbackProgress(const AppState& state);

// Map a normalized position across the whole track to seconds
double positionToTime(const AppState& state, double normalizedPosition);

// Map a normalized position across the viewport to seconds, and back
double viewportPositionToTime(const AppState& state, double viewportPosition);
double timeToViewportPosition(const AppState& state, double timeSec);

}  // namespace PlayerSelectors

}  // namespace woodshed
