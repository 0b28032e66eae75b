#pragma once

#include <juce_core/juce_core.h>

#include <variant>

#include "PlayerState.hpp"

namespace woodshed {

// ===== Lifecycle Actions =====

/**
 * @brief The player surface became visible
 */
struct AppearedAction {};

// ===== Import Actions =====

/**
 * @brief The user picked a file to open
 *
 * Resets the session and asks the engine to load the file.
 */
struct ImportPickedAction {
    juce::File file;
};

/**
 * @brief The engine finished loading the picked file
 */
struct ImportSucceededAction {
    TrackMeta track;
};

/**
 * @brief The engine could not load the picked file
 *
 * An empty message is replaced by a generic one.
 */
struct ImportFailedAction {
    juce::String message;
};

// ===== Tool Actions =====

struct SetToolAction {
    LoopTool tool;
};

// ===== Waveform Actions =====

/**
 * @brief Single tap on the waveform, interpreted by the active tool
 */
struct TapWaveformAction {
    double timeSec;
};

/**
 * @brief Scrub drag moved
 *
 * Only moves the visual position while playing; seeks for audible feedback
 * while paused.
 */
struct TransportScrubChangedAction {
    double timeSec;
};

/**
 * @brief Scrub drag released at its final position
 */
struct TransportScrubEndedAction {
    double timeSec;
};

// ===== Transport Actions =====

struct TogglePlayAction {};

/**
 * @brief Position report from the engine while playing
 */
struct TickAction {
    double timeSec;
};

/**
 * @brief The engine reached the end of the media
 */
struct PlaybackFinishedAction {};

// ===== Speed / Pitch Actions =====

struct SpeedDeltaAction {
    double delta;
};

struct PitchDeltaAction {
    double delta;
};

// ===== Marker Actions =====

struct AddMarkerAction {
    double timeSec;
};

struct DeleteMarkerAction {
    MarkerId id;
};

// ===== Loop Actions =====

/**
 * @brief Request to turn the A/B loop on or off
 *
 * Turning it on without both bounds is rejected with a toast.
 */
struct ToggleLoopEnabledAction {
    bool enabled;
};

struct SetLoopStartAction {
    double timeSec;
};

struct SetLoopEndAction {
    double timeSec;
};

/**
 * @brief "A" button: loop start at the playhead
 *
 * Clears B when the playhead is already past it.
 */
struct SetLoopStartAtPlayheadAction {};

/**
 * @brief "B" button: loop end at the playhead
 *
 * Clears A when the playhead is still before it.
 */
struct SetLoopEndAtPlayheadAction {};

// ===== Toast Actions =====

struct ClearToastIfExpiredAction {
    juce::Time now;
};

/**
 * @brief Variant type containing all player actions
 */
using PlayerAction =
    std::variant<AppearedAction, ImportPickedAction, ImportSucceededAction, ImportFailedAction,
                 SetToolAction, TapWaveformAction, TransportScrubChangedAction,
                 TransportScrubEndedAction, TogglePlayAction, TickAction, PlaybackFinishedAction,
                 SpeedDeltaAction, PitchDeltaAction, AddMarkerAction, DeleteMarkerAction,
                 ToggleLoopEnabledAction, SetLoopStartAction, SetLoopEndAction,
                 SetLoopStartAtPlayheadAction, SetLoopEndAtPlayheadAction,
                 ClearToastIfExpiredAction>;

}  // namespace woodshed
