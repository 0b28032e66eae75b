#pragma once

#include <juce_core/juce_core.h>

#include <functional>
#include <vector>

#include "PlayerActions.hpp"
#include "PlayerEffects.hpp"
#include "PlayerState.hpp"

namespace woodshed {

// Time source used to stamp toast expiry; injected so transitions stay deterministic
using PlayerClock = std::function<juce::Time()>;

/**
 * @brief Pure state transition function of the player
 *
 * reduce() maps the current state and one action to the next state and an
 * ordered list of effects for the EffectRunner. It performs no I/O and keeps no
 * state of its own; the clock is its only outside input.
 *
 * Failure outcomes (rejected loop toggles, failed imports) are plain state: a
 * toast and no effects.
 */
class PlayerReducer {
  public:
    struct Result {
        AppState state;
        std::vector<PlayerEffect> effects;
    };

    static Result reduce(const AppState& state, const PlayerAction& action,
                         const PlayerClock& clock);

    // Clamp a time into the loaded track; always 0 without a track
    static double clampTime(const AppState& state, double timeSec);

    static inline const juce::String DEFAULT_IMPORT_ERROR{"Unable to open file"};
    static inline const juce::String LOOP_NEEDS_BOUNDS_MESSAGE{"Set A and B"};

  private:
    // Working copy threaded through the handlers
    struct Transition {
        AppState state;
        std::vector<PlayerEffect> effects;
        const PlayerClock& clock;

        void showToast(const juce::String& message);
        void emitLoopHint();
    };

    // ===== Action Handlers =====

    static void handle(Transition& t, const AppearedAction& a);

    static void handle(Transition& t, const ImportPickedAction& a);
    static void handle(Transition& t, const ImportSucceededAction& a);
    static void handle(Transition& t, const ImportFailedAction& a);

    static void handle(Transition& t, const SetToolAction& a);

    static void handle(Transition& t, const TapWaveformAction& a);
    static void handle(Transition& t, const TransportScrubChangedAction& a);
    static void handle(Transition& t, const TransportScrubEndedAction& a);

    static void handle(Transition& t, const TogglePlayAction& a);
    static void handle(Transition& t, const TickAction& a);
    static void handle(Transition& t, const PlaybackFinishedAction& a);

    static void handle(Transition& t, const SpeedDeltaAction& a);
    static void handle(Transition& t, const PitchDeltaAction& a);

    static void handle(Transition& t, const AddMarkerAction& a);
    static void handle(Transition& t, const DeleteMarkerAction& a);

    static void handle(Transition& t, const ToggleLoopEnabledAction& a);
    static void handle(Transition& t, const SetLoopStartAction& a);
    static void handle(Transition& t, const SetLoopEndAction& a);
    static void handle(Transition& t, const SetLoopStartAtPlayheadAction& a);
    static void handle(Transition& t, const SetLoopEndAtPlayheadAction& a);

    static void handle(Transition& t, const ClearToastIfExpiredAction& a);
};

}  // namespace woodshed
