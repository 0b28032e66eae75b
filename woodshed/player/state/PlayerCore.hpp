#pragma once

#include <juce_events/juce_events.h>

#include <deque>
#include <functional>
#include <memory>
#include <vector>

#include "../audio/EffectRunner.hpp"
#include "../audio/PlayerDependencies.hpp"
#include "../audio/WaveformPeaks.hpp"
#include "PlayerActions.hpp"
#include "PlayerReducer.hpp"
#include "PlayerState.hpp"

namespace woodshed {

/**
 * @brief Listener interface for player state changes
 */
class PlayerStateListener {
  public:
    virtual ~PlayerStateListener() = default;

    /**
     * Called on the message thread after an action changed the state.
     */
    virtual void playerStateChanged(const AppState& state) = 0;

    /**
     * Called on the message thread when the cached waveform peaks changed.
     */
    virtual void waveformPeaksChanged() {}
};

/**
 * @brief Central controller for the player session
 *
 * The PlayerCore owns the single source of truth (AppState) and provides:
 * - send(action) as the only way to change it
 * - Listener notification for state changes
 * - A toast-expiry timer feeding ClearToastIfExpiredAction back into send()
 *
 * Data flow:
 *   UI / engine / timer -> send(Action) -> PlayerReducer -> commit state
 *   -> EffectRunner executes effects -> results come back through send()
 *
 * Actions are applied on the JUCE message thread, one at a time, in order.
 * send() from another thread is handed over with MessageManager::callAsync.
 * Without a MessageManager, send() runs on the calling thread and concurrent
 * callers are serialised.
 * send() during the processing of an action (from an effect or a listener) is
 * queued and handled after the current action completes.
 */
class PlayerCore : private juce::Timer {
  public:
    explicit PlayerCore(const PlayerDependencies& deps);
    ~PlayerCore() override;

    // ===== State Access =====

    /**
     * Get read-only access to the current state.
     * Message thread only.
     */
    const AppState& getState() const {
        return state;
    }

    /**
     * Cached waveform peaks of the current track (empty until computed).
     */
    WaveformPeaks getPeaks() const {
        return runner_.getPeaks();
    }

    // ===== Action Dispatching =====

    /**
     * Submit an action. This is the ONLY way to modify player state.
     * Callable from any thread.
     */
    void send(const PlayerAction& action);

    // ===== Listener Management =====

    void addListener(PlayerStateListener* listener);
    void removeListener(PlayerStateListener* listener);

    // ===== Toast Expiry =====

    bool isToastTimerRunning() const {
        return isTimerRunning();
    }

    /** Stop the toast-expiry check. Toasts then stay until the timer is restarted. */
    void stopToastTimer();
    void startToastTimer();

  private:
    void timerCallback() override;

    void process(const PlayerAction& action);
    void apply(const PlayerAction& action);

    // Run fn on the message thread, immediately if already there
    void runOnMessageThread(std::function<void(PlayerCore&)> fn);

    void notifyListeners();
    void notifyPeaksChanged();

    // The single source of truth
    AppState state;

    std::vector<PlayerStateListener*> listeners;

    PlayerClock clock_;

    // Created up front so other threads only ever copy it
    juce::WeakReference<PlayerCore> self_;

    // Actions submitted while another one is being processed
    std::deque<PlayerAction> pendingActions_;
    bool isProcessing_ = false;

    // Re-entrant; only contended when no MessageManager exists
    juce::CriticalSection processLock_;

    // Declared after everything its background jobs reach through send()
    EffectRunner runner_;

    JUCE_DECLARE_WEAK_REFERENCEABLE(PlayerCore)
    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(PlayerCore)
};

}  // namespace woodshed
