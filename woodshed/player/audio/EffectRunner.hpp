#pragma once

#include <juce_core/juce_core.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>

#include "../state/PlayerActions.hpp"
#include "../state/PlayerEffects.hpp"
#include "PlayerDependencies.hpp"
#include "WaveformPeaks.hpp"

namespace woodshed {

/**
 * @brief Executes player effects against the engine and the peak computer
 *
 * Never touches AppState. Every outcome comes back as an action through the
 * action sink:
 * - engine position reports become TickAction
 * - end of media becomes PlaybackFinishedAction
 * - load results become ImportSucceededAction / ImportFailedAction
 *
 * Loads and peak computations run on the background executor. Engine loads
 * never overlap, and a load superseded by a newer one is skipped if it has not
 * started yet, or has its result and peaks discarded if it has. Peaks are
 * cached here rather than in the state and fall back to empty on failure.
 */
class EffectRunner {
  public:
    using ActionSink = std::function<void(const PlayerAction&)>;

    explicit EffectRunner(const PlayerDependencies& deps);
    ~EffectRunner();

    /** Where translated actions go. Set once before the first effect runs. */
    void setActionSink(ActionSink sink);

    /** Execute one effect. Engine transport effects run synchronously. */
    void run(const PlayerEffect& effect);

    // ===== Side Channel =====

    WaveformPeaks getPeaks() const;
    juce::File getCurrentFile() const;

    /** Fired on the background thread after the cached peaks changed. */
    std::function<void()> onPeaksChanged;

  private:
    // ===== Effect Handlers =====
    void handleEffect(const LoadEffect& e);
    void handleEffect(const PlayFromEffect& e);
    void handleEffect(const PauseEffect& e);
    void handleEffect(const SeekEffect& e);
    void handleEffect(const SetRateEffect& e);
    void handleEffect(const SetPitchEffect& e);
    void handleEffect(const SetLoopEffect& e);
    void handleEffect(const ComputePeaksEffect& e);

    void dispatch(const PlayerAction& action);
    void runInBackground(std::function<void()> job);
    void storePeaks(WaveformPeaks peaks, std::uint64_t generation);
    bool isSuperseded(std::uint64_t generation) const;

    AudioEngine& engine_;
    WaveformPeakComputer& peakComputer_;
    FileAccessProvider* fileAccess_;
    BackgroundExecutor executor_;
    ActionSink sink_;

    mutable juce::CriticalSection lock_;
    // Held for the duration of an engine load
    juce::CriticalSection loadLock_;
    WaveformPeaks peaks_;
    juce::File currentFile_;
    std::atomic<std::uint64_t> loadGeneration_{0};

    // Declared last so queued jobs finish before the members they use go away
    std::unique_ptr<juce::ThreadPool> pool_;

    static constexpr int POOL_SHUTDOWN_TIMEOUT_MS = 4000;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(EffectRunner)
};

}  // namespace woodshed
