#pragma once

#include <functional>

#include "../engine/AudioEngine.hpp"
#include "../state/PlayerReducer.hpp"
#include "../utils/ScopedFileAccess.hpp"
#include "WaveformPeakComputer.hpp"

namespace woodshed {

// Runs a job off the message thread
using BackgroundExecutor = std::function<void(std::function<void()>)>;

/**
 * @brief Collaborators handed to PlayerCore at construction
 *
 * engine and peakComputer must outlive the core. Leaving clock empty uses the
 * wall clock; leaving executor empty gives the EffectRunner its own thread pool.
 */
struct PlayerDependencies {
    AudioEngine& engine;
    WaveformPeakComputer& peakComputer;
    PlayerClock clock;
    BackgroundExecutor executor;
    FileAccessProvider* fileAccess = nullptr;
};

}  // namespace woodshed
