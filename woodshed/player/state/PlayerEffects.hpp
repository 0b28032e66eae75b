#pragma once

#include <juce_core/juce_core.h>

#include <optional>
#include <variant>

namespace woodshed {

// ===== Engine Effects =====

struct LoadEffect {
    juce::File file;

    bool operator==(const LoadEffect& other) const {
        return file == other.file;
    }
};

/**
 * @brief Start playback at an explicit position
 *
 * The engine does not remember where it stopped, so every play carries its start.
 */
struct PlayFromEffect {
    double timeSec;

    bool operator==(const PlayFromEffect& other) const {
        return timeSec == other.timeSec;
    }
};

struct PauseEffect {
    bool operator==(const PauseEffect&) const {
        return true;
    }
};

struct SeekEffect {
    double timeSec;

    bool operator==(const SeekEffect& other) const {
        return timeSec == other.timeSec;
    }
};

struct SetRateEffect {
    double rate;

    bool operator==(const SetRateEffect& other) const {
        return rate == other.rate;
    }
};

struct SetPitchEffect {
    double semitones;

    bool operator==(const SetPitchEffect& other) const {
        return semitones == other.semitones;
    }
};

/**
 * @brief Best-effort loop hint mirroring the model's loop points
 */
struct SetLoopEffect {
    std::optional<double> aSec;
    std::optional<double> bSec;
    bool enabled;

    bool operator==(const SetLoopEffect& other) const {
        return aSec == other.aSec && bSec == other.bSec && enabled == other.enabled;
    }
};

// ===== Peak Effects =====

/**
 * @brief Compute waveform peaks for the most recently loaded file
 */
struct ComputePeaksEffect {
    bool operator==(const ComputePeaksEffect&) const {
        return true;
    }
};

using PlayerEffect = std::variant<LoadEffect, PlayFromEffect, PauseEffect, SeekEffect,
                                  SetRateEffect, SetPitchEffect, SetLoopEffect, ComputePeaksEffect>;

}  // namespace woodshed
