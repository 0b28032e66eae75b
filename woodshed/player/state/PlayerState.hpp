#pragma once

#include <juce_core/juce_core.h>

#include <optional>
#include <utility>
#include <vector>

#include "../core/TypeIds.hpp"

namespace woodshed {

// Interpretation of a tap on the waveform
enum class LoopTool {
    Marker,        // Drop a marker at the tapped time
    SetLoopStart,  // Tapped time becomes A
    SetLoopEnd,    // Tapped time becomes B
    LoopSeek       // Move the playhead to the tapped time
};

/**
 * @brief Identity of the loaded audio
 */
struct TrackMeta {
    juce::String name;
    double durationSec = 0.0;

    bool operator==(const TrackMeta& other) const {
        return name == other.name && durationSec == other.durationSec;
    }
    bool operator!=(const TrackMeta& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Transport state
 *
 * The engine keeps no notion of position, so currentTimeSec is the only record
 * of where playback resumes.
 */
struct Transport {
    static constexpr double MIN_SPEED = 0.25;
    static constexpr double MAX_SPEED = 2.0;
    static constexpr double MIN_PITCH = -12.0;
    static constexpr double MAX_PITCH = 12.0;

    bool isPlaying = false;
    double currentTimeSec = 0.0;
    double speed = 1.0;
    double pitchSemitones = 0.0;

    bool operator==(const Transport& other) const {
        return isPlaying == other.isPlaying && currentTimeSec == other.currentTimeSec &&
               speed == other.speed && pitchSemitones == other.pitchSemitones;
    }
    bool operator!=(const Transport& other) const {
        return !(*this == other);
    }
};

/**
 * @brief A/B loop points
 *
 * When both bounds are set, aSec <= bSec. enabled is only true while both are set.
 */
struct LoopPoints {
    std::optional<double> aSec;
    std::optional<double> bSec;
    bool enabled = false;

    bool hasBothBounds() const {
        return aSec.has_value() && bSec.has_value();
    }

    // Swap the bounds if they are out of order
    void normalize() {
        if (hasBothBounds() && *aSec > *bSec)
            std::swap(aSec, bSec);
    }

    bool operator==(const LoopPoints& other) const {
        return aSec == other.aSec && bSec == other.bSec && enabled == other.enabled;
    }
    bool operator!=(const LoopPoints& other) const {
        return !(*this == other);
    }
};

struct Marker {
    MarkerId id = INVALID_MARKER_ID;
    double timeSec = 0.0;

    bool operator==(const Marker& other) const {
        return id == other.id && timeSec == other.timeSec;
    }
    bool operator!=(const Marker& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Visible time window (rendering hint only)
 */
struct Viewport {
    static constexpr double DEFAULT_SPAN_SEC = 60.0;

    double startSec = 0.0;
    double endSec = DEFAULT_SPAN_SEC;

    double getSpan() const {
        return endSec - startSec;
    }

    // Window covering a whole track; falls back to the default span for empty tracks
    static Viewport spanning(double durationSec) {
        Viewport v;
        if (durationSec > 0.0)
            v.endSec = durationSec;
        return v;
    }

    bool operator==(const Viewport& other) const {
        return startSec == other.startSec && endSec == other.endSec;
    }
    bool operator!=(const Viewport& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Transient message shown to the user until expiresAt
 */
struct ToastState {
    static constexpr double DEFAULT_DURATION_SEC = 1.5;

    juce::String message;
    juce::Time expiresAt;

    bool isExpired(juce::Time now) const {
        return now >= expiresAt;
    }

    bool operator==(const ToastState& other) const {
        return message == other.message && expiresAt == other.expiresAt;
    }
    bool operator!=(const ToastState& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Complete session state of the player
 *
 * Owned and replaced wholesale by PlayerCore. Everything else reads it through
 * PlayerCore::getState() or the selectors.
 */
struct AppState {
    std::optional<TrackMeta> track;
    Transport transport;
    LoopPoints loop;
    LoopTool tool = LoopTool::LoopSeek;
    std::vector<Marker> markers;
    Viewport viewport;
    bool isLoading = false;
    std::optional<ToastState> toast;
    bool isScrubbing = false;

    // Next id handed out by addMarker
    MarkerId nextMarkerId = 1;

    bool operator==(const AppState& other) const {
        return track == other.track && transport == other.transport && loop == other.loop &&
               tool == other.tool && markers == other.markers && viewport == other.viewport &&
               isLoading == other.isLoading && toast == other.toast &&
               isScrubbing == other.isScrubbing && nextMarkerId == other.nextMarkerId;
    }
    bool operator!=(const AppState& other) const {
        return !(*this == other);
    }
};

}  // namespace woodshed
