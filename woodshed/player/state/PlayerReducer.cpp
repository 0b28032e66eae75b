#include "PlayerReducer.hpp"

#include <algorithm>

#include "../core/Formatting.hpp"

namespace woodshed {

PlayerReducer::Result PlayerReducer::reduce(const AppState& state, const PlayerAction& action,
                                            const PlayerClock& clock) {
    Transition t{state, {}, clock};
    std::visit([&t](const auto& a) { handle(t, a); }, action);
    return {std::move(t.state), std::move(t.effects)};
}

double PlayerReducer::clampTime(const AppState& state, double timeSec) {
    if (!state.track)
        return 0.0;
    return juce::jlimit(0.0, juce::jmax(0.0, state.track->durationSec), timeSec);
}

void PlayerReducer::Transition::showToast(const juce::String& message) {
    const auto now = clock ? clock() : juce::Time::getCurrentTime();
    state.toast = ToastState{
        message, now + juce::RelativeTime::seconds(ToastState::DEFAULT_DURATION_SEC)};
}

void PlayerReducer::Transition::emitLoopHint() {
    effects.push_back(SetLoopEffect{state.loop.aSec, state.loop.bSec, state.loop.enabled});
}

// ===== Lifecycle =====

void PlayerReducer::handle(Transition& /*t*/, const AppearedAction& /*a*/) {}

// ===== Import =====

void PlayerReducer::handle(Transition& t, const ImportPickedAction& a) {
    auto& s = t.state;
    s.transport.isPlaying = false;
    s.transport.currentTimeSec = 0.0;
    s.isScrubbing = false;
    s.loop = LoopPoints{};
    s.markers.clear();
    s.isLoading = true;

    // Pause first so nothing plays against the track being replaced
    t.effects.push_back(PauseEffect{});
    t.effects.push_back(LoadEffect{a.file});
}

void PlayerReducer::handle(Transition& t, const ImportSucceededAction& a) {
    auto& s = t.state;
    s.track = a.track;
    s.isLoading = false;
    s.markers.clear();
    s.loop = LoopPoints{};
    s.transport.currentTimeSec = 0.0;
    s.isScrubbing = false;
    s.viewport = Viewport::spanning(a.track.durationSec);

    t.effects.push_back(ComputePeaksEffect{});
}

void PlayerReducer::handle(Transition& t, const ImportFailedAction& a) {
    t.state.isLoading = false;
    t.showToast(a.message.isEmpty() ? DEFAULT_IMPORT_ERROR : a.message);
}

// ===== Tool =====

void PlayerReducer::handle(Transition& t, const SetToolAction& a) {
    t.state.tool = a.tool;
}

// ===== Waveform =====

void PlayerReducer::handle(Transition& t, const TapWaveformAction& a) {
    t.state.isScrubbing = false;

    switch (t.state.tool) {
        case LoopTool::SetLoopStart:
            handle(t, SetLoopStartAction{a.timeSec});
            break;
        case LoopTool::SetLoopEnd:
            handle(t, SetLoopEndAction{a.timeSec});
            break;
        case LoopTool::Marker:
            handle(t, AddMarkerAction{a.timeSec});
            break;
        case LoopTool::LoopSeek: {
            const double position = clampTime(t.state, a.timeSec);
            t.state.transport.currentTimeSec = position;
            // A jump while playing has to restart the engine at the new position
            if (t.state.transport.isPlaying)
                t.effects.push_back(PlayFromEffect{position});
            break;
        }
    }
}

void PlayerReducer::handle(Transition& t, const TransportScrubChangedAction& a) {
    auto& s = t.state;
    s.isScrubbing = true;
    s.transport.currentTimeSec = clampTime(s, a.timeSec);

    // While playing, audio carries on and only the visual position follows the drag
    if (!s.transport.isPlaying)
        t.effects.push_back(SeekEffect{s.transport.currentTimeSec});
}

void PlayerReducer::handle(Transition& t, const TransportScrubEndedAction& a) {
    auto& s = t.state;
    s.isScrubbing = false;
    s.transport.currentTimeSec = clampTime(s, a.timeSec);

    if (s.transport.isPlaying)
        t.effects.push_back(PlayFromEffect{s.transport.currentTimeSec});
    else
        t.effects.push_back(SeekEffect{s.transport.currentTimeSec});
}

// ===== Transport =====

void PlayerReducer::handle(Transition& t, const TogglePlayAction& /*a*/) {
    auto& transport = t.state.transport;
    transport.isPlaying = !transport.isPlaying;

    if (transport.isPlaying)
        t.effects.push_back(PlayFromEffect{transport.currentTimeSec});
    else
        t.effects.push_back(PauseEffect{});
}

void PlayerReducer::handle(Transition& t, const TickAction& a) {
    // Engine positions must never overwrite a drag in progress
    if (t.state.isScrubbing)
        return;

    auto& s = t.state;
    s.transport.currentTimeSec = a.timeSec;

    if (s.loop.enabled && s.loop.hasBothBounds() && a.timeSec >= *s.loop.bSec) {
        s.transport.currentTimeSec = *s.loop.aSec;
        t.effects.push_back(PlayFromEffect{*s.loop.aSec});
    }
}

void PlayerReducer::handle(Transition& t, const PlaybackFinishedAction& /*a*/) {
    t.state.transport.isPlaying = false;
}

// ===== Speed / Pitch =====

void PlayerReducer::handle(Transition& t, const SpeedDeltaAction& a) {
    auto& transport = t.state.transport;
    transport.speed =
        juce::jlimit(Transport::MIN_SPEED, Transport::MAX_SPEED, transport.speed + a.delta);

    t.showToast(Formatting::speedToastMessage(transport.speed));
    t.effects.push_back(SetRateEffect{transport.speed});
}

void PlayerReducer::handle(Transition& t, const PitchDeltaAction& a) {
    auto& transport = t.state.transport;
    transport.pitchSemitones = juce::jlimit(Transport::MIN_PITCH, Transport::MAX_PITCH,
                                            transport.pitchSemitones + a.delta);

    t.showToast(Formatting::pitchToastMessage(transport.pitchSemitones));
    t.effects.push_back(SetPitchEffect{transport.pitchSemitones});
}

// ===== Markers =====

void PlayerReducer::handle(Transition& t, const AddMarkerAction& a) {
    auto& s = t.state;
    s.markers.push_back(Marker{s.nextMarkerId, a.timeSec});
    ++s.nextMarkerId;
}

void PlayerReducer::handle(Transition& t, const DeleteMarkerAction& a) {
    auto& markers = t.state.markers;
    markers.erase(std::remove_if(markers.begin(), markers.end(),
                                 [&a](const Marker& m) { return m.id == a.id; }),
                  markers.end());
}

// ===== Loop =====

void PlayerReducer::handle(Transition& t, const ToggleLoopEnabledAction& a) {
    auto& loop = t.state.loop;

    if (!a.enabled) {
        loop.enabled = false;
    } else if (!loop.hasBothBounds()) {
        loop.enabled = false;
        t.showToast(LOOP_NEEDS_BOUNDS_MESSAGE);
    } else {
        loop.enabled = true;
    }

    // The hint mirrors the model even when the request was rejected
    t.emitLoopHint();
}

void PlayerReducer::handle(Transition& t, const SetLoopStartAction& a) {
    t.state.loop.aSec = a.timeSec;
    t.state.loop.normalize();
    t.emitLoopHint();
}

void PlayerReducer::handle(Transition& t, const SetLoopEndAction& a) {
    t.state.loop.bSec = a.timeSec;
    t.state.loop.normalize();
    t.emitLoopHint();
}

void PlayerReducer::handle(Transition& t, const SetLoopStartAtPlayheadAction& /*a*/) {
    auto& loop = t.state.loop;
    const double position = t.state.transport.currentTimeSec;

    loop.aSec = position;
    if (loop.bSec && position > *loop.bSec) {
        loop.bSec.reset();
        loop.enabled = false;
    }
    t.emitLoopHint();
}

void PlayerReducer::handle(Transition& t, const SetLoopEndAtPlayheadAction& /*a*/) {
    auto& loop = t.state.loop;
    const double position = t.state.transport.currentTimeSec;

    loop.bSec = position;
    if (loop.aSec && position < *loop.aSec) {
        loop.aSec.reset();
        loop.enabled = false;
    }
    t.emitLoopHint();
}

// ===== Toast =====

void PlayerReducer::handle(Transition& t, const ClearToastIfExpiredAction& a) {
    if (t.state.toast && t.state.toast->isExpired(a.now))
        t.state.toast.reset();
}

}  // namespace woodshed
