#include "PlayerCore.hpp"

#include <algorithm>
#include <iostream>

#include "../core/Config.hpp"

namespace woodshed {

namespace {
PlayerClock wallClockIfEmpty(const PlayerClock& clock) {
    if (clock)
        return clock;
    return [] { return juce::Time::getCurrentTime(); };
}
}  // namespace

PlayerCore::PlayerCore(const PlayerDependencies& deps)
    : clock_(wallClockIfEmpty(deps.clock)), runner_(deps) {
    self_ = this;

    runner_.setActionSink([this](const PlayerAction& action) { send(action); });
    runner_.onPeaksChanged = [this] {
        runOnMessageThread([](PlayerCore& core) { core.notifyPeaksChanged(); });
    };

    startToastTimer();
    DBG("PlayerCore: initialized");
}

PlayerCore::~PlayerCore() {
    stopTimer();
}

// ===== Action Dispatching =====

void PlayerCore::send(const PlayerAction& action) {
    runOnMessageThread([action](PlayerCore& core) { core.process(action); });
}

void PlayerCore::runOnMessageThread(std::function<void(PlayerCore&)> fn) {
    auto* mm = juce::MessageManager::getInstanceWithoutCreating();
    if (mm != nullptr && !mm->isThisTheMessageThread()) {
        auto self = self_;
        juce::MessageManager::callAsync([self, fn = std::move(fn)] {
            if (auto* core = self.get())
                fn(*core);
        });
        return;
    }

    // Without a message loop the calling thread runs it; processLock_ keeps callers serial
    fn(*this);
}

void PlayerCore::process(const PlayerAction& action) {
    const juce::ScopedLock sl(processLock_);
    pendingActions_.push_back(action);

    // Re-entrant sends are drained by the outermost call
    if (isProcessing_)
        return;

    const juce::ScopedValueSetter<bool> processing(isProcessing_, true);
    while (!pendingActions_.empty()) {
        auto next = std::move(pendingActions_.front());
        pendingActions_.pop_front();
        apply(next);
    }
}

void PlayerCore::apply(const PlayerAction& action) {
    auto result = PlayerReducer::reduce(state, action, clock_);

    const bool changed = result.state != state;
    state = std::move(result.state);

    for (const auto& effect : result.effects)
        runner_.run(effect);

    if (changed)
        notifyListeners();
}

// ===== Listener Management =====

void PlayerCore::addListener(PlayerStateListener* listener) {
    if (listener && std::find(listeners.begin(), listeners.end(), listener) == listeners.end()) {
        listeners.push_back(listener);
    }
}

void PlayerCore::removeListener(PlayerStateListener* listener) {
    listeners.erase(std::remove(listeners.begin(), listeners.end(), listener), listeners.end());
}

void PlayerCore::notifyListeners() {
    // Copy so listeners may unregister while being notified
    const auto current = listeners;
    for (auto* listener : current)
        listener->playerStateChanged(state);
}

void PlayerCore::notifyPeaksChanged() {
    const juce::ScopedLock sl(processLock_);
    const auto current = listeners;
    for (auto* listener : current)
        listener->waveformPeaksChanged();
}

// ===== Toast Expiry =====

void PlayerCore::startToastTimer() {
    startTimer(Config::getInstance().getToastPollIntervalMs());
}

void PlayerCore::stopToastTimer() {
    stopTimer();
}

void PlayerCore::timerCallback() {
    if (state.toast)
        send(ClearToastIfExpiredAction{clock_()});
}

}  // namespace woodshed
