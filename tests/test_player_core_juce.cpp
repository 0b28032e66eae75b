#include <juce_core/juce_core.h>
#include <juce_events/juce_events.h>

#include <set>
#include <thread>
#include <vector>

#include "FakeAudioEngine.hpp"
#include "FakePeakComputer.hpp"
#include "woodshed/player/core/Config.hpp"
#include "woodshed/player/state/PlayerCore.hpp"

using namespace woodshed;
using woodshed::test::FakeAudioEngine;
using woodshed::test::FakePeakComputer;

/**
 * @brief Tests for PlayerCore dispatching
 *
 * Runs on the JUCE message thread so that timers and callAsync hand-offs behave
 * as in the app. Background jobs run inline to keep results deterministic.
 */
class PlayerCoreTest final : public juce::UnitTest {
  public:
    PlayerCoreTest() : juce::UnitTest("PlayerCore Tests", "woodshed") {}

    void runTest() override {
        testImportFlow();
        testImportFailure();
        testReentrantSendIsQueued();
        testListenerNotification();
        testSendFromBackgroundThread();
        testConcurrentSendsApplyOnce();
        testToastExpiry();
        testStoppedToastTimer();
    }

  private:
    // Records every state the core publishes
    struct RecordingListener : public PlayerStateListener {
        void playerStateChanged(const AppState& state) override {
            states.push_back(state);
        }
        void waveformPeaksChanged() override {
            ++peakNotifications;
        }

        std::vector<AppState> states;
        int peakNotifications = 0;
    };

    struct Fixture {
        FakeAudioEngine engine;
        FakePeakComputer peaks;
        juce::Time now{1700000000000LL};
        std::unique_ptr<PlayerCore> core;
        RecordingListener listener;

        Fixture() {
            Config::getInstance().resetToDefaults();
            core = std::make_unique<PlayerCore>(PlayerDependencies{
                engine, peaks, [this] { return now; },
                [](std::function<void()> job) { job(); }});
            core->addListener(&listener);
        }

        ~Fixture() {
            core->removeListener(&listener);
            core.reset();
        }

        void loadTrack(double duration = 120.0) {
            engine.loadDuration = duration;
            core->send(ImportPickedAction{juce::File("/practice/etude.wav")});
            engine.calls.clear();
            listener.states.clear();
        }
    };

    static void pumpMessages(int milliseconds) {
        juce::MessageManager::getInstance()->runDispatchLoopUntil(milliseconds);
    }

    // =========================================================================
    // Test Cases
    // =========================================================================

    void testImportFlow() {
        beginTest("Import runs pause, load and peak computation in order");

        Fixture f;
        f.core->send(ImportPickedAction{juce::File("/practice/etude.wav")});

        const std::vector<juce::String> expectedCalls{"pause", "load:etude.wav"};
        expect(f.engine.calls == expectedCalls, "Pause must precede load");

        const auto& state = f.core->getState();
        expect(state.track.has_value(), "Track should be installed");
        expectEquals(state.track->name, juce::String("etude"));
        expect(!state.isLoading);
        expectEquals(state.viewport.endSec, 120.0);

        expectEquals(static_cast<int>(f.peaks.requestedFiles.size()), 1);
        expectEquals(f.core->getPeaks().buckets, 1000);
        expectEquals(f.listener.peakNotifications, 1);

        // Loading state was published before the result arrived
        expect(f.listener.states.size() >= 2);
        expect(f.listener.states.front().isLoading);
    }

    void testImportFailure() {
        beginTest("Failed import leaves no track and shows the error");

        Fixture f;
        f.engine.loadError = AudioEngineError::fileNotFound();
        f.core->send(ImportPickedAction{juce::File("/practice/missing.wav")});

        const auto& state = f.core->getState();
        expect(!state.track.has_value());
        expect(!state.isLoading);
        expect(state.toast.has_value());
        expectEquals(state.toast->message, juce::String("Audio file not found"));
        expect(f.peaks.requestedFiles.empty(), "No peaks without a track");
    }

    void testReentrantSendIsQueued() {
        beginTest("Actions sent while an action is processed run after it");

        Fixture f;
        f.loadTrack();

        // The engine reports a position from inside play()
        f.engine.onPlayCalled = [&f](double from) { f.engine.emitPosition(from + 1.0); };
        f.core->send(TransportScrubEndedAction{10.0});
        f.core->send(TogglePlayAction{});

        const auto& states = f.listener.states;
        expectEquals(static_cast<int>(states.size()), 3);
        expect(states[1].transport.isPlaying);
        expectEquals(states[1].transport.currentTimeSec, 10.0);
        expectEquals(states[2].transport.currentTimeSec, 11.0);

        const std::vector<juce::String> expectedCalls{"seek:10.00", "play:10.00"};
        expect(f.engine.calls == expectedCalls);
    }

    void testListenerNotification() {
        beginTest("Listeners hear about changes only");

        Fixture f;
        f.core->send(AppearedAction{});
        expectEquals(static_cast<int>(f.listener.states.size()), 0);

        f.core->send(SetToolAction{LoopTool::Marker});
        expectEquals(static_cast<int>(f.listener.states.size()), 1);
        expect(f.listener.states.back().tool == LoopTool::Marker);

        f.core->removeListener(&f.listener);
        f.core->send(SetToolAction{LoopTool::SetLoopStart});
        expectEquals(static_cast<int>(f.listener.states.size()), 1);
        f.core->addListener(&f.listener);
    }

    void testSendFromBackgroundThread() {
        beginTest("Sends from other threads are applied on the message thread");

        Fixture f;
        f.loadTrack();

        std::thread sender([&f] { f.core->send(TogglePlayAction{}); });
        sender.join();

        expect(!f.core->getState().transport.isPlaying, "Not applied before the message loop runs");

        pumpMessages(200);
        expect(f.core->getState().transport.isPlaying);

        const std::vector<juce::String> expectedCalls{"play:0.00"};
        expect(f.engine.calls == expectedCalls);
    }

    void testConcurrentSendsApplyOnce() {
        beginTest("Concurrent sends from many threads are each applied once");

        Fixture f;
        f.loadTrack();

        constexpr int numThreads = 4;
        constexpr int sendsPerThread = 25;
        std::vector<std::thread> senders;
        for (int t = 0; t < numThreads; ++t) {
            senders.emplace_back([&f, t] {
                for (int i = 0; i < sendsPerThread; ++i)
                    f.core->send(AddMarkerAction{t * 10.0 + i * 0.1});
            });
        }
        for (auto& sender : senders)
            sender.join();

        pumpMessages(300);

        const auto& markers = f.core->getState().markers;
        expectEquals(static_cast<int>(markers.size()), numThreads * sendsPerThread);

        std::set<MarkerId> ids;
        for (const auto& marker : markers)
            ids.insert(marker.id);
        expectEquals(static_cast<int>(ids.size()), numThreads * sendsPerThread,
                     "Marker ids must stay unique");
    }

    void testToastExpiry() {
        beginTest("Toast is cleared once its time has passed");

        Fixture f;
        expect(f.core->isToastTimerRunning());

        f.core->send(SpeedDeltaAction{0.25});
        expect(f.core->getState().toast.has_value());

        pumpMessages(300);
        expect(f.core->getState().toast.has_value(), "Clock has not advanced yet");

        f.now = f.now + juce::RelativeTime::seconds(2.0);
        pumpMessages(300);
        expect(!f.core->getState().toast.has_value());
    }

    void testStoppedToastTimer() {
        beginTest("Stopped toast timer leaves the toast in place");

        Fixture f;
        f.core->stopToastTimer();
        expect(!f.core->isToastTimerRunning());

        f.core->send(PitchDeltaAction{1.0});
        f.now = f.now + juce::RelativeTime::seconds(5.0);
        pumpMessages(300);
        expect(f.core->getState().toast.has_value());

        f.core->startToastTimer();
        pumpMessages(300);
        expect(!f.core->getState().toast.has_value());
    }
};

static PlayerCoreTest playerCoreTest;
