#include <juce_core/juce_core.h>
#include <juce_events/juce_events.h>
#include <tracktion_engine/tracktion_engine.h>

#include <iostream>
#include <sstream>

#include "SharedTestEngine.hpp"
#include "TestAudioFiles.hpp"
#include "woodshed/player/engine/TracktionAudioEngine.hpp"

using namespace woodshed;

/**
 * @brief Tests for TracktionAudioEngine against a real Edit
 *
 * Uses the shared engine and generated sine WAV files. Positions crossing the
 * AudioEngine interface are source seconds regardless of the playback rate.
 */
class TracktionAudioEngineTest final : public juce::UnitTest {
  public:
    TracktionAudioEngineTest() : juce::UnitTest("TracktionAudioEngine Tests", "woodshed") {}

    void runTest() override {
        testLoadReportsMetadata();
        testLoadMissingFile();
        testLoadInvalidFormat();
        testReloadReplacesClip();
        testRateAndPitch();
        testSeekUsesSourceTime();
        testLoopHint();
        testPauseStopsTransport();
        testEndOfMediaIsReportedQuietly();
    }

  private:
    static TracktionAudioEngine& engine() {
        auto& e = woodshed::test::getSharedEngine();
        woodshed::test::resetTransport(e);
        return e;
    }

    template <typename Fn>
    void expectLoadError(Fn&& fn, AudioEngineError::Kind expectedKind) {
        try {
            fn();
            expect(false, "Expected AudioEngineError");
        } catch (const AudioEngineError& e) {
            expect(e.getKind() == expectedKind, juce::String("Unexpected error: ") + e.what());
        }
    }

    // =========================================================================
    // Test Cases
    // =========================================================================

    void testLoadReportsMetadata() {
        beginTest("Load returns name and duration");

        auto& e = engine();
        auto wav = woodshed::test::createSineWavFile(44100.0, 2.0);
        auto track = e.load(wav->getFile());

        expectEquals(track.name, wav->getFile().getFileNameWithoutExtension());
        expectWithinAbsoluteError(track.durationSec, 2.0, 0.01);
        expect(e.hasClip());
        expectWithinAbsoluteError(e.getSourceLength(), 2.0, 0.01);
    }

    void testLoadMissingFile() {
        beginTest("Missing file is reported as not found");

        auto& e = engine();
        const auto missing = juce::File::getSpecialLocation(juce::File::tempDirectory)
                                 .getChildFile("woodshed_missing_take.wav");
        expectLoadError([&] { e.load(missing); }, AudioEngineError::Kind::FileNotFound);
    }

    void testLoadInvalidFormat() {
        beginTest("Unreadable file is reported as an unsupported format");

        auto& e = engine();
        juce::TemporaryFile text(".txt");
        expect(text.getFile().replaceWithText("not audio"));
        expectLoadError([&] { e.load(text.getFile()); }, AudioEngineError::Kind::InvalidFormat);
    }

    void testReloadReplacesClip() {
        beginTest("Loading again replaces the clip");

        auto& e = engine();
        auto first = woodshed::test::createSineWavFile(44100.0, 3.0);
        auto second = woodshed::test::createSineWavFile(44100.0, 1.0);

        e.load(first->getFile());
        e.load(second->getFile());

        auto tracks = te::getAudioTracks(*e.getEdit());
        expectEquals(tracks.getFirst()->getClips().size(), 1);
        expectWithinAbsoluteError(e.getSourceLength(), 1.0, 0.01);
    }

    void testRateAndPitch() {
        beginTest("Rate and pitch are applied to the clip");

        auto& e = engine();
        auto wav = woodshed::test::createSineWavFile(44100.0, 4.0);
        e.load(wav->getFile());

        e.setRate(0.5);
        e.setPitchSemitones(-3.0);
        expectEquals(e.getRate(), 0.5);
        expectEquals(e.getPitchSemitones(), -3.0);

        auto tracks = te::getAudioTracks(*e.getEdit());
        auto* clip = dynamic_cast<te::WaveAudioClip*>(tracks.getFirst()->getClips().getFirst());
        expect(clip != nullptr);
        expectWithinAbsoluteError(clip->getSpeedRatio(), 0.5, 0.001);
        expectWithinAbsoluteError(static_cast<double>(clip->getPitchChange()), -3.0, 0.01);
        expectWithinAbsoluteError(clip->getPosition().getLength().inSeconds(), 8.0, 0.02);

        // A rate that cannot play is ignored
        e.setRate(0.0);
        expectEquals(e.getRate(), 0.5);
    }

    void testSeekUsesSourceTime() {
        beginTest("Seek positions are source seconds at any rate");

        auto& e = engine();
        auto wav = woodshed::test::createSineWavFile(44100.0, 4.0);
        e.load(wav->getFile());

        e.seek(1.5);
        expectWithinAbsoluteError(e.getSourcePosition(), 1.5, 0.01);

        e.setRate(2.0);
        expectWithinAbsoluteError(e.getSourcePosition(), 1.5, 0.01);
        expectWithinAbsoluteError(e.getEdit()->getTransport().getPosition().inSeconds(), 0.75,
                                  0.01);

        // Beyond the end is clamped to the track
        e.seek(100.0);
        expectWithinAbsoluteError(e.getSourcePosition(), 4.0, 0.01);
    }

    void testLoopHint() {
        beginTest("Loop hint drives the native transport loop");

        auto& e = engine();
        auto wav = woodshed::test::createSineWavFile(44100.0, 4.0);
        e.load(wav->getFile());

        e.setLoop(1.0, 2.0, true);
        expect(e.isNativeLoopActive());
        auto range = e.getEdit()->getTransport().getLoopRange();
        expectWithinAbsoluteError(range.getStart().inSeconds(), 1.0, 0.01);
        expectWithinAbsoluteError(range.getEnd().inSeconds(), 2.0, 0.01);

        e.setLoop(1.0, std::nullopt, true);
        expect(!e.isNativeLoopActive(), "Needs both bounds");

        e.setLoop(1.0, 2.0, false);
        expect(!e.isNativeLoopActive());
    }

    void testPauseStopsTransport() {
        beginTest("Pause stops the transport");

        auto& e = engine();
        auto wav = woodshed::test::createSineWavFile(44100.0, 2.0);
        e.load(wav->getFile());

        e.play(0.5);
        e.pause();
        expect(!e.isPlaying());

        // Positions before the start are clamped
        e.seek(-1.0);
        expectWithinAbsoluteError(e.getSourcePosition(), 0.0, 0.01);
    }

    void testEndOfMediaIsReportedQuietly() {
        beginTest("End of media raises playback finished without console output");

        auto& e = engine();
        auto wav = woodshed::test::createSineWavFile(44100.0, 1.0);
        e.load(wav->getFile());

        int finishedCount = 0;
        e.onPlaybackFinished = [&finishedCount] { ++finishedCount; };

        std::ostringstream captured;
        auto* previous = std::cout.rdbuf(captured.rdbuf());

        e.play(0.9);
        const auto deadline = juce::Time::getMillisecondCounter() + 3000;
        while (finishedCount == 0 && juce::Time::getMillisecondCounter() < deadline)
            juce::MessageManager::getInstance()->runDispatchLoopUntil(50);

        std::cout.rdbuf(previous);
        e.onPlaybackFinished = nullptr;

        if (finishedCount == 0) {
            // The transport only advances with a running output device
            logMessage("No output device running; end of media not reached");
            e.pause();
            return;
        }

        expectEquals(finishedCount, 1);
        expect(!e.isPlaying(), "Transport stops at the end of the media");
        expect(captured.str().empty(), "Engine must leave console output to the application");
    }
};

static TracktionAudioEngineTest tracktionAudioEngineTest;
