#include <juce_audio_basics/juce_audio_basics.h>
#include <juce_audio_devices/juce_audio_devices.h>
#include <juce_gui_basics/juce_gui_basics.h>
#include <tracktion_engine/tracktion_engine.h>

#include <iostream>
#include <memory>
#include <optional>

#include "audio/WaveformPeakComputer.hpp"
#include "core/Config.hpp"
#include "core/Formatting.hpp"
#include "engine/TracktionAudioEngine.hpp"
#include "state/PlayerCore.hpp"
#include "state/PlayerSelectors.hpp"

using namespace juce;

namespace {

juce::File getConfigFile() {
    return juce::File::getSpecialLocation(juce::File::userApplicationDataDirectory)
        .getChildFile("Woodshed")
        .getChildFile("woodshed.cfg");
}

/**
 * @brief Practice settings requested on the command line
 */
struct SessionOptions {
    juce::File file;
    double speed = 1.0;
    double pitchSemitones = 0.0;
    std::optional<double> loopStart;
    std::optional<double> loopEnd;
};

std::optional<SessionOptions> parseOptions(const juce::ArgumentList& args) {
    SessionOptions options;

    for (const auto& arg : args.arguments) {
        if (!arg.isOption()) {
            options.file = arg.resolveAsFile();
            break;
        }
    }
    if (options.file == juce::File())
        return std::nullopt;

    if (args.containsOption("--speed"))
        options.speed = args.getValueForOption("--speed").getDoubleValue();
    if (args.containsOption("--pitch"))
        options.pitchSemitones = args.getValueForOption("--pitch").getDoubleValue();

    if (args.containsOption("--loop")) {
        auto range = args.getValueForOption("--loop");
        if (!range.containsChar(':'))
            return std::nullopt;
        options.loopStart = range.upToFirstOccurrenceOf(":", false, false).getDoubleValue();
        options.loopEnd = range.fromFirstOccurrenceOf(":", false, false).getDoubleValue();
    }

    return options;
}

/**
 * @brief Drives one practice session from the console
 *
 * Applies the requested speed, pitch and loop once the import succeeded, starts
 * playback and reports transport changes and toasts.
 */
class ConsoleSession : public woodshed::PlayerStateListener {
  public:
    ConsoleSession(woodshed::PlayerCore& core, SessionOptions options,
                   std::function<void(int)> onFinished)
        : core_(core), options_(std::move(options)), onFinished_(std::move(onFinished)) {
        core_.addListener(this);
    }

    ~ConsoleSession() override {
        core_.removeListener(this);
    }

    void start() {
        std::cout << "Opening " << options_.file.getFullPathName() << std::endl;
        core_.send(woodshed::AppearedAction{});
        core_.send(woodshed::ImportPickedAction{options_.file});
    }

    void playerStateChanged(const woodshed::AppState& state) override {
        using namespace woodshed;

        if (state.toast && state.toast != lastToast_)
            std::cout << "[" << state.toast->message << "]" << std::endl;
        lastToast_ = state.toast;

        if (wasLoading_ && !state.isLoading) {
            if (state.track)
                startPractice(*state.track);
            else
                finish(1);
        }
        wasLoading_ = state.isLoading;

        if (started_ && !wasPlaying_ && state.transport.isPlaying)
            reportPlaybackStart(state);

        if (started_ && wasPlaying_ && !state.transport.isPlaying) {
            std::cout << "Stopped at " << Formatting::formatTime(state.transport.currentTimeSec)
                      << std::endl;
            finish(0);
        }
        wasPlaying_ = state.transport.isPlaying;

        const int second = static_cast<int>(state.transport.currentTimeSec);
        if (state.transport.isPlaying && second != lastReportedSecond_) {
            lastReportedSecond_ = second;
            std::cout << Formatting::formatTime(state.transport.currentTimeSec) << "  "
                      << juce::String(PlayerSelectors::playbackProgress(state) * 100.0, 1) << "%"
                      << std::endl;
        }
    }

    void waveformPeaksChanged() override {
        auto peaks = core_.getPeaks();
        if (!peaks.isEmpty())
            DBG("Waveform ready: " << peaks.buckets << " buckets");
    }

  private:
    void startPractice(const woodshed::TrackMeta& track) {
        using namespace woodshed;

        std::cout << "Loaded '" << track.name << "' (" << Formatting::formatTime(track.durationSec)
                  << ")" << std::endl;

        if (options_.speed != 1.0)
            core_.send(SpeedDeltaAction{options_.speed - 1.0});
        if (options_.pitchSemitones != 0.0)
            core_.send(PitchDeltaAction{options_.pitchSemitones});

        if (options_.loopStart && options_.loopEnd) {
            core_.send(SetLoopStartAction{*options_.loopStart});
            core_.send(SetLoopEndAction{*options_.loopEnd});
            core_.send(ToggleLoopEnabledAction{true});
        }

        // Queued behind the current notification, applied in order
        started_ = true;
        core_.send(TogglePlayAction{});
    }

    void reportPlaybackStart(const woodshed::AppState& state) {
        using namespace woodshed;

        std::cout << "Playing at speed " << Formatting::formatSpeed(state.transport.speed)
                  << ", pitch " << Formatting::formatPitch(state.transport.pitchSemitones)
                  << std::endl;
        if (PlayerSelectors::shouldShowLoopOverlay(state)) {
            auto range = PlayerSelectors::loopRange(state);
            std::cout << "Looping " << Formatting::formatTime(range->startSec) << " - "
                      << Formatting::formatTime(range->endSec) << std::endl;
        }
    }

    void finish(int exitCode) {
        if (onFinished_)
            onFinished_(exitCode);
    }

    woodshed::PlayerCore& core_;
    SessionOptions options_;
    std::function<void(int)> onFinished_;

    std::optional<woodshed::ToastState> lastToast_;
    bool wasLoading_ = false;
    bool wasPlaying_ = false;
    bool started_ = false;
    int lastReportedSecond_ = -1;
};

}  // namespace

class WoodshedPlayerApplication : public JUCEApplication {
  private:
    std::unique_ptr<woodshed::TracktionAudioEngine> engine_;
    std::unique_ptr<woodshed::WaveformPeakComputer> peakComputer_;
    std::unique_ptr<woodshed::PlayerCore> core_;
    std::unique_ptr<ConsoleSession> session_;

  public:
    WoodshedPlayerApplication() = default;

    const String getApplicationName() override {
        return "Woodshed";
    }
    const String getApplicationVersion() override {
        return "1.0.0";
    }
    bool moreThanOneInstanceAllowed() override {
        return true;
    }

    void initialise(const String& /*commandLine*/) override {
        juce::ArgumentList args("woodshed_player", getCommandLineParameterArray());
        auto options = parseOptions(args);
        if (!options) {
            std::cerr << "Usage: woodshed_player <audio file> [--speed=X] [--pitch=N] [--loop=A:B]"
                      << std::endl;
            setApplicationReturnValue(2);
            quit();
            return;
        }

        // 1. Load configuration
        auto configFile = getConfigFile();
        configFile.getParentDirectory().createDirectory();
        woodshed::Config::getInstance().loadFromFile(configFile.getFullPathName().toStdString());

        // 2. Initialize audio engine
        engine_ = std::make_unique<woodshed::TracktionAudioEngine>();
        if (!engine_->initialize()) {
            std::cerr << "ERROR: Failed to initialize Tracktion Engine" << std::endl;
            setApplicationReturnValue(1);
            quit();
            return;
        }
        std::cout << "Audio engine initialized" << std::endl;

        // 3. Player core and console session
        peakComputer_ = std::make_unique<woodshed::WaveformPeakComputer>();
        core_ = std::make_unique<woodshed::PlayerCore>(
            woodshed::PlayerDependencies{*engine_, *peakComputer_});

        session_ = std::make_unique<ConsoleSession>(*core_, std::move(*options), [this](int code) {
            setApplicationReturnValue(code);
            quit();
        });
        session_->start();
    }

    void shutdown() override {
        std::cout << "Shutting down..." << std::endl;

        // The session listens to the core, and the core drives the engine
        session_.reset();
        core_.reset();
        peakComputer_.reset();

        if (engine_) {
            engine_->shutdown();
            engine_.reset();
        }

        woodshed::Config::getInstance().saveToFile(getConfigFile().getFullPathName().toStdString());
    }

    void systemRequestedQuit() override {
        quit();
    }

    void anotherInstanceStarted(const String& /*commandLine*/) override {}
};

START_JUCE_APPLICATION(WoodshedPlayerApplication)
