#include "TracktionAudioEngine.hpp"

#include <iostream>

#include "../core/Config.hpp"

namespace woodshed {

TracktionAudioEngine::TracktionAudioEngine() {
    positionTimer_ = std::make_unique<PlaybackPositionTimer>(*this);
    positionTimer_->onPosition = [this](double position) {
        if (onPositionChanged)
            onPositionChanged(position);
    };
    positionTimer_->onEndReached = [this] { handleEndOfMedia(); };
}

TracktionAudioEngine::~TracktionAudioEngine() {
    shutdown();
}

// =============================================================================
// Lifecycle
// =============================================================================

bool TracktionAudioEngine::initialize() {
    try {
        engine_ = std::make_unique<te::Engine>("Woodshed");

        auto& config = Config::getInstance();
        auto& dm = engine_->getDeviceManager();
        dm.initialise(0, config.getOutputChannels());
        DBG("DeviceManager initialized with " << config.getOutputChannels()
                                              << " output channels");

        const auto preferredOutput = juce::String(config.getPreferredOutputDevice());
        if (preferredOutput.isNotEmpty()) {
            auto& juceDeviceManager = dm.deviceManager;
            juce::AudioDeviceManager::AudioDeviceSetup setup;
            juceDeviceManager.getAudioDeviceSetup(setup);
            setup.outputDeviceName = preferredOutput;

            auto error = juceDeviceManager.setAudioDeviceSetup(setup, true);
            if (error.isNotEmpty())
                std::cerr << "Could not open output device '" << preferredOutput << "': " << error
                          << std::endl;
            else
                std::cout << "Using output device: " << preferredOutput << std::endl;
        }

        auto editFile = juce::File::getSpecialLocation(juce::File::tempDirectory)
                            .getChildFile("woodshed_temp.tracktionedit");
        if (editFile.existsAsFile())
            editFile.deleteFile();

        edit_ = tracktion::createEmptyEdit(*engine_, editFile);
        if (!edit_) {
            std::cerr << "ERROR: Failed to create Edit" << std::endl;
            return false;
        }

        edit_->ensureNumberOfAudioTracks(1);
        edit_->getTransport().ensureContextAllocated();

        alive_->store(true);
        std::cout << "Tracktion Engine initialized" << std::endl;
        return true;

    } catch (const std::exception& e) {
        std::cerr << "ERROR: Failed to initialize Tracktion Engine: " << e.what() << std::endl;
        return false;
    }
}

void TracktionAudioEngine::shutdown() {
    if (!engine_)
        return;

    std::cout << "TracktionAudioEngine::shutdown - starting..." << std::endl;
    alive_->store(false);
    positionTimer_->stop();

    if (edit_) {
        auto& transport = edit_->getTransport();
        if (transport.isPlaying())
            transport.stop(false, false);

        // Release the playback context before the Edit goes away
        transport.freePlaybackContext();

        clip_ = nullptr;
        edit_.reset();
    }

    engine_->getDeviceManager().closeDevices();
    engine_.reset();

    sourceLength_ = 0.0;
    std::cout << "Tracktion Engine shutdown complete" << std::endl;
}

// =============================================================================
// Media
// =============================================================================

TrackMeta TracktionAudioEngine::load(const juce::File& file) {
    if (!file.existsAsFile())
        throw AudioEngineError::fileNotFound();

    if (!engine_ || !alive_->load())
        throw AudioEngineError::loadFailed("audio engine is not running");

    te::AudioFile audioFile(*engine_, file);
    if (!audioFile.isValid())
        throw AudioEngineError::invalidFormat();

    const double length = audioFile.getLength();
    if (length <= 0.0)
        throw AudioEngineError::loadFailed("file contains no audio");

    const bool inserted = juce::MessageManager::existsAndIsCurrentThread()
                              ? replaceClip(file, length)
                              : replaceClipOnMessageThread(file, length);
    if (!inserted)
        throw AudioEngineError::loadFailed("could not create clip for " +
                                           file.getFileName().toStdString());

    DBG("TracktionAudioEngine: loaded " << file.getFullPathName() << " (" << length << "s)");
    return TrackMeta{file.getFileNameWithoutExtension(), length};
}

bool TracktionAudioEngine::replaceClipOnMessageThread(const juce::File& file,
                                                      double sourceLength) {
    struct Request {
        juce::WaitableEvent done;
        std::atomic<bool> inserted{false};
    };

    auto request = std::make_shared<Request>();
    auto alive = alive_;
    juce::MessageManager::callAsync([this, request, alive, file, sourceLength] {
        if (alive->load())
            request->inserted = replaceClip(file, sourceLength);
        request->done.signal();
    });

    // Wait in slices so shutdown or a cancelled pool job cannot leave us blocked
    while (!request->done.wait(LOAD_HANDOFF_POLL_MS)) {
        if (!alive->load())
            throw AudioEngineError::loadFailed("audio engine shut down during load");

        if (auto* job = juce::ThreadPoolJob::getCurrentThreadPoolJob())
            if (job->shouldExit())
                throw AudioEngineError::loadFailed("load cancelled");
    }

    return request->inserted;
}

bool TracktionAudioEngine::replaceClip(const juce::File& file, double sourceLength) {
    if (!edit_)
        return false;

    positionTimer_->stop();
    auto& transport = edit_->getTransport();
    if (transport.isPlaying())
        transport.stop(false, false);

    auto tracks = te::getAudioTracks(*edit_);
    if (tracks.isEmpty())
        return false;

    if (clip_) {
        clip_->removeFromParent();
        clip_ = nullptr;
    }

    auto timeRange =
        te::TimeRange(te::TimePosition(), te::TimePosition::fromSeconds(sourceLength / rate_));
    clip_ = te::insertWaveClip(*tracks.getFirst(), file.getFileNameWithoutExtension(), file,
                               te::ClipPosition{timeRange}, te::DeleteExistingClips::yes);
    if (!clip_) {
        DBG("TracktionAudioEngine: Failed to create WaveAudioClip");
        sourceLength_ = 0.0;
        return false;
    }

    sourceLength_ = sourceLength;
    clip_->setUsesProxy(false);
    clip_->setTimeStretchMode(te::TimeStretcher::defaultMode);
    clip_->setAutoPitch(false);
    applyClipTiming();
    applyLoopHint();

    transport.setPosition(te::TimePosition());
    return true;
}

// =============================================================================
// Transport
// =============================================================================

void TracktionAudioEngine::play(double fromSeconds) {
    if (!edit_ || !clip_)
        return;

    auto& transport = edit_->getTransport();
    transport.setPosition(te::TimePosition::fromSeconds(toEditTime(clampToSource(fromSeconds))));
    if (!transport.isPlaying())
        transport.play(false);

    positionTimer_->start();
}

void TracktionAudioEngine::pause() {
    positionTimer_->stop();

    if (edit_) {
        auto& transport = edit_->getTransport();
        if (transport.isPlaying())
            transport.stop(false, false);
    }
}

void TracktionAudioEngine::seek(double seconds) {
    if (!edit_)
        return;

    edit_->getTransport().setPosition(
        te::TimePosition::fromSeconds(toEditTime(clampToSource(seconds))));
}

bool TracktionAudioEngine::isPlaying() const {
    return edit_ && edit_->getTransport().isPlaying();
}

bool TracktionAudioEngine::hasClip() const {
    return clip_ != nullptr;
}

double TracktionAudioEngine::getSourcePosition() const {
    if (!edit_)
        return 0.0;
    return edit_->getTransport().position.get().inSeconds() * rate_;
}

void TracktionAudioEngine::handleEndOfMedia() {
    pause();
    DBG("TracktionAudioEngine: end of media reached");
    if (onPlaybackFinished)
        onPlaybackFinished();
}

// =============================================================================
// Rate / Pitch
// =============================================================================

void TracktionAudioEngine::setRate(double rate) {
    if (rate <= 0.0)
        return;

    // Keep the audible source position across the change of time base
    const double sourcePosition = getSourcePosition();
    rate_ = rate;

    if (clip_) {
        applyClipTiming();
        applyLoopHint();
        edit_->getTransport().setPosition(te::TimePosition::fromSeconds(toEditTime(sourcePosition)));
    }
}

void TracktionAudioEngine::setPitchSemitones(double semitones) {
    pitch_ = semitones;
    if (clip_)
        clip_->setPitchChange(static_cast<float>(pitch_));
}

void TracktionAudioEngine::applyClipTiming() {
    DBG("TracktionAudioEngine: setSpeedRatio " << rate_.load() << ", pitch " << pitch_);
    clip_->setSpeedRatio(rate_);
    clip_->setLength(te::TimeDuration::fromSeconds(sourceLength_ / rate_), true);
    clip_->setPitchChange(static_cast<float>(pitch_));
}

// =============================================================================
// Loop
// =============================================================================

void TracktionAudioEngine::setLoop(std::optional<double> aSec, std::optional<double> bSec,
                                   bool enabled) {
    loopStart_ = aSec;
    loopEnd_ = bSec;
    loopEnabled_ = enabled;
    applyLoopHint();
}

void TracktionAudioEngine::applyLoopHint() {
    if (!edit_)
        return;

    auto& transport = edit_->getTransport();
    const bool usable = loopEnabled_ && loopStart_ && loopEnd_ && *loopEnd_ > *loopStart_;
    if (usable) {
        transport.setLoopRange(te::TimeRange(te::TimePosition::fromSeconds(toEditTime(*loopStart_)),
                                             te::TimePosition::fromSeconds(toEditTime(*loopEnd_))));
    }
    transport.looping = usable;
}

bool TracktionAudioEngine::isNativeLoopActive() const {
    return edit_ && edit_->getTransport().looping.get();
}

// =============================================================================
// Helpers
// =============================================================================

double TracktionAudioEngine::toEditTime(double sourceSeconds) const {
    return sourceSeconds / rate_;
}

double TracktionAudioEngine::clampToSource(double sourceSeconds) const {
    return juce::jlimit(0.0, juce::jmax(0.0, sourceLength_.load()), sourceSeconds);
}

}  // namespace woodshed
