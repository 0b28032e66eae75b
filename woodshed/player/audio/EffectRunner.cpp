#include "EffectRunner.hpp"

#include <utility>

#include "../core/Config.hpp"
#include "../utils/ScopedFileAccess.hpp"

namespace woodshed {

EffectRunner::EffectRunner(const PlayerDependencies& deps)
    : engine_(deps.engine),
      peakComputer_(deps.peakComputer),
      fileAccess_(deps.fileAccess),
      executor_(deps.executor) {
    if (!executor_)
        pool_ = std::make_unique<juce::ThreadPool>(Config::getInstance().getBackgroundThreads());

    // Engine notifications are not effects; they are wired once for the runner's lifetime
    engine_.onPositionChanged = [this](double timeSec) { dispatch(TickAction{timeSec}); };
    engine_.onPlaybackFinished = [this] { dispatch(PlaybackFinishedAction{}); };
}

EffectRunner::~EffectRunner() {
    engine_.onPositionChanged = nullptr;
    engine_.onPlaybackFinished = nullptr;

    if (pool_)
        pool_->removeAllJobs(true, POOL_SHUTDOWN_TIMEOUT_MS);
}

void EffectRunner::setActionSink(ActionSink sink) {
    sink_ = std::move(sink);
}

void EffectRunner::run(const PlayerEffect& effect) {
    std::visit([this](const auto& e) { handleEffect(e); }, effect);
}

WaveformPeaks EffectRunner::getPeaks() const {
    const juce::ScopedLock sl(lock_);
    return peaks_;
}

juce::File EffectRunner::getCurrentFile() const {
    const juce::ScopedLock sl(lock_);
    return currentFile_;
}

// ===== Effect Handlers =====

void EffectRunner::handleEffect(const LoadEffect& e) {
    std::uint64_t generation = 0;
    bool hadPeaks = false;
    {
        const juce::ScopedLock sl(lock_);
        generation = ++loadGeneration_;
        currentFile_ = e.file;
        hadPeaks = !peaks_.isEmpty();
        peaks_ = WaveformPeaks::empty();
    }

    if (hadPeaks && onPeaksChanged)
        onPeaksChanged();

    runInBackground([this, file = e.file, generation] {
        PlayerAction result = ImportFailedAction{};
        {
            // One engine load at a time, so the newest file is always the last one inserted
            const juce::ScopedLock loading(loadLock_);
            if (isSuperseded(generation)) {
                DBG("EffectRunner: skipping superseded load " << file.getFileName());
                return;
            }

            try {
                ScopedFileAccess access(fileAccess_, file);
                if (!access.isGranted())
                    throw AudioEngineError::loadFailed("access to the file was refused");

                result = ImportSucceededAction{engine_.load(file)};
            } catch (const std::exception& ex) {
                DBG("EffectRunner: load failed for " << file.getFullPathName() << ": "
                                                     << ex.what());
                result = ImportFailedAction{juce::String(ex.what())};
            }
        }

        if (isSuperseded(generation)) {
            DBG("EffectRunner: discarding result of superseded load " << file.getFileName());
            return;
        }
        dispatch(result);
    });
}

void EffectRunner::handleEffect(const PlayFromEffect& e) {
    engine_.play(e.timeSec);
}

void EffectRunner::handleEffect(const PauseEffect& /*e*/) {
    engine_.pause();
}

void EffectRunner::handleEffect(const SeekEffect& e) {
    engine_.seek(e.timeSec);
}

void EffectRunner::handleEffect(const SetRateEffect& e) {
    engine_.setRate(e.rate);
}

void EffectRunner::handleEffect(const SetPitchEffect& e) {
    engine_.setPitchSemitones(e.semitones);
}

void EffectRunner::handleEffect(const SetLoopEffect& e) {
    engine_.setLoop(e.aSec, e.bSec, e.enabled);
}

void EffectRunner::handleEffect(const ComputePeaksEffect& /*e*/) {
    juce::File file;
    std::uint64_t generation = 0;
    {
        const juce::ScopedLock sl(lock_);
        file = currentFile_;
        generation = loadGeneration_.load();
    }

    if (file == juce::File()) {
        DBG("EffectRunner: no file loaded, skipping peak computation");
        return;
    }

    const int buckets = Config::getInstance().getWaveformBucketCount();
    runInBackground([this, file, generation, buckets] {
        if (isSuperseded(generation))
            return;

        WaveformPeaks peaks;
        try {
            ScopedFileAccess access(fileAccess_, file);
            if (!access.isGranted())
                throw AudioEngineError::loadFailed("access to the file was refused");

            peaks = peakComputer_.computePeaks(file, buckets);
        } catch (const std::exception& ex) {
            // A missing waveform is cosmetic: show none rather than an error
            DBG("EffectRunner: peak computation failed for " << file.getFileName() << ": "
                                                             << ex.what());
            peaks = WaveformPeaks::empty();
        }
        storePeaks(std::move(peaks), generation);
    });
}

// ===== Helpers =====

void EffectRunner::storePeaks(WaveformPeaks peaks, std::uint64_t generation) {
    {
        const juce::ScopedLock sl(lock_);
        if (isSuperseded(generation)) {
            DBG("EffectRunner: discarding peaks of superseded load");
            return;
        }
        peaks_ = std::move(peaks);
    }

    if (onPeaksChanged)
        onPeaksChanged();
}

bool EffectRunner::isSuperseded(std::uint64_t generation) const {
    return generation != loadGeneration_.load();
}

void EffectRunner::dispatch(const PlayerAction& action) {
    if (sink_)
        sink_(action);
}

void EffectRunner::runInBackground(std::function<void()> job) {
    if (executor_)
        executor_(std::move(job));
    else
        pool_->addJob(std::move(job));
}

}  // namespace woodshed
