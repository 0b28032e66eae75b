#pragma once

#include <string>

namespace woodshed {

/**
 * Configuration class for the runtime knobs of the player
 *
 * Model constants that the reducer depends on (toast duration, speed and pitch
 * bounds, default viewport) are not configurable and live with the state model.
 */
class Config {
  public:
    static Config& getInstance();

    // Toast Expiry
    int getToastPollIntervalMs() const {
        return toastPollIntervalMs;
    }
    void setToastPollIntervalMs(int intervalMs);

    // Playback Position Polling
    int getPositionPollIntervalMs() const {
        return positionPollIntervalMs;
    }
    void setPositionPollIntervalMs(int intervalMs);

    // Waveform
    int getWaveformBucketCount() const {
        return waveformBucketCount;
    }
    void setWaveformBucketCount(int buckets);

    // Background Work
    int getBackgroundThreads() const {
        return backgroundThreads;
    }
    void setBackgroundThreads(int threads);

    // Audio Device Configuration
    std::string getPreferredOutputDevice() const {
        return preferredOutputDevice;
    }
    void setPreferredOutputDevice(const std::string& deviceName) {
        preferredOutputDevice = deviceName;
    }

    int getOutputChannels() const {
        return outputChannels;
    }
    void setOutputChannels(int channels);

    // Restore every setting to its default value
    void resetToDefaults();

    // Save/Load Configuration
    void saveToFile(const std::string& filename);
    void loadFromFile(const std::string& filename);

  private:
    Config() = default;

    // Helper to parse a single config line
    void parseConfigLine(const std::string& key, const std::string& value);

    int toastPollIntervalMs = 100;     // Toast expiry check period
    int positionPollIntervalMs = 33;   // ~30 position updates per second while playing
    int waveformBucketCount = 1000;    // Peak buckets computed per loaded track
    int backgroundThreads = 1;         // Threads running loads and peak computation

    std::string preferredOutputDevice = "";  // Preferred output device (empty = system default)
    int outputChannels = 2;
};

}  // namespace woodshed
