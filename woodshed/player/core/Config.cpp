#include "Config.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>

namespace woodshed {

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::setToastPollIntervalMs(int intervalMs) {
    toastPollIntervalMs = std::clamp(intervalMs, 10, 1000);
}

void Config::setPositionPollIntervalMs(int intervalMs) {
    positionPollIntervalMs = std::clamp(intervalMs, 5, 500);
}

void Config::setWaveformBucketCount(int buckets) {
    waveformBucketCount = std::clamp(buckets, 1, 100000);
}

void Config::setBackgroundThreads(int threads) {
    backgroundThreads = std::clamp(threads, 1, 8);
}

void Config::setOutputChannels(int channels) {
    outputChannels = std::clamp(channels, 1, 64);
}

void Config::resetToDefaults() {
    toastPollIntervalMs = 100;
    positionPollIntervalMs = 33;
    waveformBucketCount = 1000;
    backgroundThreads = 1;
    preferredOutputDevice.clear();
    outputChannels = 2;
}

void Config::saveToFile(const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file for writing: " << filename << std::endl;
        return;
    }

    file << "toastPollIntervalMs=" << toastPollIntervalMs << std::endl;
    file << "positionPollIntervalMs=" << positionPollIntervalMs << std::endl;
    file << "waveformBucketCount=" << waveformBucketCount << std::endl;
    file << "backgroundThreads=" << backgroundThreads << std::endl;
    file << "preferredOutputDevice=" << preferredOutputDevice << std::endl;
    file << "outputChannels=" << outputChannels << std::endl;

    file.close();
    std::cout << "Config saved to: " << filename << std::endl;
}

void Config::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cout << "Config file not found, using defaults: " << filename << std::endl;
        return;
    }

    std::string line;
    while (std::getline(file, line)) {
        size_t equalPos = line.find('=');
        if (equalPos == std::string::npos)
            continue;

        std::string key = line.substr(0, equalPos);
        std::string value = line.substr(equalPos + 1);

        parseConfigLine(key, value);
    }

    file.close();
    std::cout << "Config loaded from: " << filename << std::endl;
}

void Config::parseConfigLine(const std::string& key, const std::string& value) {
    try {
        if (key == "preferredOutputDevice") {
            preferredOutputDevice = value;
            return;
        }

        int numValue = std::stoi(value);

        if (key == "toastPollIntervalMs") {
            setToastPollIntervalMs(numValue);
        } else if (key == "positionPollIntervalMs") {
            setPositionPollIntervalMs(numValue);
        } else if (key == "waveformBucketCount") {
            setWaveformBucketCount(numValue);
        } else if (key == "backgroundThreads") {
            setBackgroundThreads(numValue);
        } else if (key == "outputChannels") {
            setOutputChannels(numValue);
        }
        // Skip unknown keys silently
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config value: " << key << "=" << value << " (" << e.what()
                  << ")" << std::endl;
    }
}

}  // namespace woodshed
