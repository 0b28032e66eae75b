#include <catch2/catch_test_macros.hpp>
#include <juce_core/juce_core.h>

#include <fstream>

#include "woodshed/player/core/Config.hpp"

using namespace woodshed;

/**
 * Config is a process-wide singleton, so every test case restores the
 * defaults before and after touching it.
 */
namespace {
struct ConfigReset {
    ConfigReset() {
        Config::getInstance().resetToDefaults();
    }
    ~ConfigReset() {
        Config::getInstance().resetToDefaults();
    }
};
}  // namespace

TEST_CASE("Config - defaults", "[config]") {
    ConfigReset reset;
    auto& config = Config::getInstance();

    REQUIRE(config.getToastPollIntervalMs() == 100);
    REQUIRE(config.getPositionPollIntervalMs() == 33);
    REQUIRE(config.getWaveformBucketCount() == 1000);
    REQUIRE(config.getBackgroundThreads() == 1);
    REQUIRE(config.getPreferredOutputDevice().empty());
    REQUIRE(config.getOutputChannels() == 2);
}

TEST_CASE("Config - setters clamp out of range values", "[config]") {
    ConfigReset reset;
    auto& config = Config::getInstance();

    config.setToastPollIntervalMs(0);
    REQUIRE(config.getToastPollIntervalMs() == 10);

    config.setPositionPollIntervalMs(100000);
    REQUIRE(config.getPositionPollIntervalMs() == 500);

    config.setWaveformBucketCount(-5);
    REQUIRE(config.getWaveformBucketCount() == 1);

    config.setBackgroundThreads(64);
    REQUIRE(config.getBackgroundThreads() == 8);
}

TEST_CASE("Config - save and load", "[config]") {
    ConfigReset reset;
    auto& config = Config::getInstance();
    juce::TemporaryFile temp(".cfg");
    const auto path = temp.getFile().getFullPathName().toStdString();

    SECTION("Values survive a round trip") {
        config.setToastPollIntervalMs(250);
        config.setWaveformBucketCount(2048);
        config.setPreferredOutputDevice("Studio Monitors");
        config.saveToFile(path);

        config.resetToDefaults();
        REQUIRE(config.getWaveformBucketCount() == 1000);

        config.loadFromFile(path);
        REQUIRE(config.getToastPollIntervalMs() == 250);
        REQUIRE(config.getWaveformBucketCount() == 2048);
        REQUIRE(config.getPreferredOutputDevice() == "Studio Monitors");
    }

    SECTION("Unknown keys and bad values are skipped") {
        {
            std::ofstream out(path);
            out << "someFutureSetting=7" << std::endl;
            out << "waveformBucketCount=lots" << std::endl;
            out << "not a setting" << std::endl;
            out << "backgroundThreads=3" << std::endl;
        }

        config.loadFromFile(path);
        REQUIRE(config.getWaveformBucketCount() == 1000);
        REQUIRE(config.getBackgroundThreads() == 3);
    }

    SECTION("Missing file keeps the current values") {
        config.setOutputChannels(6);
        config.loadFromFile(path + ".missing");
        REQUIRE(config.getOutputChannels() == 6);
    }
}
