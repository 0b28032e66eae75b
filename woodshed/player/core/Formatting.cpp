#include "Formatting.hpp"

#include <cmath>

namespace woodshed {
namespace Formatting {

namespace {
// Absorbs binary representation error so values like 59.995 round up
constexpr double ROUNDING_EPSILON = 1.0e-7;

juce::String twoDecimals(double value) {
    return juce::String(value, 2);
}
}  // namespace

juce::String formatTime(double seconds) {
    const double clamped = (std::isfinite(seconds) && seconds > 0.0) ? seconds : 0.0;
    const auto hundredths = static_cast<juce::int64>(std::round(clamped * 100.0 + ROUNDING_EPSILON));

    const auto minutes = static_cast<int>(hundredths / 6000);
    const auto wholeSeconds = static_cast<int>((hundredths / 100) % 60);
    const auto fraction = static_cast<int>(hundredths % 100);

    return juce::String::formatted("%02d:%02d.%02d", minutes, wholeSeconds, fraction);
}

juce::String formatSpeed(double speed) {
    return twoDecimals(speed) + " x";
}

juce::String formatPitch(double semitones) {
    return twoDecimals(semitones) + " st";
}

juce::String speedToastMessage(double speed) {
    return "Speed " + twoDecimals(speed);
}

juce::String pitchToastMessage(double semitones) {
    return "Pitch " + twoDecimals(semitones);
}

}  // namespace Formatting
}  // namespace woodshed
