#pragma once

#include <juce_core/juce_core.h>

namespace woodshed {

/**
 * @brief Text rendering for transport values shown to the user
 */
namespace Formatting {

/**
 * Format a time in seconds as "MM:SS.xx".
 * Negative input is shown as zero. Rounding to hundredths carries into the
 * seconds and minutes, so 59.995 renders as "01:00.00".
 */
juce::String formatTime(double seconds);

// "1.00 x"
juce::String formatSpeed(double speed);

// "-2.00 st"
juce::String formatPitch(double semitones);

juce::String speedToastMessage(double speed);
juce::String pitchToastMessage(double semitones);

}  // namespace Formatting

}  // namespace woodshed
