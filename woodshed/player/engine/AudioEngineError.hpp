#pragma once

#include <stdexcept>
#include <string>

namespace woodshed {

/**
 * @brief Failure raised by audio collaborators (engine load, peak computation)
 *
 * what() is the user-facing description; the EffectRunner turns it into an
 * import failure toast.
 */
class AudioEngineError : public std::runtime_error {
  public:
    enum class Kind { FileNotFound, InvalidFormat, LoadFailed };

    static AudioEngineError fileNotFound() {
        return AudioEngineError(Kind::FileNotFound, "Audio file not found");
    }

    static AudioEngineError invalidFormat() {
        return AudioEngineError(Kind::InvalidFormat,
                                "Audio format not supported. Please use WAV, AIFF, MP3, or M4A.");
    }

    static AudioEngineError loadFailed(const std::string& detail) {
        return AudioEngineError(Kind::LoadFailed, "Failed to load audio: " + detail);
    }

    Kind getKind() const {
        return kind_;
    }

  private:
    AudioEngineError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    Kind kind_;
};

}  // namespace woodshed
