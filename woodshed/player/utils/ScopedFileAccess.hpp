#pragma once

#include <juce_core/juce_core.h>

namespace woodshed {

/**
 * Grants and revokes permission to read a user-picked file.
 *
 * Sandboxed platforms hand out files that must be explicitly opened for access
 * and released afterwards; desktop builds run without a provider.
 */
class FileAccessProvider {
  public:
    virtual ~FileAccessProvider() = default;

    // Returns false if access to the file was refused
    virtual bool startAccessing(const juce::File& file) = 0;
    virtual void stopAccessing(const juce::File& file) = 0;
};

/**
 * RAII guard for FileAccessProvider access.
 *
 * Access is released when the guard leaves scope, on every exit path.
 * A null provider means unrestricted access and the guard does nothing.
 *
 * Non-copyable, non-movable: one guard per access.
 */
class ScopedFileAccess {
  public:
    ScopedFileAccess(FileAccessProvider* provider, const juce::File& file)
        : provider_(provider), file_(file) {
        if (provider_)
            granted_ = provider_->startAccessing(file_);
    }

    ~ScopedFileAccess() {
        if (provider_ && granted_)
            provider_->stopAccessing(file_);
    }

    // True if the file may be read (always true without a provider)
    bool isGranted() const {
        return provider_ == nullptr || granted_;
    }

    // Non-copyable, non-movable
    ScopedFileAccess(const ScopedFileAccess&) = delete;
    ScopedFileAccess& operator=(const ScopedFileAccess&) = delete;
    ScopedFileAccess(ScopedFileAccess&&) = delete;
    ScopedFileAccess& operator=(ScopedFileAccess&&) = delete;

  private:
    FileAccessProvider* provider_ = nullptr;
    juce::File file_;
    bool granted_ = false;
};

}  // namespace woodshed
