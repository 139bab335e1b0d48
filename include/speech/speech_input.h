#pragma once

#include "errors.h"
#include <atomic>
#include <string>

namespace voice_os {

/**
 * @brief Speech-to-text boundary used by the trigger sources
 *
 * An empty transcript means nothing intelligible was heard. An error means
 * the input device is unusable and the calling trigger should stop.
 */
class SpeechInput {
public:
    virtual ~SpeechInput() = default;

    /// Record until stop becomes true, then transcribe everything captured
    virtual Result<std::string> capture_until_stopped(const std::atomic<bool>& stop) = 0;

    /// Wait for one endpointed utterance and transcribe it; returns early (empty) once running is false
    virtual Result<std::string> listen_for_utterance(const std::atomic<bool>& running) = 0;
};

} // namespace voice_os
