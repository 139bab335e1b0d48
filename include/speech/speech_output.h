#pragma once

#include <string>

namespace voice_os {

/**
 * @brief Speech output boundary
 *
 * speak() is fire-and-forget and preempts whatever is being said
 * (last write wins, no queue). stop() silences output.
 */
class SpeechOutput {
public:
    virtual ~SpeechOutput() = default;

    virtual void speak(const std::string& text) = 0;
    virtual void stop() = 0;
};

} // namespace voice_os
