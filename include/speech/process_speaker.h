#pragma once

#include "speech/speech_output.h"
#include <memory>
#include <string>
#include <vector>

namespace voice_os {

/**
 * @brief SpeechOutput that runs an external TTS command per utterance
 *
 * The command is an argv template. "{text}" is replaced by the cleaned
 * text; without a placeholder the text is written to the command's stdin.
 * Starting a new utterance terminates the previous process.
 */
class ProcessSpeaker : public SpeechOutput {
public:
    explicit ProcessSpeaker(std::vector<std::string> command);
    ~ProcessSpeaker() override;

    // Non-copyable
    ProcessSpeaker(const ProcessSpeaker&) = delete;
    ProcessSpeaker& operator=(const ProcessSpeaker&) = delete;

    void speak(const std::string& text) override;
    void stop() override;

    /// True while an utterance process is alive
    bool is_speaking() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace voice_os
