#pragma once

#include "speech/speech_input.h"
#include "trigger_source.h"
#include <atomic>
#include <string>
#include <vector>

namespace voice_os {

/**
 * @brief Hands-free commands opened by a spoken wake word
 *
 * Each endpointed utterance is normalized and accepted only if it starts
 * with a wake word; the rest of the utterance is the command. An utterance
 * that is only the wake word produces nothing.
 */
class WakeWordTrigger : public TriggerSource {
public:
    WakeWordTrigger(SpeechInput& speech, std::vector<std::string> wake_words);

    const char* name() const override { return "wake-word"; }
    std::optional<Command> produce() override;
    void stop() override { running_ = false; }

private:
    SpeechInput& speech_;
    std::vector<std::string> wake_words_;
    std::atomic<bool> running_{true};
};

} // namespace voice_os
