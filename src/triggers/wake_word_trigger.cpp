#include "triggers/wake_word_trigger.h"
#include "logger.h"
#include "utils.h"

namespace voice_os {

WakeWordTrigger::WakeWordTrigger(SpeechInput& speech, std::vector<std::string> wake_words)
    : speech_(speech), wake_words_(std::move(wake_words)) {}

std::optional<Command> WakeWordTrigger::produce() {
    while (running_) {
        auto heard = speech_.listen_for_utterance(running_);
        if (heard.is_error()) {
            Logger::error("[Voice] Wake-word listening stopped: " + heard.error().message);
            return std::nullopt;
        }

        const std::string& text = heard.value();
        if (text.empty()) {
            continue;
        }

        std::string remainder;
        if (!utils::match_wake_word(text, wake_words_, remainder)) {
            LOG_VOICE("Ignored (no wake word): \"" + text + "\"");
            continue;
        }
        if (remainder.empty()) {
            LOG_VOICE("Wake word without a command");
            continue;
        }
        return Command(remainder, CommandSource::WakeWord);
    }
    return std::nullopt;
}

} // namespace voice_os
