#include "triggers/text_trigger.h"
#include "logger.h"
#include "utils.h"

namespace voice_os {

TextTrigger::TextTrigger(std::istream& input, TriggerListener* listener, std::string reset_command)
    : input_(input), listener_(listener), reset_command_(std::move(reset_command)) {}

std::optional<Command> TextTrigger::produce() {
    std::string line;
    while (running_ && std::getline(input_, line)) {
        std::string text = utils::trim_copy(line);
        if (text.empty()) {
            continue;
        }
        if (!reset_command_.empty() && text == reset_command_) {
            if (listener_) {
                listener_->on_reset_requested();
            }
            continue;
        }
        return Command(text, CommandSource::Typed);
    }
    LOG_DEBUG("[Trigger] Text input ended");
    return std::nullopt;
}

} // namespace voice_os
