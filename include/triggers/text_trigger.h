#pragma once

#include "trigger_source.h"
#include <atomic>
#include <istream>
#include <string>

namespace voice_os {

/**
 * @brief Typed commands, one per line
 *
 * A line equal to the reset command (default "/reset") clears the
 * conversation instead of producing a command. Blank lines are skipped.
 */
class TextTrigger : public TriggerSource {
public:
    TextTrigger(std::istream& input, TriggerListener* listener,
                std::string reset_command = "/reset");

    const char* name() const override { return "typed"; }
    std::optional<Command> produce() override;
    void stop() override { running_ = false; }

private:
    std::istream& input_;
    TriggerListener* listener_;
    std::string reset_command_;
    std::atomic<bool> running_{true};
};

} // namespace voice_os
