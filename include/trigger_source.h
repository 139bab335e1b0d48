#pragma once

#include "common.h"
#include <optional>

namespace voice_os {

/**
 * @brief Side effects a trigger asks of the orchestrator besides producing commands
 *
 * Called on the trigger's own thread.
 */
class TriggerListener {
public:
    virtual ~TriggerListener() = default;

    /// A capture is about to begin; returns once the microphone may open
    virtual void on_listening_started() {}

    /// The user asked to clear the conversation
    virtual void on_reset_requested() {}
};

/**
 * @brief One input modality (gesture, wake word, typed text)
 *
 * produce() runs on a thread dedicated to the source and blocks until the
 * next command. std::nullopt means the source is finished: its input ended,
 * stop() was called, or its device failed.
 */
class TriggerSource {
public:
    virtual ~TriggerSource() = default;

    virtual const char* name() const = 0;
    virtual std::optional<Command> produce() = 0;

    /// Ask produce() to return; may take effect only after the current blocking read
    virtual void stop() = 0;
};

} // namespace voice_os
