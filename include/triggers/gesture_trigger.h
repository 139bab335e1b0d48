#pragma once

#include "speech/speech_input.h"
#include "state_machine.h"
#include "trigger_source.h"
#include "vision/landmark_source.h"
#include <atomic>
#include <memory>

namespace voice_os {

/**
 * @brief Open palm starts a capture, closed fist ends it, victory resets
 *
 * Landmark frames are fed through the trigger state machine. Entering
 * Listening starts capture_until_stopped() on a capture thread; the stop
 * gesture signals it and the transcript becomes the command. Frames keep
 * being classified while the capture runs.
 */
class GestureTrigger : public TriggerSource {
public:
    GestureTrigger(LandmarkSource& landmarks, SpeechInput& speech,
                   TriggerListener* listener, Duration cooldown);
    ~GestureTrigger() override;

    // Non-copyable
    GestureTrigger(const GestureTrigger&) = delete;
    GestureTrigger& operator=(const GestureTrigger&) = delete;

    const char* name() const override { return "gesture"; }
    std::optional<Command> produce() override;
    void stop() override;

    State state() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace voice_os
