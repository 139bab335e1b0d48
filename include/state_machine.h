#pragma once

#include "common.h"
#include "gesture.h"
#include <memory>

namespace voice_os {

/**
 * @brief Trigger state enumeration
 */
enum class State {
    Idle,       ///< Waiting for a start or reset gesture
    Listening   ///< Microphone capture in progress, waiting for the stop gesture
};

const char* to_string(State state);

/**
 * @brief Side effect requested by an accepted transition
 */
enum class TriggerAction {
    None,
    StartListening,
    StopListening,
    ResetHistory
};

/**
 * @brief Gesture state machine with cooldown debounce
 *
 * - Idle -> Listening (open palm)
 * - Listening -> Idle (closed fist)
 * - Idle -> Idle (victory; reset history and cancel the current task)
 *
 * A transition is accepted only when more than the cooldown has elapsed since
 * the last accepted one. There is no multi-frame hysteresis: one qualifying
 * frame is enough. Thread-safe.
 */
class StateMachine {
public:
    explicit StateMachine(Duration cooldown = std::chrono::milliseconds(2000));
    ~StateMachine();

    /**
     * @brief Get current state
     */
    State get_state() const;

    /**
     * @brief Feed one classified frame
     * @param gesture Gesture detected in the frame
     * @param now Frame timestamp
     * @return The action to perform, TriggerAction::None when ignored
     */
    TriggerAction on_gesture(Gesture gesture, TimePoint now);

    /// Convenience: classify and feed
    TriggerAction on_hand(const HandLandmarks& hand, TimePoint now);

    /**
     * @brief Capture ended on its own (no speech, device failure); return to Idle
     *
     * Does not touch the cooldown.
     */
    void on_capture_finished();

    /**
     * @brief Reset to Idle and forget the last transition time
     */
    void reset();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace voice_os
