#include "state_machine.h"
#include "logger.h"
#include <mutex>
#include <optional>

namespace voice_os {

const char* to_string(State state) {
    return state == State::Listening ? "Listening" : "Idle";
}

class StateMachine::Impl {
public:
    explicit Impl(Duration cooldown)
        : state_(State::Idle), cooldown_(cooldown) {}

    State get_state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    TriggerAction on_gesture(Gesture gesture, TimePoint now) {
        std::lock_guard<std::mutex> lock(mutex_);

        TriggerAction action = TriggerAction::None;
        State next = state_;
        switch (state_) {
            case State::Idle:
                if (gesture == Gesture::OpenPalm) {
                    action = TriggerAction::StartListening;
                    next = State::Listening;
                } else if (gesture == Gesture::Victory) {
                    action = TriggerAction::ResetHistory;
                }
                break;

            case State::Listening:
                if (gesture == Gesture::ClosedFist) {
                    action = TriggerAction::StopListening;
                    next = State::Idle;
                }
                break;
        }

        if (action == TriggerAction::None) {
            return action;
        }
        if (last_transition_ && now - *last_transition_ <= cooldown_) {
            return TriggerAction::None;
        }

        LOG_GESTURE(std::string(to_string(gesture)) + ": " + to_string(state_) + " -> " + to_string(next));
        state_ = next;
        last_transition_ = now;
        return action;
    }

    void on_capture_finished() {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = State::Idle;
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = State::Idle;
        last_transition_.reset();
    }

private:
    mutable std::mutex mutex_;
    State state_;
    Duration cooldown_;
    std::optional<TimePoint> last_transition_;
};

StateMachine::StateMachine(Duration cooldown) : pimpl_(std::make_unique<Impl>(cooldown)) {}
StateMachine::~StateMachine() = default;

State StateMachine::get_state() const {
    return pimpl_->get_state();
}

TriggerAction StateMachine::on_gesture(Gesture gesture, TimePoint now) {
    return pimpl_->on_gesture(gesture, now);
}

TriggerAction StateMachine::on_hand(const HandLandmarks& hand, TimePoint now) {
    return pimpl_->on_gesture(classify_gesture(hand), now);
}

void StateMachine::on_capture_finished() {
    pimpl_->on_capture_finished();
}

void StateMachine::reset() {
    pimpl_->reset();
}

} // namespace voice_os
