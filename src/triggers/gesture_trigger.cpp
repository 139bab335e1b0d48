#include "triggers/gesture_trigger.h"
#include "logger.h"
#include <thread>

namespace voice_os {

class GestureTrigger::Impl {
public:
    Impl(LandmarkSource& landmarks, SpeechInput& speech, TriggerListener* listener, Duration cooldown)
        : landmarks_(landmarks), speech_(speech), listener_(listener), machine_(cooldown) {}

    ~Impl() {
        abandon_capture();
    }

    std::optional<Command> produce() {
        while (running_) {
            auto frame = landmarks_.next_frame();
            if (!frame) {
                abandon_capture();
                return std::nullopt;
            }

            TimePoint now = std::chrono::steady_clock::now();
            for (const auto& hand : *frame) {
                TriggerAction action = machine_.on_hand(hand, now);
                if (action == TriggerAction::None) {
                    continue;
                }

                std::optional<Command> command = handle(action);
                if (command) {
                    return command;
                }
                break;   // one transition per frame
            }
        }
        abandon_capture();
        return std::nullopt;
    }

    void stop() {
        running_ = false;
        capture_stop_ = true;
    }

    State state() const {
        return machine_.get_state();
    }

private:
    std::optional<Command> handle(TriggerAction action) {
        switch (action) {
            case TriggerAction::StartListening:
                LOG_GESTURE("Open palm: listening");
                if (listener_) {
                    listener_->on_listening_started();
                }
                start_capture();
                return std::nullopt;

            case TriggerAction::StopListening: {
                LOG_GESTURE("Closed fist: capture finished");
                std::string text = finish_capture();
                machine_.on_capture_finished();
                if (text.empty()) {
                    LOG_GESTURE("Nothing heard");
                    return std::nullopt;
                }
                return Command(text, CommandSource::Gesture);
            }

            case TriggerAction::ResetHistory:
                LOG_GESTURE("Victory: reset");
                if (listener_) {
                    listener_->on_reset_requested();
                }
                return std::nullopt;

            case TriggerAction::None:
                break;
        }
        return std::nullopt;
    }

    void start_capture() {
        abandon_capture();
        capture_stop_ = false;
        capture_result_ = std::string();
        capture_thread_ = std::thread([this]() {
            Logger::set_thread_name("capture");
            capture_result_ = speech_.capture_until_stopped(capture_stop_);
        });
    }

    std::string finish_capture() {
        if (!capture_thread_.joinable()) {
            return "";
        }
        capture_stop_ = true;
        capture_thread_.join();
        if (capture_result_.is_error()) {
            Logger::error("[Gesture] Capture failed: " + capture_result_.error().message);
            return "";
        }
        return capture_result_.value();
    }

    void abandon_capture() {
        if (capture_thread_.joinable()) {
            capture_stop_ = true;
            capture_thread_.join();
        }
    }

    LandmarkSource& landmarks_;
    SpeechInput& speech_;
    TriggerListener* listener_;
    StateMachine machine_;
    std::atomic<bool> running_{true};

    std::thread capture_thread_;
    std::atomic<bool> capture_stop_{false};
    Result<std::string> capture_result_{std::string()};   // written by the capture thread, read after join
};

GestureTrigger::GestureTrigger(LandmarkSource& landmarks, SpeechInput& speech,
                               TriggerListener* listener, Duration cooldown)
    : pimpl_(std::make_unique<Impl>(landmarks, speech, listener, cooldown)) {}

GestureTrigger::~GestureTrigger() = default;

std::optional<Command> GestureTrigger::produce() {
    return pimpl_->produce();
}

void GestureTrigger::stop() {
    pimpl_->stop();
}

State GestureTrigger::state() const {
    return pimpl_->state();
}

} // namespace voice_os
