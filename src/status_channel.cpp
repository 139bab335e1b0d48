#include "status_channel.h"

namespace voice_os {

const char* to_string(StatusEvent::Kind kind) {
    switch (kind) {
        case StatusEvent::Kind::Status:     return "status";
        case StatusEvent::Kind::Heard:      return "heard";
        case StatusEvent::Kind::Agent:      return "agent";
        case StatusEvent::Kind::ToolOutput: return "tool";
        case StatusEvent::Kind::Error:      return "error";
    }
    return "unknown";
}

void StatusChannel::post(StatusEvent::Kind kind, const std::string& text) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        events_.push_back(StatusEvent{kind, text});
    }
    cv_.notify_one();
}

std::optional<StatusEvent> StatusChannel::poll() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.empty()) return std::nullopt;
    StatusEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::optional<StatusEvent> StatusChannel::wait(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !events_.empty() || closed_; });
    if (events_.empty()) return std::nullopt;
    StatusEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

void StatusChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool StatusChannel::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

} // namespace voice_os
