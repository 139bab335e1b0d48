#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace voice_os {

/**
 * @brief Status update for the presentation layer
 */
struct StatusEvent {
    enum class Kind {
        Status,      ///< Short state label ("Listening", "Processing", "Ready")
        Heard,       ///< Accepted command text
        Agent,       ///< Text produced by the remote agent
        ToolOutput,  ///< Summary of a tool result
        Error        ///< Failure description
    };

    Kind kind;
    std::string text;
};

const char* to_string(StatusEvent::Kind kind);

/**
 * @brief Message channel from worker contexts into the presentation layer
 *
 * Any thread may post; the presentation loop receives. Nothing in the
 * presentation layer is ever called from a foreign thread.
 */
class StatusChannel {
public:
    void post(StatusEvent::Kind kind, const std::string& text);

    /// Non-blocking receive
    std::optional<StatusEvent> poll();

    /// Blocking receive; std::nullopt on timeout, or once closed and drained
    std::optional<StatusEvent> wait(std::chrono::milliseconds timeout);

    /// Wake all receivers; later posts are dropped
    void close();
    bool closed() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<StatusEvent> events_;
    bool closed_ = false;
};

} // namespace voice_os
