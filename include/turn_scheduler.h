#pragma once

/**
 * @file turn_scheduler.h
 * @brief Single-flight, cancellable executor for remote exchanges
 *
 * One event-loop thread owns all task bookkeeping. Callers on any thread
 * submit or cancel by posting onto that loop. Blocking work never runs on
 * it: model requests run on short-lived call threads and tools run in the
 * ToolExecutor; both post their completions back.
 *
 * Task lifecycle: Pending -> Running -> {Completed | Cancelled | Failed}.
 * A new submission cancels the current task first (fire-and-forget), so at
 * most one task is Running. A cancelled task is marked Cancelled as soon as
 * the loop handles the request; whatever its blocking call returns later is
 * discarded.
 */

#include "cancellation.h"
#include "memory/conversation_history.h"
#include "notification_sink.h"
#include "remote_agent.h"
#include "tool_executor.h"
#include "tool_registry.h"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace voice_os {

enum class TaskState {
    Pending,
    Running,
    Completed,
    Cancelled,
    Failed
};

const char* to_string(TaskState state);

inline bool is_terminal(TaskState state) {
    return state == TaskState::Completed || state == TaskState::Cancelled || state == TaskState::Failed;
}

/**
 * @brief One submitted remote exchange
 *
 * State is written only by the scheduler thread; callers observe it.
 */
class TaskHandle {
public:
    explicit TaskHandle(uint64_t id) : id_(id) {}

    uint64_t id() const { return id_; }
    TaskState state() const;
    bool is_terminal() const { return voice_os::is_terminal(state()); }

    /// Failure reason (Failed only)
    std::string error() const;

    /// Block until the task reaches a terminal state; false on timeout
    bool wait(std::chrono::milliseconds timeout) const;

    const CancellationToken& token() const { return token_; }

    // Scheduler side

    /// Returns false when the transition is not allowed (already terminal)
    bool transition(TaskState next, const std::string& error = "");
    void request_cancel() { token_.cancel(); }

private:
    const uint64_t id_;
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    TaskState state_ = TaskState::Pending;
    std::string error_;
    CancellationToken token_;
};

using TaskHandlePtr = std::shared_ptr<TaskHandle>;

struct SchedulerConfig {
    std::string model;
    std::string system_prompt;       ///< Base prompt with suffix already applied
    int max_tokens = 1024;
    size_t image_retention_limit = 3;
    int max_iterations = 10;
    int tool_timeout_ms = 0;
};

class TurnScheduler {
public:
    /// Runs on the scheduler thread; appends the user turn and returns the snapshot to run against
    using PrepareFn = std::function<memory::HistorySnapshot()>;

    /**
     * @param tools Tool definitions offered to the model (may be null)
     * @param executor Runs requested tools (may be null: every tool call fails)
     * @param sink Lifecycle notifications, called on the scheduler thread
     *
     * The executor must outlive the scheduler, or be destroyed after shutdown().
     */
    TurnScheduler(const SchedulerConfig& config,
                  memory::ConversationHistory& history,
                  std::shared_ptr<RemoteAgent> agent,
                  ToolRegistry* tools,
                  ToolExecutor* executor,
                  NotificationSink& sink);
    ~TurnScheduler();

    // Non-copyable
    TurnScheduler(const TurnScheduler&) = delete;
    TurnScheduler& operator=(const TurnScheduler&) = delete;

    /**
     * @brief Submit an exchange; returns immediately with a Pending handle
     *
     * On the scheduler thread: cancel the current task, call prepare(), start.
     */
    TaskHandlePtr submit(PrepareFn prepare);

    /// Submit against an already-taken snapshot
    TaskHandlePtr submit(memory::HistorySnapshot snapshot);

    /// Request cancellation; no effect once the task is terminal
    void cancel(const TaskHandlePtr& handle);

    /// Most recently submitted task, or null once it is terminal. A handle
    /// counts from the moment submit() returns, even before the loop starts it.
    TaskHandlePtr current_handle() const;

    /// Cancel the current task and clear the history, on the scheduler thread
    void reset_history();

    /// Run fn on the scheduler thread. Returns false after shutdown().
    bool post(std::function<void()> fn);

    /// Wait until nothing is queued or running; false on timeout
    bool wait_idle(std::chrono::milliseconds timeout);

    /// Stop the loop, cancel the current task and join call threads
    void shutdown();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace voice_os
