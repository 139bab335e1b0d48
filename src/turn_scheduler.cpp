#include "turn_scheduler.h"
#include "logger.h"
#include <atomic>
#include <deque>
#include <exception>
#include <thread>
#include <vector>

namespace voice_os {

const char* to_string(TaskState state) {
    switch (state) {
        case TaskState::Pending:   return "Pending";
        case TaskState::Running:   return "Running";
        case TaskState::Completed: return "Completed";
        case TaskState::Cancelled: return "Cancelled";
        case TaskState::Failed:    return "Failed";
    }
    return "Unknown";
}

// =============================================================================
// TaskHandle
// =============================================================================

TaskState TaskHandle::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string TaskHandle::error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

bool TaskHandle::wait(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return voice_os::is_terminal(state_); });
}

bool TaskHandle::transition(TaskState next, const std::string& error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (voice_os::is_terminal(state_)) return false;
        if (next == TaskState::Running && state_ != TaskState::Pending) return false;
        state_ = next;
        error_ = error;
    }
    cv_.notify_all();
    return true;
}

// =============================================================================
// TurnScheduler
// =============================================================================

namespace {

/// Working state of one running exchange; touched only on the scheduler thread
struct Exchange {
    TaskHandlePtr handle;
    std::vector<Turn> turns;
    uint64_t generation = 0;
    int iteration = 0;
};

using ExchangePtr = std::shared_ptr<Exchange>;

struct CallThread {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
};

} // anonymous namespace

class TurnScheduler::Impl {
public:
    Impl(const SchedulerConfig& config,
         memory::ConversationHistory& history,
         std::shared_ptr<RemoteAgent> agent,
         ToolRegistry* tools,
         ToolExecutor* executor,
         NotificationSink& sink)
        : config_(config)
        , history_(history)
        , agent_(std::move(agent))
        , executor_(executor)
        , sink_(sink)
        , running_(true) {
        if (tools && tools->size() > 0) {
            tools_json_ = tools->get_tool_definitions_json();
        }
        loop_thread_ = std::thread(&Impl::run_loop, this);
        LOG_SCHED("Started (model=" + config_.model + ")");
    }

    ~Impl() {
        shutdown();
    }

    bool post(std::function<void()> fn) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_) return false;
            queue_.push_back(std::move(fn));
        }
        cv_.notify_one();
        return true;
    }

    TaskHandlePtr submit(PrepareFn prepare) {
        auto handle = std::make_shared<TaskHandle>(next_id_++);
        bool queued = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (running_) {
                queue_.push_back([this, handle, prepare]() { start(handle, prepare); });
                latest_ = handle;
                queued = true;
            }
        }
        if (queued) {
            cv_.notify_one();
        } else {
            handle->transition(TaskState::Cancelled);
        }
        return handle;
    }

    void cancel(const TaskHandlePtr& handle) {
        if (!handle) return;
        post([this, handle]() {
            std::unique_lock<std::mutex> lock(mutex_);
            ExchangePtr current = current_;
            lock.unlock();
            if (current && current->handle == handle) {
                cancel_exchange(current);
            } else if (handle->transition(TaskState::Cancelled)) {
                handle->request_cancel();
                LOG_SCHED("Task " + std::to_string(handle->id()) + " cancelled before start");
                sink_.cancelled();
            }
        });
    }

    TaskHandlePtr current_handle() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (latest_ && !latest_->is_terminal()) {
            return latest_;
        }
        return nullptr;
    }

    void reset_history() {
        post([this]() {
            std::unique_lock<std::mutex> lock(mutex_);
            ExchangePtr current = current_;
            lock.unlock();
            if (current) {
                cancel_exchange(current);
            }
            history_.reset();
        });
    }

    bool wait_idle(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return idle_cv_.wait_for(lock, timeout, [this] {
            return !running_ || (queue_.empty() && !executing_ && !current_);
        });
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopped_) return;
            running_ = false;
            stopped_ = true;
        }
        cv_.notify_all();
        idle_cv_.notify_all();
        if (loop_thread_.joinable()) {
            loop_thread_.join();
        }

        // The loop is gone: this thread now owns the bookkeeping
        if (current_) {
            current_->handle->request_cancel();
            current_->handle->transition(TaskState::Cancelled);
            current_.reset();
        }
        // Submitted but never started
        if (latest_ && latest_->transition(TaskState::Cancelled)) {
            latest_->request_cancel();
        }
        for (auto& call : calls_) {
            if (call.thread.joinable()) {
                call.thread.join();
            }
        }
        calls_.clear();
        LOG_SCHED("Stopped");
    }

private:
    void run_loop() {
        Logger::set_thread_name("scheduler");
        while (true) {
            std::function<void()> fn;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return !queue_.empty() || !running_; });
                if (!running_) break;
                fn = std::move(queue_.front());
                queue_.pop_front();
                executing_ = true;
            }

            try {
                fn();
            } catch (const std::exception& e) {
                LOG_ERROR("[Scheduler] Task step threw: " + std::string(e.what()));
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                executing_ = false;
            }
            idle_cv_.notify_all();
        }
    }

    void set_current(const ExchangePtr& exchange) {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = exchange;
    }

    void clear_current(const ExchangePtr& exchange) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (current_ == exchange) {
            current_.reset();
        }
    }

    void start(const TaskHandlePtr& handle, const PrepareFn& prepare) {
        std::unique_lock<std::mutex> lock(mutex_);
        ExchangePtr previous = current_;
        lock.unlock();
        if (previous) {
            LOG_SCHED("Task " + std::to_string(previous->handle->id()) + " superseded by task " +
                      std::to_string(handle->id()));
            cancel_exchange(previous);
        }

        if (handle->is_terminal()) {
            return;
        }

        memory::HistorySnapshot snapshot = prepare ? prepare() : history_.snapshot_state();

        auto exchange = std::make_shared<Exchange>();
        exchange->handle = handle;
        exchange->turns = std::move(snapshot.turns);
        exchange->generation = snapshot.generation;

        set_current(exchange);
        handle->transition(TaskState::Running);
        LOG_SCHED("Task " + std::to_string(handle->id()) + " running (" +
                  std::to_string(exchange->turns.size()) + " turns)");
        request_model(exchange);
    }

    void cancel_exchange(const ExchangePtr& exchange) {
        clear_current(exchange);
        if (exchange->handle->transition(TaskState::Cancelled)) {
            exchange->handle->request_cancel();
            LOG_SCHED("Task " + std::to_string(exchange->handle->id()) + " cancelled");
            sink_.cancelled();
        }
    }

    void finish(const ExchangePtr& exchange, TaskState state, const std::string& error = "") {
        clear_current(exchange);
        if (exchange->handle->transition(state, error)) {
            LOG_SCHED("Task " + std::to_string(exchange->handle->id()) + " " + to_string(state));
            if (state == TaskState::Completed) {
                sink_.completed();
            } else if (state == TaskState::Failed) {
                sink_.failed(error);
            }
        }
    }

    void request_model(const ExchangePtr& exchange) {
        AgentRequest request;
        request.model = config_.model;
        request.system_prompt = config_.system_prompt;
        request.turns = memory::retain_recent_images(exchange->turns, config_.image_retention_limit);
        request.tools_json = tools_json_;
        request.max_tokens = config_.max_tokens;
        exchange->iteration++;

        std::shared_ptr<RemoteAgent> agent = agent_;
        spawn_call([this, agent, exchange, request]() {
            auto result = std::make_shared<Result<Turn>>(make_error(ErrorType::Unknown, "no response"));
            try {
                *result = agent->send(request, exchange->handle->token());
            } catch (const std::exception& e) {
                *result = make_error(ErrorType::Unknown, e.what());
            }
            post([this, exchange, result]() { on_model_response(exchange, *result); });
        });
    }

    void on_model_response(const ExchangePtr& exchange, const Result<Turn>& result) {
        if (exchange->handle->is_terminal()) {
            LOG_SCHED("Discarding response for task " + std::to_string(exchange->handle->id()));
            return;
        }
        if (result.is_error()) {
            if (result.error().is_cancelled()) {
                cancel_exchange(exchange);
            } else {
                finish(exchange, TaskState::Failed, result.error().message);
            }
            return;
        }

        const Turn& turn = result.value();
        if (!history_.append(turn, exchange->generation)) {
            cancel_exchange(exchange);
            return;
        }
        exchange->turns.push_back(turn);

        for (const auto& block : turn.content()) {
            if (const auto* text = std::get_if<TextBlock>(&block)) {
                if (!text->text.empty()) {
                    sink_.progress(text->text);
                }
            }
        }

        std::vector<ToolUseBlock> uses = turn.tool_uses();
        if (uses.empty()) {
            finish(exchange, TaskState::Completed);
            return;
        }
        if (exchange->iteration >= config_.max_iterations) {
            Logger::warn("[Scheduler] Task " + std::to_string(exchange->handle->id()) +
                         " reached " + std::to_string(config_.max_iterations) + " iterations; stopping");
            finish(exchange, TaskState::Completed);
            return;
        }
        run_tools(exchange, uses);
    }

    void run_tools(const ExchangePtr& exchange, const std::vector<ToolUseBlock>& uses) {
        if (!executor_) {
            std::vector<ToolExecutionResult> results;
            for (const auto& use : uses) {
                ToolExecutionResult r;
                r.tool_call_id = use.id;
                r.result = ToolResult::error_result("Tool not available: " + use.name);
                results.push_back(r);
            }
            on_tool_results(exchange, results);
            return;
        }

        std::vector<ToolExecutionRequest> calls;
        calls.reserve(uses.size());
        for (const auto& use : uses) {
            calls.push_back(ToolExecutionRequest{use.name, use.id, use.input_json});
        }
        executor_->execute_batch(calls, [this, exchange](std::vector<ToolExecutionResult> results) {
            auto shared = std::make_shared<std::vector<ToolExecutionResult>>(std::move(results));
            post([this, exchange, shared]() { on_tool_results(exchange, *shared); });
        }, config_.tool_timeout_ms);
    }

    void on_tool_results(const ExchangePtr& exchange, const std::vector<ToolExecutionResult>& results) {
        if (exchange->handle->is_terminal()) {
            LOG_SCHED("Discarding tool results for task " + std::to_string(exchange->handle->id()));
            return;
        }

        std::vector<ToolResultBlock> blocks;
        blocks.reserve(results.size());
        for (const auto& r : results) {
            ToolResultBlock block;
            block.tool_use_id = r.tool_call_id;
            if (r.result.success) {
                block.output = r.result.content;
            } else {
                block.error = r.result.error.empty() ? "Tool failed" : r.result.error;
            }
            block.images = r.result.images;
            sink_.tool_output(block);
            blocks.push_back(std::move(block));
        }

        Turn turn = Turn::tool_results(std::move(blocks));
        if (!history_.append(turn, exchange->generation)) {
            cancel_exchange(exchange);
            return;
        }
        exchange->turns.push_back(std::move(turn));
        request_model(exchange);
    }

    /// Run fn on its own thread; finished threads are joined here and at shutdown
    void spawn_call(std::function<void()> fn) {
        for (auto it = calls_.begin(); it != calls_.end();) {
            if (it->done->load()) {
                it->thread.join();
                it = calls_.erase(it);
            } else {
                ++it;
            }
        }
        auto done = std::make_shared<std::atomic<bool>>(false);
        std::thread thread([fn, done]() {
            Logger::set_thread_name("agent");
            fn();
            done->store(true);
        });
        calls_.push_back(CallThread{std::move(thread), done});
    }

    SchedulerConfig config_;
    memory::ConversationHistory& history_;
    std::shared_ptr<RemoteAgent> agent_;
    ToolExecutor* executor_;
    NotificationSink& sink_;
    std::string tools_json_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<std::function<void()>> queue_;
    bool running_;
    bool stopped_ = false;
    bool executing_ = false;
    ExchangePtr current_;
    TaskHandlePtr latest_;   // last submitted, set in submit order

    std::atomic<uint64_t> next_id_{1};
    std::vector<CallThread> calls_;   // scheduler thread only
    std::thread loop_thread_;
};

TurnScheduler::TurnScheduler(const SchedulerConfig& config,
                             memory::ConversationHistory& history,
                             std::shared_ptr<RemoteAgent> agent,
                             ToolRegistry* tools,
                             ToolExecutor* executor,
                             NotificationSink& sink)
    : pimpl_(std::make_unique<Impl>(config, history, std::move(agent), tools, executor, sink)) {}

TurnScheduler::~TurnScheduler() = default;

TaskHandlePtr TurnScheduler::submit(PrepareFn prepare) {
    return pimpl_->submit(std::move(prepare));
}

TaskHandlePtr TurnScheduler::submit(memory::HistorySnapshot snapshot) {
    auto shared = std::make_shared<memory::HistorySnapshot>(std::move(snapshot));
    return pimpl_->submit([shared]() { return *shared; });
}

void TurnScheduler::cancel(const TaskHandlePtr& handle) {
    pimpl_->cancel(handle);
}

TaskHandlePtr TurnScheduler::current_handle() const {
    return pimpl_->current_handle();
}

void TurnScheduler::reset_history() {
    pimpl_->reset_history();
}

bool TurnScheduler::post(std::function<void()> fn) {
    return pimpl_->post(std::move(fn));
}

bool TurnScheduler::wait_idle(std::chrono::milliseconds timeout) {
    return pimpl_->wait_idle(timeout);
}

void TurnScheduler::shutdown() {
    pimpl_->shutdown();
}

} // namespace voice_os
