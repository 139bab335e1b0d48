#include "tool_executor.h"
#include "logger.h"
#include <chrono>

namespace voice_os {

ToolExecutor::ToolExecutor(ToolRegistry* registry, size_t max_concurrent)
    : registry_(registry), max_concurrent_(max_concurrent), running_(true), active_executions_(0) {
    
    // Start worker threads
    for (size_t i = 0; i < max_concurrent_; ++i) {
        worker_threads_.emplace_back(&ToolExecutor::worker_thread, this);
    }
}

ToolExecutor::~ToolExecutor() {
    shutdown();
    
    // Wait for all worker threads to finish
    for (auto& thread : worker_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

bool ToolExecutor::execute_async(const ToolExecutionRequest& call, 
                                 ToolExecutionCallback callback,
                                 int timeout_ms) {
    if (!running_) {
        Logger::warn("ToolExecutor is shutdown, cannot execute tool: " + call.tool_name);
        if (callback) {
            ToolExecutionResult result;
            result.tool_call_id = call.tool_call_id;
            result.result = ToolResult::error_result("Tool executor is shut down");
            callback(result);
        }
        return false;
    }
    
    if (!registry_ || !registry_->has_tool(call.tool_name)) {
        LOG_TOOL("Tool not found: " + call.tool_name);
        if (callback) {
            ToolExecutionResult result;
            result.tool_call_id = call.tool_call_id;
            result.result = ToolResult::error_result("Tool not found: " + call.tool_name);
            callback(result);
        }
        return false;
    }
    
    ExecutionTask task;
    task.call = call;
    task.callback = callback;
    task.timeout_ms = timeout_ms;
    task.start_time = std::chrono::steady_clock::now();
    
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        task_queue_.push(task);
    }
    
    queue_cv_.notify_one();
    return true;
}

void ToolExecutor::execute_batch(const std::vector<ToolExecutionRequest>& calls,
                                 ToolBatchCallback callback,
                                 int timeout_ms) {
    if (calls.empty()) {
        if (callback) callback({});
        return;
    }

    struct BatchState {
        std::mutex mutex;
        std::vector<ToolExecutionResult> results;
        size_t remaining;
        ToolBatchCallback callback;
    };
    auto state = std::make_shared<BatchState>();
    state->results.resize(calls.size());
    state->remaining = calls.size();
    state->callback = std::move(callback);

    for (size_t i = 0; i < calls.size(); ++i) {
        execute_async(calls[i], [state, i](const ToolExecutionResult& res) {
            bool done = false;
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                state->results[i] = res;
                done = --state->remaining == 0;
            }
            if (done && state->callback) {
                state->callback(std::move(state->results));
            }
        }, timeout_ms);
    }
}

bool ToolExecutor::is_idle() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return task_queue_.empty() && active_executions_ == 0;
}

bool ToolExecutor::wait_for_completion(int timeout_ms) {
    auto start = std::chrono::steady_clock::now();
    
    while (true) {
        if (is_idle()) {
            return true;
        }
        
        if (timeout_ms > 0) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start).count();
            if (elapsed >= timeout_ms) {
                return false;
            }
        }
        
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void ToolExecutor::shutdown() {
    running_ = false;
    queue_cv_.notify_all();
}

void ToolExecutor::worker_thread() {
    Logger::set_thread_name("tool");
    while (running_) {
        ExecutionTask task;
        
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { 
                return !task_queue_.empty() || !running_; 
            });
            
            if (!running_ && task_queue_.empty()) {
                break;
            }
            
            if (task_queue_.empty()) {
                continue;
            }
            
            task = task_queue_.front();
            task_queue_.pop();
            active_executions_++;
        }
        
        execute_tool_with_timeout(task);
        
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            active_executions_--;
        }
    }
}

void ToolExecutor::execute_tool_with_timeout(const ExecutionTask& task) {
    auto tool = registry_->get_tool(task.call.tool_name);
    if (!tool) {
        Logger::error("Tool not found during execution: " + task.call.tool_name);
        if (task.callback) {
            ToolExecutionResult result;
            result.tool_call_id = task.call.tool_call_id;
            result.result = ToolResult::error_result("Tool not found");
            task.callback(result);
        }
        return;
    }
    
    ToolExecutionResult result;
    result.tool_call_id = task.call.tool_call_id;
    
    // Check timeout before execution
    if (task.timeout_ms > 0) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - task.start_time).count();
        if (elapsed >= task.timeout_ms) {
            result.result = ToolResult::error_result("Tool execution timeout");
            if (task.callback) {
                task.callback(result);
            }
            return;
        }
    }
    
    LOG_TOOL("Executing " + task.call.tool_name + " (" + task.call.tool_call_id + ")");
    try {
        result.result = tool->execute(task.call.params_json);
    } catch (const std::exception& e) {
        Logger::error("Tool execution exception for " + task.call.tool_name + ": " + e.what());
        result.result = ToolResult::error_result("Tool execution exception: " + std::string(e.what()));
    } catch (...) {
        Logger::error("Unknown exception during tool execution: " + task.call.tool_name);
        result.result = ToolResult::error_result("Unknown tool execution error");
    }
    
    // Call callback
    if (task.callback) {
        task.callback(result);
    }
}

} // namespace voice_os
