/**
 * Turn scheduler: single-flight, cancellable remote exchanges.
 * Asserts:
 * - A submission returns at once and runs to Completed.
 * - A new submission cancels the running one; only one task runs.
 * - Reset while running cancels; the late result never reaches history.
 * - Tool requests loop through the executor until the model stops asking.
 * - Failures surface as Failed plus a failure notification.
 *
 * Run from build dir: ./test_scheduler
 * The remote agent is an in-process fake.
 */

#include "memory/conversation_history.h"
#include "notification_sink.h"
#include "tool_executor.h"
#include "tool_registry.h"
#include "tools/app_control_tool.h"
#include "turn_scheduler.h"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace voice_os;
using namespace std::chrono_literals;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

/**
 * Replays scripted responses. When gated, each call blocks until release()
 * (or, if it honours the token, until cancelled).
 */
class ScriptedAgent : public RemoteAgent {
public:
    explicit ScriptedAgent(bool gated = false, bool honour_token = true)
        : gated_(gated), honour_token_(honour_token) {}

    void script(Result<Turn> response) {
        std::lock_guard<std::mutex> lock(mutex_);
        responses_.push_back(std::move(response));
    }

    void release() {
        std::lock_guard<std::mutex> lock(mutex_);
        releases_++;
        cv_.notify_all();
    }

    Result<Turn> send(const AgentRequest& request, const CancellationToken& token) override {
        std::unique_lock<std::mutex> lock(mutex_);
        requests_.push_back(request);
        cv_.notify_all();

        while (gated_) {
            if (honour_token_ && token.is_cancelled()) {
                returned_++;
                cv_.notify_all();
                return make_cancelled_error();
            }
            if (releases_ > 0) {
                releases_--;
                break;
            }
            cv_.wait_for(lock, 2ms);
        }

        Result<Turn> response = Turn::assistant("default answer");
        if (!responses_.empty()) {
            response = responses_.front();
            responses_.pop_front();
        }
        returned_++;
        cv_.notify_all();
        return response;
    }

    bool wait_for_calls(size_t n, std::chrono::milliseconds timeout = 2000ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return requests_.size() >= n; });
    }

    bool wait_for_returns(int n, std::chrono::milliseconds timeout = 2000ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return returned_ >= n; });
    }

    std::vector<AgentRequest> requests() {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    bool gated_;
    bool honour_token_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Result<Turn>> responses_;
    std::vector<AgentRequest> requests_;
    int releases_ = 0;
    int returned_ = 0;
};

class RecordingSink : public NotificationSink {
public:
    void progress(const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        progress_texts.push_back(text);
    }
    void tool_output(const ToolResultBlock& result) override {
        std::lock_guard<std::mutex> lock(mutex_);
        tool_results.push_back(result);
    }
    void completed() override { completed_count++; }
    void cancelled() override { cancelled_count++; }
    void failed(const std::string& reason) override {
        std::lock_guard<std::mutex> lock(mutex_);
        failures.push_back(reason);
    }

    std::vector<std::string> progress_texts;
    std::vector<ToolResultBlock> tool_results;
    std::vector<std::string> failures;
    std::atomic<int> completed_count{0};
    std::atomic<int> cancelled_count{0};

private:
    std::mutex mutex_;
};

class FakeApps : public AppController {
public:
    VoidResult launch_app(const std::string& name) override {
        std::lock_guard<std::mutex> lock(mutex_);
        launched.push_back(name);
        return VoidResult::ok_result();
    }
    VoidResult quit_app(const std::string&) override {
        return VoidResult::failure("exit status 1");
    }

    std::vector<std::string> launched;

private:
    std::mutex mutex_;
};

SchedulerConfig test_config() {
    SchedulerConfig config;
    config.model = "test-model";
    config.system_prompt = "Be brief.";
    config.max_tokens = 256;
    config.image_retention_limit = 3;
    config.max_iterations = 5;
    return config;
}

TurnScheduler::PrepareFn user_says(memory::ConversationHistory& history, const std::string& text) {
    return [&history, text]() {
        history.append_user(text);
        return history.snapshot_state();
    };
}

Turn tool_call(const std::string& id, const std::string& action, const std::string& app) {
    std::string input = "{\"action\":\"" + action + "\",\"app\":\"" + app + "\"}";
    return Turn(Role::Assistant, {TextBlock{"On it."}, ToolUseBlock{id, "app_control", input}});
}

} // anonymous namespace

int main() {
    // --- a simple exchange completes ---
    {
        memory::ConversationHistory history;
        auto agent = std::make_shared<ScriptedAgent>();
        agent->script(Turn::assistant("Hi there"));
        RecordingSink sink;
        TurnScheduler scheduler(test_config(), history, agent, nullptr, nullptr, sink);

        auto handle = scheduler.submit(user_says(history, "hello"));
        ASSERT(handle);
        ASSERT(handle->wait(2000ms));
        ASSERT(handle->state() == TaskState::Completed);
        ASSERT(scheduler.wait_idle(2000ms));
        ASSERT(!scheduler.current_handle());

        auto turns = history.snapshot();
        ASSERT(turns.size() == 2);
        ASSERT(turns[0].role() == Role::User && turns[0].text() == "hello");
        ASSERT(turns[1].role() == Role::Assistant && turns[1].text() == "Hi there");
        ASSERT(sink.progress_texts.size() == 1 && sink.progress_texts[0] == "Hi there");
        ASSERT(sink.completed_count == 1);
        ASSERT(sink.cancelled_count == 0);

        auto requests = agent->requests();
        ASSERT(requests.size() == 1);
        ASSERT(requests[0].model == "test-model");
        ASSERT(requests[0].system_prompt == "Be brief.");
        ASSERT(requests[0].max_tokens == 256);
        ASSERT(requests[0].turns.size() == 1);
        ASSERT(requests[0].tools_json.empty());

        // Cancelling a finished task changes nothing
        scheduler.cancel(handle);
        ASSERT(scheduler.wait_idle(2000ms));
        ASSERT(handle->state() == TaskState::Completed);
        ASSERT(sink.cancelled_count == 0);
    }

    // --- tool loop through the executor ---
    {
        memory::ConversationHistory history;
        auto apps = std::make_shared<FakeApps>();
        ToolRegistry registry;
        registry.register_tool(std::make_shared<AppControlTool>(apps));
        ToolExecutor executor(&registry, 2);

        auto agent = std::make_shared<ScriptedAgent>();
        agent->script(tool_call("toolu_1", "launch", "safari"));
        agent->script(Turn::assistant("Safari is open."));
        RecordingSink sink;
        TurnScheduler scheduler(test_config(), history, agent, &registry, &executor, sink);

        auto handle = scheduler.submit(user_says(history, "open safari please"));
        ASSERT(handle->wait(2000ms));
        ASSERT(handle->state() == TaskState::Completed);

        auto turns = history.snapshot();
        ASSERT(turns.size() == 4);
        ASSERT(turns[1].has_tool_use());
        ASSERT(turns[2].role() == Role::Tool);
        const auto* result = std::get_if<ToolResultBlock>(&turns[2].content()[0]);
        ASSERT(result && result->tool_use_id == "toolu_1" && !result->is_error());
        ASSERT(turns[3].text() == "Safari is open.");
        ASSERT(apps->launched.size() == 1 && apps->launched[0] == "safari");

        ASSERT(sink.tool_results.size() == 1);
        ASSERT(sink.progress_texts.size() == 2);

        auto requests = agent->requests();
        ASSERT(requests.size() == 2);
        ASSERT(requests[0].tools_json.find("app_control") != std::string::npos);
        ASSERT(requests[1].turns.size() == 3);
        ASSERT(requests[1].turns.back().role() == Role::Tool);

        scheduler.shutdown();
    }

    // --- a failing tool is reported back to the model, not fatal ---
    {
        memory::ConversationHistory history;
        auto apps = std::make_shared<FakeApps>();
        ToolRegistry registry;
        registry.register_tool(std::make_shared<AppControlTool>(apps));
        ToolExecutor executor(&registry, 1);

        auto agent = std::make_shared<ScriptedAgent>();
        agent->script(tool_call("toolu_q", "quit", "mail"));
        agent->script(Turn::assistant("I could not close Mail."));
        RecordingSink sink;
        TurnScheduler scheduler(test_config(), history, agent, &registry, &executor, sink);

        auto handle = scheduler.submit(user_says(history, "close mail"));
        ASSERT(handle->wait(2000ms));
        ASSERT(handle->state() == TaskState::Completed);
        ASSERT(sink.tool_results.size() == 1 && sink.tool_results[0].is_error());
        scheduler.shutdown();
    }

    // --- no executor: tool calls fail, loop bounded by max_iterations ---
    {
        memory::ConversationHistory history;
        auto agent = std::make_shared<ScriptedAgent>();
        for (int i = 0; i < 10; i++) {
            agent->script(tool_call("toolu_" + std::to_string(i), "launch", "x"));
        }
        RecordingSink sink;
        SchedulerConfig config = test_config();
        config.max_iterations = 2;
        TurnScheduler scheduler(config, history, agent, nullptr, nullptr, sink);

        auto handle = scheduler.submit(user_says(history, "loop forever"));
        ASSERT(handle->wait(2000ms));
        ASSERT(handle->state() == TaskState::Completed);
        ASSERT(agent->requests().size() == 2);
        ASSERT(sink.tool_results.size() == 1 && sink.tool_results[0].is_error());
        // user, request, results, request
        ASSERT(history.size() == 4);
    }

    // --- a new submission cancels the running one ---
    {
        memory::ConversationHistory history;
        auto agent = std::make_shared<ScriptedAgent>(true);
        agent->script(Turn::assistant("second answer"));
        RecordingSink sink;
        TurnScheduler scheduler(test_config(), history, agent, nullptr, nullptr, sink);

        auto first = scheduler.submit(user_says(history, "first"));
        ASSERT(agent->wait_for_calls(1));
        ASSERT(first->state() == TaskState::Running);
        ASSERT(scheduler.current_handle() == first);

        auto second = scheduler.submit(user_says(history, "second"));
        ASSERT(scheduler.current_handle() == second);
        ASSERT(first->wait(2000ms));
        ASSERT(first->state() == TaskState::Cancelled);
        ASSERT(agent->wait_for_calls(2));
        ASSERT(second->state() == TaskState::Running);
        ASSERT(scheduler.current_handle() == second);
        ASSERT(sink.cancelled_count == 1);

        agent->release();
        ASSERT(second->wait(2000ms));
        ASSERT(second->state() == TaskState::Completed);
        ASSERT(first->state() == TaskState::Cancelled);   // terminal states stick
        ASSERT(scheduler.wait_idle(2000ms));

        auto turns = history.snapshot();
        ASSERT(turns.size() == 3);
        ASSERT(turns[0].text() == "first");
        ASSERT(turns[1].text() == "second");
        ASSERT(turns[2].text() == "second answer");
        ASSERT(first->id() != second->id());
    }

    // --- reset while running: Cancelled, empty history, late result discarded ---
    {
        memory::ConversationHistory history;
        auto agent = std::make_shared<ScriptedAgent>(true, false);   // ignores the token
        agent->script(Turn::assistant("too late"));
        RecordingSink sink;
        TurnScheduler scheduler(test_config(), history, agent, nullptr, nullptr, sink);

        auto handle = scheduler.submit(user_says(history, "long question"));
        ASSERT(agent->wait_for_calls(1));
        scheduler.reset_history();
        ASSERT(handle->wait(2000ms));
        ASSERT(handle->state() == TaskState::Cancelled);
        ASSERT(handle->token().is_cancelled());
        ASSERT(scheduler.wait_idle(2000ms));
        ASSERT(history.empty());

        agent->release();
        ASSERT(agent->wait_for_returns(1));
        std::this_thread::sleep_for(50ms);
        ASSERT(scheduler.wait_idle(2000ms));
        ASSERT(history.empty());
        ASSERT(sink.completed_count == 0);
        ASSERT(sink.progress_texts.empty());
        ASSERT(sink.cancelled_count == 1);
    }

    // --- history cleared behind the scheduler's back: stale commit refused ---
    {
        memory::ConversationHistory history;
        auto agent = std::make_shared<ScriptedAgent>(true, false);
        RecordingSink sink;
        TurnScheduler scheduler(test_config(), history, agent, nullptr, nullptr, sink);

        auto handle = scheduler.submit(user_says(history, "question"));
        ASSERT(agent->wait_for_calls(1));
        history.reset();
        agent->release();
        ASSERT(handle->wait(2000ms));
        ASSERT(handle->state() == TaskState::Cancelled);
        ASSERT(history.empty());
    }

    // --- explicit cancel honours the token ---
    {
        memory::ConversationHistory history;
        auto agent = std::make_shared<ScriptedAgent>(true);
        RecordingSink sink;
        TurnScheduler scheduler(test_config(), history, agent, nullptr, nullptr, sink);

        auto handle = scheduler.submit(user_says(history, "question"));
        ASSERT(agent->wait_for_calls(1));
        scheduler.cancel(handle);
        ASSERT(handle->wait(2000ms));
        ASSERT(handle->state() == TaskState::Cancelled);
        ASSERT(agent->wait_for_returns(1));
        ASSERT(scheduler.wait_idle(2000ms));
        ASSERT(sink.cancelled_count == 1);
        ASSERT(history.size() == 1);   // the user turn stays
    }

    // --- remote failure ---
    {
        memory::ConversationHistory history;
        auto agent = std::make_shared<ScriptedAgent>();
        agent->script(make_network_error("HTTP 529: Overloaded"));
        RecordingSink sink;
        TurnScheduler scheduler(test_config(), history, agent, nullptr, nullptr, sink);

        auto handle = scheduler.submit(user_says(history, "hello"));
        ASSERT(handle->wait(2000ms));
        ASSERT(handle->state() == TaskState::Failed);
        ASSERT(handle->error().find("Overloaded") != std::string::npos);
        ASSERT(scheduler.wait_idle(2000ms));
        ASSERT(sink.failures.size() == 1);
        ASSERT(sink.completed_count == 0);
        ASSERT(history.size() == 1);

        // The scheduler stays usable after a failure
        auto again = scheduler.submit(user_says(history, "hello again"));
        ASSERT(again->wait(2000ms));
        ASSERT(again->state() == TaskState::Completed);
    }

    // --- requests carry only the most recent images ---
    {
        memory::ConversationHistory history;
        auto agent = std::make_shared<ScriptedAgent>();
        RecordingSink sink;
        TurnScheduler scheduler(test_config(), history, agent, nullptr, nullptr, sink);

        ToolResultBlock shots;
        shots.tool_use_id = "toolu_s";
        shots.output = "screenshots";
        shots.images.resize(5);
        history.append_user("look at the screen");
        ASSERT(history.append(Turn(Role::Assistant, {ToolUseBlock{"toolu_s", "screenshot", "{}"}}),
                              history.generation()));
        ASSERT(history.append(Turn::tool_results({shots}), history.generation()));

        auto handle = scheduler.submit(history.snapshot_state());
        ASSERT(handle->wait(2000ms));
        auto requests = agent->requests();
        ASSERT(requests.size() == 1);
        const auto* sent = std::get_if<ToolResultBlock>(&requests[0].turns[2].content()[0]);
        ASSERT(sent && sent->images.size() == 3);
        // Stored history keeps every image
        const auto* stored = std::get_if<ToolResultBlock>(&history.snapshot()[2].content()[0]);
        ASSERT(stored && stored->images.size() == 5);
    }

    // --- after shutdown, submissions are refused ---
    {
        memory::ConversationHistory history;
        auto agent = std::make_shared<ScriptedAgent>();
        RecordingSink sink;
        TurnScheduler scheduler(test_config(), history, agent, nullptr, nullptr, sink);
        scheduler.shutdown();
        auto handle = scheduler.submit(user_says(history, "anyone there"));
        ASSERT(handle->state() == TaskState::Cancelled);
        ASSERT(!scheduler.post([] {}));
        ASSERT(history.empty());
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All scheduler tests passed.\n";
    return 0;
}
