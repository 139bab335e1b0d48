#include "assistant.h"
#include "action_dispatcher.h"
#include "logger.h"
#include "notification_sink.h"
#include "plugins/app_intent_plugin.h"
#include "tool_executor.h"
#include "tool_registry.h"
#include "tools/app_control_tool.h"
#include "utils.h"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace voice_os {

namespace {

SchedulerConfig make_scheduler_config(const Config& config) {
    SchedulerConfig sc;
    sc.model = config.agent.model;
    sc.system_prompt = config.agent.system_prompt;
    if (!config.agent.system_prompt_suffix.empty()) {
        sc.system_prompt += "\n\n" + config.agent.system_prompt_suffix;
    }
    sc.max_tokens = config.agent.max_tokens;
    sc.image_retention_limit = static_cast<size_t>(std::max(0, config.agent.image_retention_limit));
    sc.max_iterations = config.agent.max_iterations;
    sc.tool_timeout_ms = config.tools.timeout_ms;
    return sc;
}

} // anonymous namespace

class Assistant::Impl {
public:
    Impl(const Config& config, AssistantParts parts)
        : config_(config), parts_(std::move(parts)) {
        if (!parts_.agent || !parts_.apps || !parts_.speech) {
            throw std::runtime_error("Assistant requires a remote agent, an app controller and a speech output");
        }

        if (config_.fast_path.enabled) {
            dispatcher_.register_plugin(std::make_shared<AppIntentPlugin>(
                parts_.apps, config_.fast_path.max_app_tokens, config_.fast_path.conjunction_markers));
        }

        for (const auto& tool_name : config_.tools.enabled) {
            if (tool_name == "app_control") {
                tool_registry_.register_tool(std::make_shared<AppControlTool>(parts_.apps));
            } else {
                Logger::warn("Unknown tool name in config: " + tool_name);
            }
        }
        Logger::info("Tool system initialized with " + std::to_string(tool_registry_.size()) + " tools");

        notifier_ = std::make_unique<SpeechNotifier>(*parts_.speech, parts_.status);
        tool_executor_ = std::make_unique<ToolExecutor>(&tool_registry_, config_.tools.max_concurrent);
        scheduler_ = std::make_unique<TurnScheduler>(make_scheduler_config(config_), history_, parts_.agent,
                                                     &tool_registry_, tool_executor_.get(), *notifier_);
    }

    ~Impl() {
        shutdown();
        // Tool workers may still post into the scheduler; it goes last
        scheduler_->shutdown();
        tool_executor_.reset();
        scheduler_.reset();
        join_sources();
    }

    TaskHandlePtr handle_command(const Command& command) {
        std::string text = utils::strip_echo_prefix(command.text, config_.trigger.echo_prefix);
        text = utils::trim_copy(utils::strip_leading_punctuation(text));
        if (text.empty()) {
            LOG_VOICE(std::string("Empty command from ") + to_string(command.source) + ", ignoring");
            return nullptr;
        }

        LOG_VOICE(std::string("Command (") + to_string(command.source) + "): \"" + text + "\"");
        post_status(StatusEvent::Kind::Heard, text);
        post_status(StatusEvent::Kind::Status, PROCESSING_PHRASE);
        parts_.speech->speak(PROCESSING_PHRASE);

        std::optional<std::string> note;
        auto outcome = dispatcher_.dispatch(utils::normalize_command(text));
        if (outcome && outcome->note) {
            if (config_.fast_path.short_circuit) {
                LOG_FASTPATH("Handled locally: " + *outcome->note);
                post_status(StatusEvent::Kind::Status, DONE_PHRASE);
                parts_.speech->speak(DONE_PHRASE);
                return nullptr;
            }
            note = outcome->note;
        }

        memory::ConversationHistory& history = history_;
        return scheduler_->submit([&history, text, note]() {
            history.append_user(text, note);
            return history.snapshot_state();
        });
    }

    void reset() {
        LOG_INFO("Resetting conversation");
        scheduler_->reset_history();
        post_status(StatusEvent::Kind::Status, RESET_PHRASE);
        parts_.speech->speak(RESET_PHRASE);
    }

    void on_listening_started() {
        parts_.speech->stop();
        post_status(StatusEvent::Kind::Status, LISTENING_PHRASE);
        parts_.speech->speak(LISTENING_PHRASE);
        std::this_thread::sleep_for(std::chrono::milliseconds(config_.trigger.listen_prompt_delay_ms));
    }

    int run(const std::vector<TriggerSource*>& sources) {
        if (sources.empty()) {
            Logger::error("No trigger sources configured");
            return 1;
        }

        Logger::info("=== voice-os started ===");
        {
            std::lock_guard<std::mutex> lock(run_mutex_);
            sources_ = sources;
            active_sources_ = sources.size();
        }
        for (TriggerSource* source : sources) {
            source_threads_.emplace_back([this, source]() { source_loop(source); });
        }

        {
            std::unique_lock<std::mutex> lock(run_mutex_);
            run_cv_.wait(lock, [this] { return active_sources_ == 0 || shutdown_requested_; });
        }

        if (!shutdown_requested_) {
            // Inputs are exhausted: let the last exchange finish
            LOG_INFO("All trigger sources finished, waiting for the current task");
            scheduler_->wait_idle(std::chrono::hours(1));
        }
        shutdown();
        join_sources();
        Logger::info("=== voice-os stopped ===");
        return 0;
    }

    void shutdown() {
        std::lock_guard<std::mutex> lock(run_mutex_);
        if (shutdown_requested_) return;
        shutdown_requested_ = true;
        for (TriggerSource* source : sources_) {
            source->stop();
        }
        run_cv_.notify_all();
    }

    bool wait_idle(std::chrono::milliseconds timeout) {
        return scheduler_->wait_idle(timeout);
    }

    TaskHandlePtr current_task() const {
        return scheduler_->current_handle();
    }

    const memory::ConversationHistory& history() const {
        return history_;
    }

private:
    void source_loop(TriggerSource* source) {
        Logger::set_thread_name(source->name());
        LOG_INFO(std::string("Trigger source started: ") + source->name());
        while (!shutdown_requested_) {
            auto command = source->produce();
            if (!command) break;
            if (shutdown_requested_) break;
            handle_command(*command);
        }
        LOG_INFO(std::string("Trigger source finished: ") + source->name());

        std::lock_guard<std::mutex> lock(run_mutex_);
        active_sources_--;
        run_cv_.notify_all();
    }

    void join_sources() {
        size_t still_active;
        {
            std::lock_guard<std::mutex> lock(run_mutex_);
            still_active = active_sources_;
        }
        for (auto& thread : source_threads_) {
            if (!thread.joinable()) continue;
            if (shutdown_requested_ && still_active > 0) {
                // A source blocked on a read it cannot interrupt (stdin)
                thread.detach();
            } else {
                thread.join();
            }
        }
        source_threads_.clear();
    }

    void post_status(StatusEvent::Kind kind, const std::string& text) {
        if (parts_.status) {
            parts_.status->post(kind, text);
        }
    }

    Config config_;
    AssistantParts parts_;

    memory::ConversationHistory history_;
    ActionDispatcher dispatcher_;
    ToolRegistry tool_registry_;
    std::unique_ptr<SpeechNotifier> notifier_;
    std::unique_ptr<ToolExecutor> tool_executor_;
    std::unique_ptr<TurnScheduler> scheduler_;

    std::mutex run_mutex_;
    std::condition_variable run_cv_;
    std::vector<TriggerSource*> sources_;
    size_t active_sources_ = 0;
    std::atomic<bool> shutdown_requested_{false};
    std::vector<std::thread> source_threads_;
};

Assistant::Assistant(const Config& config, AssistantParts parts)
    : pimpl_(std::make_unique<Impl>(config, std::move(parts))) {}

Assistant::~Assistant() = default;

TaskHandlePtr Assistant::handle_command(const Command& command) {
    return pimpl_->handle_command(command);
}

void Assistant::reset() {
    pimpl_->reset();
}

void Assistant::on_listening_started() {
    pimpl_->on_listening_started();
}

void Assistant::on_reset_requested() {
    pimpl_->reset();
}

int Assistant::run(const std::vector<TriggerSource*>& sources) {
    return pimpl_->run(sources);
}

void Assistant::shutdown() {
    pimpl_->shutdown();
}

bool Assistant::wait_idle(std::chrono::milliseconds timeout) {
    return pimpl_->wait_idle(timeout);
}

TaskHandlePtr Assistant::current_task() const {
    return pimpl_->current_task();
}

const memory::ConversationHistory& Assistant::history() const {
    return pimpl_->history();
}

} // namespace voice_os
