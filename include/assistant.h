#pragma once

#include "config.h"
#include "common.h"
#include "memory/conversation_history.h"
#include "os/app_controller.h"
#include "remote_agent.h"
#include "speech/speech_output.h"
#include "status_channel.h"
#include "trigger_source.h"
#include "turn_scheduler.h"
#include <memory>
#include <vector>

namespace voice_os {

/**
 * @brief Collaborators the assistant drives but does not implement
 */
struct AssistantParts {
    std::shared_ptr<RemoteAgent> agent;
    std::shared_ptr<AppController> apps;
    std::shared_ptr<SpeechOutput> speech;
    StatusChannel* status = nullptr;   ///< Optional presentation channel
};

/**
 * @brief Command orchestrator
 *
 * Owns the conversation history, the fast-path dispatcher, the tool system
 * and the turn scheduler, and turns commands from any trigger source into
 * either a local action or a remote exchange.
 *
 * Thread Safety:
 * - handle_command() and reset() may be called from any trigger thread
 * - Notifications are delivered on the scheduler thread
 */
class Assistant : public TriggerListener {
public:
    static constexpr const char* LISTENING_PHRASE = "Listening";
    static constexpr const char* PROCESSING_PHRASE = "Processing";
    static constexpr const char* DONE_PHRASE = "Done";
    static constexpr const char* RESET_PHRASE = "History reset";

    /// Prompt suffix used by the gesture entry point when the config leaves it empty
    static constexpr const char* GESTURE_PROMPT_SUFFIX =
        "User is using a gesture-controlled voice assistant. Be EXTREMELY concise. Max 1 sentence.";

    /// @throws std::runtime_error if a required part is missing
    Assistant(const Config& config, AssistantParts parts);
    ~Assistant() override;

    // Non-copyable
    Assistant(const Assistant&) = delete;
    Assistant& operator=(const Assistant&) = delete;

    /**
     * @brief Process one command
     * @return The submitted remote task, or null when nothing was submitted
     *         (empty transcript, or a short-circuited fast path)
     */
    TaskHandlePtr handle_command(const Command& command);

    /// Cancel the current task and clear the conversation
    void reset();

    void on_listening_started() override;
    void on_reset_requested() override;

    /**
     * @brief Run each source on its own thread until all have finished or shutdown()
     * @return Exit code (0 for success)
     */
    int run(const std::vector<TriggerSource*>& sources);

    /// Request shutdown (thread-safe)
    void shutdown();

    bool wait_idle(std::chrono::milliseconds timeout);

    TaskHandlePtr current_task() const;
    const memory::ConversationHistory& history() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace voice_os
