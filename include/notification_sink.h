#pragma once

#include "core/types.h"
#include "speech/speech_output.h"
#include "status_channel.h"
#include <string>

namespace voice_os {

/**
 * @brief Consumer of remote exchange lifecycle events
 *
 * Called only from the turn scheduler thread; implementations must not block.
 */
class NotificationSink {
public:
    virtual ~NotificationSink() = default;

    /// Text produced by the remote agent while the exchange runs
    virtual void progress(const std::string& text) = 0;

    /// A tool finished (success or error)
    virtual void tool_output(const ToolResultBlock& result) { (void)result; }

    virtual void completed() = 0;

    /// The exchange was interrupted by a newer command or a reset
    virtual void cancelled() = 0;

    virtual void failed(const std::string& reason) = 0;
};

/**
 * @brief Turns lifecycle events into speech and status updates
 *
 * Every spoken notification preempts the previous one.
 */
class SpeechNotifier : public NotificationSink {
public:
    /// @param status May be null when there is no presentation layer
    SpeechNotifier(SpeechOutput& speech, StatusChannel* status);

    void progress(const std::string& text) override;
    void tool_output(const ToolResultBlock& result) override;
    void completed() override;
    void cancelled() override;
    void failed(const std::string& reason) override;

    static constexpr const char* CANCELLED_PHRASE = "Busy";
    static constexpr const char* FAILED_PHRASE = "Sorry, something went wrong.";

private:
    void post(StatusEvent::Kind kind, const std::string& text);

    SpeechOutput& speech_;
    StatusChannel* status_;
};

} // namespace voice_os
