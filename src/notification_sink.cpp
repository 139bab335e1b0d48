#include "notification_sink.h"
#include "logger.h"

namespace voice_os {

SpeechNotifier::SpeechNotifier(SpeechOutput& speech, StatusChannel* status)
    : speech_(speech), status_(status) {}

void SpeechNotifier::post(StatusEvent::Kind kind, const std::string& text) {
    if (status_) {
        status_->post(kind, text);
    }
}

void SpeechNotifier::progress(const std::string& text) {
    LOG_AGENT("Agent: " + text);
    post(StatusEvent::Kind::Agent, text);
    speech_.speak(text);
}

void SpeechNotifier::tool_output(const ToolResultBlock& result) {
    std::string summary;
    if (result.is_error()) {
        summary = "error: " + result.error;
    } else {
        summary = result.output.size() > 200 ? result.output.substr(0, 200) + "..." : result.output;
    }
    if (!result.images.empty()) {
        summary += " [" + std::to_string(result.images.size()) + " image(s)]";
    }
    LOG_TOOL("Output " + result.tool_use_id + ": " + summary);
    post(StatusEvent::Kind::ToolOutput, summary);
}

void SpeechNotifier::completed() {
    post(StatusEvent::Kind::Status, "Ready");
}

void SpeechNotifier::cancelled() {
    post(StatusEvent::Kind::Status, "Interrupted");
    speech_.speak(CANCELLED_PHRASE);
}

void SpeechNotifier::failed(const std::string& reason) {
    LOG_ERROR("[Agent] Exchange failed: " + reason);
    post(StatusEvent::Kind::Error, reason);
    speech_.speak(FAILED_PHRASE);
}

} // namespace voice_os
