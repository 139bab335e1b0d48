#include "speech/process_speaker.h"
#include "os/process_runner.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <mutex>

namespace voice_os {

class ProcessSpeaker::Impl {
public:
    explicit Impl(std::vector<std::string> command) : command_(std::move(command)) {
        uses_placeholder_ = std::any_of(command_.begin(), command_.end(),
            [](const std::string& arg) { return arg.find("{text}") != std::string::npos; });
        if (command_.empty()) {
            Logger::warn("[TTS] No speech command configured; speech disabled");
        }
    }

    void speak(const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex_);
        current_.terminate();

        std::string clean = utils::clean_for_speech(text);
        if (clean.empty() || command_.empty()) {
            return;
        }

        auto argv = uses_placeholder_ ? expand_argv(command_, "text", clean) : command_;
        auto child = ChildProcess::spawn(argv, uses_placeholder_ ? "" : clean + "\n");
        if (child.is_error()) {
            Logger::warn("[TTS] Failed to start speech: " + child.error().message);
            return;
        }
        current_ = std::move(child.value());
        LOG_TTS("Speaking (pid " + std::to_string(current_.pid()) + "): " + clean);
    }

    void stop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (current_.running()) {
            LOG_TTS("Stopping speech");
        }
        current_.terminate();
    }

    bool is_speaking() {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_.running();
    }

private:
    std::vector<std::string> command_;
    bool uses_placeholder_ = false;
    std::mutex mutex_;
    ChildProcess current_;
};

ProcessSpeaker::ProcessSpeaker(std::vector<std::string> command)
    : pimpl_(std::make_unique<Impl>(std::move(command))) {}

ProcessSpeaker::~ProcessSpeaker() = default;

void ProcessSpeaker::speak(const std::string& text) {
    pimpl_->speak(text);
}

void ProcessSpeaker::stop() {
    pimpl_->stop();
}

bool ProcessSpeaker::is_speaking() const {
    return pimpl_->is_speaking();
}

} // namespace voice_os
