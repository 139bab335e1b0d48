#pragma once

#include "action_plugin.h"
#include "os/app_controller.h"
#include <memory>
#include <regex>
#include <string>
#include <vector>

namespace voice_os {

/// Handles "open|launch|start [the] <app>" and
/// "close|quit|exit|terminate|kill [the] <app>" locally.
///
/// The captured name is stripped of punctuation and rejected when it has more
/// than max_app_tokens words or contains a conjunction marker, so compound
/// instructions go to the remote agent instead.
class AppIntentPlugin : public ActionPlugin {
public:
    AppIntentPlugin(std::shared_ptr<AppController> controller,
                    int max_app_tokens,
                    std::vector<std::string> conjunction_markers);

    std::string name() const override { return "app_intent"; }
    std::optional<FastPathOutcome> try_handle(const std::string& command) override;
    int priority() const override { return 10; }

    /// Intent parsed from a command, exposed for logging and tests
    struct Intent {
        enum class Kind { Open, Close } kind;
        std::string app;
    };

    /// Parse without executing. std::nullopt when no pattern matches or the guard rejects.
    std::optional<Intent> parse(const std::string& command) const;

private:
    bool accept_name(const std::string& cleaned) const;

    std::shared_ptr<AppController> controller_;
    int max_app_tokens_;
    std::vector<std::string> conjunction_markers_;
    std::regex open_pattern_;
    std::regex close_pattern_;
};

} // namespace voice_os
