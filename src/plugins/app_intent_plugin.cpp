#include "plugins/app_intent_plugin.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <stdexcept>

namespace voice_os {

AppIntentPlugin::AppIntentPlugin(std::shared_ptr<AppController> controller,
                                 int max_app_tokens,
                                 std::vector<std::string> conjunction_markers)
    : controller_(std::move(controller))
    , max_app_tokens_(max_app_tokens)
    , conjunction_markers_(std::move(conjunction_markers))
    , open_pattern_("^(?:open|launch|start)\\s+(?:the\\s+)?(.+)$")
    , close_pattern_("^(?:close|quit|exit|terminate|kill)\\s+(?:the\\s+)?(.+)$") {
    if (!controller_) {
        throw std::runtime_error("AppIntentPlugin requires an AppController");
    }
    for (auto& marker : conjunction_markers_) {
        utils::normalize(marker);
    }
}

bool AppIntentPlugin::accept_name(const std::string& cleaned) const {
    auto words = utils::split_words(cleaned);
    if (words.empty() || static_cast<int>(words.size()) > max_app_tokens_) {
        return false;
    }
    for (const auto& word : words) {
        if (std::find(conjunction_markers_.begin(), conjunction_markers_.end(), word) !=
            conjunction_markers_.end()) {
            return false;
        }
    }
    return true;
}

std::optional<AppIntentPlugin::Intent> AppIntentPlugin::parse(const std::string& command) const {
    std::smatch match;
    Intent::Kind kind;
    if (std::regex_match(command, match, open_pattern_)) {
        kind = Intent::Kind::Open;
    } else if (std::regex_match(command, match, close_pattern_)) {
        kind = Intent::Kind::Close;
    } else {
        return std::nullopt;
    }

    std::string cleaned = utils::clean_app_name(match[1].str());
    if (!accept_name(cleaned)) {
        LOG_FASTPATH("Rejected app name \"" + cleaned + "\"");
        return std::nullopt;
    }
    return Intent{kind, cleaned};
}

std::optional<FastPathOutcome> AppIntentPlugin::try_handle(const std::string& command) {
    auto intent = parse(command);
    if (!intent) {
        return std::nullopt;
    }

    const bool open = intent->kind == Intent::Kind::Open;
    VoidResult result = open ? controller_->launch_app(intent->app)
                             : controller_->quit_app(intent->app);
    if (result.failed()) {
        LOG_FASTPATH(std::string(open ? "Launch" : "Quit") + " of '" + intent->app +
                     "' failed: " + result.error);
        return std::nullopt;
    }

    LOG_FASTPATH(std::string(open ? "Opened '" : "Closed '") + intent->app + "'");
    FastPathOutcome outcome;
    if (open) {
        outcome.note = "System note: the application '" + intent->app +
                       "' has already been opened by a local command. Do not open it again; "
                       "continue with any remaining steps.";
    } else {
        outcome.note = "System note: the application '" + intent->app +
                       "' has already been closed by a local command. Do not close it again.";
    }
    return outcome;
}

} // namespace voice_os
