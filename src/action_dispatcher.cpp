#include "action_dispatcher.h"
#include "logger.h"
#include <algorithm>
#include <exception>

namespace voice_os {

void ActionDispatcher::register_plugin(std::shared_ptr<ActionPlugin> plugin) {
    plugins_.push_back(std::move(plugin));
    // Keep sorted by priority (lower = first)
    std::stable_sort(plugins_.begin(), plugins_.end(),
        [](const std::shared_ptr<ActionPlugin>& a, const std::shared_ptr<ActionPlugin>& b) {
            return a->priority() < b->priority();
        });
}

std::optional<FastPathOutcome> ActionDispatcher::dispatch(const std::string& command) {
    for (auto& plugin : plugins_) {
        try {
            auto outcome = plugin->try_handle(command);
            if (outcome) {
                LOG_FASTPATH("Plugin \"" + plugin->name() + "\" handled command");
                return outcome;
            }
        } catch (const std::exception& e) {
            LOG_WARN("[FastPath] Plugin \"" + plugin->name() + "\" threw: " + e.what());
        }
    }
    return std::nullopt;
}

} // namespace voice_os
