#pragma once

#include "action_plugin.h"
#include <memory>
#include <vector>

namespace voice_os {

/// Owns registered plugins and dispatches commands to the first matching one.
class ActionDispatcher {
public:
    /// Register a plugin. Plugins are sorted by priority (lower = checked first).
    void register_plugin(std::shared_ptr<ActionPlugin> plugin);

    /// Try all plugins in priority order. Never fails: errors surface as std::nullopt.
    std::optional<FastPathOutcome> dispatch(const std::string& command);

    const std::vector<std::shared_ptr<ActionPlugin>>& plugins() const { return plugins_; }

    size_t size() const { return plugins_.size(); }

private:
    std::vector<std::shared_ptr<ActionPlugin>> plugins_;
};

} // namespace voice_os
