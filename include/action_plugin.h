#pragma once

#include <optional>
#include <string>

namespace voice_os {

/**
 * @brief Result of a fast-path action that actually ran.
 *
 * The note tells a subsequently invoked remote agent what was already done so
 * it does not repeat it.
 */
struct FastPathOutcome {
    std::optional<std::string> note;
};

/// Local command handler consulted before the remote agent.
/// Each plugin matches normalized command text and may execute an OS action.
class ActionPlugin {
public:
    virtual ~ActionPlugin() = default;

    /// Plugin name for logging (e.g. "app_intent")
    virtual std::string name() const = 0;

    /// Test if this plugin handles the given command and run it.
    /// Called with normalized text (lowercase, leading punctuation stripped).
    /// Returns an outcome only when the action ran successfully; any miss or
    /// failure returns std::nullopt so the command falls through.
    virtual std::optional<FastPathOutcome> try_handle(const std::string& command) = 0;

    /// Priority (lower = checked first).
    virtual int priority() const { return 100; }
};

} // namespace voice_os
