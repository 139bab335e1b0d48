#pragma once

#include "core/types.h"
#include <string>
#include <vector>

namespace voice_os {

/**
 * @brief OS action boundary: launch and gracefully quit applications by name
 *
 * Success means only that the helper command exited with status 0; nothing
 * checks that the application actually started or stopped.
 */
class AppController {
public:
    virtual ~AppController() = default;

    virtual VoidResult launch_app(const std::string& name) = 0;
    virtual VoidResult quit_app(const std::string& name) = 0;
};

/**
 * @brief AppController that runs configurable helper commands
 *
 * Each template is an argv vector; "{app}" is replaced by the app name.
 */
class CommandAppController : public AppController {
public:
    CommandAppController(std::vector<std::string> launch_command,
                         std::vector<std::string> quit_command);

    VoidResult launch_app(const std::string& name) override;
    VoidResult quit_app(const std::string& name) override;

private:
    VoidResult run(const std::vector<std::string>& argv_template, const std::string& name);

    std::vector<std::string> launch_command_;
    std::vector<std::string> quit_command_;
};

} // namespace voice_os
