#pragma once

#include "tool.h"
#include "os/app_controller.h"
#include <memory>
#include <string>

namespace voice_os {

/**
 * @brief Lets the remote agent launch or quit applications
 *
 * Goes through the same AppController as the fast path.
 */
class AppControlTool : public Tool {
public:
    explicit AppControlTool(std::shared_ptr<AppController> controller);

    std::string name() const override { return "app_control"; }

    std::string description() const override {
        return "Launch or gracefully quit a desktop application by name. "
               "Use action \"launch\" to open an app and \"quit\" to close it.";
    }

    std::string parameter_schema() const override;

    ToolResult execute(const std::string& params_json) override;

private:
    std::shared_ptr<AppController> controller_;
};

} // namespace voice_os
