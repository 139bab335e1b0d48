#include "os/app_controller.h"
#include "os/process_runner.h"
#include "logger.h"

namespace voice_os {

CommandAppController::CommandAppController(std::vector<std::string> launch_command,
                                           std::vector<std::string> quit_command)
    : launch_command_(std::move(launch_command)), quit_command_(std::move(quit_command)) {}

VoidResult CommandAppController::launch_app(const std::string& name) {
    return run(launch_command_, name);
}

VoidResult CommandAppController::quit_app(const std::string& name) {
    return run(quit_command_, name);
}

VoidResult CommandAppController::run(const std::vector<std::string>& argv_template,
                                     const std::string& name) {
    if (argv_template.empty()) {
        return VoidResult::failure("no command configured");
    }
    auto argv = expand_argv(argv_template, "app", name);
    auto result = run_process(argv);
    if (result.is_error()) {
        return VoidResult::failure(result.error().message);
    }
    if (result.value() != 0) {
        return VoidResult::failure(argv[0] + " exited with status " + std::to_string(result.value()));
    }
    return VoidResult::ok_result();
}

} // namespace voice_os
