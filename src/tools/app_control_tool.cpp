#include "tools/app_control_tool.h"
#include "logger.h"
#include "utils.h"
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace voice_os {

AppControlTool::AppControlTool(std::shared_ptr<AppController> controller)
    : controller_(std::move(controller)) {
    if (!controller_) {
        throw std::runtime_error("AppControlTool requires an AppController");
    }
}

std::string AppControlTool::parameter_schema() const {
    json schema;
    schema["type"] = "object";
    schema["properties"]["action"] = json::object({
        {"type", "string"},
        {"enum", json::array({"launch", "quit"})},
        {"description", "Whether to open or close the application"}
    });
    schema["properties"]["app"] = json::object({
        {"type", "string"},
        {"description", "Application name, e.g. \"Safari\" or \"firefox\""}
    });
    schema["required"] = json::array({"action", "app"});
    return schema.dump();
}

ToolResult AppControlTool::execute(const std::string& params_json) {
    json params;
    try {
        params = json::parse(params_json);
    } catch (const json::exception& e) {
        return ToolResult::error_result(std::string("Invalid parameters: ") + e.what());
    }

    if (!params.contains("action") || !params["action"].is_string()) {
        return ToolResult::error_result("Missing or invalid 'action' parameter");
    }
    if (!params.contains("app") || !params["app"].is_string() ||
        params["app"].get<std::string>().empty()) {
        return ToolResult::error_result("Missing or invalid 'app' parameter");
    }

    std::string action = params["action"].get<std::string>();
    std::string app = utils::clean_app_name(params["app"].get<std::string>());
    if (app.empty()) {
        return ToolResult::error_result("Missing or invalid 'app' parameter");
    }

    if (action != "launch" && action != "quit") {
        return ToolResult::error_result("Unknown action: " + action);
    }

    VoidResult result = action == "launch" ? controller_->launch_app(app)
                                           : controller_->quit_app(app);

    if (result.failed()) {
        LOG_TOOL("app_control " + action + " " + app + " failed: " + result.error);
        return ToolResult::error_result("Could not " + action + " " + app + ": " + result.error);
    }
    return ToolResult::success_result(action == "launch" ? "Launched " + app : "Quit " + app);
}

} // namespace voice_os
