#pragma once

#include "core/types.h"
#include <string>
#include <vector>

namespace voice_os {

/**
 * @brief Result structure for tool execution
 */
struct ToolResult {
    bool success = false;
    std::string content;              // Result text for the remote agent
    std::string error;                // Error message if failed
    std::vector<ImageBlock> images;   // Screenshots and other images

    static ToolResult success_result(const std::string& content) {
        ToolResult result;
        result.success = true;
        result.content = content;
        return result;
    }

    static ToolResult error_result(const std::string& error_msg) {
        ToolResult result;
        result.success = false;
        result.error = error_msg;
        return result;
    }
};

/**
 * @brief Abstract base class for all tools
 *
 * Tools are callable functions the remote agent can invoke to act on the
 * machine. Each tool must provide:
 * - A unique name
 * - A clear description (for the model)
 * - A JSON schema for parameters
 * - An execute method that performs the tool's action
 *
 * execute() runs on a ToolExecutor worker thread and may block.
 */
class Tool {
public:
    virtual ~Tool() = default;

    /**
     * @brief Get the tool's unique name
     * @return Tool name (e.g., "app_control")
     */
    virtual std::string name() const = 0;

    /**
     * @brief Get the tool's description for the model
     */
    virtual std::string description() const = 0;

    /**
     * @brief Get the JSON schema for tool parameters
     * @return JSON schema string describing the tool's parameters
     */
    virtual std::string parameter_schema() const = 0;

    /**
     * @brief Execute the tool with given parameters
     * @param params_json JSON string containing tool parameters
     * @return ToolResult with success status and result content or error
     */
    virtual ToolResult execute(const std::string& params_json) = 0;
};

} // namespace voice_os
