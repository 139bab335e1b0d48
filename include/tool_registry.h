#pragma once

#include "tool.h"
#include <string>
#include <vector>
#include <memory>
#include <map>

namespace voice_os {

/**
 * @brief Central registry for all available tools
 *
 * Manages tool registration, lookup, and provides tool definitions in the
 * Messages API format (name, description, input_schema).
 */
class ToolRegistry {
public:
    /**
     * @brief Register a tool with the registry
     * @return true if registration successful, false if tool with same name already exists
     */
    bool register_tool(std::shared_ptr<Tool> tool);

    /**
     * @brief Get a tool by name
     * @return Shared pointer to tool, or nullptr if not found
     */
    std::shared_ptr<Tool> get_tool(const std::string& name) const;

    std::vector<std::string> get_tool_names() const;

    /**
     * @brief Get tool definitions for the remote agent
     * @return JSON array of {name, description, input_schema}
     */
    std::string get_tool_definitions_json() const;

    bool has_tool(const std::string& name) const;

    size_t size() const { return tools_.size(); }

    void clear();

private:
    std::map<std::string, std::shared_ptr<Tool>> tools_;
};

} // namespace voice_os
