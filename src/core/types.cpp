#include "core/types.h"

namespace voice_os {

const char* to_string(Role role) {
    switch (role) {
        case Role::User:      return "user";
        case Role::Assistant: return "assistant";
        case Role::Tool:      return "tool";
    }
    return "unknown";
}

Turn Turn::user(const std::string& text) {
    return Turn(Role::User, {TextBlock{text}});
}

Turn Turn::assistant(const std::string& text) {
    return Turn(Role::Assistant, {TextBlock{text}});
}

Turn Turn::tool_results(std::vector<ToolResultBlock> results) {
    std::vector<ContentBlock> content;
    content.reserve(results.size());
    for (auto& r : results) {
        content.emplace_back(std::move(r));
    }
    return Turn(Role::Tool, std::move(content));
}

std::vector<ToolUseBlock> Turn::tool_uses() const {
    std::vector<ToolUseBlock> uses;
    for (const auto& block : content_) {
        if (const auto* use = std::get_if<ToolUseBlock>(&block)) {
            uses.push_back(*use);
        }
    }
    return uses;
}

bool Turn::has_tool_use() const {
    for (const auto& block : content_) {
        if (std::holds_alternative<ToolUseBlock>(block)) {
            return true;
        }
    }
    return false;
}

std::string Turn::text() const {
    std::string joined;
    for (const auto& block : content_) {
        if (const auto* t = std::get_if<TextBlock>(&block)) {
            if (!joined.empty()) joined += " ";
            joined += t->text;
        }
    }
    return joined;
}

} // namespace voice_os
