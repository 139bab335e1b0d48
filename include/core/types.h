#pragma once

/**
 * @file types.h
 * @brief Core type definitions for the conversation side of voice-os
 *
 * Turns and their content blocks are the currency between the history store,
 * the turn scheduler and the remote agent. Keeping them in one place keeps the
 * wire encoding and the invariants consistent.
 */

#include <cstdint>
#include <vector>
#include <string>
#include <chrono>
#include <optional>
#include <variant>
#include <utility>

namespace voice_os {

// =============================================================================
// Timing Types
// =============================================================================

using Clock = std::chrono::steady_clock;

/// Get current timestamp in milliseconds (for logging)
inline int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now().time_since_epoch()).count();
}

// =============================================================================
// Result Types
// =============================================================================

/// Void result for operations that don't return a value
struct VoidResult {
    bool success;
    std::string error;

    bool ok() const { return success; }
    bool failed() const { return !ok(); }

    static VoidResult ok_result() { return {true, ""}; }
    static VoidResult failure(std::string err) { return {false, std::move(err)}; }
};

// =============================================================================
// Conversation Types
// =============================================================================

/// Conversation roles
enum class Role {
    User,
    Assistant,
    Tool
};

const char* to_string(Role role);

/// Plain text
struct TextBlock {
    std::string text;
};

/// Base64 encoded image (screenshots returned by tools)
struct ImageBlock {
    std::string media_type = "image/png";
    std::string base64_data;
};

/// The remote agent asks for a tool to be run
struct ToolUseBlock {
    std::string id;
    std::string name;
    std::string input_json;  ///< Arguments as a JSON object string
};

/// Outcome of one tool invocation, paired with a ToolUseBlock by id
struct ToolResultBlock {
    std::string tool_use_id;
    std::string output;
    std::string error;
    std::vector<ImageBlock> images;

    bool is_error() const { return !error.empty(); }
};

using ContentBlock = std::variant<TextBlock, ToolUseBlock, ToolResultBlock, ImageBlock>;

/**
 * @brief One role-tagged entry of the conversation.
 *
 * A Turn has no mutators: history only ever appends or removes whole turns.
 */
class Turn {
public:
    Turn(Role role, std::vector<ContentBlock> content)
        : role_(role), content_(std::move(content)), timestamp_ms_(now_ms()) {}

    static Turn user(const std::string& text);
    static Turn assistant(const std::string& text);
    static Turn tool_results(std::vector<ToolResultBlock> results);

    Role role() const { return role_; }
    const std::vector<ContentBlock>& content() const { return content_; }
    int64_t timestamp_ms() const { return timestamp_ms_; }

    /// Tool invocation requests carried by this turn, in order
    std::vector<ToolUseBlock> tool_uses() const;

    bool has_tool_use() const;

    /// All text blocks joined with a single space
    std::string text() const;

private:
    Role role_;
    std::vector<ContentBlock> content_;
    int64_t timestamp_ms_;
};

} // namespace voice_os
