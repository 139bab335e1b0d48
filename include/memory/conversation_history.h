#pragma once

/**
 * @file conversation_history.h
 * @brief Ordered turn log shared by trigger threads and the turn scheduler
 *
 * Invariant: the log never ends in an assistant turn when a new user turn is
 * appended. An exchange interrupted between the model's tool request and the
 * matching tool results leaves such a turn behind; append_user() drops it.
 *
 * Every reset() bumps a generation counter. Writers that captured an older
 * generation (a task submitted before the reset) are refused, so their
 * results never land in the cleared history.
 */

#include "core/types.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace voice_os {
namespace memory {

/**
 * @brief Turns plus the generation they were read under
 */
struct HistorySnapshot {
    std::vector<Turn> turns;
    uint64_t generation = 0;
};

class ConversationHistory {
public:
    ConversationHistory();
    ~ConversationHistory();

    // Non-copyable
    ConversationHistory(const ConversationHistory&) = delete;
    ConversationHistory& operator=(const ConversationHistory&) = delete;

    // =========================================================================
    // Mutation
    // =========================================================================

    /**
     * @brief Append a user turn, first removing a trailing assistant turn
     * @param text Command text
     * @param note Fast-path note, added as a second text block
     */
    void append_user(const std::string& text,
                     const std::optional<std::string>& note = std::nullopt);

    /**
     * @brief Append a turn produced by a running exchange
     * @param generation Generation the exchange was submitted against
     * @return false (and nothing appended) if the history was reset since
     */
    bool append(Turn turn, uint64_t generation);

    /// Clear all turns and start a new generation
    void reset();

    // =========================================================================
    // Query
    // =========================================================================

    uint64_t generation() const;

    /// Copy of the current turns, in order
    std::vector<Turn> snapshot() const;

    /// Turns and generation read atomically
    HistorySnapshot snapshot_state() const;

    size_t size() const;
    bool empty() const;

    /// Role of the last turn, if any
    std::optional<Role> last_role() const;

    /// Compact JSON dump for logging (role, text, tool names)
    std::string to_json() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Keep only the `limit` most recent images inside tool results
 *
 * Returns rebuilt turns; stored turns are never modified. Older images are
 * dropped, their tool results keep text output and error.
 */
std::vector<Turn> retain_recent_images(const std::vector<Turn>& turns, size_t limit);

} // namespace memory
} // namespace voice_os
