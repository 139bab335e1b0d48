/**
 * @file conversation_history.cpp
 * @brief Conversation history implementation
 */

#include "memory/conversation_history.h"
#include "logger.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstddef>
#include <mutex>

using json = nlohmann::json;

namespace voice_os {
namespace memory {

class ConversationHistory::Impl {
public:
    void append_user(const std::string& text, const std::optional<std::string>& note) {
        std::vector<ContentBlock> content;
        content.emplace_back(TextBlock{text});
        if (note && !note->empty()) {
            content.emplace_back(TextBlock{"\n\n(" + *note + ")"});
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (!turns_.empty() && turns_.back().role() == Role::Assistant) {
            LOG_HISTORY("Pruning interrupted assistant turn");
            turns_.pop_back();
        }
        turns_.emplace_back(Role::User, std::move(content));
        LOG_HISTORY("User turn appended (" + std::to_string(turns_.size()) + " turns)");
    }

    bool append(Turn turn, uint64_t generation) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            LOG_HISTORY("Discarding " + std::string(to_string(turn.role())) +
                        " turn from generation " + std::to_string(generation));
            return false;
        }
        turns_.push_back(std::move(turn));
        return true;
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        turns_.clear();
        ++generation_;
        LOG_HISTORY("History cleared (generation " + std::to_string(generation_) + ")");
    }

    uint64_t generation() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return generation_;
    }

    std::vector<Turn> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return turns_;
    }

    HistorySnapshot snapshot_state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return HistorySnapshot{turns_, generation_};
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return turns_.size();
    }

    std::optional<Role> last_role() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (turns_.empty()) return std::nullopt;
        return turns_.back().role();
    }

    std::string to_json() const {
        json turns_json = json::array();
        for (const auto& turn : snapshot()) {
            turns_json.push_back(turn_to_json(turn));
        }
        return turns_json.dump();
    }

private:
    static json turn_to_json(const Turn& turn) {
        json j;
        j["role"] = to_string(turn.role());
        std::string text = turn.text();
        if (!text.empty()) {
            j["text"] = text;
        }
        for (const auto& use : turn.tool_uses()) {
            j["tool_uses"].push_back(use.name);
        }
        size_t results = 0;
        for (const auto& block : turn.content()) {
            if (std::holds_alternative<ToolResultBlock>(block)) ++results;
        }
        if (results > 0) {
            j["tool_results"] = results;
        }
        return j;
    }

    mutable std::mutex mutex_;
    std::vector<Turn> turns_;
    uint64_t generation_ = 0;
};

// =============================================================================
// Public Interface
// =============================================================================

ConversationHistory::ConversationHistory() : impl_(std::make_unique<Impl>()) {}

ConversationHistory::~ConversationHistory() = default;

void ConversationHistory::append_user(const std::string& text,
                                      const std::optional<std::string>& note) {
    impl_->append_user(text, note);
}

bool ConversationHistory::append(Turn turn, uint64_t generation) {
    return impl_->append(std::move(turn), generation);
}

void ConversationHistory::reset() {
    impl_->reset();
}

uint64_t ConversationHistory::generation() const {
    return impl_->generation();
}

std::vector<Turn> ConversationHistory::snapshot() const {
    return impl_->snapshot();
}

HistorySnapshot ConversationHistory::snapshot_state() const {
    return impl_->snapshot_state();
}

size_t ConversationHistory::size() const {
    return impl_->size();
}

bool ConversationHistory::empty() const {
    return impl_->size() == 0;
}

std::optional<Role> ConversationHistory::last_role() const {
    return impl_->last_role();
}

std::string ConversationHistory::to_json() const {
    return impl_->to_json();
}

// =============================================================================
// Image retention
// =============================================================================

std::vector<Turn> retain_recent_images(const std::vector<Turn>& turns, size_t limit) {
    size_t total = 0;
    for (const auto& turn : turns) {
        for (const auto& block : turn.content()) {
            if (const auto* result = std::get_if<ToolResultBlock>(&block)) {
                total += result->images.size();
            }
        }
    }
    if (total <= limit) {
        return turns;
    }

    // Oldest images go first
    size_t to_drop = total - limit;
    std::vector<Turn> filtered;
    filtered.reserve(turns.size());
    for (const auto& turn : turns) {
        if (to_drop == 0) {
            filtered.push_back(turn);
            continue;
        }
        std::vector<ContentBlock> content;
        content.reserve(turn.content().size());
        for (const auto& block : turn.content()) {
            const auto* result = std::get_if<ToolResultBlock>(&block);
            if (!result || result->images.empty() || to_drop == 0) {
                content.push_back(block);
                continue;
            }
            ToolResultBlock trimmed = *result;
            size_t drop_here = std::min(to_drop, trimmed.images.size());
            trimmed.images.erase(trimmed.images.begin(),
                                 trimmed.images.begin() + static_cast<std::ptrdiff_t>(drop_here));
            to_drop -= drop_here;
            content.emplace_back(std::move(trimmed));
        }
        filtered.emplace_back(turn.role(), std::move(content));
    }
    return filtered;
}

} // namespace memory
} // namespace voice_os
