/**
 * Conversation history store.
 * Asserts:
 * - append_user removes a trailing assistant turn before appending.
 * - Turns from before a reset are refused.
 * - Only the most recent tool-result images are kept in a request.
 *
 * Run from build dir: ./test_history
 */

#include "memory/conversation_history.h"
#include <iostream>
#include <string>

using namespace voice_os;
using namespace voice_os::memory;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

Turn tool_request(const std::string& id) {
    return Turn(Role::Assistant, {TextBlock{"Let me check."}, ToolUseBlock{id, "app_control", "{}"}});
}

ToolResultBlock result_with_images(const std::string& id, int images) {
    ToolResultBlock block;
    block.tool_use_id = id;
    block.output = "ok";
    for (int i = 0; i < images; i++) {
        ImageBlock image;
        image.base64_data = id + "-" + std::to_string(i);
        block.images.push_back(image);
    }
    return block;
}

size_t count_images(const std::vector<Turn>& turns) {
    size_t n = 0;
    for (const auto& turn : turns) {
        for (const auto& block : turn.content()) {
            if (const auto* r = std::get_if<ToolResultBlock>(&block)) n += r->images.size();
        }
    }
    return n;
}

} // anonymous namespace

int main() {
    // --- append_user on empty history ---
    {
        ConversationHistory history;
        ASSERT(history.empty());
        ASSERT(!history.last_role());
        history.append_user("hello");
        ASSERT(history.size() == 1);
        ASSERT(history.last_role() == Role::User);
        ASSERT(history.snapshot()[0].text() == "hello");
    }

    // --- a dangling tool request is removed before the next user turn ---
    {
        ConversationHistory history;
        history.append_user("open my mail and summarize it");
        uint64_t gen = history.generation();
        ASSERT(history.append(tool_request("toolu_1"), gen));
        ASSERT(history.last_role() == Role::Assistant);

        history.append_user("never mind");
        auto turns = history.snapshot();
        ASSERT(turns.size() == 2);
        ASSERT(turns.back().role() == Role::User);
        ASSERT(turns.back().text() == "never mind");
        for (const auto& turn : turns) {
            ASSERT(!turn.has_tool_use());
        }
    }

    // --- a resolved exchange keeps its tool turns; a final answer is replaced ---
    {
        ConversationHistory history;
        history.append_user("open safari");
        uint64_t gen = history.generation();
        ASSERT(history.append(tool_request("toolu_1"), gen));
        ASSERT(history.append(Turn::tool_results({result_with_images("toolu_1", 0)}), gen));
        ASSERT(history.append(Turn::assistant("Safari is open."), gen));
        ASSERT(history.size() == 4);

        history.append_user("thanks");
        auto turns = history.snapshot();
        ASSERT(turns.size() == 4);
        ASSERT(turns[1].has_tool_use());
        ASSERT(turns[2].role() == Role::Tool);
        ASSERT(turns[3].role() == Role::User);
    }

    // --- the fast-path note rides along as a second text block ---
    {
        ConversationHistory history;
        history.append_user("open safari and search for cats", std::string("Opened safari"));
        auto turn = history.snapshot().back();
        ASSERT(turn.content().size() == 2);
        const auto* note = std::get_if<TextBlock>(&turn.content()[1]);
        ASSERT(note && note->text == "\n\n(Opened safari)");

        history.append_user("again", std::string());
        ASSERT(history.snapshot().back().content().size() == 1);
    }

    // --- reset clears and refuses stale appends ---
    {
        ConversationHistory history;
        history.append_user("first");
        auto before = history.snapshot_state();
        ASSERT(before.turns.size() == 1);

        history.reset();
        ASSERT(history.empty());
        ASSERT(history.generation() == before.generation + 1);

        ASSERT(!history.append(Turn::assistant("late answer"), before.generation));
        ASSERT(history.empty());

        history.append_user("second");
        ASSERT(history.append(Turn::assistant("fresh answer"), history.generation()));
        ASSERT(history.size() == 2);
    }

    // --- snapshots are independent copies ---
    {
        ConversationHistory history;
        history.append_user("one");
        auto snap = history.snapshot();
        history.append_user("two");
        ASSERT(snap.size() == 1);
        ASSERT(history.size() == 2);
    }

    // --- compact dump for logs ---
    {
        ConversationHistory history;
        history.append_user("open safari");
        ASSERT(history.append(tool_request("toolu_9"), history.generation()));
        std::string dump = history.to_json();
        ASSERT(dump.find("\"user\"") != std::string::npos);
        ASSERT(dump.find("app_control") != std::string::npos);
    }

    // --- image retention ---
    {
        std::vector<Turn> turns;
        turns.push_back(Turn::user("take screenshots"));
        turns.push_back(tool_request("a"));
        turns.push_back(Turn::tool_results({result_with_images("a", 2)}));
        turns.push_back(tool_request("b"));
        turns.push_back(Turn::tool_results({result_with_images("b", 2)}));

        auto kept = retain_recent_images(turns, 3);
        ASSERT(kept.size() == turns.size());
        ASSERT(count_images(kept) == 3);
        ASSERT(count_images(turns) == 4);   // input untouched

        // The oldest image is the one dropped
        const auto* first = std::get_if<ToolResultBlock>(&kept[2].content()[0]);
        ASSERT(first && first->images.size() == 1 && first->images[0].base64_data == "a-1");
        const auto* second = std::get_if<ToolResultBlock>(&kept[4].content()[0]);
        ASSERT(second && second->images.size() == 2);
        // Text survives even when every image is gone
        auto none = retain_recent_images(turns, 0);
        ASSERT(count_images(none) == 0);
        const auto* stripped = std::get_if<ToolResultBlock>(&none[2].content()[0]);
        ASSERT(stripped && stripped->output == "ok" && stripped->tool_use_id == "a");

        ASSERT(count_images(retain_recent_images(turns, 10)) == 4);
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All history tests passed.\n";
    return 0;
}
