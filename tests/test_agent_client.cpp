/**
 * Messages API encoding and decoding.
 * Asserts:
 * - Tool results travel as user turns with tool_result blocks.
 * - Empty text blocks are never sent.
 * - Responses decode into text and tool_use blocks; malformed ones are errors.
 *
 * Run from build dir: ./test_agent_client
 * No network access: only the static codec functions are exercised.
 */

#include "agent_client.h"
#include <nlohmann/json.hpp>
#include <iostream>
#include <string>

using namespace voice_os;
using json = nlohmann::json;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

int main() {
    // --- request body ---
    {
        AgentRequest request;
        request.model = "claude-sonnet-4-5";
        request.system_prompt = "Be brief.";
        request.max_tokens = 512;
        request.tools_json = "[{\"name\":\"app_control\",\"description\":\"d\",\"input_schema\":{\"type\":\"object\"}}]";

        request.turns.push_back(Turn(Role::User, {TextBlock{"open safari"}, TextBlock{""}}));
        request.turns.push_back(Turn(Role::Assistant,
                                     {TextBlock{""}, ToolUseBlock{"toolu_1", "app_control",
                                                                  "{\"action\":\"launch\",\"app\":\"safari\"}"}}));
        ToolResultBlock ok;
        ok.tool_use_id = "toolu_1";
        ok.output = "Launched safari";
        ImageBlock shot;
        shot.base64_data = "AAAA";
        ok.images.push_back(shot);
        ToolResultBlock bad;
        bad.tool_use_id = "toolu_2";
        bad.error = "Tool not found: screenshot";
        request.turns.push_back(Turn::tool_results({ok, bad}));

        json body = json::parse(AgentClient::build_request_body(request));
        ASSERT(body["model"] == "claude-sonnet-4-5");
        ASSERT(body["max_tokens"] == 512);
        ASSERT(body["system"] == "Be brief.");
        ASSERT(body["tools"].is_array() && body["tools"].size() == 1);
        ASSERT(body["tools"][0]["name"] == "app_control");

        const json& messages = body["messages"];
        ASSERT(messages.size() == 3);

        // Empty text dropped
        ASSERT(messages[0]["role"] == "user");
        ASSERT(messages[0]["content"].size() == 1);
        ASSERT(messages[0]["content"][0]["text"] == "open safari");

        ASSERT(messages[1]["role"] == "assistant");
        ASSERT(messages[1]["content"].size() == 1);
        ASSERT(messages[1]["content"][0]["type"] == "tool_use");
        ASSERT(messages[1]["content"][0]["input"]["app"] == "safari");

        // Tool role is sent as user
        ASSERT(messages[2]["role"] == "user");
        ASSERT(messages[2]["content"].size() == 2);
        const json& first = messages[2]["content"][0];
        ASSERT(first["type"] == "tool_result");
        ASSERT(first["tool_use_id"] == "toolu_1");
        ASSERT(!first.contains("is_error"));
        ASSERT(first["content"].size() == 2);
        ASSERT(first["content"][1]["type"] == "image");
        ASSERT(first["content"][1]["source"]["data"] == "AAAA");
        const json& second = messages[2]["content"][1];
        ASSERT(second["is_error"] == true);
        ASSERT(second["content"][0]["text"] == "Tool not found: screenshot");
    }

    // --- no tools, no system prompt ---
    {
        AgentRequest request;
        request.model = "m";
        request.turns.push_back(Turn::user("hi"));
        json body = json::parse(AgentClient::build_request_body(request));
        ASSERT(!body.contains("tools"));
        ASSERT(!body.contains("system"));

        request.tools_json = "not json";
        body = json::parse(AgentClient::build_request_body(request));
        ASSERT(!body.contains("tools"));
    }

    // --- response parsing ---
    {
        auto parsed = AgentClient::parse_response_body(R"({
            "id": "msg_1", "type": "message", "role": "assistant",
            "content": [
                {"type": "text", "text": "Opening Safari."},
                {"type": "tool_use", "id": "toolu_9", "name": "app_control",
                 "input": {"action": "launch", "app": "Safari"}}
            ],
            "stop_reason": "tool_use"
        })");
        ASSERT(parsed.is_ok());
        if (parsed.is_ok()) {
            const Turn& turn = parsed.value();
            ASSERT(turn.role() == Role::Assistant);
            ASSERT(turn.text() == "Opening Safari.");
            auto uses = turn.tool_uses();
            ASSERT(uses.size() == 1);
            ASSERT(uses[0].id == "toolu_9" && uses[0].name == "app_control");
            ASSERT(json::parse(uses[0].input_json)["app"] == "Safari");
        }

        auto plain = AgentClient::parse_response_body(
            R"({"content": [{"type": "text", "text": "Done."}], "stop_reason": null})");
        ASSERT(plain.is_ok() && !plain.value().has_tool_use());

        auto no_input = AgentClient::parse_response_body(
            R"({"content": [{"type": "tool_use", "id": "t", "name": "n"}]})");
        ASSERT(no_input.is_ok() && no_input.value().tool_uses()[0].input_json == "{}");

        // Unknown block types are skipped
        auto thinking = AgentClient::parse_response_body(
            R"({"content": [{"type": "thinking", "thinking": "..."}, {"type": "text", "text": "ok"}]})");
        ASSERT(thinking.is_ok() && thinking.value().content().size() == 1);

        auto garbage = AgentClient::parse_response_body("<html>bad gateway</html>");
        ASSERT(garbage.is_error() && garbage.error().type == ErrorType::ParseError);

        auto missing = AgentClient::parse_response_body(R"({"type": "error"})");
        ASSERT(missing.is_error() && missing.error().type == ErrorType::ProtocolError);

        auto anonymous = AgentClient::parse_response_body(
            R"({"content": [{"type": "tool_use", "name": "app_control", "input": {}}]})");
        ASSERT(anonymous.is_error() && anonymous.error().type == ErrorType::ProtocolError);
    }

    // --- a cancelled token short-circuits without touching the network ---
    {
        AgentConfig config;
        config.endpoint = "http://127.0.0.1:9/v1/messages";
        AgentClient client(config, "test-key");
        CancellationToken token;
        token.cancel();
        AgentRequest request;
        request.model = "m";
        request.turns.push_back(Turn::user("hi"));
        auto result = client.send(request, token);
        ASSERT(result.is_error() && result.error().is_cancelled());
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All agent client tests passed.\n";
    return 0;
}
