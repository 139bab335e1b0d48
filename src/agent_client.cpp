#include "agent_client.h"
#include "logger.h"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

namespace voice_os {

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    std::string* buffer = static_cast<std::string*>(userp);
    buffer->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

/// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK
int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* token = static_cast<const CancellationToken*>(clientp);
    return token->is_cancelled() ? 1 : 0;
}

json image_to_json(const ImageBlock& image) {
    return json{
        {"type", "image"},
        {"source", {{"type", "base64"}, {"media_type", image.media_type}, {"data", image.base64_data}}}
    };
}

json block_to_json(const ContentBlock& block) {
    if (const auto* text = std::get_if<TextBlock>(&block)) {
        return json{{"type", "text"}, {"text", text->text}};
    }
    if (const auto* image = std::get_if<ImageBlock>(&block)) {
        return image_to_json(*image);
    }
    if (const auto* use = std::get_if<ToolUseBlock>(&block)) {
        json input = json::object();
        if (!use->input_json.empty()) {
            try {
                input = json::parse(use->input_json);
            } catch (const json::exception& e) {
                Logger::warn("[Agent] Tool input for " + use->id + " is not JSON: " + e.what());
            }
        }
        return json{{"type", "tool_use"}, {"id", use->id}, {"name", use->name}, {"input", input}};
    }
    const auto& result = std::get<ToolResultBlock>(block);
    json content = json::array();
    const std::string& text = result.is_error() ? result.error : result.output;
    if (!text.empty()) {
        content.push_back(json{{"type", "text"}, {"text", text}});
    }
    for (const auto& image : result.images) {
        content.push_back(image_to_json(image));
    }
    json j{{"type", "tool_result"}, {"tool_use_id", result.tool_use_id}, {"content", content}};
    if (result.is_error()) {
        j["is_error"] = true;
    }
    return j;
}

bool is_empty_text(const ContentBlock& block) {
    const auto* text = std::get_if<TextBlock>(&block);
    return text && text->text.empty();
}

json turn_to_json(const Turn& turn) {
    json content = json::array();
    for (const auto& block : turn.content()) {
        // The API rejects empty text blocks
        if (is_empty_text(block)) continue;
        content.push_back(block_to_json(block));
    }
    // Tool results travel as user turns on the wire
    const char* role = turn.role() == Role::Assistant ? "assistant" : "user";
    return json{{"role", role}, {"content", content}};
}

} // anonymous namespace

class AgentClient::Impl {
public:
    Impl(const AgentConfig& config, std::string api_key)
        : config_(config), api_key_(std::move(api_key)) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
        if (api_key_.empty()) {
            Logger::warn("[Agent] No API key configured (" + config_.api_key_env + "); remote calls will fail");
        }
    }

    ~Impl() {
        curl_global_cleanup();
    }

    Result<Turn> send(const AgentRequest& request, const CancellationToken& token) {
        if (token.is_cancelled()) {
            return make_cancelled_error();
        }

        std::string body = build_request_body(request);

        CURL* curl = curl_easy_init();
        if (!curl) {
            return make_network_error("Failed to initialize CURL");
        }

        struct curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, "Content-Type: application/json");
        headers = curl_slist_append(headers, ("x-api-key: " + api_key_).c_str());
        headers = curl_slist_append(headers, ("anthropic-version: " + config_.api_version).c_str());

        std::string response_buffer;

        curl_easy_setopt(curl, CURLOPT_URL, config_.endpoint.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_buffer);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &token);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        LOG_AGENT("POST " + config_.endpoint + " (" + std::to_string(request.turns.size()) + " turns)");
        CURLcode res = curl_easy_perform(curl);

        long http_code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);

        if (res == CURLE_ABORTED_BY_CALLBACK || token.is_cancelled()) {
            LOG_AGENT("Request aborted by cancellation");
            return make_cancelled_error("Remote call cancelled");
        }
        if (res != CURLE_OK) {
            return make_network_error(curl_easy_strerror(res));
        }
        if (http_code != 200) {
            return make_error(ErrorType::NetworkError,
                              "HTTP " + std::to_string(http_code) + ": " + extract_error_message(response_buffer));
        }
        return parse_response_body(response_buffer);
    }

private:
    static std::string extract_error_message(const std::string& body) {
        try {
            json j = json::parse(body);
            if (j.contains("error") && j["error"].is_object() && j["error"].contains("message") &&
                j["error"]["message"].is_string()) {
                return j["error"]["message"].get<std::string>();
            }
        } catch (const json::exception&) {
            // not JSON: fall through to the raw body
        }
        return body.substr(0, 200);
    }

    AgentConfig config_;
    std::string api_key_;
};

AgentClient::AgentClient(const AgentConfig& config, std::string api_key)
    : pimpl_(std::make_unique<Impl>(config, std::move(api_key))) {}

AgentClient::~AgentClient() = default;

Result<Turn> AgentClient::send(const AgentRequest& request, const CancellationToken& token) {
    return pimpl_->send(request, token);
}

std::string AgentClient::build_request_body(const AgentRequest& request) {
    json j;
    j["model"] = request.model;
    j["max_tokens"] = request.max_tokens;
    if (!request.system_prompt.empty()) {
        j["system"] = request.system_prompt;
    }

    json messages = json::array();
    for (const auto& turn : request.turns) {
        messages.push_back(turn_to_json(turn));
    }
    j["messages"] = messages;

    if (!request.tools_json.empty()) {
        try {
            json tools = json::parse(request.tools_json);
            if (tools.is_array() && !tools.empty()) {
                j["tools"] = tools;
            }
        } catch (const json::exception& e) {
            Logger::error("[Agent] Tool definitions are not valid JSON: " + std::string(e.what()));
        }
    }
    return j.dump();
}

Result<Turn> AgentClient::parse_response_body(const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::exception& e) {
        return make_parse_error("Response is not JSON: " + std::string(e.what()));
    }

    if (!j.contains("content") || !j["content"].is_array()) {
        return make_protocol_error("Response has no content array");
    }

    std::vector<ContentBlock> content;
    for (const auto& block : j["content"]) {
        std::string type = block.value("type", "");
        if (type == "text") {
            content.emplace_back(TextBlock{block.value("text", "")});
        } else if (type == "tool_use") {
            ToolUseBlock use;
            use.id = block.value("id", "");
            use.name = block.value("name", "");
            use.input_json = block.contains("input") ? block["input"].dump() : "{}";
            if (use.id.empty() || use.name.empty()) {
                return make_protocol_error("tool_use block without id or name");
            }
            content.emplace_back(std::move(use));
        } else {
            LOG_DEBUG("Ignoring response block of type " + type);
        }
    }

    std::string stop_reason = "?";
    if (j.contains("stop_reason") && j["stop_reason"].is_string()) {
        stop_reason = j["stop_reason"].get<std::string>();
    }
    std::ostringstream oss;
    oss << "Response: " << content.size() << " blocks, stop_reason=" << stop_reason;
    LOG_AGENT(oss.str());

    return Turn(Role::Assistant, std::move(content));
}

} // namespace voice_os
