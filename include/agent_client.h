#pragma once

#include "config.h"
#include "remote_agent.h"
#include <memory>
#include <string>

namespace voice_os {

/**
 * @brief RemoteAgent over the Anthropic Messages HTTP API (libcurl)
 *
 * No timeout is set on the transfer: only a cancellation ends a call early.
 */
class AgentClient : public RemoteAgent {
public:
    AgentClient(const AgentConfig& config, std::string api_key);
    ~AgentClient() override;

    // Non-copyable
    AgentClient(const AgentClient&) = delete;
    AgentClient& operator=(const AgentClient&) = delete;

    Result<Turn> send(const AgentRequest& request, const CancellationToken& token) override;

    /// Request body for a request (exposed for logging and tests)
    static std::string build_request_body(const AgentRequest& request);

    /// Parse a Messages API response body into an assistant turn
    static Result<Turn> parse_response_body(const std::string& body);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace voice_os
