#pragma once

#include "cancellation.h"
#include "core/types.h"
#include "errors.h"
#include <string>
#include <vector>

namespace voice_os {

/**
 * @brief One model request of a remote exchange
 */
struct AgentRequest {
    std::string model;
    std::string system_prompt;     ///< Base prompt with the entry point's suffix applied
    std::vector<Turn> turns;       ///< Conversation so far, images already filtered
    std::string tools_json;        ///< Tool definitions (JSON array), empty for none
    int max_tokens = 1024;
};

/**
 * @brief Remote reasoning agent boundary
 *
 * send() blocks for the duration of one model call and is called off the
 * scheduler thread. Implementations must return an Error of type Cancelled
 * promptly once the token is cancelled.
 */
class RemoteAgent {
public:
    virtual ~RemoteAgent() = default;

    /**
     * @brief Ask the model for the next assistant turn
     * @return Assistant turn (text and tool-use blocks) or an error
     */
    virtual Result<Turn> send(const AgentRequest& request, const CancellationToken& token) = 0;
};

} // namespace voice_os
