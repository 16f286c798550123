#ifndef AGENTGRAPH_COMMON_LLM_LLM_PROVIDER_H
#define AGENTGRAPH_COMMON_LLM_LLM_PROVIDER_H

#include "core/types/message.h"
#include "core/types/value.h"
#include <optional>
#include <string>
#include <vector>

namespace agentgraph {

struct LlmRequest {
    std::vector<Message> messages;
    std::optional<float> temperature; // provider default when unset
    std::optional<int> max_tokens;
};

struct LlmResponse {
    std::string content;
    std::string model;
    std::vector<ToolCall> tool_calls;
    Value usage = Value::object(); // prompt_tokens, completion_tokens, ...
};

// Text generation backend consumed by LlmNode. Implementations must allow
// concurrent calls from different executions.
class LlmProvider {
public:
    virtual ~LlmProvider() = default;

    virtual std::string name() const = 0;
    virtual LlmResponse generate(const LlmRequest& request) = 0;
};

} // namespace agentgraph

#endif // AGENTGRAPH_COMMON_LLM_LLM_PROVIDER_H
