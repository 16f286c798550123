#ifndef AGENTGRAPH_CORE_TYPES_MESSAGE_H
#define AGENTGRAPH_CORE_TYPES_MESSAGE_H

#include "core/types/value.h"
#include <optional>
#include <string>
#include <vector>

namespace agentgraph {

struct FunctionCall {
    std::string name;
    std::string arguments; // JSON-encoded argument object

    bool operator==(const FunctionCall&) const = default;
};

struct ToolCall {
    std::string id;
    std::string type = "function";
    FunctionCall function;

    bool operator==(const ToolCall&) const = default;
};

// One entry of the conversation log carried by a WorkflowState.
struct Message {
    std::string role; // "system", "user", "assistant", "tool"
    std::string content;
    std::optional<std::string> name;
    std::vector<ToolCall> tool_calls;

    Message() = default;
    Message(std::string r, std::string c) : role(std::move(r)), content(std::move(c)) {}

    bool operator==(const Message&) const = default;
};

void to_json(Value& j, const FunctionCall& call);
void from_json(const Value& j, FunctionCall& call);
void to_json(Value& j, const ToolCall& call);
void from_json(const Value& j, ToolCall& call);
void to_json(Value& j, const Message& message);
void from_json(const Value& j, Message& message);

} // namespace agentgraph

#endif // AGENTGRAPH_CORE_TYPES_MESSAGE_H
