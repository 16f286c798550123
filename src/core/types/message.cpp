#include "core/types/message.h"

namespace agentgraph {

void to_json(Value& j, const FunctionCall& call) {
    j = Value{{"name", call.name}, {"arguments", call.arguments}};
}

void from_json(const Value& j, FunctionCall& call) {
    call.name = j.value("name", "");
    // Arguments may arrive either pre-encoded or as an object.
    if (j.contains("arguments")) {
        const auto& args = j.at("arguments");
        call.arguments = args.is_string() ? args.get<std::string>() : args.dump();
    }
}

void to_json(Value& j, const ToolCall& call) {
    j = Value{{"id", call.id}, {"type", call.type}, {"function", call.function}};
}

void from_json(const Value& j, ToolCall& call) {
    call.id = j.value("id", "");
    call.type = j.value("type", "function");
    if (j.contains("function")) {
        j.at("function").get_to(call.function);
    }
}

void to_json(Value& j, const Message& message) {
    j = Value{{"role", message.role}, {"content", message.content}};
    if (message.name) {
        j["name"] = *message.name;
    }
    if (!message.tool_calls.empty()) {
        j["tool_calls"] = message.tool_calls;
    }
}

void from_json(const Value& j, Message& message) {
    message.role = j.value("role", "");
    message.content = j.value("content", "");
    if (j.contains("name") && j["name"].is_string()) {
        message.name = j["name"].get<std::string>();
    } else {
        message.name.reset();
    }
    message.tool_calls.clear();
    if (j.contains("tool_calls") && j["tool_calls"].is_array()) {
        message.tool_calls = j["tool_calls"].get<std::vector<ToolCall>>();
    }
}

} // namespace agentgraph
