#include "core/types/state.h"
#include <stdexcept>

namespace agentgraph {

std::string to_string(WorkflowStatus status) {
    switch (status) {
        case WorkflowStatus::PENDING: return "pending";
        case WorkflowStatus::RUNNING: return "running";
        case WorkflowStatus::COMPLETED: return "completed";
        case WorkflowStatus::FAILED: return "failed";
        case WorkflowStatus::CANCELLED: return "cancelled";
        case WorkflowStatus::PAUSED: return "paused";
    }
    return "unknown";
}

WorkflowStatus status_from_string(const std::string& text) {
    if (text == "pending") return WorkflowStatus::PENDING;
    if (text == "running") return WorkflowStatus::RUNNING;
    if (text == "completed") return WorkflowStatus::COMPLETED;
    if (text == "failed") return WorkflowStatus::FAILED;
    if (text == "cancelled") return WorkflowStatus::CANCELLED;
    if (text == "paused") return WorkflowStatus::PAUSED;
    throw std::invalid_argument("Unknown workflow status: " + text);
}

void to_json(Value& j, const NodeExecution& execution) {
    j = Value{
        {"node_id", execution.node_id},
        {"node_type", execution.node_type},
        {"start_time", to_unix_millis(execution.start_time)},
        {"duration_ms", static_cast<double>(execution.duration.count()) / 1000.0},
        {"input", execution.input},
        {"output", execution.output},
        {"metadata", execution.metadata}
    };
    j["end_time"] = execution.end_time ? Value(to_unix_millis(*execution.end_time)) : Value(nullptr);
    j["error"] = execution.error ? Value(*execution.error) : Value(nullptr);
}

void to_json(Value& j, const WorkflowState& state) {
    j = Value{
        {"id", state.id},
        {"workflow_id", state.workflow_id},
        {"status", to_string(state.status)},
        {"current_node", state.current_node},
        {"data", state.data},
        {"messages", state.messages},
        {"history", state.history},
        {"created_at", to_unix_millis(state.created_at)},
        {"updated_at", to_unix_millis(state.updated_at)},
        {"metadata", state.metadata}
    };
    j["error"] = state.error ? Value(*state.error) : Value(nullptr);
}

void to_json(Value& j, const NodeOutput& output) {
    j = Value{
        {"data", output.data},
        {"messages", output.messages},
        {"metadata", output.metadata}
    };
    j["next_node"] = output.next_node ? Value(*output.next_node) : Value(nullptr);
}

void to_json(Value& j, const WorkflowOutput& output) {
    j = Value{
        {"result", output.result},
        {"messages", output.messages},
        {"data", output.data},
        {"state", output.state},
        {"metadata", output.metadata}
    };
}

void from_json(const Value& j, WorkflowInput& input) {
    if (!j.is_object()) {
        throw std::invalid_argument("Workflow input must be a JSON object");
    }
    input.data = j.value("data", Value::object());
    input.context = j.value("context", Value::object());
    input.preferences = j.value("preferences", Value::object());
    input.user_id = j.value("user_id", "");
    input.session_id = j.value("session_id", "");
    input.query = j.value("query", "");
    input.messages.clear();
    if (j.contains("messages") && j["messages"].is_array()) {
        input.messages = j["messages"].get<std::vector<Message>>();
    }
}

} // namespace agentgraph
