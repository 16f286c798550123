#include "core/types/errors.h"
#include "core/types/state.h"

namespace agentgraph {

std::string to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::VALIDATION: return "validation_error";
        case ErrorCode::INVALID_NODE: return "invalid_node";
        case ErrorCode::NODE_EXECUTION: return "node_execution_error";
        case ErrorCode::ROUTING: return "routing_error";
        case ErrorCode::CONDITION: return "condition_error";
        case ErrorCode::MAX_ITERATIONS: return "max_iterations_exceeded";
        case ErrorCode::CANCELLED: return "cancelled";
        case ErrorCode::INVALID_TRANSITION: return "invalid_transition";
        case ErrorCode::NOT_FOUND: return "execution_not_found";
        case ErrorCode::PANIC: return "execution_panic";
    }
    return "execution_error";
}

void to_json(Value& j, const WorkflowError& error) {
    j = Value{
        {"code", error.code},
        {"message", error.message},
        {"timestamp", to_unix_millis(error.timestamp)},
        {"details", error.details}
    };
    j["node_id"] = error.node_id ? Value(*error.node_id) : Value(nullptr);
}

WorkflowException::WorkflowException(ErrorCode code, const std::string& message,
                                     std::optional<std::string> node_id)
    : std::runtime_error(message), code_(code), node_id_(std::move(node_id)) {}

void WorkflowException::attach_state(const WorkflowState& state) {
    state_ = std::make_shared<const WorkflowState>(state);
}

WorkflowError WorkflowException::to_error() const {
    WorkflowError error;
    error.code = to_string(code_);
    error.message = what();
    error.node_id = node_id_;
    error.timestamp = Clock::now();
    return error;
}

} // namespace agentgraph
