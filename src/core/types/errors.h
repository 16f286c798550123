#ifndef AGENTGRAPH_CORE_TYPES_ERRORS_H
#define AGENTGRAPH_CORE_TYPES_ERRORS_H

#include "core/types/value.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace agentgraph {

struct WorkflowState;

enum class ErrorCode : uint8_t {
    VALIDATION,
    INVALID_NODE,
    NODE_EXECUTION,
    ROUTING,
    CONDITION,
    MAX_ITERATIONS,
    CANCELLED,
    INVALID_TRANSITION,
    NOT_FOUND,
    PANIC
};

// Stable snake_case identifier stored in WorkflowError::code.
std::string to_string(ErrorCode code);

// Error record kept on a WorkflowState or NodeExecution for post-mortem inspection.
struct WorkflowError {
    std::string code;
    std::string message;
    std::optional<std::string> node_id;
    TimePoint timestamp = Clock::now();
    Value details = Value::object();
};

void to_json(Value& j, const WorkflowError& error);

// Base of every error the engine raises. Errors thrown out of a synchronous
// execution carry a snapshot of the final WorkflowState.
class WorkflowException : public std::runtime_error {
public:
    WorkflowException(ErrorCode code, const std::string& message,
                      std::optional<std::string> node_id = std::nullopt);

    ErrorCode code() const noexcept { return code_; }
    const std::optional<std::string>& node_id() const noexcept { return node_id_; }

    // nullptr when the error was raised before a state existed
    const WorkflowState* state() const noexcept { return state_.get(); }
    void attach_state(const WorkflowState& state);

    WorkflowError to_error() const;

private:
    ErrorCode code_;
    std::optional<std::string> node_id_;
    std::shared_ptr<const WorkflowState> state_;
};

// Invalid graph or node structure: missing start node, dangling edge,
// duplicate id, static cycle.
class ValidationError : public WorkflowException {
public:
    explicit ValidationError(const std::string& message)
        : WorkflowException(ErrorCode::VALIDATION, message) {}

protected:
    ValidationError(ErrorCode code, const std::string& message, std::optional<std::string> node_id)
        : WorkflowException(code, message, std::move(node_id)) {}
};

using StructuralError = ValidationError;

// The state points at a node id the graph does not (or no longer) contain.
class InvalidNodeError : public ValidationError {
public:
    explicit InvalidNodeError(const std::string& node_id)
        : ValidationError(ErrorCode::INVALID_NODE, "node not found: " + node_id, node_id) {}
};

class NodeExecutionError : public WorkflowException {
public:
    NodeExecutionError(const std::string& node_id, const std::string& cause)
        : WorkflowException(ErrorCode::NODE_EXECUTION,
                            "node " + node_id + " execution failed: " + cause, node_id),
          cause_(cause) {}

    const std::string& cause() const noexcept { return cause_; }

private:
    std::string cause_;
};

// No outgoing edge was eligible, or a condition could not be evaluated.
class RoutingError : public WorkflowException {
public:
    RoutingError(const std::string& node_id, const std::string& message,
                 ErrorCode code = ErrorCode::ROUTING)
        : WorkflowException(code, message, node_id) {}
};

class RunawayError : public WorkflowException {
public:
    explicit RunawayError(size_t max_iterations)
        : WorkflowException(ErrorCode::MAX_ITERATIONS,
                            "workflow exceeded maximum iterations (" + std::to_string(max_iterations) + ")"),
          max_iterations_(max_iterations) {}

    size_t max_iterations() const noexcept { return max_iterations_; }

private:
    size_t max_iterations_;
};

// The ExecutionContext was cancelled or its deadline passed; what() is the context error.
class CancelledError : public WorkflowException {
public:
    explicit CancelledError(const std::string& reason)
        : WorkflowException(ErrorCode::CANCELLED, reason) {}
};

// Illegal pause/resume/cancel transition.
class ControlError : public WorkflowException {
public:
    explicit ControlError(const std::string& message)
        : WorkflowException(ErrorCode::INVALID_TRANSITION, message) {}
};

class ExecutionNotFoundError : public WorkflowException {
public:
    explicit ExecutionNotFoundError(const std::string& execution_id)
        : WorkflowException(ErrorCode::NOT_FOUND, "execution not found: " + execution_id) {}
};

} // namespace agentgraph

#endif // AGENTGRAPH_CORE_TYPES_ERRORS_H
