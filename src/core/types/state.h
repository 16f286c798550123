#ifndef AGENTGRAPH_CORE_TYPES_STATE_H
#define AGENTGRAPH_CORE_TYPES_STATE_H

#include "core/types/errors.h"
#include "core/types/message.h"
#include "core/types/value.h"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace agentgraph {

enum class WorkflowStatus : uint8_t {
    PENDING,
    RUNNING,
    COMPLETED,
    FAILED,
    CANCELLED,
    PAUSED
};

std::string to_string(WorkflowStatus status);
WorkflowStatus status_from_string(const std::string& text); // throws std::invalid_argument

// COMPLETED, FAILED and CANCELLED admit no further transitions.
inline bool is_terminal(WorkflowStatus status) {
    return status == WorkflowStatus::COMPLETED ||
           status == WorkflowStatus::FAILED ||
           status == WorkflowStatus::CANCELLED;
}

// Audit record of one node invocation. Appended to history once, never mutated.
struct NodeExecution {
    std::string node_id;
    std::string node_type;
    TimePoint start_time = Clock::now();
    std::optional<TimePoint> end_time;
    std::chrono::microseconds duration{0};
    Value input = Value::object();  // data snapshot at invocation
    Value output = Value::object();
    std::optional<WorkflowError> error;
    Value metadata = Value::object();
};

struct WorkflowState {
    std::string id;          // execution id
    std::string workflow_id; // graph id
    WorkflowStatus status = WorkflowStatus::PENDING;
    std::string current_node; // empty once terminal
    Value data = Value::object();
    std::vector<Message> messages;
    std::vector<NodeExecution> history;
    TimePoint created_at = Clock::now();
    TimePoint updated_at = created_at;
    std::optional<WorkflowError> error;
    Value metadata = Value::object();
};

// What a node hands back to the engine; the engine performs all merging.
struct NodeOutput {
    Value data = Value::object();
    std::vector<Message> messages;
    Value metadata = Value::object();
    std::optional<std::string> next_node; // overrides edge routing when set
};

struct WorkflowInput {
    Value data = Value::object();
    std::vector<Message> messages;
    Value context = Value::object(); // merged into data
    std::string user_id;
    std::string session_id;
    std::string query;
    Value preferences = Value::object();
};

struct WorkflowOutput {
    Value result; // data["result"], null when absent
    std::vector<Message> messages;
    Value data = Value::object();
    WorkflowState state;
    Value metadata = Value::object();
};

void to_json(Value& j, const NodeExecution& execution);
void to_json(Value& j, const WorkflowState& state);
void to_json(Value& j, const NodeOutput& output);
void to_json(Value& j, const WorkflowOutput& output);
void from_json(const Value& j, WorkflowInput& input);

} // namespace agentgraph

#endif // AGENTGRAPH_CORE_TYPES_STATE_H
