#ifndef AGENTGRAPH_CORE_TYPES_NODE_H
#define AGENTGRAPH_CORE_TYPES_NODE_H

#include "core/context/execution_context.h"
#include "core/types/state.h"
#include "core/types/value.h"
#include <memory>
#include <string>

namespace agentgraph {

// Node type names used by the built-in node library and the YAML loader.
namespace node_types {
inline constexpr const char* START = "start";
inline constexpr const char* END = "end";
inline constexpr const char* FUNCTION = "function";
inline constexpr const char* TRANSFORM = "transform";
inline constexpr const char* ASSIGN = "assign";
inline constexpr const char* TOOL = "tool";
inline constexpr const char* LLM = "llm";
inline constexpr const char* DECISION = "decision";
inline constexpr const char* PARALLEL = "parallel";
} // namespace node_types

// A unit of work. Nodes are shared across executions and cloned graphs, so
// execute() must be reentrant and must not modify the state it is given.
class Node {
public:
    virtual ~Node() = default;

    virtual const std::string& id() const = 0;
    virtual const std::string& type() const = 0;

    // Structural self-check, throws ValidationError.
    virtual void validate() const = 0;

    [[nodiscard]] virtual NodeOutput execute(const ExecutionContext& ctx, const WorkflowState& state) const = 0;
};

using NodePtr = std::shared_ptr<const Node>;

// Predicate deciding whether an edge may be taken.
class Condition {
public:
    virtual ~Condition() = default;

    // Throws on evaluation failure (missing field, type mismatch, ...).
    virtual bool evaluate(const ExecutionContext& ctx, const WorkflowState& state) const = 0;
    virtual std::string description() const = 0;
};

using ConditionPtr = std::shared_ptr<const Condition>;

struct Edge {
    std::string id; // "from->to" when left empty
    std::string from_node;
    std::string to_node;
    ConditionPtr condition; // null: always eligible
    double weight = 1.0;    // informational only
    Value metadata = Value::object();

    Edge() = default;
    Edge(std::string from, std::string to, ConditionPtr cond = nullptr)
        : from_node(std::move(from)), to_node(std::move(to)), condition(std::move(cond)) {}
};

} // namespace agentgraph

#endif // AGENTGRAPH_CORE_TYPES_NODE_H
