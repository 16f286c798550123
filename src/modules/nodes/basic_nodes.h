#ifndef AGENTGRAPH_MODULES_NODES_BASIC_NODES_H
#define AGENTGRAPH_MODULES_NODES_BASIC_NODES_H

#include "core/types/node.h"
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace agentgraph {

// Identity and descriptive fields shared by the built-in nodes. Setters are
// meant for construction time, before the node is added to a graph.
class BaseNode : public Node {
public:
    BaseNode(std::string id, std::string type, std::string name = "", std::string description = "");

    const std::string& id() const override { return id_; }
    const std::string& type() const override { return type_; }
    void validate() const override;

    const std::string& name() const { return name_; }
    const std::string& description() const { return description_; }
    void set_description(std::string description) { description_ = std::move(description); }

    const Value& config() const { return config_; }
    void set_config(Value config) { config_ = std::move(config); }

    const Value& metadata() const { return metadata_; }
    void set_metadata(Value metadata) { metadata_ = std::move(metadata); }

private:
    std::string id_;
    std::string type_;
    std::string name_;
    std::string description_;
    Value config_ = Value::object();
    Value metadata_ = Value::object();
};

// Entry marker; optionally seeds data.
class StartNode : public BaseNode {
public:
    explicit StartNode(std::string id, Value initial_data = Value::object());

    void validate() const override;
    [[nodiscard]] NodeOutput execute(const ExecutionContext& ctx, const WorkflowState& state) const override;

private:
    Value initial_data_;
};

// Exit marker. Can compute data["result"] from a template and/or run a
// finalizer whose object result is merged into data.
class EndNode : public BaseNode {
public:
    using Finalizer = std::function<Value(const ExecutionContext&, const WorkflowState&)>;

    explicit EndNode(std::string id, std::optional<std::string> result_template = std::nullopt,
                     Finalizer finalizer = nullptr);

    [[nodiscard]] NodeOutput execute(const ExecutionContext& ctx, const WorkflowState& state) const override;

private:
    std::optional<std::string> result_template_;
    Finalizer finalizer_;
};

class FunctionNode : public BaseNode {
public:
    using Function = std::function<NodeOutput(const ExecutionContext&, const WorkflowState&)>;

    FunctionNode(std::string id, Function fn, std::string name = "");

    void validate() const override;
    [[nodiscard]] NodeOutput execute(const ExecutionContext& ctx, const WorkflowState& state) const override;

private:
    Function fn_;
};

// Maps the data bag to a new object whose keys are merged back.
class TransformNode : public BaseNode {
public:
    using Transformer = std::function<Value(const ExecutionContext&, const Value& data)>;

    TransformNode(std::string id, Transformer transformer, std::string name = "");

    void validate() const override;
    [[nodiscard]] NodeOutput execute(const ExecutionContext& ctx, const WorkflowState& state) const override;

private:
    Transformer transformer_;
};

// Sets keys from inja templates rendered against the incoming data.
class AssignNode : public BaseNode {
public:
    using Assignments = std::vector<std::pair<std::string, std::string>>; // key, template

    AssignNode(std::string id, Assignments assignments);

    void validate() const override;
    [[nodiscard]] NodeOutput execute(const ExecutionContext& ctx, const WorkflowState& state) const override;

    const Assignments& assignments() const { return assignments_; }

private:
    Assignments assignments_;
};

// Picks the target of the first matching branch and overrides edge routing.
// Without a match it falls back to the default target, or leaves routing to
// the outgoing edges when there is none.
class DecisionNode : public BaseNode {
public:
    explicit DecisionNode(std::string id, std::string name = "");

    DecisionNode& add_branch(std::string target, ConditionPtr condition);
    DecisionNode& set_default(std::string target);

    void validate() const override;
    [[nodiscard]] NodeOutput execute(const ExecutionContext& ctx, const WorkflowState& state) const override;

private:
    std::vector<std::pair<std::string, ConditionPtr>> branches_;
    std::string default_target_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_NODES_BASIC_NODES_H
