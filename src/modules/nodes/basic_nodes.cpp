#include "modules/nodes/basic_nodes.h"
#include "common/utils/template_renderer.h"
#include "core/types/errors.h"
#include <stdexcept>

namespace agentgraph {

// ————————————————————————
// BaseNode
// ————————————————————————

BaseNode::BaseNode(std::string id, std::string type, std::string name, std::string description)
    : id_(std::move(id)), type_(std::move(type)), name_(std::move(name)), description_(std::move(description)) {
    if (name_.empty()) {
        name_ = id_;
    }
}

void BaseNode::validate() const {
    if (id_.empty()) {
        throw ValidationError("node id cannot be empty");
    }
    if (type_.empty()) {
        throw ValidationError("node type cannot be empty: " + id_);
    }
}

// ————————————————————————
// StartNode / EndNode
// ————————————————————————

StartNode::StartNode(std::string id, Value initial_data)
    : BaseNode(std::move(id), node_types::START, "Start", "Workflow entry point"),
      initial_data_(std::move(initial_data)) {}

void StartNode::validate() const {
    BaseNode::validate();
    if (!initial_data_.is_object()) {
        throw ValidationError("start node initial data must be an object: " + id());
    }
}

NodeOutput StartNode::execute(const ExecutionContext&, const WorkflowState&) const {
    NodeOutput output;
    output.data = initial_data_;
    output.metadata = Value{{"execution_started", true}};
    return output;
}

EndNode::EndNode(std::string id, std::optional<std::string> result_template, Finalizer finalizer)
    : BaseNode(std::move(id), node_types::END, "End", "Workflow exit point"),
      result_template_(std::move(result_template)),
      finalizer_(std::move(finalizer)) {}

NodeOutput EndNode::execute(const ExecutionContext& ctx, const WorkflowState& state) const {
    NodeOutput output;
    if (finalizer_) {
        Value extra = finalizer_(ctx, state);
        if (!extra.is_null() && !extra.is_object()) {
            throw std::runtime_error("end node finalizer must return an object");
        }
        if (extra.is_object()) {
            output.data = std::move(extra);
        }
    }
    if (result_template_) {
        output.data["result"] = InjaTemplateRenderer::render_value(*result_template_, state.data);
    }
    output.metadata = Value{{"execution_completed", true}};
    return output;
}

// ————————————————————————
// FunctionNode / TransformNode
// ————————————————————————

FunctionNode::FunctionNode(std::string id, Function fn, std::string name)
    : BaseNode(std::move(id), node_types::FUNCTION, std::move(name)), fn_(std::move(fn)) {}

void FunctionNode::validate() const {
    BaseNode::validate();
    if (!fn_) {
        throw ValidationError("function node has no function: " + id());
    }
}

NodeOutput FunctionNode::execute(const ExecutionContext& ctx, const WorkflowState& state) const {
    return fn_(ctx, state);
}

TransformNode::TransformNode(std::string id, Transformer transformer, std::string name)
    : BaseNode(std::move(id), node_types::TRANSFORM, std::move(name)), transformer_(std::move(transformer)) {}

void TransformNode::validate() const {
    BaseNode::validate();
    if (!transformer_) {
        throw ValidationError("transform node has no transformer: " + id());
    }
}

NodeOutput TransformNode::execute(const ExecutionContext& ctx, const WorkflowState& state) const {
    Value transformed = transformer_(ctx, state.data);
    if (!transformed.is_object()) {
        throw std::runtime_error(std::string("transformation failed: result must be an object, got ") +
                                 transformed.type_name());
    }
    NodeOutput output;
    output.data = std::move(transformed);
    output.metadata = Value{{"transformation_applied", true}};
    return output;
}

// ————————————————————————
// AssignNode
// ————————————————————————

AssignNode::AssignNode(std::string id, Assignments assignments)
    : BaseNode(std::move(id), node_types::ASSIGN), assignments_(std::move(assignments)) {}

void AssignNode::validate() const {
    BaseNode::validate();
    if (assignments_.empty()) {
        throw ValidationError("assign node has no assignments: " + id());
    }
    for (const auto& [key, _] : assignments_) {
        if (key.empty()) {
            throw ValidationError("assign node has an empty key: " + id());
        }
    }
}

NodeOutput AssignNode::execute(const ExecutionContext&, const WorkflowState& state) const {
    NodeOutput output;
    for (const auto& [key, template_str] : assignments_) {
        try {
            output.data[key] = InjaTemplateRenderer::render_value(template_str, state.data);
        } catch (const std::runtime_error& e) {
            throw std::runtime_error("Template rendering failed for key '" + key + "': " + e.what());
        }
    }
    output.metadata = Value{{"assigned_keys", output.data.size()}};
    return output;
}

// ————————————————————————
// DecisionNode
// ————————————————————————

DecisionNode::DecisionNode(std::string id, std::string name)
    : BaseNode(std::move(id), node_types::DECISION, std::move(name),
               "Decision node that routes based on conditions") {}

DecisionNode& DecisionNode::add_branch(std::string target, ConditionPtr condition) {
    branches_.emplace_back(std::move(target), std::move(condition));
    return *this;
}

DecisionNode& DecisionNode::set_default(std::string target) {
    default_target_ = std::move(target);
    return *this;
}

void DecisionNode::validate() const {
    BaseNode::validate();
    if (branches_.empty() && default_target_.empty()) {
        throw ValidationError("decision node needs at least one branch or a default: " + id());
    }
    for (const auto& [target, condition] : branches_) {
        if (target.empty() || !condition) {
            throw ValidationError("decision node branch needs a target and a condition: " + id());
        }
    }
}

NodeOutput DecisionNode::execute(const ExecutionContext& ctx, const WorkflowState& state) const {
    NodeOutput output;
    for (const auto& [target, condition] : branches_) {
        bool matched = false;
        try {
            matched = condition->evaluate(ctx, state);
        } catch (const std::exception& e) {
            throw std::runtime_error("failed to evaluate condition for " + target + ": " + e.what());
        }
        if (matched) {
            output.data = Value{{"decision", target}};
            output.next_node = target;
            output.metadata = Value{{"condition_met", condition->description()}};
            return output;
        }
    }

    if (!default_target_.empty()) {
        output.data = Value{{"decision", default_target_}};
        output.next_node = default_target_;
        output.metadata = Value{{"used_default", true}};
        return output;
    }

    output.data = Value{{"decision", "no_condition_met"}};
    output.metadata = Value{{"no_condition_met", true}};
    return output;
}

} // namespace agentgraph
