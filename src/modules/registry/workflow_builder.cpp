#include "modules/registry/workflow_builder.h"
#include "core/types/errors.h"

namespace agentgraph {

WorkflowBuilder::WorkflowBuilder(std::string id, std::string name, std::string description)
    : graph_(std::make_shared<Graph>(std::move(id), std::move(name), std::move(description))) {}

template <typename Step>
WorkflowBuilder& WorkflowBuilder::apply(Step&& step) {
    if (error_ || !graph_) {
        return *this;
    }
    try {
        step(*graph_);
    } catch (const std::exception&) {
        error_ = std::current_exception();
    }
    return *this;
}

WorkflowBuilder& WorkflowBuilder::add_node(NodePtr node) {
    return apply([&](Graph& g) { g.add_node(std::move(node)); });
}

WorkflowBuilder& WorkflowBuilder::add_function_node(const std::string& id, FunctionNode::Function fn) {
    return add_node(std::make_shared<FunctionNode>(id, std::move(fn)));
}

WorkflowBuilder& WorkflowBuilder::add_transform_node(const std::string& id, TransformNode::Transformer transformer) {
    return add_node(std::make_shared<TransformNode>(id, std::move(transformer)));
}

WorkflowBuilder& WorkflowBuilder::add_edge(const std::string& from, const std::string& to, ConditionPtr condition) {
    return apply([&](Graph& g) { g.add_edge(Edge(from, to, std::move(condition))); });
}

WorkflowBuilder& WorkflowBuilder::add_simple_edge(const std::string& from, const std::string& to) {
    return add_edge(from, to, nullptr);
}

WorkflowBuilder& WorkflowBuilder::set_start_node(const std::string& node_id) {
    return apply([&](Graph& g) { g.set_start_node(node_id); });
}

WorkflowBuilder& WorkflowBuilder::set_metadata(const std::string& key, Value value) {
    return apply([&](Graph& g) { g.set_metadata_value(key, std::move(value)); });
}

std::shared_ptr<Graph> WorkflowBuilder::build() {
    if (error_) {
        std::rethrow_exception(error_);
    }
    if (!graph_) {
        throw ValidationError("workflow builder has already been used");
    }
    graph_->validate();
    return std::move(graph_);
}

std::shared_ptr<Graph> WorkflowBuilder::build_and_register(WorkflowRegistry& registry) {
    auto graph = build();
    registry.register_workflow(graph);
    return graph;
}

} // namespace agentgraph
