#ifndef AGENTGRAPH_MODULES_REGISTRY_WORKFLOW_BUILDER_H
#define AGENTGRAPH_MODULES_REGISTRY_WORKFLOW_BUILDER_H

#include "modules/graph/graph.h"
#include "modules/nodes/basic_nodes.h"
#include "modules/registry/workflow_registry.h"
#include <exception>
#include <memory>
#include <string>

namespace agentgraph {

// Fluent graph construction. The first failing step is remembered, later
// steps are skipped, and build() rethrows it.
class WorkflowBuilder {
public:
    WorkflowBuilder(std::string id, std::string name, std::string description = "");

    WorkflowBuilder& add_node(NodePtr node);
    WorkflowBuilder& add_function_node(const std::string& id, FunctionNode::Function fn);
    WorkflowBuilder& add_transform_node(const std::string& id, TransformNode::Transformer transformer);
    WorkflowBuilder& add_edge(const std::string& from, const std::string& to, ConditionPtr condition);
    WorkflowBuilder& add_simple_edge(const std::string& from, const std::string& to);
    WorkflowBuilder& set_start_node(const std::string& node_id);
    WorkflowBuilder& set_metadata(const std::string& key, Value value);

    // Validates and hands over the graph; the builder is spent afterwards.
    std::shared_ptr<Graph> build();
    std::shared_ptr<Graph> build_and_register(WorkflowRegistry& registry);

private:
    template <typename Step>
    WorkflowBuilder& apply(Step&& step);

    std::shared_ptr<Graph> graph_;
    std::exception_ptr error_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_REGISTRY_WORKFLOW_BUILDER_H
