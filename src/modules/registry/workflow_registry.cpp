#include "modules/registry/workflow_registry.h"
#include "common/logger.h"
#include "core/types/errors.h"
#include "modules/nodes/basic_nodes.h"
#include <mutex>
#include <stdexcept>

namespace agentgraph {

void to_json(Value& j, const WorkflowInfo& info) {
    Value nodes = Value::array();
    for (const auto& node : info.nodes) {
        nodes.push_back({{"id", node.id}, {"type", node.type}, {"name", node.name}, {"description", node.description}});
    }
    Value edges = Value::array();
    for (const auto& edge : info.edges) {
        Value e = {{"id", edge.id}, {"from_node", edge.from_node}, {"to_node", edge.to_node},
                   {"has_condition", edge.has_condition}};
        if (edge.has_condition) {
            e["condition_description"] = edge.condition_description;
        }
        edges.push_back(std::move(e));
    }
    j = Value{{"id", info.id},
              {"name", info.name},
              {"description", info.description},
              {"start_node", info.start_node},
              {"nodes", std::move(nodes)},
              {"edges", std::move(edges)},
              {"metadata", info.metadata}};
}

void WorkflowRegistry::register_workflow(std::shared_ptr<const Graph> graph) {
    if (!graph) {
        throw ValidationError("workflow cannot be null");
    }
    if (graph->id().empty()) {
        throw ValidationError("workflow ID cannot be empty");
    }
    try {
        graph->validate();
    } catch (const ValidationError& e) {
        throw ValidationError("invalid workflow " + graph->id() + ": " + e.what());
    }

    std::unique_lock lock(mutex_);
    if (workflows_.count(graph->id())) {
        throw ValidationError("workflow already registered: " + graph->id());
    }
    AGENTGRAPH_LOG_INFO("registered workflow {} ({} nodes)", graph->id(), graph->node_count());
    workflows_.emplace(graph->id(), std::move(graph));
}

std::shared_ptr<const Graph> WorkflowRegistry::get(const std::string& workflow_id) const {
    std::shared_lock lock(mutex_);
    auto it = workflows_.find(workflow_id);
    if (it == workflows_.end()) {
        throw std::out_of_range("workflow not found: " + workflow_id);
    }
    return it->second;
}

bool WorkflowRegistry::contains(const std::string& workflow_id) const {
    std::shared_lock lock(mutex_);
    return workflows_.count(workflow_id) > 0;
}

std::vector<std::string> WorkflowRegistry::list() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(workflows_.size());
    for (const auto& [id, _] : workflows_) {
        ids.push_back(id);
    }
    return ids;
}

void WorkflowRegistry::unregister_workflow(const std::string& workflow_id) {
    std::unique_lock lock(mutex_);
    if (workflows_.erase(workflow_id) == 0) {
        throw std::out_of_range("workflow not found: " + workflow_id);
    }
}

WorkflowInfo WorkflowRegistry::info(const std::string& workflow_id) const {
    auto graph = get(workflow_id);

    WorkflowInfo info;
    info.id = graph->id();
    info.name = graph->name();
    info.description = graph->description();
    info.start_node = graph->start_node();
    info.metadata = graph->metadata();

    for (const auto& node : graph->all_nodes()) {
        NodeInfo n{node->id(), node->type(), node->id(), ""};
        if (auto base = std::dynamic_pointer_cast<const BaseNode>(node)) {
            n.name = base->name();
            n.description = base->description();
        }
        info.nodes.push_back(std::move(n));
    }
    for (const auto& edge : graph->all_edges()) {
        EdgeInfo e{edge.id, edge.from_node, edge.to_node, edge.condition != nullptr, ""};
        if (edge.condition) {
            e.condition_description = edge.condition->description();
        }
        info.edges.push_back(std::move(e));
    }
    return info;
}

} // namespace agentgraph
