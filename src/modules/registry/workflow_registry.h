#ifndef AGENTGRAPH_MODULES_REGISTRY_WORKFLOW_REGISTRY_H
#define AGENTGRAPH_MODULES_REGISTRY_WORKFLOW_REGISTRY_H

#include "modules/graph/graph.h"
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace agentgraph {

struct NodeInfo {
    std::string id;
    std::string type;
    std::string name;
    std::string description;
};

struct EdgeInfo {
    std::string id;
    std::string from_node;
    std::string to_node;
    bool has_condition = false;
    std::string condition_description;
};

struct WorkflowInfo {
    std::string id;
    std::string name;
    std::string description;
    std::string start_node;
    std::vector<NodeInfo> nodes; // ordered by id
    std::vector<EdgeInfo> edges;
    Value metadata = Value::object();
};

void to_json(Value& j, const WorkflowInfo& info);

// Named, validated graphs available for execution. Lookups of unknown ids
// throw std::out_of_range.
class WorkflowRegistry {
public:
    // Throws ValidationError when the id is empty, the graph is invalid or
    // the id is already taken.
    void register_workflow(std::shared_ptr<const Graph> graph);

    std::shared_ptr<const Graph> get(const std::string& workflow_id) const;
    bool contains(const std::string& workflow_id) const;
    std::vector<std::string> list() const; // sorted
    void unregister_workflow(const std::string& workflow_id);
    WorkflowInfo info(const std::string& workflow_id) const;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::shared_ptr<const Graph>> workflows_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_REGISTRY_WORKFLOW_REGISTRY_H
