#ifndef AGENTGRAPH_MODULES_GRAPH_GRAPH_H
#define AGENTGRAPH_MODULES_GRAPH_GRAPH_H

#include "core/context/execution_context.h"
#include "core/types/node.h"
#include "core/types/state.h"
#include "core/types/value.h"
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentgraph {

// A reusable workflow definition: nodes keyed by id and, per node, outgoing
// edges in insertion order. Construction is expected to finish before
// executions start; all accessors return copies and take a shared lock.
class Graph {
public:
    Graph(std::string id, std::string name, std::string description = "");

    Graph(const Graph&) = delete;
    Graph& operator=(const Graph&) = delete;

    const std::string& id() const { return id_; }
    const std::string& name() const { return name_; }
    std::string description() const;
    void set_description(std::string description);

    Value metadata() const;
    void set_metadata(Value metadata);
    void set_metadata_value(const std::string& key, Value value);

    // Throws ValidationError on invalid or duplicate nodes.
    void add_node(NodePtr node);

    // Throws ValidationError on empty or unknown endpoints. Fills in "from->to" as id.
    void add_edge(Edge edge);

    void set_start_node(const std::string& node_id);
    std::string start_node() const;

    // Checks non-empty, start node, node validity, edge endpoints and acyclicity.
    void validate() const;

    bool has_node(const std::string& node_id) const;
    NodePtr get_node(const std::string& node_id) const; // nullptr when absent
    std::vector<Edge> get_edges(const std::string& node_id) const;
    std::vector<NodePtr> all_nodes() const; // ordered by id
    std::vector<Edge> all_edges() const;    // grouped by source id, insertion order within
    size_t node_count() const;
    size_t edge_count() const;

    // Throws ValidationError if absent.
    void remove_node(const std::string& node_id);
    void remove_edge(const std::string& edge_id);

    // Same node objects, copied edge lists; id and name get a "_clone" suffix.
    std::unique_ptr<Graph> clone() const;

    // Validates and runs to completion on the calling thread with a
    // default-configured Executor. Throws WorkflowException subclasses; the
    // exception carries the final state where one exists.
    WorkflowOutput execute(const ExecutionContext& ctx, const WorkflowInput& input) const;

private:
    void detect_cycles() const; // caller holds the lock

    std::string id_;
    std::string name_;
    std::string description_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, NodePtr> nodes_;
    std::unordered_map<std::string, std::vector<Edge>> edges_;
    std::string start_node_;
    Value metadata_ = Value::object();
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_GRAPH_GRAPH_H
