#ifndef AGENTGRAPH_MODULES_NODES_PARALLEL_NODE_H
#define AGENTGRAPH_MODULES_NODES_PARALLEL_NODE_H

#include "modules/nodes/basic_nodes.h"
#include <cstddef>
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace agentgraph {

// Runs sub-nodes concurrently, each on its own copy of the state.
// Results are reported in sub-node order regardless of completion order.
class ParallelNode : public BaseNode {
public:
    ParallelNode(std::string id, std::vector<NodePtr> sub_nodes, size_t max_concurrency = 5);

    void validate() const override;
    [[nodiscard]] NodeOutput execute(const ExecutionContext& ctx, const WorkflowState& state) const override;

    const std::vector<NodePtr>& sub_nodes() const { return sub_nodes_; }
    size_t max_concurrency() const { return max_concurrency_; }

protected:
    // Starts one worker thread. Throws std::system_error when no thread can be created.
    virtual std::thread start_worker(std::function<void()> work) const;

private:
    std::vector<NodePtr> sub_nodes_;
    size_t max_concurrency_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_NODES_PARALLEL_NODE_H
