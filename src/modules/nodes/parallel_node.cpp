#include "modules/nodes/parallel_node.h"
#include "common/logger.h"
#include "core/types/errors.h"
#include <algorithm>
#include <atomic>
#include <exception>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace agentgraph {

ParallelNode::ParallelNode(std::string id, std::vector<NodePtr> sub_nodes, size_t max_concurrency)
    : BaseNode(std::move(id), node_types::PARALLEL, "", "Parallel execution node"),
      sub_nodes_(std::move(sub_nodes)),
      max_concurrency_(max_concurrency) {}

void ParallelNode::validate() const {
    BaseNode::validate();
    if (max_concurrency_ == 0) {
        throw ValidationError("parallel node max_concurrency must be positive: " + id());
    }
    for (const auto& sub : sub_nodes_) {
        if (!sub) {
            throw ValidationError("parallel node has a null sub-node: " + id());
        }
        sub->validate();
    }
}

std::thread ParallelNode::start_worker(std::function<void()> work) const {
    return std::thread(std::move(work));
}

NodeOutput ParallelNode::execute(const ExecutionContext& ctx, const WorkflowState& state) const {
    NodeOutput output;
    if (sub_nodes_.empty()) {
        output.data = Value{{"results", Value::array()}};
        return output;
    }

    const size_t count = sub_nodes_.size();
    std::vector<std::optional<NodeOutput>> results(count);
    std::vector<std::exception_ptr> failures(count);
    std::atomic<size_t> next{0};

    auto work = [&]() {
        for (size_t i = next++; i < count; i = next++) {
            if (ctx.done()) {
                failures[i] = std::make_exception_ptr(std::runtime_error(ctx.error()));
                continue;
            }
            WorkflowState copy = state;
            try {
                results[i] = sub_nodes_[i]->execute(ctx, copy);
            } catch (...) {
                failures[i] = std::current_exception();
            }
        }
    };

    const size_t workers = std::min(max_concurrency_, count);
    std::vector<std::thread> threads;
    threads.reserve(workers);
    std::optional<std::string> spawn_failure;
    for (size_t i = 0; i < workers; ++i) {
        try {
            threads.push_back(start_worker(work));
        } catch (const std::system_error& e) {
            // Started workers stop pulling sub-nodes; they still borrow this frame.
            next = count;
            spawn_failure = e.what();
            break;
        }
    }
    for (auto& t : threads) {
        t.join();
    }
    if (spawn_failure) {
        throw std::runtime_error("parallel node " + id() + " could not start worker " +
                                 std::to_string(threads.size()) + ": " + *spawn_failure);
    }

    for (size_t i = 0; i < count; ++i) {
        if (!failures[i]) {
            continue;
        }
        try {
            std::rethrow_exception(failures[i]);
        } catch (const std::exception& e) {
            throw std::runtime_error("sub-node " + sub_nodes_[i]->id() + " failed: " + e.what());
        } catch (...) {
            throw std::runtime_error("sub-node " + sub_nodes_[i]->id() + " failed with unknown error");
        }
    }

    Value list = Value::array();
    Value combined = Value::object();
    for (size_t i = 0; i < count; ++i) {
        auto& result = *results[i];
        list.push_back(result.data);
        combined["subnode_" + std::to_string(i) + "_" + sub_nodes_[i]->id()] = result.data;
        output.messages.insert(output.messages.end(), result.messages.begin(), result.messages.end());
    }
    AGENTGRAPH_LOG_DEBUG("parallel node {} finished {} sub-nodes with {} workers", id(), count, workers);

    output.data = Value{{"results", std::move(list)}, {"combined", std::move(combined)}};
    output.metadata = Value{{"sub_node_count", count}, {"max_concurrency", max_concurrency_}};
    return output;
}

} // namespace agentgraph
