#ifndef AGENTGRAPH_MODULES_EXECUTOR_EXECUTOR_H
#define AGENTGRAPH_MODULES_EXECUTOR_EXECUTOR_H

#include "core/context/execution_context.h"
#include "core/types/node.h"
#include "core/types/state.h"
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace agentgraph {

class Graph;

// Drives WorkflowState through a Graph, either on the caller's thread or as
// a managed background execution with pause/resume/cancel control.
//
// Status: PENDING -> RUNNING -> {COMPLETED, FAILED, CANCELLED}, RUNNING <-> PAUSED.
// Pause and cancel are cooperative: they are observed between nodes, never
// during one.
class Executor {
public:
    struct Config {
        size_t max_iterations = 100;
    };

    struct Stats {
        size_t total = 0;
        std::map<std::string, size_t> status_counts;
        std::chrono::milliseconds total_duration{0};
        std::chrono::milliseconds average_duration{0};
    };

    Executor();
    explicit Executor(Config config);
    ~Executor(); // joins every worker

    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;

    const Config& config() const { return config_; }

    // Synchronous run. Throws WorkflowException subclasses carrying the final state.
    WorkflowOutput execute(const ExecutionContext& ctx, const Graph& graph, const WorkflowInput& input) const;

    // Starts a background execution and returns its id immediately. Failures
    // are reported through get_execution(id), not thrown.
    std::string execute_async(const ExecutionContext& ctx, std::shared_ptr<const Graph> graph,
                              const WorkflowInput& input);

    WorkflowState get_execution(const std::string& execution_id) const; // deep copy
    std::vector<WorkflowState> list_executions() const;                 // oldest first
    Stats execution_stats() const;

    void cancel_execution(const std::string& execution_id);
    void pause_execution(const std::string& execution_id);
    void resume_execution(const std::string& execution_id);

    // Blocks until the execution is terminal or paused with its worker
    // stopped, or the timeout elapses. Returns the state at that point.
    WorkflowState wait_for(const std::string& execution_id, std::chrono::milliseconds timeout) const;

    // Drops terminal executions last updated before now - older_than.
    size_t cleanup_completed_executions(std::chrono::milliseconds older_than);

    // The iteration loop. Runs until the current node is empty, the state is
    // paused or cancelled, or an error is raised.
    void execute_graph(const ExecutionContext& ctx, const Graph& graph, WorkflowState& state) const;

    std::string determine_next_node(const ExecutionContext& ctx, const Graph& graph,
                                    const std::string& current_node, const WorkflowState& state,
                                    const NodeOutput& output) const;

private:
    struct ExecutionRecord {
        WorkflowState state;
        std::shared_ptr<const Graph> graph;
        ExecutionContext ctx;
        std::thread worker;
        bool worker_active = false;
    };

    void run_loop(const ExecutionContext& ctx, const Graph& graph, WorkflowState& state,
                  std::shared_mutex* guard) const;
    void run_worker(std::shared_ptr<ExecutionRecord> record);
    void launch_worker(const std::shared_ptr<ExecutionRecord>& record); // caller holds mutex_

    std::shared_ptr<ExecutionRecord> find_record(const std::string& execution_id) const; // caller holds mutex_

    static WorkflowState seed_state(const Graph& graph, const WorkflowInput& input);
    static WorkflowOutput package_output(const WorkflowState& state);
    static void record_failure(WorkflowState& state, const WorkflowError& error, WorkflowStatus status);

    Config config_;

    mutable std::shared_mutex mutex_;
    mutable std::condition_variable_any changed_;
    std::unordered_map<std::string, std::shared_ptr<ExecutionRecord>> executions_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_EXECUTOR_EXECUTOR_H
