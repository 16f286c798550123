// Starts background executions and drives them through pause, resume and cancel.
#include "common/logger.h"
#include "modules/executor/executor.h"
#include "modules/registry/workflow_builder.h"
#include <chrono>
#include <iostream>
#include <thread>

namespace {

using agentgraph::ExecutionContext;
using agentgraph::NodeOutput;
using agentgraph::Value;
using agentgraph::WorkflowState;

// Three slow counting steps; each checks the context while sleeping.
std::shared_ptr<agentgraph::Graph> build_counter() {
    auto step = [](const ExecutionContext& ctx, const WorkflowState& state) {
        if (!ctx.sleep_for(std::chrono::milliseconds(200))) {
            throw std::runtime_error(ctx.error());
        }
        NodeOutput out;
        out.data["count"] = state.data.value("count", 0) + 1;
        return out;
    };
    return agentgraph::WorkflowBuilder("counter", "Slow counter")
        .add_function_node("one", step)
        .add_function_node("two", step)
        .add_function_node("three", step)
        .add_simple_edge("one", "two")
        .add_simple_edge("two", "three")
        .set_start_node("one")
        .build();
}

void print(const WorkflowState& state) {
    std::cout << state.id << " " << agentgraph::to_string(state.status) << " count=" << state.data.value("count", 0)
              << " steps=" << state.history.size() << "\n";
}

} // namespace

int main() {
    try {
        agentgraph::Executor executor;
        std::shared_ptr<const agentgraph::Graph> graph = build_counter();
        auto ctx = ExecutionContext::background();

        // 1. Pause after the first step, then resume to completion.
        std::string paused = executor.execute_async(ctx, graph, {});
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        executor.pause_execution(paused);
        print(executor.wait_for(paused, std::chrono::seconds(5)));
        executor.resume_execution(paused);
        print(executor.wait_for(paused, std::chrono::seconds(5)));

        // 2. Cancel through the control API.
        std::string cancelled = executor.execute_async(ctx, graph, {});
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        executor.cancel_execution(cancelled);
        print(executor.wait_for(cancelled, std::chrono::seconds(5)));

        // 3. Run out of time through the context deadline.
        auto short_ctx = ExecutionContext::with_timeout(ctx, std::chrono::milliseconds(300));
        std::string timed_out = executor.execute_async(short_ctx, graph, {});
        print(executor.wait_for(timed_out, std::chrono::seconds(5)));

        auto stats = executor.execution_stats();
        std::cout << "executions: " << stats.total << "\n";
        for (const auto& [status, count] : stats.status_counts) {
            std::cout << "  " << status << ": " << count << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
