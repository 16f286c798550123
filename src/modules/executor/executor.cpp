#include "modules/executor/executor.h"
#include "modules/graph/graph.h"
#include "common/logger.h"
#include "common/utils/id.h"
#include "core/types/errors.h"
#include <algorithm>
#include <mutex>
#include <system_error>

namespace agentgraph {

namespace {

template <typename Duration>
std::chrono::microseconds to_micros(Duration d) {
    return std::chrono::duration_cast<std::chrono::microseconds>(d);
}

// Applies a successful node's output to a state. Data keys are last-write-wins.
void apply_output(WorkflowState& state, const NodeOutput& output, const NodeExecution& execution) {
    if (output.data.is_object()) {
        for (auto it = output.data.begin(); it != output.data.end(); ++it) {
            state.data[it.key()] = it.value();
        }
    }
    state.messages.insert(state.messages.end(), output.messages.begin(), output.messages.end());
    state.history.push_back(execution);
    state.updated_at = Clock::now();
}

} // namespace

Executor::Executor() : Executor(Config{}) {}

Executor::Executor(Config config) : config_(config) {
    if (config_.max_iterations == 0) {
        throw std::invalid_argument("Executor max_iterations must be greater than zero");
    }
}

Executor::~Executor() {
    std::vector<std::thread> workers;
    {
        std::unique_lock lock(mutex_);
        for (auto& [id, record] : executions_) {
            // Stop loops at their next node boundary instead of running them out.
            if (record->worker_active && !is_terminal(record->state.status)) {
                record->state.status = WorkflowStatus::CANCELLED;
                record->state.updated_at = Clock::now();
            }
            if (record->worker.joinable()) {
                workers.push_back(std::move(record->worker));
            }
        }
    }
    changed_.notify_all();
    for (auto& worker : workers) {
        worker.join();
    }
}

WorkflowState Executor::seed_state(const Graph& graph, const WorkflowInput& input) {
    WorkflowState state;
    state.id = generate_uuid();
    state.workflow_id = graph.id();
    state.current_node = graph.start_node();
    state.data = input.data.is_object() ? input.data : Value::object();
    if (input.context.is_object()) {
        for (auto it = input.context.begin(); it != input.context.end(); ++it) {
            state.data[it.key()] = it.value();
        }
    }
    state.messages = input.messages;
    if (!input.user_id.empty()) {
        state.metadata["user_id"] = input.user_id;
    }
    if (!input.session_id.empty()) {
        state.metadata["session_id"] = input.session_id;
    }
    if (input.preferences.is_object() && !input.preferences.empty()) {
        state.metadata["preferences"] = input.preferences;
    }
    if (!input.query.empty()) {
        state.data["query"] = input.query;
    }
    state.created_at = Clock::now();
    state.updated_at = state.created_at;
    return state;
}

WorkflowOutput Executor::package_output(const WorkflowState& state) {
    WorkflowOutput output;
    auto it = state.data.find("result");
    output.result = it != state.data.end() ? *it : Value(nullptr);
    output.messages = state.messages;
    output.data = state.data;
    output.state = state;
    output.metadata = Value{
        {"execution_id", state.id},
        {"workflow_id", state.workflow_id},
        {"status", to_string(state.status)},
        {"iterations", state.history.size()},
        {"duration_ms", std::chrono::duration_cast<std::chrono::milliseconds>(
                            state.updated_at - state.created_at).count()}
    };
    return output;
}

void Executor::record_failure(WorkflowState& state, const WorkflowError& error, WorkflowStatus status) {
    if (!state.error) {
        state.error = error;
    }
    // A cancellation or an earlier failure is final.
    if (state.status != WorkflowStatus::CANCELLED && state.status != WorkflowStatus::FAILED) {
        state.status = status;
    }
    state.updated_at = Clock::now();
}

WorkflowOutput Executor::execute(const ExecutionContext& ctx, const Graph& graph,
                                 const WorkflowInput& input) const {
    WorkflowState state = seed_state(graph, input);
    AGENTGRAPH_LOG_INFO("Execution {} of workflow '{}' started", state.id, graph.id());

    try {
        graph.validate();
        run_loop(ctx, graph, state, nullptr);
    } catch (WorkflowException& e) {
        record_failure(state, e.to_error(),
                       e.code() == ErrorCode::CANCELLED ? WorkflowStatus::CANCELLED : WorkflowStatus::FAILED);
        e.attach_state(state);
        throw;
    }

    AGENTGRAPH_LOG_INFO("Execution {} finished with status {} after {} steps",
                        state.id, to_string(state.status), state.history.size());
    return package_output(state);
}

void Executor::execute_graph(const ExecutionContext& ctx, const Graph& graph, WorkflowState& state) const {
    run_loop(ctx, graph, state, nullptr);
}

void Executor::run_loop(const ExecutionContext& ctx, const Graph& graph, WorkflowState& state,
                        std::shared_mutex* guard) const {
    // With a guard the state lives in the registry: writes take the exclusive
    // lock briefly, and nodes see a private snapshot so readers never wait on them.
    auto exclusive = [&](auto&& fn) {
        if (guard == nullptr) {
            fn();
            return;
        }
        {
            std::unique_lock lock(*guard);
            fn();
        }
        changed_.notify_all();
    };

    const std::string execution_id = state.id;

    exclusive([&] {
        if (state.status == WorkflowStatus::PENDING) {
            state.status = WorkflowStatus::RUNNING;
        }
        state.updated_at = Clock::now();
    });

    try {
        std::string current;
        size_t iterations = 0;

        while (true) {
            WorkflowStatus status;
            WorkflowState snapshot;
            const WorkflowState* view = &state;
            if (guard != nullptr) {
                std::shared_lock lock(*guard);
                snapshot = state;
                view = &snapshot;
            }
            current = view->current_node;
            iterations = view->history.size();
            status = view->status;

            if (current.empty() || iterations >= config_.max_iterations) {
                break;
            }

            if (ctx.done()) {
                std::string reason = ctx.error();
                AGENTGRAPH_LOG_WARN("Execution {} cancelled before node '{}': {}", execution_id, current, reason);
                CancelledError error(reason);
                exclusive([&] { record_failure(state, error.to_error(), WorkflowStatus::CANCELLED); });
                throw error;
            }
            if (status == WorkflowStatus::PAUSED) {
                AGENTGRAPH_LOG_INFO("Execution {} paused before node '{}'", execution_id, current);
                return;
            }
            if (status == WorkflowStatus::CANCELLED) {
                AGENTGRAPH_LOG_INFO("Execution {} stopped before node '{}': cancelled", execution_id, current);
                return;
            }

            NodePtr node = graph.get_node(current);
            if (!node) {
                throw InvalidNodeError(current);
            }

            NodeExecution execution;
            execution.node_id = current;
            execution.node_type = node->type();
            execution.start_time = Clock::now();
            execution.input = view->data;

            AGENTGRAPH_LOG_DEBUG("Execution {} step {}: node '{}' ({})",
                                 execution_id, iterations + 1, current, execution.node_type);

            const auto started = std::chrono::steady_clock::now();
            NodeOutput output;
            std::optional<std::string> failure;
            try {
                output = node->execute(ctx, *view);
                if (!output.data.is_object() && !output.data.is_null()) {
                    failure = std::string("node output data must be an object, got ") + output.data.type_name();
                }
            } catch (const std::exception& e) {
                failure = e.what();
            } catch (...) {
                failure = "unknown exception";
            }
            execution.end_time = Clock::now();
            execution.duration = to_micros(std::chrono::steady_clock::now() - started);

            if (failure) {
                NodeExecutionError error(current, *failure);
                execution.error = error.to_error();
                AGENTGRAPH_LOG_WARN("Execution {}: {}", execution_id, error.what());
                exclusive([&] {
                    state.history.push_back(execution);
                    record_failure(state, *execution.error, WorkflowStatus::FAILED);
                });
                throw error;
            }

            execution.output = output.data.is_null() ? Value::object() : output.data;
            execution.metadata = output.metadata.is_object() ? output.metadata : Value::object();

            exclusive([&] { apply_output(state, output, execution); });
            if (guard != nullptr) {
                apply_output(snapshot, output, execution);
            }

            std::string next = determine_next_node(ctx, graph, current, *view, output);
            AGENTGRAPH_LOG_DEBUG("Execution {}: '{}' -> '{}'", execution_id, current, next.empty() ? "<end>" : next);

            exclusive([&] {
                state.current_node = next;
                state.updated_at = Clock::now();
            });
        }

        if (!current.empty()) {
            throw RunawayError(config_.max_iterations);
        }

        exclusive([&] {
            if (state.status == WorkflowStatus::RUNNING) {
                state.status = WorkflowStatus::COMPLETED;
            }
            state.updated_at = Clock::now();
        });
    } catch (const WorkflowException& e) {
        exclusive([&] {
            record_failure(state, e.to_error(),
                           e.code() == ErrorCode::CANCELLED ? WorkflowStatus::CANCELLED : WorkflowStatus::FAILED);
        });
        throw;
    }
}

std::string Executor::determine_next_node(const ExecutionContext& ctx, const Graph& graph,
                                          const std::string& current_node, const WorkflowState& state,
                                          const NodeOutput& output) const {
    if (output.next_node) {
        // An empty override ends the workflow.
        if (!output.next_node->empty() && !graph.has_node(*output.next_node)) {
            throw RoutingError(current_node, "node " + current_node + " routed to unknown node: " + *output.next_node);
        }
        return *output.next_node;
    }

    const auto edges = graph.get_edges(current_node);
    if (edges.empty()) {
        return "";
    }

    for (const auto& edge : edges) {
        if (!edge.condition) {
            return edge.to_node;
        }
        bool eligible = false;
        try {
            eligible = edge.condition->evaluate(ctx, state);
        } catch (const std::exception& e) {
            throw RoutingError(current_node,
                               "condition evaluation failed for edge " + edge.id + ": " + e.what(),
                               ErrorCode::CONDITION);
        } catch (...) {
            throw RoutingError(current_node,
                               "condition evaluation failed for edge " + edge.id + ": unknown exception",
                               ErrorCode::CONDITION);
        }
        AGENTGRAPH_LOG_TRACE("Edge {} [{}] -> {}", edge.id, edge.condition->description(), eligible);
        if (eligible) {
            return edge.to_node;
        }
    }

    throw RoutingError(current_node, "no edge condition was satisfied from node " + current_node);
}

std::string Executor::execute_async(const ExecutionContext& ctx, std::shared_ptr<const Graph> graph,
                                    const WorkflowInput& input) {
    if (!graph) {
        throw std::invalid_argument("graph must not be null");
    }

    auto record = std::make_shared<ExecutionRecord>();
    record->state = seed_state(*graph, input);
    record->graph = std::move(graph);
    record->ctx = ctx;
    const std::string execution_id = record->state.id;

    {
        std::unique_lock lock(mutex_);
        executions_[execution_id] = record;
        try {
            launch_worker(record);
        } catch (const std::system_error&) {
            executions_.erase(execution_id);
            throw;
        }
    }

    AGENTGRAPH_LOG_INFO("Execution {} of workflow '{}' started in background",
                        execution_id, record->graph->id());
    return execution_id;
}

void Executor::launch_worker(const std::shared_ptr<ExecutionRecord>& record) {
    record->worker_active = true;
    try {
        record->worker = std::thread(&Executor::run_worker, this, record);
    } catch (const std::system_error&) {
        record->worker_active = false;
        throw;
    }
}

void Executor::run_worker(std::shared_ptr<ExecutionRecord> record) {
    const std::string& execution_id = record->state.id;

    auto fail = [&](const WorkflowError& error, WorkflowStatus status) {
        std::unique_lock lock(mutex_);
        record_failure(record->state, error, status);
    };

    bool validated = false;
    while (true) {
        try {
            if (!validated) {
                record->graph->validate();
                validated = true;
            }
            run_loop(record->ctx, *record->graph, record->state, &mutex_);
        } catch (const WorkflowException& e) {
            fail(e.to_error(), e.code() == ErrorCode::CANCELLED ? WorkflowStatus::CANCELLED : WorkflowStatus::FAILED);
            AGENTGRAPH_LOG_WARN("Execution {} ended: {}", execution_id, e.what());
        } catch (const std::exception& e) {
            WorkflowError error;
            error.code = to_string(ErrorCode::PANIC);
            error.message = std::string("execution panicked: ") + e.what();
            fail(error, WorkflowStatus::FAILED);
            AGENTGRAPH_LOG_ERROR("Execution {} panicked: {}", execution_id, e.what());
        } catch (...) {
            WorkflowError error;
            error.code = to_string(ErrorCode::PANIC);
            error.message = "execution panicked: unknown exception";
            fail(error, WorkflowStatus::FAILED);
            AGENTGRAPH_LOG_ERROR("Execution {} panicked with a non-standard exception", execution_id);
        }

        // Retire under the lock resume_execution takes. A resume that already
        // set RUNNING saw this worker as active and is picked up here.
        {
            std::unique_lock lock(mutex_);
            if (record->state.status == WorkflowStatus::RUNNING) {
                AGENTGRAPH_LOG_DEBUG("Execution {} resumed before its worker stopped", execution_id);
                continue;
            }
            record->worker_active = false;
            AGENTGRAPH_LOG_DEBUG("Execution {} worker stopped with status {}",
                                 execution_id, to_string(record->state.status));
        }
        changed_.notify_all();
        return;
    }
}

std::shared_ptr<Executor::ExecutionRecord> Executor::find_record(const std::string& execution_id) const {
    auto it = executions_.find(execution_id);
    if (it == executions_.end()) {
        throw ExecutionNotFoundError(execution_id);
    }
    return it->second;
}

WorkflowState Executor::get_execution(const std::string& execution_id) const {
    std::shared_lock lock(mutex_);
    return find_record(execution_id)->state;
}

std::vector<WorkflowState> Executor::list_executions() const {
    std::vector<WorkflowState> states;
    {
        std::shared_lock lock(mutex_);
        states.reserve(executions_.size());
        for (const auto& [_, record] : executions_) {
            states.push_back(record->state);
        }
    }
    std::sort(states.begin(), states.end(), [](const WorkflowState& a, const WorkflowState& b) {
        return a.created_at != b.created_at ? a.created_at < b.created_at : a.id < b.id;
    });
    return states;
}

Executor::Stats Executor::execution_stats() const {
    Stats stats;
    size_t finished = 0;
    std::shared_lock lock(mutex_);
    stats.total = executions_.size();
    for (const auto& [_, record] : executions_) {
        const auto& state = record->state;
        ++stats.status_counts[to_string(state.status)];
        if (is_terminal(state.status)) {
            stats.total_duration += std::chrono::duration_cast<std::chrono::milliseconds>(
                state.updated_at - state.created_at);
            ++finished;
        }
    }
    if (finished > 0) {
        stats.average_duration = stats.total_duration / static_cast<int64_t>(finished);
    }
    return stats;
}

void Executor::cancel_execution(const std::string& execution_id) {
    {
        std::unique_lock lock(mutex_);
        auto record = find_record(execution_id);
        auto status = record->state.status;
        if (status != WorkflowStatus::RUNNING && status != WorkflowStatus::PENDING) {
            throw ControlError("execution cannot be cancelled, current status: " + to_string(status));
        }
        record->state.status = WorkflowStatus::CANCELLED;
        record->state.updated_at = Clock::now();
    }
    changed_.notify_all();
    AGENTGRAPH_LOG_INFO("Execution {} cancel requested", execution_id);
}

void Executor::pause_execution(const std::string& execution_id) {
    {
        std::unique_lock lock(mutex_);
        auto record = find_record(execution_id);
        auto status = record->state.status;
        if (status != WorkflowStatus::RUNNING) {
            throw ControlError("execution cannot be paused, current status: " + to_string(status));
        }
        record->state.status = WorkflowStatus::PAUSED;
        record->state.updated_at = Clock::now();
    }
    changed_.notify_all();
    AGENTGRAPH_LOG_INFO("Execution {} pause requested", execution_id);
}

void Executor::resume_execution(const std::string& execution_id) {
    std::thread finished;
    {
        std::unique_lock lock(mutex_);
        auto record = find_record(execution_id);
        auto status = record->state.status;
        if (status != WorkflowStatus::PAUSED) {
            throw ControlError("execution cannot be resumed, current status: " + to_string(status));
        }
        record->state.status = WorkflowStatus::RUNNING;
        record->state.updated_at = Clock::now();

        // A worker that has not yet seen the pause simply carries on.
        if (!record->worker_active) {
            finished = std::move(record->worker);
            try {
                launch_worker(record);
            } catch (const std::system_error&) {
                record->state.status = WorkflowStatus::PAUSED;
                throw;
            }
        }
    }
    changed_.notify_all();
    if (finished.joinable()) {
        finished.join();
    }
    AGENTGRAPH_LOG_INFO("Execution {} resumed", execution_id);
}

WorkflowState Executor::wait_for(const std::string& execution_id, std::chrono::milliseconds timeout) const {
    std::shared_lock lock(mutex_);
    auto record = find_record(execution_id);
    changed_.wait_for(lock, timeout, [&] {
        const auto status = record->state.status;
        return !record->worker_active && (is_terminal(status) || status == WorkflowStatus::PAUSED);
    });
    return record->state;
}

size_t Executor::cleanup_completed_executions(std::chrono::milliseconds older_than) {
    std::vector<std::thread> workers;
    size_t removed = 0;
    {
        std::unique_lock lock(mutex_);
        const auto cutoff = Clock::now() - older_than;
        for (auto it = executions_.begin(); it != executions_.end();) {
            const auto& record = it->second;
            if (is_terminal(record->state.status) && !record->worker_active &&
                record->state.updated_at < cutoff) {
                if (record->worker.joinable()) {
                    workers.push_back(std::move(record->worker));
                }
                it = executions_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    for (auto& worker : workers) {
        worker.join();
    }
    if (removed > 0) {
        AGENTGRAPH_LOG_DEBUG("Cleaned up {} finished executions", removed);
    }
    return removed;
}

} // namespace agentgraph
