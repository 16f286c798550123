#include <catch2/catch_test_macros.hpp>
#include "core/types/errors.h"
#include "modules/conditions/conditions.h"
#include "modules/executor/executor.h"
#include "modules/graph/graph.h"
#include "modules/nodes/basic_nodes.h"
#include "test_support.h"

using namespace agentgraph;
using agentgraph::testing::history_ids;
using agentgraph::testing::scripted;

namespace {

ConditionPtr field_equals(const std::string& field, Value value) {
    return std::make_shared<SimpleCondition>(field, SimpleCondition::Op::EQ, std::move(value));
}

// start -> n1 -> n2 -> n3 -> end
std::unique_ptr<Graph> linear_chain() {
    auto graph = std::make_unique<Graph>("chain", "Chain");
    graph->add_node(std::make_shared<StartNode>("start"));
    graph->add_node(scripted("n1", {{"a", 1}}));
    graph->add_node(scripted("n2", {{"b", 2}}));
    graph->add_node(scripted("n3", {{"a", 3}}));
    graph->add_node(std::make_shared<EndNode>("end"));
    graph->add_edge(Edge("start", "n1"));
    graph->add_edge(Edge("n1", "n2"));
    graph->add_edge(Edge("n2", "n3"));
    graph->add_edge(Edge("n3", "end"));
    graph->set_start_node("start");
    return graph;
}

} // namespace

TEST_CASE("Linear chain completes with the chain as history", "[executor]") {
    auto graph = linear_chain();
    Executor executor;

    auto output = executor.execute(ExecutionContext::background(), *graph, WorkflowInput{});

    REQUIRE(output.state.status == WorkflowStatus::COMPLETED);
    REQUIRE(history_ids(output.state) == std::vector<std::string>{"start", "n1", "n2", "n3", "end"});
    REQUIRE(output.data["a"] == 3);
    REQUIRE(output.data["b"] == 2);
    REQUIRE(output.state.current_node.empty());
    REQUIRE_FALSE(output.state.error.has_value());
    REQUIRE(output.metadata["iterations"] == 5);
    REQUIRE(output.metadata["status"] == "completed");
    REQUIRE(output.result.is_null());

    for (const auto& step : output.state.history) {
        REQUIRE(step.end_time.has_value());
        REQUIRE(step.end_time.value() >= step.start_time);
    }
    REQUIRE(output.state.history[1].input.empty());
    REQUIRE(output.state.history[2].input["a"] == 1);
}

TEST_CASE("History is deterministic for deterministic nodes", "[executor]") {
    auto graph = linear_chain();
    Executor executor;
    auto first = executor.execute(ExecutionContext::background(), *graph, WorkflowInput{});
    auto second = executor.execute(ExecutionContext::background(), *graph, WorkflowInput{});

    REQUIRE(history_ids(first.state) == history_ids(second.state));
    REQUIRE(first.data == second.data);
    REQUIRE(first.state.id != second.state.id);
}

TEST_CASE("Doubling transform turns x=3 into 6", "[executor]") {
    Graph graph("double", "Double");
    graph.add_node(std::make_shared<StartNode>("start"));
    graph.add_node(std::make_shared<TransformNode>("double", [](const ExecutionContext&, const Value& data) {
        return Value{{"x", data.at("x").get<int>() * 2}};
    }));
    graph.add_node(std::make_shared<EndNode>("end", "{{ x }}"));
    graph.add_edge(Edge("start", "double"));
    graph.add_edge(Edge("double", "end"));
    graph.set_start_node("start");

    WorkflowInput input;
    input.data = {{"x", 3}};
    auto output = Executor().execute(ExecutionContext::background(), graph, input);

    REQUIRE(output.state.status == WorkflowStatus::COMPLETED);
    REQUIRE(output.data["x"] == 6);
    REQUIRE(output.result == 6);
}

TEST_CASE("A failing node fails the run and stops the history", "[executor]") {
    auto graph = linear_chain();
    graph->remove_node("n2");
    auto failing = scripted("n2");
    failing->fail_with("boom");
    graph->add_node(failing);
    graph->add_edge(Edge("n1", "n2"));
    graph->add_edge(Edge("n2", "n3"));

    Executor executor;
    try {
        (void)executor.execute(ExecutionContext::background(), *graph, WorkflowInput{});
        FAIL("expected NodeExecutionError");
    } catch (const NodeExecutionError& e) {
        REQUIRE(e.code() == ErrorCode::NODE_EXECUTION);
        REQUIRE(e.node_id() == "n2");
        REQUIRE(e.cause() == "boom");
        REQUIRE(e.state() != nullptr);

        const WorkflowState& state = *e.state();
        REQUIRE(state.status == WorkflowStatus::FAILED);
        REQUIRE(state.error.has_value());
        REQUIRE(state.error->code == "node_execution_error");
        REQUIRE(history_ids(state) == std::vector<std::string>{"start", "n1", "n2"});
        REQUIRE(state.history.back().error.has_value());
        REQUIRE_FALSE(state.data.contains("b"));
    }
}

TEST_CASE("A node throwing a non-standard exception fails like any other", "[executor]") {
    Graph graph("odd", "Odd");
    graph.add_node(std::make_shared<StartNode>("start"));
    graph.add_node(std::make_shared<FunctionNode>("odd", [](const ExecutionContext&, const WorkflowState&) -> NodeOutput {
        throw 7;
    }));
    graph.add_node(std::make_shared<EndNode>("end"));
    graph.add_edge(Edge("start", "odd"));
    graph.add_edge(Edge("odd", "end"));
    graph.set_start_node("start");

    try {
        (void)graph.execute(ExecutionContext::background(), WorkflowInput{});
        FAIL("expected NodeExecutionError");
    } catch (const NodeExecutionError& e) {
        REQUIRE(e.node_id() == "odd");
        REQUIRE(e.cause() == "unknown exception");
        REQUIRE(e.state() != nullptr);

        const WorkflowState& state = *e.state();
        REQUIRE(state.status == WorkflowStatus::FAILED);
        REQUIRE(state.error->code == "node_execution_error");
        REQUIRE(history_ids(state) == std::vector<std::string>{"start", "odd"});
        REQUIRE(state.history.back().error.has_value());
    }
}

TEST_CASE("Routing takes the first satisfied edge", "[executor]") {
    Graph graph("branch", "Branch");
    graph.add_node(scripted("router"));
    graph.add_node(scripted("x", {{"took", "x"}}));
    graph.add_node(scripted("y", {{"took", "y"}}));
    graph.add_edge(Edge("router", "x", field_equals("route", "a")));
    graph.add_edge(Edge("router", "y", std::make_shared<SimpleCondition>("flag", SimpleCondition::Op::EXISTS)));
    graph.set_start_node("router");

    Executor executor;
    auto run = [&](Value data) {
        WorkflowInput input;
        input.data = std::move(data);
        return executor.execute(ExecutionContext::background(), graph, input);
    };

    SECTION("only the first edge matches") {
        auto output = run({{"route", "a"}});
        REQUIRE(history_ids(output.state) == std::vector<std::string>{"router", "x"});
    }

    SECTION("only the second edge matches") {
        auto output = run({{"route", "b"}, {"flag", true}});
        REQUIRE(history_ids(output.state) == std::vector<std::string>{"router", "y"});
    }

    SECTION("both match and the earlier edge wins") {
        auto output = run({{"route", "a"}, {"flag", true}});
        REQUIRE(output.data["took"] == "x");
    }

    SECTION("neither matches") {
        try {
            (void)run({{"route", "b"}});
            FAIL("expected RoutingError");
        } catch (const RoutingError& e) {
            REQUIRE(e.code() == ErrorCode::ROUTING);
            REQUIRE(e.state()->status == WorkflowStatus::FAILED);
            REQUIRE(history_ids(*e.state()) == std::vector<std::string>{"router"});
        }
    }

    SECTION("a throwing condition is a routing failure") {
        try {
            (void)run(Value::object());
            FAIL("expected RoutingError");
        } catch (const RoutingError& e) {
            REQUIRE(e.code() == ErrorCode::CONDITION);
            REQUIRE(e.state()->error->code == "condition_error");
        }
    }
}

TEST_CASE("Node routing overrides", "[executor]") {
    Graph graph("override", "Override");
    auto jump = scripted("jump");
    graph.add_node(jump);
    graph.add_node(scripted("skipped"));
    graph.add_node(scripted("target"));
    graph.add_edge(Edge("jump", "skipped"));
    graph.set_start_node("jump");

    Executor executor;

    SECTION("override to a known node") {
        jump->route_to("target");
        auto output = executor.execute(ExecutionContext::background(), graph, WorkflowInput{});
        REQUIRE(history_ids(output.state) == std::vector<std::string>{"jump", "target"});
    }

    SECTION("empty override ends the run") {
        jump->route_to("");
        auto output = executor.execute(ExecutionContext::background(), graph, WorkflowInput{});
        REQUIRE(output.state.status == WorkflowStatus::COMPLETED);
        REQUIRE(history_ids(output.state) == std::vector<std::string>{"jump"});
    }

    SECTION("override to an unknown node") {
        jump->route_to("nowhere");
        REQUIRE_THROWS_AS(executor.execute(ExecutionContext::background(), graph, WorkflowInput{}), RoutingError);
    }
}

TEST_CASE("Guarded self-loop hits the iteration ceiling", "[executor]") {
    Graph graph("loop", "Loop");
    auto spin = scripted("spin");
    graph.add_node(spin);
    graph.add_edge(Edge("spin", "spin", std::make_shared<AlwaysTrueCondition>()));
    graph.set_start_node("spin");

    Executor executor;
    try {
        (void)executor.execute(ExecutionContext::background(), graph, WorkflowInput{});
        FAIL("expected RunawayError");
    } catch (const RunawayError& e) {
        REQUIRE(e.code() == ErrorCode::MAX_ITERATIONS);
        REQUIRE(e.state()->history.size() == 100);
        REQUIRE(e.state()->status == WorkflowStatus::FAILED);
        REQUIRE(e.state()->error->code == "max_iterations_exceeded");
    }
    REQUIRE(spin->calls() == 100);

    Executor small(Executor::Config{5});
    REQUIRE_THROWS_AS(small.execute(ExecutionContext::background(), graph, WorkflowInput{}), RunawayError);
    REQUIRE_THROWS_AS(Executor(Executor::Config{0}), std::invalid_argument);
}

TEST_CASE("Invalid graphs run no nodes", "[executor]") {
    Executor executor;

    SECTION("unconditional cycle") {
        Graph graph("cycle", "Cycle");
        auto a = scripted("a");
        auto b = scripted("b");
        graph.add_node(a);
        graph.add_node(b);
        graph.add_edge(Edge("a", "b"));
        graph.add_edge(Edge("b", "a"));
        graph.set_start_node("a");

        try {
            (void)executor.execute(ExecutionContext::background(), graph, WorkflowInput{});
            FAIL("expected ValidationError");
        } catch (const ValidationError& e) {
            REQUIRE(e.state()->status == WorkflowStatus::FAILED);
            REQUIRE(e.state()->history.empty());
        }
        REQUIRE(a->calls() == 0);
        REQUIRE(b->calls() == 0);
    }

    SECTION("no start node") {
        Graph graph("nostart", "No start");
        auto a = scripted("a");
        graph.add_node(a);
        REQUIRE_THROWS_AS(executor.execute(ExecutionContext::background(), graph, WorkflowInput{}), ValidationError);
        REQUIRE(a->calls() == 0);
    }

    SECTION("node that fails validation") {
        Graph graph("bad", "Bad node");
        auto a = scripted("a");
        graph.add_node(a);
        graph.set_start_node("a");
        a->reject_validation();
        REQUIRE_THROWS_AS(executor.execute(ExecutionContext::background(), graph, WorkflowInput{}), ValidationError);
        REQUIRE(a->calls() == 0);
    }
}

TEST_CASE("Context cancellation stops at the next node boundary", "[executor]") {
    Executor executor;

    SECTION("already cancelled") {
        auto graph = linear_chain();
        auto ctx = ExecutionContext::with_cancel(ExecutionContext::background());
        ctx.cancel();
        try {
            (void)executor.execute(ctx, *graph, WorkflowInput{});
            FAIL("expected CancelledError");
        } catch (const CancelledError& e) {
            REQUIRE(e.state()->status == WorkflowStatus::CANCELLED);
            REQUIRE(e.state()->history.empty());
            REQUIRE(e.state()->error->code == "cancelled");
        }
    }

    SECTION("deadline passes while a node runs") {
        Graph graph("slow", "Slow");
        auto slow = scripted("slow", {{"done", true}});
        slow->sleep(std::chrono::milliseconds(60));
        auto after = scripted("after");
        graph.add_node(slow);
        graph.add_node(after);
        graph.add_edge(Edge("slow", "after"));
        graph.set_start_node("slow");

        auto ctx = ExecutionContext::with_timeout(ExecutionContext::background(), std::chrono::milliseconds(20));
        try {
            (void)executor.execute(ctx, graph, WorkflowInput{});
            FAIL("expected CancelledError");
        } catch (const CancelledError& e) {
            const auto& state = *e.state();
            REQUIRE(state.status == WorkflowStatus::CANCELLED);
            REQUIRE(history_ids(state) == std::vector<std::string>{"slow"});
            REQUIRE(state.data["done"] == true);
            REQUIRE(state.error->message.find("deadline") != std::string::npos);
        }
        REQUIRE(after->calls() == 0);
    }
}

TEST_CASE("Input seeding", "[executor]") {
    Graph graph("seed", "Seed");
    graph.add_node(scripted("only"));
    graph.set_start_node("only");

    WorkflowInput input;
    input.data = {{"a", 1}, {"b", 1}};
    input.context = {{"b", 2}};
    input.query = "hello";
    input.user_id = "u1";
    input.messages.emplace_back("user", "hi");

    auto output = Executor().execute(ExecutionContext::background(), graph, input);
    REQUIRE(output.data["a"] == 1);
    REQUIRE(output.data["b"] == 2);
    REQUIRE(output.data["query"] == "hello");
    REQUIRE(output.state.metadata["user_id"] == "u1");
    REQUIRE(output.messages.size() == 1);
    REQUIRE(output.state.workflow_id == "seed");
}
