#include <catch2/catch_test_macros.hpp>
#include "core/types/errors.h"
#include "modules/conditions/conditions.h"
#include "modules/executor/executor.h"
#include "modules/registry/template_registry.h"
#include "modules/registry/workflow_builder.h"
#include "modules/registry/workflow_registry.h"
#include "test_support.h"
#include <cctype>

using namespace agentgraph;
using agentgraph::testing::history_ids;
using agentgraph::testing::scripted;

namespace {

FunctionNode::Function set_value(const std::string& key, Value value) {
    return [key, value](const ExecutionContext&, const WorkflowState&) {
        NodeOutput out;
        out.data[key] = value;
        return out;
    };
}

} // namespace

TEST_CASE("Builder assembles a runnable workflow", "[registry]") {
    auto graph = WorkflowBuilder("greet", "Greeter", "Says hello")
                     .add_node(std::make_shared<StartNode>("start"))
                     .add_function_node("hello", set_value("greeting", "hello"))
                     .add_transform_node("shout", [](const ExecutionContext&, const Value& data) {
                         std::string text = data.at("greeting").get<std::string>();
                         for (auto& c : text) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
                         return Value{{"greeting", text}};
                     })
                     .add_node(std::make_shared<EndNode>("end", "{{ greeting }}!"))
                     .add_simple_edge("start", "hello")
                     .add_simple_edge("hello", "shout")
                     .add_edge("shout", "end", std::make_shared<SimpleCondition>("greeting", SimpleCondition::Op::EXISTS))
                     .set_start_node("start")
                     .set_metadata("version", 2)
                     .build();

    REQUIRE(graph->description() == "Says hello");
    REQUIRE(graph->metadata()["version"] == 2);

    auto output = Executor().execute(ExecutionContext::background(), *graph, WorkflowInput{});
    REQUIRE(output.result == "HELLO!");
    REQUIRE(history_ids(output.state) == std::vector<std::string>{"start", "hello", "shout", "end"});
}

TEST_CASE("Builder reports the first construction error", "[registry]") {
    WorkflowBuilder builder("broken", "Broken");
    builder.add_node(scripted("a"))
        .add_simple_edge("a", "missing")
        .add_node(scripted("a"))
        .set_start_node("a");

    try {
        (void)builder.build();
        FAIL("expected ValidationError");
    } catch (const ValidationError& e) {
        REQUIRE(std::string(e.what()) == "to node does not exist: missing");
    }

    WorkflowBuilder unstarted("nostart", "No start");
    unstarted.add_node(scripted("a"));
    REQUIRE_THROWS_AS(unstarted.build(), ValidationError);
}

TEST_CASE("Workflow registry", "[registry]") {
    WorkflowRegistry registry;
    auto graph = WorkflowBuilder("wf", "Workflow")
                     .add_node(scripted("a"))
                     .add_node(scripted("b"))
                     .add_edge("a", "b", std::make_shared<AlwaysTrueCondition>())
                     .set_start_node("a")
                     .build_and_register(registry);

    REQUIRE(registry.contains("wf"));
    REQUIRE(registry.get("wf") == graph);
    REQUIRE_THROWS_AS(registry.register_workflow(graph), ValidationError);
    REQUIRE_THROWS_AS(registry.register_workflow(std::make_shared<Graph>("", "Nameless")), ValidationError);
    REQUIRE_THROWS_AS(registry.register_workflow(std::make_shared<Graph>("empty", "Empty")), ValidationError);
    REQUIRE_THROWS_AS(registry.get("nope"), std::out_of_range);

    registry.register_workflow(WorkflowBuilder("another", "Another").add_node(scripted("x")).set_start_node("x").build());
    REQUIRE(registry.list() == std::vector<std::string>{"another", "wf"});

    WorkflowInfo info = registry.info("wf");
    REQUIRE(info.start_node == "a");
    REQUIRE(info.nodes.size() == 2);
    REQUIRE(info.nodes[0].type == "scripted");
    REQUIRE(info.edges.size() == 1);
    REQUIRE(info.edges[0].has_condition);
    REQUIRE(info.edges[0].condition_description == "always true");

    Value j = info;
    REQUIRE(j["edges"][0]["from_node"] == "a");

    registry.unregister_workflow("wf");
    REQUIRE_FALSE(registry.contains("wf"));
    REQUIRE_THROWS_AS(registry.unregister_workflow("wf"), std::out_of_range);
}

TEST_CASE("Template registry instantiates parameterised graphs", "[registry]") {
    TemplateRegistry templates;

    WorkflowTemplate counter;
    counter.id = "counter";
    counter.name = "Counter";
    counter.parameters = {
        {"label", ParameterType::STRING, "display label", true, nullptr},
        {"start", ParameterType::INT, "initial count", false, 10},
    };
    counter.factory = [](const Value& params) {
        return WorkflowBuilder("counter_" + params.at("label").get<std::string>(), "Counter")
            .add_function_node("init", set_value("count", params.at("start")))
            .set_start_node("init")
            .build();
    };
    templates.register_template(counter);

    auto graph = templates.instantiate("counter", {{"label", "a"}});
    REQUIRE(graph->id() == "counter_a");
    auto output = Executor().execute(ExecutionContext::background(), *graph, WorkflowInput{});
    REQUIRE(output.data["count"] == 10);

    auto custom = templates.instantiate("counter", {{"label", "b"}, {"start", 3}});
    REQUIRE(Executor().execute(ExecutionContext::background(), *custom, WorkflowInput{}).data["count"] == 3);

    REQUIRE_THROWS_AS(templates.instantiate("counter", Value::object()), ValidationError);
    REQUIRE_THROWS_AS(templates.instantiate("counter", {{"label", 5}}), ValidationError);
    REQUIRE_THROWS_AS(templates.instantiate("counter", {{"label", "c"}, {"start", "x"}}), ValidationError);
    REQUIRE_THROWS_AS(templates.instantiate("missing", Value::object()), std::out_of_range);
    REQUIRE_THROWS_AS(templates.register_template(counter), ValidationError);

    REQUIRE(templates.list() == std::vector<std::string>{"counter"});
    REQUIRE(parameter_type_from_string("float") == ParameterType::FLOAT);
    REQUIRE_THROWS_AS(parameter_type_from_string("date"), ValidationError);
}
