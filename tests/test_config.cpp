#include <catch2/catch_test_macros.hpp>
#include "common/config/engine_config.h"
#include "common/logger.h"
#include "common/tools/registry.h"
#include "common/utils/template_renderer.h"
#include "common/utils/yaml_json.h"
#include "core/context/execution_context.h"
#include "core/types/errors.h"
#include "core/types/state.h"
#include "modules/trace/trace_exporter.h"
#include <filesystem>
#include <fstream>
#include <thread>

using namespace agentgraph;
namespace fs = std::filesystem;

namespace {

fs::path write_temp(const std::string& name, const std::string& content) {
    fs::path path = fs::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path;
}

} // namespace

TEST_CASE("Engine config parsing", "[config]") {
    SECTION("missing file gives defaults") {
        EngineConfig config = load_engine_config("/nonexistent/agentgraph.json");
        REQUIRE(config.max_iterations == 100);
        REQUIRE(config.log_level == "info");
        REQUIRE_FALSE(config.llm.has_value());
    }

    SECTION("values and relative model path") {
        auto path = write_temp("agentgraph_test_config.json",
                               R"({"max_iterations": 7, "log_level": "debug",
                                   "llm": {"model_path": "m.gguf", "n_ctx": 1024, "temperature": 0.1}})");
        EngineConfig config = load_engine_config(path.string());
        REQUIRE(config.max_iterations == 7);
        REQUIRE(config.log_level == "debug");
        REQUIRE(config.llm.has_value());
        REQUIRE(config.llm->n_ctx == 1024);
        REQUIRE(fs::path(config.llm->model_path).is_absolute());
        REQUIRE(fs::path(config.llm->model_path).filename() == "m.gguf");
        fs::remove(path);
    }

    SECTION("malformed or mistyped config throws") {
        auto path = write_temp("agentgraph_bad_config.json", "{ not json");
        REQUIRE_THROWS_AS(load_engine_config(path.string()), std::runtime_error);
        fs::remove(path);

        REQUIRE_THROWS_AS(parse_engine_config(Value::parse(R"({"max_iterations": "lots"})")), std::runtime_error);
        REQUIRE_THROWS_AS(parse_engine_config(Value::parse(R"({"max_iterations": 0})")), std::runtime_error);
        REQUIRE_THROWS_AS(parse_engine_config(Value::parse(R"({"llm": {"n_ctx": "big"}})")), std::runtime_error);
        REQUIRE_THROWS_AS(parse_engine_config(Value::array()), std::runtime_error);
    }
}

TEST_CASE("Log level names", "[config]") {
    REQUIRE_NOTHROW(set_log_level("warn"));
    REQUIRE(logger()->level() == spdlog::level::warn);
    REQUIRE_THROWS_AS(set_log_level("chatty"), std::invalid_argument);
    set_log_level("info");
}

TEST_CASE("YAML to JSON conversion", "[config]") {
    Value doc = parse_yaml(R"(
count: 3
ratio: 0.5
flag: yes
nothing: ~
quoted: "42"
list: [1, two]
nested: {a: {b: true}}
)");
    REQUIRE(doc["count"] == 3);
    REQUIRE(doc["ratio"] == 0.5);
    REQUIRE(doc["flag"] == true);
    REQUIRE(doc["nothing"].is_null());
    REQUIRE(doc["quoted"] == "42");
    REQUIRE(doc["list"] == Value{1, "two"});
    REQUIRE(doc["nested"]["a"]["b"] == true);
    REQUIRE_THROWS_AS(parse_yaml("a: [1, 2"), std::runtime_error);
}

TEST_CASE("Template rendering keeps single-expression types", "[config]") {
    Value ctx = {{"n", 4}, {"items", {1, 2}}, {"name", "ann"}};
    REQUIRE(InjaTemplateRenderer::render("hi {{ name }}", ctx) == "hi ann");
    REQUIRE(InjaTemplateRenderer::render_value("{{ n }}", ctx) == 4);
    REQUIRE(InjaTemplateRenderer::render_value("{{ items }}", ctx) == Value{1, 2});
    REQUIRE(InjaTemplateRenderer::render_value("n={{ n }}", ctx) == "n=4");
    REQUIRE(InjaTemplateRenderer::evaluate("n > 3", ctx));
    REQUIRE_THROWS_AS(InjaTemplateRenderer::evaluate("name", ctx), std::runtime_error);
}

TEST_CASE("Tool registry", "[config]") {
    ToolRegistry tools;
    REQUIRE(tools.list_tools().empty());
    tools.register_tool("twice", [](const Value& args) { return Value{{"value", args.at("n").get<int>() * 2}}; });
    REQUIRE(tools.has_tool("twice"));
    REQUIRE(tools.call_tool("twice", {{"n", 4}})["value"] == 8);
    REQUIRE_THROWS_AS(tools.call_tool("thrice", Value::object()), std::runtime_error);
    REQUIRE(tools.unregister_tool("twice"));
    REQUIRE_FALSE(tools.unregister_tool("twice"));

    ToolRegistry builtin(true);
    REQUIRE(builtin.list_tools() == std::vector<std::string>{"calculate", "echo", "word_count"});
    REQUIRE(builtin.call_tool("calculate", {{"a", "1.5"}, {"b", 2}, {"op", "+"}})["result"] == 3.5);
    REQUIRE_THROWS_AS(builtin.call_tool("calculate", {{"a", 1}, {"b", 2}, {"op", "%"}}), std::invalid_argument);
}

TEST_CASE("Execution context cancellation and deadlines", "[config]") {
    auto root = ExecutionContext::background();
    REQUIRE_FALSE(root.done());
    REQUIRE(root.error().empty());

    auto parent = ExecutionContext::with_cancel(root);
    auto child = ExecutionContext::with_timeout(parent, std::chrono::hours(1));
    REQUIRE(child.deadline().has_value());
    parent.cancel();
    REQUIRE(child.done());
    REQUIRE(child.error() == ExecutionContext::kCanceled);
    REQUIRE_FALSE(root.done());

    auto quick = ExecutionContext::with_timeout(root, std::chrono::milliseconds(5));
    REQUIRE_FALSE(quick.sleep_for(std::chrono::seconds(2)));
    REQUIRE(quick.error() == ExecutionContext::kDeadlineExceeded);
}

TEST_CASE("State and error serialization", "[config]") {
    REQUIRE(status_from_string("paused") == WorkflowStatus::PAUSED);
    REQUIRE_THROWS_AS(status_from_string("sleeping"), std::invalid_argument);
    REQUIRE(is_terminal(WorkflowStatus::CANCELLED));
    REQUIRE_FALSE(is_terminal(WorkflowStatus::PAUSED));

    NodeExecutionError error("n1", "bad input");
    WorkflowError record = error.to_error();
    REQUIRE(record.code == "node_execution_error");
    REQUIRE(record.node_id == "n1");
    Value j = record;
    REQUIRE(j["code"] == "node_execution_error");

    auto input = Value::parse(R"({"data": {"x": 1}, "query": "q", "messages": [{"role": "user", "content": "hi"}]})")
                     .get<WorkflowInput>();
    REQUIRE(input.data["x"] == 1);
    REQUIRE(input.query == "q");
    REQUIRE(input.messages.at(0).content == "hi");
}

TEST_CASE("Trace export from history", "[config]") {
    WorkflowState state;
    state.id = "exec-1";
    state.workflow_id = "wf";
    state.status = WorkflowStatus::FAILED;

    NodeExecution ok;
    ok.node_id = "a";
    ok.node_type = "assign";
    ok.input = {{"x", 1}, {"y", 2}};
    ok.output = {{"x", 1}, {"z", 3}};
    ok.duration = std::chrono::microseconds(1500);
    state.history.push_back(ok);

    NodeExecution bad;
    bad.node_id = "b";
    bad.node_type = "tool";
    bad.error = NodeExecutionError("b", "boom").to_error();
    state.history.push_back(bad);

    auto records = TraceExporter::records(state);
    REQUIRE(records.size() == 2);
    REQUIRE(records[0].trace_id == "exec-1");
    REQUIRE(records[0].status == "success");
    REQUIRE(records[0].context_delta == Value{{"z", 3}});
    REQUIRE(records[0].duration_ms == 1.5);
    REQUIRE(records[1].status == "failed");
    REQUIRE(records[1].error_code == "node_execution_error");

    Value exported = TraceExporter::export_json(state);
    REQUIRE(exported["status"] == "failed");
    REQUIRE(exported["records"].size() == 2);

    fs::path path = fs::temp_directory_path() / "agentgraph_trace_test.json";
    TraceExporter::write_file(state, path.string());
    std::ifstream in(path);
    REQUIRE(Value::parse(in)["execution_id"] == "exec-1");
    in.close();
    fs::remove(path);
    REQUIRE_THROWS_AS(TraceExporter::write_file(state, "/nonexistent/dir/trace.json"), std::runtime_error);
}
