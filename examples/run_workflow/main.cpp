// agentgraph_run: load a YAML workflow, execute it and export the trace.
#include "common/config/engine_config.h"
#include "common/llm/llama_provider.h"
#include "common/logger.h"
#include "common/tools/registry.h"
#include "core/types/errors.h"
#include "modules/executor/executor.h"
#include "modules/loader/workflow_loader.h"
#include "modules/trace/trace_exporter.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace {

void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <workflow.yaml> [--input <json|@file>] [--config <engine.json>] [--async]\n";
}

agentgraph::Value read_input(const std::string& arg) {
    std::string text = arg;
    if (!arg.empty() && arg.front() == '@') {
        std::ifstream file(arg.substr(1));
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open input file: " + arg.substr(1));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        text = buffer.str();
    }
    return agentgraph::Value::parse(text);
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string workflow_path = argv[1];
    std::string input_arg;
    std::string config_path = "agentgraph.json";
    bool async = false;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--input" && i + 1 < argc) {
            input_arg = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--async") {
            async = true;
        } else {
            usage(argv[0]);
            return 1;
        }
    }

    try {
        // 1. Configuration and logging
        agentgraph::EngineConfig config = agentgraph::load_engine_config(config_path);
        agentgraph::set_log_level(config.log_level);

        // 2. Tools and the optional local model
        auto tools = std::make_shared<agentgraph::ToolRegistry>(true);
        std::shared_ptr<agentgraph::LlmProvider> provider;
        if (config.llm) {
            provider = std::make_shared<agentgraph::LlamaProvider>(*config.llm);
        }

        // 3. Load
        agentgraph::WorkflowLoader loader(tools, provider);
        std::shared_ptr<const agentgraph::Graph> graph = loader.load_file(workflow_path);

        agentgraph::WorkflowInput input;
        if (!input_arg.empty()) {
            input = read_input(input_arg).get<agentgraph::WorkflowInput>();
        }

        // 4. Execute
        agentgraph::Executor executor(agentgraph::Executor::Config{config.max_iterations});
        auto ctx = agentgraph::ExecutionContext::background();
        agentgraph::WorkflowState final_state;
        int exit_code = 0;

        if (async) {
            std::string id = executor.execute_async(ctx, graph, input);
            std::cout << "Started execution " << id << "\n";
            final_state = executor.wait_for(id, std::chrono::hours(24));
            agentgraph::Value summary = {{"execution_id", final_state.id},
                                         {"status", agentgraph::to_string(final_state.status)},
                                         {"data", final_state.data}};
            if (final_state.error) {
                summary["error"] = *final_state.error;
            }
            std::cout << summary.dump(2) << "\n";
        } else {
            try {
                agentgraph::WorkflowOutput output = executor.execute(ctx, *graph, input);
                final_state = output.state;
                agentgraph::Value j = output;
                j.erase("state");
                std::cout << j.dump(2) << "\n";
            } catch (const agentgraph::WorkflowException& e) {
                std::cerr << "[ERROR] " << agentgraph::to_string(e.code()) << ": " << e.what() << "\n";
                if (!e.state()) {
                    return 1;
                }
                final_state = *e.state();
            }
        }

        if (final_state.status != agentgraph::WorkflowStatus::COMPLETED) {
            exit_code = 1;
        }

        // 5. Export the trace
        agentgraph::TraceExporter::write_file(final_state, "execution_trace.json");
        std::cout << "Trace exported to execution_trace.json (" << final_state.history.size() << " records)\n";
        return exit_code;

    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }
}
