#ifndef AGENTGRAPH_MODULES_LOADER_WORKFLOW_LOADER_H
#define AGENTGRAPH_MODULES_LOADER_WORKFLOW_LOADER_H

#include "common/llm/llm_provider.h"
#include "common/tools/registry.h"
#include "modules/graph/graph.h"
#include <memory>
#include <string>

namespace agentgraph {

// Builds graphs from YAML workflow documents:
//
//   id: support
//   name: Support triage
//   start: begin
//   nodes:
//     - {id: begin, type: start}
//     - {id: classify, type: llm, prompt: "Classify: {{ query }}", output_key: category}
//     - {id: done, type: end, result: "{{ category }}"}
//   edges:
//     - {from: begin, to: classify}
//     - {from: classify, to: done, when: "category == \"billing\""}
//
// Every failure surfaces as ValidationError naming the node or edge.
class WorkflowLoader {
public:
    explicit WorkflowLoader(std::shared_ptr<const ToolRegistry> tools = nullptr,
                            std::shared_ptr<LlmProvider> provider = nullptr);

    std::shared_ptr<Graph> load_file(const std::string& path) const;
    std::shared_ptr<Graph> load_string(const std::string& yaml) const;
    std::shared_ptr<Graph> load_document(const Value& doc) const;

    // {field, op, value}, {all: [...]}, {any: [...]} or {not: {...}}.
    static ConditionPtr parse_condition(const Value& spec);

private:
    NodePtr build_node(const Value& spec) const;
    static Edge build_edge(const Value& spec);

    std::shared_ptr<const ToolRegistry> tools_;
    std::shared_ptr<LlmProvider> provider_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_LOADER_WORKFLOW_LOADER_H
