#ifndef AGENTGRAPH_MODULES_NODES_LLM_NODE_H
#define AGENTGRAPH_MODULES_NODES_LLM_NODE_H

#include "common/llm/llm_provider.h"
#include "modules/nodes/basic_nodes.h"
#include <memory>
#include <optional>
#include <string>

namespace agentgraph {

struct LlmNodeOptions {
    std::string system_prompt;
    std::string output_key = "llm_response";
    std::optional<float> temperature;
    std::optional<int> max_tokens;
};

class LlmNode : public BaseNode {
public:
    LlmNode(std::string id, std::shared_ptr<LlmProvider> provider, std::string prompt_template,
            LlmNodeOptions options = {});

    void validate() const override;
    [[nodiscard]] NodeOutput execute(const ExecutionContext& ctx, const WorkflowState& state) const override;

private:
    std::shared_ptr<LlmProvider> provider_;
    std::string prompt_template_;
    LlmNodeOptions options_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_NODES_LLM_NODE_H
