#include "modules/nodes/llm_node.h"
#include "common/logger.h"
#include "common/utils/template_renderer.h"
#include "core/types/errors.h"
#include <stdexcept>

namespace agentgraph {

LlmNode::LlmNode(std::string id, std::shared_ptr<LlmProvider> provider, std::string prompt_template,
                 LlmNodeOptions options)
    : BaseNode(std::move(id), node_types::LLM),
      provider_(std::move(provider)),
      prompt_template_(std::move(prompt_template)),
      options_(std::move(options)) {}

void LlmNode::validate() const {
    BaseNode::validate();
    if (!provider_) {
        throw ValidationError("llm node has no provider: " + id());
    }
    if (prompt_template_.empty()) {
        throw ValidationError("llm node has no prompt: " + id());
    }
    if (options_.output_key.empty()) {
        throw ValidationError("llm node output key cannot be empty: " + id());
    }
}

NodeOutput LlmNode::execute(const ExecutionContext& ctx, const WorkflowState& state) const {
    std::string prompt;
    try {
        prompt = InjaTemplateRenderer::render(prompt_template_, state.data);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error("failed to render prompt: " + std::string(e.what()));
    }

    NodeOutput output;
    LlmRequest request;
    request.temperature = options_.temperature;
    request.max_tokens = options_.max_tokens;

    bool has_system = !state.messages.empty() && state.messages.front().role == "system";
    if (!options_.system_prompt.empty() && !has_system) {
        request.messages.emplace_back("system", options_.system_prompt);
    }
    request.messages.insert(request.messages.end(), state.messages.begin(), state.messages.end());
    if (state.messages.empty() || state.messages.back().role != "user") {
        request.messages.emplace_back("user", prompt);
        output.messages.emplace_back("user", prompt);
    }

    if (ctx.done()) {
        throw std::runtime_error(ctx.error());
    }

    AGENTGRAPH_LOG_DEBUG("llm node {} calling provider {} with {} messages", id(), provider_->name(),
                         request.messages.size());
    LlmResponse response;
    try {
        response = provider_->generate(request);
    } catch (const std::exception& e) {
        throw std::runtime_error("LLM call failed: " + std::string(e.what()));
    }
    if (response.content.empty() && response.tool_calls.empty()) {
        throw std::runtime_error("no content returned from LLM");
    }

    Message reply("assistant", response.content);
    reply.tool_calls = response.tool_calls;
    output.messages.push_back(reply);

    output.data[options_.output_key] = response.content;
    if (!response.tool_calls.empty()) {
        output.data["tool_calls"] = response.tool_calls;
    }
    output.metadata = Value{{"usage", response.usage}, {"model", response.model}, {"provider", provider_->name()}};
    return output;
}

} // namespace agentgraph
