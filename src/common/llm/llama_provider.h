#ifndef AGENTGRAPH_COMMON_LLM_LLAMA_PROVIDER_H
#define AGENTGRAPH_COMMON_LLM_LLAMA_PROVIDER_H

#include "common/config/engine_config.h"
#include "common/llm/llm_provider.h"
#include <llama.h>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace agentgraph {

// Local GGUF model through llama.cpp. Requests are serialized on one context.
class LlamaProvider : public LlmProvider {
public:
    explicit LlamaProvider(const LlmConfig& config);
    ~LlamaProvider() override;

    std::string name() const override { return "llama.cpp"; }
    LlmResponse generate(const LlmRequest& request) override;

    bool is_loaded() const;

private:
    LlmConfig config_;
    std::unique_ptr<llama_model, decltype(&llama_model_free)> model_;
    std::unique_ptr<llama_context, decltype(&llama_free)> ctx_;
    std::mutex generate_mutex_;

    std::unique_ptr<llama_sampler, decltype(&llama_sampler_free)> make_sampler(float temperature) const;
    std::string format_prompt(const std::vector<Message>& messages) const;
    std::vector<llama_token> tokenize(const std::string& text, bool add_special) const;
    std::string detokenize(llama_token token) const;
};

} // namespace agentgraph

#endif // AGENTGRAPH_COMMON_LLM_LLAMA_PROVIDER_H
