#include "common/llm/llama_provider.h"
#include "common/logger.h"
#include <stdexcept>

namespace agentgraph {

LlamaProvider::LlamaProvider(const LlmConfig& config)
    : config_(config),
      model_(nullptr, llama_model_free),
      ctx_(nullptr, llama_free) {

    llama_model_params model_params = llama_model_default_params();
    model_params.n_gpu_layers = 99; // offload everything the backend accepts

    llama_model* raw_model = llama_model_load_from_file(config_.model_path.c_str(), model_params);
    if (!raw_model) {
        throw std::runtime_error("Failed to load model: " + config_.model_path);
    }
    model_.reset(raw_model);

    llama_context_params ctx_params = llama_context_default_params();
    ctx_params.n_ctx = static_cast<uint32_t>(config_.n_ctx);
    ctx_params.n_threads = config_.n_threads;
    ctx_params.n_threads_batch = config_.n_threads;

    llama_context* raw_ctx = llama_init_from_model(model_.get(), ctx_params);
    if (!raw_ctx) {
        throw std::runtime_error("Failed to create llama context for model: " + config_.model_path);
    }
    ctx_.reset(raw_ctx);

    AGENTGRAPH_LOG_INFO("Loaded model '{}' (n_ctx={}, n_threads={})",
                        config_.model_path, config_.n_ctx, config_.n_threads);
}

LlamaProvider::~LlamaProvider() = default;

bool LlamaProvider::is_loaded() const {
    return model_ != nullptr && ctx_ != nullptr;
}

std::unique_ptr<llama_sampler, decltype(&llama_sampler_free)>
LlamaProvider::make_sampler(float temperature) const {
    auto params = llama_sampler_chain_default_params();
    std::unique_ptr<llama_sampler, decltype(&llama_sampler_free)> chain(
        llama_sampler_chain_init(params), llama_sampler_free);
    llama_sampler_chain_add(chain.get(), llama_sampler_init_min_p(config_.min_p, 1));
    llama_sampler_chain_add(chain.get(), llama_sampler_init_temp(temperature));
    llama_sampler_chain_add(chain.get(), llama_sampler_init_dist(LLAMA_DEFAULT_SEED));
    return chain;
}

std::string LlamaProvider::format_prompt(const std::vector<Message>& messages) const {
    std::vector<llama_chat_message> chat;
    chat.reserve(messages.size());
    for (const auto& m : messages) {
        chat.push_back({m.role.c_str(), m.content.c_str()});
    }

    const char* tmpl = llama_model_chat_template(model_.get(), nullptr);
    if (tmpl != nullptr) {
        std::vector<char> buf(4096);
        int32_t n = llama_chat_apply_template(tmpl, chat.data(), chat.size(), true,
                                              buf.data(), static_cast<int32_t>(buf.size()));
        if (n > static_cast<int32_t>(buf.size())) {
            buf.resize(static_cast<size_t>(n));
            n = llama_chat_apply_template(tmpl, chat.data(), chat.size(), true,
                                          buf.data(), static_cast<int32_t>(buf.size()));
        }
        if (n >= 0) {
            return std::string(buf.data(), static_cast<size_t>(n));
        }
        AGENTGRAPH_LOG_WARN("Model chat template not supported by llama.cpp, using plain prompt");
    }

    std::string prompt;
    for (const auto& m : messages) {
        prompt += m.role + ": " + m.content + "\n";
    }
    prompt += "assistant: ";
    return prompt;
}

std::vector<llama_token> LlamaProvider::tokenize(const std::string& text, bool add_special) const {
    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    int32_t n_tokens = -llama_tokenize(vocab, text.data(), static_cast<int32_t>(text.size()),
                                       nullptr, 0, add_special, true);
    if (n_tokens <= 0) {
        return {};
    }
    std::vector<llama_token> tokens(static_cast<size_t>(n_tokens));
    if (llama_tokenize(vocab, text.data(), static_cast<int32_t>(text.size()),
                       tokens.data(), n_tokens, add_special, true) < 0) {
        return {};
    }
    return tokens;
}

std::string LlamaProvider::detokenize(llama_token token) const {
    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    char buf[256] = {0};
    int n = llama_token_to_piece(vocab, token, buf, sizeof(buf) - 1, 0, true);
    if (n < 0) return "";
    return std::string(buf, static_cast<size_t>(n));
}

LlmResponse LlamaProvider::generate(const LlmRequest& request) {
    if (!is_loaded()) {
        throw std::runtime_error("Model not loaded");
    }

    std::lock_guard<std::mutex> lock(generate_mutex_);

    // Every request is an independent conversation.
    llama_memory_clear(llama_get_memory(ctx_.get()), true);

    std::string prompt = format_prompt(request.messages);
    auto tokens = tokenize(prompt, true);
    if (tokens.empty()) {
        throw std::runtime_error("Tokenization failed");
    }

    llama_batch batch = llama_batch_get_one(tokens.data(), static_cast<int32_t>(tokens.size()));
    if (llama_decode(ctx_.get(), batch)) {
        throw std::runtime_error("Prompt evaluation failed");
    }

    auto sampler = make_sampler(request.temperature.value_or(config_.temperature));
    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    const int limit = request.max_tokens.value_or(config_.n_predict);

    LlmResponse response;
    int generated = 0;
    for (; generated < limit; ++generated) {
        llama_token next = llama_sampler_sample(sampler.get(), ctx_.get(), -1);
        if (llama_vocab_is_eog(vocab, next)) {
            break;
        }
        response.content += detokenize(next);

        batch = llama_batch_get_one(&next, 1);
        if (llama_decode(ctx_.get(), batch)) {
            AGENTGRAPH_LOG_WARN("Decode failed after {} tokens, returning partial response", generated);
            break;
        }
    }

    response.model = config_.model_path;
    response.usage = Value{
        {"prompt_tokens", tokens.size()},
        {"completion_tokens", generated},
        {"total_tokens", tokens.size() + static_cast<size_t>(generated)}
    };
    return response;
}

} // namespace agentgraph
