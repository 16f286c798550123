#ifndef AGENTGRAPH_COMMON_CONFIG_ENGINE_CONFIG_H
#define AGENTGRAPH_COMMON_CONFIG_ENGINE_CONFIG_H

#include "core/types/value.h"
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace agentgraph {

struct LlmConfig {
    std::string model_path = "models/qwen-0.6b.gguf";
    int n_ctx = 2048;
    int n_threads = 4;
    float temperature = 0.7f;
    float min_p = 0.05f;
    int n_predict = 512;
    std::string system_prompt;
};

struct EngineConfig {
    size_t max_iterations = 100;
    std::string log_level = "info";
    std::optional<LlmConfig> llm; // absent: workflows run without a model
};

// Reads an engine config file such as
//   { "max_iterations": 100, "log_level": "debug",
//     "llm": { "model_path": "models/q.gguf", "n_ctx": 4096 } }
// A missing file yields defaults. Malformed JSON or wrongly typed fields throw
// std::runtime_error. llm.model_path is resolved relative to the file.
EngineConfig load_engine_config(const std::string& config_path = "agentgraph.json");

EngineConfig parse_engine_config(const Value& j, const std::filesystem::path& base_dir = ".");

} // namespace agentgraph

#endif // AGENTGRAPH_COMMON_CONFIG_ENGINE_CONFIG_H
