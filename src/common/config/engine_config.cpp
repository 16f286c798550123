#include "common/config/engine_config.h"
#include "common/logger.h"
#include <fstream>
#include <stdexcept>
#include <thread>

namespace agentgraph {

namespace {

namespace fs = std::filesystem;

void require_type(const Value& j, const char* key, bool ok, const char* expected) {
    if (!ok) {
        throw std::runtime_error(std::string("Config field '") + key + "' must be " + expected +
                                 ", got " + j.at(key).type_name());
    }
}

LlmConfig parse_llm_config(const Value& j, const fs::path& base_dir) {
    LlmConfig config;
    int hw = static_cast<int>(std::thread::hardware_concurrency());
    config.n_threads = hw > 0 ? hw : config.n_threads;

    if (j.contains("model_path")) {
        require_type(j, "model_path", j["model_path"].is_string(), "a string");
        fs::path model_rel = j["model_path"].get<std::string>();
        config.model_path = model_rel.is_absolute()
            ? model_rel.string()
            : fs::absolute(base_dir / model_rel).string();
    }
    if (j.contains("n_ctx")) {
        require_type(j, "n_ctx", j["n_ctx"].is_number_integer(), "an integer");
        config.n_ctx = j["n_ctx"].get<int>();
    }
    if (j.contains("n_threads")) {
        require_type(j, "n_threads", j["n_threads"].is_number_integer(), "an integer");
        int threads = j["n_threads"].get<int>();
        if (threads > 0) config.n_threads = threads;
    }
    if (j.contains("temperature")) {
        require_type(j, "temperature", j["temperature"].is_number(), "a number");
        config.temperature = static_cast<float>(j["temperature"].get<double>());
    }
    if (j.contains("min_p")) {
        require_type(j, "min_p", j["min_p"].is_number(), "a number");
        config.min_p = static_cast<float>(j["min_p"].get<double>());
    }
    if (j.contains("n_predict")) {
        require_type(j, "n_predict", j["n_predict"].is_number_integer(), "an integer");
        config.n_predict = j["n_predict"].get<int>();
    }
    if (j.contains("system_prompt")) {
        require_type(j, "system_prompt", j["system_prompt"].is_string(), "a string");
        config.system_prompt = j["system_prompt"].get<std::string>();
    }
    return config;
}

} // namespace

EngineConfig parse_engine_config(const Value& j, const fs::path& base_dir) {
    if (!j.is_object()) {
        throw std::runtime_error("Engine config must be a JSON object");
    }
    EngineConfig config;
    if (j.contains("max_iterations")) {
        require_type(j, "max_iterations", j["max_iterations"].is_number_unsigned(), "a positive integer");
        config.max_iterations = j["max_iterations"].get<size_t>();
        if (config.max_iterations == 0) {
            throw std::runtime_error("Config field 'max_iterations' must be greater than zero");
        }
    }
    if (j.contains("log_level")) {
        require_type(j, "log_level", j["log_level"].is_string(), "a string");
        config.log_level = j["log_level"].get<std::string>();
    }
    if (j.contains("llm") && !j["llm"].is_null()) {
        require_type(j, "llm", j["llm"].is_object(), "an object");
        config.llm = parse_llm_config(j["llm"], base_dir);
    }
    return config;
}

EngineConfig load_engine_config(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        AGENTGRAPH_LOG_DEBUG("No engine config at '{}', using defaults", config_path);
        return EngineConfig{};
    }

    Value j;
    try {
        file >> j;
    } catch (const Value::parse_error& e) {
        throw std::runtime_error("Invalid engine config '" + config_path + "': " + e.what());
    }

    fs::path config_dir = fs::path(config_path).parent_path();
    if (config_dir.empty()) config_dir = ".";
    return parse_engine_config(j, config_dir);
}

} // namespace agentgraph
