#ifndef AGENTGRAPH_COMMON_LOGGER_H
#define AGENTGRAPH_COMMON_LOGGER_H

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace agentgraph {

// Shared "agentgraph" logger, created on first use with a colored stderr sink.
std::shared_ptr<spdlog::logger> logger();

// Accepts spdlog level names: trace, debug, info, warn, error, critical, off.
void set_log_level(const std::string& level);

} // namespace agentgraph

#define AGENTGRAPH_LOG_TRACE(...) ::agentgraph::logger()->trace(__VA_ARGS__)
#define AGENTGRAPH_LOG_DEBUG(...) ::agentgraph::logger()->debug(__VA_ARGS__)
#define AGENTGRAPH_LOG_INFO(...) ::agentgraph::logger()->info(__VA_ARGS__)
#define AGENTGRAPH_LOG_WARN(...) ::agentgraph::logger()->warn(__VA_ARGS__)
#define AGENTGRAPH_LOG_ERROR(...) ::agentgraph::logger()->error(__VA_ARGS__)

#endif // AGENTGRAPH_COMMON_LOGGER_H
