#ifndef AGENTGRAPH_CORE_TYPES_VALUE_H
#define AGENTGRAPH_CORE_TYPES_VALUE_H

#include <nlohmann/json.hpp>
#include <chrono>

namespace agentgraph {

// nlohmann::json is the single dynamic value type: data bag, metadata, tool results
using Value = nlohmann::json;

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Milliseconds since the Unix epoch, the wire representation of every TimePoint.
inline int64_t to_unix_millis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace agentgraph

#endif // AGENTGRAPH_CORE_TYPES_VALUE_H
