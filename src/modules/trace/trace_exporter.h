#ifndef AGENTGRAPH_MODULES_TRACE_TRACE_EXPORTER_H
#define AGENTGRAPH_MODULES_TRACE_TRACE_EXPORTER_H

#include "core/types/state.h"
#include "core/types/value.h"
#include <optional>
#include <string>
#include <vector>

namespace agentgraph {

struct TraceRecord {
    std::string trace_id; // execution id
    size_t sequence = 0;  // position in the run
    std::string node_id;
    std::string type;
    TimePoint start_time;
    std::optional<TimePoint> end_time;
    double duration_ms = 0.0;
    std::string status; // "success" or "failed"
    std::optional<std::string> error_code;
    std::optional<std::string> error_message;
    Value context_delta = Value::object(); // keys the step changed
    Value metadata = Value::object();
};

void to_json(Value& j, const TraceRecord& record);

// Turns an execution's history into trace records and writes them out.
class TraceExporter {
public:
    static std::vector<TraceRecord> records(const WorkflowState& state);

    // {execution_id, workflow_id, status, error?, data, records: [...]}
    static Value export_json(const WorkflowState& state);

    // Throws std::runtime_error when the file cannot be written.
    static void write_file(const WorkflowState& state, const std::string& path);

    static Value context_delta(const Value& before, const Value& changes);
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_TRACE_TRACE_EXPORTER_H
