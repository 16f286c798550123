#include "modules/trace/trace_exporter.h"
#include "common/logger.h"
#include <fstream>
#include <stdexcept>

namespace agentgraph {

void to_json(Value& j, const TraceRecord& record) {
    j = Value{{"trace_id", record.trace_id},
              {"sequence", record.sequence},
              {"node_id", record.node_id},
              {"type", record.type},
              {"start_time", to_unix_millis(record.start_time)},
              {"duration_ms", record.duration_ms},
              {"status", record.status},
              {"context_delta", record.context_delta},
              {"metadata", record.metadata}};
    if (record.end_time) {
        j["end_time"] = to_unix_millis(*record.end_time);
    }
    if (record.error_code) {
        j["error_code"] = *record.error_code;
    }
    if (record.error_message) {
        j["error_message"] = *record.error_message;
    }
}

Value TraceExporter::context_delta(const Value& before, const Value& changes) {
    Value delta = Value::object();
    if (!changes.is_object()) {
        return delta;
    }
    for (auto it = changes.begin(); it != changes.end(); ++it) {
        auto prev = before.is_object() ? before.find(it.key()) : before.end();
        if (!before.is_object() || prev == before.end() || *prev != it.value()) {
            delta[it.key()] = it.value();
        }
    }
    return delta;
}

std::vector<TraceRecord> TraceExporter::records(const WorkflowState& state) {
    std::vector<TraceRecord> out;
    out.reserve(state.history.size());
    size_t sequence = 0;
    for (const auto& step : state.history) {
        TraceRecord record;
        record.trace_id = state.id;
        record.sequence = sequence++;
        record.node_id = step.node_id;
        record.type = step.node_type;
        record.start_time = step.start_time;
        record.end_time = step.end_time;
        record.duration_ms = static_cast<double>(step.duration.count()) / 1000.0;
        record.status = step.error ? "failed" : "success";
        if (step.error) {
            record.error_code = step.error->code;
            record.error_message = step.error->message;
        }
        record.context_delta = context_delta(step.input, step.output);
        record.metadata = step.metadata;
        out.push_back(std::move(record));
    }
    return out;
}

Value TraceExporter::export_json(const WorkflowState& state) {
    Value j = {{"execution_id", state.id},
               {"workflow_id", state.workflow_id},
               {"status", to_string(state.status)},
               {"data", state.data},
               {"records", records(state)}};
    if (state.error) {
        j["error"] = *state.error;
    }
    return j;
}

void TraceExporter::write_file(const WorkflowState& state, const std::string& path) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot open trace file: " + path);
    }
    out << export_json(state).dump(2);
    if (!out) {
        throw std::runtime_error("Failed to write trace file: " + path);
    }
    AGENTGRAPH_LOG_INFO("trace of {} written to {} ({} records)", state.id, path, state.history.size());
}

} // namespace agentgraph
