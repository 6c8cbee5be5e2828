// modules/trace/trace_exporter.cpp
#include "modules/trace/trace_exporter.h"
#include <algorithm>

namespace blockflow {

namespace {

int64_t to_millis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace

void to_json(nlohmann::json& j, const TraceRecord& r) {
    j = nlohmann::json{
        {"trace_id", r.trace_id},
        {"block", r.block_id},
        {"start_ms", to_millis(r.start_time)},
        {"end_ms", to_millis(r.end_time)},
        {"status", r.status},
        {"attempts", r.attempts},
        {"priority", r.priority}
    };
    if (r.error_code) j["error_code"] = *r.error_code;
    if (r.checkpoint_before) j["checkpoint_before"] = *r.checkpoint_before;
    if (r.checkpoint_after) j["checkpoint_after"] = *r.checkpoint_after;
    if (r.resolution) j["resolution"] = *r.resolution;
}

void TraceExporter::on_block_start(const BlockId& id, double priority,
                                   const std::optional<CheckpointId>& checkpoint_before) {
    TraceRecord record;
    record.trace_id = current_trace_id_;
    record.block_id = id;
    record.start_time = std::chrono::system_clock::now();
    record.status = "running";
    record.priority = priority;
    record.checkpoint_before = checkpoint_before;
    traces_.push_back(std::move(record));
}

TraceRecord* TraceExporter::find_latest(const BlockId& id) {
    auto it = std::find_if(traces_.rbegin(), traces_.rend(),
                           [&id](const TraceRecord& r) { return r.block_id == id; });
    return it == traces_.rend() ? nullptr : &*it;
}

void TraceExporter::on_block_end(const BlockId& id,
                                 BlockStatus status,
                                 int attempts,
                                 const std::optional<std::string>& error_code,
                                 const std::optional<std::string>& resolution) {
    TraceRecord* record = find_latest(id);
    if (!record || record->status != "running") {
        return;
    }
    record->end_time = std::chrono::system_clock::now();
    record->status = to_string(status);
    record->attempts = attempts;
    record->error_code = error_code;
    record->resolution = resolution;
}

void TraceExporter::on_checkpoint_after(const BlockId& id, const std::optional<CheckpointId>& checkpoint) {
    if (TraceRecord* record = find_latest(id)) {
        record->checkpoint_after = checkpoint;
    }
}

std::vector<TraceRecord> TraceExporter::get_traces() const {
    return traces_;
}

nlohmann::json TraceExporter::export_json() const {
    return nlohmann::json(traces_);
}

void TraceExporter::clear_traces() {
    traces_.clear();
}

} // namespace blockflow
