// modules/trace/trace_exporter.h
#ifndef BLOCKFLOW_MODULES_TRACE_TRACE_EXPORTER_H
#define BLOCKFLOW_MODULES_TRACE_TRACE_EXPORTER_H

#include "core/types/block.h"
#include "core/types/checkpoint.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace blockflow {

struct TraceRecord {
    std::string trace_id;
    BlockId block_id;
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    std::string status; // "running" until the block finishes, then the BlockStatus name
    int attempts = 0;
    double priority = 0.0;
    std::optional<std::string> error_code;
    std::optional<CheckpointId> checkpoint_before;
    std::optional<CheckpointId> checkpoint_after;
    std::optional<std::string> resolution; // recovery resolution, if recovery ran
};

void to_json(nlohmann::json& j, const TraceRecord& r);

// Written by the scheduler thread only.
class TraceExporter {
public:
    void set_trace_id(std::string trace_id) { current_trace_id_ = std::move(trace_id); }

    void on_block_start(const BlockId& id, double priority, const std::optional<CheckpointId>& checkpoint_before);

    void on_block_end(const BlockId& id,
                      BlockStatus status,
                      int attempts,
                      const std::optional<std::string>& error_code,
                      const std::optional<std::string>& resolution);

    // Attach the checkpoint taken after the block finished.
    void on_checkpoint_after(const BlockId& id, const std::optional<CheckpointId>& checkpoint);

    std::vector<TraceRecord> get_traces() const;
    nlohmann::json export_json() const;
    void clear_traces();

private:
    std::vector<TraceRecord> traces_;
    std::string current_trace_id_ = "t-default";

    TraceRecord* find_latest(const BlockId& id);
};

} // namespace blockflow

#endif // BLOCKFLOW_MODULES_TRACE_TRACE_EXPORTER_H
