// modules/scheduler/block_scheduler.h
#ifndef BLOCKFLOW_MODULES_SCHEDULER_BLOCK_SCHEDULER_H
#define BLOCKFLOW_MODULES_SCHEDULER_BLOCK_SCHEDULER_H

#include "core/types/report.h"
#include "modules/checkpoint/checkpoint_store.h"
#include "modules/collaborators/collaborators.h"
#include "modules/recovery/recovery_manager.h"
#include "modules/resource/resource_monitor.h"
#include "modules/scheduler/dependency_graph.h"
#include "modules/scheduler/execution_session.h"
#include "modules/scheduler/outcome_channel.h"
#include "modules/scheduler/worker_pool.h"
#include "modules/trace/trace_exporter.h"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace blockflow {

/**
 * Drives a DependencyGraph to completion, one topological layer at a time.
 *
 * Blocks of a layer run concurrently on the worker pool; workers report
 * through an OutcomeChannel and the thread calling run() is the only one
 * that changes block state. Snapshots are taken under the same lock, so a
 * checkpoint never observes a half-applied outcome.
 */
class BlockScheduler {
public:
    struct Config {
        size_t max_parallel_paths = 0;   // 0 = hardware concurrency
        double timeout_multiplier = 2.0;
        std::chrono::milliseconds poll_interval{50};
        bool cancel_on_pressure = true;  // cancel low-priority blocks when a resource is exceeded
        std::string progress_template =
            "{{ completed }}/{{ total }} blocks completed ({{ with_issues }} with issues, "
            "{{ failed }} failed, {{ deferred }} deferred)\n"
            "{% for b in blocks %}- {{ b.id }}: {{ b.status }}{{ b.note }}\n{% endfor %}";
        Config() = default;
    };

    // monitor may be null.
    BlockScheduler(Config config,
                   DependencyGraph graph,
                   GenerationCollaborator& generator,
                   ValidationCollaborator& validator,
                   RecoveryManager& recovery,
                   CheckpointStore& checkpoints,
                   std::shared_ptr<ResourceMonitor> monitor);

    RunReport run();

    // Restores block statuses and artifacts from a checkpoint and runs the rest.
    // Load failures propagate.
    RunReport resume(const CheckpointId& checkpoint_id);

    // External NotStarted/Failed -> Deferred decision.
    void defer(const BlockId& id, const std::string& reason);

    std::vector<BlockId> execution_order() const;
    BlockStatus status(const BlockId& id) const;
    const DependencyGraph& graph() const { return graph_; }
    std::map<BlockId, std::vector<Artifact>> artifacts() const;
    std::vector<TraceRecord> traces() const;

    // {"blocks": {id: {status, reason, attempts}}}
    State snapshot_state() const;

private:
    struct InFlight {
        std::shared_ptr<CancellationToken> token;
        double priority = 0.0;
        bool cancelled = false;
    };

    const Config config_;
    DependencyGraph graph_;
    CheckpointStore& checkpoints_;
    RecoveryManager& recovery_;
    std::shared_ptr<ResourceMonitor> monitor_;
    ExecutionSession session_;

    mutable std::mutex state_mutex_;
    std::map<BlockId, std::vector<Artifact>> artifacts_;
    std::map<BlockId, Value> metrics_;
    std::map<BlockId, std::vector<std::string>> issues_;
    std::vector<std::string> warnings_;
    std::vector<CheckpointId> taken_;
    TraceExporter traces_;
    uint64_t run_counter_ = 0;

    OutcomeChannel<BlockEvent> channel_;
    WorkerPool pool_; // last: joined before the members above go away

    RunReport run_layers(const std::string& start_reason);
    void run_layer(const std::vector<BlockId>& layer);
    void apply_event(BlockEvent& event, std::map<BlockId, InFlight>& in_flight, std::exception_ptr& fatal);
    void relieve_pressure(std::map<BlockId, InFlight>& in_flight);

    void transition_locked(ImplementationBlock& block, BlockStatus to, const std::string& reason);
    void block_dependents_locked(const BlockId& failed);
    void defer_leftovers_locked();

    std::optional<CheckpointId> checkpoint(const std::string& reason);
    State snapshot_state_locked() const;
    Value artifacts_json_locked() const;
    RunReport build_report() const;
};

} // namespace blockflow

#endif // BLOCKFLOW_MODULES_SCHEDULER_BLOCK_SCHEDULER_H
