#ifndef BLOCKFLOW_ORCHESTRATOR_H
#define BLOCKFLOW_ORCHESTRATOR_H

#include "common/config/orchestrator_config.h"
#include "modules/branch/branch_coordinator.h"
#include "modules/checkpoint/checkpoint_store.h"
#include "modules/chunker/adaptive_chunker.h"
#include "modules/collaborators/collaborators.h"
#include "modules/plan/plan_loader.h"
#include "modules/recovery/recovery_manager.h"
#include "modules/resource/resource_monitor.h"
#include "modules/trace/trace_exporter.h"
#include "core/types/report.h"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace blockflow {

struct ExplorationResult {
    std::vector<ImplementationBranch> branches;
    BranchEvaluation evaluation;
    MergeResult merge;
};

/**
 * Entry point: owns the resource monitor, chunker, checkpoint store and
 * recovery manager of one orchestration and builds a scheduler per run.
 */
class Orchestrator {
public:
    // validator and probe may be null (pass-through validation, system probe).
    Orchestrator(OrchestratorConfig config,
                 std::shared_ptr<GenerationCollaborator> generator,
                 std::shared_ptr<ValidationCollaborator> validator = nullptr,
                 std::shared_ptr<ResourceProbe> probe = nullptr);

    static std::unique_ptr<Orchestrator> from_config_file(const std::string& path,
                                                          std::shared_ptr<GenerationCollaborator> generator,
                                                          std::shared_ptr<ValidationCollaborator> validator = nullptr);

    // Structural errors propagate before anything runs.
    RunReport run(const Plan& plan);
    RunReport run(const std::vector<ImplementationBlock>& blocks, const std::vector<BlockDependency>& dependencies);

    // Continues the plan of the last run() from a checkpoint.
    RunReport resume(const CheckpointId& checkpoint_id);
    // Same, for a plan run by another process against the same checkpoint directory.
    RunReport resume(const Plan& plan, const CheckpointId& checkpoint_id);

    // Runs every approach as a branch, ranks them and merges with the configured strategy.
    // When the merge fails and branches.directory is set, all branches are saved there first.
    ExplorationResult explore(const std::vector<Approach>& approaches, const Plan& plan,
                              BranchCoordinator::GeneratorFactory generators = {});

    std::vector<Chunk> chunk(std::string_view text);

    const OrchestratorConfig& config() const { return config_; }
    CheckpointStore& checkpoints() { return *checkpoints_; }
    RecoveryManager& recovery() { return *recovery_; }
    ResourceMonitor& monitor() { return *monitor_; }
    AdaptiveChunker& chunker() { return *chunker_; }

    // Artifacts of the last run or resume.
    const std::map<BlockId, std::vector<Artifact>>& artifacts() const { return artifacts_; }
    const std::vector<TraceRecord>& traces() const { return traces_; }

private:
    const OrchestratorConfig config_;
    std::shared_ptr<GenerationCollaborator> generator_;
    std::shared_ptr<ValidationCollaborator> validator_;
    std::shared_ptr<ResourceMonitor> monitor_;
    std::shared_ptr<AdaptiveChunker> chunker_;
    std::unique_ptr<CheckpointStore> checkpoints_;
    std::unique_ptr<RecoveryManager> recovery_;

    std::optional<Plan> last_plan_;
    std::map<BlockId, std::vector<Artifact>> artifacts_;
    std::vector<TraceRecord> traces_;

    RunReport execute(const Plan& plan, const std::optional<CheckpointId>& resume_from);
};

} // namespace blockflow

#endif // BLOCKFLOW_ORCHESTRATOR_H
