// modules/branch/branch_coordinator.h
#ifndef BLOCKFLOW_MODULES_BRANCH_BRANCH_COORDINATOR_H
#define BLOCKFLOW_MODULES_BRANCH_BRANCH_COORDINATOR_H

#include "modules/branch/branch.h"
#include "modules/checkpoint/checkpoint_store.h"
#include "modules/collaborators/collaborators.h"
#include "modules/recovery/recovery_manager.h"
#include "modules/resource/resource_monitor.h"
#include "modules/scheduler/block_scheduler.h"
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace blockflow {

// Produces the four subscores of an implemented branch, each in [0, 1].
class BranchEvaluator {
public:
    virtual ~BranchEvaluator() = default;
    virtual BranchMetrics score(const ImplementationBranch& branch) const = 0;
    virtual double component_score(const ImplementationBranch& branch, const BlockReport& block) const = 0;
};

/**
 * Scores from the run report. Validator metrics named "quality",
 * "performance", "maintainability" (and "score" per block) take precedence
 * over the status-derived defaults.
 */
class MetricsBranchEvaluator : public BranchEvaluator {
public:
    BranchMetrics score(const ImplementationBranch& branch) const override;
    double component_score(const ImplementationBranch& branch, const BlockReport& block) const override;
};

// Decides overlapping edits during a selective merge.
class ConflictResolver {
public:
    virtual ~ConflictResolver() = default;
    // The branch whose contribution is kept, or nullopt to leave the conflict open.
    virtual std::optional<BranchId> resolve(const MergeConflict& conflict, const BranchEvaluation& evaluation) const = 0;
};

class UnresolvedConflictResolver : public ConflictResolver {
public:
    std::optional<BranchId> resolve(const MergeConflict&, const BranchEvaluation&) const override {
        return std::nullopt;
    }
};

class PreferHigherScoreResolver : public ConflictResolver {
public:
    std::optional<BranchId> resolve(const MergeConflict& conflict, const BranchEvaluation& evaluation) const override;
};

/**
 * Runs the same block set under several approaches. Each branch gets its
 * own graph copy, checkpoint lineage, recovery manager and scheduler; only
 * the resource monitor is shared.
 */
class BranchCoordinator {
public:
    using GeneratorFactory = std::function<std::shared_ptr<GenerationCollaborator>(const Approach&)>;

    struct Config {
        EvaluationWeights weights;
        PriorityWeights priorities;
        BlockScheduler::Config scheduler;
        CheckpointStore::Config checkpoints;
        RecoveryManager::Config recovery;
        RecoveryManager::Sleeper sleeper;                     // empty = real sleep
        std::optional<std::filesystem::path> checkpoint_root; // <root>/<branch id>; in-memory when unset
        Config() = default;
    };

    BranchCoordinator(Config config,
                      GeneratorFactory generators,
                      std::shared_ptr<ValidationCollaborator> validator,
                      std::shared_ptr<ResourceMonitor> monitor,
                      std::shared_ptr<BranchEvaluator> evaluator = nullptr,
                      std::shared_ptr<ConflictResolver> resolver = nullptr);

    // Created -> Implementing. Structural errors in the plan propagate.
    std::vector<ImplementationBranch> spawn(const std::vector<Approach>& approaches,
                                            const std::vector<ImplementationBlock>& blocks,
                                            const std::vector<BlockDependency>& dependencies) const;

    // Runs every Implementing branch concurrently; Implemented iff its run fully succeeded.
    void implement(std::vector<ImplementationBranch>& branches) const;

    // Scores Implemented branches (-> Evaluated); others are left out of the ranking.
    BranchEvaluation evaluate(std::vector<ImplementationBranch>& branches) const;

    // merge() plus Selected / Rejected statuses. On a merge error nothing is changed.
    MergeResult select_and_merge(std::vector<ImplementationBranch>& branches,
                                 const BranchEvaluation& evaluation,
                                 MergeStrategy strategy) const;

    static MergeResult merge(const std::vector<ImplementationBranch>& branches,
                             const BranchEvaluation& evaluation,
                             MergeStrategy strategy,
                             const ConflictResolver& resolver);

    static BranchComparison compare(const ImplementationBranch& a, const ImplementationBranch& b);

    // Throws MergeError(BranchNotFound).
    static const ImplementationBranch& find(const std::vector<ImplementationBranch>& branches, const BranchId& id);

    const EvaluationWeights& weights() const { return config_.weights; }

private:
    const Config config_;
    GeneratorFactory generators_;
    std::shared_ptr<ValidationCollaborator> validator_;
    std::shared_ptr<ResourceMonitor> monitor_;
    std::shared_ptr<BranchEvaluator> evaluator_;
    std::shared_ptr<ConflictResolver> resolver_;

    void run_branch(ImplementationBranch& branch) const;
};

} // namespace blockflow

#endif // BLOCKFLOW_MODULES_BRANCH_BRANCH_COORDINATOR_H
