// core/orchestrator.cpp
#include "blockflow/orchestrator.h"
#include "common/config/config_loader.h"
#include "common/utils/log.h"
#include "modules/branch/branch_store.h"
#include "modules/checkpoint/checkpoint_storage.h"
#include "modules/scheduler/block_scheduler.h"
#include <filesystem>
#include <stdexcept>

namespace blockflow {

Orchestrator::Orchestrator(OrchestratorConfig config,
                           std::shared_ptr<GenerationCollaborator> generator,
                           std::shared_ptr<ValidationCollaborator> validator,
                           std::shared_ptr<ResourceProbe> probe)
    : config_(std::move(config)),
      generator_(std::move(generator)),
      validator_(validator ? std::move(validator) : std::make_shared<PassThroughValidator>()) {
    if (!generator_) {
        throw std::invalid_argument("Orchestrator requires a generation collaborator");
    }
    set_log_level(config_.log_level);

    std::shared_ptr<CheckpointStorage> storage;
    std::optional<std::filesystem::path> tracked_dir;
    if (config_.checkpoints.directory) {
        tracked_dir = std::filesystem::path(*config_.checkpoints.directory);
        storage = std::make_shared<FileCheckpointStorage>(*tracked_dir);
    } else {
        storage = std::make_shared<InMemoryCheckpointStorage>();
    }
    if (!probe) {
        probe = std::make_shared<SystemResourceProbe>(tracked_dir);
    }

    monitor_ = std::make_shared<ResourceMonitor>(config_.resources.limits, std::move(probe), config_.resources.interval);
    chunker_ = std::make_shared<AdaptiveChunker>(config_.chunking, monitor_);
    checkpoints_ = std::make_unique<CheckpointStore>(config_.checkpoints.store, std::move(storage));
    recovery_ = std::make_unique<RecoveryManager>(config_.recovery, checkpoints_.get());
}

std::unique_ptr<Orchestrator> Orchestrator::from_config_file(const std::string& path,
                                                             std::shared_ptr<GenerationCollaborator> generator,
                                                             std::shared_ptr<ValidationCollaborator> validator) {
    return std::make_unique<Orchestrator>(load_config(path), std::move(generator), std::move(validator));
}

RunReport Orchestrator::execute(const Plan& plan, const std::optional<CheckpointId>& resume_from) {
    DependencyGraph graph = DependencyGraph::build(plan.blocks, plan.dependencies, config_.scheduler.priorities);
    last_plan_ = plan;

    BlockScheduler scheduler(config_.scheduler.run, std::move(graph), *generator_, *validator_,
                             *recovery_, *checkpoints_, monitor_);
    RunReport report = resume_from ? scheduler.resume(*resume_from) : scheduler.run();
    artifacts_ = scheduler.artifacts();
    traces_ = scheduler.traces();
    return report;
}

RunReport Orchestrator::run(const Plan& plan) {
    return execute(plan, std::nullopt);
}

RunReport Orchestrator::run(const std::vector<ImplementationBlock>& blocks,
                            const std::vector<BlockDependency>& dependencies) {
    return execute(Plan{blocks, dependencies}, std::nullopt);
}

RunReport Orchestrator::resume(const CheckpointId& checkpoint_id) {
    if (!last_plan_) {
        throw std::runtime_error("resume without a plan: nothing has been run by this orchestrator");
    }
    const Plan plan = *last_plan_;
    return execute(plan, checkpoint_id);
}

RunReport Orchestrator::resume(const Plan& plan, const CheckpointId& checkpoint_id) {
    return execute(plan, checkpoint_id);
}

ExplorationResult Orchestrator::explore(const std::vector<Approach>& approaches, const Plan& plan,
                                        BranchCoordinator::GeneratorFactory generators) {
    if (!generators) {
        auto shared = generator_;
        generators = [shared](const Approach&) { return shared; };
    }

    BranchCoordinator::Config cfg;
    cfg.weights = config_.branches.weights;
    cfg.priorities = config_.scheduler.priorities;
    cfg.scheduler = config_.scheduler.run;
    cfg.checkpoints = config_.checkpoints.store;
    cfg.recovery = config_.recovery;
    if (config_.checkpoints.directory) {
        cfg.checkpoint_root = std::filesystem::path(*config_.checkpoints.directory) / "branches";
    }

    std::shared_ptr<ConflictResolver> resolver;
    if (config_.branches.prefer_higher_score) {
        resolver = std::make_shared<PreferHigherScoreResolver>();
    }
    BranchCoordinator coordinator(cfg, std::move(generators), validator_, monitor_, nullptr, resolver);

    ExplorationResult result;
    result.branches = coordinator.spawn(approaches, plan.blocks, plan.dependencies);
    coordinator.implement(result.branches);
    result.evaluation = coordinator.evaluate(result.branches);

    try {
        result.merge = coordinator.select_and_merge(result.branches, result.evaluation,
                                                    config_.branches.merge_strategy);
    } catch (const OrchestrationError& e) {
        if (e.category() == ErrorCategory::MERGE && config_.branches.directory) {
            BranchStore store(*config_.branches.directory);
            for (const auto& branch : result.branches) {
                store.save(branch);
            }
            log_warning("Merge failed (" + std::string(e.what()) + "); " +
                        std::to_string(result.branches.size()) + " branches kept in " + *config_.branches.directory);
        }
        throw;
    }
    log_info("Merged " + std::to_string(result.merge.sources.size()) + " blocks, primary branch " +
             result.merge.primary);
    return result;
}

std::vector<Chunk> Orchestrator::chunk(std::string_view text) {
    return chunker_->chunk(text);
}

} // namespace blockflow
