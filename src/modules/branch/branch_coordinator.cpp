// modules/branch/branch_coordinator.cpp
#include "modules/branch/branch_coordinator.h"
#include "common/utils/log.h"
#include <algorithm>
#include <future>
#include <set>
#include <stdexcept>

namespace blockflow {

namespace {

double metric_or(const Value& metrics, const char* key, double fallback) {
    if (metrics.is_object() && metrics.contains(key) && metrics[key].is_number()) {
        return std::clamp(metrics[key].get<double>(), 0.0, 1.0);
    }
    return fallback;
}

double block_quality(const BlockReport& b) {
    const double fallback = b.status == BlockStatus::COMPLETED ? 1.0
                          : b.status == BlockStatus::COMPLETED_WITH_ISSUES ? 0.6
                          : 0.0;
    return is_successful(b.status) ? metric_or(b.metrics, "quality", fallback) : 0.0;
}

double block_performance(const BlockReport& b) {
    const double fallback = b.attempts <= 1 ? 1.0 : 1.0 / static_cast<double>(b.attempts);
    return is_successful(b.status) ? metric_or(b.metrics, "performance", fallback) : 0.0;
}

double block_maintainability(const BlockReport& b) {
    const double fallback = b.issues.empty() ? 1.0 : 0.5;
    return is_successful(b.status) ? metric_or(b.metrics, "maintainability", fallback) : 0.0;
}

[[noreturn]] void throw_merge(MergeError::Kind kind, const std::string& message,
                              std::vector<std::string> components = {}) {
    throw OrchestrationError(MergeError{kind, message, std::move(components)});
}

// Identity of a contribution for comparisons: the target region, or block/step when untargeted.
std::string component_key(const BlockId& block, const Artifact& artifact) {
    if (!artifact.content.target) {
        return block + "/" + artifact.step_id;
    }
    std::string key = *artifact.content.target;
    if (artifact.content.region) {
        key += "#" + std::to_string(artifact.content.region->begin) + "-" +
               std::to_string(artifact.content.region->end);
    }
    return key;
}

bool regions_overlap(const Content& a, const Content& b) {
    if (!a.region || !b.region) return true; // whole-target edit
    return a.region->overlaps(*b.region);
}

} // namespace

// --- evaluators / resolvers ---

BranchMetrics MetricsBranchEvaluator::score(const ImplementationBranch& branch) const {
    BranchMetrics m;
    const auto& blocks = branch.report.blocks;
    if (blocks.empty()) return m;

    double successful = 0.0;
    for (const auto& b : blocks) {
        if (is_successful(b.status)) successful += 1.0;
        m.quality += block_quality(b);
        m.performance += block_performance(b);
        m.maintainability += block_maintainability(b);
    }
    const double n = static_cast<double>(blocks.size());
    m.functionality = successful / n;
    m.quality /= n;
    m.performance /= n;
    m.maintainability /= n;
    return m;
}

double MetricsBranchEvaluator::component_score(const ImplementationBranch&, const BlockReport& block) const {
    if (!is_successful(block.status)) return 0.0;
    const double fallback = (block_quality(block) + block_performance(block) + block_maintainability(block)) / 3.0;
    return metric_or(block.metrics, "score", fallback);
}

std::optional<BranchId> PreferHigherScoreResolver::resolve(const MergeConflict& conflict,
                                                           const BranchEvaluation& evaluation) const {
    auto score = [&evaluation](const BranchId& id) {
        auto it = evaluation.metrics.find(id);
        return it == evaluation.metrics.end() ? 0.0 : it->second.overall;
    };
    const double a = score(conflict.branch_a);
    const double b = score(conflict.branch_b);
    if (a == b) {
        return std::min(conflict.branch_a, conflict.branch_b);
    }
    return a > b ? conflict.branch_a : conflict.branch_b;
}

// --- BranchCoordinator ---

BranchCoordinator::BranchCoordinator(Config config,
                                     GeneratorFactory generators,
                                     std::shared_ptr<ValidationCollaborator> validator,
                                     std::shared_ptr<ResourceMonitor> monitor,
                                     std::shared_ptr<BranchEvaluator> evaluator,
                                     std::shared_ptr<ConflictResolver> resolver)
    : config_(std::move(config)),
      generators_(std::move(generators)),
      validator_(validator ? std::move(validator) : std::make_shared<PassThroughValidator>()),
      monitor_(std::move(monitor)),
      evaluator_(evaluator ? std::move(evaluator) : std::make_shared<MetricsBranchEvaluator>()),
      resolver_(resolver ? std::move(resolver) : std::make_shared<UnresolvedConflictResolver>()) {
    if (!generators_) {
        throw std::invalid_argument("BranchCoordinator requires a generator factory");
    }
}

std::vector<ImplementationBranch> BranchCoordinator::spawn(const std::vector<Approach>& approaches,
                                                           const std::vector<ImplementationBlock>& blocks,
                                                           const std::vector<BlockDependency>& dependencies) const {
    std::vector<ImplementationBranch> branches;
    std::set<std::string> seen;
    for (const auto& approach : approaches) {
        if (!seen.insert(approach.id).second) {
            throw std::runtime_error("Duplicate approach id '" + approach.id + "'");
        }
        ImplementationBranch branch;
        branch.id = "branch-" + approach.id;
        branch.approach = approach;
        branch.plan = DependencyGraph::build(blocks, dependencies, config_.priorities);
        branch.status = BranchStatus::IMPLEMENTING;
        log_info("Branch " + branch.id + " created for approach '" + approach.id + "'");
        branches.push_back(std::move(branch));
    }
    return branches;
}

void BranchCoordinator::run_branch(ImplementationBranch& branch) const {
    std::shared_ptr<GenerationCollaborator> generator = generators_(branch.approach);
    if (!generator) {
        throw std::runtime_error("no generator for approach '" + branch.approach.id + "'");
    }

    std::shared_ptr<CheckpointStorage> storage;
    if (config_.checkpoint_root) {
        storage = std::make_shared<FileCheckpointStorage>(*config_.checkpoint_root / branch.id);
    } else {
        storage = std::make_shared<InMemoryCheckpointStorage>();
    }
    CheckpointStore checkpoints(config_.checkpoints, storage);
    RecoveryManager recovery(config_.recovery, &checkpoints, config_.sleeper);
    BlockScheduler scheduler(config_.scheduler, branch.plan, *generator, *validator_, recovery, checkpoints, monitor_);

    branch.report = scheduler.run();
    branch.plan = scheduler.graph();
}

void BranchCoordinator::implement(std::vector<ImplementationBranch>& branches) const {
    std::vector<std::pair<ImplementationBranch*, std::future<void>>> running;
    for (auto& branch : branches) {
        if (branch.status != BranchStatus::IMPLEMENTING) continue;
        running.emplace_back(&branch, std::async(std::launch::async, [this, &branch]() { run_branch(branch); }));
    }

    for (auto& [branch, future] : running) {
        try {
            future.get();
            branch->status = branch->report.success ? BranchStatus::IMPLEMENTED : BranchStatus::FAILED;
            branch->failure = branch->report.success ? std::string{} : branch->report.message;
        } catch (const std::exception& e) {
            branch->status = BranchStatus::FAILED;
            branch->failure = e.what();
        }
        if (branch->status == BranchStatus::IMPLEMENTED) {
            log_info("Branch " + branch->id + " implemented");
        } else {
            log_error("Branch " + branch->id + " failed: " + branch->failure);
        }
    }
}

BranchEvaluation BranchCoordinator::evaluate(std::vector<ImplementationBranch>& branches) const {
    BranchEvaluation evaluation;
    for (auto& branch : branches) {
        if (branch.status != BranchStatus::IMPLEMENTED) continue;

        BranchMetrics m = evaluator_->score(branch);
        m.overall = overall_score(m, config_.weights);
        branch.metrics = m;
        branch.component_scores.clear();
        for (const auto& block : branch.report.blocks) {
            branch.component_scores[block.id] = evaluator_->component_score(branch, block);
        }
        branch.status = BranchStatus::EVALUATED;

        evaluation.metrics[branch.id] = m;
        evaluation.component_scores[branch.id] = branch.component_scores;
        evaluation.ranking.push_back(branch.id);
        log_info("Branch " + branch.id + " scored " + std::to_string(m.overall));
    }

    std::sort(evaluation.ranking.begin(), evaluation.ranking.end(),
              [&evaluation](const BranchId& a, const BranchId& b) {
                  const double sa = evaluation.metrics.at(a).overall;
                  const double sb = evaluation.metrics.at(b).overall;
                  if (sa != sb) return sa > sb;
                  return a < b;
              });
    return evaluation;
}

const ImplementationBranch& BranchCoordinator::find(const std::vector<ImplementationBranch>& branches,
                                                    const BranchId& id) {
    auto it = std::find_if(branches.begin(), branches.end(),
                           [&id](const ImplementationBranch& b) { return b.id == id; });
    if (it == branches.end()) {
        throw_merge(MergeError::Kind::BRANCH_NOT_FOUND, "branch " + id + " does not exist");
    }
    return *it;
}

MergeResult BranchCoordinator::merge(const std::vector<ImplementationBranch>& branches,
                                     const BranchEvaluation& evaluation,
                                     MergeStrategy strategy,
                                     const ConflictResolver& resolver) {
    if (evaluation.ranking.empty()) {
        throw_merge(MergeError::Kind::NO_BRANCHES_AVAILABLE, "no branch reached the implemented state");
    }

    MergeResult result;
    result.strategy = strategy;
    result.primary = evaluation.ranking.front();

    if (strategy == MergeStrategy::SINGLE_BRANCH) {
        const auto& winner = find(branches, result.primary);
        for (const auto& block : winner.report.blocks) {
            if (!is_successful(block.status)) continue;
            result.sources[block.id] = winner.id;
            result.artifacts[block.id] = block.artifacts;
        }
        return result;
    }

    // 按组件挑选得分最高的分支
    struct Pick {
        const ImplementationBranch* branch = nullptr;
        const BlockReport* block = nullptr;
        double score = 0.0;
    };
    std::map<BlockId, Pick> picks;
    for (const auto& id : evaluation.ranking) {
        const auto& branch = find(branches, id);
        const auto scores = evaluation.component_scores.find(id);
        for (const auto& block : branch.report.blocks) {
            if (!is_successful(block.status)) continue;
            double score = 0.0;
            if (scores != evaluation.component_scores.end()) {
                auto s = scores->second.find(block.id);
                if (s != scores->second.end()) score = s->second;
            }
            auto it = picks.find(block.id);
            if (it == picks.end() || score > it->second.score) { // ties keep the better-ranked branch
                picks[block.id] = Pick{&branch, &block, score};
            }
        }
    }

    struct Adopted {
        BlockId block;
        BranchId branch;
        const Artifact* artifact;
        bool dropped = false;
    };
    std::vector<Adopted> adopted;
    for (const auto& [block_id, pick] : picks) {
        for (const auto& artifact : pick.block->artifacts) {
            adopted.push_back(Adopted{block_id, pick.branch->id, &artifact, false});
        }
    }

    std::vector<std::string> unresolved;
    for (size_t i = 0; i < adopted.size(); ++i) {
        for (size_t j = i + 1; j < adopted.size(); ++j) {
            Adopted& a = adopted[i];
            Adopted& b = adopted[j];
            if (a.dropped || b.dropped || a.branch == b.branch) continue;
            const Content& ca = a.artifact->content;
            const Content& cb = b.artifact->content;
            if (!ca.target || !cb.target || *ca.target != *cb.target) continue;
            if (!regions_overlap(ca, cb) || ca.text == cb.text) continue;

            MergeConflict conflict{*ca.target, a.branch, a.block, b.branch, b.block};
            const std::optional<BranchId> winner = resolver.resolve(conflict, evaluation);
            if (!winner) {
                log_warning("Unresolved merge conflict on " + conflict.component + " between " +
                            a.branch + " and " + b.branch);
                unresolved.push_back(conflict.component);
                continue;
            }
            (*winner == a.branch ? b : a).dropped = true;
            log_info("Merge conflict on " + conflict.component + " resolved in favour of " + *winner);
            result.resolved.push_back(std::move(conflict));
        }
    }

    if (!unresolved.empty()) {
        std::sort(unresolved.begin(), unresolved.end());
        unresolved.erase(std::unique(unresolved.begin(), unresolved.end()), unresolved.end());
        std::string list;
        for (const auto& c : unresolved) list += (list.empty() ? "" : ", ") + c;
        throw_merge(MergeError::Kind::MERGE_CONFLICT, "overlapping edits in " + list, unresolved);
    }

    for (const auto& [block_id, pick] : picks) {
        result.sources[block_id] = pick.branch->id;
        result.artifacts[block_id];
    }
    for (const auto& a : adopted) {
        if (!a.dropped) result.artifacts[a.block].push_back(*a.artifact);
    }
    return result;
}

MergeResult BranchCoordinator::select_and_merge(std::vector<ImplementationBranch>& branches,
                                                const BranchEvaluation& evaluation,
                                                MergeStrategy strategy) const {
    MergeResult result = merge(branches, evaluation, strategy, *resolver_);

    std::set<BranchId> kept{result.primary};
    for (const auto& [block, source] : result.sources) kept.insert(source);

    for (auto& branch : branches) {
        if (branch.status != BranchStatus::EVALUATED) continue;
        branch.status = kept.count(branch.id) ? BranchStatus::SELECTED : BranchStatus::REJECTED;
        log_info("Branch " + branch.id + " " + to_string(branch.status));
    }
    return result;
}

BranchComparison BranchCoordinator::compare(const ImplementationBranch& a, const ImplementationBranch& b) {
    auto collect = [](const ImplementationBranch& branch) {
        std::map<std::string, Artifact> out;
        for (const auto& block : branch.report.blocks) {
            if (!is_successful(block.status)) continue;
            for (const auto& artifact : block.artifacts) {
                out.emplace(component_key(block.id, artifact), artifact);
            }
        }
        return out;
    };
    const auto in_a = collect(a);
    const auto in_b = collect(b);

    BranchComparison comparison;
    comparison.branch_a = a.id;
    comparison.branch_b = b.id;
    for (const auto& [key, artifact] : in_a) {
        auto other = in_b.find(key);
        if (other == in_b.end()) {
            comparison.unique_to_a.push_back(artifact);
        } else if (other->second.content.text == artifact.content.text) {
            comparison.common.push_back(artifact);
        } else {
            comparison.conflicts.emplace_back(artifact, other->second);
        }
    }
    for (const auto& [key, artifact] : in_b) {
        if (!in_a.count(key)) comparison.unique_to_b.push_back(artifact);
    }
    return comparison;
}

void to_json(nlohmann::json& j, const BranchMetrics& m) {
    j = nlohmann::json{
        {"quality", m.quality},
        {"functionality", m.functionality},
        {"performance", m.performance},
        {"maintainability", m.maintainability},
        {"overall", m.overall}
    };
}

void from_json(const nlohmann::json& j, BranchMetrics& m) {
    m.quality = j.value("quality", 0.0);
    m.functionality = j.value("functionality", 0.0);
    m.performance = j.value("performance", 0.0);
    m.maintainability = j.value("maintainability", 0.0);
    m.overall = j.value("overall", 0.0);
}

} // namespace blockflow
