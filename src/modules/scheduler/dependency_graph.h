// modules/scheduler/dependency_graph.h
#ifndef BLOCKFLOW_MODULES_SCHEDULER_DEPENDENCY_GRAPH_H
#define BLOCKFLOW_MODULES_SCHEDULER_DEPENDENCY_GRAPH_H

#include "core/types/block.h"
#include <map>
#include <string>
#include <vector>

namespace blockflow {

struct PriorityWeights {
    double critical_path_bonus = 10.0;
    double dependent_bonus = 2.0;   // per gating dependent
    double risk_weight = 5.0;       // times risk_factor
    double influence_bonus = 1.0;   // per Influences / ProvidesInformation dependent
};

/**
 * Validated block graph.
 *
 * Only RequiredBefore / RequiredForCompletion edges gate execution and take
 * part in cycle detection, layering and the critical path. Soft edges are
 * kept for priority scoring; Alternative edges are recorded only.
 */
class DependencyGraph {
public:
    DependencyGraph() = default;

    // Throws OrchestrationError(StructuralError) on duplicate ids, unknown
    // references or a gating cycle (the path starts and ends on the same block).
    static DependencyGraph build(std::vector<ImplementationBlock> blocks,
                                 const std::vector<BlockDependency>& dependencies,
                                 const PriorityWeights& weights = PriorityWeights{});

    // Kahn rounds; each layer ordered by priority (desc), then id.
    std::vector<std::vector<BlockId>> layers() const;
    std::vector<BlockId> execution_order() const;

    const std::vector<BlockId>& critical_path() const { return critical_path_; }
    double priority(const BlockId& id) const;

    bool contains(const BlockId& id) const { return blocks_.count(id) > 0; }
    size_t size() const { return blocks_.size(); }

    const ImplementationBlock& block(const BlockId& id) const;
    ImplementationBlock& block(const BlockId& id);
    const std::map<BlockId, ImplementationBlock>& blocks() const { return blocks_; }
    const std::vector<BlockDependency>& dependencies() const { return edges_; }

    const std::vector<BlockId>& gating_prerequisites(const BlockId& id) const;
    const std::vector<BlockId>& gating_dependents(const BlockId& id) const;

private:
    std::map<BlockId, ImplementationBlock> blocks_;
    std::vector<BlockDependency> edges_;
    std::map<BlockId, std::vector<BlockId>> prerequisites_; // gating, deduplicated
    std::map<BlockId, std::vector<BlockId>> dependents_;    // gating, deduplicated
    std::map<BlockId, double> priorities_;
    std::vector<BlockId> critical_path_;

    void check_acyclic() const;
    std::vector<BlockId> topological_order() const;
    void compute_critical_path();
    void compute_priorities(const PriorityWeights& weights);
};

} // namespace blockflow

#endif // BLOCKFLOW_MODULES_SCHEDULER_DEPENDENCY_GRAPH_H
