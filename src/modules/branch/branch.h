// modules/branch/branch.h
#ifndef BLOCKFLOW_MODULES_BRANCH_BRANCH_H
#define BLOCKFLOW_MODULES_BRANCH_BRANCH_H

#include "core/types/report.h"
#include "modules/scheduler/dependency_graph.h"
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace blockflow {

using BranchId = std::string; // "branch-<approach id>"

enum class BranchStatus : uint8_t {
    CREATED,
    IMPLEMENTING,
    IMPLEMENTED,
    FAILED,
    EVALUATED,
    SELECTED,
    REJECTED
};

inline std::string to_string(BranchStatus status) {
    switch (status) {
        case BranchStatus::CREATED: return "created";
        case BranchStatus::IMPLEMENTING: return "implementing";
        case BranchStatus::IMPLEMENTED: return "implemented";
        case BranchStatus::FAILED: return "failed";
        case BranchStatus::EVALUATED: return "evaluated";
        case BranchStatus::SELECTED: return "selected";
        case BranchStatus::REJECTED: return "rejected";
    }
    return "unknown";
}

inline BranchStatus parse_branch_status(const std::string& s) {
    if (s == "created") return BranchStatus::CREATED;
    if (s == "implementing") return BranchStatus::IMPLEMENTING;
    if (s == "implemented") return BranchStatus::IMPLEMENTED;
    if (s == "failed") return BranchStatus::FAILED;
    if (s == "evaluated") return BranchStatus::EVALUATED;
    if (s == "selected") return BranchStatus::SELECTED;
    if (s == "rejected") return BranchStatus::REJECTED;
    throw std::runtime_error("Unknown branch status '" + s + "'");
}

// A candidate strategy. parameters are handed to the generator factory.
struct Approach {
    std::string id;
    std::string description;
    Value parameters = Value::object();
};

struct BranchMetrics {
    double quality = 0.0;
    double functionality = 0.0;
    double performance = 0.0;
    double maintainability = 0.0;
    double overall = 0.0;
};

struct EvaluationWeights {
    double quality = 0.3;
    double functionality = 0.4;
    double performance = 0.15;
    double maintainability = 0.15;
};

// Weighted sum of the four subscores.
inline double overall_score(const BranchMetrics& m, const EvaluationWeights& w) {
    return m.quality * w.quality + m.functionality * w.functionality + m.performance * w.performance +
           m.maintainability * w.maintainability;
}

struct ImplementationBranch {
    BranchId id;
    Approach approach;
    DependencyGraph plan;                   // own copy of the block graph
    BranchStatus status = BranchStatus::CREATED;
    RunReport report;                       // filled by implement()
    std::optional<BranchMetrics> metrics;   // only once implemented
    std::map<BlockId, double> component_scores;
    std::string failure;                    // why the branch failed, if it did
};

struct BranchEvaluation {
    std::vector<BranchId> ranking; // best first
    std::map<BranchId, BranchMetrics> metrics;
    std::map<BranchId, std::map<BlockId, double>> component_scores;
};

// Two adopted contributions touching the same region of one component.
struct MergeConflict {
    std::string component;
    BranchId branch_a;
    BlockId block_a;
    BranchId branch_b;
    BlockId block_b;
};

enum class MergeStrategy : uint8_t {
    SINGLE_BRANCH,
    SELECTIVE
};

struct MergeResult {
    MergeStrategy strategy = MergeStrategy::SINGLE_BRANCH;
    BranchId primary;                              // best-ranked branch
    std::map<BlockId, BranchId> sources;           // which branch each block came from
    std::map<BlockId, std::vector<Artifact>> artifacts;
    std::vector<MergeConflict> resolved;           // conflicts settled by the resolver
};

struct BranchComparison {
    BranchId branch_a;
    BranchId branch_b;
    std::vector<Artifact> common;
    std::vector<Artifact> unique_to_a;
    std::vector<Artifact> unique_to_b;
    std::vector<std::pair<Artifact, Artifact>> conflicts;
};

void to_json(nlohmann::json& j, const BranchMetrics& m);
void from_json(const nlohmann::json& j, BranchMetrics& m);

} // namespace blockflow

#endif // BLOCKFLOW_MODULES_BRANCH_BRANCH_H
