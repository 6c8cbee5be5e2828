// common/config/orchestrator_config.h
#ifndef BLOCKFLOW_COMMON_CONFIG_ORCHESTRATOR_CONFIG_H
#define BLOCKFLOW_COMMON_CONFIG_ORCHESTRATOR_CONFIG_H

#include "common/utils/log.h"
#include "core/types/resource.h"
#include "modules/branch/branch.h"
#include "modules/checkpoint/checkpoint_store.h"
#include "modules/chunker/adaptive_chunker.h"
#include "modules/recovery/recovery_manager.h"
#include "modules/scheduler/block_scheduler.h"
#include "modules/scheduler/dependency_graph.h"
#include <chrono>
#include <optional>
#include <string>

namespace blockflow {

// Every field has a default; a default-constructed config is usable as is.
struct OrchestratorConfig {
    struct Checkpoints {
        CheckpointStore::Config store;
        std::optional<std::string> directory; // file-backed when set
    };

    struct Resources {
        ResourceLimits limits;
        std::chrono::milliseconds interval{1000};
    };

    struct Scheduler {
        BlockScheduler::Config run;
        PriorityWeights priorities;
    };

    struct Branches {
        EvaluationWeights weights;
        MergeStrategy merge_strategy = MergeStrategy::SINGLE_BRANCH;
        bool prefer_higher_score = false;       // resolve selective-merge conflicts automatically
        std::optional<std::string> directory;   // where branches are kept after a merge failure
    };

    Checkpoints checkpoints;
    Resources resources;
    AdaptiveChunker::Config chunking;
    Scheduler scheduler;
    RecoveryManager::Config recovery;
    Branches branches;
    LogLevel log_level = LogLevel::INFO;
};

} // namespace blockflow

#endif // BLOCKFLOW_COMMON_CONFIG_ORCHESTRATOR_CONFIG_H
