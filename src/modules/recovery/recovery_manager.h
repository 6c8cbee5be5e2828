// modules/recovery/recovery_manager.h
#ifndef BLOCKFLOW_MODULES_RECOVERY_RECOVERY_MANAGER_H
#define BLOCKFLOW_MODULES_RECOVERY_RECOVERY_MANAGER_H

#include "core/types/errors.h"
#include "core/types/recovery.h"
#include "modules/checkpoint/checkpoint_store.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace blockflow {

// How an operation is asked to run.
struct OperationScope {
    bool simplified = false;        // reduced-scope variant
    std::optional<size_t> part;     // set when subdivided
    size_t part_count = 1;
};

// A unit of work the manager may re-run. run() reports failure by throwing OrchestrationError.
struct RecoverableOperation {
    std::string name;
    std::function<Value(const OperationScope&)> run;
    std::function<size_t()> subdivide;                     // optional: number of independent units
    std::function<void(const CheckpointRecord&)> on_revert; // optional: apply restored state
};

enum class RecoveryResolution : uint8_t {
    RECOVERED,        // a retry succeeded
    SIMPLIFIED,
    ALTERNATE,
    SUBDIVIDED,
    SKIPPED,          // recoverable non-result
    REVERTED,         // state restored, operation failed
    ABORTED,
    FALLBACK_FAILED
};

std::string to_string(RecoveryResolution resolution);

struct RecoveryOutcome {
    RecoveryResolution resolution = RecoveryResolution::ABORTED;
    std::optional<Value> result;  // for the succeeding resolutions; an array of part results when subdivided
    Error error;                  // most recent failure
    int retries = 0;
    std::optional<CheckpointId> reverted_to;
    std::string message;

    bool succeeded() const { return result.has_value(); }
};

// Keyed by error code name ("GenerationFailure") or category name ("Resource").
std::map<std::string, RecoveryPolicy> default_recovery_policies();

class RecoveryManager {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using RetryObserver = std::function<void(int retry, std::chrono::milliseconds delay, const Error& error)>;

    struct Config {
        std::map<std::string, RecoveryPolicy> policies = default_recovery_policies();
        RecoveryPolicy default_policy{1, FixedBackoff{std::chrono::milliseconds(100)}, Fallback{FallbackAction::ABORT, {}}};
        size_t subdivide_parts = 2; // used when an operation does not say how to split
        Config() = default;
    };

    // checkpoints may be null; Revert then has nothing to restore and fails.
    RecoveryManager(Config config, CheckpointStore* checkpoints, Sleeper sleeper = {});

    // Policy lookup: error code, then category, then the default.
    const RecoveryPolicy& strategy_for(const Error& error) const;

    // `error` is the failure that triggered recovery; the operation is re-run up to
    // max_retries times and then the fallback is applied exactly once.
    // Checkpoint load failures during Revert propagate.
    RecoveryOutcome attempt(const RecoverableOperation& operation, const Error& error,
                            const RetryObserver& observer = {});

    void register_alternate(const std::string& id, RecoverableOperation operation);

private:
    const Config config_;
    CheckpointStore* checkpoints_;
    Sleeper sleeper_;

    mutable std::mutex alternates_mutex_;
    std::map<std::string, RecoverableOperation> alternates_;

    RecoveryOutcome apply_fallback(const RecoverableOperation& operation, const Fallback& fallback,
                                   RecoveryOutcome outcome);
};

} // namespace blockflow

#endif // BLOCKFLOW_MODULES_RECOVERY_RECOVERY_MANAGER_H
