// modules/recovery/recovery_manager.cpp
#include "modules/recovery/recovery_manager.h"
#include "common/utils/log.h"
#include <stdexcept>
#include <thread>

namespace blockflow {

using std::chrono::milliseconds;

std::string to_string(RecoveryResolution resolution) {
    switch (resolution) {
        case RecoveryResolution::RECOVERED: return "recovered";
        case RecoveryResolution::SIMPLIFIED: return "simplified";
        case RecoveryResolution::ALTERNATE: return "alternate";
        case RecoveryResolution::SUBDIVIDED: return "subdivided";
        case RecoveryResolution::SKIPPED: return "skipped";
        case RecoveryResolution::REVERTED: return "reverted";
        case RecoveryResolution::ABORTED: return "aborted";
        case RecoveryResolution::FALLBACK_FAILED: return "fallback_failed";
    }
    return "unknown";
}

std::map<std::string, RecoveryPolicy> default_recovery_policies() {
    const ExponentialBackoff exponential{milliseconds(200), 2.0, milliseconds(5000)};
    const LinearBackoff linear{milliseconds(100), milliseconds(200), milliseconds(2000)};
    const FixedBackoff fixed{milliseconds(100)};

    std::map<std::string, RecoveryPolicy> policies;
    policies["MemoryLimitExceeded"] = {0, fixed, {FallbackAction::SIMPLIFY, {}}};
    policies["CpuLimitExceeded"] = {0, fixed, {FallbackAction::SIMPLIFY, {}}};
    policies["DiskLimitExceeded"] = {0, fixed, {FallbackAction::SUBDIVIDE, {}}};
    policies["GenerationFailure"] = {3, exponential, {FallbackAction::ABORT, {}}};
    policies["BuildError"] = {3, exponential, {FallbackAction::ABORT, {}}};
    policies["ValidationFailure"] = {2, linear, {FallbackAction::SIMPLIFY, {}}};
    policies["TimeoutError"] = {1, fixed, {FallbackAction::SUBDIVIDE, {}}};
    policies["IOError"] = {2, fixed, {FallbackAction::SKIP, {}}};
    policies["SerializationError"] = {2, fixed, {FallbackAction::SKIP, {}}};
    return policies;
}

RecoveryManager::RecoveryManager(Config config, CheckpointStore* checkpoints, Sleeper sleeper)
    : config_(std::move(config)), checkpoints_(checkpoints), sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

const RecoveryPolicy& RecoveryManager::strategy_for(const Error& error) const {
    auto it = config_.policies.find(error_code(error));
    if (it != config_.policies.end()) return it->second;
    it = config_.policies.find(category_name(category_of(error)));
    if (it != config_.policies.end()) return it->second;
    return config_.default_policy;
}

void RecoveryManager::register_alternate(const std::string& id, RecoverableOperation operation) {
    std::lock_guard<std::mutex> lock(alternates_mutex_);
    alternates_[id] = std::move(operation);
}

RecoveryOutcome RecoveryManager::attempt(const RecoverableOperation& operation, const Error& error,
                                         const RetryObserver& observer) {
    RecoveryOutcome outcome;
    outcome.error = error;

    if (category_of(error) == ErrorCategory::STRUCTURAL) {
        outcome.resolution = RecoveryResolution::ABORTED;
        outcome.message = "structural errors are not recoverable";
        return outcome;
    }

    const RecoveryPolicy& policy = strategy_for(error);
    for (int retry = 0; retry < policy.max_retries; ++retry) {
        const milliseconds delay = backoff_delay(policy.backoff, retry);
        log_info("Retrying '" + operation.name + "' (" + std::to_string(retry + 1) + "/" +
                 std::to_string(policy.max_retries) + ") after " + std::to_string(delay.count()) +
                 "ms: " + describe(outcome.error));
        if (observer) observer(retry, delay, outcome.error);
        sleeper_(delay);

        ++outcome.retries;
        try {
            outcome.result = operation.run(OperationScope{});
            outcome.resolution = RecoveryResolution::RECOVERED;
            outcome.message = "recovered after " + std::to_string(outcome.retries) + " retr" +
                              (outcome.retries == 1 ? "y" : "ies");
            return outcome;
        } catch (const OrchestrationError& e) {
            outcome.error = e.error();
        }
    }

    return apply_fallback(operation, policy.fallback, std::move(outcome));
}

RecoveryOutcome RecoveryManager::apply_fallback(const RecoverableOperation& operation, const Fallback& fallback,
                                                RecoveryOutcome outcome) {
    log_warning("Applying fallback '" + to_string(fallback.action) + "' to '" + operation.name + "' after " +
                std::to_string(outcome.retries) + " retries: " + describe(outcome.error));

    switch (fallback.action) {
        case FallbackAction::SKIP:
            outcome.resolution = RecoveryResolution::SKIPPED;
            outcome.message = "skipped: " + describe(outcome.error);
            return outcome;

        case FallbackAction::SIMPLIFY: {
            OperationScope scope;
            scope.simplified = true;
            try {
                outcome.result = operation.run(scope);
                outcome.resolution = RecoveryResolution::SIMPLIFIED;
                outcome.message = "completed with reduced scope";
            } catch (const OrchestrationError& e) {
                outcome.error = e.error();
                outcome.resolution = RecoveryResolution::FALLBACK_FAILED;
                outcome.message = "simplified run failed: " + describe(outcome.error);
            }
            return outcome;
        }

        case FallbackAction::REVERT: {
            std::optional<Checkpoint> latest = checkpoints_ ? checkpoints_->latest() : std::nullopt;
            if (!latest) {
                outcome.resolution = RecoveryResolution::FALLBACK_FAILED;
                outcome.message = "no checkpoint to revert to";
                return outcome;
            }
            CheckpointRecord record = checkpoints_->load(latest->id); // load failure is fatal
            if (operation.on_revert) operation.on_revert(record);
            outcome.resolution = RecoveryResolution::REVERTED;
            outcome.reverted_to = latest->id;
            outcome.message = "reverted to " + latest->id + ": " + describe(outcome.error);
            return outcome;
        }

        case FallbackAction::USE_ALTERNATE: {
            std::optional<RecoverableOperation> alternate;
            {
                std::lock_guard<std::mutex> lock(alternates_mutex_);
                auto it = alternates_.find(fallback.alternate);
                if (it != alternates_.end()) alternate = it->second;
            }
            if (!alternate || !alternate->run) {
                outcome.resolution = RecoveryResolution::FALLBACK_FAILED;
                outcome.message = "alternate '" + fallback.alternate + "' is not registered";
                return outcome;
            }
            try {
                outcome.result = alternate->run(OperationScope{});
                outcome.resolution = RecoveryResolution::ALTERNATE;
                outcome.message = "completed by alternate '" + fallback.alternate + "'";
            } catch (const OrchestrationError& e) {
                outcome.error = e.error();
                outcome.resolution = RecoveryResolution::FALLBACK_FAILED;
                outcome.message = "alternate '" + fallback.alternate + "' failed: " + describe(outcome.error);
            }
            return outcome;
        }

        case FallbackAction::SUBDIVIDE: {
            const size_t parts = operation.subdivide ? operation.subdivide() : config_.subdivide_parts;
            Value results = Value::array();
            size_t failed = 0;
            for (size_t i = 0; i < parts; ++i) {
                OperationScope scope;
                scope.part = i;
                scope.part_count = parts;
                try {
                    results.push_back(operation.run(scope));
                } catch (const OrchestrationError& e) {
                    outcome.error = e.error();
                    ++failed;
                }
            }
            if (failed == 0) {
                outcome.result = std::move(results);
                outcome.resolution = RecoveryResolution::SUBDIVIDED;
                outcome.message = "completed in " + std::to_string(parts) + " parts";
            } else {
                outcome.resolution = RecoveryResolution::FALLBACK_FAILED;
                outcome.message = std::to_string(failed) + " of " + std::to_string(parts) +
                                  " parts failed: " + describe(outcome.error);
            }
            return outcome;
        }

        case FallbackAction::ABORT:
            break;
    }

    outcome.resolution = RecoveryResolution::ABORTED;
    outcome.message = describe(outcome.error);
    return outcome;
}

} // namespace blockflow
