// modules/scheduler/execution_session.h
#ifndef BLOCKFLOW_MODULES_SCHEDULER_EXECUTION_SESSION_H
#define BLOCKFLOW_MODULES_SCHEDULER_EXECUTION_SESSION_H

#include "core/types/block.h"
#include "core/types/errors.h"
#include "modules/collaborators/collaborators.h"
#include "modules/recovery/recovery_manager.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace blockflow {

// Checked by a running block at its safe points (between steps).
class CancellationToken {
public:
    void cancel(Error reason);
    void reset();
    bool cancelled() const { return cancelled_.load(); }
    std::optional<Error> reason() const;

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    std::optional<Error> reason_;
};

struct BlockOutcome {
    BlockId id;
    BlockStatus status = BlockStatus::FAILED; // COMPLETED, COMPLETED_WITH_ISSUES or FAILED
    std::string reason;
    int attempts = 0;
    std::vector<Artifact> artifacts;
    Value metrics = Value::object();
    std::vector<std::string> issues;
    std::optional<Error> error;
    std::optional<RecoveryResolution> resolution;
    bool skipped = false;                     // Skip fallback: the scheduler defers the block
    std::optional<CheckpointId> reverted_to;  // artifacts were restored from this checkpoint
};

enum class BlockEventType : uint8_t {
    STARTED,
    RETRYING,
    FINISHED
};

// Message from a worker to the scheduler.
struct BlockEvent {
    BlockEventType type = BlockEventType::FINISHED;
    BlockId id;
    int attempt = 0;
    std::string message;
    std::optional<BlockOutcome> outcome; // FINISHED
    std::exception_ptr fatal;            // FINISHED with an unrecoverable error
};

using EventSink = std::function<void(BlockEvent)>;

/**
 * Runs one block's steps against the collaborators on a worker thread.
 *
 * This is the only place collaborator exceptions are seen; they are mapped
 * into the error taxonomy here and handed to the recovery manager. The
 * session never touches scheduler state, it reports through the sink.
 *
 * With a deadline, each collaborator call runs on its own thread and the
 * worker waits for the result only until the deadline. A call that misses
 * it is abandoned and joined when the session is destroyed.
 */
class ExecutionSession {
public:
    struct Config {
        double timeout_multiplier = 2.0; // deadline = estimated_effort x multiplier; effort 0 = none
        Config() = default;
    };

    ExecutionSession(Config config,
                     GenerationCollaborator& generator,
                     ValidationCollaborator& validator,
                     RecoveryManager& recovery);
    ~ExecutionSession();

    ExecutionSession(const ExecutionSession&) = delete;
    ExecutionSession& operator=(const ExecutionSession&) = delete;

    // Failures that recovery cannot absorb (a checkpoint load during Revert) propagate.
    BlockOutcome execute(const ImplementationBlock& block, CancellationToken& token, const EventSink& sink);

private:
    using Clock = std::chrono::steady_clock;

    const Config config_;
    GenerationCollaborator& generator_;
    ValidationCollaborator& validator_;
    RecoveryManager& recovery_;

    struct AbandonedCall {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };
    std::mutex abandoned_mutex_;
    std::vector<AbandonedCall> abandoned_;

    std::optional<Clock::time_point> deadline_for(const ImplementationBlock& block) const;

    // Runs call inline without a deadline; otherwise throws TimeoutError once it passes.
    template <typename T>
    T call_before(const std::optional<Clock::time_point>& deadline, std::function<T()> call,
                  const std::string& what);
    void reap_abandoned();

    // Returns {"artifacts", "metrics", "issues"}. Throws OrchestrationError.
    Value run_steps(const ImplementationBlock& block, const OperationScope& scope,
                    const CancellationToken& token, bool validate_result);
    Value validate(const ImplementationBlock& block, const std::vector<Artifact>& artifacts,
                   const std::optional<Clock::time_point>& deadline = std::nullopt);
};

} // namespace blockflow

#endif // BLOCKFLOW_MODULES_SCHEDULER_EXECUTION_SESSION_H
