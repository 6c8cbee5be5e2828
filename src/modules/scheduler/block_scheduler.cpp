// modules/scheduler/block_scheduler.cpp
#include "modules/scheduler/block_scheduler.h"
#include "common/utils/log.h"
#include "common/utils/template_renderer.h"
#include <algorithm>
#include <stdexcept>
#include <tuple>

namespace blockflow {

namespace {

ExecutionSession::Config session_config(const BlockScheduler::Config& config) {
    ExecutionSession::Config session;
    session.timeout_multiplier = config.timeout_multiplier;
    return session;
}

} // namespace

BlockScheduler::BlockScheduler(Config config,
                               DependencyGraph graph,
                               GenerationCollaborator& generator,
                               ValidationCollaborator& validator,
                               RecoveryManager& recovery,
                               CheckpointStore& checkpoints,
                               std::shared_ptr<ResourceMonitor> monitor)
    : config_(std::move(config)),
      graph_(std::move(graph)),
      checkpoints_(checkpoints),
      recovery_(recovery),
      monitor_(std::move(monitor)),
      session_(session_config(config_), generator, validator, recovery),
      pool_(config_.max_parallel_paths) {}

// --- state transitions (caller holds state_mutex_) ---

void BlockScheduler::transition_locked(ImplementationBlock& block, BlockStatus to, const std::string& reason) {
    if (!can_transition(block.status, to)) {
        throw std::runtime_error("Invalid transition for block '" + block.id + "': " +
                                 to_string(block.status) + " -> " + to_string(to));
    }
    const std::string line = "Block " + block.id + ": " + to_string(block.status) + " -> " + to_string(to) +
                             (reason.empty() ? std::string{} : " (" + reason + ")");
    if (to == BlockStatus::FAILED || to == BlockStatus::DEFERRED || to == BlockStatus::BLOCKED) {
        log_warning(line);
    } else {
        log_info(line);
    }
    block.status = to;
    block.status_reason = reason;
}

void BlockScheduler::block_dependents_locked(const BlockId& failed) {
    const auto& failed_block = graph_.block(failed);
    for (const auto& id : graph_.gating_dependents(failed)) {
        auto& dependent = graph_.block(id);
        if (dependent.status == BlockStatus::NOT_STARTED || dependent.status == BlockStatus::READY) {
            transition_locked(dependent, BlockStatus::BLOCKED,
                              "prerequisite " + failed + " is " + to_string(failed_block.status));
        }
    }
}

void BlockScheduler::defer_leftovers_locked() {
    for (const auto& id : graph_.execution_order()) {
        auto& block = graph_.block(id);
        if (block.status == BlockStatus::NOT_STARTED || block.status == BlockStatus::BLOCKED ||
            block.status == BlockStatus::READY) {
            const std::string reason = block.status_reason.empty() ? "not reached in this run" : block.status_reason;
            transition_locked(block, BlockStatus::DEFERRED, reason);
        }
    }
}

// --- checkpoints ---

State BlockScheduler::snapshot_state_locked() const {
    State blocks = State::object();
    for (const auto& [id, block] : graph_.blocks()) {
        blocks[id] = {
            {"status", to_string(block.status)},
            {"reason", block.status_reason},
            {"attempts", block.attempts}
        };
    }
    return State{{"blocks", blocks}};
}

Value BlockScheduler::artifacts_json_locked() const {
    Value out = Value::object();
    for (const auto& [id, list] : artifacts_) {
        out[id] = list;
    }
    return out;
}

State BlockScheduler::snapshot_state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return snapshot_state_locked();
}

std::optional<CheckpointId> BlockScheduler::checkpoint(const std::string& reason) {
    // 快照与写入在同一临界区内
    std::lock_guard<std::mutex> lock(state_mutex_);
    const State state = snapshot_state_locked();
    const Value artifacts = artifacts_json_locked();
    try {
        CheckpointId id = checkpoints_.create(state, reason, artifacts);
        taken_.push_back(id);
        return id;
    } catch (const OrchestrationError& e) {
        if (e.category() != ErrorCategory::PERSISTENCE) throw;

        RecoverableOperation operation;
        operation.name = "checkpoint " + reason;
        operation.run = [&](const OperationScope&) {
            return Value(checkpoints_.create(state, reason, artifacts));
        };
        operation.subdivide = []() { return size_t{1}; };

        RecoveryOutcome recovered = recovery_.attempt(operation, e.error());
        if (recovered.succeeded()) {
            const Value& result = *recovered.result;
            const Value created = result.is_array() && !result.empty() ? result.back() : result;
            if (created.is_string() && checkpoints_.contains(created.get<std::string>())) {
                CheckpointId id = created.get<std::string>();
                taken_.push_back(id);
                return id;
            }
            recovered.message = "recovery did not produce a checkpoint id";
        }
        const std::string warning = "continuing without checkpoint '" + reason + "': " + recovered.message;
        log_warning(warning);
        warnings_.push_back(warning);
        return std::nullopt;
    }
}

// --- run loop ---

RunReport BlockScheduler::run() {
    return run_layers("run-start");
}

RunReport BlockScheduler::resume(const CheckpointId& checkpoint_id) {
    CheckpointRecord record = checkpoints_.load(checkpoint_id);

    std::map<BlockId, std::tuple<BlockStatus, std::string, int>> statuses;
    std::map<BlockId, std::vector<Artifact>> restored;
    try {
        const Value blocks = record.state.value("blocks", Value::object());
        for (const auto& [id, block] : graph_.blocks()) {
            BlockStatus status = BlockStatus::NOT_STARTED;
            std::string reason;
            int attempts = 0;
            if (blocks.contains(id)) {
                const Value& entry = blocks.at(id);
                status = parse_block_status(entry.value("status", std::string("not_started")));
                reason = entry.value("reason", std::string{});
                attempts = entry.value("attempts", 0);
            }
            if (status == BlockStatus::IN_PROGRESS || status == BlockStatus::READY || status == BlockStatus::BLOCKED) {
                status = BlockStatus::NOT_STARTED;
                reason.clear();
            }
            statuses[id] = {status, reason, attempts};
        }
        for (const auto& [id, list] : record.artifacts.items()) {
            if (graph_.contains(id)) {
                restored[id] = list.get<std::vector<Artifact>>();
            }
        }
    } catch (const std::exception& e) {
        throw OrchestrationError(PersistenceError{PersistenceError::Kind::SERIALIZATION_ERROR,
                                                  "cannot restore checkpoint " + checkpoint_id + ": " + e.what()});
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        for (const auto& [id, entry] : statuses) {
            auto& block = graph_.block(id);
            block.status = std::get<0>(entry);
            block.status_reason = std::get<1>(entry);
            block.attempts = std::get<2>(entry);
        }
        artifacts_ = std::move(restored);
        metrics_.clear();
        issues_.clear();
    }
    log_info("Resuming from checkpoint " + checkpoint_id);
    return run_layers("resume:" + checkpoint_id);
}

RunReport BlockScheduler::run_layers(const std::string& start_reason) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        ++run_counter_;
        traces_.set_trace_id("run-" + std::to_string(run_counter_));
        warnings_.clear();
        taken_.clear();
    }
    log_info("Scheduling " + std::to_string(graph_.size()) + " block(s) on " +
             std::to_string(pool_.size()) + " worker(s)");
    checkpoint(start_reason);

    for (const auto& layer : graph_.layers()) {
        std::vector<BlockId> runnable;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            for (const auto& id : layer) {
                auto& block = graph_.block(id);
                if (is_terminal(block.status)) continue;

                std::optional<BlockId> waiting;
                for (const auto& prerequisite : graph_.gating_prerequisites(id)) {
                    if (!is_successful(graph_.block(prerequisite).status)) {
                        waiting = prerequisite;
                        break;
                    }
                }
                if (waiting) {
                    if (block.status != BlockStatus::BLOCKED) {
                        transition_locked(block, BlockStatus::BLOCKED,
                                          "prerequisite " + *waiting + " is " +
                                              to_string(graph_.block(*waiting).status));
                    }
                    continue;
                }
                transition_locked(block, BlockStatus::READY, "");
                runnable.push_back(id);
            }
        }
        if (!runnable.empty()) {
            run_layer(runnable);
        }
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        defer_leftovers_locked();
    }
    checkpoint("run-complete");

    RunReport report = build_report();
    log_info(report.message);
    return report;
}

void BlockScheduler::run_layer(const std::vector<BlockId>& layer) {
    std::map<BlockId, InFlight> in_flight;
    std::exception_ptr fatal;
    size_t pending = 0;

    for (const auto& id : layer) {
        const auto before = checkpoint("before:" + id);

        ImplementationBlock copy;
        double priority = 0.0;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            auto& block = graph_.block(id);
            transition_locked(block, BlockStatus::IN_PROGRESS, "");
            copy = block;
            priority = graph_.priority(id);
            traces_.on_block_start(id, priority, before);
        }

        auto token = std::make_shared<CancellationToken>();
        in_flight[id] = InFlight{token, priority, false};
        ++pending;

        pool_.submit([this, copy = std::move(copy), token]() {
            BlockEvent finished;
            finished.type = BlockEventType::FINISHED;
            finished.id = copy.id;
            try {
                finished.outcome = session_.execute(copy, *token, [this](BlockEvent e) { channel_.send(std::move(e)); });
            } catch (...) {
                // carried to the scheduler thread and rethrown there
                finished.fatal = std::current_exception();
            }
            channel_.send(std::move(finished));
        });
    }

    while (pending > 0) {
        if (auto event = channel_.receive(config_.poll_interval)) {
            if (event->type == BlockEventType::FINISHED) --pending;
            apply_event(*event, in_flight, fatal);
        }
        if (pending > 0) {
            relieve_pressure(in_flight);
        }
    }

    if (fatal) {
        std::rethrow_exception(fatal);
    }
}

void BlockScheduler::apply_event(BlockEvent& event, std::map<BlockId, InFlight>& in_flight,
                                 std::exception_ptr& fatal) {
    switch (event.type) {
        case BlockEventType::STARTED:
            log_debug("Block " + event.id + " started on a worker");
            return;

        case BlockEventType::RETRYING: {
            std::lock_guard<std::mutex> lock(state_mutex_);
            auto& block = graph_.block(event.id);
            if (block.status == BlockStatus::IN_PROGRESS) {
                transition_locked(block, BlockStatus::FAILED, event.message);
                transition_locked(block, BlockStatus::IN_PROGRESS, "attempt " + std::to_string(event.attempt));
            }
            block.attempts = event.attempt;
            return;
        }

        case BlockEventType::FINISHED:
            break;
    }

    in_flight.erase(event.id);

    if (event.fatal) {
        if (!fatal) fatal = event.fatal;
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto& block = graph_.block(event.id);
        transition_locked(block, BlockStatus::FAILED, "unrecoverable error during recovery");
        block_dependents_locked(event.id);
        traces_.on_block_end(event.id, block.status, block.attempts, std::nullopt, std::nullopt);
        return;
    }

    const BlockOutcome& outcome = *event.outcome;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto& block = graph_.block(outcome.id);
        block.attempts = outcome.attempts;
        artifacts_[outcome.id] = outcome.artifacts;
        metrics_[outcome.id] = outcome.metrics;
        issues_[outcome.id] = outcome.issues;

        transition_locked(block, outcome.status, outcome.reason);
        if (outcome.status == BlockStatus::FAILED) {
            if (outcome.skipped) {
                transition_locked(block, BlockStatus::DEFERRED, outcome.reason);
            }
            block_dependents_locked(outcome.id);
        }
        traces_.on_block_end(outcome.id, block.status, outcome.attempts,
                             outcome.error ? std::optional<std::string>(error_code(*outcome.error)) : std::nullopt,
                             outcome.resolution ? std::optional<std::string>(to_string(*outcome.resolution))
                                                : std::nullopt);
    }

    const auto after = checkpoint("after:" + outcome.id);
    std::lock_guard<std::mutex> lock(state_mutex_);
    traces_.on_checkpoint_after(outcome.id, after);
}

void BlockScheduler::relieve_pressure(std::map<BlockId, InFlight>& in_flight) {
    if (!monitor_ || !config_.cancel_on_pressure) return;

    const ResourceReport report = monitor_->check_limits();
    const auto exceeded = report.first_exceeded();
    if (!exceeded) return;

    std::vector<std::pair<const BlockId*, InFlight*>> active;
    for (auto& [id, flight] : in_flight) {
        if (!flight.cancelled) active.emplace_back(&id, &flight);
    }
    if (active.size() < 2) return; // the highest-priority block keeps running

    auto victim = std::min_element(active.begin(), active.end(), [](const auto& a, const auto& b) {
        if (a.second->priority != b.second->priority) return a.second->priority < b.second->priority;
        return *a.first > *b.first;
    });

    const std::string message = "resource limit exceeded, cancelling lower-priority block " + *victim->first;
    log_warning(message);
    victim->second->token->cancel(ResourceError{*exceeded, message});
    victim->second->cancelled = true;
}

// --- queries ---

void BlockScheduler::defer(const BlockId& id, const std::string& reason) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto& block = graph_.block(id);
    if (block.status != BlockStatus::NOT_STARTED && block.status != BlockStatus::FAILED &&
        block.status != BlockStatus::BLOCKED) {
        throw std::runtime_error("Cannot defer block '" + id + "' in state " + to_string(block.status));
    }
    transition_locked(block, BlockStatus::DEFERRED, reason);
}

std::vector<BlockId> BlockScheduler::execution_order() const {
    return graph_.execution_order();
}

BlockStatus BlockScheduler::status(const BlockId& id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return graph_.block(id).status;
}

std::map<BlockId, std::vector<Artifact>> BlockScheduler::artifacts() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return artifacts_;
}

std::vector<TraceRecord> BlockScheduler::traces() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return traces_.get_traces();
}

RunReport BlockScheduler::build_report() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    RunReport report;
    report.warnings = warnings_;
    report.checkpoints = taken_;

    Value rows = Value::array();
    for (const auto& id : graph_.execution_order()) {
        const auto& block = graph_.block(id);
        BlockReport entry;
        entry.id = id;
        entry.status = block.status;
        entry.reason = block.status_reason;
        entry.attempts = block.attempts;
        if (auto it = artifacts_.find(id); it != artifacts_.end()) entry.artifacts = it->second;
        if (auto it = metrics_.find(id); it != metrics_.end()) entry.metrics = it->second;
        if (auto it = issues_.find(id); it != issues_.end()) entry.issues = it->second;
        rows.push_back(Value{
            {"id", id},
            {"status", to_string(block.status)},
            {"note", block.status_reason.empty() ? std::string{} : " (" + block.status_reason + ")"}
        });
        report.blocks.push_back(std::move(entry));
    }

    const size_t total = report.blocks.size();
    const size_t with_issues = report.count(BlockStatus::COMPLETED_WITH_ISSUES);
    const size_t completed = report.count(BlockStatus::COMPLETED) + with_issues;
    const size_t failed = report.count(BlockStatus::FAILED);
    const size_t deferred = report.count(BlockStatus::DEFERRED);

    report.success = completed == total;
    report.message = std::to_string(completed) + " of " + std::to_string(total) + " blocks completed";
    if (!report.warnings.empty()) {
        report.message += ", " + std::to_string(report.warnings.size()) + " warning(s)";
    }

    const Value data = {
        {"completed", completed},
        {"with_issues", with_issues},
        {"failed", failed},
        {"deferred", deferred},
        {"total", total},
        {"blocks", rows},
        {"warnings", report.warnings}
    };
    report.summary = TemplateRenderer::render(config_.progress_template, data);
    return report;
}

} // namespace blockflow
