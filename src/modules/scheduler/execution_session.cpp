// modules/scheduler/execution_session.cpp
#include "modules/scheduler/execution_session.h"
#include "common/utils/log.h"
#include <algorithm>
#include <future>

namespace blockflow {

namespace {

[[noreturn]] void throw_execution(ExecutionError::Kind kind, const std::string& message) {
    throw OrchestrationError(ExecutionError{kind, message});
}

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) out += sep;
        out += items[i];
    }
    return out;
}

std::vector<Artifact> artifacts_of(const Value& result) {
    return result.value("artifacts", std::vector<Artifact>{});
}

std::vector<std::string> issues_of(const Value& result) {
    return result.value("issues", std::vector<std::string>{});
}

// {"artifacts", "metrics", "issues"} as run_steps produces; alternates may return anything.
bool is_block_result(const Value& result) {
    if (!result.is_object()) return false;
    try {
        artifacts_of(result);
        issues_of(result);
        return true;
    } catch (const nlohmann::json::exception&) {
        return false;
    }
}

} // namespace

// --- CancellationToken ---

void CancellationToken::cancel(Error reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    reason_ = std::move(reason);
    cancelled_.store(true);
}

void CancellationToken::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    reason_.reset();
    cancelled_.store(false);
}

std::optional<Error> CancellationToken::reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reason_;
}

// --- ExecutionSession ---

ExecutionSession::ExecutionSession(Config config,
                                   GenerationCollaborator& generator,
                                   ValidationCollaborator& validator,
                                   RecoveryManager& recovery)
    : config_(config), generator_(generator), validator_(validator), recovery_(recovery) {}

ExecutionSession::~ExecutionSession() {
    std::lock_guard<std::mutex> lock(abandoned_mutex_);
    for (auto& call : abandoned_) {
        if (call.thread.joinable()) call.thread.join();
    }
}

void ExecutionSession::reap_abandoned() {
    std::lock_guard<std::mutex> lock(abandoned_mutex_);
    auto finished = std::partition(abandoned_.begin(), abandoned_.end(),
                                   [](const AbandonedCall& call) { return !call.done->load(); });
    for (auto it = finished; it != abandoned_.end(); ++it) {
        it->thread.join();
    }
    abandoned_.erase(finished, abandoned_.end());
}

template <typename T>
T ExecutionSession::call_before(const std::optional<Clock::time_point>& deadline, std::function<T()> call,
                                const std::string& what) {
    if (!deadline) return call();
    reap_abandoned();

    auto promise = std::make_shared<std::promise<T>>();
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::future<T> result = promise->get_future();
    std::thread thread([promise, done, call = std::move(call)]() {
        try {
            promise->set_value(call());
        } catch (...) {
            // rethrown by result.get() on the worker
            promise->set_exception(std::current_exception());
        }
        done->store(true);
    });

    if (result.wait_until(*deadline) == std::future_status::ready) {
        thread.join();
        return result.get();
    }
    log_warning(what + " is still running at the deadline, abandoning it");
    {
        std::lock_guard<std::mutex> lock(abandoned_mutex_);
        abandoned_.push_back(AbandonedCall{std::move(thread), done});
    }
    throw_execution(ExecutionError::Kind::TIMEOUT_ERROR, what + " exceeded its time budget");
}

std::optional<ExecutionSession::Clock::time_point> ExecutionSession::deadline_for(
    const ImplementationBlock& block) const {
    if (block.estimated_effort.count() <= 0 || config_.timeout_multiplier <= 0.0) {
        return std::nullopt;
    }
    const auto budget = std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double, std::milli>(
            static_cast<double>(block.estimated_effort.count()) * config_.timeout_multiplier));
    return Clock::now() + budget;
}

Value ExecutionSession::run_steps(const ImplementationBlock& block, const OperationScope& scope,
                                  const CancellationToken& token, bool validate_result) {
    const auto deadline = deadline_for(block);

    std::vector<const ExecutionStep*> steps;
    for (const auto& step : block.steps) {
        if (scope.simplified && step.optional) continue;
        steps.push_back(&step);
    }
    if (scope.part) {
        const size_t n = steps.size();
        const size_t count = std::max<size_t>(scope.part_count, 1);
        const size_t begin = n * *scope.part / count;
        const size_t end = n * (*scope.part + 1) / count;
        steps = std::vector<const ExecutionStep*>(steps.begin() + begin, steps.begin() + end);
    }

    // 安全点：每个步骤之前以及全部步骤之后
    auto safe_point = [&](const std::string& where) {
        if (token.cancelled()) {
            auto reason = token.reason();
            if (reason) throw OrchestrationError(*reason);
            throw OrchestrationError(ResourceError{ResourceError::Kind::MEMORY_LIMIT_EXCEEDED, "cancelled"});
        }
        if (deadline && Clock::now() > *deadline) {
            throw_execution(ExecutionError::Kind::TIMEOUT_ERROR,
                            "block " + block.id + " exceeded its time budget " + where);
        }
    };

    std::vector<Artifact> artifacts;
    for (const ExecutionStep* step : steps) {
        safe_point("before step " + step->id);
        try {
            GenerationCollaborator* generator = &generator_;
            Content content = call_before<Content>(
                deadline, [generator, copy = *step]() { return generator->generate(copy); },
                "block " + block.id + " step " + step->id);
            artifacts.push_back(Artifact{step->id, std::move(content)});
        } catch (const OrchestrationError&) {
            throw;
        } catch (const GenerationError& e) {
            throw_execution(ExecutionError::Kind::GENERATION_FAILURE, step->id + ": " + e.what());
        } catch (const BuildError& e) {
            throw_execution(ExecutionError::Kind::BUILD_ERROR, step->id + ": " + e.what());
        } catch (const ValidationError& e) {
            throw_execution(ExecutionError::Kind::VALIDATION_FAILURE, step->id + ": " + e.what());
        } catch (const std::exception& e) {
            throw_execution(ExecutionError::Kind::GENERATION_FAILURE, step->id + ": " + e.what());
        }
    }
    safe_point("after the last step");

    if (!validate_result) {
        return Value{{"artifacts", artifacts}, {"metrics", Value::object()}, {"issues", Value::array()}};
    }
    return validate(block, artifacts, deadline);
}

Value ExecutionSession::validate(const ImplementationBlock& block, const std::vector<Artifact>& artifacts,
                                 const std::optional<Clock::time_point>& deadline) {
    ValidationReport report;
    try {
        ValidationCollaborator* validator = &validator_;
        report = call_before<ValidationReport>(
            deadline, [validator, block, artifacts]() { return validator->validate(block, artifacts); },
            "validation of block " + block.id);
    } catch (const OrchestrationError&) {
        throw;
    } catch (const BuildError& e) {
        throw_execution(ExecutionError::Kind::BUILD_ERROR, block.id + ": " + e.what());
    } catch (const std::exception& e) {
        throw_execution(ExecutionError::Kind::VALIDATION_FAILURE, block.id + ": " + e.what());
    }
    if (!report.passed) {
        throw_execution(ExecutionError::Kind::VALIDATION_FAILURE,
                        block.id + " failed validation" +
                            (report.issues.empty() ? std::string{} : ": " + join(report.issues, "; ")));
    }
    return Value{{"artifacts", artifacts}, {"metrics", report.metrics}, {"issues", report.issues}};
}

BlockOutcome ExecutionSession::execute(const ImplementationBlock& block, CancellationToken& token,
                                       const EventSink& sink) {
    BlockOutcome outcome;
    outcome.id = block.id;
    outcome.attempts = 1;
    if (sink) sink(BlockEvent{BlockEventType::STARTED, block.id, 1, {}, std::nullopt, nullptr});

    auto complete = [&outcome](const Value& result, bool with_issues, const std::string& reason) {
        outcome.artifacts = artifacts_of(result);
        outcome.metrics = result.value("metrics", Value::object());
        outcome.issues = issues_of(result);
        const bool issues = with_issues || !outcome.issues.empty();
        outcome.status = issues ? BlockStatus::COMPLETED_WITH_ISSUES : BlockStatus::COMPLETED;
        if (!outcome.issues.empty() && !with_issues) {
            outcome.reason = reason + ": " + join(outcome.issues, "; ");
        } else {
            outcome.reason = reason;
        }
    };

    try {
        complete(run_steps(block, OperationScope{}, token, true), false, "validated");
        return outcome;
    } catch (const OrchestrationError& e) {
        outcome.error = e.error();
        log_warning("Block " + block.id + " failed: " + e.what());
    }

    // Cancelled work is resubmitted through recovery with a fresh token.
    token.reset();

    RecoverableOperation operation;
    operation.name = block.id;
    operation.run = [&](const OperationScope& scope) {
        ++outcome.attempts;
        return run_steps(block, scope, token, !scope.part.has_value());
    };
    operation.subdivide = [&block]() { return std::max<size_t>(block.steps.size(), 1); };
    operation.on_revert = [&outcome](const CheckpointRecord& record) {
        if (record.artifacts.contains(outcome.id)) {
            outcome.artifacts = record.artifacts[outcome.id].get<std::vector<Artifact>>();
        } else {
            outcome.artifacts.clear();
        }
    };

    auto observer = [&](int retry, std::chrono::milliseconds delay, const Error& error) {
        if (!sink) return;
        sink(BlockEvent{BlockEventType::RETRYING, block.id, retry + 2,
                        describe(error) + " (retry in " + std::to_string(delay.count()) + "ms)",
                        std::nullopt, nullptr});
    };

    RecoveryOutcome recovered = recovery_.attempt(operation, *outcome.error, observer);
    outcome.resolution = recovered.resolution;
    outcome.error = recovered.error;

    switch (recovered.resolution) {
        case RecoveryResolution::RECOVERED:
            complete(*recovered.result, false, recovered.message);
            outcome.error.reset();
            break;
        case RecoveryResolution::SIMPLIFIED:
        case RecoveryResolution::ALTERNATE:
            if (!is_block_result(*recovered.result)) {
                outcome.status = BlockStatus::FAILED;
                outcome.resolution = RecoveryResolution::FALLBACK_FAILED;
                outcome.error = ExecutionError{ExecutionError::Kind::GENERATION_FAILURE,
                                               "alternate for block " + block.id + " returned a malformed result"};
                outcome.reason = describe(*outcome.error);
                outcome.artifacts.clear();
                break;
            }
            complete(*recovered.result, true, recovered.message);
            outcome.error.reset();
            break;
        case RecoveryResolution::SUBDIVIDED: {
            std::vector<Artifact> merged;
            for (const auto& part : *recovered.result) {
                if (!is_block_result(part)) continue;
                auto part_artifacts = artifacts_of(part);
                merged.insert(merged.end(), part_artifacts.begin(), part_artifacts.end());
            }
            try {
                complete(validate(block, merged), true, recovered.message);
                outcome.error.reset();
            } catch (const OrchestrationError& e) {
                outcome.status = BlockStatus::FAILED;
                outcome.error = e.error();
                outcome.reason = describe(e.error());
            }
            break;
        }
        case RecoveryResolution::SKIPPED:
            outcome.status = BlockStatus::FAILED;
            outcome.skipped = true;
            outcome.reason = recovered.message;
            break;
        case RecoveryResolution::REVERTED:
            outcome.status = BlockStatus::FAILED;
            outcome.reverted_to = recovered.reverted_to;
            outcome.reason = recovered.message;
            break;
        case RecoveryResolution::ABORTED:
        case RecoveryResolution::FALLBACK_FAILED:
            outcome.status = BlockStatus::FAILED;
            outcome.artifacts.clear();
            outcome.reason = recovered.message;
            break;
    }
    return outcome;
}

} // namespace blockflow
