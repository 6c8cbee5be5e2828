// tests/test_recovery_manager.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/recovery/recovery_manager.h"
#include "test_support.h"

using namespace blockflow;
using namespace blockflow::testing;
using std::chrono::milliseconds;

namespace {

const Error kGenerationFailure = ExecutionError{ExecutionError::Kind::GENERATION_FAILURE, "model timed out"};

RecoveryPolicy policy(int retries, FallbackAction action, std::string alternate = {}) {
    RecoveryPolicy p;
    p.max_retries = retries;
    p.backoff = FixedBackoff{milliseconds(10)};
    p.fallback = Fallback{action, std::move(alternate)};
    return p;
}

RecoveryManager::Config with_policy(const std::string& key, RecoveryPolicy p) {
    RecoveryManager::Config config;
    config.policies[key] = std::move(p);
    return config;
}

[[noreturn]] void fail_generation() {
    throw OrchestrationError(kGenerationFailure);
}

// Fails the first `failures` full-scope runs; counts runs by scope.
struct CountingOperation {
    int failures = 0;
    int full_runs = 0;
    int simplified_runs = 0;
    std::vector<size_t> parts;

    RecoverableOperation make() {
        RecoverableOperation op;
        op.name = "counting";
        op.run = [this](const OperationScope& scope) -> Value {
            if (scope.part) {
                parts.push_back(*scope.part);
                return Value{{"part", *scope.part}};
            }
            if (scope.simplified) {
                ++simplified_runs;
                return Value("simplified");
            }
            ++full_runs;
            if (full_runs <= failures) fail_generation();
            return Value("full");
        };
        return op;
    }
};

} // namespace

TEST_CASE("Backoff delays grow and are capped", "[recovery][backoff]") {
    const BackoffSpec exponential = ExponentialBackoff{milliseconds(100), 2.0, milliseconds(1000)};
    REQUIRE(backoff_delay(exponential, 0) == milliseconds(100));
    REQUIRE(backoff_delay(exponential, 1) == milliseconds(200));
    REQUIRE(backoff_delay(exponential, 3) == milliseconds(800));
    REQUIRE(backoff_delay(exponential, 4) == milliseconds(1000));
    REQUIRE(backoff_delay(exponential, 5000) == milliseconds(1000));

    const BackoffSpec linear = LinearBackoff{milliseconds(100), milliseconds(50), milliseconds(300)};
    REQUIRE(backoff_delay(linear, 0) == milliseconds(100));
    REQUIRE(backoff_delay(linear, 2) == milliseconds(200));
    REQUIRE(backoff_delay(linear, 10) == milliseconds(300));

    const BackoffSpec fixed = FixedBackoff{milliseconds(70)};
    REQUIRE(backoff_delay(fixed, 0) == milliseconds(70));
    REQUIRE(backoff_delay(fixed, 9) == milliseconds(70));

    milliseconds previous{0};
    for (int i = 0; i < 40; ++i) {
        const auto d = backoff_delay(exponential, i);
        REQUIRE(d >= previous);
        previous = d;
    }
}

TEST_CASE("A retry that succeeds recovers the operation", "[recovery]") {
    SleepRecorder sleeps;
    RecoveryPolicy p = policy(3, FallbackAction::ABORT);
    p.backoff = ExponentialBackoff{milliseconds(100), 2.0, milliseconds(10000)};
    RecoveryManager manager(with_policy("GenerationFailure", p), nullptr, sleeps.sleeper());

    CountingOperation counting;
    counting.failures = 1; // the retries start after the original failure
    std::vector<int> observed;
    auto outcome = manager.attempt(counting.make(), kGenerationFailure,
                                   [&observed](int retry, milliseconds, const Error&) { observed.push_back(retry); });

    REQUIRE(outcome.resolution == RecoveryResolution::RECOVERED);
    REQUIRE(outcome.succeeded());
    REQUIRE(*outcome.result == "full");
    REQUIRE(outcome.retries == 2);
    REQUIRE(*sleeps.delays == std::vector<milliseconds>{milliseconds(100), milliseconds(200)});
    REQUIRE(observed == std::vector<int>{0, 1});
}

TEST_CASE("The fallback runs exactly once after the retries", "[recovery]") {
    SleepRecorder sleeps;
    RecoveryManager manager(with_policy("GenerationFailure", policy(2, FallbackAction::SIMPLIFY)), nullptr,
                            sleeps.sleeper());

    CountingOperation counting;
    counting.failures = 100;
    auto outcome = manager.attempt(counting.make(), kGenerationFailure);

    REQUIRE(outcome.resolution == RecoveryResolution::SIMPLIFIED);
    REQUIRE(*outcome.result == "simplified");
    REQUIRE(counting.full_runs == 2);
    REQUIRE(counting.simplified_runs == 1);
    REQUIRE(sleeps.count() == 2);
}

TEST_CASE("Policies are looked up by code, then category, then default", "[recovery]") {
    RecoveryManager::Config config;
    config.policies.clear();
    config.policies["Execution"] = policy(4, FallbackAction::SKIP);
    config.policies["BuildError"] = policy(1, FallbackAction::SUBDIVIDE);
    config.default_policy = policy(0, FallbackAction::ABORT);
    RecoveryManager manager(config, nullptr, [](milliseconds) {});

    REQUIRE(manager.strategy_for(ExecutionError{ExecutionError::Kind::BUILD_ERROR, ""}).max_retries == 1);
    REQUIRE(manager.strategy_for(kGenerationFailure).max_retries == 4);
    REQUIRE(manager.strategy_for(PersistenceError{PersistenceError::Kind::IO_ERROR, ""}).fallback.action ==
            FallbackAction::ABORT);
}

TEST_CASE("Default policies follow the error table", "[recovery]") {
    RecoveryManager manager(RecoveryManager::Config{}, nullptr, [](milliseconds) {});
    REQUIRE(manager.strategy_for(ResourceError{ResourceError::Kind::MEMORY_LIMIT_EXCEEDED, ""}).fallback.action ==
            FallbackAction::SIMPLIFY);
    REQUIRE(manager.strategy_for(ResourceError{ResourceError::Kind::DISK_LIMIT_EXCEEDED, ""}).fallback.action ==
            FallbackAction::SUBDIVIDE);
    REQUIRE(manager.strategy_for(kGenerationFailure).max_retries == 3);
    REQUIRE(manager.strategy_for(ExecutionError{ExecutionError::Kind::VALIDATION_FAILURE, ""}).max_retries == 2);
    REQUIRE(manager.strategy_for(ExecutionError{ExecutionError::Kind::TIMEOUT_ERROR, ""}).fallback.action ==
            FallbackAction::SUBDIVIDE);
    REQUIRE(manager.strategy_for(PersistenceError{PersistenceError::Kind::IO_ERROR, ""}).fallback.action ==
            FallbackAction::SKIP);
    REQUIRE(manager.strategy_for(MergeError{MergeError::Kind::MERGE_CONFLICT, "", {}}).fallback.action ==
            FallbackAction::ABORT);
}

TEST_CASE("Structural errors are never retried", "[recovery]") {
    SleepRecorder sleeps;
    RecoveryManager manager(RecoveryManager::Config{}, nullptr, sleeps.sleeper());
    CountingOperation counting;
    auto outcome = manager.attempt(counting.make(),
                                   StructuralError{StructuralError::Kind::CYCLE_DETECTED, "a -> a", {"a", "a"}});
    REQUIRE(outcome.resolution == RecoveryResolution::ABORTED);
    REQUIRE(counting.full_runs == 0);
    REQUIRE(sleeps.count() == 0);
}

TEST_CASE("Skip and abort produce no result", "[recovery]") {
    CountingOperation counting;
    counting.failures = 100;

    RecoveryManager skipping(with_policy("GenerationFailure", policy(1, FallbackAction::SKIP)), nullptr,
                             [](milliseconds) {});
    auto skipped = skipping.attempt(counting.make(), kGenerationFailure);
    REQUIRE(skipped.resolution == RecoveryResolution::SKIPPED);
    REQUIRE_FALSE(skipped.succeeded());
    REQUIRE(skipped.retries == 1);

    RecoveryManager aborting(with_policy("GenerationFailure", policy(0, FallbackAction::ABORT)), nullptr,
                             [](milliseconds) {});
    auto aborted = aborting.attempt(counting.make(), kGenerationFailure);
    REQUIRE(aborted.resolution == RecoveryResolution::ABORTED);
    REQUIRE(error_code(aborted.error) == "GenerationFailure");
}

TEST_CASE("Revert restores the latest checkpoint", "[recovery]") {
    CheckpointStore store(CheckpointStore::Config{}, std::make_shared<InMemoryCheckpointStorage>());
    store.create(State{{"marker", 1}}, "older");
    auto latest = store.create(State{{"marker", 2}}, "newer", Value{{"A", Value::array()}});

    RecoveryManager manager(with_policy("GenerationFailure", policy(0, FallbackAction::REVERT)), &store,
                            [](milliseconds) {});
    CountingOperation counting;
    RecoverableOperation op = counting.make();
    int restored_marker = 0;
    op.on_revert = [&restored_marker](const CheckpointRecord& record) { restored_marker = record.state["marker"]; };

    auto outcome = manager.attempt(op, kGenerationFailure);
    REQUIRE(outcome.resolution == RecoveryResolution::REVERTED);
    REQUIRE(outcome.reverted_to == latest);
    REQUIRE(restored_marker == 2);
    REQUIRE_FALSE(outcome.succeeded());

    RecoveryManager without_store(with_policy("GenerationFailure", policy(0, FallbackAction::REVERT)), nullptr,
                                  [](milliseconds) {});
    REQUIRE(without_store.attempt(counting.make(), kGenerationFailure).resolution ==
            RecoveryResolution::FALLBACK_FAILED);
}

TEST_CASE("Use-alternate runs the registered operation", "[recovery]") {
    RecoveryManager manager(with_policy("GenerationFailure", policy(0, FallbackAction::USE_ALTERNATE, "template")),
                            nullptr, [](milliseconds) {});
    CountingOperation counting;

    auto missing = manager.attempt(counting.make(), kGenerationFailure);
    REQUIRE(missing.resolution == RecoveryResolution::FALLBACK_FAILED);

    RecoverableOperation alternate;
    alternate.name = "template";
    alternate.run = [](const OperationScope&) { return Value("from template"); };
    manager.register_alternate("template", alternate);

    auto outcome = manager.attempt(counting.make(), kGenerationFailure);
    REQUIRE(outcome.resolution == RecoveryResolution::ALTERNATE);
    REQUIRE(*outcome.result == "from template");
}

TEST_CASE("Subdivide runs every part once", "[recovery]") {
    RecoveryManager manager(with_policy("GenerationFailure", policy(0, FallbackAction::SUBDIVIDE)), nullptr,
                            [](milliseconds) {});
    CountingOperation counting;
    RecoverableOperation op = counting.make();
    op.subdivide = []() { return size_t{3}; };

    auto outcome = manager.attempt(op, kGenerationFailure);
    REQUIRE(outcome.resolution == RecoveryResolution::SUBDIVIDED);
    REQUIRE(outcome.result->size() == 3);
    REQUIRE(counting.parts == std::vector<size_t>{0, 1, 2});

    // a failing part fails the fallback
    RecoverableOperation broken;
    broken.name = "broken";
    broken.run = [](const OperationScope& scope) -> Value {
        if (scope.part && *scope.part == 1) fail_generation();
        return Value::object();
    };
    auto failed = manager.attempt(broken, kGenerationFailure);
    REQUIRE(failed.resolution == RecoveryResolution::FALLBACK_FAILED);
}
