// tests/test_scheduler.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/scheduler/block_scheduler.h"
#include "test_support.h"
#include <algorithm>
#include <tuple>

using namespace blockflow;
using namespace blockflow::testing;
using std::chrono::milliseconds;

namespace {

RecoveryPolicy quick_policy(int retries, FallbackAction action) {
    RecoveryPolicy p;
    p.max_retries = retries;
    p.backoff = FixedBackoff{milliseconds(1)};
    p.fallback = Fallback{action, {}};
    return p;
}

// Collaborators, checkpoint store and recovery manager shared by the schedulers of a test.
struct Harness {
    ScriptedGenerator generator;
    ScriptedValidator validator;
    SleepRecorder sleeps;
    std::shared_ptr<CheckpointStorage> storage;
    std::unique_ptr<CheckpointStore> store;
    std::unique_ptr<RecoveryManager> recovery;

    explicit Harness(RecoveryManager::Config recovery_config = RecoveryManager::Config{},
                     std::shared_ptr<CheckpointStorage> backend = std::make_shared<InMemoryCheckpointStorage>())
        : storage(std::move(backend)) {
        CheckpointStore::Config cp;
        cp.max_checkpoints = 50;
        store = std::make_unique<CheckpointStore>(cp, storage);
        recovery = std::make_unique<RecoveryManager>(recovery_config, store.get(), sleeps.sleeper());
    }

    BlockScheduler make(std::vector<ImplementationBlock> blocks,
                        std::vector<BlockDependency> deps,
                        std::shared_ptr<ResourceMonitor> monitor = nullptr,
                        size_t parallel = 4) {
        BlockScheduler::Config config;
        config.max_parallel_paths = parallel;
        config.poll_interval = milliseconds(5);
        return BlockScheduler(config, DependencyGraph::build(std::move(blocks), deps), generator, validator,
                              *recovery, *store, std::move(monitor));
    }
};

RecoveryManager::Config with_policy(const std::string& key, RecoveryPolicy p) {
    RecoveryManager::Config config;
    config.policies[key] = p;
    return config;
}

const BlockReport& entry(const RunReport& report, const BlockId& id) {
    const BlockReport* found = report.find(id);
    REQUIRE(found != nullptr);
    return *found;
}

} // namespace

TEST_CASE("Blocks run in dependency order and complete", "[scheduler]") {
    Harness h;
    auto scheduler = h.make({block("A"), block("B"), block("C")},
                            {requires_before("B", "A"), requires_before("C", "B")});
    REQUIRE(scheduler.execution_order() == std::vector<BlockId>{"A", "B", "C"});

    RunReport report = scheduler.run();

    REQUIRE(report.success);
    REQUIRE(report.message == "3 of 3 blocks completed");
    REQUIRE(report.count(BlockStatus::COMPLETED) == 3);
    REQUIRE(h.generator.calls() == std::vector<std::string>{"A-main", "B-main", "C-main"});
    REQUIRE(entry(report, "B").artifacts.size() == 1);
    REQUIRE(entry(report, "B").artifacts[0].content.text == "generated B-main");
    REQUIRE(entry(report, "A").attempts == 1);

    // run-start, before/after for each block, run-complete
    REQUIRE(report.checkpoints.size() == 8);
    REQUIRE(h.store->latest()->reason == "run-complete");
    REQUIRE(report.summary.find("3/3 blocks completed") != std::string::npos);
    REQUIRE(report.summary.find("- B: completed") != std::string::npos);
}

TEST_CASE("Independent blocks of a layer run concurrently", "[scheduler]") {
    std::vector<ImplementationBlock> blocks;
    std::vector<BlockDependency> deps;
    for (const char* id : {"p1", "p2", "p3", "p4"}) {
        blocks.push_back(block(id, {step(std::string(id) + "-main", false, Value{{"sleep_ms", 50}})}));
        deps.push_back(requires_before("q", id));
    }
    blocks.push_back(block("q"));

    auto layer_window = [](const std::vector<ScriptedGenerator::Span>& spans) {
        ScriptedGenerator::Clock::time_point latest_start{};
        ScriptedGenerator::Clock::time_point earliest_end = ScriptedGenerator::Clock::time_point::max();
        ScriptedGenerator::Clock::time_point latest_end{};
        for (const auto& span : spans) {
            if (span.step_id == "q-main") continue;
            latest_start = std::max(latest_start, span.start);
            earliest_end = std::min(earliest_end, span.end);
            latest_end = std::max(latest_end, span.end);
        }
        return std::make_tuple(latest_start, earliest_end, latest_end);
    };

    SECTION("four workers") {
        Harness h;
        auto scheduler = h.make(blocks, deps, nullptr, 4);
        RunReport report = scheduler.run();
        REQUIRE(report.success);
        REQUIRE(report.count(BlockStatus::COMPLETED) == 5);

        auto spans = h.generator.spans();
        REQUIRE(spans.size() == 5);
        auto [latest_start, earliest_end, latest_end] = layer_window(spans);
        // every block of the first layer had started before any of them finished
        REQUIRE(latest_start < earliest_end);

        auto q = std::find_if(spans.begin(), spans.end(),
                              [](const ScriptedGenerator::Span& s) { return s.step_id == "q-main"; });
        REQUIRE(q != spans.end());
        REQUIRE(q->start >= latest_end);
    }

    SECTION("one worker") {
        Harness h;
        auto scheduler = h.make(blocks, deps, nullptr, 1);
        REQUIRE(scheduler.run().success);
        auto [latest_start, earliest_end, latest_end] = layer_window(h.generator.spans());
        REQUIRE(latest_start >= earliest_end);
    }
}

TEST_CASE("A failed block blocks its dependents, which end deferred", "[scheduler]") {
    Harness h;
    h.generator.fail("A-main", -1);
    auto scheduler = h.make({block("A"), block("B"), block("C"), block("D")},
                            {requires_before("B", "A"), requires_before("D", "B")});

    RunReport report = scheduler.run();

    REQUIRE_FALSE(report.success);
    REQUIRE(entry(report, "A").status == BlockStatus::FAILED);
    REQUIRE(entry(report, "A").attempts == 4); // first try plus three retries
    REQUIRE(entry(report, "B").status == BlockStatus::DEFERRED);
    REQUIRE(entry(report, "B").reason.find("prerequisite A") != std::string::npos);
    REQUIRE(entry(report, "D").status == BlockStatus::DEFERRED);
    REQUIRE(entry(report, "C").status == BlockStatus::COMPLETED);
    REQUIRE(h.generator.count("B-main") == 0);

    // exponential backoff from the default GenerationFailure policy, never really slept
    REQUIRE(*h.sleeps.delays == std::vector<milliseconds>{milliseconds(200), milliseconds(400), milliseconds(800)});
}

TEST_CASE("A block that fails and then succeeds on retry completes", "[scheduler]") {
    Harness h;
    h.generator.fail("A-main", 2);
    auto scheduler = h.make({block("A"), block("B")}, {requires_before("B", "A")});

    RunReport report = scheduler.run();

    REQUIRE(report.success);
    REQUIRE(entry(report, "A").status == BlockStatus::COMPLETED);
    REQUIRE(entry(report, "A").attempts == 3);
    REQUIRE(h.sleeps.count() == 2);

    auto traces = scheduler.traces();
    auto it = std::find_if(traces.begin(), traces.end(), [](const TraceRecord& t) { return t.block_id == "A"; });
    REQUIRE(it != traces.end());
    REQUIRE(it->resolution == std::optional<std::string>("recovered"));
    REQUIRE(it->status == "completed");
    REQUIRE(it->checkpoint_before.has_value());
    REQUIRE(it->checkpoint_after.has_value());
}

TEST_CASE("Validation issues complete a block with issues", "[scheduler]") {
    Harness h;
    ValidationReport with_issues;
    with_issues.issues = {"missing doc comment"};
    with_issues.metrics = Value{{"quality", 0.7}};
    h.validator.set("A", with_issues);

    auto scheduler = h.make({block("A")}, {});
    RunReport report = scheduler.run();

    REQUIRE(report.success);
    const auto& a = entry(report, "A");
    REQUIRE(a.status == BlockStatus::COMPLETED_WITH_ISSUES);
    REQUIRE(a.issues == std::vector<std::string>{"missing doc comment"});
    REQUIRE(a.metrics["quality"] == 0.7);
}

TEST_CASE("A block that never validates fails after simplification", "[scheduler]") {
    Harness h;
    ValidationReport failing;
    failing.passed = false;
    failing.issues = {"tests fail"};
    h.validator.set("A", failing);

    auto scheduler = h.make({block("A")}, {});
    RunReport report = scheduler.run();

    REQUIRE_FALSE(report.success);
    REQUIRE(entry(report, "A").status == BlockStatus::FAILED);
    REQUIRE(entry(report, "A").artifacts.empty());
    // two linear retries, then the simplified run
    REQUIRE(entry(report, "A").attempts == 4);
}

TEST_CASE("Simplify drops optional steps", "[scheduler]") {
    Harness h(with_policy("GenerationFailure", quick_policy(0, FallbackAction::SIMPLIFY)));
    h.generator.fail("A-extra", -1);
    auto scheduler = h.make({block("A", {step("A-core"), step("A-extra", true)})}, {});

    RunReport report = scheduler.run();

    const auto& a = entry(report, "A");
    REQUIRE(a.status == BlockStatus::COMPLETED_WITH_ISSUES);
    REQUIRE(a.reason == "completed with reduced scope");
    REQUIRE(a.artifacts.size() == 1);
    REQUIRE(a.artifacts[0].step_id == "A-core");
    REQUIRE(report.success);
}

TEST_CASE("Skip defers the block and its dependents", "[scheduler]") {
    Harness h(with_policy("GenerationFailure", quick_policy(0, FallbackAction::SKIP)));
    h.generator.fail("A-main", -1);
    auto scheduler = h.make({block("A"), block("B")}, {requires_before("B", "A")});

    RunReport report = scheduler.run();

    REQUIRE_FALSE(report.success);
    REQUIRE(entry(report, "A").status == BlockStatus::DEFERRED);
    REQUIRE(entry(report, "B").status == BlockStatus::DEFERRED);
    REQUIRE(report.count(BlockStatus::FAILED) == 0);
}

TEST_CASE("A block over its time budget is subdivided", "[scheduler][timeout]") {
    Harness h;
    // 2 x 100ms budget; each step takes 120ms, so only single steps fit
    auto slow = block("slow",
                      {step("s1", false, Value{{"sleep_ms", 120}}), step("s2", false, Value{{"sleep_ms", 120}})},
                      0.0, milliseconds(100));
    auto scheduler = h.make({slow}, {});

    RunReport report = scheduler.run();

    const auto& s = entry(report, "slow");
    REQUIRE(s.status == BlockStatus::COMPLETED_WITH_ISSUES);
    REQUIRE(s.reason == "completed in 2 parts");
    REQUIRE(s.artifacts.size() == 2);

    auto traces = scheduler.traces();
    REQUIRE(traces.size() == 1);
    REQUIRE(traces[0].resolution == std::optional<std::string>("subdivided"));
}

TEST_CASE("A stalled collaborator call is cut off at the block deadline", "[scheduler][timeout]") {
    Harness h(with_policy("TimeoutError", quick_policy(0, FallbackAction::ABORT)));
    // 2 x 10ms budget; the call takes 600ms
    auto stalled = block("A", {step("A-main", false, Value{{"sleep_ms", 600}})}, 0.0, milliseconds(10));
    {
        auto scheduler = h.make({stalled, block("B")}, {requires_before("B", "A")});

        const auto started = std::chrono::steady_clock::now();
        RunReport report = scheduler.run();
        const auto elapsed = std::chrono::steady_clock::now() - started;

        REQUIRE(elapsed < milliseconds(400));
        const auto& a = entry(report, "A");
        REQUIRE(a.status == BlockStatus::FAILED);
        REQUIRE(a.attempts == 1);
        REQUIRE(a.reason.find("TimeoutError") == 0);
        REQUIRE(entry(report, "B").status == BlockStatus::DEFERRED);
        REQUIRE(h.generator.count("B-main") == 0);
    }
    // the abandoned call was joined with the scheduler
    REQUIRE(h.generator.spans().size() == 1);
}

TEST_CASE("Required-for-completion edges gate dependents", "[scheduler]") {
    Harness h(with_policy("GenerationFailure", quick_policy(0, FallbackAction::ABORT)));
    const BlockDependency finishing{"B", "A", DependencyKind::REQUIRED_FOR_COMPLETION};

    SECTION("dependent runs after its prerequisite") {
        auto scheduler = h.make({block("A", {step("A-main", false, Value{{"sleep_ms", 20}})}), block("B")},
                                {finishing});
        REQUIRE(scheduler.graph().layers().size() == 2);
        RunReport report = scheduler.run();
        REQUIRE(report.success);
        auto spans = h.generator.spans();
        REQUIRE(spans.size() == 2);
        REQUIRE(spans[0].step_id == "A-main");
        REQUIRE(spans[1].start >= spans[0].end);
    }

    SECTION("failed prerequisite defers the dependent") {
        h.generator.fail("A-main", -1);
        auto scheduler = h.make({block("A"), block("B")}, {finishing});
        RunReport report = scheduler.run();
        REQUIRE(entry(report, "A").status == BlockStatus::FAILED);
        REQUIRE(entry(report, "B").status == BlockStatus::DEFERRED);
        REQUIRE(h.generator.count("B-main") == 0);
    }
}

TEST_CASE("Revert fails the block with the artifacts of the latest checkpoint", "[scheduler][recovery]") {
    Harness h(with_policy("GenerationFailure", quick_policy(0, FallbackAction::REVERT)));
    h.generator.fail("A-extra", -1);
    auto scheduler = h.make({block("A", {step("A-core"), step("A-extra")}), block("B")},
                            {requires_before("B", "A")});

    RunReport report = scheduler.run();

    CheckpointId before_a;
    for (const auto& cp : h.store->list()) {
        if (cp.reason == "before:A") before_a = cp.id;
    }
    REQUIRE_FALSE(before_a.empty());

    const auto& a = entry(report, "A");
    REQUIRE(a.status == BlockStatus::FAILED);
    REQUIRE(a.reason.find("reverted to " + before_a) == 0);
    // nothing of A existed before it started; the A-core output is discarded
    REQUIRE(a.artifacts.empty());
    REQUIRE(entry(report, "B").status == BlockStatus::DEFERRED);

    auto traces = scheduler.traces();
    REQUIRE(traces[0].resolution == std::optional<std::string>("reverted"));
}

TEST_CASE("Use-alternate completes the block with issues", "[scheduler][recovery]") {
    RecoveryPolicy p = quick_policy(0, FallbackAction::USE_ALTERNATE);
    p.fallback.alternate = "template";
    Harness h(with_policy("GenerationFailure", p));
    h.generator.fail("A-main", -1);

    SECTION("alternate result becomes the block output") {
        RecoverableOperation alternate;
        alternate.name = "template";
        alternate.run = [](const OperationScope&) {
            return Value{{"artifacts", Value::array({Value{{"step", "A-main"}, {"content", {{"text", "from template"}}}}})}};
        };
        h.recovery->register_alternate("template", alternate);

        auto scheduler = h.make({block("A"), block("B")}, {requires_before("B", "A")});
        RunReport report = scheduler.run();

        REQUIRE(report.success);
        const auto& a = entry(report, "A");
        REQUIRE(a.status == BlockStatus::COMPLETED_WITH_ISSUES);
        REQUIRE(a.reason == "completed by alternate 'template'");
        REQUIRE(a.artifacts.size() == 1);
        REQUIRE(a.artifacts[0].content.text == "from template");
        REQUIRE(entry(report, "B").status == BlockStatus::COMPLETED);
    }

    SECTION("a malformed alternate result fails the block") {
        RecoverableOperation alternate;
        alternate.name = "template";
        alternate.run = [](const OperationScope&) { return Value("not a block result"); };
        h.recovery->register_alternate("template", alternate);

        auto scheduler = h.make({block("A"), block("B")}, {requires_before("B", "A")});
        RunReport report;
        REQUIRE_NOTHROW(report = scheduler.run());

        REQUIRE_FALSE(report.success);
        REQUIRE(entry(report, "A").status == BlockStatus::FAILED);
        REQUIRE(entry(report, "A").reason.find("malformed result") != std::string::npos);
        REQUIRE(entry(report, "B").status == BlockStatus::DEFERRED);
        REQUIRE(scheduler.traces()[0].resolution == std::optional<std::string>("fallback_failed"));
    }
}

TEST_CASE("Completed blocks carry a status reason", "[scheduler]") {
    Harness h;
    h.generator.fail("B-main", 1);
    ValidationReport with_issues;
    with_issues.issues = {"missing doc comment"};
    h.validator.set("C", with_issues);

    auto scheduler = h.make({block("A"), block("B"), block("C")}, {});
    RunReport report = scheduler.run();

    REQUIRE(entry(report, "A").reason == "validated");
    REQUIRE(entry(report, "B").reason == "recovered after 1 retry");
    REQUIRE(entry(report, "C").reason == "validated: missing doc comment");
    REQUIRE(report.summary.find("- A: completed (validated)") != std::string::npos);
}

TEST_CASE("Checkpoint failures degrade to warnings", "[scheduler][checkpoint]") {
    Harness h(RecoveryManager::Config{}, std::make_shared<FailingStorage>());
    auto scheduler = h.make({block("A")}, {});

    RunReport report = scheduler.run();

    REQUIRE(report.success);
    REQUIRE(entry(report, "A").status == BlockStatus::COMPLETED);
    REQUIRE(report.checkpoints.empty());
    REQUIRE(report.warnings.size() == 4); // run-start, before:A, after:A, run-complete
    REQUIRE(report.warnings[0].find("run-start") != std::string::npos);
    REQUIRE(report.message == "1 of 1 blocks completed, 4 warning(s)");
    // IOError policy: two fixed retries per checkpoint
    REQUIRE(h.sleeps.count() == 8);
}

TEST_CASE("A checkpoint recovery without a checkpoint id is a warning", "[scheduler][checkpoint]") {
    RecoveryPolicy p = quick_policy(0, FallbackAction::USE_ALTERNATE);
    p.fallback.alternate = "no-op";
    Harness h(with_policy("IOError", p), std::make_shared<FailingStorage>());
    RecoverableOperation alternate;
    alternate.name = "no-op";
    alternate.run = [](const OperationScope&) { return Value::object(); };
    h.recovery->register_alternate("no-op", alternate);

    auto scheduler = h.make({block("A")}, {});
    RunReport report;
    REQUIRE_NOTHROW(report = scheduler.run());

    REQUIRE(entry(report, "A").status == BlockStatus::COMPLETED);
    REQUIRE(report.checkpoints.empty());
    REQUIRE(report.warnings.size() == 4);
    REQUIRE(report.warnings[0].find("did not produce a checkpoint id") != std::string::npos);
}

TEST_CASE("Resume continues from a checkpoint", "[scheduler][resume]") {
    Harness h(with_policy("GenerationFailure", quick_policy(0, FallbackAction::ABORT)));
    h.generator.fail("B-main", 1);
    CheckpointId after_a;
    {
        auto first = h.make({block("A"), block("B"), block("C")},
                            {requires_before("B", "A"), requires_before("C", "B")});
        RunReport report = first.run();
        REQUIRE(entry(report, "B").status == BlockStatus::FAILED);
        REQUIRE(entry(report, "C").status == BlockStatus::DEFERRED);

        for (const auto& cp : h.store->list()) {
            if (cp.reason == "after:A") after_a = cp.id;
        }
        REQUIRE_FALSE(after_a.empty());
    }

    auto second = h.make({block("A"), block("B"), block("C")},
                         {requires_before("B", "A"), requires_before("C", "B")});
    RunReport report = second.resume(after_a);

    REQUIRE(report.success);
    REQUIRE(h.generator.count("A-main") == 1); // not re-run
    REQUIRE(h.generator.count("B-main") == 2);
    REQUIRE(entry(report, "A").artifacts.size() == 1); // restored from the checkpoint
    REQUIRE(second.artifacts().at("C").size() == 1);
    REQUIRE(h.store->latest()->reason == "run-complete");
}

TEST_CASE("Resume from an unknown checkpoint fails", "[scheduler][resume]") {
    Harness h;
    auto scheduler = h.make({block("A")}, {});
    try {
        scheduler.resume("cp-424242");
        FAIL("expected CheckpointNotFound");
    } catch (const OrchestrationError& e) {
        REQUIRE(e.code() == "CheckpointNotFound");
    }
    REQUIRE(scheduler.status("A") == BlockStatus::NOT_STARTED);
}

TEST_CASE("Deferred blocks are skipped", "[scheduler]") {
    Harness h;
    auto scheduler = h.make({block("A"), block("B"), block("C")}, {requires_before("C", "B")});
    scheduler.defer("B", "postponed by planner");

    RunReport report = scheduler.run();

    REQUIRE(entry(report, "B").status == BlockStatus::DEFERRED);
    REQUIRE(entry(report, "B").reason == "postponed by planner");
    REQUIRE(entry(report, "C").status == BlockStatus::DEFERRED);
    REQUIRE(entry(report, "A").status == BlockStatus::COMPLETED);
    REQUIRE(h.generator.count("B-main") == 0);

    REQUIRE_THROWS_AS(scheduler.defer("A", "too late"), std::runtime_error);
}

TEST_CASE("Resource pressure cancels the lower-priority block", "[scheduler][resource]") {
    auto probe = std::make_shared<FakeProbe>();
    ResourceLimits limits;
    limits.memory_mb = 100.0;
    probe->set(ResourceUsage{150.0, 0.0, 0.0});
    auto monitor = std::make_shared<ResourceMonitor>(limits, probe, milliseconds(0));

    Harness h;
    auto scheduler = h.make({block("hi", {step("hi-main", false, Value{{"sleep_ms", 100}})}, 5.0),
                             block("lo", {step("lo-main", false, Value{{"sleep_ms", 100}})}, 1.0)},
                            {}, monitor);

    RunReport report = scheduler.run();

    REQUIRE(report.success);
    REQUIRE(entry(report, "hi").status == BlockStatus::COMPLETED);
    // MemoryLimitExceeded: simplified re-run
    REQUIRE(entry(report, "lo").status == BlockStatus::COMPLETED_WITH_ISSUES);
    REQUIRE(h.sleeps.count() == 0);
}

TEST_CASE("Snapshot state lists every block", "[scheduler]") {
    Harness h;
    auto scheduler = h.make({block("A"), block("B")}, {});
    State state = scheduler.snapshot_state();
    REQUIRE(state["blocks"].size() == 2);
    REQUIRE(state["blocks"]["A"]["status"] == "not_started");
}
