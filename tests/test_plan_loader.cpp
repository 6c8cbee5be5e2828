// tests/test_plan_loader.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/plan/plan_loader.h"
#include "modules/scheduler/dependency_graph.h"
#include "test_support.h"
#include <fstream>

using namespace blockflow;
using namespace blockflow::testing;

TEST_CASE("Blocks, steps and dependencies are parsed", "[plan]") {
    Plan plan = PlanLoader{}.parse_from_string(R"(
blocks:
  - id: storage
    description: Key-value storage layer
    priority: 3
    risk: 0.4
    security_critical: true
    effort_ms: 1500
    validation: [unit tests pass, no raw pointers]
    steps:
      - id: storage-schema
        description: Define the schema
        parameters: { target: src/storage/schema.h }
      - id: storage-docs
        optional: true
  - id: api
    depends_on: storage
    validation: builds cleanly
  - id: metrics
dependencies:
  - block: metrics
    requires: api
    kind: influences
)");

    REQUIRE(plan.blocks.size() == 3);
    const auto& storage = plan.blocks[0];
    REQUIRE(storage.id == "storage");
    REQUIRE(storage.description == "Key-value storage layer");
    REQUIRE(storage.priority == 3.0);
    REQUIRE(storage.risk_factor == 0.4);
    REQUIRE(storage.security_critical);
    REQUIRE(storage.estimated_effort == std::chrono::milliseconds(1500));
    REQUIRE(storage.validation_criteria == std::vector<std::string>{"unit tests pass", "no raw pointers"});
    REQUIRE(storage.steps.size() == 2);
    REQUIRE(storage.steps[0].parameters["target"] == "src/storage/schema.h");
    REQUIRE_FALSE(storage.steps[0].optional);
    REQUIRE(storage.steps[1].optional);

    REQUIRE(plan.blocks[1].validation_criteria == std::vector<std::string>{"builds cleanly"});
    REQUIRE(plan.blocks[2].steps.empty());

    REQUIRE(plan.dependencies.size() == 2);
    REQUIRE(plan.dependencies[0].block == "api");
    REQUIRE(plan.dependencies[0].prerequisite == "storage");
    REQUIRE(plan.dependencies[0].kind == DependencyKind::REQUIRED_BEFORE);
    REQUIRE(plan.dependencies[1].kind == DependencyKind::INFLUENCES);

    DependencyGraph graph = DependencyGraph::build(plan.blocks, plan.dependencies);
    // influences never gates, so metrics shares the first layer
    REQUIRE(graph.execution_order() == std::vector<BlockId>{"storage", "metrics", "api"});
}

TEST_CASE("Malformed plans are rejected", "[plan]") {
    PlanLoader loader;
    REQUIRE_THROWS_AS(loader.parse_from_string("- a\n- b\n"), std::runtime_error);
    REQUIRE_THROWS_AS(loader.parse_from_string("blocks: { id: a }"), std::runtime_error);
    REQUIRE_THROWS_AS(loader.parse_from_string("blocks:\n  - description: no id\n"), std::runtime_error);
    REQUIRE_THROWS_AS(loader.parse_from_string("blocks:\n  - id: a\n    effort_ms: -1\n"), std::runtime_error);
    REQUIRE_THROWS_AS(loader.parse_from_string("blocks:\n  - id: a\n    priority: high\n"), std::runtime_error);
    REQUIRE_THROWS_AS(loader.parse_from_string(
                          "blocks:\n  - id: a\n    steps:\n      - id: s\n      - id: s\n"),
                      std::runtime_error);
    REQUIRE_THROWS_AS(loader.parse_from_string(
                          "blocks:\n  - id: a\ndependencies:\n  - block: a\n    requires: b\n    kind: maybe\n"),
                      std::runtime_error);
    REQUIRE_THROWS_AS(loader.parse_from_string("blocks:\n  - id: a\ndependencies:\n  - block: a\n"),
                      std::runtime_error);
}

TEST_CASE("Duplicate block ids are a structural error", "[plan]") {
    try {
        PlanLoader{}.parse_from_string("blocks:\n  - id: a\n  - id: a\n");
        FAIL("expected DuplicateBlock");
    } catch (const OrchestrationError& e) {
        REQUIRE(e.code() == "DuplicateBlock");
        REQUIRE(e.category() == ErrorCategory::STRUCTURAL);
    }
}

TEST_CASE("Plans survive a trip through plan_to_json", "[plan]") {
    auto original = block("core", {step("core-a", false, Value{{"target", "src/core.cpp"}}), step("core-b", true)},
                          2.0, std::chrono::milliseconds(300));
    original.validation_criteria = {"compiles"};
    std::vector<BlockDependency> deps{{"extra", "core", DependencyKind::PROVIDES_INFORMATION}};

    Plan plan = PlanLoader{}.parse_from_json(plan_to_json({original, block("extra")}, deps));

    REQUIRE(plan.blocks.size() == 2);
    REQUIRE(plan.blocks[0].steps.size() == 2);
    REQUIRE(plan.blocks[0].steps[1].optional);
    REQUIRE(plan.blocks[0].estimated_effort == std::chrono::milliseconds(300));
    REQUIRE(plan.blocks[0].validation_criteria == std::vector<std::string>{"compiles"});
    REQUIRE(plan.dependencies.size() == 1);
    REQUIRE(plan.dependencies[0].kind == DependencyKind::PROVIDES_INFORMATION);
}

TEST_CASE("Plan files are read from disk", "[plan]") {
    TempDir dir("blockflow-plan");
    const auto path = dir.path() / "plan.yaml";
    {
        std::ofstream out(path);
        out << "blocks:\n  - id: only\n";
    }
    REQUIRE(PlanLoader{}.parse_from_file(path.string()).blocks.size() == 1);
    REQUIRE_THROWS_AS(PlanLoader{}.parse_from_file((dir.path() / "nope.yaml").string()), std::runtime_error);
}
