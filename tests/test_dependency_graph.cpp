// tests/test_dependency_graph.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/scheduler/dependency_graph.h"
#include "test_support.h"
#include <algorithm>
#include <set>

using namespace blockflow;
using namespace blockflow::testing;

namespace {

std::set<BlockId> as_set(const std::vector<BlockId>& ids) {
    return {ids.begin(), ids.end()};
}

} // namespace

TEST_CASE("Layers follow gating dependencies", "[graph]") {
    // A -> {B, C} -> D, E independent
    auto graph = DependencyGraph::build(
        {block("A"), block("B"), block("C"), block("D"), block("E")},
        {requires_before("B", "A"), requires_before("C", "A"), requires_before("D", "B"), requires_before("D", "C")});

    auto layers = graph.layers();
    REQUIRE(layers.size() == 3);
    REQUIRE(as_set(layers[0]) == std::set<BlockId>{"A", "E"});
    REQUIRE(as_set(layers[1]) == std::set<BlockId>{"B", "C"});
    REQUIRE(as_set(layers[2]) == std::set<BlockId>{"D"});

    auto order = graph.execution_order();
    REQUIRE(order.size() == 5);
    auto pos = [&order](const BlockId& id) { return std::find(order.begin(), order.end(), id) - order.begin(); };
    REQUIRE(pos("A") < pos("B"));
    REQUIRE(pos("A") < pos("C"));
    REQUIRE(pos("B") < pos("D"));
    REQUIRE(pos("C") < pos("D"));
}

TEST_CASE("A cycle is rejected with its path", "[graph]") {
    try {
        DependencyGraph::build({block("A"), block("B"), block("C")},
                               {requires_before("B", "A"), requires_before("C", "B"), requires_before("A", "C")});
        FAIL("expected a cycle error");
    } catch (const OrchestrationError& e) {
        REQUIRE(e.code() == "CycleDetected");
        const auto& err = error_as<StructuralError>(e);
        REQUIRE(err.path.size() == 4);
        REQUIRE(err.path.front() == err.path.back());
        REQUIRE(as_set(err.path) == std::set<BlockId>{"A", "B", "C"});
    }
}

TEST_CASE("A self dependency is a cycle", "[graph]") {
    try {
        DependencyGraph::build({block("A")}, {requires_before("A", "A")});
        FAIL("expected a cycle error");
    } catch (const OrchestrationError& e) {
        REQUIRE(e.code() == "CycleDetected");
        REQUIRE(error_as<StructuralError>(e).path == std::vector<BlockId>{"A", "A"});
    }
}

TEST_CASE("Unknown prerequisites and duplicate ids are structural errors", "[graph]") {
    try {
        DependencyGraph::build({block("A")}, {requires_before("A", "ghost")});
        FAIL("expected a missing dependency");
    } catch (const OrchestrationError& e) {
        REQUIRE(e.category() == ErrorCategory::STRUCTURAL);
        REQUIRE(e.code() == "MissingDependency");
    }

    try {
        DependencyGraph::build({block("A"), block("A")}, {});
        FAIL("expected a duplicate");
    } catch (const OrchestrationError& e) {
        REQUIRE(e.code() == "DuplicateBlock");
    }
}

TEST_CASE("Required-for-completion edges gate and can form cycles", "[graph]") {
    const BlockDependency finishing{"B", "A", DependencyKind::REQUIRED_FOR_COMPLETION};

    auto graph = DependencyGraph::build({block("A"), block("B"), block("C")},
                                        {finishing, requires_before("C", "B")});
    REQUIRE(graph.layers().size() == 3);
    REQUIRE(graph.gating_prerequisites("B") == std::vector<BlockId>{"A"});

    try {
        DependencyGraph::build({block("A"), block("B")}, {finishing, requires_before("A", "B")});
        FAIL("expected a cycle error");
    } catch (const OrchestrationError& e) {
        REQUIRE(e.code() == "CycleDetected");
        REQUIRE(as_set(error_as<StructuralError>(e).path) == std::set<BlockId>{"A", "B"});
    }
}

TEST_CASE("Soft dependencies do not gate or form cycles", "[graph]") {
    std::vector<BlockDependency> deps = {
        requires_before("B", "A"),
        BlockDependency{"A", "B", DependencyKind::INFLUENCES},
        BlockDependency{"C", "A", DependencyKind::PROVIDES_INFORMATION},
        BlockDependency{"C", "B", DependencyKind::ALTERNATIVE},
    };
    auto graph = DependencyGraph::build({block("A"), block("B"), block("C")}, deps);

    auto layers = graph.layers();
    REQUIRE(layers.size() == 2);
    REQUIRE(as_set(layers[0]) == std::set<BlockId>{"A", "C"});
    REQUIRE(graph.gating_prerequisites("C").empty());
    REQUIRE(graph.dependencies().size() == 4);
}

TEST_CASE("Critical path is the longest effort chain", "[graph]") {
    using std::chrono::milliseconds;
    auto graph = DependencyGraph::build(
        {block("A", {}, 0, milliseconds(100)), block("B", {}, 0, milliseconds(500)),
         block("C", {}, 0, milliseconds(50)), block("D", {}, 0, milliseconds(100)),
         block("E", {}, 0, milliseconds(300))},
        {requires_before("B", "A"), requires_before("C", "A"), requires_before("D", "B"), requires_before("D", "C")});

    REQUIRE(graph.critical_path() == std::vector<BlockId>{"A", "B", "D"});
    REQUIRE(graph.block("B").on_critical_path);
    REQUIRE_FALSE(graph.block("C").on_critical_path);
    REQUIRE_FALSE(graph.block("E").on_critical_path);
}

TEST_CASE("Priority combines base score, critical path, dependents and risk", "[graph]") {
    auto risky = block("R", {}, 1.0);
    risky.risk_factor = 3.0; // clamped to 1
    auto graph = DependencyGraph::build({block("A", {}, 2.0), block("B"), risky},
                                        {requires_before("B", "A"),
                                         BlockDependency{"B", "R", DependencyKind::INFLUENCES}});

    PriorityWeights w;
    REQUIRE(graph.block("R").risk_factor == 1.0);
    // A: base 2, on the critical path (A -> B), one gating dependent
    REQUIRE(graph.priority("A") == 2.0 + w.critical_path_bonus + w.dependent_bonus);
    // R: base 1, full risk, one soft dependent
    REQUIRE(graph.priority("R") == 1.0 + w.risk_weight + w.influence_bonus);
    // the higher priority runs first within a layer
    REQUIRE(graph.layers()[0].front() == "A");
}

TEST_CASE("Blocks of equal priority are ordered by id", "[graph]") {
    auto graph = DependencyGraph::build({block("c"), block("a"), block("b")}, {});
    // every block is its own chain of effort 0; the smallest id ends the critical path
    REQUIRE(graph.critical_path() == std::vector<BlockId>{"a"});
    REQUIRE(graph.execution_order() == std::vector<BlockId>{"a", "b", "c"});
}

TEST_CASE("Unknown block lookups fail", "[graph]") {
    auto graph = DependencyGraph::build({block("A")}, {});
    REQUIRE(graph.contains("A"));
    REQUIRE_FALSE(graph.contains("Z"));
    REQUIRE_THROWS_AS(graph.block("Z"), OrchestrationError);
    REQUIRE(graph.gating_dependents("Z").empty());
}
