// modules/scheduler/dependency_graph.cpp
#include "modules/scheduler/dependency_graph.h"
#include "core/types/errors.h"
#include <algorithm>
#include <functional>
#include <set>

namespace blockflow {

namespace {

[[noreturn]] void throw_structural(StructuralError::Kind kind, const std::string& message,
                                   std::vector<BlockId> path = {}) {
    throw OrchestrationError(StructuralError{kind, message, std::move(path)});
}

void add_unique(std::vector<BlockId>& list, const BlockId& id) {
    if (std::find(list.begin(), list.end(), id) == list.end()) {
        list.push_back(id);
    }
}

const std::vector<BlockId> kNoBlocks;

} // namespace

DependencyGraph DependencyGraph::build(std::vector<ImplementationBlock> blocks,
                                       const std::vector<BlockDependency>& dependencies,
                                       const PriorityWeights& weights) {
    DependencyGraph graph;

    for (auto& b : blocks) {
        if (b.id.empty()) {
            throw_structural(StructuralError::Kind::MISSING_DEPENDENCY, "block with empty id");
        }
        b.risk_factor = std::clamp(b.risk_factor, 0.0, 1.0);
        b.dependencies.clear();
        b.on_critical_path = false;
        const BlockId id = b.id;
        if (!graph.blocks_.emplace(id, std::move(b)).second) {
            throw_structural(StructuralError::Kind::DUPLICATE_BLOCK, "duplicate block id '" + id + "'");
        }
        graph.prerequisites_[id];
        graph.dependents_[id];
    }

    for (const auto& dep : dependencies) {
        if (!graph.contains(dep.block)) {
            throw_structural(StructuralError::Kind::MISSING_DEPENDENCY,
                             "dependency refers to unknown block '" + dep.block + "'");
        }
        if (!graph.contains(dep.prerequisite)) {
            throw_structural(StructuralError::Kind::MISSING_DEPENDENCY,
                             "block '" + dep.block + "' depends on unknown block '" + dep.prerequisite + "'");
        }
        graph.edges_.push_back(dep);
        add_unique(graph.blocks_.at(dep.block).dependencies, dep.prerequisite);
        if (is_gating(dep.kind)) {
            add_unique(graph.prerequisites_[dep.block], dep.prerequisite);
            add_unique(graph.dependents_[dep.prerequisite], dep.block);
        }
    }

    graph.check_acyclic();
    graph.compute_critical_path();
    graph.compute_priorities(weights);
    return graph;
}

// 三色 DFS，沿 prerequisite -> dependent 方向
void DependencyGraph::check_acyclic() const {
    enum class Color { WHITE, GRAY, BLACK };
    std::map<BlockId, Color> color;
    for (const auto& [id, _] : blocks_) color[id] = Color::WHITE;

    std::vector<BlockId> stack;
    std::function<void(const BlockId&)> visit = [&](const BlockId& id) {
        color[id] = Color::GRAY;
        stack.push_back(id);
        for (const auto& next : dependents_.at(id)) {
            if (color[next] == Color::GRAY) {
                auto start = std::find(stack.begin(), stack.end(), next);
                std::vector<BlockId> path(start, stack.end());
                path.push_back(next);
                std::string text;
                for (size_t i = 0; i < path.size(); ++i) {
                    text += (i ? " -> " : "") + path[i];
                }
                throw_structural(StructuralError::Kind::CYCLE_DETECTED, "dependency cycle: " + text, std::move(path));
            }
            if (color[next] == Color::WHITE) {
                visit(next);
            }
        }
        stack.pop_back();
        color[id] = Color::BLACK;
    };

    for (const auto& [id, _] : blocks_) {
        if (color[id] == Color::WHITE) visit(id);
    }
}

std::vector<BlockId> DependencyGraph::topological_order() const {
    std::vector<BlockId> order;
    for (const auto& layer : layers()) {
        order.insert(order.end(), layer.begin(), layer.end());
    }
    return order;
}

std::vector<std::vector<BlockId>> DependencyGraph::layers() const {
    std::map<BlockId, size_t> in_degree;
    for (const auto& [id, prereqs] : prerequisites_) in_degree[id] = prereqs.size();

    std::vector<BlockId> current;
    for (const auto& [id, degree] : in_degree) {
        if (degree == 0) current.push_back(id);
    }

    auto by_priority = [this](const BlockId& a, const BlockId& b) {
        const double pa = priority(a);
        const double pb = priority(b);
        if (pa != pb) return pa > pb;
        return a < b;
    };

    std::vector<std::vector<BlockId>> result;
    while (!current.empty()) {
        std::sort(current.begin(), current.end(), by_priority);
        std::vector<BlockId> next;
        for (const auto& id : current) {
            for (const auto& dependent : dependents_.at(id)) {
                if (--in_degree[dependent] == 0) next.push_back(dependent);
            }
        }
        result.push_back(std::move(current));
        current = std::move(next);
    }
    return result;
}

std::vector<BlockId> DependencyGraph::execution_order() const {
    return topological_order();
}

void DependencyGraph::compute_critical_path() {
    critical_path_.clear();
    if (blocks_.empty()) return;

    // 最长路径：dist(v) = effort(v) + max dist(prerequisite)
    std::map<BlockId, long long> dist;
    std::map<BlockId, BlockId> via;
    for (const auto& id : topological_order()) {
        long long best = 0;
        const BlockId* best_prev = nullptr;
        for (const auto& p : prerequisites_.at(id)) { // prerequisites precede id in topological order
            const long long d = dist.at(p);
            if (!best_prev || d > best || (d == best && p < *best_prev)) {
                best = d;
                best_prev = &p;
            }
        }
        dist[id] = best + blocks_.at(id).estimated_effort.count();
        if (best_prev) via[id] = *best_prev;
    }

    const BlockId* end = nullptr;
    for (const auto& [id, d] : dist) { // map order makes the smaller id win ties
        if (!end || d > dist.at(*end)) end = &id;
    }

    for (BlockId cur = *end;;) {
        critical_path_.push_back(cur);
        auto it = via.find(cur);
        if (it == via.end()) break;
        cur = it->second;
    }
    std::reverse(critical_path_.begin(), critical_path_.end());
    for (const auto& id : critical_path_) {
        blocks_.at(id).on_critical_path = true;
    }
}

void DependencyGraph::compute_priorities(const PriorityWeights& weights) {
    std::map<BlockId, size_t> soft_dependents;
    for (const auto& dep : edges_) {
        if (dep.kind == DependencyKind::INFLUENCES || dep.kind == DependencyKind::PROVIDES_INFORMATION) {
            ++soft_dependents[dep.prerequisite];
        }
    }
    for (const auto& [id, b] : blocks_) {
        double p = b.priority;
        if (b.on_critical_path) p += weights.critical_path_bonus;
        p += weights.dependent_bonus * static_cast<double>(dependents_.at(id).size());
        p += weights.risk_weight * b.risk_factor;
        p += weights.influence_bonus * static_cast<double>(soft_dependents[id]);
        priorities_[id] = p;
    }
}

double DependencyGraph::priority(const BlockId& id) const {
    auto it = priorities_.find(id);
    if (it != priorities_.end()) return it->second;
    return blocks_.count(id) ? blocks_.at(id).priority : 0.0;
}

const ImplementationBlock& DependencyGraph::block(const BlockId& id) const {
    auto it = blocks_.find(id);
    if (it == blocks_.end()) {
        throw_structural(StructuralError::Kind::MISSING_DEPENDENCY, "unknown block '" + id + "'");
    }
    return it->second;
}

ImplementationBlock& DependencyGraph::block(const BlockId& id) {
    auto it = blocks_.find(id);
    if (it == blocks_.end()) {
        throw_structural(StructuralError::Kind::MISSING_DEPENDENCY, "unknown block '" + id + "'");
    }
    return it->second;
}

const std::vector<BlockId>& DependencyGraph::gating_prerequisites(const BlockId& id) const {
    auto it = prerequisites_.find(id);
    return it == prerequisites_.end() ? kNoBlocks : it->second;
}

const std::vector<BlockId>& DependencyGraph::gating_dependents(const BlockId& id) const {
    auto it = dependents_.find(id);
    return it == dependents_.end() ? kNoBlocks : it->second;
}

} // namespace blockflow
