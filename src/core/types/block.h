#ifndef BLOCKFLOW_TYPES_BLOCK_H
#define BLOCKFLOW_TYPES_BLOCK_H

#include "context.h"
#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace blockflow {

using BlockId = std::string; // e.g., "auth/session-store"

// 区块状态
enum class BlockStatus : uint8_t {
    NOT_STARTED,
    READY,
    IN_PROGRESS,
    COMPLETED,
    COMPLETED_WITH_ISSUES,
    FAILED,
    BLOCKED,
    DEFERRED
};

// 依赖类型：只有前两种会阻塞执行
enum class DependencyKind : uint8_t {
    REQUIRED_BEFORE,
    REQUIRED_FOR_COMPLETION,
    INFLUENCES,
    PROVIDES_INFORMATION,
    ALTERNATIVE
};

inline bool is_gating(DependencyKind kind) {
    return kind == DependencyKind::REQUIRED_BEFORE || kind == DependencyKind::REQUIRED_FOR_COMPLETION;
}

inline bool is_successful(BlockStatus status) {
    return status == BlockStatus::COMPLETED || status == BlockStatus::COMPLETED_WITH_ISSUES;
}

// Terminal for the current pass.
inline bool is_terminal(BlockStatus status) {
    return is_successful(status) || status == BlockStatus::FAILED || status == BlockStatus::DEFERRED;
}

inline bool can_transition(BlockStatus from, BlockStatus to) {
    switch (from) {
        case BlockStatus::NOT_STARTED:
            return to == BlockStatus::READY || to == BlockStatus::BLOCKED || to == BlockStatus::DEFERRED;
        case BlockStatus::BLOCKED:
            return to == BlockStatus::READY || to == BlockStatus::DEFERRED;
        case BlockStatus::READY:
            return to == BlockStatus::IN_PROGRESS || to == BlockStatus::BLOCKED || to == BlockStatus::DEFERRED;
        case BlockStatus::IN_PROGRESS:
            return to == BlockStatus::COMPLETED || to == BlockStatus::COMPLETED_WITH_ISSUES ||
                   to == BlockStatus::FAILED;
        case BlockStatus::FAILED:
            return to == BlockStatus::IN_PROGRESS || to == BlockStatus::DEFERRED;
        case BlockStatus::COMPLETED:
        case BlockStatus::COMPLETED_WITH_ISSUES:
        case BlockStatus::DEFERRED:
            return false;
    }
    return false;
}

inline std::string to_string(BlockStatus status) {
    switch (status) {
        case BlockStatus::NOT_STARTED: return "not_started";
        case BlockStatus::READY: return "ready";
        case BlockStatus::IN_PROGRESS: return "in_progress";
        case BlockStatus::COMPLETED: return "completed";
        case BlockStatus::COMPLETED_WITH_ISSUES: return "completed_with_issues";
        case BlockStatus::FAILED: return "failed";
        case BlockStatus::BLOCKED: return "blocked";
        case BlockStatus::DEFERRED: return "deferred";
    }
    return "unknown";
}

inline BlockStatus parse_block_status(const std::string& s) {
    if (s == "not_started") return BlockStatus::NOT_STARTED;
    if (s == "ready") return BlockStatus::READY;
    if (s == "in_progress") return BlockStatus::IN_PROGRESS;
    if (s == "completed") return BlockStatus::COMPLETED;
    if (s == "completed_with_issues") return BlockStatus::COMPLETED_WITH_ISSUES;
    if (s == "failed") return BlockStatus::FAILED;
    if (s == "blocked") return BlockStatus::BLOCKED;
    if (s == "deferred") return BlockStatus::DEFERRED;
    throw std::runtime_error("Unknown block status '" + s + "'");
}

inline std::string to_string(DependencyKind kind) {
    switch (kind) {
        case DependencyKind::REQUIRED_BEFORE: return "required_before";
        case DependencyKind::REQUIRED_FOR_COMPLETION: return "required_for_completion";
        case DependencyKind::INFLUENCES: return "influences";
        case DependencyKind::PROVIDES_INFORMATION: return "provides_information";
        case DependencyKind::ALTERNATIVE: return "alternative";
    }
    return "unknown";
}

inline DependencyKind parse_dependency_kind(const std::string& s) {
    if (s == "required_before") return DependencyKind::REQUIRED_BEFORE;
    if (s == "required_for_completion") return DependencyKind::REQUIRED_FOR_COMPLETION;
    if (s == "influences") return DependencyKind::INFLUENCES;
    if (s == "provides_information") return DependencyKind::PROVIDES_INFORMATION;
    if (s == "alternative") return DependencyKind::ALTERNATIVE;
    throw std::runtime_error("Unknown dependency kind '" + s + "'");
}

struct ExecutionStep {
    std::string id;
    std::string description;
    Value parameters = Value::object();
    bool optional = false; // dropped by the simplify fallback
};

// Inclusive line range inside a target component.
struct LineRange {
    size_t begin = 0;
    size_t end = 0;

    bool overlaps(const LineRange& other) const {
        return begin <= other.end && other.begin <= end;
    }
};

// Output of the generation collaborator for one step.
struct Content {
    std::string text;
    std::optional<std::string> target;  // file / component path
    std::optional<LineRange> region;    // absent = whole target
    Value metadata = Value::object();
};

struct Artifact {
    std::string step_id;
    Content content;
};

struct ImplementationBlock {
    BlockId id;
    std::string description;
    double priority = 0.0;      // base score
    double risk_factor = 0.0;   // clamped to [0, 1]
    bool security_critical = false;
    std::vector<BlockId> dependencies; // filled by DependencyGraph::build
    std::vector<ExecutionStep> steps;
    std::chrono::milliseconds estimated_effort{0};
    std::vector<std::string> validation_criteria;

    BlockStatus status = BlockStatus::NOT_STARTED;
    std::string status_reason;
    int attempts = 0;
    bool on_critical_path = false;
};

// Edge from `block` to its prerequisite.
struct BlockDependency {
    BlockId block;
    BlockId prerequisite;
    DependencyKind kind = DependencyKind::REQUIRED_BEFORE;
};

inline void to_json(nlohmann::json& j, const LineRange& r) {
    j = nlohmann::json::array({r.begin, r.end});
}

inline void from_json(const nlohmann::json& j, LineRange& r) {
    r.begin = j.at(0).get<size_t>();
    r.end = j.at(1).get<size_t>();
}

inline void to_json(nlohmann::json& j, const Content& c) {
    j = nlohmann::json{{"text", c.text}, {"metadata", c.metadata}};
    if (c.target) j["target"] = *c.target;
    if (c.region) j["region"] = *c.region;
}

inline void from_json(const nlohmann::json& j, Content& c) {
    c.text = j.value("text", std::string{});
    c.metadata = j.contains("metadata") ? j["metadata"] : nlohmann::json::object();
    if (j.contains("target") && j["target"].is_string()) c.target = j["target"].get<std::string>();
    if (j.contains("region") && j["region"].is_array()) c.region = j["region"].get<LineRange>();
}

inline void to_json(nlohmann::json& j, const Artifact& a) {
    j = nlohmann::json{{"step", a.step_id}, {"content", a.content}};
}

inline void from_json(const nlohmann::json& j, Artifact& a) {
    a.step_id = j.value("step", std::string{});
    a.content = j.at("content").get<Content>();
}

} // namespace blockflow

#endif // BLOCKFLOW_TYPES_BLOCK_H
