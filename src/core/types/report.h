#ifndef BLOCKFLOW_TYPES_REPORT_H
#define BLOCKFLOW_TYPES_REPORT_H

#include "block.h"
#include "checkpoint.h"
#include <algorithm>
#include <string>
#include <vector>

namespace blockflow {

struct BlockReport {
    BlockId id;
    BlockStatus status = BlockStatus::NOT_STARTED;
    std::string reason;
    int attempts = 0;
    std::vector<Artifact> artifacts;
    Value metrics = Value::object();
    std::vector<std::string> issues;
};

struct RunReport {
    bool success = false; // every block completed (with or without issues)
    std::string message;
    std::vector<BlockReport> blocks; // execution order
    std::vector<std::string> warnings;
    std::vector<CheckpointId> checkpoints;
    std::string summary;

    const BlockReport* find(const BlockId& id) const {
        auto it = std::find_if(blocks.begin(), blocks.end(), [&id](const BlockReport& b) { return b.id == id; });
        return it == blocks.end() ? nullptr : &*it;
    }

    size_t count(BlockStatus status) const {
        return static_cast<size_t>(std::count_if(blocks.begin(), blocks.end(),
                                                  [status](const BlockReport& b) { return b.status == status; }));
    }
};

inline void to_json(nlohmann::json& j, const BlockReport& b) {
    j = nlohmann::json{
        {"id", b.id},
        {"status", to_string(b.status)},
        {"reason", b.reason},
        {"attempts", b.attempts},
        {"artifacts", b.artifacts},
        {"metrics", b.metrics},
        {"issues", b.issues}
    };
}

inline void from_json(const nlohmann::json& j, BlockReport& b) {
    b.id = j.at("id").get<std::string>();
    b.status = parse_block_status(j.at("status").get<std::string>());
    b.reason = j.value("reason", std::string{});
    b.attempts = j.value("attempts", 0);
    b.artifacts = j.value("artifacts", std::vector<Artifact>{});
    b.metrics = j.contains("metrics") ? j["metrics"] : nlohmann::json::object();
    b.issues = j.value("issues", std::vector<std::string>{});
}

inline void to_json(nlohmann::json& j, const RunReport& r) {
    j = nlohmann::json{
        {"success", r.success},
        {"message", r.message},
        {"blocks", r.blocks},
        {"warnings", r.warnings},
        {"checkpoints", r.checkpoints},
        {"summary", r.summary}
    };
}

inline void from_json(const nlohmann::json& j, RunReport& r) {
    r.success = j.value("success", false);
    r.message = j.value("message", std::string{});
    r.blocks = j.value("blocks", std::vector<BlockReport>{});
    r.warnings = j.value("warnings", std::vector<std::string>{});
    r.checkpoints = j.value("checkpoints", std::vector<CheckpointId>{});
    r.summary = j.value("summary", std::string{});
}

} // namespace blockflow

#endif // BLOCKFLOW_TYPES_REPORT_H
