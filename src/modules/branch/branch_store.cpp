// modules/branch/branch_store.cpp
#include "modules/branch/branch_store.h"
#include "common/utils/log.h"
#include "core/types/errors.h"
#include "modules/plan/plan_loader.h"
#include <algorithm>
#include <fstream>
#include <sstream>

namespace blockflow {

namespace {

[[noreturn]] void throw_persistence(PersistenceError::Kind kind, const std::string& message) {
    throw OrchestrationError(PersistenceError{kind, message});
}

void write_json(const std::filesystem::path& path, const nlohmann::json& doc) {
    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw_persistence(PersistenceError::Kind::IO_ERROR, "cannot open " + tmp.string() + " for writing");
        }
        out << doc.dump(2);
        out.flush();
        if (!out) {
            throw_persistence(PersistenceError::Kind::IO_ERROR, "write failed for " + tmp.string());
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        throw_persistence(PersistenceError::Kind::IO_ERROR, "cannot move " + path.string() + " into place");
    }
}

nlohmann::json read_json(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw_persistence(PersistenceError::Kind::IO_ERROR, "cannot open " + path.string());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    try {
        return nlohmann::json::parse(buffer.str());
    } catch (const nlohmann::json::exception& e) {
        throw_persistence(PersistenceError::Kind::SERIALIZATION_ERROR, path.string() + ": " + e.what());
    }
}

} // namespace

BranchStore::BranchStore(std::filesystem::path root) : root_(std::move(root)) {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        throw_persistence(PersistenceError::Kind::IO_ERROR,
                          "cannot create branch directory " + root_.string() + ": " + ec.message());
    }
}

void BranchStore::save(const ImplementationBranch& branch) {
    nlohmann::json metadata;
    nlohmann::json artifacts = nlohmann::json::object();
    try {
        std::vector<ImplementationBlock> blocks;
        for (const auto& [id, block] : branch.plan.blocks()) {
            blocks.push_back(block);
        }
        metadata = {
            {"id", branch.id},
            {"approach", {
                {"id", branch.approach.id},
                {"description", branch.approach.description},
                {"parameters", branch.approach.parameters}
            }},
            {"status", to_string(branch.status)},
            {"component_scores", branch.component_scores},
            {"failure", branch.failure},
            {"report", branch.report},
            {"plan", plan_to_json(blocks, branch.plan.dependencies())}
        };
        if (branch.metrics) metadata["metrics"] = *branch.metrics;
        for (const auto& block : branch.report.blocks) {
            artifacts[block.id] = block.artifacts;
        }
    } catch (const nlohmann::json::exception& e) {
        throw_persistence(PersistenceError::Kind::SERIALIZATION_ERROR,
                          "cannot serialize branch " + branch.id + ": " + e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto dir = root_ / branch.id;
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw_persistence(PersistenceError::Kind::IO_ERROR, "cannot create " + dir.string() + ": " + ec.message());
    }
    write_json(dir / "metadata.json", metadata);
    write_json(dir / "artifacts.json", artifacts);
    log_info("Branch " + branch.id + " saved to " + dir.string());
}

std::optional<ImplementationBranch> BranchStore::load(const BranchId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto dir = root_ / id;
    std::error_code ec;
    if (!std::filesystem::exists(dir / "metadata.json", ec)) {
        return std::nullopt;
    }
    const nlohmann::json metadata = read_json(dir / "metadata.json");

    ImplementationBranch branch;
    try {
        branch.id = metadata.at("id").get<std::string>();
        const auto& approach = metadata.at("approach");
        branch.approach.id = approach.at("id").get<std::string>();
        branch.approach.description = approach.value("description", std::string{});
        branch.approach.parameters = approach.contains("parameters") ? approach["parameters"] : Value::object();
        branch.status = parse_branch_status(metadata.at("status").get<std::string>());
        branch.failure = metadata.value("failure", std::string{});
        branch.component_scores = metadata.value("component_scores", std::map<BlockId, double>{});
        branch.report = metadata.at("report").get<RunReport>();
        if (metadata.contains("metrics")) branch.metrics = metadata["metrics"].get<BranchMetrics>();

        const Plan plan = PlanLoader{}.parse_from_json(metadata.at("plan"));
        branch.plan = DependencyGraph::build(plan.blocks, plan.dependencies);
        for (const auto& b : branch.report.blocks) {
            if (!branch.plan.contains(b.id)) continue;
            auto& block = branch.plan.block(b.id);
            block.status = b.status;
            block.status_reason = b.reason;
            block.attempts = b.attempts;
        }
    } catch (const OrchestrationError&) {
        throw;
    } catch (const std::exception& e) {
        throw_persistence(PersistenceError::Kind::SERIALIZATION_ERROR,
                          "malformed branch metadata for " + id + ": " + e.what());
    }

    // Report artifacts are authoritative; artifacts.json may have been edited during manual resolution.
    if (std::filesystem::exists(dir / "artifacts.json", ec)) {
        const nlohmann::json artifacts = read_json(dir / "artifacts.json");
        try {
            for (auto& block : branch.report.blocks) {
                if (artifacts.contains(block.id)) {
                    block.artifacts = artifacts[block.id].get<std::vector<Artifact>>();
                }
            }
        } catch (const nlohmann::json::exception& e) {
            throw_persistence(PersistenceError::Kind::SERIALIZATION_ERROR,
                              "malformed artifacts for " + id + ": " + e.what());
        }
    }
    return branch;
}

void BranchStore::remove(const BranchId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    std::filesystem::remove_all(root_ / id, ec);
    if (ec) {
        throw_persistence(PersistenceError::Kind::IO_ERROR, "cannot delete branch " + id + ": " + ec.message());
    }
}

std::vector<BranchId> BranchStore::list() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<BranchId> ids;
    std::error_code ec;
    for (auto it = std::filesystem::directory_iterator(root_, ec);
         !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (it->is_directory() && std::filesystem::exists(it->path() / "metadata.json")) {
            ids.push_back(it->path().filename().string());
        }
    }
    if (ec) {
        throw_persistence(PersistenceError::Kind::IO_ERROR, "cannot list " + root_.string() + ": " + ec.message());
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace blockflow
