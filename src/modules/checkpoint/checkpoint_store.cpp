// modules/checkpoint/checkpoint_store.cpp
#include "modules/checkpoint/checkpoint_store.h"
#include "common/utils/log.h"
#include "common/utils/template_renderer.h"
#include "core/types/block.h"
#include "core/types/errors.h"
#include <algorithm>
#include <cstdio>
#include <stdexcept>

namespace blockflow {

namespace {

CheckpointId make_id(uint64_t sequence) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "cp-%06llu", static_cast<unsigned long long>(sequence));
    return buf;
}

} // namespace

CheckpointStore::CheckpointStore(Config config, std::shared_ptr<CheckpointStorage> storage)
    : config_(std::move(config)), storage_(std::move(storage)) {
    if (!storage_) {
        throw std::invalid_argument("CheckpointStore requires a storage backend");
    }

    // 重新建立索引
    auto existing = storage_->list();
    std::sort(existing.begin(), existing.end(),
              [](const Checkpoint& a, const Checkpoint& b) { return a.sequence < b.sequence; });
    for (auto& cp : existing) {
        next_sequence_ = std::max(next_sequence_, cp.sequence + 1);
        index_.push_back(std::move(cp));
    }
    if (!index_.empty()) {
        log_info("Re-indexed " + std::to_string(index_.size()) + " checkpoint(s), latest " + index_.back().id);
        std::lock_guard<std::mutex> lock(mutex_);
        evict_locked();
    }
}

std::string CheckpointStore::render_summary(const State& state, const std::string& reason) const {
    size_t block_count = 0;
    size_t completed_count = 0;
    if (state.is_object() && state.contains("blocks") && state["blocks"].is_object()) {
        for (const auto& [id, entry] : state["blocks"].items()) {
            ++block_count;
            const std::string status = entry.is_object() ? entry.value("status", std::string{}) : std::string{};
            if (status == to_string(BlockStatus::COMPLETED) || status == to_string(BlockStatus::COMPLETED_WITH_ISSUES)) {
                ++completed_count;
            }
        }
    }
    Value data = {
        {"reason", reason},
        {"block_count", block_count},
        {"completed_count", completed_count}
    };
    return TemplateRenderer::render(config_.summary_template, data);
}

CheckpointId CheckpointStore::create(const State& state, const std::string& reason, const Value& artifacts) {
    std::string summary = render_summary(state, reason);

    std::lock_guard<std::mutex> lock(mutex_);
    CheckpointRecord record;
    record.checkpoint.sequence = next_sequence_;
    record.checkpoint.id = make_id(next_sequence_);
    record.checkpoint.created_at = std::chrono::system_clock::now();
    record.checkpoint.reason = reason;
    record.checkpoint.summary = std::move(summary);
    record.state = state;
    record.artifacts = artifacts;

    storage_->write(record); // throws PersistenceError; index untouched on failure
    ++next_sequence_;
    index_.push_back(record.checkpoint);
    log_debug("Checkpoint " + record.checkpoint.id + " created (" + reason + ")");

    evict_locked();
    return record.checkpoint.id;
}

bool CheckpointStore::remove_from_storage_locked(const CheckpointId& id) {
    try {
        storage_->remove(id);
        return true;
    } catch (const std::exception& e) {
        log_warning("Could not delete checkpoint " + id + ": " + e.what());
        return false;
    }
}

void CheckpointStore::evict_locked() {
    // earlier failed deletes first
    std::vector<CheckpointId> still_orphaned;
    for (const auto& id : orphans_) {
        if (!remove_from_storage_locked(id)) still_orphaned.push_back(id);
    }
    orphans_ = std::move(still_orphaned);

    // The index drops the entry even when the backend keeps the file.
    while (index_.size() > capacity()) {
        const CheckpointId oldest = index_.front().id;
        index_.pop_front();
        if (remove_from_storage_locked(oldest)) {
            log_debug("Checkpoint " + oldest + " evicted");
        } else {
            orphans_.push_back(oldest);
        }
    }
}

CheckpointRecord CheckpointStore::load(const CheckpointId& id) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const bool known = std::any_of(index_.begin(), index_.end(),
                                       [&id](const Checkpoint& cp) { return cp.id == id; });
        if (!known) {
            throw OrchestrationError(PersistenceError{PersistenceError::Kind::CHECKPOINT_NOT_FOUND,
                                                      "checkpoint " + id + " does not exist"});
        }
    }
    auto record = storage_->read(id);
    if (!record) {
        throw OrchestrationError(PersistenceError{PersistenceError::Kind::CHECKPOINT_NOT_FOUND,
                                                  "checkpoint " + id + " is missing from storage"});
    }
    return *record;
}

std::vector<Checkpoint> CheckpointStore::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {index_.begin(), index_.end()};
}

std::optional<Checkpoint> CheckpointStore::latest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index_.empty()) return std::nullopt;
    return index_.back();
}

bool CheckpointStore::contains(const CheckpointId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(index_.begin(), index_.end(), [&id](const Checkpoint& cp) { return cp.id == id; });
}

size_t CheckpointStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.size();
}

std::vector<CheckpointId> CheckpointStore::orphans() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return orphans_;
}

} // namespace blockflow
