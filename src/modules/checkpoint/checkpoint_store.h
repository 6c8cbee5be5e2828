// modules/checkpoint/checkpoint_store.h
#ifndef BLOCKFLOW_MODULES_CHECKPOINT_CHECKPOINT_STORE_H
#define BLOCKFLOW_MODULES_CHECKPOINT_CHECKPOINT_STORE_H

#include "modules/checkpoint/checkpoint_storage.h"
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace blockflow {

/**
 * Append-only checkpoint index with a retention bound.
 *
 * create() writes the snapshot first and evicts oldest-first afterwards,
 * so the newest checkpoint is always present. An entry whose backend delete
 * fails still leaves the index; the delete is retried on the next create().
 * Reopening a store over a
 * persistent backend rebuilds the index from what the backend holds.
 */
class CheckpointStore {
public:
    struct Config {
        size_t max_checkpoints = 20; // 0 is treated as 1
        std::string summary_template =
            "{{ reason }}: {{ completed_count }}/{{ block_count }} blocks complete";
        Config() = default;
    };

    CheckpointStore(Config config, std::shared_ptr<CheckpointStorage> storage);

    CheckpointId create(const State& state, const std::string& reason,
                        const Value& artifacts = Value::object());

    // Throws PersistenceError(CheckpointNotFound) if absent.
    CheckpointRecord load(const CheckpointId& id) const;

    // Oldest first.
    std::vector<Checkpoint> list() const;
    std::optional<Checkpoint> latest() const;
    bool contains(const CheckpointId& id) const;
    size_t size() const;

    // Evicted checkpoints the backend failed to delete.
    std::vector<CheckpointId> orphans() const;

private:
    const Config config_;
    std::shared_ptr<CheckpointStorage> storage_;

    mutable std::mutex mutex_;
    std::deque<Checkpoint> index_; // creation order
    uint64_t next_sequence_ = 1;
    std::vector<CheckpointId> orphans_;

    size_t capacity() const { return config_.max_checkpoints == 0 ? 1 : config_.max_checkpoints; }
    std::string render_summary(const State& state, const std::string& reason) const;
    bool remove_from_storage_locked(const CheckpointId& id);
    void evict_locked();
};

} // namespace blockflow

#endif // BLOCKFLOW_MODULES_CHECKPOINT_CHECKPOINT_STORE_H
