// modules/checkpoint/checkpoint_storage.h
#ifndef BLOCKFLOW_MODULES_CHECKPOINT_CHECKPOINT_STORAGE_H
#define BLOCKFLOW_MODULES_CHECKPOINT_CHECKPOINT_STORAGE_H

#include "core/types/checkpoint.h"
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace blockflow {

// Versioned JSON document for one checkpoint. Throws PersistenceError(SerializationError).
nlohmann::json checkpoint_to_json(const CheckpointRecord& record);
CheckpointRecord checkpoint_from_json(const nlohmann::json& doc);

/**
 * Backend behind the checkpoint store. Failures are reported as
 * OrchestrationError carrying a PersistenceError.
 */
class CheckpointStorage {
public:
    virtual ~CheckpointStorage() = default;

    virtual void write(const CheckpointRecord& record) = 0;
    virtual std::optional<CheckpointRecord> read(const CheckpointId& id) = 0;
    virtual void remove(const CheckpointId& id) = 0;
    // Metadata of every stored checkpoint, unordered.
    virtual std::vector<Checkpoint> list() = 0;
};

class InMemoryCheckpointStorage : public CheckpointStorage {
public:
    void write(const CheckpointRecord& record) override;
    std::optional<CheckpointRecord> read(const CheckpointId& id) override;
    void remove(const CheckpointId& id) override;
    std::vector<Checkpoint> list() override;

private:
    std::mutex mutex_;
    std::map<CheckpointId, std::string> documents_; // serialized, so snapshots never alias live state
};

// One <id>.json per checkpoint under a directory.
class FileCheckpointStorage : public CheckpointStorage {
public:
    explicit FileCheckpointStorage(std::filesystem::path directory);

    void write(const CheckpointRecord& record) override;
    std::optional<CheckpointRecord> read(const CheckpointId& id) override;
    void remove(const CheckpointId& id) override;
    std::vector<Checkpoint> list() override;

    const std::filesystem::path& directory() const { return directory_; }

private:
    std::filesystem::path directory_;
    std::mutex mutex_;

    std::filesystem::path path_for(const CheckpointId& id) const;
};

} // namespace blockflow

#endif // BLOCKFLOW_MODULES_CHECKPOINT_CHECKPOINT_STORAGE_H
