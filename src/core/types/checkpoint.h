#ifndef BLOCKFLOW_TYPES_CHECKPOINT_H
#define BLOCKFLOW_TYPES_CHECKPOINT_H

#include "context.h"
#include <chrono>
#include <cstdint>
#include <string>

namespace blockflow {

using CheckpointId = std::string; // e.g., "cp-000042"

inline constexpr int kCheckpointFormatVersion = 1;

struct Checkpoint {
    CheckpointId id;
    uint64_t sequence = 0; // creation order
    std::chrono::system_clock::time_point created_at;
    std::string reason;
    std::string summary; // human-readable
};

// What a checkpoint persists: metadata, state blob and the artifact snapshot.
struct CheckpointRecord {
    Checkpoint checkpoint;
    State state;
    Value artifacts = Value::object();
};

} // namespace blockflow

#endif // BLOCKFLOW_TYPES_CHECKPOINT_H
