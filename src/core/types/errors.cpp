// core/types/errors.cpp
#include "core/types/errors.h"
#include <type_traits>

namespace blockflow {

namespace {

std::string kind_name(StructuralError::Kind kind) {
    switch (kind) {
        case StructuralError::Kind::CYCLE_DETECTED: return "CycleDetected";
        case StructuralError::Kind::MISSING_DEPENDENCY: return "MissingDependency";
        case StructuralError::Kind::DUPLICATE_BLOCK: return "DuplicateBlock";
    }
    return "Structural";
}

std::string kind_name(ResourceError::Kind kind) {
    switch (kind) {
        case ResourceError::Kind::MEMORY_LIMIT_EXCEEDED: return "MemoryLimitExceeded";
        case ResourceError::Kind::CPU_LIMIT_EXCEEDED: return "CpuLimitExceeded";
        case ResourceError::Kind::DISK_LIMIT_EXCEEDED: return "DiskLimitExceeded";
    }
    return "Resource";
}

std::string kind_name(ExecutionError::Kind kind) {
    switch (kind) {
        case ExecutionError::Kind::GENERATION_FAILURE: return "GenerationFailure";
        case ExecutionError::Kind::VALIDATION_FAILURE: return "ValidationFailure";
        case ExecutionError::Kind::BUILD_ERROR: return "BuildError";
        case ExecutionError::Kind::TIMEOUT_ERROR: return "TimeoutError";
    }
    return "Execution";
}

std::string kind_name(PersistenceError::Kind kind) {
    switch (kind) {
        case PersistenceError::Kind::CHECKPOINT_NOT_FOUND: return "CheckpointNotFound";
        case PersistenceError::Kind::SERIALIZATION_ERROR: return "SerializationError";
        case PersistenceError::Kind::IO_ERROR: return "IOError";
    }
    return "Persistence";
}

std::string kind_name(MergeError::Kind kind) {
    switch (kind) {
        case MergeError::Kind::BRANCH_NOT_FOUND: return "BranchNotFound";
        case MergeError::Kind::MERGE_CONFLICT: return "MergeConflict";
        case MergeError::Kind::NO_BRANCHES_AVAILABLE: return "NoBranchesAvailable";
    }
    return "Merge";
}

} // namespace

ErrorCategory category_of(const Error& error) {
    return std::visit([](const auto& e) -> ErrorCategory {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, StructuralError>) return ErrorCategory::STRUCTURAL;
        else if constexpr (std::is_same_v<T, ResourceError>) return ErrorCategory::RESOURCE;
        else if constexpr (std::is_same_v<T, ExecutionError>) return ErrorCategory::EXECUTION;
        else if constexpr (std::is_same_v<T, PersistenceError>) return ErrorCategory::PERSISTENCE;
        else return ErrorCategory::MERGE;
    }, error);
}

std::string category_name(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::STRUCTURAL: return "Structural";
        case ErrorCategory::RESOURCE: return "Resource";
        case ErrorCategory::EXECUTION: return "Execution";
        case ErrorCategory::PERSISTENCE: return "Persistence";
        case ErrorCategory::MERGE: return "Merge";
    }
    return "Unknown";
}

std::string error_code(const Error& error) {
    return std::visit([](const auto& e) { return kind_name(e.kind); }, error);
}

const std::string& error_message(const Error& error) {
    return std::visit([](const auto& e) -> const std::string& { return e.message; }, error);
}

std::string describe(const Error& error) {
    return error_code(error) + ": " + error_message(error);
}

OrchestrationError::OrchestrationError(Error error)
    : std::runtime_error(describe(error)), error_(std::move(error)) {}

} // namespace blockflow
