#ifndef BLOCKFLOW_TYPES_ERRORS_H
#define BLOCKFLOW_TYPES_ERRORS_H

#include "block.h"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace blockflow {

enum class ErrorCategory : uint8_t {
    STRUCTURAL,
    RESOURCE,
    EXECUTION,
    PERSISTENCE,
    MERGE
};

// Raised while building the graph; never retried.
struct StructuralError {
    enum class Kind : uint8_t { CYCLE_DETECTED, MISSING_DEPENDENCY, DUPLICATE_BLOCK };
    Kind kind;
    std::string message;
    std::vector<BlockId> path; // cycle, first == last
};

struct ResourceError {
    enum class Kind : uint8_t { MEMORY_LIMIT_EXCEEDED, CPU_LIMIT_EXCEEDED, DISK_LIMIT_EXCEEDED };
    Kind kind;
    std::string message;
};

struct ExecutionError {
    enum class Kind : uint8_t { GENERATION_FAILURE, VALIDATION_FAILURE, BUILD_ERROR, TIMEOUT_ERROR };
    Kind kind;
    std::string message;
};

struct PersistenceError {
    enum class Kind : uint8_t { CHECKPOINT_NOT_FOUND, SERIALIZATION_ERROR, IO_ERROR };
    Kind kind;
    std::string message;
};

struct MergeError {
    enum class Kind : uint8_t { BRANCH_NOT_FOUND, MERGE_CONFLICT, NO_BRANCHES_AVAILABLE };
    Kind kind;
    std::string message;
    std::vector<std::string> components; // conflicting components, if any
};

using Error = std::variant<StructuralError, ResourceError, ExecutionError, PersistenceError, MergeError>;

ErrorCategory category_of(const Error& error);
std::string category_name(ErrorCategory category);

// Stable code name, e.g. "GenerationFailure". Used as the recovery policy key.
std::string error_code(const Error& error);
const std::string& error_message(const Error& error);
std::string describe(const Error& error);

class OrchestrationError : public std::runtime_error {
public:
    explicit OrchestrationError(Error error);

    const Error& error() const noexcept { return error_; }
    ErrorCategory category() const { return category_of(error_); }
    std::string code() const { return error_code(error_); }

private:
    Error error_;
};

} // namespace blockflow

#endif // BLOCKFLOW_TYPES_ERRORS_H
