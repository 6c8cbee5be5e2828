// modules/collaborators/collaborators.h
#ifndef BLOCKFLOW_MODULES_COLLABORATORS_COLLABORATORS_H
#define BLOCKFLOW_MODULES_COLLABORATORS_COLLABORATORS_H

#include "core/types/block.h"
#include <stdexcept>
#include <string>
#include <vector>

namespace blockflow {

// Failures a collaborator may raise. They are translated into the error
// taxonomy by ExecutionSession and never travel further.
class GenerationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class BuildError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ValidationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// 生成器：每个执行步骤同步调用一次
class GenerationCollaborator {
public:
    virtual ~GenerationCollaborator() = default;
    virtual Content generate(const ExecutionStep& step) = 0;
};

struct ValidationReport {
    bool passed = true;
    Value metrics = Value::object();
    std::vector<std::string> issues; // non-empty with passed == true means "completed with issues"
};

class ValidationCollaborator {
public:
    virtual ~ValidationCollaborator() = default;
    virtual ValidationReport validate(const ImplementationBlock& block, const std::vector<Artifact>& artifacts) = 0;
};

// Accepts everything.
class PassThroughValidator : public ValidationCollaborator {
public:
    ValidationReport validate(const ImplementationBlock&, const std::vector<Artifact>&) override {
        return ValidationReport{};
    }
};

} // namespace blockflow

#endif // BLOCKFLOW_MODULES_COLLABORATORS_COLLABORATORS_H
