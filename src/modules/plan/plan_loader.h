// modules/plan/plan_loader.h
#ifndef BLOCKFLOW_MODULES_PLAN_PLAN_LOADER_H
#define BLOCKFLOW_MODULES_PLAN_PLAN_LOADER_H

#include "core/types/block.h"
#include <string>
#include <vector>

namespace blockflow {

// Input of DependencyGraph::build.
struct Plan {
    std::vector<ImplementationBlock> blocks;
    std::vector<BlockDependency> dependencies;
};

/**
 * Reads plan documents:
 *
 *   blocks:
 *     - id: storage
 *       priority: 3
 *       risk: 0.2
 *       effort_ms: 1500
 *       steps:
 *         - id: schema
 *           optional: false
 *       validation: ["compiles"]
 *       depends_on: [config]          # shorthand for required_before
 *   dependencies:
 *     - { block: api, requires: storage, kind: influences }
 *
 * Format problems throw std::runtime_error naming the offending field;
 * duplicate block ids throw OrchestrationError(DuplicateBlock).
 */
class PlanLoader {
public:
    Plan parse_from_string(const std::string& yaml_content) const;
    Plan parse_from_file(const std::string& file_path) const;
    Plan parse_from_json(const nlohmann::json& doc) const;
};

// Inverse of PlanLoader::parse_from_json; runtime fields (status, attempts) are not written.
nlohmann::json plan_to_json(const std::vector<ImplementationBlock>& blocks,
                            const std::vector<BlockDependency>& dependencies);

} // namespace blockflow

#endif // BLOCKFLOW_MODULES_PLAN_PLAN_LOADER_H
