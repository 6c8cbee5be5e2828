// modules/branch/branch_store.h
#ifndef BLOCKFLOW_MODULES_BRANCH_BRANCH_STORE_H
#define BLOCKFLOW_MODULES_BRANCH_BRANCH_STORE_H

#include "modules/branch/branch.h"
#include <filesystem>
#include <mutex>
#include <optional>
#include <vector>

namespace blockflow {

/**
 * Keeps branches on disk after exploration, e.g. when a selective merge
 * stopped on a conflict and someone has to resolve it by hand.
 *
 * Layout: <root>/<branch id>/metadata.json and artifacts.json.
 * Failures throw OrchestrationError(PersistenceError).
 */
class BranchStore {
public:
    explicit BranchStore(std::filesystem::path root);

    void save(const ImplementationBranch& branch);
    // nullopt if the branch was never saved.
    std::optional<ImplementationBranch> load(const BranchId& id);
    void remove(const BranchId& id);
    // Sorted ids of stored branches.
    std::vector<BranchId> list();

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
    std::mutex mutex_;
};

} // namespace blockflow

#endif // BLOCKFLOW_MODULES_BRANCH_BRANCH_STORE_H
