// common/config/config_loader.h
#ifndef BLOCKFLOW_COMMON_CONFIG_CONFIG_LOADER_H
#define BLOCKFLOW_COMMON_CONFIG_CONFIG_LOADER_H

#include "common/config/orchestrator_config.h"
#include <nlohmann/json.hpp>
#include <string>

namespace blockflow {

// Missing sections and fields keep their defaults. A wrong-typed or out-of-range
// value throws std::runtime_error naming the field, e.g. "scheduler.poll_interval_ms".
OrchestratorConfig load_config(const std::string& path);
OrchestratorConfig parse_config(const std::string& yaml_text);
OrchestratorConfig config_from_json(const nlohmann::json& doc);

RecoveryPolicy parse_recovery_policy(const nlohmann::json& doc, const std::string& field);

} // namespace blockflow

#endif // BLOCKFLOW_COMMON_CONFIG_CONFIG_LOADER_H
