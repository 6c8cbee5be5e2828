// common/config/config_loader.cpp
#include "common/config/config_loader.h"
#include "common/utils/yaml_json.h"
#include <stdexcept>

namespace blockflow {

namespace {

// Field readers. `path` is the dotted field name used in error messages.

const nlohmann::json* section(const nlohmann::json& doc, const char* key, const std::string& path) {
    if (!doc.contains(key) || doc[key].is_null()) return nullptr;
    if (!doc[key].is_object()) {
        throw std::runtime_error("Config field '" + path + "' must be a mapping");
    }
    return &doc[key];
}

void read_number(const nlohmann::json& obj, const char* key, const std::string& prefix, double& out) {
    if (!obj.contains(key) || obj[key].is_null()) return;
    if (!obj[key].is_number()) {
        throw std::runtime_error("Config field '" + prefix + key + "' must be a number");
    }
    out = obj[key].get<double>();
}

void read_size(const nlohmann::json& obj, const char* key, const std::string& prefix, size_t& out) {
    if (!obj.contains(key) || obj[key].is_null()) return;
    if (!obj[key].is_number_integer() || obj[key].get<long long>() < 0) {
        throw std::runtime_error("Config field '" + prefix + key + "' must be a non-negative integer");
    }
    out = obj[key].get<size_t>();
}

void read_int(const nlohmann::json& obj, const char* key, const std::string& prefix, int& out) {
    if (!obj.contains(key) || obj[key].is_null()) return;
    if (!obj[key].is_number_integer() || obj[key].get<long long>() < 0) {
        throw std::runtime_error("Config field '" + prefix + key + "' must be a non-negative integer");
    }
    out = obj[key].get<int>();
}

void read_millis(const nlohmann::json& obj, const char* key, const std::string& prefix, std::chrono::milliseconds& out) {
    if (!obj.contains(key) || obj[key].is_null()) return;
    if (!obj[key].is_number_integer() || obj[key].get<long long>() < 0) {
        throw std::runtime_error("Config field '" + prefix + key + "' must be a non-negative integer (ms)");
    }
    out = std::chrono::milliseconds(obj[key].get<long long>());
}

void read_bool(const nlohmann::json& obj, const char* key, const std::string& prefix, bool& out) {
    if (!obj.contains(key) || obj[key].is_null()) return;
    if (!obj[key].is_boolean()) {
        throw std::runtime_error("Config field '" + prefix + key + "' must be a boolean");
    }
    out = obj[key].get<bool>();
}

void read_string(const nlohmann::json& obj, const char* key, const std::string& prefix, std::string& out) {
    if (!obj.contains(key) || obj[key].is_null()) return;
    if (!obj[key].is_string()) {
        throw std::runtime_error("Config field '" + prefix + key + "' must be a string");
    }
    out = obj[key].get<std::string>();
}

void read_optional_string(const nlohmann::json& obj, const char* key, const std::string& prefix,
                          std::optional<std::string>& out) {
    std::string value;
    read_string(obj, key, prefix, value);
    if (!value.empty()) out = value;
}

BackoffSpec parse_backoff(const nlohmann::json& doc, const std::string& path) {
    if (!doc.is_object()) {
        throw std::runtime_error("Config field '" + path + "' must be a mapping");
    }
    const std::string prefix = path + ".";
    std::string type = "fixed";
    read_string(doc, "type", prefix, type);

    if (type == "fixed") {
        FixedBackoff b;
        read_millis(doc, "delay_ms", prefix, b.delay);
        return b;
    }
    if (type == "exponential") {
        ExponentialBackoff b;
        read_millis(doc, "initial_ms", prefix, b.initial);
        read_number(doc, "factor", prefix, b.factor);
        read_millis(doc, "max_ms", prefix, b.max);
        if (b.factor < 1.0) {
            throw std::runtime_error("Config field '" + prefix + "factor' must be >= 1");
        }
        return b;
    }
    if (type == "linear") {
        LinearBackoff b;
        read_millis(doc, "initial_ms", prefix, b.initial);
        read_millis(doc, "increment_ms", prefix, b.increment);
        read_millis(doc, "max_ms", prefix, b.max);
        return b;
    }
    throw std::runtime_error("Config field '" + prefix + "type' must be fixed, exponential or linear");
}

} // namespace

RecoveryPolicy parse_recovery_policy(const nlohmann::json& doc, const std::string& field) {
    if (!doc.is_object()) {
        throw std::runtime_error("Config field '" + field + "' must be a mapping");
    }
    const std::string prefix = field + ".";
    RecoveryPolicy policy;
    read_int(doc, "max_retries", prefix, policy.max_retries);
    if (doc.contains("backoff") && !doc["backoff"].is_null()) {
        policy.backoff = parse_backoff(doc["backoff"], prefix + "backoff");
    }
    if (const auto* fallback = section(doc, "fallback", prefix + "fallback")) {
        std::string action = "abort";
        read_string(*fallback, "action", prefix + "fallback.", action);
        try {
            policy.fallback.action = parse_fallback_action(action);
        } catch (const std::runtime_error& e) {
            throw std::runtime_error("Config field '" + prefix + "fallback.action': " + e.what());
        }
        read_string(*fallback, "alternate", prefix + "fallback.", policy.fallback.alternate);
        if (policy.fallback.action == FallbackAction::USE_ALTERNATE && policy.fallback.alternate.empty()) {
            throw std::runtime_error("Config field '" + prefix + "fallback.alternate' is required for use_alternate");
        }
    }
    return policy;
}

OrchestratorConfig config_from_json(const nlohmann::json& doc) {
    OrchestratorConfig config;
    if (doc.is_null()) return config; // empty document
    if (!doc.is_object()) {
        throw std::runtime_error("Config document must be a mapping");
    }

    if (const auto* s = section(doc, "logging", "logging")) {
        std::string level;
        read_string(*s, "level", "logging.", level);
        if (!level.empty()) {
            try {
                config.log_level = parse_log_level(level);
            } catch (const std::runtime_error& e) {
                throw std::runtime_error("Config field 'logging.level': " + std::string(e.what()));
            }
        }
    }

    if (const auto* s = section(doc, "checkpoints", "checkpoints")) {
        read_size(*s, "max_checkpoints", "checkpoints.", config.checkpoints.store.max_checkpoints);
        read_string(*s, "summary_template", "checkpoints.", config.checkpoints.store.summary_template);
        read_optional_string(*s, "directory", "checkpoints.", config.checkpoints.directory);
    }

    if (const auto* s = section(doc, "resources", "resources")) {
        auto& limits = config.resources.limits;
        read_number(*s, "memory_mb", "resources.", limits.memory_mb);
        read_number(*s, "cpu_percent", "resources.", limits.cpu_percent);
        read_number(*s, "disk_mb", "resources.", limits.disk_mb);
        read_number(*s, "warning_ratio", "resources.", limits.warning_ratio);
        read_millis(*s, "interval_ms", "resources.", config.resources.interval);
        if (limits.warning_ratio <= 0.0 || limits.warning_ratio > 1.0) {
            throw std::runtime_error("Config field 'resources.warning_ratio' must be in (0, 1]");
        }
    }

    if (const auto* s = section(doc, "chunking", "chunking")) {
        auto& c = config.chunking;
        read_size(*s, "initial_size", "chunking.", c.initial_size);
        read_size(*s, "min_size", "chunking.", c.min_size);
        read_size(*s, "max_size", "chunking.", c.max_size);
        read_size(*s, "overlap", "chunking.", c.overlap);
        read_number(*s, "factor", "chunking.", c.factor);
        read_number(*s, "target_memory_percent", "chunking.", c.target_memory_percent);
        read_size(*s, "read_buffer", "chunking.", c.read_buffer);
    }

    if (const auto* s = section(doc, "scheduler", "scheduler")) {
        auto& run = config.scheduler.run;
        read_size(*s, "max_parallel_paths", "scheduler.", run.max_parallel_paths);
        read_number(*s, "timeout_multiplier", "scheduler.", run.timeout_multiplier);
        read_millis(*s, "poll_interval_ms", "scheduler.", run.poll_interval);
        read_bool(*s, "cancel_on_pressure", "scheduler.", run.cancel_on_pressure);
        read_string(*s, "progress_template", "scheduler.", run.progress_template);
        if (run.timeout_multiplier <= 0.0) {
            throw std::runtime_error("Config field 'scheduler.timeout_multiplier' must be > 0");
        }
        if (const auto* p = section(*s, "priorities", "scheduler.priorities")) {
            auto& w = config.scheduler.priorities;
            read_number(*p, "critical_path_bonus", "scheduler.priorities.", w.critical_path_bonus);
            read_number(*p, "dependent_bonus", "scheduler.priorities.", w.dependent_bonus);
            read_number(*p, "risk_weight", "scheduler.priorities.", w.risk_weight);
            read_number(*p, "influence_bonus", "scheduler.priorities.", w.influence_bonus);
        }
    }

    if (const auto* s = section(doc, "recovery", "recovery")) {
        read_size(*s, "subdivide_parts", "recovery.", config.recovery.subdivide_parts);
        if (s->contains("default") && !(*s)["default"].is_null()) {
            config.recovery.default_policy = parse_recovery_policy((*s)["default"], "recovery.default");
        }
        // 按错误码或类别覆盖默认策略
        if (const auto* policies = section(*s, "policies", "recovery.policies")) {
            for (const auto& [key, value] : policies->items()) {
                config.recovery.policies[key] = parse_recovery_policy(value, "recovery.policies." + key);
            }
        }
    }

    if (const auto* s = section(doc, "branches", "branches")) {
        auto& b = config.branches;
        if (const auto* w = section(*s, "weights", "branches.weights")) {
            read_number(*w, "quality", "branches.weights.", b.weights.quality);
            read_number(*w, "functionality", "branches.weights.", b.weights.functionality);
            read_number(*w, "performance", "branches.weights.", b.weights.performance);
            read_number(*w, "maintainability", "branches.weights.", b.weights.maintainability);
        }
        std::string strategy;
        read_string(*s, "merge_strategy", "branches.", strategy);
        if (strategy == "single") {
            b.merge_strategy = MergeStrategy::SINGLE_BRANCH;
        } else if (strategy == "selective") {
            b.merge_strategy = MergeStrategy::SELECTIVE;
        } else if (!strategy.empty()) {
            throw std::runtime_error("Config field 'branches.merge_strategy' must be single or selective");
        }
        read_bool(*s, "prefer_higher_score", "branches.", b.prefer_higher_score);
        read_optional_string(*s, "directory", "branches.", b.directory);
    }

    return config;
}

OrchestratorConfig parse_config(const std::string& yaml_text) {
    return config_from_json(parse_yaml(yaml_text));
}

OrchestratorConfig load_config(const std::string& path) {
    return config_from_json(load_yaml_file(path));
}

} // namespace blockflow
