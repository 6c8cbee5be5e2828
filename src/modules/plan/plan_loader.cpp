// modules/plan/plan_loader.cpp
#include "modules/plan/plan_loader.h"
#include "common/utils/yaml_json.h"
#include "core/types/errors.h"
#include <set>
#include <stdexcept>

namespace blockflow {

namespace {

const nlohmann::json& require(const nlohmann::json& obj, const char* key, const std::string& where) {
    if (!obj.contains(key)) {
        throw std::runtime_error("Missing '" + std::string(key) + "' in " + where);
    }
    return obj[key];
}

std::string string_field(const nlohmann::json& obj, const char* key, const std::string& where,
                         const std::string& fallback = {}) {
    if (!obj.contains(key) || obj[key].is_null()) return fallback;
    if (!obj[key].is_string()) {
        throw std::runtime_error("'" + std::string(key) + "' must be a string in " + where);
    }
    return obj[key].get<std::string>();
}

double number_field(const nlohmann::json& obj, const char* key, const std::string& where, double fallback) {
    if (!obj.contains(key) || obj[key].is_null()) return fallback;
    if (!obj[key].is_number()) {
        throw std::runtime_error("'" + std::string(key) + "' must be a number in " + where);
    }
    return obj[key].get<double>();
}

bool bool_field(const nlohmann::json& obj, const char* key, const std::string& where, bool fallback) {
    if (!obj.contains(key) || obj[key].is_null()) return fallback;
    if (!obj[key].is_boolean()) {
        throw std::runtime_error("'" + std::string(key) + "' must be a boolean in " + where);
    }
    return obj[key].get<bool>();
}

// Accepts a single string or a list of strings.
std::vector<std::string> string_list(const nlohmann::json& obj, const char* key, const std::string& where) {
    std::vector<std::string> out;
    if (!obj.contains(key) || obj[key].is_null()) return out;
    const auto& v = obj[key];
    if (v.is_string()) {
        out.push_back(v.get<std::string>());
        return out;
    }
    if (!v.is_array()) {
        throw std::runtime_error("'" + std::string(key) + "' must be string or array in " + where);
    }
    for (const auto& item : v) {
        if (!item.is_string()) {
            throw std::runtime_error("'" + std::string(key) + "' entries must be strings in " + where);
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

ExecutionStep parse_step(const nlohmann::json& step_json, const std::string& where) {
    if (!step_json.is_object()) {
        throw std::runtime_error("Step must be a mapping in " + where);
    }
    ExecutionStep step;
    step.id = require(step_json, "id", where).is_string() ? step_json["id"].get<std::string>() : "";
    if (step.id.empty()) {
        throw std::runtime_error("'id' must be a non-empty string in " + where);
    }
    step.description = string_field(step_json, "description", where);
    if (step_json.contains("parameters") && !step_json["parameters"].is_null()) {
        if (!step_json["parameters"].is_object()) {
            throw std::runtime_error("'parameters' must be a mapping in step " + step.id);
        }
        step.parameters = step_json["parameters"];
    }
    step.optional = bool_field(step_json, "optional", "step " + step.id, false);
    return step;
}

ImplementationBlock parse_block(const nlohmann::json& block_json) {
    if (!block_json.is_object()) {
        throw std::runtime_error("Each entry of 'blocks' must be a mapping");
    }
    const auto& id = require(block_json, "id", "block");
    if (!id.is_string() || id.get<std::string>().empty()) {
        throw std::runtime_error("Block 'id' must be a non-empty string");
    }

    ImplementationBlock block;
    block.id = id.get<std::string>();
    const std::string where = "block " + block.id;
    block.description = string_field(block_json, "description", where);
    block.priority = number_field(block_json, "priority", where, 0.0);
    block.risk_factor = number_field(block_json, "risk", where, 0.0);
    block.security_critical = bool_field(block_json, "security_critical", where, false);

    const double effort = number_field(block_json, "effort_ms", where, 0.0);
    if (effort < 0.0) {
        throw std::runtime_error("'effort_ms' must not be negative in " + where);
    }
    block.estimated_effort = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(effort));

    if (block_json.contains("steps") && !block_json["steps"].is_null()) {
        if (!block_json["steps"].is_array()) {
            throw std::runtime_error("'steps' must be an array in " + where);
        }
        std::set<std::string> step_ids;
        for (const auto& s : block_json["steps"]) {
            ExecutionStep step = parse_step(s, where);
            if (!step_ids.insert(step.id).second) {
                throw std::runtime_error("Duplicate step id '" + step.id + "' in " + where);
            }
            block.steps.push_back(std::move(step));
        }
    }
    block.validation_criteria = string_list(block_json, "validation", where);
    return block;
}

BlockDependency parse_dependency(const nlohmann::json& dep_json) {
    if (!dep_json.is_object()) {
        throw std::runtime_error("Each entry of 'dependencies' must be a mapping");
    }
    BlockDependency dep;
    dep.block = string_field(dep_json, "block", "dependency");
    dep.prerequisite = string_field(dep_json, "requires", "dependency");
    if (dep.block.empty() || dep.prerequisite.empty()) {
        throw std::runtime_error("Dependency needs non-empty 'block' and 'requires'");
    }
    const std::string kind = string_field(dep_json, "kind", "dependency " + dep.block, "required_before");
    dep.kind = parse_dependency_kind(kind);
    return dep;
}

} // namespace

Plan PlanLoader::parse_from_json(const nlohmann::json& doc) const {
    if (!doc.is_object()) {
        throw std::runtime_error("Plan document must be a mapping");
    }

    Plan plan;
    std::set<BlockId> ids;
    if (doc.contains("blocks") && !doc["blocks"].is_null()) {
        if (!doc["blocks"].is_array()) {
            throw std::runtime_error("'blocks' must be an array");
        }
        for (const auto& b : doc["blocks"]) {
            ImplementationBlock block = parse_block(b);
            if (!ids.insert(block.id).second) {
                throw OrchestrationError(StructuralError{StructuralError::Kind::DUPLICATE_BLOCK,
                                                         "duplicate block id '" + block.id + "'", {}});
            }
            for (const auto& prerequisite : string_list(b, "depends_on", "block " + block.id)) {
                plan.dependencies.push_back(BlockDependency{block.id, prerequisite, DependencyKind::REQUIRED_BEFORE});
            }
            plan.blocks.push_back(std::move(block));
        }
    }

    if (doc.contains("dependencies") && !doc["dependencies"].is_null()) {
        if (!doc["dependencies"].is_array()) {
            throw std::runtime_error("'dependencies' must be an array");
        }
        for (const auto& d : doc["dependencies"]) {
            plan.dependencies.push_back(parse_dependency(d));
        }
    }
    return plan;
}

Plan PlanLoader::parse_from_string(const std::string& yaml_content) const {
    return parse_from_json(parse_yaml(yaml_content));
}

Plan PlanLoader::parse_from_file(const std::string& file_path) const {
    return parse_from_json(load_yaml_file(file_path));
}

nlohmann::json plan_to_json(const std::vector<ImplementationBlock>& blocks,
                            const std::vector<BlockDependency>& dependencies) {
    nlohmann::json doc;
    doc["blocks"] = nlohmann::json::array();
    for (const auto& block : blocks) {
        nlohmann::json steps = nlohmann::json::array();
        for (const auto& step : block.steps) {
            steps.push_back({
                {"id", step.id},
                {"description", step.description},
                {"parameters", step.parameters},
                {"optional", step.optional}
            });
        }
        doc["blocks"].push_back({
            {"id", block.id},
            {"description", block.description},
            {"priority", block.priority},
            {"risk", block.risk_factor},
            {"security_critical", block.security_critical},
            {"effort_ms", block.estimated_effort.count()},
            {"steps", steps},
            {"validation", block.validation_criteria}
        });
    }
    doc["dependencies"] = nlohmann::json::array();
    for (const auto& dep : dependencies) {
        doc["dependencies"].push_back({
            {"block", dep.block},
            {"requires", dep.prerequisite},
            {"kind", to_string(dep.kind)}
        });
    }
    return doc;
}

} // namespace blockflow
