#ifndef BLOCKFLOW_COMMON_UTILS_YAML_JSON_H
#define BLOCKFLOW_COMMON_UTILS_YAML_JSON_H

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include <string>

namespace blockflow {

// 将 YAML::Node 转换为 nlohmann::json
nlohmann::json yaml_to_json(const YAML::Node& node);

// Parses a YAML document; throws std::runtime_error with the parser position on malformed input.
nlohmann::json parse_yaml(const std::string& text);
nlohmann::json load_yaml_file(const std::string& path);

} // namespace blockflow

#endif // BLOCKFLOW_COMMON_UTILS_YAML_JSON_H
