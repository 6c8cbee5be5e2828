#ifndef BLOCKFLOW_TYPES_CONTEXT_H
#define BLOCKFLOW_TYPES_CONTEXT_H

#include <nlohmann/json.hpp>

namespace blockflow {

// 使用 nlohmann::json 作为统一的数据类型
using Value = nlohmann::json;
using State = nlohmann::json; // serialized orchestration state (checkpoint blob)

} // namespace blockflow

#endif // BLOCKFLOW_TYPES_CONTEXT_H
