#ifndef SWARMFLOW_TYPES_CONTEXT_H
#define SWARMFLOW_TYPES_CONTEXT_H

#include <nlohmann/json.hpp>
#include <cstdint>

namespace swarmflow {

// 使用 nlohmann::json 作为统一的数据类型
using Value = nlohmann::json;
using Context = nlohmann::json;

// 显式传递的会话状态（替代全局可变状态），每次合并 version + 1
struct SessionState {
    Context data = Context::object();
    uint64_t version = 0;
};

} // namespace swarmflow

#endif // SWARMFLOW_TYPES_CONTEXT_H
