// common/hooks/handler_registry.h
#ifndef SWARMFLOW_COMMON_HOOKS_HANDLER_REGISTRY_H
#define SWARMFLOW_COMMON_HOOKS_HANDLER_REGISTRY_H

#include "core/types/hook.h"
#include <string>
#include <unordered_map>
#include <functional>
#include <vector>
#include <mutex>
#include <nlohmann/json.hpp>

namespace swarmflow {

// YAML 中声明的 hook 通过名字绑定到这里注册的处理函数
using HookHandler = std::function<HookResult(const HookContext&, const nlohmann::json& params)>;

class HookHandlerRegistry {
public:
    HookHandlerRegistry(); // 构造时注册内置处理函数

    template<typename Func>
    void register_handler(std::string name, Func&& func) {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_[std::move(name)] = std::forward<Func>(func);
    }

    bool has_handler(const std::string& name) const;
    HookResult call_handler(const std::string& name, const HookContext& ctx, const nlohmann::json& params) const;
    std::vector<std::string> list_handlers() const;

private:
    void register_builtin_handlers();

    mutable std::mutex mutex_;
    std::unordered_map<std::string, HookHandler> handlers_;
};

} // namespace swarmflow

#endif // SWARMFLOW_COMMON_HOOKS_HANDLER_REGISTRY_H
