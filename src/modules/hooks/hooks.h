// modules/hooks/hooks.h
#ifndef SWARMFLOW_MODULES_HOOKS_HOOKS_H
#define SWARMFLOW_MODULES_HOOKS_HOOKS_H

#include "core/types/hook.h"
#include "common/hooks/handler_registry.h"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <string>

namespace swarmflow {

using HookFunction = std::function<HookResult(const HookContext&)>;
using HookPredicate = std::function<bool(const HookContext&)>;

// 外部 provider 以 (context) -> HookResult 形式注册
class FunctionHook : public Hook {
public:
    FunctionHook(std::string name, int priority, std::chrono::milliseconds timeout,
                 HookFunction fn, HookPredicate predicate = {}, bool blocking = false);

    std::string name() const override { return name_; }
    int priority() const override { return priority_; }
    std::chrono::milliseconds timeout() const override { return timeout_; }
    bool blocking() const override { return blocking_; }
    bool should_run(const HookContext& ctx) const override;
    HookResult run(const HookContext& ctx) override;

private:
    std::string name_;
    int priority_;
    std::chrono::milliseconds timeout_;
    HookFunction fn_;
    HookPredicate predicate_;
    bool blocking_;
};

// YAML 中 hooks.declared 的一项
struct HookDeclaration {
    std::string name;
    HookPoint point = HookPoint::ON_REQUEST_SUBMIT;
    int priority = 100;
    std::chrono::milliseconds timeout{100};
    bool blocking = false;
    std::string when;    // inja 布尔表达式，空表示总是执行
    std::string handler; // HookHandlerRegistry 中的名字
    nlohmann::json params = nlohmann::json::object();

    static HookDeclaration from_json(const nlohmann::json& j);
};

class DeclaredHook : public Hook {
public:
    DeclaredHook(HookDeclaration decl, std::shared_ptr<const HookHandlerRegistry> handlers);

    std::string name() const override { return decl_.name; }
    int priority() const override { return decl_.priority; }
    std::chrono::milliseconds timeout() const override { return decl_.timeout; }
    bool blocking() const override { return decl_.blocking; }
    bool should_run(const HookContext& ctx) const override;
    HookResult run(const HookContext& ctx) override;

    const HookDeclaration& declaration() const { return decl_; }

private:
    HookDeclaration decl_;
    std::shared_ptr<const HookHandlerRegistry> handlers_;
};

} // namespace swarmflow

#endif // SWARMFLOW_MODULES_HOOKS_HOOKS_H
