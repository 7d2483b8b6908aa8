// modules/hooks/hook_dispatcher.h
#ifndef SWARMFLOW_MODULES_HOOKS_HOOK_DISPATCHER_H
#define SWARMFLOW_MODULES_HOOKS_HOOK_DISPATCHER_H

#include "modules/hooks/hook_registry.h"
#include "core/types/hook.h"
#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace swarmflow {

// 每个生命周期点的聚合时间预算
struct HookBudgets {
    std::chrono::milliseconds on_request_submit{500};
    std::chrono::milliseconds on_resource_mutated{100}; // 每次 dispatch
    std::chrono::milliseconds on_workflow_stop{5000};

    std::chrono::milliseconds budget_for(HookPoint point) const;
};

struct DispatchSummary {
    HookPoint point = HookPoint::ON_REQUEST_SUBMIT;
    std::vector<HookResult> results;  // 与注册顺序对齐，长度 == 注册数
    std::vector<Context> patches;     // 按执行顺序收集的 state patch
    Context merged_patch = Context::object(); // last-write-wins 合并结果
    bool blocking_failure = false;    // 仅 OnWorkflowStop
    std::vector<std::string> warnings;
    std::chrono::milliseconds elapsed{0};

    const HookResult* find(const std::string& hook_name) const;
};

using HookObserver = std::function<void(HookPoint, const HookResult&)>;

class HookDispatcher {
public:
    explicit HookDispatcher(const HookRegistry& registry, HookBudgets budgets = {});

    // 从不抛出单个 hook 的故障
    DispatchSummary dispatch(HookPoint point, const HookContext& ctx) const;

    void set_observer(HookObserver observer) { observer_ = std::move(observer); }
    const HookBudgets& budgets() const { return budgets_; }

private:
    // 在独立线程上执行，等待至多 timeout；超时后线程被放弃，结果丢弃
    static HookResult run_with_timeout(const std::shared_ptr<Hook>& hook, const HookContext& ctx,
                                       std::chrono::milliseconds timeout);

    const HookRegistry& registry_;
    HookBudgets budgets_;
    HookObserver observer_;
};

} // namespace swarmflow

#endif // SWARMFLOW_MODULES_HOOKS_HOOK_DISPATCHER_H
