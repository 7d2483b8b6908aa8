// modules/swarm/budget_controller.h
#ifndef SWARMFLOW_MODULES_SWARM_BUDGET_CONTROLLER_H
#define SWARMFLOW_MODULES_SWARM_BUDGET_CONTROLLER_H

#include "core/types/budget.h" // 引入 SwarmBudget (已包含 atomic 计数器)
#include "core/types/workflow.h"
#include "modules/swarm/worker.h"
#include <deque>
#include <string>
#include <vector>

namespace swarmflow {

struct WavePlan {
    std::deque<WorkUnit> units;         // 依次按 ceiling 取出组成波次
    std::vector<AgentTask> deferred;    // 推迟到后续阶段的非关键任务
    std::vector<std::string> actions;   // 预算动作说明
};

// BudgetController 封装了并发上限与上下文压力的检查逻辑
class BudgetController {
public:
    explicit BudgetController(SwarmBudget budget = SwarmBudget());

    // 单 agent 阶段为 1；节约模式下减半
    int ceiling_for(const Phase& phase) const;

    // 超过 ceiling 时依次：合并相关资源任务 -> 推迟非关键任务 -> 分批
    WavePlan plan(std::vector<AgentTask> tasks, int ceiling, bool allow_defer) const;

    // 按父目录把任务合并进同一个 worker
    static size_t merge_related(std::deque<WorkUnit>& units, std::vector<std::string>& actions);

    void count_iteration() { budget_.count_iteration(); }
    void count_spawn() { budget_.count_spawn(); }
    void count_log_bytes(size_t n) { budget_.count_log_bytes(n); }

    // 越过任一阈值即进入节约模式；返回 true 表示本次刚进入
    bool check_pressure();
    bool conservation_mode() const { return conservation_; }

    const SwarmBudget& budget() const { return budget_; }

private:
    SwarmBudget budget_;
    bool conservation_ = false;
};

} // namespace swarmflow

#endif // SWARMFLOW_MODULES_SWARM_BUDGET_CONTROLLER_H
