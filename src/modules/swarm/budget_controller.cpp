// modules/swarm/budget_controller.cpp
#include "modules/swarm/budget_controller.h"
#include "common/utils/text_match.h"
#include "common/log/logger.h"
#include <algorithm>
#include <map>

namespace swarmflow {

namespace {

WorkUnit single(AgentTask task) {
    WorkUnit u;
    u.worker_id = task.id;
    u.tasks.push_back(std::move(task));
    return u;
}

// 所有资源同属一个父目录时返回该目录，否则 ""
std::string unit_group(const WorkUnit& unit) {
    std::string group;
    for (const auto& r : unit.resources()) {
        std::string g = resource_group(r);
        if (g.empty()) return "";
        if (group.empty()) {
            group = g;
        } else if (group != g) {
            return "";
        }
    }
    return group;
}

} // namespace

BudgetController::BudgetController(SwarmBudget budget) : budget_(std::move(budget)) {}

int BudgetController::ceiling_for(const Phase& phase) const {
    int ceiling = phase.ownership == OwnershipModel::SINGLE_AGENT ? 1 : std::max(1, budget_.max_concurrent_workers);
    if (conservation_) ceiling = std::max(1, ceiling / 2);
    return ceiling;
}

size_t BudgetController::merge_related(std::deque<WorkUnit>& units, std::vector<std::string>& actions) {
    std::map<std::string, std::vector<size_t>> groups;
    for (size_t i = 0; i < units.size(); ++i) {
        std::string g = unit_group(units[i]);
        if (!g.empty()) groups[g].push_back(i);
    }

    std::vector<bool> absorbed(units.size(), false);
    size_t merged = 0;
    for (const auto& [group, members] : groups) {
        if (members.size() < 2) continue;
        WorkUnit& head = units[members.front()];
        size_t before = head.tasks.size();
        for (size_t k = 1; k < members.size(); ++k) {
            auto& other = units[members[k]];
            for (auto& t : other.tasks) head.tasks.push_back(std::move(t));
            absorbed[members[k]] = true;
        }
        head.worker_id = group + "/*";
        merged += members.size() - 1;
        actions.push_back("merged " + std::to_string(head.tasks.size()) + " tasks under '" + group +
                          "' into one worker (was " + std::to_string(before) + ")");
    }

    if (merged > 0) {
        std::deque<WorkUnit> kept;
        for (size_t i = 0; i < units.size(); ++i) {
            if (!absorbed[i]) kept.push_back(std::move(units[i]));
        }
        units = std::move(kept);
    }
    return merged;
}

WavePlan BudgetController::plan(std::vector<AgentTask> tasks, int ceiling, bool allow_defer) const {
    WavePlan plan;
    for (auto& t : tasks) plan.units.push_back(single(std::move(t)));
    const size_t limit = static_cast<size_t>(std::max(1, ceiling));

    // 节约模式偏向更少、更大的 worker
    if (plan.units.size() > limit || conservation_) {
        merge_related(plan.units, plan.actions);
    }

    if (plan.units.size() > limit && allow_defer) {
        // 从末尾开始挑选要推迟的单元，保持其余任务的顺序
        std::vector<bool> defer(plan.units.size(), false);
        size_t excess = plan.units.size() - limit;
        for (size_t i = plan.units.size(); i-- > 0 && excess > 0;) {
            if (!plan.units[i].critical()) {
                defer[i] = true;
                --excess;
            }
        }
        std::deque<WorkUnit> kept;
        for (size_t i = 0; i < plan.units.size(); ++i) {
            if (!defer[i]) {
                kept.push_back(std::move(plan.units[i]));
                continue;
            }
            for (auto& t : plan.units[i].tasks) {
                t.status = TaskStatus::DEFERRED;
                plan.deferred.push_back(std::move(t));
            }
        }
        plan.units = std::move(kept);
        if (!plan.deferred.empty()) {
            plan.actions.push_back("deferred " + std::to_string(plan.deferred.size()) + " non-critical task(s) to a later phase");
        }
    }

    if (plan.units.size() > limit) {
        size_t batches = (plan.units.size() + limit - 1) / limit;
        plan.actions.push_back("reduced parallelism: " + std::to_string(plan.units.size()) + " workers in " +
                               std::to_string(batches) + " sequential batches of at most " + std::to_string(limit));
    }

    for (const auto& a : plan.actions) {
        log::logger()->info("Budget control: {}", a);
    }
    return plan;
}

bool BudgetController::check_pressure() {
    if (conservation_ || !budget_.pressure_exceeded()) return false;
    conservation_ = true;
    log::logger()->warn("Context pressure: entering conservation mode (iterations {}, workers {}, log bytes {})",
                        budget_.iterations_used.load(), budget_.workers_spawned.load(), budget_.log_bytes_used.load());
    return true;
}

} // namespace swarmflow
