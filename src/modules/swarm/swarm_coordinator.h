// modules/swarm/swarm_coordinator.h
#ifndef SWARMFLOW_MODULES_SWARM_SWARM_COORDINATOR_H
#define SWARMFLOW_MODULES_SWARM_SWARM_COORDINATOR_H

#include "modules/swarm/budget_controller.h"
#include "modules/swarm/worker.h"
#include "core/types/task.h"
#include "core/types/workflow.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace swarmflow {

struct SwarmConfig {
    std::chrono::milliseconds grace_period{30000}; // 无进度超过该时长视为卡死
    std::chrono::milliseconds poll_interval{10};
    int max_concurrent_workers = 20;
    int max_replacements_per_task = 2;
    size_t summary_limit = 160; // 节约模式下的摘要长度
    // 上下文压力阈值，-1 / 0 表示不限
    int max_iterations = -1;
    int max_spawned_workers = -1;
    size_t max_log_bytes = 0;
    bool defer_non_critical = true;
};

// (PhaseResult) -> task_id -> verdict
using VerificationProvider = std::function<VerificationReport(const PhaseResult&)>;
// 每个被修改的资源回调一次，返回 OnResourceMutated hook 结果
using MutationObserver = std::function<std::vector<HookResult>(const std::string& resource, const TaskResult&)>;
using SwarmEventEmitter = std::function<void(const std::string& type, const nlohmann::json& data)>;

class AgentSwarmCoordinator {
public:
    explicit AgentSwarmCoordinator(WorkerFunction worker, SwarmConfig config = {});

    void set_verifier(VerificationProvider verifier) { verifier_ = std::move(verifier); }
    void set_mutation_observer(MutationObserver observer) { mutation_observer_ = std::move(observer); }
    void set_event_emitter(SwarmEventEmitter emitter) { emit_ = std::move(emitter); }

    // 兄弟任务资源重叠时抛出 PlanningError；验证提供方出错不抛出，记录在 verification_error
    PhaseResult run_phase(const Phase& phase, std::vector<AgentTask> tasks, bool allow_defer = true);

    static void validate_disjoint(const std::vector<AgentTask>& tasks);
    static WorkerId replacement_id(const WorkerId& original, int n) { return original + "~r" + std::to_string(n); }
    static WorkerId fix_worker_id(const TaskId& task, int n) { return task + "~fix" + std::to_string(n); }

    bool conservation_mode() const { return budget_.conservation_mode(); }
    const SwarmBudget& budget() const { return budget_.budget(); }
    const SwarmConfig& config() const { return config_; }

private:
    struct ActiveWorker {
        WorkerId base_id;                    // 替换 id 由此派生
        std::vector<AgentTask> pending;      // 尚未回报的任务
        std::shared_ptr<WorkerSignals> signals;
        int replacements = 0;
    };

    // 启动一波 worker 并等待全部任务进入终态
    std::map<TaskId, TaskResult> run_wave(std::vector<WorkUnit> units, PhaseResult& phase_result);
    void spawn(const WorkerId& id, ActiveWorker& slot, std::optional<std::string> note,
               const std::shared_ptr<ResultChannel>& channel);
    void handle_stalls(std::map<WorkerId, ActiveWorker>& active, std::map<TaskId, TaskResult>& done,
                       PhaseResult& phase_result, const std::shared_ptr<ResultChannel>& channel);
    TaskResult make_result(const AgentTask& task, const WorkerId& worker, TaskOutput output);
    void dispatch_mutations(const TaskResult& result, PhaseResult& phase_result);
    void verify_and_fix(const Phase& phase, PhaseResult& result, std::map<TaskId, AgentTask>& tasks_by_id);
    void fail_verification(const Phase& phase, PhaseResult& result, const std::string& error);
    void emit(const std::string& type, const nlohmann::json& data) const;

    WorkerFunction worker_;
    SwarmConfig config_;
    BudgetController budget_;
    VerificationProvider verifier_;
    MutationObserver mutation_observer_;
    SwarmEventEmitter emit_;
};

} // namespace swarmflow

#endif // SWARMFLOW_MODULES_SWARM_SWARM_COORDINATOR_H
