// swarmflow/core/orchestrator.h
#ifndef SWARMFLOW_CORE_ORCHESTRATOR_H
#define SWARMFLOW_CORE_ORCHESTRATOR_H

#include "modules/classifier/request_classifier.h"
#include "modules/config/engine_config.h"
#include "modules/context/context_engine.h"
#include "modules/hooks/hook_dispatcher.h"
#include "modules/hooks/hook_registry.h"
#include "modules/hooks/hooks.h"
#include "modules/risk/risk_classifier.h"
#include "modules/session/session_store.h"
#include "modules/swarm/swarm_coordinator.h"
#include "modules/trace/event_trace.h"
#include "modules/workflow/workflow_state_machine.h"
#include "common/hooks/handler_registry.h"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace swarmflow {

struct WorkflowReport {
    std::string instance_id;
    std::string request_id;
    WorkflowStatus status = WorkflowStatus::NOT_STARTED;
    WorkflowClass workflow_class = WorkflowClass::PHASE_BASED;
    std::string workflow_label;
    Score score;
    RiskTier risk_tier = RiskTier::T0;
    std::string risk_reason;
    std::string task_type;
    double confidence = 0.0;
    std::string rule;
    std::vector<std::string> decision_factors;
    std::vector<PhaseResult> phases; // 按计划顺序
    std::vector<std::string> modified_resources;
    std::vector<std::string> recovered; // 内部已恢复的错误，仅做摘要
    std::vector<std::string> follow_up_checks;
    std::vector<std::string> warnings;
    std::optional<std::string> abort_reason;
    std::optional<std::string> awaiting_phase; // 等待人工确认的阶段
    std::string summary;                       // OnWorkflowStop hook 给出的总结
    std::optional<std::string> rendered;       // report_template 渲染结果
    std::chrono::milliseconds elapsed{0};

    nlohmann::json to_json() const;
};

// (request, phase, phase index) -> 该阶段的任务；资源集必须两两不相交
using TaskPlanner = std::function<std::vector<AgentTask>(const Request&, const Phase&, int)>;
// 返回确认人；nullopt 表示暂不确认，工作流停在 AWAITING_CONFIRMATION
using ConfirmationProvider =
    std::function<std::optional<std::string>(const WorkflowInstance&, int phase_index, const PhaseResult&)>;

class Orchestrator {
public:
    explicit Orchestrator(WorkerFunction worker, EngineConfig config = {},
                          std::shared_ptr<HookHandlerRegistry> handlers = nullptr);

    static std::unique_ptr<Orchestrator> from_config_file(const std::string& path, WorkerFunction worker,
                                                          std::shared_ptr<HookHandlerRegistry> handlers = nullptr);

    // 分类 -> OnRequestSubmit -> 逐阶段执行 -> OnWorkflowStop
    WorkflowReport submit(const Request& request);

    // T3 确认门：记录确认后继续执行
    WorkflowReport resume_with_confirmation(const std::string& instance_id, const std::string& operator_name);

    // 阻塞型 Stop hook 失败后的操作员确认
    WorkflowReport acknowledge(const std::string& instance_id, const std::string& operator_name);

    void register_hook(HookPoint point, std::shared_ptr<Hook> hook);
    void register_declared_hook(const HookDeclaration& decl);

    template<typename Func>
    void register_hook_handler(std::string name, Func&& func) {
        handlers_->register_handler(std::move(name), std::forward<Func>(func));
    }

    void set_task_planner(TaskPlanner planner) { planner_ = std::move(planner); }
    void set_verifier(VerificationProvider verifier) { verifier_ = std::move(verifier); }
    void set_confirmation_provider(ConfirmationProvider provider) { confirm_ = std::move(provider); }
    void set_event_sink(EventSink sink) { trace_.set_sink(std::move(sink)); }

    std::optional<WorkflowInstance> instance(const std::string& instance_id) const;
    std::vector<TraceEvent> events(const std::string& instance_id) const { return trace_.events(instance_id); }
    const EventTrace& trace() const { return trace_; }
    SessionStore& session() { return session_; }
    const ContextEngine& checkpoints() const { return checkpoints_; }
    RequestClassifier& classifier() { return classifier_; }
    const EngineConfig& config() const { return config_; }

    static std::vector<AgentTask> default_plan(const Request& request, const Phase& phase, int phase_index);

private:
    struct GateOutcome {
        std::vector<AgentTask> tasks;
        std::vector<ErrorRecord> dropped;   // 被丢弃的非关键任务及原因
        std::optional<std::string> blocked; // 关键任务被阻断
        bool requires_confirmation = false;
        bool rollback_recorded = true;
    };

    struct Prefetched {
        GateOutcome gate;
        PhaseResult result;
    };

    struct InstanceRun {
        Request request;
        ClassificationResult classification;
        WorkflowInstance instance;
        std::unique_ptr<WorkflowStateMachine> machine;
        std::unique_ptr<AgentSwarmCoordinator> coordinator;
        std::unique_ptr<AgentSwarmCoordinator> side_coordinator; // 独立阶段并发时使用
        std::map<int, std::vector<AgentTask>> phase_tasks; // 通过风险门的任务，恢复时按 id 取回
        std::map<int, PhaseResult> results;
        std::map<int, std::vector<AgentTask>> carried; // 被推迟的任务 -> 目标阶段
        std::map<int, Prefetched> prefetched;
        std::map<int, std::set<std::string>> dropped;
        std::map<int, bool> rollback_recorded;
        std::optional<PhaseEvidence> pending_evidence;
        std::optional<int> follow_up_index;
        std::vector<std::string> recovered;
        std::vector<std::string> follow_up_checks;
        std::string summary;
        size_t synced_history = 0;
        bool finished = false;
    };

    InstanceRun& run_of(const std::string& instance_id);
    std::unique_ptr<AgentSwarmCoordinator> make_coordinator(const std::string& instance_id);

    void drive(InstanceRun& run);
    GateOutcome gate_phase(InstanceRun& run, int index);
    bool apply_gate(InstanceRun& run, int index, const GateOutcome& gate);
    PhaseResult run_swarm(InstanceRun& run, AgentSwarmCoordinator& coordinator, int index,
                          std::vector<AgentTask> tasks);
    void commit_phase(InstanceRun& run, int index, PhaseResult result);
    void absorb(InstanceRun& run, int index, const PhaseResult& piece);
    // 不可恢复的验证失败：保留阶段结果并中止
    void escalate(InstanceRun& run, int index, PhaseResult result, const std::string& reason);
    void record_hook_faults(InstanceRun& run, HookPoint point, const std::vector<HookResult>& results, int index);
    void carry_deferred(InstanceRun& run, int index, const std::vector<AgentTask>& deferred);
    PhaseEvidence evidence_for(const InstanceRun& run, int index, const PhaseResult& result) const;
    std::vector<TaskId> failing_tasks(const InstanceRun& run, int index, const PhaseResult& result) const;
    static void merge_retry(PhaseResult& result, PhaseResult retry);
    void checkpoint(InstanceRun& run, int index);
    void finish(InstanceRun& run);
    void sync_session(InstanceRun& run);
    WorkflowReport make_report(const InstanceRun& run) const;

    Context submit_context(const InstanceRun& run) const;
    Context stop_context(const InstanceRun& run) const;
    std::vector<HookResult> on_mutation(const std::string& instance_id, const std::string& resource,
                                        const TaskResult& result);
    void trace_hooks(const std::string& instance_id, const DispatchSummary& summary);

    WorkerFunction worker_;
    EngineConfig config_;
    std::shared_ptr<HookHandlerRegistry> handlers_;
    RequestClassifier classifier_;
    RiskClassifier risk_;
    HookRegistry hooks_;
    HookDispatcher dispatcher_;
    SessionStore session_;
    ContextEngine checkpoints_;
    EventTrace trace_;
    TaskPlanner planner_;
    VerificationProvider verifier_;
    ConfirmationProvider confirm_;

    mutable std::mutex runs_mutex_;
    std::mutex checkpoint_mutex_;
    std::map<std::string, std::unique_ptr<InstanceRun>> runs_;
    uint64_t next_instance_ = 1;
};

} // namespace swarmflow

#endif // SWARMFLOW_CORE_ORCHESTRATOR_H
