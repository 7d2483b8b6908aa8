// modules/workflow/workflow_state_machine.h
#ifndef SWARMFLOW_MODULES_WORKFLOW_WORKFLOW_STATE_MACHINE_H
#define SWARMFLOW_MODULES_WORKFLOW_WORKFLOW_STATE_MACHINE_H

#include "core/types/workflow.h"
#include <string>
#include <vector>

namespace swarmflow {

// 阶段完成时提交的验证证据
struct PhaseEvidence {
    bool verification_ran = false;
    bool verification_passed = false;
    bool all_verdicts_explicit = false; // 每个任务都有明确 verdict
    bool security_checked = false;
    bool rollback_plan_recorded = false;
};

enum class FailureDecision : uint8_t {
    RECOVER,  // 还有恢复次数，调用 begin_recovery()
    ESCALATE  // 次数用尽，调用 replan_reduced_scope() 或 abort()
};

// 单个 WorkflowInstance 的阶段状态机；instance 由 Orchestrator 持有
class WorkflowStateMachine {
public:
    explicit WorkflowStateMachine(WorkflowInstance& instance, int max_recovery_attempts = 2);

    void start();

    // 验证要求未满足时抛出 InvalidTransition；
    // 含 T3 任务且未确认时返回 AWAITING_CONFIRMATION，阶段保持 in_progress
    WorkflowStatus complete_phase(const PhaseEvidence& evidence);

    FailureDecision fail_phase(const std::string& reason, ErrorKind kind = ErrorKind::VERIFICATION_FAILURE,
                               const std::string& task_id = "");

    // failed -> in_progress，只做针对性修复，不重跑已完成阶段
    void begin_recovery();

    // 恢复次数用尽后丢弃非关键任务重新规划；每个阶段只允许一次
    void replan_reduced_scope(const std::vector<std::string>& dropped_tasks);

    void require_confirmation(int phase_index);
    void record_confirmation(int phase_index, const std::string& operator_name);
    bool is_confirmed(int phase_index) const;

    // 追加一个 pending 阶段（例如承接被推迟任务的 follow_up 阶段）
    int append_phase(const Phase& phase);

    void abort(const std::string& reason);

    // 阻塞型 Stop hook 失败：完成态挂起，等待操作员确认
    void await_acknowledgment(const std::string& warning);
    void acknowledge(const std::string& operator_name);

    void add_modified_resources(const std::vector<std::string>& resources);
    void log_error(ErrorRecord record);
    void note(const std::string& text); // 追加一条不改变状态的历史记录

    WorkflowStatus status() const { return instance_.status; }
    PhaseStatus phase_status(int index) const;
    int current_phase() const { return instance_.current_phase; }
    bool is_terminal() const;
    bool can_recover() const;
    bool replanned(int index) const;
    const std::vector<Transition>& history() const { return instance_.history; }
    const WorkflowInstance& instance() const { return instance_; }

    static bool requirement_satisfied(VerificationLevel level, const PhaseEvidence& evidence, std::string* missing = nullptr);

private:
    void check_index(int index) const;
    void require_status(std::initializer_list<WorkflowStatus> allowed, const char* operation) const;
    void require_current(PhaseStatus expected, const char* operation) const;
    void set_status(WorkflowStatus to, const std::string& note);
    void set_phase(int index, PhaseStatus to, const std::string& note);
    void touch();

    WorkflowInstance& instance_;
    int max_recovery_attempts_;
    std::vector<bool> replanned_;
};

} // namespace swarmflow

#endif // SWARMFLOW_MODULES_WORKFLOW_WORKFLOW_STATE_MACHINE_H
