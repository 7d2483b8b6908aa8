#ifndef SWARMFLOW_TYPES_WORKFLOW_H
#define SWARMFLOW_TYPES_WORKFLOW_H

#include "risk.h"
#include "errors.h"
#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstdint>

namespace swarmflow {

enum class WorkflowClass : uint8_t {
    DIRECT,            // 单阶段直接执行
    FIXED_MULTI_PHASE, // plan -> implement -> verify
    PHASE_BASED        // 阶段间显式 checkpoint
};

enum class OwnershipModel : uint8_t { SINGLE_AGENT, PARALLEL_SWARM };

enum class PhaseStatus : uint8_t { PENDING, IN_PROGRESS, COMPLETED, FAILED };

enum class WorkflowStatus : uint8_t {
    NOT_STARTED,
    RUNNING,
    AWAITING_CONFIRMATION,   // T3 门未确认
    AWAITING_ACKNOWLEDGMENT, // 阻塞型 Stop hook 失败
    ALL_PHASES_COMPLETED,
    ABORTED_FAILED
};

struct Phase {
    std::string name;
    OwnershipModel ownership = OwnershipModel::SINGLE_AGENT;
    VerificationLevel verification = VerificationLevel::NONE;
    bool checkpoint_after = false;
    bool independent = false; // 与下一阶段无依赖，可并发运行
};

struct WorkflowPlan {
    WorkflowClass workflow_class = WorkflowClass::PHASE_BASED;
    std::string label; // orchestrated / complete_system / taskit / aidevtasks
    std::vector<Phase> phases;
};

struct Transition {
    std::string from;
    std::string to;
    int phase_index = -1;
    std::chrono::system_clock::time_point at;
    std::string note;
};

struct Confirmation {
    int phase_index = -1;
    std::string operator_name;
    std::chrono::system_clock::time_point at;
};

// 单个请求的运行状态，由 Orchestrator 独占
struct WorkflowInstance {
    std::string id;
    std::string request_id;
    WorkflowPlan plan;
    WorkflowStatus status = WorkflowStatus::NOT_STARTED;
    std::vector<PhaseStatus> phase_status;
    std::vector<int> recovery_attempts;
    std::vector<bool> confirmation_required;
    std::vector<Confirmation> confirmations;
    int current_phase = -1;
    std::chrono::steady_clock::time_point started_at;
    std::chrono::milliseconds elapsed{0};
    std::vector<std::string> modified_resources;
    std::vector<ErrorRecord> error_log;
    std::vector<Transition> history;
    std::vector<std::string> warnings;
    std::optional<std::string> abort_reason;
};

const char* to_string(WorkflowClass c);
const char* to_string(OwnershipModel m);
const char* to_string(PhaseStatus s);
const char* to_string(WorkflowStatus s);

} // namespace swarmflow

#endif // SWARMFLOW_TYPES_WORKFLOW_H
