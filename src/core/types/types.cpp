// core/types/types.cpp
#include "core/types/errors.h"
#include "core/types/risk.h"
#include "core/types/workflow.h"
#include "core/types/task.h"
#include "core/types/hook.h"
#include <sstream>

namespace swarmflow {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INCOMPLETE_RISK_ASSESSMENT: return "IncompleteRiskAssessment";
        case ErrorKind::HOOK_FAULT: return "HookFault";
        case ErrorKind::WORKER_STALL: return "WorkerStall";
        case ErrorKind::VERIFICATION_FAILURE: return "VerificationFailure";
        case ErrorKind::BUDGET_EXCEEDED: return "BudgetExceeded";
        case ErrorKind::CONTEXT_PRESSURE: return "ContextPressure";
        case ErrorKind::PLANNING_ERROR: return "PlanningError";
        case ErrorKind::ABORTED: return "Aborted";
    }
    return "Unknown";
}

static std::string join_fields(const std::vector<std::string>& fields) {
    std::ostringstream oss;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << fields[i];
    }
    return oss.str();
}

IncompleteRiskAssessment::IncompleteRiskAssessment(const std::string& task_id,
                                                   std::vector<std::string> missing_fields)
    : Error(ErrorKind::INCOMPLETE_RISK_ASSESSMENT,
            "Incomplete risk assessment for task '" + task_id + "': missing " + join_fields(missing_fields)),
      task_id_(task_id),
      missing_fields_(std::move(missing_fields)) {}

const char* to_string(RiskTier tier) {
    switch (tier) {
        case RiskTier::T0: return "T0";
        case RiskTier::T1: return "T1";
        case RiskTier::T2: return "T2";
        case RiskTier::T3: return "T3";
    }
    return "T?";
}

const char* to_string(VerificationLevel level) {
    switch (level) {
        case VerificationLevel::NONE: return "none";
        case VerificationLevel::BASIC: return "basic";
        case VerificationLevel::FULL: return "full";
        case VerificationLevel::FULL_SECURITY_ROLLBACK: return "full+security+rollback";
    }
    return "unknown";
}

const char* to_string(ReviewType review) {
    switch (review) {
        case ReviewType::SELF: return "self";
        case ReviewType::PEER: return "peer";
        case ReviewType::SENIOR: return "senior";
        case ReviewType::TRIPLE: return "triple";
    }
    return "unknown";
}

const char* to_string(ApprovalMode mode) {
    switch (mode) {
        case ApprovalMode::AUTOMATIC: return "automatic";
        case ApprovalMode::REVIEW_REQUIRED: return "review_required";
        case ApprovalMode::HUMAN_CONFIRMATION: return "human_confirmation";
    }
    return "unknown";
}

const char* to_string(WorkflowClass c) {
    switch (c) {
        case WorkflowClass::DIRECT: return "direct";
        case WorkflowClass::FIXED_MULTI_PHASE: return "fixed_multi_phase";
        case WorkflowClass::PHASE_BASED: return "phase_based";
    }
    return "unknown";
}

const char* to_string(OwnershipModel m) {
    return m == OwnershipModel::SINGLE_AGENT ? "single_agent" : "parallel_swarm";
}

const char* to_string(PhaseStatus s) {
    switch (s) {
        case PhaseStatus::PENDING: return "pending";
        case PhaseStatus::IN_PROGRESS: return "in_progress";
        case PhaseStatus::COMPLETED: return "completed";
        case PhaseStatus::FAILED: return "failed";
    }
    return "unknown";
}

const char* to_string(WorkflowStatus s) {
    switch (s) {
        case WorkflowStatus::NOT_STARTED: return "not_started";
        case WorkflowStatus::RUNNING: return "running";
        case WorkflowStatus::AWAITING_CONFIRMATION: return "awaiting_confirmation";
        case WorkflowStatus::AWAITING_ACKNOWLEDGMENT: return "awaiting_acknowledgment";
        case WorkflowStatus::ALL_PHASES_COMPLETED: return "all_phases_completed";
        case WorkflowStatus::ABORTED_FAILED: return "aborted_failed";
    }
    return "unknown";
}

const char* to_string(TaskStatus s) {
    switch (s) {
        case TaskStatus::PENDING: return "pending";
        case TaskStatus::IN_PROGRESS: return "in_progress";
        case TaskStatus::COMPLETED: return "completed";
        case TaskStatus::FAILED: return "failed";
        case TaskStatus::REPLACED: return "replaced";
        case TaskStatus::DEFERRED: return "deferred";
        case TaskStatus::SKIPPED: return "skipped";
    }
    return "unknown";
}

const char* to_string(HookPoint point) {
    switch (point) {
        case HookPoint::ON_REQUEST_SUBMIT: return "OnRequestSubmit";
        case HookPoint::ON_RESOURCE_MUTATED: return "OnResourceMutated";
        case HookPoint::ON_WORKFLOW_STOP: return "OnWorkflowStop";
    }
    return "Unknown";
}

const char* to_string(HookStatus status) {
    switch (status) {
        case HookStatus::SUCCESS: return "success";
        case HookStatus::FAILED: return "failed";
        case HookStatus::SKIPPED: return "skipped";
        case HookStatus::TIMEOUT: return "timeout";
    }
    return "unknown";
}

HookPoint parse_hook_point(const std::string& s) {
    if (s == "OnRequestSubmit" || s == "on_request_submit") return HookPoint::ON_REQUEST_SUBMIT;
    if (s == "OnResourceMutated" || s == "on_resource_mutated") return HookPoint::ON_RESOURCE_MUTATED;
    if (s == "OnWorkflowStop" || s == "on_workflow_stop") return HookPoint::ON_WORKFLOW_STOP;
    throw ConfigError("Unknown hook point '" + s + "'");
}

} // namespace swarmflow
