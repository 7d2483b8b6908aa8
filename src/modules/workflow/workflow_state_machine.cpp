// modules/workflow/workflow_state_machine.cpp
#include "modules/workflow/workflow_state_machine.h"
#include "common/log/logger.h"
#include <algorithm>
#include <initializer_list>
#include <stdexcept>

namespace swarmflow {

WorkflowStateMachine::WorkflowStateMachine(WorkflowInstance& instance, int max_recovery_attempts)
    : instance_(instance), max_recovery_attempts_(max_recovery_attempts) {
    const size_t n = instance_.plan.phases.size();
    instance_.phase_status.assign(n, PhaseStatus::PENDING);
    instance_.recovery_attempts.assign(n, 0);
    instance_.confirmation_required.assign(n, false);
    replanned_.assign(n, false);
}

void WorkflowStateMachine::start() {
    require_status({WorkflowStatus::NOT_STARTED}, "start");
    if (instance_.plan.phases.empty()) {
        throw InvalidTransition("Cannot start workflow '" + instance_.id + "' with an empty plan");
    }
    instance_.started_at = std::chrono::steady_clock::now();
    set_status(WorkflowStatus::RUNNING, "workflow started");
    instance_.current_phase = 0;
    set_phase(0, PhaseStatus::IN_PROGRESS, "phase started");
}

bool WorkflowStateMachine::requirement_satisfied(VerificationLevel level, const PhaseEvidence& e, std::string* missing) {
    auto fail = [&](const char* what) {
        if (missing) *missing = what;
        return false;
    };
    switch (level) {
        case VerificationLevel::NONE:
            return true;
        case VerificationLevel::FULL_SECURITY_ROLLBACK:
            if (!e.security_checked) return fail("security checks did not run");
            if (!e.rollback_plan_recorded) return fail("no rollback plan recorded");
            [[fallthrough]];
        case VerificationLevel::FULL:
            if (!e.all_verdicts_explicit) return fail("not every task has an explicit verdict");
            [[fallthrough]];
        case VerificationLevel::BASIC:
            if (!e.verification_ran) return fail("verification did not run");
            if (!e.verification_passed) return fail("verification did not pass");
            return true;
    }
    return fail("unknown verification level");
}

WorkflowStatus WorkflowStateMachine::complete_phase(const PhaseEvidence& evidence) {
    require_status({WorkflowStatus::RUNNING, WorkflowStatus::AWAITING_CONFIRMATION}, "complete_phase");
    require_current(PhaseStatus::IN_PROGRESS, "complete_phase");

    const int idx = instance_.current_phase;
    const Phase& phase = instance_.plan.phases[idx];
    std::string missing;
    if (!requirement_satisfied(phase.verification, evidence, &missing)) {
        throw InvalidTransition("Phase '" + phase.name + "' cannot complete: " + missing + " (requires " +
                                to_string(phase.verification) + ")");
    }

    if (instance_.confirmation_required[idx] && !is_confirmed(idx)) {
        if (instance_.status != WorkflowStatus::AWAITING_CONFIRMATION) {
            set_status(WorkflowStatus::AWAITING_CONFIRMATION, "phase '" + phase.name + "' awaits human confirmation");
        }
        return instance_.status;
    }

    if (instance_.status == WorkflowStatus::AWAITING_CONFIRMATION) {
        set_status(WorkflowStatus::RUNNING, "confirmation recorded");
    }
    set_phase(idx, PhaseStatus::COMPLETED, "verification satisfied");

    if (idx + 1 >= static_cast<int>(instance_.plan.phases.size())) {
        set_status(WorkflowStatus::ALL_PHASES_COMPLETED, "all phases completed");
        return instance_.status;
    }
    instance_.current_phase = idx + 1;
    set_phase(idx + 1, PhaseStatus::IN_PROGRESS, "phase started");
    return instance_.status;
}

FailureDecision WorkflowStateMachine::fail_phase(const std::string& reason, ErrorKind kind, const std::string& task_id) {
    require_status({WorkflowStatus::RUNNING, WorkflowStatus::AWAITING_CONFIRMATION}, "fail_phase");
    require_current(PhaseStatus::IN_PROGRESS, "fail_phase");

    const int idx = instance_.current_phase;
    if (instance_.status == WorkflowStatus::AWAITING_CONFIRMATION) {
        set_status(WorkflowStatus::RUNNING, "confirmation gate withdrawn: phase failed");
    }
    log_error(ErrorRecord{kind, idx, task_id, reason});
    set_phase(idx, PhaseStatus::FAILED, reason);
    return can_recover() ? FailureDecision::RECOVER : FailureDecision::ESCALATE;
}

bool WorkflowStateMachine::can_recover() const {
    const int idx = instance_.current_phase;
    if (idx < 0 || idx >= static_cast<int>(instance_.recovery_attempts.size())) return false;
    return instance_.recovery_attempts[idx] < max_recovery_attempts_;
}

bool WorkflowStateMachine::replanned(int index) const {
    check_index(index);
    return replanned_[index];
}

void WorkflowStateMachine::begin_recovery() {
    require_status({WorkflowStatus::RUNNING}, "begin_recovery");
    require_current(PhaseStatus::FAILED, "begin_recovery");
    const int idx = instance_.current_phase;
    if (!can_recover()) {
        throw InvalidTransition("Phase '" + instance_.plan.phases[idx].name + "' exhausted its " +
                                std::to_string(max_recovery_attempts_) + " recovery attempts");
    }
    int attempt = ++instance_.recovery_attempts[idx];
    log::logger()->warn("Workflow '{}': recovery attempt {}/{} for phase '{}'", instance_.id, attempt,
                        max_recovery_attempts_, instance_.plan.phases[idx].name);
    set_phase(idx, PhaseStatus::IN_PROGRESS, "recovery attempt " + std::to_string(attempt));
}

void WorkflowStateMachine::replan_reduced_scope(const std::vector<std::string>& dropped_tasks) {
    require_status({WorkflowStatus::RUNNING}, "replan_reduced_scope");
    require_current(PhaseStatus::FAILED, "replan_reduced_scope");
    const int idx = instance_.current_phase;
    if (replanned_[idx]) {
        throw InvalidTransition("Phase '" + instance_.plan.phases[idx].name + "' was already re-planned");
    }
    replanned_[idx] = true;

    std::string note = "reduced-scope re-plan, dropped:";
    for (const auto& t : dropped_tasks) note += " " + t;
    instance_.warnings.push_back("Phase '" + instance_.plan.phases[idx].name + "' re-planned with reduced scope (" +
                                 std::to_string(dropped_tasks.size()) + " non-critical task(s) dropped)");
    log::logger()->warn("Workflow '{}': {}", instance_.id, note);
    set_phase(idx, PhaseStatus::IN_PROGRESS, note);
}

void WorkflowStateMachine::require_confirmation(int phase_index) {
    check_index(phase_index);
    if (instance_.phase_status[phase_index] == PhaseStatus::COMPLETED) {
        throw InvalidTransition("Phase " + std::to_string(phase_index) + " already completed");
    }
    if (!instance_.confirmation_required[phase_index]) {
        instance_.confirmation_required[phase_index] = true;
        note("phase '" + instance_.plan.phases[phase_index].name + "' requires human confirmation");
    }
}

void WorkflowStateMachine::record_confirmation(int phase_index, const std::string& operator_name) {
    check_index(phase_index);
    if (operator_name.empty()) {
        throw InvalidTransition("Confirmation requires an operator name");
    }
    if (is_terminal()) {
        throw InvalidTransition("Cannot confirm phase of terminal workflow '" + instance_.id + "'");
    }
    instance_.confirmations.push_back(Confirmation{phase_index, operator_name, std::chrono::system_clock::now()});
    note("phase '" + instance_.plan.phases[phase_index].name + "' confirmed by " + operator_name);
}

bool WorkflowStateMachine::is_confirmed(int phase_index) const {
    return std::any_of(instance_.confirmations.begin(), instance_.confirmations.end(),
                       [&](const Confirmation& c) { return c.phase_index == phase_index; });
}

int WorkflowStateMachine::append_phase(const Phase& phase) {
    if (is_terminal()) {
        throw InvalidTransition("Cannot append phase '" + phase.name + "' to terminal workflow '" + instance_.id + "'");
    }
    instance_.plan.phases.push_back(phase);
    instance_.phase_status.push_back(PhaseStatus::PENDING);
    instance_.recovery_attempts.push_back(0);
    instance_.confirmation_required.push_back(false);
    replanned_.push_back(false);
    const int index = static_cast<int>(instance_.plan.phases.size()) - 1;
    note("phase '" + phase.name + "' appended");
    return index;
}

void WorkflowStateMachine::abort(const std::string& reason) {
    if (is_terminal()) {
        throw InvalidTransition("Workflow '" + instance_.id + "' is already terminal");
    }
    const int idx = instance_.current_phase;
    if (idx >= 0 && instance_.phase_status[idx] == PhaseStatus::IN_PROGRESS) {
        set_phase(idx, PhaseStatus::FAILED, "aborted");
    }
    instance_.abort_reason = reason;
    log_error(ErrorRecord{ErrorKind::ABORTED, idx, "", reason});
    log::logger()->error("Workflow '{}' aborted: {}", instance_.id, reason);
    set_status(WorkflowStatus::ABORTED_FAILED, reason);
}

void WorkflowStateMachine::await_acknowledgment(const std::string& warning) {
    require_status({WorkflowStatus::ALL_PHASES_COMPLETED}, "await_acknowledgment");
    instance_.warnings.push_back(warning);
    set_status(WorkflowStatus::AWAITING_ACKNOWLEDGMENT, warning);
}

void WorkflowStateMachine::acknowledge(const std::string& operator_name) {
    require_status({WorkflowStatus::AWAITING_ACKNOWLEDGMENT}, "acknowledge");
    if (operator_name.empty()) {
        throw InvalidTransition("Acknowledgment requires an operator name");
    }
    set_status(WorkflowStatus::ALL_PHASES_COMPLETED, "acknowledged by " + operator_name);
}

void WorkflowStateMachine::add_modified_resources(const std::vector<std::string>& resources) {
    auto& all = instance_.modified_resources;
    for (const auto& r : resources) {
        if (std::find(all.begin(), all.end(), r) == all.end()) all.push_back(r);
    }
}

void WorkflowStateMachine::log_error(ErrorRecord record) {
    instance_.error_log.push_back(std::move(record));
}

void WorkflowStateMachine::note(const std::string& text) {
    const std::string state = to_string(instance_.status);
    instance_.history.push_back(Transition{state, state, instance_.current_phase, std::chrono::system_clock::now(), text});
    touch();
}

PhaseStatus WorkflowStateMachine::phase_status(int index) const {
    check_index(index);
    return instance_.phase_status[index];
}

bool WorkflowStateMachine::is_terminal() const {
    return instance_.status == WorkflowStatus::ALL_PHASES_COMPLETED ||
           instance_.status == WorkflowStatus::ABORTED_FAILED;
}

void WorkflowStateMachine::check_index(int index) const {
    if (index < 0 || index >= static_cast<int>(instance_.plan.phases.size())) {
        throw std::out_of_range("Phase index " + std::to_string(index) + " out of range");
    }
}

void WorkflowStateMachine::require_status(std::initializer_list<WorkflowStatus> allowed, const char* operation) const {
    if (std::find(allowed.begin(), allowed.end(), instance_.status) == allowed.end()) {
        throw InvalidTransition(std::string(operation) + " is not allowed while workflow '" + instance_.id +
                                "' is " + to_string(instance_.status));
    }
}

void WorkflowStateMachine::require_current(PhaseStatus expected, const char* operation) const {
    const int idx = instance_.current_phase;
    if (idx < 0 || instance_.phase_status[idx] != expected) {
        throw InvalidTransition(std::string(operation) + " requires the current phase to be " + to_string(expected));
    }
}

void WorkflowStateMachine::set_status(WorkflowStatus to, const std::string& note) {
    const WorkflowStatus from = instance_.status;
    instance_.status = to;
    instance_.history.push_back(Transition{to_string(from), to_string(to), instance_.current_phase,
                                           std::chrono::system_clock::now(), note});
    log::logger()->info("Workflow '{}': {} -> {} ({})", instance_.id, to_string(from), to_string(to), note);
    touch();
}

void WorkflowStateMachine::set_phase(int index, PhaseStatus to, const std::string& note) {
    const PhaseStatus from = instance_.phase_status[index];
    instance_.phase_status[index] = to;
    const std::string& name = instance_.plan.phases[index].name;
    instance_.history.push_back(Transition{name + "." + to_string(from), name + "." + to_string(to), index,
                                           std::chrono::system_clock::now(), note});
    log::logger()->debug("Workflow '{}': phase '{}' {} -> {}", instance_.id, name, to_string(from), to_string(to));
    touch();
}

void WorkflowStateMachine::touch() {
    if (instance_.status != WorkflowStatus::NOT_STARTED) {
        instance_.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - instance_.started_at);
    }
}

} // namespace swarmflow
