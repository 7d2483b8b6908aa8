// core/orchestrator.cpp
#include "swarmflow/core/orchestrator.h"
#include "common/log/logger.h"
#include "common/utils/template_renderer.h"
#include "common/utils/text_match.h"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <filesystem>
#include <future>
#include <stdexcept>

namespace swarmflow {

namespace {

constexpr const char* FOLLOW_UP_PHASE = "follow_up";

// 未注入验证方时的默认验证：worker 报告成功即通过
VerificationReport execution_verifier(const PhaseResult& result) {
    VerificationReport report;
    for (const auto& t : result.tasks) {
        if (t.status != TaskStatus::COMPLETED) continue;
        report.verdicts[t.task_id] = TaskVerdict{true, "worker reported success", {}};
    }
    return report;
}

bool answered(const std::optional<std::string>& s) {
    return s.has_value() && s->find_first_not_of(" \t\r\n") != std::string::npos;
}

bool overlaps(const AgentTask& task, const std::vector<AgentTask>& others) {
    for (const auto& other : others) {
        for (const auto& r : task.resources) {
            if (std::find(other.resources.begin(), other.resources.end(), r) != other.resources.end()) return true;
        }
    }
    return false;
}

std::string join(const std::vector<std::string>& items, const char* sep = ", ") {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

nlohmann::json hook_result_to_json(const HookResult& r) {
    nlohmann::json j = {{"hook", r.hook_name}, {"status", to_string(r.status)}, {"duration_ms", r.duration.count()}};
    if (r.display_text) j["display_text"] = *r.display_text;
    return j;
}

nlohmann::json task_result_to_json(const TaskResult& t) {
    nlohmann::json j = {{"task", t.task_id},
                        {"worker", t.worker_id},
                        {"status", to_string(t.status)},
                        {"resources", t.resources},
                        {"modified", t.modified_resources},
                        {"summary", t.summary},
                        {"critical", t.critical},
                        {"verified", t.verified},
                        {"fix_attempts", t.fix_attempts}};
    if (!t.error.empty()) j["error"] = t.error;
    if (t.escalated) j["escalated"] = true;
    if (!t.output.empty()) j["output"] = t.output;
    return j;
}

nlohmann::json phase_result_to_json(const PhaseResult& p) {
    nlohmann::json tasks = nlohmann::json::array();
    for (const auto& t : p.tasks) tasks.push_back(task_result_to_json(t));
    nlohmann::json verdicts = nlohmann::json::object();
    for (const auto& [id, v] : p.verdicts) {
        verdicts[id] = {{"passed", v.passed}, {"detail", v.detail}, {"failing_checks", v.failing_checks}};
    }
    nlohmann::json deferred = nlohmann::json::array();
    for (const auto& t : p.deferred) deferred.push_back(t.id);
    nlohmann::json hooks = nlohmann::json::array();
    for (const auto& h : p.mutation_hooks) hooks.push_back(hook_result_to_json(h));
    nlohmann::json j = {{"phase", p.phase},
                        {"tasks", std::move(tasks)},
                        {"verdicts", std::move(verdicts)},
                        {"deferred", std::move(deferred)},
                        {"skipped", p.skipped},
                        {"escalated", p.escalated},
                        {"replacements", p.replacements},
                        {"fix_workers", p.fix_workers},
                        {"budget_actions", p.budget_actions},
                        {"mutation_hooks", std::move(hooks)},
                        {"security_checked", p.security_checked},
                        {"conservation_mode", p.conservation_mode},
                        {"waves", p.waves}};
    if (p.verification_error) j["verification_error"] = *p.verification_error;
    return j;
}

} // namespace

nlohmann::json WorkflowReport::to_json() const {
    nlohmann::json phase_list = nlohmann::json::array();
    for (const auto& p : phases) phase_list.push_back(phase_result_to_json(p));
    nlohmann::json j = {{"instance_id", instance_id},
                        {"request_id", request_id},
                        {"status", to_string(status)},
                        {"workflow_class", to_string(workflow_class)},
                        {"workflow", workflow_label},
                        {"score", {{"dimensions", score.dimensions},
                                   {"aggregate", score.aggregate},
                                   {"estimated_tokens", score.estimated_tokens}}},
                        {"risk_tier", to_string(risk_tier)},
                        {"risk_reason", risk_reason},
                        {"task_type", task_type},
                        {"confidence", confidence},
                        {"rule", rule},
                        {"decision_factors", decision_factors},
                        {"phases", std::move(phase_list)},
                        {"modified_resources", modified_resources},
                        {"recovered", recovered},
                        {"follow_up_checks", follow_up_checks},
                        {"warnings", warnings},
                        {"summary", summary},
                        {"elapsed_ms", elapsed.count()}};
    j["abort_reason"] = abort_reason ? nlohmann::json(*abort_reason) : nlohmann::json(nullptr);
    j["awaiting_phase"] = awaiting_phase ? nlohmann::json(*awaiting_phase) : nlohmann::json(nullptr);
    return j;
}

Orchestrator::Orchestrator(WorkerFunction worker, EngineConfig config, std::shared_ptr<HookHandlerRegistry> handlers)
    : worker_(std::move(worker)),
      config_(std::move(config)),
      handlers_(handlers ? std::move(handlers) : std::make_shared<HookHandlerRegistry>()),
      classifier_(config_.classifier, RiskClassifier(config_.risk)),
      risk_(config_.risk),
      dispatcher_(hooks_, config_.hook_budgets) {
    if (!worker_) {
        throw std::invalid_argument("Orchestrator requires a worker function");
    }
    checkpoints_.set_snapshot_limits(config_.workflow.max_snapshots, config_.workflow.max_snapshot_size_kb);
    for (const auto& decl : config_.hooks) {
        register_declared_hook(decl);
    }
}

std::unique_ptr<Orchestrator> Orchestrator::from_config_file(const std::string& path, WorkerFunction worker,
                                                             std::shared_ptr<HookHandlerRegistry> handlers) {
    EngineConfig config = EngineConfig::from_yaml_file(path);
    log::set_level(config.log_level);
    log::logger()->info("Loaded engine configuration from {} ({} declared hook(s))", path, config.hooks.size());
    return std::make_unique<Orchestrator>(std::move(worker), std::move(config), std::move(handlers));
}

void Orchestrator::register_hook(HookPoint point, std::shared_ptr<Hook> hook) {
    hooks_.register_hook(point, std::move(hook));
}

void Orchestrator::register_declared_hook(const HookDeclaration& decl) {
    hooks_.register_hook(decl.point, std::make_shared<DeclaredHook>(decl, handlers_));
}

std::vector<AgentTask> Orchestrator::default_plan(const Request& request, const Phase& phase, int) {
    std::vector<std::string> hints;
    for (const auto& h : request.file_hints) {
        if (!h.empty() && std::find(hints.begin(), hints.end(), h) == hints.end()) hints.push_back(h);
    }

    auto make = [&](std::string id, std::vector<std::string> resources) {
        AgentTask t;
        t.id = std::move(id);
        t.phase = phase.name;
        t.description = request.description;
        t.risk.task_id = t.id;
        t.risk.description = request.description;
        t.risk.module_count = module_count(resources);
        t.risk.assessment = request.risk_assessment;
        t.resources = std::move(resources);
        return t;
    };

    std::vector<AgentTask> tasks;
    if (phase.ownership == OwnershipModel::SINGLE_AGENT || hints.size() <= 1) {
        tasks.push_back(make(phase.name, hints));
    } else {
        for (const auto& h : hints) {
            tasks.push_back(make(phase.name + ":" + h, {h}));
        }
    }
    return tasks;
}

std::unique_ptr<AgentSwarmCoordinator> Orchestrator::make_coordinator(const std::string& instance_id) {
    auto coordinator = std::make_unique<AgentSwarmCoordinator>(worker_, config_.swarm);
    // 提供方抛出的异常由 coordinator 记录为 verification_error
    coordinator->set_verifier([this](const PhaseResult& result) {
        return verifier_ ? verifier_(result) : execution_verifier(result);
    });
    coordinator->set_event_emitter([this, instance_id](const std::string& type, const nlohmann::json& data) {
        trace_.emit(instance_id, type, data);
    });
    coordinator->set_mutation_observer([this, instance_id](const std::string& resource, const TaskResult& result) {
        return on_mutation(instance_id, resource, result);
    });
    return coordinator;
}

Orchestrator::InstanceRun& Orchestrator::run_of(const std::string& instance_id) {
    std::lock_guard<std::mutex> lock(runs_mutex_);
    auto it = runs_.find(instance_id);
    if (it == runs_.end()) {
        throw std::out_of_range("Unknown workflow instance: " + instance_id);
    }
    return *it->second;
}

std::optional<WorkflowInstance> Orchestrator::instance(const std::string& instance_id) const {
    std::lock_guard<std::mutex> lock(runs_mutex_);
    auto it = runs_.find(instance_id);
    if (it == runs_.end()) return std::nullopt;
    return it->second->instance;
}

WorkflowReport Orchestrator::submit(const Request& request) {
    auto owned = std::make_unique<InstanceRun>();
    InstanceRun& run = *owned;
    run.request = request;
    {
        std::lock_guard<std::mutex> lock(runs_mutex_);
        const uint64_t n = next_instance_++;
        if (run.request.id.empty()) run.request.id = "req-" + std::to_string(n);
        run.instance.id = "wf-" + std::to_string(n);
    }
    run.instance.request_id = run.request.id;
    if (session_.record(run.request.id)) {
        throw std::invalid_argument("Request '" + run.request.id + "' was already submitted in this session");
    }
    const std::string id = run.instance.id;

    run.classification = classifier_.classify(run.request);
    auto& cls = run.classification;
    trace_.emit(id, "request.classified", {{"request_id", run.request.id},
                                           {"workflow", cls.plan.label},
                                           {"workflow_class", to_string(cls.plan.workflow_class)},
                                           {"aggregate", cls.score.aggregate},
                                           {"risk_tier", to_string(cls.risk_tier)},
                                           {"rule", cls.rule},
                                           {"confidence", cls.confidence}});

    // 请求级风险等级进入台账，只能由 hook 显式升级
    RiskTier tier = session_.record_tier(run.request.id, cls.risk_tier);

    DispatchSummary submitted = dispatcher_.dispatch(HookPoint::ON_REQUEST_SUBMIT, submit_context(run));
    trace_hooks(id, submitted);
    record_hook_faults(run, HookPoint::ON_REQUEST_SUBMIT, submitted.results, -1);
    session_.apply_patches(submitted.patches);
    for (const auto& r : submitted.results) {
        if (r.status != HookStatus::SUCCESS) continue;
        const auto* advice = std::get_if<SubmitAdvice>(&r.advice);
        if (!advice) continue;
        if (advice->escalate_to) {
            tier = session_.escalate_tier(run.request.id, *advice->escalate_to, "hook '" + r.hook_name + "'");
        }
        cls.decision_factors.insert(cls.decision_factors.end(), advice->notes.begin(), advice->notes.end());
    }
    if (tier != cls.risk_tier) {
        cls.risk_reason += fmt::format("; escalated {} -> {} by OnRequestSubmit hook", to_string(cls.risk_tier),
                                       to_string(tier));
        cls.risk_tier = tier;
    }
    const VerificationLevel floor = RiskClassifier::verification_for(tier);
    for (auto& p : cls.plan.phases) {
        p.verification = std::max(p.verification, floor);
    }
    if (auto hint = session_.outcome_hint(cls.task_type)) {
        cls.decision_factors.push_back(*hint);
    }

    run.instance.plan = cls.plan;
    session_.create(run.request.id, id, cls.score, cls.plan.label, cls.task_type);
    run.machine = std::make_unique<WorkflowStateMachine>(run.instance, config_.workflow.max_recovery_attempts);
    run.coordinator = make_coordinator(id);
    {
        std::lock_guard<std::mutex> lock(runs_mutex_);
        runs_[id] = std::move(owned);
    }

    log::logger()->info("Request '{}' -> workflow '{}' ({}, {} phase(s), risk {})", run.request.id, id,
                        cls.plan.label, cls.plan.phases.size(), to_string(tier));
    nlohmann::json phase_names = nlohmann::json::array();
    for (const auto& p : cls.plan.phases) phase_names.push_back(p.name);
    run.machine->start();
    trace_.emit(id, "workflow.started", {{"request_id", run.request.id}, {"workflow", cls.plan.label},
                                         {"phases", std::move(phase_names)}, {"risk_tier", to_string(tier)}});
    drive(run);
    return make_report(run);
}

WorkflowReport Orchestrator::resume_with_confirmation(const std::string& instance_id, const std::string& operator_name) {
    InstanceRun& run = run_of(instance_id);
    auto& m = *run.machine;
    if (m.status() != WorkflowStatus::AWAITING_CONFIRMATION || !run.pending_evidence) {
        throw InvalidTransition("Workflow '" + instance_id + "' is not awaiting confirmation");
    }
    const int index = m.current_phase();
    const Phase phase = run.instance.plan.phases[index];
    m.record_confirmation(index, operator_name);
    PhaseEvidence evidence = *run.pending_evidence;
    run.pending_evidence.reset();
    m.complete_phase(evidence);
    trace_.emit(instance_id, "phase.confirmed", {{"phase", phase.name}, {"operator", operator_name}});
    trace_.emit(instance_id, "phase.completed", {{"phase", phase.name}, {"index", index}});
    if (phase.checkpoint_after) checkpoint(run, index);

    drive(run);
    return make_report(run);
}

WorkflowReport Orchestrator::acknowledge(const std::string& instance_id, const std::string& operator_name) {
    InstanceRun& run = run_of(instance_id);
    run.machine->acknowledge(operator_name);
    session_.record_outcome(run.classification.task_type, run.instance.plan.label, true);
    trace_.emit(instance_id, "workflow.acknowledged", {{"operator", operator_name}});
    sync_session(run);
    return make_report(run);
}

void Orchestrator::drive(InstanceRun& run) {
    auto& m = *run.machine;
    const std::string& id = run.instance.id;

    while (m.status() == WorkflowStatus::RUNNING) {
        const int index = m.current_phase();
        PhaseResult result;

        try {
            auto fetched = run.prefetched.find(index);
            if (fetched != run.prefetched.end()) {
                Prefetched pre = std::move(fetched->second);
                run.prefetched.erase(fetched);
                if (!apply_gate(run, index, pre.gate)) break;
                result = std::move(pre.result);
            } else {
                GateOutcome gate = gate_phase(run, index);
                if (!apply_gate(run, index, gate)) break;

                // 与下一阶段无依赖时并发执行其 swarm，提交仍按计划顺序
                const Phase& phase = run.instance.plan.phases[index];
                const int next = index + 1;
                std::future<PhaseResult> side;
                GateOutcome next_gate;
                if (phase.independent && next < static_cast<int>(run.instance.plan.phases.size()) &&
                    run.follow_up_index != next) {
                    next_gate = gate_phase(run, next);
                    if (!next_gate.blocked) {
                        if (!run.side_coordinator) run.side_coordinator = make_coordinator(id);
                        trace_.emit(id, "phase.concurrent", {{"phase", phase.name},
                                                             {"with", run.instance.plan.phases[next].name}});
                        side = std::async(std::launch::async, [this, &run, next, tasks = next_gate.tasks]() mutable {
                            return run_swarm(run, *run.side_coordinator, next, std::move(tasks));
                        });
                    }
                }

                result = run_swarm(run, *run.coordinator, index, std::move(gate.tasks));
                if (side.valid()) {
                    try {
                        run.prefetched[next] = Prefetched{std::move(next_gate), side.get()};
                    } catch (const Error& e) {
                        // 到达该阶段时按顺序重新执行
                        log::logger()->warn("Workflow '{}': concurrent phase {} failed early: {}", id, next, e.what());
                    }
                }
            }
            commit_phase(run, index, std::move(result));
        } catch (const Error& e) {
            // PlanningError 等无法在阶段内恢复
            m.log_error(ErrorRecord{e.kind(), index, "", e.what()});
            trace_.emit(id, "phase.failed", {{"phase", run.instance.plan.phases[index].name}, {"reason", e.what()}});
            if (!m.is_terminal()) m.abort(e.what());
        }
    }

    if (m.is_terminal()) finish(run);
    sync_session(run);
}

Orchestrator::GateOutcome Orchestrator::gate_phase(InstanceRun& run, int index) {
    GateOutcome gate;
    const Phase& phase = run.instance.plan.phases[index];

    std::vector<AgentTask> tasks;
    if (run.follow_up_index != index) {
        try {
            tasks = planner_ ? planner_(run.request, phase, index) : default_plan(run.request, phase, index);
        } catch (const Error&) {
            throw;
        } catch (const std::exception& e) {
            throw PlanningError("task planner failed for phase '" + phase.name + "': " + e.what());
        }
    }
    auto carried = run.carried.find(index);
    if (carried != run.carried.end()) {
        for (const auto& t : carried->second) {
            if (overlaps(t, tasks)) {
                gate.dropped.push_back(ErrorRecord{ErrorKind::BUDGET_EXCEEDED, index, t.id,
                                                   "deferred task '" + t.id + "' overlaps resources planned for '" +
                                                       phase.name + "'"});
                continue;
            }
            tasks.push_back(t);
        }
    }

    for (auto& task : tasks) {
        task.phase = phase.name;
        auto& d = task.risk;
        if (d.task_id.empty()) d.task_id = task.id;
        if (d.description.empty()) d.description = task.description.empty() ? run.request.description : task.description;
        if (!d.assessment) d.assessment = run.request.risk_assessment;

        try {
            // 请求级等级（含 hook 升级）是任务等级的下限
            RiskTier tier = max_tier(risk_.classify(d), run.classification.risk_tier);
            if (tier != RiskTier::T0) {
                auto missing = RiskClassifier::missing_assessment_fields(d);
                if (!missing.empty()) throw IncompleteRiskAssessment(d.task_id, std::move(missing));
            }
            tier = session_.record_tier(run.instance.id + "/" + task.id, tier);
            if (tier == RiskTier::T3) gate.requires_confirmation = true;
            if (!answered(d.assessment ? d.assessment->fastest_rollback : std::nullopt)) gate.rollback_recorded = false;
            gate.tasks.push_back(std::move(task));
        } catch (const IncompleteRiskAssessment& e) {
            if (task.critical) {
                gate.blocked = e.what();
                return gate;
            }
            gate.dropped.push_back(ErrorRecord{ErrorKind::INCOMPLETE_RISK_ASSESSMENT, index, task.id, e.what()});
        }
    }
    if (gate.tasks.empty()) {
        gate.rollback_recorded =
            answered(run.request.risk_assessment ? run.request.risk_assessment->fastest_rollback : std::nullopt);
    }
    return gate;
}

bool Orchestrator::apply_gate(InstanceRun& run, int index, const GateOutcome& gate) {
    auto& m = *run.machine;
    const std::string& phase = run.instance.plan.phases[index].name;
    for (const auto& rec : gate.dropped) {
        run.dropped[index].insert(rec.task_id);
        run.recovered.push_back(fmt::format("{}: {}", to_string(rec.kind), rec.message));
        m.log_error(rec);
        trace_.emit(run.instance.id, "task.dropped", {{"phase", phase}, {"task", rec.task_id}, {"reason", rec.message}});
    }
    if (gate.blocked) {
        trace_.emit(run.instance.id, "task.blocked", {{"phase", phase}, {"reason", *gate.blocked}});
        m.log_error(ErrorRecord{ErrorKind::INCOMPLETE_RISK_ASSESSMENT, index, "", *gate.blocked});
        m.abort(*gate.blocked);
        return false;
    }
    run.phase_tasks[index] = gate.tasks;
    run.rollback_recorded[index] = gate.rollback_recorded;
    if (gate.requires_confirmation) m.require_confirmation(index);
    return true;
}

PhaseResult Orchestrator::run_swarm(InstanceRun& run, AgentSwarmCoordinator& coordinator, int index,
                                    std::vector<AgentTask> tasks) {
    const Phase phase = run.instance.plan.phases[index];
    const bool allow_defer = run.follow_up_index != index;
    trace_.emit(run.instance.id, "phase.started", {{"phase", phase.name},
                                                   {"index", index},
                                                   {"tasks", tasks.size()},
                                                   {"ownership", to_string(phase.ownership)},
                                                   {"verification", to_string(phase.verification)}});
    return coordinator.run_phase(phase, std::move(tasks), allow_defer);
}

void Orchestrator::commit_phase(InstanceRun& run, int index, PhaseResult result) {
    auto& m = *run.machine;
    const std::string& id = run.instance.id;
    absorb(run, index, result);
    const Phase phase = run.instance.plan.phases[index];

    while (true) {
        const std::vector<TaskId> failing = failing_tasks(run, index, result);
        const PhaseEvidence evidence = evidence_for(run, index, result);
        std::string missing;

        if (result.verification_error) {
            // 验证提供方出错：重跑无法得到结论，保留结果后中止
            const std::string reason = "verification provider failed: " + *result.verification_error;
            escalate(run, index, std::move(result), reason);
            return;
        }

        if (failing.empty() && WorkflowStateMachine::requirement_satisfied(phase.verification, evidence, &missing)) {
            if (m.complete_phase(evidence) == WorkflowStatus::AWAITING_CONFIRMATION) {
                std::optional<std::string> op;
                if (confirm_) {
                    try {
                        op = confirm_(run.instance, index, result);
                    } catch (const std::exception& e) {
                        run.results[index] = std::move(result);
                        trace_.emit(id, "phase.failed", {{"phase", phase.name}, {"reason", e.what()}});
                        m.abort("confirmation provider failed for phase '" + phase.name + "': " + e.what());
                        return;
                    }
                }
                if (!op) {
                    run.pending_evidence = evidence;
                    run.results[index] = std::move(result);
                    trace_.emit(id, "workflow.awaiting_confirmation", {{"phase", phase.name}, {"index", index}});
                    return;
                }
                m.record_confirmation(index, *op);
                m.complete_phase(evidence);
            }
            run.results[index] = std::move(result);
            trace_.emit(id, "phase.completed", {{"phase", phase.name}, {"index", index}});
            if (phase.checkpoint_after) checkpoint(run, index);
            return;
        }

        if (failing.empty()) {
            // 没有可修复的任务，重跑同样拿不到缺失的证据
            escalate(run, index, std::move(result), "verification requirement not met: " + missing);
            return;
        }

        const std::string reason = "task(s) failed after fix attempt: " + join(failing);
        trace_.emit(id, "phase.failed", {{"phase", phase.name}, {"reason", reason}});
        const FailureDecision decision = m.fail_phase(reason, ErrorKind::VERIFICATION_FAILURE, failing.front());

        if (decision == FailureDecision::RECOVER) {
            m.begin_recovery();
            const int attempt = run.instance.recovery_attempts[index];
            std::vector<AgentTask> retry;
            for (const auto& t : run.phase_tasks[index]) {
                if (std::find(failing.begin(), failing.end(), t.id) == failing.end()) continue;
                AgentTask task = t;
                FailureContext ctx;
                ctx.attempt = attempt + 1;
                if (const TaskResult* r = result.find(t.id)) ctx.error_detail = r->error;
                auto v = result.verdicts.find(t.id);
                if (v != result.verdicts.end()) {
                    if (ctx.error_detail.empty()) ctx.error_detail = v->second.detail;
                    ctx.failing_checks = v->second.failing_checks;
                }
                task.failure = std::move(ctx);
                retry.push_back(std::move(task));
            }
            run.recovered.push_back(fmt::format("phase '{}' recovery attempt {}: {}", phase.name, attempt, reason));
            trace_.emit(id, "phase.recovering", {{"phase", phase.name}, {"attempt", attempt}, {"tasks", failing}});
            PhaseResult retried = run_swarm(run, *run.coordinator, index, std::move(retry));
            absorb(run, index, retried);
            merge_retry(result, std::move(retried));
            continue;
        }

        const bool all_non_critical = std::all_of(failing.begin(), failing.end(), [&](const TaskId& t) {
            const TaskResult* r = result.find(t);
            return r && !r->critical;
        });
        if (all_non_critical && !m.replanned(index)) {
            m.replan_reduced_scope(failing);
            run.dropped[index].insert(failing.begin(), failing.end());
            run.recovered.push_back(fmt::format("phase '{}' re-planned without non-critical task(s): {}", phase.name,
                                                join(failing)));
            trace_.emit(id, "phase.replanned", {{"phase", phase.name}, {"dropped", failing}});
            continue;
        }

        // 部分结果保留，不回滚
        run.results[index] = std::move(result);
        m.abort("phase '" + phase.name + "' failed after " + std::to_string(config_.workflow.max_recovery_attempts) +
                " recovery attempt(s): " + reason);
        return;
    }
}

void Orchestrator::escalate(InstanceRun& run, int index, PhaseResult result, const std::string& reason) {
    auto& m = *run.machine;
    const std::string& phase = run.instance.plan.phases[index].name;
    run.results[index] = std::move(result);
    trace_.emit(run.instance.id, "phase.failed", {{"phase", phase}, {"reason", reason}});
    m.fail_phase(reason, ErrorKind::VERIFICATION_FAILURE);
    m.abort("phase '" + phase + "' cannot be verified: " + reason);
}

void Orchestrator::absorb(InstanceRun& run, int index, const PhaseResult& piece) {
    auto& m = *run.machine;
    for (const auto& t : piece.tasks) {
        if (t.status == TaskStatus::COMPLETED) m.add_modified_resources(t.modified_resources);
    }
    for (const auto& r : piece.replacements) {
        run.recovered.push_back("stalled worker replaced: " + r);
        m.log_error(ErrorRecord{ErrorKind::WORKER_STALL, index, "", "replaced " + r});
    }
    for (const auto& w : piece.fix_workers) {
        run.recovered.push_back("fix worker spawned: " + w);
    }
    for (const auto& a : piece.budget_actions) {
        const bool pressure = a.find("conservation") != std::string::npos;
        run.recovered.push_back(fmt::format("{}: {}", pressure ? "context pressure" : "budget", a));
        m.log_error(ErrorRecord{pressure ? ErrorKind::CONTEXT_PRESSURE : ErrorKind::BUDGET_EXCEEDED, index, "", a});
    }
    record_hook_faults(run, HookPoint::ON_RESOURCE_MUTATED, piece.mutation_hooks, index);
    for (const auto& hr : piece.mutation_hooks) {
        if (hr.status != HookStatus::SUCCESS) continue;
        if (const auto* advice = std::get_if<MutationAdvice>(&hr.advice)) {
            for (const auto& check : advice->follow_up_checks) {
                auto& checks = run.follow_up_checks;
                if (std::find(checks.begin(), checks.end(), check) == checks.end()) checks.push_back(check);
            }
        }
    }
    carry_deferred(run, index, piece.deferred);
}

void Orchestrator::record_hook_faults(InstanceRun& run, HookPoint point, const std::vector<HookResult>& results,
                                      int index) {
    for (const auto& r : results) {
        if (r.status != HookStatus::FAILED && r.status != HookStatus::TIMEOUT) continue;
        std::string message = fmt::format("hook '{}' {} at {}", r.hook_name, to_string(r.status), to_string(point));
        if (r.display_text) message += ": " + *r.display_text;
        run.recovered.push_back(message);
        run.instance.error_log.push_back(ErrorRecord{ErrorKind::HOOK_FAULT, index, "", message});
    }
}

void Orchestrator::carry_deferred(InstanceRun& run, int index, const std::vector<AgentTask>& deferred) {
    if (deferred.empty()) return;
    auto& m = *run.machine;
    int target = index + 1;
    while (run.prefetched.count(target)) ++target;

    if (target >= static_cast<int>(run.instance.plan.phases.size())) {
        if (!run.follow_up_index) {
            VerificationLevel level = VerificationLevel::NONE;
            for (const auto& p : run.instance.plan.phases) level = std::max(level, p.verification);
            run.follow_up_index = m.append_phase(Phase{FOLLOW_UP_PHASE, OwnershipModel::PARALLEL_SWARM, level, false, false});
        }
        target = *run.follow_up_index;
    }

    auto& bucket = run.carried[target];
    nlohmann::json ids = nlohmann::json::array();
    for (auto t : deferred) {
        t.status = TaskStatus::PENDING;
        t.worker_id.clear();
        ids.push_back(t.id);
        bucket.push_back(std::move(t));
    }
    const std::string& from = run.instance.plan.phases[index].name;
    const std::string& to = run.instance.plan.phases[target].name;
    run.recovered.push_back(fmt::format("{} non-critical task(s) deferred from '{}' to '{}'", deferred.size(), from, to));
    trace_.emit(run.instance.id, "tasks.deferred", {{"from", from}, {"to", to}, {"tasks", std::move(ids)}});
}

std::vector<TaskId> Orchestrator::failing_tasks(const InstanceRun& run, int index, const PhaseResult& result) const {
    static const std::set<std::string> none;
    auto d = run.dropped.find(index);
    const auto& dropped = d == run.dropped.end() ? none : d->second;

    std::vector<TaskId> failing;
    auto add = [&](const TaskId& id) {
        if (dropped.count(id) || std::find(failing.begin(), failing.end(), id) != failing.end()) return;
        failing.push_back(id);
    };
    for (const auto& id : result.escalated) add(id);
    for (const auto& t : result.tasks) {
        if (t.status == TaskStatus::FAILED) add(t.task_id);
    }
    return failing;
}

PhaseEvidence Orchestrator::evidence_for(const InstanceRun& run, int index, const PhaseResult& result) const {
    static const std::set<std::string> none;
    auto d = run.dropped.find(index);
    const auto& dropped = d == run.dropped.end() ? none : d->second;

    bool passed = true;
    bool all_explicit = true;
    for (const auto& t : result.tasks) {
        if (dropped.count(t.task_id) || t.status == TaskStatus::SKIPPED) continue;
        auto v = result.verdicts.find(t.task_id);
        if (v == result.verdicts.end()) {
            all_explicit = false;
            if (t.status != TaskStatus::COMPLETED) passed = false;
            continue;
        }
        if (!v->second.passed || t.status != TaskStatus::COMPLETED) passed = false;
    }

    PhaseEvidence e;
    e.verification_ran = result.verification_ran;
    e.verification_passed = result.verification_ran && passed;
    e.all_verdicts_explicit = result.verification_ran && all_explicit;
    e.security_checked = result.security_checked;
    auto rb = run.rollback_recorded.find(index);
    e.rollback_plan_recorded = rb != run.rollback_recorded.end() && rb->second;
    return e;
}

void Orchestrator::merge_retry(PhaseResult& result, PhaseResult retry) {
    for (auto& t : retry.tasks) {
        auto it = std::find_if(result.tasks.begin(), result.tasks.end(),
                               [&](const TaskResult& r) { return r.task_id == t.task_id; });
        if (it != result.tasks.end()) {
            *it = std::move(t);
        } else {
            result.tasks.push_back(std::move(t));
        }
    }
    for (auto& [id, v] : retry.verdicts) result.verdicts[id] = std::move(v);
    // 只有失败任务参与重试，上报列表以最后一次为准
    result.escalated = std::move(retry.escalated);
    auto append = [](auto& to, auto& from) {
        to.insert(to.end(), std::make_move_iterator(from.begin()), std::make_move_iterator(from.end()));
    };
    append(result.replacements, retry.replacements);
    append(result.fix_workers, retry.fix_workers);
    append(result.budget_actions, retry.budget_actions);
    append(result.mutation_hooks, retry.mutation_hooks);
    append(result.skipped, retry.skipped);
    result.verification_ran = result.verification_ran || retry.verification_ran;
    if (retry.verification_error) result.verification_error = std::move(retry.verification_error);
    result.security_checked = result.security_checked || retry.security_checked;
    result.conservation_mode = result.conservation_mode || retry.conservation_mode;
    result.waves += retry.waves;
    result.all_verdicts_explicit = result.verification_ran &&
        std::all_of(result.tasks.begin(), result.tasks.end(), [&](const TaskResult& r) {
            return r.status == TaskStatus::SKIPPED || result.verdicts.count(r.task_id) > 0;
        });
}

void Orchestrator::checkpoint(InstanceRun& run, int index) {
    const std::string& id = run.instance.id;
    const std::string& phase = run.instance.plan.phases[index].name;
    const SnapshotKey key = id + "/phase/" + std::to_string(index);

    nlohmann::json statuses = nlohmann::json::array();
    for (auto s : run.instance.phase_status) statuses.push_back(to_string(s));
    Context snapshot = {{"instance_id", id},
                        {"phase", phase},
                        {"index", index},
                        {"phase_status", std::move(statuses)},
                        {"modified_resources", run.instance.modified_resources},
                        {"session", session_.state().data}};
    auto r = run.results.find(index);
    if (r != run.results.end()) snapshot["result"] = phase_result_to_json(r->second);
    {
        std::lock_guard<std::mutex> lock(checkpoint_mutex_);
        checkpoints_.save_snapshot(key, snapshot);
    }
    run.machine->note("checkpoint after phase '" + phase + "'");

    if (config_.checkpoint_dir) {
        try {
            std::filesystem::create_directories(*config_.checkpoint_dir);
            session_.checkpoint((std::filesystem::path(*config_.checkpoint_dir) / (id + ".json")).string());
        } catch (const std::exception& e) {
            log::logger()->warn("Workflow '{}': session checkpoint failed: {}", id, e.what());
            run.instance.warnings.push_back(std::string("session checkpoint failed: ") + e.what());
        }
    }
    trace_.emit(id, "phase.checkpoint", {{"phase", phase}, {"key", key}});
}

void Orchestrator::finish(InstanceRun& run) {
    if (run.finished) return;
    run.finished = true;
    auto& m = *run.machine;
    const std::string& id = run.instance.id;

    DispatchSummary stop = dispatcher_.dispatch(HookPoint::ON_WORKFLOW_STOP, stop_context(run));
    trace_hooks(id, stop);
    record_hook_faults(run, HookPoint::ON_WORKFLOW_STOP, stop.results, m.current_phase());
    session_.apply_patches(stop.patches);
    for (const auto& r : stop.results) {
        if (r.status != HookStatus::SUCCESS) continue;
        if (const auto* advice = std::get_if<StopAdvice>(&r.advice)) {
            if (!advice->summary.empty()) {
                if (!run.summary.empty()) run.summary += "\n";
                run.summary += advice->summary;
            }
            run.instance.warnings.insert(run.instance.warnings.end(), advice->warnings.begin(), advice->warnings.end());
        }
    }

    if (stop.blocking_failure && m.status() == WorkflowStatus::ALL_PHASES_COMPLETED) {
        m.await_acknowledgment(stop.warnings.empty() ? "blocking stop hook failed" : join(stop.warnings, "; "));
        trace_.emit(id, "workflow.awaiting_acknowledgment", {{"warnings", stop.warnings}});
    } else {
        session_.record_outcome(run.classification.task_type, run.instance.plan.label,
                                m.status() == WorkflowStatus::ALL_PHASES_COMPLETED);
    }
    trace_.emit(id, "workflow.finished", {{"status", to_string(m.status())},
                                          {"modified_resources", run.instance.modified_resources},
                                          {"recovered", run.recovered.size()}});
}

void Orchestrator::sync_session(InstanceRun& run) {
    const auto& history = run.instance.history;
    if (run.synced_history < history.size()) {
        session_.append_transitions(run.request.id,
                                    std::vector<Transition>(history.begin() + static_cast<std::ptrdiff_t>(run.synced_history),
                                                            history.end()));
        run.synced_history = history.size();
    }
    session_.set_status(run.request.id, run.instance.status);
}

Context Orchestrator::submit_context(const InstanceRun& run) const {
    const auto& c = run.classification;
    return {{"instance_id", run.instance.id},
            {"request_id", run.request.id},
            {"description", run.request.description},
            {"file_hints", run.request.file_hints},
            {"score", c.score.dimensions},
            {"aggregate", c.score.aggregate},
            {"estimated_tokens", c.score.estimated_tokens},
            {"risk_tier", static_cast<int>(c.risk_tier)},
            {"risk_tier_name", to_string(c.risk_tier)},
            {"workflow", c.plan.label},
            {"workflow_class", to_string(c.plan.workflow_class)},
            {"task_type", c.task_type},
            {"session", session_.state().data}};
}

Context Orchestrator::stop_context(const InstanceRun& run) const {
    nlohmann::json phases = nlohmann::json::array();
    for (size_t i = 0; i < run.instance.plan.phases.size(); ++i) {
        phases.push_back({{"name", run.instance.plan.phases[i].name}, {"status", to_string(run.instance.phase_status[i])}});
    }
    Context ctx = {{"instance_id", run.instance.id},
                   {"request_id", run.request.id},
                   {"status", to_string(run.instance.status)},
                   {"workflow", run.instance.plan.label},
                   {"risk_tier", static_cast<int>(run.classification.risk_tier)},
                   {"phases", std::move(phases)},
                   {"modified_resources", run.instance.modified_resources},
                   {"errors", run.instance.error_log.size()},
                   {"recovered", run.recovered.size()},
                   {"aborted", run.instance.status == WorkflowStatus::ABORTED_FAILED},
                   {"session", session_.state().data}};
    ctx["abort_reason"] = run.instance.abort_reason ? nlohmann::json(*run.instance.abort_reason) : nlohmann::json(nullptr);
    return ctx;
}

std::vector<HookResult> Orchestrator::on_mutation(const std::string& instance_id, const std::string& resource,
                                                  const TaskResult& result) {
    Context ctx = {{"instance_id", instance_id},
                   {"resource", resource},
                   {"task_id", result.task_id},
                   {"worker_id", result.worker_id},
                   {"summary", result.summary},
                   {"session", session_.state().data}};
    DispatchSummary summary = dispatcher_.dispatch(HookPoint::ON_RESOURCE_MUTATED, ctx);
    trace_hooks(instance_id, summary);
    session_.apply_patches(summary.patches);
    return summary.results;
}

void Orchestrator::trace_hooks(const std::string& instance_id, const DispatchSummary& summary) {
    for (const auto& r : summary.results) {
        nlohmann::json data = hook_result_to_json(r);
        data["point"] = to_string(summary.point);
        trace_.emit(instance_id, "hook.result", std::move(data));
    }
    trace_.emit(instance_id, "hook.dispatched", {{"point", to_string(summary.point)},
                                                 {"hooks", summary.results.size()},
                                                 {"elapsed_ms", summary.elapsed.count()},
                                                 {"blocking_failure", summary.blocking_failure},
                                                 {"warnings", summary.warnings}});
}

WorkflowReport Orchestrator::make_report(const InstanceRun& run) const {
    const auto& c = run.classification;
    WorkflowReport r;
    r.instance_id = run.instance.id;
    r.request_id = run.request.id;
    r.status = run.instance.status;
    r.workflow_class = run.instance.plan.workflow_class;
    r.workflow_label = run.instance.plan.label;
    r.score = c.score;
    r.risk_tier = c.risk_tier;
    r.risk_reason = c.risk_reason;
    r.task_type = c.task_type;
    r.confidence = c.confidence;
    r.rule = c.rule;
    r.decision_factors = c.decision_factors;
    for (const auto& [index, result] : run.results) r.phases.push_back(result);
    r.modified_resources = run.instance.modified_resources;
    r.recovered = run.recovered;
    r.follow_up_checks = run.follow_up_checks;
    r.warnings = run.instance.warnings;
    r.abort_reason = run.instance.abort_reason;
    if (run.instance.status == WorkflowStatus::AWAITING_CONFIRMATION && run.instance.current_phase >= 0) {
        r.awaiting_phase = run.instance.plan.phases[run.instance.current_phase].name;
    }
    r.summary = run.summary;
    r.elapsed = run.instance.elapsed;

    if (config_.report_template) {
        try {
            r.rendered = InjaTemplateRenderer::render(*config_.report_template, r.to_json());
        } catch (const std::exception& e) {
            log::logger()->warn("Workflow '{}': report template failed: {}", r.instance_id, e.what());
            r.warnings.push_back(std::string("report template failed: ") + e.what());
        }
    }
    return r;
}

} // namespace swarmflow
