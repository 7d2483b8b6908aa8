// modules/swarm/swarm_coordinator.cpp
#include "modules/swarm/swarm_coordinator.h"
#include "modules/trace/event_trace.h"
#include "common/log/logger.h"
#include "core/types/errors.h"
#include <algorithm>
#include <deque>
#include <stdexcept>
#include <unordered_map>

namespace swarmflow {

namespace {

nlohmann::json task_ids(const std::vector<AgentTask>& tasks) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& t : tasks) arr.push_back(t.id);
    return arr;
}

SwarmBudget make_budget(const SwarmConfig& config) {
    SwarmBudget budget;
    budget.max_concurrent_workers = config.max_concurrent_workers;
    budget.max_iterations = config.max_iterations;
    budget.max_spawned_workers = config.max_spawned_workers;
    budget.max_log_bytes = config.max_log_bytes;
    return budget;
}

TaskResult* find_result(PhaseResult& result, const TaskId& id) {
    for (auto& t : result.tasks) {
        if (t.task_id == id) return &t;
    }
    return nullptr;
}

// 修复 worker 沿用任务已有的尝试次数（恢复轮次由上层递增）
int incoming_attempt(const std::map<TaskId, AgentTask>& tasks_by_id, const TaskId& id) {
    auto it = tasks_by_id.find(id);
    if (it == tasks_by_id.end() || !it->second.failure) return 1;
    return std::max(1, it->second.failure->attempt);
}

} // namespace

AgentSwarmCoordinator::AgentSwarmCoordinator(WorkerFunction worker, SwarmConfig config)
    : worker_(std::move(worker)), config_(config), budget_(make_budget(config)) {
    if (!worker_) {
        throw std::invalid_argument("AgentSwarmCoordinator requires a worker function");
    }
}

void AgentSwarmCoordinator::validate_disjoint(const std::vector<AgentTask>& tasks) {
    std::unordered_map<std::string, TaskId> owner;
    std::unordered_map<TaskId, bool> seen;
    for (const auto& task : tasks) {
        if (seen.count(task.id)) {
            throw PlanningError("Duplicate task id '" + task.id + "' in phase");
        }
        seen[task.id] = true;
        for (const auto& r : task.resources) {
            auto [it, inserted] = owner.emplace(r, task.id);
            if (!inserted && it->second != task.id) {
                throw PlanningError("Tasks '" + it->second + "' and '" + task.id + "' both target resource '" + r + "'");
            }
        }
    }
}

void AgentSwarmCoordinator::emit(const std::string& type, const nlohmann::json& data) const {
    if (emit_) emit_(type, data);
}

PhaseResult AgentSwarmCoordinator::run_phase(const Phase& phase, std::vector<AgentTask> tasks, bool allow_defer) {
    validate_disjoint(tasks);

    PhaseResult result;
    result.phase = phase.name;
    std::map<TaskId, AgentTask> tasks_by_id;
    std::vector<TaskId> order;
    for (auto& t : tasks) {
        t.phase = phase.name;
        t.status = TaskStatus::PENDING;
        tasks_by_id[t.id] = t;
        order.push_back(t.id);
    }
    emit("phase.swarm_started", {{"phase", phase.name}, {"tasks", task_ids(tasks)},
                                 {"ownership", to_string(phase.ownership)}});

    WavePlan plan = budget_.plan(std::move(tasks), budget_.ceiling_for(phase), allow_defer && config_.defer_non_critical);
    result.deferred = std::move(plan.deferred);
    result.budget_actions = std::move(plan.actions);
    for (const auto& a : result.budget_actions) emit("budget.action", {{"phase", phase.name}, {"action", a}});
    std::deque<WorkUnit> queue = std::move(plan.units);

    while (!queue.empty()) {
        if (budget_.conservation_mode()) {
            // 关键任务全部完成后，剩余只含非关键任务的波次提前结束
            bool remaining_critical = std::any_of(queue.begin(), queue.end(), [](const WorkUnit& u) { return u.critical(); });
            bool critical_done = std::all_of(result.tasks.begin(), result.tasks.end(), [](const TaskResult& r) {
                return !r.critical || r.status == TaskStatus::COMPLETED;
            });
            if (!remaining_critical && critical_done) {
                size_t n = 0;
                for (auto& unit : queue) {
                    for (auto& t : unit.tasks) {
                        TaskResult r;
                        r.task_id = t.id;
                        r.status = TaskStatus::SKIPPED;
                        r.resources = t.resources;
                        r.critical = false;
                        r.summary = "skipped: all critical tasks complete under conservation mode";
                        result.tasks.push_back(std::move(r));
                        result.skipped.push_back(t.id);
                        ++n;
                    }
                }
                queue.clear();
                std::string action = "early completion: skipped " + std::to_string(n) + " non-critical task(s)";
                result.budget_actions.push_back(action);
                emit("budget.action", {{"phase", phase.name}, {"action", action}});
                break;
            }
        }

        const size_t limit = static_cast<size_t>(budget_.ceiling_for(phase));
        std::vector<WorkUnit> wave;
        while (!queue.empty() && wave.size() < limit) {
            wave.push_back(std::move(queue.front()));
            queue.pop_front();
        }
        ++result.waves;
        for (auto& [id, r] : run_wave(std::move(wave), result)) {
            result.tasks.push_back(std::move(r));
        }
        budget_.count_iteration();

        if (budget_.check_pressure()) {
            result.budget_actions.emplace_back("entered conservation mode");
            emit("swarm.conservation_mode", EventTrace::budget_snapshot(budget_.budget()));
            BudgetController::merge_related(queue, result.budget_actions);
        }
    }

    verify_and_fix(phase, result, tasks_by_id);
    result.conservation_mode = budget_.conservation_mode();

    // 结果按原始任务顺序排列
    std::stable_sort(result.tasks.begin(), result.tasks.end(), [&](const TaskResult& a, const TaskResult& b) {
        auto ia = std::find(order.begin(), order.end(), a.task_id);
        auto ib = std::find(order.begin(), order.end(), b.task_id);
        return ia < ib;
    });

    emit("phase.swarm_finished", {{"phase", phase.name}, {"waves", result.waves},
                                  {"escalated", result.escalated}, {"replacements", result.replacements},
                                  {"fix_workers", result.fix_workers}, {"deferred", task_ids(result.deferred)},
                                  {"skipped", result.skipped}, {"conservation_mode", result.conservation_mode}});
    return result;
}

void AgentSwarmCoordinator::spawn(const WorkerId& id, ActiveWorker& slot, std::optional<std::string> note,
                                  const std::shared_ptr<ResultChannel>& channel) {
    const bool replacement = note.has_value();
    for (auto& t : slot.pending) {
        t.worker_id = id;
        t.status = TaskStatus::IN_PROGRESS;
        t.start_time = std::chrono::steady_clock::now();
    }
    slot.signals = spawn_worker(worker_, id, slot.pending, channel, std::move(note));
    budget_.count_spawn();
    emit("worker.spawned", {{"worker", id}, {"tasks", task_ids(slot.pending)}, {"replacement", replacement}});
}

std::map<TaskId, TaskResult> AgentSwarmCoordinator::run_wave(std::vector<WorkUnit> units, PhaseResult& phase_result) {
    // 每波独立通道：被放弃的 worker 迟到的输出不会串到后续波次
    auto channel = std::make_shared<ResultChannel>();
    std::map<WorkerId, ActiveWorker> active;
    std::map<TaskId, TaskResult> done;
    size_t expected = 0;

    for (auto& unit : units) {
        ActiveWorker slot;
        slot.base_id = unit.worker_id;
        slot.pending = std::move(unit.tasks);
        expected += slot.pending.size();
        spawn(slot.base_id, slot, std::nullopt, channel);
        WorkerId id = slot.base_id;
        active.emplace(std::move(id), std::move(slot));
    }

    // 等待本波全部任务进入终态；每次等待以 poll_interval 为界
    while (done.size() < expected) {
        auto msg = channel->receive_for(config_.poll_interval);
        if (msg) {
            auto it = active.find(msg->worker_id);
            auto pending_it = it == active.end()
                ? std::vector<AgentTask>::iterator{}
                : std::find_if(it->second.pending.begin(), it->second.pending.end(),
                               [&](const AgentTask& t) { return t.id == msg->task_id; });
            if (it == active.end() || pending_it == it->second.pending.end()) {
                log::logger()->debug("Discarding superseded output of worker '{}' for task '{}'", msg->worker_id, msg->task_id);
                emit("worker.output_discarded", {{"worker", msg->worker_id}, {"task", msg->task_id}});
            } else {
                AgentTask task = std::move(*pending_it);
                it->second.pending.erase(pending_it);
                budget_.count_log_bytes(msg->log_bytes + msg->output.log_bytes);

                TaskResult r = make_result(task, msg->worker_id, std::move(msg->output));
                emit("worker.task_finished", {{"worker", r.worker_id}, {"task", r.task_id},
                                              {"status", to_string(r.status)}, {"summary", r.summary}});
                if (r.status == TaskStatus::COMPLETED) dispatch_mutations(r, phase_result);
                done[r.task_id] = std::move(r);
                if (it->second.pending.empty()) active.erase(it);
            }
        }
        handle_stalls(active, done, phase_result, channel);
    }
    return done;
}

void AgentSwarmCoordinator::handle_stalls(std::map<WorkerId, ActiveWorker>& active, std::map<TaskId, TaskResult>& done,
                                          PhaseResult& phase_result, const std::shared_ptr<ResultChannel>& channel) {
    const auto now = std::chrono::steady_clock::now();
    std::vector<WorkerId> stalled;
    for (const auto& [id, slot] : active) {
        if (now - slot.signals->last_progress() > config_.grace_period) stalled.push_back(id);
    }

    for (const auto& id : stalled) {
        auto node = active.extract(id);
        ActiveWorker slot = std::move(node.mapped());
        // 尽力取消，不等待确认
        slot.signals->cancelled.store(true);

        if (slot.replacements >= config_.max_replacements_per_task) {
            log::logger()->error("Worker '{}' stalled; replacement limit {} reached", id, config_.max_replacements_per_task);
            for (const auto& t : slot.pending) {
                TaskResult r;
                r.task_id = t.id;
                r.worker_id = id;
                r.status = TaskStatus::FAILED;
                r.resources = t.resources;
                r.critical = t.critical;
                r.error = "worker stalled; replacement limit (" + std::to_string(config_.max_replacements_per_task) + ") reached";
                done[t.id] = std::move(r);
            }
            emit("worker.stall_limit", {{"worker", id}, {"tasks", task_ids(slot.pending)}});
            continue;
        }

        ++slot.replacements;
        WorkerId new_id = replacement_id(slot.base_id, slot.replacements);
        std::string note = "Replacing stalled worker '" + id + "' (no progress for more than " +
                           std::to_string(config_.grace_period.count()) + " ms)";
        log::logger()->warn("{} with '{}'", note, new_id);
        phase_result.replacements.push_back(id + " -> " + new_id);
        for (auto& t : slot.pending) t.status = TaskStatus::REPLACED;

        nlohmann::json resources = nlohmann::json::array();
        for (const auto& t : slot.pending) {
            for (const auto& r : t.resources) resources.push_back(r);
        }
        emit("worker.replaced", {{"original", id}, {"replacement", new_id}, {"tasks", task_ids(slot.pending)},
                                 {"resources", resources}});

        spawn(new_id, slot, note, channel);
        active.emplace(new_id, std::move(slot));
    }
}

TaskResult AgentSwarmCoordinator::make_result(const AgentTask& task, const WorkerId& worker, TaskOutput output) {
    TaskResult r;
    r.task_id = task.id;
    r.worker_id = worker;
    r.status = output.ok ? TaskStatus::COMPLETED : TaskStatus::FAILED;
    r.resources = task.resources;
    r.critical = task.critical;
    r.error = std::move(output.error);
    r.summary = std::move(output.summary);
    if (task.failure) r.fix_attempts = task.failure->attempt;

    // 只接受任务自身资源集合内的修改
    for (auto& m : output.modified_resources) {
        if (task.resources.empty() ||
            std::find(task.resources.begin(), task.resources.end(), m) != task.resources.end()) {
            r.modified_resources.push_back(std::move(m));
        } else {
            log::logger()->warn("Task '{}' reported modifying '{}' outside its resource set; ignored", task.id, m);
        }
    }

    if (budget_.conservation_mode()) {
        if (r.summary.size() > config_.summary_limit) {
            r.summary = r.summary.substr(0, config_.summary_limit) + "...";
        }
    } else {
        r.output = std::move(output.output);
    }
    return r;
}

void AgentSwarmCoordinator::dispatch_mutations(const TaskResult& result, PhaseResult& phase_result) {
    if (!mutation_observer_) return;
    for (const auto& resource : result.modified_resources) {
        for (auto& hr : mutation_observer_(resource, result)) {
            phase_result.mutation_hooks.push_back(std::move(hr));
        }
    }
}

void AgentSwarmCoordinator::verify_and_fix(const Phase& phase, PhaseResult& result, std::map<TaskId, AgentTask>& tasks_by_id) {
    std::map<TaskId, FailureContext> failing;
    for (const auto& r : result.tasks) {
        if (r.status == TaskStatus::FAILED) {
            failing[r.task_id] = FailureContext{r.error, {}, incoming_attempt(tasks_by_id, r.task_id)};
        }
    }

    if (verifier_) {
        VerificationReport report;
        try {
            report = verifier_(result);
        } catch (const std::exception& e) {
            // worker 结果保留，由上层决定中止
            fail_verification(phase, result, e.what());
            return;
        }
        result.verification_ran = true;
        result.security_checked = report.security_checked;
        for (auto& r : result.tasks) {
            if (r.status != TaskStatus::COMPLETED) continue;
            auto it = report.verdicts.find(r.task_id);
            if (it == report.verdicts.end()) continue;
            result.verdicts[r.task_id] = it->second;
            r.verified = it->second.passed;
            if (!it->second.passed) {
                failing[r.task_id] = FailureContext{it->second.detail, it->second.failing_checks,
                                                    incoming_attempt(tasks_by_id, r.task_id)};
            }
        }
        emit("phase.verified", {{"phase", phase.name}, {"failing", failing.size()},
                                {"security_checked", report.security_checked}});
    }

    if (!failing.empty()) {
        // 只针对失败任务启动修复 worker，通过的任务不重跑
        std::vector<WorkUnit> fix_units;
        for (const auto& [id, ctx] : failing) {
            AgentTask fix = tasks_by_id.at(id);
            fix.failure = ctx;
            WorkUnit unit;
            unit.worker_id = fix_worker_id(id, ctx.attempt);
            unit.tasks.push_back(std::move(fix));
            result.fix_workers.push_back(unit.worker_id);
            emit("worker.fix_scheduled", {{"task", id}, {"worker", unit.worker_id}, {"error", ctx.error_detail},
                                          {"failing_checks", ctx.failing_checks}});
            fix_units.push_back(std::move(unit));
        }

        std::map<TaskId, TaskResult> fixed;
        const size_t limit = static_cast<size_t>(budget_.ceiling_for(phase));
        for (size_t i = 0; i < fix_units.size(); i += limit) {
            std::vector<WorkUnit> batch;
            for (size_t k = i; k < std::min(fix_units.size(), i + limit); ++k) batch.push_back(std::move(fix_units[k]));
            ++result.waves;
            for (auto& [id, r] : run_wave(std::move(batch), result)) fixed[id] = std::move(r);
            budget_.count_iteration();
        }

        PhaseResult recheck;
        recheck.phase = result.phase;
        for (const auto& [id, r] : fixed) {
            if (r.status == TaskStatus::COMPLETED) recheck.tasks.push_back(r);
        }
        VerificationReport second;
        if (verifier_ && !recheck.tasks.empty()) {
            try {
                second = verifier_(recheck);
            } catch (const std::exception& e) {
                fail_verification(phase, result, e.what());
            }
        }

        for (auto& [id, fr] : fixed) {
            TaskResult* original = find_result(result, id);
            bool passed = fr.status == TaskStatus::COMPLETED;
            auto vit = second.verdicts.find(id);
            if (passed && vit != second.verdicts.end()) {
                passed = vit->second.passed;
                result.verdicts[id] = vit->second;
                fr.verified = passed;
            }
            fr.fix_attempts = 1;
            if (!passed) {
                // 第二次连续失败：上报，由状态机决定恢复或升级
                fr.status = TaskStatus::FAILED;
                fr.escalated = true;
                if (fr.error.empty() && vit != second.verdicts.end()) fr.error = vit->second.detail;
                result.escalated.push_back(id);
                log::logger()->warn("Task '{}' failed again after fix worker; escalating", id);
                emit("task.escalated", {{"task", id}, {"error", fr.error}});
            }
            if (original) *original = std::move(fr);
        }
    }

    if (result.verification_ran && !result.verification_error) {
        result.all_verdicts_explicit = std::all_of(result.tasks.begin(), result.tasks.end(), [&](const TaskResult& r) {
            return r.status == TaskStatus::SKIPPED || result.verdicts.count(r.task_id) > 0;
        });
    }
}

void AgentSwarmCoordinator::fail_verification(const Phase& phase, PhaseResult& result, const std::string& error) {
    log::logger()->error("Verification of phase '{}' failed: {}", phase.name, error);
    result.verification_ran = false;
    result.verification_error = error;
    emit("phase.verification_failed", {{"phase", phase.name}, {"error", error}});
}

} // namespace swarmflow
