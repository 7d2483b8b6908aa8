#ifndef SWARMFLOW_TYPES_TASK_H
#define SWARMFLOW_TYPES_TASK_H

#include "context.h"
#include "risk.h"
#include "hook.h"
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <chrono>
#include <cstdint>

namespace swarmflow {

using TaskId = std::string;
using WorkerId = std::string;

enum class TaskStatus : uint8_t {
    PENDING,
    IN_PROGRESS,
    COMPLETED,
    FAILED,
    REPLACED, // 原 worker 被替换，任务由替换者继续
    DEFERRED, // 预算控制推迟到后续阶段
    SKIPPED   // 节约模式下提前结束的非关键任务
};

// fix worker 收到的失败上下文
struct FailureContext {
    std::string error_detail;
    std::vector<std::string> failing_checks;
    int attempt = 0;
};

struct AgentTask {
    TaskId id;
    std::string phase;
    std::vector<std::string> resources; // 与兄弟任务不相交
    TaskStatus status = TaskStatus::PENDING;
    WorkerId worker_id;
    std::chrono::steady_clock::time_point start_time;
    bool critical = true;
    std::string description;
    TaskDescriptor risk;
    std::optional<FailureContext> failure;
};

// worker 执行函数的返回
struct TaskOutput {
    bool ok = true;
    Context output = Context::object();
    std::vector<std::string> modified_resources;
    std::string summary;
    std::string error;
    size_t log_bytes = 0;
};

struct TaskVerdict {
    bool passed = true;
    std::string detail;
    std::vector<std::string> failing_checks;
};

// 验证提供方的返回：task_id -> verdict
struct VerificationReport {
    std::map<TaskId, TaskVerdict> verdicts;
    bool security_checked = false;
};

struct TaskResult {
    TaskId task_id;
    WorkerId worker_id;
    TaskStatus status = TaskStatus::PENDING;
    std::vector<std::string> resources;
    std::vector<std::string> modified_resources;
    std::string summary;
    Context output = Context::object(); // 节约模式下不保留
    std::string error;
    bool critical = true;
    int fix_attempts = 0;
    bool verified = false;
    bool escalated = false;
};

struct PhaseResult {
    std::string phase;
    std::vector<TaskResult> tasks;
    std::map<TaskId, TaskVerdict> verdicts; // 最后一次验证的结论
    std::vector<AgentTask> deferred;
    std::vector<TaskId> skipped;
    std::vector<TaskId> escalated;
    std::vector<std::string> replacements; // "orig -> replacement"
    std::vector<WorkerId> fix_workers;
    std::vector<std::string> budget_actions;
    std::vector<HookResult> mutation_hooks;
    bool verification_ran = false;
    std::optional<std::string> verification_error; // 验证提供方自身出错，结论不可用
    bool security_checked = false;
    bool all_verdicts_explicit = false;
    bool conservation_mode = false;
    int waves = 0;

    const TaskResult* find(const TaskId& id) const {
        for (const auto& t : tasks) {
            if (t.task_id == id) return &t;
        }
        return nullptr;
    }
    bool succeeded() const { return escalated.empty() && !verification_error; }
};

const char* to_string(TaskStatus s);

} // namespace swarmflow

#endif // SWARMFLOW_TYPES_TASK_H
