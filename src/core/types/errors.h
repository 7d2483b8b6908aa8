#ifndef SWARMFLOW_TYPES_ERRORS_H
#define SWARMFLOW_TYPES_ERRORS_H

#include <stdexcept>
#include <string>
#include <vector>
#include <cstdint>

namespace swarmflow {

// 错误分类：只有 AbortedFailed 和未解决的 T3 确认门会暴露给用户
enum class ErrorKind : uint8_t {
    INCOMPLETE_RISK_ASSESSMENT,
    HOOK_FAULT,
    WORKER_STALL,
    VERIFICATION_FAILURE,
    BUDGET_EXCEEDED,
    CONTEXT_PRESSURE,
    PLANNING_ERROR,
    ABORTED
};

const char* to_string(ErrorKind kind);

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// T1-T3 任务缺少风险问答时抛出，阻止任务启动
class IncompleteRiskAssessment : public Error {
public:
    IncompleteRiskAssessment(const std::string& task_id, std::vector<std::string> missing_fields);

    const std::string& task_id() const noexcept { return task_id_; }
    const std::vector<std::string>& missing_fields() const noexcept { return missing_fields_; }

private:
    std::string task_id_;
    std::vector<std::string> missing_fields_;
};

// Hook 内部故障，只在 dispatcher 内部使用，从不传播给调用方
class HookFault : public Error {
public:
    explicit HookFault(const std::string& message) : Error(ErrorKind::HOOK_FAULT, message) {}
};

class VerificationFailure : public Error {
public:
    explicit VerificationFailure(const std::string& message)
        : Error(ErrorKind::VERIFICATION_FAILURE, message) {}
};

// 兄弟任务资源重叠：规划 bug，不是运行时竞争
class PlanningError : public Error {
public:
    explicit PlanningError(const std::string& message) : Error(ErrorKind::PLANNING_ERROR, message) {}
};

class InvalidTransition : public std::logic_error {
public:
    explicit InvalidTransition(const std::string& message) : std::logic_error(message) {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

// 实例内部错误日志条目（append-only）
struct ErrorRecord {
    ErrorKind kind;
    int phase_index = -1;
    std::string task_id;
    std::string message;
};

} // namespace swarmflow

#endif // SWARMFLOW_TYPES_ERRORS_H
