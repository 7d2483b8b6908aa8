#ifndef SWARMFLOW_TYPES_HOOK_H
#define SWARMFLOW_TYPES_HOOK_H

#include "context.h"
#include "risk.h"
#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <chrono>
#include <cstdint>

namespace swarmflow {

enum class HookPoint : uint8_t {
    ON_REQUEST_SUBMIT,
    ON_RESOURCE_MUTATED,
    ON_WORKFLOW_STOP
};

enum class HookStatus : uint8_t { SUCCESS, FAILED, SKIPPED, TIMEOUT };

// 每个生命周期点已知的结果形状
struct SubmitAdvice {
    std::optional<RiskTier> escalate_to;
    std::vector<std::string> notes;
};

struct MutationAdvice {
    std::vector<std::string> follow_up_checks;
};

struct StopAdvice {
    std::string summary;
    std::vector<std::string> warnings;
};

using HookAdvice = std::variant<std::monostate, SubmitAdvice, MutationAdvice, StopAdvice>;

struct HookResult {
    std::string hook_name;
    HookStatus status = HookStatus::SUCCESS;
    nlohmann::json payload = nlohmann::json::object(); // provider 私有数据
    std::optional<std::string> display_text;
    std::optional<Context> state_patch;
    HookAdvice advice;
    bool blocking = false;
    std::chrono::milliseconds duration{0};
};

using HookContext = Context;

class Hook {
public:
    virtual ~Hook() = default;

    virtual std::string name() const = 0;
    virtual int priority() const = 0; // 小的先执行
    virtual std::chrono::milliseconds timeout() const = 0;
    virtual bool blocking() const { return false; }
    virtual bool should_run(const HookContext& ctx) const = 0;
    [[nodiscard]] virtual HookResult run(const HookContext& ctx) = 0;
};

const char* to_string(HookPoint point);
const char* to_string(HookStatus status);
HookPoint parse_hook_point(const std::string& s);

} // namespace swarmflow

#endif // SWARMFLOW_TYPES_HOOK_H
