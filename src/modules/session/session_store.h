// modules/session/session_store.h
#ifndef SWARMFLOW_MODULES_SESSION_SESSION_STORE_H
#define SWARMFLOW_MODULES_SESSION_SESSION_STORE_H

#include "core/types/context.h"
#include "core/types/request.h"
#include "core/types/risk.h"
#include "core/types/workflow.h"
#include <nlohmann/json.hpp>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace swarmflow {

// 任务风险等级台账：只增不减
class RiskLedger {
public:
    struct Escalation {
        std::string task_id;
        RiskTier from = RiskTier::T0;
        RiskTier to = RiskTier::T0;
        std::string reason;
    };

    // 记录一次分类结果，返回生效等级（历史最大值）
    RiskTier record(const std::string& task_id, RiskTier tier);

    // 显式升级；低于当前等级时不生效
    RiskTier escalate(const std::string& task_id, RiskTier tier, const std::string& reason);

    std::optional<RiskTier> tier_of(const std::string& task_id) const;
    const std::vector<Escalation>& escalations() const { return escalations_; }
    nlohmann::json to_json() const;
    void load_json(const nlohmann::json& j);

private:
    std::map<std::string, RiskTier> tiers_;
    std::vector<Escalation> escalations_;
};

struct SessionRecord {
    std::string request_id;
    std::string instance_id;
    std::string workflow_label;
    std::string task_type;
    Score score;
    WorkflowStatus status = WorkflowStatus::NOT_STARTED;
    std::vector<Transition> history;
};

// 会话级持久状态，以 request id 为键；提交时创建，状态转换时追加
class SessionStore {
public:
    void create(const std::string& request_id, const std::string& instance_id, const Score& score,
                const std::string& workflow_label, const std::string& task_type);
    void append_transitions(const std::string& request_id, const std::vector<Transition>& transitions);
    void set_status(const std::string& request_id, WorkflowStatus status);
    std::optional<SessionRecord> record(const std::string& request_id) const;
    std::vector<std::string> request_ids() const;

    RiskTier record_tier(const std::string& task_id, RiskTier tier);
    RiskTier escalate_tier(const std::string& task_id, RiskTier tier, const std::string& reason);
    std::optional<RiskTier> tier_of(const std::string& task_id) const;

    // 工作流结果统计，用于分类说明（不改变分类结论）
    void record_outcome(const std::string& task_type, const std::string& workflow_label, bool success);
    std::optional<std::string> outcome_hint(const std::string& task_type) const;

    // 显式传递的版本化会话上下文
    SessionState state() const;
    uint64_t apply_patches(const std::vector<Context>& patches);

    nlohmann::json to_json() const;
    void load_json(const nlohmann::json& j);
    void checkpoint(const std::string& path) const;
    void restore(const std::string& path);

private:
    struct OutcomeStats {
        int total = 0;
        int success = 0;
    };

    mutable std::mutex mutex_;
    std::map<std::string, SessionRecord> records_;
    RiskLedger ledger_;
    std::map<std::string, std::map<std::string, OutcomeStats>> outcomes_; // task_type -> label -> stats
    SessionState state_;
};

} // namespace swarmflow

#endif // SWARMFLOW_MODULES_SESSION_SESSION_STORE_H
