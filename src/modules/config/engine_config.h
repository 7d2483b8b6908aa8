// modules/config/engine_config.h
#ifndef SWARMFLOW_MODULES_CONFIG_ENGINE_CONFIG_H
#define SWARMFLOW_MODULES_CONFIG_ENGINE_CONFIG_H

#include "modules/classifier/classification_rules.h"
#include "modules/hooks/hook_dispatcher.h"
#include "modules/hooks/hooks.h"
#include "modules/risk/risk_classifier.h"
#include "modules/swarm/swarm_coordinator.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace swarmflow {

struct WorkflowSettings {
    int max_recovery_attempts = 2;
    size_t max_snapshots = 16;
    size_t max_snapshot_size_kb = 1024;
};

// 所有可调参数都有默认值；未知键忽略，类型错误抛出 ConfigError
struct EngineConfig {
    std::string log_level = "info";
    SwarmConfig swarm;
    HookBudgets hook_budgets;
    std::vector<HookDeclaration> hooks;
    WorkflowSettings workflow;
    ClassificationRules classifier = ClassificationRules::defaults();
    RiskRules risk = RiskRules::defaults();
    std::optional<std::string> report_template; // inja 模板，渲染 WorkflowReport
    std::optional<std::string> checkpoint_dir;  // 设置后每个 checkpoint 阶段写入会话快照

    static EngineConfig from_json(const nlohmann::json& j);
    static EngineConfig from_yaml_file(const std::string& path);
    static EngineConfig from_yaml_string(const std::string& content);
};

} // namespace swarmflow

#endif // SWARMFLOW_MODULES_CONFIG_ENGINE_CONFIG_H
