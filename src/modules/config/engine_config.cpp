// modules/config/engine_config.cpp
#include "modules/config/engine_config.h"
#include "common/utils/yaml_json.h"
#include "core/types/errors.h"

namespace swarmflow {

namespace {

template<typename T>
T read(const nlohmann::json& section, const char* section_name, const char* key, const T& fallback) {
    if (!section.contains(key) || section[key].is_null()) return fallback;
    try {
        return section.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string(section_name) + "." + key + ": " + e.what());
    }
}

std::chrono::milliseconds read_ms(const nlohmann::json& section, const char* section_name, const char* key,
                                  std::chrono::milliseconds fallback) {
    auto v = read<int64_t>(section, section_name, key, fallback.count());
    if (v <= 0) {
        throw ConfigError(std::string(section_name) + "." + key + " must be positive");
    }
    return std::chrono::milliseconds(v);
}

const nlohmann::json& section_of(const nlohmann::json& j, const char* name) {
    static const nlohmann::json empty = nlohmann::json::object();
    if (!j.contains(name) || j[name].is_null()) return empty;
    if (!j[name].is_object()) {
        throw ConfigError(std::string("Config section '") + name + "' must be a mapping");
    }
    return j[name];
}

SwarmConfig parse_swarm(const nlohmann::json& s) {
    SwarmConfig c;
    c.grace_period = read_ms(s, "swarm", "grace_period_ms", c.grace_period);
    c.poll_interval = read_ms(s, "swarm", "poll_interval_ms", c.poll_interval);
    c.max_concurrent_workers = read(s, "swarm", "max_concurrent_workers", c.max_concurrent_workers);
    c.max_replacements_per_task = read(s, "swarm", "max_replacements_per_task", c.max_replacements_per_task);
    c.summary_limit = read(s, "swarm", "summary_limit", c.summary_limit);
    c.defer_non_critical = read(s, "swarm", "defer_non_critical", c.defer_non_critical);

    const auto& cons = section_of(s, "conservation");
    c.max_iterations = read(cons, "swarm.conservation", "max_iterations", c.max_iterations);
    c.max_spawned_workers = read(cons, "swarm.conservation", "max_spawned_workers", c.max_spawned_workers);
    c.max_log_bytes = read(cons, "swarm.conservation", "max_log_bytes", c.max_log_bytes);

    if (c.max_concurrent_workers < 1) {
        throw ConfigError("swarm.max_concurrent_workers must be at least 1");
    }
    if (c.max_replacements_per_task < 0) {
        throw ConfigError("swarm.max_replacements_per_task must not be negative");
    }
    return c;
}

} // namespace

EngineConfig EngineConfig::from_json(const nlohmann::json& j) {
    EngineConfig cfg;
    if (j.is_null()) return cfg;
    if (!j.is_object()) {
        throw ConfigError("Engine configuration must be a mapping");
    }

    cfg.log_level = read(j, "config", "log_level", cfg.log_level);
    cfg.swarm = parse_swarm(section_of(j, "swarm"));

    const auto& hooks = section_of(j, "hooks");
    const auto& budgets = section_of(hooks, "budgets");
    cfg.hook_budgets.on_request_submit =
        read_ms(budgets, "hooks.budgets", "on_request_submit_ms", cfg.hook_budgets.on_request_submit);
    cfg.hook_budgets.on_resource_mutated =
        read_ms(budgets, "hooks.budgets", "on_resource_mutated_ms", cfg.hook_budgets.on_resource_mutated);
    cfg.hook_budgets.on_workflow_stop =
        read_ms(budgets, "hooks.budgets", "on_workflow_stop_ms", cfg.hook_budgets.on_workflow_stop);
    if (hooks.contains("declared")) {
        if (!hooks["declared"].is_array()) {
            throw ConfigError("hooks.declared must be a list");
        }
        for (const auto& d : hooks["declared"]) {
            cfg.hooks.push_back(HookDeclaration::from_json(d));
        }
    }

    const auto& wf = section_of(j, "workflow");
    cfg.workflow.max_recovery_attempts = read(wf, "workflow", "max_recovery_attempts", cfg.workflow.max_recovery_attempts);
    cfg.workflow.max_snapshots = read(wf, "workflow", "max_snapshots", cfg.workflow.max_snapshots);
    cfg.workflow.max_snapshot_size_kb = read(wf, "workflow", "max_snapshot_size_kb", cfg.workflow.max_snapshot_size_kb);
    if (cfg.workflow.max_recovery_attempts < 0) {
        throw ConfigError("workflow.max_recovery_attempts must not be negative");
    }

    cfg.classifier = ClassificationRules::from_json(section_of(j, "classifier"));
    cfg.risk = RiskRules::from_json(section_of(j, "risk"));

    if (j.contains("report_template") && !j["report_template"].is_null()) {
        cfg.report_template = read<std::string>(j, "config", "report_template", "");
    }
    if (j.contains("checkpoint_dir") && !j["checkpoint_dir"].is_null()) {
        cfg.checkpoint_dir = read<std::string>(j, "config", "checkpoint_dir", "");
    }
    return cfg;
}

EngineConfig EngineConfig::from_yaml_file(const std::string& path) {
    return from_json(load_yaml_file(path));
}

EngineConfig EngineConfig::from_yaml_string(const std::string& content) {
    return from_json(load_yaml_string(content));
}

} // namespace swarmflow
