// modules/classifier/classification_rules.cpp
#include "modules/classifier/classification_rules.h"
#include "core/types/errors.h"
#include "core/types/request.h"
#include <cmath>

namespace swarmflow {

namespace {

RuleCondition above(const char* dim, double v) {
    RuleCondition c;
    c.dimension = dim;
    c.gt = v;
    return c;
}

RuleCondition below(const char* dim, double v) {
    RuleCondition c;
    c.dimension = dim;
    c.lt = v;
    return c;
}

RuleCondition between(const char* dim, double lo, double hi) {
    RuleCondition c;
    c.dimension = dim;
    c.ge = lo;
    c.le = hi;
    return c;
}

template<typename T>
T read_as(const nlohmann::json& j, const char* key, const T& fallback) {
    if (!j.contains(key)) return fallback;
    try {
        return j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("classifier.") + key + ": " + e.what());
    }
}

OwnershipModel parse_ownership(const std::string& s) {
    if (s == "single_agent" || s == "single") return OwnershipModel::SINGLE_AGENT;
    if (s == "parallel_swarm" || s == "swarm") return OwnershipModel::PARALLEL_SWARM;
    throw ConfigError("Unknown ownership model '" + s + "'");
}

std::optional<double> opt_number(const nlohmann::json& j, const char* key) {
    if (!j.contains(key)) return std::nullopt;
    if (!j[key].is_number()) {
        throw ConfigError(std::string("rule condition '") + key + "' must be a number");
    }
    return j[key].get<double>();
}

ClassificationRule parse_rule(const nlohmann::json& j) {
    ClassificationRule r;
    try {
        r.name = j.at("name").get<std::string>();
        r.workflow_class = parse_workflow_class(j.at("workflow_class").get<std::string>());
        r.label = j.value("label", std::string());
        r.confidence = j.value("confidence", r.confidence);
        for (const auto& cj : j.at("when")) {
            RuleCondition c;
            c.dimension = cj.at("dimension").get<std::string>();
            c.gt = opt_number(cj, "gt");
            c.lt = opt_number(cj, "lt");
            c.ge = opt_number(cj, "ge");
            c.le = opt_number(cj, "le");
            r.conditions.push_back(std::move(c));
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Invalid classification rule: " + std::string(e.what()));
    }
    return r;
}

std::vector<PhaseTemplate> parse_plan(const nlohmann::json& j) {
    if (!j.is_array() || j.empty()) {
        throw ConfigError("Plan template must be a non-empty list of phases");
    }
    std::vector<PhaseTemplate> phases;
    for (const auto& pj : j) {
        PhaseTemplate p;
        try {
            p.name = pj.at("name").get<std::string>();
            p.ownership = parse_ownership(pj.value("ownership", std::string("single_agent")));
            p.checkpoint_after = pj.value("checkpoint_after", false);
            p.independent = pj.value("independent", false);
        } catch (const nlohmann::json::exception& e) {
            throw ConfigError("Invalid phase template: " + std::string(e.what()));
        }
        phases.push_back(std::move(p));
    }
    return phases;
}

} // namespace

bool RuleCondition::matches(double value) const {
    if (gt && !(value > *gt)) return false;
    if (lt && !(value < *lt)) return false;
    if (ge && !(value >= *ge)) return false;
    if (le && !(value <= *le)) return false;
    return true;
}

long GrowthPattern::predicted_tokens() const {
    return std::lround(base_files * tokens_per_file * research_factor);
}

WorkflowClass parse_workflow_class(const std::string& s) {
    if (s == "direct") return WorkflowClass::DIRECT;
    if (s == "fixed_multi_phase" || s == "fixed") return WorkflowClass::FIXED_MULTI_PHASE;
    if (s == "phase_based" || s == "phased") return WorkflowClass::PHASE_BASED;
    throw ConfigError("Unknown workflow class '" + s + "'");
}

ClassificationRules ClassificationRules::defaults() {
    using namespace dimension;
    ClassificationRules r;

    r.complexity_terms = {
        {"architecture", 0.3}, {"refactor", 0.25}, {"migrate", 0.25}, {"system", 0.2},
        {"complex", 0.2}, {"algorithm", 0.25}, {"optimization", 0.2}, {"integration", 0.2},
        {"scalable", 0.2}, {"distributed", 0.3},
        {"implement", 0.15}, {"create", 0.1}, {"build", 0.1}, {"design", 0.15}, {"api", 0.15},
        {"database", 0.15}, {"auth", 0.15}, {"authentication", 0.15}, {"security", 0.2},
        {"fix", -0.1}, {"update", -0.05}, {"change", -0.05}, {"small", -0.1}, {"simple", -0.15},
        {"quick", -0.1}, {"typo", -0.2}};
    r.risk_terms = {
        {"breaking", 0.4}, {"delete", 0.3}, {"remove", 0.3}, {"drop", 0.3}, {"migrate", 0.25},
        {"production", 0.3}, {"live", 0.3}, {"critical", 0.4},
        {"security", 0.25}, {"auth", 0.2}, {"authentication", 0.2}, {"password", 0.25}, {"permission", 0.2},
        {"admin", 0.2},
        {"schema", 0.2}, {"database", 0.15}, {"api", 0.1},
        {"credential", 0.3}, {"signing", 0.25}, {"payment", 0.3}, {"rotate", 0.15},
        {"change", 0.05}, {"modify", 0.05}, {"update", 0.05}, {"refactor", 0.1}};
    r.time_pressure_terms = {
        {"urgent", 0.3}, {"asap", 0.35}, {"immediately", 0.35}, {"critical", 0.4}, {"emergency", 0.45},
        {"quickly", 0.25}, {"fast", 0.2}, {"soon", 0.15}, {"deadline", 0.25}, {"priority", 0.2}, {"rush", 0.3}};
    r.time_phrases = {"today", "tonight", "tomorrow", "this morning", "right now"};
    r.global_scope_terms = {"all", "entire", "every", "across", "throughout", "system-wide"};
    r.multi_component_terms = {"multiple", "several", "various", "different", "many"};
    r.growth_terms = {"implement", "create", "build", "design", "refactor",
                      "architecture", "system", "complex", "integration"};
    r.minimalism_terms = {
        {"typo", 0.5}, {"minimal", 0.4}, {"small", 0.3}, {"simple", 0.3}, {"tweak", 0.3},
        {"one-line", 0.5}, {"quick", 0.2}, {"rename", 0.2}, {"only", 0.1}};
    r.security_terms = {
        {"security", 0.6}, {"auth", 0.5}, {"authentication", 0.5}, {"authorization", 0.5}, {"password", 0.7},
        {"credential", 0.8}, {"token", 0.5}, {"encrypt", 0.6}, {"secret", 0.7}, {"permission", 0.5},
        {"signing", 0.7}, {"vulnerab*", 0.8},
        {"pii", 0.7}, {"privacy", 0.6}, {"payment", 0.7}, {"certificate", 0.6}};

    r.dimension_weights = {
        {TECHNICAL_COMPLEXITY, 0.25}, {SCOPE_IMPACT, 0.15}, {RISK_FACTOR, 0.2},
        {CONTEXT_LOAD, 0.15}, {TIME_PRESSURE, 0.05}, {SECURITY_SENSITIVITY, 0.2}};
    r.relief_weights = {{CODE_MINIMALISM, 0.1}, {PATTERN_REUSABILITY, 0.05}};

    r.workflow_weights = {
        {"orchestrated", {{TECHNICAL_COMPLEXITY, 0.4}, {SCOPE_IMPACT, 0.2}, {RISK_FACTOR, 0.2},
                          {CONTEXT_LOAD, 0.1}, {TIME_PRESSURE, 0.1}}},
        {"complete_system", {{TECHNICAL_COMPLEXITY, 0.25}, {SCOPE_IMPACT, 0.2}, {RISK_FACTOR, 0.35},
                             {CONTEXT_LOAD, 0.15}, {TIME_PRESSURE, 0.05}}},
        {"taskit", {{TECHNICAL_COMPLEXITY, 0.15}, {SCOPE_IMPACT, 0.35}, {RISK_FACTOR, 0.15},
                    {CONTEXT_LOAD, 0.3}, {TIME_PRESSURE, 0.05}}},
        {"aidevtasks", {{TECHNICAL_COMPLEXITY, 0.3}, {SCOPE_IMPACT, 0.25}, {RISK_FACTOR, 0.2},
                        {CONTEXT_LOAD, 0.15}, {TIME_PRESSURE, 0.1}}}};

    r.rules = {
        {"High Complexity", {above(TECHNICAL_COMPLEXITY, 8.0)}, WorkflowClass::PHASE_BASED, "complete_system", 0.85},
        {"Critical Risk Protection", {above(RISK_FACTOR, 8.0)}, WorkflowClass::PHASE_BASED, "complete_system", 0.9},
        {"Simple Low-Risk Task",
         {below(TECHNICAL_COMPLEXITY, 3.0), below(SCOPE_IMPACT, 4.0), below(RISK_FACTOR, 3.0),
          below(SECURITY_SENSITIVITY, 3.0), below(CONTEXT_LOAD, 4.0)},
         WorkflowClass::DIRECT, "orchestrated", 0.85},
        {"Large Scope Task", {above(SCOPE_IMPACT, 6.0), above(CONTEXT_LOAD, 5.0)},
         WorkflowClass::PHASE_BASED, "taskit", 0.8},
        {"High-Risk Complex Task", {above(RISK_FACTOR, 5.0), above(TECHNICAL_COMPLEXITY, 4.0)},
         WorkflowClass::PHASE_BASED, "complete_system", 0.85},
        {"Feature Development Task",
         {between(TECHNICAL_COMPLEXITY, 4.0, 7.0), between(SCOPE_IMPACT, 4.0, 7.0), below(RISK_FACTOR, 6.0)},
         WorkflowClass::FIXED_MULTI_PHASE, "aidevtasks", 0.75}};

    r.growth_patterns = {
        {"bug_fix", {{"fix", "bug", "typo", "error", "broken", "issue"}, 1.2, 800, 1.3}},
        {"feature", {{"feature", "add", "implement", "create", "build"}, 3.5, 1200, 2.1}},
        {"refactor", {{"refactor", "restructure", "clean up", "cleanup"}, 4.8, 1000, 2.8}},
        {"architecture", {{"architecture", "redesign", "distributed", "microservice"}, 8.2, 1400, 3.5}},
        {"optimization", {{"optimize", "optimization", "performance", "latency", "speed up"}, 2.1, 900, 1.7}},
        {"security",
         {{"security", "auth", "authentication", "credential", "encrypt", "vulnerab*", "permission"}, 3.8, 1100, 2.4}},
        {"ui", {{"ui", "page", "button", "layout", "style", "component"}, 2.3, 700, 1.4}}};

    r.plan_templates = {
        {WorkflowClass::DIRECT, {{"execute", OwnershipModel::SINGLE_AGENT, false, false}}},
        {WorkflowClass::FIXED_MULTI_PHASE,
         {{"plan", OwnershipModel::SINGLE_AGENT, false, false},
          {"implement", OwnershipModel::PARALLEL_SWARM, false, false},
          {"verify", OwnershipModel::SINGLE_AGENT, false, false}}},
        {WorkflowClass::PHASE_BASED,
         {{"analyze", OwnershipModel::SINGLE_AGENT, true, false},
          {"plan", OwnershipModel::SINGLE_AGENT, true, false},
          {"implement", OwnershipModel::PARALLEL_SWARM, true, false},
          {"verify", OwnershipModel::PARALLEL_SWARM, false, false}}}};
    return r;
}

ClassificationRules ClassificationRules::from_json(const nlohmann::json& j) {
    ClassificationRules r = defaults();
    if (j.is_null()) return r;
    if (!j.is_object()) {
        throw ConfigError("classifier section must be a mapping");
    }

    r.complexity_terms = read_as(j, "complexity_terms", r.complexity_terms);
    r.risk_terms = read_as(j, "risk_terms", r.risk_terms);
    r.time_pressure_terms = read_as(j, "time_pressure_terms", r.time_pressure_terms);
    r.time_phrases = read_as(j, "time_phrases", r.time_phrases);
    r.global_scope_terms = read_as(j, "global_scope_terms", r.global_scope_terms);
    r.multi_component_terms = read_as(j, "multi_component_terms", r.multi_component_terms);
    r.growth_terms = read_as(j, "growth_terms", r.growth_terms);
    r.minimalism_terms = read_as(j, "minimalism_terms", r.minimalism_terms);
    r.security_terms = read_as(j, "security_terms", r.security_terms);
    r.dimension_weights = read_as(j, "weights", r.dimension_weights);
    r.relief_weights = read_as(j, "relief_weights", r.relief_weights);
    r.workflow_weights = read_as(j, "workflow_weights", r.workflow_weights);

    if (j.contains("thresholds")) {
        const auto& t = j["thresholds"];
        r.direct_max_aggregate = read_as(t, "direct_max_aggregate", r.direct_max_aggregate);
        r.direct_max_context_load = read_as(t, "direct_max_context_load", r.direct_max_context_load);
        r.phase_min_aggregate = read_as(t, "phase_min_aggregate", r.phase_min_aggregate);
        r.high_complexity = read_as(t, "high_complexity", r.high_complexity);
        r.context_overflow = read_as(t, "context_overflow", r.context_overflow);
        r.token_ceiling = read_as(t, "token_ceiling", r.token_ceiling);
        r.max_description_length = read_as(t, "max_description_length", r.max_description_length);
    }
    if (r.direct_max_aggregate > r.phase_min_aggregate) {
        throw ConfigError("classifier.thresholds: direct_max_aggregate must not exceed phase_min_aggregate");
    }

    if (j.contains("rules")) {
        if (!j["rules"].is_array()) {
            throw ConfigError("classifier.rules must be a list");
        }
        r.rules.clear();
        for (const auto& rj : j["rules"]) {
            r.rules.push_back(parse_rule(rj));
        }
    }

    if (j.contains("plans")) {
        const auto& plans = j["plans"];
        if (!plans.is_object()) {
            throw ConfigError("classifier.plans must be a mapping of workflow class to phases");
        }
        for (auto it = plans.begin(); it != plans.end(); ++it) {
            r.plan_templates[parse_workflow_class(it.key())] = parse_plan(it.value());
        }
    }

    if (j.contains("growth_patterns")) {
        const auto& gp = j["growth_patterns"];
        if (!gp.is_object()) {
            throw ConfigError("classifier.growth_patterns must be a mapping");
        }
        for (auto it = gp.begin(); it != gp.end(); ++it) {
            GrowthPattern p;
            p.keywords = read_as(it.value(), "keywords", p.keywords);
            p.base_files = read_as(it.value(), "base_files", p.base_files);
            p.tokens_per_file = read_as(it.value(), "tokens_per_file", p.tokens_per_file);
            p.research_factor = read_as(it.value(), "research_factor", p.research_factor);
            r.growth_patterns[it.key()] = std::move(p);
        }
    }
    r.default_task_type = read_as(j, "default_task_type", r.default_task_type);
    return r;
}

} // namespace swarmflow
