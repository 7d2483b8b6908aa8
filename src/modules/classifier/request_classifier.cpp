// modules/classifier/request_classifier.cpp
#include "modules/classifier/request_classifier.h"
#include "common/utils/text_match.h"
#include "common/log/logger.h"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace swarmflow {

namespace {

constexpr const char* ALL_DIMENSIONS[] = {
    dimension::TECHNICAL_COMPLEXITY, dimension::SCOPE_IMPACT, dimension::RISK_FACTOR,
    dimension::CONTEXT_LOAD, dimension::TIME_PRESSURE, dimension::CODE_MINIMALISM,
    dimension::SECURITY_SENSITIVITY, dimension::PATTERN_REUSABILITY};

double unit(double v) {
    return std::clamp(v, 0.0, 1.0);
}

bool blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](char c) { return std::isspace(static_cast<unsigned char>(c)); });
}

} // namespace

RequestClassifier::RequestClassifier(ClassificationRules rules, RiskClassifier risk)
    : rules_(std::move(rules)), risk_(std::move(risk)) {}

void RequestClassifier::set_dimension_scorer(const std::string& dimension, DimensionScorer scorer) {
    scorers_[dimension] = std::move(scorer);
}

std::string RequestClassifier::task_type(const std::string& description) const {
    const std::string lowered = to_lower(description);
    std::string best = rules_.default_task_type;
    int best_hits = 0;
    for (const auto& [name, pattern] : rules_.growth_patterns) {
        int hits = count_terms(lowered, pattern.keywords);
        if (hits > best_hits) {
            best = name;
            best_hits = hits;
        }
    }
    return best;
}

double RequestClassifier::score_dimension(const std::string& dim, const Request& request, const std::string& lowered) const {
    auto it = scorers_.find(dim);
    if (it != scorers_.end()) return it->second(request);

    if (dim == dimension::TECHNICAL_COMPLEXITY) return technical_complexity(lowered);
    if (dim == dimension::SCOPE_IMPACT) return scope_impact(request, lowered);
    if (dim == dimension::RISK_FACTOR) return risk_factor(lowered);
    if (dim == dimension::CONTEXT_LOAD) return context_load(request, lowered);
    if (dim == dimension::TIME_PRESSURE) return time_pressure(lowered);
    if (dim == dimension::CODE_MINIMALISM) return code_minimalism(lowered);
    if (dim == dimension::SECURITY_SENSITIVITY) return security_sensitivity(lowered);
    if (dim == dimension::PATTERN_REUSABILITY) return pattern_reusability(request, lowered);
    throw std::invalid_argument("Unknown dimension: " + dim);
}

double RequestClassifier::technical_complexity(const std::string& lowered) const {
    double raw = sum_weights(lowered, rules_.complexity_terms);
    double normalized = 1.0 / (1.0 + std::exp(-(raw - rules_.sigmoid_center) / rules_.sigmoid_scale));
    return unit(normalized) * SCORE_MAX;
}

double RequestClassifier::scope_impact(const Request& request, const std::string& lowered) const {
    double score = 0.0;
    score += std::min(0.4, count_terms(lowered, rules_.global_scope_terms) * 0.15);
    score += std::min(0.3, count_terms(lowered, rules_.multi_component_terms) * 0.1);

    size_t files = std::max<size_t>(static_cast<size_t>(std::max(0, request.session.loaded_files)),
                                    request.file_hints.size());
    if (files > 10) {
        score += 0.2;
    } else if (files > 5) {
        score += 0.1;
    }

    size_t words = split_words(lowered).size();
    if (words > 100) {
        score += 0.2;
    } else if (words > 50) {
        score += 0.1;
    }
    return unit(score) * SCORE_MAX;
}

double RequestClassifier::risk_factor(const std::string& lowered) const {
    return unit(sum_weights(lowered, rules_.risk_terms)) * SCORE_MAX;
}

double RequestClassifier::context_load(const Request& request, const std::string& lowered) const {
    double base = std::min(0.5, std::max(0, request.session.current_tokens) / 25000.0);
    double files = std::min(0.3, std::max(0, request.session.loaded_files) / 20.0);
    double growth = std::min(0.4, count_terms(lowered, rules_.growth_terms) * 0.08);
    return unit(base + files + growth) * SCORE_MAX;
}

double RequestClassifier::time_pressure(const std::string& lowered) const {
    double score = max_weight(lowered, rules_.time_pressure_terms);
    for (const auto& phrase : rules_.time_phrases) {
        if (contains_term(lowered, phrase)) {
            score = std::max(score, 0.4);
            break;
        }
    }
    int urgency = 0;
    for (const auto& [term, _] : rules_.time_pressure_terms) {
        if (contains_term(lowered, term)) ++urgency;
    }
    if (urgency > 2) score += 0.1;
    return unit(score) * SCORE_MAX;
}

double RequestClassifier::code_minimalism(const std::string& lowered) const {
    return unit(sum_weights(lowered, rules_.minimalism_terms)) * SCORE_MAX;
}

double RequestClassifier::security_sensitivity(const std::string& lowered) const {
    double score = max_weight(lowered, rules_.security_terms);
    int hits = 0;
    for (const auto& [term, _] : rules_.security_terms) {
        if (contains_term(lowered, term)) ++hits;
    }
    if (hits > 1) score += 0.1 * (hits - 1);
    return unit(score) * SCORE_MAX;
}

double RequestClassifier::pattern_reusability(const Request& request, const std::string& lowered) const {
    const auto& patterns = request.session.prior_patterns;
    const auto& recent = request.session.recent_files;

    double pattern_frac = 0.0;
    if (!patterns.empty()) {
        int hits = 0;
        for (const auto& p : patterns) {
            if (contains_term(lowered, to_lower(p))) ++hits;
        }
        pattern_frac = static_cast<double>(hits) / patterns.size();
    }

    double file_frac = 0.0;
    if (!request.file_hints.empty() && !recent.empty()) {
        int hits = 0;
        for (const auto& f : request.file_hints) {
            if (std::find(recent.begin(), recent.end(), f) != recent.end()) ++hits;
        }
        file_frac = static_cast<double>(hits) / request.file_hints.size();
    }
    return unit(0.6 * pattern_frac + 0.4 * file_frac) * SCORE_MAX;
}

bool RequestClassifier::context_overflow(const Score& score) const {
    return score.get(dimension::CONTEXT_LOAD) > rules_.context_overflow ||
           score.estimated_tokens > rules_.token_ceiling;
}

WorkflowPlan RequestClassifier::build_plan(WorkflowClass cls, const std::string& label, VerificationLevel level) const {
    WorkflowPlan plan;
    plan.workflow_class = cls;
    plan.label = label;
    auto it = rules_.plan_templates.find(cls);
    if (it == rules_.plan_templates.end() || it->second.empty()) {
        plan.phases.push_back(Phase{"execute", OwnershipModel::SINGLE_AGENT, level, false, false});
        return plan;
    }
    for (const auto& t : it->second) {
        plan.phases.push_back(Phase{t.name, t.ownership, level, t.checkpoint_after, t.independent});
    }
    return plan;
}

std::pair<std::string, double> RequestClassifier::weighted_label(const Score& score, double* confidence) const {
    std::vector<std::pair<std::string, double>> scored;
    for (const auto& [label, weights] : rules_.workflow_weights) {
        double s = 0.0;
        for (const auto& [dim, w] : weights) {
            s += score.get(dim) / SCORE_MAX * w;
        }
        scored.emplace_back(label, s);
    }
    if (scored.empty()) {
        if (confidence) *confidence = 0.6;
        return {"complete_system", 0.0};
    }
    std::stable_sort(scored.begin(), scored.end(), [](const auto& a, const auto& b) { return a.second > b.second; });
    double margin = scored.size() > 1 ? scored[0].second - scored[1].second : scored[0].second;
    if (confidence) *confidence = std::min(0.9, 0.5 + margin);
    return scored.front();
}

std::vector<std::pair<std::string, double>> RequestClassifier::alternatives(const Score& score, const std::string& selected) const {
    std::vector<std::pair<std::string, double>> out;
    for (const auto& [label, weights] : rules_.workflow_weights) {
        if (label == selected) continue;
        double s = 0.0;
        for (const auto& [dim, w] : weights) {
            s += score.get(dim) / SCORE_MAX * w;
        }
        s = unit(s);
        if (s > 0.2) out.emplace_back(label, s);
    }
    std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.second > b.second; });
    if (out.size() > 3) out.resize(3);
    return out;
}

std::vector<std::string> RequestClassifier::decision_factors(const Score& score, const std::string& label) const {
    std::vector<std::string> factors;
    auto add_if = [&](const char* dim, double threshold, const char* text) {
        double v = score.get(dim);
        if (v > threshold) factors.push_back(fmt::format("{} ({:.1f})", text, v));
    };
    add_if(dimension::TECHNICAL_COMPLEXITY, 6.0, "High technical complexity");
    add_if(dimension::SCOPE_IMPACT, 6.0, "Large scope impact");
    add_if(dimension::RISK_FACTOR, 5.0, "Significant risk factors");
    add_if(dimension::CONTEXT_LOAD, 6.0, "High context load");
    add_if(dimension::TIME_PRESSURE, 5.0, "Time pressure detected");
    add_if(dimension::SECURITY_SENSITIVITY, 5.0, "Security-sensitive change");
    add_if(dimension::PATTERN_REUSABILITY, 5.0, "Reuses known session patterns");
    if (score.estimated_tokens > rules_.token_ceiling) {
        factors.push_back(fmt::format("Predicted context {} tokens exceeds ceiling {}", score.estimated_tokens, rules_.token_ceiling));
    }

    if (label == "orchestrated") {
        factors.emplace_back("Suitable for streamlined execution");
    } else if (label == "complete_system") {
        factors.emplace_back("Requires comprehensive validation");
    } else if (label == "taskit") {
        factors.emplace_back("Benefits from phase-based approach");
    } else if (label == "aidevtasks") {
        factors.emplace_back("Feature development with PRD approach");
    }
    return factors;
}

ClassificationResult RequestClassifier::classify(const Request& request) const {
    ClassificationResult result;
    const std::string description = request.description.substr(0, rules_.max_description_length);
    const std::string lowered = to_lower(description);
    result.task_type = task_type(lowered);

    std::vector<std::string> unscorable;
    if (blank(description)) unscorable.emplace_back("empty description");

    for (const char* dim : ALL_DIMENSIONS) {
        double v = 0.0;
        try {
            v = score_dimension(dim, request, lowered);
        } catch (const std::exception& e) {
            log::logger()->warn("Request '{}': dimension {} unscorable: {}", request.id, dim, e.what());
            unscorable.push_back(std::string(dim) + ": " + e.what());
            continue;
        }
        if (!std::isfinite(v)) {
            unscorable.push_back(std::string(dim) + ": non-finite value");
            continue;
        }
        result.score.dimensions[dim] = std::clamp(v, SCORE_MIN, SCORE_MAX);
    }

    auto growth = rules_.growth_patterns.find(result.task_type);
    long predicted = growth != rules_.growth_patterns.end() ? growth->second.predicted_tokens() : 0;
    result.score.estimated_tokens = std::max(0, request.session.current_tokens) + predicted;

    double aggregate = 0.0;
    for (const auto& [dim, w] : rules_.dimension_weights) aggregate += w * result.score.get(dim);
    for (const auto& [dim, w] : rules_.relief_weights) aggregate -= w * result.score.get(dim);
    result.score.aggregate = std::clamp(aggregate, SCORE_MIN, SCORE_MAX);

    TaskDescriptor descriptor;
    descriptor.task_id = request.id;
    descriptor.description = description;
    descriptor.module_count = module_count(request.file_hints);
    descriptor.assessment = request.risk_assessment;
    RiskDecision risk = risk_.decide(descriptor);
    result.risk_tier = risk.tier;
    result.risk_reason = risk.reason;
    VerificationLevel level = RiskClassifier::verification_for(risk.tier);

    if (!unscorable.empty()) {
        result.fallback = true;
        result.rule = "Conservative fallback";
        result.confidence = 0.6;
        result.plan = build_plan(WorkflowClass::PHASE_BASED, "complete_system",
                                 std::max(level, VerificationLevel::FULL));
        for (const auto& u : unscorable) {
            result.decision_factors.push_back("Unscorable input (" + u + ")");
        }
        result.decision_factors.emplace_back("Requires comprehensive validation");
        log::logger()->warn("Request '{}' classified conservatively: {} unscorable input(s)", request.id, unscorable.size());
        return result;
    }

    WorkflowClass cls = WorkflowClass::PHASE_BASED;
    std::string label;
    if (context_overflow(result.score)) {
        // 上下文上限单独越界时强制分阶段执行，压过其他信号
        result.rule = "Context Overflow Protection";
        cls = WorkflowClass::PHASE_BASED;
        label = "taskit";
        result.confidence = 0.95;
    } else {
        const ClassificationRule* hit = nullptr;
        for (const auto& rule : rules_.rules) {
            bool all = std::all_of(rule.conditions.begin(), rule.conditions.end(), [&](const RuleCondition& c) {
                return c.matches(result.score.get(c.dimension));
            });
            if (all) {
                hit = &rule;
                break;
            }
        }
        if (hit) {
            result.rule = hit->name;
            cls = hit->workflow_class;
            label = hit->label;
            result.confidence = hit->confidence;
        } else {
            const double agg = result.score.aggregate;
            if (agg < rules_.direct_max_aggregate &&
                result.score.get(dimension::CONTEXT_LOAD) < rules_.direct_max_context_load) {
                cls = WorkflowClass::DIRECT;
            } else if (agg >= rules_.phase_min_aggregate ||
                       result.score.get(dimension::TECHNICAL_COMPLEXITY) > rules_.high_complexity) {
                cls = WorkflowClass::PHASE_BASED;
            } else {
                cls = WorkflowClass::FIXED_MULTI_PHASE;
            }
            result.rule = "Weighted factor analysis";
            label = weighted_label(result.score, &result.confidence).first;
        }
        if (label.empty()) {
            double ignored = 0.0;
            label = weighted_label(result.score, &ignored).first;
        }
    }

    result.plan = build_plan(cls, label, level);
    result.alternatives = alternatives(result.score, label);
    result.decision_factors = decision_factors(result.score, label);

    log::logger()->info("Request '{}' classified: {} ({}, rule '{}', aggregate {:.2f}, tier {})", request.id,
                        to_string(cls), label, result.rule, result.score.aggregate, to_string(result.risk_tier));
    return result;
}

} // namespace swarmflow
