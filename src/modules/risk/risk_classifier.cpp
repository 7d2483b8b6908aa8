// modules/risk/risk_classifier.cpp
#include "modules/risk/risk_classifier.h"
#include "common/utils/text_match.h"
#include "core/types/errors.h"
#include <algorithm>
#include <cctype>

namespace swarmflow {

namespace {

std::vector<std::string> read_terms(const nlohmann::json& j, const char* key, std::vector<std::string> fallback) {
    if (!j.contains(key)) return fallback;
    const auto& v = j[key];
    if (!v.is_array()) {
        throw ConfigError(std::string("risk.") + key + " must be a list of strings");
    }
    std::vector<std::string> terms;
    for (const auto& item : v) {
        if (!item.is_string()) {
            throw ConfigError(std::string("risk.") + key + " must be a list of strings");
        }
        terms.push_back(to_lower(item.get<std::string>()));
    }
    return terms;
}

bool answered(const std::optional<std::string>& field) {
    if (!field.has_value()) return false;
    return std::any_of(field->begin(), field->end(), [](char c) { return !std::isspace(static_cast<unsigned char>(c)); });
}

std::string first_hit(const std::string& lowered, const std::vector<std::string>& terms) {
    for (const auto& t : terms) {
        if (contains_term(lowered, t)) return t;
    }
    return "";
}

} // namespace

RiskRules RiskRules::defaults() {
    RiskRules r;
    r.irreversible_terms = {"irreversible", "without rollback", "no rollback", "drop table", "drop database",
                            "purge", "permanently delete", "truncate table", "destroy"};
    r.regulated_terms = {"payment", "billing", "credential", "signing key", "private key", "certificate",
                         "pci", "hipaa", "financial transaction", "regulated"};
    r.security_terms = {"security", "auth", "authentication", "authorization", "password", "permission",
                        "token", "secret", "encrypt", "vulnerab*", "xss", "csrf", "injection", "access control"};
    r.privacy_terms = {"privacy", "pii", "personal data", "gdpr", "consent"};
    r.integrity_terms = {"data integrity", "schema", "migration", "migrate", "database", "corrupt",
                         "consistency", "transaction"};
    r.user_visible_terms = {"user-facing", "user-visible", "behavior", "behaviour", "feature", "workflow",
                            "redesign", "breaking", "layout", "ux"};
    r.multi_module_terms = {"across", "multiple modules", "all services", "system-wide", "cross-cutting",
                            "every module", "several modules"};
    return r;
}

RiskRules RiskRules::from_json(const nlohmann::json& j) {
    RiskRules d = defaults();
    if (!j.is_object()) return d;
    RiskRules r;
    r.irreversible_terms = read_terms(j, "irreversible_terms", d.irreversible_terms);
    r.regulated_terms = read_terms(j, "regulated_terms", d.regulated_terms);
    r.security_terms = read_terms(j, "security_terms", d.security_terms);
    r.privacy_terms = read_terms(j, "privacy_terms", d.privacy_terms);
    r.integrity_terms = read_terms(j, "integrity_terms", d.integrity_terms);
    r.user_visible_terms = read_terms(j, "user_visible_terms", d.user_visible_terms);
    r.multi_module_terms = read_terms(j, "multi_module_terms", d.multi_module_terms);
    return r;
}

RiskClassifier::RiskClassifier(RiskRules rules) : rules_(std::move(rules)) {}

RiskDecision RiskClassifier::decide(const TaskDescriptor& task) const {
    const std::string text = to_lower(task.description);

    if (task.irreversible) return {RiskTier::T3, "irreversible effect (flagged)"};
    if (task.regulated_data) return {RiskTier::T3, "regulated data (flagged)"};
    if (auto hit = first_hit(text, rules_.irreversible_terms); !hit.empty()) {
        return {RiskTier::T3, "irreversible effect: '" + hit + "'"};
    }
    if (auto hit = first_hit(text, rules_.regulated_terms); !hit.empty()) {
        return {RiskTier::T3, "regulated effect: '" + hit + "'"};
    }

    if (task.security_sensitive || task.privacy_sensitive || task.data_integrity) {
        return {RiskTier::T2, "security/privacy/integrity implication (flagged)"};
    }
    for (const auto* terms : {&rules_.security_terms, &rules_.privacy_terms, &rules_.integrity_terms}) {
        if (auto hit = first_hit(text, *terms); !hit.empty()) {
            return {RiskTier::T2, "security/privacy/integrity implication: '" + hit + "'"};
        }
    }

    if (task.user_visible) return {RiskTier::T1, "user-visible change (flagged)"};
    if (task.module_count > 1) {
        return {RiskTier::T1, "spans " + std::to_string(task.module_count) + " modules"};
    }
    if (auto hit = first_hit(text, rules_.user_visible_terms); !hit.empty()) {
        return {RiskTier::T1, "user-visible change: '" + hit + "'"};
    }
    if (auto hit = first_hit(text, rules_.multi_module_terms); !hit.empty()) {
        return {RiskTier::T1, "multi-module change: '" + hit + "'"};
    }

    return {RiskTier::T0, "no risk indicators"};
}

RiskTier RiskClassifier::classify(const TaskDescriptor& task) const {
    RiskTier tier = evaluate(task);
    if (tier == RiskTier::T0) return tier;

    auto missing = missing_assessment_fields(task);
    if (!missing.empty()) {
        throw IncompleteRiskAssessment(task.task_id, std::move(missing));
    }
    return tier;
}

std::vector<std::string> RiskClassifier::missing_assessment_fields(const TaskDescriptor& task) {
    if (!task.assessment.has_value()) {
        return {"failure_scenario", "detection_signal", "fastest_rollback", "weakest_assumption"};
    }
    const auto& a = *task.assessment;
    std::vector<std::string> missing;
    if (!answered(a.failure_scenario)) missing.emplace_back("failure_scenario");
    if (!answered(a.detection_signal)) missing.emplace_back("detection_signal");
    if (!answered(a.fastest_rollback)) missing.emplace_back("fastest_rollback");
    if (!answered(a.weakest_assumption)) missing.emplace_back("weakest_assumption");
    return missing;
}

RiskControls RiskClassifier::controls_for(RiskTier tier) {
    switch (tier) {
        case RiskTier::T0:
            return {VerificationLevel::NONE, ReviewType::SELF, ApprovalMode::AUTOMATIC};
        case RiskTier::T1:
            return {VerificationLevel::BASIC, ReviewType::PEER, ApprovalMode::AUTOMATIC};
        case RiskTier::T2:
            return {VerificationLevel::FULL, ReviewType::SENIOR, ApprovalMode::REVIEW_REQUIRED};
        case RiskTier::T3:
            return {VerificationLevel::FULL_SECURITY_ROLLBACK, ReviewType::TRIPLE, ApprovalMode::HUMAN_CONFIRMATION};
    }
    return {};
}

} // namespace swarmflow
