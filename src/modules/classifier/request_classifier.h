// modules/classifier/request_classifier.h
#ifndef SWARMFLOW_MODULES_CLASSIFIER_REQUEST_CLASSIFIER_H
#define SWARMFLOW_MODULES_CLASSIFIER_REQUEST_CLASSIFIER_H

#include "modules/classifier/classification_rules.h"
#include "modules/risk/risk_classifier.h"
#include "core/types/request.h"
#include "core/types/workflow.h"
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace swarmflow {

struct ClassificationResult {
    Score score;
    WorkflowPlan plan;
    RiskTier risk_tier = RiskTier::T0;
    std::string risk_reason;
    std::string task_type;
    double confidence = 0.0;
    std::string rule; // 命中规则名，或 "Weighted factor analysis" / "Conservative fallback"
    std::vector<std::string> decision_factors;
    std::vector<std::pair<std::string, double>> alternatives; // label -> suitability
    bool fallback = false;
};

// 外部提供的维度打分函数，返回值应在 [0, 10]
using DimensionScorer = std::function<double(const Request&)>;

class RequestClassifier {
public:
    explicit RequestClassifier(ClassificationRules rules = ClassificationRules::defaults(),
                               RiskClassifier risk = RiskClassifier());

    // 从不抛出；无法打分时退回最保守的分阶段计划
    ClassificationResult classify(const Request& request) const;

    // 覆盖某个维度的内置打分
    void set_dimension_scorer(const std::string& dimension, DimensionScorer scorer);

    std::string task_type(const std::string& description) const;
    const ClassificationRules& rules() const { return rules_; }

private:
    double score_dimension(const std::string& dimension, const Request& request, const std::string& lowered) const;

    double technical_complexity(const std::string& lowered) const;
    double scope_impact(const Request& request, const std::string& lowered) const;
    double risk_factor(const std::string& lowered) const;
    double context_load(const Request& request, const std::string& lowered) const;
    double time_pressure(const std::string& lowered) const;
    double code_minimalism(const std::string& lowered) const;
    double security_sensitivity(const std::string& lowered) const;
    double pattern_reusability(const Request& request, const std::string& lowered) const;

    WorkflowPlan build_plan(WorkflowClass cls, const std::string& label, VerificationLevel level) const;
    std::pair<std::string, double> weighted_label(const Score& score, double* confidence) const;
    std::vector<std::pair<std::string, double>> alternatives(const Score& score, const std::string& selected) const;
    std::vector<std::string> decision_factors(const Score& score, const std::string& label) const;
    bool context_overflow(const Score& score) const;

    ClassificationRules rules_;
    RiskClassifier risk_;
    std::map<std::string, DimensionScorer> scorers_;
};

} // namespace swarmflow

#endif // SWARMFLOW_MODULES_CLASSIFIER_REQUEST_CLASSIFIER_H
