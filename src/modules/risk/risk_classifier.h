// modules/risk/risk_classifier.h
#ifndef SWARMFLOW_MODULES_RISK_RISK_CLASSIFIER_H
#define SWARMFLOW_MODULES_RISK_RISK_CLASSIFIER_H

#include "core/types/risk.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace swarmflow {

// 关键字表由外部规则提供方注入
struct RiskRules {
    std::vector<std::string> irreversible_terms;
    std::vector<std::string> regulated_terms;
    std::vector<std::string> security_terms;
    std::vector<std::string> privacy_terms;
    std::vector<std::string> integrity_terms;
    std::vector<std::string> user_visible_terms;
    std::vector<std::string> multi_module_terms;

    static RiskRules defaults();
    // 覆盖 json 中出现的表，其余保留默认值
    static RiskRules from_json(const nlohmann::json& j);
};

struct RiskDecision {
    RiskTier tier = RiskTier::T0;
    std::string reason;
};

class RiskClassifier {
public:
    explicit RiskClassifier(RiskRules rules = RiskRules::defaults());

    // 决策树（自上而下，首个命中生效）：
    //   1. 不可逆或受监管的影响 -> T3
    //   2. 安全 / 隐私 / 数据完整性 -> T2
    //   3. 用户可见行为变化或跨多个模块 -> T1
    //   4. 其他 -> T0
    RiskDecision decide(const TaskDescriptor& task) const;
    RiskTier evaluate(const TaskDescriptor& task) const { return decide(task).tier; }

    // evaluate + 就绪门：T1-T3 缺少四个问答时抛出 IncompleteRiskAssessment
    RiskTier classify(const TaskDescriptor& task) const;

    static std::vector<std::string> missing_assessment_fields(const TaskDescriptor& task);
    static RiskControls controls_for(RiskTier tier);
    static VerificationLevel verification_for(RiskTier tier) { return controls_for(tier).verification; }

    const RiskRules& rules() const { return rules_; }

private:
    RiskRules rules_;
};

} // namespace swarmflow

#endif // SWARMFLOW_MODULES_RISK_RISK_CLASSIFIER_H
