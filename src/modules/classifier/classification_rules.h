// modules/classifier/classification_rules.h
#ifndef SWARMFLOW_MODULES_CLASSIFIER_CLASSIFICATION_RULES_H
#define SWARMFLOW_MODULES_CLASSIFIER_CLASSIFICATION_RULES_H

#include "core/types/workflow.h"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace swarmflow {

using WeightTable = std::map<std::string, double>;

// 维度阈值条件，未设置的边界不参与比较
struct RuleCondition {
    std::string dimension;
    std::optional<double> gt;
    std::optional<double> lt;
    std::optional<double> ge;
    std::optional<double> le;

    bool matches(double value) const;
};

struct ClassificationRule {
    std::string name;
    std::vector<RuleCondition> conditions; // 全部满足才命中
    WorkflowClass workflow_class = WorkflowClass::PHASE_BASED;
    std::string label;
    double confidence = 0.8;
};

struct PhaseTemplate {
    std::string name;
    OwnershipModel ownership = OwnershipModel::SINGLE_AGENT;
    bool checkpoint_after = false;
    bool independent = false;
};

// 按任务类型预测上下文增长：base_files * tokens_per_file * research_factor
struct GrowthPattern {
    std::vector<std::string> keywords;
    double base_files = 1.0;
    double tokens_per_file = 1000.0;
    double research_factor = 1.0;

    long predicted_tokens() const;
};

// 请求分类所需的全部可注入表格
struct ClassificationRules {
    // 关键字权重（0-1 区间原始权重，打分后放大到 0-10）
    WeightTable complexity_terms;
    WeightTable risk_terms;
    WeightTable time_pressure_terms;
    std::vector<std::string> time_phrases;
    std::vector<std::string> global_scope_terms;
    std::vector<std::string> multi_component_terms;
    std::vector<std::string> growth_terms;
    WeightTable minimalism_terms;
    WeightTable security_terms;

    // 聚合权重；relief 维度（代码最小化、模式复用）以负权重扣减
    WeightTable dimension_weights;
    WeightTable relief_weights;

    // 原工作流标签 -> 维度权重，用于回退打分与备选方案
    std::map<std::string, WeightTable> workflow_weights;

    double sigmoid_center = 0.3;
    double sigmoid_scale = 0.2;

    double direct_max_aggregate = 2.5;
    double direct_max_context_load = 4.0;
    double phase_min_aggregate = 6.0;
    double high_complexity = 8.0;
    double context_overflow = 8.0;
    long token_ceiling = 32000;
    size_t max_description_length = 10000;

    std::vector<ClassificationRule> rules; // 按顺序求值，首个命中生效
    std::map<std::string, GrowthPattern> growth_patterns;
    std::string default_task_type = "feature";
    std::map<WorkflowClass, std::vector<PhaseTemplate>> plan_templates;

    static ClassificationRules defaults();
    // 覆盖 json 中出现的字段，其余保留默认值
    static ClassificationRules from_json(const nlohmann::json& j);
};

WorkflowClass parse_workflow_class(const std::string& s);

} // namespace swarmflow

#endif // SWARMFLOW_MODULES_CLASSIFIER_CLASSIFICATION_RULES_H
