#ifndef SWARMFLOW_TYPES_REQUEST_H
#define SWARMFLOW_TYPES_REQUEST_H

#include "risk.h"
#include <string>
#include <vector>
#include <map>
#include <optional>

namespace swarmflow {

struct SessionContext {
    std::vector<std::string> prior_patterns;
    std::vector<std::string> recent_files;
    int current_tokens = 0;
    int loaded_files = 0;
};

// 提交后只读
struct Request {
    std::string id;
    std::string description;
    std::vector<std::string> file_hints;
    SessionContext session;
    std::optional<RiskAssessment> risk_assessment; // 任务未自带时继承
};

namespace dimension {
inline constexpr const char* TECHNICAL_COMPLEXITY = "technical_complexity";
inline constexpr const char* SCOPE_IMPACT = "scope_impact";
inline constexpr const char* RISK_FACTOR = "risk_factor";
inline constexpr const char* CONTEXT_LOAD = "context_load";
inline constexpr const char* TIME_PRESSURE = "time_pressure";
inline constexpr const char* CODE_MINIMALISM = "code_minimalism";
inline constexpr const char* SECURITY_SENSITIVITY = "security_sensitivity";
inline constexpr const char* PATTERN_REUSABILITY = "pattern_reusability";
} // namespace dimension

inline constexpr double SCORE_MIN = 0.0;
inline constexpr double SCORE_MAX = 10.0;

struct Score {
    std::map<std::string, double> dimensions; // 每个维度 [0, 10]
    double aggregate = 0.0;
    long estimated_tokens = 0; // 当前 token + 预测增长

    double get(const std::string& name) const {
        auto it = dimensions.find(name);
        return it != dimensions.end() ? it->second : 0.0;
    }
};

} // namespace swarmflow

#endif // SWARMFLOW_TYPES_REQUEST_H
