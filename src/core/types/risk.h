#ifndef SWARMFLOW_TYPES_RISK_H
#define SWARMFLOW_TYPES_RISK_H

#include <string>
#include <optional>
#include <cstdint>

namespace swarmflow {

// 有序风险等级
enum class RiskTier : uint8_t {
    T0 = 0,
    T1 = 1,
    T2 = 2,
    T3 = 3
};

enum class VerificationLevel : uint8_t {
    NONE = 0,
    BASIC = 1,
    FULL = 2,
    FULL_SECURITY_ROLLBACK = 3
};

enum class ReviewType : uint8_t { SELF, PEER, SENIOR, TRIPLE };

enum class ApprovalMode : uint8_t { AUTOMATIC, REVIEW_REQUIRED, HUMAN_CONFIRMATION };

struct RiskControls {
    VerificationLevel verification = VerificationLevel::NONE;
    ReviewType review = ReviewType::SELF;
    ApprovalMode approval = ApprovalMode::AUTOMATIC;
};

// T1-T3 执行前必须回答的四个问题
struct RiskAssessment {
    std::optional<std::string> failure_scenario;
    std::optional<std::string> detection_signal;
    std::optional<std::string> fastest_rollback;
    std::optional<std::string> weakest_assumption;
};

struct TaskDescriptor {
    std::string task_id;
    std::string description;

    // 显式标记；未设置时由关键字表推断
    bool irreversible = false;
    bool regulated_data = false;
    bool security_sensitive = false;
    bool privacy_sensitive = false;
    bool data_integrity = false;
    bool user_visible = false;
    int module_count = 1;

    std::optional<RiskAssessment> assessment;
};

inline RiskTier max_tier(RiskTier a, RiskTier b) { return (a < b) ? b : a; }

const char* to_string(RiskTier tier);
const char* to_string(VerificationLevel level);
const char* to_string(ReviewType review);
const char* to_string(ApprovalMode mode);

} // namespace swarmflow

#endif // SWARMFLOW_TYPES_RISK_H
