// tests/test_risk_classifier.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/risk/risk_classifier.h"
#include "core/types/errors.h"
#include <nlohmann/json.hpp>

using namespace swarmflow;

namespace {

TaskDescriptor task(const std::string& description) {
    TaskDescriptor d;
    d.task_id = "t1";
    d.description = description;
    return d;
}

RiskAssessment full_assessment() {
    RiskAssessment a;
    a.failure_scenario = "users locked out";
    a.detection_signal = "login error rate alert";
    a.fastest_rollback = "revert the deploy";
    a.weakest_assumption = "old sessions stay valid";
    return a;
}

} // namespace

// Test 1: 决策树自上而下，首个命中生效
TEST_CASE("Decision tree picks the first matching tier", "[risk]") {
    RiskClassifier rc;

    SECTION("Irreversible or regulated effects are T3") {
        REQUIRE(rc.evaluate(task("drop table sessions in production")) == RiskTier::T3);
        REQUIRE(rc.evaluate(task("rotate production signing credentials")) == RiskTier::T3);

        auto flagged = task("rename a column");
        flagged.irreversible = true;
        REQUIRE(rc.evaluate(flagged) == RiskTier::T3);
    }

    SECTION("Security, privacy and integrity are T2") {
        REQUIRE(rc.evaluate(task("add password strength meter")) == RiskTier::T2);
        REQUIRE(rc.evaluate(task("write schema migration for orders")) == RiskTier::T2);

        auto flagged = task("adjust logging");
        flagged.privacy_sensitive = true;
        REQUIRE(rc.evaluate(flagged) == RiskTier::T2);
    }

    SECTION("User-visible or multi-module changes are T1") {
        REQUIRE(rc.evaluate(task("change the settings page layout")) == RiskTier::T1);

        auto spread = task("rename helper");
        spread.module_count = 3;
        auto decision = rc.decide(spread);
        REQUIRE(decision.tier == RiskTier::T1);
        REQUIRE(decision.reason == "spans 3 modules");
    }

    SECTION("Everything else is T0") {
        auto decision = rc.decide(task("fix typo in login page"));
        REQUIRE(decision.tier == RiskTier::T0);
        REQUIRE(decision.reason == "no risk indicators");
    }

    SECTION("Regulated beats security when both match") {
        REQUIRE(rc.evaluate(task("encrypt payment card numbers")) == RiskTier::T3);
    }
}

// Test 2: T1-T3 缺少风险问答时阻止执行
TEST_CASE("Readiness gate rejects incomplete assessments", "[risk]") {
    RiskClassifier rc;

    SECTION("T0 needs no assessment") {
        REQUIRE(rc.classify(task("fix typo in login page")) == RiskTier::T0);
    }

    SECTION("Missing assessment lists all four fields") {
        auto t = task("add password strength meter");
        try {
            (void)rc.classify(t);
            FAIL("expected IncompleteRiskAssessment");
        } catch (const IncompleteRiskAssessment& e) {
            REQUIRE(e.task_id() == "t1");
            REQUIRE(e.kind() == ErrorKind::INCOMPLETE_RISK_ASSESSMENT);
            REQUIRE(e.missing_fields().size() == 4);
        }
    }

    SECTION("Blank answers count as missing") {
        auto t = task("add password strength meter");
        auto a = full_assessment();
        a.fastest_rollback = "   ";
        t.assessment = a;
        auto missing = RiskClassifier::missing_assessment_fields(t);
        REQUIRE(missing == std::vector<std::string>{"fastest_rollback"});
        REQUIRE_THROWS_AS(rc.classify(t), IncompleteRiskAssessment);
    }

    SECTION("Complete assessment passes") {
        auto t = task("add password strength meter");
        t.assessment = full_assessment();
        REQUIRE(rc.classify(t) == RiskTier::T2);
    }
}

TEST_CASE("Controls grow with the tier", "[risk]") {
    auto t0 = RiskClassifier::controls_for(RiskTier::T0);
    REQUIRE(t0.verification == VerificationLevel::NONE);
    REQUIRE(t0.approval == ApprovalMode::AUTOMATIC);

    auto t1 = RiskClassifier::controls_for(RiskTier::T1);
    REQUIRE(t1.verification == VerificationLevel::BASIC);
    REQUIRE(t1.review == ReviewType::PEER);

    auto t2 = RiskClassifier::controls_for(RiskTier::T2);
    REQUIRE(t2.verification == VerificationLevel::FULL);
    REQUIRE(t2.approval == ApprovalMode::REVIEW_REQUIRED);

    auto t3 = RiskClassifier::controls_for(RiskTier::T3);
    REQUIRE(t3.verification == VerificationLevel::FULL_SECURITY_ROLLBACK);
    REQUIRE(t3.review == ReviewType::TRIPLE);
    REQUIRE(t3.approval == ApprovalMode::HUMAN_CONFIRMATION);
}

TEST_CASE("Rule tables can be overridden from config", "[risk][config]") {
    SECTION("Listed tables replace the defaults") {
        auto rules = RiskRules::from_json({{"regulated_terms", {"Ledger"}}});
        RiskClassifier rc(rules);
        REQUIRE(rc.evaluate(task("update the ledger export")) == RiskTier::T3);
        REQUIRE(rc.evaluate(task("update payment retry")) != RiskTier::T3);
        // 未覆盖的表保持默认
        REQUIRE(rc.evaluate(task("rotate api token")) == RiskTier::T2);
    }

    SECTION("Wrong types are rejected") {
        REQUIRE_THROWS_AS(RiskRules::from_json({{"security_terms", "token"}}), ConfigError);
        REQUIRE_THROWS_AS(RiskRules::from_json({{"security_terms", {1, 2}}}), ConfigError);
    }
}

// Test 3: 关键词按整词匹配，只容许词形后缀
TEST_CASE("Risk terms match whole words only", "[risk]") {
    RiskClassifier rc;

    SECTION("Words that merely start with a term stay T0") {
        REQUIRE(rc.evaluate(task("update author bio on about page")) == RiskTier::T0);
        REQUIRE_NOTHROW(rc.classify(task("update author bio on about page")));
        REQUIRE(rc.evaluate(task("rename tokenizer helper")) == RiskTier::T0);
        REQUIRE(rc.decide(task("rename tokenizer helper")).reason == "no risk indicators");
    }

    SECTION("Inflected forms still match") {
        REQUIRE(rc.evaluate(task("rotate production signing credentials")) == RiskTier::T3);
        REQUIRE(rc.evaluate(task("refresh expired tokens")) == RiskTier::T2);
        REQUIRE(rc.evaluate(task("add authentication to the admin panel")) == RiskTier::T2);
    }

    SECTION("Stem terms match any continuation") {
        REQUIRE(rc.evaluate(task("patch reported vulnerabilities")) == RiskTier::T2);
        REQUIRE(rc.evaluate(task("triage the vulnerable endpoint")) == RiskTier::T2);
    }
}
