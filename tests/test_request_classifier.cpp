// tests/test_request_classifier.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/classifier/request_classifier.h"
#include "core/types/errors.h"
#include <cmath>
#include <limits>
#include <stdexcept>

using namespace swarmflow;

namespace {

Request request(const std::string& description) {
    Request r;
    r.id = "req-test";
    r.description = description;
    return r;
}

} // namespace

// Test 1: 简单低风险请求走单阶段直接执行
TEST_CASE("A trivial fix is classified as direct", "[classifier]") {
    RequestClassifier classifier;
    auto result = classifier.classify(request("fix typo in login page"));

    REQUIRE(result.plan.workflow_class == WorkflowClass::DIRECT);
    REQUIRE(result.plan.phases.size() == 1);
    REQUIRE(result.plan.phases.front().verification == VerificationLevel::NONE);
    REQUIRE(result.risk_tier == RiskTier::T0);
    REQUIRE(result.rule == "Simple Low-Risk Task");
    REQUIRE(result.task_type == "bug_fix");
    REQUIRE_FALSE(result.fallback);
}

TEST_CASE("Classification is deterministic", "[classifier]") {
    RequestClassifier classifier;
    auto req = request("implement rate limiting across several api services");
    auto a = classifier.classify(req);
    auto b = classifier.classify(req);

    REQUIRE(a.score.dimensions == b.score.dimensions);
    REQUIRE(a.score.aggregate == b.score.aggregate);
    REQUIRE(a.plan.workflow_class == b.plan.workflow_class);
    REQUIRE(a.plan.label == b.plan.label);
    REQUIRE(a.rule == b.rule);
}

TEST_CASE("Every dimension stays within bounds", "[classifier]") {
    RequestClassifier classifier;
    auto req = request("urgent: refactor the distributed architecture across all services, migrate every database "
                       "schema, rotate credentials and fix the security vulnerability asap today");
    auto result = classifier.classify(req);

    REQUIRE(result.score.dimensions.size() == 8);
    for (const auto& [dim, value] : result.score.dimensions) {
        INFO(dim);
        REQUIRE(value >= SCORE_MIN);
        REQUIRE(value <= SCORE_MAX);
    }
    REQUIRE(result.score.aggregate >= SCORE_MIN);
    REQUIRE(result.score.aggregate <= SCORE_MAX);
}

// Test 2: 高复杂度与高风险请求进入分阶段计划
TEST_CASE("Complex risky work gets a phase-based plan", "[classifier]") {
    RequestClassifier classifier;
    auto result = classifier.classify(
        request("refactor the complex integration layer and migrate the database schema"));

    REQUIRE(result.plan.workflow_class == WorkflowClass::PHASE_BASED);
    REQUIRE(result.plan.label == "complete_system");
    REQUIRE(result.plan.phases.size() == 4);
    REQUIRE(result.risk_tier == RiskTier::T2);
    for (const auto& phase : result.plan.phases) {
        REQUIRE(phase.verification == VerificationLevel::FULL);
    }
    REQUIRE_FALSE(result.decision_factors.empty());
}

TEST_CASE("Context overflow forces phase-based execution", "[classifier]") {
    RequestClassifier classifier;
    auto req = request("fix typo in login page");
    req.session.current_tokens = 40000;
    auto result = classifier.classify(req);

    REQUIRE(result.rule == "Context Overflow Protection");
    REQUIRE(result.plan.workflow_class == WorkflowClass::PHASE_BASED);
    REQUIRE(result.plan.label == "taskit");
    REQUIRE(result.score.estimated_tokens > classifier.rules().token_ceiling);
}

// Test 3: 无法打分时退回最保守的计划，且从不抛出
TEST_CASE("Unscorable input falls back conservatively", "[classifier]") {
    SECTION("Empty description") {
        RequestClassifier classifier;
        ClassificationResult result;
        REQUIRE_NOTHROW(result = classifier.classify(request("   ")));
        REQUIRE(result.fallback);
        REQUIRE(result.rule == "Conservative fallback");
        REQUIRE(result.plan.workflow_class == WorkflowClass::PHASE_BASED);
        REQUIRE(result.plan.phases.front().verification >= VerificationLevel::FULL);
    }

    SECTION("A failing scorer") {
        RequestClassifier classifier;
        classifier.set_dimension_scorer(dimension::TIME_PRESSURE, [](const Request&) -> double {
            throw std::runtime_error("scorer offline");
        });
        auto result = classifier.classify(request("fix typo in login page"));
        REQUIRE(result.fallback);
        REQUIRE(result.plan.workflow_class == WorkflowClass::PHASE_BASED);
    }

    SECTION("A non-finite score") {
        RequestClassifier classifier;
        classifier.set_dimension_scorer(dimension::SCOPE_IMPACT, [](const Request&) {
            return std::numeric_limits<double>::quiet_NaN();
        });
        auto result = classifier.classify(request("fix typo in login page"));
        REQUIRE(result.fallback);
    }
}

TEST_CASE("Injected scorers are clamped", "[classifier]") {
    RequestClassifier classifier;
    classifier.set_dimension_scorer(dimension::TECHNICAL_COMPLEXITY, [](const Request&) { return 42.0; });
    auto result = classifier.classify(request("fix typo in login page"));

    REQUIRE(result.score.get(dimension::TECHNICAL_COMPLEXITY) == SCORE_MAX);
    REQUIRE(result.rule == "High Complexity");
    REQUIRE(result.plan.workflow_class == WorkflowClass::PHASE_BASED);
}

TEST_CASE("Rules load from config and reject bad thresholds", "[classifier][config]") {
    SECTION("Custom rule list") {
        nlohmann::json rule = {{"name", "Everything Direct"},
                               {"when", nlohmann::json::array()},
                               {"workflow_class", "direct"},
                               {"label", "orchestrated"}};
        nlohmann::json j = {{"rules", nlohmann::json::array({rule})}};
        auto rules = ClassificationRules::from_json(j);
        REQUIRE(rules.rules.size() == 1);
        RequestClassifier classifier(rules);
        auto result = classifier.classify(request("implement rate limiting for the api"));
        REQUIRE(result.rule == "Everything Direct");
        REQUIRE(result.plan.workflow_class == WorkflowClass::DIRECT);
    }

    SECTION("Inverted thresholds") {
        nlohmann::json j = {{"thresholds", {{"direct_max_aggregate", 7.0}, {"phase_min_aggregate", 5.0}}}};
        REQUIRE_THROWS_AS(ClassificationRules::from_json(j), ConfigError);
    }
}
