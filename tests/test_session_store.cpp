// tests/test_session_store.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/session/session_store.h"
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace swarmflow;

namespace {

Score sample_score() {
    Score s;
    s.dimensions = {{"technical_complexity", 6.5}, {"risk_factor", 2.0}};
    s.aggregate = 4.2;
    s.estimated_tokens = 12000;
    return s;
}

std::string temp_path(const std::string& name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

} // namespace

// Test 1: 风险等级只升不降
TEST_CASE("Risk ledger never lowers a tier", "[session][risk]") {
    RiskLedger ledger;
    REQUIRE(ledger.record("t1", RiskTier::T2) == RiskTier::T2);
    // 重新分类得到更低等级时保持原等级
    REQUIRE(ledger.record("t1", RiskTier::T0) == RiskTier::T2);
    REQUIRE(ledger.record("t1", RiskTier::T3) == RiskTier::T3);
    REQUIRE(ledger.tier_of("t1") == RiskTier::T3);
    REQUIRE_FALSE(ledger.tier_of("unknown").has_value());

    SECTION("Escalation is recorded only when it raises the tier") {
        REQUIRE(ledger.escalate("t1", RiskTier::T1, "hook said so") == RiskTier::T3);
        REQUIRE(ledger.escalations().empty());

        REQUIRE(ledger.escalate("t2", RiskTier::T2, "touches auth") == RiskTier::T2);
        REQUIRE(ledger.escalations().size() == 1);
        REQUIRE(ledger.escalations().front().from == RiskTier::T0);
        REQUIRE(ledger.escalations().front().reason == "touches auth");
    }

    SECTION("Ledger survives a JSON round trip") {
        ledger.escalate("t2", RiskTier::T1, "user visible");
        RiskLedger copy;
        copy.load_json(ledger.to_json());
        REQUIRE(copy.tier_of("t1") == RiskTier::T3);
        REQUIRE(copy.tier_of("t2") == RiskTier::T1);
        REQUIRE(copy.escalations().size() == 1);
    }
}

// Test 2: 会话记录以 request id 为键
TEST_CASE("Session records are keyed by request id", "[session]") {
    SessionStore store;
    store.create("req-1", "wf-1", sample_score(), "aidevtasks", "feature");
    REQUIRE_THROWS_AS(store.create("req-1", "wf-9", sample_score(), "taskit", "feature"), std::invalid_argument);

    Transition t;
    t.from = "not_started";
    t.to = "running";
    t.phase_index = 0;
    t.at = std::chrono::system_clock::now();
    store.append_transitions("req-1", {t});
    store.set_status("req-1", WorkflowStatus::RUNNING);

    auto rec = store.record("req-1");
    REQUIRE(rec.has_value());
    REQUIRE(rec->instance_id == "wf-1");
    REQUIRE(rec->status == WorkflowStatus::RUNNING);
    REQUIRE(rec->history.size() == 1);
    REQUIRE(rec->score.aggregate == 4.2);

    REQUIRE_FALSE(store.record("req-2").has_value());
    REQUIRE_THROWS_AS(store.set_status("req-2", WorkflowStatus::RUNNING), std::out_of_range);
    REQUIRE_THROWS_AS(store.append_transitions("req-2", {t}), std::out_of_range);
}

TEST_CASE("Outcome hints need enough successful samples", "[session][learning]") {
    SessionStore store;
    REQUIRE_FALSE(store.outcome_hint("bug_fix").has_value());

    store.record_outcome("bug_fix", "orchestrated", true);
    // 单个样本不足以给出提示
    REQUIRE_FALSE(store.outcome_hint("bug_fix").has_value());

    store.record_outcome("bug_fix", "orchestrated", true);
    store.record_outcome("bug_fix", "orchestrated", false);
    store.record_outcome("bug_fix", "orchestrated", true);
    REQUIRE(store.outcome_hint("bug_fix") == "Similar bug_fix tasks succeeded 75% with orchestrated");

    store.record_outcome("feature", "taskit", true);
    store.record_outcome("feature", "taskit", false);
    // 50% 不超过 60%
    REQUIRE_FALSE(store.outcome_hint("feature").has_value());
}

TEST_CASE("Session state advances by versioned patches", "[session][state]") {
    SessionStore store;
    REQUIRE(store.state().version == 0);
    REQUIRE(store.apply_patches({Context{{"last_request", "req-1"}}}) == 1);
    REQUIRE(store.apply_patches({Context{{"last_request", "req-2"}}, Context{{"owner", "ops"}}}) == 3);
    auto state = store.state();
    REQUIRE(state.data["last_request"] == "req-2");
    REQUIRE(state.data["owner"] == "ops");
}

// Test 3: 持久化与恢复
TEST_CASE("Sessions checkpoint to disk and restore", "[session][persistence]") {
    const std::string path = temp_path("swarmflow_session_test.json");

    SessionStore store;
    store.create("req-1", "wf-1", sample_score(), "complete_system", "security");
    store.set_status("req-1", WorkflowStatus::ALL_PHASES_COMPLETED);
    store.record_tier("req-1", RiskTier::T2);
    store.escalate_tier("req-1", RiskTier::T3, "regulated data");
    store.record_outcome("security", "complete_system", true);
    store.record_outcome("security", "complete_system", true);
    store.apply_patches({Context{{"owner", "ops"}}});
    store.checkpoint(path);

    SessionStore restored;
    restored.restore(path);
    auto rec = restored.record("req-1");
    REQUIRE(rec.has_value());
    REQUIRE(rec->status == WorkflowStatus::ALL_PHASES_COMPLETED);
    REQUIRE(rec->workflow_label == "complete_system");
    REQUIRE(rec->score.dimensions.at("technical_complexity") == 6.5);
    REQUIRE(restored.tier_of("req-1") == RiskTier::T3);
    REQUIRE(restored.outcome_hint("security").has_value());
    REQUIRE(restored.state().version == 1);
    REQUIRE(restored.state().data["owner"] == "ops");

    std::filesystem::remove(path);
}

TEST_CASE("Restoring a missing or corrupt checkpoint fails loudly", "[session][persistence]") {
    SessionStore store;
    REQUIRE_THROWS_AS(store.restore(temp_path("swarmflow_does_not_exist.json")), std::runtime_error);

    const std::string path = temp_path("swarmflow_corrupt_session.json");
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    REQUIRE_THROWS_AS(store.restore(path), std::runtime_error);
    std::filesystem::remove(path);
}
