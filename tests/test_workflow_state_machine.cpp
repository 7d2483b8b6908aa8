// tests/test_workflow_state_machine.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/workflow/workflow_state_machine.h"
#include "core/types/errors.h"
#include <algorithm>

using namespace swarmflow;

namespace {

WorkflowInstance make_instance(std::vector<Phase> phases) {
    WorkflowInstance inst;
    inst.id = "wf-test";
    inst.request_id = "req-test";
    inst.plan.workflow_class = WorkflowClass::FIXED_MULTI_PHASE;
    inst.plan.label = "aidevtasks";
    inst.plan.phases = std::move(phases);
    return inst;
}

Phase phase(const std::string& name, VerificationLevel level = VerificationLevel::NONE) {
    Phase p;
    p.name = name;
    p.verification = level;
    return p;
}

PhaseEvidence passing() {
    PhaseEvidence e;
    e.verification_ran = true;
    e.verification_passed = true;
    e.all_verdicts_explicit = true;
    return e;
}

// 任一时刻最多一个阶段处于 in_progress
bool at_most_one_in_progress(const WorkflowInstance& inst) {
    return std::count(inst.phase_status.begin(), inst.phase_status.end(), PhaseStatus::IN_PROGRESS) <= 1;
}

} // namespace

// Test 1: 正常路径依次完成所有阶段
TEST_CASE("Phases complete in order", "[workflow]") {
    auto inst = make_instance({phase("plan"), phase("implement"), phase("verify")});
    WorkflowStateMachine m(inst);

    REQUIRE(m.status() == WorkflowStatus::NOT_STARTED);
    m.start();
    REQUIRE(m.status() == WorkflowStatus::RUNNING);
    REQUIRE(m.current_phase() == 0);
    REQUIRE(m.phase_status(0) == PhaseStatus::IN_PROGRESS);

    for (int i = 0; i < 3; ++i) {
        REQUIRE(at_most_one_in_progress(inst));
        m.complete_phase(PhaseEvidence{});
    }
    REQUIRE(m.status() == WorkflowStatus::ALL_PHASES_COMPLETED);
    REQUIRE(m.is_terminal());
    for (int i = 0; i < 3; ++i) REQUIRE(m.phase_status(i) == PhaseStatus::COMPLETED);
    REQUIRE_FALSE(m.history().empty());
    REQUIRE(m.history().front().to == "running");
}

TEST_CASE("Illegal transitions are rejected", "[workflow]") {
    SECTION("Empty plan cannot start") {
        auto inst = make_instance({});
        WorkflowStateMachine m(inst);
        REQUIRE_THROWS_AS(m.start(), InvalidTransition);
    }

    SECTION("Start twice") {
        auto inst = make_instance({phase("execute")});
        WorkflowStateMachine m(inst);
        m.start();
        REQUIRE_THROWS_AS(m.start(), InvalidTransition);
    }

    SECTION("Complete before start") {
        auto inst = make_instance({phase("execute")});
        WorkflowStateMachine m(inst);
        REQUIRE_THROWS_AS(m.complete_phase(PhaseEvidence{}), InvalidTransition);
    }

    SECTION("Recover a phase that did not fail") {
        auto inst = make_instance({phase("execute")});
        WorkflowStateMachine m(inst);
        m.start();
        REQUIRE_THROWS_AS(m.begin_recovery(), InvalidTransition);
    }

    SECTION("Nothing moves after abort") {
        auto inst = make_instance({phase("execute")});
        WorkflowStateMachine m(inst);
        m.start();
        m.abort("operator cancelled");
        REQUIRE(m.status() == WorkflowStatus::ABORTED_FAILED);
        REQUIRE(inst.abort_reason == "operator cancelled");
        REQUIRE_THROWS_AS(m.complete_phase(passing()), InvalidTransition);
        REQUIRE_THROWS_AS(m.abort("again"), InvalidTransition);
        REQUIRE_THROWS_AS(m.append_phase(phase("follow_up")), InvalidTransition);
    }
}

// Test 2: 验证等级决定阶段能否完成
TEST_CASE("Verification requirements gate completion", "[workflow][verification]") {
    SECTION("BASIC needs a passing run") {
        auto inst = make_instance({phase("implement", VerificationLevel::BASIC)});
        WorkflowStateMachine m(inst);
        m.start();
        REQUIRE_THROWS_AS(m.complete_phase(PhaseEvidence{}), InvalidTransition);
        REQUIRE(m.phase_status(0) == PhaseStatus::IN_PROGRESS);

        PhaseEvidence e;
        e.verification_ran = true;
        e.verification_passed = true;
        REQUIRE(m.complete_phase(e) == WorkflowStatus::ALL_PHASES_COMPLETED);
    }

    SECTION("FULL needs an explicit verdict for every task") {
        PhaseEvidence e = passing();
        e.all_verdicts_explicit = false;
        std::string missing;
        REQUIRE_FALSE(WorkflowStateMachine::requirement_satisfied(VerificationLevel::FULL, e, &missing));
        REQUIRE(missing == "not every task has an explicit verdict");
        REQUIRE(WorkflowStateMachine::requirement_satisfied(VerificationLevel::FULL, passing()));
    }

    SECTION("FULL_SECURITY_ROLLBACK needs security checks and a rollback plan") {
        PhaseEvidence e = passing();
        REQUIRE_FALSE(WorkflowStateMachine::requirement_satisfied(VerificationLevel::FULL_SECURITY_ROLLBACK, e));
        e.security_checked = true;
        REQUIRE_FALSE(WorkflowStateMachine::requirement_satisfied(VerificationLevel::FULL_SECURITY_ROLLBACK, e));
        e.rollback_plan_recorded = true;
        REQUIRE(WorkflowStateMachine::requirement_satisfied(VerificationLevel::FULL_SECURITY_ROLLBACK, e));
    }
}

// Test 3: 失败 -> 有限次恢复 -> 缩减范围重规划 -> 中止
TEST_CASE("Failure handling escalates after bounded recovery", "[workflow][recovery]") {
    auto inst = make_instance({phase("implement"), phase("verify")});
    WorkflowStateMachine m(inst, 2);
    m.start();

    REQUIRE(m.fail_phase("tests failing") == FailureDecision::RECOVER);
    REQUIRE(m.phase_status(0) == PhaseStatus::FAILED);
    REQUIRE(inst.error_log.size() == 1);
    m.begin_recovery();
    REQUIRE(m.phase_status(0) == PhaseStatus::IN_PROGRESS);
    REQUIRE(at_most_one_in_progress(inst));

    REQUIRE(m.fail_phase("still failing") == FailureDecision::RECOVER);
    m.begin_recovery();

    REQUIRE(m.fail_phase("failing a third time") == FailureDecision::ESCALATE);
    REQUIRE_THROWS_AS(m.begin_recovery(), InvalidTransition);
    REQUIRE(inst.recovery_attempts[0] == 2);

    SECTION("Reduced-scope re-plan is allowed once") {
        m.replan_reduced_scope({"docs"});
        REQUIRE_FALSE(inst.warnings.empty());
        REQUIRE(m.replanned(0));
        REQUIRE(m.phase_status(0) == PhaseStatus::IN_PROGRESS);

        REQUIRE(m.fail_phase("fails after re-plan") == FailureDecision::ESCALATE);
        REQUIRE_THROWS_AS(m.replan_reduced_scope({"docs"}), InvalidTransition);
        m.abort("recovery exhausted");
        REQUIRE(m.status() == WorkflowStatus::ABORTED_FAILED);
        // 已完成的工作保留，失败阶段之后的阶段从未开始
        REQUIRE(m.phase_status(1) == PhaseStatus::PENDING);
    }

    SECTION("Abort keeps the failure record") {
        m.abort("recovery exhausted");
        REQUIRE(inst.error_log.back().kind == ErrorKind::ABORTED);
        REQUIRE(inst.error_log.size() == 4);
    }
}

// Test 4: T3 阶段在操作员确认前不会完成
TEST_CASE("Human confirmation gates T3 phases", "[workflow][confirmation]") {
    auto inst = make_instance({phase("rotate"), phase("verify")});
    WorkflowStateMachine m(inst);
    m.start();
    m.require_confirmation(0);

    REQUIRE(m.complete_phase(PhaseEvidence{}) == WorkflowStatus::AWAITING_CONFIRMATION);
    REQUIRE(m.phase_status(0) == PhaseStatus::IN_PROGRESS);
    REQUIRE(m.current_phase() == 0);
    REQUIRE_FALSE(m.is_terminal());

    // 重复提交不会跳过确认
    REQUIRE(m.complete_phase(PhaseEvidence{}) == WorkflowStatus::AWAITING_CONFIRMATION);

    REQUIRE_THROWS_AS(m.record_confirmation(0, ""), InvalidTransition);
    m.record_confirmation(0, "alice");
    REQUIRE(m.is_confirmed(0));
    REQUIRE(m.complete_phase(PhaseEvidence{}) == WorkflowStatus::RUNNING);
    REQUIRE(m.phase_status(0) == PhaseStatus::COMPLETED);
    REQUIRE(m.current_phase() == 1);
    REQUIRE(inst.confirmations.front().operator_name == "alice");
}

TEST_CASE("Confirmation cannot be required for a completed phase", "[workflow][confirmation]") {
    auto inst = make_instance({phase("a"), phase("b")});
    WorkflowStateMachine m(inst);
    m.start();
    m.complete_phase(PhaseEvidence{});
    REQUIRE_THROWS_AS(m.require_confirmation(0), InvalidTransition);
    REQUIRE_THROWS_AS(m.require_confirmation(7), std::out_of_range);
}

// Test 5: 阻塞型 Stop hook 失败需要确认
TEST_CASE("Blocking stop failures wait for acknowledgment", "[workflow][stop]") {
    auto inst = make_instance({phase("execute")});
    WorkflowStateMachine m(inst);
    m.start();
    REQUIRE_THROWS_AS(m.await_acknowledgment("tests failing"), InvalidTransition);

    m.complete_phase(PhaseEvidence{});
    m.await_acknowledgment("tests failing");
    REQUIRE(m.status() == WorkflowStatus::AWAITING_ACKNOWLEDGMENT);
    REQUIRE_FALSE(m.is_terminal());
    REQUIRE(inst.warnings.back() == "tests failing");

    REQUIRE_THROWS_AS(m.acknowledge(""), InvalidTransition);
    m.acknowledge("bob");
    REQUIRE(m.status() == WorkflowStatus::ALL_PHASES_COMPLETED);
}

TEST_CASE("Appended phases run after the original plan", "[workflow]") {
    auto inst = make_instance({phase("implement")});
    WorkflowStateMachine m(inst);
    m.start();

    Phase follow_up = phase("follow_up");
    follow_up.ownership = OwnershipModel::PARALLEL_SWARM;
    REQUIRE(m.append_phase(follow_up) == 1);
    REQUIRE(m.phase_status(1) == PhaseStatus::PENDING);

    REQUIRE(m.complete_phase(PhaseEvidence{}) == WorkflowStatus::RUNNING);
    REQUIRE(m.current_phase() == 1);
    REQUIRE(m.complete_phase(PhaseEvidence{}) == WorkflowStatus::ALL_PHASES_COMPLETED);
}

TEST_CASE("Modified resources are recorded once", "[workflow]") {
    auto inst = make_instance({phase("execute")});
    WorkflowStateMachine m(inst);
    m.add_modified_resources({"src/a.cpp", "src/b.cpp"});
    m.add_modified_resources({"src/b.cpp", "src/c.cpp"});
    REQUIRE(inst.modified_resources == std::vector<std::string>{"src/a.cpp", "src/b.cpp", "src/c.cpp"});
}
