// tests/test_context_engine.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/context/context_engine.h"
#include "modules/trace/event_trace.h"
#include <stdexcept>
#include <string>

using namespace swarmflow;

// Test 1: 合并策略
TEST_CASE("Context merge policies", "[context][merge]") {
    SECTION("Conflicting scalars fail by default") {
        Context target = {{"owner", "alice"}};
        REQUIRE_THROWS_AS(ContextEngine::merge(target, {{"owner", "bob"}}), std::runtime_error);
        // 相同值不算冲突
        REQUIRE_NOTHROW(ContextEngine::merge(target, {{"owner", "alice"}}));
    }

    SECTION("Last write wins") {
        Context target = {{"owner", "alice"}, {"tags", {"a"}}};
        ContextEngine::merge(target, {{"owner", "bob"}, {"tags", {"b"}}}, ContextMergePolicy::last_write_wins());
        REQUIRE(target["owner"] == "bob");
        REQUIRE(target["tags"] == Context::array({"b"}));
    }

    SECTION("Nested objects merge key by key") {
        Context target = {{"review", {{"security", "pending"}}}};
        ContextEngine::merge(target, {{"review", {{"perf", "ok"}}}});
        REQUIRE(target["review"]["security"] == "pending");
        REQUIRE(target["review"]["perf"] == "ok");
    }

    SECTION("Per-field array strategies") {
        ContextMergePolicy policy;
        policy.field_policies["checks"] = "array_merge_unique";
        policy.field_policies["log.*"] = "array_concat";

        Context target = {{"checks", {"unit", "lint"}}, {"log", {{"lines", {"a"}}}}};
        ContextEngine::merge(target, {{"checks", {"lint", "fuzz"}}, {"log", {{"lines", {"a"}}}}}, policy);
        REQUIRE(target["checks"] == Context::array({"unit", "lint", "fuzz"}));
        REQUIRE(target["log"]["lines"] == Context::array({"a", "a"}));
    }
}

// Test 2: 会话状态通过版本化 patch 显式传递
TEST_CASE("Patches bump the session state version", "[context][session]") {
    SessionState state;
    std::vector<Context> patches = {Context{{"a", 1}}, Context::object(), Context{{"a", 2}, {"b", true}}};
    auto version = ContextEngine::apply_patches(state, patches);
    // 空 patch 不计入版本
    REQUIRE(version == 2);
    REQUIRE(state.version == 2);
    REQUIRE(state.data["a"] == 2);
    REQUIRE(state.data["b"] == true);
}

// Test 3: 阶段快照按 FIFO 受预算约束
TEST_CASE("Snapshots respect their budget", "[context][snapshot]") {
    ContextEngine engine;
    engine.set_snapshot_limits(2, 1024);

    engine.save_snapshot("wf-1/implement/0", {{"phase", "plan"}});
    engine.save_snapshot("wf-1/implement/1", {{"phase", "implement"}});
    engine.save_snapshot("wf-1/implement/2", {{"phase", "verify"}});

    REQUIRE(engine.get_snapshot("wf-1/implement/0") == nullptr);
    REQUIRE(engine.get_snapshot("wf-1/implement/2") != nullptr);
    REQUIRE((*engine.get_snapshot("wf-1/implement/1"))["phase"] == "implement");
    REQUIRE(engine.snapshot_keys() == std::vector<SnapshotKey>{"wf-1/implement/1", "wf-1/implement/2"});

    SECTION("Re-saving a key moves it to the back") {
        engine.save_snapshot("wf-1/implement/1", {{"phase", "implement"}, {"retry", 1}});
        REQUIRE(engine.snapshot_keys().back() == "wf-1/implement/1");
        REQUIRE((*engine.get_snapshot("wf-1/implement/1"))["retry"] == 1);
    }

    SECTION("Oversized snapshots are refused") {
        engine.set_snapshot_limits(2, 1);
        engine.save_snapshot("big", {{"blob", std::string(4096, 'x')}});
        REQUIRE(engine.get_snapshot("big") == nullptr);
    }
}

// Test 4: 事件追踪
TEST_CASE("Event trace records per-instance events in order", "[trace]") {
    EventTrace trace;
    std::vector<std::string> pushed;
    trace.set_sink([&](const TraceEvent& e) { pushed.push_back(e.type); });

    trace.emit("wf-1", "workflow.started");
    trace.emit("wf-2", "workflow.started");
    trace.emit("wf-1", "phase.started", {{"phase", "plan"}});
    trace.emit("wf-1", "phase.completed", {{"phase", "plan"}});

    auto events = trace.events("wf-1");
    REQUIRE(events.size() == 3);
    REQUIRE(events[0].seq < events[1].seq);
    REQUIRE(events[1].seq < events[2].seq);
    REQUIRE(trace.events_of_type("wf-1", "phase.started").front().data["phase"] == "plan");
    REQUIRE(pushed.size() == 4);

    auto j = trace.to_json("wf-1");
    REQUIRE(j.is_array());
    REQUIRE(j[2]["type"] == "phase.completed");

    trace.clear("wf-1");
    REQUIRE(trace.events("wf-1").empty());
    REQUIRE(trace.events("wf-2").size() == 1);
}

TEST_CASE("A throwing sink does not break emission", "[trace]") {
    EventTrace trace;
    trace.set_sink([](const TraceEvent&) { throw std::runtime_error("sink down"); });
    REQUIRE_NOTHROW(trace.emit("wf-1", "workflow.started"));
    REQUIRE(trace.events("wf-1").size() == 1);
}

TEST_CASE("Context delta reports changed and removed keys", "[trace]") {
    Context before = {{"a", 1}, {"b", 2}, {"gone", true}};
    Context after = {{"a", 1}, {"b", 3}, {"new", "x"}};
    auto delta = EventTrace::context_delta(before, after);
    REQUIRE_FALSE(delta.contains("a"));
    REQUIRE(delta["b"] == 3);
    REQUIRE(delta["new"] == "x");
    REQUIRE(delta["gone"].is_null());
}
