// tests/test_swarm_coordinator.cpp
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/generators/catch_generators_adapters.hpp>
#include <catch2/generators/catch_generators_random.hpp>
#include "modules/swarm/swarm_coordinator.h"
#include "core/types/errors.h"
#include <algorithm>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <set>
#include <stdexcept>

using namespace swarmflow;
using namespace std::chrono_literals;

namespace {

AgentTask make_task(const std::string& id, std::vector<std::string> resources, bool critical = true) {
    AgentTask t;
    t.id = id;
    t.resources = std::move(resources);
    t.critical = critical;
    t.description = "work on " + id;
    return t;
}

Phase swarm_phase(const std::string& name = "implement") {
    Phase p;
    p.name = name;
    p.ownership = OwnershipModel::PARALLEL_SWARM;
    return p;
}

SwarmConfig fast_config() {
    SwarmConfig c;
    c.grace_period = 2000ms;
    c.poll_interval = 2ms;
    return c;
}

// worker 调用记录；以 shared_ptr 捕获，分离线程可能比测试活得更久
struct CallLog {
    std::mutex mutex;
    std::map<TaskId, int> calls;
    std::map<TaskId, std::vector<WorkerId>> workers;

    void add(const AgentTask& task, const WorkerContext& ctx) {
        std::lock_guard<std::mutex> lock(mutex);
        ++calls[task.id];
        workers[task.id].push_back(ctx.worker_id());
    }
    int count(const TaskId& id) {
        std::lock_guard<std::mutex> lock(mutex);
        return calls[id];
    }
};

WorkerFunction modifying_worker(std::shared_ptr<CallLog> log) {
    return [log](const AgentTask& task, WorkerContext& ctx) {
        log->add(task, ctx);
        ctx.report_progress();
        TaskOutput out;
        out.modified_resources = task.resources;
        out.summary = "done " + task.id;
        out.output = {{"fixed", task.failure.has_value()}};
        return out;
    };
}

} // namespace

// Test 1: 兄弟任务资源必须互不相交
// 随机划分资源，部分种子注入跨任务重叠，结果与两两比较的朴素判定一致
TEST_CASE("Sibling tasks must own disjoint resources", "[swarm][planning]") {
    const int seed = GENERATE(take(60, random(1, 1000000)));
    CAPTURE(seed);
    std::mt19937 rng(static_cast<std::mt19937::result_type>(seed));
    auto pick = [&rng](int lo, int hi) { return std::uniform_int_distribution<int>(lo, hi)(rng); };

    std::vector<std::string> pool;
    for (int m = 0; m < 4; ++m) {
        for (int f = 0; f < 4; ++f) pool.push_back("mod" + std::to_string(m) + "/f" + std::to_string(f) + ".cpp");
    }
    std::shuffle(pool.begin(), pool.end(), rng);

    const int task_count = pick(2, 6);
    std::vector<AgentTask> tasks;
    for (int i = 0; i < task_count; ++i) tasks.push_back(make_task("t" + std::to_string(i), {}));
    for (const auto& r : pool) {
        const int owner = pick(-1, task_count - 1); // -1: 无人认领
        if (owner >= 0) tasks[owner].resources.push_back(r);
    }
    // 同一任务内重复列出资源不算重叠
    if (!tasks[0].resources.empty() && pick(0, 3) == 0) tasks[0].resources.push_back(tasks[0].resources.front());
    if (pick(0, 1) == 1) {
        const int from = pick(0, task_count - 1);
        const int to = (from + pick(1, task_count - 1)) % task_count;
        if (!tasks[from].resources.empty()) {
            const auto& shared = tasks[from].resources[pick(0, static_cast<int>(tasks[from].resources.size()) - 1)];
            tasks[to].resources.push_back(shared);
        }
    }

    bool overlapping = false;
    for (size_t i = 0; i < tasks.size() && !overlapping; ++i) {
        for (size_t j = i + 1; j < tasks.size() && !overlapping; ++j) {
            for (const auto& r : tasks[i].resources) {
                const auto& other = tasks[j].resources;
                if (std::find(other.begin(), other.end(), r) != other.end()) {
                    overlapping = true;
                    break;
                }
            }
        }
    }

    if (overlapping) {
        REQUIRE_THROWS_AS(AgentSwarmCoordinator::validate_disjoint(tasks), PlanningError);

        auto log = std::make_shared<CallLog>();
        AgentSwarmCoordinator coordinator(modifying_worker(log), fast_config());
        REQUIRE_THROWS_AS(coordinator.run_phase(swarm_phase(), tasks), PlanningError);
        // 规划错误在任何 worker 启动前报告
        for (const auto& t : tasks) REQUIRE(log->count(t.id) == 0);
    } else {
        REQUIRE_NOTHROW(AgentSwarmCoordinator::validate_disjoint(tasks));
    }
}

TEST_CASE("A shared resource is reported with both owners", "[swarm][planning]") {
    std::vector<AgentTask> tasks = {make_task("a", {"src/a.cpp", "src/shared.h"}), make_task("b", {"src/shared.h"})};
    try {
        AgentSwarmCoordinator::validate_disjoint(tasks);
        FAIL("expected PlanningError");
    } catch (const PlanningError& e) {
        const std::string what = e.what();
        REQUIRE(what.find("'a'") != std::string::npos);
        REQUIRE(what.find("'b'") != std::string::npos);
        REQUIRE(what.find("src/shared.h") != std::string::npos);
    }
}

TEST_CASE("Duplicate task ids are a planning error", "[swarm][planning]") {
    std::vector<AgentTask> tasks = {make_task("a", {"x"}), make_task("a", {"y"})};
    REQUIRE_THROWS_AS(AgentSwarmCoordinator::validate_disjoint(tasks), PlanningError);
}

// Test 2: 只对验证失败的任务启动修复 worker
TEST_CASE("Fix workers target only the failing tasks", "[swarm][verification]") {
    auto log = std::make_shared<CallLog>();
    AgentSwarmCoordinator coordinator(modifying_worker(log), fast_config());
    const std::set<TaskId> bad = {"t2", "t4"};
    int verifier_runs = 0;
    coordinator.set_verifier([&](const PhaseResult& pr) {
        ++verifier_runs;
        VerificationReport report;
        report.security_checked = true;
        for (const auto& r : pr.tasks) {
            bool fixed = r.output.value("fixed", false);
            TaskVerdict v;
            v.passed = !bad.count(r.task_id) || fixed;
            if (!v.passed) {
                v.detail = "assertion failed in " + r.task_id;
                v.failing_checks = {"unit"};
            }
            report.verdicts[r.task_id] = v;
        }
        return report;
    });

    std::vector<AgentTask> tasks;
    for (int i = 1; i <= 5; ++i) {
        tasks.push_back(make_task("t" + std::to_string(i), {"mod" + std::to_string(i) + "/file.cpp"}));
    }
    auto result = coordinator.run_phase(swarm_phase(), tasks);

    REQUIRE(result.fix_workers == std::vector<WorkerId>{"t2~fix1", "t4~fix1"});
    REQUIRE(result.escalated.empty());
    REQUIRE(result.succeeded());
    REQUIRE(verifier_runs == 2);
    REQUIRE(result.tasks.size() == 5);
    REQUIRE(result.all_verdicts_explicit);

    for (const char* id : {"t1", "t3", "t5"}) {
        INFO(id);
        REQUIRE(log->count(id) == 1);
        REQUIRE(result.find(id)->fix_attempts == 0);
        REQUIRE(result.find(id)->verified);
    }
    for (const char* id : {"t2", "t4"}) {
        INFO(id);
        REQUIRE(log->count(id) == 2);
        REQUIRE(result.find(id)->worker_id == std::string(id) + "~fix1");
        REQUIRE(result.find(id)->fix_attempts == 1);
        REQUIRE(result.find(id)->status == TaskStatus::COMPLETED);
    }
    // 结果按原始任务顺序排列
    REQUIRE(result.tasks.front().task_id == "t1");
    REQUIRE(result.tasks.back().task_id == "t5");
}

TEST_CASE("A task failing again after its fix is escalated", "[swarm][verification]") {
    auto log = std::make_shared<CallLog>();
    AgentSwarmCoordinator coordinator(modifying_worker(log), fast_config());
    coordinator.set_verifier([](const PhaseResult& pr) {
        VerificationReport report;
        for (const auto& r : pr.tasks) {
            TaskVerdict v;
            v.passed = r.task_id != "t3";
            if (!v.passed) v.detail = "still broken";
            report.verdicts[r.task_id] = v;
        }
        return report;
    });

    auto result = coordinator.run_phase(swarm_phase(), {make_task("t1", {"a/1"}), make_task("t3", {"b/3"})});
    REQUIRE(result.escalated == std::vector<TaskId>{"t3"});
    REQUIRE_FALSE(result.succeeded());
    const TaskResult* t3 = result.find("t3");
    REQUIRE(t3->status == TaskStatus::FAILED);
    REQUIRE(t3->escalated);
    REQUIRE(t3->error == "still broken");
    REQUIRE(result.find("t1")->status == TaskStatus::COMPLETED);
}

TEST_CASE("Worker exceptions become failed tasks and get a fix worker", "[swarm]") {
    auto attempts = std::make_shared<std::atomic<int>>(0);
    AgentSwarmCoordinator coordinator(
        [attempts](const AgentTask& task, WorkerContext&) -> TaskOutput {
            if (!task.failure) {
                ++*attempts;
                throw std::runtime_error("compiler crashed");
            }
            TaskOutput out;
            out.ok = task.failure->error_detail == "compiler crashed";
            return out;
        },
        fast_config());

    auto result = coordinator.run_phase(swarm_phase(), {make_task("t1", {"a/1"})});
    REQUIRE(*attempts == 1);
    REQUIRE(result.fix_workers.size() == 1);
    REQUIRE(result.find("t1")->status == TaskStatus::COMPLETED);
    REQUIRE_FALSE(result.verification_ran);
}

TEST_CASE("Fix workers continue the attempt count of a retried task", "[swarm][verification]") {
    auto seen = std::make_shared<CallLog>();
    auto fix_attempt = std::make_shared<std::atomic<int>>(0);
    AgentSwarmCoordinator coordinator(
        [seen, fix_attempt](const AgentTask& task, WorkerContext& ctx) {
            seen->add(task, ctx);
            TaskOutput out;
            const bool fixing = ctx.worker_id().find("~fix") != std::string::npos;
            if (fixing && task.failure) *fix_attempt = task.failure->attempt;
            out.ok = fixing;
            if (!out.ok) out.error = "lint failed";
            return out;
        },
        fast_config());

    AgentTask retried = make_task("t", {"a/1"});
    retried.failure = FailureContext{"lint failed", {"lint"}, 2};
    auto result = coordinator.run_phase(swarm_phase(), {retried});

    REQUIRE(result.fix_workers == std::vector<WorkerId>{"t~fix2"});
    REQUIRE(*fix_attempt == 2);
    REQUIRE(seen->workers["t"] == std::vector<WorkerId>{"t", "t~fix2"});
    REQUIRE(result.find("t")->status == TaskStatus::COMPLETED);
}

// Test 3: 验证提供方出错时保留 worker 结果，不抛出
TEST_CASE("A failing verifier keeps the finished work", "[swarm][verification]") {
    auto log = std::make_shared<CallLog>();
    AgentSwarmCoordinator coordinator(modifying_worker(log), fast_config());
    auto verifier_runs = std::make_shared<int>(0);
    std::vector<std::string> events;
    coordinator.set_event_emitter([&events](const std::string& type, const nlohmann::json&) { events.push_back(type); });

    SECTION("First verification fails") {
        coordinator.set_verifier([](const PhaseResult&) -> VerificationReport {
            throw std::runtime_error("provider down");
        });
        PhaseResult result;
        REQUIRE_NOTHROW(result = coordinator.run_phase(swarm_phase(), {make_task("a", {"a/1"}), make_task("b", {"b/1"})}));

        REQUIRE(result.verification_error == std::string("provider down"));
        REQUIRE_FALSE(result.verification_ran);
        REQUIRE_FALSE(result.all_verdicts_explicit);
        REQUIRE_FALSE(result.succeeded());
        REQUIRE(result.fix_workers.empty());
        REQUIRE(result.tasks.size() == 2);
        for (const auto& t : result.tasks) {
            REQUIRE(t.status == TaskStatus::COMPLETED);
            REQUIRE(t.modified_resources == t.resources);
        }
        REQUIRE(std::find(events.begin(), events.end(), "phase.verification_failed") != events.end());
    }

    SECTION("Re-verification after a fix fails") {
        coordinator.set_verifier([verifier_runs](const PhaseResult& pr) {
            if (++*verifier_runs > 1) throw std::runtime_error("provider down");
            VerificationReport report;
            for (const auto& r : pr.tasks) report.verdicts[r.task_id] = TaskVerdict{r.task_id != "b", "", {}};
            return report;
        });
        auto result = coordinator.run_phase(swarm_phase(), {make_task("a", {"a/1"}), make_task("b", {"b/1"})});

        REQUIRE(*verifier_runs == 2);
        REQUIRE(result.verification_error == std::string("provider down"));
        REQUIRE(result.fix_workers == std::vector<WorkerId>{"b~fix1"});
        REQUIRE(result.find("a")->verified);
        REQUIRE(result.find("b")->status == TaskStatus::COMPLETED);
        REQUIRE_FALSE(result.succeeded());
    }
}

// Test 4: 卡死的 worker 被同资源集合的替换者接手
TEST_CASE("A stalled worker is replaced exactly once", "[swarm][stall]") {
    auto log = std::make_shared<CallLog>();
    SwarmConfig config = fast_config();
    config.grace_period = 60ms;

    AgentSwarmCoordinator coordinator(
        [log](const AgentTask& task, WorkerContext& ctx) {
            log->add(task, ctx);
            if (task.id == "slow" && !ctx.replacement_note()) {
                // 不汇报进度，直到被取消
                ctx.wait_for_cancellation(3000ms);
                return TaskOutput{};
            }
            TaskOutput out;
            out.modified_resources = task.resources;
            return out;
        },
        config);

    std::vector<nlohmann::json> replaced;
    coordinator.set_event_emitter([&](const std::string& type, const nlohmann::json& data) {
        if (type == "worker.replaced") replaced.push_back(data);
    });

    auto result = coordinator.run_phase(swarm_phase(),
                                        {make_task("slow", {"svc/a.cpp", "svc/b.cpp"}), make_task("quick", {"lib/c.cpp"})});

    REQUIRE(result.replacements == std::vector<std::string>{"slow -> slow~r1"});
    REQUIRE(replaced.size() == 1);
    REQUIRE(replaced.front()["resources"] == nlohmann::json::array({"svc/a.cpp", "svc/b.cpp"}));

    const TaskResult* slow = result.find("slow");
    REQUIRE(slow->status == TaskStatus::COMPLETED);
    REQUIRE(slow->worker_id == "slow~r1");
    REQUIRE(slow->resources == std::vector<std::string>{"svc/a.cpp", "svc/b.cpp"});
    REQUIRE(slow->modified_resources == std::vector<std::string>{"svc/a.cpp", "svc/b.cpp"});
    REQUIRE(result.find("quick")->worker_id == "quick");
    REQUIRE(log->count("quick") == 1);
}

TEST_CASE("Replacement limit turns a stall into a failure", "[swarm][stall]") {
    SwarmConfig config = fast_config();
    config.grace_period = 30ms;
    config.max_replacements_per_task = 1;

    AgentSwarmCoordinator coordinator(
        [](const AgentTask& task, WorkerContext& ctx) {
            if (!task.failure) ctx.wait_for_cancellation(3000ms);
            return TaskOutput{};
        },
        config);

    auto result = coordinator.run_phase(swarm_phase(), {make_task("stuck", {"x/1"})});
    REQUIRE(result.replacements.size() == 1);
    // 替换者同样卡死后任务失败，随后由修复 worker 处理
    REQUIRE(result.fix_workers == std::vector<WorkerId>{"stuck~fix1"});
    REQUIRE(result.find("stuck")->status == TaskStatus::COMPLETED);
}

// Test 5: 并发上限与预算控制
TEST_CASE("Single-agent phases never run workers concurrently", "[swarm][budget]") {
    struct Gauge {
        std::atomic<int> running{0};
        std::atomic<int> peak{0};
    };
    auto gauge = std::make_shared<Gauge>();
    AgentSwarmCoordinator coordinator(
        [gauge](const AgentTask&, WorkerContext& ctx) {
            int now = ++gauge->running;
            int peak = gauge->peak.load();
            while (now > peak && !gauge->peak.compare_exchange_weak(peak, now)) {}
            ctx.wait_for_cancellation(10ms);
            --gauge->running;
            return TaskOutput{};
        },
        fast_config());

    Phase phase;
    phase.name = "plan";
    phase.ownership = OwnershipModel::SINGLE_AGENT;
    auto result = coordinator.run_phase(phase, {make_task("a", {"a/1"}), make_task("b", {"b/1"}), make_task("c", {"c/1"})});
    REQUIRE(result.waves == 3);
    REQUIRE(gauge->peak == 1);
    REQUIRE(result.tasks.size() == 3);
}

TEST_CASE("Excess non-critical tasks are deferred", "[swarm][budget]") {
    auto log = std::make_shared<CallLog>();
    SwarmConfig config = fast_config();
    config.max_concurrent_workers = 2;
    AgentSwarmCoordinator coordinator(modifying_worker(log), config);

    std::vector<AgentTask> tasks = {make_task("a", {"a/1"}), make_task("b", {"b/1"}),
                                    make_task("c", {"c/1"}, false), make_task("d", {"d/1"}, false)};

    SECTION("Deferral allowed") {
        auto result = coordinator.run_phase(swarm_phase(), tasks);
        REQUIRE(result.deferred.size() == 2);
        REQUIRE(result.deferred[0].id == "c");
        REQUIRE(result.deferred[1].id == "d");
        REQUIRE(result.tasks.size() == 2);
        REQUIRE(result.waves == 1);
        REQUIRE_FALSE(result.budget_actions.empty());
        REQUIRE(log->count("c") == 0);
    }

    SECTION("Deferral disabled runs sequential batches") {
        auto result = coordinator.run_phase(swarm_phase(), tasks, false);
        REQUIRE(result.deferred.empty());
        REQUIRE(result.tasks.size() == 4);
        REQUIRE(result.waves == 2);
    }
}

TEST_CASE("Related resources are merged into one worker", "[swarm][budget]") {
    auto log = std::make_shared<CallLog>();
    SwarmConfig config = fast_config();
    config.max_concurrent_workers = 1;
    AgentSwarmCoordinator coordinator(modifying_worker(log), config);

    auto result = coordinator.run_phase(swarm_phase(), {make_task("a", {"src/ui/a.cpp"}), make_task("b", {"src/ui/b.cpp"}),
                                                        make_task("c", {"src/ui/c.cpp"})});
    REQUIRE(result.waves == 1);
    for (const auto& r : result.tasks) {
        REQUIRE(r.worker_id == "src/ui/*");
        REQUIRE(r.status == TaskStatus::COMPLETED);
    }
}

TEST_CASE("Context pressure enters conservation mode", "[swarm][budget]") {
    auto log = std::make_shared<CallLog>();
    SwarmConfig config = fast_config();
    config.max_concurrent_workers = 1;
    config.max_iterations = 1;
    AgentSwarmCoordinator coordinator(modifying_worker(log), config);

    auto result = coordinator.run_phase(
        swarm_phase(), {make_task("core", {"a/1"}), make_task("docs", {"b/1"}, false), make_task("lint", {"c/1"}, false)},
        false);

    REQUIRE(result.conservation_mode);
    REQUIRE(coordinator.conservation_mode());
    REQUIRE(result.skipped == std::vector<TaskId>{"docs", "lint"});
    REQUIRE(result.find("core")->status == TaskStatus::COMPLETED);
    REQUIRE(result.find("docs")->status == TaskStatus::SKIPPED);
    REQUIRE(log->count("docs") == 0);
}

// Test 6: 资源修改通知
TEST_CASE("Mutations are reported once per modified resource", "[swarm][hooks]") {
    AgentSwarmCoordinator coordinator(
        [](const AgentTask& task, WorkerContext&) {
            TaskOutput out;
            out.modified_resources = task.resources;
            out.modified_resources.push_back("elsewhere/other.cpp"); // 超出资源集合，被忽略
            return out;
        },
        fast_config());

    std::vector<std::string> seen;
    coordinator.set_mutation_observer([&](const std::string& resource, const TaskResult& r) {
        seen.push_back(r.task_id + ":" + resource);
        HookResult hr;
        hr.hook_name = "fmt";
        return std::vector<HookResult>{hr};
    });

    auto result = coordinator.run_phase(swarm_phase(), {make_task("a", {"a/1", "a/2"})});
    REQUIRE(seen == std::vector<std::string>{"a:a/1", "a:a/2"});
    REQUIRE(result.mutation_hooks.size() == 2);
    REQUIRE(result.find("a")->modified_resources == std::vector<std::string>{"a/1", "a/2"});
}
