// modules/hooks/hook_dispatcher.cpp
#include "modules/hooks/hook_dispatcher.h"
#include "modules/context/context_engine.h"
#include "common/log/logger.h"
#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace swarmflow {

namespace {

using Clock = std::chrono::steady_clock;
using std::chrono::milliseconds;

// hook 线程与 dispatcher 之间的一次性结果槽
struct HookSlot {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    bool faulted = false;
    std::string error;
    HookResult result;
};

HookResult make_result(const std::string& name, HookStatus status, std::string text) {
    HookResult r;
    r.hook_name = name;
    r.status = status;
    r.display_text = std::move(text);
    return r;
}

} // namespace

std::chrono::milliseconds HookBudgets::budget_for(HookPoint point) const {
    switch (point) {
        case HookPoint::ON_REQUEST_SUBMIT: return on_request_submit;
        case HookPoint::ON_RESOURCE_MUTATED: return on_resource_mutated;
        case HookPoint::ON_WORKFLOW_STOP: return on_workflow_stop;
    }
    return on_request_submit;
}

const HookResult* DispatchSummary::find(const std::string& hook_name) const {
    for (const auto& r : results) {
        if (r.hook_name == hook_name) return &r;
    }
    return nullptr;
}

HookDispatcher::HookDispatcher(const HookRegistry& registry, HookBudgets budgets)
    : registry_(registry), budgets_(budgets) {}

HookResult HookDispatcher::run_with_timeout(const std::shared_ptr<Hook>& hook, const HookContext& ctx,
                                            milliseconds timeout) {
    auto slot = std::make_shared<HookSlot>();
    std::thread([slot, hook, ctx]() {
        HookResult r;
        bool faulted = false;
        std::string error;
        try {
            r = hook->run(ctx);
        } catch (const std::exception& e) {
            faulted = true;
            error = e.what();
        } catch (...) {
            faulted = true;
            error = "non-standard exception";
        }
        std::lock_guard<std::mutex> lock(slot->mutex);
        slot->done = true;
        slot->faulted = faulted;
        slot->error = std::move(error);
        slot->result = std::move(r);
        slot->cv.notify_one();
    }).detach();

    std::unique_lock<std::mutex> lock(slot->mutex);
    if (!slot->cv.wait_for(lock, timeout, [&] { return slot->done; })) {
        return make_result(hook->name(), HookStatus::TIMEOUT,
                           "timed out after " + std::to_string(timeout.count()) + " ms");
    }
    if (slot->faulted) {
        return make_result(hook->name(), HookStatus::FAILED, "hook fault: " + slot->error);
    }
    return std::move(slot->result);
}

DispatchSummary HookDispatcher::dispatch(HookPoint point, const HookContext& ctx) const {
    auto entries = registry_.hooks_at(point);
    const auto start = Clock::now();
    const milliseconds budget = budgets_.budget_for(point);

    DispatchSummary summary;
    summary.point = point;
    summary.results.reserve(entries.size());

    // 1. should_run 过滤；谓词本身的故障同样隔离
    std::vector<size_t> runnable;
    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& hook = entries[i].hook;
        HookResult r = make_result(hook->name(), HookStatus::SKIPPED, "predicate not met");
        r.blocking = hook->blocking();
        try {
            if (hook->should_run(ctx)) {
                runnable.push_back(i);
                r.display_text.reset();
            }
        } catch (const std::exception& e) {
            r.status = HookStatus::FAILED;
            r.display_text = std::string("predicate fault: ") + e.what();
            log::logger()->error("Hook '{}' predicate fault at {}: {}", hook->name(), to_string(point), e.what());
        }
        summary.results.push_back(std::move(r));
    }

    // 2. 按优先级稳定排序，同优先级保持注册顺序
    std::stable_sort(runnable.begin(), runnable.end(), [&](size_t a, size_t b) {
        return entries[a].hook->priority() < entries[b].hook->priority();
    });

    // 3. 顺序执行
    for (size_t idx : runnable) {
        const auto& hook = entries[idx].hook;
        const bool blocking_stop = point == HookPoint::ON_WORKFLOW_STOP && hook->blocking();
        auto spent = std::chrono::duration_cast<milliseconds>(Clock::now() - start);
        milliseconds remaining = budget - spent;

        milliseconds effective = hook->timeout();
        if (!blocking_stop) {
            if (remaining.count() <= 0) {
                auto& r = summary.results[idx];
                r.status = HookStatus::SKIPPED;
                r.display_text = "aggregate budget exhausted";
                log::logger()->warn("Hook '{}' skipped at {}: aggregate budget of {} ms exhausted",
                                    hook->name(), to_string(point), budget.count());
                if (observer_) observer_(point, r);
                continue;
            }
            effective = std::min(effective, remaining);
        }

        auto hook_start = Clock::now();
        HookResult r = run_with_timeout(hook, ctx, effective);
        r.hook_name = hook->name();
        r.blocking = hook->blocking();
        r.duration = std::chrono::duration_cast<milliseconds>(Clock::now() - hook_start);

        if (r.status == HookStatus::FAILED || r.status == HookStatus::TIMEOUT) {
            log::logger()->error("Hook '{}' at {} reported {}: {}", r.hook_name, to_string(point),
                                 to_string(r.status), r.display_text.value_or(""));
        } else {
            log::logger()->debug("Hook '{}' at {} finished in {} ms", r.hook_name, to_string(point), r.duration.count());
        }

        if (blocking_stop && r.status != HookStatus::SUCCESS) {
            summary.blocking_failure = true;
            summary.warnings.push_back("Blocking stop hook '" + r.hook_name + "' reported " +
                                       to_string(r.status) + "; operator acknowledgment required");
        }
        if (r.status == HookStatus::SUCCESS && r.state_patch.has_value()) {
            summary.patches.push_back(*r.state_patch);
        }
        if (observer_) observer_(point, r);
        summary.results[idx] = std::move(r);
    }

    // 4. 全部执行完后按执行顺序合并 patch
    for (const auto& patch : summary.patches) {
        ContextEngine::merge(summary.merged_patch, patch, ContextMergePolicy::last_write_wins());
    }

    summary.elapsed = std::chrono::duration_cast<milliseconds>(Clock::now() - start);
    log::logger()->info("Dispatched {} hook(s) at {} in {} ms", entries.size(), to_string(point), summary.elapsed.count());
    return summary;
}

} // namespace swarmflow
