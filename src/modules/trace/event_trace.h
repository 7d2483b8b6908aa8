// modules/trace/event_trace.h
#ifndef SWARMFLOW_MODULES_TRACE_EVENT_TRACE_H
#define SWARMFLOW_MODULES_TRACE_EVENT_TRACE_H

#include "core/types/context.h" // 引入 Context
#include "core/types/budget.h"  // 引入 SwarmBudget
#include <nlohmann/json.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace swarmflow {

struct TraceEvent {
    uint64_t seq = 0;
    std::string instance_id;
    std::string type; // "phase.started", "hook.result", "worker.replaced", ...
    std::chrono::system_clock::time_point timestamp;
    nlohmann::json data = nlohmann::json::object();

    nlohmann::json to_json() const;
};

using EventSink = std::function<void(const TraceEvent&)>;

// 按实例保存进度事件，并可选地实时推送给调用方
class EventTrace {
public:
    void set_sink(EventSink sink);

    void emit(const std::string& instance_id, const std::string& type, nlohmann::json data = nlohmann::json::object());

    std::vector<TraceEvent> events(const std::string& instance_id) const;
    std::vector<TraceEvent> events_of_type(const std::string& instance_id, const std::string& type) const;
    nlohmann::json to_json(const std::string& instance_id) const;
    void clear(const std::string& instance_id);

    // 状态变更前后的差异（新增/修改的键，删除的键记为 null）
    static nlohmann::json context_delta(const Context& before, const Context& after);
    static nlohmann::json budget_snapshot(const SwarmBudget& budget);

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<TraceEvent>> events_;
    EventSink sink_;
    uint64_t next_seq_ = 1;
};

} // namespace swarmflow

#endif // SWARMFLOW_MODULES_TRACE_EVENT_TRACE_H
