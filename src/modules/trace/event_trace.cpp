// modules/trace/event_trace.cpp
#include "modules/trace/event_trace.h"
#include "common/log/logger.h"

namespace swarmflow {

nlohmann::json TraceEvent::to_json() const {
    nlohmann::json j;
    j["seq"] = seq;
    j["instance_id"] = instance_id;
    j["type"] = type;
    j["timestamp_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
    j["data"] = data;
    return j;
}

void EventTrace::set_sink(EventSink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void EventTrace::emit(const std::string& instance_id, const std::string& type, nlohmann::json data) {
    TraceEvent event;
    EventSink sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        event.seq = next_seq_++;
        event.instance_id = instance_id;
        event.type = type;
        event.timestamp = std::chrono::system_clock::now();
        event.data = std::move(data);
        events_[instance_id].push_back(event);
        sink = sink_;
    }
    log::logger()->debug("[{}] {} {}", instance_id, type, event.data.dump());
    // sink 在锁外调用，允许其回调引擎查询
    if (sink) {
        try {
            sink(event);
        } catch (const std::exception& e) {
            log::logger()->error("Event sink failed on '{}': {}", type, e.what());
        }
    }
}

std::vector<TraceEvent> EventTrace::events(const std::string& instance_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = events_.find(instance_id);
    if (it == events_.end()) return {};
    return it->second;
}

std::vector<TraceEvent> EventTrace::events_of_type(const std::string& instance_id, const std::string& type) const {
    std::vector<TraceEvent> out;
    for (auto& e : events(instance_id)) {
        if (e.type == type) out.push_back(std::move(e));
    }
    return out;
}

nlohmann::json EventTrace::to_json(const std::string& instance_id) const {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& e : events(instance_id)) {
        arr.push_back(e.to_json());
    }
    return arr;
}

void EventTrace::clear(const std::string& instance_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.erase(instance_id);
}

nlohmann::json EventTrace::context_delta(const Context& before, const Context& after) {
    nlohmann::json delta = nlohmann::json::object();
    if (!after.is_object()) return delta;
    for (auto it = after.begin(); it != after.end(); ++it) {
        const std::string& key = it.key();
        if (!before.is_object() || !before.contains(key) || before[key] != it.value()) {
            delta[key] = it.value();
        }
    }
    if (before.is_object()) {
        for (auto it = before.begin(); it != before.end(); ++it) {
            if (!after.contains(it.key())) {
                delta[it.key()] = nullptr;
            }
        }
    }
    return delta;
}

nlohmann::json EventTrace::budget_snapshot(const SwarmBudget& b) {
    nlohmann::json obj;
    obj["max_concurrent_workers"] = b.max_concurrent_workers;
    obj["max_iterations"] = b.max_iterations;
    obj["max_spawned_workers"] = b.max_spawned_workers;
    obj["max_log_bytes"] = b.max_log_bytes;
    obj["iterations_used"] = b.iterations_used.load();
    obj["workers_spawned"] = b.workers_spawned.load();
    obj["log_bytes_used"] = b.log_bytes_used.load();
    obj["elapsed_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - b.start_time).count();
    return obj;
}

} // namespace swarmflow
