#ifndef SWARMFLOW_TYPES_BUDGET_H
#define SWARMFLOW_TYPES_BUDGET_H

#include <atomic>
#include <chrono>
#include <cstddef>

namespace swarmflow {

// 协调器预算与上下文压力计数
struct SwarmBudget {
    int max_concurrent_workers = 20;
    int max_iterations = -1;        // -1 表示无限制
    int max_spawned_workers = -1;
    size_t max_log_bytes = 0;       // 0 表示无限制

    mutable std::atomic<int> iterations_used{0};
    mutable std::atomic<int> workers_spawned{0};
    mutable std::atomic<size_t> log_bytes_used{0};
    std::chrono::steady_clock::time_point start_time;

    SwarmBudget() : start_time(std::chrono::steady_clock::now()) {}

    // 移动时重置计数器
    SwarmBudget(SwarmBudget&& other) noexcept
        : max_concurrent_workers(other.max_concurrent_workers),
          max_iterations(other.max_iterations),
          max_spawned_workers(other.max_spawned_workers),
          max_log_bytes(other.max_log_bytes),
          iterations_used(0),
          workers_spawned(0),
          log_bytes_used(0),
          start_time(std::chrono::steady_clock::now()) {}

    SwarmBudget& operator=(SwarmBudget&& other) noexcept {
        if (this != &other) {
            max_concurrent_workers = other.max_concurrent_workers;
            max_iterations = other.max_iterations;
            max_spawned_workers = other.max_spawned_workers;
            max_log_bytes = other.max_log_bytes;
            iterations_used = 0;
            workers_spawned = 0;
            log_bytes_used = 0;
            start_time = std::chrono::steady_clock::now();
        }
        return *this;
    }

    SwarmBudget(const SwarmBudget&) = delete;
    SwarmBudget& operator=(const SwarmBudget&) = delete;

    // 任一上下文压力阈值被越过
    bool pressure_exceeded() const {
        if (max_iterations >= 0 && iterations_used.load() >= max_iterations) return true;
        if (max_spawned_workers >= 0 && workers_spawned.load() >= max_spawned_workers) return true;
        if (max_log_bytes > 0 && log_bytes_used.load() >= max_log_bytes) return true;
        return false;
    }

    void count_iteration() { iterations_used.fetch_add(1); }
    void count_spawn() { workers_spawned.fetch_add(1); }
    void count_log_bytes(size_t n) { log_bytes_used.fetch_add(n); }
};

} // namespace swarmflow

#endif // SWARMFLOW_TYPES_BUDGET_H
