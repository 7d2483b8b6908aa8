// modules/swarm/worker.h
#ifndef SWARMFLOW_MODULES_SWARM_WORKER_H
#define SWARMFLOW_MODULES_SWARM_WORKER_H

#include "core/types/task.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace swarmflow {

// worker 与协调器共享的信号：取消令牌 + 进度心跳 + 日志量
struct WorkerSignals {
    std::atomic<bool> cancelled{false};
    std::atomic<int64_t> last_progress_ns{0};
    std::atomic<size_t> log_bytes{0};

    WorkerSignals() { beat(); }
    void beat();
    std::chrono::steady_clock::time_point last_progress() const;
};

class WorkerContext {
public:
    WorkerContext(WorkerId id, std::shared_ptr<WorkerSignals> signals, std::optional<std::string> replacement_note);

    const WorkerId& worker_id() const { return id_; }
    const std::optional<std::string>& replacement_note() const { return replacement_note_; }

    void report_progress() { signals_->beat(); }
    bool cancelled() const { return signals_->cancelled.load(); }

    // 等待至多 d，被取消时提前返回 true
    bool wait_for_cancellation(std::chrono::milliseconds d) const;

    // 记入日志量统计；内容本身由 worker 自行保存
    void log(const std::string& line);
    size_t logged_bytes() const { return logged_; }

private:
    WorkerId id_;
    std::shared_ptr<WorkerSignals> signals_;
    std::optional<std::string> replacement_note_;
    size_t logged_ = 0;
};

// 外部注入的任务执行函数
using WorkerFunction = std::function<TaskOutput(const AgentTask&, WorkerContext&)>;

struct WorkerMessage {
    WorkerId worker_id;
    TaskId task_id;
    TaskOutput output;
    size_t log_bytes = 0;
};

// worker -> 协调器的结果通道，worker 从不直接修改共享状态
class ResultChannel {
public:
    void send(WorkerMessage msg);
    std::optional<WorkerMessage> receive_for(std::chrono::milliseconds timeout);

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<WorkerMessage> queue_;
};

// 一个 worker 按顺序执行的一组任务（合并后可多于一个）
struct WorkUnit {
    WorkerId worker_id;
    std::vector<AgentTask> tasks;

    bool critical() const;
    std::vector<std::string> resources() const;
};

// 在分离线程上启动 worker；被取消后产生的输出不会再发送
std::shared_ptr<WorkerSignals> spawn_worker(const WorkerFunction& fn, WorkerId id, std::vector<AgentTask> tasks,
                                            std::shared_ptr<ResultChannel> channel,
                                            std::optional<std::string> replacement_note);

} // namespace swarmflow

#endif // SWARMFLOW_MODULES_SWARM_WORKER_H
