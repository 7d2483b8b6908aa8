// modules/swarm/worker.cpp
#include "modules/swarm/worker.h"
#include <thread>

namespace swarmflow {

void WorkerSignals::beat() {
    last_progress_ns.store(std::chrono::duration_cast<std::chrono::nanoseconds>(
                               std::chrono::steady_clock::now().time_since_epoch())
                               .count());
}

std::chrono::steady_clock::time_point WorkerSignals::last_progress() const {
    return std::chrono::steady_clock::time_point(
        std::chrono::duration_cast<std::chrono::steady_clock::duration>(std::chrono::nanoseconds(last_progress_ns.load())));
}

WorkerContext::WorkerContext(WorkerId id, std::shared_ptr<WorkerSignals> signals, std::optional<std::string> replacement_note)
    : id_(std::move(id)), signals_(std::move(signals)), replacement_note_(std::move(replacement_note)) {}

bool WorkerContext::wait_for_cancellation(std::chrono::milliseconds d) const {
    const auto deadline = std::chrono::steady_clock::now() + d;
    while (std::chrono::steady_clock::now() < deadline) {
        if (cancelled()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return cancelled();
}

void WorkerContext::log(const std::string& line) {
    logged_ += line.size();
    signals_->log_bytes.fetch_add(line.size());
}

void ResultChannel::send(WorkerMessage msg) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(msg));
    }
    cv_.notify_one();
}

std::optional<WorkerMessage> ResultChannel::receive_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
        return std::nullopt;
    }
    WorkerMessage msg = std::move(queue_.front());
    queue_.pop_front();
    return msg;
}

bool WorkUnit::critical() const {
    for (const auto& t : tasks) {
        if (t.critical) return true;
    }
    return false;
}

std::vector<std::string> WorkUnit::resources() const {
    std::vector<std::string> all;
    for (const auto& t : tasks) {
        all.insert(all.end(), t.resources.begin(), t.resources.end());
    }
    return all;
}

std::shared_ptr<WorkerSignals> spawn_worker(const WorkerFunction& fn, WorkerId id, std::vector<AgentTask> tasks,
                                            std::shared_ptr<ResultChannel> channel,
                                            std::optional<std::string> replacement_note) {
    auto signals = std::make_shared<WorkerSignals>();
    std::thread([fn, id, tasks = std::move(tasks), signals, channel, note = std::move(replacement_note)]() mutable {
        WorkerContext ctx(id, signals, note);
        for (auto& task : tasks) {
            if (signals->cancelled.load()) return;
            task.worker_id = id;
            task.status = TaskStatus::IN_PROGRESS;
            task.start_time = std::chrono::steady_clock::now();

            WorkerMessage msg;
            msg.worker_id = id;
            msg.task_id = task.id;
            const size_t logged_before = ctx.logged_bytes();
            try {
                msg.output = fn(task, ctx);
            } catch (const std::exception& e) {
                msg.output.ok = false;
                msg.output.error = e.what();
            } catch (...) {
                msg.output.ok = false;
                msg.output.error = "worker raised a non-standard exception";
            }
            msg.log_bytes = ctx.logged_bytes() - logged_before;
            ctx.report_progress();

            // 已被替换：部分写入视为作废
            if (signals->cancelled.load()) return;
            channel->send(std::move(msg));
        }
    }).detach();
    return signals;
}

} // namespace swarmflow
