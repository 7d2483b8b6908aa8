// main.cpp
#include <chrono>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "swarmflow/swarmflow.h"

namespace {

void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--config engine.yaml] [--confirm operator] \"<request>\" [file ...]\n";
}

// 模拟 worker：按资源逐个“修改”，每步上报进度
swarmflow::TaskOutput mock_worker(const swarmflow::AgentTask& task, swarmflow::WorkerContext& ctx) {
    swarmflow::TaskOutput out;
    for (const auto& r : task.resources) {
        if (ctx.wait_for_cancellation(std::chrono::milliseconds(5))) {
            out.ok = false;
            out.error = "cancelled";
            return out;
        }
        ctx.report_progress();
        ctx.log("edited " + r);
        out.modified_resources.push_back(r);
    }
    out.summary = task.failure ? "fixed " + task.id : "completed " + task.id;
    if (ctx.replacement_note()) out.summary += " (" + *ctx.replacement_note() + ")";
    out.output = {{"task", task.id}, {"phase", task.phase}};
    return out;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string confirm_as;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--confirm" && i + 1 < argc) {
            confirm_as = argv[++i];
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.empty()) {
        usage(argv[0]);
        return 1;
    }

    try {
        // 1. 创建引擎
        std::unique_ptr<swarmflow::Orchestrator> engine;
        if (config_path.empty()) {
            engine = std::make_unique<swarmflow::Orchestrator>(mock_worker);
        } else {
            engine = swarmflow::Orchestrator::from_config_file(config_path, mock_worker);
        }

        // 2. 验证方：全部通过，安全检查已执行
        engine->set_verifier([](const swarmflow::PhaseResult& result) {
            swarmflow::VerificationReport report;
            report.security_checked = true;
            for (const auto& t : result.tasks) {
                report.verdicts[t.task_id] = swarmflow::TaskVerdict{true, "demo check passed", {}};
            }
            return report;
        });
        if (!confirm_as.empty()) {
            engine->set_confirmation_provider(
                [confirm_as](const swarmflow::WorkflowInstance&, int, const swarmflow::PhaseResult&) {
                    return std::optional<std::string>(confirm_as);
                });
        }
        engine->set_event_sink([](const swarmflow::TraceEvent& ev) {
            swarmflow::log::logger()->debug("[{}] {}", ev.instance_id, ev.type);
        });

        // 3. 提交请求
        swarmflow::Request request;
        request.description = positional[0];
        request.file_hints.assign(positional.begin() + 1, positional.end());
        swarmflow::RiskAssessment assessment;
        assessment.failure_scenario = "change breaks dependent callers";
        assessment.detection_signal = "verification checks fail";
        assessment.fastest_rollback = "revert the modified files";
        assessment.weakest_assumption = "file hints cover every affected resource";
        request.risk_assessment = assessment;

        auto report = engine->submit(request);

        // 4. 输出结果
        std::cout << report.to_json().dump(2) << "\n";
        if (report.rendered) std::cout << *report.rendered << "\n";
        if (report.status == swarmflow::WorkflowStatus::AWAITING_CONFIRMATION) {
            std::cerr << "[AWAITING CONFIRMATION] phase '" << report.awaiting_phase.value_or("?")
                      << "' requires --confirm <operator>\n";
        }

        // 5. 导出事件 Trace
        std::ofstream trace_file("swarmflow_trace.json");
        trace_file << engine->trace().to_json(report.instance_id).dump(2) << std::endl;
        std::cout << "Trace exported to swarmflow_trace.json ("
                  << engine->events(report.instance_id).size() << " events)\n";

        return report.status == swarmflow::WorkflowStatus::ABORTED_FAILED ? 2 : 0;
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }
}
