// common/hooks/handler_registry.cpp
#include "common/hooks/handler_registry.h"
#include "common/utils/template_renderer.h"
#include "core/types/errors.h"
#include <stdexcept>

namespace swarmflow {

namespace {

RiskTier parse_tier(const nlohmann::json& v) {
    if (v.is_number_integer()) {
        int t = v.get<int>();
        if (t >= 0 && t <= 3) return static_cast<RiskTier>(t);
    } else if (v.is_string()) {
        const auto s = v.get<std::string>();
        if (s == "T0") return RiskTier::T0;
        if (s == "T1") return RiskTier::T1;
        if (s == "T2") return RiskTier::T2;
        if (s == "T3") return RiskTier::T3;
    }
    throw std::runtime_error("Invalid risk tier in hook params: " + v.dump());
}

std::vector<std::string> string_list(const nlohmann::json& v) {
    std::vector<std::string> out;
    if (v.is_string()) {
        out.push_back(v.get<std::string>());
    } else if (v.is_array()) {
        for (const auto& item : v) {
            if (item.is_string()) out.push_back(item.get<std::string>());
        }
    }
    return out;
}

} // namespace

HookHandlerRegistry::HookHandlerRegistry() {
    register_builtin_handlers();
}

void HookHandlerRegistry::register_builtin_handlers() {
    // params.patch 合并进会话状态
    register_handler("record_state", [](const HookContext&, const nlohmann::json& params) {
        HookResult r;
        if (params.contains("patch") && params["patch"].is_object()) {
            r.state_patch = params["patch"];
        }
        return r;
    });

    register_handler("escalate_risk", [](const HookContext&, const nlohmann::json& params) {
        HookResult r;
        SubmitAdvice advice;
        if (params.contains("tier")) {
            advice.escalate_to = parse_tier(params["tier"]);
        }
        advice.notes = string_list(params.value("notes", nlohmann::json::array()));
        r.advice = std::move(advice);
        return r;
    });

    register_handler("require_checks", [](const HookContext&, const nlohmann::json& params) {
        HookResult r;
        MutationAdvice advice;
        advice.follow_up_checks = string_list(params.value("checks", nlohmann::json::array()));
        r.advice = std::move(advice);
        return r;
    });

    // params.template 用调用上下文渲染成总结
    register_handler("summarize", [](const HookContext& ctx, const nlohmann::json& params) {
        HookResult r;
        StopAdvice advice;
        std::string tmpl = params.value("template", std::string("{{ instance_id }}: {{ status }}"));
        advice.summary = InjaTemplateRenderer::render(tmpl, ctx);
        advice.warnings = string_list(params.value("warnings", nlohmann::json::array()));
        r.display_text = advice.summary;
        r.advice = std::move(advice);
        return r;
    });

    // 显式失败，用于阻塞型 Stop 检查（例如 "tests must pass"）
    register_handler("fail_when", [](const HookContext& ctx, const nlohmann::json& params) {
        HookResult r;
        std::string cond = params.value("condition", std::string("false"));
        if (InjaTemplateRenderer::evaluate_condition(cond, ctx)) {
            r.status = HookStatus::FAILED;
            r.display_text = params.value("message", std::string("condition met: ") + cond);
        }
        return r;
    });
}

bool HookHandlerRegistry::has_handler(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.count(name) > 0;
}

HookResult HookHandlerRegistry::call_handler(const std::string& name, const HookContext& ctx,
                                             const nlohmann::json& params) const {
    HookHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(name);
        if (it == handlers_.end()) {
            throw HookFault("Hook handler not found: " + name);
        }
        handler = it->second;
    }
    return handler(ctx, params);
}

std::vector<std::string> HookHandlerRegistry::list_handlers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(handlers_.size());
    for (const auto& [name, _] : handlers_) {
        names.push_back(name);
    }
    return names;
}

} // namespace swarmflow
