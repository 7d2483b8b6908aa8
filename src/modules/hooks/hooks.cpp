// modules/hooks/hooks.cpp
#include "modules/hooks/hooks.h"
#include "common/utils/template_renderer.h"
#include "core/types/errors.h"
#include <stdexcept>

namespace swarmflow {

FunctionHook::FunctionHook(std::string name, int priority, std::chrono::milliseconds timeout,
                           HookFunction fn, HookPredicate predicate, bool blocking)
    : name_(std::move(name)), priority_(priority), timeout_(timeout),
      fn_(std::move(fn)), predicate_(std::move(predicate)), blocking_(blocking) {
    if (!fn_) {
        throw std::invalid_argument("FunctionHook '" + name_ + "' has no function");
    }
}

bool FunctionHook::should_run(const HookContext& ctx) const {
    return predicate_ ? predicate_(ctx) : true;
}

HookResult FunctionHook::run(const HookContext& ctx) {
    return fn_(ctx);
}

HookDeclaration HookDeclaration::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("Hook declaration must be a mapping");
    }
    HookDeclaration d;
    try {
        d.name = j.at("name").get<std::string>();
        d.point = parse_hook_point(j.at("point").get<std::string>());
        d.handler = j.at("handler").get<std::string>();
        d.priority = j.value("priority", d.priority);
        d.timeout = std::chrono::milliseconds(j.value("timeout_ms", static_cast<int>(d.timeout.count())));
        d.blocking = j.value("blocking", false);
        d.when = j.value("when", std::string());
        if (j.contains("params")) d.params = j["params"];
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Invalid hook declaration: " + std::string(e.what()));
    }
    if (d.timeout.count() <= 0) {
        throw ConfigError("Hook '" + d.name + "': timeout_ms must be positive");
    }
    return d;
}

DeclaredHook::DeclaredHook(HookDeclaration decl, std::shared_ptr<const HookHandlerRegistry> handlers)
    : decl_(std::move(decl)), handlers_(std::move(handlers)) {
    if (!handlers_ || !handlers_->has_handler(decl_.handler)) {
        throw ConfigError("Hook '" + decl_.name + "' refers to unknown handler '" + decl_.handler + "'");
    }
}

bool DeclaredHook::should_run(const HookContext& ctx) const {
    return InjaTemplateRenderer::evaluate_condition(decl_.when, ctx);
}

HookResult DeclaredHook::run(const HookContext& ctx) {
    return handlers_->call_handler(decl_.handler, ctx, decl_.params);
}

} // namespace swarmflow
