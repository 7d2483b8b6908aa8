// common/utils/template_renderer.cpp
#include "common/utils/template_renderer.h"
#include <inja/inja.hpp>
#include <stdexcept>
#include <mutex>
#include <filesystem>

namespace swarmflow {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\n')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\n')) s.remove_suffix(1);
    return s;
}

// inja::Environment 渲染不是线程安全的，hook 可能在多个线程上求值
std::mutex& renderer_mutex() {
    static std::mutex m;
    return m;
}

} // namespace

InjaTemplateRenderer::InjaTemplateRenderer() : env_() {
    env_.set_expression("{{", "}}");
    env_.set_statement("{%", "%}");
    env_.set_comment("{#", "#}");
    env_.set_line_statement("##");

    configure_security();
}

void InjaTemplateRenderer::configure_security() {
    env_.set_include_callback([](const std::filesystem::path&, const std::string&) -> inja::Template {
        throw inja::InjaError("render_error", "Include is disabled.", inja::SourceLocation{});
    });
}

std::string InjaTemplateRenderer::render(std::string_view template_str, const Context& context) {
    static InjaTemplateRenderer renderer;
    std::lock_guard<std::mutex> lock(renderer_mutex());
    return renderer.render_with_env(template_str, context);
}

bool InjaTemplateRenderer::evaluate_condition(std::string_view expression, const Context& context) {
    std::string_view expr = trim(expression);
    if (expr.empty()) return true;
    if (expr.size() >= 4 && expr.substr(0, 2) == "{{" && expr.substr(expr.size() - 2) == "}}") {
        expr = trim(expr.substr(2, expr.size() - 4));
    }
    std::string tmpl = "{% if " + std::string(expr) + " %}1{% else %}0{% endif %}";
    return render(tmpl, context) == "1";
}

std::string InjaTemplateRenderer::render_with_env(std::string_view template_str, const Context& context) {
    try {
        return env_.render(template_str, context);
    } catch (const inja::InjaError& e) {
        throw std::runtime_error("Template render error: " + std::string(e.message));
    }
}

} // namespace swarmflow
