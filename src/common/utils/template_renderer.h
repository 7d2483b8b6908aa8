#ifndef SWARMFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H
#define SWARMFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H

#include "core/types/context.h"
#include <inja/inja.hpp>
#include <string>
#include <string_view>

namespace swarmflow {

class InjaTemplateRenderer {
public:
    InjaTemplateRenderer();

    // 静态方法：使用默认环境渲染模板
    static std::string render(std::string_view template_str, const Context& context);

    // 计算布尔表达式，例如 "risk_tier >= 2 and phase == \"implement\""
    // 也接受 "{{ expr }}" 形式
    static bool evaluate_condition(std::string_view expression, const Context& context);

    std::string render_with_env(std::string_view template_str, const Context& context);

private:
    inja::Environment env_;
    void configure_security(); // 禁用 include
};

} // namespace swarmflow

#endif // SWARMFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H
