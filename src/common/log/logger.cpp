// common/log/logger.cpp
#include "common/log/logger.h"
#include "core/types/errors.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace swarmflow::log {

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> instance;
    std::call_once(once, [] {
        instance = spdlog::get("swarmflow");
        if (!instance) {
            instance = spdlog::stderr_color_mt("swarmflow");
            instance->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            instance->set_level(spdlog::level::info);
        }
    });
    return instance;
}

void set_level(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str 对未知字符串返回 off
    if (parsed == spdlog::level::off && level != "off") {
        throw ConfigError("Unknown log level '" + level + "'");
    }
    logger()->set_level(parsed);
}

} // namespace swarmflow::log
