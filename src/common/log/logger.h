#ifndef SWARMFLOW_COMMON_LOG_LOGGER_H
#define SWARMFLOW_COMMON_LOG_LOGGER_H

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace swarmflow::log {

// 进程内唯一的 "swarmflow" logger，首次使用时创建（stderr，彩色）
std::shared_ptr<spdlog::logger> logger();

// "trace" / "debug" / "info" / "warn" / "error" / "off"
void set_level(const std::string& level);

} // namespace swarmflow::log

#endif // SWARMFLOW_COMMON_LOG_LOGGER_H
