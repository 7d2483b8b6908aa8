#ifndef SWARMFLOW_COMMON_UTILS_YAML_JSON_H
#define SWARMFLOW_COMMON_UTILS_YAML_JSON_H

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include <string>

namespace swarmflow {

// 将 YAML::Node 转换为 nlohmann::json
nlohmann::json yaml_to_json(const YAML::Node& node);

// 读取 YAML 文件并转换；文件不可读或语法错误抛出 ConfigError
nlohmann::json load_yaml_file(const std::string& path);
nlohmann::json load_yaml_string(const std::string& content);

} // namespace swarmflow

#endif // SWARMFLOW_COMMON_UTILS_YAML_JSON_H
