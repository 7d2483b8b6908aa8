// common/utils/yaml_json.cpp
#include "common/utils/yaml_json.h"
#include "core/types/errors.h"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>
#include <cctype>
#include <cstdlib>
#include <cerrno>

namespace swarmflow {

namespace {

bool looks_like_integer(const std::string& s) {
    if (s.empty()) return false;
    size_t i = (s[0] == '-' || s[0] == '+') ? 1 : 0;
    if (i >= s.size()) return false;
    for (; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

// 整串都能被 strtod 消费才算数字
bool parse_double(const std::string& s, double& out) {
    if (s.empty()) return false;
    const char* begin = s.c_str();
    char* end = nullptr;
    errno = 0;
    out = std::strtod(begin, &end);
    return errno == 0 && end == begin + s.size();
}

nlohmann::json scalar_to_json(const YAML::Node& node) {
    const std::string& s = node.Scalar();

    // 带引号的标量保持字符串
    if (node.Tag() == "!") return s;

    if (s == "true" || s == "True" || s == "yes") return true;
    if (s == "false" || s == "False" || s == "no") return false;
    if (s == "~" || s == "null" || s.empty()) return nullptr;

    if (looks_like_integer(s)) {
        errno = 0;
        char* end = nullptr;
        long long v = std::strtoll(s.c_str(), &end, 10);
        if (errno == 0) return v;
    }
    double d = 0.0;
    if (parse_double(s, d)) return d;
    return s;
}

} // namespace

nlohmann::json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return nullptr;
        case YAML::NodeType::Scalar:
            return scalar_to_json(node);
        case YAML::NodeType::Sequence: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& item : node) {
                arr.push_back(yaml_to_json(item));
            }
            return arr;
        }
        case YAML::NodeType::Map: {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
            }
            return obj;
        }
    }
    return nullptr;
}

nlohmann::json load_yaml_string(const std::string& content) {
    try {
        return yaml_to_json(YAML::Load(content));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("YAML parse error: ") + e.what());
    }
}

nlohmann::json load_yaml_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_yaml_string(buffer.str());
}

} // namespace swarmflow
