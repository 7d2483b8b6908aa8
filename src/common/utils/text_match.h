#ifndef SWARMFLOW_COMMON_UTILS_TEXT_MATCH_H
#define SWARMFLOW_COMMON_UTILS_TEXT_MATCH_H

#include <string>
#include <string_view>
#include <vector>
#include <map>

namespace swarmflow {

std::string to_lower(std::string_view s);

// 整词匹配：term 必须从词首开始，词尾只允许常见词形后缀（"credential" 匹配 "credentials"，
// "auth" 不匹配 "author"）。以 '*' 结尾的 term 为词干，匹配任意后缀（"vulnerab*"）

bool contains_term(std::string_view lowered_text, std::string_view term);

int count_terms(std::string_view lowered_text, const std::vector<std::string>& terms);

// 命中项权重累加
double sum_weights(std::string_view lowered_text, const std::map<std::string, double>& weighted_terms);

// 命中项中的最大权重
double max_weight(std::string_view lowered_text, const std::map<std::string, double>& weighted_terms);

std::vector<std::string> split_words(std::string_view text);

// 资源路径的父目录，用于“相关资源”分组
std::string resource_group(const std::string& resource);

// 资源路径涉及的顶层目录数（至少为 1），作为跨模块程度
int module_count(const std::vector<std::string>& resources);

} // namespace swarmflow

#endif // SWARMFLOW_COMMON_UTILS_TEXT_MATCH_H
