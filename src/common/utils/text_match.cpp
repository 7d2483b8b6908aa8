// common/utils/text_match.cpp
#include "common/utils/text_match.h"
#include <algorithm>
#include <cctype>
#include <set>

namespace swarmflow {

namespace {

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// 词形变化后缀：plural / past / -ing / 名词化
bool allowed_suffix(std::string_view rest) {
    static constexpr std::string_view kSuffixes[] = {"", "s", "es", "d", "ed", "ing", "ion", "ions", "ation", "ations"};
    for (auto suffix : kSuffixes) {
        if (rest == suffix) return true;
    }
    return false;
}

} // namespace

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool contains_term(std::string_view lowered_text, std::string_view term) {
    bool stem = !term.empty() && term.back() == '*';
    if (stem) term.remove_suffix(1);
    if (term.empty()) return false;
    size_t pos = lowered_text.find(term);
    while (pos != std::string_view::npos) {
        if (pos == 0 || !is_word_char(lowered_text[pos - 1])) {
            size_t end = pos + term.size();
            size_t word_end = end;
            while (word_end < lowered_text.size() && is_word_char(lowered_text[word_end])) ++word_end;
            if (stem || allowed_suffix(lowered_text.substr(end, word_end - end))) {
                return true;
            }
        }
        pos = lowered_text.find(term, pos + 1);
    }
    return false;
}

int count_terms(std::string_view lowered_text, const std::vector<std::string>& terms) {
    int n = 0;
    for (const auto& t : terms) {
        if (contains_term(lowered_text, t)) ++n;
    }
    return n;
}

double sum_weights(std::string_view lowered_text, const std::map<std::string, double>& weighted_terms) {
    double total = 0.0;
    for (const auto& [term, weight] : weighted_terms) {
        if (contains_term(lowered_text, term)) total += weight;
    }
    return total;
}

double max_weight(std::string_view lowered_text, const std::map<std::string, double>& weighted_terms) {
    double best = 0.0;
    for (const auto& [term, weight] : weighted_terms) {
        if (contains_term(lowered_text, term)) best = std::max(best, weight);
    }
    return best;
}

std::vector<std::string> split_words(std::string_view text) {
    std::vector<std::string> words;
    std::string current;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) {
                words.push_back(std::move(current));
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) words.push_back(std::move(current));
    return words;
}

std::string resource_group(const std::string& resource) {
    auto pos = resource.find_last_of('/');
    if (pos == std::string::npos || pos == 0) return "";
    return resource.substr(0, pos);
}

int module_count(const std::vector<std::string>& resources) {
    std::set<std::string> modules;
    for (const auto& r : resources) {
        auto pos = r.find('/');
        modules.insert(pos == std::string::npos ? std::string(".") : r.substr(0, pos));
    }
    return std::max<int>(1, static_cast<int>(modules.size()));
}

} // namespace swarmflow
