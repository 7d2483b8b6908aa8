// modules/context/context_engine.cpp
#include "modules/context/context_engine.h"
#include "common/log/logger.h"
#include <algorithm>
#include <stdexcept>

namespace swarmflow {

namespace {

// 粗略估算 JSON 大小（KB）
size_t estimate_json_size_kb(const nlohmann::json& j) {
    return (j.dump().size() + 1023) / 1024;
}

MergeStrategy get_merge_strategy_for_path(const std::string& path, const ContextMergePolicy& policy) {
    auto exact_it = policy.field_policies.find(path);
    if (exact_it != policy.field_policies.end()) {
        return exact_it->second;
    }

    // 通配符，例如 "results.*" 匹配 "results.items"
    for (const auto& [pattern, strategy] : policy.field_policies) {
        if (!pattern.empty() && pattern.back() == '*') {
            std::string prefix = pattern.substr(0, pattern.length() - 1);
            if (path.starts_with(prefix)) {
                return strategy;
            }
        }
    }
    return policy.default_strategy;
}

} // namespace

void ContextEngine::merge(Context& target, const Context& source, const ContextMergePolicy& policy) {
    if (!source.is_object()) {
        return;
    }
    if (target.is_null()) {
        target = Context::object();
    }
    merge_recursive(target, source, "", policy);
}

uint64_t ContextEngine::apply_patches(SessionState& state, const std::vector<Context>& patches,
                                      const ContextMergePolicy& policy) {
    for (const auto& patch : patches) {
        if (!patch.is_object() || patch.empty()) continue;
        merge(state.data, patch, policy);
        ++state.version;
    }
    return state.version;
}

void ContextEngine::merge_recursive(Context& target, const Context& source, const std::string& path_prefix, const ContextMergePolicy& policy) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        std::string current_path = path_prefix.empty() ? it.key() : path_prefix + "." + it.key();

        auto target_it = target.find(it.key());
        if (target_it == target.end()) {
            target[it.key()] = it.value();
            continue;
        }

        MergeStrategy strategy = get_merge_strategy_for_path(current_path, policy);
        if (target_it.value().is_object() && it.value().is_object()) {
            merge_recursive(target_it.value(), it.value(), current_path, policy);
        } else if (target_it.value().is_array() && it.value().is_array()) {
            merge_array(target_it.value(), it.value(), strategy, current_path);
        } else {
            merge_scalar(target_it.value(), it.value(), strategy, current_path);
        }
    }
}

void ContextEngine::merge_array(Context& target_arr, const Context& source_arr, const MergeStrategy& strategy, const std::string& path) {
    if (strategy == "array_concat") {
        for (const auto& item : source_arr) {
            target_arr.push_back(item);
        }
    } else if (strategy == "array_merge_unique") {
        for (const auto& item : source_arr) {
            if (std::find(target_arr.begin(), target_arr.end(), item) == target_arr.end()) {
                target_arr.push_back(item);
            }
        }
    } else if (strategy == "deep_merge" || strategy == "last_write_wins") {
        // 数组整体替换
        target_arr = source_arr;
    } else if (target_arr != source_arr) { // error_on_conflict
        throw std::runtime_error("Context merge conflict for array field '" + path + "'");
    }
}

void ContextEngine::merge_scalar(Context& target_val, const Context& source_val, const MergeStrategy& strategy, const std::string& path) {
    if (strategy == "last_write_wins" || strategy == "deep_merge") {
        target_val = source_val;
    } else if (target_val != source_val) {
        throw std::runtime_error("Context merge conflict for field '" + path + "': " +
                                 target_val.dump() + " vs " + source_val.dump());
    }
}

void ContextEngine::save_snapshot(const SnapshotKey& key, const Context& ctx) {
    size_t new_snapshot_size_kb = estimate_json_size_kb(ctx);

    auto existing = snapshots_.find(key);
    if (existing != snapshots_.end()) {
        current_total_size_kb_ -= estimate_json_size_kb(existing->second);
        snapshots_.erase(existing);
        snapshot_order_.erase(std::remove(snapshot_order_.begin(), snapshot_order_.end(), key), snapshot_order_.end());
    }

    if (max_snapshots_ == 0 || new_snapshot_size_kb > max_snapshot_size_kb_) {
        log::logger()->warn("Cannot save snapshot '{}': exceeds snapshot budget", key);
        return;
    }

    snapshots_[key] = ctx;
    snapshot_order_.push_back(key);
    current_total_size_kb_ += new_snapshot_size_kb;
    enforce_snapshot_budget();
}

const Context* ContextEngine::get_snapshot(const SnapshotKey& key) const {
    auto it = snapshots_.find(key);
    if (it != snapshots_.end()) {
        return &(it->second);
    }
    return nullptr;
}

void ContextEngine::enforce_snapshot_budget() {
    while (!snapshot_order_.empty() &&
           (snapshots_.size() > max_snapshots_ || current_total_size_kb_ > max_snapshot_size_kb_)) {
        SnapshotKey oldest_key = snapshot_order_.front();
        snapshot_order_.erase(snapshot_order_.begin());

        auto it = snapshots_.find(oldest_key);
        if (it != snapshots_.end()) {
            current_total_size_kb_ -= estimate_json_size_kb(it->second);
            snapshots_.erase(it);
            log::logger()->debug("Evicted snapshot '{}'", oldest_key);
        }
    }
}

void ContextEngine::set_snapshot_limits(size_t max_count, size_t max_size_kb) {
    max_snapshots_ = max_count;
    max_snapshot_size_kb_ = max_size_kb;
    enforce_snapshot_budget();
}

} // namespace swarmflow
