// modules/context/context_engine.h
#ifndef SWARMFLOW_MODULES_CONTEXT_CONTEXT_ENGINE_H
#define SWARMFLOW_MODULES_CONTEXT_CONTEXT_ENGINE_H

#include "core/types/context.h" // 引入 Context, SessionState
#include <nlohmann/json.hpp>
#include <unordered_map>
#include <optional>
#include <string>
#include <vector>

namespace swarmflow {

// 定义合并策略类型
using MergeStrategy = std::string; // "error_on_conflict", "last_write_wins", "deep_merge", "array_concat", "array_merge_unique"

// 合并策略配置
struct ContextMergePolicy {
    std::unordered_map<std::string, MergeStrategy> field_policies; // 通配符或精确路径
    MergeStrategy default_strategy = "error_on_conflict";

    static ContextMergePolicy last_write_wins() {
        ContextMergePolicy p;
        p.default_strategy = "last_write_wins";
        return p;
    }
};

using SnapshotKey = std::string; // "<instance_id>/phase/<index>"

class ContextEngine {
public:
    // 静态合并方法（hook state patch、checkpoint 恢复等）
    static void merge(Context& target, const Context& source, const ContextMergePolicy& policy = {});

    // 按顺序合并一组 patch 到会话状态，每个非空 patch 版本号 +1，返回新版本号
    static uint64_t apply_patches(SessionState& state, const std::vector<Context>& patches,
                                  const ContextMergePolicy& policy = ContextMergePolicy::last_write_wins());

    // 保存快照（phase checkpoint）
    void save_snapshot(const SnapshotKey& key, const Context& ctx);

    // 获取快照（只读）
    const Context* get_snapshot(const SnapshotKey& key) const;

    std::vector<SnapshotKey> snapshot_keys() const { return snapshot_order_; }

    // 清理快照（FIFO，根据 max_count 和 max_size）
    void enforce_snapshot_budget();

    // 设置快照预算限制
    void set_snapshot_limits(size_t max_count, size_t max_size_kb);

private:
    std::unordered_map<SnapshotKey, Context> snapshots_;
    std::vector<SnapshotKey> snapshot_order_; // 用于 FIFO
    size_t max_snapshots_ = 16;
    size_t max_snapshot_size_kb_ = 1024;
    size_t current_total_size_kb_ = 0; // 估算的总大小

    static void merge_recursive(Context& target, const Context& source, const std::string& path_prefix, const ContextMergePolicy& policy);
    static void merge_array(Context& target_arr, const Context& source_arr, const MergeStrategy& strategy, const std::string& path);
    static void merge_scalar(Context& target_val, const Context& source_val, const MergeStrategy& strategy, const std::string& path);
};

} // namespace swarmflow

#endif // SWARMFLOW_MODULES_CONTEXT_CONTEXT_ENGINE_H
