// modules/hooks/hook_registry.h
#ifndef SWARMFLOW_MODULES_HOOKS_HOOK_REGISTRY_H
#define SWARMFLOW_MODULES_HOOKS_HOOK_REGISTRY_H

#include "core/types/hook.h"
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace swarmflow {

class HookRegistry {
public:
    struct Entry {
        std::shared_ptr<Hook> hook;
        size_t order = 0; // 注册顺序，同优先级时决定先后
    };

    void register_hook(HookPoint point, std::shared_ptr<Hook> hook);

    // 按注册顺序返回副本，dispatch 期间的并发注册不影响本次调用
    std::vector<Entry> hooks_at(HookPoint point) const;

    size_t count(HookPoint point) const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::map<HookPoint, std::vector<Entry>> hooks_;
    size_t next_order_ = 0;
};

} // namespace swarmflow

#endif // SWARMFLOW_MODULES_HOOKS_HOOK_REGISTRY_H
