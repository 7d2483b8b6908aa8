// modules/hooks/hook_registry.cpp
#include "modules/hooks/hook_registry.h"
#include "common/log/logger.h"
#include <stdexcept>

namespace swarmflow {

void HookRegistry::register_hook(HookPoint point, std::shared_ptr<Hook> hook) {
    if (!hook) {
        throw std::invalid_argument("Cannot register a null hook");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    log::logger()->debug("Registered hook '{}' at {} (priority {})", hook->name(), to_string(point), hook->priority());
    hooks_[point].push_back(Entry{std::move(hook), next_order_++});
}

std::vector<HookRegistry::Entry> HookRegistry::hooks_at(HookPoint point) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = hooks_.find(point);
    if (it == hooks_.end()) return {};
    return it->second;
}

size_t HookRegistry::count(HookPoint point) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = hooks_.find(point);
    return it == hooks_.end() ? 0 : it->second.size();
}

void HookRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    hooks_.clear();
}

} // namespace swarmflow
