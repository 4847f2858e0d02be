/**
 * @file owner_registry.cpp
 * @brief OwnerRegistry implementation.
 * @author Dimitris Kafetzis
 */

#include "scheduler/owner_registry.hpp"

#include <algorithm>

namespace crew_orchestrator {

void OwnerRegistry::register_owner(const OwnerTag& owner, std::shared_ptr<IDelegate> delegate) {
    std::lock_guard lock(mutex_);
    delegates_[owner] = std::move(delegate);
}

bool OwnerRegistry::has_owner(const OwnerTag& owner) const {
    return find(owner) != nullptr;
}

std::vector<OwnerTag> OwnerRegistry::owners() const {
    std::vector<OwnerTag> names;
    {
        std::lock_guard lock(mutex_);
        names.reserve(delegates_.size());
        for (const auto& [owner, _] : delegates_) {
            names.push_back(owner);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::shared_ptr<IDelegate> OwnerRegistry::find(const OwnerTag& owner) const {
    std::lock_guard lock(mutex_);
    auto it = delegates_.find(owner);
    if (it == delegates_.end()) {
        return nullptr;
    }
    return it->second;
}

Result<std::string> OwnerRegistry::execute(const Task& task, std::stop_token stop) {
    // Hold our own reference: the call may outlive a concurrent re-registration.
    auto delegate = find(task.owner);
    if (!delegate) {
        return Error{ErrorCode::DelegateFailure,
                     "no delegate registered for owner " + task.owner};
    }
    return delegate->execute(task, stop);
}

}  // namespace crew_orchestrator
