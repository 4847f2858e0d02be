/**
 * @file owner_registry.hpp
 * @brief Routes each task to the delegate registered for its owner tag.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "scheduler/delegate.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace crew_orchestrator {

/**
 * @brief Owner tag → delegate lookup.
 *
 * The scheduler never interprets owners; this registry is the one place
 * that maps a tag such as "Plumber" to the worker implementation. A task
 * whose owner has no registered delegate fails like any other delegate
 * error and goes through the normal retry and cascade path.
 */
class OwnerRegistry : public IDelegate {
public:
    /// Replaces any delegate previously registered for `owner`.
    void register_owner(const OwnerTag& owner, std::shared_ptr<IDelegate> delegate);

    [[nodiscard]] bool has_owner(const OwnerTag& owner) const;
    [[nodiscard]] std::vector<OwnerTag> owners() const;

    Result<std::string> execute(const Task& task, std::stop_token stop) override;

private:
    [[nodiscard]] std::shared_ptr<IDelegate> find(const OwnerTag& owner) const;

    mutable std::mutex mutex_;
    std::unordered_map<OwnerTag, std::shared_ptr<IDelegate>> delegates_;
};

}  // namespace crew_orchestrator
