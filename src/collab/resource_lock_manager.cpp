#include "tabula/collab/resource_lock_manager.hpp"

#include "tabula/collab/collab_errors.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

namespace tabula::collab {

std::error_code ResourceLockManager::acquire(const LockRequest& request)
{
    AcquireResult result{};
    return acquire(request, result, Clock::now());
}

std::error_code ResourceLockManager::acquire(const LockRequest& request, AcquireResult& result)
{
    return acquire(request, result, Clock::now());
}

std::error_code ResourceLockManager::acquire(const LockRequest& request, AcquireResult& result, Timestamp now)
{
    result = AcquireResult{};
    if (auto ec = validate(request)) {
        return ec;
    }

    const auto key = make_resource_key(request.resource_type, request.resource_id);
    std::unique_lock lock{mutex_};
    auto& holders = locks_[key];
    evict_expired(holders, now);

    ResourceLock* own = nullptr;
    for (auto& holder : holders) {
        if (holder.held_by(request.owner_id, request.session_id)) {
            own = &holder;
            continue;
        }
        if (!compatible(holder, request)) {
            result.blocking_lock = holder;
            return make_error_code(CollabErrc::LockUnavailable);
        }
    }

    if (own != nullptr) {
        own->lock_type = stronger_lock_type(own->lock_type, request.lock_type);
        own->acquired_at = now;
        own->expires_at = saturating_add(now, request.timeout);
        result.lock = *own;
        return {};
    }

    ResourceLock granted{};
    granted.resource_id = request.resource_id;
    granted.resource_type = request.resource_type;
    granted.lock_type = request.lock_type;
    granted.owner_id = request.owner_id;
    granted.session_id = request.session_id;
    granted.acquired_at = now;
    granted.expires_at = saturating_add(now, request.timeout);
    holders.push_back(granted);
    result.lock = std::move(granted);
    return {};
}

std::error_code ResourceLockManager::release(std::string_view resource_type,
                                             std::string_view resource_id,
                                             std::string_view owner_id,
                                             std::string_view session_id)
{
    const auto key = make_resource_key(resource_type, resource_id);
    std::unique_lock lock{mutex_};
    auto it = locks_.find(key);
    if (it == locks_.end()) {
        return make_error_code(CollabErrc::LockNotOwned);
    }

    auto& holders = it->second;
    auto holder_it = std::find_if(holders.begin(), holders.end(), [&](const ResourceLock& holder) {
        return holder.held_by(owner_id, session_id);
    });
    if (holder_it == holders.end()) {
        return make_error_code(CollabErrc::LockNotOwned);
    }

    holders.erase(holder_it);
    if (holders.empty()) {
        locks_.erase(it);
    }
    return {};
}

std::size_t ResourceLockManager::cleanup_expired()
{
    return cleanup_expired(Clock::now());
}

std::size_t ResourceLockManager::cleanup_expired(Timestamp now)
{
    std::unique_lock lock{mutex_};
    std::size_t removed = 0U;
    for (auto it = locks_.begin(); it != locks_.end();) {
        removed += evict_expired(it->second, now);
        if (it->second.empty()) {
            it = locks_.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

ActiveLockMap ResourceLockManager::active_locks() const
{
    return active_locks(Clock::now());
}

ActiveLockMap ResourceLockManager::active_locks(Timestamp now) const
{
    std::shared_lock lock{mutex_};
    ActiveLockMap result;
    for (const auto& [key, holders] : locks_) {
        std::vector<ResourceLock> live;
        for (const auto& holder : holders) {
            if (!holder.expired(now)) {
                live.push_back(holder);
            }
        }
        if (live.empty()) {
            continue;
        }
        std::sort(live.begin(), live.end(), [](const auto& lhs, const auto& rhs) {
            if (lhs.owner_id != rhs.owner_id) {
                return lhs.owner_id < rhs.owner_id;
            }
            return lhs.session_id < rhs.session_id;
        });
        result.emplace(key, std::move(live));
    }
    return result;
}

std::size_t ResourceLockManager::active_lock_count() const
{
    return active_lock_count(Clock::now());
}

std::size_t ResourceLockManager::active_lock_count(Timestamp now) const
{
    std::shared_lock lock{mutex_};
    std::size_t count = 0U;
    for (const auto& entry : locks_) {
        count += static_cast<std::size_t>(std::count_if(entry.second.begin(), entry.second.end(), [now](const auto& holder) {
            return !holder.expired(now);
        }));
    }
    return count;
}

bool ResourceLockManager::compatible(const ResourceLock& existing, const LockRequest& request) noexcept
{
    if (existing.held_by(request.owner_id, request.session_id)) {
        return true;
    }
    if (existing.lock_type == LockType::Exclusive || request.lock_type == LockType::Exclusive) {
        return false;
    }
    if (existing.lock_type == LockType::Write || request.lock_type == LockType::Write) {
        return false;
    }
    return existing.lock_type == LockType::Read && request.lock_type == LockType::Read;
}

std::error_code ResourceLockManager::validate(const LockRequest& request)
{
    if (request.resource_type.empty() || request.resource_id.empty()) {
        return make_error_code(CollabErrc::InvalidLockRequest);
    }
    if (request.timeout.count() <= 0) {
        return make_error_code(CollabErrc::InvalidLockRequest);
    }
    return {};
}

std::size_t ResourceLockManager::evict_expired(HolderList& holders, Timestamp now)
{
    const auto before = holders.size();
    holders.erase(std::remove_if(holders.begin(), holders.end(), [now](const ResourceLock& holder) {
                      return holder.expired(now);
                  }),
                  holders.end());
    return before - holders.size();
}

std::string describe_lock_conflict(const ResourceLock& blocking_lock)
{
    std::string text{"resource "};
    text.append(make_resource_key(blocking_lock.resource_type, blocking_lock.resource_id));
    text.append(" is locked by ");
    text.append(blocking_lock.owner_id);
    return text;
}

}  // namespace tabula::collab
