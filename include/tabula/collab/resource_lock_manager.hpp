#pragma once

#include "tabula/collab/resource_types.hpp"

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace tabula::collab {

class ResourceLockManager final {
public:
    struct AcquireResult final {
        std::optional<ResourceLock> lock{};
        // Set when the request was refused because of an incompatible holder.
        std::optional<ResourceLock> blocking_lock{};
    };

    ResourceLockManager() = default;

    ResourceLockManager(const ResourceLockManager&) = delete;
    ResourceLockManager& operator=(const ResourceLockManager&) = delete;
    ResourceLockManager(ResourceLockManager&&) = delete;
    ResourceLockManager& operator=(ResourceLockManager&&) = delete;

    [[nodiscard]] std::error_code acquire(const LockRequest& request);
    [[nodiscard]] std::error_code acquire(const LockRequest& request, AcquireResult& result);
    [[nodiscard]] std::error_code acquire(const LockRequest& request, AcquireResult& result, Timestamp now);

    [[nodiscard]] std::error_code release(std::string_view resource_type,
                                          std::string_view resource_id,
                                          std::string_view owner_id,
                                          std::string_view session_id);

    std::size_t cleanup_expired();
    std::size_t cleanup_expired(Timestamp now);

    [[nodiscard]] ActiveLockMap active_locks() const;
    [[nodiscard]] ActiveLockMap active_locks(Timestamp now) const;
    [[nodiscard]] std::size_t active_lock_count() const;
    [[nodiscard]] std::size_t active_lock_count(Timestamp now) const;

    [[nodiscard]] static bool compatible(const ResourceLock& existing, const LockRequest& request) noexcept;

private:
    using HolderList = std::vector<ResourceLock>;

    [[nodiscard]] static std::error_code validate(const LockRequest& request);
    static std::size_t evict_expired(HolderList& holders, Timestamp now);

    mutable std::shared_mutex mutex_{};
    std::unordered_map<std::string, HolderList> locks_{};
};

// Human readable refusal, e.g. "resource record:rec1 is locked by user1".
[[nodiscard]] std::string describe_lock_conflict(const ResourceLock& blocking_lock);

}  // namespace tabula::collab
