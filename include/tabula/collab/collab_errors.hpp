#pragma once

#include <system_error>

namespace tabula::collab {

enum class CollabErrc {
    Success = 0,
    LockUnavailable,
    LockNotOwned,
    InvalidLockRequest,
    DeleteConflict,
    LatestOperationWins,
    ManualResolutionRequired,
    UnknownResolutionStrategy
};

const std::error_category& collab_error_category() noexcept;
std::error_code make_error_code(CollabErrc value) noexcept;

// True for the policy rejections produced by conflict resolution.
[[nodiscard]] bool is_conflict_rejection(const std::error_code& ec) noexcept;

}  // namespace tabula::collab

namespace std {

template <>
struct is_error_code_enum<tabula::collab::CollabErrc> : true_type {
};

}  // namespace std
