#include "tabula/collab/collab_errors.hpp"

#include <string>

namespace tabula::collab {

namespace {

class CollabErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "tabula.collab";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<CollabErrc>(condition)) {
        case CollabErrc::Success:
            return "success";
        case CollabErrc::LockUnavailable:
            return "resource is locked by another owner";
        case CollabErrc::LockNotOwned:
            return "lock not owned by caller";
        case CollabErrc::InvalidLockRequest:
            return "invalid lock request";
        case CollabErrc::DeleteConflict:
            return "operation cancelled due to delete conflict";
        case CollabErrc::LatestOperationWins:
            return "operation cancelled, latest operation wins";
        case CollabErrc::ManualResolutionRequired:
            return "manual conflict resolution required";
        case CollabErrc::UnknownResolutionStrategy:
            return "unknown conflict resolution strategy";
        default:
            return "unknown collab error";
        }
    }
};

const CollabErrorCategory kCategory{};

}  // namespace

const std::error_category& collab_error_category() noexcept
{
    return kCategory;
}

std::error_code make_error_code(CollabErrc value) noexcept
{
    return {static_cast<int>(value), collab_error_category()};
}

bool is_conflict_rejection(const std::error_code& ec) noexcept
{
    if (ec.category() != collab_error_category()) {
        return false;
    }
    switch (static_cast<CollabErrc>(ec.value())) {
    case CollabErrc::DeleteConflict:
    case CollabErrc::LatestOperationWins:
    case CollabErrc::ManualResolutionRequired:
    case CollabErrc::UnknownResolutionStrategy:
        return true;
    default:
        return false;
    }
}

}  // namespace tabula::collab
