#include "tabula/collab/conflict_detector.hpp"

namespace tabula::collab {

namespace {

constexpr const char* kConfirmDeleteAction = "confirm_delete";

[[nodiscard]] bool within_window(Timestamp lhs, Timestamp rhs, std::chrono::milliseconds window) noexcept
{
    if (window.count() < 0) {
        return false;
    }
    const auto earlier = lhs < rhs ? lhs : rhs;
    const auto later = lhs < rhs ? rhs : lhs;
    return saturating_sub(later, window) <= earlier;
}

}  // namespace

ConflictDetector::ConflictDetector()
    : ConflictDetector(Config{})
{
}

ConflictDetector::ConflictDetector(Config config)
    : config_{config}
{
}

ConflictResult ConflictDetector::detect(const Operation& op, std::span<const Operation> existing_ops) const
{
    for (const auto& existing : existing_ops) {
        if (!conflicts(op, existing)) {
            continue;
        }

        ConflictResult result{};
        result.has_conflict = true;
        result.conflict_type = classify(op, existing);
        result.conflicting_operation = existing;
        result.resolution = resolve(op, existing, result.conflict_type);
        return result;
    }

    return ConflictResult{};
}

bool ConflictDetector::conflicts(const Operation& op, const Operation& existing) const
{
    if (op.resource_type != existing.resource_type || op.resource_id != existing.resource_id) {
        return false;
    }
    if (op.user_id == existing.user_id && op.session_id == existing.session_id) {
        return false;
    }
    if (!within_window(op.timestamp, existing.timestamp, config_.conflict_window)) {
        return false;
    }
    return shares_field(op.data, existing.data);
}

std::chrono::milliseconds ConflictDetector::conflict_window() const noexcept
{
    return config_.conflict_window;
}

ConflictType ConflictDetector::classify(const Operation& op, const Operation& existing) noexcept
{
    if (op.type == OperationType::Delete || existing.type == OperationType::Delete) {
        return ConflictType::DeleteConflict;
    }
    if (op.type == OperationType::Update && existing.type == OperationType::Update) {
        return ConflictType::ConcurrentUpdate;
    }
    if (op.type == OperationType::Create && existing.type == OperationType::Create) {
        return ConflictType::DuplicateCreate;
    }
    return ConflictType::UnknownConflict;
}

ConflictResolution ConflictDetector::resolve(const Operation& op, const Operation& existing, ConflictType type)
{
    ConflictResolution resolution{};
    switch (type) {
    case ConflictType::ConcurrentUpdate: {
        resolution.strategy = ResolutionStrategy::Merge;
        // On equal timestamps the incoming operation counts as the newer one.
        const bool op_is_newer = op.timestamp >= existing.timestamp;
        resolution.merged_data = op_is_newer ? merge_data(existing.data, op.data) : merge_data(op.data, existing.data);
        resolution.winner = select_winner(op, existing);
        break;
    }
    case ConflictType::DeleteConflict:
        resolution.strategy = ResolutionStrategy::DeleteWins;
        resolution.action = kConfirmDeleteAction;
        break;
    case ConflictType::DuplicateCreate:
        resolution.strategy = ResolutionStrategy::LatestWins;
        resolution.winner = select_winner(op, existing);
        break;
    case ConflictType::UnknownConflict:
    default:
        resolution.strategy = ResolutionStrategy::ManualResolve;
        break;
    }
    return resolution;
}

const std::string& ConflictDetector::select_winner(const Operation& first, const Operation& second) noexcept
{
    if (first.version > second.version) {
        return first.id;
    }
    if (second.version > first.version) {
        return second.id;
    }
    if (first.timestamp > second.timestamp) {
        return first.id;
    }
    return second.id;
}

FieldMap ConflictDetector::merge_data(const FieldMap& older, const FieldMap& newer)
{
    FieldMap merged = older;
    for (const auto& [field, value] : newer) {
        merged.insert_or_assign(field, value);
    }
    return merged;
}

bool ConflictDetector::shares_field(const FieldMap& lhs, const FieldMap& rhs)
{
    const auto& smaller = lhs.size() <= rhs.size() ? lhs : rhs;
    const auto& larger = lhs.size() <= rhs.size() ? rhs : lhs;
    for (const auto& entry : smaller) {
        if (larger.find(entry.first) != larger.end()) {
            return true;
        }
    }
    return false;
}

const char* to_string(ConflictType type) noexcept
{
    switch (type) {
    case ConflictType::ConcurrentUpdate:
        return "concurrent_update";
    case ConflictType::DeleteConflict:
        return "delete_conflict";
    case ConflictType::DuplicateCreate:
        return "duplicate_create";
    case ConflictType::UnknownConflict:
    default:
        return "unknown_conflict";
    }
}

const char* to_string(ResolutionStrategy strategy) noexcept
{
    switch (strategy) {
    case ResolutionStrategy::None:
        return "none";
    case ResolutionStrategy::Merge:
        return "merge";
    case ResolutionStrategy::DeleteWins:
        return "delete_wins";
    case ResolutionStrategy::LatestWins:
        return "latest_wins";
    case ResolutionStrategy::ManualResolve:
        return "manual_resolve";
    default:
        return "unknown";
    }
}

}  // namespace tabula::collab
