#pragma once

#include "tabula/collab/conflict_detector.hpp"
#include "tabula/collab/resource_types.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <system_error>

namespace tabula::collab {

enum class ConcurrencyEventKind {
    LockDenied,
    ConflictDetected,
    ConflictMerged,
    ConflictRejected,
    OperationExecuted,
    ExecutionFailed,
    LockReleaseFailed,
    SweepCompleted,
    SweepFailed
};

enum class EventSeverity {
    Info,
    Warning,
    Error
};

struct ConcurrencyEvent final {
    ConcurrencyEventKind kind = ConcurrencyEventKind::OperationExecuted;
    Timestamp timestamp{};
    std::string operation_id{};
    std::string resource_type{};
    std::string resource_id{};
    std::string user_id{};
    std::string session_id{};
    std::optional<ConflictType> conflict_type{};
    std::string conflicting_operation_id{};
    // Owner of the incompatible lock for LockDenied.
    std::string lock_holder{};
    std::error_code error{};
    std::uint64_t expired_locks_removed = 0U;
    std::uint64_t operations_trimmed = 0U;
};

using ConcurrencyEventLogger = std::function<void(const ConcurrencyEvent&)>;

[[nodiscard]] const char* to_string(ConcurrencyEventKind kind) noexcept;
[[nodiscard]] const char* to_string(EventSeverity severity) noexcept;
[[nodiscard]] EventSeverity event_severity(ConcurrencyEventKind kind) noexcept;

}  // namespace tabula::collab
