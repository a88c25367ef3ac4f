#include "tabula/collab/concurrency_events.hpp"

namespace tabula::collab {

const char* to_string(ConcurrencyEventKind kind) noexcept
{
    switch (kind) {
    case ConcurrencyEventKind::LockDenied:
        return "lock_denied";
    case ConcurrencyEventKind::ConflictDetected:
        return "conflict_detected";
    case ConcurrencyEventKind::ConflictMerged:
        return "conflict_merged";
    case ConcurrencyEventKind::ConflictRejected:
        return "conflict_rejected";
    case ConcurrencyEventKind::OperationExecuted:
        return "operation_executed";
    case ConcurrencyEventKind::ExecutionFailed:
        return "execution_failed";
    case ConcurrencyEventKind::LockReleaseFailed:
        return "lock_release_failed";
    case ConcurrencyEventKind::SweepCompleted:
        return "sweep_completed";
    case ConcurrencyEventKind::SweepFailed:
        return "sweep_failed";
    default:
        return "unknown";
    }
}

const char* to_string(EventSeverity severity) noexcept
{
    switch (severity) {
    case EventSeverity::Info:
        return "info";
    case EventSeverity::Warning:
        return "warning";
    case EventSeverity::Error:
    default:
        return "error";
    }
}

EventSeverity event_severity(ConcurrencyEventKind kind) noexcept
{
    switch (kind) {
    case ConcurrencyEventKind::OperationExecuted:
    case ConcurrencyEventKind::SweepCompleted:
    case ConcurrencyEventKind::ConflictMerged:
        return EventSeverity::Info;
    case ConcurrencyEventKind::LockDenied:
    case ConcurrencyEventKind::ConflictDetected:
    case ConcurrencyEventKind::ConflictRejected:
        return EventSeverity::Warning;
    case ConcurrencyEventKind::ExecutionFailed:
    case ConcurrencyEventKind::LockReleaseFailed:
    case ConcurrencyEventKind::SweepFailed:
    default:
        return EventSeverity::Error;
    }
}

}  // namespace tabula::collab
