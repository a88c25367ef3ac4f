#include "tabula/collab/concurrency_control.hpp"

#include "tabula/collab/collab_errors.hpp"

#include <new>
#include <string>
#include <utility>

namespace tabula::collab {

class ConcurrencyControl::LockHandle final {
public:
    LockHandle(ResourceLockManager* locks, const Operation& op) noexcept
        : locks_{locks}
        , op_{&op}
    {
    }

    LockHandle(const LockHandle&) = delete;
    LockHandle& operator=(const LockHandle&) = delete;

    ~LockHandle()
    {
        release();
    }

    void release() noexcept
    {
        if (locks_ == nullptr || !held_) {
            return;
        }
        held_ = false;
        release_error_ = locks_->release(op_->resource_type, op_->resource_id, op_->user_id, op_->session_id);
    }

    [[nodiscard]] std::error_code release_error() const noexcept
    {
        return release_error_;
    }

private:
    ResourceLockManager* locks_ = nullptr;
    const Operation* op_ = nullptr;
    bool held_ = true;
    std::error_code release_error_{};
};

ConcurrencyControl::ConcurrencyControl()
    : ConcurrencyControl(Config{})
{
}

ConcurrencyControl::ConcurrencyControl(Config config)
    : config_{std::move(config)}
    , detector_{ConflictDetector::Config{config_.conflict_window}}
    , maintenance_{[this](Timestamp now) -> std::error_code {
                       try {
                           run_sweep(now);
                       } catch (const std::bad_alloc&) {
                           const auto ec = std::make_error_code(std::errc::not_enough_memory);
                           update_telemetry([](auto& telemetry) { ++telemetry.sweep_failures; });
                           ConcurrencyEvent event{};
                           event.kind = ConcurrencyEventKind::SweepFailed;
                           event.timestamp = now;
                           event.error = ec;
                           emit(std::move(event));
                           return ec;
                       }
                       return {};
                   },
                   MaintenanceLoop::Config{config_.sweep_interval}}
{
}

ConcurrencyControl::~ConcurrencyControl()
{
    stop_maintenance();
}

std::error_code ConcurrencyControl::execute(Operation& op, const ApplyCallback& apply)
{
    if (!apply) {
        return std::make_error_code(std::errc::invalid_argument);
    }

    update_telemetry([](auto& telemetry) { ++telemetry.executions; });

    LockRequest request{};
    request.resource_id = op.resource_id;
    request.resource_type = op.resource_type;
    request.lock_type = LockType::Write;
    request.owner_id = op.user_id;
    request.session_id = op.session_id;
    request.timeout = config_.lock_timeout;

    ResourceLockManager::AcquireResult acquired{};
    if (auto ec = locks_.acquire(request, acquired)) {
        if (ec != CollabErrc::LockUnavailable) {
            return ec;
        }
        update_telemetry([](auto& telemetry) { ++telemetry.lock_denials; });
        auto event = make_event(ConcurrencyEventKind::LockDenied, op);
        if (acquired.blocking_lock) {
            event.lock_holder = acquired.blocking_lock->owner_id;
        }
        event.error = ec;
        emit(std::move(event));
        return ec;
    }

    LockHandle handle{&locks_, op};
    std::error_code ec;
    try {
        ec = execute_locked(op, apply);
    } catch (...) {
        release_lock(handle, op);
        throw;
    }
    release_lock(handle, op);
    return ec;
}

std::error_code ConcurrencyControl::execute_locked(Operation& op, const ApplyCallback& apply)
{
    const auto existing = operations_.operations(op.resource_type, op.resource_id);
    const auto conflict = detector_.detect(op, existing);
    if (conflict.has_conflict) {
        record_conflict(conflict.conflict_type);
        auto event = make_event(ConcurrencyEventKind::ConflictDetected, op);
        event.conflict_type = conflict.conflict_type;
        if (conflict.conflicting_operation) {
            event.conflicting_operation_id = conflict.conflicting_operation->id;
        }
        emit(std::move(event));

        if (auto ec = apply_resolution(op, conflict)) {
            update_telemetry([](auto& telemetry) { ++telemetry.conflict_rejections; });
            auto rejected = make_event(ConcurrencyEventKind::ConflictRejected, op);
            rejected.conflict_type = conflict.conflict_type;
            if (conflict.conflicting_operation) {
                rejected.conflicting_operation_id = conflict.conflicting_operation->id;
            }
            rejected.error = ec;
            emit(std::move(rejected));
            return ec;
        }
    }

    operations_.add(op);

    std::error_code apply_ec;
    try {
        apply_ec = apply(op);
    } catch (...) {
        operations_.remove(op.resource_type, op.resource_id, op.id);
        update_telemetry([](auto& telemetry) { ++telemetry.executor_failures; });
        throw;
    }

    if (apply_ec) {
        operations_.remove(op.resource_type, op.resource_id, op.id);
        update_telemetry([](auto& telemetry) { ++telemetry.executor_failures; });
        auto event = make_event(ConcurrencyEventKind::ExecutionFailed, op);
        event.error = apply_ec;
        emit(std::move(event));
        return apply_ec;
    }

    update_telemetry([](auto& telemetry) { ++telemetry.succeeded; });
    emit(make_event(ConcurrencyEventKind::OperationExecuted, op));
    return {};
}

void ConcurrencyControl::release_lock(LockHandle& handle, const Operation& op)
{
    handle.release();
    const auto ec = handle.release_error();
    if (!ec) {
        return;
    }
    update_telemetry([](auto& telemetry) { ++telemetry.lock_release_failures; });
    auto event = make_event(ConcurrencyEventKind::LockReleaseFailed, op);
    event.error = ec;
    emit(std::move(event));
}

std::error_code ConcurrencyControl::apply_resolution(Operation& op, const ConflictResult& conflict)
{
    const auto& resolution = conflict.resolution;
    switch (resolution.strategy) {
    case ResolutionStrategy::Merge:
        if (resolution.merged_data) {
            op.data = *resolution.merged_data;
            update_telemetry([](auto& telemetry) { ++telemetry.merges_applied; });
            auto event = make_event(ConcurrencyEventKind::ConflictMerged, op);
            event.conflict_type = conflict.conflict_type;
            if (conflict.conflicting_operation) {
                event.conflicting_operation_id = conflict.conflicting_operation->id;
            }
            emit(std::move(event));
        }
        return {};
    case ResolutionStrategy::DeleteWins:
        if (op.type != OperationType::Delete) {
            return make_error_code(CollabErrc::DeleteConflict);
        }
        return {};
    case ResolutionStrategy::LatestWins:
        if (resolution.winner && *resolution.winner != op.id) {
            return make_error_code(CollabErrc::LatestOperationWins);
        }
        return {};
    case ResolutionStrategy::ManualResolve:
        return make_error_code(CollabErrc::ManualResolutionRequired);
    case ResolutionStrategy::None:
    default:
        return make_error_code(CollabErrc::UnknownResolutionStrategy);
    }
}

void ConcurrencyControl::record_conflict(ConflictType type)
{
    update_telemetry([type](auto& telemetry) {
        ++telemetry.conflicts_detected;
        switch (type) {
        case ConflictType::ConcurrentUpdate:
            ++telemetry.concurrent_update_conflicts;
            break;
        case ConflictType::DeleteConflict:
            ++telemetry.delete_conflicts;
            break;
        case ConflictType::DuplicateCreate:
            ++telemetry.duplicate_create_conflicts;
            break;
        case ConflictType::UnknownConflict:
        default:
            ++telemetry.unknown_conflicts;
            break;
        }
    });
}

void ConcurrencyControl::start_maintenance()
{
    maintenance_.start();
}

void ConcurrencyControl::stop_maintenance()
{
    maintenance_.stop();
}

bool ConcurrencyControl::maintenance_running() const noexcept
{
    return maintenance_.running();
}

SweepSummary ConcurrencyControl::run_sweep()
{
    return run_sweep(Clock::now());
}

SweepSummary ConcurrencyControl::run_sweep(Timestamp now)
{
    SweepSummary summary{};
    summary.expired_locks_removed = locks_.cleanup_expired(now);
    summary.operations_trimmed = operations_.cleanup_older_than(config_.operation_retention, now);

    update_telemetry([&summary](auto& telemetry) {
        ++telemetry.sweeps;
        telemetry.expired_locks_removed += summary.expired_locks_removed;
        telemetry.operations_trimmed += summary.operations_trimmed;
    });

    ConcurrencyEvent event{};
    event.kind = ConcurrencyEventKind::SweepCompleted;
    event.timestamp = now;
    event.expired_locks_removed = summary.expired_locks_removed;
    event.operations_trimmed = summary.operations_trimmed;
    emit(std::move(event));
    return summary;
}

ConcurrencyStats ConcurrencyControl::concurrency_stats() const
{
    ConcurrencyStats stats{};
    stats.lock_details = locks_.active_locks();
    for (const auto& entry : stats.lock_details) {
        stats.active_locks += entry.second.size();
    }
    stats.logged_operations = operations_.size();
    stats.telemetry = telemetry_snapshot();
    return stats;
}

ConcurrencyTelemetrySnapshot ConcurrencyControl::telemetry_snapshot() const
{
    std::lock_guard lock(telemetry_mutex_);
    return telemetry_;
}

const ResourceLockManager& ConcurrencyControl::lock_manager() const noexcept
{
    return locks_;
}

const OperationLog& ConcurrencyControl::operation_log() const noexcept
{
    return operations_;
}

const ConflictDetector& ConcurrencyControl::conflict_detector() const noexcept
{
    return detector_;
}

const MaintenanceLoop& ConcurrencyControl::maintenance_loop() const noexcept
{
    return maintenance_;
}

const ConcurrencyControl::Config& ConcurrencyControl::config() const noexcept
{
    return config_;
}

void ConcurrencyControl::emit(ConcurrencyEvent event) const
{
    if (config_.event_logger) {
        config_.event_logger(event);
    }
}

ConcurrencyEvent ConcurrencyControl::make_event(ConcurrencyEventKind kind, const Operation& op) const
{
    ConcurrencyEvent event{};
    event.kind = kind;
    event.timestamp = Clock::now();
    event.operation_id = op.id;
    event.resource_type = op.resource_type;
    event.resource_id = op.resource_id;
    event.user_id = op.user_id;
    event.session_id = op.session_id;
    return event;
}

}  // namespace tabula::collab
