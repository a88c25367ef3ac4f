#pragma once

#include "tabula/collab/concurrency_events.hpp"
#include "tabula/collab/concurrency_telemetry.hpp"
#include "tabula/collab/conflict_detector.hpp"
#include "tabula/collab/maintenance_loop.hpp"
#include "tabula/collab/operation_log.hpp"
#include "tabula/collab/resource_lock_manager.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <system_error>

namespace tabula::collab {

struct SweepSummary final {
    std::size_t expired_locks_removed = 0U;
    std::size_t operations_trimmed = 0U;
};

struct ConcurrencyStats final {
    std::size_t active_locks = 0U;
    ActiveLockMap lock_details{};
    std::size_t logged_operations = 0U;
    ConcurrencyTelemetrySnapshot telemetry{};
};

// Wraps a caller supplied mutation with a write lock on its resource, conflict
// resolution against recent operations and operation log bookkeeping.
//
// The lock is what prevents two writers from applying to the same resource at
// once. Conflict detection only chooses the merge policy and may miss an
// operation appended concurrently after the log snapshot was taken.
class ConcurrencyControl final {
public:
    struct Config final {
        std::chrono::milliseconds lock_timeout{std::chrono::seconds{30}};
        std::chrono::milliseconds conflict_window{std::chrono::seconds{5}};
        std::chrono::milliseconds sweep_interval{std::chrono::minutes{1}};
        std::chrono::milliseconds operation_retention{std::chrono::minutes{10}};
        // Called synchronously, possibly while a resource lock is held. An
        // exception from the logger propagates out of execute() after the lock
        // is released. Events raised by background maintenance must not throw.
        ConcurrencyEventLogger event_logger{};
    };

    using ApplyCallback = std::function<std::error_code(const Operation&)>;

    ConcurrencyControl();
    explicit ConcurrencyControl(Config config);
    ~ConcurrencyControl();

    ConcurrencyControl(const ConcurrencyControl&) = delete;
    ConcurrencyControl& operator=(const ConcurrencyControl&) = delete;
    ConcurrencyControl(ConcurrencyControl&&) = delete;
    ConcurrencyControl& operator=(ConcurrencyControl&&) = delete;

    // Invokes apply at most once. On a Merge resolution op.data is replaced by
    // the merged fields before apply runs. Exceptions thrown by apply are
    // rethrown after the operation is dequeued and the lock released.
    // Malformed operations fail with CollabErrc::InvalidLockRequest.
    [[nodiscard]] std::error_code execute(Operation& op, const ApplyCallback& apply);

    void start_maintenance();
    void stop_maintenance();
    [[nodiscard]] bool maintenance_running() const noexcept;
    SweepSummary run_sweep();
    SweepSummary run_sweep(Timestamp now);

    [[nodiscard]] ConcurrencyStats concurrency_stats() const;
    [[nodiscard]] ConcurrencyTelemetrySnapshot telemetry_snapshot() const;

    [[nodiscard]] const ResourceLockManager& lock_manager() const noexcept;
    [[nodiscard]] const OperationLog& operation_log() const noexcept;
    [[nodiscard]] const ConflictDetector& conflict_detector() const noexcept;
    [[nodiscard]] const MaintenanceLoop& maintenance_loop() const noexcept;
    [[nodiscard]] const Config& config() const noexcept;

private:
    class LockHandle;

    [[nodiscard]] std::error_code execute_locked(Operation& op, const ApplyCallback& apply);
    void release_lock(LockHandle& handle, const Operation& op);
    [[nodiscard]] std::error_code apply_resolution(Operation& op, const ConflictResult& conflict);
    void record_conflict(ConflictType type);
    void emit(ConcurrencyEvent event) const;
    [[nodiscard]] ConcurrencyEvent make_event(ConcurrencyEventKind kind, const Operation& op) const;

    template <typename Fn>
    void update_telemetry(Fn&& fn)
    {
        std::lock_guard lock(telemetry_mutex_);
        fn(telemetry_);
    }

    Config config_{};
    ResourceLockManager locks_{};
    OperationLog operations_{};
    ConflictDetector detector_;
    MaintenanceLoop maintenance_;
    mutable std::mutex telemetry_mutex_{};
    ConcurrencyTelemetrySnapshot telemetry_{};
};

}  // namespace tabula::collab
