#pragma once

#include <cstdint>

namespace tabula::collab {

struct ConcurrencyTelemetrySnapshot final {
    std::uint64_t executions = 0U;
    std::uint64_t succeeded = 0U;
    std::uint64_t lock_denials = 0U;
    std::uint64_t conflicts_detected = 0U;
    std::uint64_t concurrent_update_conflicts = 0U;
    std::uint64_t delete_conflicts = 0U;
    std::uint64_t duplicate_create_conflicts = 0U;
    std::uint64_t unknown_conflicts = 0U;
    std::uint64_t merges_applied = 0U;
    std::uint64_t conflict_rejections = 0U;
    std::uint64_t executor_failures = 0U;
    std::uint64_t lock_release_failures = 0U;
    std::uint64_t sweeps = 0U;
    std::uint64_t sweep_failures = 0U;
    std::uint64_t expired_locks_removed = 0U;
    std::uint64_t operations_trimmed = 0U;
};

}  // namespace tabula::collab
