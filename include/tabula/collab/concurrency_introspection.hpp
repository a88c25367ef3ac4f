#pragma once

#include "tabula/collab/concurrency_control.hpp"
#include "tabula/collab/conflict_detector.hpp"

#include <cstdint>
#include <string>

namespace tabula::collab {

inline constexpr std::uint32_t kConcurrencyStatsSchemaVersion = 1U;

std::string concurrency_stats_to_json(const ConcurrencyStats& stats);
std::string conflict_result_to_json(const ConflictResult& result);
std::string operation_to_json(const Operation& op);

}  // namespace tabula::collab
