#pragma once

#include "tabula/collab/concurrency_events.hpp"

#include <string>

namespace tabula::tools {

[[nodiscard]] std::string format_concurrency_event_log_json(const tabula::collab::ConcurrencyEvent& event);

}  // namespace tabula::tools
