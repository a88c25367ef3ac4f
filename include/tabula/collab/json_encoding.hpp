#pragma once

#include "tabula/collab/resource_types.hpp"

#include <string>
#include <string_view>

namespace tabula::collab {

void append_json_string(std::string& out, std::string_view text);
void append_json_field_value(std::string& out, const FieldValue& value);
void append_json_field_map(std::string& out, const FieldMap& fields);

// ISO-8601 UTC with microseconds; empty for the epoch.
[[nodiscard]] std::string format_timestamp_iso(Timestamp tp);

}  // namespace tabula::collab
