#include "tabula/tools/event_log_formatter.hpp"

#include "tabula/collab/json_encoding.hpp"

namespace tabula::tools {

std::string format_concurrency_event_log_json(const tabula::collab::ConcurrencyEvent& event)
{
    using tabula::collab::append_json_string;

    std::string json;
    json.reserve(384U);
    json.push_back('{');
    bool first = true;

    auto append_field = [&](const char* name) {
        if (!first) {
            json.push_back(',');
        }
        first = false;
        json.push_back('"');
        json.append(name);
        json.push_back('"');
        json.push_back(':');
    };

    auto append_string_field = [&](const char* name, const std::string& value) {
        append_field(name);
        append_json_string(json, value);
    };

    auto append_optional_string_field = [&](const char* name, const std::string& value) {
        append_field(name);
        if (value.empty()) {
            json.append("null");
        } else {
            append_json_string(json, value);
        }
    };

    auto append_number_field = [&](const char* name, auto value) {
        append_field(name);
        json.append(std::to_string(value));
    };

    append_string_field("event", tabula::collab::to_string(event.kind));
    append_string_field("severity", tabula::collab::to_string(tabula::collab::event_severity(event.kind)));
    append_optional_string_field("timestamp", tabula::collab::format_timestamp_iso(event.timestamp));
    append_optional_string_field("operation_id", event.operation_id);
    append_optional_string_field("resource_type", event.resource_type);
    append_optional_string_field("resource_id", event.resource_id);
    append_optional_string_field("user_id", event.user_id);
    append_optional_string_field("session_id", event.session_id);

    append_field("conflict_type");
    if (event.conflict_type) {
        append_json_string(json, tabula::collab::to_string(*event.conflict_type));
    } else {
        json.append("null");
    }
    append_optional_string_field("conflicting_operation_id", event.conflicting_operation_id);
    append_optional_string_field("lock_holder", event.lock_holder);

    append_field("error");
    if (event.error) {
        json.push_back('{');
        json.append("\"category\":");
        append_json_string(json, event.error.category().name());
        json.append(",\"value\":");
        json.append(std::to_string(event.error.value()));
        json.append(",\"message\":");
        append_json_string(json, event.error.message());
        json.push_back('}');
    } else {
        json.append("null");
    }

    if (event.kind == tabula::collab::ConcurrencyEventKind::SweepCompleted) {
        append_number_field("expired_locks_removed", event.expired_locks_removed);
        append_number_field("operations_trimmed", event.operations_trimmed);
    }

    json.push_back('}');
    return json;
}

}  // namespace tabula::tools
