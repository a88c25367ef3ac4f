#include "tabula/collab/concurrency_introspection.hpp"

#include "tabula/collab/json_encoding.hpp"

#include <cstdint>
#include <string_view>

namespace tabula::collab {

namespace {

class JsonObjectWriter final {
public:
    explicit JsonObjectWriter(std::string& out)
        : out_{out}
    {
        out_.push_back('{');
    }

    void key(const char* name)
    {
        if (!first_) {
            out_.push_back(',');
        }
        first_ = false;
        out_.push_back('"');
        out_.append(name);
        out_.append("\":");
    }

    void number(const char* name, std::uint64_t value)
    {
        key(name);
        out_.append(std::to_string(value));
    }

    void signed_number(const char* name, std::int64_t value)
    {
        key(name);
        out_.append(std::to_string(value));
    }

    void string(const char* name, std::string_view value)
    {
        key(name);
        append_json_string(out_, value);
    }

    void boolean(const char* name, bool value)
    {
        key(name);
        out_.append(value ? "true" : "false");
    }

    void timestamp(const char* name, Timestamp value)
    {
        key(name);
        const auto text = format_timestamp_iso(value);
        if (text.empty()) {
            out_.append("null");
        } else {
            append_json_string(out_, text);
        }
    }

    void close()
    {
        out_.push_back('}');
    }

private:
    std::string& out_;
    bool first_ = true;
};

void append_lock(std::string& json, const ResourceLock& lock)
{
    JsonObjectWriter writer{json};
    writer.string("resource_type", lock.resource_type);
    writer.string("resource_id", lock.resource_id);
    writer.string("lock_type", to_string(lock.lock_type));
    writer.string("owner_id", lock.owner_id);
    writer.string("session_id", lock.session_id);
    writer.timestamp("acquired_at", lock.acquired_at);
    writer.timestamp("expires_at", lock.expires_at);
    writer.close();
}

void append_operation(std::string& json, const Operation& op)
{
    JsonObjectWriter writer{json};
    writer.string("id", op.id);
    writer.string("type", to_string(op.type));
    writer.string("resource_type", op.resource_type);
    writer.string("resource_id", op.resource_id);
    writer.string("user_id", op.user_id);
    writer.string("session_id", op.session_id);
    writer.key("data");
    append_json_field_map(json, op.data);
    writer.timestamp("timestamp", op.timestamp);
    writer.signed_number("version", op.version);
    writer.close();
}

}  // namespace

std::string concurrency_stats_to_json(const ConcurrencyStats& stats)
{
    std::string json;
    json.reserve(512U);
    JsonObjectWriter writer{json};
    writer.number("schema_version", kConcurrencyStatsSchemaVersion);
    writer.number("active_locks", stats.active_locks);
    writer.number("logged_operations", stats.logged_operations);

    writer.key("lock_details");
    json.push_back('{');
    bool first_key = true;
    for (const auto& [resource_key, holders] : stats.lock_details) {
        if (!first_key) {
            json.push_back(',');
        }
        first_key = false;
        append_json_string(json, resource_key);
        json.append(":[");
        for (std::size_t i = 0U; i < holders.size(); ++i) {
            if (i > 0U) {
                json.push_back(',');
            }
            append_lock(json, holders[i]);
        }
        json.push_back(']');
    }
    json.push_back('}');

    const auto& telemetry = stats.telemetry;
    writer.key("telemetry");
    JsonObjectWriter counters{json};
    counters.number("executions", telemetry.executions);
    counters.number("succeeded", telemetry.succeeded);
    counters.number("lock_denials", telemetry.lock_denials);
    counters.number("conflicts_detected", telemetry.conflicts_detected);
    counters.number("concurrent_update_conflicts", telemetry.concurrent_update_conflicts);
    counters.number("delete_conflicts", telemetry.delete_conflicts);
    counters.number("duplicate_create_conflicts", telemetry.duplicate_create_conflicts);
    counters.number("unknown_conflicts", telemetry.unknown_conflicts);
    counters.number("merges_applied", telemetry.merges_applied);
    counters.number("conflict_rejections", telemetry.conflict_rejections);
    counters.number("executor_failures", telemetry.executor_failures);
    counters.number("lock_release_failures", telemetry.lock_release_failures);
    counters.number("sweeps", telemetry.sweeps);
    counters.number("sweep_failures", telemetry.sweep_failures);
    counters.number("expired_locks_removed", telemetry.expired_locks_removed);
    counters.number("operations_trimmed", telemetry.operations_trimmed);
    counters.close();

    writer.close();
    return json;
}

std::string conflict_result_to_json(const ConflictResult& result)
{
    std::string json;
    json.reserve(256U);
    JsonObjectWriter writer{json};
    writer.boolean("has_conflict", result.has_conflict);
    if (!result.has_conflict) {
        writer.close();
        return json;
    }

    writer.string("conflict_type", to_string(result.conflict_type));
    if (result.conflicting_operation) {
        writer.key("conflicting_op");
        append_operation(json, *result.conflicting_operation);
    }

    const auto& resolution = result.resolution;
    writer.key("resolution");
    JsonObjectWriter resolution_writer{json};
    resolution_writer.string("strategy", to_string(resolution.strategy));
    if (resolution.merged_data) {
        resolution_writer.key("merged_data");
        append_json_field_map(json, *resolution.merged_data);
    }
    if (resolution.winner) {
        resolution_writer.string("winner", *resolution.winner);
    }
    if (resolution.action) {
        resolution_writer.string("action", *resolution.action);
    }
    resolution_writer.close();

    writer.close();
    return json;
}

std::string operation_to_json(const Operation& op)
{
    std::string json;
    json.reserve(256U);
    append_operation(json, op);
    return json;
}

}  // namespace tabula::collab
