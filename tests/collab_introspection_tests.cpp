#include "tabula/collab/concurrency_introspection.hpp"
#include "tabula/collab/json_encoding.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <chrono>
#include <cstdint>
#include <limits>
#include <string>

using Catch::Matchers::ContainsSubstring;
using namespace std::chrono_literals;

namespace tabula::collab::tests {

namespace {

Timestamp base_time()
{
    return Timestamp{std::chrono::seconds{1'700'000'000}};
}

ResourceLock make_lock(const std::string& owner)
{
    ResourceLock lock{};
    lock.resource_type = "record";
    lock.resource_id = "rec1";
    lock.lock_type = LockType::Read;
    lock.owner_id = owner;
    lock.session_id = owner + "-session";
    lock.acquired_at = base_time();
    lock.expires_at = base_time() + 30s;
    return lock;
}

}  // namespace

TEST_CASE("format_timestamp_iso renders UTC with microseconds", "[introspection]")
{
    CHECK(format_timestamp_iso(base_time()) == "2023-11-14T22:13:20.000000Z");
    CHECK(format_timestamp_iso(base_time() + 1500us) == "2023-11-14T22:13:20.001500Z");
    CHECK(format_timestamp_iso(Timestamp{}).empty());
}

TEST_CASE("append_json_field_value encodes each field kind", "[introspection]")
{
    FieldMap fields;
    fields.emplace("flag", true);
    fields.emplace("count", std::int64_t{42});
    fields.emplace("ratio", 0.5);
    fields.emplace("note", std::string{"line\n\"quoted\""});
    fields.emplace("missing", std::monostate{});
    fields.emplace("broken", std::numeric_limits<double>::infinity());

    std::string json;
    append_json_field_map(json, fields);
    CHECK(json == R"({"broken":null,"count":42,"flag":true,"missing":null,"note":"line\n\"quoted\"","ratio":0.5})");
}

TEST_CASE("concurrency_stats_to_json lists holders per resource", "[introspection]")
{
    ConcurrencyStats stats{};
    stats.lock_details["record:rec1"].push_back(make_lock("user1"));
    stats.lock_details["record:rec1"].push_back(make_lock("user2"));
    stats.active_locks = 2U;
    stats.logged_operations = 3U;
    stats.telemetry.executions = 5U;
    stats.telemetry.lock_denials = 1U;

    const auto json = concurrency_stats_to_json(stats);
    CHECK_THAT(json, ContainsSubstring("\"schema_version\":1"));
    CHECK_THAT(json, ContainsSubstring("\"active_locks\":2"));
    CHECK_THAT(json, ContainsSubstring("\"logged_operations\":3"));
    CHECK_THAT(json, ContainsSubstring("\"lock_details\":{\"record:rec1\":[{"));
    CHECK_THAT(json, ContainsSubstring("\"owner_id\":\"user1\""));
    CHECK_THAT(json, ContainsSubstring("\"owner_id\":\"user2\""));
    CHECK_THAT(json, ContainsSubstring("\"lock_type\":\"read\""));
    CHECK_THAT(json, ContainsSubstring("\"expires_at\":\"2023-11-14T22:13:50.000000Z\""));
    CHECK_THAT(json, ContainsSubstring("\"executions\":5"));
    CHECK_THAT(json, ContainsSubstring("\"lock_denials\":1"));
}

TEST_CASE("concurrency_stats_to_json handles an idle controller", "[introspection]")
{
    ConcurrencyControl control{};
    const auto json = concurrency_stats_to_json(control.concurrency_stats());
    CHECK_THAT(json, ContainsSubstring("\"active_locks\":0"));
    CHECK_THAT(json, ContainsSubstring("\"lock_details\":{}"));
    CHECK_THAT(json, ContainsSubstring("\"sweeps\":0"));
}

TEST_CASE("conflict_result_to_json describes the resolution", "[introspection]")
{
    Operation existing{};
    existing.id = "opA";
    existing.type = OperationType::Update;
    existing.resource_type = "record";
    existing.resource_id = "rec1";
    existing.user_id = "user1";
    existing.session_id = "s1";
    existing.data.emplace("status", std::string{"done"});
    existing.timestamp = base_time();
    existing.version = 1;

    Operation incoming = existing;
    incoming.id = "opB";
    incoming.user_id = "user2";
    incoming.session_id = "s2";
    incoming.data.clear();
    incoming.data.emplace("status", std::string{"doing"});
    incoming.timestamp = base_time() + 2s;
    incoming.version = 2;

    ConflictDetector detector{};
    const auto result = detector.detect(incoming, std::span<const Operation>{&existing, 1U});
    REQUIRE(result.has_conflict);

    const auto json = conflict_result_to_json(result);
    CHECK_THAT(json, ContainsSubstring("\"has_conflict\":true"));
    CHECK_THAT(json, ContainsSubstring("\"conflict_type\":\"concurrent_update\""));
    CHECK_THAT(json, ContainsSubstring("\"conflicting_op\":{\"id\":\"opA\""));
    CHECK_THAT(json, ContainsSubstring("\"strategy\":\"merge\""));
    CHECK_THAT(json, ContainsSubstring("\"merged_data\":{\"status\":\"doing\"}"));
    CHECK_THAT(json, ContainsSubstring("\"winner\":\"opB\""));

    CHECK(conflict_result_to_json(ConflictResult{}) == R"({"has_conflict":false})");
}

TEST_CASE("operation_to_json writes every operation field", "[introspection]")
{
    Operation op{};
    op.id = "op1";
    op.type = OperationType::Delete;
    op.resource_type = "record";
    op.resource_id = "rec1";
    op.user_id = "user1";
    op.session_id = "s1";
    op.timestamp = base_time();
    op.version = 7;

    CHECK(operation_to_json(op)
          == R"({"id":"op1","type":"delete","resource_type":"record","resource_id":"rec1","user_id":"user1","session_id":"s1","data":{},"timestamp":"2023-11-14T22:13:20.000000Z","version":7})");
}

}  // namespace tabula::collab::tests
