#include "tabula/tools/event_log_formatter.hpp"

#include "tabula/collab/collab_errors.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <chrono>
#include <string>

using Catch::Matchers::ContainsSubstring;
using tabula::collab::CollabErrc;
using tabula::collab::ConcurrencyEvent;
using tabula::collab::ConcurrencyEventKind;
using tabula::collab::ConflictType;
using tabula::collab::Timestamp;

namespace {

ConcurrencyEvent make_event(ConcurrencyEventKind kind)
{
    ConcurrencyEvent event{};
    event.kind = kind;
    event.timestamp = Timestamp{std::chrono::seconds{1'700'000'000}};
    event.operation_id = "opB";
    event.resource_type = "record";
    event.resource_id = "rec1";
    event.user_id = "user2";
    event.session_id = "s2";
    return event;
}

}  // namespace

TEST_CASE("Concurrency event log formatter emits a lock denial", "[event_log]")
{
    auto event = make_event(ConcurrencyEventKind::LockDenied);
    event.lock_holder = "user1";
    event.error = tabula::collab::make_error_code(CollabErrc::LockUnavailable);

    const auto json = tabula::tools::format_concurrency_event_log_json(event);
    CHECK(json.front() == '{');
    CHECK(json.back() == '}');
    CHECK(json.find('\n') == std::string::npos);
    CHECK_THAT(json, ContainsSubstring("\"event\":\"lock_denied\""));
    CHECK_THAT(json, ContainsSubstring("\"severity\":\"warning\""));
    CHECK_THAT(json, ContainsSubstring("\"timestamp\":\"2023-11-14T22:13:20.000000Z\""));
    CHECK_THAT(json, ContainsSubstring("\"operation_id\":\"opB\""));
    CHECK_THAT(json, ContainsSubstring("\"lock_holder\":\"user1\""));
    CHECK_THAT(json, ContainsSubstring("\"conflict_type\":null"));
    CHECK_THAT(json, ContainsSubstring("\"category\":\"tabula.collab\""));
    CHECK_THAT(json, ContainsSubstring("\"message\":\"resource is locked by another owner\""));
    CHECK_THAT(json, !ContainsSubstring("expired_locks_removed"));
}

TEST_CASE("Concurrency event log formatter emits a rejected conflict", "[event_log]")
{
    auto event = make_event(ConcurrencyEventKind::ConflictRejected);
    event.conflict_type = ConflictType::DeleteConflict;
    event.conflicting_operation_id = "opA";
    event.error = tabula::collab::make_error_code(CollabErrc::DeleteConflict);

    const auto json = tabula::tools::format_concurrency_event_log_json(event);
    CHECK_THAT(json, ContainsSubstring("\"conflict_type\":\"delete_conflict\""));
    CHECK_THAT(json, ContainsSubstring("\"conflicting_operation_id\":\"opA\""));
    CHECK_THAT(json, ContainsSubstring("\"lock_holder\":null"));
    CHECK_THAT(json, ContainsSubstring("\"message\":\"operation cancelled due to delete conflict\""));
}

TEST_CASE("Concurrency event log formatter reports sweep counts", "[event_log]")
{
    ConcurrencyEvent event{};
    event.kind = ConcurrencyEventKind::SweepCompleted;
    event.timestamp = Timestamp{std::chrono::seconds{1'700'000'000}};
    event.expired_locks_removed = 2U;
    event.operations_trimmed = 9U;

    const auto json = tabula::tools::format_concurrency_event_log_json(event);
    CHECK_THAT(json, ContainsSubstring("\"event\":\"sweep_completed\""));
    CHECK_THAT(json, ContainsSubstring("\"severity\":\"info\""));
    CHECK_THAT(json, ContainsSubstring("\"operation_id\":null"));
    CHECK_THAT(json, ContainsSubstring("\"error\":null"));
    CHECK_THAT(json, ContainsSubstring("\"expired_locks_removed\":2"));
    CHECK_THAT(json, ContainsSubstring("\"operations_trimmed\":9"));
}

TEST_CASE("Concurrency event log formatter escapes identifiers", "[event_log]")
{
    auto event = make_event(ConcurrencyEventKind::ExecutionFailed);
    event.resource_id = "rec\"1\"";
    event.error = std::make_error_code(std::errc::io_error);

    const auto json = tabula::tools::format_concurrency_event_log_json(event);
    CHECK_THAT(json, ContainsSubstring(R"("resource_id":"rec\"1\"")"));
    CHECK_THAT(json, ContainsSubstring("\"severity\":\"error\""));
    CHECK_THAT(json, ContainsSubstring("\"category\":\"generic\""));
}
