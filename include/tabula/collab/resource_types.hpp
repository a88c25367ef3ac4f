#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tabula::collab {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

enum class LockType {
    Read,
    Write,
    Exclusive
};

enum class OperationType {
    Create,
    Update,
    Delete
};

// std::monostate is a null cell value.
using FieldValue = std::variant<std::monostate, bool, std::int64_t, double, std::string>;
using FieldMap = std::map<std::string, FieldValue>;

struct ResourceLock final {
    std::string resource_id{};
    std::string resource_type{};
    LockType lock_type = LockType::Read;
    std::string owner_id{};
    std::string session_id{};
    Timestamp acquired_at{};
    Timestamp expires_at{};

    [[nodiscard]] bool expired(Timestamp now) const noexcept
    {
        return now > expires_at;
    }

    [[nodiscard]] bool held_by(std::string_view owner, std::string_view session) const noexcept
    {
        return owner_id == owner && session_id == session;
    }
};

struct LockRequest final {
    std::string resource_id{};
    std::string resource_type{};
    LockType lock_type = LockType::Write;
    std::string owner_id{};
    std::string session_id{};
    std::chrono::milliseconds timeout{std::chrono::seconds{30}};
};

struct Operation final {
    std::string id{};
    OperationType type = OperationType::Update;
    std::string resource_type{};
    std::string resource_id{};
    std::string user_id{};
    std::string session_id{};
    FieldMap data{};
    Timestamp timestamp{};
    std::int64_t version = 0;
};

// Keyed by resource key, each entry lists the compatible holders of that key.
using ActiveLockMap = std::map<std::string, std::vector<ResourceLock>>;

[[nodiscard]] std::string make_resource_key(std::string_view resource_type, std::string_view resource_id);

[[nodiscard]] const char* to_string(LockType type) noexcept;
[[nodiscard]] const char* to_string(OperationType type) noexcept;
[[nodiscard]] std::optional<LockType> parse_lock_type(std::string_view text) noexcept;
[[nodiscard]] std::optional<OperationType> parse_operation_type(std::string_view text) noexcept;

[[nodiscard]] LockType stronger_lock_type(LockType lhs, LockType rhs) noexcept;

// Clamp to Timestamp::min() / Timestamp::max() instead of overflowing the clock.
[[nodiscard]] Timestamp saturating_add(Timestamp tp, std::chrono::milliseconds delta) noexcept;
[[nodiscard]] Timestamp saturating_sub(Timestamp tp, std::chrono::milliseconds delta) noexcept;

}  // namespace tabula::collab
