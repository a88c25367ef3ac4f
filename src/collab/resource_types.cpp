#include "tabula/collab/resource_types.hpp"

namespace tabula::collab {

namespace {

// Longest whole-millisecond span the clock can represent.
constexpr auto kMaxClockSpan = std::chrono::duration_cast<std::chrono::milliseconds>(Timestamp::duration::max());

[[nodiscard]] int lock_strength(LockType type) noexcept
{
    switch (type) {
    case LockType::Read:
        return 0;
    case LockType::Write:
        return 1;
    case LockType::Exclusive:
    default:
        return 2;
    }
}

}  // namespace

std::string make_resource_key(std::string_view resource_type, std::string_view resource_id)
{
    std::string key;
    key.reserve(resource_type.size() + resource_id.size() + 1U);
    key.append(resource_type);
    key.push_back(':');
    key.append(resource_id);
    return key;
}

const char* to_string(LockType type) noexcept
{
    switch (type) {
    case LockType::Read:
        return "read";
    case LockType::Write:
        return "write";
    case LockType::Exclusive:
        return "exclusive";
    default:
        return "unknown";
    }
}

const char* to_string(OperationType type) noexcept
{
    switch (type) {
    case OperationType::Create:
        return "create";
    case OperationType::Update:
        return "update";
    case OperationType::Delete:
        return "delete";
    default:
        return "unknown";
    }
}

std::optional<LockType> parse_lock_type(std::string_view text) noexcept
{
    if (text == "read") {
        return LockType::Read;
    }
    if (text == "write") {
        return LockType::Write;
    }
    if (text == "exclusive") {
        return LockType::Exclusive;
    }
    return std::nullopt;
}

std::optional<OperationType> parse_operation_type(std::string_view text) noexcept
{
    if (text == "create") {
        return OperationType::Create;
    }
    if (text == "update") {
        return OperationType::Update;
    }
    if (text == "delete") {
        return OperationType::Delete;
    }
    return std::nullopt;
}

LockType stronger_lock_type(LockType lhs, LockType rhs) noexcept
{
    return lock_strength(lhs) >= lock_strength(rhs) ? lhs : rhs;
}

Timestamp saturating_add(Timestamp tp, std::chrono::milliseconds delta) noexcept
{
    if (delta.count() < 0) {
        return delta == std::chrono::milliseconds::min() ? Timestamp::min() : saturating_sub(tp, -delta);
    }
    if (delta >= kMaxClockSpan) {
        return Timestamp::max();
    }
    const auto step = std::chrono::duration_cast<Timestamp::duration>(delta);
    if (tp > Timestamp::max() - step) {
        return Timestamp::max();
    }
    return tp + step;
}

Timestamp saturating_sub(Timestamp tp, std::chrono::milliseconds delta) noexcept
{
    if (delta.count() < 0) {
        return delta == std::chrono::milliseconds::min() ? Timestamp::max() : saturating_add(tp, -delta);
    }
    if (delta >= kMaxClockSpan) {
        return Timestamp::min();
    }
    const auto step = std::chrono::duration_cast<Timestamp::duration>(delta);
    if (tp < Timestamp::min() + step) {
        return Timestamp::min();
    }
    return tp - step;
}

}  // namespace tabula::collab
