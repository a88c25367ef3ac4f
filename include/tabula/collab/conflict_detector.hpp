#pragma once

#include "tabula/collab/resource_types.hpp"

#include <chrono>
#include <optional>
#include <span>
#include <string>

namespace tabula::collab {

enum class ConflictType {
    ConcurrentUpdate,
    DeleteConflict,
    DuplicateCreate,
    UnknownConflict
};

enum class ResolutionStrategy {
    None,
    Merge,
    DeleteWins,
    LatestWins,
    ManualResolve
};

struct ConflictResolution final {
    ResolutionStrategy strategy = ResolutionStrategy::None;
    std::optional<FieldMap> merged_data{};
    // Operation id chosen by the winner rule (Merge and LatestWins).
    std::optional<std::string> winner{};
    // "confirm_delete" for DeleteWins.
    std::optional<std::string> action{};
};

struct ConflictResult final {
    bool has_conflict = false;
    ConflictType conflict_type = ConflictType::UnknownConflict;
    std::optional<Operation> conflicting_operation{};
    ConflictResolution resolution{};
};

class ConflictDetector final {
public:
    struct Config final {
        std::chrono::milliseconds conflict_window{std::chrono::seconds{5}};
    };

    ConflictDetector();
    explicit ConflictDetector(Config config);

    // Reports the first entry of existing_ops that conflicts with op.
    [[nodiscard]] ConflictResult detect(const Operation& op, std::span<const Operation> existing_ops) const;

    [[nodiscard]] bool conflicts(const Operation& op, const Operation& existing) const;

    [[nodiscard]] std::chrono::milliseconds conflict_window() const noexcept;

    [[nodiscard]] static ConflictType classify(const Operation& op, const Operation& existing) noexcept;
    [[nodiscard]] static ConflictResolution resolve(const Operation& op, const Operation& existing, ConflictType type);

    // Higher version wins, then later timestamp; a full tie goes to second.
    [[nodiscard]] static const std::string& select_winner(const Operation& first, const Operation& second) noexcept;

    // Shallow union; values from newer overwrite values from older.
    [[nodiscard]] static FieldMap merge_data(const FieldMap& older, const FieldMap& newer);

    [[nodiscard]] static bool shares_field(const FieldMap& lhs, const FieldMap& rhs);

private:
    Config config_{};
};

[[nodiscard]] const char* to_string(ConflictType type) noexcept;
[[nodiscard]] const char* to_string(ResolutionStrategy strategy) noexcept;

}  // namespace tabula::collab
