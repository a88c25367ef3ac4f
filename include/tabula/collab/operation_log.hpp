#pragma once

#include "tabula/collab/resource_types.hpp"

#include <chrono>
#include <cstddef>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tabula::collab {

// Recent operations per resource key, kept only as evidence for conflict detection.
class OperationLog final {
public:
    OperationLog() = default;

    OperationLog(const OperationLog&) = delete;
    OperationLog& operator=(const OperationLog&) = delete;
    OperationLog(OperationLog&&) = delete;
    OperationLog& operator=(OperationLog&&) = delete;

    void add(Operation op);

    // Returns a copy; later appends or removals do not affect it.
    [[nodiscard]] std::vector<Operation> operations(std::string_view resource_type, std::string_view resource_id) const;

    bool remove(std::string_view resource_type, std::string_view resource_id, std::string_view operation_id);

    std::size_t cleanup_older_than(std::chrono::milliseconds max_age);
    std::size_t cleanup_older_than(std::chrono::milliseconds max_age, Timestamp now);

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t resource_count() const;

private:
    mutable std::shared_mutex mutex_{};
    std::unordered_map<std::string, std::vector<Operation>> operations_{};
};

}  // namespace tabula::collab
