#include "tabula/collab/operation_log.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

namespace tabula::collab {

void OperationLog::add(Operation op)
{
    auto key = make_resource_key(op.resource_type, op.resource_id);
    std::unique_lock lock{mutex_};
    operations_[std::move(key)].push_back(std::move(op));
}

std::vector<Operation> OperationLog::operations(std::string_view resource_type, std::string_view resource_id) const
{
    const auto key = make_resource_key(resource_type, resource_id);
    std::shared_lock lock{mutex_};
    auto it = operations_.find(key);
    if (it == operations_.end()) {
        return {};
    }
    return it->second;
}

bool OperationLog::remove(std::string_view resource_type, std::string_view resource_id, std::string_view operation_id)
{
    const auto key = make_resource_key(resource_type, resource_id);
    std::unique_lock lock{mutex_};
    auto it = operations_.find(key);
    if (it == operations_.end()) {
        return false;
    }

    auto& entries = it->second;
    auto op_it = std::find_if(entries.begin(), entries.end(), [operation_id](const Operation& op) {
        return op.id == operation_id;
    });
    if (op_it == entries.end()) {
        return false;
    }

    entries.erase(op_it);
    if (entries.empty()) {
        operations_.erase(it);
    }
    return true;
}

std::size_t OperationLog::cleanup_older_than(std::chrono::milliseconds max_age)
{
    return cleanup_older_than(max_age, Clock::now());
}

std::size_t OperationLog::cleanup_older_than(std::chrono::milliseconds max_age, Timestamp now)
{
    const auto cutoff = saturating_sub(now, max_age);
    std::unique_lock lock{mutex_};
    std::size_t dropped = 0U;
    for (auto it = operations_.begin(); it != operations_.end();) {
        auto& entries = it->second;
        const auto before = entries.size();
        entries.erase(std::remove_if(entries.begin(), entries.end(), [cutoff](const Operation& op) {
                          return op.timestamp < cutoff;
                      }),
                      entries.end());
        dropped += before - entries.size();
        if (entries.empty()) {
            it = operations_.erase(it);
        } else {
            ++it;
        }
    }
    return dropped;
}

std::size_t OperationLog::size() const
{
    std::shared_lock lock{mutex_};
    std::size_t total = 0U;
    for (const auto& entry : operations_) {
        total += entry.second.size();
    }
    return total;
}

std::size_t OperationLog::resource_count() const
{
    std::shared_lock lock{mutex_};
    return operations_.size();
}

}  // namespace tabula::collab
