#include "InMemoryOperationStore.hpp"
#include <algorithm>
#include <iterator>

namespace darf {

std::expected<std::string, std::string> InMemoryOperationStore::add(
    const Operation& operation)
{
    std::lock_guard<std::mutex> lock(mutex_);

    Operation stored = operation;
    stored.assetCode = normalizeAssetCode(operation.assetCode);
    if (stored.id.empty()) {
        stored.id = generateOperationId();
    }

    if (index_.count(stored.id)) {
        return std::unexpected("Operation already exists: " + stored.id);
    }

    index_[stored.id] = operations_.size();
    operations_.push_back(stored);

    return stored.id;
}

std::expected<std::vector<Operation>, std::string> InMemoryOperationStore::list(
    const OperationFilter& filter)
{
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<Operation> result;
    std::copy_if(operations_.begin(), operations_.end(), std::back_inserter(result),
        [&filter](const Operation& operation) {
            return filter.matches(operation);
        });

    return result;
}

std::expected<Operation, std::string> InMemoryOperationStore::get(std::string_view id)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = index_.find(id);
    if (it == index_.end()) {
        return std::unexpected("Operation not found: " + std::string(id));
    }

    return operations_[it->second];
}

std::expected<void, std::string> InMemoryOperationStore::remove(std::string_view id)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = index_.find(id);
    if (it == index_.end()) {
        return std::unexpected("Operation not found: " + std::string(id));
    }

    operations_.erase(operations_.begin() + static_cast<std::ptrdiff_t>(it->second));

    // Индексы после удаленной операции сдвигаются
    index_.clear();
    for (std::size_t i = 0; i < operations_.size(); ++i) {
        index_[operations_[i].id] = i;
    }

    return {};
}

std::expected<std::size_t, std::string> InMemoryOperationStore::count()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return operations_.size();
}

}  // namespace darf
