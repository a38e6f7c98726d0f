#pragma once

#include "IOperationStore.hpp"
#include <map>
#include <mutex>
#include <vector>

namespace darf {

// ═══════════════════════════════════════════════════════════════════════════════
// Реализация: InMemoryOperationStore
// ═══════════════════════════════════════════════════════════════════════════════

class InMemoryOperationStore : public IOperationStore {
public:
    InMemoryOperationStore() = default;
    ~InMemoryOperationStore() override = default;

    std::expected<std::string, std::string> add(const Operation& operation) override;

    std::expected<std::vector<Operation>, std::string> list(
        const OperationFilter& filter = {}) override;

    std::expected<Operation, std::string> get(std::string_view id) override;

    std::expected<void, std::string> remove(std::string_view id) override;

    std::expected<std::size_t, std::string> count() override;

private:
    mutable std::mutex mutex_;

    // Операции в порядке добавления
    std::vector<Operation> operations_;

    // id -> индекс в operations_
    std::map<std::string, std::size_t, std::less<>> index_;
};

}  // namespace darf
