#pragma once

#include "Operation.hpp"
#include <string>
#include <vector>
#include <optional>
#include <expected>

namespace darf {

// Фильтры списка операций (пустое поле - без фильтра)
struct OperationFilter {
    std::string assetCode;
    std::optional<AssetType> assetType;

    bool matches(const Operation& operation) const;
};

// ═══════════════════════════════════════════════════════════════════════════════
// ИНТЕРФЕЙС: IOperationStore
// ═══════════════════════════════════════════════════════════════════════════════
//
// Внешний источник операций: движок читает полную историю и добавляет новые
// операции. Порядок списка - порядок добавления (он же разрешает равные даты).

class IOperationStore {
public:
    virtual ~IOperationStore() = default;

    // Возвращает id сохраненной операции. Пустой id генерируется,
    // тикер нормализуется, повторный id - ошибка.
    virtual std::expected<std::string, std::string> add(const Operation& operation) = 0;

    virtual std::expected<std::vector<Operation>, std::string> list(
        const OperationFilter& filter = {}) = 0;

    virtual std::expected<Operation, std::string> get(std::string_view id) = 0;

    // Ошибка, если операции нет
    virtual std::expected<void, std::string> remove(std::string_view id) = 0;

    virtual std::expected<std::size_t, std::string> count() = 0;

    IOperationStore(const IOperationStore&) = delete;
    IOperationStore& operator=(const IOperationStore&) = delete;

protected:
    IOperationStore() = default;
};

}  // namespace darf
