#pragma once

#include "Operation.hpp"
#include "EngineError.hpp"
#include <vector>

namespace darf {

// ═══════════════════════════════════════════════════════════════════════════════
// Проверка операций до попадания в журнал позиций
// ═══════════════════════════════════════════════════════════════════════════════

// Отчет по отклоненным операциям одного пересчета.
// Отклоненные операции исключаются, остальные пересчитываются.
struct ValidationReport {
    std::vector<EngineError> rejected;

    bool empty() const noexcept { return rejected.empty(); }
    std::size_t size() const noexcept { return rejected.size(); }
};

// Возвращает ValidationError с описанием первой найденной проблемы
Result validateOperation(const Operation& operation);

// Делит набор на валидные операции (порядок сохраняется, тикеры
// нормализуются) и отчет
std::vector<Operation> filterValidOperations(
    const std::vector<Operation>& operations,
    ValidationReport& report);

}  // namespace darf
