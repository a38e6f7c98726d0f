#pragma once

#include "TaxRuleEngine.hpp"
#include <memory>
#include <vector>
#include <expected>

namespace darf {

// Итог DARF за месяц
struct DarfReport {
    YearMonth period;
    std::vector<TaxComputation> items;
    double totalDue = 0.0;   // сумма netTaxDue по корзинам

    bool empty() const noexcept { return items.empty(); }
};

// ═══════════════════════════════════════════════════════════════════════════════
// DarfReporter - запросы к опубликованным (неизменяемым) расчетам
// ═══════════════════════════════════════════════════════════════════════════════
//
// Только чтение: можно вызывать повторно и из нескольких потоков.

class DarfReporter {
public:
    explicit DarfReporter(
        std::shared_ptr<const std::vector<TaxComputation>> computations = nullptr);

    // Месяц без корзин - пустой отчет с нулевым итогом.
    // ValidationError, если месяц вне 1..12.
    std::expected<DarfReport, EngineError> query(int year, int month) const;

    // Отчеты по месяцам года, в которых есть расчеты
    std::vector<DarfReport> queryYear(int year) const;

    // Все периоды с расчетами, по возрастанию
    std::vector<YearMonth> months() const;

private:
    std::shared_ptr<const std::vector<TaxComputation>> computations_;

    DarfReport collect(const YearMonth& period) const;
};

}  // namespace darf
