#pragma once

#include "PositionTracker.hpp"
#include "TaxRules.hpp"
#include <vector>

namespace darf {

struct BucketKey {
    YearMonth period;
    AssetType assetType = AssetType::Stock;
    TradeCategory tradeCategory = TradeCategory::SwingTrade;

    Lane lane() const noexcept { return Lane{assetType, tradeCategory}; }

    auto operator<=>(const BucketKey&) const = default;
};

// Итоги продаж за месяц по (тип актива, категория сделки).
// Месяцы без продаж не материализуются.
struct MonthlyBucket {
    BucketKey key;
    double totalSales = 0.0;        // сумма выручки
    double netResult = 0.0;         // сумма результатов
    double irRetainedTotal = 0.0;   // сумма удержанного налога
    std::size_t sellCount = 0;

    int year() const noexcept { return key.period.year; }
    int month() const noexcept { return key.period.month; }
    AssetType assetType() const noexcept { return key.assetType; }
    TradeCategory tradeCategory() const noexcept { return key.tradeCategory; }
};

class MonthlyAggregator {
public:
    // Результат упорядочен по (год, месяц, тип актива, категория)
    static std::vector<MonthlyBucket> aggregate(const std::vector<RealizedResult>& realized);
};

}  // namespace darf
