#pragma once

#include "PositionTracker.hpp"
#include <map>
#include <string>

namespace darf {

// Сводка по портфелю. Рыночных цен у движка нет, поэтому открытые
// позиции оцениваются по средней стоимости и нереализованного результата
// не имеют.
struct PortfolioSummary {
    double totalInvested = 0.0;        // сумма totalCost всех покупок
    double totalCurrentValue = 0.0;    // открытые позиции по стоимости
    double totalProfitLoss = 0.0;      // сумма реализованных результатов
    double profitLossPercentage = 0.0; // от totalInvested, 0 если вложений нет
    std::size_t openPositions = 0;

    // Тикер -> стоимость, только открытые позиции
    std::map<std::string, double> assetsDistribution;
};

PortfolioSummary summarizePortfolio(const RecomputeResult& recomputed);

}  // namespace darf
