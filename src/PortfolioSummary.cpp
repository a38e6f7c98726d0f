#include "PortfolioSummary.hpp"

namespace darf {

PortfolioSummary summarizePortfolio(const RecomputeResult& recomputed)
{
    PortfolioSummary summary;

    for (const auto& [code, position] : recomputed.positions) {
        summary.totalInvested += position.totalInvested;
        summary.totalProfitLoss += position.realizedGainLoss;

        if (position.isOpen()) {
            const double value = position.costValue();
            summary.totalCurrentValue += value;
            summary.assetsDistribution[code] = value;
            ++summary.openPositions;
        }
    }

    if (summary.totalInvested > 0.0) {
        summary.profitLossPercentage =
            summary.totalProfitLoss / summary.totalInvested * 100.0;
    }

    return summary;
}

}  // namespace darf
