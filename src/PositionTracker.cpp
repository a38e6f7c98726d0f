#include "PositionTracker.hpp"
#include <algorithm>
#include <sstream>
#include <utility>

namespace darf {

PositionTracker::PositionTracker(std::shared_ptr<const TaxRuleSchedule> withholdingSchedule)
    : withholdingSchedule_(std::move(withholdingSchedule))
{
}

// ═══════════════════════════════════════════════════════════════════════════════
// Покупка
// ═══════════════════════════════════════════════════════════════════════════════

Result PositionTracker::applyBuy(Position& position, const Operation& operation)
{
    if (operation.quantity <= 0.0) {
        return makeError(ErrorCode::ValidationError,
            "Buy quantity must be positive", operation.id);
    }

    const double newQuantity = position.heldQuantity + operation.quantity;

    // Комиссии уже внутри totalCost
    position.averageUnitCost =
        (position.heldQuantity * position.averageUnitCost + operation.totalCost) / newQuantity;
    position.heldQuantity = newQuantity;
    position.totalInvested += operation.totalCost;

    return {};
}

// ═══════════════════════════════════════════════════════════════════════════════
// Продажа
// ═══════════════════════════════════════════════════════════════════════════════

std::expected<RealizedResult, EngineError> PositionTracker::applySell(
    Position& position,
    const Operation& operation)
{
    if (operation.quantity <= 0.0) {
        return makeError(ErrorCode::ValidationError,
            "Sell quantity must be positive", operation.id);
    }

    if (operation.quantity > position.heldQuantity + kQuantityTolerance) {
        std::ostringstream oss;
        oss << "Cannot sell " << operation.quantity << " of " << operation.assetCode
            << " on " << formatDate(operation.operationDate)
            << ": only " << position.heldQuantity << " held";
        return makeError(ErrorCode::InsufficientPosition, oss.str(), operation.id);
    }

    RealizedResult result;
    result.operationId = operation.id;
    result.assetCode = operation.assetCode;
    result.assetType = operation.assetType;
    result.tradeCategory = operation.tradeCategory;
    result.operationDate = operation.operationDate;
    result.quantity = operation.quantity;
    result.proceeds = operation.proceeds();
    result.costBasisConsumed = operation.quantity * position.averageUnitCost;
    result.gainLoss = result.proceeds - result.costBasisConsumed;
    result.irRetained = operation.irRetained.value_or(0.0);

    // Средняя цена остатка при продаже не меняется
    position.heldQuantity -= operation.quantity;
    if (position.heldQuantity < kQuantityTolerance) {
        position.heldQuantity = 0.0;
    }
    position.realizedGainLoss += result.gainLoss;

    return result;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Полный пересчет
// ═══════════════════════════════════════════════════════════════════════════════

std::expected<RecomputeResult, EngineError> PositionTracker::recompute(
    const std::vector<Operation>& operations) const
{
    RecomputeResult result;

    // Шаг 1: валидация (отклоненные попадают в отчет)
    auto valid = filterValidOperations(operations, result.rejected);

    // Шаг 2: стабильная сортировка по дате - при равных датах
    // сохраняется порядок добавления
    std::stable_sort(valid.begin(), valid.end(),
        [](const Operation& a, const Operation& b) {
            return a.operationDate < b.operationDate;
        });

    // Шаг 3: проигрывание
    for (const auto& operation : valid) {
        if (operation.isBuy()) {
            auto [it, created] = result.positions.try_emplace(operation.assetCode);
            if (created) {
                it->second.assetCode = operation.assetCode;
                it->second.assetType = operation.assetType;
            }

            auto applied = applyBuy(it->second, operation);
            if (!applied) {
                return std::unexpected(applied.error());
            }
            continue;
        }

        auto it = result.positions.find(operation.assetCode);
        if (it == result.positions.end()) {
            return makeError(ErrorCode::InsufficientPosition,
                "Cannot sell " + operation.assetCode + " on " +
                formatDate(operation.operationDate) + ": no position held",
                operation.id);
        }

        auto realized = applySell(it->second, operation);
        if (!realized) {
            return std::unexpected(realized.error());
        }

        if (!operation.irRetained) {
            auto withheld = resolveWithholding(operation, *realized);
            if (!withheld) {
                return std::unexpected(withheld.error());
            }
            realized->irRetained = *withheld;
        }

        result.realized.push_back(std::move(*realized));
    }

    return result;
}

std::expected<double, EngineError> PositionTracker::resolveWithholding(
    const Operation& operation,
    const RealizedResult& realized) const
{
    if (!withholdingSchedule_) {
        return 0.0;
    }

    auto rules = withholdingSchedule_->resolve(operation.operationDate);
    if (!rules) {
        EngineError error = rules.error();
        error.operationId = operation.id;
        return std::unexpected(std::move(error));
    }

    return (*rules)->estimateWithholding(
        operation.tradeCategory, realized.proceeds, realized.gainLoss);
}

}  // namespace darf
