#pragma once

#include "Operation.hpp"
#include "EngineError.hpp"
#include "OperationValidator.hpp"
#include "TaxRules.hpp"
#include <map>
#include <memory>
#include <vector>
#include <expected>

namespace darf {

// ═══════════════════════════════════════════════════════════════════════════════
// Структуры данных
// ═══════════════════════════════════════════════════════════════════════════════

// Позиция по одному тикеру. Создается при первой покупке, не удаляется,
// может оставаться с нулевым количеством.
struct Position {
    std::string assetCode;
    AssetType assetType = AssetType::Stock;
    double heldQuantity = 0.0;
    double averageUnitCost = 0.0;

    // Для сводки по портфелю
    double totalInvested = 0.0;     // сумма totalCost всех покупок
    double realizedGainLoss = 0.0;  // сумма результатов всех продаж

    bool isOpen() const noexcept { return heldQuantity > 0.0; }
    double costValue() const noexcept { return heldQuantity * averageUnitCost; }
};

// Результат одной продажи
struct RealizedResult {
    std::string operationId;
    std::string assetCode;
    AssetType assetType = AssetType::Stock;
    TradeCategory tradeCategory = TradeCategory::SwingTrade;
    Date operationDate{};
    double quantity = 0.0;
    double proceeds = 0.0;
    double costBasisConsumed = 0.0;
    double gainLoss = 0.0;
    double irRetained = 0.0;
};

struct RecomputeResult {
    std::map<std::string, Position> positions;
    std::vector<RealizedResult> realized;   // в порядке обработки
    ValidationReport rejected;
};

// ═══════════════════════════════════════════════════════════════════════════════
// PositionTracker - средневзвешенная стоимость по тикеру
// ═══════════════════════════════════════════════════════════════════════════════
//
// Пересчет всегда полный: позиции строятся заново из всей истории операций,
// между вызовами recompute состояние не сохраняется.

class PositionTracker {
public:
    // withholdingSchedule нужен только для оценки удержанного налога по
    // продажам без сообщенного брокером значения; nullptr - считать нулем
    explicit PositionTracker(
        std::shared_ptr<const TaxRuleSchedule> withholdingSchedule = nullptr);

    // Допуск при сравнении дробных количеств
    static constexpr double kQuantityTolerance = 1e-9;

    static Result applyBuy(Position& position, const Operation& operation);

    // InsufficientPosition при продаже сверх позиции (шорт не моделируется)
    static std::expected<RealizedResult, EngineError> applySell(
        Position& position,
        const Operation& operation);

    // Валидация, стабильная сортировка по дате, проигрывание.
    // Невалидные операции исключаются и попадают в отчет,
    // InsufficientPosition прерывает весь пересчет.
    std::expected<RecomputeResult, EngineError> recompute(
        const std::vector<Operation>& operations) const;

private:
    std::shared_ptr<const TaxRuleSchedule> withholdingSchedule_;

    std::expected<double, EngineError> resolveWithholding(
        const Operation& operation,
        const RealizedResult& realized) const;
};

}  // namespace darf
