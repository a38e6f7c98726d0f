#pragma once

#include "MonthlyAggregator.hpp"
#include "TaxRules.hpp"
#include "EngineError.hpp"
#include <map>
#include <memory>
#include <vector>
#include <expected>

namespace darf {

// ═══════════════════════════════════════════════════════════════════════════════
// Структуры данных
// ═══════════════════════════════════════════════════════════════════════════════

struct TaxComputation {
    BucketKey key;
    double totalSales = 0.0;
    double netResult = 0.0;
    double taxableProfit = 0.0;
    double taxRate = 0.0;
    double taxDue = 0.0;
    double irRetained = 0.0;
    double netTaxDue = 0.0;
    bool exemptionApplied = false;

    // Аудит переноса убытков
    double lossCarryConsumed = 0.0;
    double lossCarryRemaining = 0.0;   // остаток линии после этого месяца

    int year() const noexcept { return key.period.year; }
    int month() const noexcept { return key.period.month; }
    AssetType assetType() const noexcept { return key.assetType; }
    TradeCategory tradeCategory() const noexcept { return key.tradeCategory; }
};

// Непокрытые убытки прошлых месяцев по линиям.
// Никогда не отрицательны, растут только от убыточных месяцев.
class LossCarryState {
public:
    double balance(const Lane& lane) const noexcept;

    void addLoss(const Lane& lane, double loss);

    // Списывает не больше upTo, возвращает списанное
    double consume(const Lane& lane, double upTo);

private:
    std::map<Lane, double> balances_;
};

struct TaxComputationSet {
    std::vector<TaxComputation> computations;   // в порядке входных корзин
    LossCarryState finalCarry;
};

// ═══════════════════════════════════════════════════════════════════════════════
// TaxRuleEngine - свертка месяцев по линиям с явным аккумулятором убытков
// ═══════════════════════════════════════════════════════════════════════════════

class TaxRuleEngine {
public:
    explicit TaxRuleEngine(std::shared_ptr<const TaxRuleSchedule> schedule);

    // Один шаг свертки: правила месяца применяются к корзине,
    // carry читается и изменяется только для линии корзины
    static std::expected<TaxComputation, EngineError> computeBucket(
        const MonthlyBucket& bucket,
        const TaxRules& rules,
        LossCarryState& carry);

    // Месяцы каждой линии должны идти строго по возрастанию,
    // иначе OrderingViolation. initialCarry - убытки до первого месяца.
    std::expected<TaxComputationSet, EngineError> computeTaxes(
        const std::vector<MonthlyBucket>& buckets,
        LossCarryState initialCarry = {}) const;

private:
    std::shared_ptr<const TaxRuleSchedule> schedule_;
};

// Сравнение сумм с точностью до сентаво
double roundToCents(double amount) noexcept;

}  // namespace darf
