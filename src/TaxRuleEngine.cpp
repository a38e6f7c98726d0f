#include "TaxRuleEngine.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace darf {

double roundToCents(double amount) noexcept
{
    return std::round(amount * 100.0) / 100.0;
}

// ═══════════════════════════════════════════════════════════════════════════════
// LossCarryState
// ═══════════════════════════════════════════════════════════════════════════════

double LossCarryState::balance(const Lane& lane) const noexcept
{
    auto it = balances_.find(lane);
    return it == balances_.end() ? 0.0 : it->second;
}

void LossCarryState::addLoss(const Lane& lane, double loss)
{
    if (loss <= 0.0) {
        return;
    }
    balances_[lane] += loss;
}

double LossCarryState::consume(const Lane& lane, double upTo)
{
    auto it = balances_.find(lane);
    if (it == balances_.end() || upTo <= 0.0) {
        return 0.0;
    }

    double consumed = std::min(it->second, upTo);
    it->second -= consumed;
    if (it->second < 0.0) {
        it->second = 0.0;
    }
    return consumed;
}

// ═══════════════════════════════════════════════════════════════════════════════
// TaxRuleEngine
// ═══════════════════════════════════════════════════════════════════════════════

TaxRuleEngine::TaxRuleEngine(std::shared_ptr<const TaxRuleSchedule> schedule)
    : schedule_(std::move(schedule))
{
}

std::expected<TaxComputation, EngineError> TaxRuleEngine::computeBucket(
    const MonthlyBucket& bucket,
    const TaxRules& rules,
    LossCarryState& carry)
{
    const Lane lane = bucket.key.lane();

    // Шаг 1: ставка из таблицы, без подстановки нуля
    auto rate = rules.rate(lane.assetType, lane.tradeCategory);
    if (!rate) {
        return std::unexpected(rate.error());
    }

    TaxComputation computation;
    computation.key = bucket.key;
    computation.totalSales = bucket.totalSales;
    computation.netResult = bucket.netResult;
    computation.irRetained = bucket.irRetainedTotal;
    computation.taxRate = *rate;

    // Шаг 2: освобождение - только акции в swing trade. totalSales корзины
    // уже является суммой продаж всех акций за месяц.
    bool exempt = false;
    if (lane.assetType == AssetType::Stock &&
        lane.tradeCategory == TradeCategory::SwingTrade) {

        auto threshold = rules.stockSwingExemptionThreshold();
        if (!threshold) {
            return makeError(ErrorCode::ConfigurationError,
                "No stock swing trade exemption threshold configured for " +
                formatYearMonth(bucket.key.period));
        }

        exempt = bucket.netResult > 0.0 &&
                 roundToCents(bucket.totalSales) <= roundToCents(*threshold);
    }

    if (exempt) {
        // Освобождение снимает налог с прибыли, убытки линии не трогает
        computation.exemptionApplied = true;
        computation.taxRate = 0.0;
        computation.taxableProfit = 0.0;
    } else if (bucket.netResult > 0.0) {
        // Шаг 3: зачет убытков прошлых месяцев
        computation.lossCarryConsumed = carry.consume(lane, bucket.netResult);
        computation.taxableProfit =
            std::max(0.0, bucket.netResult - computation.lossCarryConsumed);
    } else if (bucket.netResult < 0.0) {
        // Шаг 4: убыток переносится на следующие месяцы линии
        carry.addLoss(lane, -bucket.netResult);
        computation.taxableProfit = 0.0;
    }

    // Шаги 5-6: налог и зачет удержанного у источника
    computation.taxDue = computation.taxableProfit * computation.taxRate;
    computation.netTaxDue = std::max(0.0, computation.taxDue - computation.irRetained);
    computation.lossCarryRemaining = carry.balance(lane);

    return computation;
}

std::expected<TaxComputationSet, EngineError> TaxRuleEngine::computeTaxes(
    const std::vector<MonthlyBucket>& buckets,
    LossCarryState initialCarry) const
{
    if (!schedule_) {
        return makeError(ErrorCode::ConfigurationError, "Tax rule schedule is not set");
    }

    // Раскладываем корзины по линиям, проверяя хронологию внутри линии
    std::map<Lane, std::vector<std::size_t>> lanes;
    std::map<Lane, YearMonth> lastPeriod;

    for (std::size_t i = 0; i < buckets.size(); ++i) {
        const auto& key = buckets[i].key;
        const Lane lane = key.lane();

        auto last = lastPeriod.find(lane);
        if (last != lastPeriod.end() && !(last->second < key.period)) {
            return makeError(ErrorCode::OrderingViolation,
                "Lane " + describeLane(lane) + ": month " +
                formatYearMonth(key.period) + " processed after " +
                formatYearMonth(last->second));
        }
        lastPeriod[lane] = key.period;
        lanes[lane].push_back(i);
    }

    TaxComputationSet result;
    result.computations.resize(buckets.size());
    LossCarryState carry = std::move(initialCarry);

    // Свертка по каждой линии, месяцы по возрастанию
    for (const auto& [lane, indices] : lanes) {
        for (std::size_t index : indices) {
            const auto& bucket = buckets[index];

            auto rules = schedule_->resolve(bucket.key.period);
            if (!rules) {
                return std::unexpected(rules.error());
            }

            auto computation = computeBucket(bucket, **rules, carry);
            if (!computation) {
                return std::unexpected(computation.error());
            }
            result.computations[index] = std::move(*computation);
        }
    }

    result.finalCarry = std::move(carry);
    return result;
}

}  // namespace darf
