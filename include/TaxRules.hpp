#pragma once

#include "Operation.hpp"
#include "EngineError.hpp"
#include <map>
#include <optional>
#include <expected>
#include <filesystem>
#include <istream>

namespace darf {

// Линия учета убытков: (тип актива, категория сделки)
struct Lane {
    AssetType assetType = AssetType::Stock;
    TradeCategory tradeCategory = TradeCategory::SwingTrade;

    auto operator<=>(const Lane&) const = default;
};

std::string describeLane(const Lane& lane);

// ═══════════════════════════════════════════════════════════════════════════════
// TaxRules - налоговые параметры одного периода действия
// ═══════════════════════════════════════════════════════════════════════════════

// В коде нет ни одной ставки: все значения приходят из конфигурации,
// чтобы изменения законодательства не требовали правки кода.
class TaxRules {
public:
    TaxRules() = default;

    // Таблица ставок (доля, 0.15 = 15%)
    void setRate(AssetType assetType, TradeCategory category, double rate);
    bool hasRate(AssetType assetType, TradeCategory category) const noexcept;

    // ConfigurationError, если ставка не задана. Ноль не подставляется.
    std::expected<double, EngineError> rate(
        AssetType assetType,
        TradeCategory category) const;

    const std::map<Lane, double>& rates() const noexcept { return rates_; }

    // Месячный лимит продаж акций в swing trade для освобождения
    void setStockSwingExemptionThreshold(double threshold) noexcept {
        stockSwingExemptionThreshold_ = threshold;
    }

    std::optional<double> stockSwingExemptionThreshold() const noexcept {
        return stockSwingExemptionThreshold_;
    }

    // Ставки удержания у источника ("dedo-duro"):
    // day trade - доля положительного результата, swing trade - доля выручки.
    // Используются только если брокер не сообщил удержанную сумму.
    void setWithholdingRate(TradeCategory category, double rate);
    double withholdingRate(TradeCategory category) const noexcept;

    double estimateWithholding(
        TradeCategory category,
        double proceeds,
        double gainLoss) const noexcept;

private:
    std::map<Lane, double> rates_;
    std::optional<double> stockSwingExemptionThreshold_;
    std::map<TradeCategory, double> withholdingRates_;
};

// ═══════════════════════════════════════════════════════════════════════════════
// TaxRuleSchedule - правила, привязанные к дате начала действия
// ═══════════════════════════════════════════════════════════════════════════════

class TaxRuleSchedule {
public:
    TaxRuleSchedule() = default;

    // Один набор правил на все периоды
    static TaxRuleSchedule uniform(TaxRules rules);

    // ConfigurationError при повторном периоде
    Result addPeriod(const YearMonth& effectiveFrom, TaxRules rules);

    // Последний набор правил, вступивший в силу не позже period
    std::expected<const TaxRules*, EngineError> resolve(const YearMonth& period) const;
    std::expected<const TaxRules*, EngineError> resolve(const Date& date) const {
        return resolve(YearMonth::of(date));
    }

    bool empty() const noexcept { return periods_.empty(); }
    std::size_t size() const noexcept { return periods_.size(); }
    const std::map<YearMonth, TaxRules>& periods() const noexcept { return periods_; }

    // ───────────────────────────────────────────────────────────────────────────
    // Загрузка из INI-файла (boost::program_options)
    // ───────────────────────────────────────────────────────────────────────────
    //
    //   [2016-01]
    //   rate.acao.swing_trade = 0.15
    //   rate.acao.day_trade = 0.20
    //   exemption.stock_swing_trade = 20000
    //   withholding.day_trade = 0.01
    //
    // Секция - месяц вступления в силу. Период наследует ставки
    // предыдущего периода и переопределяет только указанные ключи.

    static std::expected<TaxRuleSchedule, EngineError> load(std::istream& input);
    static std::expected<TaxRuleSchedule, EngineError> loadFromFile(
        const std::filesystem::path& path);

private:
    std::map<YearMonth, TaxRules> periods_;
};

}  // namespace darf
