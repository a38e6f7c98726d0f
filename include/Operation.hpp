#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <expected>
#include <chrono>
#include <compare>

namespace darf {

using Date = std::chrono::year_month_day;

// ═══════════════════════════════════════════════════════════════════════════════
// Перечисления предметной области
// ═══════════════════════════════════════════════════════════════════════════════

enum class AssetType {
    Stock,              // acao
    Etf,                // etf
    RealEstateFund,     // fii
    DepositaryReceipt,  // bdr
    Option,             // opcao
    Crypto              // cripto
};

enum class TradeCategory {
    SwingTrade,
    DayTrade
};

enum class OperationType {
    Buy,    // compra
    Sell    // venda
};

inline constexpr AssetType kAllAssetTypes[] = {
    AssetType::Stock,
    AssetType::Etf,
    AssetType::RealEstateFund,
    AssetType::DepositaryReceipt,
    AssetType::Option,
    AssetType::Crypto
};

inline constexpr TradeCategory kAllTradeCategories[] = {
    TradeCategory::SwingTrade,
    TradeCategory::DayTrade
};

// Каноническое написание совпадает с API брокерского трекера (acao, fii, ...)
std::string_view toString(AssetType type) noexcept;
std::string_view toString(TradeCategory category) noexcept;
std::string_view toString(OperationType type) noexcept;

// Принимают и португальское, и английское написание, без учета регистра
std::expected<AssetType, std::string> parseAssetType(std::string_view text);
std::expected<TradeCategory, std::string> parseTradeCategory(std::string_view text);
std::expected<OperationType, std::string> parseOperationType(std::string_view text);

// ═══════════════════════════════════════════════════════════════════════════════
// Даты
// ═══════════════════════════════════════════════════════════════════════════════

// Формат YYYY-MM-DD
std::expected<Date, std::string> parseDate(std::string_view text);
std::string formatDate(const Date& date);

inline int yearOf(const Date& date) noexcept {
    return static_cast<int>(date.year());
}

inline int monthOf(const Date& date) noexcept {
    return static_cast<int>(static_cast<unsigned>(date.month()));
}

// Календарный месяц - единица налогового периода
struct YearMonth {
    int year = 0;
    int month = 0;

    static YearMonth of(const Date& date) noexcept {
        return YearMonth{yearOf(date), monthOf(date)};
    }

    bool valid() const noexcept { return month >= 1 && month <= 12; }

    auto operator<=>(const YearMonth&) const = default;
};

// Формат YYYY-MM
std::expected<YearMonth, std::string> parseYearMonth(std::string_view text);
std::string formatYearMonth(const YearMonth& period);

// Тикер без пробелов по краям, в верхнем регистре
std::string normalizeAssetCode(std::string_view code);

// Случайный UUID v4 для новых операций
std::string generateOperationId();

// ═══════════════════════════════════════════════════════════════════════════════
// Operation - неизменяемая запись о сделке
// ═══════════════════════════════════════════════════════════════════════════════

struct Operation {
    std::string id;
    std::string assetCode;
    AssetType assetType = AssetType::Stock;
    TradeCategory tradeCategory = TradeCategory::SwingTrade;
    OperationType operationType = OperationType::Buy;
    double quantity = 0.0;
    double unitPrice = 0.0;

    // Для покупки включает комиссии и формирует базу стоимости.
    // Для продажи выручка всегда quantity * unitPrice.
    double totalCost = 0.0;

    Date operationDate{};

    // Удержанный у источника налог по продаже, если брокер его сообщил.
    // Без значения налог оценивается по ставкам удержания из конфигурации.
    std::optional<double> irRetained;

    bool isBuy() const noexcept { return operationType == OperationType::Buy; }
    bool isSell() const noexcept { return operationType == OperationType::Sell; }

    // Выручка продажи (для покупки тоже считается, но не используется)
    double proceeds() const noexcept { return quantity * unitPrice; }
};

}  // namespace darf
