#include "Operation.hpp"
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <ctime>
#include <stdexcept>

namespace darf {

namespace {

// Нижний регистр, '-' и ' ' заменяются на '_'
std::string normalizeToken(std::string_view text)
{
    std::string result;
    result.reserve(text.size());

    for (char c : text) {
        if (c == '-' || c == ' ') {
            result.push_back('_');
        } else {
            result.push_back(static_cast<char>(
                std::tolower(static_cast<unsigned char>(c))));
        }
    }

    // Обрезаем '_' по краям (остатки пробелов)
    auto first = result.find_first_not_of('_');
    if (first == std::string::npos) {
        return {};
    }
    auto last = result.find_last_not_of('_');
    return result.substr(first, last - first + 1);
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Строковые представления
// ═══════════════════════════════════════════════════════════════════════════════

std::string_view toString(AssetType type) noexcept
{
    switch (type) {
        case AssetType::Stock:             return "acao";
        case AssetType::Etf:               return "etf";
        case AssetType::RealEstateFund:    return "fii";
        case AssetType::DepositaryReceipt: return "bdr";
        case AssetType::Option:            return "opcao";
        case AssetType::Crypto:            return "cripto";
    }
    return "unknown";
}

std::string_view toString(TradeCategory category) noexcept
{
    switch (category) {
        case TradeCategory::SwingTrade: return "swing_trade";
        case TradeCategory::DayTrade:   return "day_trade";
    }
    return "unknown";
}

std::string_view toString(OperationType type) noexcept
{
    switch (type) {
        case OperationType::Buy:  return "compra";
        case OperationType::Sell: return "venda";
    }
    return "unknown";
}

// ═══════════════════════════════════════════════════════════════════════════════
// Разбор перечислений
// ═══════════════════════════════════════════════════════════════════════════════

std::expected<AssetType, std::string> parseAssetType(std::string_view text)
{
    const std::string token = normalizeToken(text);

    if (token == "acao" || token == "stock") {
        return AssetType::Stock;
    }
    if (token == "etf") {
        return AssetType::Etf;
    }
    if (token == "fii" || token == "real_estate_fund") {
        return AssetType::RealEstateFund;
    }
    if (token == "bdr" || token == "depositary_receipt") {
        return AssetType::DepositaryReceipt;
    }
    if (token == "opcao" || token == "option") {
        return AssetType::Option;
    }
    if (token == "cripto" || token == "crypto") {
        return AssetType::Crypto;
    }

    return std::unexpected("Unknown asset type: '" + std::string(text) + "'");
}

std::expected<TradeCategory, std::string> parseTradeCategory(std::string_view text)
{
    const std::string token = normalizeToken(text);

    if (token == "swing_trade" || token == "swing") {
        return TradeCategory::SwingTrade;
    }
    if (token == "day_trade" || token == "day") {
        return TradeCategory::DayTrade;
    }

    return std::unexpected("Unknown trade category: '" + std::string(text) + "'");
}

std::expected<OperationType, std::string> parseOperationType(std::string_view text)
{
    const std::string token = normalizeToken(text);

    if (token == "compra" || token == "buy") {
        return OperationType::Buy;
    }
    if (token == "venda" || token == "sell") {
        return OperationType::Sell;
    }

    return std::unexpected("Unknown operation type: '" + std::string(text) + "'");
}

// ═══════════════════════════════════════════════════════════════════════════════
// Даты
// ═══════════════════════════════════════════════════════════════════════════════

std::expected<Date, std::string> parseDate(std::string_view text)
{
    // Строго YYYY-MM-DD: get_time принимает и "2024-5-2"
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::unexpected("Failed to parse date: " + std::string(text) +
                               ". Expected format: YYYY-MM-DD");
    }

    std::tm tm = {};
    std::istringstream ss{std::string(text)};
    ss >> std::get_time(&tm, "%Y-%m-%d");

    if (ss.fail() || ss.peek() != std::char_traits<char>::eof()) {
        return std::unexpected("Failed to parse date: " + std::string(text) +
                               ". Expected format: YYYY-MM-DD");
    }

    Date date{
        std::chrono::year{tm.tm_year + 1900},
        std::chrono::month{static_cast<unsigned>(tm.tm_mon + 1)},
        std::chrono::day{static_cast<unsigned>(tm.tm_mday)}};

    if (!date.ok()) {
        return std::unexpected("Invalid calendar date: " + std::string(text));
    }

    return date;
}

std::string formatDate(const Date& date)
{
    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << static_cast<int>(date.year()) << '-'
        << std::setw(2) << static_cast<unsigned>(date.month()) << '-'
        << std::setw(2) << static_cast<unsigned>(date.day());
    return oss.str();
}

std::expected<YearMonth, std::string> parseYearMonth(std::string_view text)
{
    auto dash = text.find('-');
    if (dash == std::string_view::npos || dash == 0 || dash + 1 >= text.size()) {
        return std::unexpected("Failed to parse period: " + std::string(text) +
                               ". Expected format: YYYY-MM");
    }

    YearMonth period;
    try {
        std::size_t yearDigits = 0;
        std::size_t monthDigits = 0;
        period.year = std::stoi(std::string(text.substr(0, dash)), &yearDigits);
        period.month = std::stoi(std::string(text.substr(dash + 1)), &monthDigits);

        if (yearDigits != dash || monthDigits != text.size() - dash - 1) {
            return std::unexpected("Failed to parse period: " + std::string(text) +
                                   ". Expected format: YYYY-MM");
        }
    } catch (const std::exception&) {
        return std::unexpected("Failed to parse period: " + std::string(text) +
                               ". Expected format: YYYY-MM");
    }

    if (!period.valid()) {
        return std::unexpected("Month out of range in period: " + std::string(text));
    }

    return period;
}

std::string formatYearMonth(const YearMonth& period)
{
    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << period.year << '-'
        << std::setw(2) << period.month;
    return oss.str();
}

std::string normalizeAssetCode(std::string_view code)
{
    auto first = code.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = code.find_last_not_of(" \t");

    std::string result(code.substr(first, last - first + 1));
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

std::string generateOperationId()
{
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

}  // namespace darf
