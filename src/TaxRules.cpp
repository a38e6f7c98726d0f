#include "TaxRules.hpp"
#include <boost/program_options.hpp>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <vector>

namespace po = boost::program_options;

namespace darf {

std::string describeLane(const Lane& lane)
{
    return std::string(toString(lane.assetType)) + "/" +
           std::string(toString(lane.tradeCategory));
}

// ═══════════════════════════════════════════════════════════════════════════════
// TaxRules
// ═══════════════════════════════════════════════════════════════════════════════

void TaxRules::setRate(AssetType assetType, TradeCategory category, double rate)
{
    rates_[Lane{assetType, category}] = rate;
}

bool TaxRules::hasRate(AssetType assetType, TradeCategory category) const noexcept
{
    return rates_.count(Lane{assetType, category}) > 0;
}

std::expected<double, EngineError> TaxRules::rate(
    AssetType assetType,
    TradeCategory category) const
{
    auto it = rates_.find(Lane{assetType, category});
    if (it == rates_.end()) {
        return makeError(ErrorCode::ConfigurationError,
            "No tax rate configured for " + describeLane(Lane{assetType, category}));
    }
    return it->second;
}

void TaxRules::setWithholdingRate(TradeCategory category, double rate)
{
    withholdingRates_[category] = rate;
}

double TaxRules::withholdingRate(TradeCategory category) const noexcept
{
    auto it = withholdingRates_.find(category);
    return it == withholdingRates_.end() ? 0.0 : it->second;
}

double TaxRules::estimateWithholding(
    TradeCategory category,
    double proceeds,
    double gainLoss) const noexcept
{
    const double rate = withholdingRate(category);

    if (category == TradeCategory::DayTrade) {
        return gainLoss > 0.0 ? gainLoss * rate : 0.0;
    }
    return proceeds * rate;
}

// ═══════════════════════════════════════════════════════════════════════════════
// TaxRuleSchedule
// ═══════════════════════════════════════════════════════════════════════════════

TaxRuleSchedule TaxRuleSchedule::uniform(TaxRules rules)
{
    TaxRuleSchedule schedule;
    // Минимальный период - действует для любой даты
    schedule.periods_.emplace(YearMonth{0, 1}, std::move(rules));
    return schedule;
}

Result TaxRuleSchedule::addPeriod(const YearMonth& effectiveFrom, TaxRules rules)
{
    if (!effectiveFrom.valid()) {
        return makeError(ErrorCode::ConfigurationError,
            "Invalid effective period: " + formatYearMonth(effectiveFrom));
    }

    auto [it, inserted] = periods_.emplace(effectiveFrom, std::move(rules));
    if (!inserted) {
        return makeError(ErrorCode::ConfigurationError,
            "Duplicate tax rules period: " + formatYearMonth(effectiveFrom));
    }

    return {};
}

std::expected<const TaxRules*, EngineError> TaxRuleSchedule::resolve(
    const YearMonth& period) const
{
    // Первый период строго позже запрошенного, шаг назад - действующий
    auto it = periods_.upper_bound(period);
    if (it == periods_.begin()) {
        return makeError(ErrorCode::ConfigurationError,
            "No tax rules in effect for " + formatYearMonth(period));
    }
    --it;
    return &it->second;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Загрузка конфигурации
// ═══════════════════════════════════════════════════════════════════════════════

namespace {

std::vector<std::string> splitKey(const std::string& key)
{
    std::vector<std::string> parts;
    std::stringstream ss(key);
    std::string part;
    while (std::getline(ss, part, '.')) {
        parts.push_back(part);
    }
    return parts;
}

std::expected<double, EngineError> parseNonNegative(
    const std::string& key,
    const std::string& text)
{
    try {
        std::size_t consumed = 0;
        double value = std::stod(text, &consumed);

        while (consumed < text.size() &&
               std::isspace(static_cast<unsigned char>(text[consumed]))) {
            ++consumed;
        }

        if (consumed != text.size() || !std::isfinite(value) || value < 0.0) {
            return makeError(ErrorCode::ConfigurationError,
                "Invalid value for '" + key + "': " + text);
        }
        return value;
    } catch (const std::exception&) {
        return makeError(ErrorCode::ConfigurationError,
            "Invalid value for '" + key + "': " + text);
    }
}

Result applyRuleKey(
    TaxRules& rules,
    const std::string& fullKey,
    const std::vector<std::string>& keyParts,
    const std::string& valueText)
{
    auto value = parseNonNegative(fullKey, valueText);
    if (!value) {
        return std::unexpected(value.error());
    }

    const auto& kind = keyParts[0];

    if (kind == "rate" && keyParts.size() == 3) {
        auto assetType = parseAssetType(keyParts[1]);
        if (!assetType) {
            return makeError(ErrorCode::ConfigurationError,
                assetType.error() + " in key '" + fullKey + "'");
        }
        auto category = parseTradeCategory(keyParts[2]);
        if (!category) {
            return makeError(ErrorCode::ConfigurationError,
                category.error() + " in key '" + fullKey + "'");
        }
        if (*value > 1.0) {
            return makeError(ErrorCode::ConfigurationError,
                "Rate must be a fraction in [0, 1]: '" + fullKey + "' = " + valueText);
        }
        rules.setRate(*assetType, *category, *value);
        return {};
    }

    if (kind == "exemption" && keyParts.size() == 2 &&
        keyParts[1] == "stock_swing_trade") {
        rules.setStockSwingExemptionThreshold(*value);
        return {};
    }

    if (kind == "withholding" && keyParts.size() == 2) {
        auto category = parseTradeCategory(keyParts[1]);
        if (!category) {
            return makeError(ErrorCode::ConfigurationError,
                category.error() + " in key '" + fullKey + "'");
        }
        if (*value > 1.0) {
            return makeError(ErrorCode::ConfigurationError,
                "Rate must be a fraction in [0, 1]: '" + fullKey + "' = " + valueText);
        }
        rules.setWithholdingRate(*category, *value);
        return {};
    }

    return makeError(ErrorCode::ConfigurationError,
        "Unknown configuration key: '" + fullKey + "'");
}

}  // namespace

std::expected<TaxRuleSchedule, EngineError> TaxRuleSchedule::load(std::istream& input)
{
    // Все ключи "незарегистрированные": имена секций заранее не известны
    po::options_description desc("Tax rules");
    std::vector<po::option> options;

    try {
        options = po::parse_config_file(input, desc, true).options;
    } catch (const po::error& e) {
        return makeError(ErrorCode::ConfigurationError,
            std::string("Tax rules parsing error: ") + e.what());
    }

    // Группируем ключи по периоду, сохраняя порядок файла внутри периода
    std::map<YearMonth, std::vector<std::pair<std::string, std::string>>> sections;

    for (const auto& option : options) {
        const auto& fullKey = option.string_key;
        auto dot = fullKey.find('.');

        if (dot == std::string::npos) {
            return makeError(ErrorCode::ConfigurationError,
                "Key outside of a period section: '" + fullKey + "'");
        }

        auto period = parseYearMonth(fullKey.substr(0, dot));
        if (!period) {
            return makeError(ErrorCode::ConfigurationError,
                "Invalid section name in key '" + fullKey + "': " + period.error());
        }

        if (option.value.empty()) {
            return makeError(ErrorCode::ConfigurationError,
                "Missing value for '" + fullKey + "'");
        }

        sections[*period].emplace_back(fullKey.substr(dot + 1), option.value.front());
    }

    if (sections.empty()) {
        return makeError(ErrorCode::ConfigurationError,
            "Tax rules configuration contains no periods");
    }

    TaxRuleSchedule schedule;
    TaxRules inherited;

    for (const auto& [period, entries] : sections) {
        TaxRules rules = inherited;

        for (const auto& [key, valueText] : entries) {
            auto keyParts = splitKey(key);
            if (keyParts.empty()) {
                return makeError(ErrorCode::ConfigurationError,
                    "Empty configuration key in period " + formatYearMonth(period));
            }

            auto applied = applyRuleKey(rules, formatYearMonth(period) + "." + key,
                                        keyParts, valueText);
            if (!applied) {
                return std::unexpected(applied.error());
            }
        }

        auto added = schedule.addPeriod(period, rules);
        if (!added) {
            return std::unexpected(added.error());
        }
        inherited = std::move(rules);
    }

    return schedule;
}

std::expected<TaxRuleSchedule, EngineError> TaxRuleSchedule::loadFromFile(
    const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file) {
        return makeError(ErrorCode::ConfigurationError,
            "Failed to open tax rules file: " + path.string());
    }

    return load(file);
}

}  // namespace darf
