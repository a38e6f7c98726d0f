#include <gtest/gtest.h>
#include "TaxRules.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace darf;

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Таблица ставок
// ═══════════════════════════════════════════════════════════════════════════════

TEST(TaxRulesTest, RateLookup) {
    TaxRules rules;
    rules.setRate(AssetType::Stock, TradeCategory::SwingTrade, 0.15);
    rules.setRate(AssetType::Stock, TradeCategory::DayTrade, 0.20);

    EXPECT_TRUE(rules.hasRate(AssetType::Stock, TradeCategory::SwingTrade));
    EXPECT_DOUBLE_EQ(rules.rate(AssetType::Stock, TradeCategory::SwingTrade).value(), 0.15);
    EXPECT_DOUBLE_EQ(rules.rate(AssetType::Stock, TradeCategory::DayTrade).value(), 0.20);
    EXPECT_EQ(rules.rates().size(), 2u);
}

TEST(TaxRulesTest, MissingRateIsConfigurationError) {
    TaxRules rules;
    rules.setRate(AssetType::Stock, TradeCategory::SwingTrade, 0.15);

    auto rate = rules.rate(AssetType::Crypto, TradeCategory::DayTrade);
    ASSERT_FALSE(rate.has_value());
    EXPECT_EQ(rate.error().code, ErrorCode::ConfigurationError);
    EXPECT_NE(rate.error().message.find("cripto/day_trade"), std::string::npos);
}

TEST(TaxRulesTest, ExemptionThresholdOptional) {
    TaxRules rules;
    EXPECT_FALSE(rules.stockSwingExemptionThreshold().has_value());

    rules.setStockSwingExemptionThreshold(20000.0);
    ASSERT_TRUE(rules.stockSwingExemptionThreshold().has_value());
    EXPECT_DOUBLE_EQ(*rules.stockSwingExemptionThreshold(), 20000.0);
}

TEST(TaxRulesTest, WithholdingEstimate) {
    TaxRules rules;
    rules.setWithholdingRate(TradeCategory::DayTrade, 0.01);
    rules.setWithholdingRate(TradeCategory::SwingTrade, 0.00005);

    EXPECT_DOUBLE_EQ(rules.estimateWithholding(TradeCategory::DayTrade, 5000.0, 200.0), 2.0);
    EXPECT_DOUBLE_EQ(rules.estimateWithholding(TradeCategory::DayTrade, 5000.0, -200.0), 0.0);
    EXPECT_DOUBLE_EQ(rules.estimateWithholding(TradeCategory::SwingTrade, 10000.0, -50.0), 0.5);

    TaxRules empty;
    EXPECT_DOUBLE_EQ(empty.estimateWithholding(TradeCategory::DayTrade, 5000.0, 200.0), 0.0);
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Расписание правил
// ═══════════════════════════════════════════════════════════════════════════════

class TaxRuleScheduleTest : public ::testing::Test {
protected:
    void SetUp() override {
        TaxRules early;
        early.setRate(AssetType::Stock, TradeCategory::SwingTrade, 0.15);
        early.setStockSwingExemptionThreshold(20000.0);

        TaxRules late;
        late.setRate(AssetType::Stock, TradeCategory::SwingTrade, 0.175);
        late.setStockSwingExemptionThreshold(35000.0);

        ASSERT_TRUE(schedule.addPeriod(YearMonth{2016, 1}, early).has_value());
        ASSERT_TRUE(schedule.addPeriod(YearMonth{2025, 6}, late).has_value());
    }

    TaxRuleSchedule schedule;
};

TEST_F(TaxRuleScheduleTest, ResolvesRulesInEffectForMonth) {
    auto before = schedule.resolve(YearMonth{2025, 5});
    ASSERT_TRUE(before.has_value());
    EXPECT_DOUBLE_EQ((*before)->rate(AssetType::Stock, TradeCategory::SwingTrade).value(), 0.15);

    auto from = schedule.resolve(YearMonth{2025, 6});
    ASSERT_TRUE(from.has_value());
    EXPECT_DOUBLE_EQ((*from)->rate(AssetType::Stock, TradeCategory::SwingTrade).value(), 0.175);

    auto later = schedule.resolve(
        Date{std::chrono::year{2030}, std::chrono::month{1}, std::chrono::day{1}});
    ASSERT_TRUE(later.has_value());
    EXPECT_DOUBLE_EQ(*(*later)->stockSwingExemptionThreshold(), 35000.0);
}

TEST_F(TaxRuleScheduleTest, NoRulesBeforeFirstPeriod) {
    auto rules = schedule.resolve(YearMonth{2015, 12});
    ASSERT_FALSE(rules.has_value());
    EXPECT_EQ(rules.error().code, ErrorCode::ConfigurationError);
}

TEST_F(TaxRuleScheduleTest, DuplicatePeriodRejected) {
    auto result = schedule.addPeriod(YearMonth{2016, 1}, TaxRules{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigurationError);
    EXPECT_EQ(schedule.size(), 2u);
}

TEST(TaxRuleScheduleUniformTest, UniformAppliesToAnyMonth) {
    TaxRules rules;
    rules.setRate(AssetType::Etf, TradeCategory::SwingTrade, 0.15);
    auto schedule = TaxRuleSchedule::uniform(rules);

    EXPECT_EQ(schedule.size(), 1u);
    EXPECT_TRUE(schedule.resolve(YearMonth{1990, 1}).has_value());
    EXPECT_TRUE(schedule.resolve(YearMonth{2099, 12}).has_value());
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Загрузка конфигурации
// ═══════════════════════════════════════════════════════════════════════════════

TEST(TaxRuleScheduleLoadTest, LoadsPeriodsWithInheritance) {
    std::istringstream input(
        "# reference values\n"
        "[2016-01]\n"
        "rate.acao.swing_trade = 0.15\n"
        "rate.acao.day_trade = 0.20\n"
        "exemption.stock_swing_trade = 20000\n"
        "withholding.day_trade = 0.01\n"
        "\n"
        "[2024-01]\n"
        "rate.acao.day_trade = 0.225\n");

    auto schedule = TaxRuleSchedule::load(input);
    ASSERT_TRUE(schedule.has_value()) << schedule.error().describe();
    EXPECT_EQ(schedule->size(), 2u);

    auto early = schedule->resolve(YearMonth{2020, 3});
    ASSERT_TRUE(early.has_value());
    EXPECT_DOUBLE_EQ((*early)->rate(AssetType::Stock, TradeCategory::DayTrade).value(), 0.20);

    auto late = schedule->resolve(YearMonth{2024, 2});
    ASSERT_TRUE(late.has_value());
    EXPECT_DOUBLE_EQ((*late)->rate(AssetType::Stock, TradeCategory::DayTrade).value(), 0.225);

    // Наследуется от [2016-01]
    EXPECT_DOUBLE_EQ((*late)->rate(AssetType::Stock, TradeCategory::SwingTrade).value(), 0.15);
    EXPECT_DOUBLE_EQ(*(*late)->stockSwingExemptionThreshold(), 20000.0);
    EXPECT_DOUBLE_EQ((*late)->withholdingRate(TradeCategory::DayTrade), 0.01);
}

TEST(TaxRuleScheduleLoadTest, AcceptsEnglishNamesInKeys) {
    std::istringstream input(
        "[2016-01]\n"
        "rate.real-estate-fund.swing = 0.20\n");

    auto schedule = TaxRuleSchedule::load(input);
    ASSERT_TRUE(schedule.has_value()) << schedule.error().describe();

    auto rules = schedule->resolve(YearMonth{2016, 1});
    ASSERT_TRUE(rules.has_value());
    EXPECT_TRUE((*rules)->hasRate(AssetType::RealEstateFund, TradeCategory::SwingTrade));
}

TEST(TaxRuleScheduleLoadTest, RejectsMalformedConfiguration) {
    const std::vector<std::string> inputs = {
        "",
        "rate.acao.swing_trade = 0.15\n",
        "[2016-13]\nrate.acao.swing_trade = 0.15\n",
        "[2016-01]\nrate.bond.swing_trade = 0.15\n",
        "[2016-01]\nrate.acao.swing_trade = 15\n",
        "[2016-01]\nrate.acao.swing_trade = -0.1\n",
        "[2016-01]\nrate.acao.swing_trade = abc\n",
        "[2016-01]\nexemption.fii = 1000\n",
        "[2016-01]\nsurcharge.acao = 0.01\n"
    };

    for (const auto& text : inputs) {
        std::istringstream input(text);
        auto schedule = TaxRuleSchedule::load(input);
        ASSERT_FALSE(schedule.has_value()) << "Accepted: " << text;
        EXPECT_EQ(schedule.error().code, ErrorCode::ConfigurationError);
    }
}

TEST(TaxRuleScheduleLoadTest, MissingFileIsConfigurationError) {
    auto schedule = TaxRuleSchedule::loadFromFile("does_not_exist/tax_rules.conf");
    ASSERT_FALSE(schedule.has_value());
    EXPECT_EQ(schedule.error().code, ErrorCode::ConfigurationError);
}

TEST(TaxRuleScheduleLoadTest, LoadsFromFile) {
    const std::filesystem::path path = "test_tax_rules.conf";
    {
        std::ofstream file(path);
        file << "[2016-01]\n"
             << "rate.acao.swing_trade = 0.15\n"
             << "exemption.stock_swing_trade = 20000\n";
    }

    auto schedule = TaxRuleSchedule::loadFromFile(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(schedule.has_value()) << schedule.error().describe();
    EXPECT_EQ(schedule->size(), 1u);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
