#include <gtest/gtest.h>
#include "ReportJson.hpp"

using namespace darf;

Date makeDate(int year, unsigned month, unsigned day) {
    return Date{std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day}};
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Сериализация
// ═══════════════════════════════════════════════════════════════════════════════

TEST(ReportJsonTest, OperationFields) {
    Operation operation;
    operation.id = "op-1";
    operation.assetCode = "PETR4";
    operation.assetType = AssetType::Stock;
    operation.tradeCategory = TradeCategory::DayTrade;
    operation.operationType = OperationType::Sell;
    operation.quantity = 100.0;
    operation.unitPrice = 15.0;
    operation.totalCost = 1500.0;
    operation.operationDate = makeDate(2024, 5, 20);

    auto j = operationToJson(operation);
    EXPECT_EQ(j["id"], "op-1");
    EXPECT_EQ(j["asset_type"], "acao");
    EXPECT_EQ(j["trade_category"], "day_trade");
    EXPECT_EQ(j["operation_type"], "venda");
    EXPECT_EQ(j["operation_date"], "2024-05-20");
    EXPECT_TRUE(j["ir_retained"].is_null());

    operation.irRetained = 0.75;
    EXPECT_DOUBLE_EQ(operationToJson(operation)["ir_retained"].get<double>(), 0.75);
}

TEST(ReportJsonTest, ReportWithItems) {
    TaxComputation computation;
    computation.key = BucketKey{YearMonth{2024, 3}, AssetType::Etf, TradeCategory::SwingTrade};
    computation.totalSales = 5000.0;
    computation.netResult = 400.0;
    computation.taxableProfit = 300.0;
    computation.taxRate = 0.15;
    computation.taxDue = 45.0;
    computation.irRetained = 0.25;
    computation.netTaxDue = 44.75;
    computation.lossCarryConsumed = 100.0;

    DarfReport report;
    report.period = YearMonth{2024, 3};
    report.items.push_back(computation);
    report.totalDue = 44.75;

    auto j = reportToJson(report);
    EXPECT_EQ(j["year"], 2024);
    EXPECT_EQ(j["month"], 3);
    EXPECT_DOUBLE_EQ(j["total_due"].get<double>(), 44.75);
    ASSERT_EQ(j["items"].size(), 1u);

    const auto& item = j["items"][0];
    EXPECT_EQ(item["asset_type"], "etf");
    EXPECT_EQ(item["trade_category"], "swing_trade");
    EXPECT_DOUBLE_EQ(item["taxable_profit"].get<double>(), 300.0);
    EXPECT_DOUBLE_EQ(item["ir_retained"].get<double>(), 0.25);
    EXPECT_FALSE(item.contains("ir_retained_total"));
    EXPECT_DOUBLE_EQ(item["net_tax_due"].get<double>(), 44.75);
    EXPECT_EQ(item["exemption_applied"], false);
    EXPECT_DOUBLE_EQ(item["loss_carry_consumed"].get<double>(), 100.0);
}

TEST(ReportJsonTest, EmptyReportHasEmptyItems) {
    DarfReport report;
    report.period = YearMonth{2024, 2};

    auto j = reportToJson(report);
    EXPECT_TRUE(j["items"].is_array());
    EXPECT_TRUE(j["items"].empty());
    EXPECT_DOUBLE_EQ(j["total_due"].get<double>(), 0.0);
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Десериализация
// ═══════════════════════════════════════════════════════════════════════════════

TEST(ReportJsonTest, OperationFromJsonAcceptsAliasesAndDefaults) {
    auto j = json::parse(R"({
        "asset_code": "BOVA11",
        "asset_type": "etf",
        "trade_category": "swing",
        "operation_type": "buy",
        "quantity": 10,
        "unit_price": 100.5,
        "operation_date": "2024-01-15"
    })");

    auto operation = operationFromJson(j);
    ASSERT_TRUE(operation.has_value()) << operation.error();
    EXPECT_TRUE(operation->id.empty());
    EXPECT_EQ(operation->operationType, OperationType::Buy);
    EXPECT_DOUBLE_EQ(operation->totalCost, 1005.0);
    EXPECT_EQ(operation->operationDate, makeDate(2024, 1, 15));
    EXPECT_FALSE(operation->irRetained.has_value());
}

TEST(ReportJsonTest, OperationFromJsonErrors) {
    auto missingField = operationFromJson(json::parse(R"({"asset_code": "PETR4"})"));
    ASSERT_FALSE(missingField.has_value());
    EXPECT_EQ(missingField.error().rfind("Deserialization error", 0), 0u);

    auto badType = operationFromJson(json::parse(R"({
        "asset_code": "PETR4", "asset_type": "bond", "trade_category": "swing_trade",
        "operation_type": "compra", "quantity": 1, "unit_price": 1,
        "operation_date": "2024-01-15"
    })"));
    ASSERT_FALSE(badType.has_value());
    EXPECT_NE(badType.error().find("bond"), std::string::npos);
}

TEST(ReportJsonTest, OperationsFromArrayReportsElementIndex) {
    auto j = json::parse(R"([
        {"asset_code": "PETR4", "asset_type": "acao", "trade_category": "swing_trade",
         "operation_type": "compra", "quantity": 1, "unit_price": 1,
         "operation_date": "2024-01-15"},
        {"asset_code": "PETR4", "asset_type": "acao", "trade_category": "swing_trade",
         "operation_type": "venda", "quantity": "many", "unit_price": 1,
         "operation_date": "2024-01-16"}
    ])");

    auto operations = operationsFromJson(j);
    ASSERT_FALSE(operations.has_value());
    EXPECT_EQ(operations.error().rfind("Element 1: ", 0), 0u);

    auto single = operationsFromJson(j[0]);
    ASSERT_TRUE(single.has_value());
    EXPECT_EQ(single->size(), 1u);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
