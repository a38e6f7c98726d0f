#include <gtest/gtest.h>
#include "DarfEngine.hpp"
#include "InMemoryOperationStore.hpp"
#include "PortfolioSummary.hpp"
#include <atomic>
#include <memory>
#include <thread>
#include <vector>

using namespace darf;

// ═══════════════════════════════════════════════════════════════════════════════
// Вспомогательные функции
// ═══════════════════════════════════════════════════════════════════════════════

Date makeDate(int year, unsigned month, unsigned day) {
    return Date{std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day}};
}

Operation makeOperation(
    std::string id,
    std::string code,
    OperationType type,
    double quantity,
    double price,
    Date date,
    AssetType assetType = AssetType::Stock,
    TradeCategory category = TradeCategory::SwingTrade) {

    Operation operation;
    operation.id = std::move(id);
    operation.assetCode = std::move(code);
    operation.assetType = assetType;
    operation.tradeCategory = category;
    operation.operationType = type;
    operation.quantity = quantity;
    operation.unitPrice = price;
    operation.totalCost = quantity * price;
    operation.operationDate = date;
    return operation;
}

TaxRules makeReferenceRules() {
    TaxRules rules;
    for (auto type : kAllAssetTypes) {
        rules.setRate(type, TradeCategory::SwingTrade, 0.15);
        rules.setRate(type, TradeCategory::DayTrade, 0.20);
    }
    rules.setStockSwingExemptionThreshold(20000.0);
    return rules;
}

// Хранилище, которое всегда отказывает
class FailingStore : public IOperationStore {
public:
    std::expected<std::string, std::string> add(const Operation&) override {
        return std::unexpected("disk full");
    }
    std::expected<std::vector<Operation>, std::string> list(const OperationFilter&) override {
        return std::unexpected("database is locked");
    }
    std::expected<Operation, std::string> get(std::string_view) override {
        return std::unexpected("database is locked");
    }
    std::expected<void, std::string> remove(std::string_view) override {
        return std::unexpected("database is locked");
    }
    std::expected<std::size_t, std::string> count() override {
        return std::unexpected("database is locked");
    }
};

// ═══════════════════════════════════════════════════════════════════════════════
// Test Fixtures
// ═══════════════════════════════════════════════════════════════════════════════

class DarfEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine = std::make_unique<DarfEngine>(
            std::make_shared<const TaxRuleSchedule>(TaxRuleSchedule::uniform(makeReferenceRules())));
    }

    std::unique_ptr<DarfEngine> engine;
};

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Сквозные сценарии
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(DarfEngineTest, SingleStockGainBelowThresholdIsExempt) {
    auto buy = makeOperation("1", "PETR4", OperationType::Buy, 100.0, 10.0, makeDate(2024, 5, 2));
    buy.totalCost = 1005.0;
    auto sell = makeOperation("2", "PETR4", OperationType::Sell, 100.0, 15.0, makeDate(2024, 5, 20));

    auto published = engine->run({buy, sell});
    ASSERT_TRUE(published.has_value()) << published.error().describe();

    const auto& result = **published;
    ASSERT_EQ(result.recompute.realized.size(), 1u);
    EXPECT_DOUBLE_EQ(result.recompute.realized[0].gainLoss, 495.0);

    ASSERT_EQ(result.buckets.size(), 1u);
    EXPECT_DOUBLE_EQ(result.buckets[0].totalSales, 1500.0);
    EXPECT_DOUBLE_EQ(result.buckets[0].netResult, 495.0);

    auto report = engine->query(2024, 5);
    ASSERT_TRUE(report.has_value());
    ASSERT_EQ(report->items.size(), 1u);
    EXPECT_TRUE(report->items[0].exemptionApplied);
    EXPECT_DOUBLE_EQ(report->items[0].taxDue, 0.0);
    EXPECT_DOUBLE_EQ(report->totalDue, 0.0);
}

TEST_F(DarfEngineTest, StockSalesSummedAcrossAssetsForExemption) {
    // Каждая бумага ниже лимита, вместе - выше
    auto published = engine->run({
        makeOperation("1", "PETR4", OperationType::Buy, 1000.0, 10.0, makeDate(2024, 6, 3)),
        makeOperation("2", "VALE3", OperationType::Buy, 200.0, 50.0, makeDate(2024, 6, 3)),
        makeOperation("3", "PETR4", OperationType::Sell, 1000.0, 12.0, makeDate(2024, 6, 10)),
        makeOperation("4", "VALE3", OperationType::Sell, 200.0, 55.0, makeDate(2024, 6, 11))
    });
    ASSERT_TRUE(published.has_value());

    auto report = engine->query(2024, 6);
    ASSERT_TRUE(report.has_value());
    ASSERT_EQ(report->items.size(), 1u);

    const auto& item = report->items[0];
    EXPECT_DOUBLE_EQ(item.totalSales, 23000.0);
    EXPECT_FALSE(item.exemptionApplied);
    EXPECT_DOUBLE_EQ(item.taxDue, 3000.0 * 0.15);
}

TEST_F(DarfEngineTest, LossCarriedIntoLaterMonth) {
    auto published = engine->run({
        makeOperation("1", "PETR4", OperationType::Buy, 2000.0, 15.0, makeDate(2024, 1, 2)),
        makeOperation("2", "PETR4", OperationType::Sell, 1000.0, 14.0, makeDate(2024, 1, 20)),
        makeOperation("3", "PETR4", OperationType::Sell, 1000.0, 25.0, makeDate(2024, 2, 20))
    });
    ASSERT_TRUE(published.has_value());

    auto january = engine->query(2024, 1);
    auto february = engine->query(2024, 2);
    ASSERT_TRUE(january.has_value());
    ASSERT_TRUE(february.has_value());

    EXPECT_DOUBLE_EQ(january->items[0].netResult, -1000.0);
    EXPECT_DOUBLE_EQ(january->items[0].lossCarryRemaining, 1000.0);

    // 25000 > 20000: без освобождения, 10000 - 1000 убытка
    EXPECT_DOUBLE_EQ(february->items[0].taxableProfit, 9000.0);
    EXPECT_DOUBLE_EQ(february->totalDue, 9000.0 * 0.15);
}

TEST_F(DarfEngineTest, DayTradeTaxedAtDayTradeRate) {
    const auto day = makeDate(2024, 4, 8);
    auto published = engine->run({
        makeOperation("1", "PETR4", OperationType::Buy, 100.0, 30.0, day,
                      AssetType::Stock, TradeCategory::DayTrade),
        makeOperation("2", "PETR4", OperationType::Sell, 100.0, 31.0, day,
                      AssetType::Stock, TradeCategory::DayTrade)
    });
    ASSERT_TRUE(published.has_value());

    auto report = engine->query(2024, 4);
    ASSERT_TRUE(report.has_value());
    ASSERT_EQ(report->items.size(), 1u);
    EXPECT_FALSE(report->items[0].exemptionApplied);
    EXPECT_DOUBLE_EQ(report->items[0].taxDue, 100.0 * 0.20);
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Ошибки и публикация
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(DarfEngineTest, NothingPublishedYieldsEmptyReport) {
    EXPECT_EQ(engine->published(), nullptr);

    auto report = engine->query(2024, 1);
    ASSERT_TRUE(report.has_value());
    EXPECT_TRUE(report->empty());
}

TEST_F(DarfEngineTest, FailedRunKeepsPreviousPublication) {
    auto first = engine->run({
        makeOperation("1", "PETR4", OperationType::Buy, 10.0, 10.0, makeDate(2024, 1, 2)),
        makeOperation("2", "PETR4", OperationType::Sell, 10.0, 12.0, makeDate(2024, 1, 3))
    });
    ASSERT_TRUE(first.has_value());

    auto failed = engine->run({
        makeOperation("3", "VALE3", OperationType::Sell, 1.0, 10.0, makeDate(2024, 1, 2))
    });
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, ErrorCode::InsufficientPosition);
    EXPECT_EQ(failed.error().operationId, "3");

    EXPECT_EQ(engine->published(), *first);
}

TEST_F(DarfEngineTest, MissingRateAbortsRun) {
    TaxRules rules;
    rules.setRate(AssetType::Stock, TradeCategory::SwingTrade, 0.15);
    rules.setStockSwingExemptionThreshold(20000.0);
    DarfEngine partial(std::make_shared<const TaxRuleSchedule>(TaxRuleSchedule::uniform(rules)));

    auto result = partial.run({
        makeOperation("1", "BTC", OperationType::Buy, 1.0, 100.0, makeDate(2024, 1, 2),
                      AssetType::Crypto),
        makeOperation("2", "BTC", OperationType::Sell, 1.0, 120.0, makeDate(2024, 1, 3),
                      AssetType::Crypto)
    });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigurationError);
    EXPECT_EQ(partial.published(), nullptr);
}

TEST_F(DarfEngineTest, StoreFailureIsStorageError) {
    FailingStore store;
    auto result = engine->runFromStore(store);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::StorageError);
    EXPECT_NE(result.error().message.find("database is locked"), std::string::npos);
}

TEST_F(DarfEngineTest, RunFromStoreUsesInsertionOrder) {
    InMemoryOperationStore store;
    const auto day = makeDate(2024, 7, 1);
    ASSERT_TRUE(store.add(makeOperation("", "PETR4", OperationType::Buy, 10.0, 10.0, day)).has_value());
    ASSERT_TRUE(store.add(makeOperation("", "PETR4", OperationType::Sell, 10.0, 11.0, day)).has_value());

    auto result = engine->runFromStore(store);
    ASSERT_TRUE(result.has_value()) << result.error().describe();
    EXPECT_EQ((*result)->recompute.realized.size(), 1u);
}

TEST_F(DarfEngineTest, RejectedOperationsReportedAlongsideResult) {
    auto bad = makeOperation("bad", "PETR4", OperationType::Buy, 10.0, 0.0, makeDate(2024, 1, 2));

    auto result = engine->run({
        makeOperation("1", "PETR4", OperationType::Buy, 10.0, 10.0, makeDate(2024, 1, 2)),
        bad
    });
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ((*result)->recompute.rejected.size(), 1u);
    EXPECT_EQ((*result)->recompute.rejected.rejected[0].operationId, "bad");
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Идемпотентность и конкурентность
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(DarfEngineTest, RepeatedRunsProduceIdenticalComputations) {
    std::vector<Operation> operations = {
        makeOperation("1", "PETR4", OperationType::Buy, 2000.0, 15.0, makeDate(2024, 1, 2)),
        makeOperation("2", "PETR4", OperationType::Sell, 1000.0, 14.0, makeDate(2024, 1, 20)),
        makeOperation("3", "BOVA11", OperationType::Buy, 100.0, 100.0, makeDate(2024, 1, 21),
                      AssetType::Etf),
        makeOperation("4", "PETR4", OperationType::Sell, 1000.0, 25.0, makeDate(2024, 2, 20)),
        makeOperation("5", "BOVA11", OperationType::Sell, 100.0, 110.0, makeDate(2024, 2, 21),
                      AssetType::Etf)
    };

    auto first = engine->run(operations);
    auto second = engine->run(operations);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(*first, *second);

    const auto& a = (*first)->taxes.computations;
    const auto& b = (*second)->taxes.computations;
    ASSERT_EQ(a.size(), b.size());
    for (std::size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].key, b[i].key);
        EXPECT_DOUBLE_EQ(a[i].taxableProfit, b[i].taxableProfit);
        EXPECT_DOUBLE_EQ(a[i].netTaxDue, b[i].netTaxDue);
        EXPECT_DOUBLE_EQ(a[i].lossCarryRemaining, b[i].lossCarryRemaining);
    }
}

TEST_F(DarfEngineTest, ReadersSeeCompleteSnapshotsDuringRuns) {
    std::vector<Operation> operations = {
        makeOperation("1", "PETR4", OperationType::Buy, 2000.0, 15.0, makeDate(2024, 1, 2)),
        makeOperation("2", "PETR4", OperationType::Sell, 1000.0, 14.0, makeDate(2024, 1, 20)),
        makeOperation("3", "PETR4", OperationType::Sell, 1000.0, 25.0, makeDate(2024, 2, 20))
    };
    ASSERT_TRUE(engine->run(operations).has_value());

    std::atomic<bool> stop{false};
    std::atomic<int> inconsistent{0};

    std::thread writer([&]() {
        for (int i = 0; i < 200; ++i) {
            if (!engine->run(operations)) {
                ++inconsistent;
            }
        }
        stop = true;
    });

    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&]() {
            while (!stop) {
                auto report = engine->query(2024, 2);
                if (!report || report->items.size() != 1 ||
                    report->totalDue != 9000.0 * 0.15) {
                    ++inconsistent;
                }
            }
        });
    }

    writer.join();
    for (auto& reader : readers) {
        reader.join();
    }

    EXPECT_EQ(inconsistent.load(), 0);
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Сводка по портфелю
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(DarfEngineTest, PortfolioSummaryAtCost) {
    auto published = engine->run({
        makeOperation("1", "PETR4", OperationType::Buy, 100.0, 10.0, makeDate(2024, 1, 2)),
        makeOperation("2", "VALE3", OperationType::Buy, 10.0, 60.0, makeDate(2024, 1, 2)),
        makeOperation("3", "PETR4", OperationType::Sell, 40.0, 12.0, makeDate(2024, 1, 10)),
        makeOperation("4", "VALE3", OperationType::Sell, 10.0, 50.0, makeDate(2024, 1, 11))
    });
    ASSERT_TRUE(published.has_value());

    auto summary = summarizePortfolio((*published)->recompute);

    EXPECT_DOUBLE_EQ(summary.totalInvested, 1600.0);
    EXPECT_DOUBLE_EQ(summary.totalCurrentValue, 600.0);
    EXPECT_DOUBLE_EQ(summary.totalProfitLoss, 80.0 - 100.0);
    EXPECT_DOUBLE_EQ(summary.profitLossPercentage, -20.0 / 1600.0 * 100.0);
    EXPECT_EQ(summary.openPositions, 1u);

    ASSERT_EQ(summary.assetsDistribution.size(), 1u);
    EXPECT_DOUBLE_EQ(summary.assetsDistribution.at("PETR4"), 600.0);
}

TEST(PortfolioSummaryTest, EmptyPortfolio) {
    RecomputeResult empty;
    auto summary = summarizePortfolio(empty);

    EXPECT_DOUBLE_EQ(summary.totalInvested, 0.0);
    EXPECT_DOUBLE_EQ(summary.profitLossPercentage, 0.0);
    EXPECT_TRUE(summary.assetsDistribution.empty());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
