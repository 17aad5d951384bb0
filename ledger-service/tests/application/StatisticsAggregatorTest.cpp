/**
 * @file StatisticsAggregatorTest.cpp
 * @brief Unit tests for StatisticsAggregator and StatisticsEventHandler
 */

#include <gtest/gtest.h>
#include "../fixtures/LedgerFixture.hpp"
#include "../mocks/MockEventConsumer.hpp"
#include "application/StatisticsEventHandler.hpp"

using namespace ledger;
using namespace ledger::application;
using namespace ledger::tests;
using domain::Decimal;
using domain::OrderType;

class StatisticsAggregatorTest : public LedgerFixture {
protected:
    void sellWithFees(const std::string& userId, int64_t quantity, int64_t price,
                      int64_t commission, int64_t tax) {
        auto sell = placeLimit(userId, OrderType::SELL, "005930", quantity, price);
        domain::ExecutionRequest request;
        request.orderId = sell.id;
        request.executionPrice = Decimal(price);
        request.commission = Decimal(commission);
        request.tax = Decimal(tax);
        settler_->execute(request);
    }
};

// ============================================================================
// DAILY AGGREGATION TESTS
// ============================================================================

TEST_F(StatisticsAggregatorTest, UpdateDaily_AggregatesTrades) {
    holdTenShares("user-1");
    sellWithFees("user-1", 10, 11000, 2000, 1000);

    auto stats = statistics_->updateDailyStatistics("user-1", domain::Timestamp::now());

    EXPECT_EQ(stats.periodType, "daily");
    EXPECT_EQ(stats.periodStart, domain::Timestamp::now().startOfDay());
    EXPECT_EQ(stats.totalTrades, 2);
    EXPECT_EQ(stats.buyTrades, 1);
    EXPECT_EQ(stats.sellTrades, 1);
    EXPECT_EQ(stats.totalBuyAmount, Decimal(100000));
    EXPECT_EQ(stats.totalSellAmount, Decimal(110000));
    EXPECT_EQ(stats.totalCommission, Decimal(2015));
    EXPECT_EQ(stats.totalTax, Decimal(1000));
    EXPECT_EQ(stats.totalFee, Decimal(3015));
    EXPECT_EQ(stats.realizedProfitLoss, Decimal(7000));
    EXPECT_EQ(stats.winTrades, 1);
    EXPECT_EQ(stats.lossTrades, 0);
    EXPECT_EQ(stats.winRate, Decimal(100));
}

TEST_F(StatisticsAggregatorTest, UpdateDaily_Twice_Idempotent) {
    holdTenShares("user-1");
    sellWithFees("user-1", 10, 11000, 2000, 1000);
    auto now = domain::Timestamp::now();

    auto first = statistics_->updateDailyStatistics("user-1", now);
    auto second = statistics_->updateDailyStatistics("user-1", now);

    EXPECT_TRUE(first.sameAggregates(second));

    auto stored = statistics_->getStatistics("user-1", now, now);
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_TRUE(stored[0].sameAggregates(first));
}

TEST_F(StatisticsAggregatorTest, WinRate_RoundedToTwoPlaces) {
    holdTenShares("user-1");
    sellWithFees("user-1", 3, 11000, 0, 0);
    sellWithFees("user-1", 3, 12000, 0, 0);
    sellWithFees("user-1", 3, 9000, 0, 0);

    auto stats = statistics_->updateDailyStatistics("user-1", domain::Timestamp::now());

    EXPECT_EQ(stats.winTrades, 2);
    EXPECT_EQ(stats.lossTrades, 1);
    EXPECT_EQ(stats.winRate, Decimal::fromString("66.67"));
    // 3,000 + 6,000 - 3,000
    EXPECT_EQ(stats.realizedProfitLoss, Decimal(6000));
}

TEST_F(StatisticsAggregatorTest, CashMovements_NotCountedAsTrades) {
    openAccount("user-1");
    balances_->deposit("user-1", Decimal(100), "");

    auto stats = statistics_->updateDailyStatistics("user-1", domain::Timestamp::now());

    EXPECT_EQ(stats.totalTrades, 0);
    EXPECT_TRUE(stats.winRate.isZero());
}

TEST_F(StatisticsAggregatorTest, RebuildStatistics_OneRowPerDay) {
    holdTenShares("user-1");
    auto today = domain::Timestamp::now();

    auto rebuilt = statistics_->rebuildStatistics("user-1", today.plusDays(-2), today);

    ASSERT_EQ(rebuilt.size(), 3u);
    EXPECT_EQ(rebuilt[0].totalTrades, 0);
    EXPECT_EQ(rebuilt[1].totalTrades, 0);
    EXPECT_EQ(rebuilt[2].totalTrades, 1);
    EXPECT_EQ(statistics_->getStatistics("user-1", today.plusDays(-2), today).size(), 3u);
}

TEST_F(StatisticsAggregatorTest, InvalidArguments_Rejected) {
    auto now = domain::Timestamp::now();

    EXPECT_THROW(statistics_->updateDailyStatistics("", now), domain::ValidationError);
    EXPECT_THROW(statistics_->rebuildStatistics("user-1", now, now.plusDays(-1)), domain::ValidationError);
}

// ============================================================================
// EVENT HANDLER TESTS
// ============================================================================

TEST_F(StatisticsAggregatorTest, EventHandler_RecomputesOnTransactionSettled) {
    auto consumer = std::make_shared<MockEventConsumer>();
    StatisticsEventHandler handler(consumer, statistics_);
    ASSERT_TRUE(consumer->isSubscribed(events::TRANSACTION_SETTLED));

    holdTenShares("user-1");
    auto settled = publisher_->messagesFor(events::TRANSACTION_SETTLED);
    ASSERT_EQ(settled.size(), 1u);

    consumer->deliver(events::TRANSACTION_SETTLED, settled[0].message);

    auto now = domain::Timestamp::now();
    auto stored = statistics_->getStatistics("user-1", now, now);
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_EQ(stored[0].buyTrades, 1);
}

TEST_F(StatisticsAggregatorTest, EventHandler_MalformedMessage_Ignored) {
    auto consumer = std::make_shared<MockEventConsumer>();
    StatisticsEventHandler handler(consumer, statistics_);

    EXPECT_NO_THROW(consumer->deliver(events::TRANSACTION_SETTLED, "not json"));
    EXPECT_NO_THROW(consumer->deliver(events::TRANSACTION_SETTLED, R"({"transaction_date":"2025-01-01"})"));
}
