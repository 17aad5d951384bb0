/**
 * @file BalanceServiceTest.cpp
 * @brief Unit tests for BalanceService
 */

#include <gtest/gtest.h>
#include "../fixtures/LedgerFixture.hpp"
#include <nlohmann/json.hpp>

using namespace ledger;
using namespace ledger::application;
using namespace ledger::tests;
using domain::Decimal;
using domain::TransactionType;

class BalanceServiceTest : public LedgerFixture {
protected:
    /**
     * @brief Продажа без комиссий, чтобы результат считался в уме
     */
    domain::Transaction sellWithoutFees(const std::string& userId, const std::string& stockId,
                                        int64_t quantity, int64_t price,
                                        std::optional<int64_t> currentRate = std::nullopt) {
        auto sell = placeLimit(userId, domain::OrderType::SELL, stockId, quantity, price);
        domain::ExecutionRequest request;
        request.orderId = sell.id;
        request.executionPrice = Decimal(price);
        request.commission = Decimal();
        request.tax = Decimal();
        if (currentRate) {
            request.currentExchangeRate = Decimal(*currentRate);
        }
        return settler_->execute(request).transaction;
    }

    /**
     * @brief 005930: +10,000 и -5,000; AAPL: +130,000 по цене и +110,000 по курсу
     */
    void tradeDomesticAndForeign(const std::string& userId) {
        openAccount(userId, 10000000);
        quotes_->setQuote("AAPL", Decimal(100), "USD");
        quotes_->setExchangeRate("USD", Decimal(1300));

        fill(placeLimit(userId, domain::OrderType::BUY, "005930", 10, 10000).id, 10000);
        fill(placeLimit(userId, domain::OrderType::BUY, "AAPL", 10, 100).id, 100);

        sellWithoutFees(userId, "005930", 5, 12000);
        sellWithoutFees(userId, "005930", 5, 9000);
        sellWithoutFees(userId, "AAPL", 10, 110, 1400);
    }
};

// ============================================================================
// OPEN ACCOUNT TESTS
// ============================================================================

TEST_F(BalanceServiceTest, OpenAccount_DefaultInitialCash) {
    auto account = balances_->openAccount("user-1", std::nullopt);

    EXPECT_EQ(account.cashBalance, Decimal(1000000));
    EXPECT_EQ(account.availableCash, Decimal(1000000));

    auto history = balances_->getBalanceHistory("user-1", 0);
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].changeType, TransactionType::DEPOSIT);
    EXPECT_TRUE(history[0].previousCashBalance.isZero());
    EXPECT_EQ(history[0].newCashBalance, Decimal(1000000));
}

TEST_F(BalanceServiceTest, OpenAccount_PublishesBalanceChanged) {
    balances_->openAccount("user-1", Decimal(5000));

    auto changed = publisher_->messagesFor(events::BALANCE_CHANGED);
    ASSERT_EQ(changed.size(), 1u);
    auto json = nlohmann::json::parse(changed[0].message);
    EXPECT_EQ(json["user_id"], "user-1");
    EXPECT_EQ(json["cash_balance"], "5000");
    EXPECT_EQ(json["available_cash"], "5000");
}

TEST_F(BalanceServiceTest, OpenAccount_ZeroCash_NoHistory) {
    auto account = balances_->openAccount("user-1", Decimal());

    EXPECT_TRUE(account.cashBalance.isZero());
    EXPECT_TRUE(balances_->getBalanceHistory("user-1", 0).empty());
}

TEST_F(BalanceServiceTest, OpenAccount_Twice_Conflict) {
    balances_->openAccount("user-1", std::nullopt);

    EXPECT_THROW(balances_->openAccount("user-1", std::nullopt), domain::ConflictError);
    EXPECT_EQ(balance("user-1").cashBalance, Decimal(1000000));
}

TEST_F(BalanceServiceTest, OpenAccount_Invalid_Rejected) {
    EXPECT_THROW(balances_->openAccount("", std::nullopt), domain::ValidationError);
    EXPECT_THROW(balances_->openAccount("user-1", Decimal(-1)), domain::ValidationError);
}

TEST_F(BalanceServiceTest, GetBalance_Unknown_NotFound) {
    EXPECT_THROW(balances_->getBalance("nobody"), domain::NotFoundError);
}

// ============================================================================
// DEPOSIT / WITHDRAW TESTS
// ============================================================================

TEST_F(BalanceServiceTest, DepositAndWithdraw_RecordedInHistory) {
    openAccount("user-1");

    auto deposit = balances_->deposit("user-1", Decimal(500), "");
    auto withdraw = balances_->withdraw("user-1", Decimal(200), "ATM");

    EXPECT_EQ(deposit.netAmount, Decimal(500));
    EXPECT_EQ(deposit.description, "Deposit");
    EXPECT_FALSE(deposit.orderId.has_value());
    EXPECT_EQ(withdraw.netAmount, Decimal(-200));
    EXPECT_EQ(withdraw.cashBalanceBefore, Decimal(1000500));
    EXPECT_EQ(withdraw.cashBalanceAfter, Decimal(1000300));
    EXPECT_EQ(withdraw.description, "ATM");

    auto history = balances_->getBalanceHistory("user-1", 0);
    ASSERT_EQ(history.size(), 3u);
    EXPECT_EQ(history[0].changeType, TransactionType::WITHDRAW);
    EXPECT_EQ(history[0].changeAmount, Decimal(-200));
    EXPECT_EQ(history[1].changeType, TransactionType::DEPOSIT);
    EXPECT_EQ(history[1].changeAmount, Decimal(500));

    EXPECT_EQ(balances_->getBalanceHistory("user-1", 1).size(), 1u);

    auto account = balance("user-1");
    EXPECT_EQ(account.cashBalance, Decimal(1000300));
    EXPECT_EQ(account.availableCash, Decimal(1000300));
}

TEST_F(BalanceServiceTest, Withdraw_CannotTouchReservedCash) {
    openAccount("user-1");
    placeLimit("user-1", domain::OrderType::BUY, "005930", 10, 10000);

    try {
        balances_->withdraw("user-1", Decimal(950000), "");
        FAIL() << "Expected InsufficientBalanceError";
    } catch (const domain::InsufficientBalanceError& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("reserved by open orders 100015"), std::string::npos) << message;
        EXPECT_NE(message.find("shortfall 50015"), std::string::npos) << message;
    }

    EXPECT_NO_THROW(balances_->withdraw("user-1", Decimal(899985), ""));

    auto account = balance("user-1");
    EXPECT_TRUE(account.availableCash.isZero());
    EXPECT_EQ(account.cashBalance, Decimal(100015));
}

TEST_F(BalanceServiceTest, MoveCash_NonPositiveAmount_Rejected) {
    openAccount("user-1");

    EXPECT_THROW(balances_->deposit("user-1", Decimal(), ""), domain::ValidationError);
    EXPECT_THROW(balances_->withdraw("user-1", Decimal(-5), ""), domain::ValidationError);
    EXPECT_THROW(balances_->deposit("nobody", Decimal(5), ""), domain::NotFoundError);
}

// ============================================================================
// TRANSACTION QUERY TESTS
// ============================================================================

TEST_F(BalanceServiceTest, GetTransactions_FilterByType) {
    holdTenShares("user-1");
    balances_->deposit("user-1", Decimal(100), "");

    domain::TransactionFilter filter;
    filter.transactionType = TransactionType::BUY;
    auto buys = balances_->getTransactions("user-1", filter);

    ASSERT_EQ(buys.size(), 1u);
    EXPECT_EQ(buys[0].productCode, std::optional<std::string>("005930"));

    filter.transactionType = TransactionType::DEPOSIT;
    EXPECT_EQ(balances_->getTransactions("user-1", filter).size(), 2u);

    domain::TransactionFilter limited;
    limited.limit = 2;
    auto latest = balances_->getTransactions("user-1", limited);
    ASSERT_EQ(latest.size(), 2u);
    EXPECT_EQ(latest[0].transactionType, TransactionType::DEPOSIT);
    EXPECT_EQ(latest[1].transactionType, TransactionType::BUY);
}

TEST_F(BalanceServiceTest, GetTransactions_DateRangeIsHalfOpen) {
    openAccount("user-1");
    auto now = domain::Timestamp::now();

    domain::TransactionFilter past;
    past.from = now.plusDays(-2);
    past.to = now.plusDays(-1);
    EXPECT_TRUE(balances_->getTransactions("user-1", past).empty());

    domain::TransactionFilter current;
    current.from = now.plusDays(-1);
    current.to = now.plusDays(1);
    EXPECT_EQ(balances_->getTransactions("user-1", current).size(), 1u);
}

// ============================================================================
// REALIZED PROFIT/LOSS BY PRODUCT TESTS
// ============================================================================

TEST_F(BalanceServiceTest, ProductProfitLoss_GroupsSellsAndSplitsComponents) {
    tradeDomesticAndForeign("user-1");
    auto today = domain::Timestamp::now().startOfDay();

    auto report = balances_->getProductProfitLoss("user-1", today, today.plusDays(1), domain::MarketScope::ALL);

    ASSERT_EQ(report.products.size(), 2u);

    const auto& aapl = report.products[0];
    EXPECT_EQ(aapl.productCode, "AAPL");
    EXPECT_TRUE(aapl.foreign);
    EXPECT_EQ(aapl.realizedProfitLoss, Decimal(240000));
    EXPECT_EQ(aapl.priceProfitLoss, Decimal(130000));
    EXPECT_EQ(aapl.exchangeProfitLoss, Decimal(110000));
    EXPECT_EQ(aapl.tradeCount, 1);
    EXPECT_EQ(aapl.soldQuantity, Decimal(10));
    EXPECT_EQ(aapl.sellAmount, Decimal(1540000));

    const auto& samsung = report.products[1];
    EXPECT_EQ(samsung.productCode, "005930");
    EXPECT_FALSE(samsung.foreign);
    EXPECT_EQ(samsung.realizedProfitLoss, Decimal(5000));
    EXPECT_EQ(samsung.priceProfitLoss, Decimal(5000));
    EXPECT_TRUE(samsung.exchangeProfitLoss.isZero());
    EXPECT_EQ(samsung.tradeCount, 2);
    EXPECT_EQ(samsung.soldQuantity, Decimal(10));
    EXPECT_EQ(samsung.sellAmount, Decimal(105000));
    ASSERT_TRUE(samsung.firstTradeDate && samsung.lastTradeDate);
    EXPECT_TRUE(*samsung.firstTradeDate <= *samsung.lastTradeDate);

    EXPECT_EQ(report.totalRealizedProfitLoss, Decimal(245000));
    EXPECT_EQ(report.totalPriceProfitLoss, Decimal(135000));
    EXPECT_EQ(report.totalExchangeProfitLoss, Decimal(110000));
    EXPECT_EQ(report.totalTrades, 3);
    EXPECT_EQ(report.totalRealizedProfitLoss,
              balances_->getRealizedProfitLoss("user-1", today, today.plusDays(1)));
}

TEST_F(BalanceServiceTest, ProductProfitLoss_ScopeFiltersDomesticAndForeign) {
    tradeDomesticAndForeign("user-1");
    auto today = domain::Timestamp::now().startOfDay();

    auto domestic = balances_->getProductProfitLoss("user-1", today, today.plusDays(1),
                                                    domain::MarketScope::DOMESTIC);
    ASSERT_EQ(domestic.products.size(), 1u);
    EXPECT_EQ(domestic.products[0].productCode, "005930");
    EXPECT_EQ(domestic.totalRealizedProfitLoss, Decimal(5000));
    EXPECT_TRUE(domestic.totalExchangeProfitLoss.isZero());

    auto foreign = balances_->getProductProfitLoss("user-1", today, today.plusDays(1),
                                                   domain::MarketScope::FOREIGN);
    ASSERT_EQ(foreign.products.size(), 1u);
    EXPECT_EQ(foreign.products[0].productCode, "AAPL");
    EXPECT_EQ(foreign.totalRealizedProfitLoss, Decimal(240000));
    EXPECT_EQ(foreign.totalTrades, 1);
}

TEST_F(BalanceServiceTest, ProductProfitLoss_OutsidePeriod_Empty) {
    tradeDomesticAndForeign("user-1");
    auto today = domain::Timestamp::now().startOfDay();

    auto report = balances_->getProductProfitLoss("user-1", today.plusDays(-7), today,
                                                  domain::MarketScope::ALL);

    EXPECT_TRUE(report.products.empty());
    EXPECT_TRUE(report.totalRealizedProfitLoss.isZero());
    EXPECT_EQ(report.totalTrades, 0);
}

TEST_F(BalanceServiceTest, ProductProfitLoss_InvertedPeriod_Rejected) {
    openAccount("user-1");
    auto today = domain::Timestamp::now().startOfDay();

    EXPECT_THROW(balances_->getProductProfitLoss("user-1", today, today, domain::MarketScope::ALL),
                 domain::ValidationError);
}
