/**
 * @file InMemoryLedgerStoreTest.cpp
 * @brief Unit tests for InMemoryLedgerStore unit-of-work semantics
 */

#include <gtest/gtest.h>
#include "adapters/secondary/persistence/InMemoryLedgerStore.hpp"
#include <atomic>
#include <chrono>
#include <thread>

using namespace ledger;
using namespace ledger::adapters::secondary;
using domain::Decimal;

class InMemoryLedgerStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<InMemoryLedgerStore>(std::chrono::milliseconds{100});
    }

    void seedAccount(const std::string& userId, int64_t cash) {
        auto uow = store_->begin(userId);
        uow->balances().save(domain::BalanceAccount::open(userId, Decimal(cash)));
        uow->commit();
    }

    domain::Order makeOrder(const std::string& id, const std::string& userId, domain::OrderStatus status) {
        domain::Order order;
        order.id = id;
        order.userId = userId;
        order.stockId = "005930";
        order.orderType = domain::OrderType::SELL;
        order.orderStatus = status;
        order.quantity = Decimal(5);
        return order;
    }

    std::shared_ptr<InMemoryLedgerStore> store_;
};

// ============================================================================
// COMMIT / ROLLBACK TESTS
// ============================================================================

TEST_F(InMemoryLedgerStoreTest, Commit_MakesChangesVisible) {
    seedAccount("user-1", 1000);

    auto view = store_->read();
    auto account = view->balances().findByUserId("user-1");
    ASSERT_TRUE(account.has_value());
    EXPECT_EQ(account->cashBalance, Decimal(1000));
}

TEST_F(InMemoryLedgerStoreTest, DestroyedWithoutCommit_RollsBack) {
    {
        auto uow = store_->begin("user-1");
        uow->balances().save(domain::BalanceAccount::open("user-1", Decimal(1000)));
        domain::Transaction transaction;
        transaction.id = "txn-1";
        transaction.userId = "user-1";
        uow->transactions().append(transaction);

        // Своя единица видит незафиксированные записи
        EXPECT_TRUE(uow->balances().findByUserId("user-1").has_value());
        EXPECT_FALSE(store_->read()->balances().findByUserId("user-1").has_value());
    }

    auto view = store_->read();
    EXPECT_FALSE(view->balances().findByUserId("user-1").has_value());
    domain::TransactionFilter all;
    all.limit = 0;
    EXPECT_TRUE(view->transactions().findByUserId("user-1", all).empty());
}

TEST_F(InMemoryLedgerStoreTest, Commit_Twice_Throws) {
    auto uow = store_->begin("user-1");
    uow->balances().save(domain::BalanceAccount::open("user-1", Decimal(1)));
    uow->commit();

    EXPECT_THROW(uow->commit(), domain::PersistenceError);
    EXPECT_THROW(uow->balances().save(domain::BalanceAccount::open("user-1", Decimal(2))),
                 domain::PersistenceError);
}

TEST_F(InMemoryLedgerStoreTest, ReadView_RejectsWrites) {
    auto view = store_->read();

    EXPECT_THROW(view->balances().save(domain::BalanceAccount::open("user-1", Decimal(1))),
                 domain::PersistenceError);
    EXPECT_THROW(view->commit(), domain::PersistenceError);
}

// ============================================================================
// LOCKING TESTS
// ============================================================================

TEST_F(InMemoryLedgerStoreTest, Begin_SameUserHeld_TimesOutWithConflict) {
    auto held = store_->begin("user-1");

    std::atomic<bool> conflict{false};
    std::atomic<bool> otherUserLocked{false};
    std::thread contender([&]() {
        try {
            auto second = store_->begin("user-1");
        } catch (const domain::ConflictError&) {
            conflict = true;
        }
        auto other = store_->begin("user-2");
        otherUserLocked = true;
    });
    contender.join();

    EXPECT_TRUE(conflict.load());
    EXPECT_TRUE(otherUserLocked.load());
}

TEST_F(InMemoryLedgerStoreTest, Begin_AfterRelease_Succeeds) {
    {
        auto held = store_->begin("user-1");
    }

    std::atomic<bool> locked{false};
    std::thread next([&]() {
        auto uow = store_->begin("user-1");
        locked = true;
    });
    next.join();

    EXPECT_TRUE(locked.load());
}

// ============================================================================
// QUERY TESTS
// ============================================================================

TEST_F(InMemoryLedgerStoreTest, Orders_ActiveByUserAndStock) {
    auto uow = store_->begin("user-1");
    uow->orders().save(makeOrder("ord-1", "user-1", domain::OrderStatus::PENDING));
    uow->orders().save(makeOrder("ord-2", "user-1", domain::OrderStatus::PARTIALLY_FILLED));
    uow->orders().save(makeOrder("ord-3", "user-1", domain::OrderStatus::FILLED));
    uow->orders().save(makeOrder("ord-4", "user-2", domain::OrderStatus::PENDING));
    uow->commit();

    auto view = store_->read();
    auto active = view->orders().findActiveByUserAndStock("user-1", "005930", domain::OrderType::SELL);

    EXPECT_EQ(active.size(), 2u);
    EXPECT_TRUE(view->orders().findActiveByUserAndStock("user-1", "005930", domain::OrderType::BUY).empty());
}

TEST_F(InMemoryLedgerStoreTest, Orders_ExpirableAcrossUsers) {
    auto asOf = domain::Timestamp::now();
    auto due = makeOrder("ord-1", "user-1", domain::OrderStatus::PENDING);
    due.expiresAt = asOf.plusSeconds(-1);
    auto later = makeOrder("ord-2", "user-1", domain::OrderStatus::PENDING);
    later.expiresAt = asOf.plusSeconds(60);
    auto done = makeOrder("ord-3", "user-2", domain::OrderStatus::CANCELLED);
    done.expiresAt = asOf.plusSeconds(-1);
    auto other = makeOrder("ord-4", "user-2", domain::OrderStatus::PARTIALLY_FILLED);
    other.expiresAt = asOf;

    {
        auto uow = store_->begin("user-1");
        uow->orders().save(due);
        uow->orders().save(later);
        uow->commit();
    }
    {
        auto uow = store_->begin("user-2");
        uow->orders().save(done);
        uow->orders().save(other);
        uow->commit();
    }

    auto expirable = store_->read()->orders().findExpirable(asOf);

    ASSERT_EQ(expirable.size(), 2u);
    for (const auto& order : expirable) {
        EXPECT_TRUE(order.id == "ord-1" || order.id == "ord-4") << order.id;
    }
}

TEST_F(InMemoryLedgerStoreTest, Statistics_UpsertReplacesRow) {
    domain::TradingStatistics stats;
    stats.userId = "user-1";
    stats.periodStart = domain::Timestamp::now().startOfDay();
    stats.periodEnd = stats.periodStart.plusDays(1);
    stats.totalTrades = 1;

    {
        auto uow = store_->begin("user-1");
        uow->statistics().upsert(stats);
        uow->commit();
    }
    stats.totalTrades = 5;
    {
        auto uow = store_->begin("user-1");
        uow->statistics().upsert(stats);
        uow->commit();
    }

    auto view = store_->read();
    auto found = view->statistics().find("user-1", "daily", stats.periodStart);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->totalTrades, 5);
    EXPECT_EQ(view->statistics().findRange("user-1", "daily", stats.periodStart, stats.periodEnd).size(), 1u);
}
