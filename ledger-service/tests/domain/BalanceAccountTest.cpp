/**
 * @file BalanceAccountTest.cpp
 * @brief Unit tests for BalanceAccount reservation arithmetic
 */

#include <gtest/gtest.h>
#include "domain/BalanceAccount.hpp"

using namespace ledger::domain;

class BalanceAccountTest : public ::testing::Test {
protected:
    void SetUp() override {
        account_ = BalanceAccount::open("user-1", Decimal(1000000));
    }

    BalanceAccount account_;
};

TEST_F(BalanceAccountTest, Open_CashEqualsAvailable) {
    EXPECT_EQ(account_.cashBalance, Decimal(1000000));
    EXPECT_EQ(account_.availableCash, Decimal(1000000));
    EXPECT_TRUE(account_.reservedCash().isZero());
    EXPECT_TRUE(account_.isConsistent());
}

TEST_F(BalanceAccountTest, Reserve_ReducesAvailableOnly) {
    ASSERT_TRUE(account_.reserve(Decimal(100015)));

    EXPECT_EQ(account_.cashBalance, Decimal(1000000));
    EXPECT_EQ(account_.availableCash, Decimal(899985));
    EXPECT_EQ(account_.reservedCash(), Decimal(100015));
}

TEST_F(BalanceAccountTest, Reserve_MoreThanAvailable_Refused) {
    EXPECT_FALSE(account_.reserve(Decimal(1000001)));

    EXPECT_EQ(account_.availableCash, Decimal(1000000));
}

TEST_F(BalanceAccountTest, ReleaseThenDebit_SettlesReservation) {
    ASSERT_TRUE(account_.reserve(Decimal(100015)));

    account_.release(Decimal(100015));
    ASSERT_TRUE(account_.debit(Decimal(105016)));

    EXPECT_EQ(account_.cashBalance, Decimal(894984));
    EXPECT_EQ(account_.availableCash, Decimal(894984));
    EXPECT_TRUE(account_.isConsistent());
}

TEST_F(BalanceAccountTest, Debit_CannotConsumeReservedCash) {
    ASSERT_TRUE(account_.reserve(Decimal(900000)));

    EXPECT_FALSE(account_.debit(Decimal(200000)));
    EXPECT_EQ(account_.cashBalance, Decimal(1000000));
}

TEST_F(BalanceAccountTest, Credit_IncreasesBoth) {
    account_.credit(Decimal(500));

    EXPECT_EQ(account_.cashBalance, Decimal(1000500));
    EXPECT_EQ(account_.availableCash, Decimal(1000500));
}
