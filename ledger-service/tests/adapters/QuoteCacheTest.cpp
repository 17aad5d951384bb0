/**
 * @file QuoteCacheTest.cpp
 * @brief Unit tests for QuoteCache
 */

#include <gtest/gtest.h>
#include "adapters/secondary/market/QuoteCache.hpp"
#include "adapters/secondary/events/InMemoryEventBus.hpp"

using namespace ledger;
using namespace ledger::adapters::secondary;
using domain::Decimal;

class QuoteCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        bus_ = std::make_shared<InMemoryEventBus>();
        cache_ = std::make_shared<QuoteCache>();
        cache_->listen(bus_);
        bus_->start();
    }

    std::shared_ptr<InMemoryEventBus> bus_;
    std::shared_ptr<QuoteCache> cache_;
};

TEST_F(QuoteCacheTest, Empty_ReturnsNullopt) {
    EXPECT_FALSE(cache_->getQuote("005930").has_value());
    EXPECT_FALSE(cache_->getExchangeRate("USD").has_value());
}

TEST_F(QuoteCacheTest, SetQuote_Direct) {
    cache_->setQuote("005930", Decimal(71000), "KRW");

    auto quote = cache_->getQuote("005930");
    ASSERT_TRUE(quote.has_value());
    EXPECT_EQ(quote->productCode, "005930");
    EXPECT_EQ(quote->price, Decimal(71000));
    EXPECT_EQ(quote->currency, "KRW");
}

TEST_F(QuoteCacheTest, QuoteUpdated_ByFigi) {
    bus_->publish("quote.updated", R"({"figi": "BBG004730N88", "last_price": 280.5, "currency": "RUB"})");

    auto quote = cache_->getQuote("BBG004730N88");
    ASSERT_TRUE(quote.has_value());
    EXPECT_EQ(quote->price, Decimal::fromString("280.5"));
    EXPECT_EQ(quote->currency, "RUB");
}

TEST_F(QuoteCacheTest, QuoteUpdated_ByProductCode_Replaces) {
    bus_->publish("quote.updated", R"({"product_code": "AAPL", "last_price": "100", "currency": "USD"})");
    bus_->publish("quote.updated", R"({"product_code": "AAPL", "last_price": "101.25", "currency": "USD"})");

    EXPECT_EQ(cache_->getQuote("AAPL")->price, Decimal::fromString("101.25"));
}

TEST_F(QuoteCacheTest, FxUpdated_StoresRate) {
    bus_->publish("fx.updated", R"({"currency": "USD", "rate": "1350.5"})");

    auto rate = cache_->getExchangeRate("USD");
    ASSERT_TRUE(rate.has_value());
    EXPECT_EQ(*rate, Decimal::fromString("1350.5"));
}

TEST_F(QuoteCacheTest, InvalidEvents_Ignored) {
    bus_->publish("quote.updated", "not json");
    bus_->publish("quote.updated", R"({"product_code": "AAPL"})");
    bus_->publish("quote.updated", R"({"product_code": "AAPL", "last_price": "abc"})");
    bus_->publish("fx.updated", R"({"currency": "USD", "rate": "-1"})");

    EXPECT_FALSE(cache_->getQuote("AAPL").has_value());
    EXPECT_FALSE(cache_->getExchangeRate("USD").has_value());
}
