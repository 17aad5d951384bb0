#pragma once

#include <gtest/gtest.h>
#include "application/BalanceService.hpp"
#include "application/ExecutionSettler.hpp"
#include "application/FeeCalculator.hpp"
#include "application/OrderLedger.hpp"
#include "application/PortfolioService.hpp"
#include "application/StatisticsAggregator.hpp"
#include "adapters/secondary/persistence/InMemoryLedgerStore.hpp"
#include "adapters/secondary/market/QuoteCache.hpp"
#include "settings/LedgerSettings.hpp"
#include "../mocks/MockEventPublisher.hpp"
#include <memory>

namespace ledger::tests {

/**
 * @brief Полный леджер поверх InMemoryLedgerStore
 *
 * Тарифы: комиссия 0.015% (без минимума), налог 0.23% с продажи,
 * округление до целых. Базовая валюта KRW.
 */
class LedgerFixture : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<adapters::secondary::InMemoryLedgerStore>();
        quotes_ = std::make_shared<adapters::secondary::QuoteCache>();
        publisher_ = std::make_shared<MockEventPublisher>();

        settings_ = std::make_shared<settings::LedgerSettings>();
        settings_->setBaseCurrency("KRW");
        settings_->setDefaultInitialCash(domain::Decimal(1000000));
        settings_->setOrderTtlMinutes(0);

        domain::FeeSchedule schedule;
        schedule.commissionRate = domain::Decimal::fromString("0.00015");
        schedule.minCommission = domain::Decimal();
        schedule.taxRate = domain::Decimal::fromString("0.0023");
        schedule.precision = 0;
        fees_ = std::make_shared<application::FeeCalculator>(schedule);

        orderLedger_ = std::make_shared<application::OrderLedger>(store_, quotes_, publisher_, fees_, settings_);
        settler_ = std::make_shared<application::ExecutionSettler>(store_, publisher_, fees_, settings_);
        balances_ = std::make_shared<application::BalanceService>(store_, publisher_, settings_);
        portfolio_ = std::make_shared<application::PortfolioService>(store_);
        statistics_ = std::make_shared<application::StatisticsAggregator>(store_);
    }

    domain::BalanceAccount openAccount(const std::string& userId, int64_t cash = 1000000) {
        return balances_->openAccount(userId, domain::Decimal(cash));
    }

    domain::Order placeLimit(const std::string& userId, domain::OrderType type,
                             const std::string& stockId, int64_t quantity, int64_t price) {
        domain::OrderRequest request;
        request.userId = userId;
        request.stockId = stockId;
        request.orderType = type;
        request.orderMethod = domain::OrderMethod::LIMIT;
        request.quantity = domain::Decimal(quantity);
        request.orderPrice = domain::Decimal(price);
        return orderLedger_->createOrder(request);
    }

    ports::input::SettlementResult fill(const std::string& orderId, int64_t price,
                                        std::optional<int64_t> quantity = std::nullopt) {
        domain::ExecutionRequest request;
        request.orderId = orderId;
        request.executionPrice = domain::Decimal(price);
        if (quantity) {
            request.executedQuantity = domain::Decimal(*quantity);
        }
        return settler_->execute(request);
    }

    /**
     * @brief Счёт с 1,000,000 и исполненной покупкой 10 @ 10,000
     */
    void holdTenShares(const std::string& userId, const std::string& stockId = "005930") {
        openAccount(userId);
        auto buy = placeLimit(userId, domain::OrderType::BUY, stockId, 10, 10000);
        fill(buy.id, 10000);
    }

    domain::BalanceAccount balance(const std::string& userId) {
        return balances_->getBalance(userId);
    }

    std::shared_ptr<adapters::secondary::InMemoryLedgerStore> store_;
    std::shared_ptr<adapters::secondary::QuoteCache> quotes_;
    std::shared_ptr<MockEventPublisher> publisher_;
    std::shared_ptr<settings::LedgerSettings> settings_;
    std::shared_ptr<application::FeeCalculator> fees_;

    std::shared_ptr<application::OrderLedger> orderLedger_;
    std::shared_ptr<application::ExecutionSettler> settler_;
    std::shared_ptr<application::BalanceService> balances_;
    std::shared_ptr<application::PortfolioService> portfolio_;
    std::shared_ptr<application::StatisticsAggregator> statistics_;
};

} // namespace ledger::tests
