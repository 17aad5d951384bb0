/**
 * @file OrderCommandHandlerTest.cpp
 * @brief Unit tests for OrderCommandHandler (order.* and execution.report)
 */

#include <gtest/gtest.h>
#include "../fixtures/LedgerFixture.hpp"
#include "../mocks/MockEventConsumer.hpp"
#include "application/OrderCommandHandler.hpp"
#include <nlohmann/json.hpp>

using namespace ledger;
using namespace ledger::application;
using namespace ledger::tests;
using domain::Decimal;
using domain::OrderStatus;
using domain::OrderType;

class OrderCommandHandlerTest : public LedgerFixture {
protected:
    void SetUp() override {
        LedgerFixture::SetUp();
        consumer_ = std::make_shared<MockEventConsumer>();
        handler_ = std::make_unique<OrderCommandHandler>(consumer_, publisher_, settler_, orderLedger_);
        openAccount("user-1");
        publisher_->clearMessages();
    }

    nlohmann::json lastRejection(const std::string& routingKey) {
        auto messages = publisher_->messagesFor(routingKey);
        if (messages.empty()) {
            ADD_FAILURE() << "No " << routingKey << " published";
            return nlohmann::json::object();
        }
        return nlohmann::json::parse(messages.back().message);
    }

    std::shared_ptr<MockEventConsumer> consumer_;
    std::unique_ptr<OrderCommandHandler> handler_;
};

// ============================================================================
// SUBSCRIPTION TESTS
// ============================================================================

TEST_F(OrderCommandHandlerTest, Subscribes_ToOrderCommands) {
    EXPECT_TRUE(consumer_->isSubscribed(events::ORDER_CREATE));
    EXPECT_TRUE(consumer_->isSubscribed(events::ORDER_AMEND));
    EXPECT_TRUE(consumer_->isSubscribed(events::ORDER_CANCEL));
    EXPECT_TRUE(consumer_->isSubscribed(events::ORDER_EXPIRE));
    EXPECT_TRUE(consumer_->isSubscribed(events::EXECUTION_REPORT));
}

// ============================================================================
// ORDER.CREATE TESTS
// ============================================================================

TEST_F(OrderCommandHandlerTest, Create_ValidCommand_ReservesFunds) {
    consumer_->deliver(events::ORDER_CREATE, R"({
        "user_id": "user-1",
        "stock_id": "005930",
        "order_type": "BUY",
        "order_method": "LIMIT",
        "quantity": "10",
        "order_price": 10000,
        "client_order_id": "c-1"
    })");

    auto pending = orderLedger_->getPendingOrders("user-1");
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].reservedAmount, Decimal(100015));
    EXPECT_EQ(publisher_->messagesFor(events::ORDER_CREATED).size(), 1u);
    EXPECT_TRUE(publisher_->messagesFor(events::ORDER_REJECTED).empty());
}

TEST_F(OrderCommandHandlerTest, Create_InsufficientBalance_PublishesRejection) {
    consumer_->deliver(events::ORDER_CREATE, R"({
        "user_id": "user-1",
        "stock_id": "005930",
        "order_type": "BUY",
        "order_method": "LIMIT",
        "quantity": "1000",
        "order_price": "10000",
        "client_order_id": "c-2"
    })");

    auto json = lastRejection(events::ORDER_REJECTED);
    EXPECT_EQ(json["command"], events::ORDER_CREATE);
    EXPECT_EQ(json["user_id"], "user-1");
    EXPECT_TRUE(json["order_id"].is_null());
    EXPECT_EQ(json["client_order_id"], "c-2");
    EXPECT_EQ(json["error_type"], "INSUFFICIENT_BALANCE");
    EXPECT_NE(json["reason"].get<std::string>().find("shortfall"), std::string::npos);
    EXPECT_TRUE(orderLedger_->getPendingOrders("user-1").empty());
}

TEST_F(OrderCommandHandlerTest, Create_UnknownEnum_RejectedAsValidation) {
    consumer_->deliver(events::ORDER_CREATE, R"({
        "user_id": "user-1",
        "stock_id": "005930",
        "order_type": "HOLD",
        "order_method": "LIMIT",
        "quantity": "1",
        "order_price": "10000"
    })");

    EXPECT_EQ(lastRejection(events::ORDER_REJECTED)["error_type"], "VALIDATION");
}

TEST_F(OrderCommandHandlerTest, Create_MissingQuantity_RejectedAsValidation) {
    consumer_->deliver(events::ORDER_CREATE, R"({
        "user_id": "user-1",
        "stock_id": "005930",
        "order_type": "BUY",
        "order_method": "LIMIT",
        "order_price": "10000"
    })");

    EXPECT_EQ(lastRejection(events::ORDER_REJECTED)["error_type"], "VALIDATION");
}

TEST_F(OrderCommandHandlerTest, Create_BadExpiry_RejectedAsValidation) {
    consumer_->deliver(events::ORDER_CREATE, R"({
        "user_id": "user-1",
        "stock_id": "005930",
        "order_type": "BUY",
        "order_method": "LIMIT",
        "quantity": "1",
        "order_price": "10000",
        "expires_at": "tomorrow"
    })");

    EXPECT_EQ(lastRejection(events::ORDER_REJECTED)["error_type"], "VALIDATION");
}

TEST_F(OrderCommandHandlerTest, MalformedJson_Ignored) {
    EXPECT_NO_THROW(consumer_->deliver(events::ORDER_CREATE, "{not json"));
    EXPECT_EQ(publisher_->publishCallCount(), 0);
}

// ============================================================================
// ORDER.AMEND / ORDER.CANCEL TESTS
// ============================================================================

TEST_F(OrderCommandHandlerTest, Amend_AdjustsReservation) {
    auto order = placeLimit("user-1", OrderType::BUY, "005930", 10, 10000);

    nlohmann::json command = {{"user_id", "user-1"}, {"order_id", order.id}, {"quantity", "20"}};
    consumer_->deliver(events::ORDER_AMEND, command.dump());

    EXPECT_EQ(orderLedger_->getOrder("user-1", order.id).reservedAmount, Decimal(200030));
    EXPECT_EQ(balance("user-1").availableCash, Decimal(799970));
}

TEST_F(OrderCommandHandlerTest, Cancel_RestoresFunds) {
    auto order = placeLimit("user-1", OrderType::BUY, "005930", 10, 10000);

    nlohmann::json command = {{"user_id", "user-1"}, {"order_id", order.id}};
    consumer_->deliver(events::ORDER_CANCEL, command.dump());

    EXPECT_EQ(orderLedger_->getOrder("user-1", order.id).orderStatus, OrderStatus::CANCELLED);
    EXPECT_EQ(balance("user-1").availableCash, Decimal(1000000));
}

TEST_F(OrderCommandHandlerTest, Cancel_UnknownOrder_PublishesNotFound) {
    consumer_->deliver(events::ORDER_CANCEL, R"({"user_id": "user-1", "order_id": "ord-missing"})");

    auto json = lastRejection(events::ORDER_REJECTED);
    EXPECT_EQ(json["command"], events::ORDER_CANCEL);
    EXPECT_EQ(json["order_id"], "ord-missing");
    EXPECT_EQ(json["error_type"], "NOT_FOUND");
}

TEST_F(OrderCommandHandlerTest, Expire_UsesAsOf) {
    domain::OrderRequest request;
    request.userId = "user-1";
    request.stockId = "005930";
    request.orderMethod = domain::OrderMethod::LIMIT;
    request.quantity = Decimal(1);
    request.orderPrice = Decimal(10000);
    request.expiresAt = domain::Timestamp::now().plusSeconds(3600);
    auto order = orderLedger_->createOrder(request);

    nlohmann::json command = {{"as_of", domain::Timestamp::now().plusDays(1).toString()}};
    consumer_->deliver(events::ORDER_EXPIRE, command.dump());

    EXPECT_EQ(orderLedger_->getOrder("user-1", order.id).orderStatus, OrderStatus::EXPIRED);
}

// ============================================================================
// EXECUTION.REPORT TESTS
// ============================================================================

TEST_F(OrderCommandHandlerTest, ExecutionReport_SettlesOrder) {
    auto order = placeLimit("user-1", OrderType::BUY, "005930", 10, 10000);

    nlohmann::json report = {{"order_id", order.id}, {"execution_price", "10000"}};
    consumer_->deliver(events::EXECUTION_REPORT, report.dump());

    EXPECT_EQ(orderLedger_->getOrder("user-1", order.id).orderStatus, OrderStatus::FILLED);
    EXPECT_EQ(balance("user-1").cashBalance, Decimal(899985));
    EXPECT_EQ(publisher_->messagesFor(events::ORDER_FILLED).size(), 1u);
    EXPECT_EQ(publisher_->messagesFor(events::TRANSACTION_SETTLED).size(), 1u);
}

TEST_F(OrderCommandHandlerTest, ExecutionReport_PartialWithFeeOverride) {
    auto order = placeLimit("user-1", OrderType::BUY, "005930", 10, 10000);

    nlohmann::json report = {
        {"order_id", order.id},
        {"execution_price", 10000},
        {"executed_quantity", 4},
        {"commission", "0"}
    };
    consumer_->deliver(events::EXECUTION_REPORT, report.dump());

    auto stored = orderLedger_->getOrder("user-1", order.id);
    EXPECT_EQ(stored.orderStatus, OrderStatus::PARTIALLY_FILLED);
    EXPECT_EQ(stored.executedQuantity, Decimal(4));
    EXPECT_TRUE(stored.commission.isZero());
}

TEST_F(OrderCommandHandlerTest, ExecutionReport_UnknownOrder_PublishesFailure) {
    consumer_->deliver(events::EXECUTION_REPORT, R"({"order_id": "ord-missing", "execution_price": "100"})");

    auto json = lastRejection(events::ORDER_EXECUTION_FAILED);
    EXPECT_EQ(json["order_id"], "ord-missing");
    EXPECT_EQ(json["error_type"], "NOT_FOUND");
}

TEST_F(OrderCommandHandlerTest, ExecutionReport_MissingPrice_PublishesValidationFailure) {
    auto order = placeLimit("user-1", OrderType::BUY, "005930", 10, 10000);

    nlohmann::json report = {{"order_id", order.id}};
    consumer_->deliver(events::EXECUTION_REPORT, report.dump());

    EXPECT_EQ(lastRejection(events::ORDER_EXECUTION_FAILED)["error_type"], "VALIDATION");
    EXPECT_EQ(orderLedger_->getOrder("user-1", order.id).orderStatus, OrderStatus::PENDING);
}
