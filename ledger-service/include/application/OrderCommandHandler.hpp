// include/application/OrderCommandHandler.hpp
#pragma once

#include "ports/input/IExecutionSettler.hpp"
#include "ports/input/IOrderLedger.hpp"
#include "ports/output/IEventConsumer.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "application/EventPayloads.hpp"
#include "domain/LedgerErrors.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>
#include <optional>

namespace ledger::application {

/**
 * @brief Обработчик входящих команд по ордерам и исполнениям
 *
 * Слушает из ledger.events:
 * - order.create -> OrderLedger::createOrder
 *   {"user_id", "stock_id", "order_type", "order_method", "quantity", "order_price"?,
 *    "expires_at"?, "notes"?, "client_order_id"?}
 * - order.amend -> OrderLedger::amendOrder
 *   {"user_id", "order_id", "quantity"?, "order_price"?, "expires_at"?}
 * - order.cancel -> OrderLedger::cancelOrder {"user_id", "order_id"}
 * - order.expire -> OrderLedger::expireOrders {"as_of"?}
 * - execution.report -> ExecutionSettler::execute
 *   {"order_id", "execution_price", "executed_quantity"?, "commission"?, "tax"?,
 *    "current_exchange_rate"?}
 *
 * Числа принимаются строкой ("10000.5") или JSON-числом.
 * Отказ по order.create/amend/cancel публикуется как order.rejected,
 * неудачный execution.report - как order.execution_failed.
 *
 * Подписка выполняется в конструкторе, поэтому объект нужно создать
 * до start() потребителя.
 */
class OrderCommandHandler {
public:
    OrderCommandHandler(
        std::shared_ptr<ports::output::IEventConsumer> eventConsumer,
        std::shared_ptr<ports::output::IEventPublisher> eventPublisher,
        std::shared_ptr<ports::input::IExecutionSettler> settler,
        std::shared_ptr<ports::input::IOrderLedger> orderLedger
    ) : eventConsumer_(std::move(eventConsumer))
      , eventPublisher_(std::move(eventPublisher))
      , settler_(std::move(settler))
      , orderLedger_(std::move(orderLedger))
    {
        std::cout << "[OrderCommandHandler] Created" << std::endl;
        subscribe();
    }

private:
    std::shared_ptr<ports::output::IEventConsumer> eventConsumer_;
    std::shared_ptr<ports::output::IEventPublisher> eventPublisher_;
    std::shared_ptr<ports::input::IExecutionSettler> settler_;
    std::shared_ptr<ports::input::IOrderLedger> orderLedger_;

    void subscribe() {
        std::cout << "[OrderCommandHandler] Subscribing to "
                  << events::ORDER_CREATE << ", " << events::ORDER_AMEND << ", "
                  << events::ORDER_CANCEL << ", " << events::ORDER_EXPIRE << ", "
                  << events::EXECUTION_REPORT << std::endl;

        eventConsumer_->subscribe(
            {events::ORDER_CREATE, events::ORDER_AMEND, events::ORDER_CANCEL,
             events::ORDER_EXPIRE, events::EXECUTION_REPORT},
            [this](const std::string& routingKey, const std::string& message) {
                handleCommand(routingKey, message);
            }
        );
    }

    void handleCommand(const std::string& routingKey, const std::string& message) {
        std::cout << "[OrderCommandHandler] Received " << routingKey << std::endl;

        nlohmann::json json;
        try {
            json = nlohmann::json::parse(message);
        } catch (const nlohmann::json::parse_error& e) {
            std::cerr << "[OrderCommandHandler] Malformed " << routingKey << ": " << e.what() << std::endl;
            return;
        }

        if (routingKey == events::EXECUTION_REPORT) {
            handleExecutionReport(json);
        } else if (routingKey == events::ORDER_CREATE) {
            handleCreate(json);
        } else if (routingKey == events::ORDER_AMEND) {
            handleAmend(json);
        } else if (routingKey == events::ORDER_CANCEL) {
            handleCancel(json);
        } else if (routingKey == events::ORDER_EXPIRE) {
            handleExpire(json);
        } else {
            std::cout << "[OrderCommandHandler] Unknown command: " << routingKey << std::endl;
        }
    }

    void handleCreate(const nlohmann::json& json) {
        std::string userId = stringField(json, "user_id");
        std::string clientOrderId = stringField(json, "client_order_id");
        try {
            domain::OrderRequest request;
            request.userId = userId;
            request.stockId = stringField(json, "stock_id");
            request.orderType = domain::orderTypeFromString(stringField(json, "order_type"));
            request.orderMethod = domain::orderMethodFromString(stringField(json, "order_method"));
            auto quantity = decimalFromJson(json, "quantity");
            if (!quantity) {
                throw domain::ValidationError("Missing required field: quantity");
            }
            request.quantity = *quantity;
            request.orderPrice = decimalFromJson(json, "order_price");
            request.expiresAt = timestampField(json, "expires_at");
            request.notes = stringField(json, "notes");

            auto order = orderLedger_->createOrder(request);
            std::cout << "[OrderCommandHandler] Created order " << order.id
                      << (clientOrderId.empty() ? "" : " for client order " + clientOrderId) << std::endl;
        } catch (const std::exception& e) {
            reject(events::ORDER_CREATE, userId, "", clientOrderId, e);
        }
    }

    void handleAmend(const nlohmann::json& json) {
        std::string userId = stringField(json, "user_id");
        std::string orderId = stringField(json, "order_id");
        try {
            domain::OrderAmendment amendment;
            amendment.quantity = decimalFromJson(json, "quantity");
            amendment.orderPrice = decimalFromJson(json, "order_price");
            amendment.expiresAt = timestampField(json, "expires_at");
            orderLedger_->amendOrder(userId, orderId, amendment);
        } catch (const std::exception& e) {
            reject(events::ORDER_AMEND, userId, orderId, "", e);
        }
    }

    void handleCancel(const nlohmann::json& json) {
        std::string userId = stringField(json, "user_id");
        std::string orderId = stringField(json, "order_id");
        try {
            orderLedger_->cancelOrder(userId, orderId);
        } catch (const std::exception& e) {
            reject(events::ORDER_CANCEL, userId, orderId, "", e);
        }
    }

    void handleExpire(const nlohmann::json& json) {
        try {
            auto asOf = timestampField(json, "as_of").value_or(domain::Timestamp::now());
            size_t expired = orderLedger_->expireOrders(asOf);
            std::cout << "[OrderCommandHandler] order.expire as of " << asOf.toString()
                      << ": " << expired << " expired" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[OrderCommandHandler] order.expire failed: " << e.what() << std::endl;
        }
    }

    void handleExecutionReport(const nlohmann::json& json) {
        std::string orderId = stringField(json, "order_id");
        try {
            domain::ExecutionRequest request;
            request.orderId = orderId;
            auto price = decimalFromJson(json, "execution_price");
            if (!price) {
                throw domain::ValidationError("Missing required field: execution_price");
            }
            request.executionPrice = *price;
            request.executedQuantity = decimalFromJson(json, "executed_quantity");
            request.commission = decimalFromJson(json, "commission");
            request.tax = decimalFromJson(json, "tax");
            request.currentExchangeRate = decimalFromJson(json, "current_exchange_rate");

            settler_->execute(request);
        } catch (const std::exception& e) {
            std::cerr << "[OrderCommandHandler] Execution of " << orderId << " failed: "
                      << e.what() << std::endl;
            publishEvent(eventPublisher_, "OrderCommandHandler", events::ORDER_EXECUTION_FAILED,
                         {{"order_id", orderId}, {"error_type", errorTypeOf(e)}, {"reason", e.what()}});
        }
    }

    void reject(const std::string& command, const std::string& userId, const std::string& orderId,
                const std::string& clientOrderId, const std::exception& e) {
        std::cerr << "[OrderCommandHandler] " << command << " rejected for user " << userId
                  << ": " << e.what() << std::endl;

        nlohmann::json payload = {
            {"command", command},
            {"user_id", userId},
            {"order_id", orderId.empty() ? nlohmann::json(nullptr) : nlohmann::json(orderId)},
            {"error_type", errorTypeOf(e)},
            {"reason", e.what()}
        };
        if (!clientOrderId.empty()) {
            payload["client_order_id"] = clientOrderId;
        }
        publishEvent(eventPublisher_, "OrderCommandHandler", events::ORDER_REJECTED, payload);
    }

    static std::string stringField(const nlohmann::json& json, const char* key) {
        if (!json.contains(key) || !json[key].is_string()) {
            return "";
        }
        return json[key].get<std::string>();
    }

    /**
     * @throws domain::ValidationError при неверном формате даты
     */
    static std::optional<domain::Timestamp> timestampField(const nlohmann::json& json, const char* key) {
        std::string value = stringField(json, key);
        if (value.empty()) {
            return std::nullopt;
        }
        try {
            return domain::Timestamp::fromString(value);
        } catch (const std::invalid_argument& e) {
            throw domain::ValidationError(std::string("Invalid ") + key + ": " + e.what());
        }
    }
};

} // namespace ledger::application
