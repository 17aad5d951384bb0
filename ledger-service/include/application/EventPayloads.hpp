// include/application/EventPayloads.hpp
#pragma once

#include "domain/BalanceAccount.hpp"
#include "domain/Order.hpp"
#include "domain/Transaction.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "domain/LedgerErrors.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace ledger::application {

/**
 * @brief Routing keys событий леджера (exchange ledger.events)
 */
namespace events {
    inline const std::string ORDER_CREATED = "order.created";
    inline const std::string ORDER_AMENDED = "order.amended";
    inline const std::string ORDER_CANCELLED = "order.cancelled";
    inline const std::string ORDER_EXPIRED = "order.expired";
    inline const std::string ORDER_PARTIALLY_FILLED = "order.partially_filled";
    inline const std::string ORDER_FILLED = "order.filled";
    inline const std::string ORDER_EXECUTION_FAILED = "order.execution_failed";
    inline const std::string TRANSACTION_SETTLED = "transaction.settled";
    inline const std::string ORDER_REJECTED = "order.rejected";
    inline const std::string BALANCE_CHANGED = "balance.changed";
    inline const std::string ACCOUNT_REJECTED = "account.rejected";

    // Входящие команды
    inline const std::string EXECUTION_REPORT = "execution.report";
    inline const std::string ORDER_CREATE = "order.create";
    inline const std::string ORDER_AMEND = "order.amend";
    inline const std::string ORDER_CANCEL = "order.cancel";
    inline const std::string ORDER_EXPIRE = "order.expire";
    inline const std::string ACCOUNT_OPEN = "account.open";
    inline const std::string ACCOUNT_DEPOSIT = "account.deposit";
    inline const std::string ACCOUNT_WITHDRAW = "account.withdraw";
}

// Денежные значения передаются строками, чтобы не терять точность
inline nlohmann::json decimalOrNull(const std::optional<domain::Decimal>& value) {
    return value ? nlohmann::json(value->toString()) : nlohmann::json(nullptr);
}

inline nlohmann::json timestampOrNull(const std::optional<domain::Timestamp>& value) {
    return value ? nlohmann::json(value->toString()) : nlohmann::json(nullptr);
}

inline nlohmann::json orderToJson(const domain::Order& order) {
    return {
        {"order_id", order.id},
        {"user_id", order.userId},
        {"stock_id", order.stockId},
        {"order_type", domain::toString(order.orderType)},
        {"order_method", domain::toString(order.orderMethod)},
        {"order_status", domain::toString(order.orderStatus)},
        {"quantity", order.quantity.toString()},
        {"order_price", decimalOrNull(order.orderPrice)},
        {"currency", order.currency},
        {"executed_quantity", order.executedQuantity.toString()},
        {"executed_amount", order.executedAmount.toString()},
        {"average_price", order.averagePrice.toString()},
        {"total_fee", order.totalFee.toString()},
        {"reserved_amount", order.reservedAmount.toString()},
        {"order_date", order.orderDate.toString()},
        {"expires_at", timestampOrNull(order.expiresAt)}
    };
}

inline nlohmann::json transactionToJson(const domain::Transaction& transaction) {
    nlohmann::json json = {
        {"transaction_id", transaction.id},
        {"user_id", transaction.userId},
        {"order_id", transaction.orderId ? nlohmann::json(*transaction.orderId) : nlohmann::json(nullptr)},
        {"transaction_type", domain::toString(transaction.transactionType)},
        {"quantity", transaction.quantity.toString()},
        {"price", transaction.price.toString()},
        {"amount", transaction.amount.toString()},
        {"commission", transaction.commission.toString()},
        {"tax", transaction.tax.toString()},
        {"net_amount", transaction.netAmount.toString()},
        {"cash_balance_after", transaction.cashBalanceAfter.toString()},
        {"realized_profit_loss", decimalOrNull(transaction.realizedProfitLoss)},
        {"transaction_date", transaction.transactionDate.toString()}
    };
    if (transaction.productCode) {
        json["product_code"] = *transaction.productCode;
    }
    return json;
}

inline nlohmann::json balanceToJson(const domain::BalanceAccount& account) {
    return {
        {"user_id", account.userId},
        {"cash_balance", account.cashBalance.toString()},
        {"available_cash", account.availableCash.toString()},
        {"invested_amount", account.investedAmount.toString()}
    };
}

/**
 * @brief Десятичное поле: строка или число; nullopt если отсутствует/null
 * @throws domain::ValidationError при неверном формате
 */
inline std::optional<domain::Decimal> decimalFromJson(const nlohmann::json& json, const char* key) {
    if (!json.contains(key) || json[key].is_null()) {
        return std::nullopt;
    }
    const auto& value = json[key];
    try {
        if (value.is_string()) {
            return domain::Decimal::fromString(value.get<std::string>());
        }
        if (value.is_number_integer()) {
            return domain::Decimal(value.get<int64_t>());
        }
        if (value.is_number_float()) {
            return domain::Decimal::fromDouble(value.get<double>());
        }
    } catch (const std::logic_error& e) {
        throw domain::ValidationError(std::string("Invalid ") + key + ": " + e.what());
    }
    throw domain::ValidationError(std::string("Invalid ") + key + ": expected number");
}

/**
 * @brief Код ошибки для событий *.rejected / *.failed
 */
inline std::string errorTypeOf(const std::exception& e) {
    if (dynamic_cast<const domain::ValidationError*>(&e)) return "VALIDATION";
    if (dynamic_cast<const std::invalid_argument*>(&e)) return "VALIDATION";
    if (dynamic_cast<const domain::InsufficientBalanceError*>(&e)) return "INSUFFICIENT_BALANCE";
    if (dynamic_cast<const domain::NotFoundError*>(&e)) return "NOT_FOUND";
    if (dynamic_cast<const domain::ConflictError*>(&e)) return "CONFLICT";
    return "INTERNAL";
}

/**
 * @brief Опубликовать событие после commit
 *
 * Ошибка брокера не откатывает уже зафиксированный леджер: она логируется.
 */
inline void publishEvent(const std::shared_ptr<ports::output::IEventPublisher>& publisher,
                         const std::string& component,
                         const std::string& routingKey,
                         const nlohmann::json& payload) {
    if (!publisher) return;
    try {
        publisher->publish(routingKey, payload.dump());
    } catch (const std::exception& e) {
        std::cerr << "[" << component << "] Failed to publish " << routingKey
                  << ": " << e.what() << std::endl;
    }
}

} // namespace ledger::application
