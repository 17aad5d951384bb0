// include/domain/OrderRequest.hpp
#pragma once

#include "domain/Decimal.hpp"
#include "domain/Timestamp.hpp"
#include "domain/enums/OrderType.hpp"
#include "domain/enums/OrderMethod.hpp"
#include "domain/enums/OrderStatus.hpp"
#include "domain/enums/TransactionType.hpp"
#include <map>
#include <optional>
#include <string>

namespace ledger::domain {

/**
 * @brief Параметры создания ордера
 */
struct OrderRequest {
    std::string userId;
    std::string stockId;
    OrderType orderType = OrderType::BUY;
    OrderMethod orderMethod = OrderMethod::LIMIT;
    Decimal quantity;
    std::optional<Decimal> orderPrice;
    std::optional<Timestamp> expiresAt;
    std::string notes;
};

/**
 * @brief Изменение активного ордера (пустые поля не меняются)
 */
struct OrderAmendment {
    std::optional<Decimal> quantity;
    std::optional<Decimal> orderPrice;
    std::optional<Timestamp> expiresAt;
};

/**
 * @brief Отчёт об исполнении от market-data или back-office
 */
struct ExecutionRequest {
    std::string orderId;
    Decimal executionPrice;
    std::optional<Decimal> executedQuantity;    ///< null = остаток целиком
    std::optional<Decimal> commission;          ///< null = FeeCalculator
    std::optional<Decimal> tax;
    std::optional<Decimal> currentExchangeRate; ///< null = курс ордера
};

struct OrderFilter {
    std::optional<OrderStatus> status;
    std::optional<std::string> stockId;
    std::optional<OrderType> orderType;
    size_t limit = 100;
};

struct TransactionFilter {
    std::optional<TransactionType> transactionType;
    std::optional<Timestamp> from;              ///< Включительно
    std::optional<Timestamp> to;                ///< Не включительно
    size_t limit = 100;
};

/**
 * @brief Сводка по ордерам пользователя
 */
struct OrderSummary {
    std::map<OrderStatus, int> countByStatus;
    int totalOrders = 0;
    Decimal totalExecutedAmount;
    Decimal totalFee;
};

} // namespace ledger::domain
