// include/domain/Transaction.hpp
#pragma once

#include "domain/Decimal.hpp"
#include "domain/Timestamp.hpp"
#include "domain/enums/TransactionType.hpp"
#include <optional>
#include <string>

namespace ledger::domain {

/**
 * @brief Неизменяемая проводка: исполнение сделки или движение денег
 *
 * Все суммы - в базовой валюте. Поля курсовой разницы заполняются
 * только для продаж.
 */
struct Transaction {
    std::string id;
    std::string userId;
    std::optional<std::string> orderId;         ///< null для DEPOSIT/WITHDRAW
    std::optional<std::string> productCode;
    TransactionType transactionType = TransactionType::BUY;
    Decimal quantity;
    Decimal price;                              ///< Цена исполнения, валюта инструмента
    Decimal amount;                             ///< Валовая сумма
    Decimal commission;
    Decimal tax;
    Decimal netAmount;                          ///< Влияние на cash_balance (знаковое)
    Decimal cashBalanceBefore;
    Decimal cashBalanceAfter;

    std::optional<Decimal> realizedProfitLoss;
    std::optional<Decimal> purchaseAverageExchangeRate;
    std::optional<Decimal> currentExchangeRate;
    std::optional<Decimal> exchangeProfitLoss;
    std::optional<Decimal> priceProfitLoss;

    std::string description;
    Timestamp transactionDate;
};

/**
 * @brief Запись аудита изменения cash_balance
 */
struct BalanceHistory {
    std::string id;
    std::string virtualBalanceId;               ///< user_id владельца счёта
    Decimal previousCashBalance;
    Decimal newCashBalance;
    Decimal changeAmount;
    TransactionType changeType = TransactionType::DEPOSIT;
    std::optional<std::string> relatedOrderId;
    std::string description;
    Timestamp createdAt;
};

} // namespace ledger::domain
