// include/domain/enums/TransactionType.hpp
#pragma once

#include <string>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Тип проводки в леджере
 *
 * Используется и для Transaction, и для change_type в истории баланса.
 */
enum class TransactionType {
    BUY,
    SELL,
    DEPOSIT,
    WITHDRAW
};

inline std::string toString(TransactionType type) {
    switch (type) {
        case TransactionType::BUY:      return "BUY";
        case TransactionType::SELL:     return "SELL";
        case TransactionType::DEPOSIT:  return "DEPOSIT";
        case TransactionType::WITHDRAW: return "WITHDRAW";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline TransactionType transactionTypeFromString(const std::string& str) {
    if (str == "BUY")      return TransactionType::BUY;
    if (str == "SELL")     return TransactionType::SELL;
    if (str == "DEPOSIT")  return TransactionType::DEPOSIT;
    if (str == "WITHDRAW") return TransactionType::WITHDRAW;
    throw std::invalid_argument("Unknown TransactionType: " + str);
}

inline bool isTradeType(TransactionType type) {
    return type == TransactionType::BUY || type == TransactionType::SELL;
}

} // namespace ledger::domain
