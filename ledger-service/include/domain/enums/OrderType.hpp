// include/domain/enums/OrderType.hpp
#pragma once

#include <string>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Сторона сделки
 */
enum class OrderType {
    BUY,
    SELL
};

inline std::string toString(OrderType type) {
    switch (type) {
        case OrderType::BUY:  return "BUY";
        case OrderType::SELL: return "SELL";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline OrderType orderTypeFromString(const std::string& str) {
    if (str == "BUY")  return OrderType::BUY;
    if (str == "SELL") return OrderType::SELL;
    throw std::invalid_argument("Unknown OrderType: " + str);
}

} // namespace ledger::domain
