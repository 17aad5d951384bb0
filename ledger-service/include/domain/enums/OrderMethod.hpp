// include/domain/enums/OrderMethod.hpp
#pragma once

#include <string>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Способ исполнения ордера
 */
enum class OrderMethod {
    MARKET,         ///< По рыночной цене (order_price не задаётся)
    LIMIT,          ///< Лимитный
    STOP_LOSS,      ///< Стоп-лосс
    TAKE_PROFIT     ///< Тейк-профит
};

inline std::string toString(OrderMethod method) {
    switch (method) {
        case OrderMethod::MARKET:      return "MARKET";
        case OrderMethod::LIMIT:       return "LIMIT";
        case OrderMethod::STOP_LOSS:   return "STOP_LOSS";
        case OrderMethod::TAKE_PROFIT: return "TAKE_PROFIT";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline OrderMethod orderMethodFromString(const std::string& str) {
    if (str == "MARKET")      return OrderMethod::MARKET;
    if (str == "LIMIT")       return OrderMethod::LIMIT;
    if (str == "STOP_LOSS")   return OrderMethod::STOP_LOSS;
    if (str == "TAKE_PROFIT") return OrderMethod::TAKE_PROFIT;
    throw std::invalid_argument("Unknown OrderMethod: " + str);
}

/**
 * @brief Нужна ли ордеру явная цена
 */
inline bool requiresPrice(OrderMethod method) {
    return method != OrderMethod::MARKET;
}

} // namespace ledger::domain
