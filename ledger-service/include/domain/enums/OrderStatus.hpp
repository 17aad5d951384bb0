// include/domain/enums/OrderStatus.hpp
#pragma once

#include <string>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Статус ордера
 *
 * PENDING -> {PARTIALLY_FILLED, FILLED, CANCELLED, REJECTED, EXPIRED}
 * PARTIALLY_FILLED -> {PARTIALLY_FILLED, FILLED, CANCELLED, EXPIRED}
 */
enum class OrderStatus {
    PENDING,            ///< Ожидает исполнения
    PARTIALLY_FILLED,   ///< Частично исполнен
    FILLED,             ///< Полностью исполнен
    CANCELLED,          ///< Отменён пользователем
    REJECTED,           ///< Отклонён
    EXPIRED             ///< Истёк срок действия
};

inline std::string toString(OrderStatus status) {
    switch (status) {
        case OrderStatus::PENDING:          return "PENDING";
        case OrderStatus::PARTIALLY_FILLED: return "PARTIALLY_FILLED";
        case OrderStatus::FILLED:           return "FILLED";
        case OrderStatus::CANCELLED:        return "CANCELLED";
        case OrderStatus::REJECTED:         return "REJECTED";
        case OrderStatus::EXPIRED:          return "EXPIRED";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline OrderStatus orderStatusFromString(const std::string& str) {
    if (str == "PENDING")          return OrderStatus::PENDING;
    if (str == "PARTIALLY_FILLED") return OrderStatus::PARTIALLY_FILLED;
    if (str == "FILLED")           return OrderStatus::FILLED;
    if (str == "CANCELLED")        return OrderStatus::CANCELLED;
    if (str == "REJECTED")         return OrderStatus::REJECTED;
    if (str == "EXPIRED")          return OrderStatus::EXPIRED;
    throw std::invalid_argument("Unknown OrderStatus: " + str);
}

/**
 * @brief Финальный статус: дальнейшие изменения запрещены
 */
inline bool isFinalStatus(OrderStatus status) {
    return status == OrderStatus::FILLED ||
           status == OrderStatus::CANCELLED ||
           status == OrderStatus::REJECTED ||
           status == OrderStatus::EXPIRED;
}

/**
 * @brief Ордер ещё может исполняться (держит резерв)
 */
inline bool isActiveStatus(OrderStatus status) {
    return status == OrderStatus::PENDING ||
           status == OrderStatus::PARTIALLY_FILLED;
}

/**
 * @brief Разрешён ли переход from -> to
 */
inline bool canTransition(OrderStatus from, OrderStatus to) {
    switch (from) {
        case OrderStatus::PENDING:
            return to != OrderStatus::PENDING;
        case OrderStatus::PARTIALLY_FILLED:
            return to == OrderStatus::PARTIALLY_FILLED ||
                   to == OrderStatus::FILLED ||
                   to == OrderStatus::CANCELLED ||
                   to == OrderStatus::EXPIRED;
        default:
            return false;
    }
}

} // namespace ledger::domain
