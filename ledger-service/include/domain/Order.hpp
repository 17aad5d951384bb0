// include/domain/Order.hpp
#pragma once

#include "domain/Decimal.hpp"
#include "domain/Timestamp.hpp"
#include "domain/enums/OrderType.hpp"
#include "domain/enums/OrderMethod.hpp"
#include "domain/enums/OrderStatus.hpp"
#include <optional>
#include <string>

namespace ledger::domain {

/**
 * @brief Ордер пользователя
 *
 * Создаётся OrderLedger, изменяется только путями исполнения, отмены
 * и истечения срока. Никогда не удаляется.
 *
 * Денежные агрегаты (executedAmount, averagePrice) - в валюте инструмента,
 * комиссии и резерв - в базовой валюте счёта.
 */
struct Order {
    std::string id;
    std::string userId;
    std::string stockId;                        ///< Код продукта
    OrderType orderType = OrderType::BUY;
    OrderMethod orderMethod = OrderMethod::LIMIT;
    OrderStatus orderStatus = OrderStatus::PENDING;

    Decimal quantity;                           ///< Запрошено, > 0
    std::optional<Decimal> orderPrice;          ///< null для MARKET
    std::string currency;                       ///< Валюта инструмента
    Decimal exchangeRate = Decimal(1);          ///< Курс на момент создания
    Decimal referencePrice;                     ///< Цена, по которой считался резерв
    Decimal reservedAmount;                     ///< Остаток BUY резерва (базовая валюта)

    Decimal executedQuantity;
    Decimal executedAmount;                     ///< Накопленный объём исполнения
    Decimal averagePrice;                       ///< Средневзвешенная цена исполнения
    Decimal commission;
    Decimal tax;
    Decimal totalFee;

    Timestamp orderDate;
    std::optional<Timestamp> executedDate;
    std::optional<Timestamp> cancelledDate;
    std::optional<Timestamp> expiresAt;
    Timestamp updatedAt;
    std::string notes;

    Decimal remainingQuantity() const {
        return quantity - executedQuantity;
    }

    bool isFinal() const { return isFinalStatus(orderStatus); }
    bool isActive() const { return isActiveStatus(orderStatus); }

    bool isBuy() const { return orderType == OrderType::BUY; }
    bool isSell() const { return orderType == OrderType::SELL; }

    bool isExpiredAt(const Timestamp& asOf) const {
        return expiresAt && *expiresAt <= asOf;
    }
};

/**
 * @brief Запись об исполнении (append-only)
 */
struct OrderExecution {
    std::string id;
    std::string orderId;
    Decimal executionPrice;         ///< Валюта инструмента
    Decimal executionQuantity;
    Decimal executionAmount;        ///< price * quantity, валюта инструмента
    Decimal executionFee;           ///< commission + tax, базовая валюта
    Decimal exchangeRate = Decimal(1);
    Timestamp executionTime;
};

} // namespace ledger::domain
