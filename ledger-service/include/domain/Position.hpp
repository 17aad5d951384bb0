// include/domain/Position.hpp
#pragma once

#include "domain/Decimal.hpp"
#include "domain/Timestamp.hpp"
#include <optional>
#include <string>

namespace ledger::domain {

/**
 * @brief Позиция пользователя по инструменту (запись PositionBook)
 *
 * Ключ: (userId, productCode).
 *
 * averagePrice - средневзвешенная цена покупки в валюте инструмента.
 * baseAveragePrice - то же в базовой валюте счёта (с учётом курса на момент покупок),
 * averageExchangeRate = baseAveragePrice / averagePrice.
 *
 * Продажа не меняет средние цены. При обнулении количества позиция
 * остаётся в книге с isActive=false, средние сбрасываются при следующей покупке.
 */
struct Position {
    std::string userId;
    std::string productCode;
    std::string currency;
    Decimal currentQuantity;
    Decimal averagePrice;               ///< Валюта инструмента
    Decimal baseAveragePrice;           ///< Базовая валюта
    Decimal averageExchangeRate;        ///< 1 для базовой валюты
    Decimal realizedProfitLoss;         ///< Накопленный, базовая валюта
    std::optional<Timestamp> firstBuyDate;
    std::optional<Timestamp> lastBuyDate;
    std::optional<Timestamp> lastSellDate;
    bool isActive = true;

    /**
     * @brief Применить покупку: пересчитать средние и увеличить количество
     */
    void applyBuy(const Decimal& quantity, const Decimal& price,
                  const Decimal& exchangeRate, const Timestamp& at) {
        bool reopening = !isActive || currentQuantity.isZero();
        if (reopening) {
            currentQuantity = Decimal();
            averagePrice = Decimal();
            baseAveragePrice = Decimal();
            averageExchangeRate = Decimal();
        }

        Decimal newQuantity = currentQuantity + quantity;
        averagePrice = (currentQuantity * averagePrice + quantity * price) / newQuantity;
        baseAveragePrice = (currentQuantity * baseAveragePrice + quantity * price * exchangeRate)
                           / newQuantity;
        averageExchangeRate = averagePrice.isZero()
            ? exchangeRate
            : baseAveragePrice / averagePrice;
        currentQuantity = newQuantity;

        if (reopening || !firstBuyDate) {
            firstBuyDate = at;
            lastBuyDate.reset();
        } else {
            lastBuyDate = at;
        }
        isActive = true;
    }

    /**
     * @brief Применить продажу
     * @return Себестоимость проданных единиц в базовой валюте
     */
    Decimal applySell(const Decimal& quantity, const Timestamp& at) {
        Decimal soldCost = baseAveragePrice * quantity;
        currentQuantity -= quantity;
        lastSellDate = at;
        if (currentQuantity.isZero()) {
            isActive = false;
        }
        return soldCost;
    }

    static Position open(const std::string& userId, const std::string& productCode,
                         const std::string& currency) {
        Position position;
        position.userId = userId;
        position.productCode = productCode;
        position.currency = currency;
        position.isActive = false;
        return position;
    }
};

} // namespace ledger::domain
