// include/domain/BalanceAccount.hpp
#pragma once

#include "domain/Decimal.hpp"
#include "domain/Timestamp.hpp"
#include <optional>
#include <string>

namespace ledger::domain {

/**
 * @brief Денежный счёт пользователя (1:1 с user_id)
 *
 * Резервирование - мягкое: при создании BUY ордера уменьшается только
 * availableCash, cashBalance не трогается. Разница cashBalance - availableCash
 * равна сумме резервов всех активных BUY ордеров.
 *
 * Инвариант: 0 <= availableCash <= cashBalance.
 *
 * Жизненный цикл резерва:
 * ```
 * create BUY:  reserve(required)        available -= required
 * cancel:      release(remaining)       available += remaining
 * fill:        release(share)           available += share
 *              debit(actual)            available -= actual, cash -= actual
 * ```
 */
struct BalanceAccount {
    std::string userId;                 ///< Владелец
    Decimal cashBalance;                ///< Всего денег
    Decimal availableCash;              ///< Свободно (за вычетом резервов)
    Decimal investedAmount;             ///< Себестоимость открытых позиций
    Decimal totalBuyAmount;             ///< Накопленный объём покупок
    Decimal totalSellAmount;            ///< Накопленный объём продаж
    Decimal totalCommission;
    Decimal totalTax;
    std::optional<Timestamp> lastTradeDate;
    Timestamp createdAt;
    Timestamp updatedAt;

    /**
     * @brief Сумма под резервами активных BUY ордеров
     */
    Decimal reservedCash() const {
        return cashBalance - availableCash;
    }

    bool canReserve(const Decimal& amount) const {
        return availableCash >= amount;
    }

    /**
     * @return false если свободных средств недостаточно
     */
    bool reserve(const Decimal& amount) {
        if (!canReserve(amount)) return false;
        availableCash -= amount;
        return true;
    }

    /**
     * @brief Вернуть резерв в свободные средства
     */
    void release(const Decimal& amount) {
        availableCash += amount;
    }

    /**
     * @brief Списать деньги (исполнение BUY, вывод)
     * @return false если списание увело бы баланс в минус
     */
    bool debit(const Decimal& amount) {
        if (availableCash < amount || cashBalance < amount) return false;
        cashBalance -= amount;
        availableCash -= amount;
        return true;
    }

    /**
     * @brief Зачислить деньги (исполнение SELL, пополнение)
     */
    void credit(const Decimal& amount) {
        cashBalance += amount;
        availableCash += amount;
    }

    bool isConsistent() const {
        return !availableCash.isNegative() && availableCash <= cashBalance;
    }

    static BalanceAccount open(const std::string& userId, const Decimal& initialCash) {
        BalanceAccount account;
        account.userId = userId;
        account.cashBalance = initialCash;
        account.availableCash = initialCash;
        account.createdAt = Timestamp::now();
        account.updatedAt = account.createdAt;
        return account;
    }
};

} // namespace ledger::domain
