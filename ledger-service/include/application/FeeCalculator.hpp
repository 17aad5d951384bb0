// include/application/FeeCalculator.hpp
#pragma once

#include "domain/Decimal.hpp"
#include "domain/FeeSchedule.hpp"
#include "domain/enums/OrderType.hpp"
#include <utility>

namespace ledger::application {

/**
 * @brief Расчёт комиссий, налогов и составляющих прибыли
 *
 * Чистые функции от тарифов: без I/O, детерминированно,
 * подменяется под конкретный рынок через FeeSchedule.
 *
 * Все суммы считаются в базовой валюте:
 * notional = quantity * price * exchangeRate.
 *
 * @example
 * ```cpp
 * FeeSchedule schedule{Decimal::fromString("0.00015"), Decimal(0),
 *                      Decimal::fromString("0.0023"), 0};
 * FeeCalculator fees(schedule);
 * auto f = fees.calculate(OrderType::SELL, Decimal(10), Decimal(10000));
 * // f.commission = 15, f.tax = 230
 * ```
 */
class FeeCalculator {
public:
    explicit FeeCalculator(domain::FeeSchedule schedule)
        : schedule_(std::move(schedule)) {}

    const domain::FeeSchedule& schedule() const { return schedule_; }

    /**
     * @brief Комиссия (обе стороны) и налог (только SELL)
     */
    domain::FeeBreakdown calculate(domain::OrderType orderType,
                                   const domain::Decimal& quantity,
                                   const domain::Decimal& price,
                                   const domain::Decimal& exchangeRate = domain::Decimal(1)) const {
        domain::Decimal notional = quantity * price * exchangeRate;

        domain::FeeBreakdown fees;
        fees.commission = commissionFor(notional);
        if (orderType == domain::OrderType::SELL) {
            fees.tax = (notional * schedule_.taxRate).round(schedule_.precision);
        }
        return fees;
    }

    /**
     * @brief Оценка комиссии для резерва BUY ордера
     */
    domain::Decimal estimateBuyFee(const domain::Decimal& quantity,
                                   const domain::Decimal& price,
                                   const domain::Decimal& exchangeRate = domain::Decimal(1)) const {
        return commissionFor(quantity * price * exchangeRate);
    }

    /**
     * @brief Курсовая разница при продаже иностранного актива
     *
     * price * quantity * (currentRate - purchaseRate)
     */
    domain::Decimal exchangeProfitLoss(const domain::Decimal& quantity,
                                       const domain::Decimal& price,
                                       const domain::Decimal& purchaseRate,
                                       const domain::Decimal& currentRate) const {
        return price * quantity * (currentRate - purchaseRate);
    }

    /**
     * @brief Ценовая составляющая реализованного результата
     *
     * (price - averagePrice) * quantity * purchaseRate - fee
     */
    domain::Decimal priceProfitLoss(const domain::Decimal& quantity,
                                    const domain::Decimal& price,
                                    const domain::Decimal& averagePrice,
                                    const domain::Decimal& purchaseRate,
                                    const domain::Decimal& fee) const {
        return (price - averagePrice) * quantity * purchaseRate - fee;
    }

private:
    domain::FeeSchedule schedule_;

    domain::Decimal commissionFor(const domain::Decimal& notional) const {
        if (!notional.isPositive()) {
            return domain::Decimal();
        }
        domain::Decimal commission = (notional * schedule_.commissionRate).round(schedule_.precision);
        if (commission < schedule_.minCommission) {
            commission = schedule_.minCommission;
        }
        return commission;
    }
};

} // namespace ledger::application
