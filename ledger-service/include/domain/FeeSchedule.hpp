// include/domain/FeeSchedule.hpp
#pragma once

#include "domain/Decimal.hpp"

namespace ledger::domain {

/**
 * @brief Тарифы комиссий и налогов для рынка
 */
struct FeeSchedule {
    Decimal commissionRate;     ///< Доля от суммы, обе стороны
    Decimal minCommission;      ///< Минимальная комиссия при ненулевой сумме
    Decimal taxRate;            ///< Доля от суммы продажи
    int precision = 0;          ///< Знаков после запятой у результатов
};

/**
 * @brief Результат расчёта комиссий
 */
struct FeeBreakdown {
    Decimal commission;
    Decimal tax;

    Decimal total() const { return commission + tax; }
};

} // namespace ledger::domain
