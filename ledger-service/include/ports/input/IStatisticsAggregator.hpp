// include/ports/input/IStatisticsAggregator.hpp
#pragma once

#include "domain/TradingStatistics.hpp"
#include <string>
#include <vector>

namespace ledger::ports::input {

/**
 * @brief Дневная статистика торговли (производные данные)
 */
class IStatisticsAggregator {
public:
    virtual ~IStatisticsAggregator() = default;

    /**
     * @brief Пересчитать сводку за день, содержащий date. Идемпотентно.
     */
    virtual domain::TradingStatistics updateDailyStatistics(const std::string& userId,
                                                            const domain::Timestamp& date) = 0;

    /**
     * @brief Пересчитать все дни в [from, to]
     */
    virtual std::vector<domain::TradingStatistics> rebuildStatistics(const std::string& userId,
                                                                     const domain::Timestamp& from,
                                                                     const domain::Timestamp& to) = 0;

    virtual std::vector<domain::TradingStatistics> getStatistics(const std::string& userId,
                                                                 const domain::Timestamp& from,
                                                                 const domain::Timestamp& to) = 0;
};

} // namespace ledger::ports::input
