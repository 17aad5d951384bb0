// include/ports/output/IStatisticsRepository.hpp
#pragma once

#include "domain/TradingStatistics.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ledger::ports::output {

class IStatisticsRepository {
public:
    virtual ~IStatisticsRepository() = default;

    /**
     * @brief Перезаписать сводку по ключу (userId, periodType, periodStart)
     */
    virtual void upsert(const domain::TradingStatistics& statistics) = 0;

    virtual std::optional<domain::TradingStatistics> find(const std::string& userId,
                                                          const std::string& periodType,
                                                          const domain::Timestamp& periodStart) = 0;

    /**
     * @brief Сводки с periodStart в [from, to], по возрастанию даты
     */
    virtual std::vector<domain::TradingStatistics> findRange(const std::string& userId,
                                                             const std::string& periodType,
                                                             const domain::Timestamp& from,
                                                             const domain::Timestamp& to) = 0;
};

} // namespace ledger::ports::output
