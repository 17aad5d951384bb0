// include/domain/TradingStatistics.hpp
#pragma once

#include "domain/Decimal.hpp"
#include "domain/Timestamp.hpp"
#include <string>

namespace ledger::domain {

/**
 * @brief Дневная сводка торговли пользователя
 *
 * Производные данные: полностью пересчитываются из Transaction
 * за период и перезаписываются (upsert по userId + periodType + periodStart).
 */
struct TradingStatistics {
    std::string userId;
    std::string periodType = "daily";
    Timestamp periodStart;                  ///< 00:00 UTC
    Timestamp periodEnd;                    ///< 00:00 UTC следующего дня
    int totalTrades = 0;
    int buyTrades = 0;
    int sellTrades = 0;
    Decimal totalBuyAmount;
    Decimal totalSellAmount;
    Decimal totalCommission;
    Decimal totalTax;
    Decimal totalFee;
    Decimal realizedProfitLoss;
    int winTrades = 0;
    int lossTrades = 0;
    Decimal winRate;                        ///< Проценты, 0..100
    Timestamp updatedAt;

    bool sameAggregates(const TradingStatistics& other) const {
        return totalTrades == other.totalTrades &&
               buyTrades == other.buyTrades &&
               sellTrades == other.sellTrades &&
               totalBuyAmount == other.totalBuyAmount &&
               totalSellAmount == other.totalSellAmount &&
               totalCommission == other.totalCommission &&
               totalTax == other.totalTax &&
               totalFee == other.totalFee &&
               realizedProfitLoss == other.realizedProfitLoss &&
               winTrades == other.winTrades &&
               lossTrades == other.lossTrades &&
               winRate == other.winRate;
    }
};

} // namespace ledger::domain
