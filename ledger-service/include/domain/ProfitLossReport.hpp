// include/domain/ProfitLossReport.hpp
#pragma once

#include "domain/Decimal.hpp"
#include "domain/Timestamp.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ledger::domain {

/**
 * @brief Какие инструменты попадают в отчёт
 *
 * FOREIGN - продажи с курсовой разницей (валюта инструмента не базовая).
 */
enum class MarketScope {
    ALL,
    DOMESTIC,
    FOREIGN
};

/**
 * @brief Реализованный результат по одному инструменту за период
 *
 * Все суммы - в базовой валюте. realized = price + exchange.
 */
struct ProductProfitLoss {
    std::string productCode;
    bool foreign = false;
    Decimal realizedProfitLoss;
    Decimal priceProfitLoss;
    Decimal exchangeProfitLoss;         ///< 0 для внутренних инструментов
    int tradeCount = 0;
    Decimal soldQuantity;
    Decimal sellAmount;                 ///< Валовая выручка
    std::optional<Timestamp> firstTradeDate;
    std::optional<Timestamp> lastTradeDate;
};

/**
 * @brief Разбивка реализованного результата по инструментам за [from, to)
 *
 * products отсортированы по realizedProfitLoss по убыванию.
 */
struct ProfitLossReport {
    Timestamp from;
    Timestamp to;
    MarketScope scope = MarketScope::ALL;
    std::vector<ProductProfitLoss> products;
    Decimal totalRealizedProfitLoss;
    Decimal totalPriceProfitLoss;
    Decimal totalExchangeProfitLoss;
    int totalTrades = 0;
};

} // namespace ledger::domain
