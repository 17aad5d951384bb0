// include/application/StatisticsAggregator.hpp
#pragma once

#include "ports/input/IStatisticsAggregator.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include "domain/LedgerErrors.hpp"
#include <iostream>
#include <memory>

namespace ledger::application {

/**
 * @brief Дневная статистика из журнала проводок
 *
 * Сводка - производные данные: каждый пересчёт сканирует все BUY/SELL
 * проводки дня [00:00Z, 24:00Z) и перезаписывает запись целиком,
 * поэтому повторный запуск даёт тот же результат.
 */
class StatisticsAggregator : public ports::input::IStatisticsAggregator {
public:
    explicit StatisticsAggregator(std::shared_ptr<ports::output::IUnitOfWorkFactory> unitOfWork)
        : unitOfWork_(std::move(unitOfWork)) {}

    domain::TradingStatistics updateDailyStatistics(const std::string& userId,
                                                    const domain::Timestamp& date) override {
        if (userId.empty()) {
            throw domain::ValidationError("User id is required");
        }

        domain::TradingStatistics statistics;
        statistics.userId = userId;
        statistics.periodType = PERIOD_DAILY;
        statistics.periodStart = date.startOfDay();
        statistics.periodEnd = statistics.periodStart.plusDays(1);

        domain::TransactionFilter filter;
        filter.from = statistics.periodStart;
        filter.to = statistics.periodEnd;
        filter.limit = 0;

        auto uow = unitOfWork_->begin(userId);
        for (const auto& transaction : uow->transactions().findByUserId(userId, filter)) {
            accumulate(statistics, transaction);
        }

        int decided = statistics.winTrades + statistics.lossTrades;
        statistics.winRate = decided > 0
            ? (domain::Decimal(statistics.winTrades) * domain::Decimal(100) / domain::Decimal(decided)).round(2)
            : domain::Decimal();
        statistics.updatedAt = domain::Timestamp::now();

        uow->statistics().upsert(statistics);
        uow->commit();

        std::cout << "[StatisticsAggregator] " << userId << " " << statistics.periodStart.toDateString()
                  << ": trades=" << statistics.totalTrades
                  << " realized=" << statistics.realizedProfitLoss << std::endl;
        return statistics;
    }

    std::vector<domain::TradingStatistics> rebuildStatistics(const std::string& userId,
                                                             const domain::Timestamp& from,
                                                             const domain::Timestamp& to) override {
        if (to < from) {
            throw domain::ValidationError("Invalid period: end before start");
        }
        std::vector<domain::TradingStatistics> result;
        for (auto day = from.startOfDay(); day <= to; day = day.plusDays(1)) {
            result.push_back(updateDailyStatistics(userId, day));
        }
        return result;
    }

    std::vector<domain::TradingStatistics> getStatistics(const std::string& userId,
                                                         const domain::Timestamp& from,
                                                         const domain::Timestamp& to) override {
        auto view = unitOfWork_->read();
        return view->statistics().findRange(userId, PERIOD_DAILY, from.startOfDay(), to);
    }

private:
    static constexpr const char* PERIOD_DAILY = "daily";

    std::shared_ptr<ports::output::IUnitOfWorkFactory> unitOfWork_;

    static void accumulate(domain::TradingStatistics& statistics, const domain::Transaction& transaction) {
        if (!domain::isTradeType(transaction.transactionType)) {
            return;
        }

        statistics.totalTrades++;
        statistics.totalCommission += transaction.commission;
        statistics.totalTax += transaction.tax;
        statistics.totalFee += transaction.commission + transaction.tax;

        if (transaction.transactionType == domain::TransactionType::BUY) {
            statistics.buyTrades++;
            statistics.totalBuyAmount += transaction.amount;
            return;
        }

        statistics.sellTrades++;
        statistics.totalSellAmount += transaction.amount;

        domain::Decimal realized = transaction.realizedProfitLoss.value_or(domain::Decimal());
        statistics.realizedProfitLoss += realized;
        if (realized.isPositive()) {
            statistics.winTrades++;
        } else if (realized.isNegative()) {
            statistics.lossTrades++;
        }
    }
};

} // namespace ledger::application
