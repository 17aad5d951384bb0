// include/adapters/secondary/persistence/PostgresStatisticsRepository.hpp
#pragma once

#include "ports/output/IStatisticsRepository.hpp"
#include "adapters/secondary/persistence/PgSupport.hpp"
#include <pqxx/pqxx>

namespace ledger::adapters::secondary {

class PostgresStatisticsRepository : public ports::output::IStatisticsRepository {
public:
    explicit PostgresStatisticsRepository(pqxx::transaction_base& txn) : txn_(txn) {}

    void upsert(const domain::TradingStatistics& s) override {
        try {
            txn_.exec_params(
                "INSERT INTO trading_statistics "
                "(user_id, period_type, period_start, period_end, total_trades, buy_trades, sell_trades, "
                " total_buy_amount, total_sell_amount, total_commission, total_tax, total_fee, "
                " realized_profit_loss, win_trades, loss_trades, win_rate, updated_at) "
                "VALUES ($1, $2, to_timestamp($3::BIGINT / 1000.0), to_timestamp($4::BIGINT / 1000.0), "
                "        $5, $6, $7, $8::NUMERIC, $9::NUMERIC, $10::NUMERIC, $11::NUMERIC, $12::NUMERIC, "
                "        $13::NUMERIC, $14, $15, $16::NUMERIC, to_timestamp($17::BIGINT / 1000.0)) "
                "ON CONFLICT (user_id, period_type, period_start) DO UPDATE SET "
                "period_end = EXCLUDED.period_end, "
                "total_trades = EXCLUDED.total_trades, "
                "buy_trades = EXCLUDED.buy_trades, "
                "sell_trades = EXCLUDED.sell_trades, "
                "total_buy_amount = EXCLUDED.total_buy_amount, "
                "total_sell_amount = EXCLUDED.total_sell_amount, "
                "total_commission = EXCLUDED.total_commission, "
                "total_tax = EXCLUDED.total_tax, "
                "total_fee = EXCLUDED.total_fee, "
                "realized_profit_loss = EXCLUDED.realized_profit_loss, "
                "win_trades = EXCLUDED.win_trades, "
                "loss_trades = EXCLUDED.loss_trades, "
                "win_rate = EXCLUDED.win_rate, "
                "updated_at = EXCLUDED.updated_at",
                s.userId,
                s.periodType,
                pg::millis(s.periodStart),
                pg::millis(s.periodEnd),
                s.totalTrades,
                s.buyTrades,
                s.sellTrades,
                pg::num(s.totalBuyAmount),
                pg::num(s.totalSellAmount),
                pg::num(s.totalCommission),
                pg::num(s.totalTax),
                pg::num(s.totalFee),
                pg::num(s.realizedProfitLoss),
                s.winTrades,
                s.lossTrades,
                pg::num(s.winRate),
                pg::millis(s.updatedAt)
            );
        } catch (const pqxx::failure&) {
            pg::rethrowTranslated("[PostgresStatisticsRepository] upsert");
        }
    }

    std::optional<domain::TradingStatistics> find(const std::string& userId,
                                                  const std::string& periodType,
                                                  const domain::Timestamp& periodStart) override {
        try {
            auto result = txn_.exec_params(
                selectColumns() +
                "WHERE user_id = $1 AND period_type = $2 "
                "  AND period_start = to_timestamp($3::BIGINT / 1000.0)",
                userId, periodType, pg::millis(periodStart)
            );
            if (result.empty()) {
                return std::nullopt;
            }
            return rowToStatistics(result[0]);
        } catch (const pqxx::failure&) {
            pg::rethrowTranslated("[PostgresStatisticsRepository] find");
        }
    }

    std::vector<domain::TradingStatistics> findRange(const std::string& userId,
                                                     const std::string& periodType,
                                                     const domain::Timestamp& from,
                                                     const domain::Timestamp& to) override {
        std::vector<domain::TradingStatistics> rows;
        try {
            auto result = txn_.exec_params(
                selectColumns() +
                "WHERE user_id = $1 AND period_type = $2 "
                "  AND period_start >= to_timestamp($3::BIGINT / 1000.0) "
                "  AND period_start <= to_timestamp($4::BIGINT / 1000.0) "
                "ORDER BY period_start",
                userId, periodType, pg::millis(from), pg::millis(to)
            );
            for (const auto& row : result) {
                rows.push_back(rowToStatistics(row));
            }
        } catch (const pqxx::failure&) {
            pg::rethrowTranslated("[PostgresStatisticsRepository] findRange");
        }
        return rows;
    }

private:
    pqxx::transaction_base& txn_;

    static std::string selectColumns() {
        return "SELECT user_id, period_type, "
               "       " + pg::epochMillis("period_start") + ", "
               "       " + pg::epochMillis("period_end") + ", "
               "       total_trades, buy_trades, sell_trades, total_buy_amount, total_sell_amount, "
               "       total_commission, total_tax, total_fee, realized_profit_loss, "
               "       win_trades, loss_trades, win_rate, "
               "       " + pg::epochMillis("updated_at") + " "
               "FROM trading_statistics ";
    }

    static domain::TradingStatistics rowToStatistics(const pqxx::row& row) {
        domain::TradingStatistics s;
        s.userId = row["user_id"].as<std::string>();
        s.periodType = row["period_type"].as<std::string>();
        s.periodStart = pg::timestampField(row["period_start"]);
        s.periodEnd = pg::timestampField(row["period_end"]);
        s.totalTrades = row["total_trades"].as<int>();
        s.buyTrades = row["buy_trades"].as<int>();
        s.sellTrades = row["sell_trades"].as<int>();
        s.totalBuyAmount = pg::decimalField(row["total_buy_amount"]);
        s.totalSellAmount = pg::decimalField(row["total_sell_amount"]);
        s.totalCommission = pg::decimalField(row["total_commission"]);
        s.totalTax = pg::decimalField(row["total_tax"]);
        s.totalFee = pg::decimalField(row["total_fee"]);
        s.realizedProfitLoss = pg::decimalField(row["realized_profit_loss"]);
        s.winTrades = row["win_trades"].as<int>();
        s.lossTrades = row["loss_trades"].as<int>();
        s.winRate = pg::decimalField(row["win_rate"]);
        s.updatedAt = pg::timestampField(row["updated_at"]);
        return s;
    }
};

} // namespace ledger::adapters::secondary
