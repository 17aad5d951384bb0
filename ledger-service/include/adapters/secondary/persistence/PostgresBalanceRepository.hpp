// include/adapters/secondary/persistence/PostgresBalanceRepository.hpp
#pragma once

#include "ports/output/IBalanceRepository.hpp"
#include "adapters/secondary/persistence/PgSupport.hpp"
#include <pqxx/pqxx>

namespace ledger::adapters::secondary {

/**
 * @brief Таблица virtual_balances внутри транзакции единицы работы
 *
 * При lockRows чтение идёт через SELECT ... FOR UPDATE.
 */
class PostgresBalanceRepository : public ports::output::IBalanceRepository {
public:
    PostgresBalanceRepository(pqxx::transaction_base& txn, bool lockRows)
        : txn_(txn), lockRows_(lockRows) {}

    std::optional<domain::BalanceAccount> findByUserId(const std::string& userId) override {
        try {
            auto result = txn_.exec_params(
                "SELECT user_id, cash_balance, available_cash, invested_amount, "
                "       total_buy_amount, total_sell_amount, total_commission, total_tax, "
                "       " + pg::epochMillis("last_trade_date") + ", "
                "       " + pg::epochMillis("created_at") + ", "
                "       " + pg::epochMillis("updated_at") + " "
                "FROM virtual_balances WHERE user_id = $1" +
                std::string(lockRows_ ? " FOR UPDATE" : ""),
                userId
            );

            if (result.empty()) {
                return std::nullopt;
            }
            return rowToAccount(result[0]);
        } catch (const pqxx::failure&) {
            pg::rethrowTranslated("[PostgresBalanceRepository] findByUserId");
        }
    }

    void save(const domain::BalanceAccount& account) override {
        try {
            txn_.exec_params(
                "INSERT INTO virtual_balances "
                "(user_id, cash_balance, available_cash, invested_amount, total_buy_amount, "
                " total_sell_amount, total_commission, total_tax, last_trade_date, created_at, updated_at) "
                "VALUES ($1, $2::NUMERIC, $3::NUMERIC, $4::NUMERIC, $5::NUMERIC, $6::NUMERIC, "
                "        $7::NUMERIC, $8::NUMERIC, to_timestamp($9::BIGINT / 1000.0), "
                "        to_timestamp($10::BIGINT / 1000.0), to_timestamp($11::BIGINT / 1000.0)) "
                "ON CONFLICT (user_id) DO UPDATE SET "
                "cash_balance = EXCLUDED.cash_balance, "
                "available_cash = EXCLUDED.available_cash, "
                "invested_amount = EXCLUDED.invested_amount, "
                "total_buy_amount = EXCLUDED.total_buy_amount, "
                "total_sell_amount = EXCLUDED.total_sell_amount, "
                "total_commission = EXCLUDED.total_commission, "
                "total_tax = EXCLUDED.total_tax, "
                "last_trade_date = EXCLUDED.last_trade_date, "
                "updated_at = EXCLUDED.updated_at",
                account.userId,
                pg::num(account.cashBalance),
                pg::num(account.availableCash),
                pg::num(account.investedAmount),
                pg::num(account.totalBuyAmount),
                pg::num(account.totalSellAmount),
                pg::num(account.totalCommission),
                pg::num(account.totalTax),
                pg::millis(account.lastTradeDate),
                pg::millis(account.createdAt),
                pg::millis(account.updatedAt)
            );
        } catch (const pqxx::failure&) {
            pg::rethrowTranslated("[PostgresBalanceRepository] save");
        }
    }

private:
    pqxx::transaction_base& txn_;
    bool lockRows_;

    static domain::BalanceAccount rowToAccount(const pqxx::row& row) {
        domain::BalanceAccount account;
        account.userId = row["user_id"].as<std::string>();
        account.cashBalance = pg::decimalField(row["cash_balance"]);
        account.availableCash = pg::decimalField(row["available_cash"]);
        account.investedAmount = pg::decimalField(row["invested_amount"]);
        account.totalBuyAmount = pg::decimalField(row["total_buy_amount"]);
        account.totalSellAmount = pg::decimalField(row["total_sell_amount"]);
        account.totalCommission = pg::decimalField(row["total_commission"]);
        account.totalTax = pg::decimalField(row["total_tax"]);
        account.lastTradeDate = pg::optionalTimestamp(row["last_trade_date"]);
        account.createdAt = pg::timestampField(row["created_at"]);
        account.updatedAt = pg::timestampField(row["updated_at"]);
        return account;
    }
};

} // namespace ledger::adapters::secondary
