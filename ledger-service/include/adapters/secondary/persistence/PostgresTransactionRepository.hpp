// include/adapters/secondary/persistence/PostgresTransactionRepository.hpp
#pragma once

#include "ports/output/ITransactionRepository.hpp"
#include "adapters/secondary/persistence/PgSupport.hpp"
#include <pqxx/pqxx>

namespace ledger::adapters::secondary {

/**
 * @brief Append-only журнал transactions
 */
class PostgresTransactionRepository : public ports::output::ITransactionRepository {
public:
    explicit PostgresTransactionRepository(pqxx::transaction_base& txn) : txn_(txn) {}

    void append(const domain::Transaction& t) override {
        try {
            txn_.exec_params(
                "INSERT INTO transactions "
                "(transaction_id, user_id, order_id, product_code, transaction_type, "
                " quantity, price, amount, commission, tax, net_amount, "
                " cash_balance_before, cash_balance_after, realized_profit_loss, "
                " purchase_average_exchange_rate, current_exchange_rate, "
                " exchange_profit_loss, price_profit_loss, description, transaction_date) "
                "VALUES ($1, $2, $3, $4, $5, "
                "        $6::NUMERIC, $7::NUMERIC, $8::NUMERIC, $9::NUMERIC, $10::NUMERIC, $11::NUMERIC, "
                "        $12::NUMERIC, $13::NUMERIC, $14::NUMERIC, $15::NUMERIC, $16::NUMERIC, "
                "        $17::NUMERIC, $18::NUMERIC, $19, to_timestamp($20::BIGINT / 1000.0))",
                t.id,
                t.userId,
                t.orderId,
                t.productCode,
                domain::toString(t.transactionType),
                pg::num(t.quantity),
                pg::num(t.price),
                pg::num(t.amount),
                pg::num(t.commission),
                pg::num(t.tax),
                pg::num(t.netAmount),
                pg::num(t.cashBalanceBefore),
                pg::num(t.cashBalanceAfter),
                pg::num(t.realizedProfitLoss),
                pg::num(t.purchaseAverageExchangeRate),
                pg::num(t.currentExchangeRate),
                pg::num(t.exchangeProfitLoss),
                pg::num(t.priceProfitLoss),
                t.description,
                pg::millis(t.transactionDate)
            );
        } catch (const pqxx::failure&) {
            pg::rethrowTranslated("[PostgresTransactionRepository] append");
        }
    }

    std::vector<domain::Transaction> findByUserId(const std::string& userId,
                                                  const domain::TransactionFilter& filter) override {
        std::optional<std::string> type;
        std::optional<int64_t> limit;
        if (filter.transactionType) type = domain::toString(*filter.transactionType);
        if (filter.limit > 0) limit = static_cast<int64_t>(filter.limit);

        std::vector<domain::Transaction> transactions;
        try {
            auto result = txn_.exec_params(
                "SELECT transaction_id, user_id, order_id, product_code, transaction_type, "
                "       quantity, price, amount, commission, tax, net_amount, "
                "       cash_balance_before, cash_balance_after, realized_profit_loss, "
                "       purchase_average_exchange_rate, current_exchange_rate, "
                "       exchange_profit_loss, price_profit_loss, description, "
                "       " + pg::epochMillis("transaction_date") + " "
                "FROM transactions "
                "WHERE user_id = $1 "
                "  AND ($2::VARCHAR IS NULL OR transaction_type = $2) "
                "  AND ($3::BIGINT IS NULL OR transaction_date >= to_timestamp($3::BIGINT / 1000.0)) "
                "  AND ($4::BIGINT IS NULL OR transaction_date < to_timestamp($4::BIGINT / 1000.0)) "
                "ORDER BY transaction_date DESC, seq DESC "
                "LIMIT $5",
                userId, type, pg::millis(filter.from), pg::millis(filter.to), limit
            );

            for (const auto& row : result) {
                domain::Transaction t;
                t.id = row["transaction_id"].as<std::string>();
                t.userId = row["user_id"].as<std::string>();
                t.orderId = pg::optionalString(row["order_id"]);
                t.productCode = pg::optionalString(row["product_code"]);
                t.transactionType = domain::transactionTypeFromString(row["transaction_type"].as<std::string>());
                t.quantity = pg::decimalField(row["quantity"]);
                t.price = pg::decimalField(row["price"]);
                t.amount = pg::decimalField(row["amount"]);
                t.commission = pg::decimalField(row["commission"]);
                t.tax = pg::decimalField(row["tax"]);
                t.netAmount = pg::decimalField(row["net_amount"]);
                t.cashBalanceBefore = pg::decimalField(row["cash_balance_before"]);
                t.cashBalanceAfter = pg::decimalField(row["cash_balance_after"]);
                t.realizedProfitLoss = pg::optionalDecimal(row["realized_profit_loss"]);
                t.purchaseAverageExchangeRate = pg::optionalDecimal(row["purchase_average_exchange_rate"]);
                t.currentExchangeRate = pg::optionalDecimal(row["current_exchange_rate"]);
                t.exchangeProfitLoss = pg::optionalDecimal(row["exchange_profit_loss"]);
                t.priceProfitLoss = pg::optionalDecimal(row["price_profit_loss"]);
                t.description = row["description"].as<std::string>("");
                t.transactionDate = pg::timestampField(row["transaction_date"]);
                transactions.push_back(t);
            }
        } catch (const pqxx::failure&) {
            pg::rethrowTranslated("[PostgresTransactionRepository] findByUserId");
        }
        return transactions;
    }

private:
    pqxx::transaction_base& txn_;
};

/**
 * @brief Append-only таблица balance_history
 */
class PostgresBalanceHistoryRepository : public ports::output::IBalanceHistoryRepository {
public:
    explicit PostgresBalanceHistoryRepository(pqxx::transaction_base& txn) : txn_(txn) {}

    void append(const domain::BalanceHistory& entry) override {
        try {
            txn_.exec_params(
                "INSERT INTO balance_history "
                "(history_id, virtual_balance_id, previous_cash_balance, new_cash_balance, "
                " change_amount, change_type, related_order_id, description, created_at) "
                "VALUES ($1, $2, $3::NUMERIC, $4::NUMERIC, $5::NUMERIC, $6, $7, $8, "
                "        to_timestamp($9::BIGINT / 1000.0))",
                entry.id,
                entry.virtualBalanceId,
                pg::num(entry.previousCashBalance),
                pg::num(entry.newCashBalance),
                pg::num(entry.changeAmount),
                domain::toString(entry.changeType),
                entry.relatedOrderId,
                entry.description,
                pg::millis(entry.createdAt)
            );
        } catch (const pqxx::failure&) {
            pg::rethrowTranslated("[PostgresBalanceHistoryRepository] append");
        }
    }

    std::vector<domain::BalanceHistory> findByUserId(const std::string& userId, size_t limit) override {
        std::optional<int64_t> rowLimit;
        if (limit > 0) rowLimit = static_cast<int64_t>(limit);

        std::vector<domain::BalanceHistory> entries;
        try {
            auto result = txn_.exec_params(
                "SELECT history_id, virtual_balance_id, previous_cash_balance, new_cash_balance, "
                "       change_amount, change_type, related_order_id, description, "
                "       " + pg::epochMillis("created_at") + " "
                "FROM balance_history WHERE virtual_balance_id = $1 "
                "ORDER BY created_at DESC, seq DESC "
                "LIMIT $2",
                userId, rowLimit
            );

            for (const auto& row : result) {
                domain::BalanceHistory entry;
                entry.id = row["history_id"].as<std::string>();
                entry.virtualBalanceId = row["virtual_balance_id"].as<std::string>();
                entry.previousCashBalance = pg::decimalField(row["previous_cash_balance"]);
                entry.newCashBalance = pg::decimalField(row["new_cash_balance"]);
                entry.changeAmount = pg::decimalField(row["change_amount"]);
                entry.changeType = domain::transactionTypeFromString(row["change_type"].as<std::string>());
                entry.relatedOrderId = pg::optionalString(row["related_order_id"]);
                entry.description = row["description"].as<std::string>("");
                entry.createdAt = pg::timestampField(row["created_at"]);
                entries.push_back(entry);
            }
        } catch (const pqxx::failure&) {
            pg::rethrowTranslated("[PostgresBalanceHistoryRepository] findByUserId");
        }
        return entries;
    }

private:
    pqxx::transaction_base& txn_;
};

} // namespace ledger::adapters::secondary
