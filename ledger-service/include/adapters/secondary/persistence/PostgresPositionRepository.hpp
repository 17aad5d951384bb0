// include/adapters/secondary/persistence/PostgresPositionRepository.hpp
#pragma once

#include "ports/output/IPositionRepository.hpp"
#include "adapters/secondary/persistence/PgSupport.hpp"
#include <pqxx/pqxx>

namespace ledger::adapters::secondary {

class PostgresPositionRepository : public ports::output::IPositionRepository {
public:
    PostgresPositionRepository(pqxx::transaction_base& txn, bool lockRows)
        : txn_(txn), lockRows_(lockRows) {}

    std::optional<domain::Position> find(const std::string& userId,
                                         const std::string& productCode) override {
        try {
            auto result = txn_.exec_params(
                selectColumns() +
                "WHERE user_id = $1 AND product_code = $2" +
                std::string(lockRows_ ? " FOR UPDATE" : ""),
                userId, productCode
            );

            if (result.empty()) {
                return std::nullopt;
            }
            return rowToPosition(result[0]);
        } catch (const pqxx::failure&) {
            pg::rethrowTranslated("[PostgresPositionRepository] find");
        }
    }

    std::vector<domain::Position> findByUserId(const std::string& userId) override {
        std::vector<domain::Position> positions;
        try {
            auto result = txn_.exec_params(
                selectColumns() + "WHERE user_id = $1 ORDER BY product_code",
                userId
            );
            for (const auto& row : result) {
                positions.push_back(rowToPosition(row));
            }
        } catch (const pqxx::failure&) {
            pg::rethrowTranslated("[PostgresPositionRepository] findByUserId");
        }
        return positions;
    }

    void save(const domain::Position& position) override {
        try {
            txn_.exec_params(
                "INSERT INTO positions "
                "(user_id, product_code, currency, current_quantity, average_price, "
                " base_average_price, average_exchange_rate, realized_profit_loss, "
                " first_buy_date, last_buy_date, last_sell_date, is_active, updated_at) "
                "VALUES ($1, $2, $3, $4::NUMERIC, $5::NUMERIC, $6::NUMERIC, $7::NUMERIC, $8::NUMERIC, "
                "        to_timestamp($9::BIGINT / 1000.0), to_timestamp($10::BIGINT / 1000.0), "
                "        to_timestamp($11::BIGINT / 1000.0), $12, NOW()) "
                "ON CONFLICT (user_id, product_code) DO UPDATE SET "
                "currency = EXCLUDED.currency, "
                "current_quantity = EXCLUDED.current_quantity, "
                "average_price = EXCLUDED.average_price, "
                "base_average_price = EXCLUDED.base_average_price, "
                "average_exchange_rate = EXCLUDED.average_exchange_rate, "
                "realized_profit_loss = EXCLUDED.realized_profit_loss, "
                "first_buy_date = EXCLUDED.first_buy_date, "
                "last_buy_date = EXCLUDED.last_buy_date, "
                "last_sell_date = EXCLUDED.last_sell_date, "
                "is_active = EXCLUDED.is_active, "
                "updated_at = NOW()",
                position.userId,
                position.productCode,
                position.currency,
                pg::num(position.currentQuantity),
                pg::num(position.averagePrice),
                pg::num(position.baseAveragePrice),
                pg::num(position.averageExchangeRate),
                pg::num(position.realizedProfitLoss),
                pg::millis(position.firstBuyDate),
                pg::millis(position.lastBuyDate),
                pg::millis(position.lastSellDate),
                position.isActive
            );
        } catch (const pqxx::failure&) {
            pg::rethrowTranslated("[PostgresPositionRepository] save");
        }
    }

private:
    pqxx::transaction_base& txn_;
    bool lockRows_;

    static std::string selectColumns() {
        return "SELECT user_id, product_code, currency, current_quantity, average_price, "
               "       base_average_price, average_exchange_rate, realized_profit_loss, "
               "       " + pg::epochMillis("first_buy_date") + ", "
               "       " + pg::epochMillis("last_buy_date") + ", "
               "       " + pg::epochMillis("last_sell_date") + ", is_active "
               "FROM positions ";
    }

    static domain::Position rowToPosition(const pqxx::row& row) {
        domain::Position position;
        position.userId = row["user_id"].as<std::string>();
        position.productCode = row["product_code"].as<std::string>();
        position.currency = row["currency"].as<std::string>();
        position.currentQuantity = pg::decimalField(row["current_quantity"]);
        position.averagePrice = pg::decimalField(row["average_price"]);
        position.baseAveragePrice = pg::decimalField(row["base_average_price"]);
        position.averageExchangeRate = pg::decimalField(row["average_exchange_rate"]);
        position.realizedProfitLoss = pg::decimalField(row["realized_profit_loss"]);
        position.firstBuyDate = pg::optionalTimestamp(row["first_buy_date"]);
        position.lastBuyDate = pg::optionalTimestamp(row["last_buy_date"]);
        position.lastSellDate = pg::optionalTimestamp(row["last_sell_date"]);
        position.isActive = row["is_active"].as<bool>();
        return position;
    }
};

} // namespace ledger::adapters::secondary
