// include/adapters/secondary/persistence/PostgresOrderRepository.hpp
#pragma once

#include "ports/output/IOrderRepository.hpp"
#include "ports/output/IExecutionRepository.hpp"
#include "adapters/secondary/persistence/PgSupport.hpp"
#include <pqxx/pqxx>

namespace ledger::adapters::secondary {

/**
 * @brief Таблица orders внутри транзакции единицы работы
 *
 * В блокирующей единице findById и findActiveByUserAndStock берут строки
 * FOR UPDATE: резерв количества для SELL считается по активным ордерам,
 * и параллельный SELL того же пользователя должен ждать.
 */
class PostgresOrderRepository : public ports::output::IOrderRepository {
public:
    PostgresOrderRepository(pqxx::transaction_base& txn, bool lockRows)
        : txn_(txn), lockRows_(lockRows) {}

    std::optional<domain::Order> findById(const std::string& orderId) override {
        try {
            auto result = txn_.exec_params(
                selectColumns() + "WHERE order_id = $1" + forUpdate(),
                orderId
            );
            if (result.empty()) {
                return std::nullopt;
            }
            return rowToOrder(result[0]);
        } catch (const pqxx::failure&) {
            pg::rethrowTranslated("[PostgresOrderRepository] findById");
        }
    }

    std::vector<domain::Order> findByUserId(const std::string& userId,
                                            const domain::OrderFilter& filter) override {
        std::optional<std::string> status;
        std::optional<std::string> orderType;
        std::optional<int64_t> limit;
        if (filter.status) status = domain::toString(*filter.status);
        if (filter.orderType) orderType = domain::toString(*filter.orderType);
        if (filter.limit > 0) limit = static_cast<int64_t>(filter.limit);

        try {
            // LIMIT NULL в PostgreSQL означает "без ограничения"
            return toOrders(txn_.exec_params(
                selectColumns() +
                "WHERE user_id = $1 "
                "  AND ($2::VARCHAR IS NULL OR order_status = $2) "
                "  AND ($3::VARCHAR IS NULL OR stock_id = $3) "
                "  AND ($4::VARCHAR IS NULL OR order_type = $4) "
                "ORDER BY order_date DESC, order_id DESC "
                "LIMIT $5",
                userId, status, filter.stockId, orderType, limit
            ));
        } catch (const pqxx::failure&) {
            pg::rethrowTranslated("[PostgresOrderRepository] findByUserId");
        }
    }

    std::vector<domain::Order> findActiveByUserAndStock(const std::string& userId,
                                                        const std::string& stockId,
                                                        domain::OrderType orderType) override {
        try {
            return toOrders(txn_.exec_params(
                selectColumns() +
                "WHERE user_id = $1 AND stock_id = $2 AND order_type = $3 "
                "  AND order_status IN ('PENDING', 'PARTIALLY_FILLED') "
                "ORDER BY order_date" + forUpdate(),
                userId, stockId, domain::toString(orderType)
            ));
        } catch (const pqxx::failure&) {
            pg::rethrowTranslated("[PostgresOrderRepository] findActiveByUserAndStock");
        }
    }

    std::vector<domain::Order> findExpirable(const domain::Timestamp& asOf) override {
        try {
            return toOrders(txn_.exec_params(
                selectColumns() +
                "WHERE order_status IN ('PENDING', 'PARTIALLY_FILLED') "
                "  AND expires_at IS NOT NULL "
                "  AND expires_at <= to_timestamp($1::BIGINT / 1000.0) "
                "ORDER BY user_id, expires_at",
                pg::millis(asOf)
            ));
        } catch (const pqxx::failure&) {
            pg::rethrowTranslated("[PostgresOrderRepository] findExpirable");
        }
    }

    void save(const domain::Order& order) override {
        try {
            txn_.exec_params(
                "INSERT INTO orders "
                "(order_id, user_id, stock_id, order_type, order_method, order_status, "
                " quantity, order_price, currency, exchange_rate, reference_price, reserved_amount, "
                " executed_quantity, executed_amount, average_price, commission, tax, total_fee, "
                " order_date, executed_date, cancelled_date, expires_at, updated_at, notes) "
                "VALUES ($1, $2, $3, $4, $5, $6, "
                "        $7::NUMERIC, $8::NUMERIC, $9, $10::NUMERIC, $11::NUMERIC, $12::NUMERIC, "
                "        $13::NUMERIC, $14::NUMERIC, $15::NUMERIC, $16::NUMERIC, $17::NUMERIC, $18::NUMERIC, "
                "        to_timestamp($19::BIGINT / 1000.0), to_timestamp($20::BIGINT / 1000.0), "
                "        to_timestamp($21::BIGINT / 1000.0), to_timestamp($22::BIGINT / 1000.0), "
                "        to_timestamp($23::BIGINT / 1000.0), $24) "
                "ON CONFLICT (order_id) DO UPDATE SET "
                "order_status = EXCLUDED.order_status, "
                "quantity = EXCLUDED.quantity, "
                "order_price = EXCLUDED.order_price, "
                "reference_price = EXCLUDED.reference_price, "
                "reserved_amount = EXCLUDED.reserved_amount, "
                "executed_quantity = EXCLUDED.executed_quantity, "
                "executed_amount = EXCLUDED.executed_amount, "
                "average_price = EXCLUDED.average_price, "
                "commission = EXCLUDED.commission, "
                "tax = EXCLUDED.tax, "
                "total_fee = EXCLUDED.total_fee, "
                "executed_date = EXCLUDED.executed_date, "
                "cancelled_date = EXCLUDED.cancelled_date, "
                "expires_at = EXCLUDED.expires_at, "
                "updated_at = EXCLUDED.updated_at, "
                "notes = EXCLUDED.notes",
                order.id,
                order.userId,
                order.stockId,
                domain::toString(order.orderType),
                domain::toString(order.orderMethod),
                domain::toString(order.orderStatus),
                pg::num(order.quantity),
                pg::num(order.orderPrice),
                order.currency,
                pg::num(order.exchangeRate),
                pg::num(order.referencePrice),
                pg::num(order.reservedAmount),
                pg::num(order.executedQuantity),
                pg::num(order.executedAmount),
                pg::num(order.averagePrice),
                pg::num(order.commission),
                pg::num(order.tax),
                pg::num(order.totalFee),
                pg::millis(order.orderDate),
                pg::millis(order.executedDate),
                pg::millis(order.cancelledDate),
                pg::millis(order.expiresAt),
                pg::millis(order.updatedAt),
                order.notes
            );
        } catch (const pqxx::failure&) {
            pg::rethrowTranslated("[PostgresOrderRepository] save");
        }
    }

private:
    pqxx::transaction_base& txn_;
    bool lockRows_;

    std::string forUpdate() const {
        return lockRows_ ? " FOR UPDATE" : "";
    }

    static std::string selectColumns() {
        return "SELECT order_id, user_id, stock_id, order_type, order_method, order_status, "
               "       quantity, order_price, currency, exchange_rate, reference_price, reserved_amount, "
               "       executed_quantity, executed_amount, average_price, commission, tax, total_fee, "
               "       " + pg::epochMillis("order_date") + ", "
               "       " + pg::epochMillis("executed_date") + ", "
               "       " + pg::epochMillis("cancelled_date") + ", "
               "       " + pg::epochMillis("expires_at") + ", "
               "       " + pg::epochMillis("updated_at") + ", notes "
               "FROM orders ";
    }

    static std::vector<domain::Order> toOrders(const pqxx::result& result) {
        std::vector<domain::Order> orders;
        orders.reserve(result.size());
        for (const auto& row : result) {
            orders.push_back(rowToOrder(row));
        }
        return orders;
    }

    static domain::Order rowToOrder(const pqxx::row& row) {
        domain::Order order;
        order.id = row["order_id"].as<std::string>();
        order.userId = row["user_id"].as<std::string>();
        order.stockId = row["stock_id"].as<std::string>();
        order.orderType = domain::orderTypeFromString(row["order_type"].as<std::string>());
        order.orderMethod = domain::orderMethodFromString(row["order_method"].as<std::string>());
        order.orderStatus = domain::orderStatusFromString(row["order_status"].as<std::string>());
        order.quantity = pg::decimalField(row["quantity"]);
        order.orderPrice = pg::optionalDecimal(row["order_price"]);
        order.currency = row["currency"].as<std::string>();
        order.exchangeRate = pg::decimalField(row["exchange_rate"]);
        order.referencePrice = pg::decimalField(row["reference_price"]);
        order.reservedAmount = pg::decimalField(row["reserved_amount"]);
        order.executedQuantity = pg::decimalField(row["executed_quantity"]);
        order.executedAmount = pg::decimalField(row["executed_amount"]);
        order.averagePrice = pg::decimalField(row["average_price"]);
        order.commission = pg::decimalField(row["commission"]);
        order.tax = pg::decimalField(row["tax"]);
        order.totalFee = pg::decimalField(row["total_fee"]);
        order.orderDate = pg::timestampField(row["order_date"]);
        order.executedDate = pg::optionalTimestamp(row["executed_date"]);
        order.cancelledDate = pg::optionalTimestamp(row["cancelled_date"]);
        order.expiresAt = pg::optionalTimestamp(row["expires_at"]);
        order.updatedAt = pg::timestampField(row["updated_at"]);
        order.notes = row["notes"].as<std::string>("");
        return order;
    }
};

/**
 * @brief Append-only таблица order_executions
 */
class PostgresExecutionRepository : public ports::output::IExecutionRepository {
public:
    explicit PostgresExecutionRepository(pqxx::transaction_base& txn) : txn_(txn) {}

    void append(const domain::OrderExecution& execution) override {
        try {
            txn_.exec_params(
                "INSERT INTO order_executions "
                "(execution_id, order_id, execution_price, execution_quantity, execution_amount, "
                " execution_fee, exchange_rate, execution_time) "
                "VALUES ($1, $2, $3::NUMERIC, $4::NUMERIC, $5::NUMERIC, $6::NUMERIC, $7::NUMERIC, "
                "        to_timestamp($8::BIGINT / 1000.0))",
                execution.id,
                execution.orderId,
                pg::num(execution.executionPrice),
                pg::num(execution.executionQuantity),
                pg::num(execution.executionAmount),
                pg::num(execution.executionFee),
                pg::num(execution.exchangeRate),
                pg::millis(execution.executionTime)
            );
        } catch (const pqxx::failure&) {
            pg::rethrowTranslated("[PostgresExecutionRepository] append");
        }
    }

    std::vector<domain::OrderExecution> findByOrderId(const std::string& orderId) override {
        std::vector<domain::OrderExecution> executions;
        try {
            auto result = txn_.exec_params(
                "SELECT execution_id, order_id, execution_price, execution_quantity, "
                "       execution_amount, execution_fee, exchange_rate, "
                "       " + pg::epochMillis("execution_time") + " "
                "FROM order_executions WHERE order_id = $1 "
                "ORDER BY execution_time, seq",
                orderId
            );
            for (const auto& row : result) {
                domain::OrderExecution execution;
                execution.id = row["execution_id"].as<std::string>();
                execution.orderId = row["order_id"].as<std::string>();
                execution.executionPrice = pg::decimalField(row["execution_price"]);
                execution.executionQuantity = pg::decimalField(row["execution_quantity"]);
                execution.executionAmount = pg::decimalField(row["execution_amount"]);
                execution.executionFee = pg::decimalField(row["execution_fee"]);
                execution.exchangeRate = pg::decimalField(row["exchange_rate"]);
                execution.executionTime = pg::timestampField(row["execution_time"]);
                executions.push_back(execution);
            }
        } catch (const pqxx::failure&) {
            pg::rethrowTranslated("[PostgresExecutionRepository] findByOrderId");
        }
        return executions;
    }

private:
    pqxx::transaction_base& txn_;
};

} // namespace ledger::adapters::secondary
