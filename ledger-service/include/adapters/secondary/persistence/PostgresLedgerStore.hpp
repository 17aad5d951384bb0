// include/adapters/secondary/persistence/PostgresLedgerStore.hpp
#pragma once

#include "ports/output/IUnitOfWork.hpp"
#include "adapters/secondary/persistence/PgSupport.hpp"
#include "adapters/secondary/persistence/PostgresBalanceRepository.hpp"
#include "adapters/secondary/persistence/PostgresPositionRepository.hpp"
#include "adapters/secondary/persistence/PostgresOrderRepository.hpp"
#include "adapters/secondary/persistence/PostgresTransactionRepository.hpp"
#include "adapters/secondary/persistence/PostgresStatisticsRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>

namespace ledger::adapters::secondary {

/**
 * @brief Единица работы поверх одной транзакции PostgreSQL
 *
 * Блокирующая единица:
 * - транзакция SERIALIZABLE, сбой сериализации (40001) становится ConflictError
 * - SET LOCAL lock_timeout, чтобы ожидание блокировки заканчивалось ConflictError
 * - pg_advisory_xact_lock(hashtext(user_id)) сериализует всю работу по счёту
 * - репозитории читают строки FOR UPDATE
 *
 * Разрушение без commit() откатывает транзакцию (abort в деструкторе pqxx).
 */
class PostgresUnitOfWork : public ports::output::IUnitOfWork {
public:
    using WriteTransaction = pqxx::transaction<pqxx::isolation_level::serializable>;

    PostgresUnitOfWork(const std::string& connectionString, int lockTimeoutMs,
                       const std::optional<std::string>& lockedUserId)
        : conn_(connectionString)
        , txn_(makeTransaction(conn_, lockedUserId.has_value()))
        , readOnly_(!lockedUserId.has_value())
        , balances_(*txn_, !readOnly_)
        , positions_(*txn_, !readOnly_)
        , orders_(*txn_, !readOnly_)
        , executions_(*txn_)
        , transactions_(*txn_)
        , history_(*txn_)
        , statistics_(*txn_)
    {
        if (lockedUserId) {
            txn_->exec("SET LOCAL lock_timeout = '" + std::to_string(lockTimeoutMs) + "ms'");
            txn_->exec_params("SELECT pg_advisory_xact_lock(hashtext($1))", *lockedUserId);
        }
    }

    ports::output::IBalanceRepository& balances() override { return balances_; }
    ports::output::IPositionRepository& positions() override { return positions_; }
    ports::output::IOrderRepository& orders() override { return orders_; }
    ports::output::IExecutionRepository& executions() override { return executions_; }
    ports::output::ITransactionRepository& transactions() override { return transactions_; }
    ports::output::IBalanceHistoryRepository& balanceHistory() override { return history_; }
    ports::output::IStatisticsRepository& statistics() override { return statistics_; }

    void commit() override {
        if (readOnly_) {
            throw domain::PersistenceError("Cannot commit a read-only view");
        }
        try {
            txn_->commit();
        } catch (const pqxx::failure&) {
            pg::rethrowTranslated("[PostgresUnitOfWork] commit");
        }
    }

private:
    pqxx::connection conn_;
    std::unique_ptr<pqxx::transaction_base> txn_;
    bool readOnly_;

    PostgresBalanceRepository balances_;
    PostgresPositionRepository positions_;
    PostgresOrderRepository orders_;
    PostgresExecutionRepository executions_;
    PostgresTransactionRepository transactions_;
    PostgresBalanceHistoryRepository history_;
    PostgresStatisticsRepository statistics_;

    static std::unique_ptr<pqxx::transaction_base> makeTransaction(pqxx::connection& conn, bool writable) {
        if (writable) {
            return std::make_unique<WriteTransaction>(conn);
        }
        return std::make_unique<pqxx::read_transaction>(conn);
    }
};

/**
 * @brief Хранилище леджера в PostgreSQL
 *
 * Каждая единица работы открывает своё соединение. Схема создаётся при
 * старте (CREATE TABLE IF NOT EXISTS); денежные колонки NUMERIC(28,8).
 */
class PostgresLedgerStore : public ports::output::IUnitOfWorkFactory {
public:
    explicit PostgresLedgerStore(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
        std::cout << "[PostgresLedgerStore] Initialized" << std::endl;
    }

    std::unique_ptr<ports::output::IUnitOfWork> begin(const std::string& userId) override {
        try {
            return std::make_unique<PostgresUnitOfWork>(
                settings_->getConnectionString(), settings_->getLockTimeoutMs(), userId);
        } catch (const pqxx::failure&) {
            pg::rethrowTranslated("[PostgresLedgerStore] begin(" + userId + ")");
        }
    }

    std::unique_ptr<ports::output::IUnitOfWork> read() override {
        try {
            return std::make_unique<PostgresUnitOfWork>(
                settings_->getConnectionString(), settings_->getLockTimeoutMs(), std::nullopt);
        } catch (const pqxx::failure&) {
            pg::rethrowTranslated("[PostgresLedgerStore] read");
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS virtual_balances (
                    user_id VARCHAR(64) PRIMARY KEY,
                    cash_balance NUMERIC(28,8) NOT NULL DEFAULT 0,
                    available_cash NUMERIC(28,8) NOT NULL DEFAULT 0,
                    invested_amount NUMERIC(28,8) NOT NULL DEFAULT 0,
                    total_buy_amount NUMERIC(28,8) NOT NULL DEFAULT 0,
                    total_sell_amount NUMERIC(28,8) NOT NULL DEFAULT 0,
                    total_commission NUMERIC(28,8) NOT NULL DEFAULT 0,
                    total_tax NUMERIC(28,8) NOT NULL DEFAULT 0,
                    last_trade_date TIMESTAMPTZ,
                    created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                    updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                    CONSTRAINT available_cash_bounds
                        CHECK (available_cash >= 0 AND available_cash <= cash_balance)
                );

                CREATE TABLE IF NOT EXISTS positions (
                    user_id VARCHAR(64) NOT NULL,
                    product_code VARCHAR(32) NOT NULL,
                    currency VARCHAR(8) NOT NULL,
                    current_quantity NUMERIC(28,8) NOT NULL DEFAULT 0 CHECK (current_quantity >= 0),
                    average_price NUMERIC(28,8) NOT NULL DEFAULT 0,
                    base_average_price NUMERIC(28,8) NOT NULL DEFAULT 0,
                    average_exchange_rate NUMERIC(28,8) NOT NULL DEFAULT 0,
                    realized_profit_loss NUMERIC(28,8) NOT NULL DEFAULT 0,
                    first_buy_date TIMESTAMPTZ,
                    last_buy_date TIMESTAMPTZ,
                    last_sell_date TIMESTAMPTZ,
                    is_active BOOLEAN NOT NULL DEFAULT FALSE,
                    updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                    PRIMARY KEY (user_id, product_code)
                );

                CREATE TABLE IF NOT EXISTS orders (
                    order_id VARCHAR(64) PRIMARY KEY,
                    user_id VARCHAR(64) NOT NULL,
                    stock_id VARCHAR(32) NOT NULL,
                    order_type VARCHAR(8) NOT NULL,
                    order_method VARCHAR(16) NOT NULL,
                    order_status VARCHAR(20) NOT NULL,
                    quantity NUMERIC(28,8) NOT NULL CHECK (quantity > 0),
                    order_price NUMERIC(28,8),
                    currency VARCHAR(8) NOT NULL,
                    exchange_rate NUMERIC(28,8) NOT NULL DEFAULT 1,
                    reference_price NUMERIC(28,8) NOT NULL DEFAULT 0,
                    reserved_amount NUMERIC(28,8) NOT NULL DEFAULT 0,
                    executed_quantity NUMERIC(28,8) NOT NULL DEFAULT 0,
                    executed_amount NUMERIC(28,8) NOT NULL DEFAULT 0,
                    average_price NUMERIC(28,8) NOT NULL DEFAULT 0,
                    commission NUMERIC(28,8) NOT NULL DEFAULT 0,
                    tax NUMERIC(28,8) NOT NULL DEFAULT 0,
                    total_fee NUMERIC(28,8) NOT NULL DEFAULT 0,
                    order_date TIMESTAMPTZ NOT NULL,
                    executed_date TIMESTAMPTZ,
                    cancelled_date TIMESTAMPTZ,
                    expires_at TIMESTAMPTZ,
                    updated_at TIMESTAMPTZ NOT NULL,
                    notes TEXT,
                    CONSTRAINT executed_within_quantity CHECK (executed_quantity <= quantity)
                );

                CREATE INDEX IF NOT EXISTS idx_orders_user_date ON orders(user_id, order_date DESC);
                CREATE INDEX IF NOT EXISTS idx_orders_user_stock_status
                    ON orders(user_id, stock_id, order_status);
                CREATE INDEX IF NOT EXISTS idx_orders_expires_at ON orders(expires_at)
                    WHERE expires_at IS NOT NULL;

                CREATE TABLE IF NOT EXISTS order_executions (
                    seq BIGSERIAL,
                    execution_id VARCHAR(64) PRIMARY KEY,
                    order_id VARCHAR(64) NOT NULL REFERENCES orders(order_id),
                    execution_price NUMERIC(28,8) NOT NULL,
                    execution_quantity NUMERIC(28,8) NOT NULL CHECK (execution_quantity > 0),
                    execution_amount NUMERIC(28,8) NOT NULL,
                    execution_fee NUMERIC(28,8) NOT NULL DEFAULT 0,
                    exchange_rate NUMERIC(28,8) NOT NULL DEFAULT 1,
                    execution_time TIMESTAMPTZ NOT NULL
                );

                CREATE INDEX IF NOT EXISTS idx_order_executions_order
                    ON order_executions(order_id, execution_time);

                CREATE TABLE IF NOT EXISTS transactions (
                    seq BIGSERIAL,
                    transaction_id VARCHAR(64) PRIMARY KEY,
                    user_id VARCHAR(64) NOT NULL,
                    order_id VARCHAR(64),
                    product_code VARCHAR(32),
                    transaction_type VARCHAR(10) NOT NULL,
                    quantity NUMERIC(28,8) NOT NULL DEFAULT 0,
                    price NUMERIC(28,8) NOT NULL DEFAULT 0,
                    amount NUMERIC(28,8) NOT NULL DEFAULT 0,
                    commission NUMERIC(28,8) NOT NULL DEFAULT 0,
                    tax NUMERIC(28,8) NOT NULL DEFAULT 0,
                    net_amount NUMERIC(28,8) NOT NULL DEFAULT 0,
                    cash_balance_before NUMERIC(28,8) NOT NULL,
                    cash_balance_after NUMERIC(28,8) NOT NULL,
                    realized_profit_loss NUMERIC(28,8),
                    purchase_average_exchange_rate NUMERIC(28,8),
                    current_exchange_rate NUMERIC(28,8),
                    exchange_profit_loss NUMERIC(28,8),
                    price_profit_loss NUMERIC(28,8),
                    description TEXT,
                    transaction_date TIMESTAMPTZ NOT NULL
                );

                CREATE INDEX IF NOT EXISTS idx_transactions_user_date
                    ON transactions(user_id, transaction_date DESC);

                CREATE TABLE IF NOT EXISTS balance_history (
                    seq BIGSERIAL,
                    history_id VARCHAR(64) PRIMARY KEY,
                    virtual_balance_id VARCHAR(64) NOT NULL REFERENCES virtual_balances(user_id),
                    previous_cash_balance NUMERIC(28,8) NOT NULL,
                    new_cash_balance NUMERIC(28,8) NOT NULL,
                    change_amount NUMERIC(28,8) NOT NULL,
                    change_type VARCHAR(10) NOT NULL,
                    related_order_id VARCHAR(64),
                    description TEXT,
                    created_at TIMESTAMPTZ NOT NULL
                );

                CREATE INDEX IF NOT EXISTS idx_balance_history_account
                    ON balance_history(virtual_balance_id, created_at DESC);

                CREATE TABLE IF NOT EXISTS trading_statistics (
                    user_id VARCHAR(64) NOT NULL,
                    period_type VARCHAR(10) NOT NULL,
                    period_start TIMESTAMPTZ NOT NULL,
                    period_end TIMESTAMPTZ NOT NULL,
                    total_trades INTEGER NOT NULL DEFAULT 0,
                    buy_trades INTEGER NOT NULL DEFAULT 0,
                    sell_trades INTEGER NOT NULL DEFAULT 0,
                    total_buy_amount NUMERIC(28,8) NOT NULL DEFAULT 0,
                    total_sell_amount NUMERIC(28,8) NOT NULL DEFAULT 0,
                    total_commission NUMERIC(28,8) NOT NULL DEFAULT 0,
                    total_tax NUMERIC(28,8) NOT NULL DEFAULT 0,
                    total_fee NUMERIC(28,8) NOT NULL DEFAULT 0,
                    realized_profit_loss NUMERIC(28,8) NOT NULL DEFAULT 0,
                    win_trades INTEGER NOT NULL DEFAULT 0,
                    loss_trades INTEGER NOT NULL DEFAULT 0,
                    win_rate NUMERIC(7,2) NOT NULL DEFAULT 0,
                    updated_at TIMESTAMPTZ NOT NULL,
                    PRIMARY KEY (user_id, period_type, period_start)
                );
            )");

            txn.commit();
            std::cout << "[PostgresLedgerStore] Schema initialized" << std::endl;
        } catch (const pqxx::failure&) {
            pg::rethrowTranslated("[PostgresLedgerStore] initSchema");
        }
    }
};

} // namespace ledger::adapters::secondary
