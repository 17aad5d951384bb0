// include/adapters/secondary/persistence/InMemoryLedgerStore.hpp
#pragma once

#include "ports/output/IUnitOfWork.hpp"
#include "domain/LedgerErrors.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ledger::adapters::secondary {

/**
 * @brief Таблицы леджера в памяти
 */
struct LedgerTables {
    using PositionKey = std::pair<std::string, std::string>;                  ///< (userId, productCode)
    using StatisticsKey = std::tuple<std::string, std::string, int64_t>;      ///< (userId, periodType, start)

    std::map<std::string, domain::BalanceAccount> balances;
    std::map<PositionKey, domain::Position> positions;
    std::map<std::string, domain::Order> orders;
    std::vector<domain::OrderExecution> executions;
    std::vector<domain::Transaction> transactions;
    std::vector<domain::BalanceHistory> history;
    std::map<StatisticsKey, domain::TradingStatistics> statistics;

    bool empty() const {
        return balances.empty() && positions.empty() && orders.empty() &&
               executions.empty() && transactions.empty() && history.empty() &&
               statistics.empty();
    }
};

/**
 * @brief Зафиксированное состояние, общее для всех единиц работы
 */
struct InMemoryLedgerState {
    mutable std::shared_mutex mutex;
    LedgerTables committed;
};

/**
 * @brief Единица работы над InMemoryLedgerState
 *
 * Записи копятся в staged-таблицах; чтение видит staged поверх committed.
 * commit() переносит staged в committed под эксклюзивной блокировкой данных,
 * так что другие потоки видят изменения единицы целиком или не видят вовсе.
 * Блокировка счёта пользователя (если есть) держится до разрушения объекта.
 */
class InMemoryUnitOfWork : public ports::output::IUnitOfWork {
public:
    InMemoryUnitOfWork(InMemoryLedgerState& state,
                       std::shared_ptr<std::timed_mutex> userMutex,
                       std::unique_lock<std::timed_mutex> userLock,
                       bool readOnly)
        : state_(state)
        , userMutex_(std::move(userMutex))
        , userLock_(std::move(userLock))
        , readOnly_(readOnly)
        , balances_(*this)
        , positions_(*this)
        , orders_(*this)
        , executions_(*this)
        , transactions_(*this)
        , history_(*this)
        , statistics_(*this)
    {}

    ~InMemoryUnitOfWork() override {
        if (!committed_ && !staged_.empty()) {
            std::cout << "[InMemoryUnitOfWork] Rolled back uncommitted changes" << std::endl;
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
        if (committed_) {
            throw domain::PersistenceError("Unit of work already committed");
        }

        std::unique_lock<std::shared_mutex> lock(state_.mutex);
        auto& target = state_.committed;
        for (auto& [key, value] : staged_.balances) target.balances[key] = std::move(value);
        for (auto& [key, value] : staged_.positions) target.positions[key] = std::move(value);
        for (auto& [key, value] : staged_.orders) target.orders[key] = std::move(value);
        for (auto& [key, value] : staged_.statistics) target.statistics[key] = std::move(value);
        std::move(staged_.executions.begin(), staged_.executions.end(), std::back_inserter(target.executions));
        std::move(staged_.transactions.begin(), staged_.transactions.end(), std::back_inserter(target.transactions));
        std::move(staged_.history.begin(), staged_.history.end(), std::back_inserter(target.history));

        staged_ = LedgerTables();
        committed_ = true;
    }

private:
    InMemoryLedgerState& state_;
    std::shared_ptr<std::timed_mutex> userMutex_;
    std::unique_lock<std::timed_mutex> userLock_;
    bool readOnly_;
    bool committed_ = false;
    LedgerTables staged_;

    void ensureWritable() const {
        if (readOnly_) {
            throw domain::PersistenceError("Write attempted through a read-only view");
        }
        if (committed_) {
            throw domain::PersistenceError("Write attempted after commit");
        }
    }

    // ===== Репозитории =====

    class Balances : public ports::output::IBalanceRepository {
    public:
        explicit Balances(InMemoryUnitOfWork& uow) : uow_(uow) {}

        std::optional<domain::BalanceAccount> findByUserId(const std::string& userId) override {
            auto staged = uow_.staged_.balances.find(userId);
            if (staged != uow_.staged_.balances.end()) {
                return staged->second;
            }
            std::shared_lock<std::shared_mutex> lock(uow_.state_.mutex);
            auto it = uow_.state_.committed.balances.find(userId);
            if (it == uow_.state_.committed.balances.end()) {
                return std::nullopt;
            }
            return it->second;
        }

        void save(const domain::BalanceAccount& account) override {
            uow_.ensureWritable();
            uow_.staged_.balances[account.userId] = account;
        }

    private:
        InMemoryUnitOfWork& uow_;
    };

    class Positions : public ports::output::IPositionRepository {
    public:
        explicit Positions(InMemoryUnitOfWork& uow) : uow_(uow) {}

        std::optional<domain::Position> find(const std::string& userId,
                                             const std::string& productCode) override {
            LedgerTables::PositionKey key{userId, productCode};
            auto staged = uow_.staged_.positions.find(key);
            if (staged != uow_.staged_.positions.end()) {
                return staged->second;
            }
            std::shared_lock<std::shared_mutex> lock(uow_.state_.mutex);
            auto it = uow_.state_.committed.positions.find(key);
            if (it == uow_.state_.committed.positions.end()) {
                return std::nullopt;
            }
            return it->second;
        }

        std::vector<domain::Position> findByUserId(const std::string& userId) override {
            std::map<LedgerTables::PositionKey, domain::Position> merged;
            {
                std::shared_lock<std::shared_mutex> lock(uow_.state_.mutex);
                for (const auto& [key, position] : uow_.state_.committed.positions) {
                    if (key.first == userId) merged[key] = position;
                }
            }
            for (const auto& [key, position] : uow_.staged_.positions) {
                if (key.first == userId) merged[key] = position;
            }

            std::vector<domain::Position> result;
            for (auto& [key, position] : merged) {
                result.push_back(std::move(position));
            }
            return result;
        }

        void save(const domain::Position& position) override {
            uow_.ensureWritable();
            uow_.staged_.positions[{position.userId, position.productCode}] = position;
        }

    private:
        InMemoryUnitOfWork& uow_;
    };

    class Orders : public ports::output::IOrderRepository {
    public:
        explicit Orders(InMemoryUnitOfWork& uow) : uow_(uow) {}

        std::optional<domain::Order> findById(const std::string& orderId) override {
            auto staged = uow_.staged_.orders.find(orderId);
            if (staged != uow_.staged_.orders.end()) {
                return staged->second;
            }
            std::shared_lock<std::shared_mutex> lock(uow_.state_.mutex);
            auto it = uow_.state_.committed.orders.find(orderId);
            if (it == uow_.state_.committed.orders.end()) {
                return std::nullopt;
            }
            return it->second;
        }

        std::vector<domain::Order> findByUserId(const std::string& userId,
                                                const domain::OrderFilter& filter) override {
            auto orders = merged([&](const domain::Order& order) {
                return order.userId == userId &&
                       (!filter.status || order.orderStatus == *filter.status) &&
                       (!filter.stockId || order.stockId == *filter.stockId) &&
                       (!filter.orderType || order.orderType == *filter.orderType);
            });

            std::stable_sort(orders.begin(), orders.end(),
                             [](const domain::Order& a, const domain::Order& b) {
                                 return a.orderDate > b.orderDate;
                             });
            if (filter.limit > 0 && orders.size() > filter.limit) {
                orders.resize(filter.limit);
            }
            return orders;
        }

        std::vector<domain::Order> findActiveByUserAndStock(const std::string& userId,
                                                            const std::string& stockId,
                                                            domain::OrderType orderType) override {
            return merged([&](const domain::Order& order) {
                return order.userId == userId && order.stockId == stockId &&
                       order.orderType == orderType && order.isActive();
            });
        }

        std::vector<domain::Order> findExpirable(const domain::Timestamp& asOf) override {
            return merged([&](const domain::Order& order) {
                return order.isActive() && order.isExpiredAt(asOf);
            });
        }

        void save(const domain::Order& order) override {
            uow_.ensureWritable();
            uow_.staged_.orders[order.id] = order;
        }

    private:
        InMemoryUnitOfWork& uow_;

        template <typename Predicate>
        std::vector<domain::Order> merged(Predicate predicate) {
            std::map<std::string, domain::Order> byId;
            {
                std::shared_lock<std::shared_mutex> lock(uow_.state_.mutex);
                for (const auto& [id, order] : uow_.state_.committed.orders) {
                    byId[id] = order;
                }
            }
            for (const auto& [id, order] : uow_.staged_.orders) {
                byId[id] = order;
            }

            std::vector<domain::Order> result;
            for (auto& [id, order] : byId) {
                if (predicate(order)) {
                    result.push_back(std::move(order));
                }
            }
            return result;
        }
    };

    class Executions : public ports::output::IExecutionRepository {
    public:
        explicit Executions(InMemoryUnitOfWork& uow) : uow_(uow) {}

        void append(const domain::OrderExecution& execution) override {
            uow_.ensureWritable();
            uow_.staged_.executions.push_back(execution);
        }

        std::vector<domain::OrderExecution> findByOrderId(const std::string& orderId) override {
            std::vector<domain::OrderExecution> result;
            {
                std::shared_lock<std::shared_mutex> lock(uow_.state_.mutex);
                for (const auto& execution : uow_.state_.committed.executions) {
                    if (execution.orderId == orderId) result.push_back(execution);
                }
            }
            for (const auto& execution : uow_.staged_.executions) {
                if (execution.orderId == orderId) result.push_back(execution);
            }
            return result;
        }

    private:
        InMemoryUnitOfWork& uow_;
    };

    class Transactions : public ports::output::ITransactionRepository {
    public:
        explicit Transactions(InMemoryUnitOfWork& uow) : uow_(uow) {}

        void append(const domain::Transaction& transaction) override {
            uow_.ensureWritable();
            uow_.staged_.transactions.push_back(transaction);
        }

        std::vector<domain::Transaction> findByUserId(const std::string& userId,
                                                      const domain::TransactionFilter& filter) override {
            auto matches = [&](const domain::Transaction& t) {
                return t.userId == userId &&
                       (!filter.transactionType || t.transactionType == *filter.transactionType) &&
                       (!filter.from || t.transactionDate >= *filter.from) &&
                       (!filter.to || t.transactionDate < *filter.to);
            };

            std::vector<domain::Transaction> result;
            for (auto it = uow_.staged_.transactions.rbegin(); it != uow_.staged_.transactions.rend(); ++it) {
                if (matches(*it)) result.push_back(*it);
            }
            {
                std::shared_lock<std::shared_mutex> lock(uow_.state_.mutex);
                const auto& committed = uow_.state_.committed.transactions;
                for (auto it = committed.rbegin(); it != committed.rend(); ++it) {
                    if (matches(*it)) result.push_back(*it);
                }
            }

            std::stable_sort(result.begin(), result.end(),
                             [](const domain::Transaction& a, const domain::Transaction& b) {
                                 return a.transactionDate > b.transactionDate;
                             });
            if (filter.limit > 0 && result.size() > filter.limit) {
                result.resize(filter.limit);
            }
            return result;
        }

    private:
        InMemoryUnitOfWork& uow_;
    };

    class History : public ports::output::IBalanceHistoryRepository {
    public:
        explicit History(InMemoryUnitOfWork& uow) : uow_(uow) {}

        void append(const domain::BalanceHistory& entry) override {
            uow_.ensureWritable();
            uow_.staged_.history.push_back(entry);
        }

        std::vector<domain::BalanceHistory> findByUserId(const std::string& userId, size_t limit) override {
            std::vector<domain::BalanceHistory> result;
            for (auto it = uow_.staged_.history.rbegin(); it != uow_.staged_.history.rend(); ++it) {
                if (it->virtualBalanceId == userId) result.push_back(*it);
            }
            {
                std::shared_lock<std::shared_mutex> lock(uow_.state_.mutex);
                const auto& committed = uow_.state_.committed.history;
                for (auto it = committed.rbegin(); it != committed.rend(); ++it) {
                    if (it->virtualBalanceId == userId) result.push_back(*it);
                }
            }
            if (limit > 0 && result.size() > limit) {
                result.resize(limit);
            }
            return result;
        }

    private:
        InMemoryUnitOfWork& uow_;
    };

    class Statistics : public ports::output::IStatisticsRepository {
    public:
        explicit Statistics(InMemoryUnitOfWork& uow) : uow_(uow) {}

        void upsert(const domain::TradingStatistics& statistics) override {
            uow_.ensureWritable();
            uow_.staged_.statistics[keyOf(statistics.userId, statistics.periodType, statistics.periodStart)]
                = statistics;
        }

        std::optional<domain::TradingStatistics> find(const std::string& userId,
                                                      const std::string& periodType,
                                                      const domain::Timestamp& periodStart) override {
            auto key = keyOf(userId, periodType, periodStart);
            auto staged = uow_.staged_.statistics.find(key);
            if (staged != uow_.staged_.statistics.end()) {
                return staged->second;
            }
            std::shared_lock<std::shared_mutex> lock(uow_.state_.mutex);
            auto it = uow_.state_.committed.statistics.find(key);
            if (it == uow_.state_.committed.statistics.end()) {
                return std::nullopt;
            }
            return it->second;
        }

        std::vector<domain::TradingStatistics> findRange(const std::string& userId,
                                                         const std::string& periodType,
                                                         const domain::Timestamp& from,
                                                         const domain::Timestamp& to) override {
            std::map<LedgerTables::StatisticsKey, domain::TradingStatistics> merged;
            auto inRange = [&](const domain::TradingStatistics& s) {
                return s.userId == userId && s.periodType == periodType &&
                       s.periodStart >= from && s.periodStart <= to;
            };
            {
                std::shared_lock<std::shared_mutex> lock(uow_.state_.mutex);
                for (const auto& [key, s] : uow_.state_.committed.statistics) {
                    if (inRange(s)) merged[key] = s;
                }
            }
            for (const auto& [key, s] : uow_.staged_.statistics) {
                if (inRange(s)) merged[key] = s;
            }

            std::vector<domain::TradingStatistics> result;
            for (auto& [key, s] : merged) {
                result.push_back(std::move(s));
            }
            std::sort(result.begin(), result.end(),
                      [](const domain::TradingStatistics& a, const domain::TradingStatistics& b) {
                          return a.periodStart < b.periodStart;
                      });
            return result;
        }

    private:
        InMemoryUnitOfWork& uow_;

        static LedgerTables::StatisticsKey keyOf(const std::string& userId, const std::string& periodType,
                                                 const domain::Timestamp& start) {
            return {userId, periodType, start.toUnixSeconds()};
        }
    };

    Balances balances_;
    Positions positions_;
    Orders orders_;
    Executions executions_;
    Transactions transactions_;
    History history_;
    Statistics statistics_;
};

/**
 * @brief Хранилище леджера в памяти (тесты, локальный запуск)
 *
 * Блокировка счёта - std::timed_mutex на пользователя; ожидание дольше
 * lockTimeout завершается ConflictError.
 *
 * @example
 * ```cpp
 * auto store = std::make_shared<InMemoryLedgerStore>();
 * auto ledger = std::make_shared<OrderLedger>(store, prices, publisher, fees, settings);
 * ```
 */
class InMemoryLedgerStore : public ports::output::IUnitOfWorkFactory {
public:
    explicit InMemoryLedgerStore(std::chrono::milliseconds lockTimeout = std::chrono::milliseconds{5000})
        : lockTimeout_(lockTimeout)
    {
        std::cout << "[InMemoryLedgerStore] Initialized" << std::endl;
    }

    std::unique_ptr<ports::output::IUnitOfWork> begin(const std::string& userId) override {
        auto mutex = userMutex(userId);
        std::unique_lock<std::timed_mutex> lock(*mutex, std::defer_lock);
        if (!lock.try_lock_for(lockTimeout_)) {
            throw domain::ConflictError("Could not lock balance account of user " + userId
                                        + " within " + std::to_string(lockTimeout_.count()) + "ms");
        }
        return std::make_unique<InMemoryUnitOfWork>(state_, std::move(mutex), std::move(lock), false);
    }

    std::unique_ptr<ports::output::IUnitOfWork> read() override {
        return std::make_unique<InMemoryUnitOfWork>(state_, nullptr, std::unique_lock<std::timed_mutex>(), true);
    }

private:
    InMemoryLedgerState state_;
    std::chrono::milliseconds lockTimeout_;
    std::mutex locksMutex_;
    std::unordered_map<std::string, std::shared_ptr<std::timed_mutex>> userLocks_;

    std::shared_ptr<std::timed_mutex> userMutex(const std::string& userId) {
        std::lock_guard<std::mutex> lock(locksMutex_);
        auto& mutex = userLocks_[userId];
        if (!mutex) {
            mutex = std::make_shared<std::timed_mutex>();
        }
        return mutex;
    }
};

} // namespace ledger::adapters::secondary
