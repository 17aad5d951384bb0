// include/ports/output/IUnitOfWork.hpp
#pragma once

#include "ports/output/IBalanceRepository.hpp"
#include "ports/output/IPositionRepository.hpp"
#include "ports/output/IOrderRepository.hpp"
#include "ports/output/IExecutionRepository.hpp"
#include "ports/output/ITransactionRepository.hpp"
#include "ports/output/IStatisticsRepository.hpp"
#include <memory>
#include <string>

namespace ledger::ports::output {

/**
 * @brief Атомарная единица работы над леджером одного пользователя
 *
 * Все изменения, сделанные через репозитории единицы, становятся видимыми
 * только после commit(). Объект, уничтоженный без commit(), откатывает всё.
 *
 * @example
 * ```cpp
 * auto uow = factory->begin(userId);      // эксклюзивная блокировка счёта
 * auto account = uow->balances().findByUserId(userId);
 * account->reserve(amount);
 * uow->balances().save(*account);
 * uow->orders().save(order);
 * uow->commit();
 * ```
 */
class IUnitOfWork {
public:
    virtual ~IUnitOfWork() = default;

    virtual IBalanceRepository& balances() = 0;
    virtual IPositionRepository& positions() = 0;
    virtual IOrderRepository& orders() = 0;
    virtual IExecutionRepository& executions() = 0;
    virtual ITransactionRepository& transactions() = 0;
    virtual IBalanceHistoryRepository& balanceHistory() = 0;
    virtual IStatisticsRepository& statistics() = 0;

    /**
     * @throws domain::PersistenceError если фиксация не удалась
     */
    virtual void commit() = 0;
};

/**
 * @brief Фабрика единиц работы
 */
class IUnitOfWorkFactory {
public:
    virtual ~IUnitOfWorkFactory() = default;

    /**
     * @brief Начать изменяющую единицу работы под блокировкой счёта пользователя
     * @throws domain::ConflictError если блокировку не удалось получить вовремя
     */
    virtual std::unique_ptr<IUnitOfWork> begin(const std::string& userId) = 0;

    /**
     * @brief Неблокирующее представление только для чтения
     */
    virtual std::unique_ptr<IUnitOfWork> read() = 0;
};

} // namespace ledger::ports::output
