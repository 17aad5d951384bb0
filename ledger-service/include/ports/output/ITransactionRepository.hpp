// include/ports/output/ITransactionRepository.hpp
#pragma once

#include "domain/Transaction.hpp"
#include "domain/OrderRequest.hpp"
#include <string>
#include <vector>

namespace ledger::ports::output {

/**
 * @brief Append-only журнал проводок и истории баланса
 */
class ITransactionRepository {
public:
    virtual ~ITransactionRepository() = default;

    virtual void append(const domain::Transaction& transaction) = 0;

    /**
     * @brief Проводки пользователя, новые первыми; limit == 0 - без ограничения
     */
    virtual std::vector<domain::Transaction> findByUserId(const std::string& userId,
                                                          const domain::TransactionFilter& filter) = 0;
};

class IBalanceHistoryRepository {
public:
    virtual ~IBalanceHistoryRepository() = default;

    virtual void append(const domain::BalanceHistory& entry) = 0;

    /**
     * @brief История счёта, новые первыми; limit == 0 - без ограничения
     */
    virtual std::vector<domain::BalanceHistory> findByUserId(const std::string& userId,
                                                             size_t limit) = 0;
};

} // namespace ledger::ports::output
