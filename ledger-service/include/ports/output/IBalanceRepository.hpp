// include/ports/output/IBalanceRepository.hpp
#pragma once

#include "domain/BalanceAccount.hpp"
#include <optional>
#include <string>

namespace ledger::ports::output {

/**
 * @brief Репозиторий денежных счетов
 *
 * Внутри блокирующей единицы работы чтение берёт строку на запись
 * (SELECT ... FOR UPDATE в PostgreSQL).
 */
class IBalanceRepository {
public:
    virtual ~IBalanceRepository() = default;

    virtual std::optional<domain::BalanceAccount> findByUserId(const std::string& userId) = 0;

    /**
     * @brief Insert или update по userId
     */
    virtual void save(const domain::BalanceAccount& account) = 0;
};

} // namespace ledger::ports::output
