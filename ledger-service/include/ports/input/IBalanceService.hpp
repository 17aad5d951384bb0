// include/ports/input/IBalanceService.hpp
#pragma once

#include "domain/BalanceAccount.hpp"
#include "domain/Transaction.hpp"
#include "domain/OrderRequest.hpp"
#include "domain/ProfitLossReport.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ledger::ports::input {

/**
 * @brief Операции со счётом для внешнего платёжного контура
 */
class IBalanceService {
public:
    virtual ~IBalanceService() = default;

    /**
     * @param initialCash nullopt - сумма из настроек
     * @throws domain::ConflictError счёт уже существует
     */
    virtual domain::BalanceAccount openAccount(const std::string& userId,
                                               const std::optional<domain::Decimal>& initialCash) = 0;

    virtual domain::Transaction deposit(const std::string& userId, const domain::Decimal& amount,
                                        const std::string& description) = 0;

    /**
     * @throws domain::InsufficientBalanceError сумма больше свободных средств
     */
    virtual domain::Transaction withdraw(const std::string& userId, const domain::Decimal& amount,
                                         const std::string& description) = 0;

    virtual domain::BalanceAccount getBalance(const std::string& userId) = 0;

    virtual std::vector<domain::BalanceHistory> getBalanceHistory(const std::string& userId,
                                                                  size_t limit) = 0;

    virtual std::vector<domain::Transaction> getTransactions(const std::string& userId,
                                                             const domain::TransactionFilter& filter) = 0;

    /**
     * @brief Сумма реализованного результата по продажам за [from, to)
     */
    virtual domain::Decimal getRealizedProfitLoss(const std::string& userId,
                                                  const domain::Timestamp& from,
                                                  const domain::Timestamp& to) = 0;

    /**
     * @brief Реализованный результат по инструментам за [from, to)
     * с разбивкой на ценовую и курсовую составляющие
     */
    virtual domain::ProfitLossReport getProductProfitLoss(const std::string& userId,
                                                          const domain::Timestamp& from,
                                                          const domain::Timestamp& to,
                                                          domain::MarketScope scope) = 0;
};

} // namespace ledger::ports::input
