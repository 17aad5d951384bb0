// include/ports/input/IExecutionSettler.hpp
#pragma once

#include "domain/Order.hpp"
#include "domain/OrderRequest.hpp"
#include "domain/Transaction.hpp"

namespace ledger::ports::input {

/**
 * @brief Результат расчёта одного исполнения
 */
struct SettlementResult {
    domain::Order order;
    domain::Transaction transaction;
};

/**
 * @brief Применение исполнений к ордеру, счёту и позиции
 */
class IExecutionSettler {
public:
    virtual ~IExecutionSettler() = default;

    /**
     * @throws domain::NotFoundError ордер не найден
     * @throws domain::ValidationError ордер финальный, неверная цена/количество
     * @throws domain::InsufficientBalanceError проскальзывание увело баланс в минус
     */
    virtual SettlementResult execute(const domain::ExecutionRequest& request) = 0;
};

} // namespace ledger::ports::input
