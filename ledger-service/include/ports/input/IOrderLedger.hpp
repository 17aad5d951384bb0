// include/ports/input/IOrderLedger.hpp
#pragma once

#include "domain/Order.hpp"
#include "domain/OrderRequest.hpp"
#include <string>
#include <vector>

namespace ledger::ports::input {

/**
 * @brief Жизненный цикл ордеров: приём, изменение, отмена, истечение
 */
class IOrderLedger {
public:
    virtual ~IOrderLedger() = default;

    /**
     * @brief Принять ордер с резервированием средств (BUY) или количества (SELL)
     * @throws domain::ValidationError неверные параметры, oversell
     * @throws domain::InsufficientBalanceError не хватает свободных средств
     * @throws domain::NotFoundError нет счёта
     */
    virtual domain::Order createOrder(const domain::OrderRequest& request) = 0;

    /**
     * @brief Изменить количество/цену/срок PENDING ордера без исполнений
     */
    virtual domain::Order amendOrder(const std::string& userId, const std::string& orderId,
                                     const domain::OrderAmendment& amendment) = 0;

    /**
     * @brief Отменить ордер и вернуть остаток резерва
     */
    virtual domain::Order cancelOrder(const std::string& userId, const std::string& orderId) = 0;

    /**
     * @brief Перевести просроченные активные ордера в EXPIRED
     * @return Количество истёкших ордеров
     */
    virtual size_t expireOrders(const domain::Timestamp& asOf) = 0;

    virtual domain::Order getOrder(const std::string& userId, const std::string& orderId) = 0;

    virtual std::vector<domain::Order> getOrders(const std::string& userId,
                                                 const domain::OrderFilter& filter) = 0;

    virtual std::vector<domain::Order> getPendingOrders(const std::string& userId) = 0;

    virtual std::vector<domain::OrderExecution> getExecutions(const std::string& userId,
                                                              const std::string& orderId) = 0;

    virtual domain::OrderSummary getOrderSummary(const std::string& userId) = 0;
};

} // namespace ledger::ports::input
