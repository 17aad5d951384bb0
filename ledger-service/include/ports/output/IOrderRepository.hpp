// include/ports/output/IOrderRepository.hpp
#pragma once

#include "domain/Order.hpp"
#include "domain/OrderRequest.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ledger::ports::output {

/**
 * @brief Репозиторий ордеров
 */
class IOrderRepository {
public:
    virtual ~IOrderRepository() = default;

    virtual std::optional<domain::Order> findById(const std::string& orderId) = 0;

    /**
     * @brief Ордера пользователя, новые первыми
     */
    virtual std::vector<domain::Order> findByUserId(const std::string& userId,
                                                    const domain::OrderFilter& filter) = 0;

    /**
     * @brief Активные (PENDING/PARTIALLY_FILLED) ордера пользователя по инструменту
     *
     * Основа query-based резерва количества для SELL. В блокирующей
     * единице работы строки блокируются на запись.
     */
    virtual std::vector<domain::Order> findActiveByUserAndStock(const std::string& userId,
                                                                const std::string& stockId,
                                                                domain::OrderType orderType) = 0;

    /**
     * @brief Активные ордера с expiresAt <= asOf (все пользователи)
     */
    virtual std::vector<domain::Order> findExpirable(const domain::Timestamp& asOf) = 0;

    virtual void save(const domain::Order& order) = 0;
};

} // namespace ledger::ports::output
