// include/ports/output/IExecutionRepository.hpp
#pragma once

#include "domain/Order.hpp"
#include <string>
#include <vector>

namespace ledger::ports::output {

/**
 * @brief Append-only журнал исполнений
 */
class IExecutionRepository {
public:
    virtual ~IExecutionRepository() = default;

    virtual void append(const domain::OrderExecution& execution) = 0;

    /**
     * @brief Исполнения ордера в хронологическом порядке
     */
    virtual std::vector<domain::OrderExecution> findByOrderId(const std::string& orderId) = 0;
};

} // namespace ledger::ports::output
