// include/ports/input/IPortfolioService.hpp
#pragma once

#include "domain/Position.hpp"
#include <string>
#include <vector>

namespace ledger::ports::input {

class IPortfolioService {
public:
    virtual ~IPortfolioService() = default;

    virtual std::vector<domain::Position> getPositions(const std::string& userId,
                                                       bool includeInactive) = 0;

    /**
     * @throws domain::NotFoundError позиции нет
     */
    virtual domain::Position getPosition(const std::string& userId,
                                         const std::string& productCode) = 0;
};

} // namespace ledger::ports::input
