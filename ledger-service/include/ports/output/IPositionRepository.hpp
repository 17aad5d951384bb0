// include/ports/output/IPositionRepository.hpp
#pragma once

#include "domain/Position.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ledger::ports::output {

class IPositionRepository {
public:
    virtual ~IPositionRepository() = default;

    virtual std::optional<domain::Position> find(const std::string& userId,
                                                 const std::string& productCode) = 0;

    virtual std::vector<domain::Position> findByUserId(const std::string& userId) = 0;

    virtual void save(const domain::Position& position) = 0;
};

} // namespace ledger::ports::output
