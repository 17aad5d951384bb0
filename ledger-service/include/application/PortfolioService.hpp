// include/application/PortfolioService.hpp
#pragma once

#include "ports/input/IPortfolioService.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include "domain/LedgerErrors.hpp"
#include <algorithm>
#include <memory>

namespace ledger::application {

/**
 * @brief Чтение книги позиций
 */
class PortfolioService : public ports::input::IPortfolioService {
public:
    explicit PortfolioService(std::shared_ptr<ports::output::IUnitOfWorkFactory> unitOfWork)
        : unitOfWork_(std::move(unitOfWork)) {}

    std::vector<domain::Position> getPositions(const std::string& userId,
                                               bool includeInactive) override {
        auto view = unitOfWork_->read();
        auto positions = view->positions().findByUserId(userId);
        if (!includeInactive) {
            positions.erase(
                std::remove_if(positions.begin(), positions.end(),
                               [](const domain::Position& p) { return !p.isActive; }),
                positions.end());
        }
        return positions;
    }

    domain::Position getPosition(const std::string& userId,
                                 const std::string& productCode) override {
        auto view = unitOfWork_->read();
        auto position = view->positions().find(userId, productCode);
        if (!position) {
            throw domain::NotFoundError("Position not found: " + userId + "/" + productCode);
        }
        return *position;
    }

private:
    std::shared_ptr<ports::output::IUnitOfWorkFactory> unitOfWork_;
};

} // namespace ledger::application
