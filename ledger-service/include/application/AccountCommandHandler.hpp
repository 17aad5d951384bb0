// include/application/AccountCommandHandler.hpp
#pragma once

#include "ports/input/IBalanceService.hpp"
#include "ports/output/IEventConsumer.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "application/EventPayloads.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace ledger::application {

/**
 * @brief Команды по денежному счёту
 *
 * - account.open {"user_id", "initial_cash"?}
 * - account.deposit {"user_id", "amount", "description"?}
 * - account.withdraw {"user_id", "amount", "description"?}
 *
 * Успех виден по balance.changed; отказ публикуется как account.rejected.
 */
class AccountCommandHandler {
public:
    AccountCommandHandler(
        std::shared_ptr<ports::output::IEventConsumer> eventConsumer,
        std::shared_ptr<ports::output::IEventPublisher> eventPublisher,
        std::shared_ptr<ports::input::IBalanceService> balanceService
    ) : eventConsumer_(std::move(eventConsumer))
      , eventPublisher_(std::move(eventPublisher))
      , balanceService_(std::move(balanceService))
    {
        std::cout << "[AccountCommandHandler] Created" << std::endl;
        eventConsumer_->subscribe(
            {events::ACCOUNT_OPEN, events::ACCOUNT_DEPOSIT, events::ACCOUNT_WITHDRAW},
            [this](const std::string& routingKey, const std::string& message) {
                handle(routingKey, message);
            }
        );
    }

private:
    std::shared_ptr<ports::output::IEventConsumer> eventConsumer_;
    std::shared_ptr<ports::output::IEventPublisher> eventPublisher_;
    std::shared_ptr<ports::input::IBalanceService> balanceService_;

    void handle(const std::string& routingKey, const std::string& message) {
        std::string userId;
        try {
            auto json = nlohmann::json::parse(message);
            if (json.contains("user_id") && json["user_id"].is_string()) {
                userId = json["user_id"].get<std::string>();
            }
            std::string description = json.contains("description") && json["description"].is_string()
                ? json["description"].get<std::string>()
                : "";

            if (routingKey == events::ACCOUNT_OPEN) {
                balanceService_->openAccount(userId, decimalFromJson(json, "initial_cash"));
                return;
            }

            auto amount = decimalFromJson(json, "amount");
            if (!amount) {
                throw domain::ValidationError("Missing required field: amount");
            }
            if (routingKey == events::ACCOUNT_DEPOSIT) {
                balanceService_->deposit(userId, *amount, description);
            } else if (routingKey == events::ACCOUNT_WITHDRAW) {
                balanceService_->withdraw(userId, *amount, description);
            }
        } catch (const std::exception& e) {
            std::cerr << "[AccountCommandHandler] " << routingKey << " rejected for user "
                      << userId << ": " << e.what() << std::endl;
            publishEvent(eventPublisher_, "AccountCommandHandler", events::ACCOUNT_REJECTED,
                         {{"command", routingKey}, {"user_id", userId},
                          {"error_type", errorTypeOf(e)}, {"reason", e.what()}});
        }
    }
};

} // namespace ledger::application
