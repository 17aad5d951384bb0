// include/application/StatisticsEventHandler.hpp
#pragma once

#include "ports/input/IStatisticsAggregator.hpp"
#include "ports/output/IEventConsumer.hpp"
#include "application/EventPayloads.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace ledger::application {

/**
 * @brief Асинхронное обновление дневной статистики
 *
 * Слушает transaction.settled и пересчитывает день проводки.
 * Ошибка пересчёта не влияет на леджер: статистику можно перестроить.
 */
class StatisticsEventHandler {
public:
    StatisticsEventHandler(
        std::shared_ptr<ports::output::IEventConsumer> eventConsumer,
        std::shared_ptr<ports::input::IStatisticsAggregator> aggregator
    ) : eventConsumer_(std::move(eventConsumer))
      , aggregator_(std::move(aggregator))
    {
        std::cout << "[StatisticsEventHandler] Created" << std::endl;
        eventConsumer_->subscribe(
            {events::TRANSACTION_SETTLED},
            [this](const std::string& routingKey, const std::string& message) {
                handle(routingKey, message);
            }
        );
    }

private:
    std::shared_ptr<ports::output::IEventConsumer> eventConsumer_;
    std::shared_ptr<ports::input::IStatisticsAggregator> aggregator_;

    void handle(const std::string& routingKey, const std::string& message) {
        try {
            auto json = nlohmann::json::parse(message);
            std::string userId = json.value("user_id", "");
            auto date = json.contains("transaction_date")
                ? domain::Timestamp::fromString(json["transaction_date"].get<std::string>())
                : domain::Timestamp::now();

            aggregator_->updateDailyStatistics(userId, date);
        } catch (const std::exception& e) {
            std::cerr << "[StatisticsEventHandler] Failed to process " << routingKey
                      << ": " << e.what() << std::endl;
        }
    }
};

} // namespace ledger::application
