// include/ports/output/IEventConsumer.hpp
#pragma once

#include <string>
#include <vector>
#include <functional>

namespace ledger::ports::output {

/**
 * @brief Обработчик: routingKey и JSON-сообщение
 */
using EventHandler = std::function<void(const std::string& routingKey, const std::string& message)>;

/**
 * @brief Потребитель событий
 *
 * @example
 * ```cpp
 * eventConsumer->subscribe({"execution.report", "order.expire"},
 *     [this](const std::string& routingKey, const std::string& message) {
 *         handle(routingKey, message);
 *     });
 * eventConsumer->start();
 * ```
 */
class IEventConsumer {
public:
    virtual ~IEventConsumer() = default;

    virtual void subscribe(const std::vector<std::string>& routingKeys, EventHandler handler) = 0;

    virtual void start() = 0;

    virtual void stop() = 0;
};

} // namespace ledger::ports::output
