// include/ports/output/IEventPublisher.hpp
#pragma once

#include <string>

namespace ledger::ports::output {

/**
 * @brief Публикация доменных событий леджера
 *
 * Вызывается только после commit() единицы работы, поэтому подписчики
 * никогда не видят незафиксированное состояние.
 */
class IEventPublisher {
public:
    virtual ~IEventPublisher() = default;

    /**
     * @param routingKey Ключ маршрутизации (например, "order.filled")
     * @param message JSON-сообщение
     */
    virtual void publish(const std::string& routingKey, const std::string& message) = 0;
};

} // namespace ledger::ports::output
