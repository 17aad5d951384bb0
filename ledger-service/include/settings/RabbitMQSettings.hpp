// include/settings/RabbitMQSettings.hpp
#pragma once

#include <string>
#include <cstdlib>

namespace ledger::settings {

/**
 * @brief Настройки RabbitMQ
 *
 * Читает из ENV:
 * - RABBITMQ_HOST (default: "rabbitmq")
 * - RABBITMQ_PORT (default: 5672)
 * - RABBITMQ_USER (default: "guest")
 * - RABBITMQ_PASSWORD (default: "guest")
 * - RABBITMQ_EXCHANGE (default: "ledger.events")
 * - RABBITMQ_QUEUE (default: "ledger.commands") - durable очередь входящих команд
 */
class RabbitMQSettings {
public:
    RabbitMQSettings() {
        if (const char* host = std::getenv("RABBITMQ_HOST")) {
            host_ = host;
        }
        if (const char* port = std::getenv("RABBITMQ_PORT")) {
            port_ = std::stoi(port);
        }
        if (const char* user = std::getenv("RABBITMQ_USER")) {
            user_ = user;
        }
        if (const char* password = std::getenv("RABBITMQ_PASSWORD")) {
            password_ = password;
        }
        if (const char* exchange = std::getenv("RABBITMQ_EXCHANGE")) {
            exchange_ = exchange;
        }
        if (const char* queue = std::getenv("RABBITMQ_QUEUE")) {
            queue_ = queue;
        }
    }

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getUser() const { return user_; }
    std::string getPassword() const { return password_; }
    std::string getExchange() const { return exchange_; }
    std::string getQueue() const { return queue_; }

    std::string getConnectionUrl() const {
        return "amqp://" + user_ + ":" + password_ + "@" + host_ + ":" + std::to_string(port_) + "/";
    }

private:
    std::string host_ = "rabbitmq";
    int port_ = 5672;
    std::string user_ = "guest";
    std::string password_ = "guest";
    std::string exchange_ = "ledger.events";
    std::string queue_ = "ledger.commands";
};

} // namespace ledger::settings
