// include/adapters/secondary/events/RabbitMQAdapter.hpp
#pragma once

#include "ports/output/IEventPublisher.hpp"
#include "ports/output/IEventConsumer.hpp"
#include "settings/RabbitMQSettings.hpp"
#include <amqpcpp.h>
#include <amqpcpp/libboostasio.h>
#include <boost/asio.hpp>
#include <atomic>
#include <deque>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>

namespace ledger::adapters::secondary {

/**
 * @brief RabbitMQ адаптер леджера
 *
 * Реализует IEventPublisher и IEventConsumer поверх одного соединения.
 *
 * - Exchange: topic (ledger.events)
 * - Входящие команды (execution.report, order.cancel, order.expire) и
 *   transaction.settled читаются из durable очереди ledger.commands
 * - Исходящие события: order.*, transaction.settled, balance.changed
 *
 * AMQP-CPP не потокобезопасен, поэтому publish() из любых потоков
 * перекладывается в поток io_context. До готовности канала сообщения
 * копятся в outbox и уходят после объявления exchange.
 *
 * @example
 * ```cpp
 * auto adapter = std::make_shared<RabbitMQAdapter>(std::make_shared<RabbitMQSettings>());
 * adapter->subscribe({"execution.report"}, [](const std::string& key, const std::string& msg) {
 *     std::cout << key << ": " << msg << std::endl;
 * });
 * adapter->start();
 * adapter->publish("order.created", R"({"order_id":"ord-001"})");
 * ```
 */
class RabbitMQAdapter : public ports::output::IEventPublisher,
                        public ports::output::IEventConsumer {
public:
    explicit RabbitMQAdapter(std::shared_ptr<settings::RabbitMQSettings> settings)
        : settings_(std::move(settings))
        , running_(false)
        , ready_(false)
        , ioContext_()
        , workGuard_(boost::asio::make_work_guard(ioContext_))
        , handler_(ioContext_)
    {
        exchangeName_ = settings_->getExchange();
        queueName_ = settings_->getQueue();
        std::cout << "[RabbitMQAdapter] Created for "
                  << settings_->getHost() << ":" << settings_->getPort()
                  << " exchange=" << exchangeName_
                  << " queue=" << queueName_ << std::endl;
    }

    ~RabbitMQAdapter() override {
        stop();
    }

    // =========================================================================
    // IEventPublisher
    // =========================================================================

    void publish(const std::string& routingKey, const std::string& message) override {
        if (!running_) {
            std::cerr << "[RabbitMQAdapter] Cannot publish " << routingKey
                      << ": adapter not started" << std::endl;
            return;
        }

        boost::asio::post(ioContext_, [this, routingKey, message]() {
            if (!ready_) {
                outbox_.emplace_back(routingKey, message);
                return;
            }
            send(routingKey, message);
        });
    }

    // =========================================================================
    // IEventConsumer
    // =========================================================================

    /**
     * @brief Подписаться до start(): привязки создаются при подключении
     */
    void subscribe(const std::vector<std::string>& routingKeys,
                   ports::output::EventHandler handler) override {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        for (const auto& key : routingKeys) {
            if (handlers_.find(key) == handlers_.end()) {
                bindings_.push_back(key);
            }
            handlers_[key].push_back(handler);
        }
    }

    void start() override {
        if (running_.exchange(true)) return;

        workerThread_ = std::thread([this]() {
            try {
                connect();
                ioContext_.run();
            } catch (const std::exception& e) {
                std::cerr << "[RabbitMQAdapter] Worker error: " << e.what() << std::endl;
            }
        });

        std::cout << "[RabbitMQAdapter] Started" << std::endl;
    }

    void stop() override {
        if (!running_.exchange(false)) return;

        boost::asio::post(ioContext_, [this]() {
            if (connection_) {
                connection_->close();
            }
        });
        workGuard_.reset();
        ioContext_.stop();

        if (workerThread_.joinable()) {
            workerThread_.join();
        }

        channel_.reset();
        connection_.reset();

        if (!outbox_.empty()) {
            std::cerr << "[RabbitMQAdapter] Dropped " << outbox_.size()
                      << " unsent events on stop" << std::endl;
            outbox_.clear();
        }

        std::cout << "[RabbitMQAdapter] Stopped" << std::endl;
    }

private:
    using OutgoingMessage = std::pair<std::string, std::string>;

    void connect() {
        connection_ = std::make_unique<AMQP::TcpConnection>(&handler_,
            AMQP::Address(settings_->getConnectionUrl()));
        channel_ = std::make_unique<AMQP::TcpChannel>(connection_.get());

        channel_->onError([](const char* msg) {
            std::cerr << "[RabbitMQAdapter] Channel error: " << msg << std::endl;
        });

        channel_->declareExchange(exchangeName_, AMQP::topic, AMQP::durable)
            .onSuccess([this]() {
                std::cout << "[RabbitMQAdapter] Exchange declared: " << exchangeName_ << std::endl;
                ready_ = true;
                flushOutbox();
                setupBindings();
            })
            .onError([](const char* msg) {
                std::cerr << "[RabbitMQAdapter] Exchange error: " << msg << std::endl;
            });
    }

    void setupBindings() {
        channel_->declareQueue(queueName_, AMQP::durable)
            .onSuccess([this](const std::string& name, uint32_t messageCount, uint32_t) {
                std::cout << "[RabbitMQAdapter] Queue declared: " << name
                          << " (" << messageCount << " waiting)" << std::endl;

                std::vector<std::string> keys;
                {
                    std::lock_guard<std::mutex> lock(handlersMutex_);
                    keys = bindings_;
                }
                for (const auto& key : keys) {
                    channel_->bindQueue(exchangeName_, queueName_, key);
                    std::cout << "[RabbitMQAdapter] Bound: " << key << std::endl;
                }

                startConsuming();
            })
            .onError([this](const char* msg) {
                std::cerr << "[RabbitMQAdapter] Queue error (" << queueName_ << "): " << msg << std::endl;
            });
    }

    void startConsuming() {
        channel_->consume(queueName_)
            .onReceived([this](const AMQP::Message& msg, uint64_t tag, bool) {
                std::string routingKey = msg.routingkey();
                std::string body(msg.body(), msg.bodySize());

                std::cout << "[RabbitMQAdapter] Received " << routingKey << std::endl;
                dispatch(routingKey, body);
                channel_->ack(tag);
            })
            .onError([](const char* msg) {
                std::cerr << "[RabbitMQAdapter] Consume error: " << msg << std::endl;
            });
    }

    /**
     * @brief Вызвать обработчики вне handlersMutex_
     *
     * Обработчик может публиковать события; исключение одного обработчика
     * не мешает остальным и не блокирует ack.
     */
    void dispatch(const std::string& routingKey, const std::string& body) {
        std::vector<ports::output::EventHandler> handlers;
        {
            std::lock_guard<std::mutex> lock(handlersMutex_);
            auto it = handlers_.find(routingKey);
            if (it == handlers_.end()) {
                return;
            }
            handlers = it->second;
        }

        for (const auto& handler : handlers) {
            try {
                handler(routingKey, body);
            } catch (const std::exception& e) {
                std::cerr << "[RabbitMQAdapter] Handler error on " << routingKey
                          << ": " << e.what() << std::endl;
            }
        }
    }

    void flushOutbox() {
        while (!outbox_.empty()) {
            auto message = std::move(outbox_.front());
            outbox_.pop_front();
            send(message.first, message.second);
        }
    }

    void send(const std::string& routingKey, const std::string& message) {
        if (!channel_ || !channel_->usable()) {
            std::cerr << "[RabbitMQAdapter] Cannot publish " << routingKey
                      << ": channel not usable" << std::endl;
            return;
        }

        AMQP::Envelope envelope(message.data(), message.size());
        envelope.setContentType("application/json");
        envelope.setDeliveryMode(2);
        if (channel_->publish(exchangeName_, routingKey, envelope)) {
            std::cout << "[RabbitMQAdapter] Published " << routingKey
                      << ": " << message.substr(0, 100) << std::endl;
        } else {
            std::cerr << "[RabbitMQAdapter] Publish failed for " << routingKey << std::endl;
        }
    }

    std::shared_ptr<settings::RabbitMQSettings> settings_;
    std::string exchangeName_;
    std::string queueName_;

    std::atomic<bool> running_;
    bool ready_;                                    ///< Только из потока io_context
    boost::asio::io_context ioContext_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> workGuard_;
    AMQP::LibBoostAsioHandler handler_;

    std::unique_ptr<AMQP::TcpConnection> connection_;
    std::unique_ptr<AMQP::TcpChannel> channel_;
    std::deque<OutgoingMessage> outbox_;            ///< Только из потока io_context

    std::thread workerThread_;

    std::mutex handlersMutex_;
    std::unordered_map<std::string, std::vector<ports::output::EventHandler>> handlers_;
    std::vector<std::string> bindings_;
};

} // namespace ledger::adapters::secondary
