// include/adapters/secondary/events/InMemoryEventBus.hpp
#pragma once

#include "ports/output/IEventPublisher.hpp"
#include "ports/output/IEventConsumer.hpp"
#include <atomic>
#include <iostream>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace ledger::adapters::secondary {

/**
 * @brief In-memory шина событий (LEDGER_STORAGE=memory, тесты)
 *
 * Синхронная доставка: publish() вызывает обработчики в потоке вызывающего.
 * Обработчики вызываются вне мьютекса, поэтому могут публиковать сами
 * (settle -> transaction.settled -> статистика).
 */
class InMemoryEventBus : public ports::output::IEventPublisher,
                         public ports::output::IEventConsumer {
public:
    InMemoryEventBus() : running_(false) {}

    ~InMemoryEventBus() override {
        stop();
    }

    void publish(const std::string& routingKey, const std::string& message) override {
        if (!running_) {
            std::cout << "[InMemoryEventBus] Not started, dropped " << routingKey << std::endl;
            return;
        }

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
                handler(routingKey, message);
            } catch (const std::exception& e) {
                std::cerr << "[InMemoryEventBus] Handler error on " << routingKey
                          << ": " << e.what() << std::endl;
            }
        }
    }

    void subscribe(const std::vector<std::string>& routingKeys,
                   ports::output::EventHandler handler) override {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        for (const auto& key : routingKeys) {
            handlers_[key].push_back(handler);
        }
    }

    void start() override {
        running_ = true;
    }

    void stop() override {
        running_ = false;
    }

    bool isRunning() const {
        return running_;
    }

    size_t subscriberCount(const std::string& routingKey) const {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        auto it = handlers_.find(routingKey);
        return it != handlers_.end() ? it->second.size() : 0;
    }

private:
    mutable std::mutex handlersMutex_;
    std::unordered_map<std::string, std::vector<ports::output::EventHandler>> handlers_;
    std::atomic<bool> running_;
};

} // namespace ledger::adapters::secondary
