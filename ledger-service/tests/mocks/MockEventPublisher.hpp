#pragma once

#include "ports/output/IEventPublisher.hpp"
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace ledger::tests {

/**
 * @brief Mock реализация IEventPublisher для тестов
 *
 * Потокобезопасен: в тестах конкуренции публикуют несколько потоков.
 */
class MockEventPublisher : public ports::output::IEventPublisher {
public:
    struct PublishedMessage {
        std::string routingKey;
        std::string message;
    };

    // Получение опубликованных сообщений
    std::vector<PublishedMessage> getPublishedMessages() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

    std::vector<PublishedMessage> messagesFor(const std::string& routingKey) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<PublishedMessage> result;
        for (const auto& msg : messages_) {
            if (msg.routingKey == routingKey) {
                result.push_back(msg);
            }
        }
        return result;
    }

    void clearMessages() {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.clear();
    }

    int publishCallCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<int>(messages_.size());
    }

    // IEventPublisher implementation
    void publish(const std::string& routingKey, const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.push_back({routingKey, message});
    }

private:
    mutable std::mutex mutex_;
    std::vector<PublishedMessage> messages_;
};

} // namespace ledger::tests
