// include/adapters/primary/ExpirationScheduler.hpp
#pragma once

#include "ports/input/IOrderLedger.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

namespace ledger::adapters::primary {

/**
 * @brief Фоновый поток, периодически истекающий просроченные ордера
 */
class ExpirationScheduler {
public:
    ExpirationScheduler(
        std::shared_ptr<ports::input::IOrderLedger> orderLedger,
        std::chrono::milliseconds interval = std::chrono::milliseconds{60000})
        : orderLedger_(std::move(orderLedger))
        , interval_(interval)
        , running_(false)
        , tickCount_(0)
    {}

    ~ExpirationScheduler() {
        stop();
    }

    ExpirationScheduler(const ExpirationScheduler&) = delete;
    ExpirationScheduler& operator=(const ExpirationScheduler&) = delete;

    void start() {
        if (running_.exchange(true)) return;

        thread_ = std::thread([this]() {
            std::unique_lock<std::mutex> lock(mutex_);
            while (running_) {
                lock.unlock();
                doTick();
                lock.lock();
                wakeup_.wait_for(lock, interval_, [this]() { return !running_; });
            }
        });
        std::cout << "[ExpirationScheduler] Started, interval " << interval_.count() << "ms" << std::endl;
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_) return;
            running_ = false;
        }
        wakeup_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
        std::cout << "[ExpirationScheduler] Stopped" << std::endl;
    }

    bool isRunning() const { return running_; }

    uint64_t tickCount() const { return tickCount_; }

    /**
     * @brief Выполнить один проход вручную (для тестов)
     */
    size_t manualTick() {
        return doTick();
    }

private:
    std::shared_ptr<ports::input::IOrderLedger> orderLedger_;
    std::chrono::milliseconds interval_;
    std::atomic<bool> running_;
    std::atomic<uint64_t> tickCount_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable wakeup_;

    size_t doTick() {
        size_t expired = 0;
        try {
            expired = orderLedger_->expireOrders(domain::Timestamp::now());
        } catch (const std::exception& e) {
            std::cerr << "[ExpirationScheduler] Expiry pass failed: " << e.what() << std::endl;
        }
        ++tickCount_;
        return expired;
    }
};

} // namespace ledger::adapters::primary
