// include/LedgerApp.hpp
#pragma once

#include <boost/di.hpp>

// Ports
#include "ports/input/IOrderLedger.hpp"
#include "ports/input/IExecutionSettler.hpp"
#include "ports/input/IBalanceService.hpp"
#include "ports/input/IPortfolioService.hpp"
#include "ports/input/IStatisticsAggregator.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "ports/output/IEventConsumer.hpp"
#include "ports/output/IPriceProvider.hpp"

// Settings
#include "settings/DbSettings.hpp"
#include "settings/RabbitMQSettings.hpp"
#include "settings/LedgerSettings.hpp"
#include "settings/FeeSettings.hpp"

// Application
#include "application/FeeCalculator.hpp"
#include "application/OrderLedger.hpp"
#include "application/ExecutionSettler.hpp"
#include "application/BalanceService.hpp"
#include "application/PortfolioService.hpp"
#include "application/StatisticsAggregator.hpp"
#include "application/OrderCommandHandler.hpp"
#include "application/AccountCommandHandler.hpp"
#include "application/StatisticsEventHandler.hpp"

// Secondary Adapters
#include "adapters/secondary/persistence/InMemoryLedgerStore.hpp"
#include "adapters/secondary/persistence/PostgresLedgerStore.hpp"
#include "adapters/secondary/events/InMemoryEventBus.hpp"
#include "adapters/secondary/events/RabbitMQAdapter.hpp"
#include "adapters/secondary/market/QuoteCache.hpp"

// Primary Adapters
#include "adapters/primary/ExpirationScheduler.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>

namespace di = boost::di;

namespace ledger {

/**
 * @brief Ledger Service Application (Event-Driven)
 *
 * Слушает (из ledger.events):
 *   order.create, order.amend, order.cancel, order.expire, execution.report,
 *   account.open, account.deposit, account.withdraw,
 *   transaction.settled, quote.updated, fx.updated
 * Публикует: order.*, transaction.settled, balance.changed, account.rejected
 *
 * LEDGER_STORAGE=memory поднимает сервис без PostgreSQL и RabbitMQ
 * (InMemoryLedgerStore + InMemoryEventBus).
 */
class LedgerApp {
public:
    LedgerApp() : stopRequested_(false) { std::cout << "[LedgerApp] Initializing..." << std::endl; }
    ~LedgerApp() { std::cout << "[LedgerApp] Shutting down..." << std::endl; }

    LedgerApp(const LedgerApp&) = delete;
    LedgerApp& operator=(const LedgerApp&) = delete;

    /**
     * @brief loadEnvironment -> configureInjection -> ожидание stop() -> shutdown
     */
    void run(int argc, char* argv[]) {
        loadEnvironment(argc, argv);
        configureInjection();

        std::cout << "[LedgerApp] Ready" << std::endl;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            while (!stopRequested_) {
                stopped_.wait_for(lock, std::chrono::seconds(1));
            }
        }

        shutdown();
    }

    void stop() {
        stopRequested_ = true;
        stopped_.notify_all();
    }

    // Входные порты для встраивания (доступны после configureInjection)
    std::shared_ptr<ports::input::IOrderLedger> orderLedger() const { return orderLedger_; }
    std::shared_ptr<ports::input::IBalanceService> balanceService() const { return balanceService_; }
    std::shared_ptr<ports::input::IPortfolioService> portfolioService() const { return portfolioService_; }

protected:
    void loadEnvironment(int argc, char* argv[]) {
        for (int i = 1; i < argc; ++i) {
            std::cout << "[LedgerApp] Ignoring argument: " << argv[i] << std::endl;
        }

        dbSettings_ = std::make_shared<settings::DbSettings>();
        rabbitSettings_ = std::make_shared<settings::RabbitMQSettings>();
        ledgerSettings_ = std::make_shared<settings::LedgerSettings>();
        feeSettings_ = std::make_shared<settings::FeeSettings>();

        std::cout << "[LedgerApp] Environment loaded: storage=" << ledgerSettings_->getStorage()
                  << " base_currency=" << ledgerSettings_->getBaseCurrency() << std::endl;
    }

    void configureInjection() {
        std::cout << "[LedgerApp] Configuring DI..." << std::endl;

        // Шаг 1: Хранилище и шина выбираются по LEDGER_STORAGE
        std::shared_ptr<ports::output::IUnitOfWorkFactory> store;
        if (ledgerSettings_->useInMemoryStorage()) {
            store = std::make_shared<adapters::secondary::InMemoryLedgerStore>(
                std::chrono::milliseconds{dbSettings_->getLockTimeoutMs()});
            auto bus = std::make_shared<adapters::secondary::InMemoryEventBus>();
            eventPublisher_ = bus;
            eventConsumer_ = bus;
        } else {
            store = std::make_shared<adapters::secondary::PostgresLedgerStore>(dbSettings_);
            // Один экземпляр RabbitMQ для Publisher и Consumer
            auto rabbitMQAdapter = std::make_shared<adapters::secondary::RabbitMQAdapter>(rabbitSettings_);
            eventPublisher_ = rabbitMQAdapter;
            eventConsumer_ = rabbitMQAdapter;
        }

        auto quoteCache = std::make_shared<adapters::secondary::QuoteCache>();
        auto feeCalculator = std::make_shared<application::FeeCalculator>(feeSettings_->getSchedule());

        // Шаг 2: Основной injector, внешние зависимости - instance binding
        auto injector = di::make_injector(
            di::bind<settings::LedgerSettings>().to(ledgerSettings_),
            di::bind<application::FeeCalculator>().to(feeCalculator),
            di::bind<ports::output::IUnitOfWorkFactory>().to(store),
            di::bind<ports::output::IPriceProvider>().to(quoteCache),
            di::bind<ports::output::IEventPublisher>().to(eventPublisher_),
            di::bind<ports::output::IEventConsumer>().to(eventConsumer_),

            di::bind<ports::input::IOrderLedger>().to<application::OrderLedger>().in(di::singleton),
            di::bind<ports::input::IExecutionSettler>().to<application::ExecutionSettler>().in(di::singleton),
            di::bind<ports::input::IBalanceService>().to<application::BalanceService>().in(di::singleton),
            di::bind<ports::input::IPortfolioService>().to<application::PortfolioService>().in(di::singleton),
            di::bind<ports::input::IStatisticsAggregator>().to<application::StatisticsAggregator>().in(di::singleton)
        );

        orderLedger_ = injector.create<std::shared_ptr<ports::input::IOrderLedger>>();
        balanceService_ = injector.create<std::shared_ptr<ports::input::IBalanceService>>();
        portfolioService_ = injector.create<std::shared_ptr<ports::input::IPortfolioService>>();

        // Шаг 3: Event Handlers через DI (subscribe() в конструкторе)
        orderCommandHandler_ = injector.create<std::shared_ptr<application::OrderCommandHandler>>();
        accountCommandHandler_ = injector.create<std::shared_ptr<application::AccountCommandHandler>>();
        statisticsEventHandler_ = injector.create<std::shared_ptr<application::StatisticsEventHandler>>();
        quoteCache->listen(eventConsumer_);

        // Шаг 4: Запускаем consumer ПОСЛЕ регистрации всех handlers
        std::cout << "[LedgerApp] Starting event consumer..." << std::endl;
        eventConsumer_->start();

        expirationScheduler_ = std::make_unique<adapters::primary::ExpirationScheduler>(
            orderLedger_, std::chrono::milliseconds{ledgerSettings_->getExpiryIntervalMs()});
        expirationScheduler_->start();
    }

    void shutdown() {
        if (expirationScheduler_) {
            expirationScheduler_->stop();
        }
        if (eventConsumer_) {
            eventConsumer_->stop();
        }
        std::cout << "[LedgerApp] Stopped" << std::endl;
    }

private:
    std::atomic<bool> stopRequested_;
    std::mutex mutex_;
    std::condition_variable stopped_;

    std::shared_ptr<settings::DbSettings> dbSettings_;
    std::shared_ptr<settings::RabbitMQSettings> rabbitSettings_;
    std::shared_ptr<settings::LedgerSettings> ledgerSettings_;
    std::shared_ptr<settings::FeeSettings> feeSettings_;

    std::shared_ptr<ports::output::IEventPublisher> eventPublisher_;
    std::shared_ptr<ports::output::IEventConsumer> eventConsumer_;

    std::shared_ptr<ports::input::IOrderLedger> orderLedger_;
    std::shared_ptr<ports::input::IBalanceService> balanceService_;
    std::shared_ptr<ports::input::IPortfolioService> portfolioService_;

    std::shared_ptr<application::OrderCommandHandler> orderCommandHandler_;
    std::shared_ptr<application::AccountCommandHandler> accountCommandHandler_;
    std::shared_ptr<application::StatisticsEventHandler> statisticsEventHandler_;
    std::unique_ptr<adapters::primary::ExpirationScheduler> expirationScheduler_;
};

} // namespace ledger
