// include/application/BalanceService.hpp
#pragma once

#include "ports/input/IBalanceService.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "application/EventPayloads.hpp"
#include "domain/LedgerErrors.hpp"
#include "settings/LedgerSettings.hpp"
#include "utils/IdGenerator.hpp"
#include <algorithm>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>

namespace ledger::application {

/**
 * @brief Счёт пользователя: открытие, пополнение, вывод, выписки
 *
 * Пополнение и вывод берут ту же блокировку счёта, что и расчёт
 * исполнений, поэтому не гоняются с резервами ордеров.
 * Зарезервированные под BUY ордера деньги вывести нельзя.
 */
class BalanceService : public ports::input::IBalanceService {
public:
    BalanceService(
        std::shared_ptr<ports::output::IUnitOfWorkFactory> unitOfWork,
        std::shared_ptr<ports::output::IEventPublisher> eventPublisher,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : unitOfWork_(std::move(unitOfWork))
      , eventPublisher_(std::move(eventPublisher))
      , settings_(std::move(settings))
    {}

    domain::BalanceAccount openAccount(const std::string& userId,
                                       const std::optional<domain::Decimal>& initialCash) override {
        if (userId.empty()) {
            throw domain::ValidationError("User id is required");
        }
        domain::Decimal cash = initialCash.value_or(settings_->getDefaultInitialCash());
        if (cash.isNegative()) {
            throw domain::ValidationError("Initial cash must not be negative");
        }

        domain::BalanceAccount account;
        {
            auto uow = unitOfWork_->begin(userId);
            if (uow->balances().findByUserId(userId)) {
                throw domain::ConflictError("Balance account already exists for user " + userId);
            }

            account = domain::BalanceAccount::open(userId, domain::Decimal());
            if (cash.isPositive()) {
                recordCashMovement(*uow, account, domain::TransactionType::DEPOSIT, cash,
                                   "Initial virtual balance");
            }
            uow->balances().save(account);
            uow->commit();
        }

        std::cout << "[BalanceService] Account opened for " << userId
                  << " with " << account.cashBalance << std::endl;
        publishEvent(eventPublisher_, "BalanceService", events::BALANCE_CHANGED, balanceToJson(account));
        return account;
    }

    domain::Transaction deposit(const std::string& userId, const domain::Decimal& amount,
                                const std::string& description) override {
        return moveCash(userId, domain::TransactionType::DEPOSIT, amount,
                        description.empty() ? "Deposit" : description);
    }

    domain::Transaction withdraw(const std::string& userId, const domain::Decimal& amount,
                                 const std::string& description) override {
        return moveCash(userId, domain::TransactionType::WITHDRAW, amount,
                        description.empty() ? "Withdraw" : description);
    }

    domain::BalanceAccount getBalance(const std::string& userId) override {
        auto view = unitOfWork_->read();
        auto account = view->balances().findByUserId(userId);
        if (!account) {
            throw domain::NotFoundError("Balance account not found for user " + userId);
        }
        return *account;
    }

    std::vector<domain::BalanceHistory> getBalanceHistory(const std::string& userId,
                                                          size_t limit) override {
        auto view = unitOfWork_->read();
        return view->balanceHistory().findByUserId(userId, limit);
    }

    std::vector<domain::Transaction> getTransactions(const std::string& userId,
                                                     const domain::TransactionFilter& filter) override {
        auto view = unitOfWork_->read();
        return view->transactions().findByUserId(userId, filter);
    }

    domain::Decimal getRealizedProfitLoss(const std::string& userId,
                                          const domain::Timestamp& from,
                                          const domain::Timestamp& to) override {
        domain::TransactionFilter filter;
        filter.transactionType = domain::TransactionType::SELL;
        filter.from = from;
        filter.to = to;
        filter.limit = 0;

        auto view = unitOfWork_->read();
        domain::Decimal total;
        for (const auto& transaction : view->transactions().findByUserId(userId, filter)) {
            total += transaction.realizedProfitLoss.value_or(domain::Decimal());
        }
        return total;
    }

    domain::ProfitLossReport getProductProfitLoss(const std::string& userId,
                                                  const domain::Timestamp& from,
                                                  const domain::Timestamp& to,
                                                  domain::MarketScope scope) override {
        if (!(from < to)) {
            throw domain::ValidationError("Period start must be before its end");
        }

        domain::TransactionFilter filter;
        filter.transactionType = domain::TransactionType::SELL;
        filter.from = from;
        filter.to = to;
        filter.limit = 0;

        std::vector<domain::Transaction> sells;
        {
            auto view = unitOfWork_->read();
            sells = view->transactions().findByUserId(userId, filter);
        }

        domain::ProfitLossReport report;
        report.from = from;
        report.to = to;
        report.scope = scope;

        std::map<std::string, domain::ProductProfitLoss> byProduct;
        for (const auto& sell : sells) {
            if (!sell.realizedProfitLoss || !sell.productCode) {
                continue;
            }
            bool foreign = sell.exchangeProfitLoss.has_value();
            if ((scope == domain::MarketScope::DOMESTIC && foreign)
                || (scope == domain::MarketScope::FOREIGN && !foreign)) {
                continue;
            }

            auto& product = byProduct[*sell.productCode];
            product.productCode = *sell.productCode;
            product.foreign = product.foreign || foreign;
            product.realizedProfitLoss += *sell.realizedProfitLoss;
            product.priceProfitLoss += sell.priceProfitLoss.value_or(*sell.realizedProfitLoss);
            product.exchangeProfitLoss += sell.exchangeProfitLoss.value_or(domain::Decimal());
            product.tradeCount++;
            product.soldQuantity += sell.quantity;
            product.sellAmount += sell.amount;
            if (!product.firstTradeDate || sell.transactionDate < *product.firstTradeDate) {
                product.firstTradeDate = sell.transactionDate;
            }
            if (!product.lastTradeDate || *product.lastTradeDate < sell.transactionDate) {
                product.lastTradeDate = sell.transactionDate;
            }
        }

        for (auto& [code, product] : byProduct) {
            report.totalRealizedProfitLoss += product.realizedProfitLoss;
            report.totalPriceProfitLoss += product.priceProfitLoss;
            report.totalExchangeProfitLoss += product.exchangeProfitLoss;
            report.totalTrades += product.tradeCount;
            report.products.push_back(std::move(product));
        }
        std::stable_sort(report.products.begin(), report.products.end(),
                         [](const domain::ProductProfitLoss& a, const domain::ProductProfitLoss& b) {
                             return b.realizedProfitLoss < a.realizedProfitLoss;
                         });
        return report;
    }

private:
    std::shared_ptr<ports::output::IUnitOfWorkFactory> unitOfWork_;
    std::shared_ptr<ports::output::IEventPublisher> eventPublisher_;
    std::shared_ptr<settings::LedgerSettings> settings_;

    domain::Transaction moveCash(const std::string& userId, domain::TransactionType type,
                                 const domain::Decimal& amount, const std::string& description) {
        if (!amount.isPositive()) {
            throw domain::ValidationError("Amount must be positive");
        }

        domain::Transaction transaction;
        domain::BalanceAccount account;
        {
            auto uow = unitOfWork_->begin(userId);
            auto loaded = uow->balances().findByUserId(userId);
            if (!loaded) {
                throw domain::NotFoundError("Balance account not found for user " + userId);
            }
            account = *loaded;

            if (type == domain::TransactionType::WITHDRAW && amount > account.availableCash) {
                std::ostringstream msg;
                msg << "Insufficient balance to withdraw " << amount
                    << ": available cash " << account.availableCash
                    << " (reserved by open orders " << account.reservedCash() << ")"
                    << ", shortfall " << (amount - account.availableCash);
                throw domain::InsufficientBalanceError(msg.str());
            }

            transaction = recordCashMovement(*uow, account, type, amount, description);
            uow->balances().save(account);
            uow->commit();
        }

        std::cout << "[BalanceService] " << domain::toString(type) << " " << amount
                  << " for " << userId << ", cash " << account.cashBalance << std::endl;
        publishEvent(eventPublisher_, "BalanceService", events::BALANCE_CHANGED, balanceToJson(account));
        return transaction;
    }

    /**
     * @brief Изменить cash и записать Transaction + BalanceHistory
     */
    static domain::Transaction recordCashMovement(ports::output::IUnitOfWork& uow,
                                                  domain::BalanceAccount& account,
                                                  domain::TransactionType type,
                                                  const domain::Decimal& amount,
                                                  const std::string& description) {
        domain::Timestamp now = domain::Timestamp::now();
        domain::Decimal before = account.cashBalance;

        if (type == domain::TransactionType::DEPOSIT) {
            account.credit(amount);
        } else if (!account.debit(amount)) {
            throw domain::InsufficientBalanceError("Insufficient balance to withdraw " + amount.toString());
        }
        account.updatedAt = now;

        domain::Transaction transaction;
        transaction.id = utils::IdGenerator::transactionId();
        transaction.userId = account.userId;
        transaction.transactionType = type;
        transaction.amount = amount;
        transaction.netAmount = account.cashBalance - before;
        transaction.cashBalanceBefore = before;
        transaction.cashBalanceAfter = account.cashBalance;
        transaction.description = description;
        transaction.transactionDate = now;
        uow.transactions().append(transaction);

        domain::BalanceHistory history;
        history.id = utils::IdGenerator::historyId();
        history.virtualBalanceId = account.userId;
        history.previousCashBalance = before;
        history.newCashBalance = account.cashBalance;
        history.changeAmount = transaction.netAmount;
        history.changeType = type;
        history.description = description;
        history.createdAt = now;
        uow.balanceHistory().append(history);

        return transaction;
    }
};

} // namespace ledger::application
