// include/application/ExecutionSettler.hpp
#pragma once

#include "ports/input/IExecutionSettler.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "application/FeeCalculator.hpp"
#include "application/EventPayloads.hpp"
#include "domain/LedgerErrors.hpp"
#include "settings/LedgerSettings.hpp"
#include "utils/IdGenerator.hpp"
#include <iostream>
#include <memory>
#include <sstream>

namespace ledger::application {

/**
 * @brief Расчёт исполнения: ордер, счёт, позиция, проводка и аудит
 *
 * Одно исполнение - одна единица работы. Все шаги фиксируются или
 * откатываются вместе:
 * 1. загрузка ордера (NotFound / финальный статус -> Validation);
 * 2. запись OrderExecution;
 * 3-4. пересчёт агрегатов ордера и статуса;
 * 5-6. движение денег и позиции (BUY / SELL);
 * 7. Transaction;
 * 8. BalanceHistory;
 * 9. итоги счёта.
 *
 * BUY сверка резерва с фактом:
 * ```
 * release = reservedAmount * qty / remainingQty   (последнее исполнение - весь остаток)
 * actual  = price * qty * rate + commission + tax
 * available += release; available -= actual; cash -= actual
 * ```
 * Если фактическая цена выше оценки настолько, что баланс уходит в минус,
 * исполнение отклоняется InsufficientBalanceError.
 */
class ExecutionSettler : public ports::input::IExecutionSettler {
public:
    ExecutionSettler(
        std::shared_ptr<ports::output::IUnitOfWorkFactory> unitOfWork,
        std::shared_ptr<ports::output::IEventPublisher> eventPublisher,
        std::shared_ptr<FeeCalculator> feeCalculator,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : unitOfWork_(std::move(unitOfWork))
      , eventPublisher_(std::move(eventPublisher))
      , feeCalculator_(std::move(feeCalculator))
      , settings_(std::move(settings))
    {
        std::cout << "[ExecutionSettler] Created" << std::endl;
    }

    ports::input::SettlementResult execute(const domain::ExecutionRequest& request) override {
        validateRequest(request);

        // Владелец ордера нужен до блокировки: блокируется счёт владельца
        std::string userId;
        {
            auto view = unitOfWork_->read();
            auto order = view->orders().findById(request.orderId);
            if (!order) {
                throw domain::NotFoundError("Order not found: " + request.orderId);
            }
            userId = order->userId;
        }

        ports::input::SettlementResult result;
        {
            auto uow = unitOfWork_->begin(userId);

            // 1. Перечитываем под блокировкой
            auto loaded = uow->orders().findById(request.orderId);
            if (!loaded) {
                throw domain::NotFoundError("Order not found: " + request.orderId);
            }
            domain::Order order = *loaded;
            if (order.isFinal()) {
                throw domain::ValidationError("Order " + order.id + " is already "
                                              + domain::toString(order.orderStatus));
            }

            domain::Decimal remainingBefore = order.remainingQuantity();
            domain::Decimal quantity = request.executedQuantity.value_or(remainingBefore);
            if (!quantity.isPositive() || quantity > remainingBefore) {
                std::ostringstream msg;
                msg << "Executed quantity " << quantity << " must be in (0, " << remainingBefore
                    << "] for order " << order.id;
                throw domain::ValidationError(msg.str());
            }

            domain::Decimal rate = request.currentExchangeRate.value_or(order.exchangeRate);
            domain::Decimal price = request.executionPrice;

            auto computed = feeCalculator_->calculate(order.orderType, quantity, price, rate);
            domain::FeeBreakdown fees;
            fees.commission = request.commission.value_or(computed.commission);
            fees.tax = request.tax.value_or(computed.tax);

            domain::Timestamp now = domain::Timestamp::now();

            // 2. Исполнение
            domain::OrderExecution execution;
            execution.id = utils::IdGenerator::executionId();
            execution.orderId = order.id;
            execution.executionPrice = price;
            execution.executionQuantity = quantity;
            execution.executionAmount = price * quantity;
            execution.executionFee = fees.total();
            execution.exchangeRate = rate;
            execution.executionTime = now;
            uow->executions().append(execution);

            // 3-4. Агрегаты ордера
            order.executedQuantity += quantity;
            order.executedAmount += execution.executionAmount;
            order.averagePrice = order.executedAmount / order.executedQuantity;
            order.commission += fees.commission;
            order.tax += fees.tax;
            order.totalFee += fees.total();
            order.orderStatus = order.executedQuantity == order.quantity
                ? domain::OrderStatus::FILLED
                : domain::OrderStatus::PARTIALLY_FILLED;
            if (!order.executedDate) {
                order.executedDate = now;
            }
            order.updatedAt = now;

            auto accountOpt = uow->balances().findByUserId(userId);
            if (!accountOpt) {
                throw domain::NotFoundError("Balance account not found for user " + userId);
            }
            domain::BalanceAccount account = *accountOpt;
            domain::Decimal cashBefore = account.cashBalance;

            domain::Transaction transaction;
            transaction.id = utils::IdGenerator::transactionId();
            transaction.userId = userId;
            transaction.orderId = order.id;
            transaction.productCode = order.stockId;
            transaction.transactionType = order.isBuy()
                ? domain::TransactionType::BUY
                : domain::TransactionType::SELL;
            transaction.quantity = quantity;
            transaction.price = price;
            transaction.amount = price * quantity * rate;
            transaction.commission = fees.commission;
            transaction.tax = fees.tax;
            transaction.cashBalanceBefore = cashBefore;
            transaction.transactionDate = now;

            // 5-6. Деньги и позиция
            if (order.isBuy()) {
                settleBuy(*uow, order, account, transaction, quantity, remainingBefore, rate, fees, now);
            } else {
                settleSell(*uow, order, account, transaction, quantity, rate, fees, now);
            }

            transaction.cashBalanceAfter = account.cashBalance;

            // 9. Итоги счёта
            if (order.isBuy()) {
                account.totalBuyAmount += transaction.amount;
            } else {
                account.totalSellAmount += transaction.amount;
            }
            account.totalCommission += fees.commission;
            account.totalTax += fees.tax;
            account.lastTradeDate = now;
            account.updatedAt = now;

            if (!account.isConsistent()) {
                std::ostringstream msg;
                msg << "Settlement of order " << order.id << " would break balance invariants: cash "
                    << account.cashBalance << ", available " << account.availableCash;
                throw domain::InsufficientBalanceError(msg.str());
            }

            // 7. Проводка
            uow->transactions().append(transaction);

            // 8. Аудит
            domain::BalanceHistory history;
            history.id = utils::IdGenerator::historyId();
            history.virtualBalanceId = userId;
            history.previousCashBalance = cashBefore;
            history.newCashBalance = account.cashBalance;
            history.changeAmount = account.cashBalance - cashBefore;
            history.changeType = transaction.transactionType;
            history.relatedOrderId = order.id;
            history.description = transaction.description;
            history.createdAt = now;
            uow->balanceHistory().append(history);

            uow->balances().save(account);
            uow->orders().save(order);
            uow->commit();

            result.order = order;
            result.transaction = transaction;
        }

        std::cout << "[ExecutionSettler] Settled " << domain::toString(result.transaction.transactionType)
                  << " " << result.order.stockId << " x" << result.transaction.quantity
                  << " @ " << result.transaction.price
                  << " order=" << result.order.id
                  << " status=" << domain::toString(result.order.orderStatus)
                  << " cash=" << result.transaction.cashBalanceAfter << std::endl;

        publishEvent(eventPublisher_, "ExecutionSettler",
                     result.order.orderStatus == domain::OrderStatus::FILLED
                         ? events::ORDER_FILLED
                         : events::ORDER_PARTIALLY_FILLED,
                     orderToJson(result.order));
        publishEvent(eventPublisher_, "ExecutionSettler", events::TRANSACTION_SETTLED,
                     transactionToJson(result.transaction));
        return result;
    }

private:
    std::shared_ptr<ports::output::IUnitOfWorkFactory> unitOfWork_;
    std::shared_ptr<ports::output::IEventPublisher> eventPublisher_;
    std::shared_ptr<FeeCalculator> feeCalculator_;
    std::shared_ptr<settings::LedgerSettings> settings_;

    static void validateRequest(const domain::ExecutionRequest& request) {
        if (request.orderId.empty()) {
            throw domain::ValidationError("Order id is required");
        }
        if (!request.executionPrice.isPositive()) {
            throw domain::ValidationError("Execution price must be positive");
        }
        if (request.commission && request.commission->isNegative()) {
            throw domain::ValidationError("Commission must not be negative");
        }
        if (request.tax && request.tax->isNegative()) {
            throw domain::ValidationError("Tax must not be negative");
        }
        if (request.currentExchangeRate && !request.currentExchangeRate->isPositive()) {
            throw domain::ValidationError("Exchange rate must be positive");
        }
    }

    static void ensureSameCurrency(const domain::Order& order, const domain::Position& position) {
        if (!position.currency.empty() && position.currency != order.currency) {
            throw domain::ValidationError("Order " + order.id + " is in " + order.currency
                                          + " but position " + position.productCode + " is held in "
                                          + position.currency);
        }
    }

    void settleBuy(ports::output::IUnitOfWork& uow,
                   domain::Order& order,
                   domain::BalanceAccount& account,
                   domain::Transaction& transaction,
                   const domain::Decimal& quantity,
                   const domain::Decimal& remainingBefore,
                   const domain::Decimal& rate,
                   const domain::FeeBreakdown& fees,
                   const domain::Timestamp& now) {
        domain::Decimal notional = transaction.amount;
        domain::Decimal actual = notional + fees.total();

        // Пропорциональная доля резерва; последнее исполнение забирает остаток целиком
        domain::Decimal release = quantity == remainingBefore
            ? order.reservedAmount
            : order.reservedAmount * quantity / remainingBefore;
        account.release(release);
        order.reservedAmount -= release;

        if (!account.debit(actual)) {
            std::ostringstream msg;
            msg << "Insufficient balance to settle order " << order.id
                << ": actual cost " << actual << " (amount " << notional
                << ", fees " << fees.total() << "), available cash " << account.availableCash
                << ", shortfall " << (actual - account.availableCash);
            throw domain::InsufficientBalanceError(msg.str());
        }
        account.investedAmount += notional;

        auto position = uow.positions().find(order.userId, order.stockId)
            .value_or(domain::Position::open(order.userId, order.stockId, order.currency));
        ensureSameCurrency(order, position);
        position.applyBuy(quantity, transaction.price, rate, now);
        uow.positions().save(position);

        transaction.netAmount = -actual;

        std::ostringstream description;
        description << "BUY executed: " << quantity << " " << order.stockId << " @ " << transaction.price;
        if (order.currency != settings_->getBaseCurrency()) {
            description << " " << order.currency << " (rate " << rate << ")";
        }
        description << ", total " << actual;
        transaction.description = description.str();
    }

    void settleSell(ports::output::IUnitOfWork& uow,
                    domain::Order& order,
                    domain::BalanceAccount& account,
                    domain::Transaction& transaction,
                    const domain::Decimal& quantity,
                    const domain::Decimal& rate,
                    const domain::FeeBreakdown& fees,
                    const domain::Timestamp& now) {
        auto positionOpt = uow.positions().find(order.userId, order.stockId);
        if (!positionOpt || !positionOpt->isActive || positionOpt->currentQuantity < quantity) {
            std::ostringstream msg;
            msg << "Position " << order.stockId << " holds "
                << (positionOpt ? positionOpt->currentQuantity : domain::Decimal())
                << ", cannot settle sell of " << quantity;
            throw domain::ValidationError(msg.str());
        }
        domain::Position position = *positionOpt;
        ensureSameCurrency(order, position);

        domain::Decimal net = transaction.amount - fees.total();
        account.credit(net);

        domain::Decimal purchaseRate = position.averageExchangeRate.isPositive()
            ? position.averageExchangeRate
            : rate;
        domain::Decimal priceProfitLoss = feeCalculator_->priceProfitLoss(
            quantity, transaction.price, position.averagePrice, purchaseRate, fees.total());
        domain::Decimal realized = priceProfitLoss;

        transaction.priceProfitLoss = priceProfitLoss;
        if (order.currency != settings_->getBaseCurrency()) {
            domain::Decimal exchangeProfitLoss = feeCalculator_->exchangeProfitLoss(
                quantity, transaction.price, purchaseRate, rate);
            transaction.exchangeProfitLoss = exchangeProfitLoss;
            transaction.purchaseAverageExchangeRate = purchaseRate;
            transaction.currentExchangeRate = rate;
            realized += exchangeProfitLoss;
        }
        transaction.realizedProfitLoss = realized;
        transaction.netAmount = net;

        domain::Decimal soldCost = position.applySell(quantity, now);
        position.realizedProfitLoss += realized;
        uow.positions().save(position);

        account.investedAmount -= soldCost;
        if (account.investedAmount.isNegative()) {
            account.investedAmount = domain::Decimal();
        }

        std::ostringstream description;
        description << "SELL executed: " << quantity << " " << order.stockId << " @ " << transaction.price;
        if (order.currency != settings_->getBaseCurrency()) {
            description << " " << order.currency << " (rate " << rate << ")";
        }
        description << ", net " << net << ", realized " << realized;
        transaction.description = description.str();
    }
};

} // namespace ledger::application
