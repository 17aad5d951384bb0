// include/application/OrderLedger.hpp
#pragma once

#include "ports/input/IOrderLedger.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include "ports/output/IPriceProvider.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "application/FeeCalculator.hpp"
#include "application/EventPayloads.hpp"
#include "domain/LedgerErrors.hpp"
#include "settings/LedgerSettings.hpp"
#include "utils/IdGenerator.hpp"
#include <iostream>
#include <map>
#include <memory>
#include <sstream>

namespace ledger::application {

/**
 * @brief Книга ордеров: приём с резервированием, изменение, отмена, истечение
 *
 * Резервирование:
 * - BUY: availableCash уменьшается на quantity * price * rate + комиссия,
 *   остаток резерва хранится в order.reservedAmount;
 * - SELL: отдельного счётчика нет, свободное количество считается запросом
 *   по активным SELL ордерам пользователя на тот же инструмент.
 *
 * Проверка и запись всегда выполняются в одной единице работы под
 * блокировкой счёта пользователя, поэтому два параллельных ордера не могут
 * пройти проверку по одному и тому же снимку.
 *
 * Цены и курсы запрашиваются у IPriceProvider до входа в единицу работы.
 */
class OrderLedger : public ports::input::IOrderLedger {
public:
    OrderLedger(
        std::shared_ptr<ports::output::IUnitOfWorkFactory> unitOfWork,
        std::shared_ptr<ports::output::IPriceProvider> priceProvider,
        std::shared_ptr<ports::output::IEventPublisher> eventPublisher,
        std::shared_ptr<FeeCalculator> feeCalculator,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : unitOfWork_(std::move(unitOfWork))
      , priceProvider_(std::move(priceProvider))
      , eventPublisher_(std::move(eventPublisher))
      , feeCalculator_(std::move(feeCalculator))
      , settings_(std::move(settings))
    {
        std::cout << "[OrderLedger] Created, base currency " << settings_->getBaseCurrency() << std::endl;
    }

    domain::Order createOrder(const domain::OrderRequest& request) override {
        validateRequest(request);

        domain::Order order;
        order.id = utils::IdGenerator::orderId();
        order.userId = request.userId;
        order.stockId = request.stockId;
        order.orderType = request.orderType;
        order.orderMethod = request.orderMethod;
        order.orderStatus = domain::OrderStatus::PENDING;
        order.quantity = request.quantity;
        order.notes = request.notes;
        order.orderDate = domain::Timestamp::now();
        order.updatedAt = order.orderDate;
        if (domain::requiresPrice(request.orderMethod)) {
            order.orderPrice = request.orderPrice;
        }
        order.expiresAt = request.expiresAt;
        if (!order.expiresAt && settings_->getOrderTtlMinutes() > 0) {
            order.expiresAt = order.orderDate.plusSeconds(
                static_cast<int64_t>(settings_->getOrderTtlMinutes()) * 60);
        }

        // Цена и курс - до блокировки
        resolvePricing(order);

        {
            auto uow = unitOfWork_->begin(order.userId);
            auto account = loadAccount(*uow, order.userId);
            ensurePositionCurrency(*uow, order);

            if (order.isBuy()) {
                domain::Decimal orderAmount = order.quantity * order.referencePrice * order.exchangeRate;
                domain::Decimal commission = feeCalculator_->estimateBuyFee(
                    order.quantity, order.referencePrice, order.exchangeRate);
                domain::Decimal required = orderAmount + commission;

                if (!account.reserve(required)) {
                    throw domain::InsufficientBalanceError(
                        insufficientBalanceMessage(required, orderAmount, commission, account.availableCash));
                }
                account.updatedAt = order.orderDate;
                uow->balances().save(account);
                order.reservedAmount = required;
            } else {
                ensureSellable(*uow, order.userId, order.stockId, order.quantity, "");
            }

            uow->orders().save(order);
            uow->commit();
        }

        std::cout << "[OrderLedger] Order created: " << order.id
                  << " " << domain::toString(order.orderType)
                  << " " << order.stockId << " x" << order.quantity
                  << " reserved=" << order.reservedAmount << std::endl;

        publishEvent(eventPublisher_, "OrderLedger", events::ORDER_CREATED, orderToJson(order));
        return order;
    }

    domain::Order amendOrder(const std::string& userId, const std::string& orderId,
                             const domain::OrderAmendment& amendment) override {
        if (!amendment.quantity && !amendment.orderPrice && !amendment.expiresAt) {
            throw domain::ValidationError("Nothing to amend");
        }
        if (amendment.quantity && !amendment.quantity->isPositive()) {
            throw domain::ValidationError("Quantity must be positive");
        }
        if (amendment.orderPrice && !amendment.orderPrice->isPositive()) {
            throw domain::ValidationError("Order price must be positive");
        }
        if (amendment.expiresAt && *amendment.expiresAt <= domain::Timestamp::now()) {
            throw domain::ValidationError("Expiry must be in the future");
        }

        domain::Order order;
        {
            auto uow = unitOfWork_->begin(userId);
            order = loadOwnedOrder(*uow, userId, orderId);

            if (order.orderStatus != domain::OrderStatus::PENDING || !order.executedQuantity.isZero()) {
                throw domain::ValidationError("Only PENDING orders without executions can be amended, order "
                                              + order.id + " is " + domain::toString(order.orderStatus));
            }
            if (amendment.orderPrice && order.orderMethod == domain::OrderMethod::MARKET) {
                throw domain::ValidationError("MARKET order price cannot be amended");
            }

            domain::Decimal newQuantity = amendment.quantity.value_or(order.quantity);
            domain::Decimal newReference = amendment.orderPrice.value_or(order.referencePrice);

            if (order.isBuy()) {
                domain::Decimal required = newQuantity * newReference * order.exchangeRate
                    + feeCalculator_->estimateBuyFee(newQuantity, newReference, order.exchangeRate);
                domain::Decimal delta = required - order.reservedAmount;

                auto account = loadAccount(*uow, userId);
                if (delta.isPositive()) {
                    if (!account.reserve(delta)) {
                        std::ostringstream msg;
                        msg << "Insufficient balance to amend order " << order.id
                            << ": additional " << delta << " required, available cash "
                            << account.availableCash << ", shortfall " << (delta - account.availableCash);
                        throw domain::InsufficientBalanceError(msg.str());
                    }
                } else {
                    account.release(-delta);
                }
                account.updatedAt = domain::Timestamp::now();
                uow->balances().save(account);
                order.reservedAmount = required;
            } else if (newQuantity > order.quantity) {
                ensureSellable(*uow, userId, order.stockId, newQuantity, order.id);
            }

            order.quantity = newQuantity;
            order.referencePrice = newReference;
            if (amendment.orderPrice) {
                order.orderPrice = amendment.orderPrice;
            }
            if (amendment.expiresAt) {
                order.expiresAt = amendment.expiresAt;
            }
            order.updatedAt = domain::Timestamp::now();

            uow->orders().save(order);
            uow->commit();
        }

        std::cout << "[OrderLedger] Order amended: " << order.id
                  << " qty=" << order.quantity << " reserved=" << order.reservedAmount << std::endl;

        publishEvent(eventPublisher_, "OrderLedger", events::ORDER_AMENDED, orderToJson(order));
        return order;
    }

    domain::Order cancelOrder(const std::string& userId, const std::string& orderId) override {
        domain::Order order;
        {
            auto uow = unitOfWork_->begin(userId);
            order = loadOwnedOrder(*uow, userId, orderId);

            if (!domain::canTransition(order.orderStatus, domain::OrderStatus::CANCELLED)) {
                throw domain::ValidationError("Order " + order.id + " cannot be cancelled in status "
                                              + domain::toString(order.orderStatus));
            }

            releaseReservation(*uow, order);
            order.orderStatus = domain::OrderStatus::CANCELLED;
            order.cancelledDate = domain::Timestamp::now();
            order.updatedAt = *order.cancelledDate;

            uow->orders().save(order);
            uow->commit();
        }

        std::cout << "[OrderLedger] Order cancelled: " << order.id << std::endl;

        publishEvent(eventPublisher_, "OrderLedger", events::ORDER_CANCELLED, orderToJson(order));
        return order;
    }

    size_t expireOrders(const domain::Timestamp& asOf) override {
        std::map<std::string, std::vector<std::string>> byUser;
        {
            auto view = unitOfWork_->read();
            for (const auto& order : view->orders().findExpirable(asOf)) {
                byUser[order.userId].push_back(order.id);
            }
        }

        size_t expiredCount = 0;
        for (const auto& [userId, orderIds] : byUser) {
            std::vector<domain::Order> expired;
            try {
                auto uow = unitOfWork_->begin(userId);
                for (const auto& orderId : orderIds) {
                    auto order = uow->orders().findById(orderId);
                    // Мог быть исполнен или отменён после выборки кандидатов
                    if (!order || !order->isActive() || !order->isExpiredAt(asOf)) {
                        continue;
                    }
                    releaseReservation(*uow, *order);
                    order->orderStatus = domain::OrderStatus::EXPIRED;
                    order->updatedAt = domain::Timestamp::now();
                    uow->orders().save(*order);
                    expired.push_back(*order);
                }
                uow->commit();
            } catch (const domain::ConflictError& e) {
                std::cerr << "[OrderLedger] Expiry skipped for user " << userId
                          << ", will retry on next run: " << e.what() << std::endl;
                continue;
            }

            for (const auto& order : expired) {
                publishEvent(eventPublisher_, "OrderLedger", events::ORDER_EXPIRED, orderToJson(order));
            }
            expiredCount += expired.size();
        }

        if (expiredCount > 0) {
            std::cout << "[OrderLedger] Expired " << expiredCount << " orders as of "
                      << asOf.toString() << std::endl;
        }
        return expiredCount;
    }

    domain::Order getOrder(const std::string& userId, const std::string& orderId) override {
        auto view = unitOfWork_->read();
        return loadOwnedOrder(*view, userId, orderId);
    }

    std::vector<domain::Order> getOrders(const std::string& userId,
                                         const domain::OrderFilter& filter) override {
        auto view = unitOfWork_->read();
        return view->orders().findByUserId(userId, filter);
    }

    std::vector<domain::Order> getPendingOrders(const std::string& userId) override {
        domain::OrderFilter all;
        all.limit = 0;

        auto view = unitOfWork_->read();
        std::vector<domain::Order> pending;
        for (auto& order : view->orders().findByUserId(userId, all)) {
            if (order.isActive()) {
                pending.push_back(std::move(order));
            }
        }
        return pending;
    }

    std::vector<domain::OrderExecution> getExecutions(const std::string& userId,
                                                      const std::string& orderId) override {
        auto view = unitOfWork_->read();
        auto order = loadOwnedOrder(*view, userId, orderId);
        return view->executions().findByOrderId(order.id);
    }

    domain::OrderSummary getOrderSummary(const std::string& userId) override {
        domain::OrderFilter all;
        all.limit = 0;

        auto view = unitOfWork_->read();
        domain::OrderSummary summary;
        for (const auto& order : view->orders().findByUserId(userId, all)) {
            summary.countByStatus[order.orderStatus]++;
            summary.totalOrders++;
            summary.totalExecutedAmount += order.executedAmount;
            summary.totalFee += order.totalFee;
        }
        return summary;
    }

private:
    std::shared_ptr<ports::output::IUnitOfWorkFactory> unitOfWork_;
    std::shared_ptr<ports::output::IPriceProvider> priceProvider_;
    std::shared_ptr<ports::output::IEventPublisher> eventPublisher_;
    std::shared_ptr<FeeCalculator> feeCalculator_;
    std::shared_ptr<settings::LedgerSettings> settings_;

    static void validateRequest(const domain::OrderRequest& request) {
        if (request.userId.empty()) {
            throw domain::ValidationError("User id is required");
        }
        if (request.stockId.empty()) {
            throw domain::ValidationError("Stock id is required");
        }
        if (!request.quantity.isPositive()) {
            throw domain::ValidationError("Quantity must be positive");
        }
        if (domain::requiresPrice(request.orderMethod)) {
            if (!request.orderPrice) {
                throw domain::ValidationError("Order price is required for "
                                              + domain::toString(request.orderMethod) + " orders");
            }
            if (!request.orderPrice->isPositive()) {
                throw domain::ValidationError("Order price must be positive");
            }
        }
        if (request.expiresAt && *request.expiresAt <= domain::Timestamp::now()) {
            throw domain::ValidationError("Expiry must be in the future");
        }
    }

    /**
     * @brief Валюта, курс и цена резерва (MARKET - текущая котировка)
     *
     * Валюта берётся из котировки, при её отсутствии - из уже открытой позиции.
     * Базовая валюта подставляется только для инструмента, которого у
     * пользователя никогда не было.
     */
    void resolvePricing(domain::Order& order) {
        auto quote = priceProvider_->getQuote(order.stockId);

        if (order.orderMethod == domain::OrderMethod::MARKET) {
            if (!quote || !quote->price.isPositive()) {
                throw domain::ValidationError("No market price available for " + order.stockId);
            }
            order.referencePrice = quote->price;
        } else {
            order.referencePrice = *order.orderPrice;
        }

        std::string heldCurrency;
        {
            auto view = unitOfWork_->read();
            auto position = view->positions().find(order.userId, order.stockId);
            if (position) {
                heldCurrency = position->currency;
            }
        }

        if (quote && !quote->currency.empty()) {
            if (!heldCurrency.empty() && heldCurrency != quote->currency) {
                throw domain::ValidationError("Quote currency " + quote->currency + " for " + order.stockId
                                              + " differs from position currency " + heldCurrency);
            }
            order.currency = quote->currency;
        } else if (!heldCurrency.empty()) {
            order.currency = heldCurrency;
        } else {
            order.currency = settings_->getBaseCurrency();
        }

        if (order.currency == settings_->getBaseCurrency()) {
            order.exchangeRate = domain::Decimal(1);
            return;
        }

        auto rate = priceProvider_->getExchangeRate(order.currency);
        if (!rate || !rate->isPositive()) {
            throw domain::ValidationError("No exchange rate available for " + order.currency);
        }
        order.exchangeRate = *rate;
    }

    static domain::BalanceAccount loadAccount(ports::output::IUnitOfWork& uow, const std::string& userId) {
        auto account = uow.balances().findByUserId(userId);
        if (!account) {
            throw domain::NotFoundError("Balance account not found for user " + userId);
        }
        return *account;
    }

    static domain::Order loadOwnedOrder(ports::output::IUnitOfWork& uow, const std::string& userId,
                                        const std::string& orderId) {
        auto order = uow.orders().findById(orderId);
        if (!order || order->userId != userId) {
            throw domain::NotFoundError("Order not found: " + orderId);
        }
        return *order;
    }

    /**
     * @brief Позиция могла открыться между выбором валюты и блокировкой
     */
    static void ensurePositionCurrency(ports::output::IUnitOfWork& uow, const domain::Order& order) {
        auto position = uow.positions().find(order.userId, order.stockId);
        if (position && !position->currency.empty() && position->currency != order.currency) {
            throw domain::ValidationError("Order currency " + order.currency + " for " + order.stockId
                                          + " differs from position currency " + position->currency);
        }
    }

    /**
     * @brief Количество held - reserved должно покрывать quantity
     * @param excludeOrderId Ордер, чей резерв не учитывается (при изменении)
     */
    static void ensureSellable(ports::output::IUnitOfWork& uow, const std::string& userId,
                               const std::string& stockId, const domain::Decimal& quantity,
                               const std::string& excludeOrderId) {
        domain::Decimal held;
        auto position = uow.positions().find(userId, stockId);
        if (position && position->isActive) {
            held = position->currentQuantity;
        }

        domain::Decimal reserved;
        for (const auto& open : uow.orders().findActiveByUserAndStock(userId, stockId, domain::OrderType::SELL)) {
            if (open.id != excludeOrderId) {
                reserved += open.remainingQuantity();
            }
        }

        domain::Decimal available = held - reserved;
        if (quantity > available) {
            std::ostringstream msg;
            msg << "Insufficient sellable quantity for " << stockId
                << ": requested " << quantity
                << ", available " << available
                << " (held " << held << ", reserved by open orders " << reserved << ")";
            throw domain::ValidationError(msg.str());
        }
    }

    /**
     * @brief Вернуть остаток BUY резерва в availableCash (SELL - no-op)
     */
    static void releaseReservation(ports::output::IUnitOfWork& uow, domain::Order& order) {
        if (!order.isBuy() || order.reservedAmount.isZero()) {
            return;
        }
        auto account = loadAccount(uow, order.userId);
        account.release(order.reservedAmount);
        account.updatedAt = domain::Timestamp::now();
        uow.balances().save(account);
        order.reservedAmount = domain::Decimal();
    }

    static std::string insufficientBalanceMessage(const domain::Decimal& required,
                                                  const domain::Decimal& orderAmount,
                                                  const domain::Decimal& commission,
                                                  const domain::Decimal& available) {
        std::ostringstream msg;
        msg << "Insufficient balance: required " << required
            << " (order amount " << orderAmount << ", commission " << commission << ")"
            << ", available cash " << available
            << ", shortfall " << (required - available);
        return msg.str();
    }
};

} // namespace ledger::application
