// include/adapters/secondary/market/QuoteCache.hpp
#pragma once

#include "ports/output/IPriceProvider.hpp"
#include "ports/output/IEventConsumer.hpp"
#include "application/EventPayloads.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace ledger::adapters::secondary {

/**
 * @brief Последние котировки и курсы в памяти
 *
 * Наполняется событиями рыночных данных из общего exchange:
 * - quote.updated {"figi" | "product_code", "last_price", "currency"}
 * - fx.updated {"currency", "rate"} - курс к базовой валюте
 *
 * В тестах заполняется напрямую через setQuote/setExchangeRate.
 */
class QuoteCache : public ports::output::IPriceProvider {
public:
    inline static const std::string QUOTE_UPDATED = "quote.updated";
    inline static const std::string FX_UPDATED = "fx.updated";

    QuoteCache() = default;

    /**
     * @brief Подписаться на рыночные события (до start() потребителя)
     */
    void listen(const std::shared_ptr<ports::output::IEventConsumer>& eventConsumer) {
        eventConsumer->subscribe({QUOTE_UPDATED, FX_UPDATED},
            [this](const std::string& routingKey, const std::string& message) {
                onMarketEvent(routingKey, message);
            });
        std::cout << "[QuoteCache] Listening to " << QUOTE_UPDATED << ", " << FX_UPDATED << std::endl;
    }

    std::optional<domain::Quote> getQuote(const std::string& productCode) override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = quotes_.find(productCode);
        if (it == quotes_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<domain::Decimal> getExchangeRate(const std::string& currency) override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = rates_.find(currency);
        if (it == rates_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void setQuote(const std::string& productCode, const domain::Decimal& price,
                  const std::string& currency) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        quotes_[productCode] = domain::Quote{productCode, price, currency};
    }

    void setExchangeRate(const std::string& currency, const domain::Decimal& rate) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        rates_[currency] = rate;
    }

private:
    std::shared_mutex mutex_;
    std::unordered_map<std::string, domain::Quote> quotes_;
    std::unordered_map<std::string, domain::Decimal> rates_;

    void onMarketEvent(const std::string& routingKey, const std::string& message) {
        try {
            auto json = nlohmann::json::parse(message);
            if (routingKey == QUOTE_UPDATED) {
                std::string productCode = json.contains("product_code")
                    ? json["product_code"].get<std::string>()
                    : json.value("figi", "");
                auto price = application::decimalFromJson(json, "last_price");
                if (productCode.empty() || !price) {
                    std::cerr << "[QuoteCache] Incomplete quote: " << message << std::endl;
                    return;
                }
                setQuote(productCode, *price, json.value("currency", ""));
            } else if (routingKey == FX_UPDATED) {
                std::string currency = json.value("currency", "");
                auto rate = application::decimalFromJson(json, "rate");
                if (currency.empty() || !rate || !rate->isPositive()) {
                    std::cerr << "[QuoteCache] Incomplete exchange rate: " << message << std::endl;
                    return;
                }
                setExchangeRate(currency, *rate);
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[QuoteCache] Malformed " << routingKey << ": " << e.what() << std::endl;
        } catch (const domain::ValidationError& e) {
            std::cerr << "[QuoteCache] Rejected " << routingKey << ": " << e.what() << std::endl;
        }
    }
};

} // namespace ledger::adapters::secondary
