// include/settings/LedgerSettings.hpp
#pragma once

#include "domain/Decimal.hpp"
#include <string>
#include <cstdlib>

namespace ledger::settings {

/**
 * @brief Общие настройки леджера
 *
 * Читает из ENV:
 * - LEDGER_STORAGE (default: "postgres") - postgres | memory
 * - LEDGER_BASE_CURRENCY (default: "KRW") - валюта счёта
 * - LEDGER_DEFAULT_INITIAL_CASH (default: 1000000)
 * - LEDGER_ORDER_TTL_MINUTES (default: 0) - срок жизни ордера, 0 = бессрочно
 * - LEDGER_EXPIRY_INTERVAL_MS (default: 60000) - период проверки просроченных ордеров
 */
class LedgerSettings {
public:
    LedgerSettings() {
        storage_ = getEnvOrDefault("LEDGER_STORAGE", "postgres");
        baseCurrency_ = getEnvOrDefault("LEDGER_BASE_CURRENCY", "KRW");
        defaultInitialCash_ = domain::Decimal::fromString(
            getEnvOrDefault("LEDGER_DEFAULT_INITIAL_CASH", "1000000"));
        orderTtlMinutes_ = std::stoi(getEnvOrDefault("LEDGER_ORDER_TTL_MINUTES", "0"));
        expiryIntervalMs_ = std::stoi(getEnvOrDefault("LEDGER_EXPIRY_INTERVAL_MS", "60000"));
    }

    std::string getStorage() const { return storage_; }
    bool useInMemoryStorage() const { return storage_ == "memory"; }
    std::string getBaseCurrency() const { return baseCurrency_; }
    domain::Decimal getDefaultInitialCash() const { return defaultInitialCash_; }
    int getOrderTtlMinutes() const { return orderTtlMinutes_; }
    int getExpiryIntervalMs() const { return expiryIntervalMs_; }

    // Для тестов
    void setBaseCurrency(const std::string& currency) { baseCurrency_ = currency; }
    void setDefaultInitialCash(const domain::Decimal& cash) { defaultInitialCash_ = cash; }
    void setOrderTtlMinutes(int minutes) { orderTtlMinutes_ = minutes; }

private:
    std::string storage_;
    std::string baseCurrency_;
    domain::Decimal defaultInitialCash_;
    int orderTtlMinutes_;
    int expiryIntervalMs_;

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }
};

} // namespace ledger::settings
