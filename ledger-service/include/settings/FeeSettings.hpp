// include/settings/FeeSettings.hpp
#pragma once

#include "domain/FeeSchedule.hpp"
#include <string>
#include <cstdlib>

namespace ledger::settings {

/**
 * @brief Тарифы комиссий
 *
 * Читает из ENV:
 * - LEDGER_COMMISSION_RATE (default: 0.00015) - 0.015% с обеих сторон
 * - LEDGER_MIN_COMMISSION (default: 0)
 * - LEDGER_TAX_RATE (default: 0.0023) - 0.23% с продажи
 * - LEDGER_FEE_PRECISION (default: 0) - знаков после запятой
 */
class FeeSettings {
public:
    FeeSettings() {
        schedule_.commissionRate = domain::Decimal::fromString(
            getEnvOrDefault("LEDGER_COMMISSION_RATE", "0.00015"));
        schedule_.minCommission = domain::Decimal::fromString(
            getEnvOrDefault("LEDGER_MIN_COMMISSION", "0"));
        schedule_.taxRate = domain::Decimal::fromString(
            getEnvOrDefault("LEDGER_TAX_RATE", "0.0023"));
        schedule_.precision = std::stoi(getEnvOrDefault("LEDGER_FEE_PRECISION", "0"));
    }

    const domain::FeeSchedule& getSchedule() const { return schedule_; }

private:
    domain::FeeSchedule schedule_;

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }
};

} // namespace ledger::settings
