// include/ports/output/IPriceProvider.hpp
#pragma once

#include "domain/Decimal.hpp"
#include "domain/Quote.hpp"
#include <optional>
#include <string>

namespace ledger::ports::output {

/**
 * @brief Источник цен и курсов (только чтение)
 *
 * Вызывается до входа в единицу работы: сетевые обращения под
 * блокировкой счёта запрещены.
 */
class IPriceProvider {
public:
    virtual ~IPriceProvider() = default;

    /**
     * @return Котировка или nullopt, если цена недоступна
     */
    virtual std::optional<domain::Quote> getQuote(const std::string& productCode) = 0;

    /**
     * @brief Курс валюты к базовой валюте счёта
     */
    virtual std::optional<domain::Decimal> getExchangeRate(const std::string& currency) = 0;
};

} // namespace ledger::ports::output
