// include/domain/Quote.hpp
#pragma once

#include "domain/Decimal.hpp"
#include <string>

namespace ledger::domain {

/**
 * @brief Котировка от внешнего поставщика цен
 */
struct Quote {
    std::string productCode;
    Decimal price;              ///< Последняя цена, валюта инструмента
    std::string currency;
};

} // namespace ledger::domain
