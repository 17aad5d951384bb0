// include/adapters/secondary/persistence/PgSupport.hpp
#pragma once

#include "domain/Decimal.hpp"
#include "domain/LedgerErrors.hpp"
#include "domain/Timestamp.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <optional>
#include <string>

namespace ledger::adapters::secondary::pg {

// NUMERIC(28,8) уходит и приходит строкой, TIMESTAMPTZ - миллисекундами epoch.
// В SELECT: (EXTRACT(EPOCH FROM col) * 1000)::BIGINT AS col
// В INSERT: to_timestamp($n::BIGINT / 1000.0)

inline std::string num(const domain::Decimal& value) {
    return value.toString();
}

inline std::optional<std::string> num(const std::optional<domain::Decimal>& value) {
    if (!value) return std::nullopt;
    return value->toString();
}

inline int64_t millis(const domain::Timestamp& value) {
    return value.toUnixMillis();
}

inline std::optional<int64_t> millis(const std::optional<domain::Timestamp>& value) {
    if (!value) return std::nullopt;
    return value->toUnixMillis();
}

inline domain::Decimal decimalField(const pqxx::field& field) {
    return domain::Decimal::fromString(field.c_str());
}

inline std::optional<domain::Decimal> optionalDecimal(const pqxx::field& field) {
    if (field.is_null()) return std::nullopt;
    return decimalField(field);
}

inline domain::Timestamp timestampField(const pqxx::field& field) {
    return domain::Timestamp::fromUnixMillis(field.as<int64_t>());
}

inline std::optional<domain::Timestamp> optionalTimestamp(const pqxx::field& field) {
    if (field.is_null()) return std::nullopt;
    return timestampField(field);
}

inline std::optional<std::string> optionalString(const pqxx::field& field) {
    if (field.is_null()) return std::nullopt;
    return field.as<std::string>();
}

inline std::string epochMillis(const std::string& column) {
    return "(EXTRACT(EPOCH FROM " + column + ") * 1000)::BIGINT AS " + column;
}

/**
 * @brief Перевести текущее исключение libpqxx в ошибку леджера
 *
 * Вызывать только из catch-блока. Конфликты блокировок (lock_timeout,
 * deadlock, serialization failure) становятся ConflictError, остальное
 * PersistenceError.
 *
 * @example
 * ```cpp
 * try {
 *     txn_.exec_params("...", userId);
 * } catch (const pqxx::failure&) {
 *     pg::rethrowTranslated("[PostgresBalanceRepository] save");
 * }
 * ```
 */
[[noreturn]] inline void rethrowTranslated(const std::string& context) {
    try {
        throw;
    } catch (const pqxx::sql_error& e) {
        const std::string state = e.sqlstate();
        std::cerr << context << " error (" << state << "): " << e.what() << std::endl;
        if (state == "40001" || state == "40P01" || state == "55P03") {
            throw domain::ConflictError(context + ": " + e.what());
        }
        throw domain::PersistenceError(context + ": " + e.what());
    } catch (const pqxx::failure& e) {
        std::cerr << context << " error: " << e.what() << std::endl;
        throw domain::PersistenceError(context + ": " + e.what());
    }
}

} // namespace ledger::adapters::secondary::pg
