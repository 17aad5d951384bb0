// include/domain/LedgerErrors.hpp
#pragma once

#include <stdexcept>
#include <string>

namespace ledger::domain {

/**
 * @brief Базовое исключение леджера
 *
 * Все ошибки, которые вызывающий может обработать (4xx на границе),
 * наследуются от LedgerException. PersistenceError - внутренняя ошибка.
 */
class LedgerException : public std::runtime_error {
public:
    explicit LedgerException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Некорректный ввод, запрещённый переход статуса, попытка oversell
 */
class ValidationError : public LedgerException {
public:
    explicit ValidationError(const std::string& message)
        : LedgerException(message) {}
};

/**
 * @brief Недостаточно свободных средств для резерва или списания
 */
class InsufficientBalanceError : public LedgerException {
public:
    explicit InsufficientBalanceError(const std::string& message)
        : LedgerException(message) {}
};

/**
 * @brief Неизвестный ордер, счёт или позиция
 */
class NotFoundError : public LedgerException {
public:
    explicit NotFoundError(const std::string& message)
        : LedgerException(message) {}
};

/**
 * @brief Не удалось получить блокировку / конфликт сериализации
 */
class ConflictError : public LedgerException {
public:
    explicit ConflictError(const std::string& message)
        : LedgerException(message) {}
};

/**
 * @brief Неожиданный сбой хранилища; транзакция откатывается целиком
 */
class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace ledger::domain
