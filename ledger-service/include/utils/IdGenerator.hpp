// include/utils/IdGenerator.hpp
#pragma once

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace ledger::utils {

/**
 * @brief Идентификаторы сущностей леджера
 *
 * UUID v4 с коротким префиксом типа: "ord-3f2a...", "txn-...".
 *
 * @note Thread-safe благодаря thread_local генератору
 */
class IdGenerator {
public:
    static std::string orderId()       { return withPrefix("ord"); }
    static std::string executionId()   { return withPrefix("exe"); }
    static std::string transactionId() { return withPrefix("txn"); }
    static std::string historyId()     { return withPrefix("bhs"); }

    /**
     * @brief UUID v4: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx
     */
    static std::string uuid() {
        thread_local std::mt19937_64 gen(std::random_device{}());
        std::uniform_int_distribution<uint64_t> dist;

        uint64_t high = dist(gen);
        uint64_t low = dist(gen);

        std::ostringstream ss;
        ss << std::hex << std::setfill('0');
        ss << std::setw(8) << ((high >> 32) & 0xFFFFFFFF) << "-";
        ss << std::setw(4) << ((high >> 16) & 0xFFFF) << "-";
        ss << std::setw(4) << ((high & 0x0FFF) | 0x4000) << "-";
        ss << std::setw(4) << (((low >> 48) & 0x3FFF) | 0x8000) << "-";
        ss << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
        return ss.str();
    }

private:
    static std::string withPrefix(const char* prefix) {
        return std::string(prefix) + "-" + uuid();
    }
};

} // namespace ledger::utils
