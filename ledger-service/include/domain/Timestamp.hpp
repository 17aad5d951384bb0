// include/domain/Timestamp.hpp
#pragma once

#include <string>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <ctime>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Timestamp in UTC, ISO 8601 on the wire
 */
struct Timestamp {
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    /**
     * @brief Parse "2025-12-16T10:30:00Z" or a bare date "2025-12-16"
     * @throws std::invalid_argument on malformed input
     */
    static Timestamp fromString(const std::string& isoString) {
        std::tm tm = {};
        std::istringstream ss(isoString);
        if (isoString.size() == 10) {
            ss >> std::get_time(&tm, "%Y-%m-%d");
        } else {
            ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        }

        if (ss.fail()) {
            throw std::invalid_argument("Invalid timestamp: " + isoString);
        }

        return Timestamp(std::chrono::system_clock::from_time_t(timegm(&tm)));
    }

    /**
     * @brief Convert to ISO 8601 string
     */
    std::string toString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = {};
        gmtime_r(&time_t_val, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    /**
     * @brief Calendar date "YYYY-MM-DD" (UTC)
     */
    std::string toDateString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = {};
        gmtime_r(&time_t_val, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%d");
        return ss.str();
    }

    /**
     * @brief Midnight UTC of the same day
     */
    Timestamp startOfDay() const {
        int64_t seconds = toUnixSeconds();
        int64_t day = seconds >= 0 ? seconds / 86400 : (seconds - 86399) / 86400;
        return fromUnixSeconds(day * 86400);
    }

    Timestamp plusSeconds(int64_t seconds) const {
        return Timestamp(value + std::chrono::seconds(seconds));
    }

    Timestamp plusDays(int64_t days) const {
        return plusSeconds(days * 86400);
    }

    int64_t toUnixSeconds() const {
        return std::chrono::duration_cast<std::chrono::seconds>(
            value.time_since_epoch()
        ).count();
    }

    int64_t toUnixMillis() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            value.time_since_epoch()
        ).count();
    }

    static Timestamp fromUnixSeconds(int64_t seconds) {
        return Timestamp(std::chrono::system_clock::time_point(
            std::chrono::seconds(seconds)
        ));
    }

    static Timestamp fromUnixMillis(int64_t millis) {
        return Timestamp(std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::milliseconds(millis))
        ));
    }

    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator>=(const Timestamp& other) const { return value >= other.value; }
    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }
};

} // namespace ledger::domain
