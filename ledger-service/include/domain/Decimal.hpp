// include/domain/Decimal.hpp
#pragma once

#include <algorithm>
#include <cstdint>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <string>

namespace ledger::domain {

/**
 * @brief Десятичное число с фиксированной точкой (8 знаков после запятой)
 *
 * Все деньги, цены, количества и курсы в леджере хранятся в Decimal.
 * Внутреннее представление - int64_t, масштабированный на 10^8:
 * 1.5 хранится как 150000000.
 *
 * Умножение и деление выполняются через 128-битный промежуточный
 * результат и округляются half-up (от нуля).
 *
 * Диапазон: примерно ±92 млрд, чего хватает для виртуальных счетов.
 *
 * @example
 * ```cpp
 * auto price = Decimal::fromString("10000");
 * auto qty = Decimal(10);
 * auto notional = price * qty;           // 100000
 * auto fee = (notional * Decimal::fromString("0.00015")).round(0); // 15
 * ```
 */
class Decimal {
public:
    static constexpr int SCALE = 8;
    static constexpr int64_t ONE = 100000000;

    Decimal() = default;

    /**
     * @brief Целое значение
     */
    explicit Decimal(int64_t units) : raw_(checkedScale(units)) {}

    static Decimal fromRaw(int64_t raw) {
        Decimal d;
        d.raw_ = raw;
        return d;
    }

    static Decimal zero() { return Decimal(); }

    /**
     * @brief Разобрать строку вида "-123.456"
     *
     * Лишние знаки после 8-го округляются half-up.
     * @throws std::invalid_argument при неверном формате
     */
    static Decimal fromString(const std::string& text) {
        if (text.empty()) {
            throw std::invalid_argument("Empty decimal string");
        }

        size_t pos = 0;
        bool negative = false;
        if (text[pos] == '-' || text[pos] == '+') {
            negative = text[pos] == '-';
            ++pos;
        }

        __int128 intPart = 0;
        __int128 fracPart = 0;
        int fracDigits = 0;
        bool roundUp = false;
        bool seenDigit = false;
        bool seenDot = false;

        for (; pos < text.size(); ++pos) {
            char c = text[pos];
            if (c == '.') {
                if (seenDot) {
                    throw std::invalid_argument("Invalid decimal: " + text);
                }
                seenDot = true;
                continue;
            }
            if (c < '0' || c > '9') {
                throw std::invalid_argument("Invalid decimal: " + text);
            }
            seenDigit = true;
            int digit = c - '0';
            if (!seenDot) {
                intPart = intPart * 10 + digit;
                if (intPart > std::numeric_limits<int64_t>::max() / ONE) {
                    throw std::out_of_range("Decimal out of range: " + text);
                }
            } else if (fracDigits < SCALE) {
                fracPart = fracPart * 10 + digit;
                ++fracDigits;
            } else if (fracDigits == SCALE) {
                roundUp = digit >= 5;
                ++fracDigits;
            }
        }

        if (!seenDigit) {
            throw std::invalid_argument("Invalid decimal: " + text);
        }

        for (int i = std::min(fracDigits, SCALE); i < SCALE; ++i) {
            fracPart *= 10;
        }

        __int128 raw = intPart * ONE + fracPart + (roundUp ? 1 : 0);
        return fromWide(negative ? -raw : raw);
    }

    /**
     * @brief Создать из double (только для граничных адаптеров, JSON)
     */
    static Decimal fromDouble(double value) {
        double scaled = value * static_cast<double>(ONE);
        if (scaled > static_cast<double>(std::numeric_limits<int64_t>::max()) ||
            scaled < static_cast<double>(std::numeric_limits<int64_t>::min())) {
            throw std::out_of_range("Decimal out of range");
        }
        return fromRaw(static_cast<int64_t>(scaled < 0 ? scaled - 0.5 : scaled + 0.5));
    }

    int64_t raw() const { return raw_; }

    double toDouble() const {
        return static_cast<double>(raw_) / static_cast<double>(ONE);
    }

    /**
     * @brief Строковое представление без хвостовых нулей: "100000", "0.5", "-12.345"
     */
    std::string toString() const {
        __int128 value = raw_;
        bool negative = value < 0;
        if (negative) value = -value;

        auto intPart = static_cast<uint64_t>(value / ONE);
        auto fracPart = static_cast<uint64_t>(value % ONE);

        std::string result = negative ? "-" : "";
        result += std::to_string(intPart);

        if (fracPart != 0) {
            std::string frac = std::to_string(fracPart);
            frac.insert(0, SCALE - frac.size(), '0');
            while (!frac.empty() && frac.back() == '0') {
                frac.pop_back();
            }
            result += "." + frac;
        }
        return result;
    }

    /**
     * @brief Округлить до places знаков после запятой (half-up, от нуля)
     */
    Decimal round(int places) const {
        if (places >= SCALE) return *this;
        if (places < 0) places = 0;

        int64_t factor = 1;
        for (int i = places; i < SCALE; ++i) {
            factor *= 10;
        }
        int64_t rem = raw_ % factor;
        int64_t base = raw_ - rem;
        if (rem >= factor / 2) {
            base += factor;
        } else if (rem <= -factor / 2) {
            base -= factor;
        }
        return fromRaw(base);
    }

    bool isZero() const { return raw_ == 0; }
    bool isNegative() const { return raw_ < 0; }
    bool isPositive() const { return raw_ > 0; }

    Decimal abs() const { return raw_ < 0 ? fromRaw(-raw_) : *this; }

    Decimal operator-() const { return fromRaw(-raw_); }

    Decimal operator+(const Decimal& other) const {
        return fromWide(static_cast<__int128>(raw_) + other.raw_);
    }

    Decimal operator-(const Decimal& other) const {
        return fromWide(static_cast<__int128>(raw_) - other.raw_);
    }

    Decimal operator*(const Decimal& other) const {
        __int128 product = static_cast<__int128>(raw_) * other.raw_;
        return fromWide(divideRounded(product, ONE));
    }

    /**
     * @throws std::domain_error при делении на ноль
     */
    Decimal operator/(const Decimal& other) const {
        if (other.raw_ == 0) {
            throw std::domain_error("Decimal division by zero");
        }
        __int128 numerator = static_cast<__int128>(raw_) * ONE;
        return fromWide(divideRounded(numerator, other.raw_));
    }

    Decimal& operator+=(const Decimal& other) { return *this = *this + other; }
    Decimal& operator-=(const Decimal& other) { return *this = *this - other; }
    Decimal& operator*=(const Decimal& other) { return *this = *this * other; }

    bool operator==(const Decimal& other) const { return raw_ == other.raw_; }
    bool operator!=(const Decimal& other) const { return raw_ != other.raw_; }
    bool operator<(const Decimal& other) const { return raw_ < other.raw_; }
    bool operator>(const Decimal& other) const { return raw_ > other.raw_; }
    bool operator<=(const Decimal& other) const { return raw_ <= other.raw_; }
    bool operator>=(const Decimal& other) const { return raw_ >= other.raw_; }

private:
    int64_t raw_ = 0;

    static int64_t checkedScale(int64_t units) {
        if (units > std::numeric_limits<int64_t>::max() / ONE ||
            units < std::numeric_limits<int64_t>::min() / ONE) {
            throw std::out_of_range("Decimal out of range");
        }
        return units * ONE;
    }

    static Decimal fromWide(__int128 value) {
        if (value > std::numeric_limits<int64_t>::max() ||
            value < std::numeric_limits<int64_t>::min()) {
            throw std::overflow_error("Decimal overflow");
        }
        return fromRaw(static_cast<int64_t>(value));
    }

    static __int128 divideRounded(__int128 numerator, __int128 denominator) {
        __int128 quotient = numerator / denominator;
        __int128 remainder = numerator % denominator;
        if (remainder != 0) {
            __int128 absRem = remainder < 0 ? -remainder : remainder;
            __int128 absDen = denominator < 0 ? -denominator : denominator;
            if (absRem * 2 >= absDen) {
                bool negative = (numerator < 0) != (denominator < 0);
                quotient += negative ? -1 : 1;
            }
        }
        return quotient;
    }
};

inline std::ostream& operator<<(std::ostream& os, const Decimal& value) {
    return os << value.toString();
}

} // namespace ledger::domain
