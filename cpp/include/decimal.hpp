#pragma once

#include <cstdint>
#include <string>
#include <ostream>

namespace perp {

/**
 * Exact base-10 number used for every price, amount and fee.
 *
 * Stored as a signed 128-bit mantissa and a count of fractional digits
 * (value = mantissa / 10^scale). Values are kept normalized, so two equal
 * numbers always have the same representation. Arithmetic never goes
 * through floating point; results needing more than MAX_SCALE fractional
 * digits are rounded half away from zero.
 */
class Decimal {
public:
    using mantissa_t = __int128;

    static constexpr int MAX_SCALE = 18;

    Decimal() : mantissa_(0), scale_(0) {}
    Decimal(int64_t value) : mantissa_(value), scale_(0) {}
    Decimal(int value) : mantissa_(value), scale_(0) {}

    /**
     * Build from a raw mantissa and scale, e.g. (150, 2) == 1.50
     * Throws std::invalid_argument for a scale outside [0, MAX_SCALE]
     */
    static Decimal from_raw(mantissa_t mantissa, int scale);

    /**
     * Parse "[+-]digits[.digits]"
     * Throws std::invalid_argument on malformed text or too many fractional digits
     */
    static Decimal parse(const std::string& text);

    /**
     * 10^exponent as a mantissa, exponent in [0, 38]
     */
    static mantissa_t pow10(int exponent);

    mantissa_t mantissa() const { return mantissa_; }
    int scale() const { return scale_; }

    bool is_zero() const { return mantissa_ == 0; }
    bool is_positive() const { return mantissa_ > 0; }
    bool is_negative() const { return mantissa_ < 0; }

    Decimal abs() const;

    std::string to_string() const;

    // Reporting only, never on the matching path
    double to_double() const;

    Decimal operator-() const;
    Decimal& operator+=(const Decimal& rhs);
    Decimal& operator-=(const Decimal& rhs);
    Decimal& operator*=(const Decimal& rhs);
    Decimal& operator/=(const Decimal& rhs);

    friend Decimal operator+(Decimal lhs, const Decimal& rhs) { return lhs += rhs; }
    friend Decimal operator-(Decimal lhs, const Decimal& rhs) { return lhs -= rhs; }
    friend Decimal operator*(Decimal lhs, const Decimal& rhs) { return lhs *= rhs; }
    friend Decimal operator/(Decimal lhs, const Decimal& rhs) { return lhs /= rhs; }

    friend bool operator==(const Decimal& a, const Decimal& b) {
        return a.mantissa_ == b.mantissa_ && a.scale_ == b.scale_;
    }
    friend bool operator!=(const Decimal& a, const Decimal& b) { return !(a == b); }
    friend bool operator<(const Decimal& a, const Decimal& b) { return compare(a, b) < 0; }
    friend bool operator>(const Decimal& a, const Decimal& b) { return compare(a, b) > 0; }
    friend bool operator<=(const Decimal& a, const Decimal& b) { return compare(a, b) <= 0; }
    friend bool operator>=(const Decimal& a, const Decimal& b) { return compare(a, b) >= 0; }

    static int compare(const Decimal& a, const Decimal& b);

private:
    Decimal(mantissa_t mantissa, int scale, bool /* raw */) : mantissa_(mantissa), scale_(scale) {}

    void normalize();

    // Bring both operands to the larger scale; throws std::overflow_error
    static void align(const Decimal& a, const Decimal& b, mantissa_t& ma, mantissa_t& mb, int& scale);

    mantissa_t mantissa_;
    int scale_;
};

inline std::ostream& operator<<(std::ostream& os, const Decimal& value) {
    return os << value.to_string();
}

} // namespace perp
