#include "decimal.hpp"
#include <algorithm>
#include <stdexcept>

namespace perp {

namespace {

using mantissa_t = Decimal::mantissa_t;

mantissa_t checked_mul(mantissa_t a, mantissa_t b) {
    mantissa_t out;
    if (__builtin_mul_overflow(a, b, &out)) {
        throw std::overflow_error("Decimal overflow in multiplication");
    }
    return out;
}

mantissa_t checked_add(mantissa_t a, mantissa_t b) {
    mantissa_t out;
    if (__builtin_add_overflow(a, b, &out)) {
        throw std::overflow_error("Decimal overflow in addition");
    }
    return out;
}

// Divide by 10^digits, rounding half away from zero
mantissa_t round_down_digits(mantissa_t value, int digits) {
    if (digits <= 0) {
        return value;
    }
    const mantissa_t divisor = Decimal::pow10(digits);
    mantissa_t quotient = value / divisor;
    mantissa_t remainder = value % divisor;
    if (remainder < 0) {
        remainder = -remainder;
    }
    if (remainder * 2 >= divisor) {
        quotient += (value < 0) ? -1 : 1;
    }
    return quotient;
}

} // namespace

// =============================================================================
// CONSTRUCTION
// =============================================================================

Decimal Decimal::from_raw(mantissa_t mantissa, int scale) {
    if (scale < 0 || scale > MAX_SCALE) {
        throw std::invalid_argument("Decimal scale out of range: " + std::to_string(scale));
    }
    Decimal result(mantissa, scale, true);
    result.normalize();
    return result;
}

Decimal Decimal::parse(const std::string& text) {
    if (text.empty()) {
        throw std::invalid_argument("Invalid decimal: empty string");
    }

    size_t pos = 0;
    bool negative = false;
    if (text[pos] == '+' || text[pos] == '-') {
        negative = (text[pos] == '-');
        ++pos;
    }

    mantissa_t mantissa = 0;
    int scale = 0;
    size_t digits = 0;
    bool seen_point = false;

    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (c == '.') {
            if (seen_point) {
                throw std::invalid_argument("Invalid decimal: " + text);
            }
            seen_point = true;
            continue;
        }
        if (c < '0' || c > '9') {
            throw std::invalid_argument("Invalid decimal: " + text);
        }
        if (seen_point) {
            if (++scale > MAX_SCALE) {
                throw std::invalid_argument("Too many fractional digits: " + text);
            }
        }
        mantissa_t next;
        if (__builtin_mul_overflow(mantissa, static_cast<mantissa_t>(10), &next) ||
            __builtin_add_overflow(next, static_cast<mantissa_t>(c - '0'), &next)) {
            throw std::invalid_argument("Decimal out of range: " + text);
        }
        mantissa = next;
        ++digits;
    }

    if (digits == 0) {
        throw std::invalid_argument("Invalid decimal: " + text);
    }

    Decimal result(negative ? -mantissa : mantissa, scale, true);
    result.normalize();
    return result;
}

mantissa_t Decimal::pow10(int exponent) {
    if (exponent < 0 || exponent > 38) {
        throw std::out_of_range("Decimal::pow10 exponent out of range");
    }
    mantissa_t value = 1;
    for (int i = 0; i < exponent; ++i) {
        value *= 10;
    }
    return value;
}

void Decimal::normalize() {
    if (mantissa_ == 0) {
        scale_ = 0;
        return;
    }
    while (scale_ > 0 && mantissa_ % 10 == 0) {
        mantissa_ /= 10;
        --scale_;
    }
}

void Decimal::align(const Decimal& a, const Decimal& b, mantissa_t& ma, mantissa_t& mb, int& scale) {
    scale = std::max(a.scale_, b.scale_);
    ma = checked_mul(a.mantissa_, pow10(scale - a.scale_));
    mb = checked_mul(b.mantissa_, pow10(scale - b.scale_));
}

// =============================================================================
// ARITHMETIC
// =============================================================================

Decimal Decimal::abs() const {
    return Decimal(mantissa_ < 0 ? -mantissa_ : mantissa_, scale_, true);
}

Decimal Decimal::operator-() const {
    return Decimal(-mantissa_, scale_, true);
}

Decimal& Decimal::operator+=(const Decimal& rhs) {
    mantissa_t ma, mb;
    int scale;
    align(*this, rhs, ma, mb, scale);
    mantissa_ = checked_add(ma, mb);
    scale_ = scale;
    normalize();
    return *this;
}

Decimal& Decimal::operator-=(const Decimal& rhs) {
    return *this += -rhs;
}

Decimal& Decimal::operator*=(const Decimal& rhs) {
    mantissa_t product = checked_mul(mantissa_, rhs.mantissa_);
    int scale = scale_ + rhs.scale_;
    if (scale > MAX_SCALE) {
        product = round_down_digits(product, scale - MAX_SCALE);
        scale = MAX_SCALE;
    }
    mantissa_ = product;
    scale_ = scale;
    normalize();
    return *this;
}

Decimal& Decimal::operator/=(const Decimal& rhs) {
    if (rhs.mantissa_ == 0) {
        throw std::domain_error("Decimal division by zero");
    }

    // (ma / 10^sa) / (mb / 10^sb) == (ma * 10^sb) / (mb * 10^sa)
    const bool negative = (mantissa_ < 0) != (rhs.mantissa_ < 0);
    mantissa_t numerator = checked_mul(mantissa_ < 0 ? -mantissa_ : mantissa_, pow10(rhs.scale_));
    mantissa_t denominator = checked_mul(rhs.mantissa_ < 0 ? -rhs.mantissa_ : rhs.mantissa_, pow10(scale_));

    mantissa_t quotient = numerator / denominator;
    mantissa_t remainder = numerator % denominator;

    for (int i = 0; i < MAX_SCALE; ++i) {
        remainder = checked_mul(remainder, 10);
        quotient = checked_add(checked_mul(quotient, 10), remainder / denominator);
        remainder %= denominator;
    }
    if (checked_mul(remainder, 2) >= denominator) {
        quotient = checked_add(quotient, 1);
    }

    mantissa_ = negative ? -quotient : quotient;
    scale_ = MAX_SCALE;
    normalize();
    return *this;
}

int Decimal::compare(const Decimal& a, const Decimal& b) {
    if (a.scale_ == b.scale_) {
        return (a.mantissa_ < b.mantissa_) ? -1 : (a.mantissa_ > b.mantissa_ ? 1 : 0);
    }
    mantissa_t ma, mb;
    int scale;
    align(a, b, ma, mb, scale);
    return (ma < mb) ? -1 : (ma > mb ? 1 : 0);
}

// =============================================================================
// FORMATTING
// =============================================================================

std::string Decimal::to_string() const {
    mantissa_t magnitude = mantissa_ < 0 ? -mantissa_ : mantissa_;

    std::string digits;
    do {
        digits.push_back(static_cast<char>('0' + static_cast<int>(magnitude % 10)));
        magnitude /= 10;
    } while (magnitude > 0);

    while (static_cast<int>(digits.size()) <= scale_) {
        digits.push_back('0');
    }
    std::reverse(digits.begin(), digits.end());

    if (scale_ > 0) {
        digits.insert(digits.size() - static_cast<size_t>(scale_), 1, '.');
    }
    if (mantissa_ < 0) {
        digits.insert(digits.begin(), '-');
    }
    return digits;
}

double Decimal::to_double() const {
    return static_cast<double>(mantissa_) / static_cast<double>(pow10(scale_));
}

} // namespace perp
