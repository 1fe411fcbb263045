#pragma once

#include "decimal.hpp"
#include <cstdint>
#include <functional>
#include <limits>
#include <stdexcept>

namespace perp {

/**
 * Orderbook key: a price scaled by 10^8 and truncated toward zero.
 *
 * Any price with at most 8 fractional digits survives the round trip
 * exactly. The encoded value must fit int64_t, which bounds prices at
 * roughly 9.2e10 in either direction; from_decimal() throws
 * std::out_of_range beyond that.
 */
class PriceLevel {
public:
    static constexpr int SCALE_DIGITS = 8;
    static constexpr int64_t SCALE = 100000000;

    PriceLevel() : raw_(0) {}
    explicit PriceLevel(int64_t raw) : raw_(raw) {}

    static PriceLevel from_decimal(const Decimal& price) {
        Decimal::mantissa_t scaled;
        if (price.scale() <= SCALE_DIGITS) {
            if (__builtin_mul_overflow(price.mantissa(), Decimal::pow10(SCALE_DIGITS - price.scale()), &scaled)) {
                throw std::out_of_range("Price out of range: " + price.to_string());
            }
        } else {
            // Integer division truncates toward zero
            scaled = price.mantissa() / Decimal::pow10(price.scale() - SCALE_DIGITS);
        }
        if (scaled > std::numeric_limits<int64_t>::max() || scaled < std::numeric_limits<int64_t>::min()) {
            throw std::out_of_range("Price out of range: " + price.to_string());
        }
        return PriceLevel(static_cast<int64_t>(scaled));
    }

    Decimal to_decimal() const {
        return Decimal::from_raw(raw_, SCALE_DIGITS);
    }

    int64_t raw() const { return raw_; }

    friend bool operator==(PriceLevel a, PriceLevel b) { return a.raw_ == b.raw_; }
    friend bool operator!=(PriceLevel a, PriceLevel b) { return a.raw_ != b.raw_; }
    friend bool operator<(PriceLevel a, PriceLevel b) { return a.raw_ < b.raw_; }
    friend bool operator>(PriceLevel a, PriceLevel b) { return a.raw_ > b.raw_; }
    friend bool operator<=(PriceLevel a, PriceLevel b) { return a.raw_ <= b.raw_; }
    friend bool operator>=(PriceLevel a, PriceLevel b) { return a.raw_ >= b.raw_; }

private:
    int64_t raw_;
};

} // namespace perp

namespace std {
template<>
struct hash<perp::PriceLevel> {
    size_t operator()(perp::PriceLevel level) const noexcept {
        return std::hash<int64_t>{}(level.raw());
    }
};
} // namespace std
