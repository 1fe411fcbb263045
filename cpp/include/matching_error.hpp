#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace perp {

enum class MatchingErrorKind : uint8_t {
    SYMBOL_NOT_FOUND = 0,
    ORDER_NOT_FOUND = 1,
    INVALID_PRICE = 2,
    INVALID_AMOUNT = 3,
    INVALID_SIDE = 4,
    INSUFFICIENT_LIQUIDITY = 5,
    DATABASE_ERROR = 6,
    INTERNAL_ERROR = 7
};

/**
 * Every failure the engine and orchestrator surface to callers.
 * Validation failures are thrown before any book mutation.
 */
class MatchingError : public std::runtime_error {
public:
    MatchingError(MatchingErrorKind kind, const std::string& detail)
        : std::runtime_error(format(kind, detail)), kind_(kind) {}

    MatchingErrorKind kind() const { return kind_; }

    static MatchingError symbol_not_found(const std::string& symbol) {
        return MatchingError(MatchingErrorKind::SYMBOL_NOT_FOUND, symbol);
    }
    static MatchingError order_not_found(const std::string& order_id) {
        return MatchingError(MatchingErrorKind::ORDER_NOT_FOUND, order_id);
    }
    static MatchingError invalid_price(const std::string& detail) {
        return MatchingError(MatchingErrorKind::INVALID_PRICE, detail);
    }
    static MatchingError invalid_amount(const std::string& detail) {
        return MatchingError(MatchingErrorKind::INVALID_AMOUNT, detail);
    }
    static MatchingError duplicate_order(const std::string& order_id) {
        return MatchingError(MatchingErrorKind::INTERNAL_ERROR, "duplicate order id " + order_id);
    }
    static MatchingError database_error(const std::string& detail) {
        return MatchingError(MatchingErrorKind::DATABASE_ERROR, detail);
    }

private:
    static std::string format(MatchingErrorKind kind, const std::string& detail) {
        switch (kind) {
            case MatchingErrorKind::SYMBOL_NOT_FOUND:       return "Symbol not found: " + detail;
            case MatchingErrorKind::ORDER_NOT_FOUND:        return "Order not found: " + detail;
            case MatchingErrorKind::INVALID_PRICE:          return "Invalid price: " + detail;
            case MatchingErrorKind::INVALID_AMOUNT:         return "Invalid amount: " + detail;
            case MatchingErrorKind::INVALID_SIDE:           return "Invalid side: " + detail;
            case MatchingErrorKind::INSUFFICIENT_LIQUIDITY: return "Insufficient liquidity: " + detail;
            case MatchingErrorKind::DATABASE_ERROR:         return "Database error: " + detail;
            case MatchingErrorKind::INTERNAL_ERROR:         return "Internal error: " + detail;
        }
        return detail;
    }

    MatchingErrorKind kind_;
};

} // namespace perp
