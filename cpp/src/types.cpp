#include "types.hpp"
#include "matching_error.hpp"
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace perp {

OrderId generate_id() {
    // random_generator is not thread-safe; one per thread
    thread_local boost::uuids::random_generator generator;
    return generator();
}

std::string id_to_string(const OrderId& id) {
    return boost::uuids::to_string(id);
}

OrderId parse_id(const std::string& text) {
    boost::uuids::string_generator parser;
    return parser(text);
}

std::string side_to_string(Side side) {
    return (side == Side::BUY) ? "buy" : "sell";
}

std::string order_type_to_string(OrderType type) {
    return (type == OrderType::LIMIT) ? "limit" : "market";
}

std::string status_to_string(OrderStatus status) {
    switch (status) {
        case OrderStatus::PENDING:          return "pending";
        case OrderStatus::OPEN:             return "open";
        case OrderStatus::PARTIALLY_FILLED: return "partially_filled";
        case OrderStatus::FILLED:           return "filled";
        case OrderStatus::CANCELLED:        return "cancelled";
        case OrderStatus::REJECTED:         return "rejected";
    }
    return "unknown";
}

std::string position_side_to_string(PositionSide side) {
    return (side == PositionSide::LONG) ? "long" : "short";
}

Side parse_side(const std::string& text) {
    if (text == "buy" || text == "BUY") return Side::BUY;
    if (text == "sell" || text == "SELL") return Side::SELL;
    throw MatchingError(MatchingErrorKind::INVALID_SIDE, text);
}

OrderType parse_order_type(const std::string& text) {
    if (text == "limit" || text == "LIMIT") return OrderType::LIMIT;
    if (text == "market" || text == "MARKET") return OrderType::MARKET;
    throw MatchingError(MatchingErrorKind::INTERNAL_ERROR, "unknown order type " + text);
}

OrderStatus parse_status(const std::string& text) {
    if (text == "pending") return OrderStatus::PENDING;
    if (text == "open") return OrderStatus::OPEN;
    if (text == "partially_filled") return OrderStatus::PARTIALLY_FILLED;
    if (text == "filled") return OrderStatus::FILLED;
    if (text == "cancelled") return OrderStatus::CANCELLED;
    if (text == "rejected") return OrderStatus::REJECTED;
    throw MatchingError(MatchingErrorKind::INTERNAL_ERROR, "unknown order status " + text);
}

bool is_terminal(OrderStatus status) {
    return status == OrderStatus::FILLED ||
           status == OrderStatus::CANCELLED ||
           status == OrderStatus::REJECTED;
}

} // namespace perp
