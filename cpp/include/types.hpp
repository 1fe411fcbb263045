#pragma once

#include "decimal.hpp"
#include "price_level.hpp"
#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <optional>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_hash.hpp>

namespace perp {

// Timing and latency types
using timestamp_t = std::chrono::time_point<std::chrono::high_resolution_clock>;
using duration_us_t = std::chrono::microseconds;

// Exchange-facing timestamps are unix milliseconds
using millis_t = int64_t;

// Order and trade identifiers
using OrderId = boost::uuids::uuid;
using TradeId = boost::uuids::uuid;

// Order side enumeration
enum class Side : uint8_t {
    BUY = 0,
    SELL = 1
};

enum class OrderType : uint8_t {
    LIMIT = 0,
    MARKET = 1
};

// Only GTC is honoured by the matcher; IOC/FOK are accepted as values
enum class TimeInForce : uint8_t {
    GTC = 0,
    IOC = 1,
    FOK = 2
};

// Order status enumeration
enum class OrderStatus : uint8_t {
    PENDING = 0,
    OPEN = 1,
    PARTIALLY_FILLED = 2,
    FILLED = 3,
    CANCELLED = 4,
    REJECTED = 5
};

enum class PositionSide : uint8_t {
    LONG = 0,
    SHORT = 1
};

/**
 * Maker/taker fee rates applied to trade value (amount x price)
 */
struct FeeConfig {
    Decimal maker_fee_rate;
    Decimal taker_fee_rate;

    FeeConfig() : maker_fee_rate(Decimal::from_raw(2, 4)), taker_fee_rate(Decimal::from_raw(5, 4)) {}
    FeeConfig(Decimal maker, Decimal taker) : maker_fee_rate(maker), taker_fee_rate(taker) {}
};

/**
 * Resting order inside a price level queue
 */
struct OrderEntry {
    OrderId id;
    std::string user_address;
    Decimal price;
    Decimal original_amount;
    Decimal remaining_amount;
    Side side;
    TimeInForce time_in_force;
    millis_t timestamp;

    OrderEntry() : id(), side(Side::BUY), time_in_force(TimeInForce::GTC), timestamp(0) {}
};

/**
 * One fill between a resting maker and an incoming taker, at the maker's price
 */
struct TradeExecution {
    TradeId trade_id;
    OrderId maker_order_id;
    OrderId taker_order_id;
    std::string maker_address;
    std::string taker_address;
    Decimal price;
    Decimal amount;
    Decimal maker_fee;
    Decimal taker_fee;
    millis_t timestamp;

    TradeExecution() : trade_id(), maker_order_id(), taker_order_id(), timestamp(0) {}
};

/**
 * Broadcast form of a trade; side is the taker's side
 */
struct TradeEvent {
    std::string symbol;
    Side side;
    TradeExecution trade;

    TradeEvent() : side(Side::BUY) {}
    TradeEvent(std::string s, Side sd, TradeExecution t)
        : symbol(std::move(s)), side(sd), trade(std::move(t)) {}
};

/**
 * Outcome of one submission, owned by the caller
 */
struct MatchResult {
    OrderId order_id;
    OrderStatus status;
    Decimal filled_amount;
    Decimal remaining_amount;
    std::optional<Decimal> average_price;
    std::vector<TradeExecution> trades;

    MatchResult() : order_id(), status(OrderStatus::PENDING) {}
};

/**
 * Aggregated remaining amount at one price
 */
struct LevelSummary {
    Decimal price;
    Decimal amount;

    LevelSummary() = default;
    LevelSummary(Decimal p, Decimal a) : price(p), amount(a) {}
};

struct OrderbookSnapshot {
    std::string symbol;
    std::vector<LevelSummary> bids;    // Best (highest) first
    std::vector<LevelSummary> asks;    // Best (lowest) first
    std::optional<Decimal> last_price;
    millis_t timestamp;

    OrderbookSnapshot() : timestamp(0) {}
};

struct OrderbookUpdate {
    std::string symbol;
    std::vector<LevelSummary> bids;
    std::vector<LevelSummary> asks;
    millis_t timestamp;

    OrderbookUpdate() : timestamp(0) {}
};

/**
 * Durable view of an order, as kept in history and in the trade store
 */
struct OrderRecord {
    OrderId order_id;
    std::string user_address;
    std::string symbol;
    Side side;
    OrderType order_type;
    std::optional<Decimal> price;
    Decimal original_amount;
    Decimal filled_amount;
    OrderStatus status;
    uint32_t leverage;
    millis_t created_at;
    millis_t updated_at;
    std::optional<Decimal> average_fill_price;
    std::vector<TradeId> trade_ids;

    OrderRecord() : order_id(), side(Side::BUY), order_type(OrderType::LIMIT),
                    status(OrderStatus::PENDING), leverage(1), created_at(0), updated_at(0) {}

    Decimal remaining_amount() const { return original_amount - filled_amount; }
};

// =============================================================================
// UTILITY FUNCTIONS
// =============================================================================

inline timestamp_t now() {
    return std::chrono::high_resolution_clock::now();
}

inline millis_t now_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

inline double to_microseconds(const duration_us_t& duration) {
    return static_cast<double>(duration.count());
}

inline duration_us_t time_diff_us(timestamp_t start, timestamp_t end) {
    return std::chrono::duration_cast<duration_us_t>(end - start);
}

inline Side opposite(Side side) {
    return side == Side::BUY ? Side::SELL : Side::BUY;
}

// Random (v4) identifier for orders, trades and referral rows
OrderId generate_id();

std::string id_to_string(const OrderId& id);

// Throws std::runtime_error on malformed text
OrderId parse_id(const std::string& text);

std::string side_to_string(Side side);
std::string order_type_to_string(OrderType type);
std::string status_to_string(OrderStatus status);
std::string position_side_to_string(PositionSide side);

// The parse_* helpers throw MatchingError for unknown text
Side parse_side(const std::string& text);
OrderType parse_order_type(const std::string& text);
OrderStatus parse_status(const std::string& text);

bool is_terminal(OrderStatus status);

} // namespace perp
