#pragma once

#include "types.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace perp {

/**
 * Thrown by TradeStore implementations on any write/read failure
 */
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Pending commission owed to a referrer for one side of one trade
 */
struct ReferralEarning {
    boost::uuids::uuid id;
    std::string referrer_address;
    std::string referee_address;
    TradeId trade_id;
    std::string event_type;     // "trade"
    Decimal volume;             // Trade value (amount x price)
    Decimal commission;         // fee x commission rate
    std::string token;          // "USDT"
    std::string status;         // "pending"
    millis_t created_at;

    ReferralEarning() : id(), trade_id(), event_type("trade"), token("USDT"),
                        status("pending"), created_at(0) {}
};

/**
 * One trade plus the earnings derived from it, written atomically
 */
struct TradeBatch {
    std::vector<TradeEvent> trades;
    std::vector<ReferralEarning> earnings;
};

/**
 * Durable trade / order / referral-earning table
 */
class TradeStore {
public:
    virtual ~TradeStore() = default;

    /**
     * Returns false when a trade with the same id already exists
     */
    virtual bool insert_trade(const TradeEvent& trade) = 0;

    virtual void upsert_order(const OrderRecord& order) = 0;

    /**
     * Add `amount` to the maker row's filled amount and derive its status
     * (filled once filled >= original, otherwise partially_filled).
     * Returns false if the order row is unknown.
     */
    virtual bool apply_maker_fill(const OrderId& order_id, const Decimal& amount, millis_t timestamp) = 0;

    virtual bool update_order_status(const OrderId& order_id, OrderStatus status, millis_t timestamp) = 0;

    virtual std::optional<uint32_t> find_order_leverage(const OrderId& order_id) const = 0;

    virtual void insert_referral_earning(const ReferralEarning& earning) = 0;

    /**
     * All-or-nothing write; returns the number of trades newly inserted
     */
    virtual size_t write_batch(const TradeBatch& batch) = 0;

    /**
     * Orders with status open or partially_filled, oldest first
     */
    virtual std::vector<OrderRecord> load_open_orders() const = 0;
};

/**
 * Opaque position bookkeeping owned by the settlement side
 */
class PositionService {
public:
    virtual ~PositionService() = default;

    virtual void increase_position(const std::string& user_address,
                                   const std::string& symbol,
                                   PositionSide side,
                                   const Decimal& collateral,
                                   uint32_t leverage,
                                   const Decimal& price,
                                   bool skip_min_size) = 0;
};

struct Referrer {
    std::string address;
    Decimal commission_rate;
};

class ReferralDirectory {
public:
    virtual ~ReferralDirectory() = default;

    /**
     * Keyed by the referee's lower-cased address
     */
    virtual std::optional<Referrer> find_referrer(const std::string& user_address) const = 0;
};

} // namespace perp
