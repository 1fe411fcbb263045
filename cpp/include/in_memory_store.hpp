#pragma once

#include "collaborators.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <tuple>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace perp {

/**
 * Process-local TradeStore. Also the state behind JournalTradeStore.
 */
class InMemoryTradeStore : public TradeStore {
public:
    InMemoryTradeStore() : fail_writes_(false) {}

    bool insert_trade(const TradeEvent& trade) override;
    void upsert_order(const OrderRecord& order) override;
    bool apply_maker_fill(const OrderId& order_id, const Decimal& amount, millis_t timestamp) override;
    bool update_order_status(const OrderId& order_id, OrderStatus status, millis_t timestamp) override;
    std::optional<uint32_t> find_order_leverage(const OrderId& order_id) const override;
    void insert_referral_earning(const ReferralEarning& earning) override;
    size_t write_batch(const TradeBatch& batch) override;
    std::vector<OrderRecord> load_open_orders() const override;

    // Inspection
    bool has_trade(const TradeId& trade_id) const;
    std::optional<TradeEvent> get_trade(const TradeId& trade_id) const;
    std::optional<OrderRecord> get_order(const OrderId& order_id) const;
    std::vector<ReferralEarning> referral_earnings() const;
    size_t trade_count() const;
    size_t order_count() const;

    /**
     * Make every subsequent write throw StoreError (outage simulation)
     */
    void set_fail_writes(bool fail) { fail_writes_.store(fail); }

private:
    void check_writable() const;

    mutable std::shared_mutex mutex_;
    std::unordered_map<TradeId, TradeEvent> trades_;
    std::vector<TradeId> trade_order_;
    std::unordered_map<OrderId, OrderRecord> orders_;
    std::vector<ReferralEarning> earnings_;
    std::unordered_set<boost::uuids::uuid> earning_ids_;
    std::atomic<bool> fail_writes_;
};

/**
 * Referrer lookup table keyed by lower-cased referee address
 */
class InMemoryReferralDirectory : public ReferralDirectory {
public:
    void add_referral(const std::string& referee_address, const std::string& referrer_address,
                      const Decimal& commission_rate);

    /**
     * Load [{"referee": ..., "referrer": ..., "commission_rate": "0.1"}, ...].
     * Throws std::runtime_error when the file cannot be read or parsed.
     */
    size_t load_from_file(const std::string& path);

    std::optional<Referrer> find_referrer(const std::string& user_address) const override;

    size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Referrer> referrers_;
};

/**
 * Aggregated position per (user, symbol, side)
 */
struct PositionState {
    Decimal size;              // Base amount
    Decimal collateral;
    Decimal entry_price;       // Size-weighted
    uint32_t leverage;
    size_t increases;

    PositionState() : leverage(1), increases(0) {}
};

/**
 * Minimal PositionService that accumulates increases in memory
 */
class PositionLedger : public PositionService {
public:
    void increase_position(const std::string& user_address,
                           const std::string& symbol,
                           PositionSide side,
                           const Decimal& collateral,
                           uint32_t leverage,
                           const Decimal& price,
                           bool skip_min_size) override;

    std::optional<PositionState> get_position(const std::string& user_address,
                                              const std::string& symbol,
                                              PositionSide side) const;

    size_t position_count() const;
    size_t increase_count() const;

private:
    using Key = std::tuple<std::string, std::string, PositionSide>;

    static constexpr int64_t MIN_POSITION_COLLATERAL = 10;

    mutable std::mutex mutex_;
    std::map<Key, PositionState> positions_;
    size_t increase_count_ = 0;
};

} // namespace perp
