#pragma once

#include "types.hpp"
#include <atomic>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace perp {

/**
 * Price-time priority order book for a single symbol.
 *
 * Each side is an ordered map of price level -> FIFO queue, guarded by its
 * own reader/writer lock. A separate index maps order id -> (side, level)
 * so a cancel finds its level directly and then scans only that level's
 * queue. When both are needed the side lock is always taken
 * before the index lock.
 *
 * Invariants:
 * - every indexed id resolves to exactly one queued entry
 * - no empty level is ever left in either map
 * - resting entries have 0 < remaining <= original
 */
class Orderbook {
public:
    explicit Orderbook(std::string symbol);
    ~Orderbook() = default;

    Orderbook(const Orderbook&) = delete;
    Orderbook& operator=(const Orderbook&) = delete;
    Orderbook(Orderbook&&) = delete;
    Orderbook& operator=(Orderbook&&) = delete;

    // =========================================================================
    // CORE OPERATIONS (CRITICAL PATH)
    // =========================================================================

    /**
     * Rest an entry at the tail of its price level. The caller validates
     * price and amount.
     */
    void add_order(OrderEntry entry);

    /**
     * Remove a resting order. Returns the entry as it was at removal time,
     * or nullopt when the id is unknown (already filled or cancelled).
     */
    std::optional<OrderEntry> cancel_order(const OrderId& order_id);

    /**
     * Walk the opposite side from the best price and fill `amount`.
     *
     * A limit stops at the first level beyond `limit_price`; a market order
     * (nullopt) stops only when the side is exhausted. Each fill executes at
     * the maker's price and is appended to `executions` in order.
     *
     * Returns the unfilled remainder of `amount`.
     */
    Decimal match_order(const OrderId& taker_id,
                        const std::string& taker_address,
                        Side side,
                        Decimal amount,
                        const std::optional<Decimal>& limit_price,
                        const FeeConfig& fee_config,
                        std::vector<TradeExecution>& executions);

    // =========================================================================
    // MARKET DATA ACCESS
    // =========================================================================

    /**
     * Aggregated levels, at most `depth` per side. Bids best (highest)
     * first, asks best (lowest) first.
     */
    OrderbookSnapshot snapshot(size_t depth) const;

    std::optional<Decimal> best_bid() const;
    std::optional<Decimal> best_ask() const;
    std::optional<Decimal> spread() const;
    std::optional<Decimal> last_trade_price() const;

    size_t bid_depth() const;
    size_t ask_depth() const;
    size_t order_count() const { return order_count_.load(std::memory_order_relaxed); }

    bool has_order(const OrderId& order_id) const;
    std::optional<OrderEntry> get_order(const OrderId& order_id) const;

    const std::string& symbol() const { return symbol_; }

private:
    using LevelQueue = std::deque<OrderEntry>;
    using BidBook = std::map<PriceLevel, LevelQueue, std::greater<PriceLevel>>;
    using AskBook = std::map<PriceLevel, LevelQueue, std::less<PriceLevel>>;

    struct IndexEntry {
        Side side;
        PriceLevel level;
    };

    template<typename Book>
    Decimal match_against(Book& book, Side taker_side, const OrderId& taker_id,
                          const std::string& taker_address, Decimal remaining,
                          const std::optional<Decimal>& limit_price,
                          const FeeConfig& fee_config,
                          std::vector<TradeExecution>& executions);

    template<typename Book>
    std::optional<OrderEntry> remove_from_level(Book& book, PriceLevel level, const OrderId& order_id);

    template<typename Book>
    static std::optional<OrderEntry> find_in_level(const Book& book, PriceLevel level, const OrderId& order_id);

    template<typename Book>
    static std::vector<LevelSummary> aggregate(const Book& book, size_t depth);

    static bool crosses(Side taker_side, const Decimal& level_price, const Decimal& limit_price);

    std::string symbol_;

    BidBook bids_;   // Highest first
    AskBook asks_;   // Lowest first
    mutable std::shared_mutex bids_mutex_;
    mutable std::shared_mutex asks_mutex_;

    std::unordered_map<OrderId, IndexEntry> index_;
    mutable std::mutex index_mutex_;

    // Raw PriceLevel of the last fill; 0 until the first trade
    std::atomic<int64_t> last_trade_price_;
    std::atomic<size_t> order_count_;
};

} // namespace perp
