#pragma once

#include "types.hpp"
#include "orderbook.hpp"
#include "symbol_registry.hpp"
#include "broadcast_channel.hpp"
#include "history_manager.hpp"
#include "latency_tracker.hpp"
#include "matching_error.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace perp {

using TradeReceiver = BroadcastChannel<TradeEvent>::Receiver;
using OrderbookReceiver = BroadcastChannel<OrderbookUpdate>::Receiver;

/**
 * Engine tuning, normally filled from EngineConfig
 */
struct EngineOptions {
    size_t broadcast_capacity;          // Ring size of each broadcast channel
    size_t orderbook_broadcast_depth;   // Levels per side in OrderbookUpdate
    size_t history_limit;               // Trades per symbol / orders per user kept

    EngineOptions() : broadcast_capacity(10000), orderbook_broadcast_depth(20), history_limit(1000) {}
};

struct SymbolStats {
    std::string symbol;
    size_t resting_orders;
    size_t bid_levels;
    size_t ask_levels;
    std::optional<Decimal> best_bid;
    std::optional<Decimal> best_ask;
    std::optional<Decimal> last_price;

    SymbolStats() : resting_orders(0), bid_levels(0), ask_levels(0) {}
};

struct EngineStats {
    uint64_t orders_submitted;
    uint64_t orders_rejected;
    uint64_t orders_cancelled;
    uint64_t trades_executed;
    Decimal total_volume;       // Sum of trade amounts
    Decimal total_notional;     // Sum of amount x price
    Decimal total_fees;         // Maker + taker
    std::vector<SymbolStats> symbols;

    EngineStats() : orders_submitted(0), orders_rejected(0), orders_cancelled(0), trades_executed(0) {}
};

/**
 * Owns one Orderbook per registered symbol and turns submissions into
 * MatchResults, trade events and book updates.
 *
 * Matching is synchronous and performs no I/O; downstream consumers
 * (persistence, WebSocket fan-out) subscribe to the broadcast channels.
 * Delivery on those channels is lossy under load.
 */
class MatchingEngine {
public:
    MatchingEngine(const SymbolRegistry& registry,
                   const FeeConfig& fee_config = FeeConfig(),
                   const EngineOptions& options = EngineOptions());
    ~MatchingEngine();

    MatchingEngine(const MatchingEngine&) = delete;
    MatchingEngine& operator=(const MatchingEngine&) = delete;
    MatchingEngine(MatchingEngine&&) = delete;
    MatchingEngine& operator=(MatchingEngine&&) = delete;

    // =========================================================================
    // ORDER ENTRY (CRITICAL PATH)
    // =========================================================================

    /**
     * Validate, match and (for limit orders) rest the remainder.
     *
     * Throws MatchingError before touching the book when the symbol is
     * unknown, the amount is not positive, or a limit order has no price, a
     * non-positive price, a price finer than the 1e-8 tick or a price beyond
     * the PriceLevel range. A market order's price is ignored. An id that is
     * already resting in the book is rejected as INTERNAL_ERROR.
     *
     * Submissions on one symbol are serialized; different symbols proceed in
     * parallel.
     */
    MatchResult submit_order(const OrderId& order_id,
                             const std::string& symbol,
                             const std::string& user_address,
                             Side side,
                             OrderType order_type,
                             const Decimal& amount,
                             const std::optional<Decimal>& price,
                             uint32_t leverage);

    /**
     * Remove a resting order. Ownership by `user_address` is the caller's
     * check; the engine does not re-verify it. Returns false when the order
     * is not resting (unknown, filled or already cancelled).
     */
    bool cancel_order(const std::string& symbol, const OrderId& order_id, const std::string& user_address);

    OrderbookSnapshot get_orderbook(const std::string& symbol, size_t depth) const;

    TradeReceiver subscribe_trades();
    OrderbookReceiver subscribe_orderbook();

    /**
     * Startup rehydration of resting limit orders from durable records.
     * Records for unknown symbols, market orders, terminal statuses, prices
     * finer than the tick, or with nothing left to fill are skipped. Returns the number of orders rested.
     */
    size_t recover_orders(const std::vector<OrderRecord>& open_orders);

    // =========================================================================
    // QUERIES
    // =========================================================================

    bool is_valid_symbol(const std::string& symbol) const;
    const std::vector<std::string>& symbols() const { return registry_.symbols(); }
    const FeeConfig& fee_config() const { return fee_config_; }

    const Orderbook& orderbook(const std::string& symbol) const;

    TradeHistoryResponse get_trades(const std::string& symbol, const TradeHistoryQuery& query) const;
    OrderHistoryResponse get_orders(const std::string& user_address, const OrderHistoryQuery& query) const;
    std::optional<OrderRecord> find_order(const OrderId& order_id) const;

    EngineStats get_stats() const;
    const LatencyTracker& latency_tracker() const { return latency_tracker_; }

    void print_performance_report() const;

private:
    Orderbook& book_for(const std::string& symbol);
    const Orderbook& book_for(const std::string& symbol) const;

    void validate_submission(const std::string& symbol, OrderType order_type,
                             const Decimal& amount, const std::optional<Decimal>& price) const;

    void publish_orderbook(const Orderbook& book);
    void record_fills(const std::string& symbol, Side taker_side, const std::vector<TradeExecution>& trades);

    const SymbolRegistry& registry_;
    FeeConfig fee_config_;
    EngineOptions options_;

    // Fixed after construction; read without locking
    std::unordered_map<std::string, std::unique_ptr<Orderbook>> books_;
    std::unordered_map<std::string, std::unique_ptr<std::mutex>> submit_mutexes_;

    BroadcastChannel<TradeEvent> trade_channel_;
    BroadcastChannel<OrderbookUpdate> orderbook_channel_;

    HistoryManager history_;
    mutable LatencyTracker latency_tracker_;

    std::atomic<uint64_t> orders_submitted_;
    std::atomic<uint64_t> orders_rejected_;
    std::atomic<uint64_t> orders_cancelled_;
    std::atomic<uint64_t> trades_executed_;

    mutable std::mutex totals_mutex_;
    Decimal total_volume_;
    Decimal total_notional_;
    Decimal total_fees_;
};

} // namespace perp
