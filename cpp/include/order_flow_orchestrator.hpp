#pragma once

#include "types.hpp"
#include "matching_engine.hpp"
#include "collaborators.hpp"
#include "task_executor.hpp"
#include "latency_tracker.hpp"
#include <atomic>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace perp {

struct OrchestratorStats {
    uint64_t trades_persisted;
    uint64_t trades_duplicate;
    uint64_t trade_failures;
    uint64_t position_updates;
    uint64_t position_failures;
    uint64_t referral_earnings;
    uint64_t orders_persisted;
    uint64_t order_failures;
    uint64_t lagged_messages;

    OrchestratorStats()
        : trades_persisted(0), trades_duplicate(0), trade_failures(0),
          position_updates(0), position_failures(0), referral_earnings(0),
          orders_persisted(0), order_failures(0), lagged_messages(0) {}
};

/**
 * Glue between the in-memory MatchingEngine and the durable collaborators.
 *
 * Matching stays synchronous; everything that touches a store runs on the
 * TaskExecutor or on the trade persistence worker. Persistence failures are
 * logged and counted and never roll back a match that already happened.
 * The worker reads from the lossy trade channel, so a lagging worker loses
 * trades (reported as "lagged N messages").
 */
class OrderFlowOrchestrator {
public:
    OrderFlowOrchestrator(MatchingEngine& engine,
                          TradeStore& store,
                          PositionService& positions,
                          const ReferralDirectory& referrals,
                          TaskExecutor& executor);
    ~OrderFlowOrchestrator();

    OrderFlowOrchestrator(const OrderFlowOrchestrator&) = delete;
    OrderFlowOrchestrator& operator=(const OrderFlowOrchestrator&) = delete;

    // =========================================================================
    // PERSISTENCE WORKER
    // =========================================================================

    /**
     * Subscribes to the engine's trade channel on the calling thread, then
     * hands the receiver to a background thread. No-op if already running.
     */
    void start_persistence_worker();

    /**
     * Stops the worker after draining whatever is already buffered
     */
    void stop();

    bool is_running() const { return running_.load(); }

    /**
     * Persist one trade and its side effects (positions, referral
     * commissions). Throws StoreError only when the trade row itself cannot
     * be written.
     */
    void persist_trade(const TradeEvent& event);

    /**
     * All-or-nothing write of trades plus their referral earnings.
     * Positions are not touched. Throws MatchingError(DATABASE_ERROR).
     */
    size_t batch_persist_trades(const std::vector<TradeEvent>& events);

    // =========================================================================
    // ORDER FLOW
    // =========================================================================

    MatchResult process_order(const std::string& symbol,
                              const std::string& user_address,
                              Side side,
                              OrderType order_type,
                              const Decimal& amount,
                              const std::optional<Decimal>& price,
                              uint32_t leverage);

    bool cancel_order(const std::string& symbol, const OrderId& order_id, const std::string& user_address);

    /**
     * Rest every open order from the store in the engine. Run once, before
     * any order flow.
     */
    size_t recover_open_orders();

    OrderbookSnapshot get_orderbook(const std::string& symbol, size_t depth) const;
    TradeHistoryResponse get_trades(const std::string& symbol, const TradeHistoryQuery& query) const;
    OrderHistoryResponse get_orders(const std::string& user_address, const OrderHistoryQuery& query) const;

    OrchestratorStats get_stats() const;
    const LatencyTracker& latency_tracker() const { return latency_tracker_; }

private:
    void persistence_loop(TradeReceiver receiver);
    void handle_received(const TradeEvent& event);

    TradeEvent with_fees(const TradeEvent& event) const;
    std::optional<uint32_t> lookup_leverage(const OrderId& order_id) const;
    void update_position(const std::string& user_address, const std::string& symbol,
                         PositionSide side, const OrderId& order_id, const TradeExecution& trade);
    std::optional<ReferralEarning> referral_for(const std::string& user_address, const Decimal& fee,
                                                const TradeExecution& trade) const;

    void persist_order(const OrderRecord& record, const std::vector<TradeExecution>& trades);
    void persist_cancel(const OrderId& order_id, millis_t timestamp);

    MatchingEngine& engine_;
    TradeStore& store_;
    PositionService& positions_;
    const ReferralDirectory& referrals_;
    TaskExecutor& executor_;

    std::atomic<bool> running_;
    std::thread worker_;
    LatencyTracker latency_tracker_;

    std::atomic<uint64_t> trades_persisted_;
    std::atomic<uint64_t> trades_duplicate_;
    std::atomic<uint64_t> trade_failures_;
    std::atomic<uint64_t> position_updates_;
    std::atomic<uint64_t> position_failures_;
    std::atomic<uint64_t> referral_earnings_;
    std::atomic<uint64_t> orders_persisted_;
    std::atomic<uint64_t> order_failures_;
    std::atomic<uint64_t> lagged_messages_;
};

} // namespace perp
