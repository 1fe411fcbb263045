#pragma once

#include "types.hpp"
#include <deque>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace perp {

/**
 * Trade history query parameters. Time bounds are exclusive.
 */
struct TradeHistoryQuery {
    static constexpr size_t DEFAULT_LIMIT = 50;
    static constexpr size_t MAX_LIMIT = 100;

    std::optional<size_t> limit;
    std::optional<millis_t> before;
    std::optional<millis_t> after;

    // Defaults to 50, clamped to [1, 100]
    size_t effective_limit() const;
    bool matches_time(millis_t timestamp) const;
};

struct TradeHistoryResponse {
    std::vector<TradeEvent> trades;   // Newest first
    size_t total_count;
    bool has_more;

    TradeHistoryResponse() : total_count(0), has_more(false) {}
};

/**
 * Order history query parameters. A status of "all" matches every status.
 */
struct OrderHistoryQuery {
    std::optional<std::string> status;
    std::optional<std::string> symbol;
    std::optional<size_t> limit;
    std::optional<millis_t> before;
    std::optional<millis_t> after;

    size_t effective_limit() const;
    bool matches_status(OrderStatus order_status) const;
    bool matches_symbol(const std::string& order_symbol) const;
    bool matches_time(millis_t timestamp) const;
};

struct OrderHistoryResponse {
    std::vector<OrderRecord> orders;  // Newest first
    size_t total_count;
    bool has_more;

    OrderHistoryResponse() : total_count(0), has_more(false) {}
};

/**
 * Bounded in-memory history of recent trades per symbol and orders per user.
 * Oldest entries are evicted once a bucket exceeds its limit.
 */
class HistoryManager {
public:
    explicit HistoryManager(size_t max_trades_per_symbol = 1000, size_t max_orders_per_user = 1000);

    HistoryManager(const HistoryManager&) = delete;
    HistoryManager& operator=(const HistoryManager&) = delete;

    void record_trade(const TradeEvent& event);

    /**
     * Insert or replace by order id
     */
    void record_order(const OrderRecord& record);

    /**
     * Apply one maker-side fill: bumps filled amount, average fill price,
     * trade ids and status. Unknown ids are ignored.
     */
    void apply_fill(const OrderId& order_id, const Decimal& amount, const Decimal& price,
                    const TradeId& trade_id, millis_t timestamp);

    bool update_status(const OrderId& order_id, OrderStatus status, millis_t timestamp);

    std::optional<OrderRecord> find_order(const OrderId& order_id) const;

    TradeHistoryResponse get_trades(const std::string& symbol, const TradeHistoryQuery& query) const;
    OrderHistoryResponse get_orders(const std::string& user_address, const OrderHistoryQuery& query) const;

    size_t trade_count(const std::string& symbol) const;
    size_t order_count() const;

private:
    size_t max_trades_per_symbol_;
    size_t max_orders_per_user_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::deque<TradeEvent>> trades_by_symbol_;  // Newest at front
    std::unordered_map<OrderId, OrderRecord> orders_;
    std::unordered_map<std::string, std::deque<OrderId>> orders_by_user_;      // Newest at front
};

} // namespace perp
