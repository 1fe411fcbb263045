#include "history_manager.hpp"
#include <algorithm>
#include <mutex>

namespace perp {

// =============================================================================
// QUERY HELPERS
// =============================================================================

namespace {

size_t clamp_limit(const std::optional<size_t>& limit) {
    size_t value = limit.value_or(TradeHistoryQuery::DEFAULT_LIMIT);
    return std::max<size_t>(1, std::min(value, TradeHistoryQuery::MAX_LIMIT));
}

bool within_bounds(millis_t timestamp, const std::optional<millis_t>& before, const std::optional<millis_t>& after) {
    if (before && timestamp >= *before) {
        return false;
    }
    if (after && timestamp <= *after) {
        return false;
    }
    return true;
}

} // namespace

size_t TradeHistoryQuery::effective_limit() const {
    return clamp_limit(limit);
}

bool TradeHistoryQuery::matches_time(millis_t timestamp) const {
    return within_bounds(timestamp, before, after);
}

size_t OrderHistoryQuery::effective_limit() const {
    return clamp_limit(limit);
}

bool OrderHistoryQuery::matches_status(OrderStatus order_status) const {
    if (!status || *status == "all") {
        return true;
    }
    return *status == status_to_string(order_status);
}

bool OrderHistoryQuery::matches_symbol(const std::string& order_symbol) const {
    return !symbol || *symbol == order_symbol;
}

bool OrderHistoryQuery::matches_time(millis_t timestamp) const {
    return within_bounds(timestamp, before, after);
}

// =============================================================================
// RECORDING
// =============================================================================

HistoryManager::HistoryManager(size_t max_trades_per_symbol, size_t max_orders_per_user)
    : max_trades_per_symbol_(std::max<size_t>(1, max_trades_per_symbol))
    , max_orders_per_user_(std::max<size_t>(1, max_orders_per_user)) {}

void HistoryManager::record_trade(const TradeEvent& event) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& bucket = trades_by_symbol_[event.symbol];
    bucket.push_front(event);
    while (bucket.size() > max_trades_per_symbol_) {
        bucket.pop_back();
    }
}

void HistoryManager::record_order(const OrderRecord& record) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto existing = orders_.find(record.order_id);
    if (existing != orders_.end()) {
        existing->second = record;
        return;
    }

    orders_.emplace(record.order_id, record);
    auto& bucket = orders_by_user_[record.user_address];
    bucket.push_front(record.order_id);
    while (bucket.size() > max_orders_per_user_) {
        orders_.erase(bucket.back());
        bucket.pop_back();
    }
}

void HistoryManager::apply_fill(const OrderId& order_id, const Decimal& amount, const Decimal& price,
                                const TradeId& trade_id, millis_t timestamp) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = orders_.find(order_id);
    if (it == orders_.end()) {
        return;
    }

    OrderRecord& record = it->second;
    // A recovered row may carry earlier fills without their average; it stays unknown
    const bool average_known = record.average_fill_price || record.filled_amount.is_zero();
    const Decimal previous_value = record.average_fill_price
        ? *record.average_fill_price * record.filled_amount
        : Decimal();
    record.filled_amount += amount;
    if (average_known) {
        record.average_fill_price = (previous_value + price * amount) / record.filled_amount;
    }
    record.trade_ids.push_back(trade_id);
    record.status = record.filled_amount >= record.original_amount
        ? OrderStatus::FILLED
        : OrderStatus::PARTIALLY_FILLED;
    record.updated_at = timestamp;
}

bool HistoryManager::update_status(const OrderId& order_id, OrderStatus status, millis_t timestamp) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = orders_.find(order_id);
    if (it == orders_.end()) {
        return false;
    }
    it->second.status = status;
    it->second.updated_at = timestamp;
    return true;
}

// =============================================================================
// QUERIES
// =============================================================================

std::optional<OrderRecord> HistoryManager::find_order(const OrderId& order_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = orders_.find(order_id);
    if (it == orders_.end()) {
        return std::nullopt;
    }
    return it->second;
}

TradeHistoryResponse HistoryManager::get_trades(const std::string& symbol, const TradeHistoryQuery& query) const {
    TradeHistoryResponse response;
    const size_t limit = query.effective_limit();

    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto bucket = trades_by_symbol_.find(symbol);
    if (bucket == trades_by_symbol_.end()) {
        return response;
    }

    for (const auto& event : bucket->second) {
        if (!query.matches_time(event.trade.timestamp)) {
            continue;
        }
        ++response.total_count;
        if (response.trades.size() < limit) {
            response.trades.push_back(event);
        }
    }
    response.has_more = response.total_count > limit;
    return response;
}

OrderHistoryResponse HistoryManager::get_orders(const std::string& user_address, const OrderHistoryQuery& query) const {
    OrderHistoryResponse response;
    const size_t limit = query.effective_limit();

    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto bucket = orders_by_user_.find(user_address);
    if (bucket == orders_by_user_.end()) {
        return response;
    }

    for (const auto& order_id : bucket->second) {
        auto it = orders_.find(order_id);
        if (it == orders_.end()) {
            continue;
        }
        const OrderRecord& record = it->second;
        if (!query.matches_status(record.status) ||
            !query.matches_symbol(record.symbol) ||
            !query.matches_time(record.created_at)) {
            continue;
        }
        ++response.total_count;
        if (response.orders.size() < limit) {
            response.orders.push_back(record);
        }
    }
    response.has_more = response.total_count > limit;
    return response;
}

size_t HistoryManager::trade_count(const std::string& symbol) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto bucket = trades_by_symbol_.find(symbol);
    return bucket == trades_by_symbol_.end() ? 0 : bucket->second.size();
}

size_t HistoryManager::order_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return orders_.size();
}

} // namespace perp
