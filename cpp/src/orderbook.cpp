#include "orderbook.hpp"
#include "log_control.hpp"
#include <algorithm>
#include <iostream>

namespace perp {

// =============================================================================
// CONSTRUCTOR
// =============================================================================

Orderbook::Orderbook(std::string symbol)
    : symbol_(std::move(symbol))
    , last_trade_price_(0)
    , order_count_(0) {

    constexpr size_t INITIAL_ORDER_CAPACITY = 10000;
    index_.reserve(INITIAL_ORDER_CAPACITY);

    std::cout << kLogOrderBook << "Initialized order book for symbol: " << symbol_ << std::endl;
}

// =============================================================================
// CORE ORDER BOOK OPERATIONS (CRITICAL PATH)
// =============================================================================

void Orderbook::add_order(OrderEntry entry) {
    const PriceLevel level = PriceLevel::from_decimal(entry.price);
    const OrderId id = entry.id;
    const Side side = entry.side;

    if (side == Side::BUY) {
        std::unique_lock<std::shared_mutex> side_lock(bids_mutex_);
        bids_[level].push_back(std::move(entry));
        std::lock_guard<std::mutex> index_lock(index_mutex_);
        index_[id] = IndexEntry{side, level};
    } else {
        std::unique_lock<std::shared_mutex> side_lock(asks_mutex_);
        asks_[level].push_back(std::move(entry));
        std::lock_guard<std::mutex> index_lock(index_mutex_);
        index_[id] = IndexEntry{side, level};
    }
    order_count_.fetch_add(1, std::memory_order_relaxed);
}

std::optional<OrderEntry> Orderbook::cancel_order(const OrderId& order_id) {
    IndexEntry location;
    {
        std::lock_guard<std::mutex> index_lock(index_mutex_);
        auto it = index_.find(order_id);
        if (it == index_.end()) {
            return std::nullopt;
        }
        location = it->second;
        index_.erase(it);
    }

    // A concurrent match may have consumed the entry between the two locks;
    // in that case the level no longer holds it and the cancel loses.
    std::optional<OrderEntry> removed;
    if (location.side == Side::BUY) {
        std::unique_lock<std::shared_mutex> side_lock(bids_mutex_);
        removed = remove_from_level(bids_, location.level, order_id);
    } else {
        std::unique_lock<std::shared_mutex> side_lock(asks_mutex_);
        removed = remove_from_level(asks_, location.level, order_id);
    }
    return removed;
}

Decimal Orderbook::match_order(const OrderId& taker_id,
                               const std::string& taker_address,
                               Side side,
                               Decimal amount,
                               const std::optional<Decimal>& limit_price,
                               const FeeConfig& fee_config,
                               std::vector<TradeExecution>& executions) {
    if (side == Side::BUY) {
        std::unique_lock<std::shared_mutex> side_lock(asks_mutex_);
        return match_against(asks_, side, taker_id, taker_address, amount,
                             limit_price, fee_config, executions);
    }
    std::unique_lock<std::shared_mutex> side_lock(bids_mutex_);
    return match_against(bids_, side, taker_id, taker_address, amount,
                         limit_price, fee_config, executions);
}

bool Orderbook::crosses(Side taker_side, const Decimal& level_price, const Decimal& limit_price) {
    return taker_side == Side::BUY ? level_price <= limit_price : level_price >= limit_price;
}

template<typename Book>
Decimal Orderbook::match_against(Book& book, Side taker_side, const OrderId& taker_id,
                                 const std::string& taker_address, Decimal remaining,
                                 const std::optional<Decimal>& limit_price,
                                 const FeeConfig& fee_config,
                                 std::vector<TradeExecution>& executions) {
    auto level_it = book.begin();
    while (remaining.is_positive() && level_it != book.end()) {
        if (limit_price && !crosses(taker_side, level_it->first.to_decimal(), *limit_price)) {
            break;
        }

        LevelQueue& queue = level_it->second;
        while (remaining.is_positive() && !queue.empty()) {
            OrderEntry& maker = queue.front();
            const Decimal trade_amount = std::min(remaining, maker.remaining_amount);
            const Decimal trade_value = trade_amount * maker.price;

            TradeExecution execution;
            execution.trade_id = generate_id();
            execution.maker_order_id = maker.id;
            execution.taker_order_id = taker_id;
            execution.maker_address = maker.user_address;
            execution.taker_address = taker_address;
            execution.price = maker.price;
            execution.amount = trade_amount;
            execution.maker_fee = trade_value * fee_config.maker_fee_rate;
            execution.taker_fee = trade_value * fee_config.taker_fee_rate;
            execution.timestamp = now_millis();

            remaining -= trade_amount;
            maker.remaining_amount -= trade_amount;
            last_trade_price_.store(PriceLevel::from_decimal(maker.price).raw(), std::memory_order_relaxed);

            if constexpr (kEnableHotPathLogging) {
                std::cout << kLogOrderBook << symbol_ << " fill " << trade_amount
                          << " @ " << maker.price << std::endl;
            }

            if (!maker.remaining_amount.is_positive()) {
                {
                    std::lock_guard<std::mutex> index_lock(index_mutex_);
                    index_.erase(maker.id);
                }
                queue.pop_front();
                order_count_.fetch_sub(1, std::memory_order_relaxed);
            }

            executions.push_back(std::move(execution));
        }

        if (queue.empty()) {
            level_it = book.erase(level_it);
        } else {
            ++level_it;
        }
    }
    return remaining;
}

template<typename Book>
std::optional<OrderEntry> Orderbook::remove_from_level(Book& book, PriceLevel level, const OrderId& order_id) {
    auto level_it = book.find(level);
    if (level_it == book.end()) {
        return std::nullopt;
    }

    LevelQueue& queue = level_it->second;
    auto entry_it = std::find_if(queue.begin(), queue.end(),
                                 [&order_id](const OrderEntry& e) { return e.id == order_id; });
    if (entry_it == queue.end()) {
        return std::nullopt;
    }

    OrderEntry removed = std::move(*entry_it);
    queue.erase(entry_it);
    if (queue.empty()) {
        book.erase(level_it);
    }
    order_count_.fetch_sub(1, std::memory_order_relaxed);
    return removed;
}

// =============================================================================
// MARKET DATA ACCESS
// =============================================================================

template<typename Book>
std::optional<OrderEntry> Orderbook::find_in_level(const Book& book, PriceLevel level, const OrderId& order_id) {
    auto level_it = book.find(level);
    if (level_it == book.end()) {
        return std::nullopt;
    }
    for (const auto& entry : level_it->second) {
        if (entry.id == order_id) {
            return entry;
        }
    }
    return std::nullopt;
}

template<typename Book>
std::vector<LevelSummary> Orderbook::aggregate(const Book& book, size_t depth) {
    std::vector<LevelSummary> levels;
    levels.reserve(std::min(depth, book.size()));
    for (auto it = book.begin(); it != book.end() && levels.size() < depth; ++it) {
        Decimal total;
        for (const auto& entry : it->second) {
            total += entry.remaining_amount;
        }
        levels.emplace_back(it->first.to_decimal(), total);
    }
    return levels;
}

OrderbookSnapshot Orderbook::snapshot(size_t depth) const {
    OrderbookSnapshot snap;
    snap.symbol = symbol_;
    {
        std::shared_lock<std::shared_mutex> lock(bids_mutex_);
        snap.bids = aggregate(bids_, depth);
    }
    {
        std::shared_lock<std::shared_mutex> lock(asks_mutex_);
        snap.asks = aggregate(asks_, depth);
    }
    snap.last_price = last_trade_price();
    snap.timestamp = now_millis();
    return snap;
}

std::optional<Decimal> Orderbook::best_bid() const {
    std::shared_lock<std::shared_mutex> lock(bids_mutex_);
    if (bids_.empty()) {
        return std::nullopt;
    }
    return bids_.begin()->first.to_decimal();
}

std::optional<Decimal> Orderbook::best_ask() const {
    std::shared_lock<std::shared_mutex> lock(asks_mutex_);
    if (asks_.empty()) {
        return std::nullopt;
    }
    return asks_.begin()->first.to_decimal();
}

std::optional<Decimal> Orderbook::spread() const {
    auto bid = best_bid();
    auto ask = best_ask();
    if (!bid || !ask) {
        return std::nullopt;
    }
    return *ask - *bid;
}

std::optional<Decimal> Orderbook::last_trade_price() const {
    int64_t raw = last_trade_price_.load(std::memory_order_relaxed);
    if (raw == 0) {
        return std::nullopt;
    }
    return PriceLevel(raw).to_decimal();
}

size_t Orderbook::bid_depth() const {
    std::shared_lock<std::shared_mutex> lock(bids_mutex_);
    return bids_.size();
}

size_t Orderbook::ask_depth() const {
    std::shared_lock<std::shared_mutex> lock(asks_mutex_);
    return asks_.size();
}

bool Orderbook::has_order(const OrderId& order_id) const {
    std::lock_guard<std::mutex> lock(index_mutex_);
    return index_.count(order_id) > 0;
}

std::optional<OrderEntry> Orderbook::get_order(const OrderId& order_id) const {
    IndexEntry location;
    {
        std::lock_guard<std::mutex> lock(index_mutex_);
        auto it = index_.find(order_id);
        if (it == index_.end()) {
            return std::nullopt;
        }
        location = it->second;
    }
    if (location.side == Side::BUY) {
        std::shared_lock<std::shared_mutex> lock(bids_mutex_);
        return find_in_level(bids_, location.level, order_id);
    }
    std::shared_lock<std::shared_mutex> lock(asks_mutex_);
    return find_in_level(asks_, location.level, order_id);
}

} // namespace perp
