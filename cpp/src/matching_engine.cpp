#include "matching_engine.hpp"
#include "log_control.hpp"
#include <iostream>
#include <iomanip>

namespace perp {

// =============================================================================
// CONSTRUCTOR AND DESTRUCTOR
// =============================================================================

MatchingEngine::MatchingEngine(const SymbolRegistry& registry,
                               const FeeConfig& fee_config,
                               const EngineOptions& options)
    : registry_(registry)
    , fee_config_(fee_config)
    , options_(options)
    , trade_channel_(options.broadcast_capacity)
    , orderbook_channel_(options.broadcast_capacity)
    , history_(options.history_limit, options.history_limit)
    , orders_submitted_(0)
    , orders_rejected_(0)
    , orders_cancelled_(0)
    , trades_executed_(0) {

    for (const auto& symbol : registry_.symbols()) {
        books_.emplace(symbol, std::make_unique<Orderbook>(symbol));
        submit_mutexes_.emplace(symbol, std::make_unique<std::mutex>());
    }

    std::cout << kLogEngine << "Initialized with " << books_.size() << " symbols" << std::endl;
    std::cout << "  Maker fee rate: " << fee_config_.maker_fee_rate << std::endl;
    std::cout << "  Taker fee rate: " << fee_config_.taker_fee_rate << std::endl;
    std::cout << "  Broadcast capacity: " << options_.broadcast_capacity << std::endl;

    if (books_.empty()) {
        std::cerr << kLogEngine << "WARNING: no symbols configured, every order will be rejected" << std::endl;
    }
}

MatchingEngine::~MatchingEngine() {
    trade_channel_.close();
    orderbook_channel_.close();
    std::cout << kLogEngine << "Shutdown complete (" << trades_executed_.load()
              << " trades executed)" << std::endl;
}

// =============================================================================
// ORDER ENTRY (CRITICAL PATH)
// =============================================================================

void MatchingEngine::validate_submission(const std::string& symbol, OrderType order_type,
                                         const Decimal& amount, const std::optional<Decimal>& price) const {
    if (books_.find(symbol) == books_.end()) {
        throw MatchingError::symbol_not_found(symbol);
    }
    if (!amount.is_positive()) {
        throw MatchingError::invalid_amount(amount.to_string());
    }
    if (order_type == OrderType::MARKET) {
        return;
    }
    if (!price) {
        throw MatchingError::invalid_price("limit order requires a price");
    }
    if (!price->is_positive()) {
        throw MatchingError::invalid_price(price->to_string());
    }
    if (price->scale() > PriceLevel::SCALE_DIGITS) {
        throw MatchingError::invalid_price(price->to_string() + " is finer than the 1e-8 tick");
    }
    try {
        if (PriceLevel::from_decimal(*price).raw() == 0) {
            throw MatchingError::invalid_price(price->to_string() + " is below the 1e-8 tick");
        }
    } catch (const std::out_of_range&) {
        throw MatchingError::invalid_price(price->to_string() + " exceeds the supported range");
    }
}

MatchResult MatchingEngine::submit_order(const OrderId& order_id,
                                         const std::string& symbol,
                                         const std::string& user_address,
                                         Side side,
                                         OrderType order_type,
                                         const Decimal& amount,
                                         const std::optional<Decimal>& price,
                                         uint32_t leverage) {
    PERP_MEASURE_LATENCY(latency_tracker_, LatencyType::ORDER_SUBMISSION);

    validate_submission(symbol, order_type, amount, price);
    Orderbook& book = book_for(symbol);

    // Match and rest happen under one writer per symbol
    std::lock_guard<std::mutex> writer_lock(*submit_mutexes_.at(symbol));
    if (book.has_order(order_id)) {
        throw MatchingError::duplicate_order(id_to_string(order_id));
    }
    orders_submitted_.fetch_add(1, std::memory_order_relaxed);

    const millis_t submitted_at = now_millis();
    const std::optional<Decimal> limit_price =
        (order_type == OrderType::LIMIT) ? price : std::nullopt;

    MatchResult result;
    result.order_id = order_id;

    const Decimal remaining = book.match_order(order_id, user_address, side, amount,
                                               limit_price, fee_config_, result.trades);
    result.filled_amount = amount - remaining;
    result.remaining_amount = remaining;

    if (!result.trades.empty()) {
        Decimal notional;
        for (const auto& trade : result.trades) {
            notional += trade.price * trade.amount;
        }
        result.average_price = notional / result.filled_amount;
    }

    bool book_changed = !result.trades.empty();

    if (order_type == OrderType::MARKET) {
        // Market orders never rest; an unmatched remainder is dropped
        if (result.filled_amount.is_zero()) {
            result.status = OrderStatus::REJECTED;
        } else if (remaining.is_positive()) {
            result.status = OrderStatus::PARTIALLY_FILLED;
        } else {
            result.status = OrderStatus::FILLED;
        }
    } else if (!remaining.is_positive()) {
        result.status = OrderStatus::FILLED;
    } else {
        OrderEntry entry;
        entry.id = order_id;
        entry.user_address = user_address;
        entry.price = *limit_price;
        entry.original_amount = amount;
        entry.remaining_amount = remaining;
        entry.side = side;
        entry.time_in_force = TimeInForce::GTC;
        entry.timestamp = submitted_at;
        book.add_order(std::move(entry));

        book_changed = true;
        result.status = result.filled_amount.is_zero()
            ? OrderStatus::OPEN
            : OrderStatus::PARTIALLY_FILLED;
    }

    if (result.status == OrderStatus::REJECTED) {
        orders_rejected_.fetch_add(1, std::memory_order_relaxed);
        if constexpr (kEnableHotPathLogging) {
            std::cout << kLogEngine << "Market order " << id_to_string(order_id)
                      << " rejected: no liquidity on " << symbol << std::endl;
        }
    }

    // History goes first so trade subscribers can resolve both orders
    OrderRecord record;
    record.order_id = order_id;
    record.user_address = user_address;
    record.symbol = symbol;
    record.side = side;
    record.order_type = order_type;
    record.price = limit_price;
    record.original_amount = amount;
    record.filled_amount = result.filled_amount;
    record.status = result.status;
    record.leverage = leverage;
    record.created_at = submitted_at;
    record.updated_at = submitted_at;
    record.average_fill_price = result.average_price;
    for (const auto& trade : result.trades) {
        record.trade_ids.push_back(trade.trade_id);
    }
    history_.record_order(record);

    record_fills(symbol, side, result.trades);

    if (book_changed) {
        publish_orderbook(book);
    }
    return result;
}

void MatchingEngine::record_fills(const std::string& symbol, Side taker_side,
                                  const std::vector<TradeExecution>& trades) {
    if (trades.empty()) {
        return;
    }

    Decimal volume;
    Decimal notional;
    Decimal fees;
    for (const auto& trade : trades) {
        history_.apply_fill(trade.maker_order_id, trade.amount, trade.price, trade.trade_id, trade.timestamp);

        TradeEvent event(symbol, taker_side, trade);
        history_.record_trade(event);
        trade_channel_.send(std::move(event));

        volume += trade.amount;
        notional += trade.amount * trade.price;
        fees += trade.maker_fee + trade.taker_fee;
    }

    trades_executed_.fetch_add(trades.size(), std::memory_order_relaxed);
    std::lock_guard<std::mutex> lock(totals_mutex_);
    total_volume_ += volume;
    total_notional_ += notional;
    total_fees_ += fees;
}

void MatchingEngine::publish_orderbook(const Orderbook& book) {
    if (orderbook_channel_.receiver_count() == 0) {
        return;
    }
    OrderbookSnapshot snap = book.snapshot(options_.orderbook_broadcast_depth);

    OrderbookUpdate update;
    update.symbol = std::move(snap.symbol);
    update.bids = std::move(snap.bids);
    update.asks = std::move(snap.asks);
    update.timestamp = snap.timestamp;
    orderbook_channel_.send(std::move(update));
}

bool MatchingEngine::cancel_order(const std::string& symbol, const OrderId& order_id,
                                  const std::string& /* user_address */) {
    PERP_MEASURE_LATENCY(latency_tracker_, LatencyType::ORDER_CANCELLATION);

    Orderbook& book = book_for(symbol);
    std::optional<OrderEntry> removed = book.cancel_order(order_id);
    if (!removed) {
        return false;
    }

    orders_cancelled_.fetch_add(1, std::memory_order_relaxed);
    history_.update_status(order_id, OrderStatus::CANCELLED, now_millis());
    publish_orderbook(book);
    return true;
}

OrderbookSnapshot MatchingEngine::get_orderbook(const std::string& symbol, size_t depth) const {
    PERP_MEASURE_LATENCY(latency_tracker_, LatencyType::ORDERBOOK_SNAPSHOT);
    return book_for(symbol).snapshot(depth);
}

TradeReceiver MatchingEngine::subscribe_trades() {
    return trade_channel_.subscribe();
}

OrderbookReceiver MatchingEngine::subscribe_orderbook() {
    return orderbook_channel_.subscribe();
}

// =============================================================================
// RECOVERY
// =============================================================================

size_t MatchingEngine::recover_orders(const std::vector<OrderRecord>& open_orders) {
    size_t recovered = 0;
    size_t skipped = 0;

    for (const auto& record : open_orders) {
        const std::string symbol = SymbolRegistry::normalize(record.symbol);
        auto book_it = books_.find(symbol);
        if (book_it == books_.end()) {
            std::cerr << kLogEngine << "WARNING: skipping order " << id_to_string(record.order_id)
                      << " for unknown symbol " << record.symbol << std::endl;
            ++skipped;
            continue;
        }

        const Decimal remaining = record.remaining_amount();
        if (record.order_type != OrderType::LIMIT || !record.price || !record.price->is_positive() ||
            record.price->scale() > PriceLevel::SCALE_DIGITS ||
            is_terminal(record.status) || !remaining.is_positive()) {
            ++skipped;
            continue;
        }

        Orderbook& book = *book_it->second;
        if (book.has_order(record.order_id)) {
            ++skipped;
            continue;
        }

        try {
            PriceLevel::from_decimal(*record.price);
        } catch (const std::out_of_range& e) {
            std::cerr << kLogEngine << "WARNING: skipping order " << id_to_string(record.order_id)
                      << ": " << e.what() << std::endl;
            ++skipped;
            continue;
        }

        OrderEntry entry;
        entry.id = record.order_id;
        entry.user_address = record.user_address;
        entry.price = *record.price;
        entry.original_amount = record.original_amount;
        entry.remaining_amount = remaining;
        entry.side = record.side;
        entry.time_in_force = TimeInForce::GTC;
        entry.timestamp = record.created_at;
        book.add_order(std::move(entry));

        OrderRecord restored = record;
        restored.symbol = symbol;
        history_.record_order(restored);
        ++recovered;
    }

    std::cout << kLogEngine << "Recovered " << recovered << " open orders";
    if (skipped > 0) {
        std::cout << " (skipped " << skipped << ")";
    }
    std::cout << std::endl;
    return recovered;
}

// =============================================================================
// QUERIES
// =============================================================================

Orderbook& MatchingEngine::book_for(const std::string& symbol) {
    auto it = books_.find(symbol);
    if (it == books_.end()) {
        throw MatchingError::symbol_not_found(symbol);
    }
    return *it->second;
}

const Orderbook& MatchingEngine::book_for(const std::string& symbol) const {
    auto it = books_.find(symbol);
    if (it == books_.end()) {
        throw MatchingError::symbol_not_found(symbol);
    }
    return *it->second;
}

const Orderbook& MatchingEngine::orderbook(const std::string& symbol) const {
    return book_for(symbol);
}

bool MatchingEngine::is_valid_symbol(const std::string& symbol) const {
    return books_.find(symbol) != books_.end();
}

TradeHistoryResponse MatchingEngine::get_trades(const std::string& symbol, const TradeHistoryQuery& query) const {
    if (!is_valid_symbol(symbol)) {
        throw MatchingError::symbol_not_found(symbol);
    }
    return history_.get_trades(symbol, query);
}

OrderHistoryResponse MatchingEngine::get_orders(const std::string& user_address, const OrderHistoryQuery& query) const {
    return history_.get_orders(user_address, query);
}

std::optional<OrderRecord> MatchingEngine::find_order(const OrderId& order_id) const {
    return history_.find_order(order_id);
}

EngineStats MatchingEngine::get_stats() const {
    EngineStats stats;
    stats.orders_submitted = orders_submitted_.load(std::memory_order_relaxed);
    stats.orders_rejected = orders_rejected_.load(std::memory_order_relaxed);
    stats.orders_cancelled = orders_cancelled_.load(std::memory_order_relaxed);
    stats.trades_executed = trades_executed_.load(std::memory_order_relaxed);
    {
        std::lock_guard<std::mutex> lock(totals_mutex_);
        stats.total_volume = total_volume_;
        stats.total_notional = total_notional_;
        stats.total_fees = total_fees_;
    }

    for (const auto& symbol : registry_.symbols()) {
        const Orderbook& book = book_for(symbol);
        SymbolStats symbol_stats;
        symbol_stats.symbol = symbol;
        symbol_stats.resting_orders = book.order_count();
        symbol_stats.bid_levels = book.bid_depth();
        symbol_stats.ask_levels = book.ask_depth();
        symbol_stats.best_bid = book.best_bid();
        symbol_stats.best_ask = book.best_ask();
        symbol_stats.last_price = book.last_trade_price();
        stats.symbols.push_back(std::move(symbol_stats));
    }
    return stats;
}

void MatchingEngine::print_performance_report() const {
    EngineStats stats = get_stats();

    std::cout << "\n=== MATCHING ENGINE REPORT ===" << std::endl;
    std::cout << "  Orders submitted: " << stats.orders_submitted << std::endl;
    std::cout << "  Orders rejected:  " << stats.orders_rejected << std::endl;
    std::cout << "  Orders cancelled: " << stats.orders_cancelled << std::endl;
    std::cout << "  Trades executed:  " << stats.trades_executed << std::endl;
    std::cout << "  Volume:           " << stats.total_volume << std::endl;
    std::cout << "  Notional:         " << stats.total_notional << std::endl;
    std::cout << "  Fees collected:   " << stats.total_fees << std::endl;

    std::cout << std::left;
    for (const auto& s : stats.symbols) {
        std::cout << "  " << std::setw(10) << s.symbol
                  << " resting=" << s.resting_orders
                  << " levels=" << s.bid_levels << "/" << s.ask_levels
                  << " bid=" << (s.best_bid ? s.best_bid->to_string() : "-")
                  << " ask=" << (s.best_ask ? s.best_ask->to_string() : "-")
                  << " last=" << (s.last_price ? s.last_price->to_string() : "-") << std::endl;
    }
    std::cout << std::right;

    latency_tracker_.print_latency_report();
}

} // namespace perp
