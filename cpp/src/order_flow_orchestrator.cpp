#include "order_flow_orchestrator.hpp"
#include "symbol_registry.hpp"
#include "log_control.hpp"
#include <chrono>
#include <iostream>

namespace perp {

namespace {

constexpr auto kWorkerPollInterval = std::chrono::milliseconds(100);

PositionSide position_side_for(Side side) {
    return side == Side::BUY ? PositionSide::LONG : PositionSide::SHORT;
}

} // namespace

// =============================================================================
// CONSTRUCTOR AND DESTRUCTOR
// =============================================================================

OrderFlowOrchestrator::OrderFlowOrchestrator(MatchingEngine& engine,
                                             TradeStore& store,
                                             PositionService& positions,
                                             const ReferralDirectory& referrals,
                                             TaskExecutor& executor)
    : engine_(engine)
    , store_(store)
    , positions_(positions)
    , referrals_(referrals)
    , executor_(executor)
    , running_(false)
    , trades_persisted_(0)
    , trades_duplicate_(0)
    , trade_failures_(0)
    , position_updates_(0)
    , position_failures_(0)
    , referral_earnings_(0)
    , orders_persisted_(0)
    , order_failures_(0)
    , lagged_messages_(0) {
}

OrderFlowOrchestrator::~OrderFlowOrchestrator() {
    stop();
}

// =============================================================================
// PERSISTENCE WORKER
// =============================================================================

void OrderFlowOrchestrator::start_persistence_worker() {
    if (running_.exchange(true)) {
        return;
    }

    TradeReceiver receiver = engine_.subscribe_trades();
    worker_ = std::thread(&OrderFlowOrchestrator::persistence_loop, this, std::move(receiver));
    std::cout << kLogOrchestrator << "Trade persistence worker started" << std::endl;
}

void OrderFlowOrchestrator::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (worker_.joinable()) {
        worker_.join();
    }
    std::cout << kLogOrchestrator << "Trade persistence worker stopped ("
              << trades_persisted_.load() << " persisted, "
              << trade_failures_.load() << " failed, "
              << lagged_messages_.load() << " lost to lag)" << std::endl;
}

void OrderFlowOrchestrator::persistence_loop(TradeReceiver receiver) {
    while (running_.load()) {
        RecvResult<TradeEvent> result = receiver.recv_for(kWorkerPollInterval);
        switch (result.status) {
            case RecvStatus::OK:
                handle_received(*result.value);
                break;
            case RecvStatus::LAGGED:
                lagged_messages_.fetch_add(result.missed);
                std::cerr << kLogOrchestrator << "WARNING: trade persistence lagged "
                          << result.missed << " messages" << std::endl;
                break;
            case RecvStatus::CLOSED:
                std::cout << kLogOrchestrator << "Trade channel closed" << std::endl;
                return;
            case RecvStatus::EMPTY:
                break;
        }
    }

    // Drain trades broadcast before stop() was called
    for (;;) {
        RecvResult<TradeEvent> result = receiver.try_recv();
        if (result.status == RecvStatus::OK) {
            handle_received(*result.value);
        } else if (result.status == RecvStatus::LAGGED) {
            lagged_messages_.fetch_add(result.missed);
            std::cerr << kLogOrchestrator << "WARNING: trade persistence lagged "
                      << result.missed << " messages" << std::endl;
        } else {
            break;
        }
    }
}

void OrderFlowOrchestrator::handle_received(const TradeEvent& event) {
    try {
        persist_trade(event);
    } catch (const std::exception& e) {
        trade_failures_.fetch_add(1);
        std::cerr << kLogOrchestrator << "Failed to persist trade "
                  << id_to_string(event.trade.trade_id) << ": " << e.what() << std::endl;
    }
}

// =============================================================================
// TRADE PERSISTENCE
// =============================================================================

TradeEvent OrderFlowOrchestrator::with_fees(const TradeEvent& event) const {
    const FeeConfig& fees = engine_.fee_config();
    TradeEvent stored = event;
    const Decimal value = stored.trade.amount * stored.trade.price;
    stored.trade.maker_fee = value * fees.maker_fee_rate;
    stored.trade.taker_fee = value * fees.taker_fee_rate;
    return stored;
}

void OrderFlowOrchestrator::persist_trade(const TradeEvent& event) {
    PERP_MEASURE_LATENCY(latency_tracker_, LatencyType::TRADE_PERSISTENCE);

    const TradeEvent stored = with_fees(event);
    const TradeExecution& trade = stored.trade;

    if (!store_.insert_trade(stored)) {
        // Already persisted; positions and commissions were applied then
        trades_duplicate_.fetch_add(1);
        return;
    }
    trades_persisted_.fetch_add(1);

    if constexpr (kEnableHotPathLogging) {
        std::cout << kLogOrchestrator << "Persisted trade " << id_to_string(trade.trade_id)
                  << " " << stored.symbol << " " << trade.amount << " @ " << trade.price << std::endl;
    }

    // Taker gets the side it traded; the maker holds the other side
    update_position(trade.maker_address, stored.symbol, position_side_for(opposite(stored.side)),
                    trade.maker_order_id, trade);
    update_position(trade.taker_address, stored.symbol, position_side_for(stored.side),
                    trade.taker_order_id, trade);

    const std::optional<ReferralEarning> earnings[] = {
        referral_for(trade.maker_address, trade.maker_fee, trade),
        referral_for(trade.taker_address, trade.taker_fee, trade),
    };
    for (const auto& earning : earnings) {
        if (!earning) {
            continue;
        }
        try {
            store_.insert_referral_earning(*earning);
            referral_earnings_.fetch_add(1);
        } catch (const StoreError& e) {
            std::cerr << kLogOrchestrator << "Failed to record referral commission for "
                      << earning->referee_address << ": " << e.what() << std::endl;
        }
    }
}

std::optional<uint32_t> OrderFlowOrchestrator::lookup_leverage(const OrderId& order_id) const {
    std::optional<uint32_t> leverage = store_.find_order_leverage(order_id);
    if (leverage) {
        return leverage;
    }
    // The order row may still be queued on the executor
    std::optional<OrderRecord> record = engine_.find_order(order_id);
    if (record) {
        return record->leverage;
    }
    return std::nullopt;
}

void OrderFlowOrchestrator::update_position(const std::string& user_address, const std::string& symbol,
                                            PositionSide side, const OrderId& order_id,
                                            const TradeExecution& trade) {
    std::optional<uint32_t> leverage;
    try {
        leverage = lookup_leverage(order_id);
    } catch (const StoreError& e) {
        position_failures_.fetch_add(1);
        std::cerr << kLogOrchestrator << "Leverage lookup failed for order "
                  << id_to_string(order_id) << ": " << e.what() << std::endl;
        return;
    }

    if (!leverage || *leverage == 0) {
        std::cerr << kLogOrchestrator << "WARNING: no leverage for order " << id_to_string(order_id)
                  << ", skipping position update for " << user_address << std::endl;
        return;
    }

    const Decimal collateral = trade.amount * trade.price / Decimal(static_cast<int64_t>(*leverage));
    try {
        positions_.increase_position(user_address, symbol, side, collateral, *leverage, trade.price, true);
        position_updates_.fetch_add(1);
    } catch (const std::exception& e) {
        position_failures_.fetch_add(1);
        std::cerr << kLogOrchestrator << "Position update failed for " << user_address << " "
                  << position_side_to_string(side) << " " << symbol << ": " << e.what() << std::endl;
    }
}

std::optional<ReferralEarning> OrderFlowOrchestrator::referral_for(const std::string& user_address,
                                                                   const Decimal& fee,
                                                                   const TradeExecution& trade) const {
    std::optional<Referrer> referrer = referrals_.find_referrer(user_address);
    if (!referrer) {
        return std::nullopt;
    }

    ReferralEarning earning;
    earning.id = generate_id();
    earning.referrer_address = referrer->address;
    earning.referee_address = user_address;
    earning.trade_id = trade.trade_id;
    earning.volume = trade.amount * trade.price;
    earning.commission = fee * referrer->commission_rate;
    earning.created_at = trade.timestamp;
    return earning;
}

size_t OrderFlowOrchestrator::batch_persist_trades(const std::vector<TradeEvent>& events) {
    if (events.empty()) {
        return 0;
    }

    TradeBatch batch;
    batch.trades.reserve(events.size());
    for (const auto& event : events) {
        TradeEvent stored = with_fees(event);
        const TradeExecution& trade = stored.trade;

        std::optional<ReferralEarning> maker = referral_for(trade.maker_address, trade.maker_fee, trade);
        if (maker) {
            batch.earnings.push_back(std::move(*maker));
        }
        std::optional<ReferralEarning> taker = referral_for(trade.taker_address, trade.taker_fee, trade);
        if (taker) {
            batch.earnings.push_back(std::move(*taker));
        }
        batch.trades.push_back(std::move(stored));
    }

    size_t inserted = 0;
    try {
        inserted = store_.write_batch(batch);
    } catch (const StoreError& e) {
        throw MatchingError::database_error(e.what());
    }

    trades_persisted_.fetch_add(inserted);
    trades_duplicate_.fetch_add(batch.trades.size() - inserted);
    referral_earnings_.fetch_add(batch.earnings.size());

    std::cout << kLogOrchestrator << "Batch persisted " << inserted << " of "
              << batch.trades.size() << " trades" << std::endl;
    return inserted;
}

// =============================================================================
// ORDER FLOW
// =============================================================================

MatchResult OrderFlowOrchestrator::process_order(const std::string& symbol,
                                                 const std::string& user_address,
                                                 Side side,
                                                 OrderType order_type,
                                                 const Decimal& amount,
                                                 const std::optional<Decimal>& price,
                                                 uint32_t leverage) {
    const std::string normalized = SymbolRegistry::normalize(symbol);
    const OrderId order_id = generate_id();

    MatchResult result = engine_.submit_order(order_id, normalized, user_address, side,
                                              order_type, amount, price, leverage);

    const millis_t stamped = now_millis();
    OrderRecord record;
    record.order_id = order_id;
    record.user_address = user_address;
    record.symbol = normalized;
    record.side = side;
    record.order_type = order_type;
    record.price = order_type == OrderType::LIMIT ? price : std::nullopt;
    record.original_amount = amount;
    record.filled_amount = result.filled_amount;
    record.status = result.status;
    record.leverage = leverage;
    record.created_at = stamped;
    record.updated_at = stamped;
    record.average_fill_price = result.average_price;
    for (const auto& trade : result.trades) {
        record.trade_ids.push_back(trade.trade_id);
    }

    const std::vector<TradeExecution> trades = result.trades;
    if (!executor_.post([this, record, trades] { persist_order(record, trades); })) {
        order_failures_.fetch_add(1);
        std::cerr << kLogOrchestrator << "Executor stopped, order " << id_to_string(order_id)
                  << " was not persisted" << std::endl;
    }
    return result;
}

void OrderFlowOrchestrator::persist_order(const OrderRecord& record, const std::vector<TradeExecution>& trades) {
    try {
        store_.upsert_order(record);
        for (const auto& trade : trades) {
            if (!store_.apply_maker_fill(trade.maker_order_id, trade.amount, trade.timestamp)) {
                std::cerr << kLogOrchestrator << "WARNING: maker order " << id_to_string(trade.maker_order_id)
                          << " not in store, fill of " << trade.amount << " not applied" << std::endl;
            }
        }
        orders_persisted_.fetch_add(1);
    } catch (const StoreError& e) {
        order_failures_.fetch_add(1);
        std::cerr << kLogOrchestrator << "Failed to persist order " << id_to_string(record.order_id)
                  << ": " << e.what() << std::endl;
    }
}

bool OrderFlowOrchestrator::cancel_order(const std::string& symbol, const OrderId& order_id,
                                         const std::string& user_address) {
    const std::string normalized = SymbolRegistry::normalize(symbol);
    if (!engine_.cancel_order(normalized, order_id, user_address)) {
        return false;
    }

    const millis_t cancelled_at = now_millis();
    if (!executor_.post([this, order_id, cancelled_at] { persist_cancel(order_id, cancelled_at); })) {
        order_failures_.fetch_add(1);
        std::cerr << kLogOrchestrator << "Executor stopped, cancel of " << id_to_string(order_id)
                  << " was not persisted" << std::endl;
    }
    return true;
}

void OrderFlowOrchestrator::persist_cancel(const OrderId& order_id, millis_t timestamp) {
    try {
        if (!store_.update_order_status(order_id, OrderStatus::CANCELLED, timestamp)) {
            std::cerr << kLogOrchestrator << "WARNING: cancelled order " << id_to_string(order_id)
                      << " not in store" << std::endl;
        }
    } catch (const StoreError& e) {
        order_failures_.fetch_add(1);
        std::cerr << kLogOrchestrator << "Failed to persist cancel of " << id_to_string(order_id)
                  << ": " << e.what() << std::endl;
    }
}

size_t OrderFlowOrchestrator::recover_open_orders() {
    std::vector<OrderRecord> open_orders;
    try {
        open_orders = store_.load_open_orders();
    } catch (const StoreError& e) {
        throw MatchingError::database_error(e.what());
    }

    std::cout << kLogOrchestrator << "Loaded " << open_orders.size() << " open orders from store" << std::endl;
    return engine_.recover_orders(open_orders);
}

// =============================================================================
// QUERIES
// =============================================================================

OrderbookSnapshot OrderFlowOrchestrator::get_orderbook(const std::string& symbol, size_t depth) const {
    return engine_.get_orderbook(SymbolRegistry::normalize(symbol), depth);
}

TradeHistoryResponse OrderFlowOrchestrator::get_trades(const std::string& symbol,
                                                       const TradeHistoryQuery& query) const {
    return engine_.get_trades(SymbolRegistry::normalize(symbol), query);
}

OrderHistoryResponse OrderFlowOrchestrator::get_orders(const std::string& user_address,
                                                       const OrderHistoryQuery& query) const {
    return engine_.get_orders(user_address, query);
}

OrchestratorStats OrderFlowOrchestrator::get_stats() const {
    OrchestratorStats stats;
    stats.trades_persisted = trades_persisted_.load();
    stats.trades_duplicate = trades_duplicate_.load();
    stats.trade_failures = trade_failures_.load();
    stats.position_updates = position_updates_.load();
    stats.position_failures = position_failures_.load();
    stats.referral_earnings = referral_earnings_.load();
    stats.orders_persisted = orders_persisted_.load();
    stats.order_failures = order_failures_.load();
    stats.lagged_messages = lagged_messages_.load();
    return stats;
}

} // namespace perp
