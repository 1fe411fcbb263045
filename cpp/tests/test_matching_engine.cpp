#include <gtest/gtest.h>
#include "matching_engine.hpp"
#include "log_control.hpp"
#include <chrono>
#include <memory>
#include <thread>

using namespace perp;

class MatchingEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        ScopedCoutSilencer silence(true);
        registry = std::make_unique<SymbolRegistry>(std::vector<std::string>{"BTCUSDT", "ETHUSDT"});
        engine = std::make_unique<MatchingEngine>(*registry);
    }

    void TearDown() override {
        ScopedCoutSilencer silence(true);
        engine.reset();
        registry.reset();
    }

    static Decimal d(const char* text) {
        return Decimal::parse(text);
    }

    MatchResult limit(const std::string& user, Side side, const char* amount, const char* price,
                      const std::string& symbol = "BTCUSDT") {
        return engine->submit_order(generate_id(), symbol, user, side, OrderType::LIMIT,
                                    d(amount), d(price), 10);
    }

    MatchResult market(const std::string& user, Side side, const char* amount) {
        return engine->submit_order(generate_id(), "BTCUSDT", user, side, OrderType::MARKET,
                                    d(amount), std::nullopt, 5);
    }

    std::unique_ptr<SymbolRegistry> registry;
    std::unique_ptr<MatchingEngine> engine;
};

// =============================================================================
// VALIDATION
// =============================================================================

TEST_F(MatchingEngineTest, UnknownSymbolRejected) {
    try {
        limit("alice", Side::BUY, "1", "100", "DOGEUSDT");
        FAIL() << "expected MatchingError";
    } catch (const MatchingError& e) {
        EXPECT_EQ(e.kind(), MatchingErrorKind::SYMBOL_NOT_FOUND);
        EXPECT_EQ(std::string(e.what()), "Symbol not found: DOGEUSDT");
    }
}

TEST_F(MatchingEngineTest, NonPositiveAmountRejected) {
    for (const char* amount : {"0", "-1"}) {
        try {
            limit("alice", Side::BUY, amount, "100");
            FAIL() << "expected MatchingError for amount " << amount;
        } catch (const MatchingError& e) {
            EXPECT_EQ(e.kind(), MatchingErrorKind::INVALID_AMOUNT);
        }
    }
    EXPECT_EQ(engine->orderbook("BTCUSDT").order_count(), 0u);
}

TEST_F(MatchingEngineTest, LimitPriceValidated) {
    auto expect_invalid_price = [this](const std::optional<Decimal>& price) {
        try {
            engine->submit_order(generate_id(), "BTCUSDT", "alice", Side::BUY, OrderType::LIMIT,
                                 d("1"), price, 1);
            FAIL() << "expected InvalidPrice";
        } catch (const MatchingError& e) {
            EXPECT_EQ(e.kind(), MatchingErrorKind::INVALID_PRICE);
        }
    };
    expect_invalid_price(std::nullopt);
    expect_invalid_price(d("0"));
    expect_invalid_price(d("-5"));
    expect_invalid_price(d("0.000000001"));
    expect_invalid_price(d("100.000000009"));
    expect_invalid_price(d("100000000000"));

    EXPECT_EQ(engine->orderbook("BTCUSDT").order_count(), 0u);
    EXPECT_EQ(engine->get_stats().orders_submitted, 0u);
}

TEST_F(MatchingEngineTest, TakerNeverPaysPastItsLimit) {
    EXPECT_THROW(limit("maker", Side::SELL, "1", "100.000000009"), MatchingError);
    limit("maker", Side::SELL, "1", "100.00000001");

    MatchResult taker = limit("taker", Side::BUY, "1", "100");
    EXPECT_TRUE(taker.trades.empty());
    EXPECT_EQ(taker.status, OrderStatus::OPEN);

    MatchResult lifted = limit("taker", Side::BUY, "1", "100.00000001");
    ASSERT_EQ(lifted.trades.size(), 1u);
    EXPECT_LE(lifted.trades[0].price, d("100.00000001"));
}

TEST_F(MatchingEngineTest, DuplicateRestingIdRejected) {
    const OrderId id = generate_id();
    engine->submit_order(id, "BTCUSDT", "alice", Side::SELL, OrderType::LIMIT, d("1"), d("100"), 1);

    try {
        engine->submit_order(id, "BTCUSDT", "alice", Side::SELL, OrderType::LIMIT, d("1"), d("101"), 1);
        FAIL() << "expected a duplicate id rejection";
    } catch (const MatchingError& e) {
        EXPECT_EQ(e.kind(), MatchingErrorKind::INTERNAL_ERROR);
    }

    const Orderbook& book = engine->orderbook("BTCUSDT");
    EXPECT_EQ(book.order_count(), 1u);
    EXPECT_EQ(engine->get_stats().orders_submitted, 1u);
    std::optional<OrderEntry> entry = book.get_order(id);
    ASSERT_TRUE(entry);
    EXPECT_EQ(entry->price, d("100"));

    EXPECT_TRUE(engine->cancel_order("BTCUSDT", id, "alice"));
    EXPECT_EQ(book.order_count(), 0u);
    EXPECT_FALSE(book.has_order(id));
}

TEST_F(MatchingEngineTest, ConcurrentCrossingOrdersNeverLeaveCrossedBook) {
    const Orderbook& book = engine->orderbook("BTCUSDT");
    for (int round = 0; round < 500; ++round) {
        std::thread buyer([this] { limit("bob", Side::BUY, "1", "100"); });
        std::thread seller([this] { limit("alice", Side::SELL, "1", "100"); });
        buyer.join();
        seller.join();

        ASSERT_FALSE(book.best_bid() && book.best_ask()) << "crossed after round " << round;
        EXPECT_EQ(book.order_count(), 0u);
    }
    EXPECT_EQ(engine->get_stats().trades_executed, 500u);
}

TEST_F(MatchingEngineTest, MarketOrderIgnoresPrice) {
    limit("maker", Side::SELL, "1", "100");
    MatchResult result = engine->submit_order(generate_id(), "BTCUSDT", "taker", Side::BUY,
                                              OrderType::MARKET, d("1"), d("-1"), 1);
    EXPECT_EQ(result.status, OrderStatus::FILLED);
}

// =============================================================================
// MATCHING SCENARIOS
// =============================================================================

TEST_F(MatchingEngineTest, LimitBuyAcrossTwoLevels) {
    MatchResult a = limit("maker-a", Side::SELL, "1.0", "100.0");
    MatchResult b = limit("maker-b", Side::SELL, "2.0", "101.0");
    ASSERT_EQ(a.status, OrderStatus::OPEN);
    ASSERT_EQ(b.status, OrderStatus::OPEN);

    MatchResult taker = limit("taker", Side::BUY, "1.5", "101.0");

    ASSERT_EQ(taker.trades.size(), 2u);
    EXPECT_EQ(taker.trades[0].price, d("100"));
    EXPECT_EQ(taker.trades[0].amount, d("1"));
    EXPECT_EQ(taker.trades[0].maker_order_id, a.order_id);
    EXPECT_EQ(taker.trades[1].price, d("101"));
    EXPECT_EQ(taker.trades[1].amount, d("0.5"));
    EXPECT_EQ(taker.trades[1].maker_order_id, b.order_id);

    EXPECT_EQ(taker.status, OrderStatus::FILLED);
    EXPECT_EQ(taker.filled_amount, d("1.5"));
    EXPECT_TRUE(taker.remaining_amount.is_zero());
    ASSERT_TRUE(taker.average_price);
    EXPECT_EQ(*taker.average_price, (d("100.0") * d("1.0") + d("101.0") * d("0.5")) / d("1.5"));

    const Orderbook& book = engine->orderbook("BTCUSDT");
    EXPECT_FALSE(book.has_order(a.order_id));
    std::optional<OrderEntry> rest_b = book.get_order(b.order_id);
    ASSERT_TRUE(rest_b);
    EXPECT_EQ(rest_b->remaining_amount, d("1.5"));
}

TEST_F(MatchingEngineTest, MarketBuyIntoEmptyBookRejected) {
    MatchResult result = market("taker", Side::BUY, "5.0");
    EXPECT_EQ(result.status, OrderStatus::REJECTED);
    EXPECT_TRUE(result.trades.empty());
    EXPECT_EQ(result.remaining_amount, d("5"));
    EXPECT_TRUE(result.filled_amount.is_zero());
    EXPECT_FALSE(result.average_price);
    EXPECT_EQ(engine->orderbook("BTCUSDT").order_count(), 0u);
    EXPECT_EQ(engine->get_stats().orders_rejected, 1u);
}

TEST_F(MatchingEngineTest, MarketPartialFillNeverRests) {
    limit("maker", Side::SELL, "1", "100");
    MatchResult result = market("taker", Side::BUY, "3");

    EXPECT_EQ(result.status, OrderStatus::PARTIALLY_FILLED);
    EXPECT_EQ(result.filled_amount, d("1"));
    EXPECT_EQ(result.remaining_amount, d("2"));
    EXPECT_EQ(engine->orderbook("BTCUSDT").order_count(), 0u);
    EXPECT_FALSE(engine->orderbook("BTCUSDT").best_bid());
}

TEST_F(MatchingEngineTest, LimitPartialFillRestsRemainder) {
    limit("maker", Side::SELL, "1", "100");
    MatchResult result = limit("taker", Side::BUY, "3", "100");

    EXPECT_EQ(result.status, OrderStatus::PARTIALLY_FILLED);
    EXPECT_EQ(result.remaining_amount, d("2"));

    std::optional<OrderEntry> resting = engine->orderbook("BTCUSDT").get_order(result.order_id);
    ASSERT_TRUE(resting);
    EXPECT_EQ(resting->remaining_amount, d("2"));
    EXPECT_EQ(resting->side, Side::BUY);
    EXPECT_EQ(*engine->orderbook("BTCUSDT").best_bid(), d("100"));
}

TEST_F(MatchingEngineTest, FeesOnUnitTrade) {
    limit("maker", Side::SELL, "1.0", "100.0");
    MatchResult result = limit("taker", Side::BUY, "1.0", "100.0");

    ASSERT_EQ(result.trades.size(), 1u);
    EXPECT_EQ(result.trades[0].maker_fee, d("0.02"));
    EXPECT_EQ(result.trades[0].taker_fee, d("0.05"));

    EngineStats stats = engine->get_stats();
    EXPECT_EQ(stats.total_fees, d("0.07"));
    EXPECT_EQ(stats.total_volume, d("1"));
    EXPECT_EQ(stats.total_notional, d("100"));
}

TEST_F(MatchingEngineTest, SymbolsAreIsolated) {
    limit("maker", Side::SELL, "1", "100", "ETHUSDT");
    MatchResult result = limit("taker", Side::BUY, "1", "100", "BTCUSDT");
    EXPECT_EQ(result.status, OrderStatus::OPEN);
    EXPECT_TRUE(result.trades.empty());
}

// =============================================================================
// CANCELLATION
// =============================================================================

TEST_F(MatchingEngineTest, CancelIsIdempotent) {
    MatchResult resting = limit("alice", Side::BUY, "1", "99");

    EXPECT_TRUE(engine->cancel_order("BTCUSDT", resting.order_id, "alice"));
    EXPECT_FALSE(engine->cancel_order("BTCUSDT", resting.order_id, "alice"));
    EXPECT_FALSE(engine->cancel_order("BTCUSDT", generate_id(), "alice"));

    std::optional<OrderRecord> record = engine->find_order(resting.order_id);
    ASSERT_TRUE(record);
    EXPECT_EQ(record->status, OrderStatus::CANCELLED);
    EXPECT_EQ(engine->get_stats().orders_cancelled, 1u);
}

TEST_F(MatchingEngineTest, CancelUnknownSymbolThrows) {
    EXPECT_THROW(engine->cancel_order("XRPUSDT", generate_id(), "alice"), MatchingError);
}

TEST_F(MatchingEngineTest, CancelFilledOrderFails) {
    MatchResult maker = limit("maker", Side::SELL, "1", "100");
    limit("taker", Side::BUY, "1", "100");
    EXPECT_FALSE(engine->cancel_order("BTCUSDT", maker.order_id, "maker"));
}

// =============================================================================
// BROADCASTS
// =============================================================================

TEST_F(MatchingEngineTest, TradeEventsBroadcastInExecutionOrder) {
    TradeReceiver trades = engine->subscribe_trades();

    limit("maker-a", Side::SELL, "1", "100");
    limit("maker-b", Side::SELL, "1", "101");
    MatchResult taker = limit("taker", Side::BUY, "2", "101");

    for (size_t i = 0; i < 2; ++i) {
        RecvResult<TradeEvent> received = trades.try_recv();
        ASSERT_EQ(received.status, RecvStatus::OK);
        EXPECT_EQ(received.value->symbol, "BTCUSDT");
        EXPECT_EQ(received.value->side, Side::BUY);
        EXPECT_EQ(received.value->trade.trade_id, taker.trades[i].trade_id);
    }
    EXPECT_EQ(trades.try_recv().status, RecvStatus::EMPTY);
}

TEST_F(MatchingEngineTest, OrderbookUpdatesOnEveryBookChange) {
    OrderbookReceiver updates = engine->subscribe_orderbook();

    MatchResult resting = limit("alice", Side::BUY, "2", "99");
    RecvResult<OrderbookUpdate> first = updates.try_recv();
    ASSERT_EQ(first.status, RecvStatus::OK);
    ASSERT_EQ(first.value->bids.size(), 1u);
    EXPECT_EQ(first.value->bids[0].amount, d("2"));

    engine->cancel_order("BTCUSDT", resting.order_id, "alice");
    RecvResult<OrderbookUpdate> second = updates.try_recv();
    ASSERT_EQ(second.status, RecvStatus::OK);
    EXPECT_TRUE(second.value->bids.empty());

    // A rejected market order leaves the book untouched
    market("bob", Side::BUY, "1");
    EXPECT_EQ(updates.try_recv().status, RecvStatus::EMPTY);
}

// =============================================================================
// SNAPSHOTS AND HISTORY
// =============================================================================

TEST_F(MatchingEngineTest, SnapshotMatchesRestingOrders) {
    limit("a", Side::BUY, "1", "99");
    limit("b", Side::BUY, "0.5", "99");
    limit("c", Side::SELL, "2", "101");

    OrderbookSnapshot snap = engine->get_orderbook("BTCUSDT", 10);
    ASSERT_EQ(snap.bids.size(), 1u);
    EXPECT_EQ(snap.bids[0].amount, d("1.5"));
    ASSERT_EQ(snap.asks.size(), 1u);
    EXPECT_EQ(snap.asks[0].price, d("101"));

    EXPECT_THROW(engine->get_orderbook("NOPEUSDT", 10), MatchingError);
}

TEST_F(MatchingEngineTest, HistoryTracksMakerFills) {
    MatchResult maker = limit("maker", Side::SELL, "2", "100");
    limit("taker", Side::BUY, "0.5", "100");
    limit("taker", Side::BUY, "0.5", "102");

    std::optional<OrderRecord> record = engine->find_order(maker.order_id);
    ASSERT_TRUE(record);
    EXPECT_EQ(record->status, OrderStatus::PARTIALLY_FILLED);
    EXPECT_EQ(record->filled_amount, d("1"));
    EXPECT_EQ(record->trade_ids.size(), 2u);
    EXPECT_EQ(record->leverage, 10u);
    ASSERT_TRUE(record->average_fill_price);
    EXPECT_EQ(*record->average_fill_price, d("100"));

    TradeHistoryResponse trades = engine->get_trades("BTCUSDT", TradeHistoryQuery());
    EXPECT_EQ(trades.total_count, 2u);
    EXPECT_FALSE(trades.has_more);

    OrderHistoryQuery filled_only;
    filled_only.status = "filled";
    OrderHistoryResponse taker_orders = engine->get_orders("taker", filled_only);
    EXPECT_EQ(taker_orders.total_count, 2u);

    EXPECT_THROW(engine->get_trades("NOPEUSDT", TradeHistoryQuery()), MatchingError);
}

// =============================================================================
// RECOVERY
// =============================================================================

TEST_F(MatchingEngineTest, RecoverRestsOpenLimitOrders) {
    OrderRecord open;
    open.order_id = generate_id();
    open.user_address = "alice";
    open.symbol = "btc-usdt";
    open.side = Side::SELL;
    open.order_type = OrderType::LIMIT;
    open.price = d("100");
    open.original_amount = d("2");
    open.filled_amount = d("0.5");
    open.status = OrderStatus::PARTIALLY_FILLED;
    open.leverage = 3;

    OrderRecord unknown_symbol = open;
    unknown_symbol.order_id = generate_id();
    unknown_symbol.symbol = "SOLUSDT";

    OrderRecord done = open;
    done.order_id = generate_id();
    done.filled_amount = d("2");

    OrderRecord cancelled = open;
    cancelled.order_id = generate_id();
    cancelled.status = OrderStatus::CANCELLED;

    OrderRecord market_order = open;
    market_order.order_id = generate_id();
    market_order.order_type = OrderType::MARKET;

    OrderRecord sub_tick = open;
    sub_tick.order_id = generate_id();
    sub_tick.price = d("100.000000009");

    size_t recovered;
    {
        ScopedCoutSilencer silence_out(true);
        ScopedCerrSilencer silence_err(true);
        recovered = engine->recover_orders({open, unknown_symbol, done, cancelled, market_order, sub_tick});
        // Replaying the same record does not duplicate it
        engine->recover_orders({open});
    }

    EXPECT_EQ(recovered, 1u);
    const Orderbook& book = engine->orderbook("BTCUSDT");
    EXPECT_EQ(book.order_count(), 1u);
    std::optional<OrderEntry> entry = book.get_order(open.order_id);
    ASSERT_TRUE(entry);
    EXPECT_EQ(entry->remaining_amount, d("1.5"));

    // The recovered order trades like any other resting order
    MatchResult taker = limit("bob", Side::BUY, "1.5", "100");
    EXPECT_EQ(taker.status, OrderStatus::FILLED);
    std::optional<OrderRecord> record = engine->find_order(open.order_id);
    ASSERT_TRUE(record);
    EXPECT_EQ(record->status, OrderStatus::FILLED);
    // Earlier fills came without a price, so no average can be derived
    EXPECT_FALSE(record->average_fill_price);
}

// =============================================================================
// STATISTICS
// =============================================================================

TEST_F(MatchingEngineTest, StatsAndLatency) {
    limit("maker", Side::SELL, "1", "100");
    limit("taker", Side::BUY, "1", "100");
    engine->get_orderbook("BTCUSDT", 5);

    EngineStats stats = engine->get_stats();
    EXPECT_EQ(stats.orders_submitted, 2u);
    EXPECT_EQ(stats.trades_executed, 1u);
    ASSERT_EQ(stats.symbols.size(), 2u);
    EXPECT_EQ(stats.symbols[0].symbol, "BTCUSDT");
    ASSERT_TRUE(stats.symbols[0].last_price);
    EXPECT_EQ(*stats.symbols[0].last_price, d("100"));

    const LatencyTracker& tracker = engine->latency_tracker();
    EXPECT_EQ(tracker.get_measurement_count(LatencyType::ORDER_SUBMISSION), 2u);
    EXPECT_EQ(tracker.get_measurement_count(LatencyType::ORDERBOOK_SNAPSHOT), 1u);

    ScopedCoutSilencer silence(true);
    EXPECT_NO_THROW(engine->print_performance_report());
}

// =============================================================================
// MAIN TEST RUNNER
// =============================================================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
